#pragma once

#include <filesystem>
#include <string>

namespace dply {

struct e_config_file_path {
    std::filesystem::path value;
};

/// The location of an invalid property, e.g. "targets[1].mappings[0].source"
struct e_config_key {
    std::string value;
};

struct e_target_name {
    std::string value;
};

struct e_package_name {
    std::string value;
};

}  // namespace dply
