#include "./parse.hpp"

#include <dply/error/errors.hpp>
#include <dply/error/result.hpp>
#include <dply/util/fs/io.hpp>

#include <boost/leaf/exception.hpp>
#include <yaml-cpp/exceptions.h>
#include <yaml-cpp/node/parse.h>

using namespace dply;

YAML::Node dply::parse_yaml_string(std::string_view sv) {
    try {
        return YAML::Load(std::string(sv));
    } catch (YAML::ParserException const& exc) {
        e_yaml_parse_error err{exc.msg};
        if (!exc.mark.is_null()) {
            err.line   = exc.mark.line + 1;
            err.column = exc.mark.column + 1;
        }
        BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::invalid_config_file>(
                                       "Invalid YAML document (line {}, column {}): {}",
                                       err.line,
                                       err.column,
                                       err.message),
                                   err);
    } catch (YAML::Exception const& exc) {
        BOOST_LEAF_THROW_EXCEPTION(
            make_user_error<errc::invalid_config_file>("Invalid YAML document: {}", exc.msg),
            e_yaml_parse_error{exc.msg});
    }
}

YAML::Node dply::parse_yaml_file(const std::filesystem::path& fpath) {
    DPLY_E_SCOPE(e_parse_yaml_file_path{fpath});
    return parse_yaml_string(dply::read_file(fpath));
}
