// A plugin module used by the test suite. Handles the "echo" target type: every file succeeds
// without being written anywhere, except the files whose names are listed in the target's
// `failFiles` property.

#include <dply/plugin/module_abi.hpp>

#include <yaml-cpp/yaml.h>

#include <stdexcept>
#include <string>

namespace {

bool listed_to_fail(const dply::deploy_target& target, dply::path_ref file) {
    auto names = target.declaration["failFiles"];
    if (!names.IsSequence()) {
        return false;
    }
    for (const auto& name : names) {
        if (name.as<std::string>() == file.filename().string()) {
            return true;
        }
    }
    return false;
}

class echo_plugin : public dply::deploy_plugin {
public:
    void deploy_file(dply::path_ref                   file,
                     const dply::deploy_target&       target,
                     const dply::deploy_file_options& opts) override {
        std::exception_ptr error;
        if (listed_to_fail(target, file)) {
            error = std::make_exception_ptr(
                std::runtime_error("Declined to echo " + file.filename().string()));
        }
        if (opts.on_completed) {
            opts.on_completed(dply::file_completed_event{
                .file     = file,
                .target   = target,
                .canceled = false,
                .error    = error,
            });
        }
    }

    void deploy_workspace(const std::vector<dply::fs::path>&    files,
                          const dply::deploy_target&            target,
                          const dply::deploy_workspace_options& opts) override {
        for (auto& file : files) {
            deploy_file(file,
                        target,
                        dply::deploy_file_options{
                            .base_directory   = opts.base_directory,
                            .on_before_deploy = opts.on_before_deploy_file,
                            .on_completed     = opts.on_file_completed,
                        });
        }
        if (opts.on_completed) {
            opts.on_completed(dply::workspace_completed_event{
                .target   = target,
                .canceled = false,
                .error    = nullptr,
            });
        }
    }

    dply::plugin_info info() const override { return {.description = "Echoes files"}; }
};

}  // namespace

DPLY_PLUGIN_API dply::deploy_plugin* dply_create_plugin(dply::deploy_context&) {
    return new echo_plugin();
}
