#include "./errors.hpp"

#include <neo/assert.hpp>

using namespace dply;

std::string_view dply::explanation_of(dply::errc ec) noexcept {
    switch (ec) {
    case errc::unmappable_path:
        return R"(
A file can only be deployed if its path can be expressed relative to the base
directory of the deployment (the workspace root unless another base directory
is given). Files outside of that directory cannot be placed below the target's
directory.
)";
    case errc::directory_failure:
        return R"(
The parent directory of a file's destination did not exist and could not be
created. Check that the target's `dir` is writable.
)";
    case errc::write_failure:
        return R"(
The transport failed while writing the file to its destination. Refer to the
underlying system error above.
)";
    case errc::transform_failure:
        return R"(
The target declares a `transformer` module, but the module either lacks the
function for the requested direction or failed while running. A transform
module must provide both directions so that transformed data can be restored.
)";
    case errc::empty_target_failure:
        return R"(
The target sets `empty: true`, which removes everything in the target directory
before deploying. Emptying the directory failed, so no file has been deployed.
)";
    case errc::after_deployed_failure:
        return R"(
All files have been deployed, but an operation from the target's `deployed`
list failed.
)";
    case errc::invalid_config_file:
        return R"(
The deployment configuration file is malformed. Refer to the message above for
the offending property.
)";
    case errc::unknown_target_type:
        return R"(
Every target must declare a `type` that names a loaded plugin. The built-in
plugin is `local`. Additional plugins are loaded from the shared objects listed
in the `modules` property of the configuration.
)";
    case errc::ambiguous_target_type:
        return R"(
More than one loaded plugin claims the type of the target. Remove one of the
conflicting plugin modules from the `modules` property.
)";
    case errc::unknown_target:
        return R"(The requested target is not declared in the configuration.)";
    case errc::unknown_package:
        return R"(The requested package is not declared in the configuration.)";
    case errc::module_load_failure:
        return R"(
An extension module (plugin or transform module) could not be loaded, or it does
not export the expected entry points.
)";
    case errc::none:
        break;
    }
    neo_assert_always(invariant, false, "Unexpected errc during error explanation", int(ec));
}
