#include "./error_handler.hpp"

#include <dply/config/error.hpp>
#include <dply/deploy/after_deployed.hpp>
#include <dply/deploy/orchestrator.hpp>
#include <dply/deploy/package_files.hpp>
#include <dply/error/errors.hpp>
#include <dply/error/marker.hpp>
#include <dply/error/nonesuch.hpp>
#include <dply/plugin/registry.hpp>
#include <dply/util/dynlib.hpp>
#include <dply/util/fs/path.hpp>
#include <dply/util/log.hpp>
#include <dply/util/signal.hpp>
#include <dply/util/yaml/parse.hpp>

#include <debate/argument_parser.hpp>

#include <boost/leaf/common.hpp>
#include <boost/leaf/handle_errors.hpp>
#include <boost/leaf/pred.hpp>
#include <fansi/styled.hpp>

#include <fmt/ostream.h>

#include <ostream>
#include <sstream>

using namespace dply;
using namespace fansi::literals;

namespace {

std::string diag_string(const boost::leaf::verbose_diagnostic_info& diag) {
    std::ostringstream out;
    out << diag;
    return out.str();
}

auto handlers = std::tuple(  //
    [](e_config_file_path config_path, e_yaml_parse_error error) {
        dply_log(error,
                 "Invalid YAML in configuration file [.bold.yellow[{}]]"_styled,
                 config_path.value.string());
        if (error.line != 0) {
            dply_log(error,
                     "  Line {}, column {}: .bold.red[{}]"_styled,
                     error.line,
                     error.column,
                     error.message);
        } else {
            dply_log(error, "  .bold.red[{}]"_styled, error.message);
        }
        write_error_marker("config-yaml-parse-error");
        return 1;
    },
    [](const user_error<errc::invalid_config_file>& exc,
       e_config_file_path                           config_path,
       e_config_key                                 key) {
        dply_log(error,
                 "Error loading configuration from [.bold.yellow[{}]]"_styled,
                 config_path.value.string());
        dply_log(error, "  At .bold.cyan[{}]: .bold.red[{}]"_styled, key.value, exc.what());
        write_error_marker("invalid-config");
        return 1;
    },
    [](const std::system_error& exc, e_config_file_path config_path) {
        dply_log(error,
                 "Failed to read configuration file [.bold.yellow[{}]]: .bold.red[{}]"_styled,
                 config_path.value.string(),
                 exc.code().message());
        write_error_marker("config-file-unreadable");
        return 1;
    },
    [](std::error_code ec, e_resolve_path path) {
        dply_log(error,
                 "Cannot open the directory [.bold.yellow[{}]]: .bold.red[{}]"_styled,
                 path.value.string(),
                 ec.message());
        write_error_marker("bad-workspace-dir");
        return 1;
    },
    [](const user_error<errc::unknown_target>&, e_nonesuch missing) {
        missing.log_error();
        write_error_marker("no-such-target");
        return 1;
    },
    [](const user_error<errc::unknown_package>&, e_nonesuch missing) {
        missing.log_error();
        write_error_marker("no-such-package");
        return 1;
    },
    [](const unknown_target_type_error&,
       e_target_type           type,
       e_nonesuch              missing,
       const e_deploy_target*  target) {
        if (target) {
            dply_log(error,
                     "Target .bold.cyan[{}] has type '.bold.red[{}]', but no plugin handles it"_styled,
                     target->value,
                     type.value);
        } else {
            dply_log(error, "No plugin handles the target type '.bold.red[{}]'"_styled, type.value);
        }
        if (missing.nearest) {
            dply_log(error, "  (Did you mean '.br.yellow[{}]'?)"_styled, *missing.nearest);
        }
        write_error_marker("unknown-target-type");
        return 1;
    },
    [](const ambiguous_target_type_error& exc, const e_deploy_target* target) {
        if (target) {
            dply_log(error, "Cannot deploy to target .bold.cyan[{}]"_styled, target->value);
        }
        dply_log(error, ".bold.red[{}]"_styled, exc.what());
        write_error_marker("ambiguous-target-type");
        return 1;
    },
    [](const user_error<errc::module_load_failure>& exc, e_module_path path) {
        dply_log(error,
                 "Failed to load module [.bold.yellow[{}]]: .bold.red[{}]"_styled,
                 path.value.string(),
                 exc.what());
        write_error_marker("module-load-failure");
        return 1;
    },
    [](const user_error<errc::invalid_config_file>& exc, e_package_glob glob) {
        dply_log(error,
                 "Invalid file pattern '.bold.yellow[{}]' in package: .bold.red[{}]"_styled,
                 glob.value,
                 exc.what());
        write_error_marker("invalid-package-glob");
        return 1;
    },
    [](user_cancelled) {
        dply_log(critical, "Operation cancelled by the user");
        return 2;
    },
    [](error_base const& exc, boost::leaf::verbose_diagnostic_info const& diag) {
        dply_log(error, "{}", exc.what());
        dply_log(error, "{}", exc.explanation());
        write_error_marker(error_marker_of(exc.get_errc()));
        dply_log(debug, "Additional diagnostic details:\n.br.blue[{}]"_styled, diag_string(diag));
        return 1;
    },
    [](const std::system_error& exc, boost::leaf::verbose_diagnostic_info const& diag) {
        dply_log(
            critical,
            "An unhandled std::system_error arose. .bold.red[THIS IS A DPLY BUG!] Info: {}"_styled,
            diag_string(diag));
        dply_log(critical,
                 "Exception message from std::system_error: .bold.red[{}]"_styled,
                 exc.code().message());
        return 42;
    },
    [](boost::leaf::verbose_diagnostic_info const& diag) {
        dply_log(critical,
                 "An unhandled error arose. .bold.red[THIS IS A DPLY BUG!] Info: {}"_styled,
                 diag_string(diag));
        return 42;
    });
}  // namespace

int dply::handle_cli_errors(std::function<int()> fn) noexcept {
    return boost::leaf::try_catch(fn, handlers);
}

std::optional<int> dply::parse_command_line(const debate::argument_parser&  parser,
                                            std::string_view                program_name,
                                            const std::vector<std::string>& argv,
                                            std::ostream&                   out,
                                            std::ostream&                   err) noexcept {
    auto usage_error = [&](const debate::argument_parser& p,
                           std::string_view               message) -> std::optional<int> {
        fmt::print(err, "{}\n.bold.red[error]: {}\n"_styled, p.usage_string(program_name), message);
        write_error_marker("invalid-arguments");
        return 2;
    };
    return boost::leaf::try_catch(
        [&]() -> std::optional<int> {
            parser.parse_argv(argv);
            return std::nullopt;
        },
        [&](debate::help_request, debate::e_argument_parser p) -> std::optional<int> {
            out << p.parser.help_string(program_name);
            return 0;
        },
        [&](debate::unrecognized_argument,
            debate::e_argument_parser p,
            debate::e_arg_spelling    arg,
            debate::e_did_you_mean*   dym) {
            auto message = fmt::format("Unknown {} '{}'",
                                       p.parser.subparsers() ? "subcommand or argument" : "argument",
                                       arg.spelling);
            if (dym) {
                message += fmt::format(" (did you mean '{}'?)", dym->candidate);
            }
            return usage_error(p.parser, message);
        },
        [&](debate::invalid_arguments,
            debate::e_argument_parser   p,
            debate::e_arg_spelling      spell,
            debate::e_invalid_arg_value val) {
            return usage_error(p.parser,
                               fmt::format("'{}' is not a valid value for '{}'",
                                           val.given,
                                           spell.spelling));
        },
        [&](debate::invalid_arguments,
            debate::e_argument_parser p,
            debate::e_arg_spelling    spell,
            debate::e_argument        arg,
            debate::e_wrong_val_num   given) {
            if (arg.argument.nargs == 0) {
                return usage_error(p.parser,
                                   fmt::format("'{}' does not take a value", spell.spelling));
            }
            return usage_error(p.parser,
                               fmt::format("'{}' expects {} {} value(s), but got {}",
                                           spell.spelling,
                                           arg.argument.nargs,
                                           arg.argument.valname,
                                           given.n_given));
        },
        [&](debate::missing_required, debate::e_argument_parser p, debate::e_argument arg) {
            return usage_error(p.parser,
                               fmt::format("Missing required argument '{}'",
                                           arg.argument.preferred_spelling()));
        },
        [&](debate::invalid_repitition, debate::e_argument_parser p, debate::e_arg_spelling sp) {
            return usage_error(p.parser,
                               fmt::format("'{}' may only be given once", sp.spelling));
        },
        [&](const debate::invalid_arguments& e, debate::e_argument_parser p) {
            return usage_error(p.parser, e.what());
        },
        [&](const boost::leaf::verbose_diagnostic_info& diag) -> std::optional<int> {
            dply_log(critical,
                     "An unexpected error occurred while parsing the command line:\n{}",
                     diag_string(diag));
            return 42;
        });
}
