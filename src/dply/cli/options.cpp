#include "./options.hpp"

#include <dply/util/env.hpp>
#include <dply/util/fs/path.hpp>

#include <debate/enum.hpp>
#include <magic_enum.hpp>

using namespace dply;
using namespace debate;

namespace {

struct setup {
    dply::cli::options& opts;

    explicit setup(dply::cli::options& opts)
        : opts(opts) {}

    argument workspace_arg{
        .long_spellings  = {"workspace"},
        .short_spellings = {"p"},
        .help    = "The workspace to deploy from. If not given, uses the current working directory",
        .valname = "<workspace-path>",
        .action  = put_into(opts.workspace_dir),
    };

    argument config_arg{
        .long_spellings  = {"config"},
        .short_spellings = {"c"},
        .help            = "The deployment configuration file. Default is 'deploy.yaml' in the "
                           "workspace directory",
        .valname         = "<config-file>",
        .action          = put_into(opts.config_file),
    };

    argument target_arg{
        .long_spellings  = {"target"},
        .short_spellings = {"t"},
        .help            = "The name of a target to deploy to. May be given more than once",
        .valname         = "<target-name>",
        .can_repeat      = true,
        .action          = push_back_onto(opts.targets),
    };

    void do_setup(argument_parser& parser) noexcept {
        parser.add_argument({
            .long_spellings  = {"log-level"},
            .short_spellings = {"l"},
            .help            = "Set the dply logging level. One of 'trace', 'debug', 'info', \n"
                               "'warn', 'error', 'critical', or 'silent'",
            .valname         = "<level>",
            .action          = put_into(opts.log_level),
        });

        setup_main_commands(parser.add_subparsers({
            .description = "The operation to perform",
            .action      = put_into(opts.subcommand),
        }));
    }

    void setup_main_commands(subparser_group& group) {
        setup_deploy_cmd(group.add_parser({
            .name = "deploy",
            .help = "Deploy the files of a package to its targets",
        }));
        setup_deploy_file_cmd(group.add_parser({
            .name = "deploy-file",
            .help = "Deploy individual files to one or more targets",
        }));
        setup_ls_cmd(group.add_parser({
            .name = "ls",
            .help = "List the targets, packages, or plugins of a workspace",
        }));
    }

    void add_workspace_args(argument_parser& cmd) {
        cmd.add_argument(workspace_arg.dup());
        cmd.add_argument(config_arg.dup());
    }

    void setup_deploy_cmd(argument_parser& deploy_cmd) {
        add_workspace_args(deploy_cmd);
        deploy_cmd.add_argument(target_arg.dup()).help
            = "Deploy to only the named target. May be given more than once. If omitted, every "
              "target is deployed to";
        deploy_cmd.add_argument({
            .help     = "The name of the package to deploy",
            .valname  = "<package>",
            .required = true,
            .action   = put_into(opts.deploy.package),
        });
    }

    void setup_deploy_file_cmd(argument_parser& deploy_file_cmd) noexcept {
        add_workspace_args(deploy_file_cmd);
        deploy_file_cmd.add_argument(target_arg.dup()).required = true;
        deploy_file_cmd.add_argument({
            .long_spellings  = {"base-dir"},
            .short_spellings = {"B"},
            .help     = "The directory that file paths are made relative to. Default is the "
                        "workspace directory",
            .valname  = "<directory>",
            .action   = put_into(opts.deploy_file.base_dir),
        });
        deploy_file_cmd.add_argument({
            .help       = "One or more files to deploy",
            .valname    = "<files>",
            .required   = true,
            .can_repeat = true,
            .action     = push_back_onto(opts.deploy_file.files),
        });
    }

    void setup_ls_cmd(argument_parser& ls_cmd) noexcept {
        add_workspace_args(ls_cmd);
        auto& grp = ls_cmd.add_subparsers({
            .valname = "<what>",
            .action  = put_into(opts.ls.subcommand),
        });
        grp.add_parser({
            .name = "targets",
            .help = "List the deployment targets, in deployment order",
        });
        grp.add_parser({
            .name = "packages",
            .help = "List the packages",
        });
        grp.add_parser({
            .name = "plugins",
            .help = "List the loaded plugins and the target types they handle",
        });
    }
};

}  // namespace

void cli::options::setup_parser(debate::argument_parser& parser) noexcept {
    setup{*this}.do_setup(parser);
}

fs::path dply::cli::options::absolute_workspace_dir_path() const noexcept {
    return dply::resolve_path_weak(workspace_dir);
}

cli::options::options() noexcept {
    auto ll = getenv("DPLY_LOG_LEVEL");
    if (ll.has_value()) {
        auto llo = magic_enum::enum_cast<log::level>(*ll);
        if (llo.has_value()) {
            log_level = *llo;
        }
    }

    auto ws = getenv("DPLY_WORKSPACE");
    if (ws.has_value()) {
        workspace_dir = *ws;
    }
    auto cfg = getenv("DPLY_CONFIG");
    if (cfg.has_value()) {
        config_file = *cfg;
    }
}
