#include "./local.hpp"

#include <dply/context/context.hpp>
#include <dply/error/errors.hpp>
#include <dply/error/result.hpp>
#include <dply/mapping/path_mapper.hpp>
#include <dply/transform/transform.hpp>
#include <dply/util/fs/io.hpp>
#include <dply/util/fs/path.hpp>
#include <dply/util/fs/shutil.hpp>
#include <dply/util/log.hpp>

#include <fmt/core.h>

#include <system_error>

using namespace dply;

namespace {

void write_transformed(const deploy_context& ctx,
                       path_ref              source,
                       path_ref              dest,
                       const deploy_target&  target) {
    auto& mod = ctx.require(*target.transformer);
    std::string content;
    try {
        content = dply::read_file(source);
    } catch (const std::system_error& e) {
        throw_external_error<errc::write_failure>("Failed to read [{}]: {}",
                                                  source.string(),
                                                  e.code().message());
    }
    auto transformed = apply_transform(std::move(content),
                                       transform_mode::transform,
                                       &mod,
                                       target.transformer_options);
    try {
        dply::write_file(dest, transformed);
    } catch (const std::system_error& e) {
        throw_external_error<errc::write_failure>("Failed to write [{}]: {}",
                                                  dest.string(),
                                                  e.code().message());
    }
}

}  // namespace

void local_plugin::deploy_file(path_ref                   file,
                               const deploy_target&       target,
                               const deploy_file_options& opts) {
    auto completed = [&](bool canceled, std::exception_ptr err) {
        if (opts.on_completed) {
            opts.on_completed(file_completed_event{
                .file     = file,
                .target   = target,
                .canceled = canceled,
                .error    = err,
            });
        }
    };

    if (context().is_cancelling()) {
        completed(true, nullptr);
        return;
    }

    fs::path dest;
    try {
        dest = resolve_target_path(file, target, context().workspace_root(), opts.base_directory);
    } catch (const mapping_error& e) {
        dply_log(debug, "{}", e.what());
        completed(false, std::current_exception());
        return;
    }
    const auto dest_dir = dest.parent_path();

    try {
        check_result<errc::directory_failure>([&] { return ensure_directory(dest_dir); },
                                              "Failed to create directory",
                                              dest_dir.string());
    } catch (const directory_error&) {
        completed(false, std::current_exception());
        return;
    }

    std::exception_ptr err;
    try {
        if (opts.on_before_deploy) {
            opts.on_before_deploy(before_deploy_file_event{
                .file             = file,
                .target           = target,
                .destination      = dest_dir,
                .destination_file = dest,
            });
        }
        auto source = file.is_absolute() ? file : context().workspace_root() / file;
        if (target.transformer) {
            write_transformed(context(), source, dest, target);
        } else {
            check_result<errc::write_failure>([&] { return copy_file_overwrite(source, dest); },
                                              "Failed to copy file to",
                                              dest.string());
        }
        dply_log(debug, "Deployed [{}] to [{}]", file.string(), dest.string());
    } catch (const std::exception&) {
        err = std::current_exception();
    }
    completed(false, err);
}

void local_plugin::deploy_workspace(const std::vector<fs::path>&    files,
                                    const deploy_target&            target,
                                    const deploy_workspace_options& opts) {
    if (target.empty && !context().is_cancelling()) {
        auto root = target_root_directory(target, context().workspace_root());
        auto& out = context().output();
        out.write(fmt::format("Empty LOCAL target directory '{}'... ", root.string()));
        try {
            // Emptying the workspace or a directory that contains it would delete the files
            // being deployed
            if (path_starts_with(normalize_path(context().workspace_root()), root)) {
                throw make_user_error<errc::empty_target_failure>(
                    "Refusing to empty [{}]: it contains the workspace [{}]",
                    root.string(),
                    context().workspace_root().string());
            }
            check_result<errc::empty_target_failure>([&] { return empty_directory(root); },
                                                     "Failed to empty directory",
                                                     root.string());
        } catch (const error_base& e) {
            out.write_line(fmt::format("[FAILED: {}]", e.what()));
            context().error(e.what());
            if (opts.on_completed) {
                opts.on_completed(workspace_completed_event{
                    .target   = target,
                    .canceled = false,
                    .error    = std::current_exception(),
                });
            }
            return;
        }
        out.write_line("[OK]");
    }
    deploy_plugin_base::deploy_workspace(files, target, opts);
}

plugin_info local_plugin::info() const {
    return plugin_info{
        .description = "Deploys to a local folder or a shared folder (like SMB) inside your LAN",
    };
}

std::unique_ptr<deploy_plugin> dply::create_local_plugin(deploy_context& ctx) {
    return std::make_unique<local_plugin>(ctx);
}
