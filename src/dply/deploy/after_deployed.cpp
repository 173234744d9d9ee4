#include "./after_deployed.hpp"

#include <dply/context/context.hpp>
#include <dply/error/errors.hpp>
#include <dply/error/result.hpp>
#include <dply/util/env.hpp>
#include <dply/util/log.hpp>
#include <dply/util/proc.hpp>
#include <dply/util/string.hpp>

#include <boost/leaf/exception.hpp>
#include <fmt/core.h>

#include <vector>

using namespace dply;

void dply::open_external(std::string_view what) {
    auto opener = dply::getenv_or("DPLY_OPEN_COMMAND", "xdg-open");
    auto argv   = std::vector<std::string>{opener, std::string(what)};
    dply_log(debug, "Running opener: {}", quote_command(argv));
    auto res = run_proc(proc_options{.command = argv, .capture_output = false});
    if (!res.okay()) {
        BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::after_deployed_failure>(
            "Failed to open '{}' with [{}] (exit code {}, signal {})",
            what,
            opener,
            res.retc,
            res.signal));
    }
}

void dply::run_after_deployed_operations(const deploy_target& target, const deploy_context& ctx) {
    for (auto& op : target.deployed) {
        DPLY_E_SCOPE(e_after_deployed_operation{op.type, op.target});
        auto type = normalize_key(op.type);
        if (type.empty() || type == "open") {
            if (trim_view(op.target).empty()) {
                BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::after_deployed_failure>(
                    "An 'open' operation of target [{}] has nothing to open",
                    target.display_name()));
            }
            ctx.output().write_line(fmt::format("Open '{}'...", op.target));
            open_external(op.target);
        } else {
            BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::after_deployed_failure>(
                "Unknown operation type '{}' after deploying to [{}]",
                op.type,
                target.display_name()));
        }
    }
}
