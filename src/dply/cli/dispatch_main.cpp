#include "./dispatch_main.hpp"

#include "./error_handler.hpp"
#include "./options.hpp"

#include <dply/error/result.hpp>

#include <neo/assert.hpp>

using namespace dply;

namespace dply::cli {

namespace cmd {
using command = int(const options&);

command deploy;
command deploy_file;
command ls;

}  // namespace cmd

int dispatch_main(const options& opts) noexcept {
    return dply::handle_cli_errors([&] {
        DPLY_E_SCOPE(opts.subcommand);
        switch (opts.subcommand) {
        case subcommand::deploy:
            return cmd::deploy(opts);
        case subcommand::deploy_file:
            return cmd::deploy_file(opts);
        case subcommand::ls: {
            DPLY_E_SCOPE(opts.ls.subcommand);
            return cmd::ls(opts);
        }
        case subcommand::_none_:;
        }
        neo::unreachable();
        return 6;
    });
}

}  // namespace dply::cli
