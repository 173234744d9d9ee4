#include "../options.hpp"
#include "./deploy_common.hpp"

#include <dply/context/context.hpp>
#include <dply/plugin/registry.hpp>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <neo/assert.hpp>

#include <iostream>

namespace dply::cli::cmd {

namespace {

void ls_targets(const deploy_session& session) {
    for (auto t : session.config().sorted_targets()) {
        fmt::print(std::cout, "{}\t{}\t{}\n", t->name, t->type, t->description);
    }
}

void ls_packages(const deploy_session& session) {
    for (auto p : session.config().sorted_packages()) {
        fmt::print(std::cout, "{}\t{}\n", p->name, p->description);
    }
}

void ls_plugins(const deploy_session& session) {
    for (auto reg : session.registry().plugins()) {
        fmt::print(std::cout,
                   "{}\t{}\t{}\n",
                   reg.identity.type,
                   reg.identity.file,
                   reg.plugin.info().description);
    }
}

}  // namespace

int ls(const options& opts) {
    neo_assert(invariant, opts.subcommand == subcommand::ls, "Wrong subcommand for dispatch");
    auto session = open_session(opts);
    switch (opts.ls.subcommand) {
    case ls_subcommand::targets:
        ls_targets(*session);
        return 0;
    case ls_subcommand::packages:
        ls_packages(*session);
        return 0;
    case ls_subcommand::plugins:
        ls_plugins(*session);
        return 0;
    case ls_subcommand::_none_:;
    }
    neo::unreachable();
}

}  // namespace dply::cli::cmd
