#include "./registry.hpp"

#include <dply/deploy/orchestrator.hpp>
#include <dply/deploy/session.hpp>
#include <dply/dply.test.hpp>
#include <dply/error/errors.hpp>

#include <catch2/catch.hpp>
#include <fmt/core.h>
#include <yaml-cpp/yaml.h>

using namespace dply;

namespace {

struct null_plugin : deploy_plugin {
    void deploy_file(path_ref, const deploy_target&, const deploy_file_options&) override {}
    void deploy_workspace(const std::vector<fs::path>&,
                          const deploy_target&,
                          const deploy_workspace_options&) override {}
    plugin_info info() const override { return {.description = "Does nothing"}; }
};

struct registry_fixture {
    testing::scratch_workspace ws;
    deploy_session             session{deploy_config{}, ws.root(), cancel_token{}, ws.output};

    plugin_registry& registry() { return session.registry(); }
};

}  // namespace

TEST_CASE("The built-in local plugin is registered") {
    registry_fixture f;
    REQUIRE(f.registry().size() == 1);
    auto local = f.registry().resolve("local");
    CHECK(local.identity.type == "local");
    CHECK(local.identity.file == "local");
    CHECK(local.identity.file_path.empty());
    CHECK(local.identity.index == 0);
    CHECK_FALSE(local.plugin.info().description.empty());
}

TEST_CASE("Target types compare without case and surrounding whitespace") {
    registry_fixture f;
    auto& local = f.registry().resolve("local").plugin;
    CHECK(&f.registry().resolve("LOCAL").plugin == &local);
    CHECK(&f.registry().resolve("  Local\t").plugin == &local);
}

TEST_CASE("Unknown and ambiguous target types are configuration errors") {
    registry_fixture f;
    CHECK_THROWS_AS(f.registry().resolve("sftp"), unknown_target_type_error);
    CHECK_THROWS_AS(f.registry().resolve(""), unknown_target_type_error);

    auto& ident = f.registry().add("Local", "/plugins/other-local.so", std::make_unique<null_plugin>());
    CHECK(ident.index == 1);
    CHECK(ident.file == "other-local.so");
    CHECK(f.registry().find("local").size() == 2);
    CHECK_THROWS_AS(f.registry().resolve("local"), ambiguous_target_type_error);
}

TEST_CASE("Identities are assigned in registration order") {
    registry_fixture f;
    auto& a = f.registry().add("alpha", "", std::make_unique<null_plugin>());
    auto& b = f.registry().add("beta", "/opt/plugins/libbeta.so", std::make_unique<null_plugin>());
    CHECK(a.index == 1);
    CHECK(a.file == "alpha");
    CHECK(b.index == 2);
    CHECK(b.file_path == fs::path("/opt/plugins/libbeta.so"));
    // Earlier identities stay valid as more plugins are added
    for (int i = 0; i < 20; ++i) {
        f.registry().add("filler", "", std::make_unique<null_plugin>());
    }
    CHECK(a.type == "alpha");
    CHECK(b.type == "beta");

    auto all = f.registry().plugins();
    REQUIRE(all.size() == 23);
    CHECK(all[1].identity.type == "alpha");
    CHECK(all[2].plugin.info().description == "Does nothing");
}

TEST_CASE("Plugin types derive from module file names") {
    CHECK(plugin_type_of_module("/x/libfoo.so") == "foo");
    CHECK(plugin_type_of_module("bar.so") == "bar");
    CHECK(plugin_type_of_module("lib.so") == "lib");
    CHECK(plugin_type_of_module("plugins/libsftp-deploy.so") == "sftp-deploy");
}

TEST_CASE("Load a plugin from a module") {
    registry_fixture f;
    auto& ident = f.registry().load_module(f.session.context(), DPLY_TEST_PLUGIN_MODULE);
    CHECK(ident.type == "echo");
    CHECK(ident.index == 1);
    CHECK(ident.file == fs::path(DPLY_TEST_PLUGIN_MODULE).filename().string());
    CHECK(ident.file_path == fs::path(DPLY_TEST_PLUGIN_MODULE));

    auto echo = f.registry().resolve("Echo");
    CHECK(echo.plugin.info().description == "Echoes files");
}

TEST_CASE("Modules that do not provide a plugin are rejected") {
    registry_fixture f;
    CHECK_THROWS_AS(f.registry().load_module(f.session.context(),
                                             f.ws.root() / "no-such-module.so"),
                    user_error<errc::module_load_failure>);
    CHECK_THROWS_AS(f.registry().load_module(f.session.context(), DPLY_TEST_TRANSFORM_MODULE),
                    user_error<errc::module_load_failure>);
    CHECK(f.registry().size() == 1);
}

TEST_CASE("Sessions load the modules named by the configuration") {
    testing::scratch_workspace ws;
    deploy_config              cfg;
    cfg.modules.push_back(DPLY_TEST_PLUGIN_MODULE);
    deploy_session session{std::move(cfg), ws.root(), cancel_token{}, ws.output};
    CHECK(session.registry().size() == 2);
    CHECK(session.registry().find("echo").size() == 1);
}

TEST_CASE("Module plugins can read their own target properties") {
    testing::scratch_workspace ws;
    auto cfg = deploy_config::from_yaml(YAML::Load(fmt::format(R"(
modules: "{}"
targets:
  - name: loud
    type: echo
    failFiles: [b.txt]
)",
                                                               DPLY_TEST_PLUGIN_MODULE)));
    deploy_session session{std::move(cfg), ws.root(), cancel_token{}, ws.output};

    std::vector<fs::path> files = {ws.add_file("a.txt", "a"), ws.add_file("b.txt", "b")};
    auto report = deploy_orchestrator{session.context()}.deploy_workspace(
        files,
        session.config().get_target("loud"));
    CHECK(report.succeeded == 1);
    CHECK(report.failed == 1);
    CHECK(report.files[0].succeeded());
    CHECK_THROWS_WITH(std::rethrow_exception(report.files[1].error), "Declined to echo b.txt");
}
