#include "./local.hpp"

#include <dply/deploy/session.hpp>
#include <dply/dply.test.hpp>
#include <dply/error/errors.hpp>
#include <dply/transform/builtin.hpp>
#include <dply/util/yaml/parse.hpp>

#include <catch2/catch.hpp>
#include <fmt/core.h>

#include <chrono>

using namespace dply;

namespace {

struct local_fixture {
    testing::scratch_workspace ws;
    cancel_token               cancel;

    std::unique_ptr<deploy_session> session;

    explicit local_fixture(std::string_view config_yaml) {
        session = std::make_unique<deploy_session>(
            deploy_config::from_yaml(parse_yaml_string(config_yaml)),
            ws.root(),
            cancel,
            ws.output);
    }

    const deploy_target& target(std::string_view name) const {
        return session->config().get_target(name);
    }

    deploy_plugin& plugin() const { return session->registry().resolve("local").plugin; }

    std::vector<file_completed_event> deploy_one(path_ref file, const deploy_target& t) {
        std::vector<file_completed_event> events;
        plugin().deploy_file(file, t, deploy_file_options{
            .base_directory   = std::nullopt,
            .on_before_deploy = {},
            .on_completed     = [&](const file_completed_event& ev) { events.push_back(ev); },
        });
        return events;
    }
};

template <typename Exc>
bool holds(std::exception_ptr p) {
    try {
        std::rethrow_exception(p);
    } catch (const Exc&) {
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

}  // namespace

TEST_CASE("Deploy a single file to a local directory") {
    local_fixture f{R"(
targets:
  - name: out
    type: local
    dir: out
)"};
    auto src = f.ws.add_file("src/main.cpp", "int main() {}");

    auto old_time = fs::file_time_type::clock::now() - std::chrono::hours(30);
    fs::last_write_time(src, old_time);

    auto events = f.deploy_one(src, f.target("out"));
    REQUIRE(events.size() == 1);
    CHECK(events[0].succeeded());
    CHECK(events[0].file == src);

    auto dest = f.ws.root() / "out/src/main.cpp";
    REQUIRE(fs::exists(dest));
    CHECK(read_file(dest) == "int main() {}");
    CHECK(fs::last_write_time(dest) == old_time);
}

TEST_CASE("Deploying overwrites an existing file") {
    local_fixture f{R"(
targets:
  - name: out
    type: local
    dir: out
)"};
    auto src = f.ws.add_file("readme.md", "new content");
    f.ws.add_file("out/readme.md", "old content that is longer");

    auto events = f.deploy_one(src, f.target("out"));
    REQUIRE(events.size() == 1);
    CHECK(events[0].succeeded());
    CHECK(read_file(f.ws.root() / "out/readme.md") == "new content");
}

TEST_CASE("Mappings and relative source paths are honored") {
    local_fixture f{R"(
targets:
  - name: site
    type: local
    dir: public
    mappings:
      - source: src/a
        target: out/a
      - source: src
        target: out
)"};
    f.ws.add_file("src/a/x.txt", "x");

    auto events = f.deploy_one("src/a/x.txt", f.target("site"));
    REQUIRE(events.size() == 1);
    CHECK(events[0].succeeded());
    CHECK(fs::exists(f.ws.root() / "public/out/a/x.txt"));
    CHECK_FALSE(fs::exists(f.ws.root() / "public/out/a/a/x.txt"));
}

TEST_CASE("The before-deploy event fires after the directory is created") {
    local_fixture f{R"(
targets:
  - name: out
    type: local
    dir: deep/er/out
)"};
    auto src = f.ws.add_file("docs/guide.md", "guide");

    std::vector<std::string> order;
    f.plugin().deploy_file(src, f.target("out"), deploy_file_options{
        .base_directory = std::nullopt,
        .on_before_deploy =
            [&](const before_deploy_file_event& ev) {
                order.push_back("before");
                CHECK(ev.file == src);
                CHECK(ev.destination == f.ws.root() / "deep/er/out/docs");
                CHECK(ev.destination_file == f.ws.root() / "deep/er/out/docs/guide.md");
                CHECK(fs::is_directory(ev.destination));
                CHECK_FALSE(fs::exists(ev.destination_file));
            },
        .on_completed = [&](const file_completed_event&) { order.push_back("completed"); },
    });
    CHECK(order == std::vector<std::string>{"before", "completed"});
}

TEST_CASE("A canceled deployment touches nothing") {
    local_fixture f{R"(
targets:
  - name: out
    type: local
    dir: out
)"};
    auto src = f.ws.add_file("a.txt", "a");
    f.cancel.request();

    bool before_called = false;
    std::vector<file_completed_event> events;
    f.plugin().deploy_file(src, f.target("out"), deploy_file_options{
        .base_directory   = std::nullopt,
        .on_before_deploy = [&](const before_deploy_file_event&) { before_called = true; },
        .on_completed     = [&](const file_completed_event& ev) { events.push_back(ev); },
    });
    REQUIRE(events.size() == 1);
    CHECK(events[0].canceled);
    CHECK_FALSE(events[0].error);
    CHECK_FALSE(before_called);
    CHECK_FALSE(fs::exists(f.ws.root() / "out"));
}

TEST_CASE("A file outside of the base directory fails with a mapping error") {
    local_fixture f{R"(
targets:
  - name: out
    type: local
    dir: out
)"};
    testing::scratch_workspace elsewhere;
    auto src = elsewhere.add_file("stray.txt", "stray");

    auto events = f.deploy_one(src, f.target("out"));
    REQUIRE(events.size() == 1);
    CHECK_FALSE(events[0].canceled);
    REQUIRE(events[0].error);
    CHECK(holds<mapping_error>(events[0].error));
    CHECK_FALSE(fs::exists(f.ws.root() / "out"));
}

TEST_CASE("A blocked destination directory fails with a directory error") {
    local_fixture f{R"(
targets:
  - name: out
    type: local
    dir: out
)"};
    auto src = f.ws.add_file("sub/a.txt", "a");
    // A file where the destination directory should be
    f.ws.add_file("out/sub", "in the way");

    auto events = f.deploy_one(src, f.target("out"));
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].error);
    CHECK(holds<directory_error>(events[0].error));
}

TEST_CASE("A missing source file fails with a write error") {
    local_fixture f{R"(
targets:
  - name: out
    type: local
    dir: out
)"};
    auto events = f.deploy_one(f.ws.root() / "does-not-exist.txt", f.target("out"));
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].error);
    CHECK(holds<write_error>(events[0].error));
}

TEST_CASE("Contents are transformed when the target names a transformer") {
    local_fixture f{R"(
targets:
  - name: encoded
    type: local
    dir: out
    transformer: base64
  - name: broken
    type: local
    dir: broken
    transformer: no-such-module.so
)"};
    auto src = f.ws.add_file("data.bin", "hello, world");

    auto events = f.deploy_one(src, f.target("encoded"));
    REQUIRE(events.size() == 1);
    CHECK(events[0].succeeded());
    CHECK(read_file(f.ws.root() / "out/data.bin") == base64_encode("hello, world"));

    events = f.deploy_one(src, f.target("broken"));
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].error);
    CHECK(holds<user_error<errc::module_load_failure>>(events[0].error));
    CHECK_FALSE(fs::exists(f.ws.root() / "broken/data.bin"));
}

TEST_CASE("Empty the target directory before deploying a workspace") {
    local_fixture f{R"(
targets:
  - name: out
    type: local
    dir: out
    empty: true
)"};
    auto a = f.ws.add_file("a.txt", "a");
    auto b = f.ws.add_file("nested/b.txt", "b");
    f.ws.add_file("out/stale.txt", "stale");
    f.ws.add_file("out/old/dir/stale.txt", "stale");

    std::vector<file_completed_event>      files;
    std::vector<workspace_completed_event> done;
    f.plugin().deploy_workspace({a, b}, f.target("out"), deploy_workspace_options{
        .base_directory        = std::nullopt,
        .on_before_deploy_file = {},
        .on_file_completed     = [&](const file_completed_event& ev) { files.push_back(ev); },
        .on_completed = [&](const workspace_completed_event& ev) { done.push_back(ev); },
    });

    REQUIRE(files.size() == 2);
    CHECK(files[0].file == a);
    CHECK(files[1].file == b);
    CHECK(files[0].succeeded());
    CHECK(files[1].succeeded());
    REQUIRE(done.size() == 1);
    CHECK_FALSE(done[0].canceled);
    CHECK_FALSE(done[0].error);

    CHECK_FALSE(fs::exists(f.ws.root() / "out/stale.txt"));
    CHECK_FALSE(fs::exists(f.ws.root() / "out/old"));
    CHECK(fs::exists(f.ws.root() / "out/a.txt"));
    CHECK(fs::exists(f.ws.root() / "out/nested/b.txt"));
    CHECK_THAT(f.ws.output.str(), Catch::Contains("Empty LOCAL target directory"));
    CHECK_THAT(f.ws.output.str(), Catch::Contains("[OK]"));
}

TEST_CASE("Failing to empty the target aborts the workspace deployment") {
    local_fixture f{R"(
targets:
  - name: out
    type: local
    dir: out
    empty: true
)"};
    auto a = f.ws.add_file("a.txt", "a");
    // The target root is a regular file, so it cannot be emptied
    f.ws.add_file("out", "not a directory");

    std::vector<file_completed_event>      files;
    std::vector<workspace_completed_event> done;
    f.plugin().deploy_workspace({a}, f.target("out"), deploy_workspace_options{
        .base_directory        = std::nullopt,
        .on_before_deploy_file = {},
        .on_file_completed     = [&](const file_completed_event& ev) { files.push_back(ev); },
        .on_completed = [&](const workspace_completed_event& ev) { done.push_back(ev); },
    });

    CHECK(files.empty());
    REQUIRE(done.size() == 1);
    REQUIRE(done[0].error);
    CHECK(holds<external_error<errc::empty_target_failure>>(done[0].error));
    CHECK(read_file(f.ws.root() / "out") == "not a directory");
    CHECK_THAT(f.ws.output.str(), Catch::Contains("[FAILED:"));
}

TEST_CASE("A target rooted at the workspace is never emptied") {
    auto dir = GENERATE(as<std::string>{}, "", "dir: ./", "dir: .");
    INFO("Target directory: " << dir);
    local_fixture f{fmt::format(R"(
targets:
  - name: here
    type: local
    empty: true
    {}
)",
                                dir)};
    auto a = f.ws.add_file("a.txt", "a");

    std::vector<file_completed_event>      files;
    std::vector<workspace_completed_event> done;
    f.plugin().deploy_workspace({a}, f.target("here"), deploy_workspace_options{
        .base_directory        = std::nullopt,
        .on_before_deploy_file = {},
        .on_file_completed     = [&](const file_completed_event& ev) { files.push_back(ev); },
        .on_completed = [&](const workspace_completed_event& ev) { done.push_back(ev); },
    });

    CHECK(files.empty());
    REQUIRE(done.size() == 1);
    CHECK(holds<user_error<errc::empty_target_failure>>(done[0].error));
    CHECK(read_file(a) == "a");
    CHECK_THAT(f.ws.output.str(), Catch::Contains("Refusing to empty"));
}

TEST_CASE("A workspace deployment stops deploying once canceled") {
    local_fixture f{R"(
targets:
  - name: out
    type: local
    dir: out
)"};
    auto a = f.ws.add_file("a.txt", "a");
    auto b = f.ws.add_file("b.txt", "b");
    auto c = f.ws.add_file("c.txt", "c");

    std::vector<file_completed_event>      files;
    std::vector<workspace_completed_event> done;
    f.plugin().deploy_workspace({a, b, c}, f.target("out"), deploy_workspace_options{
        .base_directory        = std::nullopt,
        .on_before_deploy_file = {},
        .on_file_completed =
            [&](const file_completed_event& ev) {
                files.push_back(ev);
                // Cancel after the first file has been deployed
                f.cancel.request();
            },
        .on_completed = [&](const workspace_completed_event& ev) { done.push_back(ev); },
    });

    REQUIRE(files.size() == 3);
    CHECK(files[0].succeeded());
    CHECK(files[1].canceled);
    CHECK(files[2].canceled);
    REQUIRE(done.size() == 1);
    CHECK(done[0].canceled);
    CHECK(fs::exists(f.ws.root() / "out/a.txt"));
    CHECK_FALSE(fs::exists(f.ws.root() / "out/b.txt"));
}

TEST_CASE("The local plugin describes itself") {
    local_fixture f{"{}"};
    CHECK_FALSE(f.plugin().info().description.empty());
}
