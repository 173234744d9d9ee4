#include "./path_mapper.hpp"

#include <dply/error/errors.hpp>

#include <catch2/catch.hpp>

namespace {

dply::deploy_target make_target(std::optional<dply::fs::path>           dir,
                                std::vector<dply::target_mapping> mappings = {}) {
    dply::deploy_target t;
    t.name     = "test";
    t.type     = "local";
    t.dir      = dir;
    t.mappings = std::move(mappings);
    return t;
}

const dply::fs::path ws_root = "/ws";

}  // namespace

TEST_CASE("Files keep their relative path without mappings") {
    auto t = make_target("/tmp/dest");
    CHECK(dply::resolve_target_path("proj/readme.md", t, ws_root, dply::fs::path("proj"))
          == dply::fs::path("/tmp/dest/readme.md"));
    CHECK(dply::resolve_target_path("/ws/src/main.cpp", t, ws_root)
          == dply::fs::path("/tmp/dest/src/main.cpp"));
}

TEST_CASE("The target root defaults to the workspace root") {
    CHECK(dply::target_root_directory(make_target(std::nullopt), ws_root) == "/ws");
    CHECK(dply::target_root_directory(make_target(""), ws_root) == "/ws");
    CHECK(dply::target_root_directory(make_target("out/site/"), ws_root) == "/ws/out/site");
    CHECK(dply::target_root_directory(make_target("/srv/www"), ws_root) == "/srv/www");

    CHECK(dply::resolve_target_path("/ws/a/b.txt", make_target("build"), ws_root)
          == dply::fs::path("/ws/build/a/b.txt"));
}

TEST_CASE("The first matching mapping wins") {
    auto t = make_target("/dest", {{"src/a", "out/a"}, {"src", "out"}});
    CHECK(dply::resolve_target_path("/ws/src/a/x.txt", t, ws_root)
          == dply::fs::path("/dest/out/a/x.txt"));
    CHECK(dply::resolve_target_path("/ws/src/b/y.txt", t, ws_root)
          == dply::fs::path("/dest/out/b/y.txt"));
    CHECK(dply::resolve_target_path("/ws/src/z.txt", t, ws_root)
          == dply::fs::path("/dest/out/z.txt"));

    // Declaration order matters, not specificity
    auto reversed = make_target("/dest", {{"src", "out"}, {"src/a", "out/a"}});
    CHECK(dply::resolve_target_path("/ws/src/a/x.txt", reversed, ws_root)
          == dply::fs::path("/dest/out/a/x.txt"));
}

TEST_CASE("Mappings match whole directory names") {
    auto t = make_target("/dest", {{"src/a", "out/a"}});
    CHECK(dply::resolve_target_path("/ws/src/ab/x.txt", t, ws_root)
          == dply::fs::path("/dest/src/ab/x.txt"));
    CHECK(dply::resolve_target_path("/ws/readme.md", t, ws_root)
          == dply::fs::path("/dest/readme.md"));
}

TEST_CASE("Leading separators of a mapping source are ignored") {
    auto t = make_target("/dest", {{"/docs", "public"}});
    CHECK(dply::resolve_target_path("/ws/docs/guide/index.html", t, ws_root)
          == dply::fs::path("/dest/public/guide/index.html"));
}

TEST_CASE("An absolute mapping target replaces the target root") {
    auto t = make_target("/dest", {{"logs", "/var/log/app"}});
    CHECK(dply::resolve_target_path("/ws/logs/2020/app.log", t, ws_root)
          == dply::fs::path("/var/log/app/2020/app.log"));
}

TEST_CASE("Mapping is deterministic") {
    auto t     = make_target("/dest", {{"src", "out"}});
    auto first = dply::resolve_target_path("/ws/src/main.cpp", t, ws_root);
    for (int i = 0; i < 5; ++i) {
        CHECK(dply::resolve_target_path("/ws/src/main.cpp", t, ws_root) == first);
    }
}

TEST_CASE("Files outside of the base directory cannot be mapped") {
    auto t = make_target("/dest");
    CHECK_THROWS_AS(dply::resolve_target_path("/elsewhere/file.txt", t, ws_root),
                    dply::mapping_error);
    CHECK_THROWS_AS(dply::resolve_target_path("/ws/other/file.txt",
                                              t,
                                              ws_root,
                                              dply::fs::path("/ws/proj")),
                    dply::mapping_error);
    CHECK_THROWS_AS(dply::resolve_target_path("../up.txt", t, ws_root), dply::mapping_error);
    CHECK_THROWS_AS(dply::resolve_target_path("/ws", t, ws_root), dply::mapping_error);
}
