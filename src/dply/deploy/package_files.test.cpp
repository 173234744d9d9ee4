#include "./package_files.hpp"

#include <dply/dply.test.hpp>
#include <dply/error/errors.hpp>

#include <catch2/catch.hpp>

#include <algorithm>

using namespace dply;

namespace {

std::vector<std::string> relative_names(const std::vector<fs::path>& files, path_ref root) {
    std::vector<std::string> ret;
    for (auto& f : files) {
        ret.push_back(f.lexically_relative(root).generic_string());
    }
    return ret;
}

}  // namespace

TEST_CASE("A package without globs includes every file") {
    auto root  = testing::DATA_DIR / "workspace";
    auto files = resolve_package_files(deploy_package{.name = "all"}, root);
    auto names = relative_names(files, root);
    CHECK(names
          == std::vector<std::string>{
              ".cache/state",
              "css/site.css",
              "deploy.yaml",
              "docs/readme.md",
              "index.html",
              "src/a/x.txt",
              "src/b.txt",
          });
}

TEST_CASE("Include and exclude globs select package files") {
    auto root = testing::DATA_DIR / "workspace";

    deploy_package web;
    web.name  = "web";
    web.files = {"*.html", "css/**"};
    CHECK(relative_names(resolve_package_files(web, root), root)
          == std::vector<std::string>{"css/site.css", "index.html"});

    deploy_package sources;
    sources.name    = "sources";
    sources.files   = {"src/**"};
    sources.exclude = {"src/a/**"};
    CHECK(relative_names(resolve_package_files(sources, root), root)
          == std::vector<std::string>{"src/b.txt"});

    deploy_package visible;
    visible.name    = "visible";
    visible.exclude = {"**/.*", "**/.*/**"};
    auto names      = relative_names(resolve_package_files(visible, root), root);
    CHECK(std::ranges::find(names, ".cache/state") == names.end());
    CHECK(std::ranges::find(names, "index.html") != names.end());
}

TEST_CASE("A package can be empty") {
    auto           root = testing::DATA_DIR / "workspace";
    deploy_package pkg;
    pkg.files = {"**/*.nothing"};
    CHECK(resolve_package_files(pkg, root).empty());
}

TEST_CASE("Invalid package globs are configuration errors") {
    testing::scratch_workspace ws;
    deploy_package             pkg;
    pkg.files = {"/"};
    CHECK_THROWS_AS(resolve_package_files(pkg, ws.root()),
                    user_error<errc::invalid_config_file>);
}
