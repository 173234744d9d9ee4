#include "./dym.hpp"

#include <catch2/catch.hpp>

#include <vector>

TEST_CASE("Compute edit distances") {
    CHECK(dply::lev_edit_distance("local", "local") == 0);
    CHECK(dply::lev_edit_distance("local", "locl") == 1);
    CHECK(dply::lev_edit_distance("kitten", "sitting") == 3);
    CHECK(dply::lev_edit_distance("", "abc") == 3);
}

TEST_CASE("Suggest the nearest name") {
    std::vector<std::string> names = {"production", "staging", "local-copy"};
    CHECK(dply::did_you_mean("prodution", names) == "production");
    CHECK(dply::did_you_mean("stagin", names) == "staging");

    // Nothing in common with any candidate
    CHECK_FALSE(dply::did_you_mean("qqq", names).has_value());

    std::vector<std::string> none;
    CHECK_FALSE(dply::did_you_mean("anything", none).has_value());
}
