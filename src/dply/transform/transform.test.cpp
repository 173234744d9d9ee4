#include "./builtin.hpp"
#include "./module.hpp"
#include "./transform.hpp"

#include <dply/error/errors.hpp>

#include <yaml-cpp/node/parse.h>

#include <catch2/catch.hpp>

#include <cctype>
#include <memory>
#include <stdexcept>

TEST_CASE("No module is the identity") {
    CHECK(dply::apply_transform("hello", dply::transform_mode::transform, nullptr) == "hello");
    CHECK(dply::apply_transform("hello", dply::transform_mode::restore, nullptr) == "hello");
}

TEST_CASE("Base64 encoding") {
    CHECK(dply::base64_encode("") == "");
    CHECK(dply::base64_encode("f") == "Zg==");
    CHECK(dply::base64_encode("fo") == "Zm8=");
    CHECK(dply::base64_encode("foo") == "Zm9v");
    CHECK(dply::base64_encode("foobar") == "Zm9vYmFy");
    CHECK(dply::base64_decode("Zm9vYg==") == "foob");
    CHECK_THROWS_AS(dply::base64_decode("Zm9"), std::invalid_argument);
    CHECK_THROWS_AS(dply::base64_decode("Zm*v"), std::invalid_argument);
}

TEST_CASE("Built-in modules round-trip") {
    auto        options = YAML::Load("key: s3cr3t");
    std::string binary  = std::string("\x00\x01\xfe\xff plain text\n", 16);

    auto module_id = GENERATE(as<std::string>{}, "base64", "xor");
    INFO("Module: " << module_id);
    auto mod = dply::builtin_transform_module(module_id);
    REQUIRE(mod.has_value());

    for (std::string input : {std::string(), std::string("a"), binary}) {
        auto out = dply::apply_transform(input, dply::transform_mode::transform, &*mod, options);
        auto back = dply::apply_transform(out, dply::transform_mode::restore, &*mod, options);
        CHECK(back == input);
    }
}

TEST_CASE("The xor module uses its key option") {
    auto mod = *dply::builtin_transform_module("xor");
    auto a   = dply::apply_transform("data", dply::transform_mode::transform, &mod,
                                   YAML::Load("key: a"));
    auto b   = dply::apply_transform("data", dply::transform_mode::transform, &mod,
                                   YAML::Load("key: b"));
    CHECK(a != b);
    CHECK(a != "data");
}

TEST_CASE("Unknown built-in modules") {
    CHECK_FALSE(dply::builtin_transform_module("rot13").has_value());
}

TEST_CASE("A module without the requested direction is a transform error") {
    dply::transform_module only_forward{
        .id             = "upper",
        .transform_data = [](const dply::transform_context& ctx) {
            std::string ret(ctx.data);
            for (auto& c : ret) {
                c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            }
            return ret;
        },
        .restore_data = {},
    };
    CHECK(dply::apply_transform("abc", dply::transform_mode::transform, &only_forward) == "ABC");
    CHECK_THROWS_AS(dply::apply_transform("ABC", dply::transform_mode::restore, &only_forward),
                    dply::transform_error);
}

TEST_CASE("Exceptions from a module are wrapped, keeping their message") {
    dply::transform_module failing{
        .id             = "failing",
        .transform_data = [](const dply::transform_context&) -> std::string {
            throw std::runtime_error("disk on fire");
        },
        .restore_data = {},
    };
    try {
        (void)dply::apply_transform("abc", dply::transform_mode::transform, &failing);
        FAIL("Expected a transform error");
    } catch (const dply::transform_error& err) {
        CHECK_THAT(err.what(), Catch::Contains("disk on fire"));
        CHECK_THAT(err.what(), Catch::Contains("failing"));
    }
}

TEST_CASE("The module receives the mode and options") {
    dply::transform_module probe{
        .id             = "probe",
        .transform_data = [](const dply::transform_context& ctx) {
            CHECK(ctx.mode == dply::transform_mode::transform);
            return ctx.options["suffix"].as<std::string>();
        },
        .restore_data = {},
    };
    CHECK(dply::apply_transform("x", dply::transform_mode::transform, &probe,
                                YAML::Load("suffix: hi"))
          == "hi");
}

TEST_CASE("Load a transform module from a shared object") {
    auto lib = std::make_shared<dply::shared_library>(
        dply::shared_library::open(DPLY_TEST_TRANSFORM_MODULE));
    auto mod = dply::make_shared_object_transform("reverse", lib);
    auto out = dply::apply_transform("abcdef", dply::transform_mode::transform, &mod);
    CHECK(out == "fedcba");
    CHECK(dply::apply_transform(out, dply::transform_mode::restore, &mod) == "abcdef");
    CHECK_THROWS_AS(dply::apply_transform("", dply::transform_mode::transform, &mod),
                    dply::transform_error);
}
