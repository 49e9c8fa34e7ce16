#include <catch2/catch_all.hpp>

#include "stanza/stanza.hpp"

#include <string_view>
#include <vector>

using namespace Catch;

namespace {
    Stanza::value json(std::string_view text) {
        auto r = Stanza::parse(text);
        REQUIRE(r);
        return *r;
    }
}


TEST_CASE("Merging a Value With Itself") {
    for (std::string_view text : { "null", "1", R"("s")", "[1,2]", R"({"a":{"b":[1]},"c":null})" }) {
        auto v = json(text);
        REQUIRE(Stanza::deep_merge(v, v) == v);
        REQUIRE(v.deep_merge(v) == v);
    }
}

TEST_CASE("Non-object Values are Replaced") {
    REQUIRE(Stanza::deep_merge(json("[1,2]"), json("[3]")) == json("[3]"));
    REQUIRE(Stanza::deep_merge(json(R"({"a":1})"), json("5")) == json("5"));
    REQUIRE(Stanza::deep_merge(json("5"), json(R"({"a":1})")) == json(R"({"a":1})"));
    REQUIRE(Stanza::deep_merge(json("true"), json("null")).is_null());
    REQUIRE(Stanza::deep_merge(json(R"({"a":[1,2]})"), json(R"({"a":[3]})")) == json(R"({"a":[3]})"));
}

TEST_CASE("Objects Merge Key by Key") {
    REQUIRE(Stanza::deep_merge(json(R"({"a":1,"b":2})"), json(R"({"b":3,"c":4})")) == json(R"({"a":1,"b":3,"c":4})"));
    REQUIRE(Stanza::deep_merge(json(R"({"a":{"x":1,"y":2}})"), json(R"({"a":{"y":3}})")) == json(R"({"a":{"x":1,"y":3}})"));
    REQUIRE(Stanza::deep_merge(json(R"({"a":{"x":1}})"), json(R"({"a":null})")) == json(R"({"a":null})"));
    REQUIRE(Stanza::deep_merge(json(R"({"a":{"b":{"c":1,"d":2}}})"), json(R"({"a":{"b":{"c":9},"e":0}})"))
            == json(R"({"a":{"b":{"c":9,"d":2},"e":0}})"));
}

TEST_CASE("Merged Objects Put Patch Members First") {
    auto merged = Stanza::deep_merge(json(R"({"a":1,"b":2,"z":0})"), json(R"({"c":4,"b":3})"));
    REQUIRE(merged.no_spaces() == R"({"c":4,"b":3,"a":1,"z":0})");

    auto nested = Stanza::deep_merge(json(R"({"n":{"x":1,"y":2}})"), json(R"({"n":{"y":3}})"));
    REQUIRE(nested.no_spaces() == R"({"n":{"y":3,"x":1}})");
}

TEST_CASE("Merging Leaves Both Inputs Unchanged") {
    auto base = json(R"({"a":{"x":1}})");
    auto patch = json(R"({"a":{"y":2}})");
    auto merged = Stanza::deep_merge(base, patch);

    REQUIRE(merged == json(R"({"a":{"x":1,"y":2}})"));
    REQUIRE(base.no_spaces() == R"({"a":{"x":1}})");
    REQUIRE(patch.no_spaces() == R"({"a":{"y":2}})");
}

TEST_CASE("Merging Several Layers") {
    std::vector<Stanza::value> layers{
        json(R"({"log":{"level":"info","file":"a.log"},"port":80})"),
        json(R"({"log":{"level":"debug"}})"),
        json(R"({"port":8080,"extra":[1]})"),
    };

    auto merged = Stanza::deep_merge_all(layers);
    REQUIRE(merged == json(R"({"log":{"level":"debug","file":"a.log"},"port":8080,"extra":[1]})"));
    REQUIRE(merged == Stanza::deep_merge(Stanza::deep_merge(layers[0], layers[1]), layers[2]));

    REQUIRE(Stanza::deep_merge_all({}).is_null());
    REQUIRE(Stanza::deep_merge_all(std::span{ layers }.first(1)) == layers[0]);
}

TEST_CASE("Deep Object Chains Merge Without Recursion") {
    constexpr int depth = 200'000;

    Stanza::value base{ "base leaf" };
    Stanza::value patch{ "patch leaf" };
    Stanza::value expected = patch;
    for (int i = 0; i < depth; i++) {
        base = Stanza::value{ Stanza::object{ { "k", std::move(base) }, { "base_only", Stanza::value{ i } } } };
        patch = Stanza::value{ Stanza::object{ { "k", std::move(patch) }, { "patch_only", Stanza::value{ i } } } };
        expected = Stanza::value{ Stanza::object{
            { "k", std::move(expected) },
            { "patch_only", Stanza::value{ i } },
            { "base_only", Stanza::value{ i } },
        } };
    }

    auto merged = Stanza::deep_merge(base, patch);
    REQUIRE(merged == expected);
    REQUIRE(merged.hash() == expected.hash());

    const Stanza::object top = *merged.as_object();
    std::vector<std::string_view> keys;
    for (const auto& [key, member] : top) keys.push_back(key);
    REQUIRE(keys == std::vector<std::string_view>{ "k", "patch_only", "base_only" });
    REQUIRE(merged["base_only"] == Stanza::value{ depth - 1 });
}
