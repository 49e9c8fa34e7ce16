#include <catch2/catch_all.hpp>

#include "stanza/stanza.hpp"

#include <unordered_set>

using namespace Catch;

namespace {
    Stanza::value json(std::string_view text) {
        auto r = Stanza::parse(text);
        REQUIRE(r);
        return *r;
    }

    void require_equal(const Stanza::value& a, const Stanza::value& b) {
        INFO(a.no_spaces() << " vs " << b.no_spaces());
        REQUIRE(a == b);
        REQUIRE(b == a);
        REQUIRE(a.hash() == b.hash());
        REQUIRE(std::hash<Stanza::value>{}(a) == std::hash<Stanza::value>{}(b));
    }

    void require_unequal(const Stanza::value& a, const Stanza::value& b) {
        INFO(a.no_spaces() << " vs " << b.no_spaces());
        REQUIRE_FALSE(a == b);
        REQUIRE_FALSE(b == a);
    }
}


TEST_CASE("Equality is Reflexive for Every Kind") {
    for (std::string_view text : { "null", "true", "false", "0", "-1.5e3", R"("s")", "[]", "{}",
                                   R"([1,[2,[3]],{"a":null}])", R"({"a":{"b":[true,false]},"c":"d"})" }) {
        auto v = json(text);
        require_equal(v, v);
        require_equal(v, json(text));
    }
}

TEST_CASE("Cross-kind Comparisons") {
    require_equal(Stanza::value{}, Stanza::value{ nullptr });
    require_unequal(Stanza::value{}, Stanza::value{ false });
    require_equal(Stanza::value{ true }, Stanza::value{ true });
    require_unequal(Stanza::value{ true }, Stanza::value{ false });
    require_unequal(json("[]"), json("{}"));
    require_unequal(json("0"), json("false"));
    require_unequal(json(R"("")"), json("null"));
    require_unequal(json(R"("1")"), json("1"));
    require_unequal(json("[]"), json("null"));
}

TEST_CASE("Numbers Compare by Value Regardless of Representation") {
    require_equal(json("1"), json("1.0"));
    require_equal(json("100"), json("1e2"));
    require_equal(json("-0"), json("0"));
    require_equal(json("[1,2.50]"), json("[1.0,2.5]"));
    require_equal(Stanza::value{ 5 }, json("5.000"));
    require_equal(Stanza::value{ 5 }, *Stanza::value::from_double(5.0));
    require_equal(Stanza::value{ 18446744073709551615ull }, json("18446744073709551615"));

    require_unequal(json("1"), json("1.0000001"));
}

TEST_CASE("Arrays Compare in Order") {
    require_unequal(json("[1,2]"), json("[2,1]"));
    require_unequal(json("[1,2]"), json("[1,2,3]"));
    require_unequal(json("[1,2,3]"), json("[1,2]"));
    require_unequal(json("[[1]]"), json("[[2]]"));
}

TEST_CASE("Objects Compare Without Regard to Order") {
    require_equal(json(R"({"a":1,"b":2})"), json(R"({"b":2,"a":1})"));
    require_equal(json(R"({"x":{"a":1,"b":[1,{"c":2,"d":3}]}})"),
                  json(R"({"x":{"b":[1,{"d":3,"c":2}],"a":1.0}})"));
    require_unequal(json(R"({"a":1})"), json(R"({"a":1,"b":2})"));
    require_unequal(json(R"({"a":1})"), json(R"({"b":1})"));
    require_unequal(json(R"({"a":null})"), json("{}"));
}

TEST_CASE("Equal Values Collapse in Hashed Containers") {
    std::unordered_set<Stanza::value> set;
    set.insert(json(R"({"a":1,"b":[1e0,"x"]})"));
    set.insert(json(R"({"b":[1,"x"],"a":1.00})"));
    set.insert(json("null"));
    set.insert(Stanza::value{});
    REQUIRE(set.size() == 2);
}

TEST_CASE("Random Values Equal Their Own Round Trip") {
    for (std::string_view text : { R"({"k":[0.1,-2E-3,{"n":null}],"s":"é"})", R"([[[[[]]]]])", R"({"":{"":{}}})" }) {
        auto v = json(text);
        require_equal(v, json(v.no_spaces()));
        require_equal(v, json(v.spaces4()));
    }
}
