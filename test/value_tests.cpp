#include <catch2/catch_all.hpp>

#include "stanza/stanza.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <sstream>

using namespace Catch;

namespace {

    std::vector<Stanza::value> one_of_each() {
        return {
            Stanza::value{},
            Stanza::value{ true },
            Stanza::value{ 42 },
            Stanza::value{ "text" },
            Stanza::value{ Stanza::array{ Stanza::value{ 1 }, Stanza::value{ 2 } } },
            Stanza::value{ Stanza::object{ { "a", Stanza::value{ 1 } } } },
        };
    }

    std::array<bool, 6> predicates(const Stanza::value& v) {
        return { v.is_null(), v.is_bool(), v.is_number(), v.is_string(), v.is_array(), v.is_object() };
    }

    std::array<bool, 5> present_accessors(const Stanza::value& v) {
        return { v.as_bool().has_value(), v.as_number().has_value(), v.as_string().has_value(),
                 v.as_array().has_value(), v.as_object().has_value() };
    }
}


TEST_CASE("Exactly One Predicate and At Most One Accessor per Kind") {
    auto values = one_of_each();
    for (size_t k = 0; k < values.size(); k++) {
        const auto& v = values[k];
        INFO("kind: " << v.name());

        auto preds = predicates(v);
        REQUIRE(std::count(preds.begin(), preds.end(), true) == 1);
        REQUIRE(preds[k]);
        REQUIRE(static_cast<size_t>(v.type()) == k);

        auto present = present_accessors(v);
        REQUIRE(std::count(present.begin(), present.end(), true) == (k == 0 ? 0 : 1));
        if (k > 0) REQUIRE(present[k - 1]);
    }
}

TEST_CASE("Fold Invokes the Matching Handler with the Stored Payload") {
    auto values = one_of_each();
    for (size_t k = 0; k < values.size(); k++) {
        int calls = 0;
        size_t chosen = values[k].fold(
            [&] { calls++; return size_t{ 0 }; },
            [&](bool b) { calls++; REQUIRE(b); return size_t{ 1 }; },
            [&](const Stanza::number& n) { calls++; REQUIRE(n.to_int64() == 42); return size_t{ 2 }; },
            [&](const Stanza::string& s) { calls++; REQUIRE(s == "text"); return size_t{ 3 }; },
            [&](const Stanza::array& a) {
                calls++;
                REQUIRE(a.size() == 2);
                REQUIRE(a[0] == Stanza::value{ 1 });
                REQUIRE(a[1] == Stanza::value{ 2 });
                return size_t{ 4 };
            },
            [&](const Stanza::object& o) { calls++; REQUIRE(o.contains("a")); return size_t{ 5 }; });
        REQUIRE(chosen == k);
        REQUIRE(calls == 1);
    }
}

TEST_CASE("Fold Hands Out the Shared Payload, Not a Copy") {
    Stanza::value v{ Stanza::array{ Stanza::value{ 1 } } };
    const Stanza::array* first = v.fold([]() -> const Stanza::array* { return nullptr; },
                                        [](bool) -> const Stanza::array* { return nullptr; },
                                        [](const Stanza::number&) -> const Stanza::array* { return nullptr; },
                                        [](const Stanza::string&) -> const Stanza::array* { return nullptr; },
                                        [](const Stanza::array& a) { return &a; },
                                        [](const Stanza::object&) -> const Stanza::array* { return nullptr; });
    Stanza::value copy = v;
    const Stanza::array* second = copy.match<Stanza::kind::array>([](const Stanza::array& a) { return &a; },
                                                                  []() -> const Stanza::array* { return nullptr; });
    REQUIRE(first != nullptr);
    REQUIRE(first == second);
}

TEST_CASE("array_or_object Uses the Default for Leaves") {
    auto describe = [](const Stanza::value& v) {
        return v.array_or_object([] { return std::string{ "leaf" }; },
                                 [](const Stanza::array& a) { return "array of " + std::to_string(a.size()); },
                                 [](const Stanza::object& o) { return "object of " + std::to_string(o.size()); });
    };

    auto values = one_of_each();
    for (size_t k = 0; k < 4; k++) REQUIRE(describe(values[k]) == "leaf");
    REQUIRE(describe(values[4]) == "array of 2");
    REQUIRE(describe(values[5]) == "object of 1");
}

TEST_CASE("Kind Names") {
    auto values = one_of_each();
    REQUIRE(values[0].name() == "Null");
    REQUIRE(values[1].name() == "Boolean");
    REQUIRE(values[2].name() == "Number");
    REQUIRE(values[3].name() == "String");
    REQUIRE(values[4].name() == "Array");
    REQUIRE(values[5].name() == "Object");
}

TEST_CASE("with_* Applies Only on a Matching Kind") {
    Stanza::value n{ 5 };
    Stanza::value s{ "five" };

    auto describe = [](const Stanza::number& x) { return Stanza::value{ "number " + x.to_string() }; };
    REQUIRE(n.with_number(describe) == Stanza::value{ "number 5" });
    REQUIRE(s.with_number(describe) == s);

    auto wrap = [](const Stanza::string& x) { return Stanza::value{ Stanza::array{ Stanza::value{ x } } }; };
    REQUIRE(s.with_string(wrap).is_array());
    REQUIRE(n.with_string(wrap) == n);
}

TEST_CASE("map_* Is the Identity on Other Kinds") {
    auto negate = [](bool b) { return !b; };
    auto twice = [](const Stanza::number& x) { return Stanza::number::from_int(*x.to_int64() * 2); };
    auto shout = [](const Stanza::string& x) { return Stanza::string{ x + "!" }; };
    auto reverse = [](const Stanza::array& a) { return Stanza::array(a.rbegin(), a.rend()); };
    auto drop_a = [](const Stanza::object& o) { return o.remove("a"); };

    auto values = one_of_each();
    for (size_t k = 0; k < values.size(); k++) {
        const auto& v = values[k];
        INFO("kind: " << v.name());
        if (k != 1) REQUIRE(v.map_bool(negate) == v);
        if (k != 2) REQUIRE(v.map_number(twice) == v);
        if (k != 3) REQUIRE(v.map_string(shout) == v);
        if (k != 4) REQUIRE(v.map_array(reverse) == v);
        if (k != 5) REQUIRE(v.map_object(drop_a) == v);
    }
}

TEST_CASE("map_* Keeps the Kind and Transforms the Payload") {
    auto values = one_of_each();

    REQUIRE(values[1].map_bool([](bool b) { return !b; }) == Stanza::value{ false });
    REQUIRE(values[3].map_string([](const Stanza::string& s) { return Stanza::string{ s + "!" }; }) == Stanza::value{ "text!" });

    auto reversed = values[4].map_array([](const Stanza::array& a) { return Stanza::array(a.rbegin(), a.rend()); });
    REQUIRE(reversed.no_spaces() == "[2,1]");
    REQUIRE(values[4].no_spaces() == "[1,2]");

    auto emptied = values[5].map_object([](const Stanza::object& o) { return o.remove("a"); });
    REQUIRE(emptied.is_object());
    REQUIRE(emptied.size() == 0);
    REQUIRE(values[5].size() == 1);
}

TEST_CASE("map_* Composes") {
    Stanza::value v{ 3 };
    auto f = [](const Stanza::number& x) { return Stanza::number::from_int(*x.to_int64() + 1); };
    auto g = [](const Stanza::number& x) { return Stanza::number::from_int(*x.to_int64() * 10); };

    REQUIRE(v.map_number(f).map_number(g) == v.map_number([&](const Stanza::number& x) { return g(f(x)); }));
    REQUIRE(v.map_number(f).map_number(g) == Stanza::value{ 40 });
}

TEST_CASE("Accessors Return Copies That Cannot Change the Value") {
    Stanza::value v{ Stanza::array{ Stanza::value{ 1 }, Stanza::value{ 2 } } };

    auto elements = v.as_array();
    REQUIRE(elements);
    elements->push_back(Stanza::value{ 3 });
    (*elements)[0] = Stanza::value{ "changed" };

    REQUIRE(v.size() == 2);
    REQUIRE(v[0] == Stanza::value{ 1 });
}

TEST_CASE("Indexing Never Fails") {
    Stanza::value arr{ Stanza::array{ Stanza::value{ 1 } } };
    Stanza::value obj{ Stanza::object{ { "k", Stanza::value{ "v" } } } };

    REQUIRE(arr[0] == Stanza::value{ 1 });
    REQUIRE(arr[7].is_null());
    REQUIRE(arr["k"].is_null());

    REQUIRE(obj["k"] == Stanza::value{ "v" });
    REQUIRE(obj["missing"].is_null());
    REQUIRE(obj[0].is_null());
    REQUIRE(obj.find("k") != nullptr);
    REQUIRE(arr.find("k") == nullptr);

    REQUIRE(Stanza::value{ "abc" }.size() == 0);
}

TEST_CASE("Integral Construction is Exact") {
    REQUIRE(Stanza::value{ std::numeric_limits<std::int64_t>::max() }.no_spaces() == "9223372036854775807");
    REQUIRE(Stanza::value{ std::numeric_limits<std::int64_t>::min() }.no_spaces() == "-9223372036854775808");
    REQUIRE(Stanza::value{ std::numeric_limits<std::uint64_t>::max() }.no_spaces() == "18446744073709551615");
    REQUIRE(Stanza::value{ 7u } == Stanza::value{ 7 });
}

TEST_CASE("Non-finite Doubles - Three Construction Policies") {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    SECTION("from_double rejects") {
        REQUIRE_FALSE(Stanza::value::from_double(nan));
        REQUIRE_FALSE(Stanza::value::from_double(inf));
        REQUIRE_FALSE(Stanza::value::from_double(-inf));
        REQUIRE(Stanza::value::from_double(1.5) == Stanza::value{ *Stanza::number::from_string("1.5") });
    }

    SECTION("from_double_or_null substitutes null") {
        REQUIRE(Stanza::value::from_double_or_null(nan).is_null());
        REQUIRE(Stanza::value::from_double_or_null(-inf).is_null());
        REQUIRE(Stanza::value::from_double_or_null(2.0) == Stanza::value{ 2 });
    }

    SECTION("from_double_or_string substitutes the text form") {
        REQUIRE(Stanza::value::from_double_or_string(nan) == Stanza::value{ "NaN" });
        REQUIRE(Stanza::value::from_double_or_string(inf) == Stanza::value{ "Infinity" });
        REQUIRE(Stanza::value::from_double_or_string(-inf) == Stanza::value{ "-Infinity" });
        REQUIRE(Stanza::value::from_double_or_string(0.25).is_number());
    }
}

TEST_CASE("Display - to_string Equals spaces2") {
    auto r = Stanza::parse(R"({"a":[1,{"b":null}],"c":"d"})");
    REQUIRE(r);

    REQUIRE(r->to_string() == r->spaces2());
    REQUIRE(r->to_string() == r->pretty(Stanza::WriteOptions::spaces2()));
    REQUIRE(r->no_spaces() == R"({"a":[1,{"b":null}],"c":"d"})");
    REQUIRE(r->spaces4() ==
            "{\n"
            "    \"a\": [\n"
            "        1,\n"
            "        {\n"
            "            \"b\": null\n"
            "        }\n"
            "    ],\n"
            "    \"c\": \"d\"\n"
            "}");

    std::ostringstream os;
    os << *r;
    REQUIRE(os.str() == r->to_string());

    for (const auto& v : one_of_each()) REQUIRE(v.to_string() == v.spaces2());
}

TEST_CASE("Moved-from Values are Null") {
    Stanza::value a{ "payload" };
    Stanza::value b{ std::move(a) };
    REQUIRE(b == Stanza::value{ "payload" });
    REQUIRE(a.is_null());

    Stanza::value c;
    c = std::move(b);
    REQUIRE(c == Stanza::value{ "payload" });
    REQUIRE(b.is_null());
}

TEST_CASE("Assigning a Value From its Own Child") {
    Stanza::value cur = Stanza::parse(R"([[1,2],{"a":{"b":3}}])").value();

    SECTION("array child") {
        cur = cur[0];
        REQUIRE(cur.no_spaces() == "[1,2]");
    }

    SECTION("walking down through children of other kinds") {
        cur = cur[1];
        REQUIRE(cur.no_spaces() == R"({"a":{"b":3}})");
        cur = cur["a"];
        REQUIRE(cur.no_spaces() == R"({"b":3})");
        cur = cur["b"];
        REQUIRE(cur == Stanza::value{ 3 });
    }

    SECTION("self") {
        const Stanza::value& same = cur;
        cur = same;
        REQUIRE(cur.size() == 2);
    }
}

TEST_CASE("Deeply Nested Values are Compared, Hashed, Printed and Destroyed Without Recursion") {
    constexpr int depth = 200'000;

    auto build = [] {
        Stanza::value v{ 0 };
        for (int i = 0; i < depth; i++) {
            if (i % 2 == 0) v = Stanza::value{ Stanza::array{ std::move(v) } };
            else v = Stanza::value{ Stanza::object{ { "k", std::move(v) } } };
        }
        return v;
    };

    Stanza::value a = build();
    Stanza::value b = build();

    REQUIRE(a == b);
    REQUIRE(a.hash() == b.hash());
    REQUIRE(Stanza::deep_merge(a, b) == b);

    const std::string compact = a.no_spaces();
    REQUIRE(compact.starts_with(R"({"k":[{"k":[)"));
    REQUIRE(compact.ends_with("0]}]}"));
    REQUIRE(std::count(compact.begin(), compact.end(), '[') == depth / 2);
    REQUIRE(std::count(compact.begin(), compact.end(), '{') == depth / 2);
}

struct CountingResource : std::pmr::memory_resource {
    size_t allocs = 0;
    size_t deallocs = 0;

    void* do_allocate(size_t bytes, size_t alignment) override {
        allocs++;
        return std::pmr::get_default_resource()->allocate(bytes, alignment);
    }

    void do_deallocate(void* p, size_t bytes, size_t alignment) override {
        deallocs++;
        std::pmr::get_default_resource()->deallocate(p, bytes, alignment);
    }

    bool do_is_equal(const std::pmr::memory_resource& other) const noexcept override {
        return this == &other;
    }
};

TEST_CASE("Value Uses Provided memory_resource") {
    CountingResource res;
    {
        Stanza::value s{ "a string long enough to leave the small buffer", &res };
        Stanza::value arr{ Stanza::array{ Stanza::value{ 1 } }, &res };
        REQUIRE(s.resource() == &res);
        REQUIRE(res.allocs > 0);

        Stanza::value mapped = s.map_string([](const Stanza::string& x) { return Stanza::string{ x }; });
        REQUIRE(mapped.resource() == &res);

        REQUIRE(arr.as_array()->get_allocator().resource() == &res);
        REQUIRE(s.as_string()->get_allocator().resource() == &res);
    }
    REQUIRE(res.allocs == res.deallocs);
}
