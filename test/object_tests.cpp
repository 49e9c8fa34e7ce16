#include <catch2/catch_all.hpp>

#include "stanza/stanza.hpp"

using namespace Catch;

namespace {
    std::vector<std::string> keys_of(const Stanza::object& o) {
        return o.keys();
    }
}


TEST_CASE("Object Keeps Insertion Order") {
    Stanza::object o{ { "z", Stanza::value{ 1 } }, { "a", Stanza::value{ 2 } }, { "m", Stanza::value{ 3 } } };
    REQUIRE(keys_of(o) == std::vector<std::string>{ "z", "a", "m" });
    REQUIRE(Stanza::value{ o }.no_spaces() == R"({"z":1,"a":2,"m":3})");
}

TEST_CASE("Repeated Keys Keep the First Position and the Last Value") {
    Stanza::object o{ { "a", Stanza::value{ 1 } }, { "b", Stanza::value{ 2 } }, { "a", Stanza::value{ 3 } } };
    REQUIRE(o.size() == 2);
    REQUIRE(keys_of(o) == std::vector<std::string>{ "a", "b" });
    REQUIRE(*o.find("a") == Stanza::value{ 3 });
}

TEST_CASE("add and remove Return New Objects") {
    Stanza::object o{ { "a", Stanza::value{ 1 } }, { "b", Stanza::value{ 2 } } };

    auto replaced = o.add("a", Stanza::value{ "x" });
    REQUIRE(keys_of(replaced) == std::vector<std::string>{ "a", "b" });
    REQUIRE(*replaced.find("a") == Stanza::value{ "x" });

    auto appended = o.add("c", Stanza::value{ 3 });
    REQUIRE(keys_of(appended) == std::vector<std::string>{ "a", "b", "c" });

    auto removed = o.remove("a");
    REQUIRE(keys_of(removed) == std::vector<std::string>{ "b" });
    REQUIRE(o.remove("missing") == o);

    // original untouched
    REQUIRE(o.size() == 2);
    REQUIRE(*o.find("a") == Stanza::value{ 1 });
}

TEST_CASE("Lookup Helpers") {
    Stanza::object o{ { "a", Stanza::value{ 1 } } };
    REQUIRE(o.contains("a"));
    REQUIRE_FALSE(o.contains("b"));
    REQUIRE(o.get("a") == Stanza::value{ 1 });
    REQUIRE_FALSE(o.get("b"));
    REQUIRE(o.find("b") == nullptr);

    auto vals = o.values();
    REQUIRE(vals.size() == 1);
    REQUIRE(vals[0] == Stanza::value{ 1 });
}

TEST_CASE("filter and map_values") {
    Stanza::object o{ { "a", Stanza::value{ 1 } }, { "b", Stanza::value{ "two" } }, { "c", Stanza::value{ 3 } } };

    auto numbers = o.filter([](std::string_view, const Stanza::value& v) { return v.is_number(); });
    REQUIRE(keys_of(numbers) == std::vector<std::string>{ "a", "c" });

    auto by_key = o.filter([](std::string_view k, const Stanza::value&) { return k != "a"; });
    REQUIRE(keys_of(by_key) == std::vector<std::string>{ "b", "c" });

    auto names = o.map_values([](const Stanza::value& v) { return Stanza::value{ v.name() }; });
    REQUIRE(keys_of(names) == std::vector<std::string>{ "a", "b", "c" });
    REQUIRE(*names.find("b") == Stanza::value{ "String" });
}

TEST_CASE("Large Objects Stay Consistent Past the Index Threshold") {
    Stanza::object::builder b;
    const size_t count = Stanza::object::index_threshold * 4;
    for (size_t i = 0; i < count; i++) b.insert_or_assign("k" + std::to_string(i), Stanza::value{ i });
    b.insert_or_assign("k3", Stanza::value{ "replaced" });
    REQUIRE(b.contains("k40"));
    REQUIRE(b.size() == count);

    Stanza::object o = std::move(b).build();
    REQUIRE(o.size() == count);
    REQUIRE(o.keys().front() == "k0");
    REQUIRE(o.keys().back() == "k" + std::to_string(count - 1));
    REQUIRE(*o.find("k3") == Stanza::value{ "replaced" });
    for (size_t i = 0; i < count; i++) REQUIRE(o.contains("k" + std::to_string(i)));

    auto smaller = o.remove("k10").remove("k11");
    REQUIRE(smaller.size() == count - 2);
    REQUIRE_FALSE(smaller.contains("k10"));
    REQUIRE(smaller.contains("k12"));

    auto grown = smaller.add("new", Stanza::value{ true });
    REQUIRE(grown.keys().back() == "new");
    REQUIRE(grown.contains("new"));
}

TEST_CASE("Builder Starting From an Object") {
    Stanza::object base{ { "a", Stanza::value{ 1 } } };
    Stanza::object::builder b{ base };
    b.insert_or_assign("b", Stanza::value{ 2 }).insert_or_assign("a", Stanza::value{ 0 });
    Stanza::object o = std::move(b).build();

    REQUIRE(keys_of(o) == std::vector<std::string>{ "a", "b" });
    REQUIRE(*o.find("a") == Stanza::value{ 0 });
    REQUIRE(*base.find("a") == Stanza::value{ 1 });
}

TEST_CASE("Object Equality Ignores Order") {
    Stanza::object ab{ { "a", Stanza::value{ 1 } }, { "b", Stanza::value{ 2 } } };
    Stanza::object ba{ { "b", Stanza::value{ 2 } }, { "a", Stanza::value{ 1 } } };
    REQUIRE(ab == ba);
    REQUIRE_FALSE(ab == ab.add("c", Stanza::value{}));
    REQUIRE_FALSE(ab == ab.add("a", Stanza::value{ 9 }));
}
