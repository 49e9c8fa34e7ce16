#include <print>
#include <fstream>

#include "stanza/stanza.hpp"

int main(int argc, char** argv) {

    Stanza::value v{ Stanza::object{
        { "name", Stanza::value{ "Zetta" } },
        { "age", Stanza::value{ 27 } },
        { "tags", Stanza::serialize(std::vector<std::string>{ "c++", "json" }) },
    } };

    std::println("{}", v.spaces4());

    auto defaults = Stanza::parse(R"({"log":{"level":"info","file":"stanza.log"},"port":80})");
    auto overrides = Stanza::parse(R"({"log":{"level":"debug"}})");
    if (!defaults || !overrides) {
        std::println("Parse error! -> {}", (defaults ? overrides : defaults).error().msg);
        return 1;
    }
    Stanza::value config = Stanza::deep_merge(*defaults, *overrides);
    std::println("\n\n{}", config.to_string());

    auto level = config.to_hcursor().down_field("log").get<std::string>("level");
    if (!level) {
        std::println("Decode error! -> {}", level.error().describe());
        return 1;
    }
    std::println("level = {}", *level);

    auto bumped = config.to_cursor().down_field("port")->set(Stanza::value{ 8080 }).top();
    std::println("{}", bumped.no_spaces());

    if (argc < 2) return 0;

    std::ifstream ifs(argv[1]);
    if (!ifs) {
        std::println("Failed to open file");
        return -1;
    }

    auto file_r = Stanza::parse(ifs, { .allow_comments = true, .allow_trailing_commas = true });
    if (!file_r) {
        std::println("Parse error! -> {} (line {}, column {})", file_r.error().msg, file_r.error().line, file_r.error().column);
        return 1;
    }

    Stanza::value file_v = std::move(file_r.value());
    std::println("{}", Stanza::dump(file_v, { .pretty = true, .sort_keys = true }));

    return 0;
}
