#include "stanza/stanza.hpp"

#include <algorithm>
#include <cctype>
#include <ostream>
#include <sstream>


namespace Stanza {

    namespace detail {
        ParseResult parse_impl(std::string_view text, const ParseOptions& opts);
        void dump_impl(const value& v, std::ostream& os, const WriteOptions& opts);
    } // namespace detail

    ParseResult parse(std::string_view input, const ParseOptions& opts) {
        return detail::parse_impl(input, opts);
    }

    ParseResult parse(std::istream& is, const ParseOptions& opts) {
        std::ostringstream oss;
        oss << is.rdbuf();
        return detail::parse_impl(oss.str(), opts);
    }

    std::string dump(const value& v, const WriteOptions& opts) {
        std::ostringstream oss;
        detail::dump_impl(v, oss, opts);
        return oss.str();
    }

    void dump(const value& v, std::ostream& os, const WriteOptions& opts) {
        detail::dump_impl(v, os, opts);
    }


#pragma region Parser
    // ================================
    // Internal parser implementation
    // ================================

    namespace detail {
        using expected_void = std::expected<void, ParseError>;
        template<typename T>
        using expected_t = std::expected<T, ParseError>;

        struct Scanner {
            std::string_view text;
            const ParseOptions& opts;
            size_t idx = 0;
            size_t line = 1;
            size_t column = 1;
            size_t depth = 0;
            std::pmr::memory_resource* mem_res;

            Scanner(std::string_view t, const ParseOptions& o, std::pmr::memory_resource* r)
                : text{ t }, opts{ o }, mem_res{ r } {}

            [[nodiscard]] bool eof() const noexcept { return idx >= text.size(); }
            [[nodiscard]] char peek() const noexcept { return eof() ? '\0' : text[idx]; }
            [[nodiscard]] char peek_next() const noexcept { return (idx + 1 < text.size()) ? text[idx + 1] : '\0'; }

            char get() {
                if (eof()) return '\0';
                char c = text[idx++];
                if (c == '\n') {
                    line++;
                    column = 1;
                } else column++;
                return c;
            }

            bool consume(char c) {
                if (peek() == c) {
                    get();
                    return true;
                }
                return false;
            }

            ParseError make_error(ParseError::code code, std::string_view msg) const {
                return ParseError::make(code, idx, line, column, msg);
            }
        };

        // Counts one level of array/object nesting for as long as it lives.
        struct DepthGuard {
            Scanner& s;

            explicit DepthGuard(Scanner& sc) : s(sc) { s.depth++; }
            ~DepthGuard() { s.depth--; }

            DepthGuard(const DepthGuard&) = delete;
            DepthGuard& operator=(const DepthGuard&) = delete;

            [[nodiscard]] bool ok() const { return s.opts.max_depth == 0 || s.depth <= s.opts.max_depth; }
        };

        expected_t<value> parse_value(Scanner& s);

        bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

        bool is_continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

        // RFC 3629 well-formedness: no overlong forms, no surrogates, nothing
        // above U+10FFFF.
        bool is_valid_utf8(std::string_view s) {
            const auto* data = reinterpret_cast<const unsigned char*>(s.data());
            const size_t n = s.size();
            size_t i = 0;

            while (i < n) {
                const unsigned char c = data[i];
                if (c <= 0x7F) {
                    i++;
                    continue;
                }

                size_t len = 0;
                unsigned char lo = 0x80, hi = 0xBF;
                if (c >= 0xC2 && c <= 0xDF) len = 2;
                else if (c == 0xE0) { len = 3; lo = 0xA0; }
                else if (c == 0xED) { len = 3; hi = 0x9F; }
                else if (c >= 0xE1 && c <= 0xEF) len = 3;
                else if (c == 0xF0) { len = 4; lo = 0x90; }
                else if (c == 0xF4) { len = 4; hi = 0x8F; }
                else if (c >= 0xF1 && c <= 0xF3) len = 4;
                else return false;

                if (i + len > n) return false;
                if (data[i + 1] < lo || data[i + 1] > hi) return false;
                for (size_t k = 2; k < len; k++) {
                    if (!is_continuation(data[i + k])) return false;
                }
                i += len;
            }
            return true;
        }

        void append_utf8(uint32_t cp, string& out) {
            if (cp <= 0x7F) {
                out.push_back(static_cast<char>(cp));
            } else if (cp <= 0x7FF) {
                out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp <= 0xFFFF) {
                out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else {
                out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
        }

        expected_void skip_ws_and_comments(Scanner& s) {
            while (!s.eof()) {
                char c = s.peek();
                if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
                    s.get();
                    continue;
                }
                if (!s.opts.allow_comments || c != '/') break;

                char next = s.peek_next();
                if (next == '/') {
                    while (!s.eof() && s.peek() != '\n') s.get();
                    continue;
                }
                if (next != '*') break;

                s.get();
                s.get();
                bool closed = false;
                while (!s.eof()) {
                    if (s.get() == '*' && s.peek() == '/') {
                        s.get();
                        closed = true;
                        break;
                    }
                }
                if (!closed) return std::unexpected(s.make_error(ParseError::code::unexpected_end_of_input, "Nonterminated block comment"));
            }
            return {};
        }

        expected_void parse_literal(Scanner& s, std::string_view literal) {
            for (char expected : literal) {
                if (s.eof()) return std::unexpected(s.make_error(ParseError::code::unexpected_end_of_input, "Truncated literal"));
                if (s.get() != expected) return std::unexpected(s.make_error(ParseError::code::unexpected_character, "Invalid literal"));
            }
            return {};
        }

        expected_t<uint16_t> parse_hex4(Scanner& s) {
            uint16_t val = 0;
            for (int i = 0; i < 4; i++) {
                if (s.eof()) return std::unexpected(s.make_error(ParseError::code::invalid_unicode_escape, "Unexpected end in unicode escape"));
                char h = s.get();
                unsigned digit = 0;
                if (h >= '0' && h <= '9') digit = static_cast<unsigned>(h - '0');
                else if (h >= 'A' && h <= 'F') digit = 10u + static_cast<unsigned>(h - 'A');
                else if (h >= 'a' && h <= 'f') digit = 10u + static_cast<unsigned>(h - 'a');
                else return std::unexpected(s.make_error(ParseError::code::invalid_unicode_escape, "Invalid hex digit in unicode escape"));
                val = static_cast<uint16_t>((val << 4) | digit);
            }
            return val;
        }

        expected_void parse_unicode_escape(Scanner& s, string& out) {
            auto first = parse_hex4(s);
            if (!first) return std::unexpected(first.error());

            if (*first >= 0xDC00 && *first <= 0xDFFF)
                return std::unexpected(s.make_error(ParseError::code::invalid_unicode_escape, "Unpaired low surrogate"));
            if (*first < 0xD800 || *first > 0xDBFF) {
                append_utf8(*first, out);
                return {};
            }

            if (!(s.consume('\\') && s.consume('u')))
                return std::unexpected(s.make_error(ParseError::code::invalid_unicode_escape, "Expected low surrogate after high surrogate"));
            auto second = parse_hex4(s);
            if (!second) return std::unexpected(second.error());
            if (*second < 0xDC00 || *second > 0xDFFF)
                return std::unexpected(s.make_error(ParseError::code::invalid_unicode_escape, "Invalid low surrogate"));

            append_utf8(0x10000u + ((static_cast<uint32_t>(*first - 0xD800) << 10) | static_cast<uint32_t>(*second - 0xDC00)), out);
            return {};
        }

        expected_t<string> parse_string(Scanner& s) {
            if (!s.consume('"')) return std::unexpected(s.make_error(ParseError::code::invalid_string, "Expected '\"' to start a string"));

            string out(s.mem_res);
            while (!s.eof()) {
                char c = s.get();
                if (c == '"') {
                    if (!is_valid_utf8(out)) return std::unexpected(s.make_error(ParseError::code::invalid_string, "Invalid UTF-8 sequence in string"));
                    return out;
                }
                if (static_cast<unsigned char>(c) < 0x20) return std::unexpected(s.make_error(ParseError::code::invalid_string, "Control character in string"));
                if (c != '\\') {
                    out.push_back(c);
                    continue;
                }

                if (s.eof()) return std::unexpected(s.make_error(ParseError::code::invalid_escape, "Unfinished escape sequence"));
                switch (s.get()) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u':
                    if (auto r = parse_unicode_escape(s, out); !r) return std::unexpected(r.error());
                    break;
                default: return std::unexpected(s.make_error(ParseError::code::invalid_escape, "Invalid escape sequence"));
                }
            }
            return std::unexpected(s.make_error(ParseError::code::unexpected_end_of_input, "Nonterminated string"));
        }

        // Scans the RFC 8259 number grammar and keeps the exact text.
        expected_t<number> parse_number(Scanner& s) {
            const size_t start = s.idx;

            if (s.consume('-') && !is_digit(s.peek()))
                return std::unexpected(s.make_error(ParseError::code::unexpected_character, "Expected digit after '-'"));

            char first_digit = s.get();
            if (first_digit == '0' && is_digit(s.peek())) return std::unexpected(s.make_error(ParseError::code::invalid_number, "Leading zeros disallowed"));
            while (is_digit(s.peek())) s.get();

            if (s.consume('.')) {
                if (!is_digit(s.peek())) return std::unexpected(s.make_error(ParseError::code::invalid_number, "Expected digit after '.'"));
                while (is_digit(s.peek())) s.get();
            }

            if (s.consume('e') || s.consume('E')) {
                if (!s.consume('+')) s.consume('-');
                if (!is_digit(s.peek())) return std::unexpected(s.make_error(ParseError::code::invalid_number, "Expected digit in exponent"));
                while (is_digit(s.peek())) s.get();
            }

            char next = s.peek();
            if (next == '.' || next == 'e' || next == 'E') return std::unexpected(s.make_error(ParseError::code::invalid_number, "Invalid character after number"));

            auto literal = number::from_string(s.text.substr(start, s.idx - start));
            if (!literal) return std::unexpected(s.make_error(ParseError::code::invalid_number, "Exponent out of range"));
            return *literal;
        }

        // Shared loop for arrays and objects: handles separators, the
        // trailing comma option and end of input.
        template<class ParseMember>
        expected_void parse_members(Scanner& s, char close, std::string_view what, ParseMember&& parse_member) {
            if (auto ws = skip_ws_and_comments(s); !ws) return ws;
            if (s.consume(close)) return {};

            while (true) {
                if (auto r = parse_member(); !r) return r;
                if (auto ws = skip_ws_and_comments(s); !ws) return ws;

                char c = s.peek();
                if (c == close) {
                    s.get();
                    return {};
                }
                if (c == '\0' && s.eof()) return std::unexpected(s.make_error(ParseError::code::unexpected_end_of_input, what));
                if (c != ',') return std::unexpected(s.make_error(ParseError::code::unexpected_character, what));

                s.get();
                if (auto ws = skip_ws_and_comments(s); !ws) return ws;
                if (s.peek() == close) {
                    if (!s.opts.allow_trailing_commas) return std::unexpected(s.make_error(ParseError::code::trailing_characters, "Trailing commas not allowed"));
                    s.get();
                    return {};
                }
            }
        }

        expected_t<value> parse_array(Scanner& s) {
            DepthGuard guard{ s };
            if (!guard.ok()) return std::unexpected(s.make_error(ParseError::code::depth_limit_exceeded, "Maximum nesting depth exceeded"));
            s.get();

            array arr{ allocator_type(s.mem_res) };
            auto done = parse_members(s, ']', "Expected ',' or ']' in array", [&]() -> expected_void {
                auto elem = parse_value(s);
                if (!elem) return std::unexpected(std::move(elem.error()));
                arr.push_back(std::move(*elem));
                return {};
            });
            if (!done) return std::unexpected(std::move(done.error()));
            return value{ std::move(arr), s.mem_res };
        }

        expected_t<value> parse_object(Scanner& s) {
            DepthGuard guard{ s };
            if (!guard.ok()) return std::unexpected(s.make_error(ParseError::code::depth_limit_exceeded, "Maximum nesting depth exceeded"));
            s.get();

            object::builder members{ s.mem_res };
            auto done = parse_members(s, '}', "Expected ',' or '}' in object", [&]() -> expected_void {
                if (s.eof()) return std::unexpected(s.make_error(ParseError::code::unexpected_end_of_input, "Unterminated object, expected string key"));
                if (s.peek() != '"') return std::unexpected(s.make_error(ParseError::code::unexpected_character, "Expected \" to start object key"));
                auto key = parse_string(s);
                if (!key) return std::unexpected(std::move(key.error()));

                if (auto ws = skip_ws_and_comments(s); !ws) return ws;
                if (s.eof()) return std::unexpected(s.make_error(ParseError::code::unexpected_end_of_input, "Unterminated object, expected ':' after key"));
                if (!s.consume(':')) return std::unexpected(s.make_error(ParseError::code::unexpected_character, "Expected ':' after object key"));

                auto val = parse_value(s);
                if (!val) return std::unexpected(std::move(val.error()));
                members.insert_or_assign(*key, std::move(*val)); // last value wins, first position kept
                return {};
            });
            if (!done) return std::unexpected(std::move(done.error()));
            return value{ std::move(members).build(), s.mem_res };
        }

        expected_t<value> parse_value(Scanner& s) {
            if (auto ws = skip_ws_and_comments(s); !ws) return std::unexpected(ws.error());
            if (s.eof()) return std::unexpected(s.make_error(ParseError::code::unexpected_end_of_input, "Expected JSON value"));

            char c = s.peek();
            switch (c) {
            case 'n':
                if (auto r = parse_literal(s, "null"); !r) return std::unexpected(r.error());
                return value{ nullptr, s.mem_res };
            case 't':
                if (auto r = parse_literal(s, "true"); !r) return std::unexpected(r.error());
                return value{ true, s.mem_res };
            case 'f':
                if (auto r = parse_literal(s, "false"); !r) return std::unexpected(r.error());
                return value{ false, s.mem_res };
            case '"': {
                auto str = parse_string(s);
                if (!str) return std::unexpected(str.error());
                return value{ std::move(*str), s.mem_res };
            }
            case '[': return parse_array(s);
            case '{': return parse_object(s);
            default:
                if (c == '-' || is_digit(c)) {
                    auto num = parse_number(s);
                    if (!num) return std::unexpected(num.error());
                    return value{ std::move(*num), s.mem_res };
                }
                if (c == '.') return std::unexpected(s.make_error(ParseError::code::invalid_number, "Fractional values must start with a 0"));
                return std::unexpected(s.make_error(ParseError::code::unexpected_character, "Unexpected character while parsing value"));
            }
        }

        ParseResult parse_impl(std::string_view text, const ParseOptions& opts) {
            Scanner s{ text, opts, std::pmr::get_default_resource() };

            auto v = parse_value(s);
            if (!v) return std::unexpected(v.error());
            if (auto ws = skip_ws_and_comments(s); !ws) return std::unexpected(ws.error());
            if (!s.eof()) return std::unexpected(s.make_error(ParseError::code::trailing_characters, "Trailing characters after top-level JSON value"));
            return *std::move(v);
        }
#pragma endregion
#pragma region Serializer

        // ================================
        // Internal serializer implementation
        // ================================

        void dump_string(std::string_view s, std::ostream& os) {
            static constexpr char hex[] = "0123456789abcdef";
            os.put('"');
            for (unsigned char c : s) {
                switch (c) {
                case '"': os << "\\\""; break;
                case '\\': os << "\\\\"; break;
                case '\b': os << "\\b"; break;
                case '\f': os << "\\f"; break;
                case '\n': os << "\\n"; break;
                case '\r': os << "\\r"; break;
                case '\t': os << "\\t"; break;
                default:
                    if (c < 0x20) os << "\\u00" << hex[c >> 4] << hex[c & 0xF];
                    else os.put(static_cast<char>(c));
                    break;
                }
            }
            os.put('"');
        }

        void dump_indent(std::ostream& os, size_t depth, const WriteOptions& opts) {
            if (!opts.pretty) return;
            for (size_t i = 0; i < depth * opts.indent; i++) os.put(' ');
        }

        // One open container on the printer's stack. Arrays are walked in
        // place; objects keep the members left after dropping and sorting.
        struct dump_frame {
            const array* arr{};
            std::vector<const object::entry*> members{};
            size_t next{};
            char close{};

            size_t count() const { return arr ? arr->size() : members.size(); }
        };

        // Writes a scalar, or opens a container and pushes its frame.
        void dump_enter(const value& v, std::ostream& os, const WriteOptions& opts, std::vector<dump_frame>& stack) {
            v.fold(
                [&] { os << "null"; },
                [&](bool b) { os << (b ? "true" : "false"); },
                [&](const number& n) { os << n.to_string(); },
                [&](const string& s) { dump_string(s, os); },
                [&](const array& arr) {
                    os.put('[');
                    if (arr.empty()) {
                        os.put(']');
                        return;
                    }
                    if (opts.pretty) os.put('\n');
                    stack.push_back(dump_frame{ &arr, {}, 0, ']' });
                },
                [&](const object& obj) {
                    std::vector<const object::entry*> members;
                    members.reserve(obj.size());
                    for (const auto& entry : obj) {
                        if (opts.drop_null_keys && entry.second.is_null()) continue;
                        members.push_back(&entry);
                    }
                    if (opts.sort_keys) {
                        std::stable_sort(members.begin(), members.end(),
                                         [](const object::entry* a, const object::entry* b) { return a->first < b->first; });
                    }

                    os.put('{');
                    if (members.empty()) {
                        os.put('}');
                        return;
                    }
                    if (opts.pretty) os.put('\n');
                    stack.push_back(dump_frame{ nullptr, std::move(members), 0, '}' });
                });
        }

        void dump_impl(const value& v, std::ostream& os, const WriteOptions& opts) {
            std::vector<dump_frame> stack;
            dump_enter(v, os, opts, stack);

            while (!stack.empty()) {
                dump_frame& top = stack.back();
                const size_t depth = stack.size();

                if (top.next == top.count()) {
                    const char close = top.close;
                    stack.pop_back();
                    dump_indent(os, depth - 1, opts);
                    os.put(close);
                    if (!stack.empty()) {
                        if (stack.back().next < stack.back().count()) os.put(',');
                        if (opts.pretty) os.put('\n');
                    }
                    continue;
                }

                const size_t i = top.next++;
                const bool last = top.next == top.count();
                dump_indent(os, depth, opts);

                const value* child;
                if (top.arr) {
                    child = &(*top.arr)[i];
                } else {
                    dump_string(top.members[i]->first, os);
                    os << (opts.pretty ? ": " : ":");
                    child = &top.members[i]->second;
                }

                // `top` may dangle once a container child is pushed.
                const size_t before = stack.size();
                dump_enter(*child, os, opts, stack);
                if (stack.size() == before) {
                    if (!last) os.put(',');
                    if (opts.pretty) os.put('\n');
                }
            }
        }

#pragma endregion

    } // namespace detail

} // namespace Stanza
