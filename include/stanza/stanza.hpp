#pragma once


/*
    -----------------------------------------------------------
    Stanza - Immutable C++ JSON value library (DOM + text I/O)
    -----------------------------------------------------------

    This is the main public header for Stanza

    It brings together:
        - The immutable JSON value type:  `Stanza::value`
        - Lossless numbers:               `Stanza::number`
        - Ordered objects:                `Stanza::object`
        - Error reporting types:          `Stanza::ParseError`,
                                          `Stanza::DecodingFailure`
        - Parsing functions:              `Stanza::parse(...)`
        - Serialization functions:        `Stanza::dump(...)`
        - Configuration options:          `Stanza::ParseOptions`,
                                          `Stanza::WriteOptions`
        - Navigation:                     `Stanza::cursor`, `Stanza::hcursor`
        - Conversion utilities:           `to_json` / `from_json` support

    -------------------
    High-Level Overview
    -------------------
    - DOM:
        * `Stanza::value` represents any JSON value. Values never change
          after construction; every transformation returns a new value
          sharing unchanged subtrees with its input
        * Structural equality, hashing and deep merge work on arbitrarily
          deep values without recursion
    - Parsing:
        * `std::expected<value, ParseError> parse(std::string_view, const ParseOptions& = {})`
        * `std::expected<value, ParseError> parse(std::istream&, const ParseOptions& = {})`
        * Numbers keep their exact decimal text
    - Serialization:
        * `std::string dump(const value&, const WriteOptions& = {})`
        * `void dump(const value&, std::ostream&, const WriteOptions& = {})`
        * Compact, two-space and four-space presets on `WriteOptions`
    - Navigation and conversion:
        * `value::to_cursor()` / `value::to_hcursor()` walk and edit a value
        * `value::as<T>()` decodes through `from_json` overloads found by ADL

    -----
    Usage
    -----
        #include <stanza/stanza.hpp>

        int main() {
            auto result = Stanza::parse(R"({"hello":"world","x":42})");
            if (!result) {
                std::println("Parse Error: {}", result.error().msg);
                return 1;
            }

            Stanza::value patched = result->deep_merge(Stanza::value{ Stanza::object{ { "y", true } } });
            std::println("{}", patched.spaces2());
        }
*/

/// @defgroup StanzaAPI Top-level Parsing and Serialization API
/// @ingroup Stanza
/// @brief Convenient free functions for parsing and writing JSON

#include <expected>
#include <iosfwd>
#include <string>
#include <string_view>

#include "stanza/config.hpp"
#include "stanza/value.hpp"
#include "stanza/error.hpp"
#include "stanza/options.hpp"
#include "stanza/cursor.hpp"
#include "stanza/convert.hpp"

namespace Stanza {

    /// @ingroup StanzaAPI
    /// @brief Alias for the result type returned by JSON parsing functions
    ///
    /// @details
    /// Successful parsing yields a fully constructed `Stanza::value`.
    /// Failures are reported through a `ParseError` containing:
    ///  - error code
    ///  - line/column information
    ///  - byte offset
    ///  - human-readable message
    using ParseResult = std::expected<value, ParseError>;

    /// @ingroup StanzaAPI
    /// @brief Parses a JSON document from a string view
    ///
    /// @details
    /// Attempts to parse the UTF-8 JSON text in @p input according to
    /// RFC 8259 as modified by @p opts. Numbers are stored as their exact
    /// literal text. A key repeated within one object keeps the position of
    /// its first occurrence and the value of its last.
    ///
    /// Example:
    /// @code
    /// auto res = Stanza::parse(R"({"x":42})");
    /// if (!res) {
    ///     std::cerr << res.error().msg << '\n';
    /// } else {
    ///     std::cout << res->spaces2();
    /// }
    /// @endcode
    ///
    /// @param input UTF-8 encoded JSON text to parse
    /// @param opts Parsing configuration options (comments, trailing commas, etc.)
    /// @return A `ParseResult` containing either a value or a parse error
    [[nodiscard]] STANZA_API ParseResult parse(std::string_view input, const ParseOptions& opts = {});

    /// @ingroup StanzaAPI
    /// @brief Parses a JSON document from an input stream
    ///
    /// @details
    /// Reads the entire contents of @p is and parses it with @p opts.
    ///
    /// @param is Input stream containing UTF-8 JSON text
    /// @param opts Parsing configuration options
    /// @return A `ParseResult` containing either a value or a parse error
    [[nodiscard]] STANZA_API ParseResult parse(std::istream& is, const ParseOptions& opts = {});

    /// @ingroup StanzaAPI
    /// @brief Serializes a JSON value to a string
    ///
    /// @details
    /// Numbers are written with `number::to_string()`, so parsed literals
    /// come back unchanged. Object members are written in insertion order
    /// unless `opts.sort_keys` is set.
    ///
    /// Example:
    /// @code
    /// std::string json = Stanza::dump(v, Stanza::WriteOptions::spaces4());
    /// @endcode
    [[nodiscard]] STANZA_API std::string dump(const value& v, const WriteOptions& opts = {});

    /// @ingroup StanzaAPI
    /// @brief Serializes a JSON value to an output stream
    STANZA_API void dump(const value& v, std::ostream& os, const WriteOptions& opts = {});

} // namespace Stanza
