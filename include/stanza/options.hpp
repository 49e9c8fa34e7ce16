#pragma once


/*
    ----------------------------------
    Stanza parsing and writing options
    ----------------------------------
    This header defines configuration structures that control the behavior
    of parsing (JSON -> value) and writing (value -> JSON) operations

    --------------------------------------
    Parsing Options - Stanza::ParseOptions
    --------------------------------------
    `ParseOptions` tunes how `Stanza::parse(...)` behaves:

    - `bool allow_comments`:
        * When true, the parser accepts line (`// ...`) and block
          (`/ * ... * /`) comments in addition to standard JSON whitespace
        * When false (default, strict JSON), a comment is reported as an
          `unexpected_character` parse error
    - `bool allow_trailing_commas`:
        * When true, the parser accepts trailing commas in arrays and objects
          e.g. `[1,2,]` or `{"a": 1,}`
        * When false (strict JSON), trailing commas produce a parse error
    - `size_t max_depth`:
        * Optional limit on nesting depth of arrays/objects
        * If exceeded, the parser fails with `depth_limit_exceeded`
        * A value of 0 is treated as no explicit limit
        * The parser descends one call per nesting level, so unbounded depth
          is limited only by the thread's stack; set a limit for untrusted
          input. Values built some other way are printed, compared, hashed,
          merged and destroyed without recursion at any depth

    --------------------------------------
    Writing Options - Stanza::WriteOptions
    --------------------------------------
    `WriteOptions` tunes how `Stanza::dump(...)` and the display members of
    `Stanza::value` serialize values back to JSON text:

    - `bool pretty`:
        * When false (default), produces compact JSON without extra whitespace
        * When true, outputs indented, human-readable JSON with newlines and spaces
    - `size_t indent`:
        * Number of spaces to indent per nesting level in pretty mode
        * Ignored if `pretty == false`
    - `bool sort_keys`:
        * When true, object members are written in lexicographic key order
        * When false, members are written in insertion order
    - `bool drop_null_keys`:
        * When true, object members whose value is null are omitted

    -------
    Presets
    -------
    - `WriteOptions::no_spaces()`  compact output
    - `WriteOptions::spaces2()`    two-space indentation (used by `value::to_string`)
    - `WriteOptions::spaces4()`    four-space indentation

    These option structures are plain aggregates suitable for
    brace-initialization
*/


#include <cstddef>

/// @defgroup StanzaOptions Parsing and Writing Options
/// @ingroup Stanza
/// @brief Configuration objects controlling parsing and serialization

namespace Stanza {

    /// @ingroup StanzaOptions
    /// @brief Configuration controlling JSON parsing behavior
    ///
    /// @details
    /// By default the parser is strict according to RFC 8259.
    ///
    /// Example:
    /// @code
    /// ParseOptions opts;
    /// opts.allow_comments = true;
    /// opts.max_depth = 32;
    /// auto result = Stanza::parse(text, opts);
    /// @endcode
    struct ParseOptions {
        bool allow_comments = false; ///< Accept `//` and `/* */` comments if true
        bool allow_trailing_commas = false; ///< Permit trailing commas in arrays/objects if true
        /// Maximum allowed nesting depth (0 = unlimited). Parsing recurses once
        /// per level, so set this for input from untrusted sources.
        size_t max_depth = 0;
    };

    /// @ingroup StanzaOptions
    /// @brief Configuration options controlling JSON serialization (dumping).
    ///
    /// Example:
    /// @code
    /// WriteOptions wo;
    /// wo.pretty = true;
    /// wo.indent = 4;
    /// std::string json = Stanza::dump(v, wo);
    /// @endcode
    struct WriteOptions {
        bool pretty = false;        ///< Enable pretty-printing (formatted output).
        std::size_t indent = 2;     ///< Number of spaces per indentation level.
        bool sort_keys = false;     ///< Write object keys in lexicographic order if true.
        bool drop_null_keys = false; ///< Omit object members holding null if true.

        /// @brief Compact output without whitespace
        [[nodiscard]] static constexpr WriteOptions no_spaces() noexcept { return WriteOptions{}; }

        /// @brief Pretty output indented by two spaces
        [[nodiscard]] static constexpr WriteOptions spaces2() noexcept { return WriteOptions{ .pretty = true, .indent = 2 }; }

        /// @brief Pretty output indented by four spaces
        [[nodiscard]] static constexpr WriteOptions spaces4() noexcept { return WriteOptions{ .pretty = true, .indent = 4 }; }
    };


} // namespace Stanza
