#pragma once


/*
    ------------------------------------------
    Stanza error surface - parse-time failures
    ------------------------------------------
    Stanza reports failures as values, never as exceptions:

        what failed                      reported as
        -------------------------------  -------------------------------------
        text is not JSON                 ParseError in `ParseResult`
        non-finite double to a number    empty optional / null / string,
                                         chosen by the constructor called
        wrong kind for an accessor       std::nullopt, or the value unchanged
        value does not decode into T     DecodingFailure in `DecodeResult<T>`
                                         (see convert.hpp)

    This header holds the first of these.

    -------------------------
    Positions in a ParseError
    -------------------------
    `offset` counts bytes from the start of the text handed to `parse`
    (for a stream, the text read from it). `line` and `column` start at 1;
    only '\n' starts a new line and `column` counts bytes, not code points.
    The position is where the scanner stood when it gave up, which is one
    past the offending character for most syntax errors.

    The message is for people. Branch on `errc`.
*/

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "stanza/config.hpp"


/// @defgroup StanzaError Parsing Errors
/// @ingroup Stanza
namespace Stanza {

    /// @ingroup StanzaError
    /// @brief Why and where `Stanza::parse` rejected its input
    struct ParseError {
        /// @ingroup StanzaError
        /// @brief Failure category
        ///
        /// @details
        /// Stanza-specific mappings worth knowing:
        /// - a literal cut short by the end of input (`tru`) is
        ///   `unexpected_end_of_input`; a wrong letter (`trux`) is
        ///   `unexpected_character`
        /// - `NaN`, `Infinity` and `-Infinity` are `unexpected_character`
        /// - `01`, `1.`, `1e`, `.5` and `1e1.2` are `invalid_number`, as is an
        ///   exponent too large to keep
        /// - a raw control character or ill-formed UTF-8 inside a string is
        ///   `invalid_string`
        /// - a trailing comma without `ParseOptions::allow_trailing_commas`
        ///   is `trailing_characters`
        /// - an unterminated block comment is `unexpected_end_of_input`
        enum class code : uint8_t {
            unexpected_character,
            invalid_number,
            invalid_string,
            invalid_escape,          ///< Backslash followed by anything but `"\/bfnrtu`
            invalid_unicode_escape,  ///< Bad hex digits or an unpaired surrogate
            unexpected_end_of_input,
            trailing_characters,
            depth_limit_exceeded,    ///< Nesting beyond `ParseOptions::max_depth`
        };

        code errc{};
        std::size_t offset{};
        std::size_t line{};
        std::size_t column{};
        std::string msg{};

        STANZA_API static ParseError make(code c, size_t o, size_t l, size_t col, std::string_view m);
    };

    /// @ingroup StanzaError
    /// @brief Name of a parse error code, e.g. "invalid_number"
    [[nodiscard]] STANZA_API std::string_view to_string(ParseError::code c) noexcept;

} // namespace Stanza
