#pragma once


/*
    -------------------------------------------
    Stanza::number - Lossless JSON number value
    -------------------------------------------
    `Stanza::number` stores a JSON number without losing information about
    the value it was built from. A number holds exactly one of:
        - a signed 64-bit integer
        - a finite `double`
        - a decimal literal (the exact text of a JSON number)

    --------
    Equality
    --------
    - Equality is numeric value equality, not representation equality:
        * `1`, `1.0`, `10e-1`, `from_double(1.0)` and `from_int(1)` are equal
        * `-0` and `0` are equal
    - Every representation is reduced to a normal form (sign, significant
      digits with no leading or trailing zeros, decimal exponent) and the
      normal forms are compared
    - `hash()` hashes the normal form, so equal numbers hash identically

    -----------
    Invariants
    -----------
    - A number never represents NaN or +/-Infinity. `from_double` refuses
      non-finite input and `from_string` only accepts the RFC 8259 grammar
    - A number is immutable; copying shares the literal text
*/

/// @defgroup StanzaNumber Numbers
/// @ingroup Stanza

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "stanza/config.hpp"

namespace Stanza {

    /// @ingroup StanzaNumber
    /// @brief Immutable, lossless JSON number with value-based equality
    class STANZA_API number {
    public:
        /// @brief Constructs the number zero
        number() noexcept = default;

        /// @brief Builds an exact integral number
        [[nodiscard]] static number from_int(std::int64_t i) noexcept;

        /// @brief Builds an exact integral number from an unsigned value
        /// @details Values above `INT64_MAX` are kept as decimal literals
        [[nodiscard]] static number from_uint(std::uint64_t u);

        /// @brief Builds a number from a double
        /// @return The number, or `std::nullopt` if @p d is NaN or infinite
        [[nodiscard]] static std::optional<number> from_double(double d) noexcept;

        /// @brief Builds a number from the text of a JSON number literal
        ///
        /// @details
        /// @p literal must match the RFC 8259 number grammar exactly
        /// (`-?(0|[1-9][0-9]*)(.[0-9]+)?([eE][+-]?[0-9]+)?`), with no
        /// surrounding whitespace. The text is kept verbatim.
        ///
        /// @return The number, or `std::nullopt` if @p literal is malformed
        ///         or its exponent does not fit in 64 bits
        [[nodiscard]] static std::optional<number> from_string(std::string_view literal);

        /// @brief Returns the nearest double
        /// @details Literals beyond the range of `double` give +/-infinity
        ///          (too large) or +/-0 (too small)
        [[nodiscard]] double to_double() const noexcept;

        /// @brief Returns the value as `int64_t` if it is an integer that fits exactly
        [[nodiscard]] std::optional<std::int64_t> to_int64() const;

        /// @brief Returns the JSON text of this number
        ///
        /// @details
        /// - integers: decimal digits
        /// - doubles: shortest text that round-trips
        /// - literals: the literal unchanged
        [[nodiscard]] std::string to_string() const;

        /// @brief Hash consistent with `operator==`
        [[nodiscard]] std::size_t hash() const;

        /// @brief Numeric value equality
        friend STANZA_API bool operator==(const number& lhs, const number& rhs);

    private:
        using literal = std::shared_ptr<const std::string>;

        std::variant<std::int64_t, double, literal> m_Repr{ std::int64_t{ 0 } };

        explicit number(std::int64_t i) noexcept : m_Repr{ i } {}
        explicit number(double d) noexcept : m_Repr{ d } {}
        explicit number(literal text) noexcept : m_Repr{ std::move(text) } {}
    };

} // namespace Stanza

template<>
struct std::hash<Stanza::number> {
    std::size_t operator()(const Stanza::number& n) const { return n.hash(); }
};
