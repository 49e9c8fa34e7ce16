#pragma once


/*
    ----------------------------------------------------
    Stanza type conversion utilities - to_json/from_json
    ----------------------------------------------------
    This header defines the customization points and helpers used to
    convert between `Stanza::value` and C++ types

    ----------
    Core Ideas
    ----------
    - For a user-defined type `T`, define in the namespace of `T`:

        // Decode T from the focus of a history cursor
        Stanza::DecodeResult<void> from_json(const Stanza::hcursor& c, T& out);

        // Encode T into a value
        void to_json(Stanza::value& out, const T& src);

      Both are found by argument-dependent lookup (ADL)
    - Helpers built on them:

        Stanza::DecodeResult<T> Stanza::decode<T>(const hcursor&);
        Stanza::DecodeResult<T> value::as<T>();
        Stanza::DecodeResult<T> hcursor::as<T>();
        Stanza::DecodeResult<T> hcursor::get<T>(key);
        Stanza::value           Stanza::serialize(const T&);

    -------------------
    Builtin Conversions
    -------------------
    - Decoding: `bool`, integral types (exact and range checked), `double`,
      `std::string`, `Stanza::value`, `std::vector<T>` and `std::optional<T>`
      (null or a missing member decodes to an empty optional)
    - Encoding: the same types plus `std::string_view`; a non-finite
      `double` encodes as null

    --------------
    Error Handling
    --------------
    - Decoding failures are returned as `Stanza::DecodingFailure`, holding a
      message and the cursor history that led to the failing position.
      Nothing is thrown

    ----------------
    Conceptual Usage
    ----------------
        struct user {
            std::string name;
            int age;
        };

        Stanza::DecodeResult<void> from_json(const Stanza::hcursor& c, user& u) {
            auto name = c.get<std::string>("name");
            if (!name) return std::unexpected(name.error());
            auto age = c.get<int>("age");
            if (!age) return std::unexpected(age.error());
            u = user{ *name, *age };
            return {};
        }

        void to_json(Stanza::value& v, const user& u) {
            v = Stanza::value{ Stanza::object{ { "name", Stanza::serialize(u.name) },
                                               { "age", Stanza::serialize(u.age) } } };
        }
*/


#include <cmath>
#include <concepts>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/cursor.hpp"
#include "stanza/value.hpp"

/// @defgroup StanzaConvert Type Conversion
/// @ingroup Stanza
/// @brief Converting between C++ types and JSON values

namespace Stanza {

    /// @ingroup StanzaConvert
    /// @brief Why a value could not be decoded, and where
    struct DecodingFailure {
        std::string msg;                  ///< What was expected
        std::vector<cursor_op> history;   ///< Operations leading to the failing position, oldest first

        /// @brief Failure at the position of @p at
        STANZA_API static DecodingFailure make(std::string_view msg, const hcursor& at);

        /// @brief Message followed by the history, e.g. "Expected Number, got String: DownField(a),DownN(0)"
        [[nodiscard]] STANZA_API std::string describe() const;

        friend bool operator==(const DecodingFailure&, const DecodingFailure&) = default;
    };

    // ------------------------------------------------------------
    // Builtin decoders
    // ------------------------------------------------------------

    STANZA_API DecodeResult<void> from_json(const hcursor& c, bool& out);
    STANZA_API DecodeResult<void> from_json(const hcursor& c, double& out);
    STANZA_API DecodeResult<void> from_json(const hcursor& c, std::string& out);
    STANZA_API DecodeResult<void> from_json(const hcursor& c, value& out);

    namespace detail {
        /// @brief Failure for a cursor without a focus, or `std::nullopt`
        STANZA_API std::optional<DecodingFailure> check_focus(const hcursor& c);

        /// @brief Number in focus as int64 if it is an integer that fits
        STANZA_API DecodeResult<std::int64_t> focus_int64(const hcursor& c);
    } // namespace detail

    template<std::integral I>
        requires (!std::same_as<I, bool>)
    DecodeResult<void> from_json(const hcursor& c, I& out) {
        auto whole = detail::focus_int64(c);
        if (!whole) return std::unexpected(std::move(whole.error()));
        if (!std::in_range<I>(*whole)) return std::unexpected(DecodingFailure::make("Integer out of range", c));
        out = static_cast<I>(*whole);
        return {};
    }

    template<class T>
    DecodeResult<void> from_json(const hcursor& c, std::vector<T>& out);

    template<class T>
    DecodeResult<void> from_json(const hcursor& c, std::optional<T>& out);

    // ------------------------------------------------------------
    // Builtin encoders
    // ------------------------------------------------------------

    STANZA_API void to_json(value& out, bool b);
    STANZA_API void to_json(value& out, double d);
    STANZA_API void to_json(value& out, const char* s);
    STANZA_API void to_json(value& out, std::string_view s);
    STANZA_API void to_json(value& out, const std::string& s);
    STANZA_API void to_json(value& out, const value& v);

    template<std::integral I>
        requires (!std::same_as<I, bool>)
    void to_json(value& out, I i) {
        out = value{ i, out.resource() };
    }

    template<class T>
    void to_json(value& out, const std::vector<T>& items);

    template<class T>
    void to_json(value& out, const std::optional<T>& item);


    /// @ingroup StanzaConvert
    /// @brief Types with a `from_json(const hcursor&, T&)` overload
    template<typename T>
    concept JsonDecodable = std::default_initializable<T>
        && requires(const hcursor& c, T& t) { { from_json(c, t) } -> std::same_as<DecodeResult<void>>; };

    /// @ingroup StanzaConvert
    /// @brief Types with a `to_json(value&, const T&)` overload
    template<typename T>
    concept JsonSerializable = requires(const T& t, value& v) { { to_json(v, t) } -> std::same_as<void>; };


    /// @ingroup StanzaConvert
    /// @brief Decodes the focus of @p c into a new `T`
    ///
    /// Example:
    /// @code
    /// auto parsed = Stanza::parse(R"({"x":1,"y":2})");
    /// auto x = Stanza::decode<int>(parsed->to_hcursor().down_field("x"));
    /// // *x == 1
    /// @endcode
    template<JsonDecodable T>
    [[nodiscard]] DecodeResult<T> decode(const hcursor& c) {
        T t{};
        if (auto r = from_json(c, t); !r) return std::unexpected(std::move(r.error()));
        return t;
    }

    /// @ingroup StanzaConvert
    /// @brief Encodes @p t into a new value
    ///
    /// @param t   The object to serialize.
    /// @param res Memory resource used for the resulting value.
    template<JsonSerializable T>
    [[nodiscard]] value serialize(const T& t, std::pmr::memory_resource* res = std::pmr::get_default_resource()) {
        value v{ res };
        to_json(v, t);
        return v;
    }


    template<class T>
    DecodeResult<void> from_json(const hcursor& c, std::vector<T>& out) {
        if (auto failed = detail::check_focus(c)) return std::unexpected(std::move(*failed));
        const value& focus = c.current()->focus();
        if (!focus.is_array()) return std::unexpected(DecodingFailure::make("Expected Array, got " + std::string{ focus.name() }, c));

        std::vector<T> items;
        items.reserve(focus.size());
        for (std::size_t i = 0; i < focus.size(); i++) {
            T item{};
            if (auto r = from_json(c.down_n(i), item); !r) return r;
            items.push_back(std::move(item));
        }
        out = std::move(items);
        return {};
    }

    template<class T>
    DecodeResult<void> from_json(const hcursor& c, std::optional<T>& out) {
        if (c.missing_field() || (c.succeeded() && c.current()->focus().is_null())) {
            out.reset();
            return {};
        }
        T item{};
        if (auto r = from_json(c, item); !r) return r;
        out = std::move(item);
        return {};
    }

    template<class T>
    void to_json(value& out, const std::vector<T>& items) {
        array elements{ allocator_type(out.resource()) };
        elements.reserve(items.size());
        for (const auto& item : items) {
            value elem{ out.resource() };
            to_json(elem, item);
            elements.push_back(std::move(elem));
        }
        out = value{ std::move(elements), out.resource() };
    }

    template<class T>
    void to_json(value& out, const std::optional<T>& item) {
        if (!item) {
            out = value{ nullptr, out.resource() };
            return;
        }
        to_json(out, *item);
    }


    template<class T>
    DecodeResult<T> value::as() const {
        return decode<T>(to_hcursor());
    }

    template<class T>
    DecodeResult<T> hcursor::as() const {
        return decode<T>(*this);
    }

    template<class T>
    DecodeResult<T> hcursor::get(std::string_view key) const {
        return decode<T>(down_field(key));
    }

} // namespace Stanza
