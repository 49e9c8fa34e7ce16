#pragma once


/*
    ------------------------------------------
    Stanza::value - Immutable JSON value type
    ------------------------------------------
    The `Stanza::value` type represents any JSON value:
        - null
        - boolean
        - number (lossless, see number.hpp)
        - string
        - array
        - object (insertion ordered, see object.hpp)
    It is the core building block of Stanza

    -----------------
    Memory Management
    -----------------
    - `value` is allocator-aware and uses `std::pmr::memory_resource` for all
      payload allocations (strings, arrays, objects)
    - Payloads are immutable and held through `std::shared_ptr`:
        * Copying a `value` is O(1) and shares the payload
        * Transformations (`map_*`, `with_*`, `deep_merge`) build new values
          and share every subtree they do not change
        * New payloads are allocated from the resource of the value the
          transformation started from
    - Destroying a deeply nested value does not recurse once per level;
      uniquely owned containers are drained into a work list first

    -------------
    Case Analysis
    -------------
    - `fold(...)` takes one handler per kind and calls exactly one of them
      with the stored payload. It is the only place that inspects the
      active kind; everything below is derived from it
    - `array_or_object(...)` only distinguishes containers and calls a
      default for the four leaf kinds
    - Predicates: `is_null()`, `is_bool()`, `is_number()`, `is_string()`,
      `is_array()`, `is_object()`
    - Accessors: `as_bool()`, `as_number()`, `as_string()`, `as_array()`,
      `as_object()` return `std::optional` copies of the payload and
      `std::nullopt` on a kind mismatch
    - `with_*(f)` replaces the value by `f(payload)` when the kind matches
    - `map_*(f)` replaces the payload by `f(payload)` keeping the kind
    - A kind mismatch is never an error: accessors give `std::nullopt`,
      `with_*`/`map_*` return the value unchanged

    ---------------------
    Equality and Hashing
    ---------------------
    - `operator==` is structural:
        * numbers compare by numeric value
        * arrays compare element-wise in order
        * objects compare by key set and per-key value, ignoring order
        * values of different kinds are never equal
    - `hash()` / `std::hash<value>` agree with `operator==`
    - Both traverse with an explicit stack, so deeply nested input cannot
      exhaust the call stack

    ----------
    Deep Merge
    ----------
    - `deep_merge(base, patch)` merges two objects key by key, recursing
      into keys present in both; any other pairing yields `patch`

    -------------
    Thread-Safety
    -------------
    - `value` is immutable; any number of threads may read the same value
      concurrently without synchronization
*/

/// @defgroup Stanza Stanza JSON Library
/// @brief Core types and functions for Stanza

/// @defgroup StanzaValue JSON Value
/// @ingroup Stanza

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <iosfwd>
#include <memory>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/number.hpp"
#include "stanza/options.hpp"

namespace Stanza {
    /// @brief Enumerates the possible JSON value kinds held by Stanza::value
    enum class kind : uint8_t {
        null, ///< JSON null value
        boolean, ///< JSON boolean value (`true` or `false`)
        number, ///< JSON number value (Stanza::number)
        string, ///< JSON string value
        array, ///< JSON array value
        object, ///< JSON object value
    };


    template<class T>
    using pmr_vector = std::pmr::vector<T>;

    /// @ingroup StanzaValue
    /// @brief String type used by Stanza::value (allocator-aware)
    using string = std::pmr::string;

    struct value;
    class object;
    class cursor;
    class hcursor;
    struct DecodingFailure;

    using allocator_type = std::pmr::polymorphic_allocator<value>;

    /// @ingroup StanzaValue
    /// @brief Array type used by Stanza::value (JSON arrays)
    using array = pmr_vector<value>;

    /// @ingroup StanzaValue
    /// @brief Result of decoding a value into a C++ type, see convert.hpp
    template<class T>
    using DecodeResult = std::expected<T, DecodingFailure>;

    /// @ingroup StanzaValue
    /// @brief Maps a kind to the payload type its handlers receive
    template<kind K> struct payload;
    template<> struct payload<kind::boolean> { using type = bool; };
    template<> struct payload<kind::number> { using type = number; };
    template<> struct payload<kind::string> { using type = string; };
    template<> struct payload<kind::array> { using type = array; };
    template<> struct payload<kind::object> { using type = object; };

    template<kind K>
    using payload_t = typename payload<K>::type;

    namespace detail {
        template<class F, class T>
        concept payload_mapper = std::invocable<F&, const T&>
            && std::convertible_to<std::invoke_result_t<F&, const T&>, T>;

        template<class F, class T>
        concept value_builder = std::invocable<F&, const T&>
            && std::convertible_to<std::invoke_result_t<F&, const T&>, value>;
    } // namespace detail


    /// @ingroup StanzaValue
    /// @brief Immutable JSON value
    ///
    /// @details
    /// `Stanza::value` can hold any JSON value:
    /// - null
    /// - boolean
    /// - number
    /// - string
    /// - array
    /// - object
    ///
    /// String, array and object payloads are allocated from the
    /// `std::pmr::memory_resource` given at construction and shared between
    /// copies. No member function modifies a payload in place.
    struct STANZA_API value {
        // ------------------------------------------------------------
        // Constructors / assignment / destructor
        // ------------------------------------------------------------

        /// @ingroup StanzaValue
        /// @brief Constructs a null JSON value using the given memory resource
        /// @param res Memory resource used by values derived from this one.
        ///            If omitted, the global default resource is used
        explicit value(std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @ingroup StanzaValue
        /// @brief Constructs a null JSON value
        value(std::nullptr_t, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @ingroup StanzaValue
        /// @brief Constructs a boolean JSON value
        value(bool b, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @ingroup StanzaValue
        /// @brief Constructs a numeric JSON value
        value(number n, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @ingroup StanzaValue
        /// @brief Constructs an exact numeric JSON value from an integral type
        ///
        /// @tparam I Integral type (e.g. int, long, uint64_t)
        template<std::integral I>
        explicit value(I i, std::pmr::memory_resource* res = std::pmr::get_default_resource())
            : m_MemRes{ res }, m_Storage{ make_integral(i) } {}

        /// @ingroup StanzaValue
        /// @brief Floating-point input may be non-finite; use `from_double`,
        ///        `from_double_or_null` or `from_double_or_string` instead
        template<std::floating_point F>
        value(F, std::pmr::memory_resource* = std::pmr::get_default_resource()) = delete;

        /// @ingroup StanzaValue
        /// @brief Constructs a string JSON value from a C string
        value(const char* s, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @ingroup StanzaValue
        /// @brief Constructs a string JSON value from a string_view
        value(std::string_view sv, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @ingroup StanzaValue
        /// @brief Constructs a string JSON value from an existing Stanza::string
        value(string s, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @ingroup StanzaValue
        /// @brief Constructs an array JSON value, taking ownership of @p a
        value(array a, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @ingroup StanzaValue
        /// @brief Constructs an object JSON value, taking ownership of @p o
        value(object o, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        value(const value& other) noexcept = default;

        /// @ingroup StanzaValue
        /// @brief Move-constructs a JSON value; @p other is left null
        value(value&& other) noexcept;

        /// @ingroup StanzaValue
        /// @brief Copy-assigns a JSON value; @p other may be a child of this value
        value& operator=(const value& other);

        /// @ingroup StanzaValue
        /// @brief Move-assigns a JSON value; @p other is left null
        value& operator=(value&& other) noexcept;

        ~value();

        // ------------------------------------------------------------
        // Non-finite aware construction from floating point
        // ------------------------------------------------------------

        /// @ingroup StanzaValue
        /// @brief Builds a number value, or `std::nullopt` if @p d is NaN or infinite
        [[nodiscard]] static std::optional<value> from_double(double d, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @ingroup StanzaValue
        /// @brief Builds a number value, or null if @p d is NaN or infinite
        [[nodiscard]] static value from_double_or_null(double d, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @ingroup StanzaValue
        /// @brief Builds a number value, or the string `"NaN"`, `"Infinity"`
        ///        or `"-Infinity"` if @p d is not finite
        [[nodiscard]] static value from_double_or_string(double d, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        // ------------------------------------------------------------
        // Case analysis
        // ------------------------------------------------------------

        /// @ingroup StanzaValue
        /// @brief Catamorphism over the six JSON kinds
        ///
        /// @details
        /// Invokes exactly one handler, chosen by the active kind, and
        /// returns its result converted to the result type of @p on_null.
        /// Handlers receive the stored payload:
        /// - `on_null()`
        /// - `on_bool(bool)`
        /// - `on_number(const number&)`
        /// - `on_string(const string&)`
        /// - `on_array(const array&)`, elements in original order
        /// - `on_object(const object&)`
        template<class OnNull, class OnBool, class OnNumber, class OnString, class OnArray, class OnObject>
        std::invoke_result_t<OnNull&> fold(OnNull&& on_null, OnBool&& on_bool, OnNumber&& on_number,
                                           OnString&& on_string, OnArray&& on_array, OnObject&& on_object) const {
            switch (m_Storage.index()) {
            case 0: return std::invoke(on_null);
            case 1: return std::invoke(on_bool, std::get<1>(m_Storage));
            case 2: return std::invoke(on_number, std::get<2>(m_Storage));
            case 3: return std::invoke(on_string, std::as_const(*std::get<3>(m_Storage)));
            case 4: return std::invoke(on_array, std::as_const(*std::get<4>(m_Storage)));
            default: return std::invoke(on_object, std::as_const(*std::get<5>(m_Storage)));
            }
        }

        /// @ingroup StanzaValue
        /// @brief Runs @p on_array or @p on_object on a container, otherwise
        ///        returns `otherwise()`
        template<class Otherwise, class OnArray, class OnObject>
        std::invoke_result_t<Otherwise&> array_or_object(Otherwise&& otherwise, OnArray&& on_array, OnObject&& on_object) const {
            auto leaf = [&](const auto&...) { return std::invoke(otherwise); };
            return fold([&] { return std::invoke(otherwise); }, leaf, leaf, leaf,
                        [&](const array& a) { return std::invoke(on_array, a); },
                        [&](const object& o) { return std::invoke(on_object, o); });
        }

        /// @ingroup StanzaValue
        /// @brief Runs @p on_match on the payload if the active kind is @p K,
        ///        otherwise returns `otherwise()`
        template<kind K, class OnMatch, class Otherwise>
        std::invoke_result_t<Otherwise&> match(OnMatch&& on_match, Otherwise&& otherwise) const {
            using result_t = std::invoke_result_t<Otherwise&>;
            auto arm = [&]<kind Arm>(const auto&... payload) -> result_t {
                if constexpr (Arm == K) return std::invoke(on_match, payload...);
                else return std::invoke(otherwise);
            };
            return fold(
                [&] { return arm.template operator()<kind::null>(); },
                [&](bool b) { return arm.template operator()<kind::boolean>(b); },
                [&](const number& n) { return arm.template operator()<kind::number>(n); },
                [&](const string& s) { return arm.template operator()<kind::string>(s); },
                [&](const array& a) { return arm.template operator()<kind::array>(a); },
                [&](const object& o) { return arm.template operator()<kind::object>(o); });
        }

        // ------------------------------------------------------------
        // Introspection
        // ------------------------------------------------------------

        /// @ingroup StanzaValue
        /// @brief Returns the kind of JSON value currently stored
        [[nodiscard]] kind type() const noexcept {
            return fold([] { return kind::null; },
                        [](bool) { return kind::boolean; },
                        [](const number&) { return kind::number; },
                        [](const string&) { return kind::string; },
                        [](const array&) { return kind::array; },
                        [](const object&) { return kind::object; });
        }

        /// @ingroup StanzaValue
        /// @brief Human readable kind name: "Null", "Boolean", "Number",
        ///        "String", "Array" or "Object"
        [[nodiscard]] std::string_view name() const noexcept {
            return fold([] { return std::string_view{ "Null" }; },
                        [](bool) { return std::string_view{ "Boolean" }; },
                        [](const number&) { return std::string_view{ "Number" }; },
                        [](const string&) { return std::string_view{ "String" }; },
                        [](const array&) { return std::string_view{ "Array" }; },
                        [](const object&) { return std::string_view{ "Object" }; });
        }

        template<kind K>
        [[nodiscard]] bool is() const noexcept {
            return match<K>([](const auto&...) { return true; }, [] { return false; });
        }

        [[nodiscard]] bool is_null()   const noexcept { return is<kind::null>();    }
        [[nodiscard]] bool is_bool()   const noexcept { return is<kind::boolean>(); }
        [[nodiscard]] bool is_number() const noexcept { return is<kind::number>();  }
        [[nodiscard]] bool is_string() const noexcept { return is<kind::string>();  }
        [[nodiscard]] bool is_array()  const noexcept { return is<kind::array>();   }
        [[nodiscard]] bool is_object() const noexcept { return is<kind::object>();  }

        // ------------------------------------------------------------
        // Accessors
        // ------------------------------------------------------------

        /// @ingroup StanzaValue
        /// @brief Copy of the payload if the active kind is @p K, else `std::nullopt`
        template<kind K>
        [[nodiscard]] std::optional<payload_t<K>> get() const {
            using result_t = std::optional<payload_t<K>>;
            return match<K>([this](const auto& p) {
                if constexpr (K == kind::array || K == kind::string)
                    return result_t{ std::in_place, p, typename std::remove_cvref_t<decltype(p)>::allocator_type(m_MemRes) };
                else return result_t{ p };
            }, [] { return result_t{}; });
        }

        [[nodiscard]] std::optional<bool>   as_bool()   const;
        [[nodiscard]] std::optional<number> as_number() const;
        [[nodiscard]] std::optional<string> as_string() const;

        /// @ingroup StanzaValue
        /// @brief Copy of the elements; the copy shares each element's payload
        [[nodiscard]] std::optional<array>  as_array()  const;

        /// @ingroup StanzaValue
        /// @brief Copy of the object; the copy shares each member's payload
        [[nodiscard]] std::optional<object> as_object() const;

        /// @ingroup StanzaValue
        /// @brief Number of array elements or object members, 0 for other kinds
        [[nodiscard]] size_t size() const noexcept;

        /// @ingroup StanzaValue
        /// @brief Finds a member with the given key
        /// @return Pointer to the member, or nullptr if this is not an
        ///         object or the key is absent
        [[nodiscard]] const value* find(std::string_view key) const;

        /// @ingroup StanzaValue
        /// @brief Array element at @p idx, or a shared null value if this is
        ///        not an array or @p idx is out of range
        const value& operator[](size_t idx) const;

        /// @ingroup StanzaValue
        /// @brief Object member @p key, or a shared null value if this is
        ///        not an object or the key is absent
        const value& operator[](std::string_view key) const;

        // ------------------------------------------------------------
        // Transformations
        // ------------------------------------------------------------

        /// @ingroup StanzaValue
        /// @brief `f(payload)` if the active kind is @p K, else `*this`
        template<kind K, class F>
        [[nodiscard]] value with(F&& f) const {
            return match<K>([&](const auto& p) -> value { return std::invoke(f, p); },
                            [&]() -> value { return *this; });
        }

        template<detail::value_builder<bool> F>
        [[nodiscard]] value with_bool(F&& f)   const { return with<kind::boolean>(std::forward<F>(f)); }
        template<detail::value_builder<number> F>
        [[nodiscard]] value with_number(F&& f) const { return with<kind::number>(std::forward<F>(f)); }
        template<detail::value_builder<string> F>
        [[nodiscard]] value with_string(F&& f) const { return with<kind::string>(std::forward<F>(f)); }
        template<detail::value_builder<array> F>
        [[nodiscard]] value with_array(F&& f)  const { return with<kind::array>(std::forward<F>(f)); }
        template<detail::value_builder<object> F>
        [[nodiscard]] value with_object(F&& f) const { return with<kind::object>(std::forward<F>(f)); }

        /// @ingroup StanzaValue
        /// @brief A value of kind @p K holding `f(payload)` if the active
        ///        kind is @p K, else `*this`
        template<kind K, class F>
        [[nodiscard]] value map(F&& f) const {
            return match<K>([&](const auto& p) -> value { return value{ payload_t<K>(std::invoke(f, p)), m_MemRes }; },
                            [&]() -> value { return *this; });
        }

        template<detail::payload_mapper<bool> F>
        [[nodiscard]] value map_bool(F&& f)   const { return map<kind::boolean>(std::forward<F>(f)); }
        template<detail::payload_mapper<number> F>
        [[nodiscard]] value map_number(F&& f) const { return map<kind::number>(std::forward<F>(f)); }
        template<detail::payload_mapper<string> F>
        [[nodiscard]] value map_string(F&& f) const { return map<kind::string>(std::forward<F>(f)); }
        template<detail::payload_mapper<array> F>
        [[nodiscard]] value map_array(F&& f)  const { return map<kind::array>(std::forward<F>(f)); }
        template<detail::payload_mapper<object> F>
        [[nodiscard]] value map_object(F&& f) const { return map<kind::object>(std::forward<F>(f)); }

        /// @ingroup StanzaValue
        /// @brief Deep merge with @p patch taking precedence, see `Stanza::deep_merge`
        [[nodiscard]] value deep_merge(const value& patch) const;

        // ------------------------------------------------------------
        // Equality, hashing and display
        // ------------------------------------------------------------

        /// @ingroup StanzaValue
        /// @brief Structural equality
        friend STANZA_API bool operator==(const value& lhs, const value& rhs);

        /// @ingroup StanzaValue
        /// @brief Hash consistent with `operator==`
        [[nodiscard]] std::size_t hash() const;

        /// @ingroup StanzaValue
        /// @brief Same as `spaces2()`
        [[nodiscard]] std::string to_string() const;

        /// @ingroup StanzaValue
        /// @brief Compact JSON text without any whitespace
        [[nodiscard]] std::string no_spaces() const;

        /// @ingroup StanzaValue
        /// @brief JSON text indented by two spaces per level
        [[nodiscard]] std::string spaces2() const;

        /// @ingroup StanzaValue
        /// @brief JSON text indented by four spaces per level
        [[nodiscard]] std::string spaces4() const;

        /// @ingroup StanzaValue
        /// @brief JSON text formatted with @p opts
        [[nodiscard]] std::string pretty(const WriteOptions& opts) const;

        /// @ingroup StanzaValue
        /// @brief Writes `to_string()` to @p os
        friend STANZA_API std::ostream& operator<<(std::ostream& os, const value& v);

        // ------------------------------------------------------------
        // Navigation and decoding
        // ------------------------------------------------------------

        /// @ingroup StanzaValue
        /// @brief Cursor focused on this value, see cursor.hpp
        [[nodiscard]] cursor to_cursor() const;

        /// @ingroup StanzaValue
        /// @brief History-tracking cursor focused on this value, see cursor.hpp
        [[nodiscard]] hcursor to_hcursor() const;

        /// @ingroup StanzaValue
        /// @brief Decodes this value into @p T through `to_hcursor()`
        /// @details Defined in convert.hpp
        template<class T>
        [[nodiscard]] DecodeResult<T> as() const;

        /// @ingroup StanzaValue
        /// @brief Returns the memory resource used for this value's payloads
        [[nodiscard]] std::pmr::memory_resource* resource() const noexcept { return m_MemRes; }

    private:
        using storage_t = std::variant<
            std::monostate,
            bool,
            number,
            std::shared_ptr<const string>,
            std::shared_ptr<array>,
            std::shared_ptr<object>
        >;

        std::pmr::memory_resource* m_MemRes{};
        storage_t m_Storage{};

        template<std::integral I>
        static number make_integral(I i) {
            if constexpr (std::is_signed_v<I>) return number::from_int(static_cast<std::int64_t>(i));
            else return number::from_uint(static_cast<std::uint64_t>(i));
        }

        void detach_children(std::vector<value>& out) noexcept;
    };

    /// @ingroup StanzaValue
    /// @brief Deep merge of two JSON values
    ///
    /// @details
    /// If both values are objects the result holds `patch`'s members in
    /// `patch`'s order, where every key also present in `base` maps to
    /// `deep_merge(base[key], patch[key])`, followed by the members only
    /// `base` has, in `base`'s order. Any other pairing, arrays included,
    /// yields @p patch unchanged.
    [[nodiscard]] STANZA_API value deep_merge(const value& base, const value& patch);

    /// @ingroup StanzaValue
    /// @brief Folds `deep_merge` over @p sources from lowest to highest precedence
    /// @return The merged value, or null if @p sources is empty
    [[nodiscard]] STANZA_API value deep_merge_all(std::span<const value> sources);

} // namespace Stanza

template<>
struct std::hash<Stanza::value> {
    std::size_t operator()(const Stanza::value& v) const { return v.hash(); }
};

#include "stanza/object.hpp"
