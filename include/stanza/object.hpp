#pragma once


/*
    -----------------------------------------------
    Stanza::object - Insertion ordered JSON object
    -----------------------------------------------
    `Stanza::object` maps unique string keys to `Stanza::value`s and keeps
    its members in insertion order.

    -----
    Rules
    -----
    - Keys are unique. Building an object from a list with a repeated key
      keeps the position of the first occurrence and the value of the last
    - `add(key, v)` returns a new object: an existing key keeps its
      position with the new value, a new key is appended
    - `remove`, `map_values` and `filter` also return new objects; the
      receiver never changes
    - Equality ignores member order: two objects are equal when they hold
      the same keys mapped to equal values

    ------
    Lookup
    ------
    - Small objects are searched linearly
    - Once an object reaches `index_threshold` members a hash index from key
      to position is kept alongside the members

    -----------------
    Memory Management
    -----------------
    - Members and keys are allocated from the object's
      `std::pmr::memory_resource`; copies keep the source's resource
*/

/// @defgroup StanzaObject JSON Objects
/// @ingroup Stanza

#include <concepts>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/value.hpp"

namespace Stanza {

    /// @ingroup StanzaObject
    /// @brief Insertion ordered map from unique keys to JSON values
    class STANZA_API object {
    public:
        using entry = std::pair<string, value>;
        using container_type = pmr_vector<entry>;
        using const_iterator = container_type::const_iterator;
        using size_type = std::size_t;

        class builder;

        /// @brief Member count from which lookups go through a hash index
        static constexpr size_type index_threshold = 16;

        /// @ingroup StanzaObject
        /// @brief Constructs an empty object
        explicit object(std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @ingroup StanzaObject
        /// @brief Constructs an object from key/value pairs
        ///
        /// @details
        /// A repeated key keeps the position of its first occurrence and
        /// the value of its last occurrence
        object(std::initializer_list<std::pair<std::string_view, value>> fields,
               std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @ingroup StanzaObject
        /// @brief Copies @p other into storage from @p other's memory resource
        object(const object& other);
        object(object&& other) noexcept = default;
        object& operator=(const object& other) = default;
        object& operator=(object&& other) = default;
        ~object() = default;

        [[nodiscard]] size_type size() const noexcept { return m_Entries.size(); }
        [[nodiscard]] bool empty() const noexcept { return m_Entries.empty(); }

        [[nodiscard]] const_iterator begin() const noexcept { return m_Entries.begin(); }
        [[nodiscard]] const_iterator end() const noexcept { return m_Entries.end(); }

        /// @ingroup StanzaObject
        /// @brief Checks whether @p key is present
        [[nodiscard]] bool contains(std::string_view key) const;

        /// @ingroup StanzaObject
        /// @brief Looks up @p key
        /// @return Pointer to the mapped value, valid while this object
        ///         lives, or nullptr if @p key is absent
        [[nodiscard]] const value* find(std::string_view key) const;

        /// @ingroup StanzaObject
        /// @brief Looks up @p key
        /// @return Copy of the mapped value, or `std::nullopt` if @p key is absent
        [[nodiscard]] std::optional<value> get(std::string_view key) const;

        /// @ingroup StanzaObject
        /// @brief Keys in member order
        [[nodiscard]] std::vector<std::string> keys() const;

        /// @ingroup StanzaObject
        /// @brief Values in member order
        [[nodiscard]] array values() const;

        /// @ingroup StanzaObject
        /// @brief Returns a copy with @p key mapped to @p v
        ///
        /// @details
        /// If @p key is present it keeps its position, otherwise it is
        /// appended after the last member
        [[nodiscard]] object add(std::string_view key, value v) const;

        /// @ingroup StanzaObject
        /// @brief Returns a copy without @p key
        [[nodiscard]] object remove(std::string_view key) const;

        /// @ingroup StanzaObject
        /// @brief Returns a copy with every value replaced by `f(value)`
        template<class F>
            requires std::invocable<F&, const value&>
        [[nodiscard]] object map_values(F&& f) const;

        /// @ingroup StanzaObject
        /// @brief Returns a copy keeping the members for which `pred(key, value)` holds
        template<class P>
            requires std::predicate<P&, std::string_view, const value&>
        [[nodiscard]] object filter(P&& pred) const;

        /// @ingroup StanzaObject
        /// @brief Same keys mapped to equal values, in any order
        friend STANZA_API bool operator==(const object& lhs, const object& rhs);

        [[nodiscard]] std::pmr::memory_resource* resource() const noexcept { return m_Entries.get_allocator().resource(); }

    private:
        struct key_hash {
            using is_transparent = void;
            std::size_t operator()(std::string_view key) const noexcept { return std::hash<std::string_view>{}(key); }
        };

        using index_type = std::pmr::unordered_map<string, size_type, key_hash, std::equal_to<>>;

        container_type m_Entries;
        index_type m_Index;

        friend struct value;

        [[nodiscard]] std::optional<size_type> position(std::string_view key) const;
        void put(std::string_view key, value v);
        void rebuild_index();
    };


    /// @ingroup StanzaObject
    /// @brief Accumulates members and produces an object
    ///
    /// @details
    /// `insert_or_assign` follows the object rules: a repeated key keeps its
    /// first position and takes the latest value.
    ///
    /// Example:
    /// @code
    /// Stanza::object::builder b;
    /// b.insert_or_assign("name", "Zetta");
    /// b.insert_or_assign("age", Stanza::value{ 27 });
    /// Stanza::object o = std::move(b).build();
    /// @endcode
    class STANZA_API object::builder {
    public:
        explicit builder(std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @brief Starts from the members of @p start
        explicit builder(object start) noexcept;

        builder& insert_or_assign(std::string_view key, value v);

        [[nodiscard]] bool contains(std::string_view key) const;
        [[nodiscard]] size_type size() const noexcept { return m_Object.size(); }

        [[nodiscard]] object build() &&;

    private:
        object m_Object;
    };


    template<class F>
        requires std::invocable<F&, const value&>
    object object::map_values(F&& f) const {
        builder b{ resource() };
        for (const auto& [k, v] : m_Entries) b.insert_or_assign(k, value{ std::invoke(f, v) });
        return std::move(b).build();
    }

    template<class P>
        requires std::predicate<P&, std::string_view, const value&>
    object object::filter(P&& pred) const {
        builder b{ resource() };
        for (const auto& [k, v] : m_Entries) {
            if (std::invoke(pred, std::string_view{ k }, v)) b.insert_or_assign(k, v);
        }
        return std::move(b).build();
    }

} // namespace Stanza
