#pragma once


/*
    ---------------------------------------------
    Stanza::cursor - Navigating and editing values
    ---------------------------------------------
    A `cursor` is a zipper over an immutable `Stanza::value`: it holds the
    value in focus plus the path of containers leading back to the root.

    ----------
    Navigation
    ----------
    - `down_field(key)`   into a member of the focused object
    - `down_array()`      into the first element of the focused array
    - `down_n(i)`         into element `i` of the focused array
    - `up()`              back to the enclosing container
    - `left()`, `right()`, `first()`   between elements of the same array
    - `field(key)`        to a sibling member of the same object
    Every move returns `std::optional<cursor>` and is empty when the target
    does not exist.

    -------
    Editing
    -------
    - `set(v)` and `with_focus(f)` replace the focus. The edit is carried
      along as the cursor moves and `top()` returns the root with every edit
      applied. The value the cursor was made from is never modified

    ---------------
    History cursors
    ---------------
    - `hcursor` wraps a cursor and records each `cursor_op` attempted on it.
      A move that fails leaves the hcursor failed; later moves on a failed
      hcursor are ignored. `history()` lists the operations oldest first,
      ending with the failed one, and is copied into `DecodingFailure`
*/

/// @defgroup StanzaCursor Cursors
/// @ingroup Stanza

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "stanza/config.hpp"
#include "stanza/value.hpp"

namespace Stanza {

    /// @ingroup StanzaCursor
    /// @brief One navigation step recorded by an hcursor
    struct cursor_op {
        enum class code : uint8_t {
            move_up,
            move_left,
            move_right,
            move_first,
            down_field,
            down_array,
            down_n,
            field,
        };

        code op{};
        std::string key{};      ///< Key for `down_field` and `field`
        std::size_t index{};    ///< Index for `down_n`
        bool succeeded = true;

        friend bool operator==(const cursor_op&, const cursor_op&) = default;
    };

    /// @ingroup StanzaCursor
    /// @brief Text form of an operation, e.g. "DownField(name)", "DownN(3)", "MoveUp"
    [[nodiscard]] STANZA_API std::string to_string(const cursor_op& op);


    /// @ingroup StanzaCursor
    /// @brief Zipper over an immutable JSON value
    class STANZA_API cursor {
    public:
        /// @brief Cursor focused on @p root
        explicit cursor(value root);

        [[nodiscard]] const value& focus() const noexcept { return m_Focus; }

        /// @brief True when the focus is the root
        [[nodiscard]] bool is_top() const noexcept { return m_Parent == nullptr; }

        /// @brief The root value with every edit made through this cursor applied
        [[nodiscard]] value top() const;

        [[nodiscard]] std::optional<cursor> up() const;
        [[nodiscard]] std::optional<cursor> left() const;
        [[nodiscard]] std::optional<cursor> right() const;
        [[nodiscard]] std::optional<cursor> first() const;

        [[nodiscard]] std::optional<cursor> down_field(std::string_view key) const;
        [[nodiscard]] std::optional<cursor> down_array() const;
        [[nodiscard]] std::optional<cursor> down_n(std::size_t n) const;

        /// @brief Moves to member @p key of the object holding the focus
        [[nodiscard]] std::optional<cursor> field(std::string_view key) const;

        /// @brief Key of the focus within its parent object, if any
        [[nodiscard]] std::optional<std::string> key() const;

        /// @brief Index of the focus within its parent array, if any
        [[nodiscard]] std::optional<std::size_t> index() const;

        /// @brief Cursor at the same position with the focus replaced by @p v
        [[nodiscard]] cursor set(value v) const;

        /// @brief Cursor at the same position with the focus replaced by `f(focus())`
        template<class F>
            requires std::invocable<F&, const value&>
        [[nodiscard]] cursor with_focus(F&& f) const {
            return set(value{ std::invoke(f, m_Focus) });
        }

    private:
        struct frame;

        value m_Focus;
        std::shared_ptr<const frame> m_Parent;
        bool m_Changed = false;

        cursor(value focus, std::shared_ptr<const frame> parent, bool changed);

        [[nodiscard]] std::shared_ptr<const frame> settled_parent() const;
        [[nodiscard]] std::optional<cursor> sibling(std::size_t idx) const;
    };


    /// @ingroup StanzaCursor
    /// @brief Cursor that remembers the operations applied to it
    class STANZA_API hcursor {
    public:
        explicit hcursor(cursor c);

        [[nodiscard]] bool succeeded() const noexcept { return m_Cursor.has_value(); }

        /// @brief The focus, or `std::nullopt` after a failed move
        [[nodiscard]] std::optional<value> focus() const;

        /// @brief The underlying cursor, or `std::nullopt` after a failed move
        [[nodiscard]] const std::optional<cursor>& current() const noexcept { return m_Cursor; }

        [[nodiscard]] const std::vector<cursor_op>& history() const noexcept { return m_History; }

        /// @brief True if the move that failed was `down_field` on an object
        ///        lacking the key
        [[nodiscard]] bool missing_field() const noexcept;

        /// @brief Root with edits applied, or `std::nullopt` after a failed move
        [[nodiscard]] std::optional<value> top() const;

        [[nodiscard]] hcursor up() const;
        [[nodiscard]] hcursor left() const;
        [[nodiscard]] hcursor right() const;
        [[nodiscard]] hcursor first() const;
        [[nodiscard]] hcursor down_field(std::string_view key) const;
        [[nodiscard]] hcursor down_array() const;
        [[nodiscard]] hcursor down_n(std::size_t n) const;
        [[nodiscard]] hcursor field(std::string_view key) const;

        [[nodiscard]] hcursor set(value v) const;

        template<class F>
            requires std::invocable<F&, const value&>
        [[nodiscard]] hcursor with_focus(F&& f) const {
            if (!m_Cursor) return *this;
            return set(value{ std::invoke(f, m_Cursor->focus()) });
        }

        /// @brief Decodes the focus into @p T, see convert.hpp
        template<class T>
        [[nodiscard]] DecodeResult<T> as() const;

        /// @brief Decodes member @p key of the focus into @p T, see convert.hpp
        template<class T>
        [[nodiscard]] DecodeResult<T> get(std::string_view key) const;

    private:
        std::optional<cursor> m_Cursor;
        std::vector<cursor_op> m_History;
        bool m_MissingField = false;

        [[nodiscard]] hcursor step(cursor_op op, std::optional<cursor> next) const;
    };

} // namespace Stanza
