#include "stanza/cursor.hpp"

#include <variant>


namespace Stanza {

    // A container on the path from the root to the focus, and where the
    // focus sits inside it. `changed` tells whether `container` differs from
    // the value stored at this position in the next frame up.
    struct cursor::frame {
        value container;
        std::variant<std::size_t, std::string> at;
        std::shared_ptr<const frame> up;
        bool changed = false;
    };

    namespace {
        value replace_child(const value& container, const std::variant<std::size_t, std::string>& at, const value& child) {
            if (const auto* idx = std::get_if<std::size_t>(&at)) {
                return container.map_array([&](const array& a) {
                    array copy(a, a.get_allocator());
                    copy[*idx] = child;
                    return copy;
                });
            }
            const auto& key = std::get<std::string>(at);
            return container.map_object([&](const object& o) { return o.add(key, child); });
        }

        const array* array_payload(const value& v) {
            return v.match<kind::array>([](const array& a) { return &a; },
                                        []() -> const array* { return nullptr; });
        }
    } // namespace


    std::string to_string(const cursor_op& op) {
        switch (op.op) {
        case cursor_op::code::move_up: return "MoveUp";
        case cursor_op::code::move_left: return "MoveLeft";
        case cursor_op::code::move_right: return "MoveRight";
        case cursor_op::code::move_first: return "MoveFirst";
        case cursor_op::code::down_field: return "DownField(" + op.key + ")";
        case cursor_op::code::down_array: return "DownArray";
        case cursor_op::code::down_n: return "DownN(" + std::to_string(op.index) + ")";
        case cursor_op::code::field: return "Field(" + op.key + ")";
        }
        return "Unknown";
    }


    cursor::cursor(value root)
        : m_Focus{ std::move(root) } {}

    cursor::cursor(value focus, std::shared_ptr<const frame> parent, bool changed)
        : m_Focus{ std::move(focus) }, m_Parent{ std::move(parent) }, m_Changed{ changed } {}

    value cursor::top() const {
        std::optional<cursor> at{ *this };
        while (!at->is_top()) at = at->up();
        return at->m_Focus;
    }

    std::optional<cursor> cursor::up() const {
        if (!m_Parent) return std::nullopt;
        if (!m_Changed) return cursor{ m_Parent->container, m_Parent->up, m_Parent->changed };
        return cursor{ replace_child(m_Parent->container, m_Parent->at, m_Focus), m_Parent->up, true };
    }

    // The parent frame with the focus written back into its container.
    std::shared_ptr<const cursor::frame> cursor::settled_parent() const {
        if (!m_Changed) return m_Parent;
        return std::make_shared<frame>(frame{
            replace_child(m_Parent->container, m_Parent->at, m_Focus), m_Parent->at, m_Parent->up, true });
    }

    std::optional<cursor> cursor::sibling(std::size_t idx) const {
        const array* siblings = array_payload(m_Parent->container);
        if (!siblings || idx >= siblings->size()) return std::nullopt;

        auto parent = settled_parent();
        value next = (*array_payload(parent->container))[idx];
        return cursor{ std::move(next), std::make_shared<frame>(frame{ parent->container, idx, parent->up, parent->changed }), false };
    }

    std::optional<cursor> cursor::left() const {
        auto idx = index();
        if (!idx || *idx == 0) return std::nullopt;
        return sibling(*idx - 1);
    }

    std::optional<cursor> cursor::right() const {
        auto idx = index();
        if (!idx) return std::nullopt;
        return sibling(*idx + 1);
    }

    std::optional<cursor> cursor::first() const {
        if (!index()) return std::nullopt;
        return sibling(0);
    }

    std::optional<cursor> cursor::down_field(std::string_view key) const {
        const value* member = m_Focus.find(key);
        if (!member) return std::nullopt;
        auto child = std::make_shared<frame>(frame{ m_Focus, std::string{ key }, m_Parent, m_Changed });
        return cursor{ *member, std::move(child), false };
    }

    std::optional<cursor> cursor::down_array() const {
        return down_n(0);
    }

    std::optional<cursor> cursor::down_n(std::size_t n) const {
        const array* elements = array_payload(m_Focus);
        if (!elements || n >= elements->size()) return std::nullopt;
        auto child = std::make_shared<frame>(frame{ m_Focus, n, m_Parent, m_Changed });
        return cursor{ (*elements)[n], std::move(child), false };
    }

    std::optional<cursor> cursor::field(std::string_view key) const {
        if (!this->key()) return std::nullopt;
        auto parent = settled_parent();
        const value* member = parent->container.find(key);
        if (!member) return std::nullopt;
        return cursor{ *member, std::make_shared<frame>(frame{ parent->container, std::string{ key }, parent->up, parent->changed }), false };
    }

    std::optional<std::string> cursor::key() const {
        if (!m_Parent) return std::nullopt;
        if (const auto* k = std::get_if<std::string>(&m_Parent->at)) return *k;
        return std::nullopt;
    }

    std::optional<std::size_t> cursor::index() const {
        if (!m_Parent) return std::nullopt;
        if (const auto* i = std::get_if<std::size_t>(&m_Parent->at)) return *i;
        return std::nullopt;
    }

    cursor cursor::set(value v) const {
        return cursor{ std::move(v), m_Parent, true };
    }


    hcursor::hcursor(cursor c)
        : m_Cursor{ std::move(c) } {}

    std::optional<value> hcursor::focus() const {
        if (!m_Cursor) return std::nullopt;
        return m_Cursor->focus();
    }

    bool hcursor::missing_field() const noexcept {
        return m_MissingField;
    }

    std::optional<value> hcursor::top() const {
        if (!m_Cursor) return std::nullopt;
        return m_Cursor->top();
    }

    hcursor hcursor::step(cursor_op op, std::optional<cursor> next) const {
        if (!m_Cursor) return *this;
        hcursor out{ *this };
        op.succeeded = next.has_value();
        out.m_Cursor = std::move(next);
        out.m_History.push_back(std::move(op));
        return out;
    }

    hcursor hcursor::up() const {
        return step({ .op = cursor_op::code::move_up }, m_Cursor ? m_Cursor->up() : std::nullopt);
    }

    hcursor hcursor::left() const {
        return step({ .op = cursor_op::code::move_left }, m_Cursor ? m_Cursor->left() : std::nullopt);
    }

    hcursor hcursor::right() const {
        return step({ .op = cursor_op::code::move_right }, m_Cursor ? m_Cursor->right() : std::nullopt);
    }

    hcursor hcursor::first() const {
        return step({ .op = cursor_op::code::move_first }, m_Cursor ? m_Cursor->first() : std::nullopt);
    }

    hcursor hcursor::down_field(std::string_view key) const {
        if (!m_Cursor) return *this;
        hcursor out = step({ .op = cursor_op::code::down_field, .key = std::string{ key } },
                           m_Cursor->down_field(key));
        out.m_MissingField = !out.m_Cursor && m_Cursor->focus().is_object();
        return out;
    }

    hcursor hcursor::down_array() const {
        return step({ .op = cursor_op::code::down_array }, m_Cursor ? m_Cursor->down_array() : std::nullopt);
    }

    hcursor hcursor::down_n(std::size_t n) const {
        return step({ .op = cursor_op::code::down_n, .index = n }, m_Cursor ? m_Cursor->down_n(n) : std::nullopt);
    }

    hcursor hcursor::field(std::string_view key) const {
        return step({ .op = cursor_op::code::field, .key = std::string{ key } },
                    m_Cursor ? m_Cursor->field(key) : std::nullopt);
    }

    hcursor hcursor::set(value v) const {
        if (!m_Cursor) return *this;
        hcursor out{ *this };
        out.m_Cursor = m_Cursor->set(std::move(v));
        return out;
    }


    cursor value::to_cursor() const {
        return cursor{ *this };
    }

    hcursor value::to_hcursor() const {
        return hcursor{ cursor{ *this } };
    }

} // namespace Stanza
