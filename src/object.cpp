#include "stanza/object.hpp"


namespace Stanza {

    object::object(std::pmr::memory_resource* res)
        : m_Entries(allocator_type(res)), m_Index(res) {}

    object::object(std::initializer_list<std::pair<std::string_view, value>> fields, std::pmr::memory_resource* res)
        : object(res) {
        m_Entries.reserve(fields.size());
        for (const auto& [k, v] : fields) put(k, v);
    }

    object::object(const object& other)
        : m_Entries(other.m_Entries, other.resource()), m_Index(other.m_Index, other.resource()) {}

    bool object::contains(std::string_view key) const {
        return position(key).has_value();
    }

    const value* object::find(std::string_view key) const {
        auto pos = position(key);
        if (!pos) return nullptr;
        return std::addressof(m_Entries[*pos].second);
    }

    std::optional<value> object::get(std::string_view key) const {
        if (auto* v = find(key)) return *v;
        return std::nullopt;
    }

    std::vector<std::string> object::keys() const {
        std::vector<std::string> out;
        out.reserve(m_Entries.size());
        for (const auto& [k, v] : m_Entries) out.emplace_back(k.begin(), k.end());
        return out;
    }

    array object::values() const {
        array out{ allocator_type(resource()) };
        out.reserve(m_Entries.size());
        for (const auto& [k, v] : m_Entries) out.push_back(v);
        return out;
    }

    object object::add(std::string_view key, value v) const {
        object copy(*this);
        copy.put(key, std::move(v));
        return copy;
    }

    object object::remove(std::string_view key) const {
        if (!contains(key)) return *this;
        builder b{ resource() };
        for (const auto& [k, v] : m_Entries) {
            if (k != key) b.insert_or_assign(k, v);
        }
        return std::move(b).build();
    }

    bool operator==(const object& lhs, const object& rhs) {
        if (lhs.size() != rhs.size()) return false;
        for (const auto& [k, v] : lhs.m_Entries) {
            const value* other = rhs.find(k);
            if (!other || !(*other == v)) return false;
        }
        return true;
    }

    std::optional<object::size_type> object::position(std::string_view key) const {
        if (!m_Index.empty()) {
            auto it = m_Index.find(key);
            if (it == m_Index.end()) return std::nullopt;
            return it->second;
        }
        for (size_type i = 0; i < m_Entries.size(); i++) {
            if (m_Entries[i].first == key) return i;
        }
        return std::nullopt;
    }

    void object::put(std::string_view key, value v) {
        if (auto pos = position(key)) {
            m_Entries[*pos].second = std::move(v);
            return;
        }
        m_Entries.emplace_back(string{ key.begin(), key.end(), resource() }, std::move(v));
        if (!m_Index.empty()) {
            m_Index.emplace(string{ key.begin(), key.end(), resource() }, m_Entries.size() - 1);
        } else if (m_Entries.size() >= index_threshold) {
            rebuild_index();
        }
    }

    void object::rebuild_index() {
        m_Index.clear();
        m_Index.reserve(m_Entries.size());
        for (size_type i = 0; i < m_Entries.size(); i++) m_Index.emplace(m_Entries[i].first, i);
    }

    // ------------------------------------------------------------
    // builder
    // ------------------------------------------------------------

    object::builder::builder(std::pmr::memory_resource* res)
        : m_Object{ res } {}

    object::builder::builder(object start) noexcept
        : m_Object{ std::move(start) } {}

    object::builder& object::builder::insert_or_assign(std::string_view key, value v) {
        m_Object.put(key, std::move(v));
        return *this;
    }

    bool object::builder::contains(std::string_view key) const {
        return m_Object.contains(key);
    }

    object object::builder::build() && {
        return std::move(m_Object);
    }

} // namespace Stanza
