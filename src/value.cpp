#include "stanza/value.hpp"

#include <cmath>
#include <ostream>

#include "stanza/stanza.hpp"


namespace Stanza {

    namespace {
        std::size_t hash_combine(std::size_t seed, std::size_t h) noexcept {
            return seed ^ (h + static_cast<std::size_t>(0x9e3779b97f4a7c15ull) + (seed << 6) + (seed >> 2));
        }

        const object* object_payload(const value& v) {
            return v.match<kind::object>([](const object& o) { return &o; },
                                         []() -> const object* { return nullptr; });
        }

        const value& null_sentinel() {
            static const value sentinel{};
            return sentinel;
        }
    } // namespace


    value::value(std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ std::monostate{} } {}

    value::value(std::nullptr_t, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ std::monostate{} } {}

    value::value(bool b, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ b } {}

    value::value(number n, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ std::move(n) } {}

    value::value(const char* s, std::pmr::memory_resource* res)
        : value(std::string_view{ s }, res) {}

    value::value(std::string_view sv, std::pmr::memory_resource* res)
        : m_MemRes{ res },
          m_Storage{ std::shared_ptr<const string>(std::allocate_shared<string>(std::pmr::polymorphic_allocator<string>(res), sv.begin(), sv.end())) } {}

    value::value(string s, std::pmr::memory_resource* res)
        : m_MemRes{ res },
          m_Storage{ std::shared_ptr<const string>(std::allocate_shared<string>(std::pmr::polymorphic_allocator<string>(res), std::move(s))) } {}

    value::value(array a, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::allocate_shared<array>(std::pmr::polymorphic_allocator<array>(res), std::move(a)) } {}

    value::value(object o, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::allocate_shared<object>(std::pmr::polymorphic_allocator<object>(res), std::move(o)) } {}

    value::value(value&& other) noexcept
        : m_MemRes{ other.m_MemRes }, m_Storage{ std::move(other.m_Storage) } {
        other.m_Storage = std::monostate{};
    }

    // The copy is taken before the old payload is released, which may own `other`.
    value& value::operator=(const value& other) {
        if (this == &other) return *this;
        value copy{ other };
        return *this = std::move(copy);
    }

    value& value::operator=(value&& other) noexcept {
        if (this == &other) return *this;
        value old{ std::move(*this) };
        m_MemRes = other.m_MemRes;
        m_Storage = std::move(other.m_Storage);
        other.m_Storage = std::monostate{};
        return *this;
    }

    value::~value() {
        std::vector<value> pending;
        detach_children(pending);
        while (!pending.empty()) {
            value next = std::move(pending.back());
            pending.pop_back();
            next.detach_children(pending);
        }
    }

    // Moves the containers below a uniquely owned payload into `out`, so the
    // payload itself is released without recursing.
    void value::detach_children(std::vector<value>& out) noexcept {
        auto take = [&out](value& child) {
            if (child.is_array() || child.is_object()) out.push_back(std::move(child));
        };
        if (auto* a = std::get_if<std::shared_ptr<array>>(&m_Storage); a && *a && a->use_count() == 1) {
            for (auto& child : **a) take(child);
            (*a)->clear();
        } else if (auto* o = std::get_if<std::shared_ptr<object>>(&m_Storage); o && *o && o->use_count() == 1) {
            for (auto& entry : (*o)->m_Entries) take(entry.second);
            (*o)->m_Index.clear();
            (*o)->m_Entries.clear();
        }
    }

    std::optional<value> value::from_double(double d, std::pmr::memory_resource* res) {
        if (auto n = number::from_double(d)) return value{ *n, res };
        return std::nullopt;
    }

    value value::from_double_or_null(double d, std::pmr::memory_resource* res) {
        if (auto v = from_double(d, res)) return std::move(*v);
        return value{ nullptr, res };
    }

    value value::from_double_or_string(double d, std::pmr::memory_resource* res) {
        if (auto v = from_double(d, res)) return std::move(*v);
        if (std::isnan(d)) return value{ "NaN", res };
        return value{ d > 0 ? "Infinity" : "-Infinity", res };
    }

    std::optional<bool> value::as_bool() const { return get<kind::boolean>(); }
    std::optional<number> value::as_number() const { return get<kind::number>(); }
    std::optional<string> value::as_string() const { return get<kind::string>(); }
    std::optional<array> value::as_array() const { return get<kind::array>(); }
    std::optional<object> value::as_object() const { return get<kind::object>(); }

    size_t value::size() const noexcept {
        return array_or_object([] { return size_t{ 0 }; },
                               [](const array& a) { return a.size(); },
                               [](const object& o) { return o.size(); });
    }

    const value* value::find(std::string_view key) const {
        return match<kind::object>([&](const object& o) { return o.find(key); },
                                   []() -> const value* { return nullptr; });
    }

    const value& value::operator[](size_t idx) const {
        const value* hit = match<kind::array>(
            [&](const array& a) -> const value* { return idx < a.size() ? &a[idx] : nullptr; },
            []() -> const value* { return nullptr; });
        return hit ? *hit : null_sentinel();
    }

    const value& value::operator[](std::string_view key) const {
        const value* hit = find(key);
        return hit ? *hit : null_sentinel();
    }

    value value::deep_merge(const value& patch) const {
        return Stanza::deep_merge(*this, patch);
    }

    bool operator==(const value& lhs, const value& rhs) {
        using pair_t = std::pair<const value*, const value*>;
        std::vector<pair_t> pending;
        pending.emplace_back(&lhs, &rhs);

        while (!pending.empty()) {
            auto [a, b] = pending.back();
            pending.pop_back();
            if (a == b || a->m_Storage == b->m_Storage) continue;

            const bool same = a->fold(
                [&] { return b->is_null(); },
                [&](bool x) {
                    return b->match<kind::boolean>([&](bool y) { return x == y; }, [] { return false; });
                },
                [&](const number& x) {
                    return b->match<kind::number>([&](const number& y) { return x == y; }, [] { return false; });
                },
                [&](const string& x) {
                    return b->match<kind::string>([&](const string& y) { return x == y; }, [] { return false; });
                },
                [&](const array& x) {
                    return b->match<kind::array>([&](const array& y) {
                        if (x.size() != y.size()) return false;
                        for (size_t i = x.size(); i-- > 0;) pending.emplace_back(&x[i], &y[i]);
                        return true;
                    }, [] { return false; });
                },
                [&](const object& x) {
                    return b->match<kind::object>([&](const object& y) {
                        if (x.size() != y.size()) return false;
                        for (const auto& [key, member] : x) {
                            const value* other = y.find(key);
                            if (!other) return false;
                            pending.emplace_back(&member, other);
                        }
                        return true;
                    }, [] { return false; });
                });
            if (!same) return false;
        }
        return true;
    }

    // Arrays combine element hashes in order; objects sum per-member hashes
    // so that member order does not matter.
    std::size_t value::hash() const {
        struct frame {
            const value* node;
            std::size_t next;
            std::size_t acc;
        };
        std::vector<frame> stack;

        auto enter = [&stack](const value& v) -> std::optional<std::size_t> {
            const auto seed = static_cast<std::size_t>(v.type());
            return v.fold(
                [&]() -> std::optional<std::size_t> { return hash_combine(seed, 0); },
                [&](bool b) -> std::optional<std::size_t> { return hash_combine(seed, b ? 1 : 2); },
                [&](const number& n) -> std::optional<std::size_t> { return hash_combine(seed, n.hash()); },
                [&](const string& s) -> std::optional<std::size_t> { return hash_combine(seed, std::hash<std::string_view>{}(s)); },
                [&](const array&) -> std::optional<std::size_t> { stack.push_back({ &v, 0, seed }); return std::nullopt; },
                [&](const object&) -> std::optional<std::size_t> { stack.push_back({ &v, 0, 0 }); return std::nullopt; });
        };

        std::optional<std::size_t> done = enter(*this);
        while (!stack.empty()) {
            if (done) {
                frame& parent = stack.back();
                const std::size_t child = *done;
                parent.node->match<kind::object>(
                    [&](const object& o) {
                        const auto& key = (o.begin() + static_cast<std::ptrdiff_t>(parent.next - 1))->first;
                        parent.acc += hash_combine(std::hash<std::string_view>{}(key), child);
                    },
                    [&] { parent.acc = hash_combine(parent.acc, child); });
                done.reset();
            }

            frame& top = stack.back();
            const value* child = top.node->array_or_object(
                []() -> const value* { return nullptr; },
                [&](const array& a) -> const value* { return top.next < a.size() ? &a[top.next] : nullptr; },
                [&](const object& o) -> const value* {
                    return top.next < o.size() ? &(o.begin() + static_cast<std::ptrdiff_t>(top.next))->second : nullptr;
                });
            if (child) {
                ++top.next;
                done = enter(*child);
                continue;
            }

            const std::size_t h = top.node->is_object()
                ? hash_combine(static_cast<std::size_t>(kind::object), top.acc)
                : hash_combine(top.acc, top.next);
            stack.pop_back();
            done = h;
        }
        return *done;
    }

    std::string value::to_string() const { return spaces2(); }
    std::string value::no_spaces() const { return dump(*this, WriteOptions::no_spaces()); }
    std::string value::spaces2() const { return dump(*this, WriteOptions::spaces2()); }
    std::string value::spaces4() const { return dump(*this, WriteOptions::spaces4()); }
    std::string value::pretty(const WriteOptions& opts) const { return dump(*this, opts); }

    std::ostream& operator<<(std::ostream& os, const value& v) {
        dump(v, os, WriteOptions::spaces2());
        return os;
    }


    value deep_merge(const value& base, const value& patch) {
        const object* base_obj = object_payload(base);
        const object* patch_obj = object_payload(patch);
        if (!base_obj || !patch_obj) return patch;

        // One frame per pair of objects being merged. `out` starts as a copy
        // of the patch side, so shared keys keep the patch's position.
        struct frame {
            const object* base;
            const object* patch;
            object::builder out;
            std::size_t next;
            std::string_view key;
        };
        std::vector<frame> stack;
        stack.push_back(frame{ base_obj, patch_obj, object::builder{ *patch_obj }, 0, {} });

        std::optional<value> merged_child;
        while (true) {
            frame& top = stack.back();
            if (merged_child) {
                top.out.insert_or_assign(top.key, std::move(*merged_child));
                merged_child.reset();
            }

            if (top.next == top.base->size()) {
                value merged{ std::move(top.out).build(), base.resource() };
                stack.pop_back();
                if (stack.empty()) return merged;
                merged_child = std::move(merged);
                continue;
            }

            const auto& [key, base_member] = *(top.base->begin() + static_cast<std::ptrdiff_t>(top.next));
            ++top.next;

            const value* patch_member = top.patch->find(key);
            if (!patch_member) {
                top.out.insert_or_assign(key, base_member);
                continue;
            }

            const object* child_base = object_payload(base_member);
            const object* child_patch = object_payload(*patch_member);
            if (child_base && child_patch) {
                top.key = key;
                stack.push_back(frame{ child_base, child_patch, object::builder{ *child_patch }, 0, {} });
            }
            // otherwise the patch member, already in `out`, wins
        }
    }

    value deep_merge_all(std::span<const value> sources) {
        if (sources.empty()) return value{};
        value merged = sources.front();
        for (const auto& next : sources.subspan(1)) merged = deep_merge(merged, next);
        return merged;
    }

} // namespace Stanza
