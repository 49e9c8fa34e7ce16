#include "stanza/convert.hpp"


namespace Stanza {

    namespace {
        std::string mismatch(std::string_view expected, const value& found) {
            std::string msg{ "Expected " };
            msg.append(expected);
            msg.append(", got ");
            msg.append(found.name());
            return msg;
        }
    } // namespace

    DecodingFailure DecodingFailure::make(std::string_view msg, const hcursor& at) {
        return DecodingFailure{ std::string{ msg }, at.history() };
    }

    std::string DecodingFailure::describe() const {
        std::string out = msg;
        if (history.empty()) return out;
        out.append(": ");
        for (std::size_t i = 0; i < history.size(); i++) {
            if (i != 0) out.push_back(',');
            out.append(to_string(history[i]));
        }
        return out;
    }

    namespace detail {
        std::optional<DecodingFailure> check_focus(const hcursor& c) {
            if (c.succeeded()) return std::nullopt;
            if (c.missing_field()) return DecodingFailure::make("Missing required field", c);
            return DecodingFailure::make("Attempt to decode value on failed cursor", c);
        }

        DecodeResult<std::int64_t> focus_int64(const hcursor& c) {
            if (auto failed = check_focus(c)) return std::unexpected(std::move(*failed));
            const value& focus = c.current()->focus();
            auto n = focus.as_number();
            if (!n) return std::unexpected(DecodingFailure::make(mismatch("Number", focus), c));
            auto whole = n->to_int64();
            if (!whole) return std::unexpected(DecodingFailure::make("Expected integer, got " + n->to_string(), c));
            return *whole;
        }
    } // namespace detail

    DecodeResult<void> from_json(const hcursor& c, bool& out) {
        if (auto failed = detail::check_focus(c)) return std::unexpected(std::move(*failed));
        auto b = c.current()->focus().as_bool();
        if (!b) return std::unexpected(DecodingFailure::make(mismatch("Boolean", c.current()->focus()), c));
        out = *b;
        return {};
    }

    DecodeResult<void> from_json(const hcursor& c, double& out) {
        if (auto failed = detail::check_focus(c)) return std::unexpected(std::move(*failed));
        auto n = c.current()->focus().as_number();
        if (!n) return std::unexpected(DecodingFailure::make(mismatch("Number", c.current()->focus()), c));
        out = n->to_double();
        return {};
    }

    DecodeResult<void> from_json(const hcursor& c, std::string& out) {
        if (auto failed = detail::check_focus(c)) return std::unexpected(std::move(*failed));
        auto s = c.current()->focus().as_string();
        if (!s) return std::unexpected(DecodingFailure::make(mismatch("String", c.current()->focus()), c));
        out.assign(s->begin(), s->end());
        return {};
    }

    DecodeResult<void> from_json(const hcursor& c, value& out) {
        if (auto failed = detail::check_focus(c)) return std::unexpected(std::move(*failed));
        out = c.current()->focus();
        return {};
    }

    void to_json(value& out, bool b) {
        out = value{ b, out.resource() };
    }

    void to_json(value& out, double d) {
        out = value::from_double_or_null(d, out.resource());
    }

    void to_json(value& out, const char* s) {
        out = value{ s, out.resource() };
    }

    void to_json(value& out, std::string_view s) {
        out = value{ s, out.resource() };
    }

    void to_json(value& out, const std::string& s) {
        out = value{ std::string_view{ s }, out.resource() };
    }

    void to_json(value& out, const value& v) {
        out = v;
    }

} // namespace Stanza
