#include "stanza/number.hpp"

#include <charconv>
#include <cmath>
#include <limits>
#include <system_error>


namespace Stanza {

    namespace {

        // value = (-1)^negative * digits * 10^exponent, digits carry no
        // leading or trailing zeros, zero is the empty digit string
        struct normal_form {
            bool negative = false;
            std::string digits;
            std::int64_t exponent = 0;

            bool operator==(const normal_form&) const = default;
        };

        // Keeps exponent arithmetic on fraction lengths far from overflow
        constexpr std::int64_t max_exponent = std::numeric_limits<std::int64_t>::max() / 4;

        bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

        std::optional<normal_form> scan_literal(std::string_view s) {
            normal_form out;
            size_t i = 0;
            const size_t n = s.size();

            if (i < n && s[i] == '-') {
                out.negative = true;
                i++;
            }
            if (i >= n || !is_digit(s[i])) return std::nullopt;

            size_t int_start = i;
            if (s[i] == '0') {
                i++;
                if (i < n && is_digit(s[i])) return std::nullopt;
            } else {
                while (i < n && is_digit(s[i])) i++;
            }
            std::string_view int_part = s.substr(int_start, i - int_start);

            std::string_view frac_part;
            if (i < n && s[i] == '.') {
                i++;
                size_t frac_start = i;
                while (i < n && is_digit(s[i])) i++;
                if (i == frac_start) return std::nullopt;
                frac_part = s.substr(frac_start, i - frac_start);
            }

            std::int64_t exponent = 0;
            if (i < n && (s[i] == 'e' || s[i] == 'E')) {
                i++;
                bool neg_exp = false;
                if (i < n && (s[i] == '+' || s[i] == '-')) {
                    neg_exp = s[i] == '-';
                    i++;
                }
                size_t exp_start = i;
                while (i < n && is_digit(s[i])) {
                    int d = s[i] - '0';
                    if (exponent > (max_exponent - d) / 10) return std::nullopt;
                    exponent = exponent * 10 + d;
                    i++;
                }
                if (i == exp_start) return std::nullopt;
                if (neg_exp) exponent = -exponent;
            }

            if (i != n) return std::nullopt;

            out.digits.reserve(int_part.size() + frac_part.size());
            out.digits.append(int_part);
            out.digits.append(frac_part);
            exponent -= static_cast<std::int64_t>(frac_part.size());

            auto first = out.digits.find_first_not_of('0');
            if (first == std::string::npos) return normal_form{};
            out.digits.erase(0, first);

            auto last = out.digits.find_last_not_of('0');
            exponent += static_cast<std::int64_t>(out.digits.size() - 1 - last);
            out.digits.erase(last + 1);

            out.exponent = exponent;
            return out;
        }

        normal_form normalize(const number& n) {
            // to_string() always yields a valid literal
            return scan_literal(n.to_string()).value_or(normal_form{});
        }

        std::string int_text(std::int64_t i) {
            char buf[32];
            auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), i);
            return std::string(buf, ptr);
        }

        std::string double_text(double d) {
            char buf[64];
            auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d);
            if (ec != std::errc{}) return "0";
            return std::string(buf, ptr);
        }

        void hash_combine(std::size_t& seed, std::size_t h) noexcept {
            seed ^= h + 0x9e3779b97f4a7c15ull + (seed << 6) + (seed >> 2);
        }

    } // namespace

    number number::from_int(std::int64_t i) noexcept {
        return number{ i };
    }

    number number::from_uint(std::uint64_t u) {
        if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
            return number{ static_cast<std::int64_t>(u) };

        char buf[32];
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), u);
        return number{ std::make_shared<const std::string>(buf, ptr) };
    }

    std::optional<number> number::from_double(double d) noexcept {
        if (!std::isfinite(d)) return std::nullopt;
        return number{ d };
    }

    std::optional<number> number::from_string(std::string_view literal) {
        if (!scan_literal(literal)) return std::nullopt;
        return number{ std::make_shared<const std::string>(literal) };
    }

    double number::to_double() const noexcept {
        switch (m_Repr.index()) {
        case 0: return static_cast<double>(std::get<std::int64_t>(m_Repr));
        case 1: return std::get<double>(m_Repr);
        }

        const std::string& text = *std::get<literal>(m_Repr);
        double d = 0.0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), d);
        if (ec == std::errc::result_out_of_range) {
            auto nf = scan_literal(text);
            if (!nf || nf->digits.empty()) return 0.0;
            bool huge = static_cast<std::int64_t>(nf->digits.size()) + nf->exponent > 0;
            double magnitude = huge ? std::numeric_limits<double>::infinity() : 0.0;
            return nf->negative ? -magnitude : magnitude;
        }
        if (ec != std::errc{}) return 0.0;
        return d;
    }

    std::optional<std::int64_t> number::to_int64() const {
        if (m_Repr.index() == 0) return std::get<std::int64_t>(m_Repr);

        normal_form nf = normalize(*this);
        if (nf.digits.empty()) return std::int64_t{ 0 };
        if (nf.exponent < 0) return std::nullopt;

        // 19 digits is the widest magnitude that can fit
        auto width = static_cast<std::int64_t>(nf.digits.size()) + nf.exponent;
        if (width > 19) return std::nullopt;

        std::string text = nf.digits;
        text.append(static_cast<size_t>(nf.exponent), '0');

        std::uint64_t magnitude = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), magnitude);
        if (ec != std::errc{}) return std::nullopt;

        constexpr auto max_positive = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
        if (!nf.negative) {
            if (magnitude > max_positive) return std::nullopt;
            return static_cast<std::int64_t>(magnitude);
        }
        if (magnitude > max_positive + 1) return std::nullopt;
        if (magnitude == max_positive + 1) return std::numeric_limits<std::int64_t>::min();
        return -static_cast<std::int64_t>(magnitude);
    }

    std::string number::to_string() const {
        switch (m_Repr.index()) {
        case 0: return int_text(std::get<std::int64_t>(m_Repr));
        case 1: return double_text(std::get<double>(m_Repr));
        }
        return *std::get<literal>(m_Repr);
    }

    std::size_t number::hash() const {
        normal_form nf = normalize(*this);
        std::size_t seed = std::hash<bool>{}(nf.negative);
        hash_combine(seed, std::hash<std::string>{}(nf.digits));
        hash_combine(seed, std::hash<std::int64_t>{}(nf.exponent));
        return seed;
    }

    bool operator==(const number& lhs, const number& rhs) {
        if (lhs.m_Repr.index() == 0 && rhs.m_Repr.index() == 0)
            return std::get<std::int64_t>(lhs.m_Repr) == std::get<std::int64_t>(rhs.m_Repr);
        if (lhs.m_Repr.index() == 1 && rhs.m_Repr.index() == 1)
            return std::get<double>(lhs.m_Repr) == std::get<double>(rhs.m_Repr);
        return normalize(lhs) == normalize(rhs);
    }

} // namespace Stanza
