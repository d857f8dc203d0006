#include <sheetq/core/value.hpp>

#include <fmt/format.h>

#include <charconv>
#include <cmath>
#include <system_error>
#include <type_traits>

namespace sheetq {

namespace {

constexpr std::string_view kWhitespace = " \t\r\n\f\v";

auto trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(kWhitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(kWhitespace);
    return text.substr(begin, end - begin + 1);
}

}  // namespace

auto parse_number(std::string_view text) -> std::optional<double> {
    text = trim(text);
    if (text.empty()) {
        return std::nullopt;
    }
    // from_chars rejects a leading '+', but "+12" is a valid number here.
    if (text.front() == '+') {
        text.remove_prefix(1);
        if (text.empty() || text.front() == '-' || text.front() == '+') {
            return std::nullopt;
        }
    }
    double out = 0.0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return out;
}

auto coerce_number(const Value& value) -> std::optional<double> {
    return std::visit(
        [](const auto& v) -> std::optional<double> {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, double>) {
                return v;
            } else if constexpr (std::is_same_v<T, std::string>) {
                return parse_number(v);
            } else {
                return std::nullopt;
            }
        },
        value);
}

auto format_number(double value) -> std::string {
    if (std::isfinite(value) && std::trunc(value) == value) {
        if (value == 0.0) {
            return "0";
        }
        return fmt::format("{:.0f}", value);
    }
    std::string text = fmt::format("{:.6f}", value);
    if (text.find('.') == std::string::npos) {
        return text;  // nan / inf
    }
    while (!text.empty() && text.back() == '0') {
        text.pop_back();
    }
    if (!text.empty() && text.back() == '.') {
        text.pop_back();
    }
    return text;
}

auto stringify(const Value& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, double>) {
                return format_number(v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else {
                return {};
            }
        },
        value);
}

}  // namespace sheetq
