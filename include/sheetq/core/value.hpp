#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace sheetq {

/// A single cell: Null, Number or Text.
///
/// Equality is raw: values of different kinds never compare equal, so
/// Number(125000) != Text("125000"). Null compares equal to Null.
using Value = std::variant<std::monostate, double, std::string>;

/// One materialized sheet row: column name -> cell.
using Row = std::unordered_map<std::string, Value>;

/// Rows of one sheet in source order.
using Rows = std::vector<Row>;

[[nodiscard]] inline auto is_null(const Value& value) noexcept -> bool {
    return std::holds_alternative<std::monostate>(value);
}

[[nodiscard]] inline auto as_text(const Value& value) noexcept -> const std::string* {
    return std::get_if<std::string>(&value);
}

/// Cell lookup; nullptr when the row has no such column.
[[nodiscard]] inline auto lookup(const Row& row, const std::string& column) -> const Value* {
    if (auto it = row.find(column); it != row.end()) {
        return &it->second;
    }
    return nullptr;
}

/// Parse numeric-looking text (integers, decimals, exponents, optional sign,
/// surrounding whitespace). Locale-independent.
[[nodiscard]] auto parse_number(std::string_view text) -> std::optional<double>;

/// Numeric coercion shared by filters and aggregates.
/// Numbers pass through, text is parsed, Null never coerces.
[[nodiscard]] auto coerce_number(const Value& value) -> std::optional<double>;

/// Render a number for output: integral values without a decimal point,
/// everything else with up to six decimals and trailing zeros stripped.
[[nodiscard]] auto format_number(double value) -> std::string;

/// Render any cell for output. Null renders as an empty string.
[[nodiscard]] auto stringify(const Value& value) -> std::string;

}  // namespace sheetq
