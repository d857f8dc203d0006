#pragma once

#include <sheetq/core/error.hpp>

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <variant>

namespace sheetq::query {

/// Supported aggregate functions.
enum class AggFunc : std::uint8_t {
    Sum,
    Avg,
    Count,
};

[[nodiscard]] auto to_string(AggFunc func) -> std::string_view;

/// `alias.column` projection.
struct ScalarRef {
    std::string alias;
    std::string column;
};

/// `func(alias.column)` projection.
struct AggregateRef {
    AggFunc func = AggFunc::Sum;
    std::string alias;
    std::string column;
};

/// `count(*)` projection.
struct CountStar {};

/// Parsed projection expression.
struct Expression {
    std::variant<ScalarRef, AggregateRef, CountStar> node;
};

[[nodiscard]] inline auto is_aggregate(const Expression& expr) noexcept -> bool {
    return !std::holds_alternative<ScalarRef>(expr.node);
}

/// Parse a projection expression.
///
/// `func(inner)` with func in {sum, avg, count} (case-insensitive) is an
/// aggregate; anything else is a scalar column reference. A reference without
/// an alias (`column`) resolves to `primary_alias`. Whether the alias and
/// column exist is checked when the projection executes, not here.
[[nodiscard]] auto parse_expression(std::string_view text, std::string_view primary_alias)
    -> std::expected<Expression, PreviewError>;

}  // namespace sheetq::query
