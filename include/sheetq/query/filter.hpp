#pragma once

#include <sheetq/core/error.hpp>
#include <sheetq/core/value.hpp>
#include <sheetq/query/combined_row.hpp>
#include <sheetq/query/request.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sheetq::query {

enum class FilterOp : std::uint8_t {
    Eq,
    Ne,
    Contains,
    Gt,
    Lt,
};

[[nodiscard]] auto to_string(FilterOp op) -> std::string_view;

/// Case-insensitive operator lookup.
[[nodiscard]] auto parse_filter_op(std::string_view text) -> std::optional<FilterOp>;

/// Filter resolved against the request's alias slots.
struct BoundFilter {
    std::size_t slot = 0;
    std::string column;
    FilterOp op = FilterOp::Eq;
    Value value;
};

/// Resolve aliases and operators. Checked in filter order: unknown alias
/// first, then the operator.
[[nodiscard]] auto bind_filters(const std::vector<Filter>& filters, const AliasSlots& slots)
    -> std::expected<std::vector<BoundFilter>, PreviewError>;

/// Evaluate one predicate against a cell (nullptr when the column is absent).
[[nodiscard]] auto matches(FilterOp op, const Value* cell, const Value& operand) -> bool;

/// Keep combined rows satisfying every filter, preserving order.
[[nodiscard]] auto apply_filters(std::vector<CombinedRow> rows,
                                 const std::vector<BoundFilter>& filters)
    -> std::vector<CombinedRow>;

}  // namespace sheetq::query
