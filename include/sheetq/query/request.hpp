#pragma once

#include <sheetq/core/value.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sheetq::query {

/// Role of a sheet within a preview request.
enum class SheetRole : std::uint8_t {
    Primary,
    Join,
    /// Accepted by the data model; rejected at execution.
    Union,
};

[[nodiscard]] auto to_string(SheetRole role) -> std::string_view;
[[nodiscard]] auto parse_sheet_role(std::string_view text) -> std::optional<SheetRole>;

/// One sheet taking part in a preview, referenced everywhere else by alias.
struct SheetSelection {
    std::string sheet_id;
    std::string alias;
    SheetRole role = SheetRole::Primary;
    /// Columns matched between the primary sheet and this one, in order.
    std::vector<std::string> join_keys;
};

/// Output column: `alias.column`, `func(alias.column)` or `count(*)`.
struct Projection {
    std::string expression;
    std::string label;
};

/// Row predicate on one alias. `op` is one of eq, ne, contains, gt, lt.
struct Filter {
    std::string alias;
    std::string column;
    std::string op;
    Value value;
};

struct PreviewRequest {
    std::vector<SheetSelection> sheets;
    std::vector<Projection> projections;
    std::vector<Filter> filters;
    std::optional<std::int64_t> limit;
};

/// Tabular preview output. Every row has one cell per header.
struct PreviewResult {
    std::vector<std::string> headers;
    std::vector<std::vector<std::string>> rows;
    std::vector<std::string> warnings;
    double execution_ms = 0.0;
    std::size_t row_count = 0;
};

}  // namespace sheetq::query
