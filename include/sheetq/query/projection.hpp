#pragma once

#include <sheetq/core/error.hpp>
#include <sheetq/query/combined_row.hpp>
#include <sheetq/query/expression.hpp>
#include <sheetq/query/request.hpp>

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace sheetq::query {

/// Parsed projections of one request, all scalar or all aggregate.
struct ProjectionPlan {
    bool aggregate = false;
    std::vector<Expression> expressions;
};

/// Parse every projection and enforce scalar/aggregate exclusivity.
[[nodiscard]] auto plan_projections(const std::vector<Projection>& projections,
                                    std::string_view primary_alias)
    -> std::expected<ProjectionPlan, PreviewError>;

/// Produce output cells: one row per combined row in scalar mode, exactly one
/// row in aggregate mode.
[[nodiscard]] auto project_rows(const std::vector<CombinedRow>& rows, const ProjectionPlan& plan,
                                const AliasSlots& slots)
    -> std::expected<std::vector<std::vector<std::string>>, PreviewError>;

}  // namespace sheetq::query
