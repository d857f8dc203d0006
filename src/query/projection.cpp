#include <sheetq/query/projection.hpp>

#include <fmt/format.h>

#include <cstddef>
#include <type_traits>
#include <utility>
#include <variant>

namespace sheetq::query {

namespace {

auto cell_at(const CombinedRow& merged, std::size_t slot, const std::string& column)
    -> const Value* {
    const Row* row = slot < merged.size() ? merged[slot] : nullptr;
    if (row == nullptr) {
        return nullptr;
    }
    return lookup(*row, column);
}

auto scalar_cell(const CombinedRow& merged, const ScalarRef& ref, const AliasSlots& slots)
    -> std::string {
    auto slot = slots.find(ref.alias);
    if (slot == slots.end()) {
        return {};
    }
    const auto* value = cell_at(merged, slot->second, ref.column);
    return value != nullptr ? stringify(*value) : std::string{};
}

auto aggregate_cell(const std::vector<CombinedRow>& rows, const AggregateRef& ref,
                    const AliasSlots& slots) -> std::expected<std::string, PreviewError> {
    auto unknown_alias = [&] {
        return std::unexpected(validation_error(fmt::format(
            "unknown sheet alias '{}' in aggregate '{}'", ref.alias, to_string(ref.func))));
    };

    auto slot = slots.find(ref.alias);
    if (slot == slots.end()) {
        return unknown_alias();
    }

    std::size_t present = 0;
    std::size_t count = 0;
    std::size_t numeric = 0;
    double total = 0.0;
    for (const auto& merged : rows) {
        const Row* row = slot->second < merged.size() ? merged[slot->second] : nullptr;
        if (row == nullptr) {
            continue;
        }
        ++present;
        const auto* value = lookup(*row, ref.column);
        if (value == nullptr || is_null(*value)) {
            continue;
        }
        ++count;
        if (auto number = coerce_number(*value)) {
            total += *number;
            ++numeric;
        }
    }
    if (!rows.empty() && present == 0) {
        return unknown_alias();
    }

    switch (ref.func) {
        case AggFunc::Count:
            return format_number(static_cast<double>(count));
        case AggFunc::Sum:
            return format_number(total);
        case AggFunc::Avg:
            return format_number(numeric == 0 ? 0.0 : total / static_cast<double>(numeric));
    }
    return std::string{};
}

}  // namespace

auto plan_projections(const std::vector<Projection>& projections, std::string_view primary_alias)
    -> std::expected<ProjectionPlan, PreviewError> {
    ProjectionPlan plan;
    plan.expressions.reserve(projections.size());
    bool any_scalar = false;
    bool any_aggregate = false;
    for (const auto& projection : projections) {
        auto expr = parse_expression(projection.expression, primary_alias);
        if (!expr) {
            return std::unexpected(std::move(expr.error()));
        }
        if (is_aggregate(*expr)) {
            any_aggregate = true;
        } else {
            any_scalar = true;
        }
        plan.expressions.push_back(std::move(*expr));
    }
    if (any_scalar && any_aggregate) {
        return std::unexpected(validation_error("cannot mix aggregate and scalar projections"));
    }
    plan.aggregate = any_aggregate;
    return plan;
}

auto project_rows(const std::vector<CombinedRow>& rows, const ProjectionPlan& plan,
                  const AliasSlots& slots)
    -> std::expected<std::vector<std::vector<std::string>>, PreviewError> {
    std::vector<std::vector<std::string>> output;

    if (!plan.aggregate) {
        output.reserve(rows.size());
        for (const auto& merged : rows) {
            std::vector<std::string> cells;
            cells.reserve(plan.expressions.size());
            for (const auto& expr : plan.expressions) {
                cells.push_back(scalar_cell(merged, std::get<ScalarRef>(expr.node), slots));
            }
            output.push_back(std::move(cells));
        }
        return output;
    }

    std::vector<std::string> cells;
    cells.reserve(plan.expressions.size());
    for (const auto& expr : plan.expressions) {
        auto cell = std::visit(
            [&](const auto& node) -> std::expected<std::string, PreviewError> {
                using T = std::decay_t<decltype(node)>;
                if constexpr (std::is_same_v<T, CountStar>) {
                    return format_number(static_cast<double>(rows.size()));
                } else if constexpr (std::is_same_v<T, AggregateRef>) {
                    return aggregate_cell(rows, node, slots);
                } else {
                    return std::unexpected(
                        validation_error("cannot mix aggregate and scalar projections"));
                }
            },
            expr.node);
        if (!cell) {
            return std::unexpected(std::move(cell.error()));
        }
        cells.push_back(std::move(*cell));
    }
    output.push_back(std::move(cells));
    return output;
}

}  // namespace sheetq::query
