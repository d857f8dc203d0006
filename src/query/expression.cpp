#include <sheetq/query/expression.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <optional>
#include <utility>

namespace sheetq::query {

namespace {

auto trim(std::string_view text) -> std::string_view {
    auto is_space = [](char ch) {
        return std::isspace(static_cast<unsigned char>(ch)) != 0;
    };
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

auto lookup_func(std::string_view name) -> std::optional<AggFunc> {
    std::string lowered(name);
    std::ranges::transform(lowered, lowered.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (lowered == "sum") {
        return AggFunc::Sum;
    }
    if (lowered == "avg") {
        return AggFunc::Avg;
    }
    if (lowered == "count") {
        return AggFunc::Count;
    }
    return std::nullopt;
}

struct ColumnPath {
    std::string alias;
    std::string column;
};

// Split `alias.column` at the first dot; a missing or blank alias falls back
// to the primary alias.
auto resolve_column_path(std::string_view text, std::string_view primary_alias,
                         std::string_view expression) -> std::expected<ColumnPath, PreviewError> {
    text = trim(text);
    ColumnPath path;
    if (auto dot = text.find('.'); dot != std::string_view::npos) {
        path.alias = std::string(trim(text.substr(0, dot)));
        path.column = std::string(trim(text.substr(dot + 1)));
    } else {
        path.column = std::string(text);
    }
    if (path.alias.empty()) {
        path.alias = std::string(primary_alias);
    }
    if (path.column.empty()) {
        return std::unexpected(
            validation_error(fmt::format("column missing in projection '{}'", expression)));
    }
    return path;
}

}  // namespace

auto to_string(AggFunc func) -> std::string_view {
    switch (func) {
        case AggFunc::Sum:
            return "sum";
        case AggFunc::Avg:
            return "avg";
        case AggFunc::Count:
            return "count";
    }
    return "unknown";
}

auto parse_expression(std::string_view text, std::string_view primary_alias)
    -> std::expected<Expression, PreviewError> {
    const auto expr = trim(text);

    auto open = expr.find('(');
    if (open != std::string_view::npos && expr.ends_with(')')) {
        if (auto func = lookup_func(trim(expr.substr(0, open)))) {
            auto inner = trim(expr.substr(open + 1, expr.size() - open - 2));
            if (inner.empty()) {
                return std::unexpected(
                    validation_error(fmt::format("aggregate expression '{}' is empty", text)));
            }
            if (*func == AggFunc::Count && inner == "*") {
                return Expression{CountStar{}};
            }
            auto path = resolve_column_path(inner, primary_alias, text);
            if (!path) {
                return std::unexpected(std::move(path.error()));
            }
            return Expression{AggregateRef{
                .func = *func,
                .alias = std::move(path->alias),
                .column = std::move(path->column),
            }};
        }
    }

    auto path = resolve_column_path(expr, primary_alias, text);
    if (!path) {
        return std::unexpected(std::move(path.error()));
    }
    return Expression{ScalarRef{.alias = std::move(path->alias), .column = std::move(path->column)}};
}

}  // namespace sheetq::query
