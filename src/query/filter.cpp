#include <sheetq/query/filter.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <utility>

namespace sheetq::query {

namespace {

auto fold(unsigned char ch) -> char {
    return static_cast<char>(std::tolower(ch));
}

auto contains_folded(std::string_view haystack, std::string_view needle) -> bool {
    if (needle.empty()) {
        return true;
    }
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](char a, char b) {
                              return fold(static_cast<unsigned char>(a)) ==
                                     fold(static_cast<unsigned char>(b));
                          });
    return it != haystack.end();
}

const Value kNull{};

}  // namespace

auto to_string(FilterOp op) -> std::string_view {
    switch (op) {
        case FilterOp::Eq:
            return "eq";
        case FilterOp::Ne:
            return "ne";
        case FilterOp::Contains:
            return "contains";
        case FilterOp::Gt:
            return "gt";
        case FilterOp::Lt:
            return "lt";
    }
    return "unknown";
}

auto parse_filter_op(std::string_view text) -> std::optional<FilterOp> {
    std::string lowered(text);
    std::ranges::transform(lowered, lowered.begin(), fold);
    if (lowered == "eq") {
        return FilterOp::Eq;
    }
    if (lowered == "ne") {
        return FilterOp::Ne;
    }
    if (lowered == "contains") {
        return FilterOp::Contains;
    }
    if (lowered == "gt") {
        return FilterOp::Gt;
    }
    if (lowered == "lt") {
        return FilterOp::Lt;
    }
    return std::nullopt;
}

auto bind_filters(const std::vector<Filter>& filters, const AliasSlots& slots)
    -> std::expected<std::vector<BoundFilter>, PreviewError> {
    std::vector<BoundFilter> bound;
    bound.reserve(filters.size());
    for (const auto& filter : filters) {
        auto slot = slots.find(filter.alias);
        if (slot == slots.end()) {
            return std::unexpected(validation_error(
                fmt::format("filter references unknown alias '{}'", filter.alias)));
        }
        auto op = parse_filter_op(filter.op);
        if (!op) {
            return std::unexpected(
                validation_error(fmt::format("unsupported filter operator '{}'", filter.op)));
        }
        bound.push_back(BoundFilter{
            .slot = slot->second,
            .column = filter.column,
            .op = *op,
            .value = filter.value,
        });
    }
    return bound;
}

auto matches(FilterOp op, const Value* cell, const Value& operand) -> bool {
    const Value& lhs = cell != nullptr ? *cell : kNull;
    switch (op) {
        case FilterOp::Eq:
            return lhs == operand;
        case FilterOp::Ne:
            return lhs != operand;
        case FilterOp::Contains: {
            const auto* text = as_text(lhs);
            const auto* needle = as_text(operand);
            return text != nullptr && needle != nullptr && contains_folded(*text, *needle);
        }
        case FilterOp::Gt:
        case FilterOp::Lt: {
            auto left = coerce_number(lhs);
            auto right = coerce_number(operand);
            if (!left || !right) {
                return false;
            }
            return op == FilterOp::Gt ? *left > *right : *left < *right;
        }
    }
    return false;
}

auto apply_filters(std::vector<CombinedRow> rows, const std::vector<BoundFilter>& filters)
    -> std::vector<CombinedRow> {
    for (const auto& filter : filters) {
        const auto before = rows.size();
        std::erase_if(rows, [&](const CombinedRow& merged) {
            const Row* row = filter.slot < merged.size() ? merged[filter.slot] : nullptr;
            if (row == nullptr) {
                return true;
            }
            return !matches(filter.op, lookup(*row, filter.column), filter.value);
        });
        spdlog::debug("filter {} {} {}: {} -> {} rows", filter.column, to_string(filter.op),
                      stringify(filter.value), before, rows.size());
    }
    return rows;
}

}  // namespace sheetq::query
