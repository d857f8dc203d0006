#include <sheetq/query/schema_check.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace sheetq::query {

namespace {

using TypeLookup = std::unordered_map<std::string, std::string>;

auto lowercase(std::string text) -> std::string {
    std::ranges::transform(text, text.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return text;
}

// Later duplicates of a column name win.
auto build_lookup(const std::vector<source::ColumnSchema>& schema) -> TypeLookup {
    TypeLookup lookup;
    lookup.reserve(schema.size());
    for (const auto& column : schema) {
        if (column.name.empty()) {
            continue;
        }
        lookup.insert_or_assign(column.name, lowercase(column.inferred_type));
    }
    return lookup;
}

}  // namespace

auto validate_join_keys(const std::vector<source::ColumnSchema>& primary_schema,
                        const std::vector<source::ColumnSchema>& join_schema,
                        const std::vector<std::string>& join_keys, std::string_view primary_alias,
                        std::string_view join_alias)
    -> std::expected<std::vector<std::string>, PreviewError> {
    if (join_keys.empty()) {
        return std::unexpected(
            validation_error(fmt::format("join keys required for alias {}", join_alias)));
    }

    const auto primary_types = build_lookup(primary_schema);
    const auto join_types = build_lookup(join_schema);

    std::vector<std::string> warnings;
    for (const auto& key : join_keys) {
        auto primary_it = primary_types.find(key);
        if (primary_it == primary_types.end()) {
            return std::unexpected(validation_error(
                fmt::format("join column '{}' missing on sheet alias '{}'", key, primary_alias)));
        }
        auto join_it = join_types.find(key);
        if (join_it == join_types.end()) {
            return std::unexpected(validation_error(
                fmt::format("join column '{}' missing on sheet alias '{}'", key, join_alias)));
        }

        const auto& primary_type = primary_it->second;
        const auto& join_type = join_it->second;
        if (!primary_type.empty() && !join_type.empty() && primary_type != join_type) {
            warnings.push_back(fmt::format(
                "Join column '{}' uses incompatible types between '{}' ({}) and '{}' ({}).", key,
                primary_alias, primary_type, join_alias, join_type));
        }
    }
    return warnings;
}

}  // namespace sheetq::query
