#pragma once

#include <sheetq/core/error.hpp>
#include <sheetq/source/catalog.hpp>

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace sheetq::query {

/// Check join keys against both sides' declared schemas.
///
/// A key missing on either side (or an empty key list) is a validation error.
/// Keys whose declared types differ (case-insensitively, when both sides
/// declare one) produce a warning and the join still runs on raw equality.
[[nodiscard]] auto validate_join_keys(const std::vector<source::ColumnSchema>& primary_schema,
                                      const std::vector<source::ColumnSchema>& join_schema,
                                      const std::vector<std::string>& join_keys,
                                      std::string_view primary_alias, std::string_view join_alias)
    -> std::expected<std::vector<std::string>, PreviewError>;

}  // namespace sheetq::query
