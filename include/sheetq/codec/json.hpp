#pragma once

#include <sheetq/core/error.hpp>
#include <sheetq/query/request.hpp>

#include <nlohmann/json.hpp>

#include <expected>
#include <string_view>

namespace sheetq::codec {

/// Decode a preview request from its JSON wire shape:
///
///   {"sheets": [{"sheetId", "alias"?, "role"?, "joinKeys"?}],
///    "projections": [{"expression", "label"}],
///    "filters"?: [{"sheetAlias", "column", "operator", "value"}],
///    "limit"?: 25}
///
/// Field-level problems are validation errors.
[[nodiscard]] auto parse_request(const nlohmann::json& payload)
    -> std::expected<query::PreviewRequest, PreviewError>;

/// As `parse_request`, from JSON text.
[[nodiscard]] auto parse_request_text(std::string_view text)
    -> std::expected<query::PreviewRequest, PreviewError>;

/// {"headers", "rows", "warnings", "executionMetrics": {"executionMs", "rowCount"}}
[[nodiscard]] auto serialize_result(const query::PreviewResult& result) -> nlohmann::json;

/// {"error": "validation" | "source_unavailable", "detail": message}
[[nodiscard]] auto serialize_error(const PreviewError& error) -> nlohmann::json;

}  // namespace sheetq::codec
