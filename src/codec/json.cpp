#include <sheetq/codec/json.hpp>

#include <fmt/format.h>

#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace sheetq::codec {

namespace {

using json = nlohmann::json;

auto trim(std::string_view text) -> std::string {
    auto is_space = [](char ch) {
        return std::isspace(static_cast<unsigned char>(ch)) != 0;
    };
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    return std::string(text);
}

auto fail(std::string message) -> std::unexpected<PreviewError> {
    return std::unexpected(validation_error(std::move(message)));
}

// Non-blank string member, or nullopt.
auto nonblank_string(const json& object, const char* key) -> std::optional<std::string> {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return std::nullopt;
    }
    auto text = it->get<std::string>();
    if (trim(text).empty()) {
        return std::nullopt;
    }
    return text;
}

// Absent and null members both read as "not provided".
auto optional_member(const json& object, const char* key) -> const json* {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

auto parse_join_keys(const json& entry) -> std::expected<std::vector<std::string>, PreviewError> {
    std::vector<std::string> keys;
    const json* raw = optional_member(entry, "joinKeys");
    if (raw == nullptr) {
        return keys;
    }
    if (!raw->is_array()) {
        return fail("joinKeys must be an array of strings.");
    }
    keys.reserve(raw->size());
    for (const auto& item : *raw) {
        std::string key;
        if (item.is_string()) {
            key = trim(item.get<std::string>());
        } else if (item.is_number()) {
            key = format_number(item.get<double>());
        } else {
            return fail("joinKeys must contain only strings or numbers.");
        }
        if (key.empty()) {
            return fail("joinKeys entries must be non-empty strings.");
        }
        keys.push_back(std::move(key));
    }
    return keys;
}

auto parse_sheets(const json& payload)
    -> std::expected<std::vector<query::SheetSelection>, PreviewError> {
    auto it = payload.find("sheets");
    if (it == payload.end() || !it->is_array() || it->empty()) {
        return fail("'sheets' must be a non-empty array.");
    }
    std::vector<query::SheetSelection> sheets;
    sheets.reserve(it->size());
    std::size_t index = 0;
    for (const auto& entry : *it) {
        ++index;
        if (!entry.is_object()) {
            return fail("Each sheet entry must be an object.");
        }
        auto sheet_id = nonblank_string(entry, "sheetId");
        if (!sheet_id) {
            return fail("sheetId is required for each sheet.");
        }

        auto alias = nonblank_string(entry, "alias");

        auto role = query::SheetRole::Primary;
        if (auto role_it = entry.find("role"); role_it != entry.end()) {
            if (!role_it->is_string()) {
                return fail("role must be a string when provided.");
            }
            auto text = role_it->get<std::string>();
            auto parsed = query::parse_sheet_role(text);
            if (!parsed) {
                return fail(fmt::format("Unsupported role '{}'.", text));
            }
            role = *parsed;
        }

        auto keys = parse_join_keys(entry);
        if (!keys) {
            return std::unexpected(std::move(keys.error()));
        }

        sheets.push_back(query::SheetSelection{
            .sheet_id = std::move(*sheet_id),
            .alias = alias ? trim(*alias) : fmt::format("sheet_{}", index),
            .role = role,
            .join_keys = std::move(*keys),
        });
    }
    return sheets;
}

auto parse_projections(const json& payload)
    -> std::expected<std::vector<query::Projection>, PreviewError> {
    auto it = payload.find("projections");
    if (it == payload.end() || !it->is_array() || it->empty()) {
        return fail("'projections' must be a non-empty array.");
    }
    std::vector<query::Projection> projections;
    projections.reserve(it->size());
    for (const auto& entry : *it) {
        if (!entry.is_object()) {
            return fail("Each projection must be an object.");
        }
        auto expression = nonblank_string(entry, "expression");
        if (!expression) {
            return fail("Projection expression must be a non-empty string.");
        }
        auto label = nonblank_string(entry, "label");
        if (!label) {
            return fail("Projection label must be a non-empty string.");
        }
        projections.push_back(
            query::Projection{.expression = std::move(*expression), .label = std::move(*label)});
    }
    return projections;
}

auto parse_filter_value(const json& entry) -> std::expected<Value, PreviewError> {
    const json* raw = optional_member(entry, "value");
    if (raw == nullptr) {
        return Value{};
    }
    if (raw->is_string()) {
        return Value{raw->get<std::string>()};
    }
    if (raw->is_number()) {
        return Value{raw->get<double>()};
    }
    // Booleans compare as 1 and 0.
    if (raw->is_boolean()) {
        return Value{raw->get<bool>() ? 1.0 : 0.0};
    }
    return fail("Filter value must be null, a string, a number or a boolean.");
}

auto parse_filters(const json& payload) -> std::expected<std::vector<query::Filter>, PreviewError> {
    std::vector<query::Filter> filters;
    const json* raw = optional_member(payload, "filters");
    if (raw == nullptr) {
        return filters;
    }
    if (!raw->is_array()) {
        return fail("'filters' must be an array when provided.");
    }
    filters.reserve(raw->size());
    for (const auto& entry : *raw) {
        if (!entry.is_object()) {
            return fail("Each filter must be an object.");
        }
        auto alias = nonblank_string(entry, "sheetAlias");
        if (!alias) {
            return fail("Filter sheetAlias must be a non-empty string.");
        }
        auto column = nonblank_string(entry, "column");
        if (!column) {
            return fail("Filter column must be a non-empty string.");
        }
        auto op = nonblank_string(entry, "operator");
        if (!op) {
            return fail("Filter operator must be a non-empty string.");
        }
        auto value = parse_filter_value(entry);
        if (!value) {
            return std::unexpected(std::move(value.error()));
        }
        filters.push_back(query::Filter{
            .alias = std::move(*alias),
            .column = std::move(*column),
            .op = std::move(*op),
            .value = std::move(*value),
        });
    }
    return filters;
}

auto parse_limit(const json& payload) -> std::expected<std::optional<std::int64_t>, PreviewError> {
    const json* raw = optional_member(payload, "limit");
    if (raw == nullptr) {
        return std::optional<std::int64_t>{};
    }
    if (!raw->is_number_integer()) {
        return fail("limit must be an integer when provided.");
    }
    if (raw->is_number_unsigned() &&
        raw->get<std::uint64_t>() > static_cast<std::uint64_t>(INT64_MAX)) {
        return fail("limit must be an integer when provided.");
    }
    auto limit = raw->get<std::int64_t>();
    if (limit <= 0) {
        return fail("limit must be greater than zero.");
    }
    return std::optional<std::int64_t>{limit};
}

}  // namespace

auto parse_request(const nlohmann::json& payload)
    -> std::expected<query::PreviewRequest, PreviewError> {
    if (!payload.is_object()) {
        return fail("request body must be a JSON object.");
    }

    query::PreviewRequest request;

    auto sheets = parse_sheets(payload);
    if (!sheets) {
        return std::unexpected(std::move(sheets.error()));
    }
    request.sheets = std::move(*sheets);

    auto projections = parse_projections(payload);
    if (!projections) {
        return std::unexpected(std::move(projections.error()));
    }
    request.projections = std::move(*projections);

    auto filters = parse_filters(payload);
    if (!filters) {
        return std::unexpected(std::move(filters.error()));
    }
    request.filters = std::move(*filters);

    auto limit = parse_limit(payload);
    if (!limit) {
        return std::unexpected(std::move(limit.error()));
    }
    request.limit = *limit;

    return request;
}

auto parse_request_text(std::string_view text)
    -> std::expected<query::PreviewRequest, PreviewError> {
    json payload = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (payload.is_discarded()) {
        return fail("request body is not valid JSON.");
    }
    return parse_request(payload);
}

auto serialize_result(const query::PreviewResult& result) -> nlohmann::json {
    return json{
        {"headers", result.headers},
        {"rows", result.rows},
        {"warnings", result.warnings},
        {"executionMetrics",
         {{"executionMs", result.execution_ms}, {"rowCount", result.row_count}}},
    };
}

auto serialize_error(const PreviewError& error) -> nlohmann::json {
    return json{{"error", to_string(error.kind)}, {"detail", error.message}};
}

}  // namespace sheetq::codec
