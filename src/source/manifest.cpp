#include <sheetq/source/manifest.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iterator>
#include <utility>

namespace sheetq::source {

namespace {

using json = nlohmann::json;

auto string_field(const json& object, const char* key) -> std::string {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

auto parse_columns(const json& entry, const std::string& sheet_id)
    -> std::expected<std::vector<ColumnSchema>, std::string> {
    auto it = entry.find("columns");
    if (it == entry.end() || !it->is_array()) {
        return std::unexpected(fmt::format("sheet '{}': 'columns' must be an array", sheet_id));
    }
    std::vector<ColumnSchema> schema;
    schema.reserve(it->size());
    for (const auto& column : *it) {
        if (!column.is_object()) {
            return std::unexpected(
                fmt::format("sheet '{}': each column must be an object", sheet_id));
        }
        auto name = string_field(column, "name");
        if (name.empty()) {
            return std::unexpected(fmt::format("sheet '{}': column name is required", sheet_id));
        }
        schema.push_back(ColumnSchema{.name = std::move(name),
                                      .inferred_type = string_field(column, "inferredType")});
    }
    return schema;
}

}  // namespace

auto parse_manifest(std::string_view text, const std::filesystem::path& base_dir,
                    CsvOptions options) -> std::expected<Manifest, std::string> {
    json doc = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded()) {
        return std::unexpected("manifest is not valid JSON");
    }
    auto sheets = doc.find("sheets");
    if (!doc.is_object() || sheets == doc.end() || !sheets->is_array()) {
        return std::unexpected("manifest requires a 'sheets' array");
    }

    Manifest manifest;
    manifest.rows.set_options(std::move(options));
    for (const auto& entry : *sheets) {
        if (!entry.is_object()) {
            return std::unexpected("each manifest sheet must be an object");
        }
        auto id = string_field(entry, "id");
        if (id.empty()) {
            return std::unexpected("manifest sheet 'id' must be a non-empty string");
        }
        if (manifest.catalog.contains(id)) {
            return std::unexpected(fmt::format("duplicate sheet id '{}' in manifest", id));
        }

        auto status = SheetStatus::Active;
        if (auto raw = string_field(entry, "status"); !raw.empty()) {
            auto parsed = parse_sheet_status(raw);
            if (!parsed) {
                return std::unexpected(fmt::format("sheet '{}': unknown status '{}'", id, raw));
            }
            status = *parsed;
        }

        auto path = string_field(entry, "path");
        if (path.empty()) {
            return std::unexpected(fmt::format("sheet '{}': 'path' is required", id));
        }
        std::filesystem::path resolved{path};
        if (resolved.is_relative()) {
            resolved = base_dir / resolved;
        }

        char delimiter = ',';
        if (auto raw = string_field(entry, "delimiter"); !raw.empty()) {
            if (raw.size() != 1) {
                return std::unexpected(
                    fmt::format("sheet '{}': delimiter must be a single character", id));
            }
            delimiter = raw.front();
        }

        auto schema = parse_columns(entry, id);
        if (!schema) {
            return std::unexpected(schema.error());
        }

        auto label = string_field(entry, "label");
        if (label.empty()) {
            label = id;
        }

        manifest.rows.add_sheet(id, CsvSheet{.path = resolved.string(), .delimiter = delimiter});
        manifest.catalog.add(SheetInfo{.sheet_id = id,
                                       .schema = std::move(*schema),
                                       .status = status,
                                       .display_label = std::move(label)});
    }
    spdlog::debug("manifest: {} sheets registered", manifest.catalog.size());
    return manifest;
}

auto load_manifest(const std::filesystem::path& path, CsvOptions options)
    -> std::expected<Manifest, std::string> {
    std::ifstream input{path};
    if (!input) {
        return std::unexpected(fmt::format("failed to open manifest: {}", path.string()));
    }
    std::string text(std::istreambuf_iterator<char>{input}, {});
    auto manifest = parse_manifest(text, path.parent_path(), std::move(options));
    if (!manifest) {
        return std::unexpected(fmt::format("{}: {}", path.string(), manifest.error()));
    }
    return manifest;
}

}  // namespace sheetq::source
