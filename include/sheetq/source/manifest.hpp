#pragma once

#include <sheetq/source/catalog.hpp>
#include <sheetq/source/csv.hpp>

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

namespace sheetq::source {

/// A catalog plus the CSV files backing it, as described by a manifest file.
///
/// Manifest layout:
///   {"sheets": [{"id": "...", "label": "...", "status": "active",
///                "path": "sales.csv", "delimiter": ",",
///                "columns": [{"name": "region", "inferredType": "string"}]}]}
///
/// Relative paths are resolved against `base_dir`.
struct Manifest {
    InMemoryCatalog catalog;
    CsvRowSource rows;
};

[[nodiscard]] auto parse_manifest(std::string_view text, const std::filesystem::path& base_dir,
                                  CsvOptions options = {}) -> std::expected<Manifest, std::string>;

/// Read and parse a manifest file; paths resolve relative to its directory.
[[nodiscard]] auto load_manifest(const std::filesystem::path& path, CsvOptions options = {})
    -> std::expected<Manifest, std::string>;

}  // namespace sheetq::source
