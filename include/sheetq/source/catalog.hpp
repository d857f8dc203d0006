#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sheetq::source {

/// Lifecycle status of a sheet source.
enum class SheetStatus : std::uint8_t {
    Active,
    Inactive,
    Deprecated,
};

[[nodiscard]] auto to_string(SheetStatus status) -> std::string_view;
[[nodiscard]] auto parse_sheet_status(std::string_view text) -> std::optional<SheetStatus>;

/// One declared column of a sheet. `inferred_type` is empty when unknown.
struct ColumnSchema {
    std::string name;
    std::string inferred_type;
};

/// Catalog entry for a sheet source.
struct SheetInfo {
    std::string sheet_id;
    std::vector<ColumnSchema> schema;
    SheetStatus status = SheetStatus::Active;
    std::string display_label;
};

/// Read-only lookup from sheet identifier to sheet metadata.
///
/// Implementations must be safe for concurrent `resolve` calls.
class SheetCatalog {
   public:
    virtual ~SheetCatalog() = default;

    [[nodiscard]] virtual auto resolve(const std::string& sheet_id) const
        -> std::optional<SheetInfo> = 0;
};

/// Catalog backed by a hash map, filled before use.
class InMemoryCatalog final : public SheetCatalog {
   public:
    InMemoryCatalog() = default;

    /// Register (or replace) a sheet.
    void add(SheetInfo info) {
        auto id = info.sheet_id;
        sheets_.insert_or_assign(std::move(id), std::move(info));
    }

    [[nodiscard]] auto resolve(const std::string& sheet_id) const
        -> std::optional<SheetInfo> override;

    [[nodiscard]] auto contains(const std::string& sheet_id) const -> bool {
        return sheets_.contains(sheet_id);
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return sheets_.size(); }

   private:
    std::unordered_map<std::string, SheetInfo> sheets_;
};

}  // namespace sheetq::source
