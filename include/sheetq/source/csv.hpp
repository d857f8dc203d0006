#pragma once

#include <sheetq/core/value.hpp>
#include <sheetq/source/row_source.hpp>

#include <expected>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace sheetq::source {

/// Cell decoding options shared by every sheet of a CsvRowSource.
struct CsvOptions {
    /// Turn numeric-looking cells into numbers. Off by default: a CSV
    /// dictionary reader yields text, and numeric coercion happens downstream.
    bool infer_numbers = false;
    /// Treat empty cells as Null.
    bool null_if_empty = false;
    /// Cell contents that decode as Null (e.g. "NA").
    std::unordered_set<std::string> null_tokens;
};

/// Apply a comma-separated null spec to `options`.
/// `<empty>` marks empty cells as Null; any other token is matched verbatim.
/// Example: "<empty>,NA".
void apply_null_spec(CsvOptions& options, std::string_view spec);

/// Location of one sheet's backing file.
struct CsvSheet {
    std::string path;
    char delimiter = ',';
};

/// Read a header-first CSV file (RFC 4180 quoting) into rows.
/// Fields missing from a short row decode as Null.
[[nodiscard]] auto read_csv_rows(const std::string& path, char delimiter,
                                 const CsvOptions& options) -> std::expected<Rows, std::string>;

/// Row source reading each sheet from its own CSV file.
class CsvRowSource final : public RowSource {
   public:
    CsvRowSource() = default;
    explicit CsvRowSource(CsvOptions options) : options_(std::move(options)) {}

    void add_sheet(std::string sheet_id, CsvSheet sheet) {
        sheets_.insert_or_assign(std::move(sheet_id), std::move(sheet));
    }

    [[nodiscard]] auto load(const std::string& sheet_id) const
        -> std::expected<Rows, std::string> override;

    [[nodiscard]] auto options() const noexcept -> const CsvOptions& { return options_; }
    void set_options(CsvOptions options) { options_ = std::move(options); }

    [[nodiscard]] auto find_sheet(const std::string& sheet_id) const -> const CsvSheet* {
        if (auto it = sheets_.find(sheet_id); it != sheets_.end()) {
            return &it->second;
        }
        return nullptr;
    }

   private:
    CsvOptions options_;
    std::unordered_map<std::string, CsvSheet> sheets_;
};

}  // namespace sheetq::source
