#include <sheetq/source/csv.hpp>

#include <fmt/format.h>
#include <rapidcsv.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <exception>
#include <filesystem>
#include <optional>
#include <utility>
#include <vector>

namespace sheetq::source {

namespace {

auto csv_trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

// Stricter than parse_number: no surrounding whitespace and no nan/inf
// spellings, so cells like " 12" or "nan" stay text.
auto infer_number(const std::string& cell) -> std::optional<double> {
    if (cell.empty()) {
        return std::nullopt;
    }
    unsigned char first = static_cast<unsigned char>(cell.front());
    if (std::isdigit(first) == 0 && first != '-' && first != '+' && first != '.') {
        return std::nullopt;
    }
    unsigned char last = static_cast<unsigned char>(cell.back());
    if (std::isdigit(last) == 0 && last != '.') {
        return std::nullopt;
    }
    return parse_number(cell);
}

auto decode_cell(std::string cell, const CsvOptions& options) -> Value {
    if (options.null_if_empty && cell.empty()) {
        return Value{};
    }
    if (options.null_tokens.contains(cell)) {
        return Value{};
    }
    if (options.infer_numbers) {
        if (auto number = infer_number(cell)) {
            return Value{*number};
        }
    }
    return Value{std::move(cell)};
}

}  // namespace

void apply_null_spec(CsvOptions& options, std::string_view spec) {
    std::size_t pos = 0;
    while (pos <= spec.size()) {
        std::size_t comma = spec.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = spec.size();
        }
        auto token = csv_trim(spec.substr(pos, comma - pos));
        if (!token.empty()) {
            if (token == "<empty>") {
                options.null_if_empty = true;
            } else {
                options.null_tokens.emplace(token);
            }
        }
        if (comma == spec.size()) {
            break;
        }
        pos = comma + 1;
    }
}

auto read_csv_rows(const std::string& path, char delimiter, const CsvOptions& options)
    -> std::expected<Rows, std::string> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::unexpected(fmt::format("sheet data file missing on disk: {}", path));
    }

    try {
        rapidcsv::Document doc(path,
                               rapidcsv::LabelParams(0, -1),  // row 0 = header, no row labels
                               rapidcsv::SeparatorParams(delimiter),
                               rapidcsv::ConverterParams(),
                               rapidcsv::LineReaderParams(false, '#', true));  // skip blank lines

        const auto names = doc.GetColumnNames();
        const std::size_t row_count = doc.GetRowCount();

        Rows rows;
        rows.reserve(row_count);
        for (std::size_t r = 0; r < row_count; ++r) {
            auto cells = doc.GetRow<std::string>(r);
            Row row;
            row.reserve(names.size());
            for (std::size_t c = 0; c < names.size(); ++c) {
                if (names[c].empty()) {
                    continue;
                }
                if (c >= cells.size()) {
                    row.insert_or_assign(names[c], Value{});
                    continue;
                }
                row.insert_or_assign(names[c], decode_cell(std::move(cells[c]), options));
            }
            rows.push_back(std::move(row));
        }
        spdlog::debug("csv: read {} rows x {} columns from {}", rows.size(), names.size(), path);
        return rows;
    } catch (const std::exception& e) {
        return std::unexpected(fmt::format("failed to read csv '{}': {}", path, e.what()));
    }
}

auto CsvRowSource::load(const std::string& sheet_id) const -> std::expected<Rows, std::string> {
    const auto* sheet = find_sheet(sheet_id);
    if (sheet == nullptr) {
        return std::unexpected(fmt::format("backing data file for sheet '{}' not found", sheet_id));
    }
    return read_csv_rows(sheet->path, sheet->delimiter, options_);
}

}  // namespace sheetq::source
