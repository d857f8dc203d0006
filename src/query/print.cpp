#include <sheetq/query/print.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

namespace sheetq::query {

void print(const PreviewResult& result, std::ostream& out) {
    if (result.headers.empty()) {
        out << "(empty preview)\n";
        return;
    }

    std::vector<std::size_t> widths(result.headers.size());
    for (std::size_t c = 0; c < result.headers.size(); ++c) {
        widths[c] = result.headers[c].size();
        for (const auto& row : result.rows) {
            if (c < row.size()) {
                widths[c] = std::max(widths[c], row[c].size());
            }
        }
    }

    auto emit = [&](auto&& cell_at) {
        for (std::size_t c = 0; c < widths.size(); ++c) {
            if (c > 0)
                out << "  ";
            out << fmt::format("{:<{}}", cell_at(c), widths[c]);
        }
        out << "\n";
    };

    emit([&](std::size_t c) -> const std::string& { return result.headers[c]; });
    emit([&](std::size_t c) { return std::string(widths[c], '-'); });
    for (const auto& row : result.rows) {
        emit([&](std::size_t c) { return c < row.size() ? row[c] : std::string{}; });
    }

    out << fmt::format("({} row{})\n", result.row_count, result.row_count == 1 ? "" : "s");
    for (const auto& warning : result.warnings) {
        out << "warning: " << warning << "\n";
    }
}

}  // namespace sheetq::query
