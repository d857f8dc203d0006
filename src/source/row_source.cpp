#include <sheetq/source/row_source.hpp>

#include <fmt/format.h>

namespace sheetq::source {

auto InMemoryRowSource::load(const std::string& sheet_id) const
    -> std::expected<Rows, std::string> {
    auto it = sheets_.find(sheet_id);
    if (it == sheets_.end()) {
        return std::unexpected(fmt::format("no rows registered for sheet '{}'", sheet_id));
    }
    return it->second;
}

}  // namespace sheetq::source
