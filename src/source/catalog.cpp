#include <sheetq/source/catalog.hpp>

#include <algorithm>
#include <cctype>

namespace sheetq::source {

auto to_string(SheetStatus status) -> std::string_view {
    switch (status) {
        case SheetStatus::Active:
            return "active";
        case SheetStatus::Inactive:
            return "inactive";
        case SheetStatus::Deprecated:
            return "deprecated";
    }
    return "unknown";
}

auto parse_sheet_status(std::string_view text) -> std::optional<SheetStatus> {
    std::string lowered(text);
    std::ranges::transform(lowered, lowered.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (lowered == "active") {
        return SheetStatus::Active;
    }
    if (lowered == "inactive") {
        return SheetStatus::Inactive;
    }
    if (lowered == "deprecated") {
        return SheetStatus::Deprecated;
    }
    return std::nullopt;
}

auto InMemoryCatalog::resolve(const std::string& sheet_id) const -> std::optional<SheetInfo> {
    if (auto it = sheets_.find(sheet_id); it != sheets_.end()) {
        return it->second;
    }
    return std::nullopt;
}

}  // namespace sheetq::source
