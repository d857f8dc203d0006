#include <sheetq/query/request.hpp>

namespace sheetq::query {

auto to_string(SheetRole role) -> std::string_view {
    switch (role) {
        case SheetRole::Primary:
            return "primary";
        case SheetRole::Join:
            return "join";
        case SheetRole::Union:
            return "union";
    }
    return "unknown";
}

auto parse_sheet_role(std::string_view text) -> std::optional<SheetRole> {
    if (text == "primary") {
        return SheetRole::Primary;
    }
    if (text == "join") {
        return SheetRole::Join;
    }
    if (text == "union") {
        return SheetRole::Union;
    }
    return std::nullopt;
}

}  // namespace sheetq::query
