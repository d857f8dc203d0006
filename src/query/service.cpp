#include <sheetq/query/service.hpp>

#include <sheetq/query/filter.hpp>
#include <sheetq/query/join.hpp>
#include <sheetq/query/projection.hpp>
#include <sheetq/query/schema_check.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace sheetq::query {

namespace {

auto primary_index(const std::vector<SheetSelection>& sheets) -> std::size_t {
    auto it = std::ranges::find_if(
        sheets, [](const SheetSelection& sheet) { return sheet.role == SheetRole::Primary; });
    return it == sheets.end() ? 0 : static_cast<std::size_t>(it - sheets.begin());
}

auto build_slots(const std::vector<SheetSelection>& sheets)
    -> std::expected<AliasSlots, PreviewError> {
    AliasSlots slots;
    slots.reserve(sheets.size());
    for (std::size_t i = 0; i < sheets.size(); ++i) {
        if (!slots.emplace(sheets[i].alias, i).second) {
            return std::unexpected(
                validation_error(fmt::format("duplicate alias {}", sheets[i].alias)));
        }
    }
    return slots;
}

void apply_limit(std::vector<std::vector<std::string>>& rows, std::int64_t limit) {
    if (limit <= 0) {
        rows.clear();
        return;
    }
    if (static_cast<std::uint64_t>(limit) < rows.size()) {
        rows.resize(static_cast<std::size_t>(limit));
    }
}

}  // namespace

auto QueryBuilderService::preview(const PreviewRequest& request) const
    -> std::expected<PreviewResult, PreviewError> {
    const auto started = std::chrono::steady_clock::now();

    if (request.sheets.empty()) {
        return std::unexpected(validation_error("no sheets"));
    }
    if (request.projections.empty()) {
        return std::unexpected(validation_error("no projections"));
    }

    auto slots = build_slots(request.sheets);
    if (!slots) {
        return std::unexpected(std::move(slots.error()));
    }

    PreviewResult result;

    std::vector<source::SheetInfo> infos;
    infos.reserve(request.sheets.size());
    for (const auto& sheet : request.sheets) {
        auto info = catalog_.resolve(sheet.sheet_id);
        if (!info) {
            return std::unexpected(
                validation_error(fmt::format("sheet not found: '{}'", sheet.sheet_id)));
        }
        if (info->status != source::SheetStatus::Active) {
            auto warning = fmt::format("Sheet '{}' ({}) is {}", sheet.alias, info->display_label,
                                       source::to_string(info->status));
            spdlog::warn("{}", warning);
            result.warnings.push_back(std::move(warning));
        }
        infos.push_back(std::move(*info));
    }

    const std::size_t primary = primary_index(request.sheets);
    const auto& primary_sheet = request.sheets[primary];

    for (std::size_t i = 0; i < request.sheets.size(); ++i) {
        if (i == primary) {
            continue;
        }
        const auto& sheet = request.sheets[i];
        if (sheet.role == SheetRole::Union) {
            return std::unexpected(validation_error("union not supported"));
        }
        auto warnings = validate_join_keys(infos[primary].schema, infos[i].schema, sheet.join_keys,
                                           primary_sheet.alias, sheet.alias);
        if (!warnings) {
            return std::unexpected(std::move(warnings.error()));
        }
        for (auto& warning : *warnings) {
            spdlog::warn("{}", warning);
            result.warnings.push_back(std::move(warning));
        }
    }

    auto plan = plan_projections(request.projections, primary_sheet.alias);
    if (!plan) {
        return std::unexpected(std::move(plan.error()));
    }
    auto filters = bind_filters(request.filters, *slots);
    if (!filters) {
        return std::unexpected(std::move(filters.error()));
    }

    // Combined rows point into this storage; it lives until the call returns.
    std::vector<Rows> storage(request.sheets.size());

    auto loaded = rows_.load(primary_sheet.sheet_id);
    if (!loaded) {
        return std::unexpected(source_unavailable(std::move(loaded.error())));
    }
    storage[primary] = std::move(*loaded);
    spdlog::debug("loaded primary '{}' ({}): {} rows", primary_sheet.alias, primary_sheet.sheet_id,
                  storage[primary].size());

    auto combined = seed_rows(storage[primary], primary, request.sheets.size());

    for (std::size_t i = 0; i < request.sheets.size(); ++i) {
        if (i == primary) {
            continue;
        }
        const auto& sheet = request.sheets[i];
        if (combined.empty()) {
            spdlog::debug("skipping load of '{}': no rows left to join", sheet.alias);
            continue;
        }
        auto join_loaded = rows_.load(sheet.sheet_id);
        if (!join_loaded) {
            return std::unexpected(source_unavailable(std::move(join_loaded.error())));
        }
        storage[i] = std::move(*join_loaded);
        spdlog::debug("loaded {} '{}' ({}): {} rows", to_string(sheet.role), sheet.alias,
                      sheet.sheet_id, storage[i].size());
        combined = join_rows(combined, primary, i, storage[i], sheet.join_keys);
    }

    combined = apply_filters(std::move(combined), *filters);

    auto rows = project_rows(combined, *plan, *slots);
    if (!rows) {
        return std::unexpected(std::move(rows.error()));
    }
    if (!plan->aggregate && request.limit) {
        apply_limit(*rows, *request.limit);
    }

    result.headers.reserve(request.projections.size());
    for (const auto& projection : request.projections) {
        result.headers.push_back(projection.label);
    }
    result.rows = std::move(*rows);
    result.row_count = result.rows.size();

    const auto elapsed = std::chrono::steady_clock::now() - started;
    result.execution_ms = std::chrono::duration<double, std::milli>(elapsed).count();
    spdlog::debug("preview: {} rows, {} warnings in {:.3f} ms", result.row_count,
                  result.warnings.size(), result.execution_ms);
    return result;
}

}  // namespace sheetq::query
