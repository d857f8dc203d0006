#pragma once

#include <sheetq/core/value.hpp>
#include <sheetq/query/combined_row.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace sheetq::query {

/// Wrap each primary row as a combined row with `slot_count` slots, only
/// `primary_slot` filled.
[[nodiscard]] auto seed_rows(const Rows& primary_rows, std::size_t primary_slot,
                             std::size_t slot_count) -> std::vector<CombinedRow>;

/// Inner equi-join of the combined rows against one more sheet.
///
/// The key tuple is always read from the primary slot's row, never from a
/// previously joined alias. Combined rows without a match are dropped; rows
/// with several matches fan out, one output row per match in `join_sheet`
/// order. A key column absent from a row contributes Null to the tuple.
///
/// `join_sheet` must outlive the returned rows (they point into it).
[[nodiscard]] auto join_rows(const std::vector<CombinedRow>& combined, std::size_t primary_slot,
                             std::size_t join_slot, const Rows& join_sheet,
                             const std::vector<std::string>& join_keys)
    -> std::vector<CombinedRow>;

}  // namespace sheetq::query
