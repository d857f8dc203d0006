#pragma once

#include <sheetq/core/value.hpp>

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace sheetq::query {

/// One row of the in-progress join result.
///
/// Slot i points at the row contributed by the request's i-th sheet
/// selection, or is null while that alias has not been joined. Pointers refer
/// into sheet storage owned by the running preview call.
using CombinedRow = std::vector<const Row*>;

/// Alias -> slot (position of the selection in the request).
using AliasSlots = std::unordered_map<std::string, std::size_t>;

}  // namespace sheetq::query
