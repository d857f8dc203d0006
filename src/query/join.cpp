#include <sheetq/query/join.hpp>

#include <robin_hood.h>
#include <spdlog/spdlog.h>

#include <functional>
#include <type_traits>
#include <utility>
#include <variant>

namespace sheetq::query {

namespace {

struct Key {
    std::vector<Value> values;
};

struct KeyHash {
    auto operator()(const Key& key) const -> std::size_t {
        std::size_t seed = 0;
        auto hash_combine = [&](std::size_t value) {
            seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        };
        for (const auto& value : key.values) {
            hash_combine(value.index());
            hash_combine(std::visit(
                [](const auto& v) { return std::hash<std::decay_t<decltype(v)>>{}(v); }, value));
        }
        return seed;
    }
};

struct KeyEq {
    auto operator()(const Key& a, const Key& b) const -> bool { return a.values == b.values; }
};

using JoinIndex = robin_hood::unordered_flat_map<Key, std::vector<std::size_t>, KeyHash, KeyEq>;

auto make_key(const Row& row, const std::vector<std::string>& join_keys) -> Key {
    Key key;
    key.values.reserve(join_keys.size());
    for (const auto& column : join_keys) {
        const auto* value = lookup(row, column);
        key.values.push_back(value != nullptr ? *value : Value{});
    }
    return key;
}

auto build_index(const Rows& rows, const std::vector<std::string>& join_keys) -> JoinIndex {
    JoinIndex index;
    index.reserve(rows.size());
    for (std::size_t r = 0; r < rows.size(); ++r) {
        index[make_key(rows[r], join_keys)].push_back(r);
    }
    return index;
}

}  // namespace

auto seed_rows(const Rows& primary_rows, std::size_t primary_slot, std::size_t slot_count)
    -> std::vector<CombinedRow> {
    std::vector<CombinedRow> combined;
    combined.reserve(primary_rows.size());
    for (const auto& row : primary_rows) {
        CombinedRow seeded(slot_count, nullptr);
        seeded[primary_slot] = &row;
        combined.push_back(std::move(seeded));
    }
    return combined;
}

auto join_rows(const std::vector<CombinedRow>& combined, std::size_t primary_slot,
               std::size_t join_slot, const Rows& join_sheet,
               const std::vector<std::string>& join_keys) -> std::vector<CombinedRow> {
    if (combined.empty()) {
        return {};
    }

    const auto index = build_index(join_sheet, join_keys);

    std::vector<CombinedRow> result;
    result.reserve(combined.size());
    std::size_t dropped = 0;
    for (const auto& merged : combined) {
        const Row* primary = merged[primary_slot];
        if (primary == nullptr) {
            ++dropped;
            continue;
        }
        auto it = index.find(make_key(*primary, join_keys));
        if (it == index.end()) {
            ++dropped;
            continue;
        }
        for (auto r : it->second) {
            CombinedRow out = merged;
            out[join_slot] = &join_sheet[r];
            result.push_back(std::move(out));
        }
    }

    spdlog::debug("join: {} rows in, {} distinct keys, {} dropped, {} rows out", combined.size(),
                  index.size(), dropped, result.size());
    return result;
}

}  // namespace sheetq::query
