#pragma once

#include <sheetq/core/value.hpp>

#include <expected>
#include <string>
#include <unordered_map>
#include <utility>

namespace sheetq::source {

/// Loads the materialized rows of one sheet.
///
/// An error result is a "source unavailable" condition (missing or unreadable
/// backing data); the message is surfaced to the caller unchanged.
/// Implementations must be safe for concurrent `load` calls.
class RowSource {
   public:
    virtual ~RowSource() = default;

    [[nodiscard]] virtual auto load(const std::string& sheet_id) const
        -> std::expected<Rows, std::string> = 0;
};

/// Row source holding pre-built rows per sheet id.
class InMemoryRowSource final : public RowSource {
   public:
    InMemoryRowSource() = default;

    void add(std::string sheet_id, Rows rows) {
        sheets_.insert_or_assign(std::move(sheet_id), std::move(rows));
    }

    [[nodiscard]] auto load(const std::string& sheet_id) const
        -> std::expected<Rows, std::string> override;

   private:
    std::unordered_map<std::string, Rows> sheets_;
};

}  // namespace sheetq::source
