#pragma once

#include <sheetq/core/error.hpp>
#include <sheetq/query/request.hpp>
#include <sheetq/source/catalog.hpp>
#include <sheetq/source/row_source.hpp>

#include <expected>

namespace sheetq::query {

/// Cross-sheet preview engine.
///
/// Validates a request, loads the primary sheet and joins every other
/// selection off the primary row's key columns, filters, then projects either
/// detail rows or a single aggregate row. Holds no per-call state; `preview`
/// may be called concurrently as long as the catalog and row source allow
/// concurrent reads. Both collaborators must outlive the service.
class QueryBuilderService {
   public:
    QueryBuilderService(const source::SheetCatalog& catalog, const source::RowSource& rows)
        : catalog_(catalog), rows_(rows) {}

    [[nodiscard]] auto preview(const PreviewRequest& request) const
        -> std::expected<PreviewResult, PreviewError>;

   private:
    const source::SheetCatalog& catalog_;
    const source::RowSource& rows_;
};

}  // namespace sheetq::query
