#include <sheetq/sheetq.hpp>

#include <fmt/core.h>

using sheetq::Row;
using sheetq::Value;

namespace {

auto sales_row(std::string region, std::string category, double revenue) -> Row {
    return Row{{"region", Value{std::move(region)}},
               {"category", Value{std::move(category)}},
               {"revenue", Value{revenue}}};
}

auto budget_row(std::string region, std::string category, double budget) -> Row {
    return Row{{"region", Value{std::move(region)}},
               {"category", Value{std::move(category)}},
               {"budget", Value{budget}}};
}

}  // namespace

auto main() -> int {
    using namespace sheetq;

    source::InMemoryCatalog catalog;
    catalog.add(source::SheetInfo{
        .sheet_id = "sales",
        .schema = {{"region", "string"}, {"category", "string"}, {"revenue", "number"}},
        .display_label = "Sales FY24",
    });
    catalog.add(source::SheetInfo{
        .sheet_id = "budget",
        .schema = {{"region", "string"}, {"category", "string"}, {"budget", "number"}},
        .display_label = "Budget FY24",
    });

    source::InMemoryRowSource rows;
    rows.add("sales", {sales_row("north", "hardware", 125000),
                       sales_row("north", "software", 98500),
                       sales_row("south", "hardware", 89200)});
    rows.add("budget", {budget_row("north", "hardware", 130000),
                        budget_row("north", "software", 95000)});

    query::PreviewRequest request{
        .sheets = {{.sheet_id = "sales", .alias = "sales", .role = query::SheetRole::Primary},
                   {.sheet_id = "budget",
                    .alias = "budget",
                    .role = query::SheetRole::Join,
                    .join_keys = {"region", "category"}}},
        .projections = {{"sales.category", "category"},
                        {"sales.revenue", "revenue"},
                        {"budget.budget", "budget"}},
        .filters = {{.alias = "sales", .column = "region", .op = "eq", .value = Value{"north"}}},
    };

    query::QueryBuilderService service{catalog, rows};

    fmt::print("=== Detail rows ===\n");
    auto detail = service.preview(request);
    if (!detail) {
        fmt::print("{}\n", detail.error().format());
        return 1;
    }
    query::print(*detail);

    fmt::print("\n=== Totals ===\n");
    request.projections = {{"sum(sales.revenue)", "total_revenue"},
                           {"sum(budget.budget)", "total_budget"}};
    auto totals = service.preview(request);
    if (!totals) {
        fmt::print("{}\n", totals.error().format());
        return 1;
    }
    fmt::print("{}\n", codec::serialize_result(*totals).dump(2));

    return 0;
}
