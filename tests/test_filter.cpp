#include <sheetq/query/filter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace sheetq;
using namespace sheetq::query;

namespace {

auto text(std::string s) -> Value {
    return Value{std::move(s)};
}

auto number(double v) -> Value {
    return Value{v};
}

}  // namespace

TEST_CASE("filter: operator names are case-insensitive", "[query][filter]") {
    CHECK(parse_filter_op("eq") == FilterOp::Eq);
    CHECK(parse_filter_op("NE") == FilterOp::Ne);
    CHECK(parse_filter_op("Contains") == FilterOp::Contains);
    CHECK(parse_filter_op("gT") == FilterOp::Gt);
    CHECK(parse_filter_op("lt") == FilterOp::Lt);
    CHECK_FALSE(parse_filter_op("ge").has_value());
    CHECK_FALSE(parse_filter_op("").has_value());
}

TEST_CASE("filter: eq and ne compare raw values", "[query][filter]") {
    auto north = text("north");
    CHECK(matches(FilterOp::Eq, &north, text("north")));
    CHECK_FALSE(matches(FilterOp::Eq, &north, text("North")));
    CHECK(matches(FilterOp::Ne, &north, text("south")));

    auto amount = number(125000.0);
    CHECK_FALSE(matches(FilterOp::Eq, &amount, text("125000")));
    CHECK(matches(FilterOp::Ne, &amount, text("125000")));
    CHECK(matches(FilterOp::Eq, &amount, number(125000.0)));
}

TEST_CASE("filter: missing cells read as null", "[query][filter]") {
    CHECK(matches(FilterOp::Eq, nullptr, Value{}));
    CHECK_FALSE(matches(FilterOp::Eq, nullptr, text("")));
    CHECK(matches(FilterOp::Ne, nullptr, text("x")));
    CHECK_FALSE(matches(FilterOp::Gt, nullptr, number(0.0)));
}

TEST_CASE("filter: contains is a case-insensitive text test", "[query][filter]") {
    auto category = text("Hardware Tools");
    CHECK(matches(FilterOp::Contains, &category, text("WARE")));
    CHECK(matches(FilterOp::Contains, &category, text("")));
    CHECK_FALSE(matches(FilterOp::Contains, &category, text("software")));

    auto amount = number(125.0);
    CHECK_FALSE(matches(FilterOp::Contains, &amount, text("12")));
    CHECK_FALSE(matches(FilterOp::Contains, &category, number(1.0)));
    CHECK_FALSE(matches(FilterOp::Contains, nullptr, text("a")));
}

TEST_CASE("filter: gt and lt coerce both sides", "[query][filter]") {
    auto revenue = text(" 98500.5 ");
    CHECK(matches(FilterOp::Gt, &revenue, number(90000.0)));
    CHECK(matches(FilterOp::Lt, &revenue, text("1e5")));
    CHECK_FALSE(matches(FilterOp::Gt, &revenue, text("98500.5")));

    auto word = text("north");
    CHECK_FALSE(matches(FilterOp::Gt, &word, number(0.0)));
    CHECK_FALSE(matches(FilterOp::Lt, &word, number(0.0)));

    auto amount = number(10.0);
    CHECK_FALSE(matches(FilterOp::Gt, &amount, text("ten")));
    CHECK_FALSE(matches(FilterOp::Lt, &amount, Value{}));
}

TEST_CASE("filter: binding resolves aliases to slots", "[query][filter]") {
    AliasSlots slots{{"sales", 0}, {"budget", 1}};
    std::vector<Filter> filters = {
        {.alias = "budget", .column = "budget", .op = "GT", .value = number(1.0)},
    };
    auto bound = bind_filters(filters, slots);
    REQUIRE(bound.has_value());
    REQUIRE(bound->size() == 1);
    CHECK(bound->front().slot == 1);
    CHECK(bound->front().op == FilterOp::Gt);
    CHECK(bound->front().column == "budget");
}

TEST_CASE("filter: unknown alias is checked before the operator", "[query][filter]") {
    AliasSlots slots{{"sales", 0}};
    std::vector<Filter> filters = {
        {.alias = "ghost", .column = "region", .op = "like", .value = text("n")},
    };
    auto bound = bind_filters(filters, slots);
    REQUIRE_FALSE(bound.has_value());
    CHECK(bound.error().kind == ErrorKind::Validation);
    CHECK(bound.error().message == "filter references unknown alias 'ghost'");
}

TEST_CASE("filter: unsupported operator", "[query][filter]") {
    AliasSlots slots{{"sales", 0}};
    std::vector<Filter> filters = {
        {.alias = "sales", .column = "region", .op = "like", .value = text("n")},
    };
    auto bound = bind_filters(filters, slots);
    REQUIRE_FALSE(bound.has_value());
    CHECK(bound.error().message == "unsupported filter operator 'like'");
}

TEST_CASE("filter: filters combine with AND and keep order", "[query][filter]") {
    Rows sales = {
        {{"region", text("north")}, {"revenue", number(125000.0)}},
        {{"region", text("north")}, {"revenue", number(98500.0)}},
        {{"region", text("south")}, {"revenue", number(89200.0)}},
        {{"region", text("north")}, {"revenue", number(150000.0)}},
    };
    std::vector<CombinedRow> rows;
    for (const auto& row : sales) {
        rows.push_back(CombinedRow{&row});
    }

    std::vector<BoundFilter> filters = {
        {.slot = 0, .column = "region", .op = FilterOp::Eq, .value = text("north")},
        {.slot = 0, .column = "revenue", .op = FilterOp::Gt, .value = number(100000.0)},
    };
    auto kept = apply_filters(rows, filters);
    REQUIRE(kept.size() == 2);
    CHECK(kept[0][0] == &sales[0]);
    CHECK(kept[1][0] == &sales[3]);
}

TEST_CASE("filter: rows missing the filtered alias are excluded", "[query][filter]") {
    Row only = {{"region", text("north")}};
    std::vector<CombinedRow> rows = {CombinedRow{&only, nullptr}};
    std::vector<BoundFilter> filters = {
        {.slot = 1, .column = "region", .op = FilterOp::Ne, .value = text("south")},
    };
    CHECK(apply_filters(rows, filters).empty());
}
