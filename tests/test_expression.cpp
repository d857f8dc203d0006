#include <sheetq/query/expression.hpp>

#include <catch2/catch_test_macros.hpp>

#include <variant>

using namespace sheetq;
using namespace sheetq::query;

namespace {

auto parse_ok(std::string_view text) -> Expression {
    auto expr = parse_expression(text, "sales");
    REQUIRE(expr.has_value());
    return *expr;
}

auto parse_error(std::string_view text) -> PreviewError {
    auto expr = parse_expression(text, "sales");
    REQUIRE_FALSE(expr.has_value());
    return expr.error();
}

}  // namespace

TEST_CASE("expression: alias.column is a scalar reference", "[query][expression]") {
    auto expr = parse_ok("budget.amount");
    const auto* ref = std::get_if<ScalarRef>(&expr.node);
    REQUIRE(ref != nullptr);
    CHECK(ref->alias == "budget");
    CHECK(ref->column == "amount");
    CHECK_FALSE(is_aggregate(expr));
}

TEST_CASE("expression: bare column resolves to the primary alias", "[query][expression]") {
    auto expr = parse_ok("revenue");
    const auto* ref = std::get_if<ScalarRef>(&expr.node);
    REQUIRE(ref != nullptr);
    CHECK(ref->alias == "sales");
    CHECK(ref->column == "revenue");
}

TEST_CASE("expression: only the first dot separates alias and column", "[query][expression]") {
    auto expr = parse_ok("sales.unit.price");
    const auto& ref = std::get<ScalarRef>(expr.node);
    CHECK(ref.alias == "sales");
    CHECK(ref.column == "unit.price");
}

TEST_CASE("expression: aggregate functions", "[query][expression]") {
    auto sum = parse_ok("sum(sales.revenue)");
    const auto* ref = std::get_if<AggregateRef>(&sum.node);
    REQUIRE(ref != nullptr);
    CHECK(ref->func == AggFunc::Sum);
    CHECK(ref->alias == "sales");
    CHECK(ref->column == "revenue");
    CHECK(is_aggregate(sum));

    auto avg = parse_ok("  AVG ( budget.budget ) ");
    const auto& avg_ref = std::get<AggregateRef>(avg.node);
    CHECK(avg_ref.func == AggFunc::Avg);
    CHECK(avg_ref.alias == "budget");
    CHECK(avg_ref.column == "budget");

    auto count = parse_ok("Count(region)");
    const auto& count_ref = std::get<AggregateRef>(count.node);
    CHECK(count_ref.func == AggFunc::Count);
    CHECK(count_ref.alias == "sales");
    CHECK(count_ref.column == "region");
}

TEST_CASE("expression: bare aggregate column resolves to the primary alias",
          "[query][expression]") {
    auto expr = parse_ok("sum(revenue)");
    const auto* ref = std::get_if<AggregateRef>(&expr.node);
    REQUIRE(ref != nullptr);
    CHECK(ref->func == AggFunc::Sum);
    CHECK(ref->alias == "sales");
    CHECK(ref->column == "revenue");
    CHECK(is_aggregate(expr));

    auto other = parse_expression("avg( budget )", "plan");
    REQUIRE(other.has_value());
    CHECK(std::get<AggregateRef>(other->node).alias == "plan");
}

TEST_CASE("expression: count(*) is its own node", "[query][expression]") {
    auto expr = parse_ok("count(*)");
    CHECK(std::holds_alternative<CountStar>(expr.node));
    CHECK(is_aggregate(expr));
    CHECK(std::holds_alternative<CountStar>(parse_ok("COUNT( * )").node));
}

TEST_CASE("expression: unknown functions are scalar references", "[query][expression]") {
    auto expr = parse_ok("max(sales.revenue)");
    CHECK(std::holds_alternative<ScalarRef>(expr.node));
}

TEST_CASE("expression: empty aggregate is rejected", "[query][expression]") {
    auto error = parse_error("sum()");
    CHECK(error.kind == ErrorKind::Validation);
    CHECK(error.message == "aggregate expression 'sum()' is empty");
    CHECK(parse_error("avg(   )").kind == ErrorKind::Validation);
}

TEST_CASE("expression: missing column is rejected", "[query][expression]") {
    CHECK(parse_error("sales.").message == "column missing in projection 'sales.'");
    CHECK(parse_error("sum(budget.)").kind == ErrorKind::Validation);
    CHECK(parse_error("").kind == ErrorKind::Validation);
}

TEST_CASE("expression: function names print lower-case", "[query][expression]") {
    CHECK(to_string(AggFunc::Sum) == "sum");
    CHECK(to_string(AggFunc::Avg) == "avg");
    CHECK(to_string(AggFunc::Count) == "count");
}
