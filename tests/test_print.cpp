#include <sheetq/query/print.hpp>

#include <catch2/catch_test_macros.hpp>

#include <sstream>

using namespace sheetq;

TEST_CASE("print: aligned table with row count", "[query][print]") {
    query::PreviewResult result{
        .headers = {"region", "revenue"},
        .rows = {{"north", "125000"}, {"south", "89200.5"}},
        .row_count = 2,
    };
    std::ostringstream out;
    query::print(result, out);
    CHECK(out.str() ==
          "region  revenue\n"
          "------  -------\n"
          "north   125000 \n"
          "south   89200.5\n"
          "(2 rows)\n");
}

TEST_CASE("print: warnings follow the table", "[query][print]") {
    query::PreviewResult result{
        .headers = {"n"},
        .rows = {{"1"}},
        .warnings = {"Sheet 't' (T) is inactive"},
        .row_count = 1,
    };
    std::ostringstream out;
    query::print(result, out);
    CHECK(out.str() ==
          "n\n"
          "-\n"
          "1\n"
          "(1 row)\n"
          "warning: Sheet 't' (T) is inactive\n");
}

TEST_CASE("print: no headers", "[query][print]") {
    std::ostringstream out;
    query::print(query::PreviewResult{}, out);
    CHECK(out.str() == "(empty preview)\n");
}
