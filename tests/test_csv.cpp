#include <sheetq/source/csv.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <string>

using namespace sheetq;

namespace {

auto write_csv(const std::filesystem::path& path, const char* content) {
    std::ofstream out(path);
    out << content;
}

auto tmp(const char* name) -> std::filesystem::path {
    return std::filesystem::temp_directory_path() / name;
}

auto cell(const Row& row, const std::string& column) -> const Value& {
    const auto* value = lookup(row, column);
    REQUIRE(value != nullptr);
    return *value;
}

}  // namespace

TEST_CASE("csv: cells are text by default", "[source][csv]") {
    auto path = tmp("sheetq_test_text.csv");
    write_csv(path, "region,revenue\nnorth,125000\nsouth,89200.5\n");

    auto rows = source::read_csv_rows(path.string(), ',', {});
    REQUIRE(rows.has_value());
    REQUIRE(rows->size() == 2);
    CHECK(cell((*rows)[0], "region") == Value{std::string("north")});
    CHECK(cell((*rows)[0], "revenue") == Value{std::string("125000")});
    CHECK(cell((*rows)[1], "revenue") == Value{std::string("89200.5")});
}

TEST_CASE("csv: numeric inference", "[source][csv]") {
    auto path = tmp("sheetq_test_infer.csv");
    write_csv(path, "id,amount,code\n1,-2.5,007a\n2,1e3, 12\n");

    source::CsvOptions options;
    options.infer_numbers = true;
    auto rows = source::read_csv_rows(path.string(), ',', options);
    REQUIRE(rows.has_value());
    REQUIRE(rows->size() == 2);
    CHECK(cell((*rows)[0], "id") == Value{1.0});
    CHECK(cell((*rows)[0], "amount") == Value{-2.5});
    CHECK(cell((*rows)[0], "code") == Value{std::string("007a")});
    CHECK(cell((*rows)[1], "amount") == Value{1000.0});
    CHECK(cell((*rows)[1], "code") == Value{std::string(" 12")});
}

TEST_CASE("csv: quoted fields keep delimiters", "[source][csv]") {
    auto path = tmp("sheetq_test_quoted.csv");
    write_csv(path, "name,note\n\"Smith, J\",plain\n");

    auto rows = source::read_csv_rows(path.string(), ',', {});
    REQUIRE(rows.has_value());
    REQUIRE(rows->size() == 1);
    CHECK(cell((*rows)[0], "name") == Value{std::string("Smith, J")});
    CHECK(cell((*rows)[0], "note") == Value{std::string("plain")});
}

TEST_CASE("csv: short rows pad with null", "[source][csv]") {
    auto path = tmp("sheetq_test_short.csv");
    write_csv(path, "a,b,c\n1,2\n");

    auto rows = source::read_csv_rows(path.string(), ',', {});
    REQUIRE(rows.has_value());
    REQUIRE(rows->size() == 1);
    CHECK(cell((*rows)[0], "b") == Value{std::string("2")});
    CHECK(is_null(cell((*rows)[0], "c")));
}

TEST_CASE("csv: null spec", "[source][csv]") {
    auto path = tmp("sheetq_test_nulls.csv");
    write_csv(path, "a,b,c\n,NA,x\n");

    source::CsvOptions options;
    source::apply_null_spec(options, " <empty> , NA ");
    CHECK(options.null_if_empty);
    CHECK(options.null_tokens.contains("NA"));

    auto rows = source::read_csv_rows(path.string(), ',', options);
    REQUIRE(rows.has_value());
    CHECK(is_null(cell((*rows)[0], "a")));
    CHECK(is_null(cell((*rows)[0], "b")));
    CHECK(cell((*rows)[0], "c") == Value{std::string("x")});

    auto plain = source::read_csv_rows(path.string(), ',', {});
    REQUIRE(plain.has_value());
    CHECK(cell((*plain)[0], "a") == Value{std::string("")});
}

TEST_CASE("csv: custom delimiter", "[source][csv]") {
    auto path = tmp("sheetq_test_semicolon.csv");
    write_csv(path, "region;budget\nnorth;130000\n");

    auto rows = source::read_csv_rows(path.string(), ';', {});
    REQUIRE(rows.has_value());
    REQUIRE(rows->size() == 1);
    CHECK(cell((*rows)[0], "budget") == Value{std::string("130000")});
}

TEST_CASE("csv: missing file is reported", "[source][csv]") {
    auto path = tmp("sheetq_test_does_not_exist.csv");
    std::filesystem::remove(path);
    auto rows = source::read_csv_rows(path.string(), ',', {});
    REQUIRE_FALSE(rows.has_value());
    CHECK(rows.error() == "sheet data file missing on disk: " + path.string());
}

TEST_CASE("csv: row source resolves sheets by id", "[source][csv]") {
    auto path = tmp("sheetq_test_source.csv");
    write_csv(path, "k\nv\n");

    source::CsvRowSource source;
    source.add_sheet("one", source::CsvSheet{.path = path.string()});

    auto rows = source.load("one");
    REQUIRE(rows.has_value());
    CHECK(rows->size() == 1);

    auto missing = source.load("two");
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error() == "backing data file for sheet 'two' not found");
}
