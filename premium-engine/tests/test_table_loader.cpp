#include <catch2/catch_test_macros.hpp>
#include "../src/io/table_loader.hpp"
#include <sstream>
#include <string>

using namespace premium;
using namespace premium::io;

namespace {

const std::string TEST_DATA_DIR = PREMIUM_TEST_DATA_DIR;
const std::string DATA_DIR = PREMIUM_DATA_DIR;

} // anonymous namespace

TEST_CASE("Table format detection", "[table_loader]") {
    REQUIRE(detect_table_format("premium_tables.xlsx") == TableFormat::Xlsx);
    REQUIRE(detect_table_format("/srv/PREMIUM_TABLES.XLSX") == TableFormat::Xlsx);
    REQUIRE(detect_table_format("export.csv") == TableFormat::Csv);
    REQUIRE_THROWS_AS(detect_table_format("premium_tables.xls"), TableLoadError);
    REQUIRE_THROWS_AS(detect_table_format("premium_tables"), TableLoadError);
}

TEST_CASE("Workbook and CSV export load the same table", "[table_loader]") {
    PremiumTable from_xlsx = load_premium_table(DATA_DIR + "/premium_tables.xlsx");
    PremiumTable from_csv = load_premium_table(DATA_DIR + "/premium_tables.csv");

    REQUIRE(from_xlsx.size() == 63);
    REQUIRE(from_xlsx.key_count() == 9);
    REQUIRE(from_xlsx.rates() == from_csv.rates());

    REQUIRE(from_xlsx.find("1A:100000", 3).value() == 750.0);
    REQUIRE(from_xlsx.find("1A:100000", 7).value() == 2600.0);
    REQUIRE(from_xlsx.find("1B:100000", 1).value() == 437.5);
    REQUIRE(from_xlsx.find("2A:500000", 1).value() == 2100.0);
    REQUIRE_FALSE(from_xlsx.find("1A:300000", 1).has_value());
}

TEST_CASE("Workbook without header or shared strings", "[table_loader]") {
    PremiumTable table = load_premium_table(TEST_DATA_DIR + "/no_header_matrix.xlsx");

    REQUIRE(table.size() == 7);
    REQUIRE(table.keys() == std::vector<std::string>{"3C:250000"});
    REQUIRE(table.find("3C:250000", 1).value() == 350.0);
    REQUIRE(table.find("3C:250000", 7).value() == 2600.0);
}

TEST_CASE("Quoted CSV export", "[table_loader]") {
    PremiumTable table = load_premium_table(TEST_DATA_DIR + "/quoted.csv");

    REQUIRE(table.size() == 2);
    REQUIRE(table.find("1A:100000", 1).value() == 350.0);
    REQUIRE(table.find("1A:100000", 2).value() == 500.5);
}

TEST_CASE("CSV rows keep their line positions", "[table_loader]") {
    std::istringstream is("code,sum,band,premium\n\n1A,100000,18-35,350\n");
    SheetRows rows = read_csv_rows(is);

    REQUIRE(rows.size() == 3);
    REQUIRE(rows[1].empty());
    REQUIRE(rows[2][3] == "350");
}

TEST_CASE("Invalid premium tables", "[table_loader]") {
    SECTION("Missing file") {
        REQUIRE_THROWS_AS(load_premium_table(TEST_DATA_DIR + "/missing.xlsx"), TableLoadError);
    }

    SECTION("Missing worksheet") {
        REQUIRE_THROWS_AS(load_premium_table(DATA_DIR + "/premium_tables.xlsx", "rates"),
                          TableLoadError);
    }

    SECTION("Worksheet without premiums") {
        REQUIRE_THROWS_AS(load_premium_table(DATA_DIR + "/premium_tables.xlsx", "notes"),
                          TableLoadError);
    }

    SECTION("Too many bands for a key") {
        REQUIRE_THROWS_AS(load_premium_table(TEST_DATA_DIR + "/too_many_bands.csv"),
                          TableLoadError);
    }

    SECTION("Non-numeric premium names file and row") {
        try {
            load_premium_table(TEST_DATA_DIR + "/bad_premium.csv");
            FAIL("expected TableLoadError");
        } catch (const TableLoadError& e) {
            std::string message = e.what();
            REQUIRE(message.find("bad_premium.csv") != std::string::npos);
            REQUIRE(message.find("Row 3") != std::string::npos);
        }
    }
}
