#include <catch2/catch_test_macros.hpp>
#include "../src/io/csv_reader.hpp"
#include <sstream>

using namespace premium::io;

TEST_CASE("CsvReader splits and trims cells", "[csv_reader]") {
    std::istringstream is("code, sum_insured ,premium\n1A,100000,750\n");
    CsvReader reader(is);

    REQUIRE(reader.has_more());
    auto header = reader.read_row();
    REQUIRE(header.size() == 3);
    REQUIRE(header[1] == "sum_insured");
    REQUIRE(reader.line_number() == 1);

    auto row = reader.read_row();
    REQUIRE(row.size() == 3);
    REQUIRE(row[0] == "1A");
    REQUIRE(row[2] == "750");
    REQUIRE(reader.line_number() == 2);

    REQUIRE_FALSE(reader.has_more());
}

TEST_CASE("CsvReader handles quoting", "[csv_reader]") {
    SECTION("Delimiter inside quotes") {
        std::istringstream is("\"1A\",\"36, to 45\",500\n");
        CsvReader reader(is);
        auto row = reader.read_row();
        REQUIRE(row.size() == 3);
        REQUIRE(row[1] == "36, to 45");
    }

    SECTION("Escaped quote") {
        std::istringstream is("\"say \"\"hi\"\"\",x\n");
        CsvReader reader(is);
        auto row = reader.read_row();
        REQUIRE(row[0] == "say \"hi\"");
        REQUIRE(row[1] == "x");
    }

    SECTION("Quoted whitespace is preserved") {
        std::istringstream is("\" padded \",b\n");
        CsvReader reader(is);
        REQUIRE(reader.read_row()[0] == " padded ");
    }

    SECTION("Empty trailing cell") {
        std::istringstream is("a,b,\n");
        CsvReader reader(is);
        auto row = reader.read_row();
        REQUIRE(row.size() == 3);
        REQUIRE(row[2].empty());
    }
}

TEST_CASE("CsvReader handles spreadsheet exports", "[csv_reader]") {
    std::istringstream is("\xEF\xBB\xBF" "code,premium\r\n\r\n1A,750\r\n");
    CsvReader reader(is);

    auto header = reader.read_row();
    REQUIRE(header[0] == "code");
    REQUIRE(header[1] == "premium");

    auto blank = reader.read_row();
    REQUIRE(blank.empty());

    auto row = reader.read_row();
    REQUIRE(row[1] == "750");
    REQUIRE(reader.line_number() == 3);
}
