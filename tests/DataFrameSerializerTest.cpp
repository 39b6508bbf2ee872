#include <catch2/catch.hpp>
#include "dataframe/DataFrame.hpp"
#include "dataframe/DataFrameSerializer.hpp"

using namespace salescast;

static DataFrame createForecastRows() {
    DataFrame df;
    df.addStringColumn("Date");
    df.addStringColumn("Type");
    df.addIntColumn("Count");
    df.addDoubleColumn("Predicted Quantity");
    df.addRow({"2024-01-31", "Actual", "1", ""});
    df.addRow({"2024-02-29", "Forecast", "-2", "3.5"});
    return df;
}

TEST_CASE("Serializer toString empty DataFrame", "[DataFrameSerializer]") {
    DataFrame df;

    REQUIRE(df.toString() == "Empty DataFrame\n");
}

TEST_CASE("Serializer toString with maxRows limit", "[DataFrameSerializer]") {
    auto df = createForecastRows();

    std::string out = df.toString(1);

    REQUIRE(out.find("Date\tType\tCount\tPredicted Quantity\t") == 0);
    REQUIRE(out.find("2024-01-31") != std::string::npos);
    REQUIRE(out.find("2024-02-29") == std::string::npos);
    REQUIRE(out.find("(1 more rows)") != std::string::npos);
}

TEST_CASE("Serializer toJson format columnar", "[DataFrameSerializer]") {
    auto df = createForecastRows();

    auto j = df.toJson();

    REQUIRE(j["columns"] == json::array({"Date", "Type", "Count", "Predicted Quantity"}));
    REQUIRE(j["data"].size() == 2);
    REQUIRE(j["data"][0][0] == "2024-01-31");
    REQUIRE(j["data"][1][2] == -2);
    REQUIRE(j["data"][1][3] == 3.5);
}

TEST_CASE("Serializer toJson NaN becomes null", "[DataFrameSerializer]") {
    auto df = createForecastRows();

    auto j = df.toJson();

    REQUIRE(j["data"][0][3].is_null());
    // dump() ne doit jamais produire "NaN"
    REQUIRE(j.dump().find("NaN") == std::string::npos);
}

TEST_CASE("Serializer toJson empty DataFrame", "[DataFrameSerializer]") {
    DataFrame df;
    df.addStringColumn("Date");

    auto j = df.toJson();

    REQUIRE(j["columns"].size() == 1);
    REQUIRE(j["data"].empty());
}

TEST_CASE("Serializer columnTypeToString", "[DataFrameSerializer]") {
    REQUIRE(DataFrameSerializer::columnTypeToString(ColumnTypeOpt::INT) == "INT");
    REQUIRE(DataFrameSerializer::columnTypeToString(ColumnTypeOpt::DOUBLE) == "DOUBLE");
    REQUIRE(DataFrameSerializer::columnTypeToString(ColumnTypeOpt::STRING) == "STRING");
}
