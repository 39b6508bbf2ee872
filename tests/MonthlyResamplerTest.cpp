#include <catch2/catch.hpp>
#include "forecast/MonthlyResampler.hpp"
#include "dataframe/DataFrame.hpp"

using namespace salescast;
using namespace salescast::forecast;
using Catch::Matchers::WithinAbs;

// Helper: (date, customer, item, quantity) rows
static DataFrame createTable(const std::vector<std::vector<std::string>>& rows) {
    DataFrame df;
    df.addStringColumn("Date");
    df.addStringColumn("Customer Name");
    df.addStringColumn("Item Name");
    df.addDoubleColumn("Quantity");
    for (const auto& r : rows) df.addRow(r);
    return df;
}

// Helper: one transaction per month for `months` consecutive months from Jan 2022
static DataFrame createMonthlyTable(int months) {
    std::vector<std::vector<std::string>> rows;
    for (int m = 0; m < months; ++m) {
        int year = 2022 + m / 12;
        int month = m % 12 + 1;
        std::string date = std::to_string(year) + "-" + (month < 10 ? "0" : "") +
                           std::to_string(month) + "-15";
        rows.push_back({date, "ACME", "Widget", "5"});
    }
    return createTable(rows);
}

TEST_CASE("MonthlyResampler sums quantities within a month", "[MonthlyResampler]") {
    auto df = createTable({
        {"2024-01-03", "ACME", "Widget", "2"},
        {"2024-01-28", "ACME", "Widget", "3"},
        {"2024-03-10", "ACME", "Widget", "4"},
        {"2024-01-15", "ACME", "Gadget", "100"},
    });

    MonthlyResampler resampler;
    auto series = resampler.resample(df, GroupingScheme::Pair, GroupKey{{"ACME", "Widget"}});

    REQUIRE(series.size() == 2);
    REQUIRE(series.points[0].month == CalendarDate{2024, 1, 31});
    REQUIRE_THAT(series.points[0].quantity, WithinAbs(5.0, 1e-9));
    REQUIRE(series.points[1].month == CalendarDate{2024, 3, 31});
    REQUIRE_THAT(series.points[1].quantity, WithinAbs(4.0, 1e-9));
}

TEST_CASE("MonthlyResampler months without transactions are absent", "[MonthlyResampler]") {
    auto df = createTable({
        {"2023-11-02", "ACME", "Widget", "1"},
        {"2024-02-20", "ACME", "Widget", "1"},
    });

    auto series = MonthlyResampler().resample(df, GroupingScheme::Pair, GroupKey{{"ACME", "Widget"}});

    REQUIRE(series.size() == 2);
    REQUIRE(series.back().month == CalendarDate{2024, 2, 29});
}

TEST_CASE("MonthlyResampler output strictly increasing from unsorted input", "[MonthlyResampler]") {
    auto df = createTable({
        {"2024-05-01", "A", "x", "1"},
        {"2023-12-01", "A", "x", "1"},
        {"2024-02-01", "A", "x", "1"},
        {"2024-05-30", "A", "x", "1"},
    });

    auto series = MonthlyResampler().resample(df, GroupingScheme::Pair, GroupKey{{"A", "x"}});

    REQUIRE(series.size() == 3);
    for (size_t i = 1; i < series.size(); ++i) {
        REQUIRE(series.points[i - 1].month < series.points[i].month);
    }
    REQUIRE_THAT(series.back().quantity, WithinAbs(2.0, 1e-9));
}

TEST_CASE("MonthlyResampler mixed date formats land in the same month", "[MonthlyResampler]") {
    auto df = createTable({
        {"2024-02-01", "A", "x", "1"},
        {"15/02/2024", "A", "x", "2"},
        {"28 février 2024", "A", "x", "3"},
    });

    auto series = MonthlyResampler().resample(df, GroupingScheme::Pair, GroupKey{{"A", "x"}});

    REQUIRE(series.size() == 1);
    REQUIRE_THAT(series.points[0].quantity, WithinAbs(6.0, 1e-9));
}

TEST_CASE("MonthlyResampler empty quantity counts as zero", "[MonthlyResampler]") {
    auto df = createTable({
        {"2024-01-01", "A", "x", ""},
        {"2024-01-02", "A", "x", "3"},
    });

    auto series = MonthlyResampler().resample(df, GroupingScheme::Pair, GroupKey{{"A", "x"}});

    REQUIRE_THAT(series.points[0].quantity, WithinAbs(3.0, 1e-9));
}

TEST_CASE("MonthlyResampler unknown key gives empty series", "[MonthlyResampler]") {
    auto df = createMonthlyTable(3);

    auto series = MonthlyResampler().resample(df, GroupingScheme::Pair, GroupKey{{"Nobody", "Widget"}});

    REQUIRE(series.empty());
}

TEST_CASE("MonthlyResampler malformed date reports row", "[MonthlyResampler]") {
    auto df = createTable({
        {"2024-01-01", "A", "x", "1"},
        {"31/31/2024", "A", "x", "1"},
    });

    try {
        MonthlyResampler().resample(df, GroupingScheme::Pair, GroupKey{{"A", "x"}});
        FAIL("DateParseError expected");
    } catch (const DateParseError& e) {
        REQUIRE(std::string(e.what()).find("row 2") != std::string::npos);
    }
}

TEST_CASE("MonthlyResampler key size must match scheme", "[MonthlyResampler]") {
    auto df = createMonthlyTable(2);

    REQUIRE_THROWS_AS(
        MonthlyResampler().resample(df, GroupingScheme::Triplet, GroupKey{{"ACME", "Widget"}}),
        std::invalid_argument);
}

TEST_CASE("MonthlyResampler 9 months excluded, 10 included", "[MonthlyResampler]") {
    MonthlyResampler resampler;
    GroupKey key{{"ACME", "Widget"}};

    auto nine = resampler.resample(createMonthlyTable(9), GroupingScheme::Pair, key);
    auto ten = resampler.resample(createMonthlyTable(10), GroupingScheme::Pair, key);

    REQUIRE(nine.size() == 9);
    REQUIRE_FALSE(resampler.isForecastable(nine));
    REQUIRE(ten.size() == 10);
    REQUIRE(resampler.isForecastable(ten));
}

TEST_CASE("MonthlyResampler custom threshold", "[MonthlyResampler]") {
    MonthlyResampler resampler(4);
    auto series = resampler.resample(createMonthlyTable(4), GroupingScheme::Pair, GroupKey{{"ACME", "Widget"}});

    REQUIRE(resampler.minObservations() == 4);
    REQUIRE(resampler.isForecastable(series));
}
