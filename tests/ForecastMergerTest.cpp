#include <catch2/catch.hpp>
#include "forecast/ForecastMerger.hpp"
#include <cmath>

using namespace salescast;
using namespace salescast::forecast;
using Catch::Matchers::WithinAbs;

static MonthlySeries createHistory() {
    MonthlySeries history;
    history.points.push_back(MonthlyPoint{CalendarDate{2024, 1, 31}, 4.0});
    history.points.push_back(MonthlyPoint{CalendarDate{2024, 2, 29}, 6.0});
    return history;
}

static std::vector<PredictedPoint> createPredictions() {
    return {
        PredictedPoint{CalendarDate{2024, 1, 31}, 4.5, 3.0, 6.0, true},
        PredictedPoint{CalendarDate{2024, 2, 29}, 5.5, 4.0, 7.0, true},
        PredictedPoint{CalendarDate{2024, 3, 31}, 6.5, 5.0, 8.0, false},
        PredictedPoint{CalendarDate{2024, 4, 30}, 7.5, 5.5, 9.5, false},
    };
}

TEST_CASE("ForecastMerger keeps actuals and future predictions", "[ForecastMerger]") {
    ForecastMerger merger(GroupingScheme::Pair);
    GroupKey key{{"ACME", "Widget"}};

    auto points = merger.merge(key, createHistory(), createPredictions());

    REQUIRE(points.size() == 4);
    REQUIRE(points[0].type == PointType::Actual);
    REQUIRE(points[1].type == PointType::Actual);
    REQUIRE_FALSE(points[0].lower.has_value());
    REQUIRE(points[2].type == PointType::Forecast);
    REQUIRE(points[2].date == CalendarDate{2024, 3, 31});
    REQUIRE(points[2].lower.value() == 5.0);
    REQUIRE(points[3].key == key);
}

TEST_CASE("ForecastMerger includeFittedHistory emits in-sample rows", "[ForecastMerger]") {
    ForecastMergerOptions options;
    options.includeFittedHistory = true;
    ForecastMerger merger(GroupingScheme::Pair, options);

    auto points = merger.merge(GroupKey{{"ACME", "Widget"}}, createHistory(), createPredictions());

    size_t forecasts = 0;
    for (const auto& p : points) {
        if (p.type == PointType::Forecast) ++forecasts;
    }
    REQUIRE(points.size() == 6);
    REQUIRE(forecasts == 4);
}

TEST_CASE("ForecastMerger drops negative predictions", "[ForecastMerger]") {
    ForecastMerger merger(GroupingScheme::Pair);
    std::vector<PredictedPoint> predictions{
        PredictedPoint{CalendarDate{2024, 3, 31}, -1.0, -2.0, 0.0, false},
        PredictedPoint{CalendarDate{2024, 4, 30}, 0.0, -1.0, 1.0, false},
    };

    auto points = merger.merge(GroupKey{{"A", "x"}}, createHistory(), predictions);

    REQUIRE(points.size() == 3);
    REQUIRE(points.back().date == CalendarDate{2024, 4, 30});
}

TEST_CASE("ForecastMerger result table layout for triplets", "[ForecastMerger]") {
    auto df = ForecastMerger::createResultTable(GroupingScheme::Triplet);

    REQUIRE(df->getColumnNames() == std::vector<std::string>{
        "Date", "Sales Name", "Customer Name", "Item Name", "Type",
        "Actual Quantity", "Predicted Quantity", "yhat_lower", "yhat_upper"});
    REQUIRE(df->rowCount() == 0);
}

TEST_CASE("ForecastMerger append fills the result table", "[ForecastMerger]") {
    ForecastMerger merger(GroupingScheme::Pair);
    GroupKey key{{"ACME", "Widget"}};

    merger.append(merger.merge(key, createHistory(), createPredictions()));
    auto df = merger.result();

    REQUIRE(merger.groupCount() == 1);
    REQUIRE(df->rowCount() == 4);
    REQUIRE(df->cellAsString("Date", 0) == "2024-01-31");
    REQUIRE(df->cellAsString("Customer Name", 0) == "ACME");
    REQUIRE(df->cellAsString("Type", 0) == "Actual");
    REQUIRE_THAT(df->numericAt("Actual Quantity", 0), WithinAbs(4.0, 1e-9));
    REQUIRE(std::isnan(df->numericAt("Predicted Quantity", 0)));
    REQUIRE(std::isnan(df->numericAt("yhat_upper", 1)));

    REQUIRE(df->cellAsString("Type", 2) == "Forecast");
    REQUIRE(std::isnan(df->numericAt("Actual Quantity", 2)));
    REQUIRE_THAT(df->numericAt("Predicted Quantity", 2), WithinAbs(6.5, 1e-9));
    REQUIRE_THAT(df->numericAt("yhat_upper", 3), WithinAbs(9.5, 1e-9));
}

TEST_CASE("ForecastMerger append accumulates groups", "[ForecastMerger]") {
    ForecastMerger merger(GroupingScheme::Pair);

    merger.append(merger.merge(GroupKey{{"A", "x"}}, createHistory(), createPredictions()));
    merger.append(merger.merge(GroupKey{{"B", "y"}}, createHistory(), createPredictions()));
    merger.append({});

    REQUIRE(merger.groupCount() == 2);
    REQUIRE(merger.result()->rowCount() == 8);
    REQUIRE(merger.result()->cellAsString("Customer Name", 4) == "B");
}

TEST_CASE("ForecastMerger append rejects mismatched key", "[ForecastMerger]") {
    ForecastMerger merger(GroupingScheme::Triplet);

    auto points = ForecastMerger(GroupingScheme::Pair)
        .merge(GroupKey{{"A", "x"}}, createHistory(), createPredictions());

    REQUIRE_THROWS_AS(merger.append(points), std::invalid_argument);
}

TEST_CASE("ForecastMerger typeName", "[ForecastMerger]") {
    REQUIRE(ForecastMerger::typeName(PointType::Actual) == "Actual");
    REQUIRE(ForecastMerger::typeName(PointType::Forecast) == "Forecast");
}
