#include <catch2/catch.hpp>
#include "forecast/ForecastEngine.hpp"
#include <cmath>

using namespace salescast;
using namespace salescast::forecast;
using Catch::Matchers::WithinAbs;

// Helper: consecutive monthly points from Jan 2021, value = f(t)
template <typename F>
static MonthlySeries createSeries(int months, F value) {
    MonthlySeries series;
    for (int t = 0; t < months; ++t) {
        CalendarDate first{2021 + t / 12, t % 12 + 1, 1};
        series.points.push_back(MonthlyPoint{monthEnd(first), value(t)});
    }
    return series;
}

static std::vector<PredictedPoint> futureOnly(const std::vector<PredictedPoint>& points) {
    std::vector<PredictedPoint> out;
    for (const auto& p : points) {
        if (!p.inSample) out.push_back(p);
    }
    return out;
}

TEST_CASE("ForecastEngine predicts 12 future months by default", "[ForecastEngine]") {
    auto series = createSeries(12, [](int t) { return 10.0 + t; });

    ForecastEngine engine;
    auto future = futureOnly(engine.forecast(series));

    REQUIRE(future.size() == 12);
    REQUIRE(future.front().date == CalendarDate{2022, 1, 31});
    REQUIRE(future.back().date == CalendarDate{2022, 12, 31});
    for (size_t i = 1; i < future.size(); ++i) {
        REQUIRE(future[i - 1].date < future[i].date);
    }
}

TEST_CASE("ForecastEngine in-sample points cover the history", "[ForecastEngine]") {
    auto series = createSeries(10, [](int t) { return 5.0 + 0.5 * t; });

    auto predictions = ForecastEngine().forecast(series);

    size_t inSample = 0;
    for (const auto& p : predictions) {
        if (p.inSample) {
            REQUIRE_FALSE(series.back().month < p.date);
            ++inSample;
        }
    }
    REQUIRE(inSample == series.size());
}

TEST_CASE("ForecastEngine extends a linear trend", "[ForecastEngine]") {
    auto series = createSeries(12, [](int t) { return 20.0 + 2.0 * t; });

    auto future = futureOnly(ForecastEngine().forecast(series));

    // t = 12 -> 44, t = 23 -> 66
    REQUIRE_THAT(future.front().yhat, WithinAbs(44.0, 1e-6));
    REQUIRE_THAT(future.back().yhat, WithinAbs(66.0, 1e-6));
}

TEST_CASE("ForecastEngine custom horizon", "[ForecastEngine]") {
    ForecastEngineOptions options;
    options.horizon = 3;
    auto series = createSeries(10, [](int) { return 7.0; });

    auto future = futureOnly(ForecastEngine(options).forecast(series));

    REQUIRE(future.size() == 3);
    REQUIRE_THAT(future[0].yhat, WithinAbs(7.0, 1e-6));
}

TEST_CASE("ForecastEngine intervals bracket the estimate", "[ForecastEngine]") {
    // Saisonnalité + bruit déterministe
    auto series = createSeries(36, [](int t) {
        return 50.0 + 0.3 * t + 10.0 * std::sin(2.0 * 3.14159265358979 * t / 12.0) +
               ((t * 7) % 5 - 2.0);
    });

    auto predictions = ForecastEngine().forecast(series);
    auto future = futureOnly(predictions);

    for (const auto& p : predictions) {
        REQUIRE(p.lower <= p.yhat);
        REQUIRE(p.yhat <= p.upper);
        REQUIRE(p.yhat >= 0.0);
    }
    // l'incertitude croît avec l'horizon
    REQUIRE(future.back().upper - future.back().lower > future.front().upper - future.front().lower);
}

TEST_CASE("ForecastEngine captures yearly seasonality", "[ForecastEngine]") {
    auto series = createSeries(36, [](int t) {
        return 100.0 + 30.0 * std::cos(2.0 * 3.14159265358979 * t / 12.0);
    });

    auto future = futureOnly(ForecastEngine().forecast(series));

    // t = 36 (janvier): pic, t = 42 (juillet): creux
    REQUIRE_THAT(future[0].yhat, WithinAbs(130.0, 1e-4));
    REQUIRE_THAT(future[6].yhat, WithinAbs(70.0, 1e-4));
}

TEST_CASE("ForecastEngine drops negative estimates", "[ForecastEngine]") {
    auto series = createSeries(10, [](int t) { return 30.0 - 3.0 * t; });

    auto predictions = ForecastEngine().forecast(series);
    auto future = futureOnly(predictions);

    for (const auto& p : predictions) {
        REQUIRE(p.yhat >= 0.0);
    }
    // la tendance passe sous zéro après t = 10
    REQUIRE(future.size() < 12);
}

TEST_CASE("ForecastEngine effectiveFourierOrder", "[ForecastEngine]") {
    ForecastEngine engine;

    REQUIRE(engine.effectiveFourierOrder(20, 20) == 0);   // moins de deux ans
    REQUIRE(engine.effectiveFourierOrder(24, 24) == 3);
    REQUIRE(engine.effectiveFourierOrder(8, 30) == 2);    // limité par les données

    ForecastEngineOptions options;
    options.fourierOrder = 0;
    REQUIRE(ForecastEngine(options).effectiveFourierOrder(48, 48) == 0);
}

// Helper: one point every `step` months from Jan 2014, value = f(k)
template <typename F>
static MonthlySeries createSparseSeries(int points, int step, F value) {
    MonthlySeries series;
    for (int k = 0; k < points; ++k) {
        int t = k * step;
        CalendarDate first{2014 + t / 12, t % 12 + 1, 1};
        series.points.push_back(MonthlyPoint{monthEnd(first), value(k)});
    }
    return series;
}

TEST_CASE("ForecastEngine effectiveFourierOrder limited by months of the year", "[ForecastEngine]") {
    ForecastEngine engine;

    REQUIRE(engine.effectiveFourierOrder(12, 34, 4) == 1);    // trimestriel
    REQUIRE(engine.effectiveFourierOrder(10, 109, 1) == 0);   // annuel
    REQUIRE(engine.effectiveFourierOrder(24, 24, 12) == 3);
}

TEST_CASE("ForecastEngine quarterly buyer", "[ForecastEngine]") {
    // Achats en janvier, avril, juillet, octobre sur trois ans
    auto series = createSparseSeries(12, 3, [](int k) {
        return 40.0 + 0.5 * k + (k % 4 == 0 ? 5.0 : 0.0);
    });

    auto future = futureOnly(ForecastEngine().forecast(series));

    REQUIRE(future.size() == 12);
    REQUIRE(future.front().date == addMonths(series.back().month, 1));
    for (const auto& p : future) {
        REQUIRE(std::isfinite(p.yhat));
        REQUIRE(p.lower <= p.upper);
    }
}

TEST_CASE("ForecastEngine yearly buyer", "[ForecastEngine]") {
    // Une commande chaque janvier pendant dix ans
    auto series = createSparseSeries(10, 12, [](int k) { return 20.0 + 2.0 * k; });

    auto future = futureOnly(ForecastEngine().forecast(series));

    REQUIRE(future.size() == 12);
    REQUIRE(future.front().date == CalendarDate{2023, 2, 28});
    // tendance seule: 2 unités par an
    REQUIRE_THAT(future.front().yhat, WithinAbs(20.0 + 2.0 * (109.0 / 12.0), 1e-6));
}

TEST_CASE("ForecastEngine too short series throws", "[ForecastEngine]") {
    auto series = createSeries(2, [](int t) { return 1.0 + t; });

    REQUIRE_THROWS_AS(ForecastEngine().forecast(series), ModelFitError);
}

TEST_CASE("ForecastEngine non-finite quantity throws", "[ForecastEngine]") {
    auto series = createSeries(10, [](int t) { return t == 4 ? std::nan("") : 1.0; });

    REQUIRE_THROWS_AS(ForecastEngine().forecast(series), ModelFitError);
}

TEST_CASE("ForecastEngine rejects invalid options", "[ForecastEngine]") {
    ForecastEngineOptions badHorizon;
    badHorizon.horizon = 0;
    ForecastEngineOptions badWidth;
    badWidth.intervalWidth = 1.0;

    REQUIRE_THROWS_AS(ForecastEngine(badHorizon), std::invalid_argument);
    REQUIRE_THROWS_AS(ForecastEngine(badWidth), std::invalid_argument);
}
