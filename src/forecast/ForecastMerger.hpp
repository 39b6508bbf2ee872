#pragma once

#include "forecast/ForecastEngine.hpp"
#include "forecast/MonthlyResampler.hpp"
#include "forecast/SalesSchema.hpp"
#include "dataframe/DataFrame.hpp"
#include <optional>
#include <string>
#include <vector>

namespace salescast {
namespace forecast {

enum class PointType {
    Actual,
    Forecast
};

/**
 * One row of a group's merged timeline
 */
struct ForecastPoint {
    CalendarDate date;
    PointType type = PointType::Actual;
    double quantity = 0.0;           // actual or predicted, depending on type
    std::optional<double> lower;     // Forecast rows only
    std::optional<double> upper;
    GroupKey key;
};

struct ForecastMergerOptions {
    // Also emit the in-sample fitted values as Forecast rows
    bool includeFittedHistory = false;
};

/**
 * Joins a group's history with its predictions and accumulates every
 * group's rows into the forecast result table.
 *
 * Result columns: Date, [Sales Name], Customer Name, Item Name, Type,
 * Actual Quantity, Predicted Quantity, yhat_lower, yhat_upper.
 */
class ForecastMerger {
public:
    explicit ForecastMerger(GroupingScheme scheme, ForecastMergerOptions options = {});

    std::vector<ForecastPoint> merge(
        const GroupKey& key,
        const MonthlySeries& history,
        const std::vector<PredictedPoint>& predictions
    ) const;

    /// Adds one group's rows to the running result
    void append(const std::vector<ForecastPoint>& points);

    DataFramePtr result() const { return m_result; }
    size_t groupCount() const { return m_groupCount; }

    static DataFramePtr createResultTable(GroupingScheme scheme);
    static std::string typeName(PointType type);

private:
    GroupingScheme m_scheme;
    ForecastMergerOptions m_options;
    DataFramePtr m_result;
    size_t m_groupCount = 0;
};

} // namespace forecast
} // namespace salescast
