#pragma once

#include "forecast/SalesSchema.hpp"
#include "dataframe/DataFrame.hpp"
#include "util/DateUtil.hpp"
#include <vector>

namespace salescast {
namespace forecast {

struct MonthlyPoint {
    CalendarDate month;   // month-end label, e.g. 2024-02-29
    double quantity = 0.0;
};

/**
 * Monthly quantity totals of one group, strictly increasing in month.
 * Only months with at least one transaction appear.
 */
struct MonthlySeries {
    std::vector<MonthlyPoint> points;

    size_t size() const { return points.size(); }
    bool empty() const { return points.empty(); }
    const MonthlyPoint& back() const { return points.back(); }
};

class MonthlyResampler {
public:
    static constexpr size_t DEFAULT_MIN_OBSERVATIONS = 10;

    explicit MonthlyResampler(size_t minObservations = DEFAULT_MIN_OBSERVATIONS)
        : m_minObservations(minObservations) {}

    /**
     * Filters the rows matching `key` under `scheme`, then aggregates them.
     * Throws DateParseError on a malformed Date cell.
     */
    MonthlySeries resample(const DataFrame& df, GroupingScheme scheme, const GroupKey& key) const;

    /// Aggregates the given rows (already filtered on the group key)
    MonthlySeries resample(const DataFrame& df, const std::vector<size_t>& rows) const;

    /// Data-sufficiency gate: false means the group is left out entirely
    bool isForecastable(const MonthlySeries& series) const {
        return series.size() >= m_minObservations;
    }

    size_t minObservations() const { return m_minObservations; }

    static std::vector<size_t> matchRows(const DataFrame& df, GroupingScheme scheme, const GroupKey& key);

private:
    size_t m_minObservations;
};

} // namespace forecast
} // namespace salescast
