#include "forecast/MonthlyResampler.hpp"
#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <cmath>
#include <map>

namespace salescast {
namespace forecast {

std::vector<size_t> MonthlyResampler::matchRows(
    const DataFrame& df,
    GroupingScheme scheme,
    const GroupKey& key
) {
    auto dimensions = SalesSchema::dimensionColumns(scheme);
    if (key.values.size() != dimensions.size()) {
        throw std::invalid_argument("Group key '" + key.toString() + "' does not match scheme " +
                                    SalesSchema::schemeName(scheme));
    }

    std::vector<size_t> rows;
    for (size_t d = 0; d < dimensions.size(); ++d) {
        if (!df.hasColumn(dimensions[d])) {
            throw SchemaError("Missing grouping column '" + dimensions[d] + "'");
        }
        auto matches = df.getColumn(dimensions[d])->filterEqual(key.values[d]);
        if (d == 0) {
            rows = std::move(matches);
        } else {
            std::vector<size_t> both;
            std::set_intersection(rows.begin(), rows.end(), matches.begin(), matches.end(),
                                  std::back_inserter(both));
            rows = std::move(both);
        }
        if (rows.empty()) break;
    }
    return rows;
}

MonthlySeries MonthlyResampler::resample(
    const DataFrame& df,
    GroupingScheme scheme,
    const GroupKey& key
) const {
    return resample(df, matchRows(df, scheme, key));
}

MonthlySeries MonthlyResampler::resample(
    const DataFrame& df,
    const std::vector<size_t>& rows
) const {
    // monthIndex -> total; std::map garde l'ordre croissant
    std::map<int, double> totals;

    for (size_t row : rows) {
        std::string rawDate = df.cellAsString(columns::DATE, row);
        CalendarDate date;
        try {
            date = parseDate(rawDate);
        } catch (const DateParseError& e) {
            throw DateParseError(std::string(e.what()) + " (row " + std::to_string(row + 1) + ")");
        }

        double quantity = df.numericAt(columns::QUANTITY, row);
        if (std::isnan(quantity)) {
            quantity = 0.0;  // cellule vide
        }
        totals[monthIndex(date)] += quantity;
    }

    MonthlySeries series;
    series.points.reserve(totals.size());
    for (const auto& [index, total] : totals) {
        CalendarDate first{index / 12, index % 12 + 1, 1};
        series.points.push_back(MonthlyPoint{monthEnd(first), total});
    }
    return series;
}

} // namespace forecast
} // namespace salescast
