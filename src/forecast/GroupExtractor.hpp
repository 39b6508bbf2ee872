#pragma once

#include "forecast/SalesSchema.hpp"
#include "dataframe/DataFrame.hpp"
#include <vector>

namespace salescast {
namespace forecast {

/**
 * One distinct GroupKey and the table rows that carry it
 */
struct GroupedRows {
    GroupKey key;
    std::vector<size_t> rows;  // ascending
};

/**
 * Enumerates the independent time series of a sales table.
 *
 * The scheme is fixed at construction. Keys come out in order of first
 * appearance in the table, so the same table always yields the same
 * sequence (progress percentages are reproducible).
 */
class GroupExtractor {
public:
    explicit GroupExtractor(GroupingScheme scheme);

    /// Detects the scheme from the table's columns
    static GroupExtractor forTable(const DataFrame& df);

    GroupingScheme scheme() const { return m_scheme; }
    const std::vector<std::string>& dimensionColumns() const { return m_dimensions; }

    std::vector<GroupKey> extractKeys(const DataFrame& df) const;

    std::vector<GroupedRows> extractGroups(const DataFrame& df) const;

private:
    void requireDimensions(const DataFrame& df) const;

    GroupingScheme m_scheme;
    std::vector<std::string> m_dimensions;
};

} // namespace forecast
} // namespace salescast
