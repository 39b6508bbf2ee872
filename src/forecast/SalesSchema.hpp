#pragma once

#include "dataframe/DataFrame.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace salescast {
namespace forecast {

/**
 * Required column missing from the sales table
 */
class SchemaError : public std::runtime_error {
public:
    explicit SchemaError(const std::string& message)
        : std::runtime_error(message) {}
};

namespace columns {
    constexpr const char* DATE = "Date";
    constexpr const char* SALES_NAME = "Sales Name";
    constexpr const char* CUSTOMER_NAME = "Customer Name";
    constexpr const char* ITEM_NAME = "Item Name";
    constexpr const char* QUANTITY = "Quantity";
    constexpr const char* AMOUNT = "Amount";
    constexpr const char* CURRENCY = "Currency";
    constexpr const char* CITY = "City";
    constexpr const char* DOCUMENT_NUMBER = "Document Number";

    // Forecast result table
    constexpr const char* TYPE = "Type";
    constexpr const char* ACTUAL_QUANTITY = "Actual Quantity";
    constexpr const char* PREDICTED_QUANTITY = "Predicted Quantity";
    constexpr const char* YHAT_LOWER = "yhat_lower";
    constexpr const char* YHAT_UPPER = "yhat_upper";
} // namespace columns

/**
 * Grouping dimensionality, chosen once per run from the table's columns
 */
enum class GroupingScheme {
    Triplet,  // Sales Name, Customer Name, Item Name
    Pair      // Customer Name, Item Name
};

/**
 * Dimension values identifying one time series, in dimensionColumns() order
 */
struct GroupKey {
    std::vector<std::string> values;

    bool operator==(const GroupKey& other) const { return values == other.values; }
    bool operator!=(const GroupKey& other) const { return values != other.values; }
    bool operator<(const GroupKey& other) const { return values < other.values; }

    std::string toString() const;
};

class SalesSchema {
public:
    static const std::vector<std::string>& requiredColumns();

    /// Throws SchemaError listing every missing required column
    static void validate(const DataFrame& df);

    static GroupingScheme detectScheme(const DataFrame& df);

    static std::vector<std::string> dimensionColumns(GroupingScheme scheme);

    static std::string schemeName(GroupingScheme scheme);
};

} // namespace forecast
} // namespace salescast
