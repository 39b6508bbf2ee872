#include "forecast/SalesSchema.hpp"
#include "dataframe/DataFrameSerializer.hpp"

namespace salescast {
namespace forecast {

std::string GroupKey::toString() const {
    std::string out;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += " / ";
        out += values[i];
    }
    return out;
}

const std::vector<std::string>& SalesSchema::requiredColumns() {
    static const std::vector<std::string> required = {
        columns::DATE,
        columns::CUSTOMER_NAME,
        columns::ITEM_NAME,
        columns::QUANTITY,
        columns::AMOUNT,
        columns::CURRENCY,
        columns::CITY,
        columns::DOCUMENT_NUMBER
    };
    return required;
}

void SalesSchema::validate(const DataFrame& df) {
    std::string missing;
    for (const auto& name : requiredColumns()) {
        if (!df.hasColumn(name)) {
            if (!missing.empty()) missing += ", ";
            missing += "'" + name + "'";
        }
    }

    if (!missing.empty()) {
        throw SchemaError("Missing required column(s): " + missing);
    }

    auto quantityType = df.getColumn(columns::QUANTITY)->getType();
    if (quantityType == ColumnTypeOpt::STRING) {
        throw SchemaError("Column 'Quantity' must be numeric, found " +
                          DataFrameSerializer::columnTypeToString(quantityType));
    }
}

GroupingScheme SalesSchema::detectScheme(const DataFrame& df) {
    return df.hasColumn(columns::SALES_NAME) ? GroupingScheme::Triplet : GroupingScheme::Pair;
}

std::vector<std::string> SalesSchema::dimensionColumns(GroupingScheme scheme) {
    if (scheme == GroupingScheme::Triplet) {
        return {columns::SALES_NAME, columns::CUSTOMER_NAME, columns::ITEM_NAME};
    }
    return {columns::CUSTOMER_NAME, columns::ITEM_NAME};
}

std::string SalesSchema::schemeName(GroupingScheme scheme) {
    return scheme == GroupingScheme::Triplet
        ? "Sales-Customer-Item triplets"
        : "Customer-Item pairs";
}

} // namespace forecast
} // namespace salescast
