#include "DataFrameSerializer.hpp"
#include "DataFrame.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>

namespace salescast {

std::string DataFrameSerializer::cellToString(const IColumn& column, size_t row, int precision) {
    switch (column.getType()) {
        case ColumnTypeOpt::STRING:
            return static_cast<const StringColumn&>(column).at(row);
        case ColumnTypeOpt::INT:
            return std::to_string(static_cast<const IntColumn&>(column).at(row));
        case ColumnTypeOpt::DOUBLE: {
            const auto& doubles = static_cast<const DoubleColumn&>(column);
            if (doubles.isNull(row)) return "";
            std::ostringstream oss;
            oss << std::setprecision(precision) << doubles.at(row);
            return oss.str();
        }
    }
    return "";
}

json DataFrameSerializer::cellToJson(const IColumn& column, size_t row) {
    switch (column.getType()) {
        case ColumnTypeOpt::STRING:
            return static_cast<const StringColumn&>(column).at(row);
        case ColumnTypeOpt::INT:
            return static_cast<const IntColumn&>(column).at(row);
        case ColumnTypeOpt::DOUBLE: {
            const auto& doubles = static_cast<const DoubleColumn&>(column);
            if (doubles.isNull(row)) return nullptr;
            return doubles.at(row);
        }
    }
    return nullptr;
}

std::string DataFrameSerializer::toString(const DataFrame& df, size_t maxRows) {
    auto names = df.getColumnNames();
    if (names.empty()) {
        return "Empty DataFrame\n";
    }

    std::vector<IColumnPtr> columns;
    std::ostringstream oss;
    for (const auto& name : names) {
        columns.push_back(df.getColumn(name));
        oss << name << "\t";
    }
    oss << "\n";

    size_t rows = df.rowCount();
    size_t shown = std::min(rows, maxRows);
    for (size_t i = 0; i < shown; ++i) {
        for (const auto& col : columns) {
            oss << cellToString(*col, i, 6) << "\t";
        }
        oss << "\n";
    }

    if (rows > shown) {
        oss << "... (" << (rows - shown) << " more rows)\n";
    }
    return oss.str();
}

json DataFrameSerializer::toJson(const DataFrame& df) {
    auto names = df.getColumnNames();

    std::vector<IColumnPtr> columns;
    columns.reserve(names.size());
    for (const auto& name : names) {
        columns.push_back(df.getColumn(name));
    }

    json data = json::array();
    size_t rows = df.rowCount();
    for (size_t i = 0; i < rows; ++i) {
        json row = json::array();
        for (const auto& col : columns) {
            row.push_back(cellToJson(*col, i));
        }
        data.push_back(std::move(row));
    }

    return json{{"columns", names}, {"data", std::move(data)}};
}

std::string DataFrameSerializer::columnTypeToString(ColumnTypeOpt type) {
    switch (type) {
        case ColumnTypeOpt::INT: return "INT";
        case ColumnTypeOpt::DOUBLE: return "DOUBLE";
        case ColumnTypeOpt::STRING: return "STRING";
    }
    return "UNKNOWN";
}

} // namespace salescast
