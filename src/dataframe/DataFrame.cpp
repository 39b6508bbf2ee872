#include "DataFrame.hpp"
#include "DataFrameSerializer.hpp"
#include <stdexcept>

namespace salescast {

void DataFrame::addColumn(IColumnPtr column) {
    if (!column) {
        throw std::invalid_argument("Cannot add null column");
    }
    if (hasColumn(column->getName())) {
        throw std::invalid_argument("Column '" + column->getName() + "' already exists");
    }
    m_index.emplace(column->getName(), m_columns.size());
    m_columns.push_back(std::move(column));
}

void DataFrame::setColumn(IColumnPtr column) {
    if (!column) {
        throw std::invalid_argument("Cannot set null column");
    }
    auto it = m_index.find(column->getName());
    if (it == m_index.end()) {
        addColumn(std::move(column));
    } else {
        m_columns[it->second] = std::move(column);
    }
}

void DataFrame::addIntColumn(const std::string& name) {
    addColumn(std::make_shared<IntColumn>(name));
}

void DataFrame::addDoubleColumn(const std::string& name) {
    addColumn(std::make_shared<DoubleColumn>(name));
}

void DataFrame::addStringColumn(const std::string& name) {
    addColumn(std::make_shared<StringColumn>(name, m_pool));
}

IColumnPtr DataFrame::getColumn(const std::string& name) const {
    auto it = m_index.find(name);
    if (it == m_index.end()) {
        throw std::out_of_range("Column '" + name + "' not found");
    }
    return m_columns[it->second];
}

std::shared_ptr<StringColumn> DataFrame::getStringColumn(const std::string& name) const {
    auto col = getColumn(name);
    if (col->getType() != ColumnTypeOpt::STRING) {
        throw std::invalid_argument("Column '" + name + "' is not a string column");
    }
    return std::static_pointer_cast<StringColumn>(col);
}

std::vector<std::string> DataFrame::getColumnNames() const {
    std::vector<std::string> names;
    names.reserve(m_columns.size());
    for (const auto& col : m_columns) {
        names.push_back(col->getName());
    }
    return names;
}

double DataFrame::numericAt(const std::string& column, size_t row) const {
    auto col = getColumn(column);
    switch (col->getType()) {
        case ColumnTypeOpt::INT:
            return static_cast<double>(static_cast<const IntColumn&>(*col).at(row));
        case ColumnTypeOpt::DOUBLE:
            return static_cast<const DoubleColumn&>(*col).at(row);
        case ColumnTypeOpt::STRING:
            break;
    }
    throw std::invalid_argument("Column '" + column + "' is not numeric");
}

std::string DataFrame::cellAsString(const std::string& column, size_t row) const {
    return DataFrameSerializer::cellToString(*getColumn(column), row);
}

void DataFrame::addRow(const std::vector<std::string>& values) {
    if (values.size() != m_columns.size()) {
        throw std::invalid_argument("Row size mismatch: expected " +
            std::to_string(m_columns.size()) + " values, got " +
            std::to_string(values.size()));
    }

    for (size_t i = 0; i < values.size(); ++i) {
        IColumn& col = *m_columns[i];
        const std::string& value = values[i];
        switch (col.getType()) {
            case ColumnTypeOpt::INT:
                static_cast<IntColumn&>(col).push_back(std::stoll(value));
                break;
            case ColumnTypeOpt::DOUBLE:
                static_cast<DoubleColumn&>(col).push_back(
                    value.empty() ? DoubleColumn::null() : std::stod(value));
                break;
            case ColumnTypeOpt::STRING:
                static_cast<StringColumn&>(col).push_back(value);
                break;
        }
    }
}

void DataFrame::append(const DataFrame& other) {
    if (other.getColumnNames() != getColumnNames()) {
        throw std::invalid_argument("Cannot append DataFrame with a different schema");
    }

    for (size_t i = 0; i < m_columns.size(); ++i) {
        if (m_columns[i]->getType() != other.m_columns[i]->getType()) {
            throw std::invalid_argument("Column '" + m_columns[i]->getName() +
                                        "' type mismatch on append");
        }
        m_columns[i]->append(*other.m_columns[i]);
    }
}

std::string DataFrame::toString(size_t maxRows) const {
    return DataFrameSerializer::toString(*this, maxRows);
}

json DataFrame::toJson() const {
    return DataFrameSerializer::toJson(*this);
}

} // namespace salescast
