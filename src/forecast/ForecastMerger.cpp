#include "forecast/ForecastMerger.hpp"

namespace salescast {
namespace forecast {

ForecastMerger::ForecastMerger(GroupingScheme scheme, ForecastMergerOptions options)
    : m_scheme(scheme)
    , m_options(options)
    , m_result(createResultTable(scheme))
{
}

DataFramePtr ForecastMerger::createResultTable(GroupingScheme scheme) {
    auto df = std::make_shared<DataFrame>();
    df->addStringColumn(columns::DATE);
    for (const auto& dim : SalesSchema::dimensionColumns(scheme)) {
        df->addStringColumn(dim);
    }
    df->addStringColumn(columns::TYPE);
    df->addDoubleColumn(columns::ACTUAL_QUANTITY);
    df->addDoubleColumn(columns::PREDICTED_QUANTITY);
    df->addDoubleColumn(columns::YHAT_LOWER);
    df->addDoubleColumn(columns::YHAT_UPPER);
    return df;
}

std::string ForecastMerger::typeName(PointType type) {
    return type == PointType::Actual ? "Actual" : "Forecast";
}

std::vector<ForecastPoint> ForecastMerger::merge(
    const GroupKey& key,
    const MonthlySeries& history,
    const std::vector<PredictedPoint>& predictions
) const {
    std::vector<ForecastPoint> points;
    points.reserve(history.size() + predictions.size());

    for (const auto& month : history.points) {
        ForecastPoint point;
        point.date = month.month;
        point.type = PointType::Actual;
        point.quantity = month.quantity;
        point.key = key;
        points.push_back(std::move(point));
    }

    for (const auto& predicted : predictions) {
        bool future = history.empty() || history.back().month < predicted.date;
        if (!future && !m_options.includeFittedHistory) {
            continue;
        }
        if (predicted.yhat < 0.0) {
            continue;
        }

        ForecastPoint point;
        point.date = predicted.date;
        point.type = PointType::Forecast;
        point.quantity = predicted.yhat;
        point.lower = predicted.lower;
        point.upper = predicted.upper;
        point.key = key;
        points.push_back(std::move(point));
    }

    return points;
}

void ForecastMerger::append(const std::vector<ForecastPoint>& points) {
    auto dims = SalesSchema::dimensionColumns(m_scheme);

    auto dateCol = m_result->getStringColumn(columns::DATE);
    std::vector<std::shared_ptr<StringColumn>> dimCols;
    for (const auto& dim : dims) {
        dimCols.push_back(m_result->getStringColumn(dim));
    }
    auto typeCol = m_result->getStringColumn(columns::TYPE);
    auto actualCol = std::dynamic_pointer_cast<DoubleColumn>(m_result->getColumn(columns::ACTUAL_QUANTITY));
    auto predictedCol = std::dynamic_pointer_cast<DoubleColumn>(m_result->getColumn(columns::PREDICTED_QUANTITY));
    auto lowerCol = std::dynamic_pointer_cast<DoubleColumn>(m_result->getColumn(columns::YHAT_LOWER));
    auto upperCol = std::dynamic_pointer_cast<DoubleColumn>(m_result->getColumn(columns::YHAT_UPPER));

    for (const auto& point : points) {
        if (point.key.values.size() != dims.size()) {
            throw std::invalid_argument("Group key '" + point.key.toString() +
                                        "' does not match scheme " + SalesSchema::schemeName(m_scheme));
        }

        dateCol->push_back(formatDate(point.date));
        for (size_t d = 0; d < dims.size(); ++d) {
            dimCols[d]->push_back(point.key.values[d]);
        }
        typeCol->push_back(typeName(point.type));

        if (point.type == PointType::Actual) {
            actualCol->push_back(point.quantity);
            predictedCol->push_back(DoubleColumn::null());
        } else {
            actualCol->push_back(DoubleColumn::null());
            predictedCol->push_back(point.quantity);
        }
        lowerCol->push_back(point.lower.value_or(DoubleColumn::null()));
        upperCol->push_back(point.upper.value_or(DoubleColumn::null()));
    }

    if (!points.empty()) {
        ++m_groupCount;
    }
}

} // namespace forecast
} // namespace salescast
