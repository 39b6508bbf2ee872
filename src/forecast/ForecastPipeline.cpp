#include "forecast/ForecastPipeline.hpp"
#include "server/Logger.hpp"
#include "server/Profiler.hpp"
#include <cmath>

namespace salescast {
namespace forecast {

using server::ScopedTimer;

ForecastPipeline::ForecastPipeline(PipelineOptions options)
    : m_options(options)
    , m_resampler(options.minObservations)
    , m_engine(options.engine)
{
}

int ForecastPipeline::progressPercent(size_t processed, size_t total) {
    if (total == 0) return 100;
    return static_cast<int>(std::lround(100.0 * static_cast<double>(processed) /
                                        static_cast<double>(total)));
}

PipelineResult ForecastPipeline::run(const DataFrame& sales, const ProgressSink& onProgress) const {
    SalesSchema::validate(sales);

    ScopedTimer timer("forecast.pipeline");

    auto extractor = GroupExtractor::forTable(sales);
    auto groups = extractor.extractGroups(sales);

    LOG_INFO("Using " + SalesSchema::schemeName(extractor.scheme()) + ": " +
             std::to_string(groups.size()) + " combinations");

    ForecastMerger merger(extractor.scheme(), m_options.merger);

    PipelineResult result;
    result.scheme = extractor.scheme();
    result.totalGroups = groups.size();

    for (size_t idx = 0; idx < groups.size(); ++idx) {
        const auto& group = groups[idx];

        MonthlySeries series = m_resampler.resample(sales, group.rows);

        if (!m_resampler.isForecastable(series)) {
            LOG_DEBUG("Skipping " + group.key.toString() + ": " + std::to_string(series.size()) +
                      " monthly points < " + std::to_string(m_resampler.minObservations()));
            ++result.skippedGroups;
        } else {
            std::vector<PredictedPoint> predictions;
            try {
                ScopedTimer fitTimer("forecast.fit");
                predictions = m_engine.forecast(series);
            } catch (const ModelFitError& e) {
                LOG_ERROR("Model fit failed for " + group.key.toString() + ": " + e.what());
                throw ModelFitError("Model fit failed for " + group.key.toString() + ": " + e.what());
            }

            merger.append(merger.merge(group.key, series, predictions));
            ++result.forecastGroups;
        }

        if (onProgress) {
            PipelineProgress progress;
            progress.groupsProcessed = idx + 1;
            progress.totalGroups = groups.size();
            progress.percent = progressPercent(idx + 1, groups.size());
            onProgress(progress);
        }
    }

    result.table = merger.result();

    LOG_INFO("Forecast done: " + std::to_string(result.forecastGroups) + " forecast, " +
             std::to_string(result.skippedGroups) + " skipped, " +
             std::to_string(result.table->rowCount()) + " rows");

    return result;
}

} // namespace forecast
} // namespace salescast
