#pragma once

#include "forecast/ForecastEngine.hpp"
#include "forecast/ForecastMerger.hpp"
#include "forecast/GroupExtractor.hpp"
#include "forecast/MonthlyResampler.hpp"
#include "dataframe/DataFrame.hpp"
#include <functional>

namespace salescast {
namespace forecast {

struct PipelineOptions {
    size_t minObservations = MonthlyResampler::DEFAULT_MIN_OBSERVATIONS;
    ForecastEngineOptions engine;
    ForecastMergerOptions merger;
};

struct PipelineProgress {
    size_t groupsProcessed = 0;
    size_t totalGroups = 0;
    int percent = 0;  // round(groupsProcessed / totalGroups * 100)
};

struct PipelineResult {
    DataFramePtr table;
    GroupingScheme scheme = GroupingScheme::Pair;
    size_t totalGroups = 0;
    size_t forecastGroups = 0;
    size_t skippedGroups = 0;
};

/**
 * Called after every group, skipped or forecast. Throwing from the sink
 * aborts the run (used for cancellation and time budgets).
 */
using ProgressSink = std::function<void(const PipelineProgress&)>;

/**
 * Sales table -> forecast result table
 *
 * Groups are processed sequentially in GroupExtractor order. Any error
 * (malformed date, model fit failure) stops the run; nothing is returned
 * for a failed run.
 */
class ForecastPipeline {
public:
    explicit ForecastPipeline(PipelineOptions options = {});

    /// Throws SchemaError before any grouping when a required column is missing
    PipelineResult run(const DataFrame& sales, const ProgressSink& onProgress = nullptr) const;

    const PipelineOptions& options() const { return m_options; }

    static int progressPercent(size_t processed, size_t total);

private:
    PipelineOptions m_options;
    MonthlyResampler m_resampler;
    ForecastEngine m_engine;
};

} // namespace forecast
} // namespace salescast
