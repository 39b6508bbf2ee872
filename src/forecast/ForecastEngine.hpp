#pragma once

#include "forecast/MonthlyResampler.hpp"
#include "util/DateUtil.hpp"
#include <Eigen/Dense>
#include <stdexcept>
#include <string>
#include <vector>

namespace salescast {
namespace forecast {

/**
 * The model could not be fitted to a group's series
 */
class ModelFitError : public std::runtime_error {
public:
    explicit ModelFitError(const std::string& message)
        : std::runtime_error(message) {}
};

struct PredictedPoint {
    CalendarDate date;     // month end
    double yhat = 0.0;
    double lower = 0.0;
    double upper = 0.0;
    bool inSample = false; // true on the fitted historical span
};

struct ForecastEngineOptions {
    int horizon = 12;            // months
    int fourierOrder = 3;        // yearly seasonality terms
    double intervalWidth = 0.80;
};

/**
 * Additive trend + yearly seasonality regression
 *
 *   y(t) = k*t + m + sum_{n=1..N} a_n cos(2*pi*n*t/12) + b_n sin(2*pi*n*t/12)
 *
 * with t in months since the first observation, fitted by least squares.
 * Seasonality is only used when the history spans two full years; N is
 * reduced so that at least two residual degrees of freedom remain and so
 * that the observed months of the year can identify every harmonic. A
 * rank-deficient design falls back to a lower order, down to trend only.
 * Intervals are yhat +/- z*sigma, widening with the distance to the last
 * observation.
 */
class ForecastEngine {
public:
    explicit ForecastEngine(ForecastEngineOptions options = {});

    /**
     * Fits the series and predicts its historical span plus `horizon` months.
     * Points with a negative estimate are dropped.
     * Throws ModelFitError when the fit is degenerate.
     */
    std::vector<PredictedPoint> forecast(const MonthlySeries& series) const;

    const ForecastEngineOptions& options() const { return m_options; }

    /// Fourier order for `observations` points spanning `spanMonths` and
    /// covering `seasonalPhases` distinct months of the year
    int effectiveFourierOrder(size_t observations, int spanMonths, size_t seasonalPhases = 12) const;

private:
    struct FittedModel {
        Eigen::VectorXd coefficients;
        int fourierOrder = 0;
        double sigma = 0.0;
        size_t observations = 0;
    };

    FittedModel fit(const std::vector<double>& t, const std::vector<double>& y, int fourierOrder) const;

    static Eigen::RowVectorXd designRow(double t, int fourierOrder);

    ForecastEngineOptions m_options;
    double m_z;
};

} // namespace forecast
} // namespace salescast
