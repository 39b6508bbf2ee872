#include "forecast/ForecastEngine.hpp"
#include <boost/math/distributions/normal.hpp>
#include <algorithm>
#include <cmath>
#include <set>

namespace salescast {
namespace forecast {

namespace {

constexpr double PI = 3.14159265358979323846;
constexpr double SEASON_LENGTH = 12.0;   // months
constexpr int MAX_FOURIER_ORDER = 5;     // order 6 is aliased at monthly sampling
constexpr int MIN_SEASONAL_SPAN = 24;    // months

} // anonymous namespace

ForecastEngine::ForecastEngine(ForecastEngineOptions options)
    : m_options(options)
{
    if (m_options.horizon < 1) {
        throw std::invalid_argument("Forecast horizon must be >= 1");
    }
    if (m_options.fourierOrder < 0) {
        throw std::invalid_argument("Fourier order must be >= 0");
    }
    if (!(m_options.intervalWidth > 0.0 && m_options.intervalWidth < 1.0)) {
        throw std::invalid_argument("Interval width must be in (0, 1)");
    }

    boost::math::normal_distribution<double> normal;
    m_z = boost::math::quantile(normal, 0.5 + m_options.intervalWidth / 2.0);
}

int ForecastEngine::effectiveFourierOrder(size_t observations, int spanMonths, size_t seasonalPhases) const {
    if (spanMonths < MIN_SEASONAL_SPAN) {
        return 0;
    }
    // 2 + 2N parameters, at least 2 residual degrees of freedom
    int byData = observations >= 4 ? static_cast<int>((observations - 4) / 2) : 0;
    // 1 + 2N seasonal columns need as many distinct months of the year
    int byPhases = seasonalPhases >= 1 ? static_cast<int>((seasonalPhases - 1) / 2) : 0;
    return std::max(0, std::min({m_options.fourierOrder, MAX_FOURIER_ORDER, byData, byPhases}));
}

Eigen::RowVectorXd ForecastEngine::designRow(double t, int fourierOrder) {
    Eigen::RowVectorXd row(2 + 2 * fourierOrder);
    row(0) = 1.0;
    row(1) = t;
    for (int n = 1; n <= fourierOrder; ++n) {
        double angle = 2.0 * PI * n * t / SEASON_LENGTH;
        row(2 * n) = std::cos(angle);
        row(2 * n + 1) = std::sin(angle);
    }
    return row;
}

ForecastEngine::FittedModel ForecastEngine::fit(
    const std::vector<double>& t,
    const std::vector<double>& y,
    int fourierOrder
) const {
    const Eigen::Index n = static_cast<Eigen::Index>(y.size());

    Eigen::VectorXd Y(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        if (!std::isfinite(y[static_cast<size_t>(i)])) {
            throw ModelFitError("Series contains a non-finite quantity");
        }
        Y(i) = y[static_cast<size_t>(i)];
    }

    // Harmoniques repliées sur les mois observés: on descend l'ordre
    // jusqu'à une matrice de plein rang (tendance seule au pire)
    for (int order = fourierOrder; order >= 0; --order) {
        const Eigen::Index p = 2 + 2 * order;
        if (n < p + 1) {
            if (order > 0) continue;
            throw ModelFitError("Not enough observations (" + std::to_string(n) +
                                ") for " + std::to_string(p) + " parameters");
        }

        Eigen::MatrixXd X(n, p);
        for (Eigen::Index i = 0; i < n; ++i) {
            X.row(i) = designRow(t[static_cast<size_t>(i)], order);
        }

        Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(X);
        if (qr.rank() < p) {
            if (order > 0) continue;
            throw ModelFitError("Degenerate design matrix (rank " + std::to_string(qr.rank()) +
                                " < " + std::to_string(p) + ")");
        }

        FittedModel model;
        model.coefficients = qr.solve(Y);
        model.fourierOrder = order;
        model.observations = static_cast<size_t>(n);

        if (!model.coefficients.allFinite()) {
            throw ModelFitError("Model coefficients are not finite");
        }

        Eigen::VectorXd residuals = Y - X * model.coefficients;
        double dof = static_cast<double>(n - p);
        model.sigma = std::sqrt(residuals.squaredNorm() / dof);

        if (!std::isfinite(model.sigma)) {
            throw ModelFitError("Residual variance is not finite");
        }
        return model;
    }

    throw ModelFitError("Invalid Fourier order " + std::to_string(fourierOrder));
}

std::vector<PredictedPoint> ForecastEngine::forecast(const MonthlySeries& series) const {
    if (series.size() < 3) {
        throw ModelFitError("Series too short to fit (" + std::to_string(series.size()) + " points)");
    }

    const CalendarDate& first = series.points.front().month;
    std::vector<double> t;
    std::vector<double> y;
    t.reserve(series.size());
    y.reserve(series.size());
    for (const auto& point : series.points) {
        t.push_back(static_cast<double>(monthIndex(point.month) - monthIndex(first)));
        y.push_back(point.quantity);
    }

    int span = static_cast<int>(t.back()) + 1;
    std::set<int> phases;
    for (double tValue : t) {
        phases.insert(static_cast<int>(tValue) % 12);
    }
    FittedModel model = fit(t, y, effectiveFourierOrder(series.size(), span, phases.size()));

    std::vector<PredictedPoint> predictions;
    predictions.reserve(series.size() + static_cast<size_t>(m_options.horizon));

    auto predictAt = [&](const CalendarDate& date, double tValue, double widen, bool inSample) {
        double yhat = designRow(tValue, model.fourierOrder).dot(model.coefficients);
        if (yhat < 0.0) {
            return;  // la demande ne peut pas être négative
        }
        double half = m_z * model.sigma * widen;
        predictions.push_back(PredictedPoint{date, yhat, yhat - half, yhat + half, inSample});
    };

    for (size_t i = 0; i < series.size(); ++i) {
        predictAt(series.points[i].month, t[i], 1.0, true);
    }

    const CalendarDate& last = series.back().month;
    double n = static_cast<double>(model.observations);
    for (int h = 1; h <= m_options.horizon; ++h) {
        predictAt(addMonths(last, h), t.back() + h, std::sqrt(1.0 + h / n), false);
    }

    return predictions;
}

} // namespace forecast
} // namespace salescast
