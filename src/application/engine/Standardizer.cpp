/**
 * @file Standardizer.cpp
 * @brief Implementation of Standardizer.
 */

#include "application/engine/Standardizer.hpp"

#include <algorithm>
#include <cmath>
#include <set>

#include "domain/Errors.hpp"

namespace indexforge::application::engine {

using namespace indexforge::domain;

double Standardizer::applyDirection(double raw, Direction direction) {
    return direction == Direction::Negative ? -raw : raw;
}

StandardizationParams Standardizer::fit(const std::string& indicatorKey,
                                        const std::vector<std::optional<double>>& raw,
                                        Direction direction,
                                        StandardizationMethod method) {
    std::vector<double> values;
    values.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        if (!raw[i] || !std::isfinite(*raw[i])) {
            throw MissingValueError("Indicator '" + indicatorKey + "': missing or non-numeric value at observation " +
                                    std::to_string(i));
        }
        values.push_back(applyDirection(*raw[i], direction));
    }

    std::set<double> distinct(values.begin(), values.end());
    if (distinct.size() < 2) {
        throw InsufficientDataError("Indicator '" + indicatorKey + "': needs at least 2 distinct values, got " +
                                    std::to_string(distinct.size()));
    }

    if (method == StandardizationMethod::MinMax) {
        auto [lo, hi] = std::minmax_element(values.begin(), values.end());
        return MinMaxParams{*lo, *hi};
    }

    const double n = static_cast<double>(values.size());
    double mean = 0.0;
    for (double v : values) mean += v;
    mean /= n;
    double ss = 0.0;
    for (double v : values) ss += (v - mean) * (v - mean);
    return ZScoreParams{mean, std::sqrt(ss / (n - 1.0))};
}

double Standardizer::apply(double raw, Direction direction, const StandardizationParams& params) {
    const double v = applyDirection(raw, direction);
    if (const auto* mm = std::get_if<MinMaxParams>(&params)) {
        const double range = mm->max - mm->min;
        if (range == 0.0) return kMinMaxNeutral;
        return std::clamp((v - mm->min) / range, 0.0, 1.0);
    }
    const auto& z = std::get<ZScoreParams>(params);
    if (z.stddev == 0.0) return kZScoreNeutral;
    return (v - z.mean) / z.stddev;
}

Mat Standardizer::fitTransform(const ObservationMatrix& raw,
                               const std::vector<Direction>& directions,
                               StandardizationMethod method,
                               std::vector<StandardizationParams>& params) {
    const Eigen::Index n = raw.values.rows();
    const Eigen::Index p = raw.values.cols();
    params.clear();
    params.reserve(static_cast<size_t>(p));

    Mat out(n, p);
    for (Eigen::Index j = 0; j < p; ++j) {
        std::vector<std::optional<double>> column(static_cast<size_t>(n));
        for (Eigen::Index i = 0; i < n; ++i) column[static_cast<size_t>(i)] = raw.values(i, j);

        const auto& key = raw.indicatorKeys[static_cast<size_t>(j)];
        const Direction dir = directions[static_cast<size_t>(j)];
        params.push_back(fit(key, column, dir, method));
        for (Eigen::Index i = 0; i < n; ++i) {
            out(i, j) = apply(raw.values(i, j), dir, params.back());
        }
    }
    return out;
}

} // namespace indexforge::application::engine
