/**
 * @file EntropyWeighter.cpp
 * @brief Implementation of EntropyWeighter.
 */

#include "application/engine/EntropyWeighter.hpp"

#include <cmath>

#include "domain/Errors.hpp"

namespace indexforge::application::engine {

using namespace indexforge::domain;

void EntropyWeighter::requireDispersion(const std::string& indicatorKey, const Vec& rawColumn) {
    if (rawColumn.size() == 0) return;
    if (rawColumn.maxCoeff() == rawColumn.minCoeff()) {
        throw DegenerateIndicatorError(indicatorKey);
    }
}

EntropyWeighter::Result EntropyWeighter::weigh(const Mat& standardized, const std::vector<std::string>& indicatorKeys) {
    const Eigen::Index n = standardized.rows();
    const Eigen::Index p = standardized.cols();
    if (n < 2) {
        throw InsufficientDataError("Entropy weighting needs at least 2 observations, got " + std::to_string(n));
    }
    if (standardized.minCoeff() < 0.0 || standardized.maxCoeff() > 1.0) {
        throw ValidationError("Entropy weighting requires min-max standardized values in [0, 1]");
    }

    const double k = 1.0 / std::log(static_cast<double>(n));
    Result result;
    result.provenance.entropy.resize(static_cast<size_t>(p));
    result.provenance.divergence.resize(static_cast<size_t>(p));
    Vec d(p);

    for (Eigen::Index j = 0; j < p; ++j) {
        const auto column = standardized.col(j);
        const double colSum = column.sum();
        if (colSum == 0.0 || column.maxCoeff() == column.minCoeff()) {
            throw DegenerateIndicatorError(indicatorKeys[static_cast<size_t>(j)]);
        }

        double acc = 0.0;
        for (Eigen::Index i = 0; i < n; ++i) {
            const double pij = column(i) / colSum;
            if (pij > 0.0) acc += pij * std::log(pij); // 0 * ln(0) := 0
        }
        const double e = -k * acc;
        d(j) = 1.0 - e;
        result.provenance.entropy[static_cast<size_t>(j)] = e;
        result.provenance.divergence[static_cast<size_t>(j)] = d(j);
    }

    const double total = d.sum();
    if (!(total > 0.0)) {
        throw AllIndicatorsUniformError();
    }
    result.weights = d / total;
    return result;
}

} // namespace indexforge::application::engine
