/**
 * @file ScoreScaler.cpp
 * @brief Implementation of CompositeScorer and ScoreScaler.
 */

#include "application/engine/ScoreScaler.hpp"

#include <algorithm>
#include <limits>

namespace indexforge::application::engine {

using namespace indexforge::domain;

CompositeScorer::CompositeScorer(const std::vector<std::string>& indicatorKeys,
                                 const std::map<std::string, double>& weights,
                                 const std::map<std::string, std::string>& dimensions,
                                 const std::map<std::string, double>& dimension2Weights)
    : m_weights(static_cast<Eigen::Index>(indicatorKeys.size())) {
    for (size_t j = 0; j < indicatorKeys.size(); ++j) {
        const auto& key = indicatorKeys[j];
        auto w = weights.find(key);
        m_weights(static_cast<Eigen::Index>(j)) = w == weights.end() ? 0.0 : w->second;
        auto d = dimensions.find(key);
        const std::string dim = (d == dimensions.end() || d->second.empty()) ? std::string(kDefaultDimension) : d->second;
        m_members[dim].push_back(static_cast<Eigen::Index>(j));
    }
    for (const auto& [dim, members] : m_members) {
        auto w = dimension2Weights.find(dim);
        const double dimWeight = w == dimension2Weights.end() ? 0.0 : w->second;
        if (dimWeight > 0.0) {
            m_dimensionWeights[dim] = dimWeight;
            m_scoredDimensions.push_back(dim);
        }
    }
}

CompositeScorer::Scores CompositeScorer::score(const Vec& standardized) const {
    Scores out;
    out.scoreRaw = m_weights.dot(standardized);
    for (const auto& [dim, dimWeight] : m_dimensionWeights) {
        double acc = 0.0;
        for (Eigen::Index j : m_members.at(dim)) acc += m_weights(j) * standardized(j);
        out.subScoreRaw[dim] = acc / dimWeight;
    }
    return out;
}

ScoreScaling ScoreScaler::fit(StandardizationMethod method,
                              const std::vector<CompositeScorer::Scores>& trainingScores,
                              const std::vector<std::string>& dimensions) {
    ScoreScaling scaling;
    if (method == StandardizationMethod::MinMax) {
        scaling.scoreMin = 0.0;
        scaling.scoreMax = 1.0;
        for (const auto& dim : dimensions) {
            scaling.subScoreMin[dim] = 0.0;
            scaling.subScoreMax[dim] = 1.0;
        }
        return scaling;
    }

    constexpr double inf = std::numeric_limits<double>::infinity();
    scaling.scoreMin = inf;
    scaling.scoreMax = -inf;
    for (const auto& dim : dimensions) {
        scaling.subScoreMin[dim] = inf;
        scaling.subScoreMax[dim] = -inf;
    }
    for (const auto& s : trainingScores) {
        scaling.scoreMin = std::min(scaling.scoreMin, s.scoreRaw);
        scaling.scoreMax = std::max(scaling.scoreMax, s.scoreRaw);
        for (const auto& [dim, value] : s.subScoreRaw) {
            scaling.subScoreMin[dim] = std::min(scaling.subScoreMin[dim], value);
            scaling.subScoreMax[dim] = std::max(scaling.subScoreMax[dim], value);
        }
    }
    if (trainingScores.empty()) {
        scaling.scoreMin = scaling.scoreMax = 0.0;
        for (const auto& dim : dimensions) scaling.subScoreMin[dim] = scaling.subScoreMax[dim] = 0.0;
    }
    return scaling;
}

double ScoreScaler::toIndex(double value, double min, double max) {
    const double range = max - min;
    if (range == 0.0) return kNeutralIndex;
    return std::clamp(100.0 * (value - min) / range, 0.0, 100.0);
}

} // namespace indexforge::application::engine
