/**
 * @file ScoreScaler.hpp
 * @brief Composite and conditional sub-scores, and their mapping onto 0-100.
 */

#pragma once

#include <map>
#include <string>
#include <vector>

#include "application/engine/EngineTypes.hpp"
#include "domain/WeightModel.hpp"

namespace indexforge::application::engine {

/**
 * @class CompositeScorer
 * @brief Weighted sums over a standardized observation.
 *
 * scoreRaw = sum_j w_j * x_j; the sub-score of a dimension is the same sum restricted
 * to its members, divided by the dimension weight.
 */
class CompositeScorer {
public:
    struct Scores {
        double scoreRaw = 0.0;
        std::map<std::string, double> subScoreRaw;
    };

    CompositeScorer(const std::vector<std::string>& indicatorKeys,
                    const std::map<std::string, double>& weights,
                    const std::map<std::string, std::string>& dimensions,
                    const std::map<std::string, double>& dimension2Weights);

    /** @brief @p standardized holds one value per indicator, in indicatorKeys order. */
    Scores score(const Vec& standardized) const;

    /** @brief Dimensions that receive a sub-score (positive aggregate weight), sorted. */
    const std::vector<std::string>& scoredDimensions() const { return m_scoredDimensions; }

private:
    Vec m_weights;
    std::map<std::string, std::vector<Eigen::Index>> m_members;
    std::map<std::string, double> m_dimensionWeights;
    std::vector<std::string> m_scoredDimensions;
};

class ScoreScaler {
public:
    /// Output for a degenerate (max == min) scaling range.
    static constexpr double kNeutralIndex = 50.0;

    /**
     * @brief Freezes the scaling range. Min-max models get exactly [0, 1]; z-score
     *        models get the observed range of the training scores.
     */
    static domain::ScoreScaling fit(domain::StandardizationMethod method,
                                    const std::vector<CompositeScorer::Scores>& trainingScores,
                                    const std::vector<std::string>& dimensions);

    /** @brief 100 * (value - min) / (max - min), clamped to [0, 100]. */
    static double toIndex(double value, double min, double max);
};

} // namespace indexforge::application::engine
