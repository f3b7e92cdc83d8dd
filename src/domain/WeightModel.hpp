/**
 * @file WeightModel.hpp
 * @brief Immutable output of a weighting run: weights, frozen standardization and provenance.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "domain/Indicator.hpp"
#include "domain/StandardizationParams.hpp"

namespace indexforge::domain {

/**
 * @enum WeightMethod
 * @brief The three weighting schemes.
 */
enum class WeightMethod {
    Entropy,
    Pca,
    Ahp
};

inline std::string WeightMethodToString(WeightMethod m) {
    switch (m) {
        case WeightMethod::Entropy: return "entropy";
        case WeightMethod::Pca: return "pca";
        case WeightMethod::Ahp: return "ahp";
    }
    return "entropy";
}

inline std::optional<WeightMethod> WeightMethodFromString(const std::string& s) {
    if (s == "entropy") return WeightMethod::Entropy;
    if (s == "pca") return WeightMethod::Pca;
    if (s == "ahp") return WeightMethod::Ahp;
    return std::nullopt;
}

/// Per-indicator entropy e_j and divergence d_j, in indicatorKeys order.
struct EntropyProvenance {
    std::vector<double> entropy;
    std::vector<double> divergence;
};

struct PcaProvenance {
    std::vector<double> eigenvalues;              ///< All eigenvalues, descending.
    std::vector<double> explainedVarianceRatio;   ///< eigenvalue / total, per component.
    std::vector<double> cumulativeVariance;       ///< Running sum of the ratios.
    std::vector<std::vector<double>> loadings;    ///< loadings[indicator][component], sign-normalized.
    int componentsRetained = 0;
    double threshold = 0.85;
};

struct AhpProvenance {
    std::vector<std::string> order;               ///< Indicator order of the matrix rows/columns.
    std::vector<std::vector<double>> matrix;      ///< Full reciprocal pairwise matrix.
    std::vector<double> priorityVector;           ///< Normalized principal eigenvector.
    double lambdaMax = 0.0;
    double consistencyIndex = 0.0;
    double randomIndex = 0.0;
    double consistencyRatio = 0.0;
    bool acceptable = true;                       ///< consistencyRatio below the configured threshold.
};

/// One concrete payload per method; the alternative always matches WeightModel::method.
using MethodProvenance = std::variant<EntropyProvenance, PcaProvenance, AhpProvenance>;

/**
 * @struct ScoreScaling
 * @brief Training-population range of the raw composite and of each conditional sub-score.
 *
 * For min-max models the range is exactly [0, 1]; for z-score models it is the
 * observed min/max, which maps scores onto 0-100 at apply time.
 */
struct ScoreScaling {
    double scoreMin = 0.0;
    double scoreMax = 1.0;
    std::map<std::string, double> subScoreMin;
    std::map<std::string, double> subScoreMax;
};

/**
 * @struct WeightModel
 * @brief Trained weighting scheme. Never mutated after creation.
 */
struct WeightModel {
    std::string id;
    std::string name;
    std::string createdAt;
    WeightMethod method = WeightMethod::Entropy;
    std::vector<std::string> indicatorKeys;
    std::map<std::string, double> weights;            ///< Sums to 1.
    std::map<std::string, double> dimension2Weights;  ///< Sums to 1; sum of member weights.
    std::map<std::string, std::string> dimensions;    ///< indicatorKey -> dimension2Key (frozen).
    std::map<std::string, Direction> directions;      ///< indicatorKey -> direction (frozen).
    StandardizationMethod standardizationMethod = StandardizationMethod::MinMax;
    std::map<std::string, StandardizationParams> standardizationParams;
    ScoreScaling scaling;
    std::vector<std::string> trainedOnDatasetIds;
    MethodProvenance provenance;

    /** @brief Dimension keys in sorted order. */
    std::vector<std::string> dimensionKeys() const {
        std::vector<std::string> keys;
        for (const auto& [dim, w] : dimension2Weights) keys.push_back(dim);
        return keys;
    }
};

} // namespace indexforge::domain
