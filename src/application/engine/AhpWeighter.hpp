/**
 * @file AhpWeighter.hpp
 * @brief Analytic Hierarchy Process: weights from a reciprocal pairwise-judgment matrix.
 */

#pragma once

#include <string>
#include <vector>

#include "application/engine/EngineTypes.hpp"
#include "domain/WeightModel.hpp"

namespace indexforge::application::engine {

/**
 * @struct PairwiseJudgment
 * @brief "rowKey is @p value times as important as colKey", value on the 1/9..9 scale.
 */
struct PairwiseJudgment {
    std::string rowKey;
    std::string colKey;
    double value = 1.0;
};

/**
 * @class PairwiseMatrix
 * @brief Builds a reciprocal matrix with unit diagonal from judgments.
 *
 * Reciprocity and the diagonal are enforced by construction; missing pairs default to 1.
 */
class PairwiseMatrix {
public:
    static constexpr double kMinJudgment = 1.0 / 9.0;
    static constexpr double kMaxJudgment = 9.0;

    /**
     * @throws domain::ValidationError on unknown keys, out-of-scale values, a non-unit
     *         self comparison, or a pair given twice with non-reciprocal values.
     */
    static Mat build(const std::vector<std::string>& keys, const std::vector<PairwiseJudgment>& judgments);

    /**
     * @brief Reads the strict upper triangle of a dense matrix as judgments.
     * @throws domain::ValidationError if the matrix is not keys.size() square.
     */
    static std::vector<PairwiseJudgment> fromDense(const std::vector<std::string>& keys,
                                                   const std::vector<std::vector<double>>& dense);
};

class AhpWeighter {
public:
    static constexpr double kDefaultConsistencyThreshold = 0.10;

    struct Result {
        Vec weights;
        domain::AhpProvenance provenance;
    };

    /**
     * @brief Principal eigenvector of @p matrix as weights, with lambda_max, CI and CR.
     *
     * The model is produced regardless of CR; provenance.acceptable is false and a
     * warning is logged when CR >= @p consistencyThreshold.
     *
     * @throws domain::ValidationError if the matrix is empty, not square or not positive.
     * @throws domain::NonConvergentEigenDecompositionError if the solver fails.
     */
    static Result weigh(const Mat& matrix,
                        const std::vector<std::string>& order,
                        double consistencyThreshold = kDefaultConsistencyThreshold);

    /** @brief Saaty random index for an n x n matrix. */
    static double randomIndex(size_t n);
};

} // namespace indexforge::application::engine
