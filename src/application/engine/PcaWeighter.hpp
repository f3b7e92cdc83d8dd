/**
 * @file PcaWeighter.hpp
 * @brief Weights from principal-component loadings of z-scored data.
 */

#pragma once

#include <string>
#include <vector>

#include "application/engine/EngineTypes.hpp"
#include "domain/WeightModel.hpp"

namespace indexforge::application::engine {

class PcaWeighter {
public:
    static constexpr double kDefaultCumVarThreshold = 0.85;

    struct Result {
        Vec weights;                      ///< Sums to 1, each in [0, 1].
        domain::PcaProvenance provenance;
    };

    /**
     * @brief Eigen-decomposes the correlation matrix of the z-scored data and keeps
     *        the smallest number of components reaching @p cumVarThreshold.
     *
     * Weight of indicator j is sum over retained components c of |loading_jc| * eigenvalue_c,
     * renormalized to 1. Each component is sign-normalized so that its
     * largest-magnitude loading is positive.
     *
     * @throws domain::ValidationError if the threshold is not in (0, 1].
     * @throws domain::InsufficientObservationsError if observations <= indicators.
     * @throws domain::NonConvergentEigenDecompositionError if the solver fails.
     * @throws domain::NumericalError on non-finite input or zero total variance.
     */
    static Result weigh(const Mat& zscored, double cumVarThreshold = kDefaultCumVarThreshold);

    /** @brief Flips each column so that its largest-magnitude entry is positive (first on ties). */
    static void normalizeSigns(Mat& eigenvectors);
};

} // namespace indexforge::application::engine
