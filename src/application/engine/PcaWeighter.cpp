/**
 * @file PcaWeighter.cpp
 * @brief Implementation of PcaWeighter.
 */

#include "application/engine/PcaWeighter.hpp"

#include <Eigen/Eigenvalues>
#include <cmath>

#include "domain/Errors.hpp"

namespace indexforge::application::engine {

using namespace indexforge::domain;

namespace {
// Slack on the cumulative-variance comparison so that a threshold of 1.0 is reachable.
constexpr double kCumulativeTolerance = 1e-12;
}

void PcaWeighter::normalizeSigns(Mat& eigenvectors) {
    for (Eigen::Index c = 0; c < eigenvectors.cols(); ++c) {
        Eigen::Index pivot = 0;
        for (Eigen::Index r = 1; r < eigenvectors.rows(); ++r) {
            if (std::abs(eigenvectors(r, c)) > std::abs(eigenvectors(pivot, c))) pivot = r;
        }
        if (eigenvectors(pivot, c) < 0.0) eigenvectors.col(c) *= -1.0;
    }
}

PcaWeighter::Result PcaWeighter::weigh(const Mat& zscored, double cumVarThreshold) {
    if (!(cumVarThreshold > 0.0 && cumVarThreshold <= 1.0)) {
        throw ValidationError("Cumulative variance threshold must be in (0, 1], got " + std::to_string(cumVarThreshold));
    }
    const Eigen::Index n = zscored.rows();
    const Eigen::Index p = zscored.cols();
    if (p == 0) {
        throw ValidationError("PCA needs at least one indicator");
    }
    if (n <= p) {
        throw InsufficientObservationsError(static_cast<size_t>(n), static_cast<size_t>(p));
    }
    if (!zscored.allFinite()) {
        throw NumericalError("PCA input contains non-finite values");
    }

    // Covariance of z-scored columns, i.e. the correlation matrix of the raw data.
    const Mat centered = zscored.rowwise() - zscored.colwise().mean();
    const Mat cov = (centered.adjoint() * centered) / static_cast<double>(n - 1);

    Eigen::SelfAdjointEigenSolver<Mat> solver(cov);
    if (solver.info() != Eigen::Success) {
        throw NonConvergentEigenDecompositionError("PCA covariance matrix (" + std::to_string(p) + "x" +
                                                   std::to_string(p) + ")");
    }

    // Solver returns ascending order; reverse to descending.
    Vec eigenvalues = solver.eigenvalues().reverse();
    Mat eigenvectors = solver.eigenvectors().rowwise().reverse();
    for (Eigen::Index c = 0; c < p; ++c) {
        if (eigenvalues(c) < 0.0) eigenvalues(c) = 0.0;
    }
    normalizeSigns(eigenvectors);

    const double total = eigenvalues.sum();
    if (!(total > 0.0)) {
        throw NumericalError("PCA covariance matrix has zero total variance");
    }

    Result result;
    auto& prov = result.provenance;
    prov.threshold = cumVarThreshold;
    double running = 0.0;
    int retained = 0;
    for (Eigen::Index c = 0; c < p; ++c) {
        const double ratio = eigenvalues(c) / total;
        running += ratio;
        prov.eigenvalues.push_back(eigenvalues(c));
        prov.explainedVarianceRatio.push_back(ratio);
        prov.cumulativeVariance.push_back(running);
        if (retained == 0 && running >= cumVarThreshold - kCumulativeTolerance) {
            retained = static_cast<int>(c) + 1;
        }
    }
    if (retained == 0) retained = static_cast<int>(p);
    prov.componentsRetained = retained;

    prov.loadings.assign(static_cast<size_t>(p), std::vector<double>(static_cast<size_t>(p), 0.0));
    for (Eigen::Index j = 0; j < p; ++j) {
        for (Eigen::Index c = 0; c < p; ++c) {
            prov.loadings[static_cast<size_t>(j)][static_cast<size_t>(c)] = eigenvectors(j, c);
        }
    }

    Vec raw = Vec::Zero(p);
    for (int c = 0; c < retained; ++c) {
        raw += eigenvectors.col(c).cwiseAbs() * eigenvalues(c);
    }
    const double s = raw.sum();
    if (!(s > 0.0)) {
        throw NumericalError("PCA produced an all-zero weight vector");
    }
    result.weights = raw / s;
    return result;
}

} // namespace indexforge::application::engine
