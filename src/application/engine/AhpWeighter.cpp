/**
 * @file AhpWeighter.cpp
 * @brief Implementation of PairwiseMatrix and AhpWeighter.
 */

#include "application/engine/AhpWeighter.hpp"

#include <Eigen/Eigenvalues>
#include <algorithm>
#include <array>
#include <cmath>
#include <iostream>
#include <map>

#include "domain/Errors.hpp"

namespace indexforge::application::engine {

using namespace indexforge::domain;

namespace {

constexpr double kReciprocalTolerance = 1e-6;

// Saaty random consistency index, n = 1..15.
constexpr std::array<double, 15> kRandomIndex = {
    0.0, 0.0, 0.58, 0.90, 1.12, 1.24, 1.32, 1.41, 1.45, 1.49, 1.51, 1.48, 1.56, 1.57, 1.59
};

std::string FormatJudgment(const PairwiseJudgment& j) {
    return "(" + j.rowKey + ", " + j.colKey + ") = " + std::to_string(j.value);
}

} // namespace

Mat PairwiseMatrix::build(const std::vector<std::string>& keys, const std::vector<PairwiseJudgment>& judgments) {
    std::map<std::string, Eigen::Index> index;
    for (size_t i = 0; i < keys.size(); ++i) {
        if (!index.emplace(keys[i], static_cast<Eigen::Index>(i)).second) {
            throw ValidationError("Duplicate indicator in pairwise matrix: " + keys[i]);
        }
    }

    const Eigen::Index n = static_cast<Eigen::Index>(keys.size());
    Mat m = Mat::Ones(n, n);
    // Tracks which cells were set explicitly, to detect conflicting duplicates.
    Eigen::Matrix<bool, Eigen::Dynamic, Eigen::Dynamic> given =
        Eigen::Matrix<bool, Eigen::Dynamic, Eigen::Dynamic>::Constant(n, n, false);

    for (const auto& j : judgments) {
        auto row = index.find(j.rowKey);
        auto col = index.find(j.colKey);
        if (row == index.end() || col == index.end()) {
            throw ValidationError("Pairwise judgment references an indicator outside the model: " + FormatJudgment(j));
        }
        if (!std::isfinite(j.value) || j.value < kMinJudgment - 1e-12 || j.value > kMaxJudgment + 1e-12) {
            throw ValidationError("Pairwise judgment outside the 1/9..9 scale: " + FormatJudgment(j));
        }
        const Eigen::Index a = row->second;
        const Eigen::Index b = col->second;
        if (a == b) {
            if (std::abs(j.value - 1.0) > kReciprocalTolerance) {
                throw ValidationError("Self comparison must be 1: " + FormatJudgment(j));
            }
            continue;
        }
        if (given(a, b) && std::abs(m(a, b) - j.value) > kReciprocalTolerance) {
            throw ValidationError("Conflicting pairwise judgments for " + FormatJudgment(j));
        }
        m(a, b) = j.value;
        m(b, a) = 1.0 / j.value;
        given(a, b) = true;
        given(b, a) = true;
    }
    return m;
}

std::vector<PairwiseJudgment> PairwiseMatrix::fromDense(const std::vector<std::string>& keys,
                                                        const std::vector<std::vector<double>>& dense) {
    if (dense.size() != keys.size()) {
        throw ValidationError("AHP matrix must have one row per indicator (" + std::to_string(keys.size()) +
                              "), got " + std::to_string(dense.size()));
    }
    std::vector<PairwiseJudgment> judgments;
    for (size_t i = 0; i < dense.size(); ++i) {
        if (dense[i].size() != keys.size()) {
            throw ValidationError("AHP matrix must be square; row " + std::to_string(i) + " has " +
                                  std::to_string(dense[i].size()) + " entries");
        }
        for (size_t j = i + 1; j < dense[i].size(); ++j) {
            judgments.push_back({keys[i], keys[j], dense[i][j]});
        }
    }
    return judgments;
}

double AhpWeighter::randomIndex(size_t n) {
    if (n == 0) return 0.0;
    if (n > kRandomIndex.size()) return kRandomIndex.back();
    return kRandomIndex[n - 1];
}

AhpWeighter::Result AhpWeighter::weigh(const Mat& matrix, const std::vector<std::string>& order, double consistencyThreshold) {
    const Eigen::Index n = matrix.rows();
    if (n == 0 || matrix.cols() != n) {
        throw ValidationError("AHP matrix must be square and non-empty");
    }
    if (static_cast<size_t>(n) != order.size()) {
        throw ValidationError("AHP matrix size does not match the indicator list");
    }
    if (!matrix.allFinite() || matrix.minCoeff() <= 0.0) {
        throw ValidationError("AHP matrix entries must be positive and finite");
    }

    Eigen::EigenSolver<Mat> solver(matrix);
    if (solver.info() != Eigen::Success) {
        throw NonConvergentEigenDecompositionError("AHP pairwise matrix (" + std::to_string(n) + "x" +
                                                   std::to_string(n) + ")");
    }

    // Perron root: the eigenvalue with the largest real part.
    const auto eigenvalues = solver.eigenvalues();
    Eigen::Index dominant = 0;
    for (Eigen::Index i = 1; i < n; ++i) {
        if (eigenvalues(i).real() > eigenvalues(dominant).real()) dominant = i;
    }
    const double lambdaMax = eigenvalues(dominant).real();
    Vec vec = solver.eigenvectors().col(dominant).real().cwiseAbs();
    const double vecSum = vec.sum();
    if (!(vecSum > 0.0)) {
        throw NumericalError("AHP principal eigenvector is zero");
    }

    Result result;
    result.weights = vec / vecSum;

    auto& prov = result.provenance;
    prov.order = order;
    prov.matrix.assign(static_cast<size_t>(n), std::vector<double>(static_cast<size_t>(n)));
    for (Eigen::Index i = 0; i < n; ++i) {
        for (Eigen::Index j = 0; j < n; ++j) {
            prov.matrix[static_cast<size_t>(i)][static_cast<size_t>(j)] = matrix(i, j);
        }
        prov.priorityVector.push_back(result.weights(i));
    }
    prov.lambdaMax = lambdaMax;
    // lambda_max >= n for positive reciprocal matrices; clamp round-off below zero.
    prov.consistencyIndex = n <= 2 ? 0.0 : std::max(0.0, (lambdaMax - static_cast<double>(n)) / static_cast<double>(n - 1));
    prov.randomIndex = randomIndex(static_cast<size_t>(n));
    prov.consistencyRatio = prov.randomIndex == 0.0 ? 0.0 : prov.consistencyIndex / prov.randomIndex;
    prov.acceptable = prov.consistencyRatio < consistencyThreshold;

    if (!prov.acceptable) {
        std::cerr << "[AhpWeighter] WARNING: consistency ratio " << prov.consistencyRatio
                  << " >= " << consistencyThreshold << " (lambda_max=" << lambdaMax
                  << "); judgments are inconsistent but the model is still created." << std::endl;
    }
    return result;
}

} // namespace indexforge::application::engine
