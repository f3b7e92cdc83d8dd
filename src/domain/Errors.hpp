/**
 * @file Errors.hpp
 * @brief Exception taxonomy for training, aggregation and storage lookups.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace indexforge::domain {

/**
 * @class EngineError
 * @brief Base class of every error raised by the index engine and its services.
 */
class EngineError : public std::runtime_error {
public:
    explicit EngineError(const std::string& message) : std::runtime_error(message) {}

    /** @brief Stable short name of the error kind (used in API error bodies). */
    virtual const char* kind() const noexcept { return "EngineError"; }
};

// --- Validation -----------------------------------------------------------

class ValidationError : public EngineError {
public:
    explicit ValidationError(const std::string& message) : EngineError(message) {}
    const char* kind() const noexcept override { return "ValidationError"; }
};

/// Indicator has no mapped column, or the mapped column is absent from the dataset.
class MissingMappingError : public ValidationError {
public:
    MissingMappingError(const std::string& datasetId, const std::string& indicatorKey, const std::string& detail)
        : ValidationError("Dataset " + datasetId + ": indicator '" + indicatorKey + "' " + detail),
          m_indicatorKey(indicatorKey) {}
    const char* kind() const noexcept override { return "MissingMappingError"; }
    const std::string& indicatorKey() const { return m_indicatorKey; }

private:
    std::string m_indicatorKey;
};

// --- Data quality ---------------------------------------------------------

class DataQualityError : public EngineError {
public:
    explicit DataQualityError(const std::string& message) : EngineError(message) {}
    const char* kind() const noexcept override { return "DataQualityError"; }
};

class MissingValueError : public DataQualityError {
public:
    explicit MissingValueError(const std::string& message) : DataQualityError(message) {}
    const char* kind() const noexcept override { return "MissingValueError"; }
};

/// Fewer than two observations, or fewer than two distinct values (degenerate scale).
class InsufficientDataError : public DataQualityError {
public:
    explicit InsufficientDataError(const std::string& message) : DataQualityError(message) {}
    const char* kind() const noexcept override { return "InsufficientDataError"; }
};

/// The indicator carries no information and cannot be weighted.
class DegenerateIndicatorError : public DataQualityError {
public:
    explicit DegenerateIndicatorError(const std::string& indicatorKey)
        : DataQualityError("Indicator '" + indicatorKey + "' carries no information (zero column sum or constant column)"),
          m_indicatorKey(indicatorKey) {}
    const char* kind() const noexcept override { return "DegenerateIndicatorError"; }
    const std::string& indicatorKey() const { return m_indicatorKey; }

private:
    std::string m_indicatorKey;
};

class AllIndicatorsUniformError : public DataQualityError {
public:
    AllIndicatorsUniformError()
        : DataQualityError("Every indicator has maximal entropy; no discriminative information to weight") {}
    const char* kind() const noexcept override { return "AllIndicatorsUniformError"; }
};

class InsufficientObservationsError : public DataQualityError {
public:
    InsufficientObservationsError(size_t observations, size_t indicators)
        : DataQualityError("PCA needs more observations than indicators (got " + std::to_string(observations) +
                           " observations for " + std::to_string(indicators) + " indicators)") {}
    const char* kind() const noexcept override { return "InsufficientObservationsError"; }
};

// --- Numerical ------------------------------------------------------------

class NumericalError : public EngineError {
public:
    explicit NumericalError(const std::string& message) : EngineError(message) {}
    const char* kind() const noexcept override { return "NumericalError"; }
};

class NonConvergentEigenDecompositionError : public NumericalError {
public:
    explicit NonConvergentEigenDecompositionError(const std::string& where)
        : NumericalError("Eigen-decomposition did not converge: " + where) {}
    const char* kind() const noexcept override { return "NonConvergentEigenDecompositionError"; }
};

// --- Lookup ---------------------------------------------------------------

class NotFoundError : public EngineError {
public:
    NotFoundError(const std::string& what, const std::string& id)
        : EngineError(what + " not found: " + id) {}
    const char* kind() const noexcept override { return "NotFoundError"; }
};

} // namespace indexforge::domain
