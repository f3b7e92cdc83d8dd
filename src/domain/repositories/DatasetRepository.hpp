/**
 * @file DatasetRepository.hpp
 * @brief Interface for storage and retrieval of imported datasets.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/Dataset.hpp"

namespace indexforge::domain {

class DatasetRepository {
public:
    virtual ~DatasetRepository() = default;

    /** @brief Creates or replaces a dataset (metadata and rows). */
    virtual void save(const Dataset& dataset) = 0;

    virtual std::optional<Dataset> findById(const std::string& id) const = 0;

    /** @brief All datasets, newest first. */
    virtual std::vector<Dataset> findAll() const = 0;
};

} // namespace indexforge::domain
