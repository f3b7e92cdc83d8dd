/**
 * @file WeightModelRepository.hpp
 * @brief Interface for persisting trained weight models.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/WeightModel.hpp"

namespace indexforge::domain {

class WeightModelRepository {
public:
    virtual ~WeightModelRepository() = default;

    /** @brief Stores a freshly trained model. Models are never updated in place. */
    virtual void save(const WeightModel& model) = 0;

    virtual std::optional<WeightModel> findById(const std::string& id) const = 0;

    /** @brief All models, newest first. */
    virtual std::vector<WeightModel> findAll() const = 0;
};

} // namespace indexforge::domain
