/**
 * @file IndicatorCatalog.hpp
 * @brief Interface to the controlled vocabulary of indicators.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/Indicator.hpp"

namespace indexforge::domain {

class IndicatorCatalog {
public:
    virtual ~IndicatorCatalog() = default;

    /** @brief All indicators, sorted by key. */
    virtual std::vector<Indicator> findAll() const = 0;

    virtual std::optional<Indicator> findByKey(const std::string& key) const = 0;

    virtual void upsert(const Indicator& indicator) = 0;

    /**
     * @brief Removes an indicator and drops it from every dataset mapping.
     * Trained models keep their frozen copy of direction and dimension.
     */
    virtual void remove(const std::string& key) = 0;
};

} // namespace indexforge::domain
