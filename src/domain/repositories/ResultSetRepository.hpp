/**
 * @file ResultSetRepository.hpp
 * @brief Interface for persisting aggregation results.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/ResultSet.hpp"

namespace indexforge::domain {

class ResultSetRepository {
public:
    virtual ~ResultSetRepository() = default;

    virtual void save(const ResultSet& result) = 0;

    virtual std::optional<ResultSet> findById(const std::string& id) const = 0;

    /** @brief All result sets, newest first. */
    virtual std::vector<ResultSet> findAll() const = 0;
};

} // namespace indexforge::domain
