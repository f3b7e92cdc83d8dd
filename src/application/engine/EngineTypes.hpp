/**
 * @file EngineTypes.hpp
 * @brief Dense matrix aliases and the observation matrix shared by the weighters.
 */

#pragma once

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace indexforge::application::engine {

using Mat = Eigen::MatrixXd;
using Vec = Eigen::VectorXd;

struct ObservationKey {
    std::string datasetId;
    std::string entity;
    int year = 0;
};

/**
 * @struct ObservationMatrix
 * @brief values(row, col): row = observation, col = indicator in indicatorKeys order.
 */
struct ObservationMatrix {
    std::vector<std::string> indicatorKeys;
    std::vector<ObservationKey> rows;
    Mat values;

    size_t observationCount() const { return rows.size(); }
    size_t indicatorCount() const { return indicatorKeys.size(); }
};

} // namespace indexforge::application::engine
