/**
 * @file WeightModelService.hpp
 * @brief Application Service that trains and persists weight models.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "application/ObservationMatrixBuilder.hpp"
#include "application/engine/AhpWeighter.hpp"
#include "application/engine/PcaWeighter.hpp"
#include "domain/repositories/IndicatorCatalog.hpp"
#include "domain/repositories/WeightModelRepository.hpp"

namespace indexforge::application {

/**
 * @class WeightModelService
 * @brief Entry point for trainEntropy / trainPCA / trainAHP.
 *
 * Each call reads its inputs through the injected repositories, produces a new model
 * with a fresh id and persists it. Any training error aborts the call before anything
 * is stored, so a model is never partially trained.
 */
class WeightModelService {
public:
    WeightModelService(std::shared_ptr<const domain::IndicatorCatalog> catalog,
                       std::shared_ptr<const domain::DatasetRepository> datasets,
                       std::shared_ptr<const domain::MappingRepository> mappings,
                       std::shared_ptr<domain::WeightModelRepository> models,
                       double consistencyThreshold = engine::AhpWeighter::kDefaultConsistencyThreshold);

    /** @brief Min-max standardization, entropy weights. */
    domain::WeightModel trainEntropy(const std::vector<std::string>& indicatorKeys,
                                     const std::vector<std::string>& datasetIds,
                                     const std::string& name = "");

    /** @brief Z-score standardization, PCA weights retaining @p cumVarThreshold of the variance. */
    domain::WeightModel trainPCA(const std::vector<std::string>& indicatorKeys,
                                 const std::vector<std::string>& datasetIds,
                                 double cumVarThreshold = engine::PcaWeighter::kDefaultCumVarThreshold,
                                 const std::string& name = "");

    /**
     * @brief AHP weights from pairwise judgments (missing pairs default to 1). The datasets
     *        only supply the standardization parameters.
     */
    domain::WeightModel trainAHP(const std::vector<std::string>& indicatorKeys,
                                 const std::vector<std::string>& datasetIds,
                                 const std::vector<engine::PairwiseJudgment>& judgments,
                                 const std::string& name = "",
                                 domain::StandardizationMethod standardization = domain::StandardizationMethod::ZScore);

    std::vector<domain::WeightModel> listModels() const;
    std::optional<domain::WeightModel> getModel(const std::string& id) const;

private:
    std::vector<domain::Indicator> resolveIndicators(const std::vector<std::string>& indicatorKeys) const;

    domain::WeightModel assemble(domain::WeightMethod method,
                                 const std::string& name,
                                 const std::vector<domain::Indicator>& indicators,
                                 const std::vector<std::string>& datasetIds,
                                 const engine::Mat& standardized,
                                 domain::StandardizationMethod standardization,
                                 const std::vector<domain::StandardizationParams>& params,
                                 const engine::Vec& weights,
                                 domain::MethodProvenance provenance) const;

    std::shared_ptr<const domain::IndicatorCatalog> m_catalog;
    std::shared_ptr<domain::WeightModelRepository> m_models;
    ObservationMatrixBuilder m_matrixBuilder;
    double m_consistencyThreshold;
};

} // namespace indexforge::application
