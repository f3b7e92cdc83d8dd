/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/CatalogService.hpp"
#include "application/DatasetService.hpp"
#include "application/IndexComputationService.hpp"
#include "application/WeightModelService.hpp"
#include "infrastructure/JsonStore.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace indexforge::application {

struct AppServices {
    std::unique_ptr<CatalogService> catalogService;
    std::unique_ptr<DatasetService> datasetService;
    std::unique_ptr<WeightModelService> weightModelService;
    std::unique_ptr<IndexComputationService> indexComputationService;
    std::shared_ptr<infrastructure::JsonStore> store;
    std::shared_ptr<infrastructure::PersistenceService> persistenceService;
};

} // namespace indexforge::application
