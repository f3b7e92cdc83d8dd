/**
 * @file WeightModelService.cpp
 * @brief Implementation of WeightModelService.
 */

#include "application/WeightModelService.hpp"

#include <iostream>
#include <set>
#include <utility>

#include "application/Identifiers.hpp"
#include "application/engine/EntropyWeighter.hpp"
#include "application/engine/ScoreScaler.hpp"
#include "application/engine/Standardizer.hpp"
#include "domain/Errors.hpp"

namespace indexforge::application {

using namespace indexforge::domain;
using namespace indexforge::application::engine;

namespace {

std::vector<Direction> DirectionsOf(const std::vector<Indicator>& indicators) {
    std::vector<Direction> directions;
    directions.reserve(indicators.size());
    for (const auto& ind : indicators) directions.push_back(ind.direction);
    return directions;
}

std::string DefaultName(WeightMethod method) {
    return "Model / " + WeightMethodToString(method) + " / " + NowIso();
}

} // namespace

WeightModelService::WeightModelService(std::shared_ptr<const IndicatorCatalog> catalog,
                                       std::shared_ptr<const DatasetRepository> datasets,
                                       std::shared_ptr<const MappingRepository> mappings,
                                       std::shared_ptr<WeightModelRepository> models,
                                       double consistencyThreshold)
    : m_catalog(std::move(catalog)),
      m_models(std::move(models)),
      m_matrixBuilder(std::move(datasets), std::move(mappings)),
      m_consistencyThreshold(consistencyThreshold) {}

std::vector<Indicator> WeightModelService::resolveIndicators(const std::vector<std::string>& indicatorKeys) const {
    if (indicatorKeys.empty()) {
        throw ValidationError("At least one indicator is required");
    }
    std::set<std::string> unique;
    std::vector<Indicator> selected;
    std::string missing;
    for (const auto& key : indicatorKeys) {
        if (!unique.insert(key).second) {
            throw ValidationError("Indicator listed twice: " + key);
        }
        auto indicator = m_catalog->findByKey(key);
        if (!indicator) {
            missing += (missing.empty() ? "" : ", ") + key;
            continue;
        }
        selected.push_back(*indicator);
    }
    if (!missing.empty()) {
        throw ValidationError("Indicators not in catalog: " + missing);
    }
    return selected;
}

WeightModel WeightModelService::trainEntropy(const std::vector<std::string>& indicatorKeys,
                                             const std::vector<std::string>& datasetIds,
                                             const std::string& name) {
    const auto indicators = resolveIndicators(indicatorKeys);
    const auto raw = m_matrixBuilder.build(datasetIds, indicatorKeys);

    for (size_t j = 0; j < indicatorKeys.size(); ++j) {
        EntropyWeighter::requireDispersion(indicatorKeys[j], raw.values.col(static_cast<Eigen::Index>(j)));
    }

    std::vector<StandardizationParams> params;
    const Mat standardized = Standardizer::fitTransform(raw, DirectionsOf(indicators), StandardizationMethod::MinMax, params);
    auto entropy = EntropyWeighter::weigh(standardized, indicatorKeys);

    auto model = assemble(WeightMethod::Entropy, name, indicators, datasetIds, standardized,
                          StandardizationMethod::MinMax, params, entropy.weights, std::move(entropy.provenance));
    m_models->save(model);
    std::cout << "[WeightModelService] Trained entropy model " << model.id << " on " << raw.observationCount()
              << " observations x " << raw.indicatorCount() << " indicators" << std::endl;
    return model;
}

WeightModel WeightModelService::trainPCA(const std::vector<std::string>& indicatorKeys,
                                         const std::vector<std::string>& datasetIds,
                                         double cumVarThreshold,
                                         const std::string& name) {
    const auto indicators = resolveIndicators(indicatorKeys);
    if (!(cumVarThreshold > 0.0 && cumVarThreshold <= 1.0)) {
        throw ValidationError("Cumulative variance threshold must be in (0, 1], got " + std::to_string(cumVarThreshold));
    }
    const auto raw = m_matrixBuilder.build(datasetIds, indicatorKeys);

    std::vector<StandardizationParams> params;
    const Mat standardized = Standardizer::fitTransform(raw, DirectionsOf(indicators), StandardizationMethod::ZScore, params);
    auto pca = PcaWeighter::weigh(standardized, cumVarThreshold);
    const int retained = pca.provenance.componentsRetained;
    const double cumulative = pca.provenance.cumulativeVariance[static_cast<size_t>(retained - 1)];

    auto model = assemble(WeightMethod::Pca, name, indicators, datasetIds, standardized,
                          StandardizationMethod::ZScore, params, pca.weights, std::move(pca.provenance));
    m_models->save(model);
    std::cout << "[WeightModelService] Trained pca model " << model.id << " (k=" << retained
              << ", cumulative=" << cumulative << ")" << std::endl;
    return model;
}

WeightModel WeightModelService::trainAHP(const std::vector<std::string>& indicatorKeys,
                                         const std::vector<std::string>& datasetIds,
                                         const std::vector<PairwiseJudgment>& judgments,
                                         const std::string& name,
                                         StandardizationMethod standardization) {
    const auto indicators = resolveIndicators(indicatorKeys);
    const Mat pairwise = PairwiseMatrix::build(indicatorKeys, judgments);
    const auto raw = m_matrixBuilder.build(datasetIds, indicatorKeys);

    std::vector<StandardizationParams> params;
    const Mat standardized = Standardizer::fitTransform(raw, DirectionsOf(indicators), standardization, params);
    auto ahp = AhpWeighter::weigh(pairwise, indicatorKeys, m_consistencyThreshold);
    const double cr = ahp.provenance.consistencyRatio;

    auto model = assemble(WeightMethod::Ahp, name, indicators, datasetIds, standardized,
                          standardization, params, ahp.weights, std::move(ahp.provenance));
    m_models->save(model);
    std::cout << "[WeightModelService] Created ahp model " << model.id << " (CR=" << cr << ")" << std::endl;
    return model;
}

WeightModel WeightModelService::assemble(WeightMethod method,
                                         const std::string& name,
                                         const std::vector<Indicator>& indicators,
                                         const std::vector<std::string>& datasetIds,
                                         const Mat& standardized,
                                         StandardizationMethod standardization,
                                         const std::vector<StandardizationParams>& params,
                                         const Vec& weights,
                                         MethodProvenance provenance) const {
    WeightModel model;
    model.id = GenerateId();
    model.name = name.empty() ? DefaultName(method) : name;
    model.createdAt = NowIso();
    model.method = method;
    model.standardizationMethod = standardization;
    model.trainedOnDatasetIds = datasetIds;
    model.provenance = std::move(provenance);

    for (size_t j = 0; j < indicators.size(); ++j) {
        const auto& ind = indicators[j];
        const double w = weights(static_cast<Eigen::Index>(j));
        model.indicatorKeys.push_back(ind.key);
        model.weights[ind.key] = w;
        model.dimensions[ind.key] = ind.effectiveDimension();
        model.directions[ind.key] = ind.direction;
        model.standardizationParams[ind.key] = params[j];
        model.dimension2Weights[ind.effectiveDimension()] += w;
    }

    // Freeze the 0-100 mapping over the training population.
    CompositeScorer scorer(model.indicatorKeys, model.weights, model.dimensions, model.dimension2Weights);
    std::vector<CompositeScorer::Scores> trainingScores;
    trainingScores.reserve(static_cast<size_t>(standardized.rows()));
    for (Eigen::Index i = 0; i < standardized.rows(); ++i) {
        trainingScores.push_back(scorer.score(standardized.row(i).transpose()));
    }
    model.scaling = ScoreScaler::fit(standardization, trainingScores, scorer.scoredDimensions());
    return model;
}

std::vector<WeightModel> WeightModelService::listModels() const {
    return m_models->findAll();
}

std::optional<WeightModel> WeightModelService::getModel(const std::string& id) const {
    return m_models->findById(id);
}

} // namespace indexforge::application
