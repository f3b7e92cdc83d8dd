#include <cassert>
#include <cmath>
#include <iostream>

#include "application/WeightModelService.hpp"
#include "application/engine/AhpWeighter.hpp"
#include "domain/Errors.hpp"
#include "test/InMemoryRepositories.hpp"

using namespace indexforge::domain;
using namespace indexforge::application;
using namespace indexforge::application::engine;
using namespace indexforge::test;

namespace {

template <typename F>
bool ThrowsValidation(F&& f) {
    try {
        f();
    } catch (const ValidationError&) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    std::cout << "[Test] Starting AhpWeighter Test..." << std::endl;

    const std::vector<std::string> four = {"a", "b", "c", "d"};

    // All-ones matrix (no judgments at all): equal weights and CR = 0.
    auto uniform = AhpWeighter::weigh(PairwiseMatrix::build(four, {}), four);
    for (Eigen::Index i = 0; i < 4; ++i) assert(Near(uniform.weights(i), 0.25, 1e-9));
    assert(Near(uniform.provenance.lambdaMax, 4.0, 1e-9));
    assert(uniform.provenance.consistencyRatio < 1e-9);
    assert(uniform.provenance.acceptable);
    std::cout << "[PASS] All-ones matrix gives 1/n weights and CR = 0." << std::endl;

    // Perfectly consistent matrix built from w = (4, 2, 1) / 7.
    const std::vector<std::string> three = {"a", "b", "c"};
    auto consistent = AhpWeighter::weigh(PairwiseMatrix::build(three, {{"a", "b", 2.0}, {"a", "c", 4.0}, {"b", "c", 2.0}}), three);
    assert(Near(consistent.weights(0), 4.0 / 7.0, 1e-9));
    assert(Near(consistent.weights(1), 2.0 / 7.0, 1e-9));
    assert(Near(consistent.weights(2), 1.0 / 7.0, 1e-9));
    assert(Near(consistent.provenance.lambdaMax, 3.0, 1e-9));
    assert(Near(consistent.provenance.randomIndex, 0.58));
    std::cout << "[PASS] Consistent judgments recover the generating weights." << std::endl;

    // Strongly inconsistent judgments are flagged, not rejected.
    auto judgments = PairwiseMatrix::fromDense(three, {{1, 1, 1}, {1, 1, 9}, {1, 1.0 / 9.0, 1}});
    auto inconsistent = AhpWeighter::weigh(PairwiseMatrix::build(three, judgments), three);
    assert(inconsistent.provenance.consistencyRatio >= 0.10);
    assert(!inconsistent.provenance.acceptable);
    assert(std::fabs(inconsistent.weights.sum() - 1.0) < 1e-9);
    std::cout << "[PASS] Inconsistent matrix yields CR >= 0.10 with acceptable = false." << std::endl;

    // Two indicators: consistency is trivial.
    const std::vector<std::string> two = {"a", "b"};
    auto pair = AhpWeighter::weigh(PairwiseMatrix::build(two, {{"b", "a", 3.0}}), two);
    assert(Near(pair.weights(0), 0.25, 1e-9));
    assert(Near(pair.weights(1), 0.75, 1e-9));
    assert(pair.provenance.consistencyIndex == 0.0);
    assert(pair.provenance.consistencyRatio == 0.0);
    std::cout << "[PASS] n = 2 has CI = 0." << std::endl;

    assert(Near(AhpWeighter::randomIndex(3), 0.58));
    assert(Near(AhpWeighter::randomIndex(4), 0.90));
    assert(Near(AhpWeighter::randomIndex(5), 1.12));
    assert(Near(AhpWeighter::randomIndex(40), 1.59));

    // Malformed input.
    assert(ThrowsValidation([&] { PairwiseMatrix::build(three, {{"a", "b", 10.0}}); }));
    assert(ThrowsValidation([&] { PairwiseMatrix::build(three, {{"a", "b", 0.05}}); }));
    assert(ThrowsValidation([&] { PairwiseMatrix::build(three, {{"a", "zz", 2.0}}); }));
    assert(ThrowsValidation([&] { PairwiseMatrix::build(three, {{"a", "b", 2.0}, {"b", "a", 3.0}}); }));
    assert(ThrowsValidation([&] { PairwiseMatrix::build(three, {{"a", "a", 2.0}}); }));
    assert(ThrowsValidation([&] { PairwiseMatrix::fromDense(three, {{1, 1}, {1, 1}}); }));
    // Reciprocal restatement of the same judgment is accepted.
    auto restated = PairwiseMatrix::build(three, {{"a", "b", 2.0}, {"b", "a", 0.5}});
    assert(restated(0, 1) == 2.0 && restated(1, 0) == 0.5);
    std::cout << "[PASS] Out-of-scale, unknown and conflicting judgments are rejected." << std::endl;

    // Through the service: the inconsistent model is still stored with its diagnostics.
    Fixture fx;
    for (const auto& k : three) fx.catalog->upsert(MakeIndicator(k, k == "c" ? "env" : "econ"));
    fx.datasets->save(MakeDataset("d1", three, {
        {"A", 2020, {"1", "10", "5"}},
        {"B", 2020, {"2", "30", "3"}},
        {"C", 2020, {"3", "20", "4"}},
    }));
    fx.mapIdentity("d1", three);
    WeightModelService service(fx.catalog, fx.datasets, fx.mappings, fx.models);

    auto model = service.trainAHP(three, {"d1"}, judgments, "inconsistent");
    assert(fx.models->size() == 1);
    assert(model.method == WeightMethod::Ahp);
    assert(model.standardizationMethod == StandardizationMethod::ZScore);
    const auto& prov = std::get<AhpProvenance>(model.provenance);
    assert(!prov.acceptable);
    assert(prov.order == three);
    double dsum = 0.0;
    for (const auto& [dim, w] : model.dimension2Weights) dsum += w;
    assert(std::fabs(dsum - 1.0) < 1e-9);

    auto minmax = service.trainAHP(three, {"d1"}, {}, "", StandardizationMethod::MinMax);
    assert(minmax.standardizationMethod == StandardizationMethod::MinMax);
    assert(minmax.scaling.scoreMin == 0.0 && minmax.scaling.scoreMax == 1.0);
    assert(Near(minmax.weights.at("a"), 1.0 / 3.0, 1e-9));
    std::cout << "[PASS] Service stores AHP models with flagged provenance." << std::endl;

    bool unknown = ThrowsValidation([&] { service.trainAHP({"a", "missing"}, {"d1"}, {}); });
    assert(unknown && "Keys outside the catalog must be a ValidationError.");
    assert(fx.models->size() == 2);

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
