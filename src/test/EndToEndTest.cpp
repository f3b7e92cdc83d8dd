#include <cassert>
#include <cmath>
#include <iostream>

#include "application/CatalogService.hpp"
#include "application/IndexComputationService.hpp"
#include "application/WeightModelService.hpp"
#include "domain/Errors.hpp"
#include "test/InMemoryRepositories.hpp"

using namespace indexforge::domain;
using namespace indexforge::application;
using namespace indexforge::test;

namespace {

const ResultRow& RowOf(const ResultSet& result, const std::string& entity, int year) {
    for (const auto& r : result.rows) {
        if (r.entity == entity && r.year == year) return r;
    }
    assert(false && "row not found");
    return result.rows.front();
}

} // namespace

int main() {
    std::cout << "[Test] Starting End-to-End Test..." << std::endl;

    Fixture fx;
    CatalogService catalog(fx.catalog, fx.mappings, fx.mappings, fx.datasets);
    WeightModelService training(fx.catalog, fx.datasets, fx.mappings, fx.models);
    IndexComputationService computing(fx.models, fx.datasets, fx.mappings, fx.results);

    catalog.upsertIndicator(MakeIndicator("income", "economy"));
    catalog.upsertIndicator(MakeIndicator("literacy", "society"));

    // A dominates B on both indicators every year.
    fx.datasets->save(MakeDataset("panel", {"inc", "lit"}, {
        {"A", 2020, {"120", "0.95"}},
        {"B", 2020, {"80", "0.70"}},
        {"A", 2021, {"130", "0.97"}},
        {"B", 2021, {"90", "0.75"}},
    }));
    catalog.putMapping("panel", {{"income", "inc"}, {"literacy", "lit"}});

    auto model = training.trainEntropy({"income", "literacy"}, {"panel"}, "panel entropy");
    double wsum = 0.0;
    for (const auto& [k, w] : model.weights) wsum += w;
    assert(std::fabs(wsum - 1.0) < 1e-9);
    assert(model.trainedOnDatasetIds == std::vector<std::string>{"panel"});
    std::cout << "[PASS] Entropy model trained on the panel." << std::endl;

    auto result = computing.computeIndex(model.id, {"panel"});
    assert(result.rows.size() == 4);
    assert(result.failures.empty());
    assert(result.weightModelId == model.id);
    for (const auto& r : result.rows) {
        assert(r.index0To100 >= 0.0 && r.index0To100 <= 100.0);
        for (const auto& [dim, v] : r.subindex) assert(v >= 0.0 && v <= 100.0);
    }
    for (int year : {2020, 2021}) {
        assert(RowOf(result, "A", year).index0To100 > RowOf(result, "B", year).index0To100);
    }
    std::cout << "[PASS] 4 rows in [0, 100]; the dominant entity ranks first every year." << std::endl;

    // Re-running produces a new result with bit-identical rows.
    auto rerun = computing.computeIndex(model.id, {"panel"});
    assert(rerun.id != result.id);
    assert(rerun.rows.size() == result.rows.size());
    for (size_t i = 0; i < result.rows.size(); ++i) {
        assert(rerun.rows[i].entity == result.rows[i].entity);
        assert(rerun.rows[i].year == result.rows[i].year);
        assert(rerun.rows[i].index0To100 == result.rows[i].index0To100);
        assert(rerun.rows[i].subindex == result.rows[i].subindex);
        assert(rerun.rows[i].scoreRaw == result.rows[i].scoreRaw);
    }
    std::cout << "[PASS] computeIndex is deterministic." << std::endl;

    // Scoring a new dataset with different column names reuses the frozen parameters.
    fx.datasets->save(MakeDataset("later", {"gdp_pc", "lit_rate", "notes"}, {
        {"A", 2022, {"200", "0.99", "x"}},
        {"B", 2022, {"", "0.80", "y"}},
    }));
    catalog.putMapping("later", {{"income", "gdp_pc"}, {"literacy", "lit_rate"}});
    auto later = computing.computeIndex(model.id, {"later"}, std::string("2022 scoring"));
    assert(later.name == "2022 scoring");
    assert(later.rows.size() == 1);
    assert(Near(later.rows[0].index0To100, 100.0, 1e-9));
    assert(later.failureSummary.failedRows == 1);
    assert(later.failureSummary.byCause.at("MissingValue") == 1);
    std::cout << "[PASS] Out-of-sample rows are clamped and missing values are reported." << std::endl;

    // Catalog edits after training do not change a trained model's results.
    catalog.upsertIndicator(MakeIndicator("income", "economy", Direction::Negative));
    auto afterEdit = computing.computeIndex(model.id, {"panel"});
    for (size_t i = 0; i < result.rows.size(); ++i) {
        assert(afterEdit.rows[i].index0To100 == result.rows[i].index0To100);
    }
    std::cout << "[PASS] Direction is frozen in the model." << std::endl;

    // Call-level failures.
    bool threw = false;
    try {
        computing.computeIndex("nope", {"panel"});
    } catch (const NotFoundError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        computing.computeIndex(model.id, {"panel", "ghost"});
    } catch (const NotFoundError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        computing.computeIndex(model.id, {});
    } catch (const ValidationError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        training.trainEntropy({"income", "unknown"}, {"panel"});
    } catch (const ValidationError&) {
        threw = true;
    }
    assert(threw);

    // Training needs a mapping for every selected indicator.
    fx.datasets->save(MakeDataset("unmapped", {"inc"}, {{"A", 2020, {"1"}}, {"B", 2020, {"2"}}}));
    threw = false;
    try {
        training.trainEntropy({"income"}, {"unmapped"});
    } catch (const MissingMappingError& e) {
        threw = e.indicatorKey() == "income";
    }
    assert(threw);

    // Duplicate (entity, year) across training datasets is fatal.
    threw = false;
    try {
        training.trainEntropy({"income", "literacy"}, {"panel", "panel"});
    } catch (const ValidationError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Unknown ids, empty inputs, missing mappings and duplicates are rejected." << std::endl;

    // Catalog management: templates and cascading indicator removal.
    catalog.upsertTemplate("panel-layout", {{"income", "inc"}, {"literacy", "lit"}});
    fx.datasets->save(MakeDataset("copy", {"inc"}, {{"A", 2020, {"1"}}}));
    auto applied = catalog.applyTemplate("panel-layout", "copy");
    assert(applied.map.size() == 1 && applied.map.at("income") == "inc");

    threw = false;
    try {
        catalog.putMapping("copy", {{"income", "missing_col"}});
    } catch (const ValidationError&) {
        threw = true;
    }
    assert(threw);

    catalog.deleteIndicator("literacy");
    assert(fx.mappings->getMapping("panel").map.count("literacy") == 0);
    assert(fx.mappings->getMapping("panel").map.count("income") == 1);
    std::cout << "[PASS] Templates apply per dataset; deleting an indicator unmaps it." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
