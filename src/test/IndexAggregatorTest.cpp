#include <cassert>
#include <cmath>
#include <iostream>

#include "application/engine/IndexAggregator.hpp"
#include "application/engine/ScoreScaler.hpp"
#include "test/InMemoryRepositories.hpp"

using namespace indexforge::domain;
using namespace indexforge::application::engine;
using namespace indexforge::test;

namespace {

WeightModel HandModel() {
    WeightModel model;
    model.id = "m1";
    model.method = WeightMethod::Ahp;
    model.indicatorKeys = {"x", "y", "z"};
    model.weights = {{"x", 0.5}, {"y", 0.3}, {"z", 0.2}};
    model.dimensions = {{"x", "econ"}, {"y", "econ"}, {"z", "env"}};
    model.dimension2Weights = {{"econ", 0.8}, {"env", 0.2}};
    model.directions = {{"x", Direction::Positive}, {"y", Direction::Positive}, {"z", Direction::Negative}};
    model.standardizationMethod = StandardizationMethod::MinMax;
    model.standardizationParams["x"] = MinMaxParams{0.0, 10.0};
    model.standardizationParams["y"] = MinMaxParams{0.0, 100.0};
    // Negative direction: parameters live in the negated space.
    model.standardizationParams["z"] = MinMaxParams{-1.0, 0.0};
    model.scaling.scoreMin = 0.0;
    model.scaling.scoreMax = 1.0;
    model.scaling.subScoreMin = {{"econ", 0.0}, {"env", 0.0}};
    model.scaling.subScoreMax = {{"econ", 1.0}, {"env", 1.0}};
    model.provenance = AhpProvenance{};
    return model;
}

const ResultRow* FindRow(const std::vector<ResultRow>& rows, const std::string& entity, int year) {
    for (const auto& r : rows) {
        if (r.entity == entity && r.year == year) return &r;
    }
    return nullptr;
}

} // namespace

int main() {
    std::cout << "[Test] Starting IndexAggregator Test..." << std::endl;

    const WeightModel model = HandModel();
    IndexAggregator aggregator(model);

    Dataset d1 = MakeDataset("d1", {"X", "Y", "Z"}, {
        {"A", 2020, {"5", "50", "0.25"}},
        {"B", 2020, {"20", "50", "0.25"}},
        {"C", 2020, {"", "50", "0.25"}},
        {"A", 2020, {"1", "1", "0.1"}},
    });
    Dataset d2 = MakeDataset("d2", {"X", "Y", "Z"}, {
        {"D", 2021, {"5", "50", "0.25"}},
        {"A", 2020, {"5", "50", "0.25"}},
    });

    ColumnMapping m1{"d1", {{"x", "X"}, {"y", "Y"}, {"z", "Z"}}};
    ColumnMapping m2{"d2", {{"x", "X"}, {"y", "Y"}}};

    auto out = aggregator.aggregate({{&d1, m1}, {&d2, m2}});

    // Scored rows.
    assert(out.rows.size() == 2);
    const ResultRow* a = FindRow(out.rows, "A", 2020);
    assert(a && a->datasetId == "d1");
    assert(Near(a->scoreRaw, 0.55));
    assert(Near(a->index0To100, 55.0));
    assert(Near(a->subindex.at("econ"), 50.0));
    assert(Near(a->subindex.at("env"), 75.0));
    assert(Near(a->rawValues.at("z"), 0.25));
    std::cout << "[PASS] Weighted composite and conditional sub-indexes." << std::endl;

    // Out-of-range raw value is clamped by the frozen min-max parameters.
    const ResultRow* b = FindRow(out.rows, "B", 2020);
    assert(b && Near(b->index0To100, 80.0));
    for (const auto& r : out.rows) {
        assert(r.index0To100 >= 0.0 && r.index0To100 <= 100.0);
    }
    std::cout << "[PASS] Out-of-range values stay within 0..100." << std::endl;

    // Failures: missing value, duplicate, missing mapping, duplicate + missing mapping.
    assert(out.failures.size() == 4);
    assert(out.summary.failedRows == 4);
    assert(out.summary.byCause.at("MissingValue") == 1);
    assert(out.summary.byCause.at("DuplicateObservation") == 2);
    assert(out.summary.byCause.at("MissingMapping") == 2);

    const auto& missingValue = out.failures[0];
    assert(missingValue.entity == "C" && missingValue.issues.size() == 1);
    assert(missingValue.issues[0].cause == RowFailureCause::MissingValue);
    assert(missingValue.issues[0].indicatorKey == "x");

    const auto& both = out.failures[3];
    assert(both.datasetId == "d2" && both.entity == "A");
    assert(both.issues.size() == 2);
    assert(both.issues[0].cause == RowFailureCause::DuplicateObservation);
    assert(both.issues[1].cause == RowFailureCause::MissingMapping && both.issues[1].indicatorKey == "z");
    std::cout << "[PASS] Row failures are recorded per cause without aborting." << std::endl;

    // A mapping to a column the dataset lacks is a mapping failure too.
    ColumnMapping broken{"d1", {{"x", "X"}, {"y", "Y"}, {"z", "NOPE"}}};
    auto brokenOut = aggregator.aggregate({{&d1, broken}});
    assert(brokenOut.rows.empty());
    assert(brokenOut.summary.byCause.at("MissingMapping") == 4);

    // A failed first row does not claim (entity, year); the later valid row is scored.
    Dataset retry = MakeDataset("d3", {"X", "Y", "Z"}, {
        {"A", 2021, {"", "50", "0.25"}},
        {"A", 2021, {"5", "50", "0.25"}},
        {"A", 2021, {"6", "50", "0.25"}},
    });
    auto retryOut = aggregator.aggregate({{&retry, ColumnMapping{"d3", m1.map}}});
    assert(retryOut.rows.size() == 1);
    assert(Near(retryOut.rows[0].index0To100, 55.0));
    assert(retryOut.failures.size() == 2);
    assert(retryOut.failures[0].issues[0].cause == RowFailureCause::MissingValue);
    assert(retryOut.failures[1].issues.size() == 1);
    assert(retryOut.failures[1].issues[0].cause == RowFailureCause::DuplicateObservation);
    assert(retryOut.summary.byCause.count("DuplicateObservation") == 1);
    std::cout << "[PASS] Only a scored row blocks later duplicates." << std::endl;

    // Dimension keys come from the model.
    assert((out.dimensionKeys == std::vector<std::string>{"econ", "env"}));

    // Scaling helpers.
    assert(ScoreScaler::toIndex(0.3, 0.3, 0.3) == ScoreScaler::kNeutralIndex);
    assert(ScoreScaler::toIndex(-5.0, -1.0, 1.0) == 0.0);
    assert(ScoreScaler::toIndex(5.0, -1.0, 1.0) == 100.0);
    assert(Near(ScoreScaler::toIndex(0.0, -1.0, 1.0), 50.0));
    std::cout << "[PASS] Index scaling clamps and handles an empty range." << std::endl;

    // Determinism.
    auto again = aggregator.aggregate({{&d1, m1}, {&d2, m2}});
    assert(again.rows.size() == out.rows.size());
    for (size_t i = 0; i < out.rows.size(); ++i) {
        assert(again.rows[i].scoreRaw == out.rows[i].scoreRaw);
        assert(again.rows[i].index0To100 == out.rows[i].index0To100);
        assert(again.rows[i].subindex == out.rows[i].subindex);
    }
    std::cout << "[PASS] Aggregation is deterministic." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
