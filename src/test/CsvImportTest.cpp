#include <cassert>
#include <iostream>
#include <sstream>

#include "application/DatasetService.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/CsvCodec.hpp"
#include "test/InMemoryRepositories.hpp"

using namespace indexforge::domain;
using namespace indexforge::application;
using namespace indexforge::infrastructure;
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
    std::cout << "[Test] Starting CSV Import Test..." << std::endl;

    // BOM, CRLF line endings, quoted comma, padded header, blank line, empty header column.
    const std::string text =
        "\xEF\xBB\xBF entity , year,gdp,label,\r\n"
        "A,2020,1.5,\"North, East\",\r\n"
        "\r\n"
        "B,2020.0,2,\"say \"\"hi\"\"\",\r\n";
    CsvTable table = CsvCodec::parse(text);
    assert((table.columns == std::vector<std::string>{"entity", "year", "gdp", "label"}));
    assert(table.records.size() == 2);
    assert(table.records[0].at("label") == "North, East");
    assert(table.records[1].at("label") == "say \"hi\"");
    std::cout << "[PASS] Parser handles BOM, CRLF, quotes and blank lines." << std::endl;

    Dataset ds = CsvCodec::normalize(table, std::nullopt);
    assert(ds.rows.size() == 2);
    assert(ds.rows[1].year == 2020);
    assert(ds.rows[0].cells.at("gdp") == "1.5");
    assert(ds.columnTypes.at("year") == "int");
    assert(ds.columnTypes.at("gdp") == "number");
    assert(ds.columnTypes.at("label") == "string");
    Dataset odd = CsvCodec::normalize(CsvCodec::parse("entity,year,hex,tiny\nA,2020,0x10,1e-310\nB,2020,7,2\n"),
                                      std::nullopt);
    assert(odd.columnTypes.at("hex") == "string");
    assert(odd.columnTypes.at("tiny") == "number");
    std::cout << "[PASS] Years are normalized and column types inferred." << std::endl;

    // Missing year column with an override: inserted as the second column.
    Dataset withYear = CsvCodec::normalize(CsvCodec::parse("gdp,entity\n1,A\n2,B\n"), 2019);
    assert((withYear.columns == std::vector<std::string>{"entity", "year", "gdp"}));
    assert(withYear.rows[0].year == 2019 && withYear.rows[1].year == 2019);

    // Empty year cells take the override when given.
    Dataset filled = CsvCodec::normalize(CsvCodec::parse("entity,year,gdp\nA,,1\nB,2021,2\n"), 2020);
    assert(filled.rows[0].year == 2020 && filled.rows[1].year == 2021);
    std::cout << "[PASS] Year override fills a missing column or empty cells." << std::endl;

    assert(ThrowsValidation([] { CsvCodec::parse("   \n"); }));
    assert(ThrowsValidation([] { CsvCodec::parse("entity,year\n\"A,2020\n"); }));
    assert(ThrowsValidation([] { CsvCodec::normalize(CsvCodec::parse("name,year\nA,2020\n"), std::nullopt); }));
    assert(ThrowsValidation([] { CsvCodec::normalize(CsvCodec::parse("entity,gdp\nA,1\n"), std::nullopt); }));
    assert(ThrowsValidation([] { CsvCodec::normalize(CsvCodec::parse("entity,year\nA,\n"), std::nullopt); }));
    assert(ThrowsValidation([] { CsvCodec::normalize(CsvCodec::parse("entity,year\nA,soon\n"), std::nullopt); }));
    assert(ThrowsValidation([] { CsvCodec::normalize(CsvCodec::parse("entity,year\nA,0x7E4\n"), std::nullopt); }));
    assert(ThrowsValidation([] { CsvCodec::normalize(CsvCodec::parse("entity,year\nA,2020\nA,2020.0\n"), std::nullopt); }));
    std::cout << "[PASS] Malformed CSV, missing entity/year and duplicates are rejected." << std::endl;

    // Writer quotes only where needed and round-trips.
    const std::string written = CsvCodec::datasetToCsv(ds);
    Dataset reread = CsvCodec::normalize(CsvCodec::parse(written), std::nullopt);
    assert(reread.rows.size() == ds.rows.size());
    assert(reread.rows[0].cells.at("label") == "North, East");
    assert(written.find("\"North, East\"") != std::string::npos);
    std::cout << "[PASS] Dataset CSV emission re-parses to the same rows." << std::endl;

    // Result export column order.
    ResultSet result;
    result.dimensionKeys = {"econ"};
    result.indicatorKeys = {"gdp"};
    ResultRow row;
    row.entity = "A";
    row.year = 2020;
    row.scoreRaw = 0.5;
    row.index0To100 = 50.0;
    row.subScoreRaw["econ"] = 0.5;
    row.subindex["econ"] = 50.0;
    row.rawValues["gdp"] = 1.5;
    result.rows.push_back(row);
    const std::string exported = CsvCodec::resultToCsv(result);
    std::istringstream lines(exported);
    std::string header;
    std::string first;
    std::getline(lines, header);
    std::getline(lines, first);
    assert(header == "entity,year,score_raw,index_0_100,sub_score_raw.econ,subindex.econ_0_100,raw.gdp");
    assert(first == "A,2020,0.5,50,0.5,50,1.5");
    std::cout << "[PASS] Result export has the documented columns." << std::endl;

    // DatasetService over an in-memory repository.
    auto repo = std::make_shared<InMemoryDatasets>();
    DatasetService service(repo);
    auto imported = service.importText("", "entity,year,gdp\nA,2020,1\nB,2020,2\n");
    assert(imported.name == "Pasted Dataset");
    assert(imported.id.size() == 32);
    assert(repo->findById(imported.id).has_value());

    auto renamed = service.rename(imported.id, "Provinces 2020");
    assert(renamed.name == "Provinces 2020");
    assert(repo->findById(imported.id)->rows.size() == 2);
    assert(ThrowsValidation([&] { service.rename(imported.id, "  "); }));

    auto replaced = service.replaceRows(imported.id, {"entity", "year", "gdp", "pop"},
                                        {{{"entity", "C"}, {"year", "2021"}, {"gdp", "3"}, {"pop", "10"}}});
    assert(replaced.rows.size() == 1);
    assert(replaced.name == "Provinces 2020");
    assert(replaced.createdAt == imported.createdAt);
    assert(replaced.hasColumn("pop"));

    bool notFound = false;
    try {
        service.getDataset("ghost");
    } catch (const NotFoundError&) {
        notFound = true;
    }
    assert(notFound);
    std::cout << "[PASS] DatasetService imports, renames and replaces rows." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
