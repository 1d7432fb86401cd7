#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "io/csv_reader.hpp"
#include "io/csv_writer.hpp"
#include "io/json_writer.hpp"
#include "io/parquet_writer.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace powerfin;
using json = nlohmann::json;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::StartsWith;

namespace {

FinancialResults reference_model() {
    return build_model(ProjectParameters(), DebtStructure());
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream is(text);
    std::string line;
    while (std::getline(is, line)) {
        lines.push_back(line);
    }
    return lines;
}

} // anonymous namespace

// ============================================================================
// CSV reader
// ============================================================================

TEST_CASE("CsvReader splits quoted fields", "[io][csv]") {
    std::istringstream is("a, b ,c\n\"x,y\",\"say \"\"hi\"\"\",z\r\n");
    CsvReader reader(is);

    std::vector<std::string> first = reader.read_row();
    REQUIRE(first == std::vector<std::string>{"a", "b", "c"});
    REQUIRE(reader.line_number() == 1);

    std::vector<std::string> second = reader.read_row();
    REQUIRE(second == std::vector<std::string>{"x,y", "say \"hi\"", "z"});
    REQUIRE(reader.line_number() == 2);
}

TEST_CASE("CsvReader with another delimiter", "[io][csv]") {
    std::istringstream is("capacity_factor;0.38\n");
    CsvReader reader(is, ';');
    REQUIRE(reader.read_row() == std::vector<std::string>{"capacity_factor", "0.38"});
}

// ============================================================================
// JSON output
// ============================================================================

TEST_CASE("Model JSON carries metrics and schedule", "[io][json]") {
    FinancialResults model = reference_model();
    std::ostringstream os;
    io::write_model_json(os, model);

    json j = json::parse(os.str());
    REQUIRE_THAT(j["metrics"]["equity_irr"]["rate"].get<double>(), WithinAbs(model.equity_irr(), 1e-12));
    REQUIRE(j["metrics"]["equity_irr"]["converged"] == true);
    REQUIRE_THAT(j["metrics"]["npv"].get<double>(), WithinAbs(model.npv, 1e-9));
    REQUIRE_THAT(j["metrics"]["min_dscr"].get<double>(), WithinAbs(*model.min_dscr, 1e-12));
    REQUIRE(j["tranches"].size() == 3);
    REQUIRE(j["tranches"][2]["currency"] == "LKR");

    REQUIRE(j["schedule"].size() == model.rows.size());
    REQUIRE(j["schedule"][0]["phase"] == "construction");
    REQUIRE(j["schedule"][0]["dscr"].is_null());
    REQUIRE(j["schedule"][1]["phase"] == "operation");
    REQUIRE(j["schedule"][1]["dscr"].is_number());
    // Debt is repaid after 15 operating years
    REQUIRE(j["schedule"].back()["dscr"].is_null());
}

TEST_CASE("Compact JSON is a single line", "[io][json]") {
    std::ostringstream os;
    io::write_model_json(os, reference_model(), false);
    REQUIRE(split_lines(os.str()).size() == 1);
}

TEST_CASE("Undefined DSCR and missing IRR are null", "[io][json]") {
    DebtStructure no_debt = DebtStructure::from_ratios(155.0, 0.0, 0.45, 0.10);
    std::ostringstream os;
    io::write_model_json(os, build_model(ProjectParameters(), no_debt));

    json j = json::parse(os.str());
    REQUIRE(j["metrics"]["min_dscr"].is_null());
    REQUIRE(j["metrics"]["average_dscr"].is_null());
}

TEST_CASE("Monte Carlo JSON", "[io][json]") {
    MonteCarloResult result = run_monte_carlo(20, 42);

    SECTION("With trials") {
        std::ostringstream os;
        io::write_monte_carlo_json(os, result);
        json j = json::parse(os.str());

        REQUIRE(j["seed"] == 42);
        REQUIRE(j["iterations"] == 20);
        REQUIRE(j["trials"].size() == 20);
        REQUIRE(j["statistics"]["npv"]["count"] == 20);
        REQUIRE_THAT(j["statistics"]["equity_irr"]["mean"].get<double>(),
                     WithinAbs(result.summary.equity_irr.mean, 1e-12));
        REQUIRE(j["statistics"]["dscr_covenant"] == result.summary.dscr_covenant);
        REQUIRE(j["trials"][0]["iteration"] == result.rows[0].iteration);
    }

    SECTION("Statistics only") {
        std::ostringstream os;
        io::write_monte_carlo_json(os, result, false);
        json j = json::parse(os.str());
        REQUIRE_FALSE(j.contains("trials"));
        REQUIRE(j["statistics"].contains("prob_dscr_below_covenant"));
    }
}

TEST_CASE("Sensitivity JSON", "[io][json]") {
    DebtStructure debt;
    SensitivityResult result = run_sensitivity(ProjectParameters(), debt,
                                               default_sensitivity_config(ProjectParameters(), debt));
    std::ostringstream os;
    io::write_sensitivity_json(os, result);
    json j = json::parse(os.str());

    REQUIRE(j["rows"].size() == result.rows.size());
    REQUIRE(j["tornado"].size() == 7);
    REQUIRE(j["tornado"][0]["field"] == "total_capex");
    REQUIRE_THAT(j["base"]["equity_irr"].get<double>(), WithinAbs(result.base_equity_irr, 1e-12));
}

TEST_CASE("Optimization JSON", "[io][json]") {
    OptimizationResult result = optimize_capital_structure(Objective::Npv);
    std::ostringstream os;
    io::write_optimization_json(os, result);
    json j = json::parse(os.str());

    REQUIRE(j["objective"] == "npv");
    REQUIRE(j["converged"] == result.converged);
    REQUIRE_THAT(j["structure"]["debt_ratio"].get<double>(), WithinAbs(result.debt_ratio, 1e-12));
    REQUIRE(j["violations"]["dscr"] == 0.0);
    REQUIRE(j["model"]["schedule"].size() == 21);
}

TEST_CASE("JSON writer reports unwritable paths", "[io][json]") {
    REQUIRE_THROWS_WITH(io::write_model_json("/nonexistent/dir/model.json", reference_model()),
                        StartsWith("Failed to open output file: "));
}

// ============================================================================
// CSV output
// ============================================================================

TEST_CASE("Schedule CSV", "[io][csv]") {
    FinancialResults model = reference_model();
    std::ostringstream os;
    io::write_schedule_csv(os, model);

    std::vector<std::string> lines = split_lines(os.str());
    REQUIRE(lines.size() == model.rows.size() + 1);
    REQUIRE_THAT(lines[0], StartsWith("year,phase,generation_mwh,"));
    REQUIRE_THAT(lines[1], StartsWith("0,construction,"));
    // Empty DSCR cell once the debt is repaid
    REQUIRE(lines.back().back() == ',');

    std::istringstream is(os.str());
    CsvReader reader(is);
    std::vector<std::string> header = reader.read_row();
    std::vector<std::string> first_operating;
    reader.read_row();
    first_operating = reader.read_row();
    REQUIRE(first_operating.size() == header.size());
    REQUIRE_THAT(std::stod(first_operating.back()), WithinAbs(*model.rows[1].dscr, 1e-9));
}

TEST_CASE("Monte Carlo CSV", "[io][csv]") {
    MonteCarloResult result = run_monte_carlo(5, 7);
    std::ostringstream os;
    io::write_monte_carlo_csv(os, result);

    std::vector<std::string> lines = split_lines(os.str());
    REQUIRE(lines.size() == 6);
    REQUIRE_THAT(lines[0], StartsWith("iteration,capacity_factor,"));
    REQUIRE_THAT(lines[1], StartsWith("0,"));
}

TEST_CASE("Sensitivity CSV quotes labels", "[io][csv]") {
    DebtStructure debt;
    SensitivityConfig config;
    config.entries.emplace_back("Tariff, LKR/kWh", ParameterField::TariffLkrPerKwh, 20.36,
                                std::vector<double>{18.324});
    SensitivityResult result = run_sensitivity(ProjectParameters(), debt, config);

    std::ostringstream os;
    io::write_sensitivity_csv(os, result);
    std::vector<std::string> lines = split_lines(os.str());
    REQUIRE(lines.size() == 2);
    REQUIRE_THAT(lines[1], StartsWith("\"Tariff, LKR/kWh\",tariff_lkr_per_kwh,"));
}

TEST_CASE("CSV writer writes files", "[io][csv]") {
    std::string path = "/tmp/powerfin_test_schedule.csv";
    io::write_schedule_csv(path, reference_model());

    std::ifstream file(path);
    std::string header;
    std::getline(file, header);
    REQUIRE_THAT(header, StartsWith("year,phase"));
    file.close();
    std::filesystem::remove(path);
}

// ============================================================================
// Parquet output
// ============================================================================

#ifdef HAVE_ARROW

TEST_CASE("Parquet writer creates files", "[io][parquet]") {
    std::string mc_path = "/tmp/powerfin_test_trials.parquet";
    std::string schedule_path = "/tmp/powerfin_test_schedule.parquet";

    ParquetWriter::write_monte_carlo(run_monte_carlo(10, 3), mc_path);
    ParquetWriter::write_schedule(reference_model(), schedule_path);

    REQUIRE(std::filesystem::file_size(mc_path) > 0);
    REQUIRE(std::filesystem::file_size(schedule_path) > 0);

    std::filesystem::remove(mc_path);
    std::filesystem::remove(schedule_path);
}

TEST_CASE("Parquet writer rejects an empty trial table", "[io][parquet]") {
    REQUIRE_THROWS_AS(ParquetWriter::write_monte_carlo(MonteCarloResult(), "/tmp/powerfin_empty.parquet"),
                      std::runtime_error);
}

#else

TEST_CASE("Parquet writer without Arrow", "[io][parquet]") {
    REQUIRE_THROWS_WITH(ParquetWriter::write_monte_carlo(run_monte_carlo(2, 1), "/tmp/unused.parquet"),
                        "Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
    REQUIRE_THROWS_AS(ParquetWriter::write_schedule(reference_model(), "/tmp/unused.parquet"),
                      std::runtime_error);
}

#endif
