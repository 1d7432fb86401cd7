#include "json_writer.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace powerfin {
namespace io {

namespace {

json number_or_null(double value) {
    return std::isfinite(value) ? json(value) : json(nullptr);
}

json number_or_null(const std::optional<double>& value) {
    return value ? number_or_null(*value) : json(nullptr);
}

json irr_to_json(const IrrResult& result) {
    return {
        {"rate", number_or_null(result.rate)},
        {"converged", result.converged},
        {"method", result.method},
        {"iterations", result.iterations},
        {"sign_changes", result.sign_changes}
    };
}

json summary_to_json(const MetricSummary& s) {
    return {
        {"mean", number_or_null(s.mean)},
        {"std_dev", number_or_null(s.std_dev)},
        {"p10", number_or_null(s.p10)},
        {"p50", number_or_null(s.p50)},
        {"p90", number_or_null(s.p90)},
        {"min", number_or_null(s.min)},
        {"max", number_or_null(s.max)},
        {"count", s.count}
    };
}

json model_to_json(const FinancialResults& results) {
    json j;
    j["metrics"] = {
        {"equity_irr", irr_to_json(results.equity_irr_result)},
        {"project_irr", irr_to_json(results.project_irr_result)},
        {"npv", number_or_null(results.npv)},
        {"min_dscr", number_or_null(results.min_dscr)},
        {"average_dscr", results.min_dscr ? number_or_null(results.average_dscr()) : json(nullptr)}
    };

    json tranches = json::array();
    for (const auto& t : results.tranches) {
        tranches.push_back({
            {"name", t.name},
            {"currency", t.currency == TrancheCurrency::Hard ? "USD" : "LKR"},
            {"amount", t.amount},
            {"rate", t.rate},
            {"total_interest", t.total_interest()},
            {"total_principal", t.total_principal()}
        });
    }
    j["tranches"] = tranches;

    json schedule = json::array();
    for (const auto& row : results.rows) {
        schedule.push_back({
            {"year", row.year},
            {"phase", row.phase == Phase::Construction ? "construction" : "operation"},
            {"generation_mwh", row.generation_mwh},
            {"fx_rate", row.fx_rate},
            {"revenue", row.revenue},
            {"levy", row.levy},
            {"opex", row.opex},
            {"ebitda", row.ebitda},
            {"depreciation", row.depreciation},
            {"interest", row.interest},
            {"principal", row.principal},
            {"tax", row.tax},
            {"cfads", row.cfads},
            {"debt_service", row.debt_service},
            {"equity_cashflow", row.equity_cashflow},
            {"project_cashflow", row.project_cashflow},
            {"dscr", number_or_null(row.dscr)}
        });
    }
    j["schedule"] = schedule;
    return j;
}

void dump(std::ostream& os, const json& j, bool pretty_print) {
    os << j.dump(pretty_print ? 2 : -1) << "\n";
}

std::ofstream open_output(const std::string& filepath) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    return file;
}

} // anonymous namespace

void write_model_json(std::ostream& os, const FinancialResults& results, bool pretty_print) {
    dump(os, model_to_json(results), pretty_print);
}

void write_model_json(const std::string& filepath, const FinancialResults& results,
                      bool pretty_print) {
    std::ofstream file = open_output(filepath);
    write_model_json(file, results, pretty_print);
}

void write_monte_carlo_json(std::ostream& os, const MonteCarloResult& result,
                            bool include_trials, bool pretty_print) {
    const MonteCarloSummary& s = result.summary;
    json j;
    j["seed"] = result.seed;
    j["iterations"] = result.rows.size();
    j["execution_time_ms"] = result.execution_time_ms;
    j["statistics"] = {
        {"equity_irr", summary_to_json(s.equity_irr)},
        {"project_irr", summary_to_json(s.project_irr)},
        {"npv", summary_to_json(s.npv)},
        {"min_dscr", summary_to_json(s.min_dscr)},
        {"dscr_covenant", s.dscr_covenant},
        {"prob_dscr_below_covenant", s.prob_dscr_below_covenant},
        {"irr_not_converged", s.irr_not_converged}
    };

    if (include_trials) {
        json trials = json::array();
        for (const auto& row : result.rows) {
            trials.push_back({
                {"iteration", row.iteration},
                {"capacity_factor", row.capacity_factor},
                {"opex_usd_per_mwh", row.opex_usd_per_mwh},
                {"fx_depreciation", row.fx_depreciation},
                {"hard_currency_rate", row.hard_currency_rate},
                {"local_currency_rate", row.local_currency_rate},
                {"debt_ratio", row.debt_ratio},
                {"equity_irr", number_or_null(row.equity_irr)},
                {"equity_irr_converged", row.equity_irr_converged},
                {"project_irr", number_or_null(row.project_irr)},
                {"npv", row.npv},
                {"min_dscr", number_or_null(row.min_dscr)}
            });
        }
        j["trials"] = trials;
    }
    dump(os, j, pretty_print);
}

void write_monte_carlo_json(const std::string& filepath, const MonteCarloResult& result,
                            bool include_trials, bool pretty_print) {
    std::ofstream file = open_output(filepath);
    write_monte_carlo_json(file, result, include_trials, pretty_print);
}

void write_sensitivity_json(std::ostream& os, const SensitivityResult& result,
                            bool pretty_print) {
    json j;
    j["base"] = {
        {"equity_irr", number_or_null(result.base_equity_irr)},
        {"project_irr", number_or_null(result.base_project_irr)},
        {"npv", result.base_npv},
        {"min_dscr", number_or_null(result.base_min_dscr)}
    };
    j["execution_time_ms"] = result.execution_time_ms;

    json rows = json::array();
    for (const auto& row : result.rows) {
        rows.push_back({
            {"label", row.label},
            {"field", field_name(row.field)},
            {"base_value", row.base_value},
            {"stress_value", row.stress_value},
            {"stressed_equity_irr", number_or_null(row.stressed_equity_irr)},
            {"delta_equity_irr", number_or_null(row.delta_equity_irr)},
            {"stressed_npv", row.stressed_npv},
            {"delta_npv", row.delta_npv},
            {"stressed_project_irr", number_or_null(row.stressed_project_irr)},
            {"stressed_min_dscr", number_or_null(row.stressed_min_dscr)},
            {"equity_irr_converged", row.equity_irr_converged}
        });
    }
    j["rows"] = rows;

    json bars = json::array();
    for (const auto& bar : tornado(result)) {
        bars.push_back({
            {"label", bar.label},
            {"field", field_name(bar.field)},
            {"low_delta", number_or_null(bar.low_delta)},
            {"high_delta", number_or_null(bar.high_delta)},
            {"swing", number_or_null(bar.swing)}
        });
    }
    j["tornado"] = bars;
    dump(os, j, pretty_print);
}

void write_sensitivity_json(const std::string& filepath, const SensitivityResult& result,
                            bool pretty_print) {
    std::ofstream file = open_output(filepath);
    write_sensitivity_json(file, result, pretty_print);
}

void write_optimization_json(std::ostream& os, const OptimizationResult& result,
                             bool pretty_print) {
    json j;
    j["objective"] = objective_to_string(result.objective);
    j["converged"] = result.converged;
    j["message"] = result.message;
    j["iterations"] = result.iterations;
    j["evaluations"] = result.evaluations;
    j["structure"] = {
        {"debt_ratio", result.debt_ratio},
        {"hard_currency_share", result.hard_currency_share},
        {"dfi_share", result.dfi_share}
    };
    j["metrics"] = {
        {"equity_irr", number_or_null(result.equity_irr)},
        {"project_irr", number_or_null(result.project_irr)},
        {"npv", result.npv},
        {"min_dscr", number_or_null(result.min_dscr)}
    };
    j["violations"] = {
        {"equity_irr", result.irr_violation},
        {"dscr", result.dscr_violation}
    };
    j["model"] = model_to_json(result.financials);
    dump(os, j, pretty_print);
}

void write_optimization_json(const std::string& filepath, const OptimizationResult& result,
                             bool pretty_print) {
    std::ofstream file = open_output(filepath);
    write_optimization_json(file, result, pretty_print);
}

} // namespace io
} // namespace powerfin
