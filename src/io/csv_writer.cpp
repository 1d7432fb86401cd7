#include "csv_writer.hpp"
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace powerfin {
namespace io {

namespace {

// Finite numbers in full precision, anything else as an empty cell
std::string cell(double value) {
    if (!std::isfinite(value)) {
        return "";
    }
    std::ostringstream oss;
    oss << std::setprecision(12) << value;
    return oss.str();
}

std::string cell(const std::optional<double>& value) {
    return value ? cell(*value) : std::string();
}

std::string quoted(const std::string& text) {
    if (text.find_first_of(",\"\n") == std::string::npos) {
        return text;
    }
    std::string out = "\"";
    for (char c : text) {
        if (c == '"') out += '"';
        out += c;
    }
    return out + "\"";
}

std::ofstream open_output(const std::string& filepath) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    return file;
}

} // anonymous namespace

void write_schedule_csv(std::ostream& os, const FinancialResults& results) {
    os << "year,phase,generation_mwh,fx_rate,revenue,levy,opex,ebitda,depreciation,"
          "interest,principal,tax,cfads,debt_service,equity_cashflow,project_cashflow,dscr\n";
    for (const auto& row : results.rows) {
        os << row.year << ','
           << (row.phase == Phase::Construction ? "construction" : "operation") << ','
           << cell(row.generation_mwh) << ','
           << cell(row.fx_rate) << ','
           << cell(row.revenue) << ','
           << cell(row.levy) << ','
           << cell(row.opex) << ','
           << cell(row.ebitda) << ','
           << cell(row.depreciation) << ','
           << cell(row.interest) << ','
           << cell(row.principal) << ','
           << cell(row.tax) << ','
           << cell(row.cfads) << ','
           << cell(row.debt_service) << ','
           << cell(row.equity_cashflow) << ','
           << cell(row.project_cashflow) << ','
           << cell(row.dscr) << '\n';
    }
}

void write_schedule_csv(const std::string& filepath, const FinancialResults& results) {
    std::ofstream file = open_output(filepath);
    write_schedule_csv(file, results);
}

void write_monte_carlo_csv(std::ostream& os, const MonteCarloResult& result) {
    os << "iteration,capacity_factor,opex_usd_per_mwh,fx_depreciation,hard_currency_rate,"
          "local_currency_rate,debt_ratio,equity_irr,equity_irr_converged,project_irr,npv,min_dscr\n";
    for (const auto& row : result.rows) {
        os << row.iteration << ','
           << cell(row.capacity_factor) << ','
           << cell(row.opex_usd_per_mwh) << ','
           << cell(row.fx_depreciation) << ','
           << cell(row.hard_currency_rate) << ','
           << cell(row.local_currency_rate) << ','
           << cell(row.debt_ratio) << ','
           << cell(row.equity_irr) << ','
           << (row.equity_irr_converged ? "true" : "false") << ','
           << cell(row.project_irr) << ','
           << cell(row.npv) << ','
           << cell(row.min_dscr) << '\n';
    }
}

void write_monte_carlo_csv(const std::string& filepath, const MonteCarloResult& result) {
    std::ofstream file = open_output(filepath);
    write_monte_carlo_csv(file, result);
}

void write_sensitivity_csv(std::ostream& os, const SensitivityResult& result) {
    os << "label,field,base_value,stress_value,base_equity_irr,stressed_equity_irr,"
          "delta_equity_irr,base_npv,stressed_npv,delta_npv,stressed_project_irr,stressed_min_dscr\n";
    for (const auto& row : result.rows) {
        os << quoted(row.label) << ','
           << field_name(row.field) << ','
           << cell(row.base_value) << ','
           << cell(row.stress_value) << ','
           << cell(row.base_equity_irr) << ','
           << cell(row.stressed_equity_irr) << ','
           << cell(row.delta_equity_irr) << ','
           << cell(row.base_npv) << ','
           << cell(row.stressed_npv) << ','
           << cell(row.delta_npv) << ','
           << cell(row.stressed_project_irr) << ','
           << cell(row.stressed_min_dscr) << '\n';
    }
}

void write_sensitivity_csv(const std::string& filepath, const SensitivityResult& result) {
    std::ofstream file = open_output(filepath);
    write_sensitivity_csv(file, result);
}

} // namespace io
} // namespace powerfin
