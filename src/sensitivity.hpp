#ifndef POWERFIN_SENSITIVITY_HPP
#define POWERFIN_SENSITIVITY_HPP

#include "financial_model.hpp"
#include "parameters.hpp"
#include <optional>
#include <string>
#include <vector>

namespace powerfin {

// One tracked parameter and the values it is stressed to
struct SensitivityEntry {
    std::string label;
    ParameterField field;
    double base_value;
    std::vector<double> stress_values;

    SensitivityEntry();
    SensitivityEntry(const std::string& label, ParameterField field,
                     double base_value, const std::vector<double>& stress_values);
};

struct SensitivityConfig {
    std::vector<SensitivityEntry> entries;
};

// Result of a single one-at-a-time perturbation
struct SensitivityRow {
    std::string label;
    ParameterField field;
    double base_value;              // Actual value in the base inputs
    double stress_value;
    double base_equity_irr;
    double stressed_equity_irr;
    double delta_equity_irr;
    double base_npv;
    double stressed_npv;
    double delta_npv;
    double stressed_project_irr;
    std::optional<double> stressed_min_dscr;
    bool equity_irr_converged;

    SensitivityRow();
};

// Spread of one parameter's equity-IRR impact, for tornado charts
struct TornadoBar {
    std::string label;
    ParameterField field;
    double low_delta;               // Most negative equity-IRR delta
    double high_delta;              // Most positive equity-IRR delta
    double swing;                   // Largest absolute delta

    TornadoBar();
};

struct SensitivityResult {
    std::vector<SensitivityRow> rows;
    double base_equity_irr;
    double base_project_irr;
    double base_npv;
    std::optional<double> base_min_dscr;
    double execution_time_ms;

    SensitivityResult();
};

// Capacity factor 0.38 / 0.42, opex, tariff and capex +/-10%, FX
// depreciation 0.02 / 0.05, hard and local rates +/-1pp
SensitivityConfig default_sensitivity_config(const ProjectParameters& params,
                                             const DebtStructure& debt);

// Rebuild the model once per (parameter, stress value) with only that field
// changed. A configured base value that differs from the actual base input
// is logged and the actual value is reported.
SensitivityResult run_sensitivity(const ProjectParameters& base_params,
                                  const DebtStructure& base_debt,
                                  const SensitivityConfig& config);

// Parameters ranked by largest absolute equity-IRR delta, descending
std::vector<TornadoBar> tornado(const SensitivityResult& result);

} // namespace powerfin

#endif // POWERFIN_SENSITIVITY_HPP
