#include "sensitivity.hpp"
#include "logger.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <map>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace powerfin {

// ============================================================================
// Structures
// ============================================================================

SensitivityEntry::SensitivityEntry()
    : field(ParameterField::CapacityFactor), base_value(0.0) {}

SensitivityEntry::SensitivityEntry(const std::string& label, ParameterField field,
                                   double base_value, const std::vector<double>& stress_values)
    : label(label), field(field), base_value(base_value), stress_values(stress_values) {}

SensitivityRow::SensitivityRow()
    : field(ParameterField::CapacityFactor),
      base_value(0.0),
      stress_value(0.0),
      base_equity_irr(0.0),
      stressed_equity_irr(0.0),
      delta_equity_irr(0.0),
      base_npv(0.0),
      stressed_npv(0.0),
      delta_npv(0.0),
      stressed_project_irr(0.0),
      equity_irr_converged(false) {}

TornadoBar::TornadoBar()
    : field(ParameterField::CapacityFactor), low_delta(0.0), high_delta(0.0), swing(0.0) {}

SensitivityResult::SensitivityResult()
    : base_equity_irr(0.0), base_project_irr(0.0), base_npv(0.0), execution_time_ms(0.0) {}

// ============================================================================
// Sensitivity Implementation
// ============================================================================

namespace {

double current_value(const ProjectParameters& params, const DebtStructure& debt, ParameterField field) {
    return is_debt_field(field) ? debt.get(field) : params.get(field);
}

struct Perturbation {
    size_t entry;
    double stress_value;
};

} // anonymous namespace

SensitivityConfig default_sensitivity_config(const ProjectParameters& params,
                                             const DebtStructure& debt) {
    SensitivityConfig config;
    const double opex = params.opex_usd_per_mwh();
    const double tariff = params.tariff_lkr_per_kwh();
    const double capex = params.total_capex();
    const double hard_rate = debt.hard_currency_rate();
    const double local_rate = debt.local_currency_rate();

    config.entries = {
        {"Capacity factor", ParameterField::CapacityFactor, params.capacity_factor(), {0.38, 0.42}},
        {"Opex (USD/MWh)", ParameterField::OpexUsdPerMwh, opex, {opex * 0.9, opex * 1.1}},
        {"Tariff (LKR/kWh)", ParameterField::TariffLkrPerKwh, tariff, {tariff * 0.9, tariff * 1.1}},
        {"FX depreciation", ParameterField::FxDepreciation, params.fx_depreciation(), {0.02, 0.05}},
        {"Capex (USD M)", ParameterField::TotalCapex, capex, {capex * 0.9, capex * 1.1}},
        {"USD debt rate", ParameterField::HardCurrencyRate, hard_rate, {hard_rate - 0.01, hard_rate + 0.01}},
        {"LKR debt rate", ParameterField::LocalCurrencyRate, local_rate, {local_rate - 0.01, local_rate + 0.01}}
    };
    return config;
}

SensitivityResult run_sensitivity(const ProjectParameters& base_params,
                                  const DebtStructure& base_debt,
                                  const SensitivityConfig& config) {
    SensitivityResult result;
    auto start_time = std::chrono::high_resolution_clock::now();
    Logger& logger = Logger::get_instance();

    std::vector<Perturbation> perturbations;
    for (size_t e = 0; e < config.entries.size(); ++e) {
        const SensitivityEntry& entry = config.entries[e];
        for (double value : entry.stress_values) {
            perturbations.push_back({e, value});
        }
    }

    logger.log_analysis_start("sensitivity", {
        {"parameters", std::to_string(config.entries.size())},
        {"perturbations", std::to_string(perturbations.size())}
    });

    FinancialResults base = build_model(base_params, base_debt);
    result.base_equity_irr = base.equity_irr();
    result.base_project_irr = base.project_irr();
    result.base_npv = base.npv;
    result.base_min_dscr = base.min_dscr;

    std::vector<double> actual_base(config.entries.size());
    for (size_t e = 0; e < config.entries.size(); ++e) {
        const SensitivityEntry& entry = config.entries[e];
        actual_base[e] = current_value(base_params, base_debt, entry.field);
        if (std::abs(actual_base[e] - entry.base_value) > 1e-9 * std::max(1.0, std::abs(actual_base[e]))) {
            logger.log_warning("Configured base value differs from base inputs", {
                {"event", "sensitivity_base_mismatch"},
                {"parameter", field_name(entry.field)},
                {"configured", format_value(entry.base_value)},
                {"actual", format_value(actual_base[e])}
            });
        }
    }

    result.rows.resize(perturbations.size());
    std::exception_ptr failure;

#ifdef HAVE_OPENMP
    const long long count = static_cast<long long>(perturbations.size());
    #pragma omp parallel for schedule(dynamic, 1)
    for (long long i = 0; i < count; ++i) {
#else
    for (size_t i = 0; i < perturbations.size(); ++i) {
#endif
        try {
            const Perturbation& p = perturbations[static_cast<size_t>(i)];
            const SensitivityEntry& entry = config.entries[p.entry];

            ProjectParameters params = base_params;
            DebtStructure debt = base_debt;
            if (is_debt_field(entry.field)) {
                debt = base_debt.with_field(entry.field, p.stress_value);
            } else {
                params = base_params.with_field(entry.field, p.stress_value);
            }
            FinancialResults stressed = build_model(params, debt);

            SensitivityRow row;
            row.label = entry.label;
            row.field = entry.field;
            row.base_value = actual_base[p.entry];
            row.stress_value = p.stress_value;
            row.base_equity_irr = result.base_equity_irr;
            row.stressed_equity_irr = stressed.equity_irr();
            row.delta_equity_irr = stressed.equity_irr() - result.base_equity_irr;
            row.base_npv = result.base_npv;
            row.stressed_npv = stressed.npv;
            row.delta_npv = stressed.npv - result.base_npv;
            row.stressed_project_irr = stressed.project_irr();
            row.stressed_min_dscr = stressed.min_dscr;
            row.equity_irr_converged = stressed.equity_irr_result.converged;
            result.rows[static_cast<size_t>(i)] = row;
        } catch (...) {
#ifdef HAVE_OPENMP
            #pragma omp critical
#endif
            {
                if (!failure) {
                    failure = std::current_exception();
                }
            }
        }
    }

    if (failure) {
        std::rethrow_exception(failure);
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    result.execution_time_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();

    logger.log_analysis_complete("sensitivity", result.execution_time_ms, {
        {"rows", std::to_string(result.rows.size())},
        {"base_equity_irr", format_value(result.base_equity_irr)}
    });
    return result;
}

std::vector<TornadoBar> tornado(const SensitivityResult& result) {
    std::vector<TornadoBar> bars;
    std::map<std::string, size_t> index;

    for (const auto& row : result.rows) {
        auto it = index.find(row.label);
        if (it == index.end()) {
            TornadoBar bar;
            bar.label = row.label;
            bar.field = row.field;
            index[row.label] = bars.size();
            bars.push_back(bar);
            it = index.find(row.label);
        }
        TornadoBar& bar = bars[it->second];
        bar.low_delta = std::min(bar.low_delta, row.delta_equity_irr);
        bar.high_delta = std::max(bar.high_delta, row.delta_equity_irr);
        bar.swing = std::max(bar.swing, std::abs(row.delta_equity_irr));
    }

    std::stable_sort(bars.begin(), bars.end(), [](const TornadoBar& a, const TornadoBar& b) {
        return a.swing > b.swing;
    });
    return bars;
}

} // namespace powerfin
