#ifndef POWERFIN_IO_JSON_WRITER_HPP
#define POWERFIN_IO_JSON_WRITER_HPP

#include "../financial_model.hpp"
#include "../monte_carlo.hpp"
#include "../optimizer.hpp"
#include "../sensitivity.hpp"
#include <ostream>
#include <string>

namespace powerfin {
namespace io {

// Headline metrics, tranche totals and the annual schedule.
// Undefined DSCRs and IRRs that were not found are written as null.
void write_model_json(std::ostream& os, const FinancialResults& results,
                      bool pretty_print = true);
void write_model_json(const std::string& filepath, const FinancialResults& results,
                      bool pretty_print = true);

// Summary statistics, and the per-trial table when include_trials is set
void write_monte_carlo_json(std::ostream& os, const MonteCarloResult& result,
                            bool include_trials = true, bool pretty_print = true);
void write_monte_carlo_json(const std::string& filepath, const MonteCarloResult& result,
                            bool include_trials = true, bool pretty_print = true);

// Perturbation rows plus the tornado ranking
void write_sensitivity_json(std::ostream& os, const SensitivityResult& result,
                            bool pretty_print = true);
void write_sensitivity_json(const std::string& filepath, const SensitivityResult& result,
                            bool pretty_print = true);

void write_optimization_json(std::ostream& os, const OptimizationResult& result,
                             bool pretty_print = true);
void write_optimization_json(const std::string& filepath, const OptimizationResult& result,
                             bool pretty_print = true);

} // namespace io
} // namespace powerfin

#endif // POWERFIN_IO_JSON_WRITER_HPP
