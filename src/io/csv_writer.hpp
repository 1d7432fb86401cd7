#ifndef POWERFIN_IO_CSV_WRITER_HPP
#define POWERFIN_IO_CSV_WRITER_HPP

#include "../financial_model.hpp"
#include "../monte_carlo.hpp"
#include "../sensitivity.hpp"
#include <ostream>
#include <string>

namespace powerfin {
namespace io {

// One line per year with a header row; undefined values are left empty
void write_schedule_csv(std::ostream& os, const FinancialResults& results);
void write_schedule_csv(const std::string& filepath, const FinancialResults& results);

// One line per trial
void write_monte_carlo_csv(std::ostream& os, const MonteCarloResult& result);
void write_monte_carlo_csv(const std::string& filepath, const MonteCarloResult& result);

// One line per (parameter, stress value)
void write_sensitivity_csv(std::ostream& os, const SensitivityResult& result);
void write_sensitivity_csv(const std::string& filepath, const SensitivityResult& result);

} // namespace io
} // namespace powerfin

#endif // POWERFIN_IO_CSV_WRITER_HPP
