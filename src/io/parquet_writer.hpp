#ifndef POWERFIN_PARQUET_WRITER_HPP
#define POWERFIN_PARQUET_WRITER_HPP

#include "../financial_model.hpp"
#include "../monte_carlo.hpp"
#include <string>

namespace powerfin {

class ParquetWriter {
public:
    /**
     * Write the Monte Carlo trial table to a Parquet file.
     *
     * Output schema:
     *   - iteration: uint32
     *   - capacity_factor, opex_usd_per_mwh, fx_depreciation,
     *     hard_currency_rate, local_currency_rate, debt_ratio: float64
     *   - equity_irr, project_irr: float64 (null when not found)
     *   - npv: float64
     *   - min_dscr: float64 (null when no debt service)
     *
     * @throws std::runtime_error if the table is empty or cannot be written
     */
    static void write_monte_carlo(const MonteCarloResult& result, const std::string& filepath);

    /**
     * Write the annual schedule, one row per year, same columns as the CSV output.
     */
    static void write_schedule(const FinancialResults& results, const std::string& filepath);
};

} // namespace powerfin

#endif // POWERFIN_PARQUET_WRITER_HPP
