#ifndef POWERFIN_FINANCIAL_MODEL_HPP
#define POWERFIN_FINANCIAL_MODEL_HPP

#include "debt_schedule.hpp"
#include "parameters.hpp"
#include "returns.hpp"
#include <optional>
#include <vector>

namespace powerfin {

enum class Phase {
    Construction,
    Operation
};

// One year of the projection. USD millions unless noted.
struct YearRow {
    int year;                       // 0-based index into the full timeline
    Phase phase;
    int operating_year;             // 0 at COD, -1 during construction
    double generation_mwh;
    double fx_rate;                 // LKR per USD
    double revenue;
    double levy;
    double opex;
    double ebitda;
    double depreciation;
    double interest;
    double principal;
    double tax;
    double cfads;                   // EBITDA less tax
    double debt_service;
    double equity_cashflow;
    double project_cashflow;
    std::optional<double> dscr;     // Empty when there is no debt service

    YearRow();
};

// Full annual schedule plus headline metrics
struct FinancialResults {
    std::vector<YearRow> rows;      // Construction years first
    std::vector<TrancheSchedule> tranches;

    IrrResult equity_irr_result;
    IrrResult project_irr_result;
    double npv;                     // Equity cash flows at discount_rate
    std::optional<double> min_dscr; // Empty when no year carries debt service

    double equity_irr() const { return equity_irr_result.rate; }
    double project_irr() const { return project_irr_result.rate; }

    std::vector<double> equity_cashflows() const;
    std::vector<double> project_cashflows() const;

    // Operating-year DSCRs, skipping years without debt service
    std::vector<double> defined_dscrs() const;

    // 0 when no year carries debt service
    double average_dscr() const;

    FinancialResults();
};

// Build the annual projection for a parameter set and debt structure.
//
// Each operating year t (0 at COD):
//   fx_t       = fx_initial * (1 + fx_depreciation)^t
//   revenue_t  = generation_t * tariff * 1000 / fx_t / 1e6
//   EBITDA_t   = revenue_t - levy_t - opex_t
//   tax_t      = max(0, (EBITDA_t - depreciation_t - interest_t) * tax_rate)
//   equity CF  = EBITDA_t - interest_t - principal_t - tax_t
//   project CF = EBITDA_t - unlevered tax_t
//   DSCR_t     = (EBITDA_t - tax_t) / debt service_t
//
// Construction years carry the capex outflow: the equity share for the
// equity series, the whole capex for the project series.
//
// Throws ValidationError when the debt tenor exceeds the operating life.
FinancialResults build_model(const ProjectParameters& params, const DebtStructure& debt);

} // namespace powerfin

#endif // POWERFIN_FINANCIAL_MODEL_HPP
