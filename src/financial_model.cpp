#include "financial_model.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace powerfin {

namespace {

// Debt service below this is treated as none; the DSCR is then undefined
constexpr double MIN_DEBT_SERVICE = 1e-9;

} // anonymous namespace

// ============================================================================
// YearRow / FinancialResults
// ============================================================================

YearRow::YearRow()
    : year(0),
      phase(Phase::Construction),
      operating_year(-1),
      generation_mwh(0.0),
      fx_rate(0.0),
      revenue(0.0),
      levy(0.0),
      opex(0.0),
      ebitda(0.0),
      depreciation(0.0),
      interest(0.0),
      principal(0.0),
      tax(0.0),
      cfads(0.0),
      debt_service(0.0),
      equity_cashflow(0.0),
      project_cashflow(0.0) {}

FinancialResults::FinancialResults()
    : npv(0.0) {}

std::vector<double> FinancialResults::equity_cashflows() const {
    std::vector<double> flows;
    flows.reserve(rows.size());
    for (const auto& row : rows) {
        flows.push_back(row.equity_cashflow);
    }
    return flows;
}

std::vector<double> FinancialResults::project_cashflows() const {
    std::vector<double> flows;
    flows.reserve(rows.size());
    for (const auto& row : rows) {
        flows.push_back(row.project_cashflow);
    }
    return flows;
}

std::vector<double> FinancialResults::defined_dscrs() const {
    std::vector<double> values;
    for (const auto& row : rows) {
        if (row.dscr) {
            values.push_back(*row.dscr);
        }
    }
    return values;
}

double FinancialResults::average_dscr() const {
    std::vector<double> values = defined_dscrs();
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

// ============================================================================
// build_model
// ============================================================================

FinancialResults build_model(const ProjectParameters& params, const DebtStructure& debt) {
    if (debt.tenor_years() > params.operating_years()) {
        throw ValidationError("tenor_years (" + std::to_string(debt.tenor_years()) +
                              ") exceeds operating_years (" +
                              std::to_string(params.operating_years()) + ")");
    }

    FinancialResults results;
    results.tranches = build_debt_schedule(params, debt);

    const int construction = params.construction_years();
    const int operating = params.operating_years();
    results.rows.reserve(static_cast<size_t>(construction + operating));

    const double equity_outlay = params.total_capex() - debt.total_debt();
    for (int k = 0; k < construction; ++k) {
        YearRow row;
        row.year = k;
        row.phase = Phase::Construction;
        row.fx_rate = params.fx_initial();
        row.equity_cashflow = -equity_outlay / construction;
        row.project_cashflow = -params.total_capex() / construction;
        results.rows.push_back(row);
    }

    const double annual_depreciation = params.total_capex() / params.depreciation_years();
    const double hard_share = params.opex_hard_share();

    for (int t = 0; t < operating; ++t) {
        const double td = static_cast<double>(t);
        YearRow row;
        row.year = construction + t;
        row.phase = Phase::Operation;
        row.operating_year = t;

        row.fx_rate = params.fx_initial() * std::pow(1.0 + params.fx_depreciation(), td);
        row.generation_mwh = params.capacity_mw() * params.capacity_factor() * params.hours_per_year() *
                             std::pow(1.0 - params.degradation_rate(), td);

        const double tariff = params.tariff_lkr_per_kwh() * std::pow(1.0 + params.tariff_escalation(), td);
        row.revenue = row.generation_mwh * tariff * 1000.0 / row.fx_rate / 1e6;
        row.levy = row.revenue * params.levy_rate();

        // Local opex escalates in LKR and is converted at the year's rate
        const double opex_rate =
            params.opex_usd_per_mwh() * hard_share * std::pow(1.0 + params.opex_escalation_hard(), td) +
            params.opex_usd_per_mwh() * (1.0 - hard_share) *
                std::pow(1.0 + params.opex_escalation_local(), td) * params.fx_initial() / row.fx_rate;
        row.opex = row.generation_mwh * opex_rate / 1e6;

        row.ebitda = row.revenue - row.levy - row.opex;
        row.depreciation = t < params.depreciation_years() ? annual_depreciation : 0.0;

        for (const auto& tranche : results.tranches) {
            const double conversion = tranche.currency == TrancheCurrency::Local ? row.fx_rate : 1.0;
            row.interest += tranche.interest[t] / conversion;
            row.principal += tranche.principal[t] / conversion;
        }
        row.debt_service = row.interest + row.principal;

        row.tax = std::max(0.0, (row.ebitda - row.depreciation - row.interest) * params.tax_rate());
        const double unlevered_tax = std::max(0.0, (row.ebitda - row.depreciation) * params.tax_rate());
        row.cfads = row.ebitda - row.tax;

        if (row.debt_service > MIN_DEBT_SERVICE) {
            row.dscr = row.cfads / row.debt_service;
        }

        row.equity_cashflow = row.ebitda - row.interest - row.principal - row.tax;
        row.project_cashflow = row.ebitda - unlevered_tax;
        if (t == operating - 1) {
            row.equity_cashflow += params.residual_value();
            row.project_cashflow += params.residual_value();
        }

        results.rows.push_back(row);
    }

    results.equity_irr_result = irr(results.equity_cashflows());
    results.project_irr_result = irr(results.project_cashflows());
    results.npv = npv(results.equity_cashflows(), params.discount_rate());

    std::vector<double> dscrs = results.defined_dscrs();
    if (!dscrs.empty()) {
        results.min_dscr = *std::min_element(dscrs.begin(), dscrs.end());
    }

    Logger::get_instance().log_model_built(results.equity_irr(), results.project_irr(),
                                           results.npv, results.min_dscr);
    return results;
}

} // namespace powerfin
