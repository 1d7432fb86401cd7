#ifndef POWERFIN_DEBT_SCHEDULE_HPP
#define POWERFIN_DEBT_SCHEDULE_HPP

#include "parameters.hpp"
#include <string>
#include <vector>

namespace powerfin {

enum class TrancheCurrency {
    Hard,   // USD
    Local   // LKR, serviced at each year's FX rate
};

// Amortization of one debt tranche, by operating year, in tranche currency
struct TrancheSchedule {
    std::string name;
    TrancheCurrency currency;
    double amount;                          // Disbursed amount
    double rate;
    std::vector<double> opening_balance;
    std::vector<double> interest;
    std::vector<double> principal;

    double total_principal() const;
    double total_interest() const;

    TrancheSchedule();
};

// Amortize a single tranche over `operating_years` years from COD.
//
// Years [0, grace) are interest-only. Principal is repaid in years
// [grace, tenor); the final repayment year retires the outstanding balance.
// Annuity: level payment recomputed from the outstanding balance over the
// remaining repayment years. Equal installment: amount / (tenor - grace).
TrancheSchedule amortize_tranche(const std::string& name,
                                 TrancheCurrency currency,
                                 double amount,
                                 double rate,
                                 int grace_years,
                                 int tenor_years,
                                 int operating_years,
                                 RepaymentMethod method);

// Market, DFI and local-currency tranches for a debt structure. The local
// tranche is disbursed in LKR at the initial FX rate.
std::vector<TrancheSchedule> build_debt_schedule(const ProjectParameters& params,
                                                 const DebtStructure& debt);

} // namespace powerfin

#endif // POWERFIN_DEBT_SCHEDULE_HPP
