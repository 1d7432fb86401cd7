#include "debt_schedule.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace powerfin {

TrancheSchedule::TrancheSchedule()
    : currency(TrancheCurrency::Hard), amount(0.0), rate(0.0) {}

double TrancheSchedule::total_principal() const {
    return std::accumulate(principal.begin(), principal.end(), 0.0);
}

double TrancheSchedule::total_interest() const {
    return std::accumulate(interest.begin(), interest.end(), 0.0);
}

TrancheSchedule amortize_tranche(const std::string& name,
                                 TrancheCurrency currency,
                                 double amount,
                                 double rate,
                                 int grace_years,
                                 int tenor_years,
                                 int operating_years,
                                 RepaymentMethod method) {
    if (amount < 0.0) {
        throw std::invalid_argument("Tranche amount must be non-negative: " + name);
    }
    if (grace_years < 0 || tenor_years <= grace_years) {
        throw std::invalid_argument("Tranche tenor must exceed grace period: " + name);
    }
    if (tenor_years > operating_years) {
        throw std::invalid_argument("Tranche tenor exceeds operating life: " + name);
    }

    TrancheSchedule schedule;
    schedule.name = name;
    schedule.currency = currency;
    schedule.amount = amount;
    schedule.rate = rate;
    schedule.opening_balance.resize(operating_years, 0.0);
    schedule.interest.resize(operating_years, 0.0);
    schedule.principal.resize(operating_years, 0.0);

    const int repayment_years = tenor_years - grace_years;
    double balance = amount;

    for (int t = 0; t < operating_years; ++t) {
        double interest = balance * rate;
        double principal = 0.0;

        if (t >= grace_years && t < tenor_years && balance > 0.0) {
            if (t == tenor_years - 1) {
                principal = balance;
            } else if (method == RepaymentMethod::Annuity) {
                int remaining = tenor_years - t;
                if (std::abs(rate) < 1e-12) {
                    principal = balance / remaining;
                } else {
                    double payment = balance * rate / (1.0 - std::pow(1.0 + rate, -remaining));
                    principal = payment - interest;
                }
            } else {
                principal = amount / repayment_years;
            }
            principal = std::min(principal, balance);
        }

        schedule.opening_balance[t] = balance;
        schedule.interest[t] = interest;
        schedule.principal[t] = principal;
        balance -= principal;
    }

    return schedule;
}

std::vector<TrancheSchedule> build_debt_schedule(const ProjectParameters& params,
                                                 const DebtStructure& debt) {
    const int n = params.operating_years();
    const int grace = debt.grace_years();
    const int tenor = debt.tenor_years();

    std::vector<TrancheSchedule> tranches;
    tranches.reserve(3);
    tranches.push_back(amortize_tranche("usd_market", TrancheCurrency::Hard,
                                        debt.market_debt(), debt.hard_currency_rate(),
                                        grace, tenor, n, debt.repayment()));
    tranches.push_back(amortize_tranche("usd_dfi", TrancheCurrency::Hard,
                                        debt.dfi_debt(), debt.dfi_rate(),
                                        grace, tenor, n, debt.repayment()));
    tranches.push_back(amortize_tranche("lkr", TrancheCurrency::Local,
                                        debt.local_currency_debt() * params.fx_initial(),
                                        debt.local_currency_rate(),
                                        grace, tenor, n, debt.repayment()));
    return tranches;
}

} // namespace powerfin
