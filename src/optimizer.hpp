#ifndef POWERFIN_OPTIMIZER_HPP
#define POWERFIN_OPTIMIZER_HPP

#include "financial_model.hpp"
#include "parameters.hpp"
#include <optional>
#include <string>

namespace powerfin {

// Scalar to maximize
enum class Objective {
    EquityIrr,
    ProjectIrr,
    Npv
};

std::string objective_to_string(Objective objective);
Objective string_to_objective(const std::string& str);

// Floors on the optimized point
struct OptimizationConstraints {
    double min_equity_irr;
    double min_dscr;

    OptimizationConstraints();
    OptimizationConstraints(double min_equity_irr, double min_dscr);
};

// Bounds, starting point and solver budget
struct OptimizerConfig {
    double debt_ratio_min;
    double debt_ratio_max;
    double hard_share_min;
    double hard_share_max;
    double dfi_share_min;
    double dfi_share_max;
    double initial_debt_ratio;
    double initial_hard_share;
    double initial_dfi_share;
    int max_iterations;
    double ftol;
    double ctol;

    OptimizerConfig();
};

struct OptimizationResult {
    Objective objective;
    double debt_ratio;
    double hard_currency_share;
    double dfi_share;
    double equity_irr;
    double project_irr;
    double npv;
    std::optional<double> min_dscr;
    FinancialResults financials;    // Full model at the returned point
    bool converged;
    std::string message;
    int iterations;
    int evaluations;
    double irr_violation;           // max(0, floor - equity IRR)
    double dscr_violation;          // max(0, floor - min DSCR), 0 if undefined

    OptimizationResult();
};

// Maximize the objective over debt ratio, hard-currency share and DFI share
// subject to the equity-IRR and DSCR floors. An undefined minimum DSCR (no
// debt service) satisfies the coverage floor.
//
// Callers must check `converged`: on incompatible constraints or an
// exhausted iteration budget the best iterate is returned with
// converged = false.
OptimizationResult optimize_capital_structure(const ProjectParameters& params,
                                              const DebtTerms& terms,
                                              Objective objective,
                                              const OptimizationConstraints& constraints,
                                              const OptimizerConfig& config = OptimizerConfig());

// Reference case, default bounds and starting point (0.80, 0.45, 0.10)
OptimizationResult optimize_capital_structure(Objective objective = Objective::EquityIrr,
                                              const OptimizationConstraints& constraints = OptimizationConstraints());

} // namespace powerfin

#endif // POWERFIN_OPTIMIZER_HPP
