#include "optimizer.hpp"
#include "logger.hpp"
#include "sqp_solver.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>

namespace powerfin {

std::string objective_to_string(Objective objective) {
    switch (objective) {
        case Objective::EquityIrr: return "equity_irr";
        case Objective::ProjectIrr: return "project_irr";
        case Objective::Npv: return "npv";
    }
    return "unknown";
}

Objective string_to_objective(const std::string& str) {
    if (str == "equity_irr") return Objective::EquityIrr;
    if (str == "project_irr") return Objective::ProjectIrr;
    if (str == "npv") return Objective::Npv;
    throw std::invalid_argument("Unknown objective: " + str);
}

OptimizationConstraints::OptimizationConstraints()
    : min_equity_irr(0.15), min_dscr(1.30) {}

OptimizationConstraints::OptimizationConstraints(double min_equity_irr, double min_dscr)
    : min_equity_irr(min_equity_irr), min_dscr(min_dscr) {}

OptimizerConfig::OptimizerConfig()
    : debt_ratio_min(0.50),
      debt_ratio_max(0.80),
      hard_share_min(0.0),
      hard_share_max(1.0),
      dfi_share_min(0.0),
      dfi_share_max(0.20),
      initial_debt_ratio(0.80),
      initial_hard_share(0.45),
      initial_dfi_share(0.10),
      max_iterations(150),
      ftol(1e-4),
      ctol(1e-4) {}

OptimizationResult::OptimizationResult()
    : objective(Objective::EquityIrr),
      debt_ratio(0.0),
      hard_currency_share(0.0),
      dfi_share(0.0),
      equity_irr(0.0),
      project_irr(0.0),
      npv(0.0),
      converged(false),
      iterations(0),
      evaluations(0),
      irr_violation(0.0),
      dscr_violation(0.0) {}

namespace {

// Stand-in for an undefined minimum DSCR in the coverage constraint
constexpr double UNDEFINED_DSCR_VALUE = 1e9;

// Rate used in place of a NaN IRR candidate so the search moves away
constexpr double UNUSABLE_IRR = -1.0;

double usable(double rate) {
    return std::isfinite(rate) ? rate : UNUSABLE_IRR;
}

double objective_value(const FinancialResults& model, Objective objective) {
    switch (objective) {
        case Objective::EquityIrr: return usable(model.equity_irr());
        case Objective::ProjectIrr: return usable(model.project_irr());
        case Objective::Npv: return model.npv;
    }
    return 0.0;
}

void validate_config(const OptimizerConfig& config) {
    std::vector<std::string> errors;
    if (!(config.debt_ratio_min <= config.debt_ratio_max) ||
        config.debt_ratio_min < 0.0 || config.debt_ratio_max > 1.0) {
        errors.push_back("debt ratio bounds must satisfy 0 <= min <= max <= 1");
    }
    if (!(config.hard_share_min <= config.hard_share_max) ||
        config.hard_share_min < 0.0 || config.hard_share_max > 1.0) {
        errors.push_back("hard-currency share bounds must satisfy 0 <= min <= max <= 1");
    }
    if (!(config.dfi_share_min <= config.dfi_share_max) ||
        config.dfi_share_min < 0.0 || config.dfi_share_max > 1.0) {
        errors.push_back("DFI share bounds must satisfy 0 <= min <= max <= 1");
    }
    if (config.max_iterations <= 0) {
        errors.push_back("max_iterations must be positive");
    }
    if (!(config.ftol > 0.0) || !(config.ctol > 0.0)) {
        errors.push_back("optimizer tolerances must be positive");
    }
    if (!errors.empty()) {
        throw ValidationError(errors);
    }
}

} // anonymous namespace

OptimizationResult optimize_capital_structure(const ProjectParameters& params,
                                              const DebtTerms& terms,
                                              Objective objective,
                                              const OptimizationConstraints& constraints,
                                              const OptimizerConfig& config) {
    validate_config(config);
    if (terms.tenor_years > params.operating_years()) {
        throw ValidationError("tenor_years exceeds operating_years");
    }

    auto start_time = std::chrono::high_resolution_clock::now();
    Logger& logger = Logger::get_instance();
    logger.log_analysis_start("optimization", {
        {"objective", objective_to_string(objective)},
        {"min_equity_irr", format_value(constraints.min_equity_irr)},
        {"min_dscr", format_value(constraints.min_dscr)}
    });

    auto build_at = [&](const std::vector<double>& x) {
        DebtStructure debt = DebtStructure::from_ratios(params.total_capex(), x[0], x[1], x[2], terms);
        return build_model(params, debt);
    };

    SqpProblem problem;
    problem.lower = {config.debt_ratio_min, config.hard_share_min, config.dfi_share_min};
    problem.upper = {config.debt_ratio_max, config.hard_share_max, config.dfi_share_max};
    problem.evaluate = [&](const std::vector<double>& x) {
        FinancialResults model = build_at(x);
        double dscr = model.min_dscr ? *model.min_dscr : UNDEFINED_DSCR_VALUE;
        SqpEvaluation e;
        e.objective = -objective_value(model, objective);
        e.constraints = {
            usable(model.equity_irr()) - constraints.min_equity_irr,
            dscr - constraints.min_dscr
        };
        return e;
    };

    SqpOptions options;
    options.max_iterations = config.max_iterations;
    options.ftol = config.ftol;
    options.ctol = config.ctol;

    SqpSolver solver(options);
    SqpResult sqp = solver.minimize(problem, {
        config.initial_debt_ratio, config.initial_hard_share, config.initial_dfi_share
    });

    OptimizationResult result;
    result.objective = objective;
    result.debt_ratio = sqp.x[0];
    result.hard_currency_share = sqp.x[1];
    result.dfi_share = sqp.x[2];
    result.financials = build_at(sqp.x);
    result.equity_irr = result.financials.equity_irr();
    result.project_irr = result.financials.project_irr();
    result.npv = result.financials.npv;
    result.min_dscr = result.financials.min_dscr;
    result.converged = sqp.converged;
    result.message = sqp.message;
    result.iterations = sqp.iterations;
    result.evaluations = sqp.evaluations;
    result.irr_violation = std::max(0.0, constraints.min_equity_irr - usable(result.equity_irr));
    result.dscr_violation = result.min_dscr ? std::max(0.0, constraints.min_dscr - *result.min_dscr) : 0.0;

    if (!result.converged) {
        logger.log_warning("Capital-structure optimization did not converge", {
            {"event", "optimizer_not_converged"},
            {"message", result.message},
            {"iterations", std::to_string(result.iterations)}
        });
    }
    if (result.irr_violation > config.ctol || result.dscr_violation > config.ctol) {
        logger.log_warning("Optimized structure violates constraints", {
            {"event", "constraint_violation"},
            {"irr_violation", format_value(result.irr_violation)},
            {"dscr_violation", format_value(result.dscr_violation)}
        });
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    double elapsed = std::chrono::duration<double, std::milli>(end_time - start_time).count();
    logger.log_analysis_complete("optimization", elapsed, {
        {"converged", result.converged ? "true" : "false"},
        {"iterations", std::to_string(result.iterations)},
        {"debt_ratio", format_value(result.debt_ratio)},
        {"hard_currency_share", format_value(result.hard_currency_share)},
        {"dfi_share", format_value(result.dfi_share)},
        {"equity_irr", format_value(result.equity_irr)}
    });
    return result;
}

OptimizationResult optimize_capital_structure(Objective objective,
                                              const OptimizationConstraints& constraints) {
    return optimize_capital_structure(ProjectParameters(), DebtTerms(), objective, constraints);
}

} // namespace powerfin
