#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "optimizer.hpp"

using namespace powerfin;
using Catch::Matchers::WithinAbs;

// ============================================================================
// Objective names
// ============================================================================

TEST_CASE("Objective names round trip", "[optimizer]") {
    REQUIRE(objective_to_string(Objective::EquityIrr) == "equity_irr");
    REQUIRE(objective_to_string(Objective::ProjectIrr) == "project_irr");
    REQUIRE(objective_to_string(Objective::Npv) == "npv");
    REQUIRE(string_to_objective("npv") == Objective::Npv);
    REQUIRE_THROWS_AS(string_to_objective("dscr"), std::invalid_argument);
}

TEST_CASE("Default floors and bounds", "[optimizer]") {
    OptimizationConstraints c;
    REQUIRE(c.min_equity_irr == 0.15);
    REQUIRE(c.min_dscr == 1.30);

    OptimizerConfig config;
    REQUIRE(config.debt_ratio_min == 0.50);
    REQUIRE(config.debt_ratio_max == 0.80);
    REQUIRE(config.dfi_share_max == 0.20);
    REQUIRE(config.initial_hard_share == 0.45);
}

// ============================================================================
// Reference case
// ============================================================================

TEST_CASE("Equity IRR objective pushes leverage to its bound", "[optimizer]") {
    OptimizationResult r = optimize_capital_structure(Objective::EquityIrr);

    REQUIRE(r.converged);
    REQUIRE(r.objective == Objective::EquityIrr);
    REQUIRE_THAT(r.debt_ratio, WithinAbs(0.80, 1e-6));
    REQUIRE_THAT(r.hard_currency_share, WithinAbs(0.0, 1e-3));
    REQUIRE(r.dfi_share >= 0.0);
    REQUIRE(r.dfi_share <= 0.20);
    REQUIRE_THAT(r.equity_irr, WithinAbs(0.4021, 1e-3));
    REQUIRE(r.min_dscr.has_value());
    REQUIRE_THAT(*r.min_dscr, WithinAbs(1.4799, 1e-3));
    REQUIRE(r.irr_violation == 0.0);
    REQUIRE(r.dscr_violation == 0.0);
    REQUIRE(r.evaluations > r.iterations);
}

TEST_CASE("Optimized point reproduces its financials", "[optimizer]") {
    OptimizationResult r = optimize_capital_structure(Objective::EquityIrr);

    DebtStructure debt = DebtStructure::from_ratios(ProjectParameters().total_capex(),
                                                    r.debt_ratio, r.hard_currency_share, r.dfi_share);
    FinancialResults rebuilt = build_model(ProjectParameters(), debt);

    REQUIRE_THAT(rebuilt.equity_irr(), WithinAbs(r.equity_irr, 1e-12));
    REQUIRE_THAT(rebuilt.npv, WithinAbs(r.npv, 1e-9));
    REQUIRE_THAT(r.financials.npv, WithinAbs(r.npv, 1e-12));
}

TEST_CASE("NPV objective", "[optimizer]") {
    OptimizationResult r = optimize_capital_structure(Objective::Npv);

    REQUIRE(r.converged);
    REQUIRE_THAT(r.debt_ratio, WithinAbs(0.80, 1e-6));
    REQUIRE_THAT(r.hard_currency_share, WithinAbs(0.0, 1e-3));
    REQUIRE_THAT(r.npv, WithinAbs(46.534, 1e-2));
}

TEST_CASE("Project IRR objective converges inside the floors", "[optimizer]") {
    OptimizationResult r = optimize_capital_structure(Objective::ProjectIrr);

    REQUIRE(r.converged);
    REQUIRE(r.equity_irr >= 0.15 - 1e-4);
    REQUIRE(*r.min_dscr >= 1.30 - 1e-4);
    REQUIRE(r.debt_ratio >= 0.50);
    REQUIRE(r.debt_ratio <= 0.80);
}

TEST_CASE("Unreachable floors are reported, not hidden", "[optimizer]") {
    OptimizationResult r = optimize_capital_structure(Objective::EquityIrr,
                                                      OptimizationConstraints(0.50, 3.0));

    REQUIRE_FALSE(r.converged);
    REQUIRE(r.message == "Inequality constraints incompatible");
    REQUIRE(r.irr_violation > 0.05);
    REQUIRE(r.dscr_violation > 1.0);
}

TEST_CASE("Narrow bounds hold the optimizer", "[optimizer]") {
    OptimizerConfig config;
    config.debt_ratio_min = 0.60;
    config.debt_ratio_max = 0.70;
    config.initial_debt_ratio = 0.65;

    OptimizationResult r = optimize_capital_structure(ProjectParameters(), DebtTerms(),
                                                      Objective::EquityIrr,
                                                      OptimizationConstraints(), config);
    REQUIRE(r.debt_ratio >= 0.60);
    REQUIRE(r.debt_ratio <= 0.70 + 1e-12);
}

TEST_CASE("DFI participation can be switched off through its bounds", "[optimizer]") {
    OptimizerConfig config;
    config.dfi_share_min = 0.0;
    config.dfi_share_max = 0.0;
    config.initial_dfi_share = 0.0;

    OptimizationResult r = optimize_capital_structure(ProjectParameters(), DebtTerms(),
                                                      Objective::EquityIrr,
                                                      OptimizationConstraints(), config);
    REQUIRE(r.converged);
    REQUIRE(r.dfi_share == 0.0);
    REQUIRE_THAT(r.debt_ratio, WithinAbs(0.80, 1e-6));
    REQUIRE_THAT(r.equity_irr, WithinAbs(0.4021, 1e-3));
}

// ============================================================================
// Invalid input
// ============================================================================

TEST_CASE("Invalid optimizer configuration", "[optimizer]") {
    OptimizerConfig inverted;
    inverted.debt_ratio_min = 0.9;
    REQUIRE_THROWS_AS(optimize_capital_structure(ProjectParameters(), DebtTerms(), Objective::Npv,
                                                 OptimizationConstraints(), inverted),
                      ValidationError);

    OptimizerConfig no_budget;
    no_budget.max_iterations = 0;
    REQUIRE_THROWS_AS(optimize_capital_structure(ProjectParameters(), DebtTerms(), Objective::Npv,
                                                 OptimizationConstraints(), no_budget),
                      ValidationError);

    DebtTerms long_tenor;
    long_tenor.tenor_years = 30;
    REQUIRE_THROWS_AS(optimize_capital_structure(ProjectParameters(), long_tenor, Objective::Npv,
                                                 OptimizationConstraints()),
                      ValidationError);
}
