#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <random>
#include "monte_carlo.hpp"

using namespace powerfin;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

// ============================================================================
// Distribution Tests
// ============================================================================

TEST_CASE("Distribution samples stay within bounds", "[monte_carlo]") {
    std::mt19937_64 rng(7);
    Distribution uniform = Distribution::uniform(0.38, 0.42);
    Distribution tri = Distribution::triangular(6.5, 6.83, 7.5);
    Distribution normal = Distribution::truncated_normal(0.40, 0.05, 0.35, 0.45);

    for (int i = 0; i < 2000; ++i) {
        double u = uniform.sample(rng);
        double t = tri.sample(rng);
        double n = normal.sample(rng);
        REQUIRE((u >= 0.38 && u <= 0.42));
        REQUIRE((t >= 6.5 && t <= 7.5));
        REQUIRE((n >= 0.35 && n <= 0.45));
    }
}

TEST_CASE("Triangular sample mean approaches (min + mode + max) / 3", "[monte_carlo]") {
    std::mt19937_64 rng(11);
    Distribution tri = Distribution::triangular(0.0, 1.0, 4.0);
    REQUIRE_THAT(tri.mean(), WithinRel(5.0 / 3.0, 1e-12));

    double sum = 0.0;
    const int n = 50000;
    for (int i = 0; i < n; ++i) sum += tri.sample(rng);
    REQUIRE_THAT(sum / n, WithinAbs(5.0 / 3.0, 0.02));
}

TEST_CASE("Degenerate distribution returns its single value", "[monte_carlo]") {
    std::mt19937_64 rng(1);
    REQUIRE(Distribution::uniform(0.4, 0.4).sample(rng) == 0.4);
}

TEST_CASE("Distribution rejects invalid parameters", "[monte_carlo]") {
    REQUIRE_THROWS_AS(Distribution::uniform(0.5, 0.4), ValidationError);
    REQUIRE_THROWS_AS(Distribution::triangular(1.0, 3.0, 2.0), ValidationError);
    REQUIRE_THROWS_AS(Distribution::truncated_normal(0.4, 0.0, 0.3, 0.5), ValidationError);
    REQUIRE_THROWS_AS(string_to_distribution("lognormal"), std::invalid_argument);
    REQUIRE(string_to_distribution("normal") == DistributionType::TruncatedNormal);
    REQUIRE(distribution_to_string(DistributionType::Triangular) == "triangular");
}

// ============================================================================
// Statistics
// ============================================================================

TEST_CASE("summarize computes moments and percentiles", "[monte_carlo]") {
    MetricSummary s = summarize({5.0, 1.0, 4.0, 2.0, 3.0});

    REQUIRE(s.count == 5);
    REQUIRE_THAT(s.mean, WithinRel(3.0, 1e-12));
    REQUIRE_THAT(s.std_dev, WithinRel(std::sqrt(2.0), 1e-12));
    REQUIRE_THAT(s.p10, WithinRel(1.4, 1e-12));
    REQUIRE_THAT(s.p50, WithinRel(3.0, 1e-12));
    REQUIRE_THAT(s.p90, WithinRel(4.6, 1e-12));
    REQUIRE(s.min == 1.0);
    REQUIRE(s.max == 5.0);

    MetricSummary empty = summarize({});
    REQUIRE(empty.count == 0);
    REQUIRE(empty.mean == 0.0);
}

// ============================================================================
// run_monte_carlo Tests
// ============================================================================

TEST_CASE("Monte Carlo is reproducible for a seed", "[monte_carlo]") {
    MonteCarloResult a = run_monte_carlo(200, 42);
    MonteCarloResult b = run_monte_carlo(200, 42);

    REQUIRE(a.rows.size() == 200);
    REQUIRE(a.seed == 42);
    for (size_t i = 0; i < a.rows.size(); ++i) {
        REQUIRE(a.rows[i].iteration == i);
        REQUIRE(a.rows[i].capacity_factor == b.rows[i].capacity_factor);
        REQUIRE(a.rows[i].debt_ratio == b.rows[i].debt_ratio);
        REQUIRE(a.rows[i].npv == b.rows[i].npv);
        REQUIRE(a.rows[i].equity_irr == b.rows[i].equity_irr);
    }
    REQUIRE(a.summary.npv.mean == b.summary.npv.mean);
    REQUIRE(a.summary.prob_dscr_below_covenant == b.summary.prob_dscr_below_covenant);
}

TEST_CASE("Different seeds give different draws", "[monte_carlo]") {
    MonteCarloResult a = run_monte_carlo(50, 1);
    MonteCarloResult b = run_monte_carlo(50, 2);
    REQUIRE(a.rows[0].capacity_factor != b.rows[0].capacity_factor);
}

TEST_CASE("Monte Carlo draws respect the default ranges", "[monte_carlo]") {
    MonteCarloResult r = run_monte_carlo(500, 123);

    for (const auto& row : r.rows) {
        REQUIRE((row.capacity_factor >= 0.38 && row.capacity_factor <= 0.42));
        REQUIRE((row.opex_usd_per_mwh >= 6.5 && row.opex_usd_per_mwh <= 7.5));
        REQUIRE((row.fx_depreciation >= 0.03 && row.fx_depreciation <= 0.05));
        REQUIRE((row.hard_currency_rate >= 0.065 && row.hard_currency_rate <= 0.09));
        REQUIRE((row.local_currency_rate >= 0.075 && row.local_currency_rate <= 0.09));
        REQUIRE((row.debt_ratio >= 0.50 && row.debt_ratio <= 0.80));
        REQUIRE(row.min_dscr.has_value());
    }

    const MonteCarloSummary& s = r.summary;
    REQUIRE(s.npv.count == 500);
    REQUIRE(s.equity_irr.count + s.irr_not_converged == 500);
    REQUIRE(s.equity_irr.p10 <= s.equity_irr.p50);
    REQUIRE(s.equity_irr.p50 <= s.equity_irr.p90);
    REQUIRE((s.prob_dscr_below_covenant >= 0.0 && s.prob_dscr_below_covenant <= 1.0));
    REQUIRE(s.dscr_covenant == 1.20);
    REQUIRE(r.execution_time_ms >= 0.0);
}

TEST_CASE("Fixed distributions reproduce the deterministic model", "[monte_carlo]") {
    ProjectParameters params;
    MonteCarloConfig config;
    config.iterations = 5;
    config.capacity_factor = Distribution::uniform(0.40, 0.40);
    config.opex_usd_per_mwh = Distribution::uniform(6.83, 6.83);
    config.fx_depreciation = Distribution::uniform(0.03, 0.03);
    config.hard_currency_rate = Distribution::uniform(0.07, 0.07);
    config.local_currency_rate = Distribution::uniform(0.075, 0.075);
    config.debt_ratio = Distribution::uniform(0.75, 0.75);

    MonteCarloResult r = run_monte_carlo(params, DebtTerms(), config);

    REQUIRE_THAT(r.summary.equity_irr.mean, WithinAbs(0.3155116770, 1e-6));
    REQUIRE_THAT(r.summary.npv.mean, WithinAbs(39.1384336795, 1e-6));
    REQUIRE_THAT(r.summary.npv.std_dev, WithinAbs(0.0, 1e-9));
    REQUIRE_THAT(r.summary.min_dscr.min, WithinAbs(1.3075983528, 1e-6));
    REQUIRE(r.summary.prob_dscr_below_covenant == 0.0);

    SECTION("Covenant above the fixed DSCR is always breached") {
        config.dscr_covenant = 1.40;
        MonteCarloResult breached = run_monte_carlo(params, DebtTerms(), config);
        REQUIRE(breached.summary.prob_dscr_below_covenant == 1.0);
    }
}

TEST_CASE("Invalid sampled inputs stop the run", "[monte_carlo]") {
    MonteCarloConfig config;
    config.iterations = 10;
    config.capacity_factor = Distribution::uniform(1.1, 1.2);

    REQUIRE_THROWS_AS(run_monte_carlo(ProjectParameters(), DebtTerms(), config), ValidationError);
}
