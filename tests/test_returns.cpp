#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <memory>
#include <numeric>
#include "returns.hpp"

using namespace powerfin;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

// ============================================================================
// NPV Tests
// ============================================================================

TEST_CASE("NPV at zero rate is the raw sum", "[returns]") {
    std::vector<double> cf = {-155.0, 24.157, 23.27, 0.1, -3.0, 51.9};
    double sum = std::accumulate(cf.begin(), cf.end(), 0.0);
    REQUIRE(npv(cf, 0.0) == sum);
}

TEST_CASE("NPV discounts from period zero", "[returns]") {
    REQUIRE_THAT(npv({-100.0, 110.0}, 0.10), WithinAbs(0.0, 1e-12));
    REQUIRE_THAT(npv({100.0}, 0.5), WithinRel(100.0, 1e-15));
    REQUIRE_THAT(npv({0.0, 121.0}, 0.10), WithinRel(110.0, 1e-12));
}

TEST_CASE("NPV rejects invalid input", "[returns]") {
    REQUIRE_THROWS_AS(npv({}, 0.1), std::invalid_argument);
    REQUIRE_THROWS_AS(npv({-100.0, 110.0}, -1.0), std::invalid_argument);
    REQUIRE_THROWS_AS(npv({-100.0, 110.0}, -1.5), std::invalid_argument);
}

TEST_CASE("Sign changes ignore zero flows", "[returns]") {
    REQUIRE(count_sign_changes({-100.0, 0.0, 50.0, 60.0}) == 1);
    REQUIRE(count_sign_changes({-100.0, 230.0, -132.0}) == 2);
    REQUIRE(count_sign_changes({100.0, 50.0}) == 0);
    REQUIRE(count_sign_changes({0.0, 0.0}) == 0);
}

// ============================================================================
// IRR Tests
// ============================================================================

TEST_CASE("IRR of a simple two-period series", "[returns]") {
    IrrResult r = irr({-100.0, 110.0});

    REQUIRE(r.converged);
    REQUIRE_THAT(r.rate, WithinAbs(0.10, 1e-9));
    REQUIRE(r.method == "brent");
    REQUIRE(r.sign_changes == 1);
    REQUIRE_THAT(r.npv_at_rate, WithinAbs(0.0, 1e-8));
}

TEST_CASE("IRR recovers the rate an annuity was priced at", "[returns]") {
    const double rate = 0.08;
    const double payment = 1000.0 * rate / (1.0 - std::pow(1.0 + rate, -10.0));
    std::vector<double> cf = {-1000.0};
    for (int t = 0; t < 10; ++t) cf.push_back(payment);

    IrrResult r = irr(cf);
    REQUIRE(r.converged);
    REQUIRE_THAT(r.rate, WithinAbs(0.08, 1e-6));
}

TEST_CASE("IRR handles leading zero flows", "[returns]") {
    IrrResult r = irr({0.0, -100.0, 110.0});
    REQUIRE(r.converged);
    REQUIRE_THAT(r.rate, WithinAbs(0.10, 1e-9));
}

TEST_CASE("Multiple roots fall back to polynomial and pick the smallest positive", "[returns]") {
    // NPV is negative at both ends of the Brent domain; roots at 10% and 20%
    IrrResult r = irr({-100.0, 230.0, -132.0});

    REQUIRE(r.converged);
    REQUIRE(r.method == "polynomial");
    REQUIRE(r.sign_changes == 2);
    REQUIRE_THAT(r.rate, WithinAbs(0.10, 1e-9));
    REQUIRE(r.message.find("2 real roots") != std::string::npos);
}

TEST_CASE("No IRR exists for an all-positive series", "[returns]") {
    IrrResult r = irr({100.0, 50.0});

    REQUIRE_FALSE(r.converged);
    REQUIRE(std::isfinite(r.rate));
    REQUIRE(r.sign_changes == 0);
    REQUIRE(r.message == "All IRR strategies failed to converge");
}

TEST_CASE("IRR rejects degenerate series", "[returns]") {
    REQUIRE_THROWS_AS(irr({}), std::invalid_argument);
    REQUIRE_THROWS_AS(irr({0.0, 0.0, 0.0}), std::invalid_argument);
    REQUIRE_THROWS_AS(irr({-100.0, std::nan("")}), std::invalid_argument);
}

TEST_CASE("IrrSolver runs a custom strategy chain", "[returns]") {
    SECTION("Polynomial roots alone") {
        std::vector<std::unique_ptr<IrrStrategy>> chain;
        chain.push_back(std::make_unique<PolynomialRootStrategy>());
        IrrSolver solver(std::move(chain));

        IrrResult r = solver.solve({-100.0, 110.0});
        REQUIRE(solver.strategy_count() == 1);
        REQUIRE(r.converged);
        REQUIRE(r.method == "polynomial");
        REQUIRE_THAT(r.rate, WithinAbs(0.10, 1e-10));
    }

    SECTION("Narrow Brent domain misses the root; polynomial recovers it") {
        std::vector<std::unique_ptr<IrrStrategy>> chain;
        chain.push_back(std::make_unique<BracketedBrentStrategy>(0.5, 1.0));
        chain.push_back(std::make_unique<PolynomialRootStrategy>());
        IrrSolver solver(std::move(chain));

        IrrResult r = solver.solve({-100.0, 110.0});
        REQUIRE(r.converged);
        REQUIRE(r.method == "polynomial");
    }

    SECTION("Empty chain is rejected") {
        REQUIRE_THROWS_AS(IrrSolver(std::vector<std::unique_ptr<IrrStrategy>>{}), std::invalid_argument);
    }

    SECTION("Brent domain must be ordered") {
        REQUIRE_THROWS_AS(BracketedBrentStrategy(0.5, 0.1), std::invalid_argument);
    }
}

// ============================================================================
// Irregular Timing
// ============================================================================

TEST_CASE("XNPV and XIRR with fractional years", "[returns]") {
    REQUIRE_THAT(xnpv({-100.0, 110.0}, {0.0, 1.0}, 0.10), WithinAbs(0.0, 1e-12));

    IrrResult half_year = xirr({-100.0, 110.0}, {0.0, 0.5});
    REQUIRE(half_year.converged);
    REQUIRE(half_year.method == "brent_irregular");
    REQUIRE_THAT(half_year.rate, WithinAbs(0.21, 1e-9));

    // Times are measured from the first flow
    IrrResult shifted = xirr({-100.0, 110.0}, {2.0, 3.0});
    REQUIRE_THAT(shifted.rate, WithinAbs(0.10, 1e-9));

    REQUIRE_THROWS_AS(xirr({-100.0, 110.0}, {0.0}), std::invalid_argument);
    REQUIRE_THROWS_AS(xirr({-100.0, 110.0}, {1.0, 0.0}), std::invalid_argument);
}

TEST_CASE("XIRR scans past the Brent domain", "[returns]") {
    // NPV is positive at both -99% and 500%; the root sits at 4900%
    IrrResult steep = xirr({-1.0, 50.0}, {0.0, 1.0});
    REQUIRE(steep.converged);
    REQUIRE(steep.method == "grid_scan");
    REQUIRE_THAT(steep.rate, WithinAbs(49.0, 1e-6));
    REQUIRE(std::abs(steep.npv_at_rate) < 1e-8);

    IrrResult quarter = xirr({-1.0, 3.0}, {0.0, 0.25});
    REQUIRE(quarter.converged);
    REQUIRE(quarter.method == "grid_scan");
    REQUIRE_THAT(quarter.rate, WithinAbs(80.0, 1e-6));

    SECTION("No sign change anywhere") {
        IrrResult none = xirr({100.0, 50.0}, {0.0, 0.5});
        REQUIRE_FALSE(none.converged);
        REQUIRE(none.method == "grid_scan");
        REQUIRE_FALSE(none.message.empty());
        REQUIRE(std::isfinite(none.rate));
    }
}
