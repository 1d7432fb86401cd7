#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include "sensitivity.hpp"

using namespace powerfin;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {

DebtStructure reference_debt() {
    return DebtStructure::from_ratios(155.0, 0.75, 0.45, 0.10);
}

const SensitivityRow& find_row(const SensitivityResult& result, ParameterField field, double stress) {
    for (const auto& row : result.rows) {
        if (row.field == field && std::abs(row.stress_value - stress) < 1e-12) {
            return row;
        }
    }
    throw std::runtime_error("row not found");
}

} // anonymous namespace

// ============================================================================
// Configuration
// ============================================================================

TEST_CASE("Default sensitivity table covers seven parameters", "[sensitivity]") {
    ProjectParameters params;
    SensitivityConfig config = default_sensitivity_config(params, reference_debt());

    REQUIRE(config.entries.size() == 7);
    REQUIRE(config.entries[0].field == ParameterField::CapacityFactor);
    REQUIRE(config.entries[0].stress_values == std::vector<double>{0.38, 0.42});

    const SensitivityEntry& opex = config.entries[1];
    REQUIRE(opex.field == ParameterField::OpexUsdPerMwh);
    REQUIRE_THAT(opex.stress_values[0], WithinRel(6.147, 1e-12));
    REQUIRE_THAT(opex.stress_values[1], WithinRel(7.513, 1e-12));

    const SensitivityEntry& usd_rate = config.entries[5];
    REQUIRE(usd_rate.field == ParameterField::HardCurrencyRate);
    REQUIRE_THAT(usd_rate.stress_values[0], WithinRel(0.06, 1e-12));
    REQUIRE_THAT(usd_rate.stress_values[1], WithinRel(0.08, 1e-12));
}

// ============================================================================
// run_sensitivity
// ============================================================================

TEST_CASE("Capacity factor stresses move equity IRR asymmetrically", "[sensitivity]") {
    ProjectParameters params;
    DebtStructure debt = reference_debt();
    SensitivityResult result = run_sensitivity(params, debt, default_sensitivity_config(params, debt));

    REQUIRE(result.rows.size() == 14);
    REQUIRE_THAT(result.base_equity_irr, WithinAbs(0.3155116770, 1e-6));

    const SensitivityRow& low = find_row(result, ParameterField::CapacityFactor, 0.38);
    const SensitivityRow& high = find_row(result, ParameterField::CapacityFactor, 0.42);

    REQUIRE(low.delta_equity_irr < 0.0);
    REQUIRE(high.delta_equity_irr > 0.0);
    REQUIRE(std::abs(low.delta_equity_irr) != std::abs(high.delta_equity_irr));
    REQUIRE_THAT(low.delta_equity_irr, WithinAbs(-0.0319825, 1e-6));
    REQUIRE_THAT(high.delta_equity_irr, WithinAbs(0.0317648, 1e-6));
    REQUIRE_THAT(low.delta_npv, WithinAbs(-6.43632, 1e-4));
    REQUIRE_THAT(high.delta_npv, WithinAbs(6.43632, 1e-4));
    REQUIRE(low.base_value == 0.40);
    REQUIRE(low.equity_irr_converged);
}

TEST_CASE("Capex stress keeps the debt amount fixed", "[sensitivity]") {
    ProjectParameters params;
    DebtStructure debt = reference_debt();
    SensitivityConfig config;
    config.entries.push_back(SensitivityEntry("Capex", ParameterField::TotalCapex, 155.0, {170.5}));

    SensitivityResult result = run_sensitivity(params, debt, config);

    REQUIRE(result.rows.size() == 1);
    REQUIRE_THAT(result.rows[0].stressed_equity_irr, WithinAbs(0.2082626166, 1e-6));
    REQUIRE_THAT(result.rows[0].stressed_npv, WithinAbs(25.3750793222, 1e-6));
}

TEST_CASE("Debt-rate stress reduces equity returns", "[sensitivity]") {
    ProjectParameters params;
    DebtStructure debt = reference_debt();
    SensitivityConfig config;
    config.entries.push_back(SensitivityEntry("USD debt rate", ParameterField::HardCurrencyRate, 0.07, {0.06, 0.08}));

    SensitivityResult result = run_sensitivity(params, debt, config);

    REQUIRE(find_row(result, ParameterField::HardCurrencyRate, 0.08).delta_equity_irr < 0.0);
    REQUIRE(find_row(result, ParameterField::HardCurrencyRate, 0.06).delta_equity_irr > 0.0);
    // Project returns are unlevered
    REQUIRE_THAT(find_row(result, ParameterField::HardCurrencyRate, 0.08).stressed_project_irr,
                 WithinAbs(result.base_project_irr, 1e-9));
}

TEST_CASE("Mismatched configured base value reports the actual base", "[sensitivity]") {
    ProjectParameters params;
    SensitivityConfig config;
    config.entries.push_back(SensitivityEntry("Capacity factor", ParameterField::CapacityFactor, 0.35, {0.38}));

    SensitivityResult result = run_sensitivity(params, reference_debt(), config);
    REQUIRE(result.rows[0].base_value == 0.40);
}

TEST_CASE("Invalid stress value stops the analysis", "[sensitivity]") {
    ProjectParameters params;
    SensitivityConfig config;
    config.entries.push_back(SensitivityEntry("Capacity factor", ParameterField::CapacityFactor, 0.40, {1.5}));

    REQUIRE_THROWS_AS(run_sensitivity(params, reference_debt(), config), ValidationError);
}

// ============================================================================
// Tornado
// ============================================================================

TEST_CASE("Tornado ranks parameters by largest equity-IRR swing", "[sensitivity]") {
    ProjectParameters params;
    DebtStructure debt = reference_debt();
    SensitivityResult result = run_sensitivity(params, debt, default_sensitivity_config(params, debt));

    std::vector<TornadoBar> bars = tornado(result);

    REQUIRE(bars.size() == 7);
    for (size_t i = 1; i < bars.size(); ++i) {
        REQUIRE(bars[i - 1].swing >= bars[i].swing);
    }
    for (const auto& bar : bars) {
        REQUIRE(bar.low_delta <= 0.0);
        REQUIRE(bar.high_delta >= 0.0);
        REQUIRE_THAT(bar.swing, WithinAbs(std::max(-bar.low_delta, bar.high_delta), 1e-15));
    }

    // Capex moves equity IRR far more than a capacity-factor stress
    REQUIRE(bars[0].field == ParameterField::TotalCapex);
}
