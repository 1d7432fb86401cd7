#ifndef POWERFIN_PARAMETERS_HPP
#define POWERFIN_PARAMETERS_HPP

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace powerfin {

// Thrown when a parameter set or debt structure violates a domain rule.
// Every violated rule is reported, not just the first one found.
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::vector<std::string>& violations);
    explicit ValidationError(const std::string& violation);

    const std::vector<std::string>& violations() const { return violations_; }

private:
    std::vector<std::string> violations_;
};

enum class RepaymentMethod {
    Annuity,            // Level payment over the remaining repayment years
    EqualInstallment    // Equal principal per repayment year
};

std::string repayment_to_string(RepaymentMethod method);
RepaymentMethod string_to_repayment(const std::string& str);

// Fields that can be overridden one at a time (sensitivity stresses,
// CSV overrides, JSON configuration)
enum class ParameterField {
    // Project
    CapacityMw,
    CapacityFactor,
    DegradationRate,
    HoursPerYear,
    TariffLkrPerKwh,
    TariffEscalation,
    FxInitial,
    FxDepreciation,
    OpexUsdPerMwh,
    OpexHardShare,
    OpexEscalationHard,
    OpexEscalationLocal,
    LevyRate,
    TaxRate,
    TotalCapex,
    DepreciationYears,
    ConstructionYears,
    OperatingYears,
    ResidualValue,
    DiscountRate,
    // Debt
    HardCurrencyRate,
    DfiRate,
    LocalCurrencyRate,
    DfiShare,
    GraceYears,
    TenorYears
};

// snake_case name used in config files and reports, e.g. "capacity_factor"
std::string field_name(ParameterField field);

// Inverse of field_name; throws std::invalid_argument for unknown names
ParameterField parse_parameter_field(const std::string& name);

bool is_debt_field(ParameterField field);

const std::vector<ParameterField>& all_parameter_fields();

using FieldOverride = std::pair<ParameterField, double>;

// Raw project inputs. Defaults describe the 150 MW reference wind farm.
// Monetary amounts are USD millions unless the name says otherwise.
struct ProjectInputs {
    double capacity_mw = 150.0;
    double capacity_factor = 0.40;
    double degradation_rate = 0.006;
    double hours_per_year = 8760.0;
    double tariff_lkr_per_kwh = 20.36;
    double tariff_escalation = 0.0;
    double fx_initial = 300.0;              // LKR per USD at COD
    double fx_depreciation = 0.03;
    double opex_usd_per_mwh = 6.83;
    double opex_hard_share = 0.30;
    double opex_escalation_hard = 0.02;
    double opex_escalation_local = 0.05;
    double levy_rate = 0.025;               // SSCL turnover levy
    double tax_rate = 0.30;
    double total_capex = 155.0;
    int depreciation_years = 20;
    int construction_years = 1;
    int operating_years = 20;
    double residual_value = 0.0;
    double discount_rate = 0.12;
};

// Validated, immutable project parameter set
class ProjectParameters {
public:
    ProjectParameters();
    explicit ProjectParameters(const ProjectInputs& inputs);

    const ProjectInputs& inputs() const { return inputs_; }

    double capacity_mw() const { return inputs_.capacity_mw; }
    double capacity_factor() const { return inputs_.capacity_factor; }
    double degradation_rate() const { return inputs_.degradation_rate; }
    double hours_per_year() const { return inputs_.hours_per_year; }
    double tariff_lkr_per_kwh() const { return inputs_.tariff_lkr_per_kwh; }
    double tariff_escalation() const { return inputs_.tariff_escalation; }
    double fx_initial() const { return inputs_.fx_initial; }
    double fx_depreciation() const { return inputs_.fx_depreciation; }
    double opex_usd_per_mwh() const { return inputs_.opex_usd_per_mwh; }
    double opex_hard_share() const { return inputs_.opex_hard_share; }
    double opex_escalation_hard() const { return inputs_.opex_escalation_hard; }
    double opex_escalation_local() const { return inputs_.opex_escalation_local; }
    double levy_rate() const { return inputs_.levy_rate; }
    double tax_rate() const { return inputs_.tax_rate; }
    double total_capex() const { return inputs_.total_capex; }
    int depreciation_years() const { return inputs_.depreciation_years; }
    int construction_years() const { return inputs_.construction_years; }
    int operating_years() const { return inputs_.operating_years; }
    double residual_value() const { return inputs_.residual_value; }
    double discount_rate() const { return inputs_.discount_rate; }

    // Value of a project field; throws std::invalid_argument for debt fields
    double get(ParameterField field) const;

    // Copy with a single field replaced, validated like any new instance
    ProjectParameters with_field(ParameterField field, double value) const;

    // Copy with several fields replaced, validated once after all are applied
    ProjectParameters with_fields(const std::vector<FieldOverride>& overrides) const;

private:
    ProjectInputs inputs_;
};

// Financing terms that do not depend on the debt amounts
struct DebtTerms {
    double hard_currency_rate = 0.07;
    double dfi_rate = 0.065;
    double local_currency_rate = 0.075;
    int grace_years = 1;
    int tenor_years = 15;                   // Years from COD to maturity, grace included
    RepaymentMethod repayment = RepaymentMethod::Annuity;
};

// Validated, immutable debt structure.
//
// The hard-currency tranche is split into a DFI slice (dfi_share) and a
// market slice. The local-currency amount is held in USD millions at the
// initial FX rate.
class DebtStructure {
public:
    // 80% of the reference capex, 45% hard currency, 10% DFI
    DebtStructure();

    DebtStructure(double total_debt, double hard_currency_debt,
                  double local_currency_debt, double dfi_share,
                  const DebtTerms& terms = DebtTerms());

    static DebtStructure from_ratios(double total_capex, double debt_ratio,
                                     double hard_currency_share, double dfi_share,
                                     const DebtTerms& terms = DebtTerms());

    double total_debt() const { return total_debt_; }
    double hard_currency_debt() const { return hard_currency_debt_; }
    double local_currency_debt() const { return local_currency_debt_; }
    double dfi_share() const { return dfi_share_; }
    double hard_currency_rate() const { return terms_.hard_currency_rate; }
    double dfi_rate() const { return terms_.dfi_rate; }
    double local_currency_rate() const { return terms_.local_currency_rate; }
    int grace_years() const { return terms_.grace_years; }
    int tenor_years() const { return terms_.tenor_years; }
    RepaymentMethod repayment() const { return terms_.repayment; }
    const DebtTerms& terms() const { return terms_; }

    double dfi_debt() const { return hard_currency_debt_ * dfi_share_; }
    double market_debt() const { return hard_currency_debt_ - dfi_debt(); }

    // Value of a debt field; throws std::invalid_argument for project fields
    double get(ParameterField field) const;

    DebtStructure with_field(ParameterField field, double value) const;
    DebtStructure with_fields(const std::vector<FieldOverride>& overrides) const;

private:
    double total_debt_;
    double hard_currency_debt_;
    double local_currency_debt_;
    double dfi_share_;
    DebtTerms terms_;
};

} // namespace powerfin

#endif // POWERFIN_PARAMETERS_HPP
