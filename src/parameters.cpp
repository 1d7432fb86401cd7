#include "parameters.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace powerfin {

// ============================================================================
// ValidationError Implementation
// ============================================================================

namespace {

std::string join_violations(const std::vector<std::string>& violations) {
    std::ostringstream oss;
    oss << "Validation failed: ";
    for (size_t i = 0; i < violations.size(); ++i) {
        if (i > 0) oss << "; ";
        oss << violations[i];
    }
    return oss.str();
}

} // anonymous namespace

ValidationError::ValidationError(const std::vector<std::string>& violations)
    : std::invalid_argument(join_violations(violations)),
      violations_(violations) {}

ValidationError::ValidationError(const std::string& violation)
    : ValidationError(std::vector<std::string>{violation}) {}

// ============================================================================
// RepaymentMethod / ParameterField
// ============================================================================

std::string repayment_to_string(RepaymentMethod method) {
    switch (method) {
        case RepaymentMethod::Annuity: return "annuity";
        case RepaymentMethod::EqualInstallment: return "equal_installment";
    }
    return "unknown";
}

RepaymentMethod string_to_repayment(const std::string& str) {
    if (str == "annuity") return RepaymentMethod::Annuity;
    if (str == "equal_installment" || str == "equal") return RepaymentMethod::EqualInstallment;
    throw std::invalid_argument("Unknown repayment method: " + str);
}

namespace {

struct FieldEntry {
    ParameterField field;
    const char* name;
};

const FieldEntry FIELD_NAMES[] = {
    {ParameterField::CapacityMw, "capacity_mw"},
    {ParameterField::CapacityFactor, "capacity_factor"},
    {ParameterField::DegradationRate, "degradation_rate"},
    {ParameterField::HoursPerYear, "hours_per_year"},
    {ParameterField::TariffLkrPerKwh, "tariff_lkr_per_kwh"},
    {ParameterField::TariffEscalation, "tariff_escalation"},
    {ParameterField::FxInitial, "fx_initial"},
    {ParameterField::FxDepreciation, "fx_depreciation"},
    {ParameterField::OpexUsdPerMwh, "opex_usd_per_mwh"},
    {ParameterField::OpexHardShare, "opex_hard_share"},
    {ParameterField::OpexEscalationHard, "opex_escalation_hard"},
    {ParameterField::OpexEscalationLocal, "opex_escalation_local"},
    {ParameterField::LevyRate, "levy_rate"},
    {ParameterField::TaxRate, "tax_rate"},
    {ParameterField::TotalCapex, "total_capex"},
    {ParameterField::DepreciationYears, "depreciation_years"},
    {ParameterField::ConstructionYears, "construction_years"},
    {ParameterField::OperatingYears, "operating_years"},
    {ParameterField::ResidualValue, "residual_value"},
    {ParameterField::DiscountRate, "discount_rate"},
    {ParameterField::HardCurrencyRate, "hard_currency_rate"},
    {ParameterField::DfiRate, "dfi_rate"},
    {ParameterField::LocalCurrencyRate, "local_currency_rate"},
    {ParameterField::DfiShare, "dfi_share"},
    {ParameterField::GraceYears, "grace_years"},
    {ParameterField::TenorYears, "tenor_years"},
};

// Year counts arrive as doubles through with_field
int to_whole_years(ParameterField field, double value) {
    if (!std::isfinite(value) || std::floor(value) != value || std::abs(value) > 1000.0) {
        throw ValidationError(field_name(field) + " must be a whole number of years");
    }
    return static_cast<int>(value);
}

} // anonymous namespace

std::string field_name(ParameterField field) {
    for (const auto& entry : FIELD_NAMES) {
        if (entry.field == field) return entry.name;
    }
    return "unknown";
}

ParameterField parse_parameter_field(const std::string& name) {
    for (const auto& entry : FIELD_NAMES) {
        if (name == entry.name) return entry.field;
    }
    throw std::invalid_argument("Unknown parameter field: " + name);
}

bool is_debt_field(ParameterField field) {
    switch (field) {
        case ParameterField::HardCurrencyRate:
        case ParameterField::DfiRate:
        case ParameterField::LocalCurrencyRate:
        case ParameterField::DfiShare:
        case ParameterField::GraceYears:
        case ParameterField::TenorYears:
            return true;
        default:
            return false;
    }
}

const std::vector<ParameterField>& all_parameter_fields() {
    static const std::vector<ParameterField> fields = [] {
        std::vector<ParameterField> v;
        for (const auto& entry : FIELD_NAMES) v.push_back(entry.field);
        return v;
    }();
    return fields;
}

// ============================================================================
// ProjectParameters Implementation
// ============================================================================

namespace {

void check_finite(std::vector<std::string>& errors, const char* name, double value) {
    if (!std::isfinite(value)) {
        errors.push_back(std::string(name) + " must be finite");
    }
}

std::vector<std::string> validate_project(const ProjectInputs& p) {
    std::vector<std::string> errors;

    const std::pair<const char*, double> values[] = {
        {"capacity_mw", p.capacity_mw}, {"capacity_factor", p.capacity_factor},
        {"degradation_rate", p.degradation_rate}, {"hours_per_year", p.hours_per_year},
        {"tariff_lkr_per_kwh", p.tariff_lkr_per_kwh}, {"tariff_escalation", p.tariff_escalation},
        {"fx_initial", p.fx_initial}, {"fx_depreciation", p.fx_depreciation},
        {"opex_usd_per_mwh", p.opex_usd_per_mwh}, {"opex_hard_share", p.opex_hard_share},
        {"opex_escalation_hard", p.opex_escalation_hard},
        {"opex_escalation_local", p.opex_escalation_local},
        {"levy_rate", p.levy_rate}, {"tax_rate", p.tax_rate},
        {"total_capex", p.total_capex}, {"residual_value", p.residual_value},
        {"discount_rate", p.discount_rate}
    };
    for (const auto& [name, value] : values) {
        check_finite(errors, name, value);
    }
    if (!errors.empty()) {
        return errors;
    }

    if (p.capacity_mw <= 0.0) errors.push_back("capacity_mw must be positive");
    if (p.capacity_factor <= 0.0 || p.capacity_factor > 1.0) {
        errors.push_back("capacity_factor must be in (0, 1]");
    }
    if (p.degradation_rate < 0.0 || p.degradation_rate >= 1.0) {
        errors.push_back("degradation_rate must be in [0, 1)");
    }
    if (p.hours_per_year <= 0.0) errors.push_back("hours_per_year must be positive");
    if (p.tariff_lkr_per_kwh < 0.0) errors.push_back("tariff_lkr_per_kwh must be non-negative");
    if (p.tariff_escalation <= -1.0) errors.push_back("tariff_escalation must be greater than -1");
    if (p.fx_initial <= 0.0) errors.push_back("fx_initial must be positive");
    if (p.fx_depreciation <= -1.0) errors.push_back("fx_depreciation must be greater than -1");
    if (p.opex_usd_per_mwh < 0.0) errors.push_back("opex_usd_per_mwh must be non-negative");
    if (p.opex_hard_share < 0.0 || p.opex_hard_share > 1.0) {
        errors.push_back("opex_hard_share must be in [0, 1]");
    }
    if (p.opex_escalation_hard <= -1.0) errors.push_back("opex_escalation_hard must be greater than -1");
    if (p.opex_escalation_local <= -1.0) errors.push_back("opex_escalation_local must be greater than -1");
    if (p.levy_rate < 0.0 || p.levy_rate >= 1.0) errors.push_back("levy_rate must be in [0, 1)");
    if (p.tax_rate < 0.0 || p.tax_rate >= 1.0) errors.push_back("tax_rate must be in [0, 1)");
    if (p.total_capex <= 0.0) errors.push_back("total_capex must be positive");
    if (p.depreciation_years <= 0) errors.push_back("depreciation_years must be positive");
    if (p.construction_years < 1) errors.push_back("construction_years must be at least 1");
    if (p.operating_years <= 0) errors.push_back("operating_years must be positive");
    if (p.residual_value < 0.0) errors.push_back("residual_value must be non-negative");
    if (p.discount_rate <= -1.0) errors.push_back("discount_rate must be greater than -1");

    return errors;
}

} // anonymous namespace

ProjectParameters::ProjectParameters()
    : ProjectParameters(ProjectInputs()) {}

ProjectParameters::ProjectParameters(const ProjectInputs& inputs)
    : inputs_(inputs) {
    std::vector<std::string> errors = validate_project(inputs_);
    if (!errors.empty()) {
        throw ValidationError(errors);
    }
}

double ProjectParameters::get(ParameterField field) const {
    switch (field) {
        case ParameterField::CapacityMw: return inputs_.capacity_mw;
        case ParameterField::CapacityFactor: return inputs_.capacity_factor;
        case ParameterField::DegradationRate: return inputs_.degradation_rate;
        case ParameterField::HoursPerYear: return inputs_.hours_per_year;
        case ParameterField::TariffLkrPerKwh: return inputs_.tariff_lkr_per_kwh;
        case ParameterField::TariffEscalation: return inputs_.tariff_escalation;
        case ParameterField::FxInitial: return inputs_.fx_initial;
        case ParameterField::FxDepreciation: return inputs_.fx_depreciation;
        case ParameterField::OpexUsdPerMwh: return inputs_.opex_usd_per_mwh;
        case ParameterField::OpexHardShare: return inputs_.opex_hard_share;
        case ParameterField::OpexEscalationHard: return inputs_.opex_escalation_hard;
        case ParameterField::OpexEscalationLocal: return inputs_.opex_escalation_local;
        case ParameterField::LevyRate: return inputs_.levy_rate;
        case ParameterField::TaxRate: return inputs_.tax_rate;
        case ParameterField::TotalCapex: return inputs_.total_capex;
        case ParameterField::DepreciationYears: return inputs_.depreciation_years;
        case ParameterField::ConstructionYears: return inputs_.construction_years;
        case ParameterField::OperatingYears: return inputs_.operating_years;
        case ParameterField::ResidualValue: return inputs_.residual_value;
        case ParameterField::DiscountRate: return inputs_.discount_rate;
        default:
            throw std::invalid_argument(field_name(field) + " is not a project parameter");
    }
}

namespace {

void assign(ProjectInputs& inputs, ParameterField field, double value) {
    switch (field) {
        case ParameterField::CapacityMw: inputs.capacity_mw = value; break;
        case ParameterField::CapacityFactor: inputs.capacity_factor = value; break;
        case ParameterField::DegradationRate: inputs.degradation_rate = value; break;
        case ParameterField::HoursPerYear: inputs.hours_per_year = value; break;
        case ParameterField::TariffLkrPerKwh: inputs.tariff_lkr_per_kwh = value; break;
        case ParameterField::TariffEscalation: inputs.tariff_escalation = value; break;
        case ParameterField::FxInitial: inputs.fx_initial = value; break;
        case ParameterField::FxDepreciation: inputs.fx_depreciation = value; break;
        case ParameterField::OpexUsdPerMwh: inputs.opex_usd_per_mwh = value; break;
        case ParameterField::OpexHardShare: inputs.opex_hard_share = value; break;
        case ParameterField::OpexEscalationHard: inputs.opex_escalation_hard = value; break;
        case ParameterField::OpexEscalationLocal: inputs.opex_escalation_local = value; break;
        case ParameterField::LevyRate: inputs.levy_rate = value; break;
        case ParameterField::TaxRate: inputs.tax_rate = value; break;
        case ParameterField::TotalCapex: inputs.total_capex = value; break;
        case ParameterField::DepreciationYears: inputs.depreciation_years = to_whole_years(field, value); break;
        case ParameterField::ConstructionYears: inputs.construction_years = to_whole_years(field, value); break;
        case ParameterField::OperatingYears: inputs.operating_years = to_whole_years(field, value); break;
        case ParameterField::ResidualValue: inputs.residual_value = value; break;
        case ParameterField::DiscountRate: inputs.discount_rate = value; break;
        default:
            throw std::invalid_argument(field_name(field) + " is not a project parameter");
    }
}

} // anonymous namespace

ProjectParameters ProjectParameters::with_field(ParameterField field, double value) const {
    return with_fields({{field, value}});
}

ProjectParameters ProjectParameters::with_fields(const std::vector<FieldOverride>& overrides) const {
    ProjectInputs next = inputs_;
    for (const auto& [field, value] : overrides) {
        assign(next, field, value);
    }
    return ProjectParameters(next);
}

// ============================================================================
// DebtStructure Implementation
// ============================================================================

namespace {

std::vector<std::string> validate_debt(double total, double hard, double local,
                                       double dfi_share, const DebtTerms& terms) {
    std::vector<std::string> errors;

    const std::pair<const char*, double> values[] = {
        {"total_debt", total}, {"hard_currency_debt", hard},
        {"local_currency_debt", local}, {"dfi_share", dfi_share},
        {"hard_currency_rate", terms.hard_currency_rate},
        {"dfi_rate", terms.dfi_rate},
        {"local_currency_rate", terms.local_currency_rate}
    };
    for (const auto& [name, value] : values) {
        check_finite(errors, name, value);
    }
    if (!errors.empty()) {
        return errors;
    }

    if (total < 0.0) errors.push_back("total_debt must be non-negative");
    if (hard < 0.0) errors.push_back("hard_currency_debt must be non-negative");
    if (local < 0.0) errors.push_back("local_currency_debt must be non-negative");
    if (std::abs(hard + local - total) > 1e-6 * std::max(1.0, std::abs(total))) {
        errors.push_back("hard_currency_debt + local_currency_debt must equal total_debt");
    }
    if (dfi_share < 0.0 || dfi_share > 1.0) errors.push_back("dfi_share must be in [0, 1]");
    if (terms.hard_currency_rate <= -1.0) errors.push_back("hard_currency_rate must be greater than -1");
    if (terms.dfi_rate <= -1.0) errors.push_back("dfi_rate must be greater than -1");
    if (terms.local_currency_rate <= -1.0) errors.push_back("local_currency_rate must be greater than -1");
    if (terms.grace_years < 0) errors.push_back("grace_years must be non-negative");
    if (terms.tenor_years <= terms.grace_years) {
        errors.push_back("tenor_years must exceed grace_years");
    }

    return errors;
}

} // anonymous namespace

DebtStructure::DebtStructure()
    : DebtStructure(from_ratios(ProjectInputs().total_capex, 0.80, 0.45, 0.10)) {}

DebtStructure::DebtStructure(double total_debt, double hard_currency_debt,
                             double local_currency_debt, double dfi_share,
                             const DebtTerms& terms)
    : total_debt_(total_debt),
      hard_currency_debt_(hard_currency_debt),
      local_currency_debt_(local_currency_debt),
      dfi_share_(dfi_share),
      terms_(terms) {
    std::vector<std::string> errors = validate_debt(
        total_debt, hard_currency_debt, local_currency_debt, dfi_share, terms);
    if (!errors.empty()) {
        throw ValidationError(errors);
    }
}

DebtStructure DebtStructure::from_ratios(double total_capex, double debt_ratio,
                                         double hard_currency_share, double dfi_share,
                                         const DebtTerms& terms) {
    std::vector<std::string> errors;
    if (!std::isfinite(total_capex) || total_capex <= 0.0) {
        errors.push_back("total_capex must be positive");
    }
    if (!std::isfinite(debt_ratio) || debt_ratio < 0.0 || debt_ratio > 1.0) {
        errors.push_back("debt_ratio must be in [0, 1]");
    }
    if (!std::isfinite(hard_currency_share) || hard_currency_share < 0.0 || hard_currency_share > 1.0) {
        errors.push_back("hard_currency_share must be in [0, 1]");
    }
    if (!errors.empty()) {
        throw ValidationError(errors);
    }

    double total = total_capex * debt_ratio;
    double hard = total * hard_currency_share;
    return DebtStructure(total, hard, total - hard, dfi_share, terms);
}

double DebtStructure::get(ParameterField field) const {
    switch (field) {
        case ParameterField::HardCurrencyRate: return terms_.hard_currency_rate;
        case ParameterField::DfiRate: return terms_.dfi_rate;
        case ParameterField::LocalCurrencyRate: return terms_.local_currency_rate;
        case ParameterField::DfiShare: return dfi_share_;
        case ParameterField::GraceYears: return terms_.grace_years;
        case ParameterField::TenorYears: return terms_.tenor_years;
        default:
            throw std::invalid_argument(field_name(field) + " is not a debt parameter");
    }
}

DebtStructure DebtStructure::with_field(ParameterField field, double value) const {
    return with_fields({{field, value}});
}

DebtStructure DebtStructure::with_fields(const std::vector<FieldOverride>& overrides) const {
    DebtTerms next = terms_;
    double dfi_share = dfi_share_;
    for (const auto& [field, value] : overrides) {
        switch (field) {
            case ParameterField::HardCurrencyRate: next.hard_currency_rate = value; break;
            case ParameterField::DfiRate: next.dfi_rate = value; break;
            case ParameterField::LocalCurrencyRate: next.local_currency_rate = value; break;
            case ParameterField::DfiShare: dfi_share = value; break;
            case ParameterField::GraceYears: next.grace_years = to_whole_years(field, value); break;
            case ParameterField::TenorYears: next.tenor_years = to_whole_years(field, value); break;
            default:
                throw std::invalid_argument(field_name(field) + " is not a debt parameter");
        }
    }
    return DebtStructure(total_debt_, hard_currency_debt_, local_currency_debt_, dfi_share, next);
}

} // namespace powerfin
