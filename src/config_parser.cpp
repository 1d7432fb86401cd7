#include "config_parser.hpp"
#include "io/csv_reader.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace powerfin {

ModelConfig::ModelConfig()
    : debt_ratio(0.80),
      hard_currency_share(0.45),
      dfi_share(0.10),
      objective(Objective::EquityIrr) {}

DebtStructure ModelConfig::debt() const {
    return DebtStructure::from_ratios(params.total_capex(), debt_ratio,
                                      hard_currency_share, dfi_share, debt_terms);
}

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        size_t cursor = pos + 1;

        bool braces = cursor < result.size() && result[cursor] == '{';
        if (braces) {
            cursor++;
        }

        size_t name_start = cursor;
        while (cursor < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[cursor])) || result[cursor] == '_')) {
            cursor++;
        }
        std::string var_name = result.substr(name_start, cursor - name_start);

        if (var_name.empty() || (braces && (cursor >= result.size() || result[cursor] != '}'))) {
            pos = start + 1;  // Not a reference; keep the '$'
            continue;
        }
        if (braces) {
            cursor++;  // Skip '}'
        }

        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";
        result.replace(start, cursor - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    fs::path p(path);

    if (p.is_absolute() || config_file_path.empty()) {
        return path;
    }

    fs::path config_dir = fs::path(config_file_path).parent_path();
    return (config_dir / p).string();
}

namespace {

Distribution parse_distribution(const std::string& name, const json& j) {
    if (!j.is_object() || !j.contains("type")) {
        throw ConfigParseError("Distribution '" + name + "' missing required field: type");
    }
    DistributionType type;
    try {
        type = string_to_distribution(j["type"].get<std::string>());
    } catch (const std::invalid_argument& e) {
        throw ConfigParseError("Distribution '" + name + "': " + e.what());
    }

    auto require = [&](const char* key) {
        if (!j.contains(key)) {
            throw ConfigParseError("Distribution '" + name + "' missing required field: " + key);
        }
        return j[key].get<double>();
    };

    switch (type) {
        case DistributionType::Uniform:
            return Distribution::uniform(require("min"), require("max"));
        case DistributionType::Triangular:
            return Distribution::triangular(require("min"), require("mode"), require("max"));
        case DistributionType::TruncatedNormal:
            return Distribution::truncated_normal(require("mean"), require("sd"),
                                                  require("min"), require("max"));
    }
    throw ConfigParseError("Distribution '" + name + "' has an unsupported type");
}

ParameterField parse_field_name(const std::string& name) {
    try {
        return parse_parameter_field(name);
    } catch (const std::invalid_argument&) {
        throw ConfigParseError("Unknown parameter: " + name);
    }
}

void parse_project(const json& j, ModelConfig& config) {
    std::vector<FieldOverride> fields;
    for (auto it = j.begin(); it != j.end(); ++it) {
        ParameterField field = parse_field_name(it.key());
        if (is_debt_field(field)) {
            throw ConfigParseError("Debt parameter '" + it.key() + "' belongs in the debt section");
        }
        fields.emplace_back(field, it.value().get<double>());
    }
    config.params = config.params.with_fields(fields);
}

void parse_debt(const json& j, ModelConfig& config) {
    if (j.contains("debt_ratio")) config.debt_ratio = j["debt_ratio"].get<double>();
    if (j.contains("hard_currency_share")) config.hard_currency_share = j["hard_currency_share"].get<double>();
    if (j.contains("dfi_share")) config.dfi_share = j["dfi_share"].get<double>();
    if (j.contains("hard_currency_rate")) config.debt_terms.hard_currency_rate = j["hard_currency_rate"].get<double>();
    if (j.contains("dfi_rate")) config.debt_terms.dfi_rate = j["dfi_rate"].get<double>();
    if (j.contains("local_currency_rate")) config.debt_terms.local_currency_rate = j["local_currency_rate"].get<double>();
    if (j.contains("grace_years")) config.debt_terms.grace_years = j["grace_years"].get<int>();
    if (j.contains("tenor_years")) config.debt_terms.tenor_years = j["tenor_years"].get<int>();
    if (j.contains("repayment")) {
        try {
            config.debt_terms.repayment = string_to_repayment(j["repayment"].get<std::string>());
        } catch (const std::invalid_argument& e) {
            throw ConfigParseError(e.what());
        }
    }
}

void parse_monte_carlo(const json& j, ModelConfig& config) {
    MonteCarloConfig& mc = config.monte_carlo;
    if (j.contains("iterations")) {
        const json& iterations = j["iterations"];
        if (!iterations.is_number_integer() || iterations.get<long long>() < 1) {
            throw ConfigParseError("monte_carlo.iterations must be a positive integer");
        }
        mc.iterations = static_cast<size_t>(iterations.get<long long>());
    }
    if (j.contains("seed")) mc.seed = j["seed"].get<uint64_t>();
    if (j.contains("dscr_covenant")) mc.dscr_covenant = j["dscr_covenant"].get<double>();
    if (j.contains("hard_currency_share")) mc.hard_currency_share = j["hard_currency_share"].get<double>();
    if (j.contains("dfi_share")) mc.dfi_share = j["dfi_share"].get<double>();

    if (j.contains("distributions")) {
        for (auto it = j["distributions"].begin(); it != j["distributions"].end(); ++it) {
            const std::string& name = it.key();
            Distribution d = parse_distribution(name, it.value());
            if (name == "capacity_factor") mc.capacity_factor = d;
            else if (name == "opex_usd_per_mwh") mc.opex_usd_per_mwh = d;
            else if (name == "fx_depreciation") mc.fx_depreciation = d;
            else if (name == "hard_currency_rate") mc.hard_currency_rate = d;
            else if (name == "local_currency_rate") mc.local_currency_rate = d;
            else if (name == "debt_ratio") mc.debt_ratio = d;
            else throw ConfigParseError("No distribution slot for: " + name);
        }
    }
}

void parse_sensitivity(const json& j, ModelConfig& config) {
    if (!j.is_array()) {
        throw ConfigParseError("sensitivity must be an array");
    }

    const DebtStructure debt = config.debt();
    SensitivityConfig sensitivity;
    for (const auto& entry_json : j) {
        if (!entry_json.contains("field")) {
            throw ConfigParseError("Sensitivity entry missing required field: field");
        }
        std::string name = entry_json["field"].get<std::string>();
        ParameterField field = parse_field_name(name);

        SensitivityEntry entry;
        entry.field = field;
        entry.label = entry_json.contains("label") ? entry_json["label"].get<std::string>() : name;
        entry.base_value = entry_json.contains("base")
            ? entry_json["base"].get<double>()
            : (is_debt_field(field) ? debt.get(field) : config.params.get(field));

        if (!entry_json.contains("stress") || !entry_json["stress"].is_array() ||
            entry_json["stress"].empty()) {
            throw ConfigParseError("Sensitivity entry '" + entry.label + "' needs a non-empty stress array");
        }
        for (const auto& value : entry_json["stress"]) {
            entry.stress_values.push_back(value.get<double>());
        }
        sensitivity.entries.push_back(entry);
    }
    config.sensitivity = sensitivity;
}

void parse_optimizer(const json& j, ModelConfig& config) {
    if (j.contains("objective")) {
        try {
            config.objective = string_to_objective(j["objective"].get<std::string>());
        } catch (const std::invalid_argument& e) {
            throw ConfigParseError(e.what());
        }
    }
    if (j.contains("min_equity_irr")) config.constraints.min_equity_irr = j["min_equity_irr"].get<double>();
    if (j.contains("min_dscr")) config.constraints.min_dscr = j["min_dscr"].get<double>();

    OptimizerConfig& opt = config.optimizer;
    if (j.contains("max_iterations")) opt.max_iterations = j["max_iterations"].get<int>();
    if (j.contains("ftol")) opt.ftol = j["ftol"].get<double>();
    if (j.contains("ctol")) opt.ctol = j["ctol"].get<double>();
    if (j.contains("bounds")) {
        const json& bounds = j["bounds"];
        auto read_pair = [&](const char* key, double& lo, double& hi) {
            if (!bounds.contains(key)) return;
            const json& pair = bounds[key];
            if (!pair.is_array() || pair.size() != 2) {
                throw ConfigParseError(std::string("Bound '") + key + "' must be a [min, max] array");
            }
            lo = pair[0].get<double>();
            hi = pair[1].get<double>();
        };
        read_pair("debt_ratio", opt.debt_ratio_min, opt.debt_ratio_max);
        read_pair("hard_currency_share", opt.hard_share_min, opt.hard_share_max);
        read_pair("dfi_share", opt.dfi_share_min, opt.dfi_share_max);
    }
    if (j.contains("initial_guess")) {
        const json& x0 = j["initial_guess"];
        if (!x0.is_array() || x0.size() != 3) {
            throw ConfigParseError("initial_guess must be [debt_ratio, hard_currency_share, dfi_share]");
        }
        opt.initial_debt_ratio = x0[0].get<double>();
        opt.initial_hard_share = x0[1].get<double>();
        opt.initial_dfi_share = x0[2].get<double>();
    }
}

void parse_logging(const json& j, ModelConfig& config, const std::string& config_file_path) {
    LoggerConfig& log = config.logging;
    if (j.contains("level")) {
        try {
            log.min_level = string_to_level(j["level"].get<std::string>());
        } catch (const std::invalid_argument& e) {
            throw ConfigParseError(e.what());
        }
    }
    if (j.contains("format")) {
        std::string format = j["format"].get<std::string>();
        if (format != "json" && format != "text") {
            throw ConfigParseError("Log format must be 'json' or 'text': " + format);
        }
        log.enable_json = format == "json";
    }
    if (j.contains("console")) log.enable_console = j["console"].get<bool>();
    if (j.contains("file")) {
        log.enable_file = true;
        log.log_file_path = resolve_relative_path(
            expand_environment_variables(j["file"].get<std::string>()), config_file_path);
    }
}

} // anonymous namespace

ModelConfig parse_model_config_from_string(const std::string& json_string,
                                           const std::string& config_file_path) {
    ModelConfig config;

    try {
        json j = json::parse(json_string);
        if (!j.is_object()) {
            throw ConfigParseError("Configuration must be a JSON object");
        }

        if (j.contains("project")) parse_project(j["project"], config);
        if (j.contains("debt")) parse_debt(j["debt"], config);

        // Validates the ratios and terms before anything depends on them
        config.debt();

        if (j.contains("monte_carlo")) parse_monte_carlo(j["monte_carlo"], config);
        if (j.contains("sensitivity")) parse_sensitivity(j["sensitivity"], config);
        if (j.contains("optimizer")) parse_optimizer(j["optimizer"], config);
        if (j.contains("logging")) parse_logging(j["logging"], config, config_file_path);

        if (j.contains("overrides")) {
            config.overrides_path = resolve_relative_path(
                expand_environment_variables(j["overrides"].get<std::string>()), config_file_path);
        }
    } catch (const json::exception& e) {
        throw ConfigParseError("JSON parse error: " + std::string(e.what()));
    }

    return config;
}

ModelConfig parse_model_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Cannot open config file: " + file_path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_model_config_from_string(buffer.str(), file_path);
}

std::vector<FieldOverride> load_parameter_overrides(std::istream& is) {
    std::vector<FieldOverride> overrides;
    CsvReader reader(is);

    while (reader.has_more()) {
        std::vector<std::string> row = reader.read_row();
        size_t line = reader.line_number();
        if (row.empty() || (row.size() == 1 && row[0].empty()) || row[0].rfind("#", 0) == 0) {
            continue;
        }
        if (line == 1 && row[0] == "parameter") {
            continue;  // Header
        }
        if (row.size() < 2) {
            throw ConfigParseError("Override line " + std::to_string(line) + " needs parameter,value");
        }

        ParameterField field = parse_field_name(row[0]);
        size_t consumed = 0;
        double value = 0.0;
        try {
            value = std::stod(row[1], &consumed);
        } catch (const std::exception&) {
            consumed = 0;
        }
        if (consumed == 0 || consumed != row[1].size()) {
            throw ConfigParseError("Override line " + std::to_string(line) +
                                   ": invalid number '" + row[1] + "'");
        }
        overrides.emplace_back(field, value);
    }
    return overrides;
}

std::vector<FieldOverride> load_parameter_overrides(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Cannot open overrides file: " + file_path);
    }
    return load_parameter_overrides(file);
}

void apply_parameter_overrides(ModelConfig& config, const std::vector<FieldOverride>& overrides) {
    std::vector<FieldOverride> project_fields;
    std::vector<FieldOverride> debt_fields;
    for (const auto& entry : overrides) {
        (is_debt_field(entry.first) ? debt_fields : project_fields).push_back(entry);
    }

    const DebtStructure previous_debt = config.debt();
    ProjectParameters params = config.params.with_fields(project_fields);
    DebtStructure debt = DebtStructure::from_ratios(params.total_capex(), config.debt_ratio,
                                                    config.hard_currency_share, config.dfi_share,
                                                    config.debt_terms).with_fields(debt_fields);

    // Sensitivity bases that described the old inputs follow the overridden ones
    if (config.sensitivity) {
        for (auto& entry : config.sensitivity->entries) {
            const bool debt_field = is_debt_field(entry.field);
            double before = debt_field ? previous_debt.get(entry.field) : config.params.get(entry.field);
            if (entry.base_value == before) {
                entry.base_value = debt_field ? debt.get(entry.field) : params.get(entry.field);
            }
        }
    }

    config.params = params;
    config.debt_terms = debt.terms();
    config.dfi_share = debt.dfi_share();
}

} // namespace powerfin
