#ifndef POWERFIN_CONFIG_PARSER_HPP
#define POWERFIN_CONFIG_PARSER_HPP

#include "logger.hpp"
#include "monte_carlo.hpp"
#include "optimizer.hpp"
#include "parameters.hpp"
#include "sensitivity.hpp"
#include <istream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace powerfin {

/**
 * @brief Exception thrown when config file parsing fails
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Everything a run needs: base case, analysis settings, logging
 */
struct ModelConfig {
    ProjectParameters params;
    DebtTerms debt_terms;
    double debt_ratio;
    double hard_currency_share;
    double dfi_share;

    MonteCarloConfig monte_carlo;
    std::optional<SensitivityConfig> sensitivity;   ///< Empty: default table

    Objective objective;
    OptimizationConstraints constraints;
    OptimizerConfig optimizer;

    LoggerConfig logging;
    std::string overrides_path;                     ///< Optional parameter-override CSV

    /**
     * @brief Debt structure for the configured ratios
     * @throws ValidationError if the ratios or terms are out of range
     */
    DebtStructure debt() const;

    ModelConfig();
};

/**
 * @brief Parses a run configuration from a JSON file
 *
 * Relative paths inside the file resolve against its directory.
 *
 * @throws ConfigParseError if the file cannot be read or JSON is invalid
 * @throws ValidationError if a value is out of its domain
 */
ModelConfig parse_model_config_from_file(const std::string& file_path);

/**
 * @brief Parses a run configuration from a JSON string
 *
 * @param json_string JSON configuration
 * @param config_file_path Path relative file references resolve against (may be empty)
 */
ModelConfig parse_model_config_from_string(const std::string& json_string,
                                           const std::string& config_file_path = "");

/**
 * @brief Reads `parameter,value` rows (header optional)
 *
 * @throws ConfigParseError for unknown parameters or malformed numbers
 */
std::vector<FieldOverride> load_parameter_overrides(std::istream& is);
std::vector<FieldOverride> load_parameter_overrides(const std::string& file_path);

/**
 * @brief Applies overrides to the base case, project and debt fields alike
 *
 * Sensitivity entries whose base value equalled a replaced input take the
 * new value, so a defaulted base keeps tracking the inputs.
 *
 * @throws ValidationError if the resulting inputs are invalid
 */
void apply_parameter_overrides(ModelConfig& config, const std::vector<FieldOverride>& overrides);

/**
 * @brief Expands environment variable references (${VAR} or $VAR)
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves a path relative to the directory of the config file
 *
 * Absolute paths and an empty config path leave the path unchanged.
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace powerfin

#endif // POWERFIN_CONFIG_PARSER_HPP
