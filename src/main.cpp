#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include "config_parser.hpp"
#include "financial_model.hpp"
#include "logger.hpp"
#include "monte_carlo.hpp"
#include "optimizer.hpp"
#include "sensitivity.hpp"
#include "io/csv_writer.hpp"
#include "io/json_writer.hpp"
#include "io/parquet_writer.hpp"

namespace {

struct CLIArgs {
    std::string mode;
    std::string config_path;
    std::string overrides_path;
    std::string output_path;
    std::string format = "json";
    std::optional<size_t> iterations;
    std::optional<uint64_t> seed;
    std::optional<std::string> objective;
    std::optional<double> min_irr;
    std::optional<double> min_dscr;
    std::optional<std::string> log_level;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "powerfin v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " <mode> [options]\n\n";
    std::cerr << "Modes:\n";
    std::cerr << "  base                        Build the base-case model and report its metrics\n";
    std::cerr << "  monte-carlo                 Sample uncertain inputs and summarize outcomes\n";
    std::cerr << "  sensitivity                 One-at-a-time stresses with a tornado ranking\n";
    std::cerr << "  optimize                    Search debt ratio, hard-currency and DFI shares\n\n";
    std::cerr << "Input options:\n";
    std::cerr << "  --config <path>             JSON run configuration (default: built-in base case)\n";
    std::cerr << "  --overrides <path>          CSV of parameter,value overrides\n\n";
    std::cerr << "Analysis options:\n";
    std::cerr << "  --iterations <count>        Monte Carlo trials (default: 1000)\n";
    std::cerr << "  --seed <value>              Random seed for reproducibility (default: 42)\n";
    std::cerr << "  --objective <name>          equity_irr | project_irr | npv (default: equity_irr)\n";
    std::cerr << "  --min-irr <rate>            Equity IRR floor for optimize (default: 0.15)\n";
    std::cerr << "  --min-dscr <ratio>          DSCR floor for optimize (default: 1.30)\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             Output file (default: stdout)\n";
    std::cerr << "  --format <fmt>              json | csv | parquet (default: json)\n";
    std::cerr << "  --log-level <level>         DEBUG | INFO | WARN | ERROR\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Examples:\n\n";
    std::cerr << "  " << program_name << " base --config data/base_case.json\n";
    std::cerr << "  " << program_name << " monte-carlo --iterations 5000 --seed 7 \\\n";
    std::cerr << "      --format parquet --output trials.parquet\n";
    std::cerr << "  " << program_name << " optimize --objective npv --min-dscr 1.35\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        try {
            if (arg == "--help" || arg == "-h") {
                args.help = true;
                return true;
            } else if (arg == "--config" && i + 1 < argc) {
                args.config_path = argv[++i];
            } else if (arg == "--overrides" && i + 1 < argc) {
                args.overrides_path = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                args.output_path = argv[++i];
            } else if (arg == "--format" && i + 1 < argc) {
                args.format = argv[++i];
            } else if (arg == "--iterations" && i + 1 < argc) {
                args.iterations = static_cast<size_t>(std::stoul(argv[++i]));
            } else if (arg == "--seed" && i + 1 < argc) {
                args.seed = std::stoull(argv[++i]);
            } else if (arg == "--objective" && i + 1 < argc) {
                args.objective = argv[++i];
            } else if (arg == "--min-irr" && i + 1 < argc) {
                args.min_irr = std::stod(argv[++i]);
            } else if (arg == "--min-dscr" && i + 1 < argc) {
                args.min_dscr = std::stod(argv[++i]);
            } else if (arg == "--log-level" && i + 1 < argc) {
                args.log_level = argv[++i];
            } else if (args.mode.empty() && !arg.empty() && arg[0] != '-') {
                args.mode = arg;
            } else {
                std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
                return false;
            }
        } catch (const std::logic_error&) {
            std::cerr << "Error: Invalid value for " << arg << ": " << argv[i] << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (args.mode.empty()) {
        std::cerr << "Error: a mode is required (base, monte-carlo, sensitivity, optimize)\n";
        valid = false;
    } else if (args.mode != "base" && args.mode != "monte-carlo" &&
               args.mode != "sensitivity" && args.mode != "optimize") {
        std::cerr << "Error: Unknown mode: " << args.mode << "\n";
        valid = false;
    }

    if (!args.config_path.empty() && !file_exists(args.config_path)) {
        std::cerr << "Error: Config file not found: " << args.config_path << "\n";
        valid = false;
    }

    if (!args.overrides_path.empty() && !file_exists(args.overrides_path)) {
        std::cerr << "Error: Overrides file not found: " << args.overrides_path << "\n";
        valid = false;
    }

    if (args.format != "json" && args.format != "csv" && args.format != "parquet") {
        std::cerr << "Error: --format must be json, csv or parquet\n";
        valid = false;
    } else if (args.format == "parquet") {
        if (args.output_path.empty()) {
            std::cerr << "Error: --format parquet requires --output\n";
            valid = false;
        }
        if (args.mode == "sensitivity" || args.mode == "optimize") {
            std::cerr << "Error: --format parquet is available for base and monte-carlo only\n";
            valid = false;
        }
    }

    if (args.iterations && *args.iterations == 0) {
        std::cerr << "Error: --iterations must be greater than 0\n";
        valid = false;
    }

    if (args.log_level) {
        try {
            powerfin::string_to_level(*args.log_level);
        } catch (const std::invalid_argument&) {
            std::cerr << "Error: --log-level must be DEBUG, INFO, WARN or ERROR\n";
            valid = false;
        }
    }

    return valid;
}

std::string percent(double rate) {
    std::ostringstream oss;
    if (std::isfinite(rate)) {
        oss << std::fixed << std::setprecision(2) << rate * 100.0 << "%";
    } else {
        oss << "n/a";
    }
    return oss.str();
}

std::string ratio(const std::optional<double>& dscr) {
    std::ostringstream oss;
    if (dscr) {
        oss << std::fixed << std::setprecision(3) << *dscr << "x";
    } else {
        oss << "undefined";
    }
    return oss.str();
}

void report_model(const powerfin::FinancialResults& results) {
    std::cerr << "  Equity IRR:  " << percent(results.equity_irr())
              << (results.equity_irr_result.converged ? "" : " (not converged)") << "\n";
    std::cerr << "  Project IRR: " << percent(results.project_irr()) << "\n";
    std::cerr << "  Equity NPV:  " << std::fixed << std::setprecision(3) << results.npv << " USD M\n";
    std::cerr << "  Min DSCR:    " << ratio(results.min_dscr) << "\n";
}

template <typename Writer>
void emit(const CLIArgs& args, Writer write) {
    if (args.output_path.empty()) {
        write(std::cout);
    } else {
        std::ofstream file(args.output_path);
        if (!file) {
            throw std::runtime_error("Failed to open output file: " + args.output_path);
        }
        write(file);
        std::cerr << "\nOutput written to: " << args.output_path << "\n";
    }
}

void run_base(const CLIArgs& args, const powerfin::ModelConfig& config) {
    powerfin::FinancialResults results = powerfin::build_model(config.params, config.debt());

    std::cerr << "\nBase case:\n";
    report_model(results);

    if (args.format == "parquet") {
        powerfin::ParquetWriter::write_schedule(results, args.output_path);
        std::cerr << "\nOutput written to: " << args.output_path << "\n";
    } else if (args.format == "csv") {
        emit(args, [&](std::ostream& os) { powerfin::io::write_schedule_csv(os, results); });
    } else {
        emit(args, [&](std::ostream& os) { powerfin::io::write_model_json(os, results); });
    }
}

void run_monte_carlo(const CLIArgs& args, const powerfin::ModelConfig& config) {
    powerfin::MonteCarloConfig mc = config.monte_carlo;
    if (args.iterations) mc.iterations = *args.iterations;
    if (args.seed) mc.seed = *args.seed;

    std::cerr << "Running " << mc.iterations << " Monte Carlo trials (seed " << mc.seed << ")...\n";
    powerfin::MonteCarloResult result =
        powerfin::run_monte_carlo(config.params, config.debt_terms, mc);

    const powerfin::MonteCarloSummary& s = result.summary;
    std::cerr << "\nResults:\n";
    std::cerr << "  Equity IRR P10/P50/P90: " << percent(s.equity_irr.p10) << " / "
              << percent(s.equity_irr.p50) << " / " << percent(s.equity_irr.p90) << "\n";
    std::cerr << "  NPV mean:               " << std::fixed << std::setprecision(3)
              << s.npv.mean << " USD M\n";
    std::cerr << "  P(min DSCR < " << std::setprecision(2) << s.dscr_covenant << "):     "
              << std::setprecision(4) << s.prob_dscr_below_covenant << "\n";
    std::cerr << "  IRR not converged:      " << s.irr_not_converged << "\n";
    std::cerr << "  Execution:              " << result.execution_time_ms << " ms\n";

    if (args.format == "parquet") {
        powerfin::ParquetWriter::write_monte_carlo(result, args.output_path);
        std::cerr << "\nOutput written to: " << args.output_path << "\n";
    } else if (args.format == "csv") {
        emit(args, [&](std::ostream& os) { powerfin::io::write_monte_carlo_csv(os, result); });
    } else {
        emit(args, [&](std::ostream& os) { powerfin::io::write_monte_carlo_json(os, result); });
    }
}

void run_sensitivity(const CLIArgs& args, const powerfin::ModelConfig& config) {
    powerfin::DebtStructure debt = config.debt();
    powerfin::SensitivityConfig sensitivity = config.sensitivity
        ? *config.sensitivity
        : powerfin::default_sensitivity_config(config.params, debt);

    powerfin::SensitivityResult result = powerfin::run_sensitivity(config.params, debt, sensitivity);

    std::cerr << "\nTornado (equity IRR swing):\n";
    for (const auto& bar : powerfin::tornado(result)) {
        std::cerr << "  " << std::left << std::setw(20) << bar.label << std::right
                  << " low " << std::setw(8) << percent(bar.low_delta)
                  << "  high " << std::setw(8) << percent(bar.high_delta) << "\n";
    }

    if (args.format == "csv") {
        emit(args, [&](std::ostream& os) { powerfin::io::write_sensitivity_csv(os, result); });
    } else {
        emit(args, [&](std::ostream& os) { powerfin::io::write_sensitivity_json(os, result); });
    }
}

// Returns false when the optimizer did not converge
bool run_optimize(const CLIArgs& args, const powerfin::ModelConfig& config) {
    powerfin::Objective objective = config.objective;
    if (args.objective) objective = powerfin::string_to_objective(*args.objective);
    powerfin::OptimizationConstraints constraints = config.constraints;
    if (args.min_irr) constraints.min_equity_irr = *args.min_irr;
    if (args.min_dscr) constraints.min_dscr = *args.min_dscr;

    powerfin::OptimizationResult result = powerfin::optimize_capital_structure(
        config.params, config.debt_terms, objective, constraints, config.optimizer);

    std::cerr << "\nOptimization (" << powerfin::objective_to_string(objective) << "): "
              << result.message << " after " << result.iterations << " iterations\n";
    std::cerr << "  Debt ratio:          " << percent(result.debt_ratio) << "\n";
    std::cerr << "  Hard-currency share: " << percent(result.hard_currency_share) << "\n";
    std::cerr << "  DFI share:           " << percent(result.dfi_share) << "\n";
    report_model(result.financials);

    if (args.format == "csv") {
        emit(args, [&](std::ostream& os) { powerfin::io::write_schedule_csv(os, result.financials); });
    } else {
        emit(args, [&](std::ostream& os) { powerfin::io::write_optimization_json(os, result); });
    }
    return result.converged;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    if (args.help || argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    powerfin::Logger& logger = powerfin::Logger::get_instance();

    try {
        powerfin::ModelConfig config;
        if (!args.config_path.empty()) {
            std::cerr << "Loading config: " << args.config_path << "\n";
            config = powerfin::parse_model_config_from_file(args.config_path);
        }

        powerfin::LoggerConfig log_config = config.logging;
        if (args.log_level) log_config.min_level = powerfin::string_to_level(*args.log_level);
        logger.configure(log_config);

        std::string overrides_path = args.overrides_path.empty() ? config.overrides_path : args.overrides_path;
        if (!overrides_path.empty()) {
            std::cerr << "Applying overrides from " << overrides_path << "..." << std::flush;
            auto overrides = powerfin::load_parameter_overrides(overrides_path);
            powerfin::apply_parameter_overrides(config, overrides);
            std::cerr << " " << overrides.size() << " applied\n";
        }

        if (args.mode == "base") {
            run_base(args, config);
        } else if (args.mode == "monte-carlo") {
            run_monte_carlo(args, config);
        } else if (args.mode == "sensitivity") {
            run_sensitivity(args, config);
        } else if (!run_optimize(args, config)) {
            return 2;
        }

        logger.flush();
        return 0;
    } catch (const powerfin::ValidationError& e) {
        logger.log_error(e.what(), {{"event", "validation_error"}});
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        logger.log_error(e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
