/**
 * @file logger.hpp
 * @brief Structured event log for model runs
 *
 * Solver diagnostics (IRR fallbacks, optimizer iterations) and analysis
 * timings are emitted as one record per line, JSON or plain text, to stderr
 * and/or an appended log file. Records are written under a mutex, so
 * Monte Carlo trials evaluated in parallel may log.
 */

#ifndef POWERFIN_LOGGER_HPP
#define POWERFIN_LOGGER_HPP

#include "returns.hpp"
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace powerfin {

enum class LogLevel {
    DEBUG,   ///< Per-model and per-iteration detail
    INFO,    ///< Analysis start/end
    WARN,    ///< Non-convergence, constraint violations, inconsistent inputs
    ERROR    ///< Failures reported to the user
};

std::string level_to_string(LogLevel level);

/**
 * @brief Level named DEBUG, INFO, WARN or ERROR
 * @throws std::invalid_argument for any other name
 */
LogLevel string_to_level(const std::string& name);

struct LoggerConfig {
    LogLevel min_level = LogLevel::INFO;
    bool enable_console = true;                 ///< Records go to stderr
    bool enable_file = false;
    std::string log_file_path = "powerfin.log"; ///< Opened for append
    bool enable_json = true;                    ///< false: timestamp [LEVEL] message | key=value
};

/**
 * @brief Process-wide structured logger
 *
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   config.enable_console = false;
 *   config.enable_file = true;
 *
 *   Logger::get_instance().configure(config);
 *   Logger::get_instance().log_analysis_start("monte_carlo", {{"iterations", "1000"}});
 *   @endcode
 */
class Logger {
public:
    static Logger& get_instance();

    /**
     * @brief Replace the configuration and reopen the file sink
     *
     * A log file that cannot be opened disables file output with a warning
     * on stderr; the run itself continues.
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log headline metrics of a built model (DEBUG)
     */
    void log_model_built(double equity_irr, double project_irr, double npv,
                         std::optional<double> min_dscr);

    /**
     * @brief Log an IRR solve that exhausted every strategy (WARN)
     *
     * @param result Best candidate returned to the caller
     * @param periods Length of the cash-flow series
     */
    void log_irr_not_converged(const IrrResult& result, size_t periods);

    /**
     * @brief Log a cash-flow series that may have several IRRs (DEBUG)
     */
    void log_multiple_sign_changes(int sign_changes, size_t periods);

    /**
     * @brief Log start of an analysis (monte_carlo, sensitivity, optimization)
     */
    void log_analysis_start(const std::string& analysis,
                            const std::map<std::string, std::string>& details);

    /**
     * @brief Log completion of an analysis with its elapsed time
     */
    void log_analysis_complete(const std::string& analysis,
                               double elapsed_ms,
                               const std::map<std::string, std::string>& details);

    /**
     * @brief Log one optimizer iteration (DEBUG)
     *
     * @param iteration 1-based iteration number
     * @param x Current iterate
     * @param objective Objective value being minimized
     * @param max_violation Largest constraint violation at x
     * @param step_norm Euclidean norm of the accepted step
     */
    void log_optimizer_iteration(int iteration,
                                 const std::vector<double>& x,
                                 double objective,
                                 double max_violation,
                                 double step_norm);

    void log_warning(const std::string& warning_message,
                     const std::map<std::string, std::string>& fields = {});

    void log_error(const std::string& error_message,
                   const std::map<std::string, std::string>& fields = {});

    void flush();

    void set_min_level(LogLevel level);
    LogLevel get_min_level() const;

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;
    mutable std::mutex mutex_;

    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    void write_line(const std::string& line);
};

/**
 * @brief Format a number for log fields with enough digits to reproduce it
 */
std::string format_value(double value);

} // namespace powerfin

#endif // POWERFIN_LOGGER_HPP
