#include "logger.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace powerfin {

namespace {

// UTC, ISO 8601 with milliseconds: 2026-03-01T09:15:42.137Z
std::string utc_timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

// One JSON object per line; timestamp, level and message lead, event fields follow
std::string json_record(const std::string& timestamp, LogLevel level, const std::string& message,
                        const std::map<std::string, std::string>& fields) {
    nlohmann::ordered_json record;
    record["timestamp"] = timestamp;
    record["level"] = level_to_string(level);
    record["message"] = message;
    for (const auto& [key, value] : fields) {
        if (key != "timestamp" && key != "level" && key != "message") {
            record[key] = value;
        }
    }
    return record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string text_record(const std::string& timestamp, LogLevel level, const std::string& message,
                        const std::map<std::string, std::string>& fields) {
    std::ostringstream oss;
    oss << timestamp << " [" << level_to_string(level) << "] " << message;
    const char* separator = " | ";
    for (const auto& [key, value] : fields) {
        oss << separator << key << '=' << value;
        separator = " ";
    }
    return oss.str();
}

} // anonymous namespace

std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

LogLevel string_to_level(const std::string& name) {
    static const std::map<std::string, LogLevel> levels = {
        {"DEBUG", LogLevel::DEBUG},
        {"INFO", LogLevel::INFO},
        {"WARN", LogLevel::WARN},
        {"ERROR", LogLevel::ERROR}
    };
    auto it = levels.find(name);
    if (it == levels.end()) {
        throw std::invalid_argument("Unknown log level: " + name);
    }
    return it->second;
}

std::string format_value(double value) {
    if (std::isnan(value)) return "nan";
    if (std::isinf(value)) return value > 0 ? "inf" : "-inf";
    std::ostringstream out;
    out << std::setprecision(10) << value;
    return out.str();
}

// ============================================================================
// Lifecycle
// ============================================================================

Logger& Logger::get_instance() {
    static Logger logger;
    return logger;
}

Logger::Logger() : config_() {}

Logger::~Logger() {
    flush();
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    file_stream_.reset();
    if (!config_.enable_file) {
        return;
    }

    // Appends, so consecutive runs share one log
    auto stream = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
    if (stream->is_open()) {
        file_stream_ = std::move(stream);
    } else {
        std::cerr << "Warning: cannot open log file " << config_.log_file_path
                  << "; file logging disabled" << std::endl;
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) std::cerr.flush();
    if (file_stream_) file_stream_->flush();
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

// ============================================================================
// Events
// ============================================================================

void Logger::log_model_built(double equity_irr, double project_irr, double npv,
                             std::optional<double> min_dscr) {
    log(LogLevel::DEBUG, "Financial model built", {
        {"event", "model_built"},
        {"equity_irr", format_value(equity_irr)},
        {"project_irr", format_value(project_irr)},
        {"npv", format_value(npv)},
        {"min_dscr", min_dscr ? format_value(*min_dscr) : "undefined"}
    });
}

void Logger::log_irr_not_converged(const IrrResult& result, size_t periods) {
    log(LogLevel::WARN, result.message.empty() ? "IRR did not converge" : result.message, {
        {"event", "irr_not_converged"},
        {"best_rate", format_value(result.rate)},
        {"npv_at_rate", format_value(result.npv_at_rate)},
        {"method", result.method},
        {"sign_changes", std::to_string(result.sign_changes)},
        {"periods", std::to_string(periods)}
    });
}

void Logger::log_multiple_sign_changes(int sign_changes, size_t periods) {
    log(LogLevel::DEBUG, "Cash-flow series may have multiple IRRs", {
        {"event", "multiple_sign_changes"},
        {"sign_changes", std::to_string(sign_changes)},
        {"periods", std::to_string(periods)}
    });
}

void Logger::log_analysis_start(const std::string& analysis,
                                const std::map<std::string, std::string>& details) {
    std::map<std::string, std::string> fields = details;
    fields["event"] = "analysis_start";
    fields["analysis"] = analysis;
    log(LogLevel::INFO, "Starting " + analysis, fields);
}

void Logger::log_analysis_complete(const std::string& analysis,
                                   double elapsed_ms,
                                   const std::map<std::string, std::string>& details) {
    std::map<std::string, std::string> fields = details;
    fields["event"] = "analysis_complete";
    fields["analysis"] = analysis;
    fields["execution_time_ms"] = format_value(elapsed_ms);
    log(LogLevel::INFO, "Completed " + analysis, fields);
}

void Logger::log_optimizer_iteration(int iteration,
                                     const std::vector<double>& x,
                                     double objective,
                                     double max_violation,
                                     double step_norm) {
    std::map<std::string, std::string> fields = {
        {"event", "optimizer_iteration"},
        {"iteration", std::to_string(iteration)},
        {"objective", format_value(objective)},
        {"max_violation", format_value(max_violation)},
        {"step_norm", format_value(step_norm)}
    };
    for (size_t i = 0; i < x.size(); ++i) {
        fields["x" + std::to_string(i)] = format_value(x[i]);
    }
    log(LogLevel::DEBUG, "Optimizer iteration", fields);
}

void Logger::log_warning(const std::string& warning_message,
                         const std::map<std::string, std::string>& fields) {
    std::map<std::string, std::string> all = fields;
    all.emplace("event", "warning");
    log(LogLevel::WARN, warning_message, all);
}

void Logger::log_error(const std::string& error_message,
                       const std::map<std::string, std::string>& fields) {
    std::map<std::string, std::string> all = fields;
    all.emplace("event", "error");
    all["error_message"] = error_message;
    log(LogLevel::ERROR, error_message, all);
}

// ============================================================================
// Emission
// ============================================================================

void Logger::log(LogLevel level, const std::string& message,
                 const std::map<std::string, std::string>& fields) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < config_.min_level) {
        return;
    }
    if (!config_.enable_console && !file_stream_) {
        return;
    }

    std::string timestamp = utc_timestamp();
    write_line(config_.enable_json ? json_record(timestamp, level, message, fields)
                                   : text_record(timestamp, level, message, fields));
}

// Caller holds mutex_
void Logger::write_line(const std::string& line) {
    if (config_.enable_console) {
        std::cerr << line << '\n';
    }
    if (file_stream_) {
        *file_stream_ << line << '\n';
    }
}

} // namespace powerfin
