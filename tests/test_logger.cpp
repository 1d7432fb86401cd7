/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger
 */

#include <catch2/catch_test_macros.hpp>
#include "logger.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

using namespace powerfin;
using json = nlohmann::json;

namespace {

// Routes the logger to a fresh file for one test
void log_to_file(const std::string& path, LogLevel min_level = LogLevel::DEBUG, bool as_json = true) {
    std::filesystem::remove(path);
    LoggerConfig config;
    config.min_level = min_level;
    config.enable_console = false;
    config.enable_file = true;
    config.enable_json = as_json;
    config.log_file_path = path;
    Logger::get_instance().configure(config);
}

std::vector<std::string> read_lines(const std::string& path) {
    Logger::get_instance().flush();
    std::ifstream file(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}

void reset_logger() {
    LoggerConfig quiet;
    quiet.enable_console = false;
    Logger::get_instance().configure(quiet);
}

} // anonymous namespace

TEST_CASE("Logger Configuration", "[logger]") {
    Logger& logger = Logger::get_instance();

    SECTION("Default configuration") {
        LoggerConfig config;

        REQUIRE(config.min_level == LogLevel::INFO);
        REQUIRE(config.enable_console == true);
        REQUIRE(config.enable_file == false);
        REQUIRE(config.enable_json == true);
    }

    SECTION("Level names") {
        REQUIRE(level_to_string(LogLevel::WARN) == "WARN");
        REQUIRE(string_to_level("DEBUG") == LogLevel::DEBUG);
        REQUIRE_THROWS_AS(string_to_level("verbose"), std::invalid_argument);
    }

    SECTION("Log level filtering") {
        std::string path = "test_level_filter.log";
        log_to_file(path, LogLevel::WARN);
        REQUIRE(logger.get_min_level() == LogLevel::WARN);

        logger.log_model_built(0.2, 0.1, 30.0, 1.4);
        logger.log_analysis_start("monte_carlo", {});
        logger.log_warning("Inconsistent base value");

        auto lines = read_lines(path);
        REQUIRE(lines.size() == 1);
        REQUIRE(json::parse(lines[0])["level"] == "WARN");

        logger.set_min_level(LogLevel::ERROR);
        logger.log_warning("Dropped");
        REQUIRE(read_lines(path).size() == 1);

        reset_logger();
        std::filesystem::remove(path);
    }
}

TEST_CASE("Logger solver diagnostics", "[logger]") {
    Logger& logger = Logger::get_instance();
    std::string path = "test_solver_diagnostics.log";
    log_to_file(path);

    SECTION("IRR non-convergence") {
        IrrResult result;
        result.rate = 0.05;
        result.converged = false;
        result.method = "newton";
        result.npv_at_rate = 1.5;
        result.sign_changes = 0;
        result.message = "All IRR strategies failed to converge";

        logger.log_irr_not_converged(result, 21);

        auto lines = read_lines(path);
        REQUIRE(lines.size() == 1);
        json fields = json::parse(lines[0]);
        REQUIRE(fields["event"] == "irr_not_converged");
        REQUIRE(fields["level"] == "WARN");
        REQUIRE(fields["message"] == "All IRR strategies failed to converge");
        REQUIRE(fields["method"] == "newton");
        REQUIRE(fields["periods"] == "21");
        REQUIRE(std::stod(fields["best_rate"].get<std::string>()) == 0.05);
    }

    SECTION("Model built with undefined DSCR") {
        logger.log_model_built(0.25, 0.11, 40.0, std::nullopt);

        json fields = json::parse(read_lines(path).at(0));
        REQUIRE(fields["event"] == "model_built");
        REQUIRE(fields["level"] == "DEBUG");
        REQUIRE(fields["min_dscr"] == "undefined");
    }

    SECTION("Optimizer iteration") {
        logger.log_optimizer_iteration(3, {0.8, 0.0, 0.13}, -0.402, 0.0, 1e-3);

        json fields = json::parse(read_lines(path).at(0));
        REQUIRE(fields["event"] == "optimizer_iteration");
        REQUIRE(fields["iteration"] == "3");
        REQUIRE(fields["x0"] == "0.8");
        REQUIRE(fields["x2"] == "0.13");
    }

    reset_logger();
    std::filesystem::remove(path);
}

TEST_CASE("Logger analysis timing", "[logger]") {
    Logger& logger = Logger::get_instance();
    std::string path = "test_analysis_timing.log";
    log_to_file(path, LogLevel::INFO);

    logger.log_analysis_start("sensitivity", {{"entries", "7"}});
    logger.log_analysis_complete("sensitivity", 12.5, {{"rows", "14"}});

    auto lines = read_lines(path);
    REQUIRE(lines.size() == 2);

    json start = json::parse(lines[0]);
    REQUIRE(start["event"] == "analysis_start");
    REQUIRE(start["analysis"] == "sensitivity");
    REQUIRE(start["entries"] == "7");

    json done = json::parse(lines[1]);
    REQUIRE(done["event"] == "analysis_complete");
    REQUIRE(done["rows"] == "14");
    REQUIRE(std::stod(done["execution_time_ms"].get<std::string>()) == 12.5);

    reset_logger();
    std::filesystem::remove(path);
}

TEST_CASE("Logger Error and Warning Logging", "[logger]") {
    Logger& logger = Logger::get_instance();
    std::string path = "test_error_warning.log";
    log_to_file(path);

    SECTION("Error logging") {
        logger.log_error("capacity_factor must be in (0, 1]", {{"event", "validation_error"}});

        json fields = json::parse(read_lines(path).at(0));
        REQUIRE(fields["event"] == "validation_error");
        REQUIRE(fields["level"] == "ERROR");
        REQUIRE(fields["error_message"] == "capacity_factor must be in (0, 1]");
    }

    SECTION("Warning defaults its event") {
        logger.log_warning("Optimized structure violates constraints");

        json fields = json::parse(read_lines(path).at(0));
        REQUIRE(fields["event"] == "warning");
        REQUIRE(fields["message"] == "Optimized structure violates constraints");
    }

    reset_logger();
    std::filesystem::remove(path);
}

TEST_CASE("Logger text format", "[logger]") {
    Logger& logger = Logger::get_instance();
    std::string path = "test_text_format.log";
    log_to_file(path, LogLevel::INFO, false);

    logger.log_warning("Base value differs", {{"field", "total_capex"}});

    auto lines = read_lines(path);
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].find("[WARN] Base value differs") != std::string::npos);
    REQUIRE(lines[0].find("field=total_capex") != std::string::npos);

    reset_logger();
    std::filesystem::remove(path);
}

TEST_CASE("Logger JSON Escaping", "[logger]") {
    Logger& logger = Logger::get_instance();
    std::string path = "test_escape.log";
    log_to_file(path);

    logger.log_warning("Quote \" and backslash \\ and\nnewline");

    json fields = json::parse(read_lines(path).at(0));
    REQUIRE(fields["message"] == "Quote \" and backslash \\ and\nnewline");

    reset_logger();
    std::filesystem::remove(path);
}

TEST_CASE("Number formatting for log fields", "[logger]") {
    REQUIRE(format_value(0.125) == "0.125");
    REQUIRE(format_value(std::nan("")) == "nan");
    REQUIRE(format_value(-std::numeric_limits<double>::infinity()) == "-inf");
}
