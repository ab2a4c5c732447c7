/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/logger.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

using namespace sandlyst;

namespace {

// Configure the singleton to write JSON lines to path only
void log_to_file(const std::string& path, LogLevel level = LogLevel::DEBUG, size_t max_field_bytes = 2048) {
    std::filesystem::remove(path);
    LoggerConfig config;
    config.min_level = level;
    config.enable_console = false;
    config.enable_file = true;
    config.log_file_path = path;
    config.max_field_bytes = max_field_bytes;
    Logger::get_instance().configure(config);
}

std::vector<nlohmann::json> read_lines(const std::string& path) {
    Logger::get_instance().flush();
    std::vector<nlohmann::json> lines;
    std::ifstream file(path);
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty()) {
            lines.push_back(nlohmann::json::parse(line));
        }
    }
    return lines;
}

} // anonymous namespace

TEST_CASE("Logger Configuration", "[logger]") {
    SECTION("Default configuration") {
        LoggerConfig config;

        REQUIRE(config.min_level == LogLevel::INFO);
        REQUIRE(config.enable_console == true);
        REQUIRE(config.enable_file == false);
        REQUIRE(config.enable_json == true);
        REQUIRE(config.max_field_bytes == 2048);
    }

    SECTION("Level names round-trip") {
        REQUIRE(string_to_level("DEBUG") == LogLevel::DEBUG);
        REQUIRE(string_to_level("WARN") == LogLevel::WARN);
        REQUIRE(string_to_level("bogus") == LogLevel::INFO);
        REQUIRE(level_to_string(LogLevel::ERROR) == "ERROR");
    }

    SECTION("Level filtering") {
        log_to_file("test_filter.log", LogLevel::WARN);
        Logger& logger = Logger::get_instance();
        REQUIRE(logger.get_min_level() == LogLevel::WARN);

        logger.log_info(LogContext("s1"), "dropped");
        logger.log_warning(LogContext("s1"), "kept");

        auto lines = read_lines("test_filter.log");
        REQUIRE(lines.size() == 1);
        REQUIRE(lines[0]["warning"] == "kept");

        std::filesystem::remove("test_filter.log");
    }
}

TEST_CASE("Logger Session Events", "[logger]") {
    log_to_file("test_session.log");
    Logger& logger = Logger::get_instance();

    LogContext ctx("analysis_0badf00d", 2, "negotiate");

    logger.log_session_start(ctx, "quarterly sales", 3, 4);
    logger.log_turn(ctx, "compute", "inspect columns");
    logger.log_turn(ctx, "malformed", "not JSON");
    logger.log_state_transition(ctx, "NEGOTIATING", "SUCCEEDED");

    auto lines = read_lines("test_session.log");
    REQUIRE(lines.size() == 4);

    REQUIRE(lines[0]["event"] == "session_start");
    REQUIRE(lines[0]["session_id"] == "analysis_0badf00d");
    REQUIRE(lines[0]["input_file_count"] == "3");
    REQUIRE(lines[0]["max_turns"] == "4");

    REQUIRE(lines[1]["event"] == "turn");
    REQUIRE(lines[1]["level"] == "INFO");
    REQUIRE(lines[1]["turn"] == "2");
    REQUIRE(lines[1]["action"] == "compute");

    REQUIRE(lines[2]["level"] == "WARN");

    REQUIRE(lines[3]["event"] == "state_transition");
    REQUIRE(lines[3]["old_state"] == "NEGOTIATING");
    REQUIRE(lines[3]["new_state"] == "SUCCEEDED");

    std::filesystem::remove("test_session.log");
}

TEST_CASE("Logger Job Events", "[logger]") {
    log_to_file("test_jobs.log", LogLevel::DEBUG, 16);
    Logger& logger = Logger::get_instance();

    LogContext ctx("s2", 1, "compute");

    SECTION("Successful job omits the log body") {
        ExecutionOutcome outcome;
        outcome.succeeded = true;
        outcome.exit_code = 0;
        outcome.status = ExecutionStatus::SUCCEEDED;
        outcome.combined_log = "rows=10";

        logger.log_job_start(ctx, ExecutionMode::COMPUTE, 1, 120);
        logger.log_job_complete(ctx, ExecutionMode::COMPUTE, outcome);

        auto lines = read_lines("test_jobs.log");
        REQUIRE(lines.size() == 2);
        REQUIRE(lines[0]["event"] == "job_start");
        REQUIRE(lines[0]["mode"] == "compute");
        REQUIRE(lines[0]["code_bytes"] == "120");
        REQUIRE(lines[1]["event"] == "job_complete");
        REQUIRE(lines[1]["success"] == "true");
        REQUIRE(lines[1]["status"] == "SUCCEEDED");
        REQUIRE_FALSE(lines[1].contains("log"));
    }

    SECTION("Failed job log is clipped") {
        ExecutionOutcome outcome;
        outcome.status = ExecutionStatus::TIMED_OUT;
        outcome.exit_code = 137;
        outcome.combined_log = std::string(100, 'x');

        logger.log_job_complete(ctx, ExecutionMode::PLOT, outcome);

        auto lines = read_lines("test_jobs.log");
        REQUIRE(lines.size() == 1);
        REQUIRE(lines[0]["level"] == "ERROR");
        REQUIRE(lines[0]["status"] == "TIMED_OUT");
        std::string log = lines[0]["log"];
        REQUIRE(log.find(std::string(16, 'x')) == 0);
        REQUIRE(log.find("84 bytes truncated") != std::string::npos);
    }

    std::filesystem::remove("test_jobs.log");
}

TEST_CASE("Logger Error Logging", "[logger]") {
    log_to_file("test_error.log");
    Logger& logger = Logger::get_instance();

    logger.log_error(LogContext("s3", 4), "Turn budget exhausted", "AnalysisIncomplete");

    auto lines = read_lines("test_error.log");
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0]["event"] == "error");
    REQUIRE(lines[0]["error_message"] == "Turn budget exhausted");
    REQUIRE(lines[0]["error_kind"] == "AnalysisIncomplete");

    std::filesystem::remove("test_error.log");
}

TEST_CASE("Logger JSON Escaping", "[logger]") {
    log_to_file("test_escape.log");
    Logger& logger = Logger::get_instance();

    logger.log_warning(LogContext(), "quote \" backslash \\ newline \n tab \t");
    // Invalid UTF-8 from a sandbox must not break the line
    logger.log_warning(LogContext(), std::string("bad \xff\xfe byte"));

    auto lines = read_lines("test_escape.log");
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0]["warning"] == "quote \" backslash \\ newline \n tab \t");
    REQUIRE(lines[1]["warning"].get<std::string>().find("bad") == 0);

    std::filesystem::remove("test_escape.log");
}

TEST_CASE("Logger Token Masking", "[logger]") {
    REQUIRE(Logger::mask_token("") == "<empty>");
    REQUIRE(Logger::mask_token("short") == "***");
    REQUIRE(Logger::mask_token("sk-1234567890abcdef") == "sk-1...cdef");
}

TEST_CASE("Logger Concurrent Writers", "[logger]") {
    log_to_file("test_concurrent.log");
    Logger& logger = Logger::get_instance();

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&logger, t]() {
            LogContext ctx("session_" + std::to_string(t));
            for (int i = 0; i < 50; ++i) {
                logger.log_info(ctx, "tick", {{"i", std::to_string(i)}});
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    // Every line parses: no interleaving
    auto lines = read_lines("test_concurrent.log");
    REQUIRE(lines.size() == 200);

    std::filesystem::remove("test_concurrent.log");
}
