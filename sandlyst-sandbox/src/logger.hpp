/**
 * @file logger.hpp
 * @brief Structured logging for the sandbox and the analysis orchestrator
 *
 * The Logger provides structured logging capabilities with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted output for easy parsing
 * - Context tracking (session ID, turn, phase)
 * - Sandbox job start/completion events with timing
 * - Bounded field sizes so sandbox logs never flood the output
 *
 * Design Pattern: Singleton logger with structured event emission.
 * All writes are serialized, so concurrent sessions may share it.
 */

#ifndef SANDLYST_LOGGER_HPP
#define SANDLYST_LOGGER_HPP

#include "execution_types.hpp"
#include <string>
#include <map>
#include <memory>
#include <mutex>
#include <atomic>
#include <fstream>

namespace sandlyst {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Detailed debugging information (planner text, instrumented code)
    INFO,    ///< Informational messages (session start, turns, job completion)
    WARN,    ///< Warning messages (skipped input files, malformed planner output)
    ERROR    ///< Error messages (failures, exceptions)
};

/**
 * @brief Convert log level to string
 */
inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level from string
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;  // default
}

/**
 * @brief Context attached to every log event
 */
struct LogContext {
    std::string session_id;          ///< Analysis session identifier (empty for standalone jobs)
    int turn;                        ///< Current turn number (0 before the first planner call)
    std::string phase;               ///< Current phase (negotiate, compute, plot, report)

    LogContext() : turn(0) {}

    explicit LogContext(const std::string& id, int turn_ = 0, const std::string& phase_ = "")
        : session_id(id), turn(turn_), phase(phase_) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)
    size_t max_field_bytes;          ///< Long field values (sandbox logs, planner text) are cut here

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("sandlyst.log"),
          enable_json(true),
          max_field_bytes(2048) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   config.enable_file = true;
 *   config.log_file_path = "sandlyst.log";
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   LogContext ctx("analysis_1a2b3c4d", 1, "compute");
 *   logger.log_job_start(ctx, ExecutionMode::COMPUTE, 2, code.size());
 *   logger.log_job_complete(ctx, ExecutionMode::COMPUTE, outcome);
 *   @endcode
 */
class Logger {
public:
    /**
     * @brief Get singleton logger instance
     */
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log the start of an analysis session
     *
     * @param ctx Log context
     * @param context_description Caller-provided description (truncated)
     * @param input_file_count Number of files available to the sandbox
     * @param max_turns Turn budget for the session
     */
    void log_session_start(
        const LogContext& ctx,
        const std::string& context_description,
        size_t input_file_count,
        int max_turns
    );

    /**
     * @brief Log one decoded planner turn
     *
     * @param ctx Log context
     * @param action Decoded action kind ("compute", "final", "malformed")
     * @param detail Reason or decoding error
     */
    void log_turn(
        const LogContext& ctx,
        const std::string& action,
        const std::string& detail
    );

    /**
     * @brief Log session state transition
     */
    void log_state_transition(
        const LogContext& ctx,
        const std::string& old_state,
        const std::string& new_state
    );

    /**
     * @brief Log sandbox job start
     */
    void log_job_start(
        const LogContext& ctx,
        ExecutionMode mode,
        size_t input_file_count,
        size_t code_bytes
    );

    /**
     * @brief Log sandbox job completion
     */
    void log_job_complete(
        const LogContext& ctx,
        ExecutionMode mode,
        const ExecutionOutcome& outcome
    );

    /**
     * @brief Log an artifact moved into the results directory
     */
    void log_artifact(
        const LogContext& ctx,
        const std::string& source,
        const std::string& destination
    );

    void log_info(
        const LogContext& ctx,
        const std::string& message,
        const std::map<std::string, std::string>& extra = {}
    );

    void log_debug(
        const LogContext& ctx,
        const std::string& message,
        const std::map<std::string, std::string>& extra = {}
    );

    void log_warning(
        const LogContext& ctx,
        const std::string& warning_message
    );

    void log_error(
        const LogContext& ctx,
        const std::string& error_message,
        const std::string& error_kind = ""
    );

    /**
     * @brief Flush all log outputs
     */
    void flush();

    void set_min_level(LogLevel level);
    LogLevel get_min_level() const;

    /**
     * @brief Mask a secret for logging (first/last 4 characters kept)
     */
    static std::string mask_token(const std::string& token);

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::atomic<size_t> max_field_bytes_;
    std::unique_ptr<std::ofstream> file_stream_;

    void log(LogLevel level, const std::string& message, std::map<std::string, std::string> fields);
    void add_context(std::map<std::string, std::string>& fields, const LogContext& ctx) const;
    std::string clip(const std::string& value) const;
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    void write_output(const std::string& output);
};

} // namespace sandlyst

#endif // SANDLYST_LOGGER_HPP
