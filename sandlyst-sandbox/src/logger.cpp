/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <ctime>

namespace sandlyst {

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : max_field_bytes_(LoggerConfig().max_field_bytes) {
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    max_field_bytes_ = config_.max_field_bytes;

    file_stream_.reset();
    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::log_session_start(
    const LogContext& ctx,
    const std::string& context_description,
    size_t input_file_count,
    int max_turns
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "session_start";
    add_context(fields, ctx);
    fields["context_description"] = clip(context_description);
    fields["input_file_count"] = std::to_string(input_file_count);
    fields["max_turns"] = std::to_string(max_turns);

    log(LogLevel::INFO, "Analysis session started", std::move(fields));
}

void Logger::log_turn(
    const LogContext& ctx,
    const std::string& action,
    const std::string& detail
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "turn";
    add_context(fields, ctx);
    fields["action"] = action;
    if (!detail.empty()) {
        fields["detail"] = clip(detail);
    }

    log(action == "malformed" ? LogLevel::WARN : LogLevel::INFO, "Planner turn decoded", std::move(fields));
}

void Logger::log_state_transition(
    const LogContext& ctx,
    const std::string& old_state,
    const std::string& new_state
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "state_transition";
    add_context(fields, ctx);
    fields["old_state"] = old_state;
    fields["new_state"] = new_state;

    log(LogLevel::DEBUG, "State transition", std::move(fields));
}

void Logger::log_job_start(
    const LogContext& ctx,
    ExecutionMode mode,
    size_t input_file_count,
    size_t code_bytes
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "job_start";
    add_context(fields, ctx);
    fields["mode"] = mode_to_string(mode);
    fields["input_file_count"] = std::to_string(input_file_count);
    fields["code_bytes"] = std::to_string(code_bytes);

    log(LogLevel::INFO, "Starting sandbox job", std::move(fields));
}

void Logger::log_job_complete(
    const LogContext& ctx,
    ExecutionMode mode,
    const ExecutionOutcome& outcome
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "job_complete";
    add_context(fields, ctx);
    fields["mode"] = mode_to_string(mode);
    fields["success"] = outcome.succeeded ? "true" : "false";
    fields["status"] = status_to_string(outcome.status);
    fields["exit_code"] = std::to_string(outcome.exit_code);
    fields["duration_ms"] = std::to_string(outcome.duration_ms);
    fields["log_bytes"] = std::to_string(outcome.combined_log.size());
    fields["artifact_count"] = std::to_string(outcome.artifacts.size());

    if (!outcome.succeeded) {
        fields["log"] = clip(outcome.combined_log);
    }

    log(outcome.succeeded ? LogLevel::INFO : LogLevel::ERROR, "Sandbox job completed", std::move(fields));
}

void Logger::log_artifact(
    const LogContext& ctx,
    const std::string& source,
    const std::string& destination
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "artifact_collected";
    add_context(fields, ctx);
    fields["source"] = source;
    fields["destination"] = destination;

    log(LogLevel::DEBUG, "Artifact collected", std::move(fields));
}

void Logger::log_info(
    const LogContext& ctx,
    const std::string& message,
    const std::map<std::string, std::string>& extra
) {
    std::map<std::string, std::string> fields;
    for (const auto& [key, value] : extra) {
        fields[key] = clip(value);
    }
    add_context(fields, ctx);

    log(LogLevel::INFO, message, std::move(fields));
}

void Logger::log_debug(
    const LogContext& ctx,
    const std::string& message,
    const std::map<std::string, std::string>& extra
) {
    std::map<std::string, std::string> fields;
    for (const auto& [key, value] : extra) {
        fields[key] = clip(value);
    }
    add_context(fields, ctx);

    log(LogLevel::DEBUG, message, std::move(fields));
}

void Logger::log_warning(
    const LogContext& ctx,
    const std::string& warning_message
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    add_context(fields, ctx);
    fields["warning"] = clip(warning_message);

    log(LogLevel::WARN, warning_message, std::move(fields));
}

void Logger::log_error(
    const LogContext& ctx,
    const std::string& error_message,
    const std::string& error_kind
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    add_context(fields, ctx);
    fields["error_message"] = clip(error_message);
    if (!error_kind.empty()) {
        fields["error_kind"] = error_kind;
    }

    log(LogLevel::ERROR, "Analysis error", std::move(fields));
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

std::string Logger::mask_token(const std::string& token) {
    if (token.empty()) {
        return "<empty>";
    }
    if (token.size() <= 8) {
        return "***";
    }
    return token.substr(0, 4) + "..." + token.substr(token.size() - 4);
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    std::map<std::string, std::string> fields
) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        fields["timestamp"] = get_timestamp();
        fields["level"] = level_to_string(level);
        fields["message"] = message;
        output = format_json(fields);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

void Logger::add_context(std::map<std::string, std::string>& fields, const LogContext& ctx) const {
    if (!ctx.session_id.empty()) {
        fields["session_id"] = ctx.session_id;
    }
    fields["turn"] = std::to_string(ctx.turn);
    if (!ctx.phase.empty()) {
        fields["phase"] = ctx.phase;
    }
}

std::string Logger::clip(const std::string& value) const {
    size_t limit = max_field_bytes_.load();
    if (limit == 0 || value.size() <= limit) {
        return value;
    }
    return value.substr(0, limit) + "...<" + std::to_string(value.size() - limit) + " bytes truncated>";
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    nlohmann::json j(fields);
    // Invalid UTF-8 from sandbox output is replaced rather than throwing
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace sandlyst
