/**
 * @file analysis_errors.hpp
 * @brief Error taxonomy of an analysis session
 *
 * Every way a session can end without a report is one AnalysisError subclass
 * carrying an ErrorKind, so callers can branch on kind() or serialize the
 * failure with to_json(). A malformed planner reply is not an error: it is a
 * decoded action that costs a turn.
 */

#ifndef SANDLYST_ANALYSIS_ERRORS_HPP
#define SANDLYST_ANALYSIS_ERRORS_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <stdexcept>

namespace sandlyst {

/**
 * @brief Failure categories
 */
enum class ErrorKind {
    BACKEND_UNAVAILABLE,          ///< No sandbox backend configured or reachable
    EXECUTION_FAILED,             ///< Final chart code exited non-zero or the backend rejected it
    TIMEOUT,                      ///< Final chart code exceeded the wall clock (an execution failure)
    ACTION_CONTRACT_VIOLATION,    ///< Final action without chart code
    ANALYSIS_INCOMPLETE,          ///< Turn budget exhausted without a final action
    PLANNER_FAILURE               ///< Planner transport or protocol failure
};

inline std::string kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::BACKEND_UNAVAILABLE: return "BackendUnavailable";
        case ErrorKind::EXECUTION_FAILED: return "ExecutionFailed";
        case ErrorKind::TIMEOUT: return "Timeout";
        case ErrorKind::ACTION_CONTRACT_VIOLATION: return "ActionContractViolation";
        case ErrorKind::ANALYSIS_INCOMPLETE: return "AnalysisIncomplete";
        case ErrorKind::PLANNER_FAILURE: return "PlannerFailure";
        default: return "Unknown";
    }
}

/**
 * @brief Base class for session-terminating failures
 */
class AnalysisError : public std::runtime_error {
public:
    AnalysisError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

    virtual nlohmann::json to_json() const {
        return {
            {"kind", kind_to_string(kind_)},
            {"message", what()}
        };
    }

private:
    ErrorKind kind_;
};

/**
 * @brief Raised when the sandbox backend cannot run anything
 */
class SandboxUnavailableError : public AnalysisError {
public:
    explicit SandboxUnavailableError(const std::string& message)
        : AnalysisError(ErrorKind::BACKEND_UNAVAILABLE, "Sandbox backend unavailable: " + message) {}
};

/**
 * @brief Raised when the final chart code fails in the sandbox
 */
class ExecutionFailedError : public AnalysisError {
public:
    ExecutionFailedError(const std::string& message, int exit_code, const std::string& log)
        : AnalysisError(ErrorKind::EXECUTION_FAILED, message), exit_code_(exit_code), log_(log) {}

    int exit_code() const { return exit_code_; }
    const std::string& log() const { return log_; }

    nlohmann::json to_json() const override {
        nlohmann::json j = AnalysisError::to_json();
        j["exit_code"] = exit_code_;
        j["log"] = log_;
        return j;
    }

protected:
    ExecutionFailedError(ErrorKind kind, const std::string& message, int exit_code, const std::string& log)
        : AnalysisError(kind, message), exit_code_(exit_code), log_(log) {}

private:
    int exit_code_;
    std::string log_;
};

/**
 * @brief Raised when the final chart code is killed at the wall-clock limit
 */
class TimeoutError : public ExecutionFailedError {
public:
    TimeoutError(const std::string& message, int exit_code, const std::string& log)
        : ExecutionFailedError(ErrorKind::TIMEOUT, message, exit_code, log) {}
};

/**
 * @brief Raised when a final action carries no chart code
 */
class ActionContractViolation : public AnalysisError {
public:
    explicit ActionContractViolation(const std::string& message)
        : AnalysisError(ErrorKind::ACTION_CONTRACT_VIOLATION, "Action contract violation: " + message) {}
};

/**
 * @brief Raised when the turn budget runs out before a final action
 */
class AnalysisIncomplete : public AnalysisError {
public:
    explicit AnalysisIncomplete(int max_turns)
        : AnalysisError(ErrorKind::ANALYSIS_INCOMPLETE,
                        "Interactive analysis did not complete within " + std::to_string(max_turns) + " turns"),
          max_turns_(max_turns) {}

    int max_turns() const { return max_turns_; }

private:
    int max_turns_;
};

/**
 * @brief Raised when the planner cannot be reached or returns an unusable envelope
 */
class PlannerError : public AnalysisError {
public:
    explicit PlannerError(const std::string& message, int status_code = 0)
        : AnalysisError(ErrorKind::PLANNER_FAILURE, "Planner failure: " + message), status_code_(status_code) {}

    int status_code() const { return status_code_; }

private:
    int status_code_;
};

} // namespace sandlyst

#endif // SANDLYST_ANALYSIS_ERRORS_HPP
