/**
 * @file execution_types.hpp
 * @brief Jobs, outcomes and resource limits for sandboxed execution
 */

#ifndef SANDLYST_EXECUTION_TYPES_HPP
#define SANDLYST_EXECUTION_TYPES_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <filesystem>

namespace sandlyst {

/**
 * @brief How submitted code is run
 *
 * COMPUTE: no figure persistence, captured output is the result.
 * PLOT: all figures open at the end of the script are saved and collected.
 */
enum class ExecutionMode {
    COMPUTE,
    PLOT
};

inline std::string mode_to_string(ExecutionMode mode) {
    switch (mode) {
        case ExecutionMode::COMPUTE: return "compute";
        case ExecutionMode::PLOT: return "plot";
        default: return "unknown";
    }
}

/**
 * @brief Terminal status of one sandbox run
 */
enum class ExecutionStatus {
    SUCCEEDED,             ///< Exit code 0
    FAILED,                ///< Non-zero exit or backend API error
    TIMED_OUT,             ///< Wall-clock budget exceeded, container killed
    BACKEND_UNAVAILABLE    ///< No backend configured or reachable, nothing was started
};

inline std::string status_to_string(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::SUCCEEDED: return "SUCCEEDED";
        case ExecutionStatus::FAILED: return "FAILED";
        case ExecutionStatus::TIMED_OUT: return "TIMED_OUT";
        case ExecutionStatus::BACKEND_UNAVAILABLE: return "BACKEND_UNAVAILABLE";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Hard resource ceilings applied to every sandbox run
 */
struct ResourceLimits {
    int64_t memory_bytes;            ///< Memory ceiling (default: 4 GiB)
    int64_t max_processes;           ///< PID ceiling (default: 128)
    int64_t nano_cpus;               ///< CPU share in 1e-9 CPUs (default: 2 CPUs)
    int wall_clock_timeout_seconds;  ///< Kill deadline (default: 30s)

    ResourceLimits()
        : memory_bytes(4LL * 1024 * 1024 * 1024),
          max_processes(128),
          nano_cpus(2000000000LL),
          wall_clock_timeout_seconds(30) {}
};

/**
 * @brief A host file made available read-only under /data/<name>
 */
struct InputFile {
    std::string name;           ///< File name inside the data mount (single path component)
    std::string source_path;    ///< Path on the host

    InputFile() = default;

    // Name defaults to the file name of the source path
    explicit InputFile(const std::string& source)
        : name(std::filesystem::path(source).filename().string()), source_path(source) {}

    InputFile(const std::string& name_, const std::string& source)
        : name(name_), source_path(source) {}
};

/**
 * @brief One sandboxed run
 */
struct ExecutionJob {
    std::string code;                    ///< Untrusted script, instrumented before execution
    ExecutionMode mode;
    std::vector<InputFile> input_files;  ///< Copied into the data mount in order
    std::string output_dir;              ///< PLOT: destination directory for artifacts
    std::string output_name;             ///< PLOT: artifact name prefix ({output_name}_{k}.png)

    ExecutionJob() : mode(ExecutionMode::COMPUTE) {}

    ExecutionJob(const std::string& code_, ExecutionMode mode_)
        : code(code_), mode(mode_) {}
};

/**
 * @brief Result of one ExecutionJob
 *
 * Invariants: succeeded == (exit_code == 0) == (status == SUCCEEDED);
 * artifacts is non-empty only for a successful PLOT run.
 */
struct ExecutionOutcome {
    bool succeeded;
    int exit_code;
    ExecutionStatus status;
    std::string combined_log;            ///< stdout + stderr of the sandboxed process
    std::vector<std::string> artifacts;  ///< Collected image paths, in figure order
    double duration_ms;

    ExecutionOutcome()
        : succeeded(false), exit_code(-1), status(ExecutionStatus::FAILED), duration_ms(0.0) {}

    bool timed_out() const { return status == ExecutionStatus::TIMED_OUT; }
    bool backend_unavailable() const { return status == ExecutionStatus::BACKEND_UNAVAILABLE; }
};

} // namespace sandlyst

#endif // SANDLYST_EXECUTION_TYPES_HPP
