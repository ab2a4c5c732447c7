/**
 * @file execution_backend.hpp
 * @brief Abstract interface for isolated execution backends
 *
 * The Sandbox Runner decides WHAT is isolated and HOW tightly (mounts,
 * limits, network policy) and expresses it as a ContainerSpec. A backend
 * only knows how to realize one ContainerSpec on a concrete runtime.
 *
 * Contract for implementations:
 * - run() blocks until the process exits or the wall-clock timeout elapses
 * - on timeout the process is forcibly killed before run() returns
 * - every container/process started by run() is removed before it returns,
 *   on success, failure and exception paths alike
 * - run() must be safe to call concurrently from independent sessions
 */

#ifndef SANDLYST_EXECUTION_BACKEND_HPP
#define SANDLYST_EXECUTION_BACKEND_HPP

#include "execution_types.hpp"
#include "sandbox_errors.hpp"
#include <string>
#include <vector>

namespace sandlyst {

/**
 * @brief Host directory bound into the sandbox
 */
struct MountSpec {
    std::string host_path;       ///< Absolute path on the host
    std::string container_path;  ///< Mount point inside the sandbox
    bool read_only;

    MountSpec(const std::string& host, const std::string& container, bool ro)
        : host_path(host), container_path(container), read_only(ro) {}
};

/**
 * @brief Fully specified isolated launch
 */
struct ContainerSpec {
    std::string image;                   ///< Runtime image with the interpreter and libraries
    std::vector<std::string> command;    ///< argv, e.g. {"python", "/in/run.py"}
    std::string working_dir;             ///< Working directory inside the sandbox
    std::vector<MountSpec> mounts;
    ResourceLimits limits;
    bool network_disabled;               ///< No network interfaces besides loopback
    bool read_only_root;                 ///< Root filesystem mounted read-only

    ContainerSpec() : network_disabled(true), read_only_root(true) {}
};

/**
 * @brief Raw result of one backend run
 */
struct BackendRunResult {
    int exit_code;          ///< Process exit status (137 when killed)
    std::string logs;       ///< Combined stdout/stderr
    bool timed_out;         ///< True if the wall-clock deadline killed the process

    BackendRunResult() : exit_code(-1), timed_out(false) {}
};

/**
 * @brief Backend metadata
 */
struct BackendInfo {
    std::string name;       ///< e.g. "docker"
    std::string endpoint;   ///< e.g. "unix:///var/run/docker.sock"
};

/**
 * @brief Abstract isolated execution backend
 */
class IExecutionBackend {
public:
    virtual ~IExecutionBackend() = default;

    /**
     * @brief Get backend metadata
     */
    virtual BackendInfo get_info() const = 0;

    /**
     * @brief Check whether the backend can accept work right now
     *
     * @note Must not throw
     */
    virtual bool is_available() noexcept = 0;

    /**
     * @brief Run one isolated process to completion or timeout
     *
     * @param spec Isolation, mounts, limits and command
     * @return Exit code, combined log and timeout flag
     *
     * @throws BackendUnavailableError If the runtime cannot be reached
     * @throws BackendError If the runtime rejects the request
     */
    virtual BackendRunResult run(const ContainerSpec& spec) = 0;
};

} // namespace sandlyst

#endif // SANDLYST_EXECUTION_BACKEND_HPP
