#ifndef SANDLYST_SANDBOX_ERRORS_HPP
#define SANDLYST_SANDBOX_ERRORS_HPP

#include <string>
#include <stdexcept>

namespace sandlyst {

// Base exception for sandbox-layer failures
class SandboxError : public std::runtime_error {
public:
    explicit SandboxError(const std::string& msg) : std::runtime_error(msg) {}
};

// Execution backend cannot be reached (daemon down, socket missing, not configured)
class BackendUnavailableError : public SandboxError {
public:
    explicit BackendUnavailableError(const std::string& msg)
        : SandboxError("Execution backend unavailable: " + msg) {}
};

// Backend reachable but rejected or failed a request (missing image, API error)
class BackendError : public SandboxError {
public:
    explicit BackendError(const std::string& msg, int status_code = 0)
        : SandboxError("Execution backend error: " + msg), status_code_(status_code) {}

    int status_code() const { return status_code_; }

private:
    int status_code_;
};

// Scratch area could not be prepared on the host
class ScratchAreaError : public SandboxError {
public:
    explicit ScratchAreaError(const std::string& msg)
        : SandboxError("Scratch area error: " + msg) {}
};

} // namespace sandlyst

#endif // SANDLYST_SANDBOX_ERRORS_HPP
