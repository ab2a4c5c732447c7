#pragma once

#include <string>
#include <map>
#include <memory>
#include <stdexcept>
#include <chrono>
#include <cstddef>

namespace sandlyst {
namespace http {

/**
 * HTTP response structure
 */
struct HttpResponse {
    int status_code;
    std::string body;
    std::map<std::string, std::string> headers;
    std::chrono::milliseconds duration;
    bool body_truncated = false;    // Body cut at RequestOptions::max_body_bytes
};

/**
 * Transport-level failure category (no HTTP status available)
 */
enum class TransportFailure {
    NONE,               // Request reached the server, see status_code
    CONNECTION,         // Could not connect (refused, socket missing, DNS)
    TIMEOUT,            // Request exceeded its timeout
    OTHER               // Any other libcurl failure
};

/**
 * HTTP client error
 */
class HttpClientError : public std::runtime_error {
public:
    HttpClientError(const std::string& message,
                    int status_code = 0,
                    TransportFailure transport = TransportFailure::NONE)
        : std::runtime_error(message), status_code_(status_code), transport_(transport) {}

    int status_code() const { return status_code_; }
    TransportFailure transport() const { return transport_; }

    bool is_timeout() const { return transport_ == TransportFailure::TIMEOUT; }
    bool is_connection_failure() const { return transport_ == TransportFailure::CONNECTION; }

private:
    int status_code_;
    TransportFailure transport_;
};

/**
 * Per-request options
 */
struct RequestOptions {
    int timeout_ms = 0;             // 0 = use client default
    bool allow_retry = true;        // Disable for non-idempotent calls
    bool throw_on_error_status = true;
    size_t max_body_bytes = 0;      // 0 = unlimited; the transfer stops once reached
};

/**
 * HTTP client with retry logic and timeout support
 *
 * Features:
 * - Exponential backoff retry (1s, 2s, 4s max 3 attempts) on 408/429/5xx
 * - Configurable timeout (default 30s), overridable per request
 * - Optional UNIX domain socket transport (Docker Engine API)
 * - Request/response logging in debug mode, Authorization redacted
 * - Thread-safe: every request uses its own curl handle
 */
class HttpClient {
public:
    /**
     * Constructor
     * @param base_url Base URL for all requests (e.g., "http://localhost/v1.41")
     * @param timeout_ms Timeout in milliseconds (default: 30000)
     */
    explicit HttpClient(const std::string& base_url, int timeout_ms = 30000);

    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /**
     * Route all requests through a UNIX domain socket
     * @param socket_path e.g. "/var/run/docker.sock"
     */
    void set_unix_socket(const std::string& socket_path) { unix_socket_path_ = socket_path; }

    /**
     * Number of attempts for retryable responses (1 disables retry)
     */
    void set_max_attempts(int attempts) { max_attempts_ = attempts < 1 ? 1 : attempts; }

    /**
     * GET request with automatic retry
     * @param path Path relative to base_url (e.g., "/_ping")
     * @param headers Additional headers
     * @return HttpResponse
     * @throws HttpClientError on failure after retries
     */
    HttpResponse get(const std::string& path,
                     const std::map<std::string, std::string>& headers = {},
                     const RequestOptions& options = RequestOptions());

    /**
     * POST request with automatic retry
     * @param path Path relative to base_url
     * @param body Request body (JSON string, may be empty)
     * @param headers Additional headers
     * @return HttpResponse
     * @throws HttpClientError on failure after retries
     */
    HttpResponse post(const std::string& path,
                      const std::string& body,
                      const std::map<std::string, std::string>& headers = {},
                      const RequestOptions& options = RequestOptions());

    /**
     * DELETE request (never retried)
     */
    HttpResponse del(const std::string& path,
                     const std::map<std::string, std::string>& headers = {},
                     const RequestOptions& options = RequestOptions());

    /**
     * Set debug mode (logs requests/responses, redacts tokens)
     */
    void set_debug(bool debug) { debug_ = debug; }

    const std::string& base_url() const { return base_url_; }

    /**
     * Whether a status code is worth retrying (408, 429, 5xx)
     */
    static bool is_retryable_status(int status_code);

private:
    std::string base_url_;
    std::string unix_socket_path_;
    int timeout_ms_;
    int max_attempts_;
    bool debug_;

    static constexpr int MAX_RETRY_DELAYS = 3;
    static constexpr int RETRY_DELAYS_MS[MAX_RETRY_DELAYS] = {1000, 2000, 4000};

    HttpResponse execute_once(
        const std::string& method,
        const std::string& path,
        const std::string& body,
        const std::map<std::string, std::string>& headers,
        int timeout_ms,
        size_t max_body_bytes
    );

    HttpResponse execute_with_retry(
        const std::string& method,
        const std::string& path,
        const std::string& body,
        const std::map<std::string, std::string>& headers,
        const RequestOptions& options
    );
};

} // namespace http
} // namespace sandlyst
