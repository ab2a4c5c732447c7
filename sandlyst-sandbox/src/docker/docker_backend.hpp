/**
 * @file docker_backend.hpp
 * @brief Execution backend speaking the Docker Engine REST API
 *
 * One container per run:
 *   create -> start -> wait (bounded) -> [kill on timeout] -> logs -> remove
 *
 * The container is removed on every path by a scoped guard. Logs are read
 * up to max_log_bytes. Once the wait has timed out, a failed kill or log
 * fetch is logged and the run is still reported as timed out. The API is
 * reached over the daemon's UNIX socket (default) or a tcp:// endpoint.
 */

#ifndef SANDLYST_DOCKER_BACKEND_HPP
#define SANDLYST_DOCKER_BACKEND_HPP

#include "../execution_backend.hpp"
#include "../logger.hpp"
#include "api/http_client.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>

namespace sandlyst {

/**
 * @brief Docker connection settings
 */
struct DockerBackendConfig {
    std::string docker_host;         ///< unix:///path/to/docker.sock or tcp://host:port
    std::string api_version;         ///< API version prefix (e.g. "v1.41"), empty for unversioned
    int request_timeout_ms;          ///< Timeout for every call except wait
    int ping_timeout_ms;             ///< Timeout for the availability check
    size_t max_log_bytes;            ///< Ceiling on the raw log body read back from the daemon

    DockerBackendConfig()
        : docker_host("unix:///var/run/docker.sock"),
          api_version("v1.41"),
          request_timeout_ms(30000),
          ping_timeout_ms(2000),
          max_log_bytes(1024 * 1024) {}
};

/**
 * @brief Resolved transport for a docker_host string
 */
struct DockerEndpoint {
    std::string base_url;       ///< URL the HTTP client is built with
    std::string unix_socket;    ///< Socket path, empty for TCP
};

/**
 * @brief Resolve a docker_host value
 *
 * @throws BackendError If the scheme is not unix:// or tcp://
 */
DockerEndpoint parse_docker_host(const std::string& docker_host);

/**
 * @brief Split the attach/logs stream into plain text
 *
 * Without a TTY the daemon frames output as
 * [stream type, 0, 0, 0, size (4 bytes big-endian)] payload.
 * Input that does not start with a valid frame header is returned as-is.
 * An incomplete header at the end of a cut-off stream is dropped.
 */
std::string demultiplex_docker_stream(const std::string& raw);

/**
 * @brief Build the /containers/create request body for a spec
 */
nlohmann::json build_create_request(const ContainerSpec& spec);

/**
 * @brief Docker Engine execution backend
 */
class DockerBackend : public IExecutionBackend {
public:
    explicit DockerBackend(const DockerBackendConfig& config = DockerBackendConfig(), Logger* logger = nullptr);

    BackendInfo get_info() const override;
    bool is_available() noexcept override;
    BackendRunResult run(const ContainerSpec& spec) override;

private:
    DockerBackendConfig config_;
    DockerEndpoint endpoint_;
    std::string prefix_;
    http::HttpClient client_;
    Logger* logger_;

    std::string create_container(const ContainerSpec& spec);
    void start_container(const std::string& id);
    bool wait_container(const std::string& id, int timeout_seconds, int& exit_code);
    void kill_container(const std::string& id);
    std::string fetch_logs(const std::string& id);
    void remove_container(const std::string& id) noexcept;

    std::string path(const std::string& suffix) const;

    class ContainerGuard;
};

} // namespace sandlyst

#endif // SANDLYST_DOCKER_BACKEND_HPP
