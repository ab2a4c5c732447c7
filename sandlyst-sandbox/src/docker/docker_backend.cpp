#include "docker_backend.hpp"
#include <cstdint>

namespace sandlyst {

using http::HttpClient;
using http::HttpClientError;
using http::HttpResponse;
using http::RequestOptions;

namespace {

const char* const kUnixScheme = "unix://";
const char* const kTcpScheme = "tcp://";

// Exit status of a SIGKILLed process
const int kKilledExitCode = 137;

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

[[noreturn]] void rethrow_transport(const HttpClientError& e, const std::string& operation) {
    if (e.is_connection_failure()) {
        throw BackendUnavailableError(operation + ": " + e.what());
    }
    throw BackendError(operation + ": " + e.what(), e.status_code());
}

std::string error_message(const HttpResponse& response) {
    try {
        auto body = nlohmann::json::parse(response.body);
        if (body.is_object() && body.contains("message") && body["message"].is_string()) {
            return body["message"].get<std::string>();
        }
    } catch (const nlohmann::json::parse_error&) {
        // fall through to the raw body
    }
    return response.body;
}

RequestOptions no_throw(int timeout_ms) {
    RequestOptions options;
    options.timeout_ms = timeout_ms;
    options.allow_retry = false;
    options.throw_on_error_status = false;
    return options;
}

} // anonymous namespace

// ============================================================================
// Free functions
// ============================================================================

DockerEndpoint parse_docker_host(const std::string& docker_host) {
    DockerEndpoint endpoint;
    if (docker_host.empty() || starts_with(docker_host, kUnixScheme)) {
        std::string socket = docker_host.empty()
            ? std::string("/var/run/docker.sock")
            : docker_host.substr(std::string(kUnixScheme).size());
        if (socket.empty()) {
            throw BackendError("empty socket path in docker host: " + docker_host);
        }
        endpoint.unix_socket = socket;
        // Host part is ignored by the daemon when talking over the socket
        endpoint.base_url = "http://localhost";
        return endpoint;
    }
    if (starts_with(docker_host, kTcpScheme)) {
        std::string authority = docker_host.substr(std::string(kTcpScheme).size());
        while (!authority.empty() && authority.back() == '/') {
            authority.pop_back();
        }
        if (authority.empty()) {
            throw BackendError("missing address in docker host: " + docker_host);
        }
        endpoint.base_url = "http://" + authority;
        return endpoint;
    }
    throw BackendError("unsupported docker host scheme: " + docker_host);
}

std::string demultiplex_docker_stream(const std::string& raw) {
    const size_t header_size = 8;

    auto is_frame_header = [&](size_t pos) {
        if (pos + header_size > raw.size()) {
            return false;
        }
        unsigned char type = static_cast<unsigned char>(raw[pos]);
        return type <= 2 && raw[pos + 1] == 0 && raw[pos + 2] == 0 && raw[pos + 3] == 0;
    };

    if (!is_frame_header(0)) {
        return raw;
    }

    std::string output;
    output.reserve(raw.size());
    size_t pos = 0;
    while (pos < raw.size()) {
        if (raw.size() - pos < header_size) {
            // Header cut off by a size-limited read
            break;
        }
        if (!is_frame_header(pos)) {
            // Trailing garbage, keep it rather than drop output
            output.append(raw, pos, std::string::npos);
            break;
        }
        uint32_t size = (static_cast<uint32_t>(static_cast<unsigned char>(raw[pos + 4])) << 24) |
                        (static_cast<uint32_t>(static_cast<unsigned char>(raw[pos + 5])) << 16) |
                        (static_cast<uint32_t>(static_cast<unsigned char>(raw[pos + 6])) << 8) |
                        static_cast<uint32_t>(static_cast<unsigned char>(raw[pos + 7]));
        pos += header_size;
        size_t available = raw.size() - pos;
        size_t take = size < available ? size : available;
        output.append(raw, pos, take);
        pos += take;
    }
    return output;
}

nlohmann::json build_create_request(const ContainerSpec& spec) {
    nlohmann::json binds = nlohmann::json::array();
    for (const auto& mount : spec.mounts) {
        binds.push_back(mount.host_path + ":" + mount.container_path + (mount.read_only ? ":ro" : ":rw"));
    }

    nlohmann::json host_config = {
        {"Binds", binds},
        {"ReadonlyRootfs", spec.read_only_root},
        {"Memory", spec.limits.memory_bytes},
        {"MemorySwap", spec.limits.memory_bytes},
        {"PidsLimit", spec.limits.max_processes},
        {"NanoCpus", spec.limits.nano_cpus},
        {"CapDrop", nlohmann::json::array({"ALL"})},
        {"SecurityOpt", nlohmann::json::array({"no-new-privileges"})},
        {"AutoRemove", false}
    };
    if (spec.network_disabled) {
        host_config["NetworkMode"] = "none";
    }

    nlohmann::json request = {
        {"Image", spec.image},
        {"Cmd", spec.command},
        {"WorkingDir", spec.working_dir},
        {"NetworkDisabled", spec.network_disabled},
        {"AttachStdout", true},
        {"AttachStderr", true},
        {"Tty", false},
        {"HostConfig", host_config}
    };
    return request;
}

// ============================================================================
// ContainerGuard: removes the container when the run scope exits
// ============================================================================

class DockerBackend::ContainerGuard {
public:
    ContainerGuard(DockerBackend& backend, const std::string& id)
        : backend_(backend), id_(id) {}

    ~ContainerGuard() {
        backend_.remove_container(id_);
    }

    ContainerGuard(const ContainerGuard&) = delete;
    ContainerGuard& operator=(const ContainerGuard&) = delete;

private:
    DockerBackend& backend_;
    std::string id_;
};

// ============================================================================
// DockerBackend
// ============================================================================

DockerBackend::DockerBackend(const DockerBackendConfig& config, Logger* logger)
    : config_(config),
      endpoint_(parse_docker_host(config.docker_host)),
      prefix_(config.api_version.empty() ? std::string() : "/" + config.api_version),
      client_(endpoint_.base_url, config.request_timeout_ms),
      logger_(logger) {

    if (!logger_) {
        logger_ = &Logger::get_instance();
    }
    if (!endpoint_.unix_socket.empty()) {
        client_.set_unix_socket(endpoint_.unix_socket);
    }
}

BackendInfo DockerBackend::get_info() const {
    BackendInfo info;
    info.name = "docker";
    info.endpoint = config_.docker_host;
    return info;
}

bool DockerBackend::is_available() noexcept {
    try {
        HttpResponse response = client_.get(path("/_ping"), {}, no_throw(config_.ping_timeout_ms));
        return response.status_code == 200;
    } catch (const HttpClientError& e) {
        logger_->log_debug(LogContext(), "Docker ping failed", {{"error", e.what()}});
        return false;
    } catch (const std::exception& e) {
        logger_->log_debug(LogContext(), "Docker ping failed", {{"error", e.what()}});
        return false;
    }
}

BackendRunResult DockerBackend::run(const ContainerSpec& spec) {
    BackendRunResult result;

    std::string id = create_container(spec);
    ContainerGuard guard(*this, id);

    start_container(id);

    int exit_code = -1;
    bool finished = wait_container(id, spec.limits.wall_clock_timeout_seconds, exit_code);
    if (finished) {
        result.exit_code = exit_code;
        result.logs = fetch_logs(id);
        return result;
    }

    result.timed_out = true;
    result.exit_code = kKilledExitCode;
    try {
        kill_container(id);
    } catch (const SandboxError& e) {
        // The guard's forced remove still stops the container
        logger_->log_warning(LogContext(), std::string("Kill after timeout failed: ") + e.what());
    }
    try {
        result.logs = fetch_logs(id);
    } catch (const SandboxError& e) {
        logger_->log_warning(LogContext(), std::string("Log fetch after timeout failed: ") + e.what());
        result.logs = std::string("Logs unavailable: ") + e.what();
    }
    return result;
}

std::string DockerBackend::create_container(const ContainerSpec& spec) {
    std::string body = build_create_request(spec).dump();
    HttpResponse response;
    try {
        response = client_.post(path("/containers/create"), body, {}, no_throw(config_.request_timeout_ms));
    } catch (const HttpClientError& e) {
        rethrow_transport(e, "create container");
    }

    if (response.status_code == 404) {
        throw BackendError("image not found: " + spec.image + " (" + error_message(response) + ")", 404);
    }
    if (response.status_code != 201) {
        throw BackendError("create container failed with HTTP " + std::to_string(response.status_code) +
                           ": " + error_message(response), response.status_code);
    }

    try {
        auto created = nlohmann::json::parse(response.body);
        std::string id = created.at("Id").get<std::string>();
        if (created.contains("Warnings") && created["Warnings"].is_array()) {
            for (const auto& warning : created["Warnings"]) {
                if (warning.is_string()) {
                    logger_->log_warning(LogContext(), "Docker: " + warning.get<std::string>());
                }
            }
        }
        return id;
    } catch (const nlohmann::json::exception& e) {
        throw BackendError(std::string("unexpected create response: ") + e.what());
    }
}

void DockerBackend::start_container(const std::string& id) {
    HttpResponse response;
    try {
        response = client_.post(path("/containers/" + id + "/start"), "", {}, no_throw(config_.request_timeout_ms));
    } catch (const HttpClientError& e) {
        rethrow_transport(e, "start container");
    }
    // 304: already started
    if (response.status_code != 204 && response.status_code != 304) {
        throw BackendError("start container failed with HTTP " + std::to_string(response.status_code) +
                           ": " + error_message(response), response.status_code);
    }
}

bool DockerBackend::wait_container(const std::string& id, int timeout_seconds, int& exit_code) {
    HttpResponse response;
    try {
        response = client_.post(path("/containers/" + id + "/wait?condition=not-running"), "", {},
                                no_throw(timeout_seconds * 1000));
    } catch (const HttpClientError& e) {
        if (e.is_timeout()) {
            return false;
        }
        rethrow_transport(e, "wait container");
    }

    if (response.status_code != 200) {
        throw BackendError("wait container failed with HTTP " + std::to_string(response.status_code) +
                           ": " + error_message(response), response.status_code);
    }

    try {
        auto status = nlohmann::json::parse(response.body);
        exit_code = status.at("StatusCode").get<int>();
    } catch (const nlohmann::json::exception& e) {
        throw BackendError(std::string("unexpected wait response: ") + e.what());
    }
    return true;
}

void DockerBackend::kill_container(const std::string& id) {
    try {
        HttpResponse response = client_.post(path("/containers/" + id + "/kill"), "", {},
                                             no_throw(config_.request_timeout_ms));
        // 409: container already stopped
        if (response.status_code != 204 && response.status_code != 409) {
            logger_->log_warning(LogContext(), "Docker kill returned HTTP " +
                                 std::to_string(response.status_code) + " for " + id);
        }
    } catch (const HttpClientError& e) {
        rethrow_transport(e, "kill container");
    }
}

std::string DockerBackend::fetch_logs(const std::string& id) {
    RequestOptions options = no_throw(config_.request_timeout_ms);
    options.max_body_bytes = config_.max_log_bytes;

    HttpResponse response;
    try {
        response = client_.get(path("/containers/" + id + "/logs?stdout=1&stderr=1"), {}, options);
    } catch (const HttpClientError& e) {
        rethrow_transport(e, "fetch logs");
    }
    if (response.status_code != 200) {
        throw BackendError("fetch logs failed with HTTP " + std::to_string(response.status_code) +
                           ": " + error_message(response), response.status_code);
    }

    std::string logs = demultiplex_docker_stream(response.body);
    if (response.body_truncated) {
        if (!logs.empty() && logs.back() != '\n') {
            logs += "\n";
        }
        logs += "...<log truncated at " + std::to_string(config_.max_log_bytes) + " bytes>...\n";
    }
    return logs;
}

void DockerBackend::remove_container(const std::string& id) noexcept {
    try {
        HttpResponse response = client_.del(path("/containers/" + id + "?force=1&v=1"), {},
                                            no_throw(config_.request_timeout_ms));
        if (response.status_code != 204 && response.status_code != 404) {
            logger_->log_warning(LogContext(), "Docker remove returned HTTP " +
                                 std::to_string(response.status_code) + " for " + id);
        }
    } catch (const std::exception& e) {
        logger_->log_error(LogContext(), "Failed to remove container " + id + ": " + e.what(), "BackendError");
    }
}

std::string DockerBackend::path(const std::string& suffix) const {
    return prefix_ + suffix;
}

} // namespace sandlyst
