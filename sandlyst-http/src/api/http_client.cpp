#include "api/http_client.hpp"
#include <curl/curl.h>
#include <thread>
#include <iostream>
#include <sstream>
#include <mutex>

namespace sandlyst {
namespace http {

namespace {

std::once_flag curl_init_flag;

void ensure_curl_initialized() {
    std::call_once(curl_init_flag, []() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

// Response body with an optional byte ceiling
struct BodySink {
    std::string body;
    size_t limit = 0;
    bool truncated = false;
};

// CURL write callback
size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    auto* sink = static_cast<BodySink*>(userp);
    if (sink->limit > 0 && sink->body.size() + total_size > sink->limit) {
        sink->body.append(static_cast<char*>(contents), sink->limit - sink->body.size());
        sink->truncated = true;
        // A short count aborts the transfer with CURLE_WRITE_ERROR
        return 0;
    }
    sink->body.append(static_cast<char*>(contents), total_size);
    return total_size;
}

// CURL header callback
size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total_size = size * nitems;
    std::string header(buffer, total_size);

    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);

    // Parse header line: "Name: Value\r\n"
    size_t colon_pos = header.find(':');
    if (colon_pos != std::string::npos) {
        std::string name = header.substr(0, colon_pos);
        std::string value = header.substr(colon_pos + 1);

        value.erase(0, value.find_first_not_of(" \t\r\n"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);

        headers->insert({name, value});
    }

    return total_size;
}

TransportFailure classify(CURLcode code) {
    switch (code) {
        case CURLE_COULDNT_CONNECT:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return TransportFailure::CONNECTION;
        case CURLE_OPERATION_TIMEDOUT:
            return TransportFailure::TIMEOUT;
        default:
            return TransportFailure::OTHER;
    }
}

// Owns one easy handle and its header list for the duration of a request
struct CurlRequest {
    CURL* curl = nullptr;
    curl_slist* headers = nullptr;

    CurlRequest() {
        ensure_curl_initialized();
        curl = curl_easy_init();
        if (!curl) {
            throw HttpClientError("Failed to initialize CURL", 0, TransportFailure::OTHER);
        }
    }

    ~CurlRequest() {
        if (headers) {
            curl_slist_free_all(headers);
        }
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }

    CurlRequest(const CurlRequest&) = delete;
    CurlRequest& operator=(const CurlRequest&) = delete;
};

} // namespace

constexpr int HttpClient::RETRY_DELAYS_MS[];

HttpClient::HttpClient(const std::string& base_url, int timeout_ms)
    : base_url_(base_url)
    , timeout_ms_(timeout_ms)
    , max_attempts_(MAX_RETRY_DELAYS)
    , debug_(false)
{
    if (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

HttpClient::~HttpClient() = default;

bool HttpClient::is_retryable_status(int status_code) {
    // Retry on: timeout (408), rate limit (429), server errors (500-599)
    // Don't retry on: auth (401), forbidden (403), not found (404), conflict (409)
    if (status_code == 408 || status_code == 429) {
        return true;
    }
    return status_code >= 500 && status_code < 600;
}

HttpResponse HttpClient::execute_once(
    const std::string& method,
    const std::string& path,
    const std::string& body,
    const std::map<std::string, std::string>& headers,
    int timeout_ms,
    size_t max_body_bytes)
{
    auto start = std::chrono::steady_clock::now();
    std::string url = base_url_ + path;

    CurlRequest request;
    CURL* curl = request.curl;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    if (!unix_socket_path_.empty()) {
        curl_easy_setopt(curl, CURLOPT_UNIX_SOCKET_PATH, unix_socket_path_.c_str());
    }

    if (method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    } else if (method == "DELETE") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
    }

    request.headers = curl_slist_append(request.headers, "Content-Type: application/json");
    for (const auto& [key, value] : headers) {
        if (debug_) {
            if (key == "Authorization") {
                std::cerr << "[HttpClient] Header: " << key << ": [REDACTED]" << std::endl;
            } else {
                std::cerr << "[HttpClient] Header: " << key << ": " << value << std::endl;
            }
        }
        std::string header_line = key + ": " + value;
        request.headers = curl_slist_append(request.headers, header_line.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, request.headers);

    BodySink sink;
    sink.limit = max_body_bytes;
    std::map<std::string, std::string> response_headers;

    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response_headers);

    if (debug_) {
        std::cerr << "[HttpClient] " << method << " " << url << std::endl;
    }

    CURLcode res = curl_easy_perform(curl);

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    // Hitting the body ceiling is not a failure
    if (res != CURLE_OK && !(res == CURLE_WRITE_ERROR && sink.truncated)) {
        std::string error_msg = "CURL error: ";
        error_msg += curl_easy_strerror(res);
        error_msg += " (" + method + " " + url + ")";
        throw HttpClientError(error_msg, 0, classify(res));
    }

    long status_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status_code);

    if (debug_) {
        std::cerr << "[HttpClient] Status: " << status_code
                  << " (" << duration.count() << "ms)" << std::endl;
    }

    HttpResponse response;
    response.status_code = static_cast<int>(status_code);
    response.body = std::move(sink.body);
    response.body_truncated = sink.truncated;
    response.headers = std::move(response_headers);
    response.duration = duration;
    return response;
}

HttpResponse HttpClient::execute_with_retry(
    const std::string& method,
    const std::string& path,
    const std::string& body,
    const std::map<std::string, std::string>& headers,
    const RequestOptions& options)
{
    int timeout_ms = options.timeout_ms > 0 ? options.timeout_ms : timeout_ms_;
    int attempts = options.allow_retry ? max_attempts_ : 1;

    for (int attempt = 0; ; ++attempt) {
        HttpResponse response = execute_once(method, path, body, headers, timeout_ms, options.max_body_bytes);

        if (is_retryable_status(response.status_code) && attempt + 1 < attempts) {
            int delay = RETRY_DELAYS_MS[attempt < MAX_RETRY_DELAYS ? attempt : MAX_RETRY_DELAYS - 1];
            if (debug_) {
                std::cerr << "[HttpClient] HTTP " << response.status_code
                          << " - retrying in " << delay << "ms..." << std::endl;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
            continue;
        }

        if (options.throw_on_error_status && response.status_code >= 400) {
            std::ostringstream oss;
            oss << "HTTP " << response.status_code << " from " << method << " " << path;
            if (!response.body.empty()) {
                oss << ": " << response.body;
            }
            throw HttpClientError(oss.str(), response.status_code);
        }

        return response;
    }
}

HttpResponse HttpClient::get(
    const std::string& path,
    const std::map<std::string, std::string>& headers,
    const RequestOptions& options)
{
    return execute_with_retry("GET", path, "", headers, options);
}

HttpResponse HttpClient::post(
    const std::string& path,
    const std::string& body,
    const std::map<std::string, std::string>& headers,
    const RequestOptions& options)
{
    return execute_with_retry("POST", path, body, headers, options);
}

HttpResponse HttpClient::del(
    const std::string& path,
    const std::map<std::string, std::string>& headers,
    const RequestOptions& options)
{
    RequestOptions once = options;
    once.allow_retry = false;
    return execute_with_retry("DELETE", path, "", headers, once);
}

} // namespace http
} // namespace sandlyst
