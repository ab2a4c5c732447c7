#include <catch2/catch_test_macros.hpp>
#include "api/http_client.hpp"
#include <filesystem>

using namespace sandlyst::http;

TEST_CASE("HttpClient retry policy", "[http_client]") {
    SECTION("Retries transient statuses") {
        REQUIRE(HttpClient::is_retryable_status(408));
        REQUIRE(HttpClient::is_retryable_status(429));
        REQUIRE(HttpClient::is_retryable_status(500));
        REQUIRE(HttpClient::is_retryable_status(503));
    }

    SECTION("Does not retry client errors") {
        REQUIRE_FALSE(HttpClient::is_retryable_status(200));
        REQUIRE_FALSE(HttpClient::is_retryable_status(401));
        REQUIRE_FALSE(HttpClient::is_retryable_status(404));
        REQUIRE_FALSE(HttpClient::is_retryable_status(409));
    }
}

TEST_CASE("HttpClient strips trailing slash from base URL", "[http_client]") {
    HttpClient client("http://localhost/v1.41/");
    REQUIRE(client.base_url() == "http://localhost/v1.41");
}

TEST_CASE("HttpClient reports connection failures", "[http_client]") {
    SECTION("Missing UNIX socket") {
        auto socket_path = std::filesystem::temp_directory_path() / "sandlyst_no_such.sock";
        std::filesystem::remove(socket_path);

        HttpClient client("http://localhost", 2000);
        client.set_unix_socket(socket_path.string());

        try {
            client.get("/_ping");
            FAIL("Expected HttpClientError");
        } catch (const HttpClientError& e) {
            REQUIRE(e.is_connection_failure());
            REQUIRE(e.status_code() == 0);
        }
    }

    SECTION("Refused TCP port") {
        HttpClient client("http://127.0.0.1:1", 2000);
        client.set_max_attempts(1);

        try {
            client.post("/chat/completions", "{}");
            FAIL("Expected HttpClientError");
        } catch (const HttpClientError& e) {
            REQUIRE(e.status_code() == 0);
            REQUIRE_FALSE(e.is_timeout());
        }
    }
}

TEST_CASE("HttpClientError carries status and transport", "[http_client]") {
    HttpClientError status_error("HTTP 404", 404);
    REQUIRE(status_error.status_code() == 404);
    REQUIRE(status_error.transport() == TransportFailure::NONE);

    HttpClientError timeout_error("timed out", 0, TransportFailure::TIMEOUT);
    REQUIRE(timeout_error.is_timeout());
    REQUIRE_FALSE(timeout_error.is_connection_failure());
}
