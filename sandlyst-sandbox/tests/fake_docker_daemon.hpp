/**
 * @file fake_docker_daemon.hpp
 * @brief Minimal HTTP/1.1 server on a UNIX socket that answers Docker API calls
 *
 * Each connection carries one request. Responses come from a handler keyed on
 * method and path, and may be delayed to make the client time out.
 */

#ifndef SANDLYST_FAKE_DOCKER_DAEMON_HPP
#define SANDLYST_FAKE_DOCKER_DAEMON_HPP

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace sandlyst {
namespace testing {

struct CannedResponse {
    int status = 200;
    std::string body;
    int delay_ms = 0;
};

class FakeDockerDaemon {
public:
    using Handler = std::function<CannedResponse(const std::string& method, const std::string& path)>;

    explicit FakeDockerDaemon(Handler handler)
        : handler_(std::move(handler)), stop_(false), listen_fd_(-1) {

        std::string tmpl = (std::filesystem::temp_directory_path() / "sandlyst_dockerd_XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (::mkdtemp(buf.data()) == nullptr) {
            throw std::runtime_error(std::string("mkdtemp failed: ") + std::strerror(errno));
        }
        dir_ = buf.data();
        socket_path_ = (dir_ / "docker.sock").string();

        listen_fd_ = ::socket(AF_UNIX, SOCK_STREAM, 0);
        if (listen_fd_ < 0) {
            throw std::runtime_error(std::string("socket failed: ") + std::strerror(errno));
        }

        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);
        if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 ||
            ::listen(listen_fd_, 16) < 0) {
            std::string error = std::strerror(errno);
            ::close(listen_fd_);
            throw std::runtime_error("bind/listen failed: " + error);
        }

        accept_thread_ = std::thread([this]() { accept_loop(); });
    }

    ~FakeDockerDaemon() {
        stop_ = true;
        if (accept_thread_.joinable()) {
            accept_thread_.join();
        }
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        ::close(listen_fd_);
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    FakeDockerDaemon(const FakeDockerDaemon&) = delete;
    FakeDockerDaemon& operator=(const FakeDockerDaemon&) = delete;

    std::string docker_host() const { return "unix://" + socket_path_; }

    // "METHOD /path" for every request seen, in arrival order
    std::vector<std::string> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    bool saw(const std::string& method, const std::string& path_fragment) const {
        for (const auto& request : requests()) {
            if (request.compare(0, method.size() + 1, method + " ") == 0 &&
                request.find(path_fragment) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

private:
    Handler handler_;
    std::atomic<bool> stop_;
    int listen_fd_;
    std::filesystem::path dir_;
    std::string socket_path_;
    std::thread accept_thread_;
    std::vector<std::thread> workers_;
    mutable std::mutex mutex_;
    std::vector<std::string> requests_;

    void accept_loop() {
        while (!stop_) {
            pollfd pfd{listen_fd_, POLLIN, 0};
            if (::poll(&pfd, 1, 50) <= 0) {
                continue;
            }
            int client = ::accept(listen_fd_, nullptr, nullptr);
            if (client < 0) {
                continue;
            }
            workers_.emplace_back([this, client]() { serve(client); });
        }
    }

    void serve(int client) {
        std::string request;
        char buffer[4096];
        size_t header_end = std::string::npos;
        while (header_end == std::string::npos) {
            ssize_t n = ::recv(client, buffer, sizeof(buffer), 0);
            if (n <= 0) {
                ::close(client);
                return;
            }
            request.append(buffer, static_cast<size_t>(n));
            header_end = request.find("\r\n\r\n");
        }

        size_t content_length = 0;
        size_t cl = request.find("Content-Length:");
        if (cl != std::string::npos && cl < header_end) {
            content_length = static_cast<size_t>(std::strtoul(request.c_str() + cl + 15, nullptr, 10));
        }
        while (request.size() < header_end + 4 + content_length) {
            ssize_t n = ::recv(client, buffer, sizeof(buffer), 0);
            if (n <= 0) {
                break;
            }
            request.append(buffer, static_cast<size_t>(n));
        }

        size_t first_space = request.find(' ');
        size_t second_space = request.find(' ', first_space + 1);
        std::string method = request.substr(0, first_space);
        std::string path = request.substr(first_space + 1, second_space - first_space - 1);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(method + " " + path);
        }

        CannedResponse canned = handler_(method, path);

        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(canned.delay_ms);
        while (!stop_ && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        std::string response = "HTTP/1.1 " + std::to_string(canned.status) + " Fake\r\n"
            "Content-Type: application/json\r\n"
            "Content-Length: " + std::to_string(canned.body.size()) + "\r\n"
            "Connection: close\r\n\r\n" + canned.body;

        size_t sent = 0;
        while (sent < response.size()) {
            // The client may already have given up on a delayed response
            ssize_t n = ::send(client, response.data() + sent, response.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) {
                break;
            }
            sent += static_cast<size_t>(n);
        }
        ::close(client);
    }
};

} // namespace testing
} // namespace sandlyst

#endif // SANDLYST_FAKE_DOCKER_DAEMON_HPP
