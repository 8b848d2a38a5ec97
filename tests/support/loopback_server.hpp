#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace immich::test_support {

/**
 * Minimal HTTP/1.1 responder on 127.0.0.1 for exercising CurlTransport
 *
 * One request per connection; every response carries "Connection: close".
 * The handler maps "METHOD /path" to a complete raw response.
 */
class LoopbackServer {
public:
    using Handler = std::function<std::string(const std::string& request_line)>;

    explicit LoopbackServer(Handler handler) : handler_(std::move(handler)) {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
        if (listen_fd_ < 0) {
            return;
        }
        int reuse = 1;
        ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = 0;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 ||
            ::listen(listen_fd_, 8) < 0) {
            ::close(listen_fd_);
            listen_fd_ = -1;
            return;
        }

        socklen_t len = sizeof(addr);
        ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
        thread_ = std::thread(&LoopbackServer::serve, this);
    }

    ~LoopbackServer() {
        stopping_ = true;
        if (listen_fd_ >= 0) {
            ::shutdown(listen_fd_, SHUT_RDWR);
            ::close(listen_fd_);
        }
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    LoopbackServer(const LoopbackServer&) = delete;
    LoopbackServer& operator=(const LoopbackServer&) = delete;

    bool running() const { return listen_fd_ >= 0; }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    std::vector<std::string> request_lines() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return request_lines_;
    }

    static std::string response(int status, const std::string& reason, const std::string& body,
                                const std::string& extra_headers = {}) {
        return "HTTP/1.1 " + std::to_string(status) + " " + reason + "\r\n" +
               extra_headers +
               "Content-Length: " + std::to_string(body.size()) + "\r\n"
               "Connection: close\r\n\r\n" + body;
    }

private:
    void serve() {
        while (!stopping_) {
            const int client = ::accept(listen_fd_, nullptr, nullptr);
            if (client < 0) {
                return;
            }
            handle(client);
            ::close(client);
        }
    }

    void handle(int client) {
        std::string request;
        char buffer[4096];
        std::size_t header_end = std::string::npos;
        while (header_end == std::string::npos) {
            const auto got = ::recv(client, buffer, sizeof(buffer), 0);
            if (got <= 0) {
                return;
            }
            request.append(buffer, static_cast<std::size_t>(got));
            header_end = request.find("\r\n\r\n");
        }

        // Drain the body so the client never sees a reset mid-upload
        std::size_t content_length = 0;
        const auto marker = request.find("Content-Length:");
        if (marker != std::string::npos && marker < header_end) {
            content_length = std::stoul(request.substr(marker + 15));
        }
        std::size_t have = request.size() - (header_end + 4);
        while (have < content_length) {
            const auto got = ::recv(client, buffer, sizeof(buffer), 0);
            if (got <= 0) {
                break;
            }
            have += static_cast<std::size_t>(got);
        }

        const auto line_end = request.find("\r\n");
        const auto first_space = request.find(' ');
        const auto second_space = request.find(' ', first_space + 1);
        const std::string line = request.substr(0, std::min(second_space, line_end));
        {
            std::lock_guard<std::mutex> lock(mutex_);
            request_lines_.push_back(line);
        }

        const std::string reply = handler_(line);
        std::size_t sent = 0;
        while (sent < reply.size()) {
            const auto wrote = ::send(client, reply.data() + sent, reply.size() - sent, MSG_NOSIGNAL);
            if (wrote <= 0) {
                return;
            }
            sent += static_cast<std::size_t>(wrote);
        }
    }

    Handler handler_;
    int listen_fd_ = -1;
    std::uint16_t port_ = 0;
    std::atomic<bool> stopping_{false};
    std::thread thread_;
    mutable std::mutex mutex_;
    std::vector<std::string> request_lines_;
};

} // namespace immich::test_support
