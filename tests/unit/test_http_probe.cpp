/**
 * @file test_http_probe.cpp
 * @brief Unit tests for the HTTP reachability probe against loopback servers.
 */

#include "network/http_probe.hpp"

#include <gtest/gtest.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>

using namespace exo_watch;

namespace {

/// Loopback listener that answers each connection with a canned response.
class StubHttpServer {
public:
    /// A non-zero `byte_delay` sends the response one byte at a time.
    explicit StubHttpServer(std::string response, bool respond = true,
                            std::chrono::milliseconds byte_delay = std::chrono::milliseconds{0})
        : response_(std::move(response)), respond_(respond), byte_delay_(byte_delay) {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        int one = 1;
        ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        ::listen(fd_, 8);

        socklen_t len = sizeof(addr);
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        if (respond_) {
            thread_ = std::thread([this] { serve(); });
        }
    }

    ~StubHttpServer() {
        stopping_ = true;
        ::shutdown(fd_, SHUT_RDWR);
        ::close(fd_);
        if (thread_.joinable()) thread_.join();
    }

    [[nodiscard]] uint16_t port() const { return port_; }
    [[nodiscard]] std::string last_request() const {
        std::lock_guard lock(mutex_);
        return last_request_;
    }

private:
    void serve() {
        while (!stopping_) {
            int client = ::accept(fd_, nullptr, nullptr);
            if (client < 0) return;
            char buf[1024];
            auto n = ::recv(client, buf, sizeof(buf), 0);
            if (n > 0) {
                std::lock_guard lock(mutex_);
                last_request_.assign(buf, static_cast<size_t>(n));
            }
            if (byte_delay_.count() == 0) {
                ::send(client, response_.data(), response_.size(), MSG_NOSIGNAL);
            } else {
                for (char c : response_) {
                    if (stopping_ || ::send(client, &c, 1, MSG_NOSIGNAL) != 1) break;
                    std::this_thread::sleep_for(byte_delay_);
                }
            }
            ::close(client);
        }
    }

    std::string response_;
    bool respond_;
    std::chrono::milliseconds byte_delay_;
    int fd_ = -1;
    uint16_t port_ = 0;
    std::atomic<bool> stopping_{false};
    mutable std::mutex mutex_;
    std::string last_request_;
    std::thread thread_;
};

uint16_t unused_port() {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    socklen_t len = sizeof(addr);
    ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    ::close(fd);
    return ntohs(addr.sin_port);
}

}  // namespace

TEST(HttpProbeTest, ReturnsStatusCode) {
    StubHttpServer server("HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n");
    auto status = probe_http("127.0.0.1", server.port(), "/", 1000);
    ASSERT_TRUE(status.has_value()) << status.error().message;
    EXPECT_EQ(*status, 200);
}

TEST(HttpProbeTest, SendsRequestedPath) {
    StubHttpServer server("HTTP/1.0 405 Method Not Allowed\r\n\r\n");
    auto status = probe_http("127.0.0.1", server.port(), "/v1/chat/completions", 1000);
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(*status, 405);
    EXPECT_EQ(server.last_request().rfind("GET /v1/chat/completions HTTP/1.0\r\n", 0), 0u);
}

TEST(HttpProbeTest, NotFoundIsStillAResponse) {
    StubHttpServer server("HTTP/1.1 404 Not Found\r\n\r\n");
    auto status = probe_http("127.0.0.1", server.port(), "/", 1000);
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(*status, 404);
    EXPECT_FALSE(is_peer_status(*status));
}

TEST(HttpProbeTest, NonHttpAnswerIsMalformed) {
    StubHttpServer server("SSH-2.0-OpenSSH_9.0\r\n");
    auto status = probe_http("127.0.0.1", server.port(), "/", 1000);
    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error().kind, ErrorKind::MalformedMessage);
}

TEST(HttpProbeTest, SilentServerTimesOut) {
    StubHttpServer server("", /*respond=*/false);
    auto status = probe_http("127.0.0.1", server.port(), "/", 200);
    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error().kind, ErrorKind::ProbeTimeout);
}

TEST(HttpProbeTest, SlowStatusLineHitsOverallDeadline) {
    // 17 bytes at 150 ms each; every single byte arrives well inside 200 ms.
    StubHttpServer server("HTTP/1.1 200 OK\r\n", true, std::chrono::milliseconds(150));

    auto start = std::chrono::steady_clock::now();
    auto status = probe_http("127.0.0.1", server.port(), "/", 200);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error().kind, ErrorKind::ProbeTimeout);
    EXPECT_LT(elapsed, std::chrono::milliseconds(1000));
}

TEST(HttpProbeTest, RefusedConnectionIsTransportError) {
    auto status = probe_http("127.0.0.1", unused_port(), "/", 500);
    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error().kind, ErrorKind::Transport);
}

TEST(HttpProbeTest, InvalidAddressRejected) {
    auto status = probe_http("not-an-ip", 80, "/", 100);
    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error().kind, ErrorKind::Transport);
}

TEST(HttpProbeTest, PeerStatusRange) {
    EXPECT_TRUE(is_peer_status(200));
    EXPECT_TRUE(is_peer_status(204));
    EXPECT_TRUE(is_peer_status(302));
    EXPECT_FALSE(is_peer_status(199));
    EXPECT_FALSE(is_peer_status(400));
    EXPECT_FALSE(is_peer_status(500));
}

TEST(HttpProbeTest, ParseStatusLine) {
    EXPECT_EQ(*parse_status_line("HTTP/1.1 302 Found"), 302);
    EXPECT_EQ(*parse_status_line("HTTP/1.0 200"), 200);
    EXPECT_FALSE(parse_status_line("HTTP/1.1").has_value());
    EXPECT_FALSE(parse_status_line("HTTP/1.1 2x0 OK").has_value());
    EXPECT_FALSE(parse_status_line("220 smtp ready").has_value());
}
