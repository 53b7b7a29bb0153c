/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <thread>

#include "hatch/proxy_server.hpp"
#include "test_helpers.hpp"

using namespace hatch;
using namespace std::chrono_literals;

namespace {

// Loopback TCP socket closed on destruction.
class Socket {
public:
    explicit Socket(int port) {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(static_cast<uint16_t>(port));
        ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        timeval timeout{5, 0};
        ::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
        connected_ = ::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
    }
    ~Socket() {
        if (fd_ >= 0) ::close(fd_);
    }
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    [[nodiscard]] bool connected() const noexcept { return connected_; }

    bool send(const std::string& data) {
        return ::send(fd_, data.data(), data.size(), MSG_NOSIGNAL) == static_cast<ssize_t>(data.size());
    }

    // Reads until `marker` shows up or the peer closes.
    std::string readUntil(const std::string& marker) {
        std::string out;
        char buffer[4096];
        while (marker.empty() || out.find(marker) == std::string::npos) {
            ssize_t n = ::recv(fd_, buffer, sizeof(buffer), 0);
            if (n <= 0) break;
            out.append(buffer, static_cast<std::size_t>(n));
        }
        return out;
    }

    std::string readAll() { return readUntil(""); }

private:
    int fd_ = -1;
    bool connected_ = false;
};

// Accepts one connection and echoes every chunk back prefixed with "echo:".
class EchoServer {
public:
    EchoServer() {
        listenFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = 0;
        ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        ::bind(listenFd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        ::listen(listenFd_, 4);
        socklen_t len = sizeof(addr);
        ::getsockname(listenFd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
        thread_ = std::thread([this] {
            int fd = ::accept(listenFd_, nullptr, nullptr);
            if (fd < 0) return;
            char buffer[1024];
            ssize_t n;
            while ((n = ::recv(fd, buffer, sizeof(buffer), 0)) > 0) {
                std::string reply = "echo:" + std::string(buffer, static_cast<std::size_t>(n));
                ::send(fd, reply.data(), reply.size(), MSG_NOSIGNAL);
            }
            ::close(fd);
        });
    }
    ~EchoServer() {
        ::shutdown(listenFd_, SHUT_RDWR);
        ::close(listenFd_);
        thread_.join();
    }

    [[nodiscard]] int port() const noexcept { return port_; }

private:
    int listenFd_ = -1;
    int port_ = 0;
    std::thread thread_;
};

class ProxyServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        test::quietLogs();
        token = *tokens.issue("job1");
        proxy.installRules("job1", {{"api.example.com", "", ""}, {"127.0.0.1", "", ""}});
        ASSERT_TRUE(server.start("127.0.0.1", 0));
        ASSERT_GT(server.port(), 0);
    }

    void TearDown() override { server.stop(); }

    std::string auth() const {
        return "Proxy-Authorization: Basic " + base64Encode("job1:" + token) + "\r\n";
    }

    TokenStore tokens;
    CredentialStore credentials;
    test::RecordingUpstream upstream;
    EgressProxy proxy{tokens, credentials, upstream};
    ProxyServer server{proxy};
    std::string token;
};

TEST_F(ProxyServerTest, MissingCredentialsGet407) {
    Socket s(server.port());
    ASSERT_TRUE(s.connected());
    ASSERT_TRUE(s.send("GET http://api.example.com/ HTTP/1.1\r\nHost: api.example.com\r\n\r\n"));
    auto reply = s.readAll();
    EXPECT_EQ(reply.rfind("HTTP/1.1 407", 0), 0u) << reply;
    EXPECT_NE(reply.find("Proxy-Authenticate: Basic"), std::string::npos);
    EXPECT_TRUE(upstream.requests.empty());
}

TEST_F(ProxyServerTest, UnlistedHostGet403) {
    Socket s(server.port());
    ASSERT_TRUE(s.send("GET http://evil.example.org/ HTTP/1.1\r\nHost: evil.example.org\r\n" + auth() + "\r\n"));
    auto reply = s.readAll();
    EXPECT_EQ(reply.rfind("HTTP/1.1 403", 0), 0u) << reply;
    EXPECT_NE(reply.find("X-Hatch-Egress: denied"), std::string::npos);
    EXPECT_EQ(proxy.deniedCount(), 1u);
}

TEST_F(ProxyServerTest, ChunkedBodiesGet411) {
    Socket s(server.port());
    ASSERT_TRUE(s.send("POST http://api.example.com/upload HTTP/1.1\r\nHost: api.example.com\r\n" + auth() +
                       "Transfer-Encoding: chunked\r\n\r\n5\r\nhello\r\n0\r\n\r\n"));
    auto reply = s.readAll();
    EXPECT_EQ(reply.rfind("HTTP/1.1 411", 0), 0u) << reply;
    EXPECT_TRUE(upstream.requests.empty());
}

TEST_F(ProxyServerTest, AllowedRequestIsForwardedWithBody) {
    Socket s(server.port());
    ASSERT_TRUE(s.send("POST http://api.example.com/v1/items?q=1 HTTP/1.1\r\nHost: api.example.com\r\n" + auth() +
                       "Content-Length: 7\r\n\r\npayload"));
    auto reply = s.readAll();
    EXPECT_EQ(reply.rfind("HTTP/1.1 200", 0), 0u) << reply;
    EXPECT_NE(reply.find("upstream-body"), std::string::npos);
    EXPECT_NE(reply.find("Connection: close"), std::string::npos);

    std::lock_guard<std::mutex> lock(upstream.mutex_);
    ASSERT_EQ(upstream.requests.size(), 1u);
    EXPECT_EQ(upstream.requests[0].host, "api.example.com");
    EXPECT_EQ(upstream.requests[0].method, "POST");
    EXPECT_EQ(upstream.requests[0].body, "payload");
}

TEST_F(ProxyServerTest, MalformedRequestLineGet400) {
    Socket s(server.port());
    ASSERT_TRUE(s.send("garbage\r\n\r\n"));
    EXPECT_EQ(s.readAll().rfind("HTTP/1.1 400", 0), 0u);
}

TEST_F(ProxyServerTest, ConnectTunnelRelaysBytes) {
    EchoServer echo;
    Socket s(server.port());
    std::string authority = "127.0.0.1:" + std::to_string(echo.port());
    ASSERT_TRUE(s.send("CONNECT " + authority + " HTTP/1.1\r\nHost: " + authority + "\r\n" + auth() + "\r\n"));
    auto established = s.readUntil("\r\n\r\n");
    ASSERT_EQ(established.rfind("HTTP/1.1 200", 0), 0u) << established;

    ASSERT_TRUE(s.send("ping"));
    EXPECT_EQ(s.readUntil("echo:ping"), "echo:ping");
    ASSERT_TRUE(s.send("again"));
    EXPECT_EQ(s.readUntil("echo:again"), "echo:again");
    EXPECT_EQ(proxy.allowedCount(), 1u);
}

TEST_F(ProxyServerTest, ConnectToUnlistedHostIsRefused) {
    Socket s(server.port());
    ASSERT_TRUE(s.send("CONNECT evil.example.org:443 HTTP/1.1\r\nHost: evil.example.org:443\r\n" + auth() + "\r\n"));
    EXPECT_EQ(s.readAll().rfind("HTTP/1.1 403", 0), 0u);
}

TEST_F(ProxyServerTest, StopClosesOpenTunnels) {
    EchoServer echo;
    Socket s(server.port());
    std::string authority = "127.0.0.1:" + std::to_string(echo.port());
    ASSERT_TRUE(s.send("CONNECT " + authority + " HTTP/1.1\r\n" + auth() + "\r\n"));
    ASSERT_EQ(s.readUntil("\r\n\r\n").rfind("HTTP/1.1 200", 0), 0u);

    auto start = std::chrono::steady_clock::now();
    server.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 4s);
    EXPECT_FALSE(server.isRunning());
    EXPECT_EQ(s.readAll(), "");
}

TEST_F(ProxyServerTest, ManySequentialConnectionsAreTrackedAndReleased) {
    for (int i = 0; i < 25; ++i) {
        Socket s(server.port());
        ASSERT_TRUE(s.send("GET http://api.example.com/" + std::to_string(i) + " HTTP/1.1\r\n" + auth() + "\r\n"));
        ASSERT_EQ(s.readAll().rfind("HTTP/1.1 200", 0), 0u);
    }
    auto start = std::chrono::steady_clock::now();
    server.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 4s);
}

}
