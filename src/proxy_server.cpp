/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hatch/proxy_server.hpp"
#include "hatch/logger.hpp"
#include "hatch/util.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace hatch {

namespace {
constexpr std::size_t kMaxHeaderBytes = 64 * 1024;
constexpr std::size_t kMaxBodyBytes = 32 * 1024 * 1024;

bool sendAll(int fd, const char* data, std::size_t len) {
    while (len > 0) {
        ssize_t n = ::send(fd, data, len, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        len -= static_cast<std::size_t>(n);
    }
    return true;
}

bool sendAll(int fd, const std::string& data) {
    return sendAll(fd, data.data(), data.size());
}

void writeResponse(int fd, const ProxyResponse& response) {
    std::string head = "HTTP/1.1 " + std::to_string(response.status) + " " + httplib::status_message(response.status) + "\r\n";
    for (const auto& [name, value] : response.headers) {
        head += name + ": " + value + "\r\n";
    }
    head += "Content-Length: " + std::to_string(response.body.size()) + "\r\n";
    head += "Connection: close\r\n\r\n";
    if (sendAll(fd, head)) {
        (void)sendAll(fd, response.body);
    }
}

void writeError(int fd, int status, const std::string& message) {
    ProxyResponse r;
    r.status = status;
    r.body = message;
    r.headers.emplace("Content-Type", "text/plain");
    writeResponse(fd, r);
    LOG_DEBUG("Proxy replied " + std::to_string(status) + ": " + message);
}

// Reads the request head; anything past the blank line is returned in `rest`.
bool readHead(int fd, std::string& head, std::string& rest) {
    std::string buffer;
    char chunk[4096];
    while (buffer.size() < kMaxHeaderBytes) {
        ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        buffer.append(chunk, static_cast<std::size_t>(n));
        auto end = buffer.find("\r\n\r\n");
        if (end != std::string::npos) {
            head = buffer.substr(0, end);
            rest = buffer.substr(end + 4);
            return true;
        }
    }
    return false;
}

bool parseHead(const std::string& head, ProxyRequest& request) {
    auto lineEnd = head.find("\r\n");
    std::string requestLine = head.substr(0, lineEnd);
    auto sp1 = requestLine.find(' ');
    auto sp2 = requestLine.rfind(' ');
    if (sp1 == std::string::npos || sp2 == sp1) return false;
    request.method = requestLine.substr(0, sp1);
    request.target = requestLine.substr(sp1 + 1, sp2 - sp1 - 1);

    std::size_t pos = lineEnd == std::string::npos ? head.size() : lineEnd + 2;
    while (pos < head.size()) {
        auto next = head.find("\r\n", pos);
        std::string line = head.substr(pos, next == std::string::npos ? std::string::npos : next - pos);
        auto colon = line.find(':');
        if (colon != std::string::npos) {
            request.headers.emplace(trim(line.substr(0, colon)), trim(line.substr(colon + 1)));
        }
        if (next == std::string::npos) break;
        pos = next + 2;
    }
    return !request.method.empty() && !request.target.empty();
}

int connectTo(const std::string& host, int port) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* result = nullptr;
    if (getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &result) != 0) {
        return -1;
    }
    int fd = -1;
    for (auto* entry = result; entry != nullptr; entry = entry->ai_next) {
        fd = ::socket(entry->ai_family, entry->ai_socktype, entry->ai_protocol);
        if (fd < 0) continue;
        if (::connect(fd, entry->ai_addr, entry->ai_addrlen) == 0) break;
        ::close(fd);
        fd = -1;
    }
    freeaddrinfo(result);
    return fd;
}
}

ProxyServer::ProxyServer(EgressProxy& proxy) noexcept : proxy_(proxy) {}

ProxyServer::~ProxyServer() {
    stop();
}

bool ProxyServer::start(const std::string& bindAddress, int port) {
    if (running_.load()) {
        LOG_WARN("Proxy already running");
        return false;
    }

    listenFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listenFd_ < 0) {
        LOG_ERROR("Proxy socket failed: " + std::string(std::strerror(errno)));
        return false;
    }
    int yes = 1;
    ::setsockopt(listenFd_, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (::inet_pton(AF_INET, bindAddress.c_str(), &addr.sin_addr) != 1) {
        LOG_ERROR("Proxy bind address is not IPv4: " + bindAddress);
        ::close(listenFd_);
        listenFd_ = -1;
        return false;
    }
    if (::bind(listenFd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
        ::listen(listenFd_, 64) != 0) {
        LOG_ERROR("Proxy bind " + bindAddress + ":" + std::to_string(port) + " failed: " + std::strerror(errno));
        ::close(listenFd_);
        listenFd_ = -1;
        return false;
    }

    socklen_t len = sizeof(addr);
    ::getsockname(listenFd_, reinterpret_cast<sockaddr*>(&addr), &len);
    port_ = ntohs(addr.sin_port);

    running_.store(true);
    acceptThread_ = std::thread(&ProxyServer::acceptLoop, this);
    LOG_INFO("Egress proxy listening on " + bindAddress + ":" + std::to_string(port_));
    return true;
}

void ProxyServer::stop() noexcept {
    if (!running_.exchange(false)) {
        return;
    }
    ::shutdown(listenFd_, SHUT_RDWR);
    ::close(listenFd_);
    listenFd_ = -1;
    if (acceptThread_.joinable()) {
        acceptThread_.join();
    }

    std::unique_lock<std::mutex> lock(connMutex_);
    for (int fd : activeFds_) {
        ::shutdown(fd, SHUT_RDWR);
    }
    connDone_.wait(lock, [this] { return activeFds_.empty(); });
    LOG_INFO("Egress proxy stopped");
}

void ProxyServer::acceptLoop() {
    setThreadName("Proxy");
    while (running_.load()) {
        int fd = ::accept(listenFd_, nullptr, nullptr);
        if (fd < 0) {
            if (errno == EINTR) continue;
            if (running_.load()) {
                LOG_WARN("Proxy accept failed: " + std::string(std::strerror(errno)));
            }
            break;
        }
        {
            std::lock_guard<std::mutex> lock(connMutex_);
            activeFds_.insert(fd);
        }
        try {
            std::thread(&ProxyServer::serveConnection, this, fd).detach();
        } catch (const std::exception& e) {
            LOG_ERROR("Proxy cannot spawn connection thread: " + std::string(e.what()));
            release(fd);
        }
    }
}

void ProxyServer::release(int fd) noexcept {
    // Untrack before closing so accept() cannot hand the number out while it is still in the set.
    std::lock_guard<std::mutex> lock(connMutex_);
    activeFds_.erase(fd);
    ::close(fd);
    connDone_.notify_all();
}

void ProxyServer::serveConnection(int fd) {
    setThreadName("Proxy-conn");
    try {
        std::string head;
        std::string rest;
        if (!readHead(fd, head, rest)) {
            release(fd);
            return;
        }

        ProxyRequest request;
        if (!parseHead(head, request)) {
            writeError(fd, 400, "malformed request");
            release(fd);
            return;
        }

        if (request.method == "CONNECT") {
            auto decision = proxy_.authorizeConnect(request);
            if (!decision) {
                writeResponse(fd, decision.denial);
            } else {
                tunnel(fd, decision);
            }
            release(fd);
            return;
        }

        auto te = request.headers.find("Transfer-Encoding");
        if (te != request.headers.end() && toLowerCopy(te->second) != "identity") {
            writeError(fd, 411, "chunked request bodies are not supported");
            release(fd);
            return;
        }

        std::size_t length = 0;
        auto cl = request.headers.find("Content-Length");
        if (cl != request.headers.end()) {
            length = static_cast<std::size_t>(std::stoull(cl->second));
        }
        if (length > kMaxBodyBytes) {
            writeError(fd, 413, "request body too large");
            release(fd);
            return;
        }
        request.body = rest.substr(0, length);
        char chunk[8192];
        while (request.body.size() < length) {
            ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) break;
            request.body.append(chunk, static_cast<std::size_t>(n));
        }
        if (request.body.size() < length) {
            release(fd);
            return;
        }

        writeResponse(fd, proxy_.handle(request));
    } catch (const std::exception& e) {
        LOG_ERROR("Proxy connection error: " + std::string(e.what()));
        writeError(fd, 400, "bad request");
    }
    release(fd);
}

void ProxyServer::tunnel(int clientFd, const TunnelDecision& decision) {
    int upstreamFd = connectTo(decision.host, decision.port);
    if (upstreamFd < 0) {
        LOG_JOB(WARN, decision.scope, "tunnel connect failed: " + decision.host + ":" + std::to_string(decision.port));
        writeError(clientFd, 502, "upstream unreachable");
        return;
    }
    {
        std::lock_guard<std::mutex> lock(connMutex_);
        activeFds_.insert(upstreamFd);
    }

    if (sendAll(clientFd, std::string("HTTP/1.1 200 Connection Established\r\n\r\n"))) {
        LOG_JOB(DEBUG, decision.scope, "tunnel open to " + decision.host);
        pollfd fds[2] = {{clientFd, POLLIN, 0}, {upstreamFd, POLLIN, 0}};
        char buffer[16384];
        bool open = true;
        while (open && running_.load()) {
            int ready = ::poll(fds, 2, 1000);
            if (ready < 0) {
                if (errno == EINTR) continue;
                break;
            }
            for (int i = 0; i < 2 && open; ++i) {
                if (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) {
                    ssize_t n = ::recv(fds[i].fd, buffer, sizeof(buffer), 0);
                    if (n <= 0 || !sendAll(fds[1 - i].fd, buffer, static_cast<std::size_t>(n))) {
                        open = false;
                    }
                }
            }
        }
    }
    release(upstreamFd);
}

}
