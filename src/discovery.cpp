// UDP discovery responder and probe

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <system_error>

#include <fmt/core.h>
#include "discovery.hpp"
#include "net.hpp"
#include "protocol.hpp"
#include "utils.hpp"

namespace {

void set_recv_timeout(int fd, int ms) {
    struct timeval tv = {};
    tv.tv_sec = ms / 1000;
    tv.tv_usec = (ms % 1000) * 1000;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
}

}  // namespace

// ============================================================
// Responder
// ============================================================

DiscoveryResponder::DiscoveryResponder(std::string identity, uint16_t tcp_port, uint16_t udp_port)
    : identity_(std::move(identity)), tcp_port_(tcp_port), udp_port_(udp_port) {}

DiscoveryResponder::~DiscoveryResponder() {
    stop();
}

void DiscoveryResponder::start() {
    sockfd_ = socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (sockfd_ < 0) {
        throw std::system_error(errno, std::generic_category(), "discovery socket");
    }

    int opt = 1;
    setsockopt(sockfd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    struct sockaddr_in addr = {};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(udp_port_);
    addr.sin_addr.s_addr = INADDR_ANY;
    if (bind(sockfd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        int saved = errno;
        close(sockfd_);
        sockfd_ = -1;
        throw std::system_error(saved, std::generic_category(),
                                fmt::format("discovery bind on UDP {}", udp_port_));
    }
    udp_port_ = local_port(sockfd_);

    // Short timeout so stop() is noticed promptly
    set_recv_timeout(sockfd_, 250);

    running_ = true;
    thread_ = std::thread(&DiscoveryResponder::loop, this);
}

void DiscoveryResponder::stop() {
    running_ = false;
    if (thread_.joinable()) thread_.join();
    if (sockfd_ >= 0) {
        close(sockfd_);
        sockfd_ = -1;
    }
}

void DiscoveryResponder::loop() {
    const std::string reply = protocol::make_discover_response(identity_, tcp_port_);
    char buf[512];

    while (running_) {
        struct sockaddr_storage from;
        socklen_t from_len = sizeof(from);
        ssize_t n = recvfrom(sockfd_, buf, sizeof(buf) - 1, 0,
                             reinterpret_cast<struct sockaddr*>(&from), &from_len);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            log_error("Discovery receive failed: {}", strerror(errno));
            break;
        }

        std::string msg(buf, static_cast<size_t>(n));
        while (!msg.empty() && (msg.back() == '\n' || msg.back() == '\r')) msg.pop_back();
        if (msg != protocol::DISCOVER_REQUEST) continue;

        if (sendto(sockfd_, reply.data(), reply.size(), 0,
                   reinterpret_cast<struct sockaddr*>(&from), from_len) < 0) {
            log_error("Discovery reply to {} failed: {}", format_address(from), strerror(errno));
        }
    }
}

// ============================================================
// Probe
// ============================================================

std::vector<DiscoveredServer> discover_servers(uint16_t udp_port, int window_ms,
                                               const std::string& target) {
    std::vector<DiscoveredServer> found;

    int fd = socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        fmt::print(stderr, "Discovery socket failed: {}\n", strerror(errno));
        return found;
    }

    int yes = 1;
    setsockopt(fd, SOL_SOCKET, SO_BROADCAST, &yes, sizeof(yes));

    struct sockaddr_in dest = {};
    dest.sin_family = AF_INET;
    dest.sin_port = htons(udp_port);
    if (inet_pton(AF_INET, target.c_str(), &dest.sin_addr) != 1) {
        fmt::print(stderr, "Invalid discovery target '{}'\n", target);
        close(fd);
        return found;
    }

    const std::string probe = protocol::DISCOVER_REQUEST;
    if (sendto(fd, probe.data(), probe.size(), 0,
               reinterpret_cast<struct sockaddr*>(&dest), sizeof(dest)) < 0) {
        fmt::print(stderr, "Discovery probe failed: {}\n", strerror(errno));
        close(fd);
        return found;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(window_ms);
    char buf[512];
    while (true) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (left <= 0) break;
        set_recv_timeout(fd, static_cast<int>(left));

        struct sockaddr_storage from;
        socklen_t from_len = sizeof(from);
        ssize_t n = recvfrom(fd, buf, sizeof(buf), 0,
                             reinterpret_cast<struct sockaddr*>(&from), &from_len);
        if (n < 0) {
            if (errno == EINTR) continue;
            break;  // Window closed
        }

        auto resp = protocol::parse_discover_response(std::string(buf, static_cast<size_t>(n)));
        if (!resp) continue;
        found.push_back({resp->identity, format_address(from), resp->port});
    }

    close(fd);
    return found;
}
