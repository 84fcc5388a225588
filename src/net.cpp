// Socket plumbing shared by the server and the client

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <fcntl.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <fmt/core.h>
#include "net.hpp"
#include "protocol.hpp"

// ============================================================
// Connection
// ============================================================

Connection::Connection(Connection&& other) noexcept
    : fd_(other.fd_), buf_(std::move(other.buf_)), pos_(other.pos_) {
    other.fd_ = -1;
    other.pos_ = 0;
}

Connection& Connection::operator=(Connection&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        buf_ = std::move(other.buf_);
        pos_ = other.pos_;
        other.fd_ = -1;
        other.pos_ = 0;
    }
    return *this;
}

bool Connection::set_timeouts(int timeout_ms) {
    struct timeval tv = {};
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    if (setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) return false;
    if (setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) return false;
    return true;
}

bool Connection::send_all(const void* buf, size_t len) {
    const char* p = static_cast<const char*>(buf);
    size_t sent = 0;
    while (sent < len) {
        ssize_t n = send(fd_, p + sent, len - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        sent += n;
    }
    return true;
}

bool Connection::send_line(const std::string& line) {
    std::string framed = line;
    framed.push_back('\n');
    return send_all(framed.data(), framed.size());
}

IoResult Connection::fill() {
    char chunk[4096];
    ssize_t n;
    do {
        n = recv(fd_, chunk, sizeof(chunk), 0);
    } while (n < 0 && errno == EINTR);

    if (n == 0) return IoResult::CLOSED;
    if (n < 0) {
        return (errno == EAGAIN || errno == EWOULDBLOCK) ? IoResult::TIMEOUT : IoResult::ERROR;
    }

    // Compact before growing
    if (pos_ > 0) {
        buf_.erase(buf_.begin(), buf_.begin() + pos_);
        pos_ = 0;
    }
    buf_.insert(buf_.end(), chunk, chunk + n);
    return IoResult::OK;
}

IoResult Connection::read_line(std::string& out) {
    size_t scanned = pos_;
    while (true) {
        auto begin = buf_.begin() + scanned;
        auto nl = std::find(begin, buf_.end(), '\n');
        if (nl != buf_.end()) {
            out.assign(buf_.begin() + pos_, nl);
            pos_ = (nl - buf_.begin()) + 1;
            if (!out.empty() && out.back() == '\r') out.pop_back();
            if (out.size() > protocol::MAX_LINE_LEN) return IoResult::TOO_LONG;
            return IoResult::OK;
        }
        if (buf_.size() - pos_ > protocol::MAX_LINE_LEN + 1) {
            return IoResult::TOO_LONG;
        }

        size_t pending = buf_.size() - pos_;
        IoResult r = fill();
        if (r != IoResult::OK) return r;
        scanned = pos_ + pending;  // fill() may have compacted
    }
}

IoResult Connection::read_some(char* buf, size_t len, size_t& n) {
    n = 0;
    if (len == 0) return IoResult::OK;

    if (pos_ < buf_.size()) {
        n = std::min(len, buf_.size() - pos_);
        memcpy(buf, buf_.data() + pos_, n);
        pos_ += n;
        if (pos_ == buf_.size()) {
            buf_.clear();
            pos_ = 0;
        }
        return IoResult::OK;
    }

    ssize_t r;
    do {
        r = recv(fd_, buf, len, 0);
    } while (r < 0 && errno == EINTR);

    if (r == 0) return IoResult::CLOSED;
    if (r < 0) {
        return (errno == EAGAIN || errno == EWOULDBLOCK) ? IoResult::TIMEOUT : IoResult::ERROR;
    }
    n = static_cast<size_t>(r);
    return IoResult::OK;
}

std::string Connection::peer_address() const {
    struct sockaddr_storage addr;
    socklen_t len = sizeof(addr);
    if (getpeername(fd_, reinterpret_cast<struct sockaddr*>(&addr), &len) < 0) {
        return "unknown";
    }
    return format_address(addr);
}

void Connection::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    buf_.clear();
    pos_ = 0;
}

// ============================================================
// Socket setup helpers
// ============================================================

std::string format_address(const struct sockaddr_storage& addr) {
    char addr_str[INET6_ADDRSTRLEN] = {0};
    if (addr.ss_family == AF_INET) {
        inet_ntop(AF_INET, &reinterpret_cast<const struct sockaddr_in*>(&addr)->sin_addr,
                  addr_str, sizeof(addr_str));
        return addr_str;
    }
    if (addr.ss_family == AF_INET6) {
        const auto* a6 = reinterpret_cast<const struct sockaddr_in6*>(&addr);
        inet_ntop(AF_INET6, &a6->sin6_addr, addr_str, sizeof(addr_str));
        std::string s = addr_str;
        // Show v4-mapped peers as plain IPv4
        if (s.compare(0, 7, "::ffff:") == 0 && s.find('.') != std::string::npos) {
            return s.substr(7);
        }
        return s;
    }
    return "unknown";
}

int create_listen_socket(uint16_t port, int backlog) {
    int opt = 1;
    int sockfd = socket(AF_INET6, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (sockfd >= 0) {
        setsockopt(sockfd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        // Allow both IPv4 and IPv6
        int no = 0;
        setsockopt(sockfd, IPPROTO_IPV6, IPV6_V6ONLY, &no, sizeof(no));

        struct sockaddr_in6 addr = {};
        addr.sin6_family = AF_INET6;
        addr.sin6_port = htons(port);
        addr.sin6_addr = in6addr_any;

        if (bind(sockfd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
            close(sockfd);
            sockfd = -1;
        }
    }

    if (sockfd < 0) {
        // Try IPv4 only
        sockfd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (sockfd < 0) return -1;

        setsockopt(sockfd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        struct sockaddr_in addr4 = {};
        addr4.sin_family = AF_INET;
        addr4.sin_port = htons(port);
        addr4.sin_addr.s_addr = INADDR_ANY;

        if (bind(sockfd, reinterpret_cast<struct sockaddr*>(&addr4), sizeof(addr4)) < 0) {
            int saved = errno;
            close(sockfd);
            errno = saved;
            return -1;
        }
    }

    if (listen(sockfd, backlog) < 0) {
        int saved = errno;
        close(sockfd);
        errno = saved;
        return -1;
    }

    return sockfd;
}

uint16_t local_port(int sockfd) {
    struct sockaddr_storage addr;
    socklen_t len = sizeof(addr);
    if (getsockname(sockfd, reinterpret_cast<struct sockaddr*>(&addr), &len) < 0) return 0;
    if (addr.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<struct sockaddr_in6*>(&addr)->sin6_port);
    }
    if (addr.ss_family == AF_INET) {
        return ntohs(reinterpret_cast<struct sockaddr_in*>(&addr)->sin_port);
    }
    return 0;
}

// Non-blocking connect bounded by poll(), then back to blocking mode
static bool connect_with_timeout(int sockfd, const struct sockaddr* addr, socklen_t addrlen,
                                 int timeout_ms, int& err) {
    int flags = fcntl(sockfd, F_GETFL, 0);
    if (flags < 0 || fcntl(sockfd, F_SETFL, flags | O_NONBLOCK) < 0) {
        err = errno;
        return false;
    }

    int rc = connect(sockfd, addr, addrlen);
    if (rc < 0 && errno != EINPROGRESS) {
        err = errno;
        return false;
    }

    if (rc < 0) {
        struct pollfd pfd = {sockfd, POLLOUT, 0};
        int ready;
        do {
            ready = poll(&pfd, 1, timeout_ms);
        } while (ready < 0 && errno == EINTR);

        if (ready == 0) {
            err = ETIMEDOUT;
            return false;
        }
        if (ready < 0) {
            err = errno;
            return false;
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (getsockopt(sockfd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
            err = errno;
            return false;
        }
        if (so_error != 0) {
            err = so_error;
            return false;
        }
    }

    if (fcntl(sockfd, F_SETFL, flags) < 0) {
        err = errno;
        return false;
    }
    return true;
}

int connect_to_host(const std::string& host, uint16_t port, int timeout_ms,
                    std::string& error) {
    struct addrinfo hints = {}, *result;
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    std::string port_str = std::to_string(port);
    int gai = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &result);
    if (gai != 0) {
        error = fmt::format("cannot resolve {}: {}", host, gai_strerror(gai));
        return -1;
    }

    int sockfd = -1;
    int last_err = 0;
    for (struct addrinfo* rp = result; rp != nullptr; rp = rp->ai_next) {
        sockfd = socket(rp->ai_family, rp->ai_socktype | SOCK_CLOEXEC, rp->ai_protocol);
        if (sockfd < 0) {
            last_err = errno;
            continue;
        }

        if (connect_with_timeout(sockfd, rp->ai_addr, rp->ai_addrlen, timeout_ms, last_err)) {
            break;  // Success
        }
        close(sockfd);
        sockfd = -1;
    }

    freeaddrinfo(result);
    if (sockfd < 0) {
        error = fmt::format("cannot connect to {}:{}: {}", host, port,
                            strerror(last_err ? last_err : ECONNREFUSED));
    }
    return sockfd;
}
