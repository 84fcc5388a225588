#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <sys/socket.h>
#include "common.hpp"

// ============================================================
// Read outcome for control lines and payload reads
// ============================================================
enum class IoResult {
    OK,
    CLOSED,     // Orderly EOF from peer
    TIMEOUT,    // SO_RCVTIMEO expired
    ERROR,      // Socket error
    TOO_LONG    // Control line over protocol::MAX_LINE_LEN
};

inline ErrorKind to_error_kind(IoResult r) {
    switch (r) {
        case IoResult::OK:       return ErrorKind::NONE;
        case IoResult::TIMEOUT:  return ErrorKind::IDLE_TIMEOUT;
        case IoResult::TOO_LONG: return ErrorKind::PROTOCOL_VIOLATION;
        default:                 return ErrorKind::IO_FAILURE;
    }
}

// ============================================================
// Connection - one connected TCP socket
// ============================================================
// Owns the fd. Control lines are read through an internal buffer; raw
// payload reads drain that buffer before touching the socket so bytes
// that arrived together with a line are not lost.
class Connection {
public:
    Connection() = default;
    explicit Connection(int fd) : fd_(fd) {}
    ~Connection() { close(); }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    Connection(Connection&& other) noexcept;
    Connection& operator=(Connection&& other) noexcept;

    // Bounds every blocking read and write. 0 disables the bound.
    bool set_timeouts(int timeout_ms);

    bool send_all(const void* buf, size_t len);
    bool send_line(const std::string& line);

    // Reads one '\n'-terminated line, stripping "\n" or "\r\n"
    IoResult read_line(std::string& out);

    // At most `len` bytes, buffered data first. Sets `n` to bytes read.
    IoResult read_some(char* buf, size_t len, size_t& n);

    std::string peer_address() const;

    void close();

    int fd() const { return fd_; }
    bool is_open() const { return fd_ >= 0; }

private:
    IoResult fill();  // One recv() into the line buffer

    int fd_ = -1;
    std::vector<char> buf_;
    size_t pos_ = 0;   // Consumed prefix of buf_
};

// ============================================================
// Socket setup helpers
// ============================================================

// Dual-stack listener (IPv6 with v4-mapped, IPv4 fallback).
// port 0 picks an ephemeral port. Returns fd or -1 with errno set.
int create_listen_socket(uint16_t port, int backlog = 16);

// Port a bound socket is listening on, 0 on error
uint16_t local_port(int sockfd);

// Resolves `host` and connects within `timeout_ms`.
// Returns fd or -1; `error` receives a description.
int connect_to_host(const std::string& host, uint16_t port, int timeout_ms,
                    std::string& error);

// Numeric address of a sockaddr_storage peer
std::string format_address(const struct sockaddr_storage& addr);
