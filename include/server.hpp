#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "auth.hpp"
#include "common.hpp"
#include "discovery.hpp"
#include "handler.hpp"
#include "net.hpp"
#include "protocol.hpp"

// ============================================================
// Configuration
// ============================================================
struct ServerConfig {
    std::string identity;                          // Operator-assigned identity
    std::string share_root;
    uint16_t port = protocol::DEFAULT_PORT;        // 0 = ephemeral (tests)
    int num_workers = 10;                          // Max concurrent handlers
    int idle_timeout_ms = protocol::IDLE_TIMEOUT_MS;
    size_t chunk_size = protocol::CHUNK_SIZE;
    bool create_share = false;                     // mkdir -p a missing share root
    bool discovery = false;                        // Answer UDP discovery probes
    uint16_t discovery_port = protocol::DISCOVERY_PORT;
    bool verbose = false;
};

// ============================================================
// Server - listener plus bounded worker pool
// ============================================================
// Accepted connections go onto a FIFO queue; `num_workers` threads pop
// them and run one ConnectionHandler each. A full pool delays service,
// it never refuses a connection.
class Server {
public:
    Server(ServerConfig cfg, const auth::CredentialStore& credentials);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Validates the share root and identity, binds, starts workers.
    // Throws ConfigError or std::system_error; nothing is accepted on failure.
    void start();

    // Accept loop. Blocks until stop(), then drains and joins workers.
    void run();

    // Safe from any thread. In-flight handlers finish on their own;
    // queued connections not yet picked up are closed unserved.
    void stop();

    uint16_t port() const { return port_; }
    const ServerConfig& config() const { return cfg_; }
    const ServerStats& stats() const { return stats_; }
    uint64_t active_connections() const { return stats_.active_connections.load(); }
    bool is_running() const { return running_.load(); }

    // Bound UDP port of the discovery responder, 0 when disabled
    uint16_t discovery_port() const { return discovery_ ? discovery_->udp_port() : 0; }

private:
    void worker_loop(int worker_id);
    void accept_one();
    void join_workers();
    void print_banner(size_t file_count) const;

    ServerConfig cfg_;
    const auth::CredentialStore& credentials_;
    SessionContext session_ctx_;
    ServerStats stats_;

    std::atomic<int> listen_fd_{-1};   // Written by start() and ~Server only
    uint16_t port_ = 0;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};

    WorkQueue<Connection> queue_;
    std::vector<std::thread> workers_;
    std::unique_ptr<DiscoveryResponder> discovery_;
};
