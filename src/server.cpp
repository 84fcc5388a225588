// Listener and worker pool

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>

#include <fmt/core.h>
#include "disk_io.hpp"
#include "server.hpp"
#include "share.hpp"
#include "utils.hpp"

namespace {

// Decrements the active count however the handler ends
class ActiveConnectionGuard {
public:
    explicit ActiveConnectionGuard(ServerStats& stats) : stats_(stats) {}
    ~ActiveConnectionGuard() { stats_.active_connections--; }

    ActiveConnectionGuard(const ActiveConnectionGuard&) = delete;
    ActiveConnectionGuard& operator=(const ActiveConnectionGuard&) = delete;

private:
    ServerStats& stats_;
};

}  // namespace

Server::Server(ServerConfig cfg, const auth::CredentialStore& credentials)
    : cfg_(std::move(cfg)), credentials_(credentials) {
    if (cfg_.num_workers <= 0) cfg_.num_workers = 1;

    session_ctx_.identity = cfg_.identity;
    session_ctx_.share_root = cfg_.share_root;
    session_ctx_.credentials = &credentials_;
    session_ctx_.idle_timeout_ms = cfg_.idle_timeout_ms;
    session_ctx_.chunk_size = cfg_.chunk_size;
    session_ctx_.verbose = cfg_.verbose;
}

Server::~Server() {
    stop();
    join_workers();
    // Only closed here, so stop() never races a close or a reused fd
    int fd = listen_fd_.exchange(-1);
    if (fd >= 0) close(fd);
}

// ============================================================
// Lifecycle
// ============================================================

void Server::start() {
    // Fail fast, before anything is bound
    validate_share_root(cfg_.share_root, cfg_.create_share);

    if (cfg_.identity.empty()) {
        throw ConfigError("Server identity not set");
    }
    if (!credentials_.exists(cfg_.identity)) {
        throw ConfigError(fmt::format("Unknown identity '{}'", cfg_.identity));
    }

    size_t file_count = 0;
    try {
        file_count = enumerate_share(cfg_.share_root).size();
    } catch (const std::filesystem::filesystem_error& e) {
        throw ConfigError(fmt::format("Cannot list share directory: {}", e.what()));
    }

    int fd = create_listen_socket(cfg_.port);
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(),
                                fmt::format("Failed to listen on port {}", cfg_.port));
    }
    port_ = local_port(fd);
    listen_fd_ = fd;

    if (cfg_.discovery) {
        discovery_ = std::make_unique<DiscoveryResponder>(cfg_.identity, port_, cfg_.discovery_port);
        discovery_->start();
    }

    running_ = true;
    workers_.reserve(cfg_.num_workers);
    for (int i = 0; i < cfg_.num_workers; i++) {
        workers_.emplace_back(&Server::worker_loop, this, i);
    }

    print_banner(file_count);
}

void Server::run() {
    while (running_) {
        accept_one();
    }

    // Stop listening; the fd itself stays open until ~Server
    int fd = listen_fd_.load();
    if (fd >= 0) shutdown(fd, SHUT_RDWR);

    // No more connections will be queued. Drop the ones still waiting.
    queue_.set_done();
    Connection queued;
    while (queue_.try_pop(queued)) {
        ActiveConnectionGuard guard(stats_);
        log_info("Closing queued connection from {} unserved", queued.peer_address());
        queued.close();
    }
    join_workers();

    if (discovery_) discovery_->stop();
    log_info("Server stopped. Total connections served: {}", stats_.total_connections.load());
}

void Server::stop() {
    stopping_ = true;
    if (!running_.exchange(false)) return;

    log_info("Shutdown signal received...");
    // Wakes the thread blocked in accept()
    int fd = listen_fd_.load();
    if (fd >= 0) shutdown(fd, SHUT_RDWR);
}

void Server::join_workers() {
    queue_.set_done();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();
}

// ============================================================
// Accept
// ============================================================

void Server::accept_one() {
    struct sockaddr_storage client_addr;
    socklen_t addr_len = sizeof(client_addr);
    int client_fd = accept4(listen_fd_.load(), reinterpret_cast<struct sockaddr*>(&client_addr),
                            &addr_len, SOCK_CLOEXEC);
    if (client_fd < 0) {
        if (running_ && errno != EINTR) {
            log_error("ERROR accepting connection: {}", strerror(errno));
        }
        return;
    }

    uint64_t conn_num = ++stats_.total_connections;
    uint64_t active = ++stats_.active_connections;
    log_info("Connection #{} from {} (active clients: {})",
             conn_num, format_address(client_addr), active);

    queue_.push(Connection(client_fd));
}

// ============================================================
// Worker Thread
// ============================================================

void Server::worker_loop(int worker_id) {
    // Each worker has its own ring for disk reads
    auto ring = DiskFile::make_ring();

    Connection conn;
    while (queue_.wait_pop(conn)) {
        ActiveConnectionGuard guard(stats_);

        if (stopping_) {
            log_info("Closing queued connection from {} unserved", conn.peer_address());
            conn.close();
            continue;
        }

        try {
            ConnectionHandler handler(std::move(conn), session_ctx_, stats_, ring.get());
            handler.run();
            if (cfg_.verbose) {
                fmt::print("Worker {}: {} finished ({})\n", worker_id, handler.peer(),
                           error_kind_name(handler.error()));
            }
        } catch (const std::exception& e) {
            log_error("Handler error on worker {}: {}", worker_id, e.what());
        }
        conn.close();
    }

    if (cfg_.verbose) {
        fmt::print("Worker {} finished\n", worker_id);
    }
}

void Server::print_banner(size_t file_count) const {
    char host[256] = {0};
    if (gethostname(host, sizeof(host) - 1) != 0) {
        strncpy(host, "unknown", sizeof(host) - 1);
    }

    fmt::print("\n");
    fmt::print("LAN file share server started\n");
    fmt::print("  Identity   : {}\n", cfg_.identity);
    fmt::print("  Port       : {}\n", port_);
    fmt::print("  Hostname   : {}\n", host);
    fmt::print("  Shared Dir : {} ({} file(s))\n", cfg_.share_root, file_count);
    fmt::print("  Max Clients: {}\n", cfg_.num_workers);
    fmt::print("  Idle limit : {} ms\n", cfg_.idle_timeout_ms);
    if (discovery_) {
        fmt::print("  Discovery  : UDP {}\n", discovery_->udp_port());
    }
    fmt::print("Waiting for connections...\n\n");
    fflush(stdout);
}
