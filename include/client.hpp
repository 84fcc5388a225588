#pragma once
#include <cstdint>
#include <functional>
#include <future>
#include <string>
#include <vector>
#include "auth.hpp"
#include "common.hpp"
#include "net.hpp"
#include "protocol.hpp"
#include "ring.hpp"

// ============================================================
// Configuration
// ============================================================
struct ClientConfig {
    std::string identity;
    std::string secret;                              // Plain; hashed before sending
    std::string sink_dir;                            // Flat, created on demand
    std::string address;                             // Skips directory lookup if set
    uint16_t port = protocol::DEFAULT_PORT;
    int connect_timeout_ms = protocol::CONNECT_TIMEOUT_MS;
    int idle_timeout_ms = protocol::IDLE_TIMEOUT_MS;
    size_t chunk_size = protocol::CHUNK_SIZE;
    bool verbose = false;
};

// ============================================================
// Session outcome
// ============================================================
enum class SessionStatus {
    SUCCESS,           // Every announced file received
    PARTIAL_FAILURE,   // Transfer phase reached, at least one file missing
    NO_FILES,          // Server shares nothing
    AUTH_REJECTED,     // AUTH_FAILED (or no answer) from the server
    FAILED             // Lookup, connect, or protocol failure before transfer
};

const char* session_status_name(SessionStatus status);

struct SessionReport {
    SessionStatus status = SessionStatus::FAILED;
    ErrorKind error_kind = ErrorKind::NONE;
    size_t files_announced = 0;
    size_t files_received = 0;
    uint64_t bytes_received = 0;
    std::vector<std::string> received;   // Sink file names, in arrival order
    std::string error;

    // "received/announced", e.g. "2/2"
    std::string summary() const;
};

struct TransferProgress {
    size_t file_index;        // 1-based
    size_t file_count;
    std::string file_name;
    uint64_t file_received;
    uint64_t file_size;
    int overall_percent;
};

// ============================================================
// Client Session - requesting side of the protocol
// ============================================================
// A straight-line walk through the protocol: lookup, connect,
// authenticate, receive each file, acknowledge. Nothing overlaps on the
// connection. A file that fails is removed from the sink before the
// report is returned.
class ClientSession {
public:
    using ProgressCallback = std::function<void(const TransferProgress&)>;

    ClientSession(ClientConfig cfg, const auth::IdentityDirectory& directory);

    ClientSession(const ClientSession&) = delete;
    ClientSession& operator=(const ClientSession&) = delete;

    // Called on the session's thread for every chunk
    void on_progress(ProgressCallback cb) { progress_ = std::move(cb); }

    // Blocking run on the caller's thread
    SessionReport run();

    // Runs on a separate thread. The session must outlive the future.
    std::future<SessionReport> start();

private:
    enum class FileOutcome {
        RECEIVED,        // All bytes on disk, FILE_RECEIVED sent
        REJECTED,        // FILE_ERROR sent, stream still in sync
        STREAM_BROKEN    // Connection unusable afterwards
    };

    bool read_announcement(Connection& conn, SessionReport& report, uint64_t& count);
    FileOutcome receive_file(Connection& conn, const protocol::FileInfoMsg& info,
                             size_t index, size_t count, RingManager* ring,
                             SessionReport& report);
    void report_progress(size_t index, size_t count, const std::string& name,
                         uint64_t received, uint64_t size);

    ClientConfig cfg_;
    const auth::IdentityDirectory& directory_;
    ProgressCallback progress_;
    std::vector<char> buffer_;
};
