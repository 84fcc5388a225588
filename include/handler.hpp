#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <fmt/core.h>
#include "auth.hpp"
#include "common.hpp"
#include "disk_io.hpp"
#include "net.hpp"
#include "protocol.hpp"
#include "ring.hpp"

// ============================================================
// Session Context - what every handler of one server shares
// ============================================================
// Built once at startup and passed down; handlers only read it.
struct SessionContext {
    std::string identity;                        // The one identity this server serves
    std::string share_root;
    const auth::CredentialStore* credentials = nullptr;
    int idle_timeout_ms = protocol::IDLE_TIMEOUT_MS;
    size_t chunk_size = protocol::CHUNK_SIZE;
    bool verbose = false;
};

// ============================================================
// Connection Handler - server side of one session
// ============================================================
// CONNECTED -> AUTHENTICATING -> AUTHENTICATED -> ENUMERATING
//   -> TRANSFERRING -> COMPLETE, or FAILED from any state.
// run() never throws for peer or disk trouble; the outcome is left in
// state() and error(). TRANSFER_COMPLETE closes every session that sent
// FILE_COUNT, except when a file shrinks mid-payload: then the
// connection is closed with no marker.
class ConnectionHandler {
public:
    // `ring` may be null (pread fallback); it must outlive run()
    ConnectionHandler(Connection conn, const SessionContext& ctx,
                      ServerStats& stats, RingManager* ring = nullptr);

    ConnectionHandler(const ConnectionHandler&) = delete;
    ConnectionHandler& operator=(const ConnectionHandler&) = delete;

    HandlerState run();

    HandlerState state() const { return state_; }
    ErrorKind error() const { return error_; }
    size_t files_announced() const { return files_.size(); }
    size_t files_sent() const { return files_sent_; }
    const std::string& peer() const { return peer_; }

private:
    bool authenticate();
    void transfer_files();

    // Opens a listed file and reads its current size, before FILE_INFO
    bool open_for_send(const FileDescriptor& fd, DiskFile& file, uint64_t& size);

    // Streams one file after READY. True only if exactly `size` bytes
    // went out; false leaves the stream unframed.
    bool stream_file(DiskFile& file, const std::string& name, uint64_t size);

    void fail(ErrorKind kind);

    template<typename... Args>
    void log(fmt::format_string<Args...> format, Args&&... args);

    Connection conn_;
    const SessionContext& ctx_;
    ServerStats& stats_;
    RingManager* ring_;

    std::string peer_;
    HandlerState state_ = HandlerState::CONNECTED;
    ErrorKind error_ = ErrorKind::NONE;
    std::vector<FileDescriptor> files_;
    size_t files_sent_ = 0;
    std::vector<char> buffer_;
};
