// Server-side protocol state machine, one instance per accepted connection

#include <algorithm>
#include <cstring>
#include <filesystem>

#include <fmt/core.h>
#include "disk_io.hpp"
#include "handler.hpp"
#include "share.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

ConnectionHandler::ConnectionHandler(Connection conn, const SessionContext& ctx,
                                     ServerStats& stats, RingManager* ring)
    : conn_(std::move(conn)), ctx_(ctx), stats_(stats), ring_(ring) {
    peer_ = conn_.peer_address();
    buffer_.resize(ctx_.chunk_size > 0 ? ctx_.chunk_size : protocol::CHUNK_SIZE);
}

template<typename... Args>
void ConnectionHandler::log(fmt::format_string<Args...> format, Args&&... args) {
    log_info("[{}] {}", peer_, fmt::format(format, std::forward<Args>(args)...));
}

void ConnectionHandler::fail(ErrorKind kind) {
    state_ = HandlerState::FAILED;
    if (error_ == ErrorKind::NONE) error_ = kind;
}

HandlerState ConnectionHandler::run() {
    if (ctx_.idle_timeout_ms > 0 && !conn_.set_timeouts(ctx_.idle_timeout_ms)) {
        log("Cannot set socket timeout: {}", strerror(errno));
    }
    log("Client connected");

    // ========================================================
    // Authenticate
    // ========================================================
    state_ = HandlerState::AUTHENTICATING;
    if (!authenticate()) {
        stats_.auth_failures++;
        fail(ErrorKind::AUTHENTICATION_REJECTED);
        if (!conn_.send_line(protocol::AUTH_FAILED)) {
            log("Could not deliver {}", protocol::AUTH_FAILED);
        }
        log("Authentication FAILED");
        conn_.close();
        return state_;
    }

    if (!conn_.send_line(protocol::AUTH_SUCCESS)) {
        fail(ErrorKind::IO_FAILURE);
        conn_.close();
        return state_;
    }
    state_ = HandlerState::AUTHENTICATED;
    stats_.sessions_authenticated++;
    log("Authentication PASSED");

    // ========================================================
    // Enumerate and send
    // ========================================================
    transfer_files();

    conn_.close();
    return state_;
}

bool ConnectionHandler::authenticate() {
    std::string identity, proof;

    IoResult r = conn_.read_line(identity);
    if (r != IoResult::OK) {
        log("No identity received ({})", error_kind_name(to_error_kind(r)));
        return false;
    }
    identity = auth::trim(identity);

    r = conn_.read_line(proof);
    if (r != IoResult::OK) {
        log("No proof received ({})", error_kind_name(to_error_kind(r)));
        return false;
    }
    proof = auth::trim(proof);

    log("Auth attempt, identity '{}'", identity);

    // Still run the credential check so a foreign identity costs the same
    bool verified = ctx_.credentials && ctx_.credentials->verify(identity, proof);
    if (identity != ctx_.identity) {
        log("Rejected: identity '{}' does not match this server ({})", identity, ctx_.identity);
        return false;
    }
    return verified;
}

void ConnectionHandler::transfer_files() {
    state_ = HandlerState::ENUMERATING;

    try {
        files_ = enumerate_share(ctx_.share_root);
    } catch (const fs::filesystem_error& e) {
        log("Share directory unavailable: {}", e.what());
        if (!conn_.send_line(protocol::make_error("Shared folder not available"))) {
            log("Could not deliver error message");
        }
        fail(ErrorKind::IO_FAILURE);
        return;
    }

    if (files_.empty()) {
        log("No files to send");
        if (!conn_.send_line(protocol::NO_FILES)) {
            fail(ErrorKind::IO_FAILURE);
            return;
        }
        state_ = HandlerState::COMPLETE;
        return;
    }

    if (!conn_.send_line(protocol::make_file_count(files_.size()))) {
        fail(ErrorKind::IO_FAILURE);
        return;
    }
    log("Preparing to send {} file(s)", files_.size());

    state_ = HandlerState::TRANSFERRING;
    for (const auto& fd : files_) {
        // Open first so the announced size is the one the descriptor will serve
        DiskFile file(ring_);
        uint64_t size = 0;
        if (!open_for_send(fd, file, size)) {
            stats_.files_failed++;
            break;
        }

        if (!conn_.send_line(protocol::make_file_info(fd.name, size))) {
            fail(ErrorKind::IO_FAILURE);
            break;
        }
        log("  -> {} ({})", fd.name, format_bytes(size));

        // Wait for READY
        std::string response;
        IoResult r = conn_.read_line(response);
        if (r != IoResult::OK) {
            log("No READY for {} ({}). Aborting transfers.", fd.name,
                error_kind_name(to_error_kind(r)));
            fail(to_error_kind(r));
            break;
        }
        if (response != protocol::READY) {
            log("Client not ready (received: {}). Aborting transfers.", response);
            break;
        }

        if (!stream_file(file, fd.name, size)) {
            // The receiver is still inside the payload slot, so neither an
            // outcome token nor the closing marker can follow.
            stats_.files_failed++;
            log("Closing without {}, {}/{} files sent", protocol::TRANSFER_COMPLETE,
                files_sent_, files_.size());
            return;
        }

        // Wait for FILE_RECEIVED / FILE_ERROR
        std::string confirm;
        r = conn_.read_line(confirm);
        if (r != IoResult::OK) {
            log("No confirmation for {} ({})", fd.name, error_kind_name(to_error_kind(r)));
            fail(to_error_kind(r));
            stats_.files_failed++;
            break;
        }
        if (confirm != protocol::FILE_RECEIVED) {
            log("Client did not confirm receipt of {} (response: {})", fd.name, confirm);
            stats_.files_failed++;
            break;
        }

        files_sent_++;
        stats_.files_sent++;
    }

    // Every ending that left the stream framed gets the closing marker
    if (!conn_.send_line(protocol::TRANSFER_COMPLETE)) {
        fail(ErrorKind::IO_FAILURE);
    } else if (state_ != HandlerState::FAILED) {
        state_ = HandlerState::COMPLETE;
    }
    log("Transfer session complete, {}/{} files sent", files_sent_, files_.size());
}

bool ConnectionHandler::open_for_send(const FileDescriptor& fd, DiskFile& file,
                                      uint64_t& size) {
    if (!protocol::is_safe_name(fd.name)) {
        log("  x Refusing to send '{}': not a plain file name", fd.name);
        fail(ErrorKind::PROTOCOL_VIOLATION);
        return false;
    }
    std::string path = (fs::path(ctx_.share_root) / fd.name).string();

    int res = file.open_read(path);
    if (res < 0) {
        log("  x Cannot open {}: {}", fd.name, strerror(-res));
        fail(ErrorKind::IO_FAILURE);
        return false;
    }
    int64_t current = file.size();
    if (current < 0) {
        log("  x Cannot stat {}: {}", fd.name, strerror(static_cast<int>(-current)));
        fail(ErrorKind::IO_FAILURE);
        return false;
    }
    if (static_cast<uint64_t>(current) != fd.size) {
        log("  {} changed size since listing ({} -> {})", fd.name, fd.size, current);
    }
    size = static_cast<uint64_t>(current);
    return true;
}

bool ConnectionHandler::stream_file(DiskFile& file, const std::string& name, uint64_t size) {
    // Never more than announced, even if the file grew since the stat
    uint64_t sent = 0;
    while (sent < size) {
        size_t chunk = static_cast<size_t>(std::min<uint64_t>(buffer_.size(), size - sent));
        ssize_t n = file.read_at(buffer_.data(), chunk, sent);
        if (n <= 0) {
            log("  x {} shrank or failed to read at {} of {} bytes{}", name, sent, size,
                n < 0 ? fmt::format(": {}", strerror(static_cast<int>(-n))) : "");
            fail(ErrorKind::IO_FAILURE);
            return false;
        }

        if (!conn_.send_all(buffer_.data(), static_cast<size_t>(n))) {
            log("  x Error sending {}: {}", name, strerror(errno));
            fail(ErrorKind::IO_FAILURE);
            return false;
        }
        sent += static_cast<uint64_t>(n);
        stats_.bytes_sent += static_cast<uint64_t>(n);

        if (ctx_.verbose && sent % (1024 * 1024) < static_cast<uint64_t>(n)) {
            log("    Sent {} / {}", format_bytes(sent), format_bytes(size));
        }
    }

    log("  Finished sending {}", name);
    return true;
}
