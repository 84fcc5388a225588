// Client side of the transfer protocol

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>

#include <fmt/core.h>
#include "client.hpp"
#include "disk_io.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

const char* session_status_name(SessionStatus status) {
    switch (status) {
        case SessionStatus::SUCCESS:         return "success";
        case SessionStatus::PARTIAL_FAILURE: return "partial failure";
        case SessionStatus::NO_FILES:        return "no files";
        case SessionStatus::AUTH_REJECTED:   return "authentication rejected";
        case SessionStatus::FAILED:          return "failed";
    }
    return "unknown";
}

std::string SessionReport::summary() const {
    return fmt::format("{}/{}", files_received, files_announced);
}

ClientSession::ClientSession(ClientConfig cfg, const auth::IdentityDirectory& directory)
    : cfg_(std::move(cfg)), directory_(directory) {
    buffer_.resize(cfg_.chunk_size > 0 ? cfg_.chunk_size : protocol::CHUNK_SIZE);
}

std::future<SessionReport> ClientSession::start() {
    return std::async(std::launch::async, [this] { return run(); });
}

void ClientSession::report_progress(size_t index, size_t count, const std::string& name,
                                    uint64_t received, uint64_t size) {
    if (!progress_) return;
    int file_pct = size > 0 ? static_cast<int>((received * 100) / size) : 100;
    int overall = count > 0
        ? static_cast<int>(((index - 1) * 100 + file_pct) / count)
        : 100;
    progress_(TransferProgress{index, count, name, received, size, overall});
}

// ============================================================
// Session
// ============================================================

SessionReport ClientSession::run() {
    SessionReport report;

    // Resolve identity -> host
    std::string host = cfg_.address;
    if (host.empty()) {
        auto addr = directory_.address_for(cfg_.identity);
        if (!addr) {
            report.error = fmt::format("Unknown identity '{}'", cfg_.identity);
            return report;
        }
        host = *addr;
    }

    if (cfg_.verbose) fmt::print("Connecting to {}:{}...\n", host, cfg_.port);
    std::string err;
    int fd = connect_to_host(host, cfg_.port, cfg_.connect_timeout_ms, err);
    if (fd < 0) {
        report.error_kind = ErrorKind::IO_FAILURE;
        report.error = err;
        return report;
    }
    Connection conn(fd);
    if (cfg_.idle_timeout_ms > 0) conn.set_timeouts(cfg_.idle_timeout_ms);

    // ========================================================
    // Authenticate
    // ========================================================
    if (!conn.send_line(cfg_.identity) ||
        !conn.send_line(auth::hash_secret(cfg_.secret))) {
        report.error_kind = ErrorKind::IO_FAILURE;
        report.error = "Failed to send credentials";
        return report;
    }

    std::string line;
    IoResult r = conn.read_line(line);
    if (r != IoResult::OK) {
        report.error_kind = to_error_kind(r);
        report.error = fmt::format("No authentication result from server ({})",
                                   error_kind_name(report.error_kind));
        return report;
    }
    if (line == protocol::AUTH_FAILED) {
        report.status = SessionStatus::AUTH_REJECTED;
        report.error_kind = ErrorKind::AUTHENTICATION_REJECTED;
        report.error = "Authentication failed";
        return report;
    }
    if (line != protocol::AUTH_SUCCESS) {
        report.error_kind = ErrorKind::PROTOCOL_VIOLATION;
        report.error = fmt::format("Unexpected authentication reply: {}", line);
        return report;
    }
    if (cfg_.verbose) fmt::print("Authenticated.\n");

    // ========================================================
    // File announcement
    // ========================================================
    uint64_t count = 0;
    if (!read_announcement(conn, report, count)) {
        return report;
    }
    if (report.status == SessionStatus::NO_FILES) {
        // Server closes after NO_FILES; a trailing marker is tolerated
        if (conn.read_line(line) == IoResult::OK && line != protocol::TRANSFER_COMPLETE) {
            fmt::print(stderr, "Unexpected message after {}: {}\n", protocol::NO_FILES, line);
        }
        return report;
    }
    report.files_announced = static_cast<size_t>(count);

    std::error_code ec;
    fs::create_directories(cfg_.sink_dir, ec);
    if (ec) {
        report.status = SessionStatus::FAILED;
        report.error_kind = ErrorKind::IO_FAILURE;
        report.error = fmt::format("Cannot create sink directory '{}': {}",
                                   cfg_.sink_dir, ec.message());
        return report;
    }

    // Sink writes go through the ring; sockets stay synchronous
    auto ring = DiskFile::make_ring();

    // ========================================================
    // Per-file loop
    // ========================================================
    bool in_sync = true;
    for (size_t i = 1; i <= count; i++) {
        r = conn.read_line(line);
        if (r != IoResult::OK) {
            report.error_kind = to_error_kind(r);
            report.error = fmt::format("Connection lost waiting for file {} of {}", i, count);
            in_sync = false;
            break;
        }

        // The server ran out of files it could open; the marker is already read
        if (line == protocol::TRANSFER_COMPLETE) {
            report.error_kind = ErrorKind::IO_FAILURE;
            report.error = fmt::format("Server ended the transfer after {} of {} files",
                                       i - 1, count);
            in_sync = false;
            break;
        }

        auto info = protocol::parse_file_info(line);
        if (!info) {
            report.error_kind = ErrorKind::PROTOCOL_VIOLATION;
            report.error = fmt::format("Malformed file announcement: {}", line);
            in_sync = false;
            break;
        }

        FileOutcome outcome = receive_file(conn, *info, i, count, ring.get(), report);
        if (outcome == FileOutcome::RECEIVED) continue;
        in_sync = (outcome == FileOutcome::REJECTED);
        break;
    }

    // Consume the closing marker
    if (in_sync) {
        r = conn.read_line(line);
        if (r != IoResult::OK || line != protocol::TRANSFER_COMPLETE) {
            fmt::print(stderr, "Missing {} (got: {})\n", protocol::TRANSFER_COMPLETE,
                       r == IoResult::OK ? line : error_kind_name(to_error_kind(r)));
        }
    }

    if (report.files_received == report.files_announced) {
        report.status = SessionStatus::SUCCESS;
        report.error_kind = ErrorKind::NONE;
        report.error.clear();
    } else {
        report.status = SessionStatus::PARTIAL_FAILURE;
        if (report.error.empty()) report.error = "Transfer stopped early";
    }
    return report;
}

bool ClientSession::read_announcement(Connection& conn, SessionReport& report, uint64_t& count) {
    std::string line;
    IoResult r = conn.read_line(line);
    if (r != IoResult::OK) {
        report.error_kind = to_error_kind(r);
        report.error = "No file announcement from server";
        return false;
    }

    if (line == protocol::NO_FILES) {
        report.status = SessionStatus::NO_FILES;
        return true;
    }
    if (auto msg = protocol::parse_error(line)) {
        report.error_kind = ErrorKind::IO_FAILURE;
        report.error = fmt::format("Server error: {}", *msg);
        return false;
    }
    auto n = protocol::parse_file_count(line);
    if (!n) {
        report.error_kind = ErrorKind::PROTOCOL_VIOLATION;
        report.error = fmt::format("Unexpected server response: {}", line);
        return false;
    }
    count = *n;
    return true;
}

ClientSession::FileOutcome ClientSession::receive_file(Connection& conn,
                                                       const protocol::FileInfoMsg& info,
                                                       size_t index, size_t count,
                                                       RingManager* ring,
                                                       SessionReport& report) {
    if (!protocol::is_safe_name(info.name)) {
        report.error_kind = ErrorKind::PROTOCOL_VIOLATION;
        report.error = fmt::format("Refusing unsafe file name '{}'", info.name);
        return conn.send_line(protocol::FILE_ERROR) ? FileOutcome::REJECTED
                                                    : FileOutcome::STREAM_BROKEN;
    }

    std::string path = (fs::path(cfg_.sink_dir) / info.name).string();
    DiskFile sink(ring);
    int res = sink.open_write(path);
    if (res < 0) {
        report.error_kind = ErrorKind::IO_FAILURE;
        report.error = fmt::format("Cannot create {}: {}", path, strerror(-res));
        return conn.send_line(protocol::FILE_ERROR) ? FileOutcome::REJECTED
                                                    : FileOutcome::STREAM_BROKEN;
    }

    if (cfg_.verbose) {
        fmt::print("Downloading ({}/{}): {} ({})\n", index, count, info.name,
                   format_bytes(info.size));
    }
    if (!conn.send_line(protocol::READY)) {
        sink.close();
        std::error_code ec;
        fs::remove(path, ec);
        report.error_kind = ErrorKind::IO_FAILURE;
        report.error = "Failed to send READY";
        return FileOutcome::STREAM_BROKEN;
    }

    // Exactly info.size bytes follow. A disk error keeps draining the
    // socket so the stream stays framed.
    uint64_t received = 0;
    bool disk_ok = true;
    IoResult r = IoResult::OK;
    report_progress(index, count, info.name, 0, info.size);
    while (received < info.size) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(buffer_.size(), info.size - received));
        size_t n = 0;
        r = conn.read_some(buffer_.data(), want, n);
        if (r != IoResult::OK) break;

        if (disk_ok) {
            ssize_t w = sink.write_at(buffer_.data(), n, received);
            if (w < 0) {
                disk_ok = false;
                report.error_kind = ErrorKind::IO_FAILURE;
                report.error = fmt::format("Write to {} failed: {}", path,
                                           strerror(static_cast<int>(-w)));
            }
        }
        received += n;
        report.bytes_received += n;
        report_progress(index, count, info.name, received, info.size);
    }
    sink.close();

    if (received == info.size && disk_ok) {
        if (!conn.send_line(protocol::FILE_RECEIVED)) {
            report.error_kind = ErrorKind::IO_FAILURE;
            report.error = "Failed to acknowledge file";
            // File is complete on disk; keep it but stop
            report.files_received++;
            report.received.push_back(info.name);
            return FileOutcome::STREAM_BROKEN;
        }
        report.files_received++;
        report.received.push_back(info.name);
        return FileOutcome::RECEIVED;
    }

    // Never leave a partial file behind
    std::error_code ec;
    fs::remove(path, ec);

    bool sent_error = conn.send_line(protocol::FILE_ERROR);
    if (received < info.size) {
        report.error_kind = to_error_kind(r);
        report.error = fmt::format("Received {} of {} bytes for {}", received, info.size, info.name);
        return FileOutcome::STREAM_BROKEN;
    }
    return sent_error ? FileOutcome::REJECTED : FileOutcome::STREAM_BROKEN;
}
