#pragma once
#include <cstdint>
#include <cstdlib>
#include <cerrno>
#include <optional>
#include <string>

// Line-oriented wire protocol for lanshare
// Control messages are newline-terminated ASCII tokens.
// File payloads are raw bytes, length taken from the preceding FILE_INFO.
//
//   C -> S  identity
//   C -> S  proof
//   S -> C  AUTH_SUCCESS | AUTH_FAILED
//   S -> C  FILE_COUNT:<n> | NO_FILES | ERROR:<msg>
//   for each file:
//     S -> C  FILE_INFO:<name>:<size>
//     C -> S  READY
//     S -> C  <size raw bytes>
//     C -> S  FILE_RECEIVED | FILE_ERROR
//   S -> C  TRANSFER_COMPLETE

namespace protocol {

// ============================================================
// Constants
// ============================================================
constexpr uint16_t DEFAULT_PORT = 5050;
constexpr uint16_t DISCOVERY_PORT = 8888;
constexpr size_t CHUNK_SIZE = 8192;
constexpr int IDLE_TIMEOUT_MS = 60000;
constexpr int CONNECT_TIMEOUT_MS = 5000;
constexpr size_t MAX_LINE_LEN = 4096;

// Tokens
constexpr const char* AUTH_SUCCESS = "AUTH_SUCCESS";
constexpr const char* AUTH_FAILED = "AUTH_FAILED";
constexpr const char* FILE_COUNT_PREFIX = "FILE_COUNT:";
constexpr const char* NO_FILES = "NO_FILES";
constexpr const char* FILE_INFO_PREFIX = "FILE_INFO:";
constexpr const char* READY = "READY";
constexpr const char* FILE_RECEIVED = "FILE_RECEIVED";
constexpr const char* FILE_ERROR = "FILE_ERROR";
constexpr const char* TRANSFER_COMPLETE = "TRANSFER_COMPLETE";
constexpr const char* ERROR_PREFIX = "ERROR:";
constexpr char DELIMITER = ':';

// Discovery datagrams
constexpr const char* DISCOVER_REQUEST = "DISCOVER_LAN_FILE_SERVER_REQ";
constexpr const char* DISCOVER_RESPONSE_PREFIX = "DISCOVER_LAN_FILE_SERVER_RES:";

inline bool starts_with(const std::string& s, const char* prefix) {
    return s.compare(0, std::char_traits<char>::length(prefix), prefix) == 0;
}

// Strict decimal parse, no sign, no whitespace
inline std::optional<uint64_t> parse_u64(const std::string& s) {
    if (s.empty() || s.size() > 20) return std::nullopt;
    for (char c : s) {
        if (c < '0' || c > '9') return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long v = std::strtoull(s.c_str(), &end, 10);
    if (errno == ERANGE || end != s.c_str() + s.size()) return std::nullopt;
    return static_cast<uint64_t>(v);
}

// ============================================================
// Name Validation (Security)
// ============================================================

inline bool is_safe_name(const std::string& name) {
    if (name.empty()) return false;
    if (name == "." || name == "..") return false;
    if (name.find('/') != std::string::npos) return false;   // No paths
    if (name.find('\\') != std::string::npos) return false;
    if (name.find('\0') != std::string::npos) return false;
    if (name.find('\n') != std::string::npos) return false;  // Would break framing
    return true;
}

// ============================================================
// Message Builders
// ============================================================

inline std::string make_file_count(uint64_t n) {
    return FILE_COUNT_PREFIX + std::to_string(n);
}

inline std::string make_file_info(const std::string& name, uint64_t size) {
    return FILE_INFO_PREFIX + name + DELIMITER + std::to_string(size);
}

inline std::string make_error(const std::string& message) {
    return ERROR_PREFIX + message;
}

inline std::string make_discover_response(const std::string& identity, uint16_t port) {
    return DISCOVER_RESPONSE_PREFIX + identity + DELIMITER + std::to_string(port);
}

// ============================================================
// Message Parsers
// ============================================================

inline std::optional<uint64_t> parse_file_count(const std::string& line) {
    if (!starts_with(line, FILE_COUNT_PREFIX)) return std::nullopt;
    return parse_u64(line.substr(std::char_traits<char>::length(FILE_COUNT_PREFIX)));
}

struct FileInfoMsg {
    std::string name;
    uint64_t size;
};

// Splits at the last ':' so names may contain colons
inline std::optional<FileInfoMsg> parse_file_info(const std::string& line) {
    if (!starts_with(line, FILE_INFO_PREFIX)) return std::nullopt;
    std::string payload = line.substr(std::char_traits<char>::length(FILE_INFO_PREFIX));
    size_t pos = payload.rfind(DELIMITER);
    if (pos == std::string::npos || pos == 0) return std::nullopt;

    auto size = parse_u64(payload.substr(pos + 1));
    if (!size) return std::nullopt;
    return FileInfoMsg{payload.substr(0, pos), *size};
}

inline std::optional<std::string> parse_error(const std::string& line) {
    if (!starts_with(line, ERROR_PREFIX)) return std::nullopt;
    return line.substr(std::char_traits<char>::length(ERROR_PREFIX));
}

struct DiscoverResponse {
    std::string identity;
    uint16_t port;
};

inline std::optional<DiscoverResponse> parse_discover_response(const std::string& msg) {
    if (!starts_with(msg, DISCOVER_RESPONSE_PREFIX)) return std::nullopt;
    std::string payload = msg.substr(std::char_traits<char>::length(DISCOVER_RESPONSE_PREFIX));
    size_t pos = payload.rfind(DELIMITER);
    if (pos == std::string::npos || pos == 0) return std::nullopt;

    auto port = parse_u64(payload.substr(pos + 1));
    if (!port || *port == 0 || *port > 65535) return std::nullopt;
    return DiscoverResponse{payload.substr(0, pos), static_cast<uint16_t>(*port)};
}

}  // namespace protocol
