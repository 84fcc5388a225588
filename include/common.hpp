#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <queue>
#include <stdexcept>

// ============================================================
// Error Taxonomy
// ============================================================
enum class ErrorKind {
    NONE,
    AUTHENTICATION_REJECTED,  // Bad identity or proof
    PROTOCOL_VIOLATION,       // Out-of-sequence or malformed token
    IO_FAILURE,               // Socket or disk error
    IDLE_TIMEOUT,             // Peer silent past the idle bound
    CONFIGURATION_FAULT       // ShareRoot missing/unreadable at startup
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:                    return "none";
        case ErrorKind::AUTHENTICATION_REJECTED: return "authentication rejected";
        case ErrorKind::PROTOCOL_VIOLATION:      return "protocol violation";
        case ErrorKind::IO_FAILURE:              return "I/O failure";
        case ErrorKind::IDLE_TIMEOUT:            return "idle timeout";
        case ErrorKind::CONFIGURATION_FAULT:     return "configuration fault";
    }
    return "unknown";
}

// Thrown at startup only; fatal to the server process
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// ============================================================
// Handler State Machine
// ============================================================
enum class HandlerState {
    CONNECTED,        // Socket accepted, nothing read yet
    AUTHENTICATING,   // Reading identity + proof
    AUTHENTICATED,    // AUTH_SUCCESS sent
    ENUMERATING,      // Listing the share root
    TRANSFERRING,     // Inside the per-file loop
    COMPLETE,         // TRANSFER_COMPLETE (or NO_FILES) sent
    FAILED            // Auth rejected or connection lost
};

// ============================================================
// File Descriptor - one shared file as announced on the wire
// ============================================================
struct FileDescriptor {
    std::string name;     // Bare file name, never a path
    uint64_t size = 0;    // Bytes at enumeration time
};

// ============================================================
// Statistics - atomic counters shared by all handlers
// ============================================================
struct ServerStats {
    std::atomic<uint64_t> active_connections{0};
    std::atomic<uint64_t> total_connections{0};
    std::atomic<uint64_t> sessions_authenticated{0};
    std::atomic<uint64_t> auth_failures{0};
    std::atomic<uint64_t> files_sent{0};
    std::atomic<uint64_t> files_failed{0};
    std::atomic<uint64_t> bytes_sent{0};
};

// ============================================================
// Thread-Safe Work Queue
// ============================================================
template<typename T>
class WorkQueue {
public:
    WorkQueue() = default;

    // Non-copyable
    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    // Push an item to the queue
    void push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.push(std::move(item));
        }
        cv_.notify_one();
    }

    // Try to pop an item (non-blocking)
    bool try_pop(T& item) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) return false;
        item = std::move(queue_.front());
        queue_.pop();
        return true;
    }

    // Pop with wait (blocking). Returns false once done and drained.
    bool wait_pop(T& item) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !queue_.empty() || done_; });
        if (queue_.empty()) return false;
        item = std::move(queue_.front());
        queue_.pop();
        return true;
    }

    // Signal that no more items will be added
    void set_done() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            done_ = true;
        }
        cv_.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<T> queue_;
    bool done_ = false;
};
