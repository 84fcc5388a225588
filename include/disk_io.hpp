#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <sys/types.h>
#include "ring.hpp"

// ============================================================
// DiskFile - one open file, I/O routed through io_uring
// ============================================================
// Socket I/O stays synchronous; disk reads and writes go through the
// ring. With no ring (kernel refused io_uring) pread/pwrite are used.
// All operations return bytes transferred or a negative errno.
class DiskFile {
public:
    explicit DiskFile(RingManager* ring = nullptr) : ring_(ring) {}
    ~DiskFile() { close(); }

    DiskFile(const DiskFile&) = delete;
    DiskFile& operator=(const DiskFile&) = delete;

    // Opens for reading, refusing a symlink (-ELOOP); returns 0 or -errno
    int open_read(const std::string& path);

    // Creates or truncates with mode 0644; returns 0 or -errno
    int open_write(const std::string& path);

    // One read; may return fewer than `len` bytes, 0 at EOF
    ssize_t read_at(char* buf, size_t len, uint64_t offset);

    // Writes all of `len` or fails
    ssize_t write_at(const char* buf, size_t len, uint64_t offset);

    // Current size from statx/fstat, negative errno on failure
    int64_t size();

    void close();
    bool is_open() const { return fd_ >= 0; }
    bool uses_ring() const { return ring_ != nullptr; }

    // A ring for one worker's disk I/O, or nullptr if io_uring is unavailable.
    // The first failure is logged once per process.
    static std::unique_ptr<RingManager> make_ring(unsigned int depth = 4);

private:
    int open_path(const std::string& path, int flags, mode_t mode);

    RingManager* ring_;
    int fd_ = -1;
};
