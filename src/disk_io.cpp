// Disk access for share files and sink files

#include <atomic>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>

#include <fmt/core.h>
#include "disk_io.hpp"

namespace {

enum DiskOp { OPEN = 1, STATX, READ, WRITE, CLOSE };

std::atomic<bool> g_ring_warned{false};

}  // namespace

std::unique_ptr<RingManager> DiskFile::make_ring(unsigned int depth) {
    try {
        return std::make_unique<RingManager>(depth);
    } catch (const std::runtime_error& e) {
        if (!g_ring_warned.exchange(true)) {
            fmt::print(stderr, "Warning: {}, falling back to pread/pwrite\n", e.what());
        }
        return nullptr;
    }
}

int DiskFile::open_path(const std::string& path, int flags, mode_t mode) {
    close();

    if (ring_) {
        IoRequest req{OPEN};
        ring_->prepare_openat(AT_FDCWD, path.c_str(), flags, mode, &req);
        int res = ring_->run_one(&req);
        if (res < 0) return res;
        fd_ = res;
        return 0;
    }

    int fd = ::open(path.c_str(), flags, mode);
    if (fd < 0) return -errno;
    fd_ = fd;
    return 0;
}

int DiskFile::open_read(const std::string& path) {
    return open_path(path, O_RDONLY | O_NOFOLLOW | O_CLOEXEC, 0);
}

int DiskFile::open_write(const std::string& path) {
    return open_path(path, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
}

ssize_t DiskFile::read_at(char* buf, size_t len, uint64_t offset) {
    if (fd_ < 0) return -EBADF;

    if (ring_) {
        IoRequest req{READ};
        ring_->prepare_read(fd_, buf, static_cast<unsigned>(len), offset, &req);
        return ring_->run_one(&req);
    }

    ssize_t n;
    do {
        n = ::pread(fd_, buf, len, static_cast<off_t>(offset));
    } while (n < 0 && errno == EINTR);
    return n < 0 ? -errno : n;
}

ssize_t DiskFile::write_at(const char* buf, size_t len, uint64_t offset) {
    if (fd_ < 0) return -EBADF;

    size_t written = 0;
    while (written < len) {
        ssize_t n;
        if (ring_) {
            IoRequest req{WRITE};
            ring_->prepare_write(fd_, buf + written, static_cast<unsigned>(len - written),
                                 offset + written, &req);
            n = ring_->run_one(&req);
        } else {
            n = ::pwrite(fd_, buf + written, len - written,
                         static_cast<off_t>(offset + written));
            if (n < 0) {
                if (errno == EINTR) continue;
                n = -errno;
            }
        }
        if (n < 0) return n;
        if (n == 0) return -EIO;
        written += n;
    }
    return static_cast<ssize_t>(written);
}

int64_t DiskFile::size() {
    if (fd_ < 0) return -EBADF;

    if (ring_) {
        struct statx stx;
        IoRequest req{STATX};
        ring_->prepare_statx(fd_, "", AT_EMPTY_PATH, STATX_SIZE, &stx, &req);
        int res = ring_->run_one(&req);
        if (res < 0) return res;
        return static_cast<int64_t>(stx.stx_size);
    }

    struct stat st;
    if (fstat(fd_, &st) < 0) return -errno;
    return static_cast<int64_t>(st.st_size);
}

void DiskFile::close() {
    if (fd_ < 0) return;
    if (ring_) {
        IoRequest req{CLOSE};
        ring_->prepare_close(fd_, &req);
        if (ring_->run_one(&req) < 0) {
            ::close(fd_);
        }
    } else {
        ::close(fd_);
    }
    fd_ = -1;
}
