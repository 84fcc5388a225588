#pragma once
#include <liburing.h>
#include <stdexcept>
#include <string>
#include <fcntl.h>
#include <sys/stat.h>

// Tag carried through a submission and handed back with its completion
struct IoRequest {
    int op = 0;
    int result = 0;
};

class RingManager {
public:
    RingManager(unsigned int depth) : depth_(depth) {
        if (io_uring_queue_init(depth, &ring, 0) < 0) {
            throw std::runtime_error("Failed to initialize io_uring");
        }
    }

    ~RingManager() {
        io_uring_queue_exit(&ring);
    }

    // Non-copyable
    RingManager(const RingManager&) = delete;
    RingManager& operator=(const RingManager&) = delete;

    // ============================================================
    // File Operations
    // ============================================================

    void prepare_openat(int dirfd, const char* path, int flags, mode_t mode,
                        IoRequest* req) {
        struct io_uring_sqe* sqe = get_sqe();
        io_uring_prep_openat(sqe, dirfd, path, flags, mode);
        io_uring_sqe_set_data(sqe, req);
    }

    void prepare_statx(int dirfd, const char* path, int flags, unsigned int mask,
                       struct statx* statxbuf, IoRequest* req) {
        struct io_uring_sqe* sqe = get_sqe();
        io_uring_prep_statx(sqe, dirfd, path, flags, mask, statxbuf);
        io_uring_sqe_set_data(sqe, req);
    }

    void prepare_close(int fd, IoRequest* req) {
        struct io_uring_sqe* sqe = get_sqe();
        io_uring_prep_close(sqe, fd);
        io_uring_sqe_set_data(sqe, req);
    }

    void prepare_read(int fd, char* buffer, unsigned len, uint64_t offset,
                      IoRequest* req) {
        struct io_uring_sqe* sqe = get_sqe();
        io_uring_prep_read(sqe, fd, buffer, len, offset);
        io_uring_sqe_set_data(sqe, req);
    }

    void prepare_write(int fd, const char* buffer, unsigned len, uint64_t offset,
                       IoRequest* req) {
        struct io_uring_sqe* sqe = get_sqe();
        io_uring_prep_write(sqe, fd, buffer, len, offset);
        io_uring_sqe_set_data(sqe, req);
    }

    // ============================================================
    // Submission and Completion
    // ============================================================

    int submit() {
        return io_uring_submit(&ring);
    }

    IoRequest* wait_one(int& res_out) {
        struct io_uring_cqe* cqe;
        int ret = io_uring_wait_cqe(&ring, &cqe);
        if (ret < 0) {
            res_out = ret;
            return nullptr;
        }

        IoRequest* req = static_cast<IoRequest*>(io_uring_cqe_get_data(cqe));
        res_out = cqe->res;
        if (req) req->result = cqe->res;
        io_uring_cqe_seen(&ring, cqe);
        return req;
    }

    // Submit whatever is queued and block for exactly one completion.
    // Returns the kernel result (negative errno on failure).
    int run_one(IoRequest* req) {
        int ret = submit();
        if (ret < 0) return ret;
        int res = 0;
        if (!wait_one(res) && res < 0) return res;
        return req ? req->result : res;
    }

    bool has_sqe_space() const {
        return io_uring_sq_space_left(&ring) > 0;
    }

    unsigned int depth() const { return depth_; }

private:
    struct io_uring ring;
    unsigned int depth_;

    struct io_uring_sqe* get_sqe() {
        struct io_uring_sqe* sqe = io_uring_get_sqe(&ring);
        if (!sqe) {
            io_uring_submit(&ring);
            sqe = io_uring_get_sqe(&ring);
            if (!sqe) {
                throw std::runtime_error("Submission Queue is full!");
            }
        }
        return sqe;
    }
};
