#pragma once

/**
 * @file FdGuard.h
 * @brief Owning wrapper for a pipe end, /dev/null handle or socket
 */

#include <unistd.h>

namespace ConsoleGate {

/**
 * @brief Closes its descriptor when it goes out of scope
 *
 * The executor holds every pipe end in one of these so that early returns
 * on launch failure never leak a descriptor into the next fork().
 *
 * @code
 * FdGuard devNull(::open("/dev/null", O_RDONLY | O_CLOEXEC));
 * if (!devNull) { ... }
 * ::dup2(devNull.get(), STDIN_FILENO);
 * @endcode
 */
class FdGuard {
public:
    FdGuard() noexcept = default;
    explicit FdGuard(int fd) noexcept : fd_(fd) {}

    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    FdGuard(FdGuard&& other) noexcept : fd_(other.fd_) {
        other.fd_ = -1;
    }

    FdGuard& operator=(FdGuard&& other) noexcept {
        if (this != &other) {
            reset(other.fd_);
            other.fd_ = -1;
        }
        return *this;
    }

    ~FdGuard() { reset(); }

    int get() const noexcept { return fd_; }
    bool valid() const noexcept { return fd_ >= 0; }
    explicit operator bool() const noexcept { return valid(); }

    // Close the held descriptor (if any) and own fd instead.
    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_{-1};
};

} // namespace ConsoleGate
