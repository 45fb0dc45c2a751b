#pragma once
/// @file UniqueFd.hpp
/// @brief RAII owner of a POSIX file descriptor (internal implementation)

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

#include <string>
#include <system_error>

namespace FileReg {
namespace detail {

/// @brief Owns one file descriptor and closes it on destruction
///
/// Destruction ignores close() failures. Writers that must know whether their data
/// reached the file call close(ec) explicitly before letting the object go.
///
/// @note This class is for internal library use.
class UniqueFd {
  public:
    UniqueFd() noexcept = default;
    explicit UniqueFd(int fd) noexcept : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}

    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other)
            reset(other.release());
        return *this;
    }

    /// @brief open(2) with O_CLOEXEC added
    /// @return Owning object; invalid with ec set on failure
    static UniqueFd open(const std::string& path, int flags, mode_t mode, std::error_code& ec) {
        ec.clear();
#ifdef O_CLOEXEC
        flags |= O_CLOEXEC;
#endif
        int fd = ::open(path.c_str(), flags, mode);
        if (fd < 0)
            ec = std::error_code(errno, std::generic_category());
        return UniqueFd(fd);
    }

    int get() const noexcept { return fd_; }
    bool valid() const noexcept { return fd_ >= 0; }
    explicit operator bool() const noexcept { return valid(); }

    /// @brief Gives up ownership without closing
    int release() noexcept {
        int tmp = fd_;
        fd_ = -1;
        return tmp;
    }

    /// @brief Closes the current fd (errors ignored) and adopts newFd
    void reset(int newFd = -1) noexcept {
        if (fd_ >= 0)
            (void)::close(fd_);
        fd_ = newFd;
    }

    /// @brief Closes the fd and reports the result of close(2)
    /// @details The descriptor is released even when close() fails; it must not be retried.
    bool close(std::error_code& ec) noexcept {
        ec.clear();
        if (fd_ < 0)
            return true;
        int fd = release();
        if (::close(fd) < 0) {
            ec = std::error_code(errno, std::generic_category());
            return false;
        }
        return true;
    }

    /// @brief write(2) until every byte is written or an error occurs
    bool writeAll(const char* data, size_t size, std::error_code& ec) noexcept {
        ec.clear();
        while (size > 0) {
            ssize_t n = ::write(fd_, data, size);
            if (n < 0) {
                if (errno == EINTR)
                    continue;
                ec = std::error_code(errno, std::generic_category());
                return false;
            }
            data += n;
            size -= static_cast<size_t>(n);
        }
        return true;
    }

    /// @brief fsync(2)
    bool sync(std::error_code& ec) noexcept {
        ec.clear();
        if (::fsync(fd_) < 0) {
            ec = std::error_code(errno, std::generic_category());
            return false;
        }
        return true;
    }

  private:
    int fd_ = -1;
};

} // namespace detail
} // namespace FileReg
