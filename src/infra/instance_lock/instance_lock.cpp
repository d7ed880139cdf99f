#include "instance_lock.hpp"

#include <cerrno>
#include <cstring>
#include <utility>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace discpack::infra {

auto InstanceLock::acquire(const std::filesystem::path& lock_file) -> Result<InstanceLock>
{
    int fd = ::open(lock_file.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return std::unexpected(make_error(ErrorCode::PermissionDenied,
            fmt::format("Cannot open lock file {}: {}", lock_file.string(), std::strerror(errno))));
    }

    while (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        if (errno == EINTR) continue; // повтор, если прервано сигналом
        const int err = errno;
        ::close(fd);
        if (err == EWOULDBLOCK) {
            return std::unexpected(make_error(ErrorCode::AlreadyRunning,
                fmt::format("Another discpack is already using {}", lock_file.string())));
        }
        return std::unexpected(make_error(ErrorCode::PermissionDenied,
            fmt::format("Cannot lock {}: {}", lock_file.string(), std::strerror(err))));
    }

    spdlog::debug("Acquired lock {}", lock_file.string());
    return InstanceLock{fd};
}

InstanceLock::InstanceLock(int fd)
    : fd_(fd) {}

InstanceLock::InstanceLock(InstanceLock&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)) {}

InstanceLock& InstanceLock::operator=(InstanceLock&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) {
            ::flock(fd_, LOCK_UN);
            ::close(fd_);
        }
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

InstanceLock::~InstanceLock() {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }
}

auto lock_path_for(const std::filesystem::path& state_file) -> std::filesystem::path {
    auto lock = state_file;
    lock += ".lock";
    return lock;
}

} // namespace discpack::infra
