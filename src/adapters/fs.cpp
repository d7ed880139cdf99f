#include "fs.hpp"

#include <cerrno>
#include <cstring>
#include <system_error>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace discpack::adapters::fs {

namespace {

auto errno_message() -> std::string {
    return std::strerror(errno);
}

// fsync на каталоге, чтобы rename пережил перезагрузку
void sync_directory(const std::filesystem::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd == -1) {
        spdlog::debug("Cannot open {} for fsync: {}", dir.string(), errno_message());
        return;
    }
    if (::fsync(fd) == -1) {
        spdlog::debug("fsync of {} failed: {}", dir.string(), errno_message());
    }
    ::close(fd);
}

} // namespace

auto ensure_directory(const std::filesystem::path& dir)
    -> std::expected<void, infra::Error>
{
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied,
                             fmt::format("Cannot create directory {}: {}", dir.string(), ec.message())));
    }
    return {};
}

auto write_file_atomic(const std::filesystem::path& target,
                       std::string_view contents)
    -> std::expected<void, infra::Error>
{
    auto dir = target.parent_path();
    if (dir.empty()) {
        dir = ".";
    }
    const auto tmp = dir / fmt::format(".{}.tmp", target.filename().string());

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd == -1) {
        return std::unexpected(infra::make_error(infra::ErrorCode::StateIoError,
                             fmt::format("Cannot create {}: {}", tmp.string(), errno_message())));
    }

    const char* data = contents.data();
    std::size_t remaining = contents.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd, data, remaining);
        if (written == -1) {
            if (errno == EINTR) continue;
            auto msg = errno_message();
            ::close(fd);
            remove_quietly(tmp);
            return std::unexpected(infra::make_error(infra::ErrorCode::StateIoError,
                                 fmt::format("Write to {} failed: {}", tmp.string(), msg)));
        }
        data += written;
        remaining -= static_cast<std::size_t>(written);
    }

    if (::fsync(fd) == -1) {
        auto msg = errno_message();
        ::close(fd);
        remove_quietly(tmp);
        return std::unexpected(infra::make_error(infra::ErrorCode::StateIoError,
                             fmt::format("fsync of {} failed: {}", tmp.string(), msg)));
    }
    ::close(fd);

    if (::rename(tmp.c_str(), target.c_str()) == -1) {
        auto msg = errno_message();
        remove_quietly(tmp);
        return std::unexpected(infra::make_error(infra::ErrorCode::StateIoError,
                             fmt::format("Cannot replace {}: {}", target.string(), msg)));
    }

    sync_directory(dir);
    return {};
}

auto part_path_for(const std::filesystem::path& chunk_dir,
                   std::string_view item_id)
    -> std::filesystem::path
{
    return chunk_dir / fmt::format(".{}.part", item_id);
}

auto commit_part(const std::filesystem::path& part,
                 const std::filesystem::path& target)
    -> std::expected<void, infra::Error>
{
    std::error_code ec;
    std::filesystem::rename(part, target, ec);
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied,
                             fmt::format("Cannot move {} to {}: {}",
                                         part.string(), target.string(), ec.message())));
    }
    return {};
}

void remove_quietly(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        spdlog::warn("Failed to remove {}: {}", path.string(), ec.message());
    }
}

} // namespace discpack::adapters::fs
