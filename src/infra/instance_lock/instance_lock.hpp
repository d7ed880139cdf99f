#pragma once

#include <filesystem>
#include <expected>
#include "../error_handler/error.hpp"

namespace discpack::infra {

// Advisory flock(2) held for the lifetime of the object. Guarantees a single
// discpack per state file; released on destruction or process exit.
class InstanceLock {
public:
    [[nodiscard]] static auto acquire(const std::filesystem::path& lock_file)
        -> Result<InstanceLock>;

    InstanceLock(InstanceLock&& other) noexcept;
    InstanceLock& operator=(InstanceLock&& other) noexcept;
    InstanceLock(const InstanceLock&) = delete;
    InstanceLock& operator=(const InstanceLock&) = delete;
    ~InstanceLock();

private:
    explicit InstanceLock(int fd);

    int fd_ = -1;
};

// "{state_file}.lock"
[[nodiscard]] auto lock_path_for(const std::filesystem::path& state_file) -> std::filesystem::path;

} // namespace discpack::infra
