// progress_store.hpp
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include "infra/error_handler/error.hpp"

namespace discpack::extensions {

// Единственная запись, по которой возобновляется архивирование.
struct ProgressState {
    std::string last_item_id;                        // пусто — ещё ничего не сохранено
    std::uint64_t current_chunk_index = 1;
    std::uint64_t current_chunk_occupied_bytes = 0;

    bool operator==(const ProgressState&) const = default;
};

// Durable JSON record of ProgressState. A missing file is the zero state.
// Not safe for concurrent use by two processes; the caller holds the lock.
class ProgressStore {
public:
    explicit ProgressStore(std::filesystem::path state_file);

    [[nodiscard]] auto load() const -> infra::Result<ProgressState>;

    // Atomic with respect to process termination (temp file + rename).
    [[nodiscard]] auto save(const ProgressState& state) -> infra::VoidResult;

private:
    std::filesystem::path state_file_;
};

} // namespace discpack::extensions
