#include "chunk_allocator.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace discpack::core {

ChunkAllocator::ChunkAllocator(extensions::ProgressStore& store,
                               extensions::ProgressState initial,
                               std::uint64_t capacity_bytes,
                               infra::OversizePolicy policy)
    : store_(store)
    , state_(std::move(initial))
    , capacity_(capacity_bytes)
    , policy_(policy) {}

auto ChunkAllocator::reserve(std::uint64_t size_bytes) -> infra::Result<ChunkPlacement>
{
    const bool oversized = size_bytes > capacity_;
    if (oversized && policy_ == infra::OversizePolicy::Reject) {
        return std::unexpected(infra::make_error(infra::ErrorCode::OversizedItem,
            fmt::format("Item of {} bytes does not fit a {}-byte chunk", size_bytes, capacity_)));
    }

    ChunkPlacement placement{.chunk_index = state_.current_chunk_index,
                             .opened_new_chunk = false,
                             .oversized = oversized};

    // Пустой чанк никогда не закрываем: иначе крупный элемент оставил бы дыру в нумерации
    const auto occupied = state_.current_chunk_occupied_bytes;
    if (occupied > 0 && occupied + size_bytes > capacity_) {
        spdlog::info("Chunk {} is full ({} of {} bytes). Starting chunk {}.",
                     state_.current_chunk_index, occupied, capacity_,
                     state_.current_chunk_index + 1);

        ++state_.current_chunk_index;
        state_.current_chunk_occupied_bytes = 0;
        if (auto saved = store_.save(state_); !saved) {
            return std::unexpected(std::move(saved.error()));
        }
        placement.chunk_index = state_.current_chunk_index;
        placement.opened_new_chunk = true;
    }

    if (oversized) {
        spdlog::warn("Item of {} bytes exceeds chunk capacity {}; chunk {} will overflow",
                     size_bytes, capacity_, placement.chunk_index);
    }
    return placement;
}

auto ChunkAllocator::commit(std::string_view item_id, std::uint64_t size_bytes)
    -> infra::VoidResult
{
    state_.current_chunk_occupied_bytes += size_bytes;
    state_.last_item_id = std::string(item_id);
    return store_.save(state_);
}

} // namespace discpack::core
