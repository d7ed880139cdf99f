#pragma once

#include <cstdint>
#include <string_view>
#include "../../extensions/progress_store.hpp"
#include "../../infra/config/config.hpp"
#include "../../infra/error_handler/error.hpp"

namespace discpack::core {

struct ChunkPlacement {
    std::uint64_t chunk_index = 1;
    bool opened_new_chunk = false;  // текущий чанк закрыт ради этого элемента
    bool oversized = false;         // элемент сам по себе больше ёмкости
};

/// Streaming next-fit bin packing over fixed-capacity chunks.
///
/// Items arrive once, in catalog order, and are never moved after
/// placement. The allocator owns the ProgressState of the run and persists
/// it through the ProgressStore at each chunk transition (before anything
/// lands in the new chunk) and at each commit.
///
/// A chunk that already holds bytes is closed when the next item would
/// overflow it. An item larger than the capacity is either placed alone in
/// a fresh chunk (OversizePolicy::Allow) or rejects the run
/// (OversizePolicy::Reject).
class ChunkAllocator {
public:
    ChunkAllocator(extensions::ProgressStore& store,
                   extensions::ProgressState initial,
                   std::uint64_t capacity_bytes,
                   infra::OversizePolicy policy = infra::OversizePolicy::Allow);

    // Chooses the chunk for an item of `size_bytes`, advancing if needed.
    [[nodiscard]] auto reserve(std::uint64_t size_bytes) -> infra::Result<ChunkPlacement>;

    // Records a fully transferred item and persists the new state.
    [[nodiscard]] auto commit(std::string_view item_id, std::uint64_t size_bytes)
        -> infra::VoidResult;

    [[nodiscard]] auto state() const -> const extensions::ProgressState& { return state_; }

private:
    extensions::ProgressStore& store_;
    extensions::ProgressState state_;
    const std::uint64_t capacity_;
    const infra::OversizePolicy policy_;
};

} // namespace discpack::core
