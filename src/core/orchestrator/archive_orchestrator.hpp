#pragma once

#include <filesystem>
#include <cstdint>
#include <expected>
#include "../../infra/config/config.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../../extensions/progress_store.hpp"
#include "../catalog/catalog_reader.hpp"
#include "../fetcher/item_fetcher.hpp"

namespace discpack::core {

struct ArchiveStatsSnapshot {
    std::uint64_t items_archived = 0;
    std::uint64_t bytes_archived = 0;
    std::uint64_t items_skipped = 0;    // уже заархивированы в прошлых запусках
    std::uint64_t chunks_opened = 0;    // переходы на новый чанк в этом запуске
    std::uint64_t name_collisions = 0;
    extensions::ProgressState final_state{};
};

// Single-threaded driver of one archival pass:
// probe -> load state -> seek past the last committed item (placing it if the
// previous run stopped before its rename) -> for each item reserve a chunk,
// fetch into .{id}.part, commit state, rename to a collision-free name.
// Only one orchestrator may run against a given state file and backup dir.
class ArchiveOrchestrator {
public:
    ArchiveOrchestrator(const infra::Config& config,
                        CatalogSource& catalog,
                        ItemFetcher& fetcher,
                        extensions::ProgressStore& store);

    [[nodiscard]] auto run() -> std::expected<ArchiveStatsSnapshot, infra::Error>;

private:
    const infra::Config& config_;
    CatalogSource& catalog_;
    ItemFetcher& fetcher_;
    extensions::ProgressStore& store_;
};

} // namespace discpack::core
