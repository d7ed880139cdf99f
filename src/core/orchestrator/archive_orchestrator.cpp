#include "archive_orchestrator.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../../adapters/fs.hpp"
#include "../../infra/interrupt.hpp"
#include "../allocator/chunk_allocator.hpp"
#include "../naming/target_path.hpp"

namespace discpack::core {

namespace {

// Moves a staged item to its final, collision-free name in chunk_dir.
auto place(const std::filesystem::path& chunk_dir, const CatalogItem& item,
           const std::filesystem::path& part, ArchiveStatsSnapshot& stats) -> infra::VoidResult
{
    const auto target = resolve_target_path(chunk_dir, item);
    if (target.filename() != primary_file_name(item)) {
        ++stats.name_collisions;
    }
    return adapters::fs::commit_part(part, target);
}

// The last committed item may still sit in its staging file if the previous
// run stopped between saving state and renaming. Finish that rename.
auto finish_staged(const std::filesystem::path& backup_dir, const CatalogItem& marker,
                   const extensions::ProgressState& state, ArchiveStatsSnapshot& stats)
    -> infra::VoidResult
{
    const auto chunk_dir = chunk_directory(backup_dir, state.current_chunk_index);
    const auto part = adapters::fs::part_path_for(chunk_dir, marker.id);
    std::error_code ec;
    const bool staged = std::filesystem::exists(part, ec);
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied,
            fmt::format("Cannot inspect {}: {}", part.string(), ec.message())));
    }
    if (!staged) {
        return {};
    }
    spdlog::info("Placing {} ({}), transferred by the previous run", marker.display_name, marker.id);
    return place(chunk_dir, marker, part, stats);
}

} // namespace

ArchiveOrchestrator::ArchiveOrchestrator(const infra::Config& config,
                                         CatalogSource& catalog,
                                         ItemFetcher& fetcher,
                                         extensions::ProgressStore& store)
    : config_(config), catalog_(catalog), fetcher_(fetcher), store_(store) {}

auto ArchiveOrchestrator::run() -> std::expected<ArchiveStatsSnapshot, infra::Error>
{
    if (auto alive = catalog_.ping(); !alive) {
        return std::unexpected(std::move(alive.error()));
    }

    if (auto dir = adapters::fs::ensure_directory(config_.backup_dir); !dir) {
        return std::unexpected(std::move(dir.error()));
    }

    auto state = store_.load();
    if (!state) {
        return std::unexpected(std::move(state.error()));
    }

    ArchiveStatsSnapshot stats{};
    ChunkAllocator allocator{store_, *state, config_.capacity_bytes, config_.oversize_policy};
    CatalogReader reader{catalog_, config_.page_size};

    spdlog::info("Fetching asset list from Immich...");
    if (!state->last_item_id.empty()) {
        auto resumed = reader.seek_past(state->last_item_id);
        if (!resumed) {
            return std::unexpected(std::move(resumed.error()));
        }
        stats.items_skipped = resumed->consumed;
        if (auto finished = finish_staged(config_.backup_dir, resumed->marker, *state, stats); !finished) {
            return std::unexpected(std::move(finished.error()));
        }
    }

    while (true) {
        if (infra::is_interrupted()) {
            spdlog::warn("Interrupted after {} item(s); state saved at item '{}'",
                         stats.items_archived, allocator.state().last_item_id);
            return std::unexpected(infra::make_error(infra::ErrorCode::Interrupted, "User interrupted"));
        }

        auto next = reader.next();
        if (!next) {
            return std::unexpected(std::move(next.error()));
        }
        if (!*next) {
            break;
        }
        const CatalogItem& item = **next;

        auto placement = allocator.reserve(item.size_bytes);
        if (!placement) {
            return std::unexpected(infra::make_error(placement.error().code,
                fmt::format("{} (item {})", placement.error().message, item.id)));
        }
        if (placement->opened_new_chunk) {
            ++stats.chunks_opened;
        }

        const auto chunk_dir = chunk_directory(config_.backup_dir, placement->chunk_index);
        if (auto dir = adapters::fs::ensure_directory(chunk_dir); !dir) {
            return std::unexpected(std::move(dir.error()));
        }

        const auto part = adapters::fs::part_path_for(chunk_dir, item.id);
        spdlog::info("Downloading: {} ({}) to {}...",
                     item.display_name, item.id, chunk_dir.filename().string());
        if (auto fetched = fetcher_.fetch(item.id, part); !fetched) {
            return std::unexpected(std::move(fetched.error()));
        }

        // Состояние сохраняется до переименования: перезапуск доведёт .part до конца
        if (auto committed = allocator.commit(item.id, item.size_bytes); !committed) {
            adapters::fs::remove_quietly(part);
            return std::unexpected(std::move(committed.error()));
        }
        if (auto placed = place(chunk_dir, item, part, stats); !placed) {
            return std::unexpected(std::move(placed.error()));
        }
        ++stats.items_archived;
        stats.bytes_archived += item.size_bytes;
    }

    stats.final_state = allocator.state();
    spdlog::info("Backup process completed. Archived {} item(s), current chunk is {}",
                 stats.items_archived, stats.final_state.current_chunk_index);
    return stats;
}

} // namespace discpack::core
