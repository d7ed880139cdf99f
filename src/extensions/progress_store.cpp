// progress_store.cpp
#include "progress_store.hpp"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <fmt/core.h>
#include "adapters/fs.hpp"

namespace discpack::extensions {

namespace {

constexpr auto kLastItemId = "last_item_id";
constexpr auto kChunkIndex = "current_chunk_index";
constexpr auto kChunkOccupied = "current_chunk_occupied_bytes";

} // namespace

void to_json(nlohmann::json& j, const ProgressState& state) {
    j = nlohmann::json{
        {kLastItemId, state.last_item_id},
        {kChunkIndex, state.current_chunk_index},
        {kChunkOccupied, state.current_chunk_occupied_bytes},
    };
}

void from_json(const nlohmann::json& j, ProgressState& state) {
    // null и отсутствие поля означают одно и то же
    if (auto it = j.find(kLastItemId); it != j.end() && !it->is_null()) {
        state.last_item_id = it->get<std::string>();
    }
    state.current_chunk_index = j.value(kChunkIndex, std::uint64_t{1});
    state.current_chunk_occupied_bytes = j.value(kChunkOccupied, std::uint64_t{0});
}

ProgressStore::ProgressStore(std::filesystem::path state_file)
    : state_file_(std::move(state_file)) {}

auto ProgressStore::load() const -> infra::Result<ProgressState>
{
    std::error_code ec;
    const bool present = std::filesystem::exists(state_file_, ec);
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::StateIoError,
                             fmt::format("Cannot inspect state file {}: {}", state_file_.string(), ec.message())));
    }
    if (!present) {
        spdlog::info("No state file at {}, starting fresh", state_file_.string());
        return ProgressState{};
    }

    std::ifstream in(state_file_);
    if (!in) {
        return std::unexpected(infra::make_error(infra::ErrorCode::StateIoError,
                             fmt::format("Cannot open state file {}", state_file_.string())));
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    ProgressState state;
    try {
        auto node = nlohmann::json::parse(buffer.str());
        if (!node.is_object()) {
            return std::unexpected(infra::make_error(infra::ErrorCode::StateCorrupt,
                                 fmt::format("State file {} is not a JSON object", state_file_.string())));
        }
        state = node.get<ProgressState>();
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(infra::make_error(infra::ErrorCode::StateCorrupt,
                             fmt::format("Cannot parse state file {}: {}", state_file_.string(), e.what())));
    }

    if (state.current_chunk_index == 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::StateCorrupt,
                             fmt::format("State file {} has chunk index 0", state_file_.string())));
    }

    spdlog::info("Loaded state from {}: last item '{}', chunk {} ({} bytes used)",
                 state_file_.string(), state.last_item_id,
                 state.current_chunk_index, state.current_chunk_occupied_bytes);
    return state;
}

auto ProgressStore::save(const ProgressState& state) -> infra::VoidResult
{
    const nlohmann::json node = state;
    return adapters::fs::write_file_atomic(state_file_, node.dump());
}

} // namespace discpack::extensions
