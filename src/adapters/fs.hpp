#pragma once

#include <filesystem>
#include <expected>
#include <string_view>
#include "infra/error_handler/error.hpp"

namespace discpack::adapters::fs {

// Создаёт каталог (и родителей), если его ещё нет.
[[nodiscard]] auto ensure_directory(const std::filesystem::path& dir)
    -> std::expected<void, infra::Error>;

// Replaces `target` with `contents` so that a crash leaves either the old or
// the new file: sibling temp file, fsync, rename, fsync of the directory.
[[nodiscard]] auto write_file_atomic(const std::filesystem::path& target,
                                     std::string_view contents)
    -> std::expected<void, infra::Error>;

// Hidden staging file of an item inside its chunk directory: dir/.{id}.part
// Keyed by id so that a rerun can find it without knowing the final name.
[[nodiscard]] auto part_path_for(const std::filesystem::path& chunk_dir,
                                 std::string_view item_id)
    -> std::filesystem::path;

// Moves a completed .part file to its final name. On failure the .part file
// is left where it is.
[[nodiscard]] auto commit_part(const std::filesystem::path& part,
                               const std::filesystem::path& target)
    -> std::expected<void, infra::Error>;

// Best-effort cleanup of a leftover file; failures are only logged.
void remove_quietly(const std::filesystem::path& path);

} // namespace discpack::adapters::fs
