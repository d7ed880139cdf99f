#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include "../catalog/catalog_item.hpp"

namespace discpack::core {

// {backup_dir}/Chunk_{index}
[[nodiscard]] auto chunk_directory(const std::filesystem::path& backup_dir,
                                   std::uint64_t chunk_index) -> std::filesystem::path;

// "{display_name}.{extension}". A name that already ends with ".{extension}"
// (any case) is kept as is; an empty extension adds nothing.
[[nodiscard]] auto primary_file_name(const CatalogItem& item) -> std::string;

// Primary name with its last suffix replaced by "_{id}.{extension}",
// unique because ids are. "IMG_1.JPG" -> "IMG_1_{id}.JPG".
[[nodiscard]] auto disambiguated_file_name(const CatalogItem& item) -> std::string;

// Primary name inside chunk_dir, or the id-suffixed one if that is taken.
[[nodiscard]] auto resolve_target_path(const std::filesystem::path& chunk_dir,
                                       const CatalogItem& item) -> std::filesystem::path;

} // namespace discpack::core
