#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace discpack::core {

// One catalog entry. Immutable once read; the engine never writes back.
struct CatalogItem {
    std::string id;
    std::uint64_t size_bytes = 0;   // 0 when the catalog omits it
    std::string display_name;       // falls back to id
    std::string extension;          // without the dot, may be empty
    std::string created_at;         // ordering key only
};

// Text after the last '.' of the final path component ("" if there is none).
[[nodiscard]] auto extension_from_path(std::string_view original_path) -> std::string;

} // namespace discpack::core
