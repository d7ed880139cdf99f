#pragma once

#include <filesystem>
#include <string_view>
#include "../../infra/error_handler/error.hpp"

namespace discpack::core {

// Materializes the original bytes of one item at `destination`, a staging
// file the caller later renames. On failure `destination` does not exist.
// No retries: any failure is returned as-is and ends the run.
class ItemFetcher {
public:
    virtual ~ItemFetcher() = default;

    [[nodiscard]] virtual auto fetch(std::string_view item_id,
                                     const std::filesystem::path& destination)
        -> infra::VoidResult = 0;
};

} // namespace discpack::core
