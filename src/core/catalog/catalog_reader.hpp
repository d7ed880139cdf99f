#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>
#include "catalog_item.hpp"
#include "../../infra/error_handler/error.hpp"

namespace discpack::core {

// Paginated remote catalog. Pages are 1-based and ordered by creation time,
// oldest first; an empty page means the enumeration is exhausted.
class CatalogSource {
public:
    virtual ~CatalogSource() = default;

    // Reachability check, run once before any work.
    [[nodiscard]] virtual auto ping() -> infra::VoidResult = 0;

    [[nodiscard]] virtual auto next_page(std::uint32_t page, std::uint32_t page_size)
        -> infra::Result<std::vector<CatalogItem>> = 0;
};

// Where seek_past stopped: the marker item itself and how many items were
// consumed to reach it (marker included).
struct ResumePoint {
    CatalogItem marker;
    std::uint64_t consumed = 0;
};

// Lazy, ordered item cursor over a CatalogSource. Holds one page at a time.
class CatalogReader {
public:
    CatalogReader(CatalogSource& source, std::uint32_t page_size);

    // Next item, std::nullopt once the catalog is exhausted.
    [[nodiscard]] auto next() -> infra::Result<std::optional<CatalogItem>>;

    // Consumes items up to and including `item_id`. Fails with
    // ResumeMarkerNotFound if the catalog ends first.
    [[nodiscard]] auto seek_past(std::string_view item_id) -> infra::Result<ResumePoint>;

private:
    [[nodiscard]] auto fill_() -> infra::VoidResult;

    CatalogSource& source_;
    const std::uint32_t page_size_;
    std::uint32_t next_page_ = 1;
    std::vector<CatalogItem> page_;
    std::size_t pos_ = 0;
    bool exhausted_ = false;
};

} // namespace discpack::core
