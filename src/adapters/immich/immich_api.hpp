#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include "adapters/http/http_client.hpp"
#include "core/catalog/catalog_reader.hpp"
#include "core/fetcher/item_fetcher.hpp"

namespace discpack::adapters::immich {

struct Endpoint {
    std::string base_url;   // без завершающего '/'
    std::string api_key;
};

// Request body for POST /api/search/metadata.
[[nodiscard]] auto search_request_body(std::uint32_t page, std::uint32_t page_size) -> std::string;

// Decodes a search/metadata response into catalog items, in server order.
[[nodiscard]] auto parse_search_page(std::string_view body)
    -> infra::Result<std::vector<core::CatalogItem>>;

// Catalog over Immich's search API, ordered by creation time ascending.
class ImmichCatalog final : public core::CatalogSource {
public:
    ImmichCatalog(http::HttpClient& client, Endpoint endpoint);

    [[nodiscard]] auto ping() -> infra::VoidResult override;

    [[nodiscard]] auto next_page(std::uint32_t page, std::uint32_t page_size)
        -> infra::Result<std::vector<core::CatalogItem>> override;

private:
    http::HttpClient& client_;
    Endpoint endpoint_;
};

// GET /api/assets/{id}/original into the given staging file. Anything but a
// complete 2xx transfer removes the file and fails.
class ImmichFetcher final : public core::ItemFetcher {
public:
    ImmichFetcher(http::HttpClient& client, Endpoint endpoint);

    [[nodiscard]] auto fetch(std::string_view item_id,
                             const std::filesystem::path& destination)
        -> infra::VoidResult override;

private:
    http::HttpClient& client_;
    Endpoint endpoint_;
};

} // namespace discpack::adapters::immich
