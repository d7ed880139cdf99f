#include "immich_api.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/spdlog.h>
#include "adapters/fs.hpp"

namespace discpack::adapters::immich {

namespace {

// Wire shape of one asset in assets.items[]. Only what archiving needs.
struct AssetDto {
    std::string id;
    std::optional<std::string> original_file_name;
    std::optional<std::string> original_path;
    std::optional<std::string> file_created_at;
    std::optional<std::uint64_t> file_size;
};

template<typename T>
auto optional_field(const nlohmann::json& j, const char* key) -> std::optional<T> {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->template get<T>();
}

void from_json(const nlohmann::json& j, AssetDto& asset) {
    j.at("id").get_to(asset.id);
    asset.original_file_name = optional_field<std::string>(j, "originalFileName");
    asset.original_path = optional_field<std::string>(j, "originalPath");
    asset.file_created_at = optional_field<std::string>(j, "fileCreatedAt");

    if (auto exif = j.find("exifInfo"); exif != j.end() && exif->is_object()) {
        // Сервер отдаёт fileSizeInByte; старые клиенты ждали fileSizeInBytes
        asset.file_size = optional_field<std::uint64_t>(*exif, "fileSizeInByte");
        if (!asset.file_size) {
            asset.file_size = optional_field<std::uint64_t>(*exif, "fileSizeInBytes");
        }
    }
}

auto to_item(AssetDto&& asset) -> core::CatalogItem {
    core::CatalogItem item;
    item.id = std::move(asset.id);

    if (asset.file_size) {
        item.size_bytes = *asset.file_size;
    } else {
        spdlog::debug("Asset {} has no file size, counting it as 0 bytes", item.id);
    }

    if (asset.original_file_name && !asset.original_file_name->empty()) {
        item.display_name = std::move(*asset.original_file_name);
    } else {
        spdlog::debug("Asset {} has no original file name, using its id", item.id);
        item.display_name = item.id;
    }

    if (asset.original_path) {
        item.extension = core::extension_from_path(*asset.original_path);
    }
    item.created_at = asset.file_created_at.value_or("");
    return item;
}

auto api_headers(const Endpoint& endpoint) -> http::Headers {
    return {{"x-api-key", endpoint.api_key}};
}

} // namespace

auto search_request_body(std::uint32_t page, std::uint32_t page_size) -> std::string {
    const nlohmann::json body{
        {"order", "asc"},
        {"page", page},
        {"size", page_size},
        {"withExif", true},
    };
    return body.dump();
}

auto parse_search_page(std::string_view body)
    -> infra::Result<std::vector<core::CatalogItem>>
{
    std::vector<core::CatalogItem> items;
    try {
        const auto root = nlohmann::json::parse(body);
        const auto& list = root.at("assets").at("items");
        if (!list.is_array()) {
            return std::unexpected(infra::make_error(infra::ErrorCode::CatalogFetchFailed,
                                 "assets.items is not an array"));
        }
        items.reserve(list.size());
        for (const auto& node : list) {
            items.push_back(to_item(node.get<AssetDto>()));
        }
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(infra::make_error(infra::ErrorCode::CatalogFetchFailed,
                             fmt::format("Malformed search response: {}", e.what())));
    }
    return items;
}

ImmichCatalog::ImmichCatalog(http::HttpClient& client, Endpoint endpoint)
    : client_(client), endpoint_(std::move(endpoint)) {}

auto ImmichCatalog::ping() -> infra::VoidResult
{
    spdlog::info("Pinging server...");
    auto response = client_.get(endpoint_.base_url + "/api/server/ping", {},
                                infra::ErrorCode::ProbeFailed);
    if (!response) {
        return std::unexpected(std::move(response.error()));
    }
    if (response->status != 200) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ProbeFailed,
                             fmt::format("Server is not reachable. Status: {}", response->status)));
    }
    spdlog::info("Server is reachable.");
    return {};
}

auto ImmichCatalog::next_page(std::uint32_t page, std::uint32_t page_size)
    -> infra::Result<std::vector<core::CatalogItem>>
{
    auto response = client_.post_json(endpoint_.base_url + "/api/search/metadata",
                                      api_headers(endpoint_),
                                      search_request_body(page, page_size),
                                      infra::ErrorCode::CatalogFetchFailed);
    if (!response) {
        return std::unexpected(std::move(response.error()));
    }
    if (!response->ok()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::CatalogFetchFailed,
                             fmt::format("Page {} request returned status {}: {}",
                                         page, response->status, response->body)));
    }

    auto items = parse_search_page(response->body);
    if (!items) {
        return std::unexpected(infra::make_error(infra::ErrorCode::CatalogFetchFailed,
                             fmt::format("Page {}: {}", page, items.error().message)));
    }
    return items;
}

ImmichFetcher::ImmichFetcher(http::HttpClient& client, Endpoint endpoint)
    : client_(client), endpoint_(std::move(endpoint)) {}

auto ImmichFetcher::fetch(std::string_view item_id,
                          const std::filesystem::path& destination)
    -> infra::VoidResult
{
    const auto url = fmt::format("{}/api/assets/{}/original", endpoint_.base_url, item_id);

    auto response = client_.download(url, api_headers(endpoint_), destination,
                                     infra::ErrorCode::ItemFetchFailed);
    if (!response) {
        fs::remove_quietly(destination);
        return std::unexpected(std::move(response.error()));
    }
    if (!response->ok()) {
        fs::remove_quietly(destination);
        return std::unexpected(infra::make_error(infra::ErrorCode::ItemFetchFailed,
                             fmt::format("Download of {} returned status {}: {}",
                                         item_id, response->status, response->body)));
    }
    return {};
}

} // namespace discpack::adapters::immich
