#include "catalog_reader.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace discpack::core {

auto extension_from_path(std::string_view original_path) -> std::string
{
    const auto slash = original_path.find_last_of("/\\");
    const auto name = slash == std::string_view::npos ? original_path
                                                      : original_path.substr(slash + 1);
    // ".profile" has no extension: leading dots belong to the name
    const auto dot = name.rfind('.');
    const auto first = name.find_first_not_of('.');
    if (dot == std::string_view::npos || first == std::string_view::npos
        || first >= dot || dot + 1 == name.size()) {
        return {};
    }
    return std::string(name.substr(dot + 1));
}

CatalogReader::CatalogReader(CatalogSource& source, std::uint32_t page_size)
    : source_(source), page_size_(page_size) {}

auto CatalogReader::fill_() -> infra::VoidResult
{
    spdlog::debug("Fetching catalog page {} (size {})", next_page_, page_size_);
    auto page = source_.next_page(next_page_, page_size_);
    if (!page) {
        return std::unexpected(std::move(page.error()));
    }

    page_ = std::move(*page);
    pos_ = 0;
    if (page_.empty()) {
        spdlog::debug("Catalog exhausted after {} page(s)", next_page_ - 1);
        exhausted_ = true;
        return {};
    }
    spdlog::info("Processing page {} ({} items)", next_page_, page_.size());
    ++next_page_;
    return {};
}

auto CatalogReader::next() -> infra::Result<std::optional<CatalogItem>>
{
    if (exhausted_) {
        return std::nullopt;
    }
    if (pos_ >= page_.size()) {
        auto filled = fill_();
        if (!filled) {
            return std::unexpected(std::move(filled.error()));
        }
        if (exhausted_) {
            return std::nullopt;
        }
    }
    return std::move(page_[pos_++]);
}

auto CatalogReader::seek_past(std::string_view item_id) -> infra::Result<ResumePoint>
{
    std::uint64_t consumed = 0;
    while (true) {
        auto item = next();
        if (!item) {
            return std::unexpected(std::move(item.error()));
        }
        if (!*item) {
            return std::unexpected(infra::make_error(infra::ErrorCode::ResumeMarkerNotFound,
                fmt::format("Last archived item '{}' not found among {} catalog items; "
                            "the catalog changed since the previous run", item_id, consumed)));
        }
        ++consumed;
        if ((*item)->id == item_id) {
            spdlog::info("Resuming after item '{}' ({} items already archived)", item_id, consumed);
            return ResumePoint{.marker = std::move(**item), .consumed = consumed};
        }
    }
}

} // namespace discpack::core
