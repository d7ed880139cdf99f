#include "target_path.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace discpack::core {

namespace {

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size()
        && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x))
                   == std::tolower(static_cast<unsigned char>(y));
           });
}

bool ends_with_icase(std::string_view name, std::string_view suffix) {
    return name.size() >= suffix.size() && iequals(name.substr(name.size() - suffix.size()), suffix);
}

// Имя приходит с сервера: не даём ему выйти за пределы каталога чанка
std::string safe_display_name(const CatalogItem& item) {
    std::string name = item.display_name.empty() ? item.id : item.display_name;
    std::replace(name.begin(), name.end(), '/', '_');
    if (name == "." || name == "..") {
        name = item.id;
    }
    return name;
}

std::string dotted(std::string_view extension) {
    return extension.empty() ? std::string{} : fmt::format(".{}", extension);
}

// Drops the last ".suffix"; leading dots do not start a suffix.
std::string_view without_last_suffix(std::string_view name) {
    const auto dot = name.rfind('.');
    const auto first = name.find_first_not_of('.');
    if (dot == std::string_view::npos || first == std::string_view::npos || first >= dot) {
        return name;
    }
    return name.substr(0, dot);
}

} // namespace

auto chunk_directory(const std::filesystem::path& backup_dir,
                     std::uint64_t chunk_index) -> std::filesystem::path
{
    return backup_dir / fmt::format("Chunk_{}", chunk_index);
}

auto primary_file_name(const CatalogItem& item) -> std::string
{
    auto name = safe_display_name(item);
    const auto suffix = dotted(item.extension);
    if (ends_with_icase(name, suffix)) {
        return name;
    }
    return name + suffix;
}

auto disambiguated_file_name(const CatalogItem& item) -> std::string
{
    const auto primary = primary_file_name(item);
    return fmt::format("{}_{}{}", without_last_suffix(primary), item.id, dotted(item.extension));
}

auto resolve_target_path(const std::filesystem::path& chunk_dir,
                         const CatalogItem& item) -> std::filesystem::path
{
    auto target = chunk_dir / primary_file_name(item);
    std::error_code ec;
    if (std::filesystem::exists(target, ec)) {
        auto renamed = chunk_dir / disambiguated_file_name(item);
        spdlog::info("Name collision on {}, storing item {} as {}",
                     target.filename().string(), item.id, renamed.filename().string());
        return renamed;
    }
    return target;
}

} // namespace discpack::core
