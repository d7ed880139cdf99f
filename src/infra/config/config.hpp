#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <cstdint>
#include <expected>
#include <filesystem>
#include "../error_handler/error.hpp"

namespace discpack::args_parser {
    struct CLIArgs;
}

namespace discpack::infra {

enum class OversizePolicy {
    Allow,   // элемент больше ёмкости ложится один в отдельный чанк
    Reject,  // прогон останавливается с ошибкой
};

[[nodiscard]] auto parse_oversize_policy(std::string_view text) -> std::optional<OversizePolicy>;
[[nodiscard]] auto to_string(OversizePolicy policy) -> std::string_view;

inline constexpr std::string_view kDefaultUrl = "http://localhost:2283";
inline constexpr std::string_view kDefaultBackupDir = "./immich_backups";
inline constexpr std::string_view kDefaultStateFile = "./immich_backup_state.json";
inline constexpr std::uint64_t kDvdCapacityBytes = 4'700'000'000; // 4.7 GB DVD-R, decimal
inline constexpr std::uint32_t kDefaultPageSize = 1000;
inline constexpr long kDefaultConnectTimeoutSeconds = 30;

// Every layer (file, environment, CLI) fills only what it knows; merge_with
// lets the higher-priority layer override the lower one.
struct ConfigLayer {
    std::optional<std::string> url;
    std::optional<std::string> api_key;
    std::optional<std::filesystem::path> backup_dir;
    std::optional<std::filesystem::path> state_file;
    std::optional<std::uint64_t> capacity_bytes;
    std::optional<std::uint32_t> page_size;
    std::optional<OversizePolicy> oversize_policy;
    std::optional<long> connect_timeout_seconds;

    void merge_with(const ConfigLayer& other);
};

// Fully resolved settings for one run.
struct Config {
    std::string url{kDefaultUrl};
    std::string api_key;
    std::filesystem::path backup_dir{kDefaultBackupDir};
    std::filesystem::path state_file{kDefaultStateFile};
    std::uint64_t capacity_bytes = kDvdCapacityBytes;
    std::uint32_t page_size = kDefaultPageSize;
    OversizePolicy oversize_policy = OversizePolicy::Allow;
    long connect_timeout_seconds = kDefaultConnectTimeoutSeconds;

    bool verbose = false;
    bool quiet = false;

    void apply(const ConfigLayer& layer);

    [[nodiscard]] auto validate() const -> VoidResult;
};

/// Загружает конфигурацию из YAML.
/// Если задан explicit_path, читается только он (и он обязан существовать).
/// Иначе первый существующий из:
///   1. ./.discpack.yaml
///   2. $XDG_CONFIG_HOME/discpack/config.yaml
///   3. ~/.config/discpack/config.yaml
/// Отсутствие файла — не ошибка.
[[nodiscard]] auto load_config_from_file(const std::optional<std::filesystem::path>& explicit_path = std::nullopt)
    -> Result<ConfigLayer>;

/// Same keys, read straight from a YAML document (used by the loader and tests).
[[nodiscard]] auto config_from_yaml(std::string_view yaml_text, std::string_view origin)
    -> Result<ConfigLayer>;

/// IMMICH_URL, IMMICH_API_KEY, IMMICH_BACKUP_DIR, IMMICH_BACKUP_STATE_FILE
[[nodiscard]] auto config_from_env() -> ConfigLayer;

/// Создаёт слой из CLI аргументов (структура из args_parser)
[[nodiscard]] auto config_from_cli(const discpack::args_parser::CLIArgs& args) -> ConfigLayer;

} // namespace discpack::infra
