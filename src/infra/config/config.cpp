#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <cstdlib>
#include <vector>

#include "config.hpp"
#include "../../cli/args_parser/args_parser.hpp"

namespace discpack::infra {

    auto parse_oversize_policy(std::string_view text) -> std::optional<OversizePolicy> {
        if (text == "allow") return OversizePolicy::Allow;
        if (text == "reject") return OversizePolicy::Reject;
        return std::nullopt;
    }

    auto to_string(OversizePolicy policy) -> std::string_view {
        return policy == OversizePolicy::Reject ? "reject" : "allow";
    }

    void ConfigLayer::merge_with(const ConfigLayer& other) {
        if (other.url) url = other.url;
        if (other.api_key) api_key = other.api_key;
        if (other.backup_dir) backup_dir = other.backup_dir;
        if (other.state_file) state_file = other.state_file;
        if (other.capacity_bytes) capacity_bytes = other.capacity_bytes;
        if (other.page_size) page_size = other.page_size;
        if (other.oversize_policy) oversize_policy = other.oversize_policy;
        if (other.connect_timeout_seconds) connect_timeout_seconds = other.connect_timeout_seconds;
    }

    void Config::apply(const ConfigLayer& layer) {
        if (layer.url) url = *layer.url;
        if (layer.api_key) api_key = *layer.api_key;
        if (layer.backup_dir) backup_dir = *layer.backup_dir;
        if (layer.state_file) state_file = *layer.state_file;
        if (layer.capacity_bytes) capacity_bytes = *layer.capacity_bytes;
        if (layer.page_size) page_size = *layer.page_size;
        if (layer.oversize_policy) oversize_policy = *layer.oversize_policy;
        if (layer.connect_timeout_seconds) connect_timeout_seconds = *layer.connect_timeout_seconds;
    }

    auto Config::validate() const -> VoidResult {
        if (url.empty()) {
            return std::unexpected(make_error(ErrorCode::InvalidConfig, "Immich URL not specified"));
        }
        if (api_key.empty()) {
            return std::unexpected(make_error(ErrorCode::InvalidConfig, "API key not specified"));
        }
        if (capacity_bytes == 0) {
            return std::unexpected(make_error(ErrorCode::InvalidConfig, "Chunk capacity must be positive"));
        }
        if (page_size == 0) {
            return std::unexpected(make_error(ErrorCode::InvalidConfig, "Page size must be positive"));
        }
        if (backup_dir.empty() || state_file.empty()) {
            return std::unexpected(make_error(ErrorCode::InvalidConfig, "Backup directory and state file must be set"));
        }
        return {};
    }

    static auto get_config_paths() -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> paths;

        // 1. Локальный файл
        paths.push_back(".discpack.yaml");

        // 2. Глобальный файл
        const char* config_home = std::getenv("XDG_CONFIG_HOME");
        if (config_home && std::filesystem::exists(config_home)) {
            paths.push_back(std::filesystem::path(config_home) / "discpack" / "config.yaml");
        } else {
            const char* home = std::getenv("HOME");
            if (home) {
                paths.push_back(std::filesystem::path(home) / ".config" / "discpack" / "config.yaml");
            }
        }

        return paths;
    }

    static auto layer_from_node(const YAML::Node& config, std::string_view origin) -> Result<ConfigLayer> {
        ConfigLayer layer{};
        try {
            if (config["url"]) layer.url = config["url"].as<std::string>();
            if (config["api_key"]) layer.api_key = config["api_key"].as<std::string>();
            if (config["backup_dir"]) layer.backup_dir = config["backup_dir"].as<std::string>();
            if (config["state_file"]) layer.state_file = config["state_file"].as<std::string>();
            if (config["capacity_bytes"]) layer.capacity_bytes = config["capacity_bytes"].as<std::uint64_t>();
            if (config["page_size"]) layer.page_size = config["page_size"].as<std::uint32_t>();
            if (config["connect_timeout_seconds"]) {
                layer.connect_timeout_seconds = config["connect_timeout_seconds"].as<long>();
            }
            if (config["oversize_policy"]) {
                const auto text = config["oversize_policy"].as<std::string>();
                layer.oversize_policy = parse_oversize_policy(text);
                if (!layer.oversize_policy) {
                    return std::unexpected(make_error(ErrorCode::InvalidConfig,
                        fmt::format("{}: unknown oversize_policy '{}' (expected allow or reject)", origin, text)));
                }
            }
        } catch (const YAML::Exception& e) {
            return std::unexpected(make_error(ErrorCode::InvalidConfig,
                fmt::format("Failed to parse {}: {}", origin, e.what())));
        }
        return layer;
    }

    auto config_from_yaml(std::string_view yaml_text, std::string_view origin) -> Result<ConfigLayer> {
        YAML::Node node;
        try {
            node = YAML::Load(std::string(yaml_text));
        } catch (const YAML::Exception& e) {
            return std::unexpected(make_error(ErrorCode::InvalidConfig,
                fmt::format("Failed to parse {}: {}", origin, e.what())));
        }
        if (node.IsNull()) {
            return ConfigLayer{};
        }
        if (!node.IsMap()) {
            return std::unexpected(make_error(ErrorCode::InvalidConfig,
                fmt::format("{}: top level must be a mapping", origin)));
        }
        return layer_from_node(node, origin);
    }

    auto load_config_from_file(const std::optional<std::filesystem::path>& explicit_path) -> Result<ConfigLayer> {
        std::vector<std::filesystem::path> candidates;
        if (explicit_path) {
            if (!std::filesystem::exists(*explicit_path)) {
                return std::unexpected(make_error(ErrorCode::InvalidConfig,
                    fmt::format("Config file {} does not exist", explicit_path->string())));
            }
            candidates.push_back(*explicit_path);
        } else {
            candidates = get_config_paths();
        }

        for (const auto& path : candidates) {
            if (!std::filesystem::exists(path)) continue;

            YAML::Node node;
            try {
                node = YAML::LoadFile(path.string());
            } catch (const YAML::Exception& e) {
                return std::unexpected(make_error(ErrorCode::InvalidConfig,
                    fmt::format("Failed to parse {}: {}", path.string(), e.what())));
            }

            spdlog::info("Loading config from '{}'", path.string());
            if (node.IsNull()) {
                return ConfigLayer{};
            }
            if (!node.IsMap()) {
                return std::unexpected(make_error(ErrorCode::InvalidConfig,
                    fmt::format("{}: top level must be a mapping", path.string())));
            }
            return layer_from_node(node, path.string());
        }

        // Файл не найден — возвращаем пустой слой (не ошибка!)
        return ConfigLayer{};
    }

    auto config_from_env() -> ConfigLayer {
        ConfigLayer layer{};
        auto read = [](const char* name) -> std::optional<std::string> {
            const char* value = std::getenv(name);
            if (value && *value) return std::string(value);
            return std::nullopt;
        };

        layer.url = read("IMMICH_URL");
        layer.api_key = read("IMMICH_API_KEY");
        if (auto dir = read("IMMICH_BACKUP_DIR")) layer.backup_dir = *dir;
        if (auto file = read("IMMICH_BACKUP_STATE_FILE")) layer.state_file = *file;
        return layer;
    }

    [[nodiscard]]
    auto config_from_cli(const discpack::args_parser::CLIArgs& args) -> ConfigLayer {
        ConfigLayer layer{};
        layer.url = args.url;
        layer.api_key = args.api_key;
        if (args.backup_dir) layer.backup_dir = *args.backup_dir;
        if (args.state_file) layer.state_file = *args.state_file;
        layer.capacity_bytes = args.capacity;
        layer.page_size = args.page_size;
        if (args.oversize_policy) layer.oversize_policy = parse_oversize_policy(*args.oversize_policy);
        layer.connect_timeout_seconds = args.connect_timeout;
        return layer;
    }

} // namespace discpack::infra
