#include <fmt/core.h>

#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/instance_lock/instance_lock.hpp"
#include "infra/interrupt.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "adapters/http/http_client.hpp"
#include "adapters/immich/immich_api.hpp"
#include "extensions/progress_store.hpp"
#include "core/orchestrator/archive_orchestrator.hpp"
#include <build_info.hpp>
#include <spdlog/spdlog.h>
#include <chrono>

using BUILD = discpack::build_info::BuildInfo;
using discpack::args_parser::ParseOutcome;

constexpr auto load_from_cli = discpack::infra::config_from_cli;
constexpr auto load_from_env = discpack::infra::config_from_env;
constexpr auto load_config_file = discpack::infra::load_config_from_file;
constexpr auto args_parser = discpack::args_parser::parse_args;
constexpr auto build = discpack::build_info::get_build_info();

static auto
out_build_verse(const BUILD& info)
-> void {
    spdlog::debug("discpack {} ({}{}, branch {}), built {}",
                  info.version, info.commit_short, info.dirty ? "-dirty" : "",
                  info.branch, info.timestamp);
}

static auto
out_config_verse(const discpack::infra::Config& config)
-> void {
    spdlog::debug("Immich URL: {}", config.url);
    spdlog::debug("Backup dir: {}", config.backup_dir.string());
    spdlog::debug("State file: {}", config.state_file.string());
    spdlog::debug("Chunk capacity: {} bytes", config.capacity_bytes);
    spdlog::debug("Page size: {}", config.page_size);
    spdlog::debug("Oversize policy: {}", discpack::infra::to_string(config.oversize_policy));
}

static auto
fail(discpack::infra::Error&& err)
-> int {
    const int code = err.to_exit_code();
    (void)discpack::infra::log_and_return(std::move(err));
    spdlog::info("It is safe to run discpack again; it resumes after the last archived item.");
    return code;
}

int main(int argc, char** argv)
{
    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        discpack::infra::install_signal_handler();

        auto parsed = args_parser(argc, argv);
        if (parsed.outcome != ParseOutcome::Run) {
            return parsed.exit_code; // --help, --version или ошибка разбора
        }
        const auto& args = parsed.args;

        if (args.verbose) spdlog::set_level(spdlog::level::debug);
        if (args.quiet) spdlog::set_level(spdlog::level::warn);
        out_build_verse(build);

        // defaults < файл < окружение < CLI
        auto file_layer = load_config_file(args.config_file
            ? std::optional<std::filesystem::path>(*args.config_file)
            : std::nullopt);
        if (!file_layer) {
            return fail(std::move(file_layer.error()));
        }
        auto layer = *file_layer;
        layer.merge_with(load_from_env());
        layer.merge_with(load_from_cli(args));

        discpack::infra::Config config{};
        config.apply(layer);
        config.verbose = args.verbose;
        config.quiet = args.quiet;
        if (auto valid = config.validate(); !valid) {
            return fail(std::move(valid.error()));
        }
        out_config_verse(config);

        auto lock = discpack::infra::InstanceLock::acquire(
            discpack::infra::lock_path_for(config.state_file));
        if (!lock) {
            return fail(std::move(lock.error()));
        }

        discpack::adapters::http::CurlGlobal curl_global;
        discpack::adapters::http::HttpClient client{config.connect_timeout_seconds};
        const discpack::adapters::immich::Endpoint endpoint{config.url, config.api_key};
        discpack::adapters::immich::ImmichCatalog catalog{client, endpoint};
        discpack::adapters::immich::ImmichFetcher fetcher{client, endpoint};
        discpack::extensions::ProgressStore store{config.state_file};

        discpack::core::ArchiveOrchestrator orchestrator(config, catalog, fetcher, store);

        auto start_time = std::chrono::steady_clock::now();
        auto result = orchestrator.run();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        if (!result) {
            return fail(std::move(result.error()));
        }

        const auto& stats = *result;
        spdlog::info("Items archived: {}", stats.items_archived);
        spdlog::info("Bytes archived: {} ({:.2f} MB)",
                     stats.bytes_archived, stats.bytes_archived / 1024.0 / 1024.0);
        spdlog::info("Items already archived earlier: {}", stats.items_skipped);
        spdlog::info("New chunks started: {}", stats.chunks_opened);
        spdlog::info("Name collisions resolved: {}", stats.name_collisions);
        spdlog::info("Time elapsed: {:.2f} seconds", duration.count() / 1000.0);
        spdlog::info("Final state saved to: {}", config.state_file.string());
        return 0;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
