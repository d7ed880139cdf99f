#include "args_parser.hpp"

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <build_info.hpp>

namespace discpack::args_parser {

ParseResult parse_args(int argc, char const* const* argv)
{
    constexpr auto info = discpack::build_info::get_build_info();

    CLI::App app{"Archive an Immich library onto DVD-sized chunks, resumably."};
    app.set_version_flag("--version", fmt::format("discpack {} ({})", info.version, info.commit_short));
    app.footer(
        "Priority: command-line arguments > environment variables > config file > defaults.\n"
        "Environment: IMMICH_URL, IMMICH_API_KEY, IMMICH_BACKUP_DIR, IMMICH_BACKUP_STATE_FILE.\n"
        "Only one discpack may run against a given state file at a time.");

    ParseResult result;
    auto& args = result.args;

    app.add_option("url", args.url, "Immich server URL");
    app.add_option("api_key", args.api_key, "Immich API key");
    app.add_option("--backup-dir", args.backup_dir, "Directory that receives Chunk_N subdirectories");
    app.add_option("--state-file", args.state_file, "Path of the JSON progress record");
    app.add_option("--capacity", args.capacity, "Chunk capacity in bytes")
        ->check(CLI::PositiveNumber);
    app.add_option("--page-size", args.page_size, "Catalog page size")
        ->check(CLI::PositiveNumber);
    app.add_option("--oversize-policy", args.oversize_policy,
                   "What to do with an item larger than a chunk")
        ->check(CLI::IsMember({"allow", "reject"}));
    app.add_option("--connect-timeout", args.connect_timeout, "Connect timeout in seconds")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--config", args.config_file, "YAML config file")
        ->check(CLI::ExistingFile);
    app.add_flag("-v,--verbose", args.verbose, "Debug logging");
    app.add_flag("-q,--quiet", args.quiet, "Only warnings and errors");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        result.exit_code = app.exit(e);
        result.outcome = e.get_exit_code() == static_cast<int>(CLI::ExitCodes::Success)
            ? ParseOutcome::Exit
            : ParseOutcome::Error;
    }
    return result;
}

} // namespace discpack::args_parser
