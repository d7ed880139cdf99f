#pragma once

#include <string>
#include <cstdint>
#include <optional>



namespace discpack::args_parser {
    struct CLIArgs
{
    std::optional<std::string> url;                 // первый позиционный аргумент
    std::optional<std::string> api_key;             // второй позиционный аргумент
    std::optional<std::string> backup_dir;          // --backup-dir
    std::optional<std::string> state_file;          // --state-file
    std::optional<std::uint64_t> capacity;          // --capacity=BYTES
    std::optional<std::uint32_t> page_size;         // --page-size=N
    std::optional<std::string> oversize_policy;     // --oversize-policy=allow|reject
    std::optional<long> connect_timeout;            // --connect-timeout=SECONDS
    std::optional<std::string> config_file;         // --config=PATH
    bool verbose{false};                            // -v, --verbose
    bool quiet{false};                              // -q, --quiet
};

enum class ParseOutcome {
    Run,
    Exit,   // --help / --version already printed
    Error,
};

struct ParseResult {
    ParseOutcome outcome = ParseOutcome::Run;
    int exit_code = 0;
    CLIArgs args;
};

/// Parses command-line arguments (CLI11). Help and errors are printed here.
ParseResult parse_args(int argc, char const* const* argv);

} // namespace discpack::args_parser
