#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <spdlog/spdlog.h>

namespace discpack::infra {

enum class ErrorCode {
    // Connectivity: the run stops, state still points at the last committed item
    ProbeFailed,
    CatalogFetchFailed,
    ItemFetchFailed,

    // Persisted state
    StateIoError,
    StateCorrupt,
    ResumeMarkerNotFound,

    // Policy / setup
    OversizedItem,
    InvalidConfig,
    AlreadyRunning,
    PermissionDenied,

    Interrupted,
};

struct Error {
    ErrorCode code;
    std::string message;
    std::string file;
    int line;
    std::string function;

    Error(ErrorCode c, std::string_view msg,
          const std::source_location& loc = std::source_location::current())
        : code(c)
        , message(msg)
        , file(loc.file_name())
        , line(static_cast<int>(loc.line()))
        , function(loc.function_name())
    {}

    [[nodiscard]] auto is_fatal() const -> bool;
    [[nodiscard]] auto to_exit_code() const -> int;
    [[nodiscard]] auto what() const -> const char*;

    // Short name of the pipeline stage that failed ("probe", "page fetch", ...)
    [[nodiscard]] auto stage() const -> std::string_view;
};

template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Логирование ошибки и возврат
[[nodiscard]] auto log_and_return(Error&& err) -> Error;

const auto DP_ERR = ::discpack::infra::make_error;

} // namespace discpack::infra
