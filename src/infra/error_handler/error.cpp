#include "error.hpp"
#include <cstdlib>
#include <fmt/core.h>

namespace discpack::infra {

bool Error::is_fatal() const {
    switch (code) {
        case ErrorCode::Interrupted:
            return false;
        default:
            return true;
    }
}

int Error::to_exit_code() const {
    switch (code) {
        case ErrorCode::InvalidConfig:  return 2;
        case ErrorCode::AlreadyRunning: return 3;
        case ErrorCode::Interrupted:    return 130; // SIGINT
        default:                        return EXIT_FAILURE;
    }
}

const char* Error::what() const {
    return message.c_str();
}

std::string_view Error::stage() const {
    switch (code) {
        case ErrorCode::ProbeFailed:          return "probe";
        case ErrorCode::CatalogFetchFailed:   return "page fetch";
        case ErrorCode::ItemFetchFailed:      return "item fetch";
        case ErrorCode::StateIoError:
        case ErrorCode::StateCorrupt:         return "state";
        case ErrorCode::ResumeMarkerNotFound: return "resume";
        case ErrorCode::OversizedItem:        return "allocation";
        case ErrorCode::InvalidConfig:        return "config";
        case ErrorCode::AlreadyRunning:       return "lock";
        case ErrorCode::PermissionDenied:     return "output";
        case ErrorCode::Interrupted:          return "interrupt";
        default:                              return "unknown";
    }
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, std::string(message), loc};
}

Error log_and_return(Error&& err) {
    auto level = err.is_fatal() ? spdlog::level::err : spdlog::level::warn;
    spdlog::log(level,
        "[{}:{} in {}] {} failed: {}",
        err.file, err.line, err.function,
        err.stage(), err.message
    );
    return std::move(err);
}

} // namespace discpack::infra
