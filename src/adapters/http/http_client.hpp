#pragma once

#include <filesystem>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <curl/curl.h>
#include "infra/error_handler/error.hpp"

namespace discpack::adapters::http {

struct HttpResponse {
    long status = 0;
    std::string body;

    [[nodiscard]] auto ok() const -> bool { return status >= 200 && status < 300; }
};

using Headers = std::vector<std::pair<std::string, std::string>>;

// Process-wide curl_global_init / curl_global_cleanup. One instance in main.
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

// Blocking HTTP client over a single reused curl easy handle.
// Transport failures come back as `transport_error`; HTTP statuses are
// returned to the caller, which decides what a failure means for its stage.
// A transfer in flight is aborted with ErrorCode::Interrupted once
// infra::is_interrupted() turns true.
class HttpClient {
public:
    explicit HttpClient(long connect_timeout_seconds = 30);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    [[nodiscard]] auto get(const std::string& url, const Headers& headers,
                           infra::ErrorCode transport_error)
        -> std::expected<HttpResponse, infra::Error>;

    [[nodiscard]] auto post_json(const std::string& url, const Headers& headers,
                                 std::string_view body,
                                 infra::ErrorCode transport_error)
        -> std::expected<HttpResponse, infra::Error>;

    // Streams the response body into `destination` (truncated first). The body
    // of a non-2xx response is not written; its status is returned as usual.
    [[nodiscard]] auto download(const std::string& url, const Headers& headers,
                                const std::filesystem::path& destination,
                                infra::ErrorCode transport_error)
        -> std::expected<HttpResponse, infra::Error>;

private:
    struct CurlDeleter {
        void operator()(CURL* handle) const;
    };

    void reset_(const std::string& url);
    [[nodiscard]] auto perform_(std::string_view method, const std::string& url,
                                infra::ErrorCode transport_error) -> infra::VoidResult;

    std::unique_ptr<CURL, CurlDeleter> curl_;
    const long connect_timeout_seconds_;
};

} // namespace discpack::adapters::http
