#include "http_client.hpp"

#include <fstream>
#include <stdexcept>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "infra/interrupt.hpp"

namespace discpack::adapters::http {

namespace {

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};
using SlistPtr = std::unique_ptr<curl_slist, SlistDeleter>;

auto build_headers(const Headers& headers) -> SlistPtr {
    curl_slist* list = nullptr;
    for (const auto& [name, value] : headers) {
        auto line = fmt::format("{}: {}", name, value);
        list = curl_slist_append(list, line.c_str());
    }
    return SlistPtr{list};
}

size_t write_to_string(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

// Тело ответа пишется в файл только для 2xx; остальное копится в body для диагностики.
struct DownloadSink {
    CURL* curl;
    std::ofstream* out;
    std::string* error_body;
};

size_t write_to_file(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* sink = static_cast<DownloadSink*>(userdata);
    const size_t bytes = size * nmemb;

    long status = 0;
    curl_easy_getinfo(sink->curl, CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        if (sink->error_body->size() < 4096) {
            sink->error_body->append(ptr, bytes);
        }
        return bytes;
    }

    sink->out->write(ptr, static_cast<std::streamsize>(bytes));
    return *sink->out ? bytes : 0; // 0 прерывает передачу с CURLE_WRITE_ERROR
}

// Called by curl about once a second, also while a transfer is stalled.
int abort_on_interrupt(void*, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    return infra::is_interrupted() ? 1 : 0;
}

} // namespace

CurlGlobal::CurlGlobal() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlGlobal::~CurlGlobal() {
    curl_global_cleanup();
}

void HttpClient::CurlDeleter::operator()(CURL* handle) const {
    curl_easy_cleanup(handle);
}

HttpClient::HttpClient(long connect_timeout_seconds)
    : curl_(curl_easy_init())
    , connect_timeout_seconds_(connect_timeout_seconds)
{
    if (!curl_) {
        throw std::runtime_error("Failed to initialise curl easy handle");
    }
}

HttpClient::~HttpClient() = default;

void HttpClient::reset_(const std::string& url) {
    CURL* curl = curl_.get();
    curl_easy_reset(curl);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, connect_timeout_seconds_);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "discpack");
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, abort_on_interrupt);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
}

auto HttpClient::perform_(std::string_view method, const std::string& url,
                          infra::ErrorCode transport_error) -> infra::VoidResult
{
    const CURLcode res = curl_easy_perform(curl_.get());
    if (res == CURLE_ABORTED_BY_CALLBACK) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Interrupted,
                             fmt::format("{} {} interrupted", method, url)));
    }
    if (res != CURLE_OK) {
        return std::unexpected(infra::make_error(transport_error,
                             fmt::format("{} {}: {}", method, url, curl_easy_strerror(res))));
    }
    return {};
}

auto HttpClient::get(const std::string& url, const Headers& headers,
                     infra::ErrorCode transport_error)
    -> std::expected<HttpResponse, infra::Error>
{
    reset_(url);
    CURL* curl = curl_.get();
    auto header_list = build_headers(headers);

    HttpResponse response;
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_to_string);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);

    spdlog::debug("GET {}", url);
    if (auto done = perform_("GET", url, transport_error); !done) {
        return std::unexpected(std::move(done.error()));
    }
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

auto HttpClient::post_json(const std::string& url, const Headers& headers,
                           std::string_view body,
                           infra::ErrorCode transport_error)
    -> std::expected<HttpResponse, infra::Error>
{
    reset_(url);
    CURL* curl = curl_.get();

    Headers all_headers = headers;
    all_headers.emplace_back("Content-Type", "application/json");
    all_headers.emplace_back("Accept", "application/json");
    auto header_list = build_headers(all_headers);

    HttpResponse response;
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.data());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_to_string);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);

    spdlog::debug("POST {} {}", url, body);
    if (auto done = perform_("POST", url, transport_error); !done) {
        return std::unexpected(std::move(done.error()));
    }
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

auto HttpClient::download(const std::string& url, const Headers& headers,
                          const std::filesystem::path& destination,
                          infra::ErrorCode transport_error)
    -> std::expected<HttpResponse, infra::Error>
{
    std::ofstream out(destination, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied,
                             fmt::format("Cannot open {} for writing", destination.string())));
    }

    reset_(url);
    CURL* curl = curl_.get();
    auto header_list = build_headers(headers);

    HttpResponse response;
    DownloadSink sink{curl, &out, &response.body};
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_to_file);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &sink);

    spdlog::debug("GET {} -> {}", url, destination.string());
    auto done = perform_("GET", url, transport_error);
    out.close();
    if (!done) {
        return std::unexpected(std::move(done.error()));
    }
    if (!out) {
        return std::unexpected(infra::make_error(transport_error,
                             fmt::format("Write to {} failed", destination.string())));
    }
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

} // namespace discpack::adapters::http
