#include "immich/network/curl_transport.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>

namespace immich::network {
namespace {

struct CurlEasyDeleter {
    void operator()(CURL* handle) const noexcept { curl_easy_cleanup(handle); }
};

using CurlEasy = std::unique_ptr<CURL, CurlEasyDeleter>;

// curl_slist_append copies each header line
struct SList {
    curl_slist* list = nullptr;

    SList() = default;
    SList(const SList&) = delete;
    SList& operator=(const SList&) = delete;
    ~SList() { if (list) curl_slist_free_all(list); }

    void add(const std::string& header) {
        list = curl_slist_append(list, header.c_str());
    }
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    auto* body = static_cast<std::vector<uint8_t>*>(userdata);
    const auto* bytes = reinterpret_cast<const uint8_t*>(ptr);
    body->insert(body->end(), bytes, bytes + total);
    return total;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    auto* headers = static_cast<HeaderList*>(userdata);

    std::string line(buffer, total);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    // A new status line starts the headers of a redirected response
    if (line.rfind("HTTP/", 0) == 0) {
        headers->clear();
        return total;
    }

    const auto colon = line.find(':');
    if (line.empty() || colon == std::string::npos) {
        return total;
    }

    std::string key = line.substr(0, colon);
    std::string value = line.substr(colon + 1);
    const auto first = value.find_first_not_of(" \t");
    value = first == std::string::npos ? std::string() : value.substr(first);
    headers->emplace_back(std::move(key), std::move(value));
    return total;
}

} // namespace

void ensure_curl_global_init() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

CurlTransport::CurlTransport(ClientConfig config)
    : config_(std::move(config)) {
    ensure_curl_global_init();
}

Result<HttpResponse> CurlTransport::send(const HttpRequest& request) {
    CurlEasy handle(curl_easy_init());
    if (!handle) {
        return Err<HttpResponse>(make_error(ErrorCode::Transport, "Failed to initialize libcurl easy handle", request.url));
    }
    CURL* curl = handle.get();

    SList headers;
    for (const auto& [name, value] : request.headers) {
        headers.add(name + ": " + value);
    }
    // libcurl would otherwise add "Expect: 100-continue" to large uploads
    headers.add("Expect:");

    HttpResponse response;

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.list);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    // A redirected POST would be replayed as a GET without its body, so only
    // body-less requests follow redirects; others see the 3xx as a status
    const bool follow = request.method == HttpMethod::GET || request.method == HttpMethod::HEAD;
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, follow ? 1L : 0L);

    if (config_.connect_timeout.count() > 0) {
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(config_.connect_timeout.count()));
    }
    if (config_.request_timeout.count() > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(config_.request_timeout.count()));
    }
    if (!config_.verify_tls) {
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
    }

    switch (request.method) {
        case HttpMethod::GET:
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
            break;
        case HttpMethod::HEAD:
            curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
            break;
        case HttpMethod::POST:
        case HttpMethod::PUT:
        case HttpMethod::DELETE_METHOD:
            if (request.method != HttpMethod::POST) {
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST,
                                 HttpMethodUtils::to_string(request.method).c_str());
            }
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS,
                             request.body.empty() ? "" : reinterpret_cast<const char*>(request.body.data()));
            break;
    }

    const CURLcode code = curl_easy_perform(curl);
    if (code != CURLE_OK) {
        spdlog::debug("{} {} failed: {}", HttpMethodUtils::to_string(request.method),
                      request.url, curl_easy_strerror(code));
        return Err<HttpResponse>(make_error(ErrorCode::Transport, curl_easy_strerror(code), request.url));
    }

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    response.status_code = static_cast<int>(status);

    spdlog::debug("{} {} -> {} ({} bytes)", HttpMethodUtils::to_string(request.method),
                  request.url, response.status_code, response.body.size());
    return Ok(std::move(response));
}

} // namespace immich::network
