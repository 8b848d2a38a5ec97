#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#ifndef _WIN32
#include <strings.h>
#endif

namespace immich {
namespace network {

/**
 * @brief HTTP request methods used against the server API
 */
enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE_METHOD,  // renamed to avoid the Windows DELETE macro
    HEAD
};

/**
 * @brief Status codes the client branches on
 */
enum class HttpStatus {
    OK = 200,
    CREATED = 201,
    NO_CONTENT = 204,
    BAD_REQUEST = 400,
    UNAUTHORIZED = 401,
    FORBIDDEN = 403,
    NOT_FOUND = 404,
    INTERNAL_SERVER_ERROR = 500
};

using HeaderList = std::vector<std::pair<std::string, std::string>>;

namespace detail {

inline int strcasecmp_cross_platform(const char* s1, const char* s2) {
#ifdef _WIN32
    return _stricmp(s1, s2);
#else
    return strcasecmp(s1, s2);
#endif
}

inline std::string find_header(const HeaderList& headers, const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (strcasecmp_cross_platform(key.c_str(), name.c_str()) == 0) {
            return value;
        }
    }
    return "";
}

} // namespace detail

/**
 * @brief Outgoing request handed to a Transport
 *
 * The url is absolute. Headers keep insertion order; names are compared
 * case-insensitively per RFC 7230.
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HeaderList headers;
    std::vector<uint8_t> body;

    void set_header(const std::string& name, const std::string& value) {
        for (auto& [key, existing] : headers) {
            if (detail::strcasecmp_cross_platform(key.c_str(), name.c_str()) == 0) {
                existing = value;
                return;
            }
        }
        headers.emplace_back(name, value);
    }

    std::string get_header(const std::string& name) const {
        return detail::find_header(headers, name);
    }

    bool has_header(const std::string& name) const {
        return !get_header(name).empty();
    }

    void set_body(const std::string& content) {
        body.assign(content.begin(), content.end());
    }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }
};

/**
 * @brief Response as received from the server
 */
struct HttpResponse {
    int status_code = 0;
    HeaderList headers;
    std::vector<uint8_t> body;

    HttpResponse() = default;

    explicit HttpResponse(HttpStatus status)
        : status_code(static_cast<int>(status)) {
    }

    HttpResponse(int status, const std::string& content)
        : status_code(status), body(content.begin(), content.end()) {
    }

    bool is_success() const {
        return status_code >= 200 && status_code < 300;
    }

    bool has_status(HttpStatus status) const {
        return status_code == static_cast<int>(status);
    }

    std::string get_header(const std::string& name) const {
        return detail::find_header(headers, name);
    }

    /**
     * @brief Body as text
     *
     * Warning: only meaningful for textual (JSON) responses.
     */
    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }
};

/**
 * @brief Helper functions for HTTP method conversions
 */
class HttpMethodUtils {
public:
    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::POST: return "POST";
            case HttpMethod::PUT: return "PUT";
            case HttpMethod::DELETE_METHOD: return "DELETE";
            case HttpMethod::HEAD: return "HEAD";
        }
        return "UNKNOWN";
    }
};

} // namespace network
} // namespace immich
