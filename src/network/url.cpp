#include "immich/network/url.hpp"

namespace immich::network {
namespace {

bool starts_with(const std::string& value, std::string_view prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

Result<BaseUrl> BaseUrl::parse(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }

    if (!starts_with(url, "https://") && !starts_with(url, "http://")) {
        return Err<BaseUrl>(make_error(ErrorCode::InvalidUrl, "Url must start with http or https", url));
    }

    const auto scheme_end = url.find("://") + 3;
    if (scheme_end >= url.size()) {
        return Err<BaseUrl>(make_error(ErrorCode::InvalidUrl, "Url has no host", url));
    }

    return Ok(BaseUrl(std::move(url)));
}

std::string BaseUrl::join(std::string_view path) const {
    std::string full = url_;
    if (path.empty() || path.front() != '/') {
        full.push_back('/');
    }
    full.append(path.data(), path.size());
    return full;
}

} // namespace immich::network
