#pragma once

#include "immich/core/result.hpp"

#include <string>
#include <string_view>

namespace immich::network {

/**
 * @brief Validated API root, e.g. "https://photos.example.org/api"
 *
 * Must start with http:// or https://. Trailing slashes are dropped so that
 * joining "/albums" never produces a double slash.
 */
class BaseUrl {
public:
    static Result<BaseUrl> parse(std::string url);

    [[nodiscard]] const std::string& str() const noexcept { return url_; }

    /**
     * @brief Append an endpoint path; a missing leading '/' is added
     */
    [[nodiscard]] std::string join(std::string_view path) const;

private:
    explicit BaseUrl(std::string url) : url_(std::move(url)) {}

    std::string url_;
};

} // namespace immich::network
