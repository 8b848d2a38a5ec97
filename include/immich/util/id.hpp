#pragma once

#include <string_view>

namespace immich::util {

/**
 * @brief Cheap shape check for server ids before they are placed in a URL
 *
 * Accepts 36 characters, alphanumeric except for dashes at positions
 * 8, 13, 18 and 23 ("f0edb589-1312-4161-b41e-0a18f127b3dd").
 */
bool is_valid_remote_id(std::string_view id) noexcept;

} // namespace immich::util
