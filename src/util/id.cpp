#include "immich/util/id.hpp"

#include <cctype>

namespace immich::util {

bool is_valid_remote_id(std::string_view id) noexcept {
    if (id.size() != 36) {
        return false;
    }
    for (std::size_t i = 0; i < id.size(); ++i) {
        const bool dash_position = (i == 8 || i == 13 || i == 18 || i == 23);
        if (dash_position) {
            if (id[i] != '-') {
                return false;
            }
        } else if (!std::isalnum(static_cast<unsigned char>(id[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace immich::util
