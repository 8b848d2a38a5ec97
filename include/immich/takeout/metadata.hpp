#pragma once

#include "immich/core/result.hpp"
#include "immich/util/datetime.hpp"

#include <string>

namespace immich::takeout {

/**
 * @brief Capture time from a Google Photos JSON sidecar
 *
 * Reads photoTakenTime.timestamp, Unix seconds sent as a string (a JSON
 * number is accepted too). Fails with ErrorCode::InvalidArchive when the
 * text is not JSON, the field is missing or the value is not a usable time.
 */
Result<util::DateTime> parse_photo_taken_time(const std::string& sidecar_json);

} // namespace immich::takeout
