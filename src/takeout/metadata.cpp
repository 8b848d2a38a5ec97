#include "immich/takeout/metadata.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <exception>
#include <string>

namespace immich::takeout {

using json = nlohmann::json;

namespace {

Error invalid_metadata(std::string message) {
    return make_error(ErrorCode::InvalidArchive, "Unable to parse metadata: " + std::move(message));
}

Result<std::int64_t> to_seconds(const json& timestamp) {
    if (timestamp.is_number_integer()) {
        return Ok(timestamp.get<std::int64_t>());
    }
    if (!timestamp.is_string()) {
        return Err<std::int64_t>(invalid_metadata("timestamp is neither string nor integer"));
    }

    const auto text = timestamp.get<std::string>();
    std::size_t used = 0;
    std::int64_t seconds = 0;
    try {
        seconds = std::stoll(text, &used);
    } catch (const std::exception&) {
        return Err<std::int64_t>(invalid_metadata("timestamp '" + text + "' is not a number"));
    }
    if (used != text.size()) {
        return Err<std::int64_t>(invalid_metadata("timestamp '" + text + "' is not a number"));
    }
    return Ok(seconds);
}

} // namespace

Result<util::DateTime> parse_photo_taken_time(const std::string& sidecar_json) {
    json document;
    try {
        document = json::parse(sidecar_json);
    } catch (const json::parse_error& e) {
        return Err<util::DateTime>(invalid_metadata(e.what()));
    }

    if (!document.is_object() || !document.contains("photoTakenTime") ||
        !document["photoTakenTime"].is_object() || !document["photoTakenTime"].contains("timestamp")) {
        return Err<util::DateTime>(invalid_metadata("photoTakenTime.timestamp is missing"));
    }

    auto seconds = to_seconds(document["photoTakenTime"]["timestamp"]);
    if (seconds.is_error()) {
        return Err<util::DateTime>(seconds.error());
    }

    using clock = util::DateTime::clock;
    const auto limit = std::chrono::duration_cast<std::chrono::seconds>(clock::duration::max()).count();
    if (seconds.value() > limit || seconds.value() < -limit) {
        return Err<util::DateTime>(invalid_metadata("timestamp out of range"));
    }

    const auto since_epoch = std::chrono::duration_cast<clock::duration>(std::chrono::seconds(seconds.value()));
    return Ok(util::DateTime(clock::time_point(since_epoch)));
}

} // namespace immich::takeout
