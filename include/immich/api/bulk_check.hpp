#pragma once

#include "immich/api/session.hpp"
#include "immich/asset/asset.hpp"
#include "immich/core/result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace immich::api {

enum class RemoteStatus {
    Absent,   ///< Server would accept the upload
    Present   ///< Server already holds an asset with this checksum
};

struct RemoteCheck {
    std::string device_asset_id;
    RemoteStatus status = RemoteStatus::Absent;
    std::optional<std::string> remote_id;   ///< Existing asset id when Present
};

/**
 * @brief POST /assets/bulk-upload-check
 *
 * Asks the server which checksums it already stores, without sending any
 * file bytes. Results are returned in request order. The server must answer
 * with one result per asset; anything else is ErrorCode::Protocol.
 * Uploading directly is equally safe: the server deduplicates on upload too.
 */
Result<std::vector<RemoteCheck>> bulk_upload_check(const Session& session,
                                                   const std::vector<asset::Asset>& assets);

} // namespace immich::api
