#pragma once

#include "immich/api/session.hpp"
#include "immich/core/result.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace immich::api {

/**
 * @brief Owner of an album on the server
 */
struct User {
    std::string id;
    std::string email;
    std::string name;
};

struct Album {
    std::string id;
    std::string name;
    std::size_t asset_count = 0;
    User owner;
    bool shared = false;

    [[nodiscard]] bool empty() const noexcept { return asset_count == 0; }
};

/**
 * @brief Per-asset answer of PUT /albums/{id}/assets
 */
struct AlbumAssetResult {
    std::string id;
    bool success = false;
    std::string error;   ///< e.g. "duplicate", "no_permission"
};

/**
 * @brief GET /albums
 */
Result<std::vector<Album>> list_albums(const Session& session);

/**
 * @brief POST /albums; the server answers 201 with the new album
 */
Result<Album> create_album(const Session& session, const std::string& name);

/**
 * @brief First album whose name matches exactly, created when none does
 */
Result<Album> get_or_create_album(const Session& session, const std::string& name);

/**
 * @brief PUT /albums/{id}/assets
 *
 * The album id is checked for UUID shape before it is placed in the URL.
 */
Result<std::vector<AlbumAssetResult>> add_assets_to_album(const Session& session,
                                                          const std::string& album_id,
                                                          const std::vector<std::string>& asset_ids);

/**
 * @brief Number of entries the server actually added
 */
std::size_t count_successful(const std::vector<AlbumAssetResult>& results);

Result<Album> album_from_json(const nlohmann::json& value);

} // namespace immich::api
