#pragma once

#include "immich/api/album.hpp"
#include "immich/client/client.hpp"
#include "immich/core/result.hpp"
#include "immich/takeout/source.hpp"
#include "immich/takeout/takeout.hpp"
#include "immich/upload/sink.hpp"

#include <cstddef>
#include <vector>

namespace immich::takeout {

/**
 * @brief Album every imported photo and video is added to
 */
inline constexpr const char* kImportAlbumName = "Google Takeout Import";

struct TakeoutImport {
    /// One entry per asset pulled, as Client::upload_to_album() reports it
    std::vector<api::AlbumAssetResult> imported;
    /// One entry per uploaded asset and Google Photos album it belonged to
    std::vector<api::AlbumAssetResult> moved;
};

/**
 * @brief Upload a Takeout archive and recreate its albums
 *
 * Everything the filter keeps is uploaded with up to limit requests in
 * flight and added to kImportAlbumName. Afterwards each album of the archive
 * is looked up or created by name and receives the server ids of its
 * created and duplicate assets. An album that cannot be created or filled
 * reports its assets in moved with success == false.
 *
 * RETURNS: the error of Client::upload_to_album(), or of creating the import
 *          album; nothing is uploaded when the import album cannot be created
 */
Result<TakeoutImport> import_takeout(const Client& client,
                                     std::size_t limit,
                                     const Takeout& takeout,
                                     TakeoutAssetSource::Filter filter = nullptr,
                                     upload::ResultSink* progress = nullptr);

} // namespace immich::takeout
