#include "immich/takeout/import.hpp"

#include <spdlog/spdlog.h>

#include <map>
#include <string>

namespace immich::takeout {

namespace {

void report_failed(const std::vector<std::string>& ids,
                   const Error& error,
                   std::vector<api::AlbumAssetResult>& moved) {
    for (const auto& id : ids) {
        api::AlbumAssetResult result;
        result.id = id;
        result.error = error.to_string();
        moved.push_back(std::move(result));
    }
}

} // namespace

Result<TakeoutImport> import_takeout(const Client& client,
                                     std::size_t limit,
                                     const Takeout& takeout,
                                     TakeoutAssetSource::Filter filter,
                                     upload::ResultSink* progress) {
    auto import_album = client.get_or_create_album(kImportAlbumName);
    if (import_album.is_error()) {
        return Err<TakeoutImport>(import_album.error());
    }

    TakeoutAssetSource source(takeout, std::move(filter));
    upload::CollectingSink uploaded;
    upload::TeeSink observer(uploaded, progress);

    auto imported = client.upload_to_album(limit, source, import_album.value(), &observer);
    if (imported.is_error()) {
        return Err<TakeoutImport>(imported.error());
    }

    TakeoutImport result;
    result.imported = std::move(imported.value());

    std::map<std::string, std::string> remote_ids;
    for (const auto& outcome : uploaded.take()) {
        if (outcome.ok() && outcome.remote_id()) {
            remote_ids.emplace(outcome.device_asset_id(), *outcome.remote_id());
        }
    }

    for (const auto& [name, device_ids] : takeout.albums()) {
        std::vector<std::string> ids;
        for (const auto& device_id : device_ids) {
            const auto it = remote_ids.find(device_id);
            if (it != remote_ids.end()) {
                ids.push_back(it->second);
            }
        }
        if (ids.empty()) {
            continue;
        }

        auto album = client.get_or_create_album(name);
        if (album.is_error()) {
            spdlog::warn("Cannot recreate album '{}': {}", name, album.error().to_string());
            report_failed(ids, album.error(), result.moved);
            continue;
        }

        auto added = api::add_assets_to_album(client.session(), album.value().id, ids);
        if (added.is_error()) {
            spdlog::warn("Cannot fill album '{}': {}", name, added.error().to_string());
            report_failed(ids, added.error(), result.moved);
            continue;
        }
        spdlog::info("Added {} of {} assets to album '{}'",
                     api::count_successful(added.value()), ids.size(), name);
        result.moved.insert(result.moved.end(), added.value().begin(), added.value().end());
    }

    return Ok(std::move(result));
}

} // namespace immich::takeout
