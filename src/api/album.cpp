#include "immich/api/album.hpp"

#include "immich/util/id.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace immich::api {

using json = nlohmann::json;
using network::HttpResponse;
using network::HttpStatus;

namespace {

constexpr const char* kAlbumsPath = "/albums";

Error protocol_error(const std::string& what) {
    return make_error(ErrorCode::Protocol, "Invalid album response: " + what);
}

Result<json> parse_body(const HttpResponse& response) {
    try {
        return Ok(json::parse(response.body_as_string()));
    } catch (const json::exception& e) {
        return Err<json>(protocol_error(e.what()));
    }
}

} // namespace

Result<Album> album_from_json(const json& value) {
    try {
        Album album;
        album.id = value.at("id").get<std::string>();
        album.name = value.at("albumName").get<std::string>();
        album.asset_count = value.value("assetCount", static_cast<std::size_t>(0));
        album.shared = value.value("shared", false);
        if (value.contains("owner") && value["owner"].is_object()) {
            const auto& owner = value["owner"];
            album.owner.id = owner.value("id", "");
            album.owner.email = owner.value("email", "");
            album.owner.name = owner.value("name", "");
        }
        return Ok(std::move(album));
    } catch (const json::exception& e) {
        return Err<Album>(protocol_error(e.what()));
    }
}

Result<std::vector<Album>> list_albums(const Session& session) {
    auto sent = session.get(kAlbumsPath);
    if (sent.is_error()) {
        return Err<std::vector<Album>>(sent.error());
    }
    const auto& response = sent.value();
    if (!response.has_status(HttpStatus::OK)) {
        return Err<std::vector<Album>>(make_status_error(response.status_code, response.body_as_string()));
    }

    auto body = parse_body(response);
    if (body.is_error()) {
        return Err<std::vector<Album>>(body.error());
    }
    if (!body.value().is_array()) {
        return Err<std::vector<Album>>(protocol_error("expected a JSON array"));
    }

    std::vector<Album> albums;
    albums.reserve(body.value().size());
    for (const auto& entry : body.value()) {
        auto album = album_from_json(entry);
        if (album.is_error()) {
            return Err<std::vector<Album>>(album.error());
        }
        albums.push_back(std::move(album.value()));
    }

    spdlog::debug("Server lists {} albums", albums.size());
    return Ok(std::move(albums));
}

Result<Album> create_album(const Session& session, const std::string& name) {
    auto sent = session.post_json(kAlbumsPath, json{{"albumName", name}});
    if (sent.is_error()) {
        return Err<Album>(sent.error());
    }
    const auto& response = sent.value();
    if (!response.has_status(HttpStatus::CREATED)) {
        return Err<Album>(make_status_error(response.status_code, response.body_as_string()));
    }

    auto body = parse_body(response);
    if (body.is_error()) {
        return Err<Album>(body.error());
    }

    auto album = album_from_json(body.value());
    if (album.is_ok()) {
        spdlog::info("Created album '{}' [{}]", album.value().name, album.value().id);
    }
    return album;
}

Result<Album> get_or_create_album(const Session& session, const std::string& name) {
    auto albums = list_albums(session);
    if (albums.is_error()) {
        return Err<Album>(albums.error());
    }

    auto& existing = albums.value();
    const auto it = std::find_if(existing.begin(), existing.end(),
                                 [&](const Album& album) { return album.name == name; });
    if (it != existing.end()) {
        return Ok(std::move(*it));
    }
    return create_album(session, name);
}

Result<std::vector<AlbumAssetResult>> add_assets_to_album(const Session& session,
                                                          const std::string& album_id,
                                                          const std::vector<std::string>& asset_ids) {
    using Results = std::vector<AlbumAssetResult>;

    if (!util::is_valid_remote_id(album_id)) {
        return Err<Results>(make_error(ErrorCode::InvalidId, "Album has an invalid id", album_id));
    }

    auto sent = session.put_json(std::string(kAlbumsPath) + "/" + album_id + "/assets",
                                 json{{"ids", asset_ids}});
    if (sent.is_error()) {
        return Err<Results>(sent.error());
    }
    const auto& response = sent.value();
    if (!response.has_status(HttpStatus::OK)) {
        return Err<Results>(make_status_error(response.status_code, response.body_as_string()));
    }

    auto body = parse_body(response);
    if (body.is_error()) {
        return Err<Results>(body.error());
    }
    if (!body.value().is_array()) {
        return Err<Results>(protocol_error("expected a JSON array"));
    }

    Results results;
    try {
        for (const auto& entry : body.value()) {
            AlbumAssetResult result;
            result.id = entry.at("id").get<std::string>();
            result.success = entry.at("success").get<bool>();
            result.error = entry.value("error", "");
            results.push_back(std::move(result));
        }
    } catch (const json::exception& e) {
        return Err<Results>(protocol_error(e.what()));
    }

    spdlog::info("Added {} assets to album {}", results.size(), album_id);
    return Ok(std::move(results));
}

std::size_t count_successful(const std::vector<AlbumAssetResult>& results) {
    return static_cast<std::size_t>(std::count_if(results.begin(), results.end(),
        [](const AlbumAssetResult& result) { return result.success; }));
}

} // namespace immich::api
