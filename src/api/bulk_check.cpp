#include "immich/api/bulk_check.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <unordered_map>

namespace immich::api {

using json = nlohmann::json;
using network::HttpStatus;

namespace {

constexpr const char* kBulkCheckPath = "/assets/bulk-upload-check";

} // namespace

Result<std::vector<RemoteCheck>> bulk_upload_check(const Session& session,
                                                   const std::vector<asset::Asset>& assets) {
    using Checks = std::vector<RemoteCheck>;

    if (assets.empty()) {
        return Ok(Checks{});
    }

    json request_assets = json::array();
    for (const auto& asset : assets) {
        request_assets.push_back({{"id", asset.device_asset_id()}, {"checksum", asset.checksum().hex()}});
    }

    auto sent = session.post_json(kBulkCheckPath, json{{"assets", request_assets}});
    if (sent.is_error()) {
        return Err<Checks>(sent.error());
    }
    const auto& response = sent.value();
    if (!response.has_status(HttpStatus::OK)) {
        return Err<Checks>(make_status_error(response.status_code, response.body_as_string()));
    }

    std::unordered_map<std::string, RemoteCheck> by_id;
    std::size_t result_count = 0;
    try {
        const auto body = json::parse(response.body_as_string());
        const auto& results = body.at("results");
        if (!results.is_array()) {
            return Err<Checks>(make_error(ErrorCode::Protocol, "bulk check results is not an array"));
        }
        result_count = results.size();
        for (const auto& entry : results) {
            RemoteCheck check;
            check.device_asset_id = entry.at("id").get<std::string>();
            const auto action = entry.at("action").get<std::string>();
            if (action == "accept") {
                check.status = RemoteStatus::Absent;
            } else if (action == "reject") {
                check.status = RemoteStatus::Present;
            } else {
                return Err<Checks>(make_error(ErrorCode::Protocol, "Unknown bulk check action: " + action));
            }
            if (entry.contains("assetId") && entry["assetId"].is_string()) {
                check.remote_id = entry["assetId"].get<std::string>();
            }
            by_id[check.device_asset_id] = std::move(check);
        }
    } catch (const json::exception& e) {
        return Err<Checks>(make_error(ErrorCode::Protocol, std::string("Invalid bulk check response: ") + e.what()));
    }

    if (result_count != assets.size()) {
        return Err<Checks>(make_error(ErrorCode::Protocol,
                                      "bulk check returned " + std::to_string(result_count) +
                                      " results for " + std::to_string(assets.size()) + " assets"));
    }

    Checks checks;
    checks.reserve(assets.size());
    for (const auto& asset : assets) {
        const auto it = by_id.find(asset.device_asset_id());
        if (it == by_id.end()) {
            return Err<Checks>(make_error(ErrorCode::Protocol, "bulk check omitted an asset", asset.device_asset_id()));
        }
        checks.push_back(it->second);
    }

    spdlog::debug("Bulk check: {} assets checked", checks.size());
    return Ok(std::move(checks));
}

} // namespace immich::api
