#include "immich/api/upload.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace immich::api {

using json = nlohmann::json;
using network::HttpMethod;
using network::HttpResponse;

namespace {

constexpr const char* kUploadPath = "/assets";
constexpr const char* kChecksumHeader = "x-immich-checksum";

} // namespace

const char* to_string(UploadStatus status) {
    switch (status) {
        case UploadStatus::Created: return "Created";
        case UploadStatus::Duplicate: return "Duplicate";
        case UploadStatus::Failed: return "Failed";
    }
    return "Unknown";
}

UploadOutcome::UploadOutcome(UploadStatus status,
                             std::string device_asset_id,
                             std::optional<std::string> remote_id,
                             std::optional<Error> error)
    : status_(status),
      device_asset_id_(std::move(device_asset_id)),
      remote_id_(std::move(remote_id)),
      error_(std::move(error)) {}

UploadOutcome UploadOutcome::created(std::string device_asset_id, std::string remote_id) {
    return UploadOutcome(UploadStatus::Created, std::move(device_asset_id), std::move(remote_id), std::nullopt);
}

UploadOutcome UploadOutcome::duplicate(std::string device_asset_id, std::string remote_id) {
    return UploadOutcome(UploadStatus::Duplicate, std::move(device_asset_id), std::move(remote_id), std::nullopt);
}

UploadOutcome UploadOutcome::failed(std::string device_asset_id, Error error) {
    if (error.subject.empty()) {
        error.subject = device_asset_id;
    }
    return UploadOutcome(UploadStatus::Failed, std::move(device_asset_id), std::nullopt, std::move(error));
}

UploadOutcome SessionUploader::upload(const asset::Asset& asset) {
    return upload_asset(session_, asset);
}

Result<network::MultipartBody> build_upload_body(const asset::Asset& asset) {
    const util::DateTime created = asset.captured_at().value_or(asset.created_at());
    network::MultipartBuilder builder(network::MultipartBuilder::boundary_for(asset.data()));
    builder.add_text("deviceAssetId", asset.device_asset_id())
        .add_text("deviceId", asset.device_id())
        .add_text("fileCreatedAt", created.to_string())
        .add_text("fileModifiedAt", asset.modified_at().to_string())
        .add_bytes("assetData", asset.data(), asset.device_asset_id());

    auto body = builder.finish();
    if (body.is_error()) {
        return Err<network::MultipartBody>(make_error(ErrorCode::InvalidAsset,
                                                      "Cannot encode upload form: " + body.error().message,
                                                      asset.device_asset_id()));
    }
    return body;
}

UploadOutcome parse_upload_response(const std::string& device_asset_id, const HttpResponse& response) {
    if (!response.is_success()) {
        return UploadOutcome::failed(device_asset_id,
                                     make_status_error(response.status_code, response.body_as_string()));
    }

    std::string id;
    std::string status;
    try {
        const auto body = json::parse(response.body_as_string());
        id = body.at("id").get<std::string>();
        status = body.at("status").get<std::string>();
    } catch (const json::exception& e) {
        return UploadOutcome::failed(device_asset_id,
                                     make_error(ErrorCode::Protocol, std::string("Invalid upload response: ") + e.what()));
    }

    if (id.empty()) {
        return UploadOutcome::failed(device_asset_id,
                                     make_error(ErrorCode::Protocol, "Upload response carries an empty id"));
    }
    if (status == "created") {
        return UploadOutcome::created(device_asset_id, std::move(id));
    }
    if (status == "duplicate") {
        return UploadOutcome::duplicate(device_asset_id, std::move(id));
    }
    return UploadOutcome::failed(device_asset_id,
                                 make_error(ErrorCode::Protocol, "Unknown upload status: " + status));
}

UploadOutcome upload_asset(const Session& session, const asset::Asset& asset) {
    auto body = build_upload_body(asset);
    if (body.is_error()) {
        spdlog::warn("Upload of {} failed: {}", asset.device_asset_id(), body.error().to_string());
        return UploadOutcome::failed(asset.device_asset_id(), body.error());
    }

    auto sent = session.send(HttpMethod::POST, kUploadPath, std::move(body.value().data),
                             {{"Content-Type", body.value().content_type},
                              {kChecksumHeader, asset.checksum().hex()}});
    if (sent.is_error()) {
        spdlog::warn("Upload of {} failed: {}", asset.device_asset_id(), sent.error().to_string());
        return UploadOutcome::failed(asset.device_asset_id(), sent.error());
    }

    auto outcome = parse_upload_response(asset.device_asset_id(), sent.value());
    if (outcome.ok()) {
        spdlog::debug("Uploaded {}: {} [{}]", asset.device_asset_id(), to_string(outcome.status()), *outcome.remote_id());
    } else {
        spdlog::warn("Upload of {} failed: {}", asset.device_asset_id(), outcome.error()->to_string());
    }
    return outcome;
}

} // namespace immich::api
