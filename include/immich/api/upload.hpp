#pragma once

#include "immich/api/session.hpp"
#include "immich/asset/asset.hpp"
#include "immich/core/error.hpp"
#include "immich/network/multipart.hpp"

#include <optional>
#include <string>

namespace immich::api {

enum class UploadStatus {
    Created,    ///< Server stored a new asset
    Duplicate,  ///< Server already had an asset with this checksum
    Failed
};

const char* to_string(UploadStatus status);

/**
 * @brief Result of one upload attempt
 *
 * Built only through the named constructors, which keep status, remote id
 * and error consistent: Failed never carries a remote id, Created and
 * Duplicate never carry an error.
 */
class UploadOutcome {
public:
    static UploadOutcome created(std::string device_asset_id, std::string remote_id);
    static UploadOutcome duplicate(std::string device_asset_id, std::string remote_id);
    static UploadOutcome failed(std::string device_asset_id, Error error);

    [[nodiscard]] UploadStatus status() const noexcept { return status_; }
    [[nodiscard]] const std::string& device_asset_id() const noexcept { return device_asset_id_; }
    [[nodiscard]] const std::optional<std::string>& remote_id() const noexcept { return remote_id_; }
    [[nodiscard]] const std::optional<Error>& error() const noexcept { return error_; }

    [[nodiscard]] bool ok() const noexcept { return status_ != UploadStatus::Failed; }

private:
    UploadOutcome(UploadStatus status,
                  std::string device_asset_id,
                  std::optional<std::string> remote_id,
                  std::optional<Error> error);

    UploadStatus status_;
    std::string device_asset_id_;
    std::optional<std::string> remote_id_;
    std::optional<Error> error_;
};

/**
 * @brief Uploads one asset and reports what happened
 *
 * Implementations are called concurrently by the upload engine and must not
 * throw; every failure is reported as a Failed outcome.
 */
class AssetUploader {
public:
    virtual ~AssetUploader() = default;

    virtual UploadOutcome upload(const asset::Asset& asset) = 0;
};

/**
 * @brief AssetUploader that talks to the server through a Session
 */
class SessionUploader : public AssetUploader {
public:
    explicit SessionUploader(const Session& session) : session_(session) {}

    UploadOutcome upload(const asset::Asset& asset) override;

private:
    const Session& session_;
};

/**
 * @brief POST /assets for a single asset; one network call, no retry
 */
UploadOutcome upload_asset(const Session& session, const asset::Asset& asset);

/**
 * @brief Multipart form for POST /assets
 *
 * The boundary is chosen so it never occurs in the file bytes. Fails with
 * ErrorCode::InvalidAsset when the device asset id holds a line break.
 */
Result<network::MultipartBody> build_upload_body(const asset::Asset& asset);

UploadOutcome parse_upload_response(const std::string& device_asset_id,
                                    const network::HttpResponse& response);

} // namespace immich::api
