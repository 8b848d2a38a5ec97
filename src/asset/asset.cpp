#include "immich/asset/asset.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <stdexcept>
#include <system_error>

namespace immich::asset {
namespace fs = std::filesystem;

namespace {

Error invalid_asset(const fs::path& path, const std::string& reason) {
    return make_error(ErrorCode::InvalidAsset, reason, path.string());
}

} // namespace

Asset::Asset(std::shared_ptr<const Bytes> data, util::Checksum checksum)
    : checksum_(checksum), data_(std::move(data)) {}

Result<Asset> Asset::from_path(const fs::path& path, std::string device_id) {
    std::error_code ec;
    const auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        return Err<Asset>(invalid_asset(path, "path does not exist"));
    }
    if (fs::is_directory(status)) {
        return Err<Asset>(invalid_asset(path, "path is a directory"));
    }
    if (!fs::is_regular_file(status)) {
        return Err<Asset>(invalid_asset(path, "path is not a regular file"));
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<Asset>(invalid_asset(path, "failed to open file for reading"));
    }

    Bytes bytes;
    const auto file_size = fs::file_size(path, ec);
    if (!ec) {
        bytes.reserve(static_cast<std::size_t>(file_size));
    }

    char buffer[64 * 1024];
    while (input.read(buffer, sizeof(buffer)) || input.gcount() > 0) {
        const auto count = static_cast<std::size_t>(input.gcount());
        bytes.insert(bytes.end(), buffer, buffer + count);
    }
    if (input.bad()) {
        return Err<Asset>(invalid_asset(path, "read error"));
    }

    util::Checksum checksum;
    try {
        checksum = util::Checksum::sha1(bytes);
    } catch (const std::exception& e) {
        return Err<Asset>(invalid_asset(path, e.what()));
    }

    Asset asset(std::make_shared<const Bytes>(std::move(bytes)), checksum);
    asset.path_ = path;
    asset.device_id_ = std::move(device_id);

    const auto write_time = fs::last_write_time(path, ec);
    if (ec) {
        spdlog::warn("Cannot read modification time of {}, using fallback timestamp", path.string());
    } else {
        asset.modified_at_ = util::DateTime::from_file_time(write_time);
        // POSIX filesystems expose no portable birth time
        asset.created_at_ = asset.modified_at_;
    }

    const auto name = path.filename().string();
    if (name.empty()) {
        asset.device_asset_id_ = std::string(asset.device_id_) + " - " + asset.created_at_.filename();
    } else {
        asset.device_asset_id_ = name;
    }

    spdlog::debug("Prepared asset {} ({} bytes, sha1 {})",
                  asset.device_asset_id_, asset.size(), asset.checksum_.hex());
    return Ok(std::move(asset));
}

Asset Asset::from_bytes(std::string device_asset_id,
                        Bytes data,
                        util::DateTime created_at,
                        util::DateTime modified_at,
                        std::string device_id) {
    const auto checksum = util::Checksum::sha1(data);
    Asset asset(std::make_shared<const Bytes>(std::move(data)), checksum);
    asset.device_id_ = std::move(device_id);
    asset.created_at_ = created_at;
    asset.modified_at_ = modified_at;
    if (device_asset_id.empty()) {
        device_asset_id = asset.device_id_ + " - " + created_at.filename();
    }
    asset.device_asset_id_ = std::move(device_asset_id);
    return asset;
}

} // namespace immich::asset
