#pragma once

#include "immich/core/config.hpp"
#include "immich/core/result.hpp"
#include "immich/util/checksum.hpp"
#include "immich/util/datetime.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace immich::asset {

/**
 * @brief One local image or video prepared for upload
 *
 * The file is read and hashed once, when the Asset is built. Copies share the
 * same immutable byte buffer, so handing an Asset to a worker thread is cheap
 * and never re-hashes it.
 */
class Asset {
public:
    using Bytes = std::vector<std::uint8_t>;

    /**
     * @brief Build an asset from a regular file on disk
     *
     * Fails with ErrorCode::InvalidAsset when the path is missing, is a
     * directory or other non-regular file, or cannot be read. The device
     * asset id is the file name.
     */
    static Result<Asset> from_path(const std::filesystem::path& path,
                                   std::string device_id = kClientName);

    /**
     * @brief Build an asset from bytes already in memory
     */
    static Asset from_bytes(std::string device_asset_id,
                            Bytes data,
                            util::DateTime created_at = {},
                            util::DateTime modified_at = {},
                            std::string device_id = kClientName);

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] const std::string& device_asset_id() const noexcept { return device_asset_id_; }
    [[nodiscard]] const std::string& device_id() const noexcept { return device_id_; }
    [[nodiscard]] const util::DateTime& created_at() const noexcept { return created_at_; }
    [[nodiscard]] const util::DateTime& modified_at() const noexcept { return modified_at_; }
    [[nodiscard]] const std::optional<util::DateTime>& captured_at() const noexcept { return captured_at_; }
    [[nodiscard]] const util::Checksum& checksum() const noexcept { return checksum_; }
    [[nodiscard]] const Bytes& data() const noexcept { return *data_; }
    [[nodiscard]] std::size_t size() const noexcept { return data_->size(); }

    /**
     * @brief Attach the moment the photo or video was taken
     *
     * When set it is sent as the file creation time.
     */
    void set_captured_at(util::DateTime captured_at) { captured_at_ = captured_at; }

    /**
     * @brief Override the id the server uses to recognise this file
     */
    void set_device_asset_id(std::string id) { device_asset_id_ = std::move(id); }

private:
    Asset(std::shared_ptr<const Bytes> data, util::Checksum checksum);

    std::filesystem::path path_;
    std::string device_asset_id_;
    std::string device_id_;
    util::DateTime created_at_;
    util::DateTime modified_at_;
    std::optional<util::DateTime> captured_at_;
    util::Checksum checksum_;
    std::shared_ptr<const Bytes> data_;
};

} // namespace immich::asset
