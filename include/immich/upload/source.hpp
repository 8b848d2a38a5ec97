#pragma once

#include "immich/asset/asset.hpp"
#include "immich/core/config.hpp"
#include "immich/core/result.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace immich::upload {

using AssetResult = Result<asset::Asset>;

/**
 * @brief Lazy, single-pass sequence of assets
 *
 * next() returns nullopt once the sequence is exhausted. An item may be an
 * error when the asset could not be built; its Error::subject names the path.
 * The engine never calls next() from two threads at once, and never again
 * after it returned nullopt.
 */
class AssetSource {
public:
    virtual ~AssetSource() = default;

    virtual std::optional<AssetResult> next() = 0;
};

/**
 * @brief Source backed by a generator callback
 */
class CallbackAssetSource : public AssetSource {
public:
    using Generator = std::function<std::optional<AssetResult>()>;

    explicit CallbackAssetSource(Generator generator) : generator_(std::move(generator)) {}

    std::optional<AssetResult> next() override { return generator_(); }

private:
    Generator generator_;
};

/**
 * @brief Builds an Asset from each path, one at a time as they are pulled
 */
class PathAssetSource : public AssetSource {
public:
    explicit PathAssetSource(std::vector<std::filesystem::path> paths,
                             std::string device_id = kClientName);

    std::optional<AssetResult> next() override;

private:
    std::vector<std::filesystem::path> paths_;
    std::size_t cursor_ = 0;
    std::string device_id_;
};

/**
 * @brief Walks a directory lazily and yields its regular files
 *
 * Sub-directories are descended into only when recursive is set; other
 * non-regular entries are skipped. Files that cannot be read are reported as
 * failed assets. A root that is not a directory yields nothing.
 */
class DirectoryAssetSource : public AssetSource {
public:
    explicit DirectoryAssetSource(std::filesystem::path root,
                                  bool recursive = false,
                                  std::string device_id = kClientName);

    std::optional<AssetResult> next() override;

private:
    std::optional<std::filesystem::path> next_file();

    std::filesystem::path root_;
    bool recursive_;
    std::string device_id_;
    bool started_ = false;
    bool done_ = false;
    std::filesystem::directory_iterator flat_;
    std::filesystem::recursive_directory_iterator deep_;
};

} // namespace immich::upload
