#include "immich/upload/source.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace fs = std::filesystem;

namespace immich::upload {

namespace {

// Steps the iterator past the next regular file and returns it
template<typename Iterator>
std::optional<fs::path> advance_to_file(Iterator& it, bool& done) {
    while (it != Iterator{}) {
        const fs::directory_entry entry = *it;

        std::error_code ec;
        it.increment(ec);
        if (ec) {
            spdlog::warn("Directory scan stopped at {}: {}", entry.path().string(), ec.message());
            it = Iterator{};
        }

        std::error_code type_ec;
        if (entry.is_regular_file(type_ec)) {
            return entry.path();
        }
    }
    done = true;
    return std::nullopt;
}

} // namespace

PathAssetSource::PathAssetSource(std::vector<fs::path> paths, std::string device_id)
    : paths_(std::move(paths)), device_id_(std::move(device_id)) {}

std::optional<AssetResult> PathAssetSource::next() {
    if (cursor_ >= paths_.size()) {
        return std::nullopt;
    }
    return asset::Asset::from_path(paths_[cursor_++], device_id_);
}

DirectoryAssetSource::DirectoryAssetSource(fs::path root, bool recursive, std::string device_id)
    : root_(std::move(root)), recursive_(recursive), device_id_(std::move(device_id)) {}

std::optional<AssetResult> DirectoryAssetSource::next() {
    auto path = next_file();
    if (!path) {
        return std::nullopt;
    }
    return asset::Asset::from_path(*path, device_id_);
}

std::optional<fs::path> DirectoryAssetSource::next_file() {
    if (done_) {
        return std::nullopt;
    }

    if (!started_) {
        started_ = true;

        std::error_code ec;
        if (!fs::is_directory(root_, ec)) {
            spdlog::warn("Not a directory, nothing to upload: {}", root_.string());
            done_ = true;
            return std::nullopt;
        }

        const auto options = fs::directory_options::skip_permission_denied;
        if (recursive_) {
            deep_ = fs::recursive_directory_iterator(root_, options, ec);
        } else {
            flat_ = fs::directory_iterator(root_, options, ec);
        }
        if (ec) {
            spdlog::warn("Cannot scan {}: {}", root_.string(), ec.message());
            done_ = true;
            return std::nullopt;
        }
        spdlog::debug("Scanning {}{}", root_.string(), recursive_ ? " recursively" : "");
    }

    return recursive_ ? advance_to_file(deep_, done_) : advance_to_file(flat_, done_);
}

} // namespace immich::upload
