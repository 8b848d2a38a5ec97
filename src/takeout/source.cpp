#include "immich/takeout/source.hpp"

#include <spdlog/spdlog.h>

namespace immich::takeout {

TakeoutAssetSource::TakeoutAssetSource(const Takeout& takeout, Filter filter, std::string device_id)
    : takeout_(takeout), filter_(std::move(filter)), device_id_(std::move(device_id)) {}

std::optional<upload::AssetResult> TakeoutAssetSource::fail(Error error) {
    done_ = true;
    reader_.reset();
    return upload::AssetResult(ErrValue<Error>(std::move(error)));
}

std::optional<upload::AssetResult> TakeoutAssetSource::next() {
    if (done_) {
        return std::nullopt;
    }

    if (!reader_) {
        auto opened = ArchiveReader::open(takeout_.path());
        if (opened.is_error()) {
            return fail(opened.error());
        }
        reader_.emplace(std::move(opened.value()));
    }

    while (true) {
        auto next = reader_->next();
        if (next.is_error()) {
            return fail(next.error());
        }
        if (!next.value()) {
            done_ = true;
            reader_.reset();
            return std::nullopt;
        }

        const ArchiveEntry& entry = *next.value();
        if (!entry.regular) {
            continue;
        }

        auto name = parse_entry_name(entry.path);
        if (name.is_error()) {
            continue;
        }
        auto id = takeout_.device_asset_id(name.value());
        if (!id || handed_out_.count(*id) > 0) {
            continue;
        }

        const TakeoutMedia* media = takeout_.find(name.value().name);
        if (filter_ && !filter_(*media)) {
            continue;
        }

        handed_out_.insert(*id);
        auto content = reader_->read_data();
        if (content.is_error()) {
            Error error = content.error();
            error.code = ErrorCode::InvalidAsset;
            error.subject = entry.path;
            spdlog::warn("Cannot extract {} from Takeout archive: {}", entry.path, error.message);
            return upload::AssetResult(ErrValue<Error>(std::move(error)));
        }

        const util::DateTime stored = entry.modified.value_or(util::DateTime());
        util::DateTime created = stored;
        util::DateTime modified = stored;
        if (media->taken_at) {
            created = *media->taken_at;
            if (!entry.modified || entry.modified->time_point() < media->taken_at->time_point()) {
                modified = *media->taken_at;
            }
        }

        auto asset = asset::Asset::from_bytes(*id, std::move(content.value()), created, modified, device_id_);
        if (media->taken_at) {
            asset.set_captured_at(*media->taken_at);
        }
        return upload::AssetResult(OkValue<asset::Asset>(std::move(asset)));
    }
}

} // namespace immich::takeout
