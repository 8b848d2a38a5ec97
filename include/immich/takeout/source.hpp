#pragma once

#include "immich/core/config.hpp"
#include "immich/takeout/archive_reader.hpp"
#include "immich/takeout/takeout.hpp"
#include "immich/upload/source.hpp"

#include <functional>
#include <optional>
#include <set>
#include <string>

namespace immich::takeout {

/**
 * @brief Streams the photos and videos of a scanned Takeout archive
 *
 * Opens the archive again on the first pull and reads one entry at a time,
 * so only the asset being handed out is held in memory. Sidecars, unknown
 * files and versions left out by the archive's HandleEdited rule are skipped.
 * A photo filed under several albums is handed out once.
 *
 * Each asset carries the device asset id Takeout::device_asset_id() gives,
 * the sidecar's photo taken time as captured_at and as creation time, and
 * the later of that time and the entry's modification time as modification
 * time. Without a sidecar both times come from the archive entry.
 *
 * An entry whose content cannot be read becomes a failed item. A broken
 * archive structure ends the sequence after one failed item.
 */
class TakeoutAssetSource : public upload::AssetSource {
public:
    using Filter = std::function<bool(const TakeoutMedia&)>;

    /**
     * @param takeout index built by Takeout::open(); must outlive the source
     * @param filter  keeps a media item when it returns true; null keeps all
     */
    explicit TakeoutAssetSource(const Takeout& takeout,
                                Filter filter = nullptr,
                                std::string device_id = kClientName);

    std::optional<upload::AssetResult> next() override;

private:
    std::optional<upload::AssetResult> fail(Error error);

    const Takeout& takeout_;
    Filter filter_;
    std::string device_id_;
    std::optional<ArchiveReader> reader_;
    std::set<std::string> handed_out_;
    bool done_ = false;
};

} // namespace immich::takeout
