/**
 * @file takeout.hpp
 * @brief Index of a Google Photos Takeout archive
 *
 * A Takeout export is a .tgz whose directories are albums (including the
 * "Photos from <year>" folders Google creates) holding images, videos,
 * "-edited" copies and JSON sidecars. Takeout::open() reads the archive once
 * and keeps only names, albums and capture times; the bytes are read later,
 * one file at a time, by TakeoutAssetSource.
 *
 * EXAMPLE:
 * auto takeout = Takeout::open("takeout-001.tgz", HandleEdited::PreferEdited);
 * TakeoutAssetSource source(takeout.value());
 * auto outcomes = client.parallel_upload(4, source);
 */

#pragma once

#include "immich/core/result.hpp"
#include "immich/takeout/entry_name.hpp"
#include "immich/util/datetime.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace immich::takeout {

/**
 * @brief Which version to upload when a file exists edited and unedited
 */
enum class HandleEdited {
    PreferEdited,    ///< Only the edited copy
    UseBoth,         ///< Both, as separate assets
    PreferOriginal   ///< Only the unedited file; edited copies are ignored
};

/**
 * @brief Everything the index knows about one photo or video
 */
struct TakeoutMedia {
    std::string name;
    std::optional<util::DateTime> taken_at;   ///< From the JSON sidecar
    bool original = false;
    bool edited = false;
    std::string edited_file;                  ///< Archive file name of the edited copy
    std::vector<std::string> albums;          ///< First-seen order, no repeats

    [[nodiscard]] bool has_file() const noexcept { return original || edited; }
};

class Takeout {
public:
    /**
     * @brief Scan the archive and build the index
     *
     * Blocks for one full pass over the archive. Entries that cannot be
     * classified and sidecars that cannot be parsed are skipped.
     *
     * RETURNS: ErrorCode::InvalidArchive when the archive cannot be opened or
     *          its structure cannot be read
     */
    static Result<Takeout> open(std::filesystem::path archive,
                                HandleEdited edited = HandleEdited::PreferEdited);

    /**
     * @brief Number of photos and videos; sidecars without a file do not count
     */
    [[nodiscard]] std::size_t size() const noexcept { return file_count_; }
    [[nodiscard]] bool empty() const noexcept { return file_count_ == 0; }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] HandleEdited handle_edited() const noexcept { return edited_; }

    const TakeoutMedia* find(const std::string& name) const;

    /**
     * @brief Device asset id the archive entry is uploaded under
     *
     * nullopt for sidecars, unknown files and versions the HandleEdited rule
     * leaves out. Originals use the media name, edited copies their own file
     * name so both versions stay apart under UseBoth.
     */
    std::optional<std::string> device_asset_id(const EntryName& entry) const;

    /**
     * @brief Device asset ids per album, in the form device_asset_id() gives
     */
    std::map<std::string, std::vector<std::string>> albums() const;

private:
    Takeout(std::filesystem::path path, HandleEdited edited);

    void add(const EntryName& entry, const std::optional<util::DateTime>& taken_at);
    bool uploads_original(const TakeoutMedia& media) const noexcept;
    bool uploads_edited(const TakeoutMedia& media) const noexcept;

    std::filesystem::path path_;
    HandleEdited edited_;
    std::map<std::string, TakeoutMedia> media_;
    std::size_t file_count_ = 0;
};

} // namespace immich::takeout
