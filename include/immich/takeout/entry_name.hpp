#pragma once

#include "immich/core/result.hpp"

#include <string>

namespace immich::takeout {

enum class EntryKind {
    Metadata,   ///< JSON sidecar describing a photo or video
    Original,   ///< Image or video as uploaded to Google Photos
    Edited,     ///< Copy saved after an edit, "-edited" in its name
    Unknown
};

/**
 * @brief What a Takeout archive path refers to
 *
 * A photo, its edited copy and its sidecar all map to the same name, e.g.
 * "Holidays/IMG_1.jpg", "Holidays/IMG_1-edited.jpg" and
 * "Holidays/IMG_1.jpg.supplemental-metadata.json" share "IMG_1.jpg".
 */
struct EntryName {
    std::string name;        ///< Media name shared by file, edited copy and sidecar
    std::string file_name;   ///< Last path component as stored in the archive
    std::string album;       ///< Directory holding the entry
    EntryKind kind = EntryKind::Unknown;
};

/**
 * @brief Classify one archive path
 *
 * Fails with ErrorCode::InvalidArchive when the path has no file name or no
 * parent directory. Files without an extension are Unknown.
 */
Result<EntryName> parse_entry_name(const std::string& archive_path);

/**
 * @brief Move a copy counter in front of the extension
 *
 * Sidecars of "IMG(1).jpg" are named "IMG.jpg(1).json"; once ".json" is
 * gone this turns "IMG.jpg(1)" back into "IMG(1).jpg".
 */
void normalize_duplicate_suffix(std::string& name);

/**
 * @brief Lower-case extension without dot is one Google Photos exports
 */
bool is_media_extension(const std::string& extension);

} // namespace immich::takeout
