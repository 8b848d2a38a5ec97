#pragma once

#include "immich/core/result.hpp"
#include "immich/util/datetime.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct archive;

namespace immich::takeout {

struct ArchiveEntry {
    std::string path;
    std::int64_t size = -1;                  ///< -1 when the archive does not record it
    std::optional<util::DateTime> modified;
    bool regular = false;
};

/**
 * @brief Forward-only reader over a Takeout archive
 *
 * Reads .tgz exports and any other container and compression libarchive
 * recognises, without unpacking to disk. read_data() returns the content of
 * the entry last returned by next(); content left unread is skipped.
 *
 * All failures are ErrorCode::InvalidArchive with the archive path as subject.
 */
class ArchiveReader {
public:
    static Result<ArchiveReader> open(const std::filesystem::path& path);

    ArchiveReader(ArchiveReader&&) noexcept = default;
    ArchiveReader& operator=(ArchiveReader&&) noexcept = default;

    /**
     * @brief Header of the next entry, or nullopt at the end of the archive
     */
    Result<std::optional<ArchiveEntry>> next();

    Result<std::vector<std::uint8_t>> read_data();

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    struct Closer {
        void operator()(archive* handle) const noexcept;
    };

    ArchiveReader(std::filesystem::path path, std::unique_ptr<archive, Closer> handle);

    Error failure(const std::string& what) const;

    std::filesystem::path path_;
    std::unique_ptr<archive, Closer> handle_;
};

} // namespace immich::takeout
