#include "immich/takeout/archive_reader.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <spdlog/spdlog.h>

#include <chrono>

namespace immich::takeout {

namespace {

constexpr std::size_t kBlockSize = 64 * 1024;

} // namespace

void ArchiveReader::Closer::operator()(archive* handle) const noexcept {
    archive_read_free(handle);
}

ArchiveReader::ArchiveReader(std::filesystem::path path, std::unique_ptr<archive, Closer> handle)
    : path_(std::move(path)), handle_(std::move(handle)) {}

Result<ArchiveReader> ArchiveReader::open(const std::filesystem::path& path) {
    std::unique_ptr<archive, Closer> handle(archive_read_new());
    if (!handle) {
        return Err<ArchiveReader>(make_error(ErrorCode::InvalidArchive,
                                             "Failed to allocate archive reader", path.string()));
    }

    archive_read_support_filter_all(handle.get());
    archive_read_support_format_all(handle.get());

    if (archive_read_open_filename(handle.get(), path.c_str(), kBlockSize) != ARCHIVE_OK) {
        const char* reason = archive_error_string(handle.get());
        return Err<ArchiveReader>(make_error(ErrorCode::InvalidArchive,
                                             std::string("Cannot open archive: ") +
                                                 (reason ? reason : "unknown error"),
                                             path.string()));
    }

    spdlog::debug("Opened archive {}", path.string());
    return Ok(ArchiveReader(path, std::move(handle)));
}

Result<std::optional<ArchiveEntry>> ArchiveReader::next() {
    archive_entry* header = nullptr;
    const int status = archive_read_next_header(handle_.get(), &header);
    if (status == ARCHIVE_EOF) {
        return Ok(std::optional<ArchiveEntry>());
    }
    if (status == ARCHIVE_WARN) {
        spdlog::warn("Archive {}: {}", path_.string(), archive_error_string(handle_.get()));
    } else if (status != ARCHIVE_OK) {
        return Err<std::optional<ArchiveEntry>>(failure("Cannot read entry header"));
    }

    ArchiveEntry entry;
    if (const char* name = archive_entry_pathname(header)) {
        entry.path = name;
    }
    if (archive_entry_size_is_set(header)) {
        entry.size = archive_entry_size(header);
    }
    if (archive_entry_mtime_is_set(header)) {
        const auto seconds = std::chrono::seconds(archive_entry_mtime(header));
        entry.modified = util::DateTime(util::DateTime::clock::time_point(
            std::chrono::duration_cast<util::DateTime::clock::duration>(seconds)));
    }
    entry.regular = archive_entry_filetype(header) == AE_IFREG;
    return Ok(std::optional<ArchiveEntry>(std::move(entry)));
}

Result<std::vector<std::uint8_t>> ArchiveReader::read_data() {
    std::vector<std::uint8_t> data;
    std::uint8_t buffer[kBlockSize];
    while (true) {
        const auto got = archive_read_data(handle_.get(), buffer, sizeof(buffer));
        if (got == 0) {
            break;
        }
        if (got < 0) {
            return Err<std::vector<std::uint8_t>>(failure("Cannot read entry data"));
        }
        data.insert(data.end(), buffer, buffer + got);
    }
    return Ok(std::move(data));
}

Error ArchiveReader::failure(const std::string& what) const {
    const char* reason = archive_error_string(handle_.get());
    return make_error(ErrorCode::InvalidArchive,
                      what + ": " + (reason ? reason : "unknown error"),
                      path_.string());
}

} // namespace immich::takeout
