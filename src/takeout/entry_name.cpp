#include "immich/takeout/entry_name.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>

namespace immich::takeout {

namespace {

constexpr std::array<const char*, 10> kMediaExtensions = {
    "jpg", "jpeg", "png", "webp", "heic", "mp4", "m4v", "webm", "3gp", "gif"
};

void erase_all(std::string& text, const std::string& pattern) {
    for (auto at = text.find(pattern); at != std::string::npos; at = text.find(pattern, at)) {
        text.erase(at, pattern.size());
    }
}

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

bool is_media_extension(const std::string& extension) {
    return std::any_of(kMediaExtensions.begin(), kMediaExtensions.end(),
                       [&extension](const char* known) { return extension == known; });
}

void normalize_duplicate_suffix(std::string& name) {
    if (name.empty() || name.back() != ')') {
        return;
    }
    const auto open = name.rfind('(');
    if (open == std::string::npos) {
        return;
    }

    const std::string counter = name.substr(open);
    name.erase(open);
    const auto dot = name.rfind('.');
    if (dot == std::string::npos) {
        name += counter;
        return;
    }
    name.insert(dot, counter);
}

Result<EntryName> parse_entry_name(const std::string& archive_path) {
    const std::filesystem::path path(archive_path);

    EntryName entry;
    entry.file_name = path.filename().string();
    if (entry.file_name.empty()) {
        return Err<EntryName>(make_error(ErrorCode::InvalidArchive,
                                         "Entry path must contain a file name", archive_path));
    }
    entry.album = path.parent_path().filename().string();
    if (entry.album.empty()) {
        return Err<EntryName>(make_error(ErrorCode::InvalidArchive,
                                         "Entry path must contain an album directory", archive_path));
    }

    std::string extension = path.extension().string();
    if (!extension.empty()) {
        extension = lower(extension.substr(1));
    }

    if (extension == "json") {
        entry.kind = EntryKind::Metadata;
    } else if (is_media_extension(extension)) {
        entry.kind = entry.file_name.find("edited") != std::string::npos ? EntryKind::Edited
                                                                         : EntryKind::Original;
    }

    entry.name = entry.file_name;
    erase_all(entry.name, "-edited");
    erase_all(entry.name, ".supplemental-metadata");
    erase_all(entry.name, ".json");
    normalize_duplicate_suffix(entry.name);
    return Ok(std::move(entry));
}

} // namespace immich::takeout
