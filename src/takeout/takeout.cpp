#include "immich/takeout/takeout.hpp"

#include "immich/takeout/archive_reader.hpp"
#include "immich/takeout/metadata.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace immich::takeout {

namespace {

void push_unique(std::vector<std::string>& values, const std::string& value) {
    if (std::find(values.begin(), values.end(), value) == values.end()) {
        values.push_back(value);
    }
}

} // namespace

Takeout::Takeout(std::filesystem::path path, HandleEdited edited)
    : path_(std::move(path)), edited_(edited) {}

Result<Takeout> Takeout::open(std::filesystem::path archive, HandleEdited edited) {
    auto opened = ArchiveReader::open(archive);
    if (opened.is_error()) {
        return Err<Takeout>(opened.error());
    }
    ArchiveReader& reader = opened.value();

    spdlog::info("Scanning Takeout archive {}", archive.string());
    Takeout takeout(std::move(archive), edited);

    while (true) {
        auto next = reader.next();
        if (next.is_error()) {
            return Err<Takeout>(next.error());
        }
        if (!next.value()) {
            break;
        }

        const ArchiveEntry& entry = *next.value();
        if (!entry.regular) {
            continue;
        }

        auto name = parse_entry_name(entry.path);
        if (name.is_error()) {
            spdlog::debug("Skipping {}: {}", entry.path, name.error().message);
            continue;
        }

        switch (name.value().kind) {
            case EntryKind::Metadata: {
                auto content = reader.read_data();
                if (content.is_error()) {
                    return Err<Takeout>(content.error());
                }
                const std::string json(content.value().begin(), content.value().end());
                auto taken = parse_photo_taken_time(json);
                if (taken.is_error()) {
                    spdlog::debug("Ignoring sidecar {}: {}", entry.path, taken.error().message);
                    break;
                }
                takeout.add(name.value(), taken.value());
                break;
            }
            case EntryKind::Edited:
                if (edited != HandleEdited::PreferOriginal) {
                    takeout.add(name.value(), std::nullopt);
                }
                break;
            case EntryKind::Original:
                takeout.add(name.value(), std::nullopt);
                break;
            case EntryKind::Unknown:
                break;
        }
    }

    takeout.file_count_ = static_cast<std::size_t>(std::count_if(
        takeout.media_.begin(), takeout.media_.end(),
        [](const auto& item) { return item.second.has_file(); }));

    spdlog::info("Takeout archive holds {} images and videos", takeout.file_count_);
    return Ok(std::move(takeout));
}

void Takeout::add(const EntryName& entry, const std::optional<util::DateTime>& taken_at) {
    auto [it, inserted] = media_.try_emplace(entry.name);
    TakeoutMedia& media = it->second;
    if (inserted) {
        media.name = entry.name;
    }

    switch (entry.kind) {
        case EntryKind::Metadata:
            media.taken_at = taken_at;
            break;
        case EntryKind::Original:
            media.original = true;
            break;
        case EntryKind::Edited:
            media.edited = true;
            media.edited_file = entry.file_name;
            break;
        case EntryKind::Unknown:
            return;
    }
    push_unique(media.albums, entry.album);
}

const TakeoutMedia* Takeout::find(const std::string& name) const {
    const auto it = media_.find(name);
    return it == media_.end() ? nullptr : &it->second;
}

bool Takeout::uploads_original(const TakeoutMedia& media) const noexcept {
    return media.original && !(media.edited && edited_ == HandleEdited::PreferEdited);
}

bool Takeout::uploads_edited(const TakeoutMedia& media) const noexcept {
    return media.edited && edited_ != HandleEdited::PreferOriginal;
}

std::optional<std::string> Takeout::device_asset_id(const EntryName& entry) const {
    const TakeoutMedia* media = find(entry.name);
    if (!media) {
        return std::nullopt;
    }

    switch (entry.kind) {
        case EntryKind::Original:
            if (uploads_original(*media)) {
                return media->name;
            }
            return std::nullopt;
        case EntryKind::Edited:
            if (uploads_edited(*media)) {
                return entry.file_name;
            }
            return std::nullopt;
        case EntryKind::Metadata:
        case EntryKind::Unknown:
            break;
    }
    return std::nullopt;
}

std::map<std::string, std::vector<std::string>> Takeout::albums() const {
    std::map<std::string, std::vector<std::string>> albums;
    for (const auto& [name, media] : media_) {
        for (const auto& album : media.albums) {
            auto& ids = albums[album];
            if (uploads_original(media)) {
                push_unique(ids, media.name);
            }
            if (uploads_edited(media)) {
                push_unique(ids, media.edited_file);
            }
            if (ids.empty()) {
                albums.erase(album);
            }
        }
    }
    return albums;
}

} // namespace immich::takeout
