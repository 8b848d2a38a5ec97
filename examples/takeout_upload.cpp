/**
 * @file takeout_upload.cpp
 * @brief Imports a Google Photos Takeout archive with its albums
 *
 * Prints a running tally while the upload runs, then recreates the albums
 * of the archive on the server.
 *
 * Run with:
 *   ./build/examples/takeout_upload <URL> <EMAIL> <PASSWORD> <TAKEOUT_FILE> [--original|--both]
 */

#include "immich/client/client.hpp"
#include "immich/takeout/import.hpp"
#include "immich/takeout/takeout.hpp"
#include "immich/upload/sink.hpp"

#include <spdlog/spdlog.h>

#include <cstddef>
#include <string>
#include <vector>

using namespace immich;

namespace {

constexpr std::size_t kWorkers = 5;

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args;
    auto edited = takeout::HandleEdited::PreferEdited;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--original") {
            edited = takeout::HandleEdited::PreferOriginal;
        } else if (arg == "--both") {
            edited = takeout::HandleEdited::UseBoth;
        } else {
            args.push_back(std::move(arg));
        }
    }

    if (args.size() < 4) {
        spdlog::error("Usage: takeout_upload <URL> <EMAIL> <PASSWORD> <TAKEOUT_FILE> [--original|--both]");
        return 1;
    }

    auto connected = Client::login(args[0], args[1], args[2]);
    if (connected.is_error()) {
        spdlog::error("Unable to connect: {}", connected.error().to_string());
        return 1;
    }

    spdlog::info("Scanning Takeout archive, this might take a while");
    auto archive = takeout::Takeout::open(args[3], edited);
    if (archive.is_error()) {
        spdlog::error("Cannot read Takeout archive: {}", archive.error().to_string());
        return 1;
    }
    const std::size_t total = archive.value().size();

    std::size_t created = 0;
    std::size_t duplicate = 0;
    std::size_t failed = 0;
    upload::CallbackSink tally([&](const api::UploadOutcome& outcome) {
        switch (outcome.status()) {
            case api::UploadStatus::Created: ++created; break;
            case api::UploadStatus::Duplicate: ++duplicate; break;
            case api::UploadStatus::Failed: ++failed; break;
        }
        spdlog::info("Created: {} | Duplicate: {} | Failure: {} | Total: {}/{} | [{}: {}]",
                     created, duplicate, failed, created + duplicate + failed, total,
                     api::to_string(outcome.status()), outcome.device_asset_id());
    });

    auto imported = takeout::import_takeout(connected.value(), kWorkers, archive.value(), nullptr, &tally);
    if (imported.is_error()) {
        spdlog::error("Import failed: {}", imported.error().to_string());
        return 1;
    }

    spdlog::info("{} of {} assets added to '{}', {} album placements restored",
                 api::count_successful(imported.value().imported), total,
                 takeout::kImportAlbumName, api::count_successful(imported.value().moved));
    return 0;
}
