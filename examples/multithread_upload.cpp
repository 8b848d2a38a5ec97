/**
 * @file multithread_upload.cpp
 * @brief Uploads every file of a folder with five workers
 *
 * Outcomes stream through a BoundedChannel to a printer thread while the
 * upload runs. With an album name the uploaded assets are added to that
 * album, which is created when missing.
 *
 * Run with:
 *   ./build/examples/multithread_upload <URL> <EMAIL> <PASSWORD> <FOLDER> [ALBUM] [--verbose]
 */

#include "immich/client/client.hpp"
#include "immich/upload/channel.hpp"
#include "immich/upload/sink.hpp"
#include "immich/upload/source.hpp"

#include <spdlog/spdlog.h>

#include <string>
#include <thread>
#include <vector>

using namespace immich;

namespace {

constexpr std::size_t kWorkers = 5;

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--verbose") {
            spdlog::set_level(spdlog::level::debug);
        } else {
            args.push_back(std::move(arg));
        }
    }

    if (args.size() < 4) {
        spdlog::error("Usage: multithread_upload <URL> <EMAIL> <PASSWORD> <FOLDER> [ALBUM] [--verbose]");
        return 1;
    }

    auto connected = Client::login(args[0], args[1], args[2]);
    if (connected.is_error()) {
        spdlog::error("Unable to connect: {}", connected.error().to_string());
        return 1;
    }
    const Client& client = connected.value();

    upload::DirectoryAssetSource source(args[3], false, client.session().config().device_id);

    upload::BoundedChannel<api::UploadOutcome> channel(kWorkers * 2);
    upload::ChannelSink sink(channel);
    std::thread printer([&channel]() {
        while (auto outcome = channel.receive()) {
            if (outcome->ok()) {
                spdlog::info("{}: {}", api::to_string(outcome->status()), outcome->device_asset_id());
            } else {
                spdlog::warn("failed: {} ({})", outcome->device_asset_id(), outcome->error()->message);
            }
        }
    });

    int exit_code = 0;
    if (args.size() > 4) {
        auto album = client.get_or_create_album(args[4]);
        if (album.is_error()) {
            spdlog::error("Can't find or create album: {}", album.error().to_string());
            exit_code = 1;
        } else {
            auto added = client.upload_to_album(kWorkers, source, album.value(), &sink);
            if (added.is_error()) {
                spdlog::error("Upload failed: {}", added.error().to_string());
                exit_code = 1;
            } else {
                const auto moved = api::count_successful(added.value());
                spdlog::info("{} of {} assets uploaded and moved to '{}'",
                             moved, added.value().size(), album.value().name);
            }
        }
    } else {
        upload::EngineOptions options;
        options.stop_on_auth_failure = true;
        auto summary = client.parallel_upload_with_progress(kWorkers, source, sink, options);
        if (summary.is_error()) {
            spdlog::error("Upload failed: {}", summary.error().to_string());
            exit_code = 1;
        } else {
            spdlog::info("{} assets uploaded ({} new, {} duplicate, {} failed)",
                         summary.value().pulled, summary.value().created,
                         summary.value().duplicate, summary.value().failed);
        }
    }

    channel.close();
    printer.join();
    return exit_code;
}
