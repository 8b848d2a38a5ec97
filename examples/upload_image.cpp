/**
 * @file upload_image.cpp
 * @brief Uploads a single image and prints how the server took it
 *
 * Run with:
 *   ./build/examples/upload_image <URL> <EMAIL> <PASSWORD> <IMAGE> [--verbose]
 */

#include "immich/asset/asset.hpp"
#include "immich/client/client.hpp"

#include <spdlog/spdlog.h>

#include <string>
#include <vector>

using namespace immich;

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
        spdlog::error("Usage: upload_image <URL> <EMAIL> <PASSWORD> <IMAGE> [--verbose]");
        return 1;
    }

    auto client = Client::login(args[0], args[1], args[2]);
    if (client.is_error()) {
        spdlog::error("Unable to connect: {}", client.error().to_string());
        return 1;
    }

    auto asset = asset::Asset::from_path(args[3], client.value().session().config().device_id);
    if (asset.is_error()) {
        spdlog::error("Cannot read image: {}", asset.error().to_string());
        return 1;
    }

    const auto outcome = client.value().upload(asset.value());
    if (!outcome.ok()) {
        spdlog::error("{}: {}", outcome.device_asset_id(), outcome.error()->to_string());
        return 1;
    }

    spdlog::info("{}: {} as {}", outcome.device_asset_id(),
                 api::to_string(outcome.status()), *outcome.remote_id());
    return 0;
}
