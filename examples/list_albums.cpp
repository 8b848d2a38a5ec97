/**
 * @file list_albums.cpp
 * @brief Prints the albums visible to an API key as JSON
 *
 * Run with:
 *   ./build/examples/list_albums <URL> <API_KEY> [--verbose]
 */

#include "immich/client/client.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <iostream>
#include <string>
#include <vector>

using namespace immich;
using json = nlohmann::json;

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

    if (args.size() < 2) {
        spdlog::error("Usage: list_albums <URL> <API_KEY> [--verbose]");
        return 1;
    }

    auto client = Client::with_api_key(args[0], args[1]);
    if (client.is_error()) {
        spdlog::error("Unable to connect: {}", client.error().to_string());
        return 1;
    }

    auto albums = client.value().albums();
    if (albums.is_error()) {
        spdlog::error("Cannot list albums: {}", albums.error().to_string());
        return 1;
    }

    json listing = json::array();
    for (const auto& album : albums.value()) {
        listing.push_back({
            {"id", album.id},
            {"name", album.name},
            {"assets", album.asset_count},
            {"owner", album.owner.email},
            {"shared", album.shared}
        });
    }
    std::cout << listing.dump(2) << std::endl;
    return 0;
}
