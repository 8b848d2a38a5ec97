#include "immich/takeout/import.hpp"

#include "support/fake_transport.hpp"
#include "support/takeout_archive.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace immich;
using namespace immich::takeout;
using namespace immich::test_support;
using json = nlohmann::json;
using network::HttpMethod;
using network::HttpRequest;

namespace {

constexpr std::int64_t kTaken = 1738042956;

std::string uuid(int n) {
    char buffer[37];
    std::snprintf(buffer, sizeof(buffer), "00000000-0000-0000-0000-%012d", n);
    return buffer;
}

/**
 * Server keeping albums and uploads in memory; names in refused cannot be created
 */
class AlbumServer {
public:
    AlbumServer() { albums_.emplace("Holidays", uuid(900)); }

    std::set<std::string> refused;
    bool albums_broken = false;

    Result<network::HttpResponse> operator()(const HttpRequest& request) {
        std::lock_guard<std::mutex> lock(mutex_);
        const std::string url = request.url;
        const std::string albums_url = std::string(kTestUrl) + "/albums";

        if (request.method == HttpMethod::POST && url == std::string(kTestUrl) + "/assets") {
            const std::string body = request.body_as_string();
            const auto start = body.find("filename=\"") + 10;
            const std::string name = body.substr(start, body.find('"', start) - start);
            const std::string id = uuid(static_cast<int>(uploaded_.size()) + 1);
            uploaded_[name] = id;
            return json_response(201, {{"id", id}, {"status", "created"}});
        }
        if (albums_broken) {
            return text_response(500, "albums unavailable");
        }
        if (request.method == HttpMethod::GET && url == albums_url) {
            json list = json::array();
            for (const auto& [name, id] : albums_) {
                list.push_back({{"id", id}, {"albumName", name}, {"assetCount", 0}});
            }
            return json_response(200, list);
        }
        if (request.method == HttpMethod::POST && url == albums_url) {
            const auto name = json::parse(request.body_as_string()).at("albumName").get<std::string>();
            if (refused.count(name) > 0) {
                return text_response(500, "cannot create album");
            }
            const std::string id = uuid(901 + static_cast<int>(albums_.size()));
            albums_[name] = id;
            return json_response(201, {{"id", id}, {"albumName", name}, {"assetCount", 0}});
        }
        if (request.method == HttpMethod::PUT) {
            json results = json::array();
            const json body = json::parse(request.body_as_string());
            for (const auto& id : body.at("ids")) {
                filed_[url].push_back(id.get<std::string>());
                results.push_back({{"id", id}, {"success", true}});
            }
            return json_response(200, results);
        }
        return text_response(404, "not found");
    }

    std::string remote_id(const std::string& device_asset_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = uploaded_.find(device_asset_id);
        return it == uploaded_.end() ? std::string() : it->second;
    }

    std::size_t uploads() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return uploaded_.size();
    }

    bool has_album(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return albums_.count(name) > 0;
    }

    std::vector<std::string> album_content(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto album = albums_.find(name);
        if (album == albums_.end()) {
            return {};
        }
        const auto it = filed_.find(std::string(kTestUrl) + "/albums/" + album->second + "/assets");
        if (it == filed_.end()) {
            return {};
        }
        auto ids = it->second;
        std::sort(ids.begin(), ids.end());
        return ids;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> albums_;
    std::map<std::string, std::string> uploaded_;
    std::map<std::string, std::vector<std::string>> filed_;
};

struct Fixture {
    std::shared_ptr<AlbumServer> server = std::make_shared<AlbumServer>();
    std::shared_ptr<FakeTransport> transport;
    fs::path archive;

    Fixture() {
        transport = std::make_shared<FakeTransport>([server = server](const HttpRequest& request) {
            return (*server)(request);
        });
        archive = temp_archive_path("import");
        EXPECT_TRUE(write_tar_gz(archive, {
            {"Takeout/Google Photos/Holidays/IMG_1.jpg", "one", 0},
            {"Takeout/Google Photos/Holidays/IMG_1.jpg.json", sidecar(kTaken), 0},
            {"Takeout/Google Photos/Holidays/IMG_1-edited.jpg", "one edited", 0},
            {"Takeout/Google Photos/Photos from 2025/IMG_1.jpg", "one", 0},
            {"Takeout/Google Photos/Photos from 2025/VID_2.mp4", "two", 0},
        }));
    }

    ~Fixture() { fs::remove_all(archive.parent_path()); }

    std::vector<std::string> sorted(std::vector<std::string> ids) const {
        std::sort(ids.begin(), ids.end());
        return ids;
    }
};

std::size_t failures(const std::vector<api::AlbumAssetResult>& results) {
    return static_cast<std::size_t>(std::count_if(results.begin(), results.end(),
                                                  [](const auto& result) { return !result.success; }));
}

} // namespace

TEST(TakeoutImportTest, UploadsAndRecreatesAlbums) {
    Fixture fixture;
    Client client(make_session(fixture.transport));
    auto takeout = Takeout::open(fixture.archive);
    ASSERT_TRUE(takeout.is_ok()) << takeout.error().to_string();

    upload::CollectingSink progress;
    auto imported = import_takeout(client, 2, takeout.value(), nullptr, &progress);
    ASSERT_TRUE(imported.is_ok()) << imported.error().to_string();

    EXPECT_EQ(fixture.server->uploads(), 2u);
    EXPECT_EQ(progress.outcomes().size(), 2u);
    EXPECT_EQ(imported.value().imported.size(), 2u);
    EXPECT_EQ(api::count_successful(imported.value().imported), 2u);

    const std::string edited = fixture.server->remote_id("IMG_1-edited.jpg");
    const std::string video = fixture.server->remote_id("VID_2.mp4");
    ASSERT_FALSE(edited.empty());
    ASSERT_FALSE(video.empty());

    EXPECT_TRUE(fixture.server->has_album(kImportAlbumName));
    EXPECT_EQ(fixture.server->album_content(kImportAlbumName), fixture.sorted({edited, video}));
    EXPECT_EQ(fixture.server->album_content("Holidays"), (std::vector<std::string>{edited}));
    EXPECT_EQ(fixture.server->album_content("Photos from 2025"), fixture.sorted({edited, video}));

    EXPECT_EQ(imported.value().moved.size(), 3u);
    EXPECT_EQ(api::count_successful(imported.value().moved), 3u);
}

TEST(TakeoutImportTest, AlbumThatCannotBeCreatedReportsItsAssets) {
    Fixture fixture;
    fixture.server->refused.insert("Photos from 2025");
    Client client(make_session(fixture.transport));
    auto takeout = Takeout::open(fixture.archive);
    ASSERT_TRUE(takeout.is_ok());

    auto imported = import_takeout(client, 2, takeout.value());
    ASSERT_TRUE(imported.is_ok()) << imported.error().to_string();

    EXPECT_FALSE(fixture.server->has_album("Photos from 2025"));
    EXPECT_EQ(imported.value().moved.size(), 3u);
    EXPECT_EQ(failures(imported.value().moved), 2u);
    for (const auto& result : imported.value().moved) {
        if (!result.success) {
            EXPECT_NE(result.error.find("500"), std::string::npos) << result.error;
        }
    }
}

TEST(TakeoutImportTest, ImportAlbumFailureUploadsNothing) {
    Fixture fixture;
    fixture.server->albums_broken = true;
    Client client(make_session(fixture.transport));
    auto takeout = Takeout::open(fixture.archive);
    ASSERT_TRUE(takeout.is_ok());

    auto imported = import_takeout(client, 2, takeout.value());
    ASSERT_TRUE(imported.is_error());
    EXPECT_EQ(fixture.server->uploads(), 0u);
}

TEST(TakeoutImportTest, FilterLeavingNothingTouchesNoAlbums) {
    Fixture fixture;
    Client client(make_session(fixture.transport));
    auto takeout = Takeout::open(fixture.archive, HandleEdited::UseBoth);
    ASSERT_TRUE(takeout.is_ok());

    auto imported = import_takeout(client, 2, takeout.value(), [](const TakeoutMedia&) { return false; });
    ASSERT_TRUE(imported.is_ok());
    EXPECT_TRUE(imported.value().imported.empty());
    EXPECT_TRUE(imported.value().moved.empty());
    EXPECT_EQ(fixture.server->uploads(), 0u);
    EXPECT_FALSE(fixture.server->has_album("Photos from 2025"));
    EXPECT_TRUE(fixture.server->album_content("Holidays").empty());
}
