#include "immich/upload/sink.hpp"
#include "immich/upload/source.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <unistd.h>

namespace fs = std::filesystem;
using namespace immich;
using namespace immich::upload;

namespace {

fs::path create_temp_dir() {
    const auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = base / fs::path("immich_source_test_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

void write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

std::vector<std::string> drain_ids(AssetSource& source) {
    std::vector<std::string> ids;
    while (auto item = source.next()) {
        EXPECT_TRUE(item->is_ok());
        if (item->is_ok()) {
            ids.push_back(item->value().device_asset_id());
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace

TEST(PathAssetSourceTest, YieldsInOrderAndReportsBadPaths) {
    const auto dir = create_temp_dir();
    write_file(dir / "a.jpg", "a");
    write_file(dir / "b.jpg", "b");

    PathAssetSource source({dir / "a.jpg", dir / "missing.jpg", dir / "b.jpg"}, "camera");

    auto first = source.next();
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(first->is_ok());
    EXPECT_EQ(first->value().device_asset_id(), "a.jpg");
    EXPECT_EQ(first->value().device_id(), "camera");

    auto second = source.next();
    ASSERT_TRUE(second.has_value());
    ASSERT_TRUE(second->is_error());
    EXPECT_EQ(second->error().code, ErrorCode::InvalidAsset);

    auto third = source.next();
    ASSERT_TRUE(third.has_value());
    EXPECT_TRUE(third->is_ok());

    EXPECT_FALSE(source.next().has_value());
    EXPECT_FALSE(source.next().has_value());

    fs::remove_all(dir);
}

TEST(DirectoryAssetSourceTest, YieldsRegularFilesOnly) {
    const auto dir = create_temp_dir();
    write_file(dir / "one.jpg", "1");
    write_file(dir / "two.mp4", "2");
    fs::create_directories(dir / "nested");
    write_file(dir / "nested" / "three.png", "3");

    DirectoryAssetSource flat(dir);
    EXPECT_EQ(drain_ids(flat), (std::vector<std::string>{"one.jpg", "two.mp4"}));

    DirectoryAssetSource deep(dir, true);
    EXPECT_EQ(drain_ids(deep), (std::vector<std::string>{"one.jpg", "three.png", "two.mp4"}));

    fs::remove_all(dir);
}

TEST(DirectoryAssetSourceTest, RecursiveDescendsEveryLevel) {
    const auto dir = create_temp_dir();
    fs::create_directories(dir / "2019" / "summer");
    fs::create_directories(dir / "2020");
    write_file(dir / "top.jpg", "t");
    write_file(dir / "2019" / "spring.jpg", "s");
    write_file(dir / "2019" / "summer" / "beach.jpg", "b");
    write_file(dir / "2020" / "snow.mp4", "w");

    DirectoryAssetSource flat(dir, false);
    EXPECT_EQ(drain_ids(flat), std::vector<std::string>{"top.jpg"});

    DirectoryAssetSource deep(dir, true);
    EXPECT_EQ(drain_ids(deep),
              (std::vector<std::string>{"beach.jpg", "snow.mp4", "spring.jpg", "top.jpg"}));

    fs::remove_all(dir);
}

TEST(DirectoryAssetSourceTest, UnreadableFileIsReportedAsFailure) {
    if (::geteuid() == 0) {
        GTEST_SKIP() << "permission bits do not restrict root";
    }
    const auto dir = create_temp_dir();
    write_file(dir / "locked.jpg", "l");
    fs::permissions(dir / "locked.jpg", fs::perms::none);

    DirectoryAssetSource source(dir);
    auto item = source.next();
    ASSERT_TRUE(item.has_value());
    ASSERT_TRUE(item->is_error());
    EXPECT_EQ(item->error().code, ErrorCode::InvalidAsset);
    EXPECT_EQ(fs::path(item->error().subject).filename().string(), "locked.jpg");
    EXPECT_FALSE(source.next().has_value());

    fs::permissions(dir / "locked.jpg", fs::perms::owner_all);
    fs::remove_all(dir);
}

TEST(DirectoryAssetSourceTest, MissingRootYieldsNothing) {
    const auto dir = create_temp_dir();

    DirectoryAssetSource source(dir / "nope");
    EXPECT_FALSE(source.next().has_value());
    EXPECT_FALSE(source.next().has_value());

    DirectoryAssetSource file_root(dir / "file.jpg");
    write_file(dir / "file.jpg", "x");
    EXPECT_FALSE(file_root.next().has_value());

    fs::remove_all(dir);
}

TEST(DirectoryAssetSourceTest, EmptyDirectory) {
    const auto dir = create_temp_dir();

    DirectoryAssetSource source(dir);
    EXPECT_FALSE(source.next().has_value());

    fs::remove_all(dir);
}

TEST(ResultSinkTest, CallbackSinkForwardsAndReportsThrow) {
    std::vector<std::string> seen;
    CallbackSink sink([&seen](const api::UploadOutcome& outcome) {
        if (outcome.device_asset_id() == "bad.jpg") {
            throw std::runtime_error("display closed");
        }
        seen.push_back(outcome.device_asset_id());
    });

    EXPECT_TRUE(sink.deliver(api::UploadOutcome::created("a.jpg", "r1")).is_ok());
    auto failed = sink.deliver(api::UploadOutcome::created("bad.jpg", "r2"));
    ASSERT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error().code, ErrorCode::Engine);
    EXPECT_EQ(seen, std::vector<std::string>{"a.jpg"});
    EXPECT_FALSE(sink.concurrent());
}

TEST(ResultSinkTest, EmptyCallbackIsError) {
    CallbackSink sink(nullptr);
    EXPECT_TRUE(sink.deliver(api::UploadOutcome::created("a.jpg", "r1")).is_error());
}

TEST(ResultSinkTest, CollectingSinkTake) {
    CollectingSink sink;
    ASSERT_TRUE(sink.deliver(api::UploadOutcome::created("a.jpg", "r1")).is_ok());
    ASSERT_TRUE(sink.deliver(api::UploadOutcome::duplicate("b.jpg", "r2")).is_ok());

    EXPECT_EQ(sink.outcomes().size(), 2u);
    const auto taken = sink.take();
    ASSERT_EQ(taken.size(), 2u);
    EXPECT_EQ(taken[1].status(), api::UploadStatus::Duplicate);
    EXPECT_TRUE(sink.outcomes().empty());
}

TEST(ResultSinkTest, ChannelSinkFailsOnceClosed) {
    BoundedChannel<api::UploadOutcome> channel(2);
    ChannelSink sink(channel);

    ASSERT_TRUE(sink.deliver(api::UploadOutcome::created("a.jpg", "r1")).is_ok());
    EXPECT_EQ(channel.size(), 1u);

    channel.close();
    auto failed = sink.deliver(api::UploadOutcome::created("b.jpg", "r2"));
    ASSERT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error().code, ErrorCode::Engine);
    EXPECT_EQ(failed.error().subject, "b.jpg");
}

TEST(ResultSinkTest, TeeSinkShowsObserverFirst) {
    CollectingSink kept;
    std::vector<std::string> seen;
    CallbackSink observer([&seen](const api::UploadOutcome& outcome) {
        if (outcome.device_asset_id() == "bad.jpg") {
            throw std::runtime_error("observer gone");
        }
        seen.push_back(outcome.device_asset_id());
    });
    TeeSink tee(kept, &observer);

    EXPECT_TRUE(tee.deliver(api::UploadOutcome::created("a.jpg", "r1")).is_ok());
    EXPECT_TRUE(tee.deliver(api::UploadOutcome::created("bad.jpg", "r2")).is_error());
    EXPECT_EQ(seen, std::vector<std::string>{"a.jpg"});
    ASSERT_EQ(kept.outcomes().size(), 1u);
    EXPECT_FALSE(tee.concurrent());

    TeeSink alone(kept, nullptr);
    EXPECT_TRUE(alone.concurrent());
    EXPECT_TRUE(alone.deliver(api::UploadOutcome::duplicate("c.jpg", "r3")).is_ok());
    EXPECT_EQ(kept.outcomes().size(), 2u);
}
