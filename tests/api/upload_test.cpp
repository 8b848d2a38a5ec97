#include "immich/api/upload.hpp"

#include "support/fake_transport.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <memory>
#include <string>

using namespace immich;
using namespace immich::test_support;
using json = nlohmann::json;
using network::HttpRequest;

namespace {

constexpr const char* kRemoteId = "f0edb589-1312-4161-b41e-0a18f127b3dd";

asset::Asset sample_asset() {
    const auto created = util::DateTime::from_civil(2025, 1, 28, 5, 42, 36).value();
    const auto modified = util::DateTime::from_civil(2025, 1, 29, 8, 0, 0).value();
    const std::string content = "hello world";
    return asset::Asset::from_bytes("IMG_0001.jpg", asset::Asset::Bytes(content.begin(), content.end()),
                                    created, modified, "test-device");
}

api::UploadOutcome upload_with(FakeTransport::Handler handler) {
    auto transport = std::make_shared<FakeTransport>(std::move(handler));
    const auto session = make_session(transport);
    return api::upload_asset(session, sample_asset());
}

} // namespace

TEST(UploadTest, CreatedResponse) {
    const auto outcome = upload_with([](const HttpRequest&) {
        return json_response(201, {{"id", kRemoteId}, {"status", "created"}});
    });

    EXPECT_EQ(outcome.status(), api::UploadStatus::Created);
    EXPECT_EQ(outcome.device_asset_id(), "IMG_0001.jpg");
    ASSERT_TRUE(outcome.remote_id().has_value());
    EXPECT_EQ(*outcome.remote_id(), kRemoteId);
    EXPECT_FALSE(outcome.error().has_value());
    EXPECT_TRUE(outcome.ok());
}

TEST(UploadTest, DuplicateResponse) {
    const auto outcome = upload_with([](const HttpRequest&) {
        return json_response(200, {{"id", kRemoteId}, {"status", "duplicate"}});
    });

    EXPECT_EQ(outcome.status(), api::UploadStatus::Duplicate);
    EXPECT_EQ(*outcome.remote_id(), kRemoteId);
    EXPECT_TRUE(outcome.ok());
}

TEST(UploadTest, RequestCarriesChecksumAndFormFields) {
    auto transport = std::make_shared<FakeTransport>([](const HttpRequest&) {
        return json_response(201, {{"id", kRemoteId}, {"status", "created"}});
    });
    const auto session = make_session(transport);
    auto asset = sample_asset();
    asset.set_captured_at(util::DateTime::from_civil(2024, 12, 24, 18, 30, 0).value());

    ASSERT_TRUE(api::upload_asset(session, asset).ok());

    const auto requests = transport->requests();
    ASSERT_EQ(requests.size(), 1u);
    const auto& request = requests[0];
    EXPECT_EQ(request.method, network::HttpMethod::POST);
    EXPECT_EQ(request.url, "http://immich.test/api/assets");
    EXPECT_EQ(request.get_header("x-immich-checksum"), "2aae6c35c94fcfb415dbe95f408b9ce91ee846ed");
    EXPECT_EQ(request.get_header("x-api-key"), "test-key");
    EXPECT_EQ(request.get_header("Content-Type"),
              "multipart/form-data; boundary=IMMICHCLIENTMULTIPARTUPLOADBOUND");

    const std::string body = request.body_as_string();
    EXPECT_NE(body.find("name=\"deviceAssetId\"\r\n\r\nIMG_0001.jpg\r\n"), std::string::npos);
    EXPECT_NE(body.find("name=\"deviceId\"\r\n\r\ntest-device\r\n"), std::string::npos);
    EXPECT_NE(body.find("name=\"fileCreatedAt\"\r\n\r\n2024-12-24T18:30:00.000Z\r\n"), std::string::npos);
    EXPECT_NE(body.find("name=\"fileModifiedAt\"\r\n\r\n2025-01-29T08:00:00.000Z\r\n"), std::string::npos);
    EXPECT_NE(body.find("name=\"assetData\"; filename=\"IMG_0001.jpg\"\r\n\r\nhello world\r\n"),
              std::string::npos);
}

TEST(UploadTest, CreationTimeDefaultsToFileTime) {
    const auto body = api::build_upload_body(sample_asset());
    ASSERT_TRUE(body.is_ok());
    const std::string text(body.value().data.begin(), body.value().data.end());
    EXPECT_NE(text.find("name=\"fileCreatedAt\"\r\n\r\n2025-01-28T05:42:36.000Z\r\n"), std::string::npos);
}

TEST(UploadTest, QuoteInFileNameIsEscaped) {
    auto asset = sample_asset();
    asset.set_device_asset_id("say \"cheese\".jpg");

    const auto body = api::build_upload_body(asset);
    ASSERT_TRUE(body.is_ok());
    const std::string text(body.value().data.begin(), body.value().data.end());
    EXPECT_NE(text.find("filename=\"say \\\"cheese\\\".jpg\"\r\n"), std::string::npos);
}

TEST(UploadTest, LineBreakInIdFailsWithoutRequest) {
    auto transport = std::make_shared<FakeTransport>([](const HttpRequest&) {
        return json_response(201, {{"id", kRemoteId}, {"status", "created"}});
    });
    const auto session = make_session(transport);
    auto asset = sample_asset();
    asset.set_device_asset_id("evil\r\nX-Injected: 1.jpg");

    const auto outcome = api::upload_asset(session, asset);
    ASSERT_EQ(outcome.status(), api::UploadStatus::Failed);
    EXPECT_EQ(outcome.error()->code, ErrorCode::InvalidAsset);
    EXPECT_TRUE(transport->requests().empty());
}

TEST(UploadTest, BoundaryAvoidsFileContent) {
    const std::string content = std::string("prefix --") + network::MultipartBuilder::kDefaultBoundary + " suffix";
    auto asset = asset::Asset::from_bytes("tricky.bin", asset::Asset::Bytes(content.begin(), content.end()));

    const auto body = api::build_upload_body(asset);
    ASSERT_TRUE(body.is_ok());
    EXPECT_EQ(body.value().content_type,
              "multipart/form-data; boundary=IMMICHCLIENTMULTIPARTUPLOADBOUND-1");
}

TEST(UploadTest, UnauthorizedIsAuthFailure) {
    const auto outcome = upload_with([](const HttpRequest&) {
        return json_response(401, {{"message", "Invalid user token"}});
    });

    EXPECT_EQ(outcome.status(), api::UploadStatus::Failed);
    EXPECT_FALSE(outcome.remote_id().has_value());
    ASSERT_TRUE(outcome.error().has_value());
    EXPECT_EQ(outcome.error()->code, ErrorCode::Auth);
    EXPECT_EQ(outcome.error()->http_status, 401);
}

TEST(UploadTest, ServerErrorIsStatusFailure) {
    const auto outcome = upload_with([](const HttpRequest&) {
        return text_response(500, "internal error");
    });

    ASSERT_EQ(outcome.status(), api::UploadStatus::Failed);
    EXPECT_EQ(outcome.error()->code, ErrorCode::Status);
    EXPECT_EQ(outcome.error()->http_status, 500);
    EXPECT_EQ(outcome.error()->subject, "IMG_0001.jpg");
}

TEST(UploadTest, MalformedResponsesAreProtocolFailures) {
    const auto not_json = upload_with([](const HttpRequest&) {
        return text_response(201, "<html>proxy</html>");
    });
    EXPECT_EQ(not_json.error()->code, ErrorCode::Protocol);

    const auto missing_id = upload_with([](const HttpRequest&) {
        return json_response(201, {{"status", "created"}});
    });
    EXPECT_EQ(missing_id.error()->code, ErrorCode::Protocol);

    const auto unknown_status = upload_with([](const HttpRequest&) {
        return json_response(201, {{"id", kRemoteId}, {"status", "replaced"}});
    });
    EXPECT_EQ(unknown_status.error()->code, ErrorCode::Protocol);
    EXPECT_FALSE(unknown_status.remote_id().has_value());
}

TEST(UploadTest, TransportFailureIsNotRetried) {
    auto transport = std::make_shared<FakeTransport>([](const HttpRequest& request) {
        return transport_failure(request.url);
    });
    const auto session = make_session(transport);

    const auto outcome = api::upload_asset(session, sample_asset());
    EXPECT_EQ(outcome.status(), api::UploadStatus::Failed);
    EXPECT_EQ(outcome.error()->code, ErrorCode::Transport);
    EXPECT_EQ(transport->request_count(), 1u);
}

TEST(UploadTest, SessionUploaderDelegates) {
    auto transport = std::make_shared<FakeTransport>([](const HttpRequest&) {
        return json_response(201, {{"id", kRemoteId}, {"status", "created"}});
    });
    const auto session = make_session(transport);
    api::SessionUploader uploader(session);

    EXPECT_EQ(uploader.upload(sample_asset()).status(), api::UploadStatus::Created);
}

TEST(UploadOutcomeTest, FailedKeepsSubject) {
    const auto outcome = api::UploadOutcome::failed("a.jpg", make_error(ErrorCode::Transport, "timeout"));
    EXPECT_EQ(outcome.error()->subject, "a.jpg");

    const auto with_subject = api::UploadOutcome::failed(
        "a.jpg", make_error(ErrorCode::InvalidAsset, "unreadable", "/photos/a.jpg"));
    EXPECT_EQ(with_subject.error()->subject, "/photos/a.jpg");
}
