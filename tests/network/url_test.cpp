#include "immich/network/url.hpp"

#include <gtest/gtest.h>

using immich::ErrorCode;
using immich::network::BaseUrl;

TEST(BaseUrlTest, AcceptsHttpAndHttps) {
    auto https = BaseUrl::parse("https://photos.example.org/api");
    ASSERT_TRUE(https.is_ok());
    EXPECT_EQ(https.value().str(), "https://photos.example.org/api");

    auto http = BaseUrl::parse("http://192.168.1.10:2283/api");
    ASSERT_TRUE(http.is_ok());
    EXPECT_EQ(http.value().str(), "http://192.168.1.10:2283/api");
}

TEST(BaseUrlTest, StripsTrailingSlashes) {
    auto url = BaseUrl::parse("https://photos.example.org/api//");
    ASSERT_TRUE(url.is_ok());
    EXPECT_EQ(url.value().str(), "https://photos.example.org/api");
}

TEST(BaseUrlTest, RejectsOtherSchemes) {
    auto url = BaseUrl::parse("ftp://photos.example.org");
    ASSERT_TRUE(url.is_error());
    EXPECT_EQ(url.error().code, ErrorCode::InvalidUrl);

    EXPECT_TRUE(BaseUrl::parse("photos.example.org/api").is_error());
    EXPECT_TRUE(BaseUrl::parse("").is_error());
}

TEST(BaseUrlTest, RejectsMissingHost) {
    EXPECT_TRUE(BaseUrl::parse("https://").is_error());
    EXPECT_TRUE(BaseUrl::parse("http:///").is_error());
}

TEST(BaseUrlTest, JoinsPaths) {
    auto url = BaseUrl::parse("https://photos.example.org/api/");
    ASSERT_TRUE(url.is_ok());
    EXPECT_EQ(url.value().join("/albums"), "https://photos.example.org/api/albums");
    EXPECT_EQ(url.value().join("albums"), "https://photos.example.org/api/albums");
}
