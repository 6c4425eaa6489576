#include <gtest/gtest.h>
#include <vector>
#include "core/single_shot_upload_client.hpp"
#include "core/upload_errors.hpp"
#include "test_support.hpp"

using namespace test_support;

class SingleShotUploadClientTest : public TempDirTest
{
protected:
    void SetUp() override
    {
        TempDirTest::SetUp();
        transport_ = std::make_shared<FakeTransport>();
    }

    std::shared_ptr<FakeTransport> transport_;
};

TEST_F(SingleShotUploadClientTest, LoginReturnsSession)
{
    installBluesky(*transport_);
    SingleShotUploadClient client(transport_, BLUESKY_URL + "/");

    BlueskySession session = client.login("tester.bsky.social", "app-password");
    EXPECT_EQ(session.did, "did:plc:test");
    EXPECT_EQ(session.handle, "tester.bsky.social");
    EXPECT_EQ(session.access_jwt, "access-token");
    EXPECT_EQ(session.refresh_jwt, "refresh-token");
    // Not a JWT, so no expiry can be decoded
    EXPECT_FALSE(session.access_expires_at.has_value());

    auto requests = transport_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].url, BSKY_SESSION_URL);
    nlohmann::json body = nlohmann::json::parse(requests[0].body);
    EXPECT_EQ(body["identifier"], "tester.bsky.social");
    EXPECT_EQ(body["password"], "app-password");
}

TEST_F(SingleShotUploadClientTest, LoginFailureCarriesServerMessage)
{
    transport_->on("POST", BSKY_SESSION_URL, [](const HttpRequest &)
                   { return jsonResponse(401, {{"error", "AuthenticationRequired"}, {"message", "Invalid identifier or password"}}); });
    SingleShotUploadClient client(transport_);
    try
    {
        client.login("who", "bad");
        FAIL() << "expected ProtocolError";
    }
    catch (const ProtocolError &e)
    {
        EXPECT_EQ(e.httpStatus(), 401);
        EXPECT_NE(std::string(e.what()).find("Invalid identifier or password"), std::string::npos);
    }
}

TEST_F(SingleShotUploadClientTest, UploadBlobSendsRawBytesWithBearerAuth)
{
    installBluesky(*transport_);
    SingleShotUploadClient client(transport_);
    BlueskySession session = client.login("tester.bsky.social", "app-password");

    MediaAsset asset = makeAsset("photo.png", 2048, MediaKind::IMAGE, "image/png");
    BlueskyBlob blob = client.uploadBlob(asset, session);

    EXPECT_EQ(blob.link, "bafy1");
    EXPECT_EQ(blob.mime_type, "image/png");
    EXPECT_EQ(blob.size, 2048u);

    HttpRequest upload = transport_->requests().back();
    EXPECT_EQ(upload.url, BSKY_BLOB_URL);
    EXPECT_EQ(upload.content_type, "image/png");
    EXPECT_EQ(upload.body.size(), 2048u);
    EXPECT_EQ(upload.header("Authorization"), "Bearer access-token");
}

TEST_F(SingleShotUploadClientTest, BlobWithoutLinkIsProtocolError)
{
    installBluesky(*transport_);
    transport_->on("POST", BSKY_BLOB_URL, [](const HttpRequest &)
                   { return jsonResponse(200, {{"blob", {{"mimeType", "image/png"}}}}); });
    SingleShotUploadClient client(transport_);
    BlueskySession session = client.login("tester.bsky.social", "app-password");
    MediaAsset asset = makeAsset("photo.png", 10, MediaKind::IMAGE, "image/png");
    EXPECT_THROW(client.uploadBlob(asset, session), ProtocolError);
}

TEST_F(SingleShotUploadClientTest, MalformedBlobFieldsAreProtocolErrors)
{
    const std::vector<nlohmann::json> malformed = {
        {{"ref", {{"$link", 42}}}, {"mimeType", "image/png"}, {"size", 10}},
        {{"ref", {{"$link", nullptr}}}, {"mimeType", "image/png"}, {"size", 10}},
        {{"ref", "bafy1"}, {"mimeType", "image/png"}, {"size", 10}},
        {{"ref", {{"$link", "bafy1"}}}, {"mimeType", 7}, {"size", 10}},
        {{"ref", {{"$link", "bafy1"}}}, {"mimeType", "image/png"}, {"size", "ten"}},
        {{"ref", {{"$link", "bafy1"}}}, {"mimeType", "image/png"}, {"size", -1}},
    };
    for (const auto &blob : malformed)
    {
        EXPECT_THROW(BlueskyBlob::fromJson(blob), ProtocolError) << blob.dump();
    }

    installBluesky(*transport_);
    transport_->on("POST", BSKY_BLOB_URL, [](const HttpRequest &)
                   { return jsonResponse(200, {{"blob", {{"ref", {{"$link", 42}}}, {"mimeType", "image/png"}}}}); });
    SingleShotUploadClient client(transport_);
    BlueskySession session = client.login("tester.bsky.social", "app-password");
    MediaAsset asset = makeAsset("photo.png", 10, MediaKind::IMAGE, "image/png");
    EXPECT_THROW(client.uploadBlob(asset, session), ProtocolError);
}

TEST_F(SingleShotUploadClientTest, PostWithImageEmbedsBlob)
{
    installBluesky(*transport_);
    SingleShotUploadClient client(transport_);
    BlueskySession session = client.login("tester.bsky.social", "app-password");

    BlueskyBlob blob{"bafyimage", "image/jpeg", 1234};
    std::string uri = client.post("hello", blob, session);
    EXPECT_EQ(uri, "at://did:plc:test/app.bsky.feed.post/1");

    nlohmann::json payload = nlohmann::json::parse(transport_->requests().back().body);
    EXPECT_EQ(payload["repo"], "did:plc:test");
    EXPECT_EQ(payload["collection"], "app.bsky.feed.post");
    const auto &record = payload["record"];
    EXPECT_EQ(record["$type"], "app.bsky.feed.post");
    EXPECT_EQ(record["text"], "hello");
    EXPECT_EQ(record["embed"]["$type"], "app.bsky.embed.images");
    ASSERT_EQ(record["embed"]["images"].size(), 1u);
    EXPECT_EQ(record["embed"]["images"][0]["alt"], "");
    EXPECT_EQ(record["embed"]["images"][0]["image"]["ref"]["$link"], "bafyimage");
    EXPECT_EQ(transport_->requests().back().header("Authorization"), "Bearer access-token");
}

TEST_F(SingleShotUploadClientTest, VideoBlobUsesVideoEmbed)
{
    nlohmann::json record = SingleShotUploadClient::buildPostRecord(
        "clip", BlueskyBlob{"bafyvideo", "video/mp4", 99}, "2024-01-02T03:04:05.678Z");
    EXPECT_EQ(record["embed"]["$type"], "app.bsky.embed.video");
    EXPECT_EQ(record["embed"]["video"]["ref"]["$link"], "bafyvideo");
    EXPECT_EQ(record["createdAt"], "2024-01-02T03:04:05.678Z");
}

TEST_F(SingleShotUploadClientTest, TextOnlyRecordHasNoEmbed)
{
    nlohmann::json record = SingleShotUploadClient::buildPostRecord("just text", std::nullopt, "2024-01-01T00:00:00.000Z");
    EXPECT_FALSE(record.contains("embed"));
}

TEST_F(SingleShotUploadClientTest, TimestampIsIsoUtcWithMilliseconds)
{
    std::string ts = SingleShotUploadClient::isoTimestampNow();
    ASSERT_EQ(ts.size(), 24u);
    EXPECT_EQ(ts[4], '-');
    EXPECT_EQ(ts[10], 'T');
    EXPECT_EQ(ts[19], '.');
    EXPECT_EQ(ts.back(), 'Z');
}

TEST_F(SingleShotUploadClientTest, CreateRecordWithoutUriIsProtocolError)
{
    installBluesky(*transport_);
    transport_->on("POST", BSKY_RECORD_URL, [](const HttpRequest &)
                   { return jsonResponse(200, nlohmann::json::object()); });
    SingleShotUploadClient client(transport_);
    BlueskySession session = client.login("tester.bsky.social", "app-password");
    EXPECT_THROW(client.post("hi", std::nullopt, session), ProtocolError);
}
