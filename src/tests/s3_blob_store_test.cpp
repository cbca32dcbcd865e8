#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "crypto/digest.hpp"
#include "pipeline/tile_error.hpp"
#include "store/s3_blob_store.hpp"
#include "test_utils.hpp"

using namespace deepzoom;
using namespace deepzoom::store;
using deepzoom::test::make_response;
using deepzoom::test::MockHttpClient;
using deepzoom::test::to_bytes;
using ::testing::_;
using ::testing::Field;
using ::testing::Return;
using ::testing::SaveArg;
using ::testing::Throw;

class S3BlobStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        test::init_logging();
        options.endpoint = "https://s3.example.com/";
        options.region = "eu-west-1";
        options.bucket = "tiles";
        options.access_key_id = "AKID";
        options.secret_access_key = "SECRET";
        options.public_base_url = "https://tiles.example.com";
    }

    S3BlobStore make_store() {
        // 2024-01-02T03:04:05Z
        return S3BlobStore(options, client, [] {
            return std::chrono::system_clock::from_time_t(1704164645);
        });
    }

    S3Options options;
    MockHttpClient client;
};

TEST(S3SigningKeyTest, MatchesDocumentedExample) {
    const auto key = S3BlobStore::signing_key("wJalrXUtnFEMI/K7MDENG+bPxRfiCYEXAMPLEKEY",
                                              "20120215", "us-east-1", "iam");
    EXPECT_EQ(crypto::to_hex(key), "f4780e2d9f65fa895f9c67b32ce1baf0b0d8a43505a000a1a9e090d414db404d");
}

TEST_F(S3BlobStoreTest, UrlsArePathStyle) {
    S3BlobStore store = make_store();
    EXPECT_EQ(store.object_url("img-42abc123_2_3_4.jpg"),
              "https://s3.example.com/tiles/img-42abc123_2_3_4.jpg");
    EXPECT_EQ(store.public_url("img-42abc123_2_3_4.jpg"),
              "https://tiles.example.com/img-42abc123_2_3_4.jpg");
}

TEST_F(S3BlobStoreTest, PutSignsRequest) {
    http::HttpRequest put_request;
    EXPECT_CALL(client, perform(Field(&http::HttpRequest::method, "HEAD")))
        .WillOnce(Return(make_response(404)));
    EXPECT_CALL(client, perform(Field(&http::HttpRequest::method, "PUT")))
        .WillOnce(::testing::DoAll(SaveArg<0>(&put_request), Return(make_response(200))));

    S3BlobStore store = make_store();
    const std::string url = store.put("img-42abc123_2_3_4.jpg", to_bytes("hello"), "image/jpeg");

    EXPECT_EQ(url, "https://tiles.example.com/img-42abc123_2_3_4.jpg");
    EXPECT_EQ(put_request.url, "https://s3.example.com/tiles/img-42abc123_2_3_4.jpg");
    EXPECT_EQ(put_request.body, "hello");
    EXPECT_EQ(put_request.headers["content-type"], "image/jpeg");
    EXPECT_EQ(put_request.headers["x-amz-acl"], "public-read");
    EXPECT_EQ(put_request.headers["x-amz-date"], "20240102T030405Z");
    EXPECT_EQ(put_request.headers["x-amz-content-sha256"],
              "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824");
    EXPECT_EQ(put_request.headers["authorization"],
              "AWS4-HMAC-SHA256 Credential=AKID/20240102/eu-west-1/s3/aws4_request, "
              "SignedHeaders=content-type;host;x-amz-acl;x-amz-content-sha256;x-amz-date, "
              "Signature=b7ed8f7598fd90b0076127a97990d3c59008b814ef709d1b77355c288cfbdd80");
}

TEST_F(S3BlobStoreTest, ExistingObjectIsNotUploaded) {
    EXPECT_CALL(client, perform(Field(&http::HttpRequest::method, "HEAD")))
        .WillOnce(Return(make_response(200)));
    EXPECT_CALL(client, perform(Field(&http::HttpRequest::method, "PUT"))).Times(0);

    S3BlobStore store = make_store();
    EXPECT_EQ(store.put("tile.jpg", to_bytes("data"), "image/jpeg"), "https://tiles.example.com/tile.jpg");
}

TEST_F(S3BlobStoreTest, ExistsMapsStatus) {
    EXPECT_CALL(client, perform(_))
        .WillOnce(Return(make_response(200)))
        .WillOnce(Return(make_response(404)))
        .WillOnce(Return(make_response(403)));

    S3BlobStore store = make_store();
    EXPECT_TRUE(store.exists("a.jpg"));
    EXPECT_FALSE(store.exists("a.jpg"));
    EXPECT_THROW(store.exists("a.jpg"), pipeline::StorageError);
}

TEST_F(S3BlobStoreTest, FailuresAreStorageErrors) {
    EXPECT_CALL(client, perform(Field(&http::HttpRequest::method, "HEAD")))
        .WillOnce(Return(make_response(404)))
        .WillOnce(Throw(pipeline::NetworkError("connection refused")));
    EXPECT_CALL(client, perform(Field(&http::HttpRequest::method, "PUT")))
        .WillOnce(Return(make_response(500, "<Error>InternalError</Error>")));

    S3BlobStore store = make_store();
    EXPECT_THROW(store.put("a.jpg", to_bytes("x"), "image/jpeg"), pipeline::StorageError);
    EXPECT_THROW(store.put("a.jpg", to_bytes("x"), "image/jpeg"), pipeline::StorageError);
}

TEST_F(S3BlobStoreTest, RequiresEndpointAndBucket) {
    options.bucket.clear();
    EXPECT_THROW(make_store(), pipeline::StorageError);
}
