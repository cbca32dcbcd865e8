#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "pipeline/image_uploader.hpp"
#include "pipeline/tile_error.hpp"
#include "test_utils.hpp"

using namespace deepzoom;
using namespace deepzoom::pipeline;
using deepzoom::test::make_response;
using deepzoom::test::to_bytes;
using ::testing::_;
using ::testing::Return;

class ImageUploaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        test::init_logging();
    }

    std::shared_ptr<RetryPolicy> fast_retry() {
        return make_fixed_delay_retry(3, std::chrono::milliseconds(1));
    }

    test::MockHttpClient client;
    test::MemoryBlobStore blobs;
};

TEST(ImageExtensionTest, TakenFromPathBeforeQuery) {
    EXPECT_EQ(ImageUploader::extension_of("https://cdn.example.com/a/thumb.png?w=200"), ".png");
    EXPECT_EQ(ImageUploader::extension_of("https://cdn.example.com/a/thumb.webp"), ".webp");
    EXPECT_EQ(ImageUploader::extension_of("https://lh3.example.com/ci/AB12cd=s400"), ".jpg");
    EXPECT_EQ(ImageUploader::extension_of("https://cdn.example.com/"), ".jpg");
    EXPECT_EQ(ImageUploader::extension_of("https://cdn.example.com.au/image?name=x.gif"), ".jpg");
    EXPECT_EQ(ImageUploader::extension_of("https://cdn.example.com/art/.hidden"), ".jpg");
    EXPECT_EQ(ImageUploader::extension_of("https://cdn.example.com/art/.hidden.png"), ".png");
}

TEST(ImageExtensionTest, ContentTypes) {
    EXPECT_EQ(ImageUploader::content_type_of(".PNG"), "image/png");
    EXPECT_EQ(ImageUploader::content_type_of(".jpg"), "image/jpeg");
    EXPECT_EQ(ImageUploader::content_type_of(".bin"), "image/jpeg");
}

TEST_F(ImageUploaderTest, UploadsUnderImageId) {
    EXPECT_CALL(client, perform(_)).WillOnce(Return(make_response(200, "png-bytes")));

    ImageUploader uploader(client, blobs, fast_retry());
    const auto url = uploader.upload("https://cdn.example.com/thumb.png?w=1", "img-42");

    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(*url, "https://cdn.example.com/img-42.png");
    EXPECT_EQ(*blobs.object("img-42.png"), to_bytes("png-bytes"));
    EXPECT_EQ(blobs.content_type("img-42.png"), "image/png");
}

TEST_F(ImageUploaderTest, RetriesTransientFailures) {
    EXPECT_CALL(client, perform(_))
        .WillOnce(Return(make_response(502)))
        .WillOnce(Return(make_response(200, "jpeg")));

    ImageUploader uploader(client, blobs, fast_retry());
    EXPECT_TRUE(uploader.upload("https://cdn.example.com/a.jpg", "img").has_value());
}

TEST_F(ImageUploaderTest, GivesUpAfterLastAttempt) {
    EXPECT_CALL(client, perform(_)).Times(3).WillRepeatedly(Return(make_response(500)));

    ImageUploader uploader(client, blobs, fast_retry());
    EXPECT_FALSE(uploader.upload("https://cdn.example.com/a.jpg", "img").has_value());
    EXPECT_EQ(blobs.writes(), 0u);
}

TEST_F(ImageUploaderTest, DuplicateIsNotRetried) {
    class DuplicateBlobStore : public test::MemoryBlobStore {
    public:
        std::string put(const std::string& key, const std::vector<uint8_t>&, const std::string&) override {
            throw DuplicateError(key + " must be unique");
        }
    };
    DuplicateBlobStore duplicates;
    EXPECT_CALL(client, perform(_)).Times(1).WillOnce(Return(make_response(200, "jpeg")));

    ImageUploader uploader(client, duplicates, fast_retry());
    EXPECT_FALSE(uploader.upload("https://cdn.example.com/a.jpg", "img").has_value());
}
