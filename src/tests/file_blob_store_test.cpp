#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <thread>
#include "pipeline/tile_error.hpp"
#include "store/file_blob_store.hpp"
#include "test_utils.hpp"

using namespace deepzoom;
using namespace deepzoom::store;
using deepzoom::test::to_bytes;

class FileBlobStoreTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::unique_ptr<FileBlobStore> store;

  void SetUp() override {
    test::init_logging();
    test_dir = std::filesystem::temp_directory_path() /
      ("blob_store_test_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()));
    store = std::make_unique<FileBlobStore>(test_dir.string(), "https://cdn.example.com/tiles");
    ASSERT_TRUE(std::filesystem::exists(test_dir));
  }

  void TearDown() override {
    store.reset();
    std::filesystem::remove_all(test_dir);
  }

  // Helper storing data and checking it reads back
  void put_and_verify(const std::string& key, const std::string& data) {
    std::string url;
    ASSERT_NO_THROW(url = store->put(key, to_bytes(data), "image/jpeg")) << "Failed to store key: " << key;
    EXPECT_EQ(url, "https://cdn.example.com/tiles/" + key);
    ASSERT_TRUE(store->exists(key)) << "Key should exist after storing: " << key;
    EXPECT_EQ(store->get(key), to_bytes(data)) << "Data mismatch for key: " << key;
  }
};

TEST_F(FileBlobStoreTest, BasicOperations) {
  put_and_verify("img-42abc123_2_3_4.jpg", "decrypted tile bytes");
  put_and_verify("empty.jpg", "");

  EXPECT_FALSE(store->exists("missing.jpg"));
  EXPECT_THROW(store->get("missing.jpg"), pipeline::StorageError);
}

TEST_F(FileBlobStoreTest, PutIsIdempotent) {
  const std::string key = "tile.jpg";
  put_and_verify(key, "first");

  // A second put keeps the original object and returns the same URL
  EXPECT_EQ(store->put(key, to_bytes("second"), "image/jpeg"), store->public_url(key));
  EXPECT_EQ(store->get(key), to_bytes("first"));
}

TEST_F(FileBlobStoreTest, HashedLayout) {
  put_and_verify("layout.jpg", "x");

  // root/aa/bb/cc/rest
  size_t files = 0;
  for (const auto& entry : std::filesystem::recursive_directory_iterator(test_dir)) {
    if (entry.is_regular_file()) {
      ++files;
      const auto relative = std::filesystem::relative(entry.path(), test_dir);
      EXPECT_EQ(std::distance(relative.begin(), relative.end()), 4);
    }
  }
  EXPECT_EQ(files, 1u);
}

TEST_F(FileBlobStoreTest, ConcurrentAccess) {
  const size_t num_threads = 5;
  const size_t ops_per_thread = 20;
  std::atomic<size_t> successful_ops{0};
  std::vector<std::thread> threads;

  for (size_t i = 0; i < num_threads; ++i) {
    threads.emplace_back([this, i, ops_per_thread, &successful_ops]() {
      for (size_t j = 0; j < ops_per_thread; ++j) {
        try {
          const std::string key = "concurrent_" + std::to_string(i) + "_" + std::to_string(j) + ".jpg";
          store->put(key, to_bytes("Data for " + key), "image/jpeg");
          if (store->get(key) == to_bytes("Data for " + key)) {
            successful_ops++;
          }
        } catch (const std::exception& e) {
          ADD_FAILURE() << "Thread " << i << " failed: " << e.what();
        }
      }
    });
  }

  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(successful_ops, num_threads * ops_per_thread);
}
