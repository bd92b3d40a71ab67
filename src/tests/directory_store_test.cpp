#include <gtest/gtest.h>
#include <sstream>
#include <filesystem>
#include <thread>
#include <vector>
#include "store/directory_store.hpp"
#include "store/store_factory.hpp"
#include "test_utils.hpp"

using namespace hvault::store;

class DirectoryStoreTest : public ::testing::Test {
protected:
  const std::string BUCKET = "artifacts";
  std::filesystem::path test_dir;
  std::unique_ptr<DirectoryStore> store;

  void SetUp() override {
    test_dir = hvault::test::make_test_dir("directory_store_test");
    ASSERT_TRUE(std::filesystem::exists(test_dir));
    store = std::make_unique<DirectoryStore>(test_dir.string());
    ASSERT_NE(store, nullptr);
  }

  void TearDown() override {
    if (store) {
      store->clear();
      store.reset();
    }
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  // Helper methods to reduce repetition
  void store_and_verify(const std::string& key, const std::string& data) {
    ASSERT_NO_THROW(store->put_object(BUCKET, key, data, "application/octet-stream"))
      << "Failed to store key: " << key;

    ObjectStat stat;
    ASSERT_NO_THROW(stat = store->head_object(BUCKET, key)) << "Key should exist after storing: " << key;
    EXPECT_EQ(stat.size, data.size());

    std::stringstream output;
    ASSERT_NO_THROW(store->get_object(BUCKET, key, output)) << "Failed to retrieve key: " << key;
    ASSERT_EQ(output.str(), data) << "Data mismatch for key: " << key;
  }

  void expect_not_found(const std::string& key) {
    try {
      store->head_object(BUCKET, key);
      FAIL() << "Key should not exist: " << key;
    } catch (const ObjectStoreError& e) {
      EXPECT_TRUE(e.not_found()) << e.what();
      EXPECT_EQ(e.status(), 404u);
    }
  }
};

TEST_F(DirectoryStoreTest, BasicOperations) {
  store_and_verify("downloads/aaaa", "Hello, Store!");

  // Empty payload
  store_and_verify("events/abc123-deadbeef", "");

  expect_not_found("downloads/nonexistent");
}

TEST_F(DirectoryStoreTest, OverwritesExistingObject) {
  store_and_verify("uploads/bbbb", "first");
  store_and_verify("uploads/bbbb", "second, longer content");
}

TEST_F(DirectoryStoreTest, BinaryContent) {
  std::string data;
  for (int i = 0; i < 256; ++i) {
    data.push_back(static_cast<char>(i));
  }
  store_and_verify("downloads/binary", data);
}

TEST_F(DirectoryStoreTest, LeavesNoTemporaryFiles) {
  store_and_verify("downloads/cccc", "payload");

  std::size_t files = 0;
  for (const auto& entry : std::filesystem::recursive_directory_iterator(test_dir)) {
    if (entry.is_regular_file()) {
      ++files;
    }
  }
  EXPECT_EQ(files, 1u);
}

TEST_F(DirectoryStoreTest, KeyBelowExistingObjectIsNotFound) {
  store_and_verify("events/abc", "session log");

  // A stored object occupies the path of a would-be parent directory
  expect_not_found("events/abc/def-1234");
}

TEST_F(DirectoryStoreTest, RejectsInvalidKeys) {
  const std::vector<std::string> invalid_keys = {
    "",
    "../path/traversal",
    "downloads/../../escape",
    "/absolute/path",
    "downloads//double",
    "downloads/",
    "./dot"
  };

  for (const auto& key : invalid_keys) {
    EXPECT_THROW(store->put_object(BUCKET, key, "data", "application/octet-stream"), ObjectStoreError)
      << "Key should be rejected: " << key;
    try {
      store->head_object(BUCKET, key);
      FAIL() << "Head should reject key: " << key;
    } catch (const ObjectStoreError& e) {
      EXPECT_FALSE(e.not_found()) << key;
      EXPECT_EQ(e.status(), 400u) << key;
    }
  }
  EXPECT_FALSE(std::filesystem::exists(test_dir.parent_path() / "escape"));
}

TEST_F(DirectoryStoreTest, RejectsInvalidBuckets) {
  for (const std::string bucket : {"", "..", "a/b"}) {
    EXPECT_THROW(store->put_object(bucket, "downloads/aaaa", "data", "text/plain"), ObjectStoreError)
      << "Bucket should be rejected: " << bucket;
  }
}

TEST_F(DirectoryStoreTest, ClearRemovesEverything) {
  store_and_verify("downloads/temp", "temp_data");
  ASSERT_NO_THROW(store->clear());
  expect_not_found("downloads/temp");
  EXPECT_TRUE(std::filesystem::exists(test_dir));
}

TEST_F(DirectoryStoreTest, ConcurrentPuts) {
  const int num_threads = 8;
  std::vector<std::thread> threads;

  for (int i = 0; i < num_threads; ++i) {
    threads.emplace_back([this, i]() {
      store->put_object(BUCKET, "downloads/shared", "content from writer", "application/octet-stream");
      store->put_object(BUCKET, "downloads/own" + std::to_string(i), std::to_string(i), "application/octet-stream");
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  std::stringstream output;
  store->get_object(BUCKET, "downloads/shared", output);
  EXPECT_EQ(output.str(), "content from writer");
  for (int i = 0; i < num_threads; ++i) {
    EXPECT_NO_THROW(store->head_object(BUCKET, "downloads/own" + std::to_string(i)));
  }
}

TEST_F(DirectoryStoreTest, FactorySelectsDirectoryStore) {
  hvault::config::StoreConfig config;
  config.bucket = BUCKET;
  config.endpoint = "file://" + (test_dir / "factory").string();

  auto created = make_object_store(config);
  ASSERT_NE(dynamic_cast<DirectoryStore*>(created.get()), nullptr);
  EXPECT_NO_THROW(created->put_object(BUCKET, "downloads/eeee", "x", "text/plain"));
  EXPECT_TRUE(std::filesystem::exists(test_dir / "factory" / BUCKET / "downloads" / "eeee"));

  config.endpoint = "file://";
  EXPECT_THROW(make_object_store(config), hvault::config::ConfigError);
}
