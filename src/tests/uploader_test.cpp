#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <filesystem>
#include <vector>
#include "upload/uploader.hpp"
#include "utils/blocking_runner.hpp"
#include "test_utils.hpp"

using namespace hvault::upload;
using hvault::store::ObjectStat;
using hvault::store::ObjectStoreError;
using hvault::test::MockObjectStore;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;
using ::testing::StrictMock;

class UploaderTest : public ::testing::Test {
protected:
  const std::string BUCKET = "artifacts";
  const std::string KEY = "downloads/aaaa";
  const std::string CONTENT = "captured payload";

  boost::asio::io_context io;
  hvault::utils::ThreadPoolRunner runner{io, 2};
  StrictMock<MockObjectStore> store;
  DedupCache cache;
  Uploader uploader{store, BUCKET, runner, cache};

  std::filesystem::path test_dir;
  std::vector<UploadResult> results;

  void SetUp() override {
    test_dir = hvault::test::make_test_dir("uploader_test");
  }

  void TearDown() override {
    std::filesystem::remove_all(test_dir);
  }

  std::string stage(const std::string& name, const std::string& content) {
    const auto path = test_dir / name;
    hvault::test::write_file(path, content);
    return path.string();
  }

  void upload(const std::string& key, const std::string& file_path) {
    uploader.upload(key, file_path, [this](const UploadResult& result) { results.push_back(result); });
    hvault::test::drain(io);
  }
};

TEST_F(UploaderTest, UploadsWhenNotFound) {
  const std::string file = stage("x", CONTENT);

  EXPECT_CALL(store, head_object(BUCKET, KEY)).WillOnce(Throw(hvault::test::not_found_error()));
  EXPECT_CALL(store, put_object(BUCKET, KEY, CONTENT, "application/octet-stream")).Times(1);

  upload(KEY, file);

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].state, UploadState::Done);
  EXPECT_EQ(results[0].outcome, UploadOutcome::Uploaded);
  EXPECT_EQ(results[0].bytes, CONTENT.size());
  EXPECT_TRUE(results[0].succeeded());
  EXPECT_FALSE(std::filesystem::exists(file));
  EXPECT_TRUE(cache.seen(KEY));
}

TEST_F(UploaderTest, SecondUploadIsShortCircuited) {
  const std::string file = stage("x", CONTENT);

  EXPECT_CALL(store, head_object(BUCKET, KEY)).WillOnce(Throw(hvault::test::not_found_error()));
  EXPECT_CALL(store, put_object(BUCKET, KEY, CONTENT, _)).Times(1);

  upload(KEY, file);

  const std::string again = stage("x-again", CONTENT);
  bool called_inline = false;
  uploader.upload(KEY, again, [&](const UploadResult& result) {
    called_inline = true;
    results.push_back(result);
  });
  EXPECT_TRUE(called_inline);
  hvault::test::drain(io);

  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[1].outcome, UploadOutcome::SkippedSeen);
  EXPECT_TRUE(results[1].succeeded());
  // Short-circuits keep the staged file
  EXPECT_TRUE(std::filesystem::exists(again));
}

TEST_F(UploaderTest, ExistingObjectIsNotUploaded) {
  const std::string file = stage("x", CONTENT);

  EXPECT_CALL(store, head_object(BUCKET, KEY)).WillOnce(Return(ObjectStat{CONTENT.size(), ""}));
  EXPECT_CALL(store, put_object(_, _, _, _)).Times(0);

  upload(KEY, file);

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].state, UploadState::Done);
  EXPECT_EQ(results[0].outcome, UploadOutcome::AlreadyRemote);
  EXPECT_TRUE(cache.seen(KEY));
  EXPECT_TRUE(std::filesystem::exists(file));

  // Remembered without another probe
  upload(KEY, file);
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[1].outcome, UploadOutcome::SkippedSeen);
}

TEST_F(UploaderTest, ProbeErrorFailsWithoutPut) {
  const std::string file = stage("x", CONTENT);

  EXPECT_CALL(store, head_object(BUCKET, KEY))
    .WillOnce(Throw(ObjectStoreError(500, "InternalError", "We encountered an internal error")));
  EXPECT_CALL(store, put_object(_, _, _, _)).Times(0);

  upload(KEY, file);

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].state, UploadState::Failed);
  EXPECT_EQ(results[0].outcome, UploadOutcome::Failed);
  EXPECT_FALSE(results[0].succeeded());
  ASSERT_TRUE(results[0].error);
  EXPECT_EQ(results[0].error_message(), "We encountered an internal error");
  EXPECT_TRUE(std::filesystem::exists(file));
  EXPECT_FALSE(cache.seen(KEY));
}

TEST_F(UploaderTest, PutErrorKeepsFile) {
  const std::string file = stage("x", CONTENT);

  EXPECT_CALL(store, head_object(BUCKET, KEY)).WillOnce(Throw(hvault::test::not_found_error()));
  EXPECT_CALL(store, put_object(BUCKET, KEY, CONTENT, _))
    .WillOnce(Throw(ObjectStoreError(0, "NetworkError", "connection reset")));

  upload(KEY, file);

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].state, UploadState::Failed);
  EXPECT_EQ(results[0].error_message(), "connection reset");
  EXPECT_TRUE(std::filesystem::exists(file));
  EXPECT_FALSE(cache.seen(KEY));
}

TEST_F(UploaderTest, FailedKeyIsRetriedLater) {
  const std::string file = stage("x", CONTENT);

  EXPECT_CALL(store, head_object(BUCKET, KEY))
    .WillOnce(Throw(ObjectStoreError(503, "SlowDown", "Please reduce your request rate")))
    .WillOnce(Throw(hvault::test::not_found_error()));
  EXPECT_CALL(store, put_object(BUCKET, KEY, CONTENT, _)).Times(1);

  upload(KEY, file);
  upload(KEY, file);

  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].outcome, UploadOutcome::Failed);
  EXPECT_EQ(results[1].outcome, UploadOutcome::Uploaded);
}

TEST_F(UploaderTest, MissingStagedFileFails) {
  const std::string file = (test_dir / "missing").string();

  EXPECT_CALL(store, head_object(BUCKET, KEY)).WillOnce(Throw(hvault::test::not_found_error()));
  EXPECT_CALL(store, put_object(_, _, _, _)).Times(0);

  upload(KEY, file);

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].state, UploadState::Failed);
  ASSERT_TRUE(results[0].error);
  EXPECT_THROW(std::rethrow_exception(results[0].error), StagedFileError);
  EXPECT_FALSE(cache.seen(KEY));
}

TEST_F(UploaderTest, ConcurrentUploadsOfSameKeyBothProceed) {
  const std::string first = stage("first", CONTENT);
  const std::string second = stage("second", CONTENT);

  EXPECT_CALL(store, head_object(BUCKET, KEY))
    .Times(2)
    .WillRepeatedly(Throw(hvault::test::not_found_error()));
  EXPECT_CALL(store, put_object(BUCKET, KEY, CONTENT, _)).Times(2);

  auto collect = [this](const UploadResult& result) { results.push_back(result); };
  uploader.upload(KEY, first, collect);
  uploader.upload(KEY, second, collect);
  hvault::test::drain(io);

  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].outcome, UploadOutcome::Uploaded);
  EXPECT_EQ(results[1].outcome, UploadOutcome::Uploaded);
  EXPECT_FALSE(std::filesystem::exists(first));
  EXPECT_FALSE(std::filesystem::exists(second));
}

TEST_F(UploaderTest, StateNames) {
  EXPECT_STREQ(to_string(UploadState::NotChecked), "NotChecked");
  EXPECT_STREQ(to_string(UploadState::Uploading), "Uploading");
  EXPECT_STREQ(to_string(UploadOutcome::AlreadyRemote), "AlreadyRemote");
}
