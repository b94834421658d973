#include "framelift/config/config.hpp"
#include "framelift/config/settings_provider.hpp"

#include <fstream>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace framelift;

// ClientConfig tests
TEST(ConfigTest, ClientConfigDefaults) {
  ClientConfig config;

  EXPECT_EQ(config.storage.db_file, "framelift.db");
  EXPECT_EQ(config.logging.level, "info");
  EXPECT_TRUE(config.logging.file.empty());
  EXPECT_EQ(config.preprocess.max_workers, 4);
  EXPECT_FALSE(config.preprocess.recursive);
  EXPECT_EQ(config.preprocess.thumbnail_width, 100);
  EXPECT_EQ(config.preprocess.thumbnail_height, 70);
  EXPECT_EQ(config.transfer.max_retries, 3);
  EXPECT_TRUE(config.transfer.auto_download);
  EXPECT_DOUBLE_EQ(config.space.warning_percent, 80.0);
  EXPECT_DOUBLE_EQ(config.space.pause_percent, 90.0);
  EXPECT_EQ(config.conversion.output_format, "mp4");
  EXPECT_EQ(config.conversion.source_file_action, SourceFileAction::Keep);
}

TEST(ConfigTest, LoadFromString) {
  auto yaml = R"(
storage:
  db_file: /var/lib/framelift/tasks.db
  write_retry_interval_ms: 500
logging:
  level: debug
preprocess:
  max_workers: 8
  recursive: true
  thumbnail_width: 160
transfer:
  max_concurrent_uploads: 3
  max_retries: 5
  auto_download: false
  output_directory: /data/out
space:
  warning_percent: 70
  pause_percent: 85
  total_space_gb: 250
conversion:
  output_format: mkv
  video_bitrate: 2500k
  two_pass: true
  source_file_action: archive
)";

  auto result = ConfigLoader::load_from_string(yaml);
  ASSERT_TRUE(result.has_value());
  const auto& c = *result;

  EXPECT_EQ(c.storage.db_file, "/var/lib/framelift/tasks.db");
  EXPECT_EQ(c.storage.write_retry_interval_ms, 500);
  EXPECT_EQ(c.logging.level, "debug");
  EXPECT_EQ(c.preprocess.max_workers, 8);
  EXPECT_TRUE(c.preprocess.recursive);
  EXPECT_EQ(c.preprocess.thumbnail_width, 160);
  EXPECT_EQ(c.preprocess.thumbnail_height, 70);
  EXPECT_EQ(c.transfer.max_concurrent_uploads, 3);
  EXPECT_EQ(c.transfer.max_retries, 5);
  EXPECT_FALSE(c.transfer.auto_download);
  EXPECT_EQ(c.transfer.output_directory, "/data/out");
  EXPECT_DOUBLE_EQ(c.space.warning_percent, 70.0);
  EXPECT_DOUBLE_EQ(c.space.pause_percent, 85.0);
  EXPECT_DOUBLE_EQ(c.space.total_space_gb, 250.0);
  EXPECT_EQ(c.conversion.output_format, "mkv");
  EXPECT_EQ(c.conversion.video_bitrate, "2500k");
  EXPECT_EQ(c.conversion.audio_bitrate, "192k");
  EXPECT_TRUE(c.conversion.two_pass);
  EXPECT_EQ(c.conversion.source_file_action, SourceFileAction::Archive);
}

TEST(ConfigTest, PartialSectionsKeepDefaults) {
  auto result = ConfigLoader::load_from_string("transfer:\n  max_retries: 1\n");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->transfer.max_retries, 1);
  EXPECT_EQ(result->transfer.max_concurrent_uploads, 2);
  EXPECT_EQ(result->storage.db_file, "framelift.db");
}

TEST(ConfigTest, LoadFromString_InvalidYaml) {
  auto result = ConfigLoader::load_from_string("storage: [unclosed");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, LoadFromString_Empty) {
  auto result = ConfigLoader::load_from_string("");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, RejectsInvertedSpaceThresholds) {
  auto result = ConfigLoader::load_from_string(
      "space:\n  warning_percent: 95\n  pause_percent: 90\n");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::InvalidArgument));
}

TEST(ConfigTest, RejectsZeroWorkers) {
  auto result =
      ConfigLoader::load_from_string("preprocess:\n  max_workers: 0\n");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::InvalidArgument));
}

TEST(ConfigTest, RetryDelaysParseAndRejectCapBelowBase) {
  auto result = ConfigLoader::load_from_string(
      "transfer:\n  retry_base_delay_ms: 500\n  retry_max_delay_ms: 4000\n");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->transfer.retry_base_delay_ms, 500);
  EXPECT_EQ(result->transfer.retry_max_delay_ms, 4000);

  auto inverted = ConfigLoader::load_from_string(
      "transfer:\n  retry_base_delay_ms: 5000\n  retry_max_delay_ms: 1000\n");
  ASSERT_FALSE(inverted.has_value());
  EXPECT_EQ(inverted.error(), make_error_code(Error::InvalidArgument));
}

TEST(ConfigTest, RejectsUnsupportedOutputFormat) {
  auto result =
      ConfigLoader::load_from_string("conversion:\n  output_format: gif\n");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::InvalidArgument));
}

TEST(ConfigTest, LoadFromFile) {
  framelift::test::TempDir dir;
  auto path = dir.path() / "framelift.yaml";
  {
    std::ofstream out(path);
    out << "logging:\n  level: warn\n  file: /tmp/framelift.log\n";
  }

  auto result = ConfigLoader::load_from_file(path.string());
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->logging.level, "warn");
  EXPECT_EQ(result->logging.file, "/tmp/framelift.log");
}

TEST(ConfigTest, LoadFromFile_Missing) {
  auto result = ConfigLoader::load_from_file("/nonexistent/framelift.yaml");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::FileNotFound));
}

// SettingsStore tests
TEST(SettingsStoreTest, UpdatePublishesToSubscribers) {
  SettingsStore store;
  std::vector<std::string> seen;
  auto id = store.subscribe(
      [&](const ConversionSettings& s) { seen.push_back(s.video_bitrate); });

  auto next = store.current();
  next.video_bitrate = "4M";
  ASSERT_TRUE(store.update(next).has_value());
  ASSERT_TRUE(store.update(next).has_value());
  EXPECT_EQ(store.current().video_bitrate, "4M");
  ASSERT_EQ(seen.size(), 1);
  EXPECT_EQ(seen[0], "4M");

  store.unsubscribe(id);
  next.video_bitrate = "6M";
  ASSERT_TRUE(store.update(next).has_value());
  EXPECT_EQ(seen.size(), 1);
}

TEST(SettingsStoreTest, InvalidUpdateKeepsCurrent) {
  SettingsStore store;
  auto bad = store.current();
  bad.audio_codec.clear();

  auto r = store.update(bad);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), make_error_code(Error::InvalidArgument));
  EXPECT_EQ(store.current().audio_codec, "aac");
}

TEST(SettingsStoreTest, SourceFileActionNames) {
  EXPECT_EQ(source_file_action_name(SourceFileAction::Delete), "delete");
  EXPECT_EQ(parse_source_file_action("archive"), SourceFileAction::Archive);
  EXPECT_EQ(parse_source_file_action("bogus"), SourceFileAction::Keep);
}
