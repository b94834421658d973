#include "framelift/config/settings_provider.hpp"
#include "framelift/preprocess/pipeline.hpp"
#include "framelift/preprocess/size_estimator.hpp"
#include "framelift/util/util.hpp"

#include <algorithm>
#include <set>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace framelift;
using namespace framelift::test;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

class PipelineTest : public ::testing::Test {
protected:
  void SetUp() override {
    ConversionSettings settings;
    settings.video_bitrate = "2500k";
    settings.audio_bitrate = "128k";
    settings_ = std::make_unique<SettingsStore>(settings);
  }

  auto make_pipeline(int workers = 4) -> std::unique_ptr<PreprocessPipeline> {
    return std::make_unique<PreprocessPipeline>(
        &probe_, &thumbnailer_, *settings_, estimator_,
        PipelineConfig{.max_workers = workers, .thumbnail = {}});
  }

  auto run(PreprocessPipeline& pipeline, std::vector<fs::path> inputs,
           PreprocessOptions options = {}, PreprocessCallbacks callbacks = {},
           const CancellationToken& cancel = {}) -> PreprocessResult {
    return pipeline.run(inputs, options, callbacks, cancel);
  }

  TempDir dir_;
  FakeProbe probe_;
  FakeThumbnailer thumbnailer_;
  BitrateSizeEstimator estimator_;
  std::unique_ptr<SettingsStore> settings_;
};

TEST_F(PipelineTest, MixedFolderYieldsReadyAndSkipped) {
  dir_.sparse_file("a.mp4", 50ULL * 1024 * 1024);
  dir_.write_file("b.txt", 128);
  dir_.sparse_file("c.mkv", 200ULL * 1024 * 1024);
  dir_.sparse_file("nested/d.mp4", 1024);

  auto pipeline = make_pipeline();
  auto result = run(*pipeline, {dir_.path()});

  ASSERT_EQ(result.ready.size(), 2);
  ASSERT_EQ(result.skipped.size(), 1);
  EXPECT_EQ(result.skipped[0].path.filename(), "b.txt");
  EXPECT_EQ(result.skipped[0].reason, skip_reason::kUnsupportedFormat);

  for (const auto& file : result.ready) {
    EXPECT_TRUE(file.success);
    EXPECT_FALSE(file.thumbnail.empty());
    EXPECT_NE(file.estimated_size_bytes, file.size_bytes);
    // (2.5 Mb/s + 128 kb/s) x 60 s / 8
    EXPECT_EQ(file.estimated_size_bytes, 19'710'000);
  }

  EXPECT_EQ(result.stats.total, 3);
  EXPECT_EQ(result.stats.ready, 2);
  EXPECT_EQ(result.stats.skipped, 1);
  EXPECT_EQ(result.stats.total_bytes, 250ULL * 1024 * 1024);
  EXPECT_EQ(result.stats.estimated_bytes, 2 * 19'710'000ULL);
  EXPECT_EQ(result.stats.large_files, 1);
}

TEST_F(PipelineTest, RecursiveScanFindsNestedFiles) {
  dir_.write_file("a.mp4", 64);
  dir_.write_file("nested/deeper/b.MOV", 64);

  auto pipeline = make_pipeline();
  auto result = run(*pipeline, {dir_.path()}, {.recursive = true});

  EXPECT_EQ(result.ready.size(), 2);
  EXPECT_TRUE(result.skipped.empty());
}

TEST_F(PipelineTest, InvalidInputsAreSkippedWithReason) {
  auto empty = dir_.write_file("empty.mp4", 0);
  auto missing = dir_.path() / "missing.mp4";

  auto pipeline = make_pipeline();
  auto result = run(*pipeline, {empty, missing});

  ASSERT_EQ(result.skipped.size(), 2);
  std::set<std::string> reasons;
  for (const auto& s : result.skipped) {
    reasons.insert(s.reason);
  }
  EXPECT_TRUE(reasons.contains(std::string(skip_reason::kEmpty)));
  EXPECT_TRUE(reasons.contains(std::string(skip_reason::kNotFound)));
  EXPECT_TRUE(result.ready.empty());
  EXPECT_EQ(probe_.calls(), 0);
}

TEST_F(PipelineTest, ProbeFailureIsIsolatedToOneFile) {
  dir_.write_file("good.mp4", 64);
  dir_.write_file("bad.mp4", 64);
  probe_.fail_for("bad.mp4", Error::ToolFailed);

  auto pipeline = make_pipeline();
  auto result = run(*pipeline, {dir_.path()});

  ASSERT_EQ(result.ready.size(), 2);
  auto bad = std::ranges::find(result.ready, fs::path(dir_.path() / "bad.mp4"),
                               &PreparedFile::path);
  auto good = std::ranges::find(result.ready, fs::path(dir_.path() / "good.mp4"),
                                &PreparedFile::path);
  ASSERT_NE(bad, result.ready.end());
  ASSERT_NE(good, result.ready.end());

  EXPECT_FALSE(bad->success);
  EXPECT_FALSE(bad->error.empty());
  EXPECT_EQ(bad->media.duration_text(), "unknown");
  EXPECT_EQ(bad->estimated_size_bytes, bad->size_bytes);

  EXPECT_TRUE(good->success);
  EXPECT_EQ(good->media.duration_seconds, 60.0);
}

TEST_F(PipelineTest, ThumbnailFailureKeepsMetadata) {
  dir_.write_file("a.mp4", 64);
  thumbnailer_.fail_for("a.mp4");

  auto pipeline = make_pipeline();
  auto result = run(*pipeline, {dir_.path()});

  ASSERT_EQ(result.ready.size(), 1);
  EXPECT_FALSE(result.ready[0].success);
  EXPECT_TRUE(result.ready[0].thumbnail.empty());
  EXPECT_EQ(result.ready[0].media.width, 1920);
}

TEST_F(PipelineTest, DegradedModeWithoutTools) {
  probe_.set_available(false);
  thumbnailer_.set_available(false);
  dir_.write_file("a.mp4", 4096);

  auto pipeline = make_pipeline();
  EXPECT_TRUE(pipeline->degraded());

  auto result = run(*pipeline, {dir_.path()});
  ASSERT_EQ(result.ready.size(), 1);
  EXPECT_FALSE(result.ready[0].success);
  EXPECT_EQ(result.ready[0].estimated_size_bytes, 4096);
  EXPECT_EQ(probe_.calls(), 0);
  EXPECT_EQ(thumbnailer_.calls(), 0);
}

TEST_F(PipelineTest, NullToolsAreTreatedAsUnavailable) {
  dir_.write_file("a.mp4", 64);
  PreprocessPipeline pipeline(nullptr, nullptr, *settings_, estimator_, {});

  EXPECT_TRUE(pipeline.degraded());
  std::vector<fs::path> inputs{dir_.path()};
  auto result = pipeline.run(inputs, {});
  EXPECT_EQ(result.ready.size(), 1);
}

TEST_F(PipelineTest, ConcurrencyNeverExceedsWorkerLimit) {
  for (int i = 0; i < 12; ++i) {
    dir_.write_file(std::format("clip{:02}.mp4", i), 64);
  }
  probe_.set_delay(15ms);

  auto pipeline = make_pipeline(2);
  EXPECT_LE(pipeline->worker_limit(), 2);
  auto result = run(*pipeline, {dir_.path()});

  EXPECT_EQ(result.ready.size(), 12);
  EXPECT_EQ(probe_.calls(), 12);
  EXPECT_LE(probe_.max_active(), pipeline->worker_limit());
}

TEST_F(PipelineTest, DisplayNamesAreUniqueAcrossBatchAndReserved) {
  dir_.write_file("one/clip.mp4", 64);
  dir_.write_file("two/clip.mp4", 64);
  dir_.write_file("three/CLIP.mp4", 64);

  PreprocessOptions options;
  options.recursive = true;
  options.reserved_names = {"clip.mp4"};

  auto pipeline = make_pipeline();
  auto result = run(*pipeline, {dir_.path()}, options);

  ASSERT_EQ(result.ready.size(), 3);
  std::set<std::string> names;
  for (const auto& file : result.ready) {
    names.insert(to_lower(file.display_name));
  }
  EXPECT_EQ(names.size(), 3);
  EXPECT_FALSE(names.contains("clip.mp4"));
}

TEST_F(PipelineTest, CancellationSkipsRemainingFiles) {
  for (int i = 0; i < 8; ++i) {
    dir_.write_file(std::format("clip{}.mp4", i), 64);
  }
  CancellationSource source;
  probe_.on_probe = [&](const fs::path&) { source.cancel(); };

  auto pipeline = make_pipeline(1);
  auto result = run(*pipeline, {dir_.path()}, {}, {}, source.token());

  EXPECT_TRUE(result.ready.empty());
  ASSERT_EQ(result.skipped.size(), 8);
  for (const auto& s : result.skipped) {
    EXPECT_EQ(s.reason, skip_reason::kCancelled);
  }
  EXPECT_EQ(probe_.calls(), 1);
}

TEST_F(PipelineTest, CallbacksReportPhasesAndResults) {
  dir_.write_file("a.mp4", 64);
  dir_.write_file("notes.txt", 64);

  std::vector<std::string> phases;
  int done = 0;
  int skipped = 0;
  PreprocessCallbacks callbacks{
      .on_phase = [&](const fs::path&, std::string_view p) {
        phases.emplace_back(p);
      },
      .on_file_done = [&](const PreparedFile&) { ++done; },
      .on_skipped = [&](const SkippedFile&) { ++skipped; },
  };

  auto pipeline = make_pipeline();
  auto result = run(*pipeline, {dir_.path()}, {}, callbacks);

  EXPECT_EQ(done, 1);
  EXPECT_EQ(skipped, 1);
  std::vector<std::string> expected{
      std::string(phase::kAnalyzing), std::string(phase::kProbing),
      std::string(phase::kThumbnail), std::string(phase::kEstimating)};
  EXPECT_EQ(phases, expected);
}

TEST_F(PipelineTest, EstimateFollowsCurrentSettings) {
  dir_.write_file("a.mp4", 64);
  auto pipeline = make_pipeline();
  auto result = run(*pipeline, {dir_.path()});
  ASSERT_EQ(result.ready.size(), 1);

  auto updated = settings_->current();
  updated.video_bitrate = "1M";
  updated.audio_bitrate = "0";
  ASSERT_TRUE(settings_->update(updated).has_value());

  // Unparsable audio bitrate falls back to the default.
  EXPECT_EQ(pipeline->estimate(result.ready[0]),
            (1'000'000ULL + 128'000ULL) * 60 / 8);
}

TEST_F(PipelineTest, PreparedFileConvertsToFileInfo) {
  dir_.write_file("a.mp4", 64);
  auto pipeline = make_pipeline();
  auto result = run(*pipeline, {dir_.path()});
  ASSERT_EQ(result.ready.size(), 1);

  auto info = result.ready[0].to_file_info();
  EXPECT_EQ(info.display_name, "a.mp4");
  EXPECT_EQ(info.size_bytes, 64);
  EXPECT_DOUBLE_EQ(info.duration_seconds, 60.0);
  EXPECT_EQ(info.estimated_size_bytes, result.ready[0].estimated_size_bytes);
}
