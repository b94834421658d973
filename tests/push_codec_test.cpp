#include "framelift/remote/push_codec.hpp"

#include <nlohmann/json.hpp>

#include "gtest/gtest.h"

using namespace framelift;
using json = nlohmann::json;

namespace {

auto frame(std::string_view target, json arguments) -> std::string {
  return json{{"type", 1},
              {"target", std::string(target)},
              {"arguments", std::move(arguments)}}
      .dump();
}

template <typename T>
auto decode_as(const std::string& text) -> T {
  auto r = decode_frame(text);
  EXPECT_TRUE(r.has_value());
  EXPECT_TRUE(r->has_value());
  EXPECT_TRUE(std::holds_alternative<T>(**r));
  return std::get<T>(**r);
}

}  // namespace

TEST(PushCodecTest, EncodeInvocationAppendsSeparator) {
  auto out = encode_invocation({std::string(hub::kJoinTaskGroup), {"abc"}});
  ASSERT_FALSE(out.empty());
  EXPECT_EQ(out.back(), kRecordSeparator);

  out.pop_back();
  auto j = json::parse(out);
  EXPECT_EQ(j["type"], 1);
  EXPECT_EQ(j["target"], "JoinTaskGroup");
  EXPECT_EQ(j["arguments"], json::array({"abc"}));
}

TEST(PushCodecTest, SplitFramesKeepsPartialTail) {
  std::string buffer = "{\"a\":1}";
  buffer.push_back(kRecordSeparator);
  buffer += "{\"b\":2}";
  buffer.push_back(kRecordSeparator);
  buffer += "{\"c\":";

  auto frames = split_frames(buffer);
  ASSERT_EQ(frames.size(), 2);
  EXPECT_EQ(frames[0], "{\"a\":1}");
  EXPECT_EQ(frames[1], "{\"b\":2}");
  EXPECT_EQ(buffer, "{\"c\":");

  buffer += "3}";
  buffer.push_back(kRecordSeparator);
  frames = split_frames(buffer);
  ASSERT_EQ(frames.size(), 1);
  EXPECT_EQ(frames[0], "{\"c\":3}");
  EXPECT_TRUE(buffer.empty());
}

TEST(PushCodecTest, SplitFramesSkipsEmptyRecords) {
  std::string buffer(3, kRecordSeparator);
  EXPECT_TRUE(split_frames(buffer).empty());
  EXPECT_TRUE(buffer.empty());
}

TEST(PushCodecTest, DecodesProgressUpdate) {
  auto e = decode_as<ProgressUpdateEvent>(frame(
      "ProgressUpdate",
      json::array({{{"taskId", "t1"}, {"progress", 42.6}, {"speed", 1.25},
                    {"remainingSeconds", 90}}})));
  EXPECT_EQ(e.task_id, "t1");
  EXPECT_EQ(e.percent, 43);
  EXPECT_DOUBLE_EQ(e.speed, 1.25);
  EXPECT_EQ(e.eta_seconds, 90);
}

TEST(PushCodecTest, ProgressAcceptsAlternateRemainingKey) {
  auto e = decode_as<ProgressUpdateEvent>(frame(
      "ProgressUpdate",
      json::array({{{"taskId", "t1"}, {"progress", 10},
                    {"estimatedRemainingSeconds", 30}}})));
  EXPECT_EQ(e.eta_seconds, 30);
}

TEST(PushCodecTest, DecodesPositionalCompletion) {
  auto e = decode_as<TaskCompletedEvent>(
      frame("TaskCompleted", json::array({"t1", "clip", true, "/dl/t1"})));
  EXPECT_EQ(e.task_id, "t1");
  EXPECT_TRUE(e.success);
  EXPECT_EQ(e.output_path, "/dl/t1");
}

TEST(PushCodecTest, DecodesObjectCompletionFailure) {
  auto e = decode_as<TaskCompletedEvent>(frame(
      "TaskCompleted",
      json::array({{{"taskId", "t1"}, {"success", false},
                    {"message", "encoder crashed"}}})));
  EXPECT_FALSE(e.success);
  EXPECT_EQ(e.output_path, "encoder crashed");
}

TEST(PushCodecTest, DecodesTaskLifecycleEvents) {
  auto created = decode_as<TaskCreatedEvent>(
      frame("TaskCreated", json::array({"t1", "clip"})));
  EXPECT_EQ(created.task_name, "clip");

  auto started = decode_as<TaskStartedEvent>(
      frame("TaskStarted", json::array({{{"taskId", "t1"}}})));
  EXPECT_EQ(started.task_id, "t1");

  auto failed = decode_as<TaskFailedEvent>(
      frame("TaskFailed", json::array({"t1", "out of memory"})));
  EXPECT_EQ(failed.reason, "out of memory");
}

TEST(PushCodecTest, DecodesTaskStatus) {
  auto e = decode_as<TaskStatusEvent>(frame(
      "TaskStatus",
      json::array({{{"taskId", "t1"}, {"status", "Converting"},
                    {"progress", 55}, {"errorMessage", ""}}})));
  EXPECT_EQ(e.status, "Converting");
  EXPECT_EQ(e.progress, 55);
}

TEST(PushCodecTest, DecodesDiskSpaceUpdate) {
  auto e = decode_as<DiskSpaceUpdatedEvent>(frame(
      "DiskSpaceUpdated",
      json::array({{{"totalSpace", 1000}, {"usedSpace", 850},
                    {"availableSpace", 150}, {"usagePercentage", 85.0}}})));
  EXPECT_EQ(e.usage.total_bytes, 1000);
  EXPECT_EQ(e.usage.used_bytes, 850);
  EXPECT_DOUBLE_EQ(e.usage.usage_percent, 85.0);
}

TEST(PushCodecTest, DiskUsageDerivesMissingFields) {
  auto e = decode_as<DiskSpaceUpdatedEvent>(frame(
      "DiskSpaceUpdated",
      json::array({{{"totalSpace", 200}, {"availableSpace", 50}}})));
  EXPECT_EQ(e.usage.used_bytes, 150);
  EXPECT_DOUBLE_EQ(e.usage.usage_percent, 75.0);
}

TEST(PushCodecTest, DecodesSpaceEvents) {
  auto released = decode_as<SpaceReleasedEvent>(frame(
      "SpaceReleased",
      json::array({{{"releasedBytes", 4096},
                    {"diskSpace", {{"totalSpace", 100}, {"usedSpace", 20}}}}})));
  EXPECT_EQ(released.released_bytes, 4096);
  ASSERT_TRUE(released.usage.has_value());
  EXPECT_DOUBLE_EQ(released.usage->usage_percent, 20.0);

  auto warning = decode_as<SpaceWarningEvent>(frame(
      "SpaceWarning",
      json::array({{{"usagePercentage", 88.5}, {"message", "nearly full"}}})));
  EXPECT_DOUBLE_EQ(warning.usage_percent, 88.5);

  auto config = decode_as<SpaceConfigChangedEvent>(
      frame("SpaceConfigChanged", json::array({{{"maxTotalSpace", 5000}}})));
  EXPECT_EQ(config.max_total_bytes, 5000);
}

TEST(PushCodecTest, UnknownTargetAndPingCarryNoEvent) {
  auto unknown = decode_frame(frame("SomethingNew", json::array({1})));
  ASSERT_TRUE(unknown.has_value());
  EXPECT_FALSE(unknown->has_value());

  auto ping = decode_frame(R"({"type":6})");
  ASSERT_TRUE(ping.has_value());
  EXPECT_FALSE(ping->has_value());
}

TEST(PushCodecTest, MalformedFramesAreParseErrors) {
  for (std::string_view bad : {
           R"(not json)",
           R"([1,2,3])",
           R"({"target":"TaskStarted","arguments":["t1"]})",
           R"({"type":1,"arguments":["t1"]})",
           R"({"type":1,"target":"TaskStarted","arguments":"t1"})",
           R"({"type":1,"target":"TaskStarted","arguments":[]})",
           R"({"type":1,"target":"ProgressUpdate","arguments":["t1", 5]})",
       }) {
    auto r = decode_frame(bad);
    ASSERT_FALSE(r.has_value()) << bad;
    EXPECT_EQ(r.error(), make_error_code(Error::ParseError)) << bad;
  }
}
