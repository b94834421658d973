#include "framelift/remote/push_codec.hpp"

#include "framelift/util/log.hpp"

#include <nlohmann/json.hpp>

#include <cmath>

namespace framelift {

using json = nlohmann::json;

namespace {

constexpr int kInvocationType = 1;

auto string_field(const json& obj, const char* key) -> std::string {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

auto number_field(const json& obj, const char* key, double fallback = 0.0)
    -> double {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_number()) {
    return fallback;
  }
  return it->get<double>();
}

auto bytes_field(const json& obj, const char* key) -> std::uint64_t {
  auto value = number_field(obj, key);
  return value > 0 ? static_cast<std::uint64_t>(value) : 0;
}

auto parse_disk_usage(const json& obj) -> DiskUsage {
  DiskUsage usage;
  usage.total_bytes = bytes_field(obj, "totalSpace");
  usage.used_bytes = bytes_field(obj, "usedSpace");
  usage.available_bytes = bytes_field(obj, "availableSpace");
  if (usage.used_bytes == 0 && usage.total_bytes >= usage.available_bytes) {
    usage.used_bytes = usage.total_bytes - usage.available_bytes;
  }
  usage.usage_percent = number_field(obj, "usagePercentage", -1.0);
  if (usage.usage_percent < 0.0) {
    usage.normalize();
  }
  return usage;
}

// Arguments are either positional scalars or one object payload.
auto payload(const json& args) -> const json* {
  if (!args.empty() && args.front().is_object()) {
    return &args.front();
  }
  return nullptr;
}

auto positional_string(const json& args, std::size_t idx) -> std::string {
  if (idx < args.size() && args[idx].is_string()) {
    return args[idx].get<std::string>();
  }
  return {};
}

auto decode_invocation(std::string_view target, const json& args)
    -> Result<std::optional<PushEvent>> {
  const json* obj = payload(args);

  if (target == "TaskCreated") {
    TaskCreatedEvent e;
    e.task_id = obj ? string_field(*obj, "taskId") : positional_string(args, 0);
    e.task_name = obj ? string_field(*obj, "taskName") : positional_string(args, 1);
    if (e.task_id.empty()) {
      return fail(Error::ParseError);
    }
    return PushEvent{std::move(e)};
  }

  if (target == "TaskStarted") {
    TaskStartedEvent e;
    e.task_id = obj ? string_field(*obj, "taskId") : positional_string(args, 0);
    if (e.task_id.empty()) {
      return fail(Error::ParseError);
    }
    return PushEvent{std::move(e)};
  }

  if (target == "ProgressUpdate") {
    if (obj == nullptr) {
      return fail(Error::ParseError);
    }
    ProgressUpdateEvent e;
    e.task_id = string_field(*obj, "taskId");
    e.percent = static_cast<int>(std::lround(number_field(*obj, "progress")));
    e.speed = number_field(*obj, "speed");
    e.eta_seconds = static_cast<int>(std::lround(
        number_field(*obj, "remainingSeconds",
                     number_field(*obj, "estimatedRemainingSeconds"))));
    if (e.task_id.empty()) {
      return fail(Error::ParseError);
    }
    return PushEvent{std::move(e)};
  }

  if (target == "TaskCompleted") {
    TaskCompletedEvent e;
    if (obj) {
      e.task_id = string_field(*obj, "taskId");
      auto it = obj->find("success");
      e.success = it != obj->end() && it->is_boolean() && it->get<bool>();
      e.output_path = string_field(*obj, "outputPath");
      if (e.output_path.empty()) {
        e.output_path = string_field(*obj, "message");
      }
    } else {
      // (taskId, taskName, success, message)
      e.task_id = positional_string(args, 0);
      e.success = args.size() > 2 && args[2].is_boolean() && args[2].get<bool>();
      e.output_path = positional_string(args, 3);
    }
    if (e.task_id.empty()) {
      return fail(Error::ParseError);
    }
    return PushEvent{std::move(e)};
  }

  if (target == "TaskFailed") {
    TaskFailedEvent e;
    e.task_id = obj ? string_field(*obj, "taskId") : positional_string(args, 0);
    e.reason = obj ? string_field(*obj, "reason") : positional_string(args, 1);
    if (e.task_id.empty()) {
      return fail(Error::ParseError);
    }
    return PushEvent{std::move(e)};
  }

  if (target == "TaskStatus") {
    if (obj == nullptr) {
      return fail(Error::ParseError);
    }
    TaskStatusEvent e;
    e.task_id = string_field(*obj, "taskId");
    e.status = string_field(*obj, "status");
    e.progress = static_cast<int>(std::lround(number_field(*obj, "progress")));
    e.error = string_field(*obj, "errorMessage");
    if (e.task_id.empty() || e.status.empty()) {
      return fail(Error::ParseError);
    }
    return PushEvent{std::move(e)};
  }

  if (target == "DiskSpaceUpdated") {
    if (obj == nullptr) {
      return fail(Error::ParseError);
    }
    return PushEvent{DiskSpaceUpdatedEvent{parse_disk_usage(*obj)}};
  }

  if (target == "SpaceWarning") {
    if (obj == nullptr) {
      return fail(Error::ParseError);
    }
    return PushEvent{SpaceWarningEvent{number_field(*obj, "usagePercentage"),
                                       string_field(*obj, "message")}};
  }

  if (target == "SpaceReleased") {
    if (obj == nullptr) {
      return fail(Error::ParseError);
    }
    SpaceReleasedEvent e;
    e.released_bytes = bytes_field(*obj, "releasedBytes");
    if (auto it = obj->find("diskSpace"); it != obj->end() && it->is_object()) {
      e.usage = parse_disk_usage(*it);
    }
    return PushEvent{std::move(e)};
  }

  if (target == "SpaceConfigChanged") {
    if (obj == nullptr) {
      return fail(Error::ParseError);
    }
    return PushEvent{SpaceConfigChangedEvent{bytes_field(*obj, "maxTotalSpace")}};
  }

  log::debug("Ignoring hub target {}", target);
  return std::optional<PushEvent>{};
}

}  // namespace

auto encode_invocation(const HubInvocation& invocation) -> std::string {
  json j = {{"type", kInvocationType},
            {"target", invocation.target},
            {"arguments", invocation.arguments}};
  auto out = j.dump();
  out.push_back(kRecordSeparator);
  return out;
}

auto split_frames(std::string& buffer) -> std::vector<std::string> {
  std::vector<std::string> frames;
  std::size_t start = 0;
  for (auto pos = buffer.find(kRecordSeparator); pos != std::string::npos;
       pos = buffer.find(kRecordSeparator, start)) {
    if (pos > start) {
      frames.emplace_back(buffer, start, pos - start);
    }
    start = pos + 1;
  }
  buffer.erase(0, start);
  return frames;
}

auto decode_frame(std::string_view frame) -> Result<std::optional<PushEvent>> {
  auto j = json::parse(frame, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    return fail(Error::ParseError);
  }

  auto type = j.find("type");
  if (type == j.end() || !type->is_number_integer()) {
    return fail(Error::ParseError);
  }
  if (type->get<int>() != kInvocationType) {
    return std::optional<PushEvent>{};
  }

  auto target = string_field(j, "target");
  if (target.empty()) {
    return fail(Error::ParseError);
  }

  auto args = j.find("arguments");
  if (args == j.end() || !args->is_array()) {
    return fail(Error::ParseError);
  }
  return decode_invocation(target, *args);
}

}  // namespace framelift
