#pragma once

#include "framelift/space/disk_usage.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace framelift {

// Server to client notifications. task_id is always the remote id.

struct TaskCreatedEvent {
  std::string task_id;
  std::string task_name;
};

struct TaskStartedEvent {
  std::string task_id;
};

struct ProgressUpdateEvent {
  std::string task_id;
  int percent{0};
  double speed{0.0};
  int eta_seconds{0};
};

struct TaskCompletedEvent {
  std::string task_id;
  bool success{false};
  // Download location on success, failure reason otherwise.
  std::string output_path;
};

struct TaskFailedEvent {
  std::string task_id;
  std::string reason;
};

// Reply to GetTaskStatus.
struct TaskStatusEvent {
  std::string task_id;
  std::string status;
  int progress{0};
  std::string error;
};

struct DiskSpaceUpdatedEvent {
  DiskUsage usage;
};

struct SpaceWarningEvent {
  double usage_percent{0.0};
  std::string message;
};

struct SpaceReleasedEvent {
  std::uint64_t released_bytes{0};
  std::optional<DiskUsage> usage;
};

struct SpaceConfigChangedEvent {
  std::uint64_t max_total_bytes{0};
};

using PushEvent =
    std::variant<TaskCreatedEvent, TaskStartedEvent, ProgressUpdateEvent,
                 TaskCompletedEvent, TaskFailedEvent, TaskStatusEvent,
                 DiskSpaceUpdatedEvent, SpaceWarningEvent, SpaceReleasedEvent,
                 SpaceConfigChangedEvent>;

}  // namespace framelift
