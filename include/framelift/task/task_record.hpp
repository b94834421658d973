#pragma once

#include "framelift/config/conversion_settings.hpp"
#include "framelift/util/id.hpp"
#include "framelift/util/util.hpp"

#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace framelift {

enum class TaskStatus : std::uint8_t {
  Pending,
  Uploading,
  Converting,
  Paused,
  Completed,
  Failed,
  Cancelled,
};

enum class TaskPhase : std::uint8_t {
  None,
  Uploading,
  Converting,
  Downloading,
};

namespace detail {

constexpr std::array<std::string_view, 7> kTaskStatusNames = {
    "pending", "uploading", "converting", "paused",
    "completed", "failed", "cancelled",
};

constexpr std::array<std::string_view, 4> kTaskPhaseNames = {
    "none",
    "uploading",
    "converting",
    "downloading",
};

}  // namespace detail

[[nodiscard]] auto task_status_name(TaskStatus status) noexcept
    -> std::string_view;
// Case-insensitive; accepts the remote service's spelling ("Converting").
[[nodiscard]] auto parse_task_status(std::string_view name) noexcept
    -> std::optional<TaskStatus>;

[[nodiscard]] auto task_phase_name(TaskPhase phase) noexcept
    -> std::string_view;
[[nodiscard]] auto parse_task_phase(std::string_view name) noexcept
    -> TaskPhase;

[[nodiscard]] constexpr auto is_terminal(TaskStatus s) noexcept -> bool {
  return s == TaskStatus::Completed || s == TaskStatus::Failed ||
         s == TaskStatus::Cancelled;
}

[[nodiscard]] constexpr auto is_active(TaskStatus s) noexcept -> bool {
  return s == TaskStatus::Uploading || s == TaskStatus::Converting ||
         s == TaskStatus::Paused;
}

struct FileInfo {
  std::filesystem::path path;
  std::string display_name;
  std::uint64_t size_bytes{0};
  double duration_seconds{0.0};
  std::uint64_t estimated_size_bytes{0};
};

struct TaskRecord {
  LocalId local_id;
  std::optional<ServerId> server_id;
  BatchId batch_id;
  std::string task_name;

  FileInfo file;
  ConversionSettings settings;

  TaskStatus status{TaskStatus::Pending};
  TaskPhase phase{TaskPhase::None};
  int progress{0};
  int attempt{0};
  std::string error_message;
  double conversion_speed{0.0};
  int eta_seconds{0};

  TimePoint created_at{};
  TimePoint upload_started_at{};
  TimePoint upload_completed_at{};
  TimePoint conversion_started_at{};
  TimePoint completed_at{};
  TimePoint updated_at{};

  int retry_count{0};
  int max_retries{3};
  std::string last_error;
  TimePoint last_retry_at{};

  std::string download_url;
  std::string local_output_path;
  bool is_downloaded{false};
  TimePoint downloaded_at{};
  std::uint64_t output_file_size{0};
  std::string archive_path;
  bool source_file_processed{false};

  // Bumped on every mutation; listeners use it to discard stale snapshots.
  std::uint64_t version{0};

  [[nodiscard]] auto current_id() const -> std::string_view {
    return server_id ? server_id->value() : local_id.value();
  }

  [[nodiscard]] auto is_linked() const noexcept -> bool {
    return server_id.has_value();
  }
};

}  // namespace framelift
