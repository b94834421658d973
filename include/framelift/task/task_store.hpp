#pragma once

#include "framelift/config/conversion_settings.hpp"
#include "framelift/core/error.hpp"
#include "framelift/task/task_record.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace framelift {

class PersistenceService;

enum class FailureDisposition : std::uint8_t { Retry, Terminal };

// Receives an immutable copy of a record after every applied mutation.
using TaskListener = std::function<void(const TaskRecord&)>;
using ListenerId = std::uint64_t;

// Owner of all task records. Every mutation is a compare-and-update under
// the store lock, so concurrent callers never observe a half-applied change.
// Mutators accepting std::string_view resolve either a local or a remote id.
class TaskStore {
public:
  explicit TaskStore(PersistenceService* persistence = nullptr,
                     int default_max_retries = 3);

  TaskStore(const TaskStore&) = delete;
  auto operator=(const TaskStore&) -> TaskStore& = delete;

  // Replaces in-memory state with records read back from disk.
  auto load(std::vector<TaskRecord> records) -> void;

  [[nodiscard]] auto create_task(FileInfo file, ConversionSettings settings,
                                 BatchId batch = {}) -> TaskRecord;

  // One-time. Re-linking the same id is accepted; a different id is refused.
  [[nodiscard]] auto link_remote_id(const LocalId& local_id,
                                    const ServerId& server_id,
                                    std::string task_name = {})
      -> Result<void>;

  // Returns false when the request matches the current state (no-op).
  // A transition to Pending is a retry reset: progress, phase, error and
  // remote link are cleared and a new attempt begins.
  [[nodiscard]] auto update_status(std::string_view id, TaskStatus status,
                                   std::optional<int> progress = {},
                                   std::optional<std::string> error = {})
      -> Result<bool>;

  // Monotonic within an attempt; lower values are ignored (returns false).
  [[nodiscard]] auto update_progress(std::string_view id, int percent,
                                     double speed = 0.0, int eta_seconds = 0)
      -> Result<bool>;

  [[nodiscard]] auto record_failure(std::string_view id, std::string error)
      -> Result<FailureDisposition>;

  // Terminal failure without touching the retry budget.
  [[nodiscard]] auto mark_failed(std::string_view id, std::string error)
      -> Result<void>;

  [[nodiscard]] auto reset_for_retry(std::string_view id) -> Result<void>;

  // User retry from a terminal state: fresh attempt, budget restored.
  [[nodiscard]] auto restart(std::string_view id) -> Result<void>;

  // Remote conversion finished. With awaiting_download the record enters
  // the Downloading phase instead of Completed. Returns false for a
  // completion that was already applied.
  [[nodiscard]] auto mark_remote_completed(std::string_view id,
                                           std::string download_url,
                                           bool awaiting_download)
      -> Result<bool>;

  [[nodiscard]] auto complete_download(std::string_view id,
                                       std::string local_output_path,
                                       std::uint64_t output_size)
      -> Result<void>;
  [[nodiscard]] auto fail_download(std::string_view id, std::string error)
      -> Result<void>;
  [[nodiscard]] auto mark_source_processed(std::string_view id,
                                           std::string archive_path)
      -> Result<void>;

  [[nodiscard]] auto remove(std::string_view id) -> Result<void>;
  // Drops terminal records last updated before now - age.
  auto purge_finished(std::chrono::hours age) -> std::size_t;

  [[nodiscard]] auto get(const LocalId& id) const -> std::optional<TaskRecord>;
  [[nodiscard]] auto find_by_server_id(const ServerId& id) const
      -> std::optional<TaskRecord>;
  [[nodiscard]] auto find(std::string_view any_id) const
      -> std::optional<TaskRecord>;
  [[nodiscard]] auto list() const -> std::vector<TaskRecord>;
  [[nodiscard]] auto list_by_status(TaskStatus status) const
      -> std::vector<TaskRecord>;
  [[nodiscard]] auto display_names() const -> std::vector<std::string>;
  [[nodiscard]] auto size() const -> std::size_t;

  auto subscribe(TaskListener listener) -> ListenerId;
  auto unsubscribe(ListenerId id) -> void;

private:
  using Mutator = std::function<Result<bool>(TaskRecord&)>;

  // Applies fn to the resolved record under the exclusive lock. When fn
  // reports a change, the record is versioned, persisted and published.
  [[nodiscard]] auto mutate(std::string_view id, const Mutator& fn)
      -> Result<bool>;
  [[nodiscard]] auto resolve(std::string_view id) -> TaskRecord*;
  [[nodiscard]] auto resolve(std::string_view id) const -> const TaskRecord*;
  auto reset_attempt(TaskRecord& r) -> void;
  auto publish(const TaskRecord& snapshot) -> void;

  PersistenceService* persistence_;
  int default_max_retries_;

  mutable std::shared_mutex mu_;
  std::unordered_map<LocalId, TaskRecord> tasks_;
  std::unordered_map<std::string, LocalId, StringHash, StringEqual> by_server_;
  std::uint64_t next_version_{1};

  mutable std::mutex listeners_mu_;
  std::map<ListenerId, TaskListener> listeners_;
  ListenerId next_listener_{1};
};

}  // namespace framelift
