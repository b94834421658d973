#pragma once

#include "framelift/core/constants.hpp"
#include "framelift/relay/relay_event_queue.hpp"
#include "framelift/remote/push_channel.hpp"
#include "framelift/task/task_record.hpp"
#include "framelift/task/task_store.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>

namespace framelift {

class SpaceGovernor;

struct RelayConfig {
  // When false, a successful remote completion finishes the task directly.
  bool auto_download{true};
};

// Invoked once per remote completion, after the record entered the
// Downloading phase.
using CompletionHandler = std::function<void(const TaskRecord&)>;
// Invoked for remote failures of non-terminal records.
using FailureHandler =
    std::function<void(const TaskRecord&, const std::string& reason)>;

// Applies push-channel events to the task store from a single dispatch
// thread, so updates for one task are always applied in arrival order.
// Group membership follows store snapshots: a record is joined while it is
// linked and uploading or converting.
class ProgressRelay {
public:
  ProgressRelay(TaskStore& store, IPushChannel& channel,
                SpaceGovernor* governor = nullptr, RelayConfig config = {});
  ~ProgressRelay();

  ProgressRelay(const ProgressRelay&) = delete;
  auto operator=(const ProgressRelay&) -> ProgressRelay& = delete;

  // Handlers must be set before start().
  auto set_completion_handler(CompletionHandler handler) -> void;
  auto set_failure_handler(FailureHandler handler) -> void;

  auto start() -> void;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
  }

  // Accepts either id.
  [[nodiscard]] auto track(std::string_view id) -> bool;
  [[nodiscard]] auto untrack(std::string_view id) -> bool;

  // Injects an event as if it arrived on the channel.
  [[nodiscard]] auto submit(PushEvent event) -> bool;

  // True when every event posted so far has been handled.
  [[nodiscard]] auto idle() const noexcept -> bool {
    return !busy_.load(std::memory_order_acquire) && events_.empty();
  }

private:
  struct Observed {
    int attempt{0};
    int percent{0};
  };

  auto run_loop(std::stop_token stop) -> void;
  auto process_events() -> void;
  auto post(RelayEvent event) -> bool;
  auto notify() -> void;

  auto handle_event(const InboundEvent& e) -> void;
  auto handle_event(const ConnectionChangedEvent& e) -> void;
  auto handle_event(const MembershipEvent& e) -> void;
  auto handle_event(const UntrackEvent& e) -> void;
  auto handle_event(const RelayShutdownEvent& e) -> void;

  auto on_push(const TaskCreatedEvent& e) -> void;
  auto on_push(const TaskStartedEvent& e) -> void;
  auto on_push(const ProgressUpdateEvent& e) -> void;
  auto on_push(const TaskCompletedEvent& e) -> void;
  auto on_push(const TaskFailedEvent& e) -> void;
  auto on_push(const TaskStatusEvent& e) -> void;
  auto on_push(const DiskSpaceUpdatedEvent& e) -> void;
  auto on_push(const SpaceWarningEvent& e) -> void;
  auto on_push(const SpaceReleasedEvent& e) -> void;
  auto on_push(const SpaceConfigChangedEvent& e) -> void;

  // Record for a remote event, or nullopt when unknown or already terminal.
  [[nodiscard]] auto live_record(std::string_view task_id)
      -> std::optional<TaskRecord>;
  auto apply_progress(const TaskRecord& rec, int percent, double speed,
                      int eta_seconds) -> void;
  auto apply_completion(const TaskRecord& rec, const std::string& output)
      -> void;
  auto apply_failure(const TaskRecord& rec, const std::string& reason) -> void;
  auto join(const TaskRecord& rec) -> void;
  auto leave(const LocalId& local_id) -> void;
  auto resync() -> void;
  auto on_snapshot(const TaskRecord& rec) -> void;

  TaskStore& store_;
  IPushChannel& channel_;
  SpaceGovernor* governor_;
  RelayConfig config_;
  CompletionHandler on_completed_;
  FailureHandler on_failed_;

  alignas(kCacheLineSize) std::atomic<bool> running_{false};
  std::atomic<bool> busy_{false};
  int wake_fd_{-1};
  RelayEventQueue events_;
  std::jthread loop_thread_;
  ListenerId store_listener_{0};

  // Desired group per record, maintained by the store listener.
  std::mutex wanted_mu_;
  std::unordered_map<LocalId, std::string> wanted_;

  // Dispatch thread only.
  std::unordered_map<LocalId, Observed> observed_;
  std::unordered_map<LocalId, std::string> groups_;
};

}  // namespace framelift
