#include "framelift/relay/progress_relay.hpp"

#include "framelift/space/space_governor.hpp"
#include "framelift/util/log.hpp"

#include <sys/eventfd.h>

#include <cerrno>
#include <cstring>

#include <poll.h>
#include <unistd.h>

namespace framelift {

namespace {

auto wants_group(const TaskRecord& rec) -> bool {
  return rec.is_linked() && !is_terminal(rec.status) &&
         rec.phase != TaskPhase::Downloading;
}

}  // namespace

ProgressRelay::ProgressRelay(TaskStore& store, IPushChannel& channel,
                             SpaceGovernor* governor, RelayConfig config)
    : store_(store), channel_(channel), governor_(governor), config_(config) {
  wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
  if (wake_fd_ < 0) {
    log::error("Failed to create eventfd: {}", std::strerror(errno));
  }
}

ProgressRelay::~ProgressRelay() {
  stop();
  if (wake_fd_ >= 0) {
    ::close(wake_fd_);
    wake_fd_ = -1;
  }
}

auto ProgressRelay::set_completion_handler(CompletionHandler handler) -> void {
  on_completed_ = std::move(handler);
}

auto ProgressRelay::set_failure_handler(FailureHandler handler) -> void {
  on_failed_ = std::move(handler);
}

auto ProgressRelay::start() -> void {
  if (running_.exchange(true)) {
    return;
  }

  store_listener_ =
      store_.subscribe([this](const TaskRecord& rec) { on_snapshot(rec); });
  channel_.set_event_handler([this](PushEvent event) {
    if (!submit(std::move(event))) {
      log::warn("Relay queue full, dropping push event");
    }
  });
  channel_.set_connection_handler([this](ConnectionState state) {
    if (!post(ConnectionChangedEvent{state})) {
      log::warn("Relay queue full, dropping connection change");
    }
  });

  loop_thread_ = std::jthread([this](std::stop_token st) { run_loop(st); });

  if (channel_.state() == ConnectionState::Connected) {
    static_cast<void>(post(ConnectionChangedEvent{ConnectionState::Connected}));
  }
  log::info("Progress relay started");
}

auto ProgressRelay::stop() -> void {
  if (!running_.exchange(false)) {
    return;
  }
  store_.unsubscribe(store_listener_);
  channel_.set_event_handler({});
  channel_.set_connection_handler({});

  events_.push_blocking(RelayShutdownEvent{});
  notify();
  if (loop_thread_.joinable()) {
    loop_thread_.request_stop();
    loop_thread_.join();
  }
  log::info("Progress relay stopped");
}

auto ProgressRelay::track(std::string_view id) -> bool {
  auto rec = store_.find(id);
  if (!rec) {
    return false;
  }
  return post(MembershipEvent{rec->local_id});
}

auto ProgressRelay::untrack(std::string_view id) -> bool {
  auto rec = store_.find(id);
  if (!rec) {
    return false;
  }
  return post(UntrackEvent{rec->local_id});
}

auto ProgressRelay::submit(PushEvent event) -> bool {
  return post(InboundEvent{std::move(event)});
}

auto ProgressRelay::post(RelayEvent event) -> bool {
  if (!events_.push(std::move(event))) {
    return false;
  }
  notify();
  return true;
}

auto ProgressRelay::notify() -> void {
  std::uint64_t val = 1;
  if (::write(wake_fd_, &val, sizeof(val)) < 0) {
    log::warn("Failed to write to relay eventfd: {}", std::strerror(errno));
  }
}

auto ProgressRelay::run_loop(std::stop_token stop) -> void {
  pollfd pfd{wake_fd_, POLLIN, 0};
  auto timeout_ms = static_cast<int>(timing::kRelayIdleTimeout.count());

  while (!stop.stop_requested()) {
    process_events();
    if (!running_.load(std::memory_order_acquire)) {
      break;
    }

    int ret = ::poll(&pfd, 1, timeout_ms);
    if (ret < 0 && errno != EINTR) {
      log::error("poll failed: {}", std::strerror(errno));
      break;
    }

    std::uint64_t val;
    while (::read(wake_fd_, &val, sizeof(val)) > 0) {
    }
  }
}

auto ProgressRelay::process_events() -> void {
  busy_.store(true, std::memory_order_release);
  while (auto event = events_.try_pop()) {
    std::visit([this](const auto& e) { handle_event(e); }, *event);
  }
  busy_.store(false, std::memory_order_release);
}

auto ProgressRelay::on_snapshot(const TaskRecord& rec) -> void {
  std::string want = wants_group(rec) ? std::string(rec.current_id()) : "";
  {
    std::lock_guard lock(wanted_mu_);
    auto it = wanted_.find(rec.local_id);
    if (want.empty()) {
      if (it == wanted_.end()) {
        return;
      }
      wanted_.erase(it);
    } else {
      if (it != wanted_.end() && it->second == want) {
        return;
      }
      wanted_.insert_or_assign(rec.local_id, std::move(want));
    }
  }
  if (!post(MembershipEvent{rec.local_id})) {
    log::warn("Relay queue full, membership for {} deferred to resync",
              rec.local_id);
  }
}

auto ProgressRelay::handle_event(const InboundEvent& e) -> void {
  std::visit([this](const auto& ev) { on_push(ev); }, e.event);
}

auto ProgressRelay::handle_event(const ConnectionChangedEvent& e) -> void {
  if (e.state == ConnectionState::Connected) {
    resync();
    return;
  }
  // The server forgets membership with the connection.
  if (!groups_.empty()) {
    log::info("Channel {}, {} task groups will be rejoined",
              connection_state_name(e.state), groups_.size());
  }
  groups_.clear();
}

auto ProgressRelay::handle_event(const MembershipEvent& e) -> void {
  auto rec = store_.get(e.local_id);
  if (!rec) {
    leave(e.local_id);
    observed_.erase(e.local_id);
    return;
  }
  if (wants_group(*rec)) {
    join(*rec);
  } else {
    leave(e.local_id);
  }
  if (is_terminal(rec->status)) {
    observed_.erase(e.local_id);
  }
}

auto ProgressRelay::handle_event(const UntrackEvent& e) -> void {
  leave(e.local_id);
}

auto ProgressRelay::handle_event(const RelayShutdownEvent&) -> void {
  log::debug("Relay dispatch shutting down");
}

auto ProgressRelay::on_push(const TaskCreatedEvent& e) -> void {
  log::debug("Remote task {} created ({})", e.task_id, e.task_name);
}

auto ProgressRelay::on_push(const TaskStartedEvent& e) -> void {
  auto rec = live_record(e.task_id);
  if (!rec || rec->phase == TaskPhase::Downloading) {
    return;
  }
  if (auto r = store_.update_status(rec->local_id.value(),
                                    TaskStatus::Converting);
      !r) {
    log::debug("Start of {} not applied: {}", e.task_id, r.error().message());
  }
}

auto ProgressRelay::on_push(const ProgressUpdateEvent& e) -> void {
  if (auto rec = live_record(e.task_id)) {
    apply_progress(*rec, e.percent, e.speed, e.eta_seconds);
  }
}

auto ProgressRelay::on_push(const TaskCompletedEvent& e) -> void {
  auto rec = live_record(e.task_id);
  if (!rec) {
    return;
  }
  if (e.success) {
    apply_completion(*rec, e.output_path);
  } else {
    apply_failure(*rec,
                  e.output_path.empty() ? "conversion failed" : e.output_path);
  }
}

auto ProgressRelay::on_push(const TaskFailedEvent& e) -> void {
  if (auto rec = live_record(e.task_id)) {
    apply_failure(*rec, e.reason.empty() ? "conversion failed" : e.reason);
  }
}

auto ProgressRelay::on_push(const TaskStatusEvent& e) -> void {
  auto rec = live_record(e.task_id);
  if (!rec) {
    return;
  }
  auto status = parse_task_status(e.status);
  if (!status) {
    log::debug("Unrecognized remote status '{}' for {}", e.status, e.task_id);
    return;
  }

  switch (*status) {
    case TaskStatus::Converting:
      if (rec->status == TaskStatus::Uploading ||
          rec->status == TaskStatus::Paused) {
        if (auto r = store_.update_status(rec->local_id.value(),
                                          TaskStatus::Converting);
            !r) {
          log::debug("Status refresh for {} not applied: {}", e.task_id,
                     r.error().message());
          return;
        }
      }
      apply_progress(*rec, e.progress, 0.0, 0);
      break;
    case TaskStatus::Paused:
      // Server-side hold; the local phase stays Converting.
      if (rec->phase == TaskPhase::Downloading) {
        return;
      }
      if (auto r = store_.update_status(rec->local_id.value(),
                                        TaskStatus::Paused);
          !r) {
        log::debug("Remote pause of {} not applied: {}", e.task_id,
                   r.error().message());
      }
      break;
    case TaskStatus::Completed:
      apply_completion(*rec, {});
      break;
    case TaskStatus::Failed:
      apply_failure(*rec, e.error.empty() ? "conversion failed" : e.error);
      break;
    case TaskStatus::Cancelled:
      if (auto r = store_.update_status(rec->local_id.value(),
                                        TaskStatus::Cancelled);
          !r) {
        log::debug("Remote cancel of {} not applied: {}", e.task_id,
                   r.error().message());
      }
      break;
    default:
      log::debug("Remote status {} for {} is informational", e.status,
                 e.task_id);
      break;
  }
}

auto ProgressRelay::on_push(const DiskSpaceUpdatedEvent& e) -> void {
  if (governor_) {
    governor_->on_snapshot(e.usage);
  }
}

auto ProgressRelay::on_push(const SpaceWarningEvent& e) -> void {
  if (governor_) {
    governor_->on_warning(e.usage_percent, e.message);
  }
}

auto ProgressRelay::on_push(const SpaceReleasedEvent& e) -> void {
  if (governor_) {
    governor_->on_space_released(e.released_bytes, e.usage);
  }
}

auto ProgressRelay::on_push(const SpaceConfigChangedEvent& e) -> void {
  if (governor_) {
    governor_->on_capacity_changed(e.max_total_bytes);
  }
}

auto ProgressRelay::live_record(std::string_view task_id)
    -> std::optional<TaskRecord> {
  auto rec = store_.find(task_id);
  if (!rec) {
    log::debug("Dropping event for unknown task {}", task_id);
    return std::nullopt;
  }
  if (is_terminal(rec->status)) {
    log::debug("Dropping event for finished task {}", task_id);
    return std::nullopt;
  }
  return rec;
}

auto ProgressRelay::apply_progress(const TaskRecord& rec, int percent,
                                   double speed, int eta_seconds) -> void {
  if (rec.phase == TaskPhase::Downloading || rec.status == TaskStatus::Pending) {
    return;
  }

  auto& seen = observed_[rec.local_id];
  if (seen.attempt != rec.attempt) {
    seen = Observed{rec.attempt, 0};
  }
  if (percent < seen.percent) {
    log::debug("Dropping stale progress {}% < {}% for {}", percent,
               seen.percent, rec.current_id());
    return;
  }
  seen.percent = percent;

  if (auto r = store_.update_progress(rec.local_id.value(), percent, speed,
                                      eta_seconds);
      !r) {
    log::debug("Progress for {} not applied: {}", rec.current_id(),
               r.error().message());
  }
}

auto ProgressRelay::apply_completion(const TaskRecord& rec,
                                     const std::string& output) -> void {
  auto r = store_.mark_remote_completed(rec.local_id.value(), output,
                                        config_.auto_download);
  if (!r) {
    log::warn("Completion of {} not applied: {}", rec.current_id(),
              r.error().message());
    return;
  }
  if (!*r) {
    log::debug("Duplicate completion for {}", rec.current_id());
    return;
  }
  observed_.erase(rec.local_id);
  log::info("Task {} converted remotely", rec.local_id);

  if (config_.auto_download && on_completed_) {
    if (auto snapshot = store_.get(rec.local_id)) {
      on_completed_(*snapshot);
    }
  }
}

auto ProgressRelay::apply_failure(const TaskRecord& rec,
                                  const std::string& reason) -> void {
  if (rec.phase == TaskPhase::Downloading) {
    log::debug("Ignoring failure for {} after remote completion",
               rec.current_id());
    return;
  }
  observed_.erase(rec.local_id);
  if (on_failed_) {
    on_failed_(rec, reason);
    return;
  }
  if (auto r = store_.mark_failed(rec.local_id.value(), reason); !r) {
    log::warn("Failure of {} not applied: {}", rec.current_id(),
              r.error().message());
  }
}

auto ProgressRelay::join(const TaskRecord& rec) -> void {
  std::string group(rec.current_id());
  if (auto it = groups_.find(rec.local_id); it != groups_.end()) {
    if (it->second == group) {
      return;
    }
    leave(rec.local_id);
  }
  if (auto r = channel_.join_task_group(group); !r) {
    log::debug("Join {} deferred: {}", group, r.error().message());
    return;
  }
  log::debug("Joined task group {}", group);
  groups_.emplace(rec.local_id, std::move(group));
}

auto ProgressRelay::leave(const LocalId& local_id) -> void {
  auto it = groups_.find(local_id);
  if (it == groups_.end()) {
    return;
  }
  if (auto r = channel_.leave_task_group(it->second); !r) {
    log::debug("Leave {} failed: {}", it->second, r.error().message());
  }
  groups_.erase(it);
}

auto ProgressRelay::resync() -> void {
  groups_.clear();
  std::size_t refreshed = 0;
  for (const auto& rec : store_.list()) {
    if (!rec.is_linked() || !is_active(rec.status) ||
        rec.phase == TaskPhase::Downloading) {
      continue;
    }
    join(rec);
    if (auto r = channel_.get_task_status(rec.current_id()); !r) {
      log::warn("Status refresh for {} failed: {}", rec.current_id(),
                r.error().message());
      continue;
    }
    ++refreshed;
  }
  if (auto r = channel_.get_active_tasks(); !r) {
    log::warn("Active task refresh failed: {}", r.error().message());
  }
  log::info("Channel connected, refreshed {} active tasks", refreshed);
}

}  // namespace framelift
