#include "framelift/task/task_store.hpp"

#include "framelift/storage/persistence_service.hpp"
#include "framelift/util/log.hpp"

#include <algorithm>
#include <format>
#include <ranges>
#include <utility>

namespace framelift {

namespace {

auto phase_for(TaskStatus status) -> TaskPhase {
  switch (status) {
    case TaskStatus::Uploading:
      return TaskPhase::Uploading;
    case TaskStatus::Converting:
    case TaskStatus::Paused:
      return TaskPhase::Converting;
    default:
      return TaskPhase::None;
  }
}

}  // namespace

TaskStore::TaskStore(PersistenceService* persistence, int default_max_retries)
    : persistence_(persistence), default_max_retries_(default_max_retries) {
}

auto TaskStore::load(std::vector<TaskRecord> records) -> void {
  std::unique_lock lock(mu_);
  tasks_.clear();
  by_server_.clear();
  for (auto& record : records) {
    if (record.local_id.empty()) {
      log::warn("Skipping stored task without a local id");
      continue;
    }
    next_version_ = std::max(next_version_, record.version + 1);
    if (record.server_id) {
      by_server_.emplace(record.server_id->str(), record.local_id);
    }
    auto id = record.local_id;
    tasks_.insert_or_assign(std::move(id), std::move(record));
  }
  log::info("Loaded {} tasks", tasks_.size());
}

auto TaskStore::create_task(FileInfo file, ConversionSettings settings,
                            BatchId batch) -> TaskRecord {
  TaskRecord record;
  record.local_id = generate_local_id();
  record.batch_id = std::move(batch);
  record.file = std::move(file);
  record.task_name = record.file.display_name;
  record.settings = std::move(settings);
  record.max_retries = default_max_retries_;
  record.created_at = Clock::now();
  record.updated_at = record.created_at;

  TaskRecord snapshot;
  {
    std::unique_lock lock(mu_);
    record.version = next_version_++;
    snapshot = record;
    tasks_.emplace(record.local_id, std::move(record));
  }

  log::debug("Created task {} for {}", snapshot.local_id,
             snapshot.file.path.string());
  if (persistence_) {
    persistence_->save(snapshot);
  }
  publish(snapshot);
  return snapshot;
}

auto TaskStore::link_remote_id(const LocalId& local_id,
                               const ServerId& server_id, std::string task_name)
    -> Result<void> {
  if (server_id.empty()) {
    return fail(Error::InvalidArgument);
  }

  auto r = mutate(local_id.value(), [&](TaskRecord& rec) -> Result<bool> {
    if (rec.server_id) {
      if (*rec.server_id == server_id) {
        return false;
      }
      log::warn("Task {} already linked to {}, refusing {}", rec.local_id,
                *rec.server_id, server_id);
      return fail(Error::AlreadyLinked);
    }
    if (auto it = by_server_.find(server_id.value());
        it != by_server_.end() && it->second != rec.local_id) {
      log::warn("Remote id {} already belongs to task {}", server_id,
                it->second);
      return fail(Error::AlreadyLinked);
    }
    rec.server_id = server_id;
    if (!task_name.empty()) {
      rec.task_name = std::move(task_name);
    }
    by_server_.emplace(server_id.str(), rec.local_id);
    return true;
  });
  if (!r) {
    return fail(r.error());
  }
  return ok();
}

auto TaskStore::update_status(std::string_view id, TaskStatus status,
                              std::optional<int> progress,
                              std::optional<std::string> error)
    -> Result<bool> {
  return mutate(id, [&](TaskRecord& rec) -> Result<bool> {
    // Progress never moves backwards within an attempt.
    bool same_progress = !progress || *progress <= rec.progress;
    bool same_error = !error || *error == rec.error_message;
    if (rec.status == status && same_progress && same_error) {
      return false;
    }

    if (is_terminal(rec.status) && rec.status != status) {
      log::debug("Task {} is {}, ignoring transition to {}", rec.local_id,
                 task_status_name(rec.status), task_status_name(status));
      return fail(Error::InvalidTransition);
    }

    if (status == TaskStatus::Pending) {
      reset_attempt(rec);
      return true;
    }

    auto now = Clock::now();
    if (status != rec.status) {
      if (status == TaskStatus::Uploading) {
        rec.upload_started_at = now;
      } else if (status == TaskStatus::Converting &&
                 rec.status == TaskStatus::Uploading) {
        rec.upload_completed_at = now;
      }
      if (status == TaskStatus::Converting &&
          rec.conversion_started_at == TimePoint{}) {
        rec.conversion_started_at = now;
      }
      if (is_terminal(status)) {
        rec.completed_at = now;
        rec.conversion_speed = 0.0;
        rec.eta_seconds = 0;
      }
      rec.status = status;
    }

    rec.phase = phase_for(status);
    if (status == TaskStatus::Completed) {
      rec.progress = 100;
    } else if (progress) {
      rec.progress = std::max(rec.progress, std::clamp(*progress, 0, 100));
    }
    if (error) {
      rec.error_message = std::move(*error);
    }
    return true;
  });
}

auto TaskStore::update_progress(std::string_view id, int percent, double speed,
                                int eta_seconds) -> Result<bool> {
  percent = std::clamp(percent, 0, 100);
  return mutate(id, [&](TaskRecord& rec) -> Result<bool> {
    if (is_terminal(rec.status) || rec.status == TaskStatus::Pending ||
        rec.phase == TaskPhase::Downloading) {
      return false;
    }
    if (percent < rec.progress) {
      return false;
    }
    if (percent == rec.progress && speed == rec.conversion_speed &&
        eta_seconds == rec.eta_seconds) {
      return false;
    }

    if (rec.status == TaskStatus::Uploading) {
      rec.status = TaskStatus::Converting;
      rec.phase = TaskPhase::Converting;
      rec.upload_completed_at = Clock::now();
      rec.conversion_started_at = rec.upload_completed_at;
    }
    rec.progress = percent;
    rec.conversion_speed = speed;
    rec.eta_seconds = eta_seconds;
    return true;
  });
}

auto TaskStore::record_failure(std::string_view id, std::string error)
    -> Result<FailureDisposition> {
  auto disposition = FailureDisposition::Terminal;
  auto r = mutate(id, [&](TaskRecord& rec) -> Result<bool> {
    if (rec.status == TaskStatus::Completed ||
        rec.status == TaskStatus::Cancelled) {
      return fail(Error::InvalidTransition);
    }
    if (rec.status == TaskStatus::Failed) {
      disposition = FailureDisposition::Terminal;
      return false;
    }

    rec.last_error = error;
    rec.error_message = std::move(error);
    if (rec.retry_count < rec.max_retries) {
      rec.retry_count++;
      rec.last_retry_at = Clock::now();
      disposition = FailureDisposition::Retry;
      log::info("Task {} failed (retry {}/{}): {}", rec.local_id,
                rec.retry_count, rec.max_retries, rec.error_message);
    } else {
      rec.status = TaskStatus::Failed;
      rec.phase = TaskPhase::None;
      rec.completed_at = Clock::now();
      disposition = FailureDisposition::Terminal;
      log::warn("Task {} failed after {} retries: {}", rec.local_id,
                rec.retry_count, rec.error_message);
    }
    return true;
  });
  if (!r) {
    return fail(r.error());
  }
  return disposition;
}

auto TaskStore::mark_failed(std::string_view id, std::string error)
    -> Result<void> {
  auto r = mutate(id, [&](TaskRecord& rec) -> Result<bool> {
    if (rec.status == TaskStatus::Failed) {
      return false;
    }
    if (is_terminal(rec.status)) {
      return fail(Error::InvalidTransition);
    }
    rec.status = TaskStatus::Failed;
    rec.phase = TaskPhase::None;
    rec.last_error = error;
    rec.error_message = std::move(error);
    rec.completed_at = Clock::now();
    return true;
  });
  if (!r) {
    return fail(r.error());
  }
  return ok();
}

auto TaskStore::reset_for_retry(std::string_view id) -> Result<void> {
  auto r = mutate(id, [&](TaskRecord& rec) -> Result<bool> {
    if (is_terminal(rec.status)) {
      return fail(Error::InvalidTransition);
    }
    reset_attempt(rec);
    return true;
  });
  if (!r) {
    return fail(r.error());
  }
  return ok();
}

auto TaskStore::restart(std::string_view id) -> Result<void> {
  auto r = mutate(id, [&](TaskRecord& rec) -> Result<bool> {
    if (!is_terminal(rec.status)) {
      return fail(Error::InvalidTransition);
    }
    reset_attempt(rec);
    rec.retry_count = 0;
    rec.last_error.clear();
    rec.last_retry_at = {};
    rec.completed_at = {};
    rec.download_url.clear();
    rec.local_output_path.clear();
    rec.is_downloaded = false;
    rec.downloaded_at = {};
    rec.output_file_size = 0;
    return true;
  });
  if (!r) {
    return fail(r.error());
  }
  return ok();
}

auto TaskStore::mark_remote_completed(std::string_view id,
                                      std::string download_url,
                                      bool awaiting_download) -> Result<bool> {
  return mutate(id, [&](TaskRecord& rec) -> Result<bool> {
    if (is_terminal(rec.status) || rec.phase == TaskPhase::Downloading) {
      return false;
    }
    if (rec.status == TaskStatus::Pending) {
      return fail(Error::InvalidTransition);
    }
    rec.progress = 100;
    rec.conversion_speed = 0.0;
    rec.eta_seconds = 0;
    rec.download_url = std::move(download_url);
    if (awaiting_download) {
      rec.status = TaskStatus::Converting;
      rec.phase = TaskPhase::Downloading;
    } else {
      rec.status = TaskStatus::Completed;
      rec.phase = TaskPhase::None;
      rec.completed_at = Clock::now();
    }
    return true;
  });
}

auto TaskStore::complete_download(std::string_view id,
                                  std::string local_output_path,
                                  std::uint64_t output_size) -> Result<void> {
  auto r = mutate(id, [&](TaskRecord& rec) -> Result<bool> {
    if (rec.phase != TaskPhase::Downloading &&
        rec.status != TaskStatus::Completed) {
      return fail(Error::InvalidTransition);
    }
    auto now = Clock::now();
    rec.status = TaskStatus::Completed;
    rec.phase = TaskPhase::None;
    rec.is_downloaded = true;
    rec.downloaded_at = now;
    rec.local_output_path = std::move(local_output_path);
    rec.output_file_size = output_size;
    rec.error_message.clear();
    if (rec.completed_at == TimePoint{}) {
      rec.completed_at = now;
    }
    return true;
  });
  if (!r) {
    return fail(r.error());
  }
  return ok();
}

auto TaskStore::fail_download(std::string_view id, std::string error)
    -> Result<void> {
  auto r = mutate(id, [&](TaskRecord& rec) -> Result<bool> {
    if (rec.phase != TaskPhase::Downloading &&
        rec.status != TaskStatus::Completed) {
      return fail(Error::InvalidTransition);
    }
    rec.status = TaskStatus::Completed;
    rec.phase = TaskPhase::None;
    rec.is_downloaded = false;
    rec.error_message = std::format("download failed: {}", error);
    if (rec.completed_at == TimePoint{}) {
      rec.completed_at = Clock::now();
    }
    return true;
  });
  if (!r) {
    return fail(r.error());
  }
  return ok();
}

auto TaskStore::mark_source_processed(std::string_view id,
                                      std::string archive_path)
    -> Result<void> {
  auto r = mutate(id, [&](TaskRecord& rec) -> Result<bool> {
    if (rec.source_file_processed && rec.archive_path == archive_path) {
      return false;
    }
    rec.source_file_processed = true;
    rec.archive_path = std::move(archive_path);
    return true;
  });
  if (!r) {
    return fail(r.error());
  }
  return ok();
}

auto TaskStore::remove(std::string_view id) -> Result<void> {
  LocalId local_id;
  std::uint64_t version = 0;
  {
    std::unique_lock lock(mu_);
    auto* rec = resolve(id);
    if (rec == nullptr) {
      return fail(Error::NotFound);
    }
    local_id = rec->local_id;
    version = rec->version;
    if (rec->server_id) {
      by_server_.erase(rec->server_id->str());
    }
    tasks_.erase(local_id);
  }
  if (persistence_) {
    persistence_->remove(local_id, version);
  }
  log::info("Removed task {}", local_id);
  return ok();
}

auto TaskStore::purge_finished(std::chrono::hours age) -> std::size_t {
  auto cutoff = Clock::now() - age;
  std::vector<std::pair<LocalId, std::uint64_t>> removed;
  {
    std::unique_lock lock(mu_);
    for (auto it = tasks_.begin(); it != tasks_.end();) {
      const auto& rec = it->second;
      if (is_terminal(rec.status) && rec.updated_at < cutoff) {
        if (rec.server_id) {
          by_server_.erase(rec.server_id->str());
        }
        removed.emplace_back(it->first, rec.version);
        it = tasks_.erase(it);
      } else {
        ++it;
      }
    }
  }
  if (persistence_) {
    for (const auto& [id, version] : removed) {
      persistence_->remove(id, version);
    }
  }
  if (!removed.empty()) {
    log::info("Purged {} finished tasks", removed.size());
  }
  return removed.size();
}

auto TaskStore::get(const LocalId& id) const -> std::optional<TaskRecord> {
  std::shared_lock lock(mu_);
  auto it = tasks_.find(id);
  if (it == tasks_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto TaskStore::find_by_server_id(const ServerId& id) const
    -> std::optional<TaskRecord> {
  std::shared_lock lock(mu_);
  auto it = by_server_.find(id.value());
  if (it == by_server_.end()) {
    return std::nullopt;
  }
  return tasks_.at(it->second);
}

auto TaskStore::find(std::string_view any_id) const
    -> std::optional<TaskRecord> {
  std::shared_lock lock(mu_);
  if (const auto* rec = resolve(any_id)) {
    return *rec;
  }
  return std::nullopt;
}

auto TaskStore::list() const -> std::vector<TaskRecord> {
  std::vector<TaskRecord> out;
  {
    std::shared_lock lock(mu_);
    out.reserve(tasks_.size());
    for (const auto& rec : tasks_ | std::views::values) {
      out.push_back(rec);
    }
  }
  std::ranges::sort(out, {}, &TaskRecord::created_at);
  return out;
}

auto TaskStore::list_by_status(TaskStatus status) const
    -> std::vector<TaskRecord> {
  auto all = list();
  std::erase_if(all, [status](const TaskRecord& r) { return r.status != status; });
  return all;
}

auto TaskStore::display_names() const -> std::vector<std::string> {
  std::shared_lock lock(mu_);
  std::vector<std::string> names;
  names.reserve(tasks_.size());
  for (const auto& rec : tasks_ | std::views::values) {
    names.push_back(rec.file.display_name);
  }
  return names;
}

auto TaskStore::size() const -> std::size_t {
  std::shared_lock lock(mu_);
  return tasks_.size();
}

auto TaskStore::subscribe(TaskListener listener) -> ListenerId {
  std::lock_guard lock(listeners_mu_);
  auto id = next_listener_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

auto TaskStore::unsubscribe(ListenerId id) -> void {
  std::lock_guard lock(listeners_mu_);
  listeners_.erase(id);
}

auto TaskStore::mutate(std::string_view id, const Mutator& fn)
    -> Result<bool> {
  TaskRecord snapshot;
  {
    std::unique_lock lock(mu_);
    auto* rec = resolve(id);
    if (rec == nullptr) {
      return fail(Error::NotFound);
    }
    auto changed = fn(*rec);
    if (!changed || !*changed) {
      return changed;
    }
    rec->version = next_version_++;
    rec->updated_at = Clock::now();
    snapshot = *rec;
  }

  if (persistence_) {
    persistence_->save(snapshot);
  }
  publish(snapshot);
  return true;
}

auto TaskStore::resolve(std::string_view id) -> TaskRecord* {
  return const_cast<TaskRecord*>(std::as_const(*this).resolve(id));
}

auto TaskStore::resolve(std::string_view id) const -> const TaskRecord* {
  if (id.empty()) {
    return nullptr;
  }
  if (auto it = by_server_.find(id); it != by_server_.end()) {
    return &tasks_.at(it->second);
  }
  if (auto it = tasks_.find(LocalId{std::string(id)}); it != tasks_.end()) {
    return &it->second;
  }
  return nullptr;
}

auto TaskStore::reset_attempt(TaskRecord& r) -> void {
  if (r.server_id) {
    by_server_.erase(r.server_id->str());
    r.server_id.reset();
  }
  r.status = TaskStatus::Pending;
  r.phase = TaskPhase::None;
  r.progress = 0;
  r.attempt++;
  r.error_message.clear();
  r.conversion_speed = 0.0;
  r.eta_seconds = 0;
  r.upload_started_at = {};
  r.upload_completed_at = {};
  r.conversion_started_at = {};
}

auto TaskStore::publish(const TaskRecord& snapshot) -> void {
  std::vector<TaskListener> listeners;
  {
    std::lock_guard lock(listeners_mu_);
    listeners.reserve(listeners_.size());
    for (const auto& listener : listeners_ | std::views::values) {
      listeners.push_back(listener);
    }
  }
  for (const auto& listener : listeners) {
    listener(snapshot);
  }
}

}  // namespace framelift
