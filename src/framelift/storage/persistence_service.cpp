#include "framelift/storage/persistence_service.hpp"

#include "framelift/util/log.hpp"

#include <algorithm>
#include <utility>

namespace framelift {

PersistenceService::PersistenceService(ITaskRepository& repo,
                                       std::chrono::milliseconds retry_interval)
    : repo_(repo), retry_interval_(retry_interval) {
}

PersistenceService::~PersistenceService() {
  stop();
}

auto PersistenceService::start() -> void {
  if (worker_.joinable()) {
    return;
  }
  worker_ = std::jthread([this](std::stop_token st) { run(st); });
}

auto PersistenceService::stop() -> void {
  if (!worker_.joinable()) {
    return;
  }
  worker_.request_stop();
  cv_.notify_all();
  worker_.join();
  worker_ = std::jthread{};

  if (!flush()) {
    log::warn("{} task writes could not be persisted before shutdown",
              pending_count());
  }
}

auto PersistenceService::save(TaskRecord record) -> void {
  {
    std::lock_guard lock(mu_);
    auto id = record.local_id;
    if (auto it = tombstones_.find(id);
        it != tombstones_.end() && record.version <= it->second) {
      return;
    }
    auto& slot = pending_[id];
    if (slot.record && slot.record->version > record.version) {
      return;
    }
    slot.record = std::move(record);
  }
  cv_.notify_one();
}

auto PersistenceService::remove(const LocalId& id, std::uint64_t version)
    -> void {
  {
    std::lock_guard lock(mu_);
    auto& removed_at = tombstones_[id];
    removed_at = std::max(removed_at, version);
    pending_[id].record.reset();
  }
  cv_.notify_one();
}

auto PersistenceService::flush() -> bool {
  drain();
  return pending_count() == 0;
}

auto PersistenceService::pending_count() const -> std::size_t {
  std::lock_guard lock(mu_);
  return pending_.size();
}

auto PersistenceService::drain() -> std::size_t {
  std::lock_guard write_lock(write_mu_);

  PendingMap batch;
  {
    std::lock_guard lock(mu_);
    batch.swap(pending_);
  }

  std::size_t failed = 0;
  for (auto& [id, write] : batch) {
    auto r = write.record ? repo_.save_task(*write.record)
                          : repo_.delete_task(id);
    if (r) {
      continue;
    }

    ++failed;
    write.failures++;
    if (write.failures == 1) {
      log::warn("Persisting task {} failed, will retry: {}", id,
                r.error().message());
    } else {
      log::debug("Persisting task {} failed again (attempt {})", id,
                 write.failures);
    }

    // A newer write queued meanwhile supersedes this one.
    std::lock_guard lock(mu_);
    pending_.try_emplace(id, std::move(write));
  }
  return failed;
}

auto PersistenceService::run(std::stop_token st) -> void {
  while (!st.stop_requested()) {
    {
      std::unique_lock lock(mu_);
      cv_.wait(lock, st, [this] { return !pending_.empty(); });
    }
    if (st.stop_requested()) {
      break;
    }

    if (drain() > 0) {
      std::unique_lock lock(mu_);
      cv_.wait_for(lock, st, retry_interval_, [] { return false; });
    }
  }
}

}  // namespace framelift
