#pragma once

#include "framelift/storage/task_repository.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <unordered_map>

namespace framelift {

// Write-behind front for a task repository. Callers hand over record copies
// and never wait on the disk; a failed write stays queued and is retried on
// the next cycle. Multiple saves of one record coalesce into the newest.
class PersistenceService {
public:
  PersistenceService(ITaskRepository& repo,
                     std::chrono::milliseconds retry_interval);
  ~PersistenceService();

  PersistenceService(const PersistenceService&) = delete;
  auto operator=(const PersistenceService&) -> PersistenceService& = delete;

  auto start() -> void;
  // Stops the worker after one last attempt to drain the queue.
  auto stop() -> void;

  // Dropped when the record was removed at or after record.version.
  auto save(TaskRecord record) -> void;
  // version is the record's version at removal; later saves carrying it or
  // an older one are ignored.
  auto remove(const LocalId& id, std::uint64_t version) -> void;

  // Attempts every queued write on the calling thread. True when nothing
  // is left pending.
  auto flush() -> bool;

  [[nodiscard]] auto pending_count() const -> std::size_t;

private:
  struct PendingWrite {
    std::optional<TaskRecord> record;  // nullopt: delete
    int failures{0};
  };

  using PendingMap = std::unordered_map<LocalId, PendingWrite>;

  auto run(std::stop_token st) -> void;
  // Returns the number of writes that failed and were requeued.
  auto drain() -> std::size_t;

  ITaskRepository& repo_;
  std::chrono::milliseconds retry_interval_;

  mutable std::mutex mu_;
  std::condition_variable_any cv_;
  PendingMap pending_;
  // Removal version per deleted record. Local ids are never reused.
  std::unordered_map<LocalId, std::uint64_t> tombstones_;
  std::mutex write_mu_;
  std::jthread worker_;
};

}  // namespace framelift
