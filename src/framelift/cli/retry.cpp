#include "framelift/cli/commands.hpp"
#include "framelift/retry/retry_controller.hpp"
#include "framelift/storage/persistence.hpp"
#include "framelift/storage/persistence_service.hpp"
#include "framelift/task/task_store.hpp"
#include "framelift/util/log.hpp"

#include <chrono>
#include <print>

namespace framelift::cli {

auto cmd_retry(const RetryOptions& opts) -> int {
  auto config = load_config(opts.common);
  if (!config) {
    std::println(stderr, "Error: Failed to load config: {}",
                 config.error().message());
    return 1;
  }

  Persistence db(config->storage.db_file);
  if (auto r = db.open(); !r) {
    std::println(stderr, "Error: Failed to open database: {}",
                 r.error().message());
    log::stop();
    return 1;
  }
  auto records = db.load_tasks();
  if (!records) {
    std::println(stderr, "Error: {}", records.error().message());
    log::stop();
    return 1;
  }

  PersistenceService writer(
      db, std::chrono::milliseconds(config->storage.write_retry_interval_ms));
  TaskStore store(&writer, config->transfer.max_retries);
  store.load(std::move(*records));

  RetryController retry(store);
  auto r = retry.user_retry(opts.task_id);
  bool saved = writer.flush();
  log::stop();

  if (!r) {
    std::println(stderr, "Error: Cannot retry {}: {}", opts.task_id,
                 r.error().message());
    return 1;
  }
  if (!saved) {
    std::println(stderr, "Error: Failed to save task {}", opts.task_id);
    return 1;
  }
  std::println("Task {} is pending again.", opts.task_id);
  return 0;
}

}  // namespace framelift::cli
