#include "framelift/cli/commands.hpp"
#include "framelift/storage/persistence.hpp"
#include "framelift/util/log.hpp"
#include "framelift/util/util.hpp"

#include <print>

namespace framelift::cli {

auto cmd_list(const ListOptions& opts) -> int {
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

  Result<std::vector<TaskRecord>> result;
  if (opts.status.empty()) {
    result = db.load_tasks();
  } else {
    auto status = parse_task_status(opts.status);
    if (!status) {
      std::println(stderr, "Error: Unknown status: {}", opts.status);
      log::stop();
      return 1;
    }
    result = db.list_tasks_by_status(*status);
  }
  log::stop();

  if (!result) {
    std::println(stderr, "Error: {}", result.error().message());
    return 1;
  }

  const auto& tasks = *result;
  if (tasks.empty()) {
    std::println("No tasks found.");
    return 0;
  }

  std::println("{:<36} {:<30} {:<11} {:>5} {:>7} {:<19}", "ID", "NAME",
               "STATUS", "PROG", "RETRY", "CREATED");
  for (const auto& task : tasks) {
    std::println("{:<36} {:<30} {:<11} {:>4}% {:>3}/{:<3} {:<19}",
                 task.current_id(), task.file.display_name.substr(0, 29),
                 task_status_name(task.status), task.progress,
                 task.retry_count, task.max_retries,
                 format_timestamp(task.created_at));
    if (!task.error_message.empty()) {
      std::println("    {}", task.error_message);
    }
  }
  return 0;
}

}  // namespace framelift::cli
