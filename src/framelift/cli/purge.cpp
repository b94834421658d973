#include "framelift/cli/commands.hpp"
#include "framelift/storage/persistence.hpp"
#include "framelift/util/log.hpp"
#include "framelift/util/util.hpp"

#include <chrono>
#include <print>

namespace framelift::cli {

auto cmd_purge(const PurgeOptions& opts) -> int {
  if (opts.days < 0) {
    std::println(stderr, "Error: --days must not be negative");
    return 1;
  }
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

  auto cutoff = Clock::now() - std::chrono::days(opts.days);
  auto removed = db.delete_finished_before(cutoff);
  log::stop();
  if (!removed) {
    std::println(stderr, "Error: {}", removed.error().message());
    return 1;
  }
  std::println("Removed {} finished tasks older than {} days.", *removed,
               opts.days);
  return 0;
}

}  // namespace framelift::cli
