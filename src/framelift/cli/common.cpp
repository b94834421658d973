#include "framelift/cli/commands.hpp"
#include "framelift/config/config.hpp"
#include "framelift/util/log.hpp"

#include <print>

namespace framelift::cli {

auto load_config(const CommonOptions& opts) -> Result<ClientConfig> {
  ClientConfig config;
  if (!opts.config_file.empty()) {
    auto loaded = ConfigLoader::load_from_file(opts.config_file);
    if (!loaded) {
      return fail(loaded.error());
    }
    config = std::move(*loaded);
  }
  if (!opts.db_file.empty()) {
    config.storage.db_file = opts.db_file;
  }

  log::set_level(config.logging.level);
  if (!config.logging.file.empty() &&
      !log::set_output_file(config.logging.file)) {
    std::println(stderr, "Warning: cannot open log file {}, using stdout",
                 config.logging.file);
  }
  log::start();
  return config;
}

}  // namespace framelift::cli
