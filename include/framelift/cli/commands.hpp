#pragma once

#include "framelift/config/system_config.hpp"
#include "framelift/core/error.hpp"

#include <string>
#include <vector>

namespace framelift::cli {

struct CommonOptions {
  std::string config_file;
  // Overrides storage.db_file when set.
  std::string db_file;
};

struct ScanOptions {
  CommonOptions common;
  std::vector<std::string> paths;
  bool recursive{false};
};

struct ListOptions {
  CommonOptions common;
  std::string status;
};

struct RetryOptions {
  CommonOptions common;
  std::string task_id;
};

struct PurgeOptions {
  CommonOptions common;
  int days{30};
};

// Loads the config (defaults when no file is given), applies overrides and
// starts logging.
[[nodiscard]] auto load_config(const CommonOptions& opts)
    -> Result<ClientConfig>;

[[nodiscard]] auto cmd_scan(const ScanOptions& opts) -> int;
[[nodiscard]] auto cmd_list(const ListOptions& opts) -> int;
[[nodiscard]] auto cmd_retry(const RetryOptions& opts) -> int;
[[nodiscard]] auto cmd_purge(const PurgeOptions& opts) -> int;

}  // namespace framelift::cli
