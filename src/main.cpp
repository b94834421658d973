#include "framelift/cli/commands.hpp"

#include <charconv>
#include <cstdlib>
#include <print>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

void print_usage(const char* prog) {
  std::println("FrameLift - video conversion client");
  std::println("Usage: {} <command> [OPTIONS]", prog);
  std::println("");
  std::println("Commands:");
  std::println("  scan <paths...>       Analyze files and estimate output size");
  std::println("  list                  List stored conversion tasks");
  std::println("  retry <id>            Reset a finished task to pending");
  std::println("  purge                 Delete old finished tasks");
  std::println("");
  std::println("Options:");
  std::println("  -c, --config <file>   Config file (YAML)");
  std::println("  --db <file>           Database file (default: framelift.db)");
  std::println("  -r, --recursive       scan: descend into subdirectories");
  std::println("  --status <status>     list: only tasks in this status");
  std::println("  --days <n>            purge: retention in days (default: 30)");
  std::println("  -v, --version         Show version and exit");
  std::println("  -h, --help            Show this help message");
  std::println("");
  std::println("Examples:");
  std::println("  {} scan -r ~/Videos", prog);
  std::println("  {} list --status failed", prog);
  std::println("  {} purge --days 7 --db tasks.db", prog);
}

void print_version() {
  std::println("FrameLift v0.1.0");
}

struct Options {
  std::string command;
  std::vector<std::string> positional;
  framelift::cli::CommonOptions common;
  std::string status;
  int days{30};
  bool recursive{false};
};

auto require_value(int& i, int argc, char* argv[], std::string_view flag)
    -> std::string {
  if (++i >= argc) {
    std::println(stderr, "Error: {} requires an argument", flag);
    std::exit(1);
  }
  return argv[i];
}

auto parse_args(int argc, char* argv[]) -> Options {
  Options opts;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      std::exit(0);
    } else if (arg == "-c" || arg == "--config") {
      opts.common.config_file = require_value(i, argc, argv, arg);
    } else if (arg == "--db") {
      opts.common.db_file = require_value(i, argc, argv, arg);
    } else if (arg == "-r" || arg == "--recursive") {
      opts.recursive = true;
    } else if (arg == "--status") {
      opts.status = require_value(i, argc, argv, arg);
    } else if (arg == "--days") {
      auto value = require_value(i, argc, argv, arg);
      auto [ptr, ec] =
          std::from_chars(value.data(), value.data() + value.size(), opts.days);
      if (ec != std::errc{} || ptr != value.data() + value.size()) {
        std::println(stderr, "Error: invalid --days value: {}", value);
        std::exit(1);
      }
    } else if (arg.starts_with('-') && arg.size() > 1) {
      std::println(stderr, "Unknown option: {}", arg);
      print_usage(argv[0]);
      std::exit(1);
    } else if (opts.command.empty()) {
      opts.command = arg;
    } else {
      opts.positional.emplace_back(arg);
    }
  }

  return opts;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto opts = parse_args(argc, argv);
  namespace cli = framelift::cli;

  if (opts.command == "scan") {
    return cli::cmd_scan(cli::ScanOptions{opts.common, opts.positional,
                                          opts.recursive});
  }
  if (opts.command == "list") {
    return cli::cmd_list(cli::ListOptions{opts.common, opts.status});
  }
  if (opts.command == "retry") {
    if (opts.positional.size() != 1) {
      std::println(stderr, "Error: retry requires exactly one task id");
      return 1;
    }
    return cli::cmd_retry(cli::RetryOptions{opts.common, opts.positional[0]});
  }
  if (opts.command == "purge") {
    return cli::cmd_purge(cli::PurgeOptions{opts.common, opts.days});
  }

  if (opts.command.empty()) {
    print_usage(argv[0]);
  } else {
    std::println(stderr, "Unknown command: {}", opts.command);
  }
  return 1;
}
