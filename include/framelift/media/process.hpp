#pragma once

#include "framelift/core/cancellation.hpp"
#include "framelift/core/constants.hpp"
#include "framelift/core/error.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace framelift {

struct ProcessOptions {
  std::chrono::milliseconds timeout{std::chrono::seconds(30)};
  CancellationToken cancel;
  std::size_t max_output{io::kMaxToolOutputSize};
};

struct ProcessResult {
  int exit_code{-1};
  std::string output;  // stdout only; stderr is discarded
  bool timed_out{false};
  bool cancelled{false};
  bool truncated{false};
};

// Resolves a bare program name against PATH; paths containing '/' are
// checked directly.
[[nodiscard]] auto find_executable(std::string_view program)
    -> std::optional<std::filesystem::path>;

// Runs argv[0] with arguments in its own process group, capturing stdout.
// Timeout and cancellation kill the whole group. Fails with ToolUnavailable
// when the program cannot be executed at all.
[[nodiscard]] auto run_process(const std::vector<std::string>& argv,
                               const ProcessOptions& options)
    -> Result<ProcessResult>;

}  // namespace framelift
