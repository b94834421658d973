#pragma once

#include "framelift/core/error.hpp"
#include "framelift/task/task_store.hpp"
#include "framelift/util/id.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>

namespace framelift {

enum class FailureKind : std::uint8_t {
  Network,          // upload or connection failure
  Remote,           // conversion failed on the server
  ServerRejection,  // request refused; parameters likely invalid
};

namespace detail {
constexpr std::array<std::string_view, 3> kFailureKindNames = {
    "network", "remote", "rejected"};
}  // namespace detail

[[nodiscard]] constexpr auto failure_kind_name(FailureKind k) noexcept
    -> std::string_view {
  return detail::kFailureKindNames[static_cast<std::size_t>(k)];
}

[[nodiscard]] inline auto classify_failure(std::error_code ec) -> FailureKind {
  return ec == Error::ServerRejected ? FailureKind::ServerRejection
                                     : FailureKind::Network;
}

// Backoff between automatic attempts: base_delay doubled per failure
// already recorded, capped at max_delay.
struct RetryPolicy {
  std::chrono::milliseconds base_delay{1000};
  std::chrono::milliseconds max_delay{16000};
};

// Delay before the attempt that follows the retry_count-th failure.
[[nodiscard]] inline auto retry_delay(int retry_count, const RetryPolicy& policy)
    -> std::chrono::milliseconds {
  if (retry_count <= 0 || policy.base_delay.count() <= 0) {
    return std::chrono::milliseconds{0};
  }
  auto delay = policy.base_delay;
  for (int i = 1; i < retry_count && delay < policy.max_delay; ++i) {
    delay *= 2;
  }
  return std::min(delay, policy.max_delay);
}

// Called with the local id of a task that went back to Pending and how long
// to wait before uploading it again.
using RequeueCallback =
    std::function<void(const LocalId&, std::chrono::milliseconds)>;

class RetryController {
public:
  explicit RetryController(TaskStore& store, RetryPolicy policy = {});

  auto set_requeue_callback(RequeueCallback cb) -> void;

  // Automatic path. Returns Retry when the task was reset and requeued.
  [[nodiscard]] auto handle_failure(std::string_view id, std::string error,
                                    FailureKind kind)
      -> Result<FailureDisposition>;

  // Fresh attempt with the retry budget restored. Terminal records only.
  [[nodiscard]] auto user_retry(std::string_view id) -> Result<void>;

private:
  auto requeue(const LocalId& id, std::chrono::milliseconds delay) -> void;

  TaskStore& store_;
  RetryPolicy policy_;
  RequeueCallback requeue_;
};

}  // namespace framelift
