#pragma once

#include "framelift/core/lockfree_queue.hpp"
#include "framelift/remote/push_channel.hpp"
#include "framelift/remote/push_events.hpp"
#include "framelift/util/id.hpp"

#include <atomic>
#include <optional>
#include <string>
#include <thread>
#include <variant>

namespace framelift {

struct InboundEvent {
  PushEvent event;
};

struct ConnectionChangedEvent {
  ConnectionState state;
};

// Re-evaluates group membership for one record.
struct MembershipEvent {
  LocalId local_id;
};

struct UntrackEvent {
  LocalId local_id;
};

struct RelayShutdownEvent {};

using RelayEvent = std::variant<InboundEvent, ConnectionChangedEvent,
                                MembershipEvent, UntrackEvent,
                                RelayShutdownEvent>;

class RelayEventQueue {
public:
  // Returns false if the queue stayed full for every retry.
  [[nodiscard]] auto push(RelayEvent event) -> bool {
    constexpr int kMaxRetries = 100;
    for (int retry = 0; retry < kMaxRetries; ++retry) {
      if (queue_.push(std::move(event))) {
        pending_.fetch_add(1, std::memory_order_release);
        return true;
      }
      std::this_thread::yield();
    }
    return false;
  }

  auto push_blocking(RelayEvent event) -> void {
    while (!queue_.push(std::move(event))) {
      std::this_thread::yield();
    }
    pending_.fetch_add(1, std::memory_order_release);
  }

  [[nodiscard]] auto try_pop() -> std::optional<RelayEvent> {
    auto result = queue_.try_pop();
    if (result) {
      pending_.fetch_sub(1, std::memory_order_release);
    }
    return result;
  }

  [[nodiscard]] auto empty() const -> bool {
    return pending_.load(std::memory_order_acquire) == 0;
  }

  [[nodiscard]] auto size() const -> std::size_t {
    return pending_.load(std::memory_order_acquire);
  }

private:
  // Power of two; progress bursts for a few hundred tasks fit.
  static constexpr std::size_t kQueueCapacity = 1024;

  BoundedMPSCQueue<RelayEvent> queue_{kQueueCapacity};
  std::atomic<std::size_t> pending_{0};
};

}  // namespace framelift
