#pragma once

#include <atomic>
#include <memory>

namespace framelift {

class CancellationToken;

// Cooperative cancellation. A source created with linked_to() also reports
// cancelled once its parent is cancelled, so a per-task signal observes a
// session-wide shutdown without extra plumbing.
class CancellationSource {
public:
  CancellationSource() : state_(std::make_shared<State>()) {
  }

  [[nodiscard]] static auto linked_to(const CancellationToken& parent)
      -> CancellationSource;

  [[nodiscard]] auto token() const noexcept -> CancellationToken;
  auto cancel() noexcept -> void {
    state_->cancelled.store(true, std::memory_order_release);
  }
  [[nodiscard]] auto is_cancelled() const noexcept -> bool {
    return state_->is_cancelled();
  }

private:
  struct State {
    std::atomic<bool> cancelled{false};
    std::shared_ptr<const State> parent;

    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
      for (const State* s = this; s != nullptr; s = s->parent.get()) {
        if (s->cancelled.load(std::memory_order_acquire)) {
          return true;
        }
      }
      return false;
    }
  };
  std::shared_ptr<State> state_;

  friend class CancellationToken;
};

class CancellationToken {
public:
  CancellationToken() = default;

  [[nodiscard]] auto is_cancelled() const noexcept -> bool {
    return state_ && state_->is_cancelled();
  }

  [[nodiscard]] explicit operator bool() const noexcept {
    return !is_cancelled();
  }

  [[nodiscard]] static auto none() noexcept -> CancellationToken {
    return {};
  }

private:
  explicit CancellationToken(std::shared_ptr<CancellationSource::State> state)
      : state_(std::move(state)) {
  }

  std::shared_ptr<CancellationSource::State> state_;

  friend class CancellationSource;
};

inline auto CancellationSource::token() const noexcept -> CancellationToken {
  return CancellationToken{state_};
}

inline auto CancellationSource::linked_to(const CancellationToken& parent)
    -> CancellationSource {
  CancellationSource source;
  source.state_->parent = parent.state_;
  return source;
}

}  // namespace framelift
