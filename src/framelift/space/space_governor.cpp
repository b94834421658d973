#include "framelift/space/space_governor.hpp"

#include "framelift/util/log.hpp"
#include "framelift/util/util.hpp"

#include <algorithm>
#include <ranges>
#include <vector>

namespace framelift {

SpaceGovernor::SpaceGovernor(SpaceThresholds thresholds,
                             std::uint64_t total_bytes)
    : thresholds_(thresholds), configured_total_(total_bytes) {
}

auto SpaceGovernor::on_snapshot(DiskUsage usage) -> void {
  std::optional<AdmissionState> previous;
  AdmissionState current{};
  {
    std::lock_guard lock(mu_);
    previous = apply_locked(usage);
    current = state_;
  }
  if (previous) {
    notify(*previous, current);
  }
}

auto SpaceGovernor::on_space_released(std::uint64_t released_bytes,
                                      std::optional<DiskUsage> usage) -> void {
  log::info("Server released {}", format_bytes(released_bytes));

  std::optional<AdmissionState> previous;
  AdmissionState current{};
  {
    std::lock_guard lock(mu_);
    DiskUsage next;
    if (usage) {
      next = *usage;
    } else if (latest_) {
      next = *latest_;
      next.used_bytes -= std::min(next.used_bytes, released_bytes);
      next.normalize();
    } else {
      return;
    }
    previous = apply_locked(next);
    current = state_;
  }
  if (previous) {
    notify(*previous, current);
  }
}

auto SpaceGovernor::on_capacity_changed(std::uint64_t total_bytes) -> void {
  std::optional<AdmissionState> previous;
  AdmissionState current{};
  {
    std::lock_guard lock(mu_);
    configured_total_ = total_bytes;
    log::info("Server space limit set to {}", format_bytes(total_bytes));
    if (!latest_) {
      return;
    }
    auto next = *latest_;
    next.total_bytes = total_bytes;
    next.normalize();
    previous = apply_locked(next);
    current = state_;
  }
  if (previous) {
    notify(*previous, current);
  }
}

auto SpaceGovernor::on_warning(double usage_percent, std::string_view message)
    -> void {
  log::warn("Server space warning ({:.1f}%): {}", usage_percent, message);

  std::optional<AdmissionState> previous;
  AdmissionState current{};
  {
    std::lock_guard lock(mu_);
    auto next = latest_.value_or(DiskUsage{});
    if (next.total_bytes == 0) {
      next.total_bytes = configured_total_;
    }
    // used_bytes must agree with the reported percentage.
    auto pct = std::clamp(usage_percent, 0.0, 100.0);
    next.used_bytes = static_cast<std::uint64_t>(
        static_cast<double>(next.total_bytes) * pct / 100.0);
    next.available_bytes = next.total_bytes - next.used_bytes;
    next.usage_percent = usage_percent;
    previous = apply_locked(next);
    current = state_;
  }
  if (previous) {
    notify(*previous, current);
  }
}

auto SpaceGovernor::state() const -> AdmissionState {
  std::lock_guard lock(mu_);
  return state_;
}

auto SpaceGovernor::can_admit() const -> bool {
  return state() != AdmissionState::Paused;
}

auto SpaceGovernor::latest() const -> std::optional<DiskUsage> {
  std::lock_guard lock(mu_);
  return latest_;
}

auto SpaceGovernor::subscribe(AdmissionListener listener) -> ListenerId {
  std::lock_guard lock(listeners_mu_);
  auto id = next_listener_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

auto SpaceGovernor::unsubscribe(ListenerId id) -> void {
  std::lock_guard lock(listeners_mu_);
  listeners_.erase(id);
}

auto SpaceGovernor::apply_locked(const DiskUsage& usage)
    -> std::optional<AdmissionState> {
  latest_ = usage;
  auto next = classify_usage(usage.usage_percent, thresholds_);
  if (next == state_) {
    return std::nullopt;
  }
  auto previous = state_;
  state_ = next;
  log::info("Admission {} -> {} at {:.1f}% used",
            admission_state_name(previous), admission_state_name(next),
            usage.usage_percent);
  return previous;
}

auto SpaceGovernor::notify(AdmissionState previous, AdmissionState current)
    -> void {
  std::vector<AdmissionListener> listeners;
  {
    std::lock_guard lock(listeners_mu_);
    for (const auto& listener : listeners_ | std::views::values) {
      listeners.push_back(listener);
    }
  }
  for (const auto& listener : listeners) {
    listener(previous, current);
  }
}

}  // namespace framelift
