#pragma once

#include "framelift/space/disk_usage.hpp"

#include <array>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string_view>

namespace framelift {

enum class AdmissionState : std::uint8_t { Normal, Warning, Paused };

namespace detail {
constexpr std::array<std::string_view, 3> kAdmissionStateNames = {
    "normal", "warning", "paused"};
}  // namespace detail

[[nodiscard]] constexpr auto admission_state_name(AdmissionState s) noexcept
    -> std::string_view {
  return detail::kAdmissionStateNames[static_cast<std::size_t>(s)];
}

struct SpaceThresholds {
  double warning_percent{80.0};
  double pause_percent{90.0};
};

// Above pause_percent: Paused. Above warning_percent: Warning.
[[nodiscard]] constexpr auto classify_usage(double usage_percent,
                                            const SpaceThresholds& t) noexcept
    -> AdmissionState {
  if (usage_percent > t.pause_percent) {
    return AdmissionState::Paused;
  }
  if (usage_percent > t.warning_percent) {
    return AdmissionState::Warning;
  }
  return AdmissionState::Normal;
}

using AdmissionListener =
    std::function<void(AdmissionState previous, AdmissionState current)>;

// Gates whether new tasks may start uploading, based on the server's disk
// usage. Tasks already uploading or converting are never affected.
class SpaceGovernor {
public:
  using ListenerId = std::uint64_t;

  explicit SpaceGovernor(SpaceThresholds thresholds = {},
                         std::uint64_t total_bytes = 0);

  SpaceGovernor(const SpaceGovernor&) = delete;
  auto operator=(const SpaceGovernor&) -> SpaceGovernor& = delete;

  auto on_snapshot(DiskUsage usage) -> void;
  // Without a fresh snapshot the latest one is reduced by released_bytes.
  auto on_space_released(std::uint64_t released_bytes,
                         std::optional<DiskUsage> usage = std::nullopt)
      -> void;
  auto on_capacity_changed(std::uint64_t total_bytes) -> void;
  auto on_warning(double usage_percent, std::string_view message) -> void;

  [[nodiscard]] auto state() const -> AdmissionState;
  [[nodiscard]] auto can_admit() const -> bool;
  [[nodiscard]] auto latest() const -> std::optional<DiskUsage>;
  [[nodiscard]] auto thresholds() const noexcept -> const SpaceThresholds& {
    return thresholds_;
  }

  // Listeners run on the caller's thread after each state change.
  auto subscribe(AdmissionListener listener) -> ListenerId;
  auto unsubscribe(ListenerId id) -> void;

private:
  // Stores usage as the latest snapshot and re-evaluates. Caller holds mu_.
  [[nodiscard]] auto apply_locked(const DiskUsage& usage)
      -> std::optional<AdmissionState>;
  auto notify(AdmissionState previous, AdmissionState current) -> void;

  SpaceThresholds thresholds_;

  mutable std::mutex mu_;
  std::optional<DiskUsage> latest_;
  std::uint64_t configured_total_;
  AdmissionState state_{AdmissionState::Normal};

  std::mutex listeners_mu_;
  std::map<ListenerId, AdmissionListener> listeners_;
  ListenerId next_listener_{1};
};

}  // namespace framelift
