#include "framelift/task/task_record.hpp"

#include <algorithm>
#include <ranges>
#include <utility>

namespace framelift {

auto task_status_name(TaskStatus status) noexcept -> std::string_view {
  auto idx = std::to_underlying(status);
  return idx < detail::kTaskStatusNames.size() ? detail::kTaskStatusNames[idx]
                                               : "unknown";
}

auto parse_task_status(std::string_view name) noexcept
    -> std::optional<TaskStatus> {
  auto it = std::ranges::find_if(detail::kTaskStatusNames,
                                 [name](std::string_view candidate) {
                                   return iequals(candidate, name);
                                 });
  if (it != detail::kTaskStatusNames.end()) {
    return static_cast<TaskStatus>(
        std::ranges::distance(detail::kTaskStatusNames.begin(), it));
  }
  return std::nullopt;
}

auto task_phase_name(TaskPhase phase) noexcept -> std::string_view {
  auto idx = std::to_underlying(phase);
  return idx < detail::kTaskPhaseNames.size() ? detail::kTaskPhaseNames[idx]
                                              : "none";
}

auto parse_task_phase(std::string_view name) noexcept -> TaskPhase {
  auto it = std::ranges::find(detail::kTaskPhaseNames, name);
  if (it != detail::kTaskPhaseNames.end()) {
    return static_cast<TaskPhase>(
        std::ranges::distance(detail::kTaskPhaseNames.begin(), it));
  }
  return TaskPhase::None;
}

}  // namespace framelift
