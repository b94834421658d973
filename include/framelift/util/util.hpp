#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace framelift {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

[[nodiscard]] auto generate_uuid() -> std::string;

[[nodiscard]] auto format_timestamp(TimePoint tp) -> std::string;

[[nodiscard]] inline auto to_epoch_ms(TimePoint tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

[[nodiscard]] inline auto from_epoch_ms(std::int64_t ms) -> TimePoint {
  return TimePoint(std::chrono::milliseconds(ms));
}

// "1.5 GB", "700 KB", "12 B"
[[nodiscard]] auto format_bytes(std::uint64_t bytes) -> std::string;

// "mm:ss" below an hour, "h:mm:ss" otherwise.
[[nodiscard]] auto format_duration(double seconds) -> std::string;

[[nodiscard]] auto to_lower(std::string_view s) -> std::string;

[[nodiscard]] auto iequals(std::string_view a, std::string_view b) noexcept
    -> bool;

}  // namespace framelift
