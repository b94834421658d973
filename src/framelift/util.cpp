#include "framelift/util/util.hpp"
#include "framelift/util/id.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <format>
#include <random>

#include <time.h>

namespace framelift {

auto generate_uuid() -> std::string {
  thread_local std::random_device rd;
  thread_local std::mt19937_64 gen(rd());
  thread_local std::uniform_int_distribution<std::uint64_t> dis;

  std::uint64_t a = dis(gen);
  std::uint64_t b = dis(gen);

  // Version 4, RFC 4122 variant.
  a = (a & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  b = (b & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  return std::format(
      "{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
      static_cast<std::uint32_t>(a >> 32), static_cast<std::uint16_t>(a >> 16),
      static_cast<std::uint16_t>(a), static_cast<std::uint16_t>(b >> 48),
      b & 0xFFFFFFFFFFFFULL);
}

auto generate_local_id() -> LocalId {
  return LocalId{generate_uuid()};
}

auto generate_batch_id() -> BatchId {
  return BatchId{generate_uuid()};
}

auto format_timestamp(TimePoint tp) -> std::string {
  if (tp == TimePoint{}) {
    return "-";
  }
  auto time = Clock::to_time_t(tp);
  std::tm tm{};
  localtime_r(&time, &tm);
  return std::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}",
                     tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                     tm.tm_min, tm.tm_sec);
}

auto format_bytes(std::uint64_t bytes) -> std::string {
  constexpr std::array<std::string_view, 5> units = {"B", "KB", "MB", "GB",
                                                     "TB"};
  auto value = static_cast<double>(bytes);
  std::size_t unit = 0;
  while (value >= 1024.0 && unit + 1 < units.size()) {
    value /= 1024.0;
    ++unit;
  }
  if (unit == 0) {
    return std::format("{} B", bytes);
  }
  return std::format("{:.1f} {}", value, units[unit]);
}

auto format_duration(double seconds) -> std::string {
  if (!(seconds > 0.0)) {
    return "00:00";
  }
  auto total = static_cast<long long>(std::llround(seconds));
  auto h = total / 3600;
  auto m = (total % 3600) / 60;
  auto s = total % 60;
  if (h > 0) {
    return std::format("{}:{:02d}:{:02d}", h, m, s);
  }
  return std::format("{:02d}:{:02d}", m, s);
}

auto to_lower(std::string_view s) -> std::string {
  std::string out(s);
  std::ranges::transform(out, out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

auto iequals(std::string_view a, std::string_view b) noexcept -> bool {
  return std::ranges::equal(a, b, [](unsigned char x, unsigned char y) {
    return std::tolower(x) == std::tolower(y);
  });
}

}  // namespace framelift
