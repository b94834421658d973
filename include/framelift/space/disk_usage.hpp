#pragma once

#include <cstdint>

namespace framelift {

struct DiskUsage {
  std::uint64_t total_bytes{0};
  std::uint64_t used_bytes{0};
  std::uint64_t available_bytes{0};
  double usage_percent{0.0};

  // Recomputes available_bytes and usage_percent from total and used.
  auto normalize() noexcept -> void {
    if (used_bytes > total_bytes) {
      used_bytes = total_bytes;
    }
    available_bytes = total_bytes - used_bytes;
    usage_percent = total_bytes == 0
                        ? 0.0
                        : 100.0 * static_cast<double>(used_bytes) /
                              static_cast<double>(total_bytes);
  }
};

}  // namespace framelift
