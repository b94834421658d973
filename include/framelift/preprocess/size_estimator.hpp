#pragma once

#include "framelift/config/conversion_settings.hpp"
#include "framelift/media/media_probe.hpp"

#include <cstdint>
#include <string_view>

namespace framelift {

class ISizeEstimator {
public:
  virtual ~ISizeEstimator() = default;

  [[nodiscard]] virtual auto estimate(const MediaInfo& media,
                                      std::uint64_t original_size,
                                      const ConversionSettings& settings) const
      -> std::uint64_t = 0;
};

// (video bitrate + audio bitrate) x duration / 8. Falls back to the
// original size when the duration is unknown.
class BitrateSizeEstimator : public ISizeEstimator {
public:
  [[nodiscard]] auto estimate(const MediaInfo& media,
                              std::uint64_t original_size,
                              const ConversionSettings& settings) const
      -> std::uint64_t override;
};

// "2500k" -> 2'500'000, "8M" -> 8'000'000, "640000" -> 640'000.
// Anything unparsable ("auto", "") yields fallback.
[[nodiscard]] auto parse_bitrate(std::string_view text, std::uint64_t fallback)
    -> std::uint64_t;

}  // namespace framelift
