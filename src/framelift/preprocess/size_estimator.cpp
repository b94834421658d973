#include "framelift/preprocess/size_estimator.hpp"

#include "framelift/core/constants.hpp"

#include <charconv>
#include <cmath>

namespace framelift {

auto parse_bitrate(std::string_view text, std::uint64_t fallback)
    -> std::uint64_t {
  while (!text.empty() && text.back() == ' ') {
    text.remove_suffix(1);
  }
  if (text.empty()) {
    return fallback;
  }

  double multiplier = 1.0;
  switch (text.back()) {
    case 'k':
    case 'K':
      multiplier = 1e3;
      text.remove_suffix(1);
      break;
    case 'm':
    case 'M':
      multiplier = 1e6;
      text.remove_suffix(1);
      break;
    default:
      break;
  }

  double value = 0.0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size() || value <= 0.0) {
    return fallback;
  }
  return static_cast<std::uint64_t>(std::llround(value * multiplier));
}

auto BitrateSizeEstimator::estimate(const MediaInfo& media,
                                    std::uint64_t original_size,
                                    const ConversionSettings& settings) const
    -> std::uint64_t {
  if (!media.has_duration()) {
    return original_size;
  }
  auto video = parse_bitrate(settings.video_bitrate, media::kDefaultVideoBitrate);
  auto audio = parse_bitrate(settings.audio_bitrate, media::kDefaultAudioBitrate);
  auto bits = static_cast<double>(video + audio) * media.duration_seconds;
  return static_cast<std::uint64_t>(std::llround(bits / 8.0));
}

}  // namespace framelift
