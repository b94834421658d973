#pragma once

#include "framelift/core/cancellation.hpp"
#include "framelift/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace framelift {

struct MediaInfo {
  double duration_seconds{0.0};
  int width{0};
  int height{0};
  std::string video_codec;
  std::string audio_codec;
  std::uint64_t bit_rate{0};

  [[nodiscard]] auto has_duration() const noexcept -> bool {
    return duration_seconds > 0.0;
  }
  // "unknown" when the value was not probed.
  [[nodiscard]] auto duration_text() const -> std::string;
  [[nodiscard]] auto resolution_text() const -> std::string;
  [[nodiscard]] auto codec_text() const -> std::string;
};

class IMediaProbe {
public:
  virtual ~IMediaProbe() = default;

  [[nodiscard]] virtual auto available() const -> bool = 0;
  [[nodiscard]] virtual auto probe(const std::filesystem::path& file,
                                   const CancellationToken& cancel)
      -> Result<MediaInfo> = 0;
};

class FfprobeMediaProbe : public IMediaProbe {
public:
  FfprobeMediaProbe(std::string ffprobe_path, std::chrono::seconds timeout);

  [[nodiscard]] auto available() const -> bool override;
  [[nodiscard]] auto probe(const std::filesystem::path& file,
                           const CancellationToken& cancel)
      -> Result<MediaInfo> override;

private:
  std::string ffprobe_path_;
  std::chrono::seconds timeout_;
};

// Parses `ffprobe -print_format json -show_format -show_streams` output.
// Older ffprobe builds emit the input path unescaped, so the "filename"
// value is blanked before parsing and a plain field scan is used when the
// document still is not valid JSON.
[[nodiscard]] auto parse_probe_output(std::string_view text)
    -> Result<MediaInfo>;

}  // namespace framelift
