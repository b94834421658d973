#pragma once

#include "framelift/core/error.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace framelift {

enum class SourceFileAction : std::uint8_t { Keep, Delete, Archive };

namespace detail {
constexpr std::array<std::string_view, 3> kSourceFileActionNames = {
    "keep",
    "delete",
    "archive",
};
}  // namespace detail

[[nodiscard]] auto source_file_action_name(SourceFileAction action) noexcept
    -> std::string_view;
[[nodiscard]] auto parse_source_file_action(std::string_view name) noexcept
    -> SourceFileAction;

// Target parameters for one conversion. Passed through to the remote service
// unchanged; only the size estimator interprets the bitrates.
struct ConversionSettings {
  std::string output_format{"mp4"};
  std::string resolution{"1920x1080"};
  std::string video_codec{"libx264"};
  std::string audio_codec{"aac"};
  std::string video_bitrate{"auto"};
  std::string audio_bitrate{"192k"};
  std::string quality_mode{"crf"};
  std::string quality_value{"23"};
  std::string encoding_preset{"medium"};
  std::string frame_rate{"auto"};
  std::string hardware_acceleration{"auto"};
  bool two_pass{false};
  bool fast_start{true};
  SourceFileAction source_file_action{SourceFileAction::Keep};

  [[nodiscard]] auto operator==(const ConversionSettings&) const
      -> bool = default;
};

[[nodiscard]] auto validate(const ConversionSettings& settings)
    -> Result<void>;

}  // namespace framelift
