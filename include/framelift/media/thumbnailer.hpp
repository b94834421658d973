#pragma once

#include "framelift/core/cancellation.hpp"
#include "framelift/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace framelift {

struct ThumbnailSize {
  int width{100};
  int height{70};
};

using ImageBytes = std::vector<std::uint8_t>;

class IThumbnailer {
public:
  virtual ~IThumbnailer() = default;

  [[nodiscard]] virtual auto available() const -> bool = 0;
  [[nodiscard]] virtual auto generate(const std::filesystem::path& file,
                                      ThumbnailSize size,
                                      const CancellationToken& cancel)
      -> Result<ImageBytes> = 0;
};

// Grabs the frame at 00:00:01, letterboxed to the target size, as JPEG
// piped through stdout.
class FfmpegThumbnailer : public IThumbnailer {
public:
  FfmpegThumbnailer(std::string ffmpeg_path, std::chrono::seconds timeout);

  [[nodiscard]] auto available() const -> bool override;
  [[nodiscard]] auto generate(const std::filesystem::path& file,
                              ThumbnailSize size,
                              const CancellationToken& cancel)
      -> Result<ImageBytes> override;

  [[nodiscard]] static auto build_args(const std::string& ffmpeg,
                                       const std::filesystem::path& file,
                                       ThumbnailSize size)
      -> std::vector<std::string>;

private:
  std::string ffmpeg_path_;
  std::chrono::seconds timeout_;
};

}  // namespace framelift
