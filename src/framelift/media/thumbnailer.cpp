#include "framelift/media/thumbnailer.hpp"

#include "framelift/media/process.hpp"
#include "framelift/util/log.hpp"

#include <format>

namespace framelift {

namespace {

// JPEG start-of-image marker.
constexpr std::uint8_t kJpegMagic0 = 0xFF;
constexpr std::uint8_t kJpegMagic1 = 0xD8;

}  // namespace

FfmpegThumbnailer::FfmpegThumbnailer(std::string ffmpeg_path,
                                     std::chrono::seconds timeout)
    : ffmpeg_path_(std::move(ffmpeg_path)), timeout_(timeout) {
}

auto FfmpegThumbnailer::available() const -> bool {
  return find_executable(ffmpeg_path_).has_value();
}

auto FfmpegThumbnailer::build_args(const std::string& ffmpeg,
                                   const std::filesystem::path& file,
                                   ThumbnailSize size)
    -> std::vector<std::string> {
  auto filter = std::format(
      "scale={0}:{1}:force_original_aspect_ratio=decrease,"
      "pad={0}:{1}:(ow-iw)/2:(oh-ih)/2",
      size.width, size.height);
  return {
      ffmpeg, "-v", "quiet", "-ss", "00:00:01", "-i", file.string(),
      "-vframes", "1", "-vf", filter, "-f", "image2pipe",
      "-vcodec", "mjpeg", "-",
  };
}

auto FfmpegThumbnailer::generate(const std::filesystem::path& file,
                                 ThumbnailSize size,
                                 const CancellationToken& cancel)
    -> Result<ImageBytes> {
  if (size.width <= 0 || size.height <= 0) {
    return fail(Error::InvalidArgument);
  }

  auto run = run_process(build_args(ffmpeg_path_, file, size),
                         {.timeout = timeout_, .cancel = cancel});
  if (!run) {
    return fail(run.error());
  }
  if (run->cancelled) {
    return fail(Error::Cancelled);
  }
  if (run->timed_out) {
    log::warn("Thumbnail generation timed out for {}", file.string());
    return fail(Error::Timeout);
  }
  const auto& out = run->output;
  if (run->exit_code != 0 || out.size() < 2 ||
      static_cast<std::uint8_t>(out[0]) != kJpegMagic0 ||
      static_cast<std::uint8_t>(out[1]) != kJpegMagic1) {
    log::debug("ffmpeg produced no thumbnail for {} (exit {})", file.string(),
               run->exit_code);
    return fail(Error::ToolFailed);
  }
  return ImageBytes(out.begin(), out.end());
}

}  // namespace framelift
