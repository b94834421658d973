#pragma once

#include "framelift/config/settings_provider.hpp"
#include "framelift/core/cancellation.hpp"
#include "framelift/media/media_probe.hpp"
#include "framelift/media/thumbnailer.hpp"
#include "framelift/preprocess/size_estimator.hpp"
#include "framelift/task/task_record.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace framelift {

namespace phase {
inline constexpr std::string_view kAnalyzing = "analyzing";
inline constexpr std::string_view kProbing = "probing";
inline constexpr std::string_view kThumbnail = "generating thumbnail";
inline constexpr std::string_view kEstimating = "estimating";
}  // namespace phase

namespace skip_reason {
inline constexpr std::string_view kUnsupportedFormat = "unsupported format";
inline constexpr std::string_view kNotFound = "file not found";
inline constexpr std::string_view kEmpty = "file is empty";
inline constexpr std::string_view kCannotOpen = "cannot open file";
inline constexpr std::string_view kCancelled = "cancelled";
}  // namespace skip_reason

struct PreparedFile {
  std::filesystem::path path;
  std::string display_name;
  std::uint64_t size_bytes{0};
  MediaInfo media;
  ImageBytes thumbnail;
  std::uint64_t estimated_size_bytes{0};
  // False when probing or thumbnailing failed; media then holds defaults.
  bool success{false};
  std::string error;

  [[nodiscard]] auto to_file_info() const -> FileInfo;
};

struct SkippedFile {
  std::filesystem::path path;
  std::string reason;
};

struct PreprocessStatistics {
  std::size_t total{0};
  std::size_t ready{0};
  std::size_t skipped{0};
  std::uint64_t total_bytes{0};
  std::uint64_t estimated_bytes{0};
  std::size_t large_files{0};
};

struct PreprocessResult {
  std::vector<PreparedFile> ready;
  std::vector<SkippedFile> skipped;
  PreprocessStatistics stats;
};

struct PreprocessOptions {
  bool recursive{false};
  // Display names already in use, e.g. by existing tasks.
  std::vector<std::string> reserved_names;
};

// Invoked from worker threads, never concurrently with each other.
struct PreprocessCallbacks {
  std::function<void(const std::filesystem::path&, std::string_view)> on_phase;
  std::function<void(const PreparedFile&)> on_file_done;
  std::function<void(const SkippedFile&)> on_skipped;
};

struct PipelineConfig {
  int max_workers{4};
  ThumbnailSize thumbnail;
};

class PreprocessPipeline {
public:
  // probe and thumbnailer may be null; the matching step is then skipped.
  PreprocessPipeline(IMediaProbe* probe, IThumbnailer* thumbnailer,
                     const ISettingsProvider& settings,
                     const ISizeEstimator& estimator, PipelineConfig config);

  PreprocessPipeline(const PreprocessPipeline&) = delete;
  auto operator=(const PreprocessPipeline&) -> PreprocessPipeline& = delete;

  [[nodiscard]] auto run(std::span<const std::filesystem::path> inputs,
                         const PreprocessOptions& options,
                         const PreprocessCallbacks& callbacks = {},
                         const CancellationToken& cancel = {})
      -> PreprocessResult;

  // Re-estimates against the provider's current settings.
  [[nodiscard]] auto estimate(const PreparedFile& file) const -> std::uint64_t;

  [[nodiscard]] auto degraded() const noexcept -> bool { return degraded_; }
  [[nodiscard]] auto worker_limit() const noexcept -> int {
    return worker_limit_;
  }

private:
  struct Candidate {
    std::filesystem::path path;
    std::uint64_t size{0};
    std::string display_name;
  };

  auto expand(std::span<const std::filesystem::path> inputs, bool recursive,
              std::vector<std::filesystem::path>& files,
              std::vector<SkippedFile>& skipped) const -> void;
  [[nodiscard]] auto validate(const std::filesystem::path& file,
                              std::uint64_t& size) const -> std::string_view;
  // nullopt when cancellation was observed at a step boundary.
  [[nodiscard]] auto process(const Candidate& candidate,
                             const PreprocessCallbacks& callbacks,
                             const CancellationToken& cancel)
      -> std::optional<PreparedFile>;

  auto emit_phase(const PreprocessCallbacks& callbacks,
                  const std::filesystem::path& file, std::string_view name)
      -> void;

  IMediaProbe* probe_;
  IThumbnailer* thumbnailer_;
  const ISettingsProvider& settings_;
  const ISizeEstimator& estimator_;
  PipelineConfig config_;
  int worker_limit_;
  bool degraded_{false};
  bool thumbnails_enabled_{true};
  std::mutex callback_mu_;
};

}  // namespace framelift
