#include "framelift/cli/commands.hpp"
#include "framelift/config/settings_provider.hpp"
#include "framelift/media/media_probe.hpp"
#include "framelift/media/thumbnailer.hpp"
#include "framelift/preprocess/pipeline.hpp"
#include "framelift/preprocess/size_estimator.hpp"
#include "framelift/util/log.hpp"
#include "framelift/util/util.hpp"

#include <chrono>
#include <filesystem>
#include <print>

namespace framelift::cli {

auto cmd_scan(const ScanOptions& opts) -> int {
  auto config = load_config(opts.common);
  if (!config) {
    std::println(stderr, "Error: Failed to load config: {}",
                 config.error().message());
    return 1;
  }
  if (opts.paths.empty()) {
    std::println(stderr, "Error: scan requires at least one path");
    return 1;
  }

  const auto& pre = config->preprocess;
  FfprobeMediaProbe probe(pre.ffprobe_path,
                          std::chrono::seconds(pre.probe_timeout_sec));
  FfmpegThumbnailer thumbnailer(pre.ffmpeg_path,
                                std::chrono::seconds(pre.thumbnail_timeout_sec));
  SettingsStore settings(config->conversion);
  BitrateSizeEstimator estimator;
  PreprocessPipeline pipeline(
      &probe, &thumbnailer, settings, estimator,
      PipelineConfig{pre.max_workers,
                     ThumbnailSize{pre.thumbnail_width, pre.thumbnail_height}});

  std::vector<std::filesystem::path> inputs(opts.paths.begin(),
                                            opts.paths.end());
  PreprocessOptions options;
  options.recursive = opts.recursive || pre.recursive;

  PreprocessCallbacks callbacks;
  callbacks.on_phase = [](const std::filesystem::path& file,
                          std::string_view phase) {
    log::debug("{}: {}", file.filename().string(), phase);
  };

  auto result = pipeline.run(inputs, options, callbacks);
  log::stop();

  if (!result.ready.empty()) {
    std::println("{:<32} {:>10} {:>10} {:<11} {:<14} {:>10}", "NAME", "SIZE",
                 "DURATION", "RESOLUTION", "CODEC", "ESTIMATE");
    for (const auto& file : result.ready) {
      std::println("{:<32} {:>10} {:>10} {:<11} {:<14} {:>10}{}",
                   file.display_name.substr(0, 31),
                   format_bytes(file.size_bytes), file.media.duration_text(),
                   file.media.resolution_text(),
                   file.media.codec_text().substr(0, 13),
                   format_bytes(file.estimated_size_bytes),
                   file.success ? "" : "  (metadata unavailable)");
    }
  }

  if (!result.skipped.empty()) {
    std::println("");
    std::println("Skipped:");
    for (const auto& skipped : result.skipped) {
      std::println("  {} - {}", skipped.path.string(), skipped.reason);
    }
  }

  const auto& stats = result.stats;
  std::println("");
  std::println("{} files: {} ready, {} skipped, {} large", stats.total,
               stats.ready, stats.skipped, stats.large_files);
  std::println("Input {} -> estimated output {}", format_bytes(stats.total_bytes),
               format_bytes(stats.estimated_bytes));
  return result.ready.empty() ? 2 : 0;
}

}  // namespace framelift::cli
