#include "framelift/preprocess/pipeline.hpp"

#include "framelift/core/constants.hpp"
#include "framelift/preprocess/file_names.hpp"
#include "framelift/util/log.hpp"

#include <algorithm>
#include <atomic>
#include <format>
#include <fstream>
#include <optional>
#include <thread>

namespace framelift {

namespace fs = std::filesystem;

auto PreparedFile::to_file_info() const -> FileInfo {
  return FileInfo{
      .path = path,
      .display_name = display_name,
      .size_bytes = size_bytes,
      .duration_seconds = media.duration_seconds,
      .estimated_size_bytes = estimated_size_bytes,
  };
}

PreprocessPipeline::PreprocessPipeline(IMediaProbe* probe,
                                       IThumbnailer* thumbnailer,
                                       const ISettingsProvider& settings,
                                       const ISizeEstimator& estimator,
                                       PipelineConfig config)
    : probe_(probe),
      thumbnailer_(thumbnailer),
      settings_(settings),
      estimator_(estimator),
      config_(config) {
  auto hw = static_cast<int>(std::thread::hardware_concurrency());
  worker_limit_ = std::max(1, std::min(hw > 0 ? hw : 1, config_.max_workers));

  if (probe_ == nullptr || !probe_->available()) {
    degraded_ = true;
    log::warn("Media probe unavailable, preprocessing without metadata");
  }
  if (thumbnailer_ == nullptr || !thumbnailer_->available()) {
    thumbnails_enabled_ = false;
    log::warn("Thumbnail generator unavailable, thumbnails disabled");
  }
}

auto PreprocessPipeline::run(std::span<const fs::path> inputs,
                             const PreprocessOptions& options,
                             const PreprocessCallbacks& callbacks,
                             const CancellationToken& cancel)
    -> PreprocessResult {
  PreprocessResult result;
  std::vector<fs::path> files;
  expand(inputs, options.recursive, files, result.skipped);

  auto skip = [&](fs::path path, std::string_view reason) {
    SkippedFile entry{std::move(path), std::string(reason)};
    log::debug("Skipped {}: {}", entry.path.string(), entry.reason);
    if (callbacks.on_skipped) {
      std::lock_guard lock(callback_mu_);
      callbacks.on_skipped(entry);
    }
    result.skipped.push_back(std::move(entry));
  };

  // Expansion already recorded missing inputs; report them now.
  if (callbacks.on_skipped) {
    std::lock_guard lock(callback_mu_);
    for (const auto& entry : result.skipped) {
      callbacks.on_skipped(entry);
    }
  }

  NameAllocator names(options.reserved_names);
  std::vector<Candidate> candidates;
  candidates.reserve(files.size());
  for (auto& file : files) {
    if (!is_supported_video(file)) {
      skip(std::move(file), skip_reason::kUnsupportedFormat);
      continue;
    }
    std::uint64_t size = 0;
    if (auto reason = validate(file, size); !reason.empty()) {
      skip(std::move(file), reason);
      continue;
    }
    auto display = names.allocate(file.filename().string());
    candidates.push_back({std::move(file), size, std::move(display)});
  }

  std::vector<std::optional<PreparedFile>> slots(candidates.size());
  std::atomic<std::size_t> next{0};
  auto worker = [&] {
    for (auto i = next.fetch_add(1); i < candidates.size();
         i = next.fetch_add(1)) {
      slots[i] = process(candidates[i], callbacks, cancel);
    }
  };

  auto workers = std::min<std::size_t>(
      static_cast<std::size_t>(worker_limit_), candidates.size());
  {
    std::vector<std::jthread> pool;
    pool.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i) {
      pool.emplace_back(worker);
    }
  }

  for (std::size_t i = 0; i < candidates.size(); ++i) {
    if (slots[i]) {
      result.ready.push_back(std::move(*slots[i]));
    } else {
      skip(candidates[i].path, skip_reason::kCancelled);
    }
  }

  auto& stats = result.stats;
  stats.ready = result.ready.size();
  stats.skipped = result.skipped.size();
  stats.total = stats.ready + stats.skipped;
  for (const auto& file : result.ready) {
    stats.total_bytes += file.size_bytes;
    stats.estimated_bytes += file.estimated_size_bytes;
    if (file.size_bytes > media::kLargeFileThreshold) {
      stats.large_files++;
    }
  }

  log::info("Preprocessed {} files: {} ready, {} skipped", stats.total,
            stats.ready, stats.skipped);
  return result;
}

auto PreprocessPipeline::estimate(const PreparedFile& file) const
    -> std::uint64_t {
  return estimator_.estimate(file.media, file.size_bytes, settings_.current());
}

auto PreprocessPipeline::expand(std::span<const fs::path> inputs,
                                bool recursive, std::vector<fs::path>& files,
                                std::vector<SkippedFile>& skipped) const
    -> void {
  for (const auto& input : inputs) {
    std::error_code ec;
    auto status = fs::status(input, ec);
    if (ec || !fs::exists(status)) {
      skipped.push_back({input, std::string(skip_reason::kNotFound)});
      continue;
    }
    if (!fs::is_directory(status)) {
      files.push_back(input);
      continue;
    }

    std::vector<fs::path> found;
    auto collect = [&](auto iter) {
      for (auto it = iter; it != decltype(iter){}; it.increment(ec)) {
        if (ec) {
          log::warn("Error while scanning {}: {}", input.string(), ec.message());
          break;
        }
        std::error_code type_ec;
        if (it->is_regular_file(type_ec)) {
          found.push_back(it->path());
        }
      }
    };
    constexpr auto opts = fs::directory_options::skip_permission_denied;
    if (recursive) {
      collect(fs::recursive_directory_iterator(input, opts, ec));
    } else {
      collect(fs::directory_iterator(input, opts, ec));
    }
    std::ranges::sort(found);
    files.insert(files.end(), std::make_move_iterator(found.begin()),
                 std::make_move_iterator(found.end()));
  }
}

auto PreprocessPipeline::validate(const fs::path& file,
                                  std::uint64_t& size) const
    -> std::string_view {
  std::error_code ec;
  if (!fs::is_regular_file(file, ec)) {
    return skip_reason::kNotFound;
  }
  auto bytes = fs::file_size(file, ec);
  if (ec) {
    return skip_reason::kCannotOpen;
  }
  if (bytes == 0) {
    return skip_reason::kEmpty;
  }
  std::ifstream probe(file, std::ios::binary);
  if (!probe.is_open()) {
    return skip_reason::kCannotOpen;
  }
  size = bytes;
  return {};
}

auto PreprocessPipeline::process(const Candidate& candidate,
                                 const PreprocessCallbacks& callbacks,
                                 const CancellationToken& cancel)
    -> std::optional<PreparedFile> {
  if (cancel.is_cancelled()) {
    return std::nullopt;
  }

  PreparedFile out;
  out.path = candidate.path;
  out.display_name = candidate.display_name;
  out.size_bytes = candidate.size;
  out.success = true;

  emit_phase(callbacks, out.path, phase::kAnalyzing);

  if (!degraded_) {
    emit_phase(callbacks, out.path, phase::kProbing);
    if (auto info = probe_->probe(out.path, cancel)) {
      out.media = std::move(*info);
    } else if (info.error() == Error::Cancelled) {
      return std::nullopt;
    } else {
      out.success = false;
      out.error = std::format("probe failed: {}", info.error().message());
      log::warn("Probing {} failed: {}", out.path.string(),
                info.error().message());
    }
  } else {
    out.success = false;
    out.error = "media probe unavailable";
  }

  if (cancel.is_cancelled()) {
    return std::nullopt;
  }

  if (thumbnails_enabled_) {
    emit_phase(callbacks, out.path, phase::kThumbnail);
    if (auto image = thumbnailer_->generate(out.path, config_.thumbnail, cancel)) {
      out.thumbnail = std::move(*image);
    } else if (image.error() == Error::Cancelled) {
      return std::nullopt;
    } else {
      out.success = false;
      if (out.error.empty()) {
        out.error =
            std::format("thumbnail failed: {}", image.error().message());
      }
      log::debug("Thumbnail for {} failed: {}", out.path.string(),
                 image.error().message());
    }
  }

  if (cancel.is_cancelled()) {
    return std::nullopt;
  }

  emit_phase(callbacks, out.path, phase::kEstimating);
  out.estimated_size_bytes = estimate(out);

  if (callbacks.on_file_done) {
    std::lock_guard lock(callback_mu_);
    callbacks.on_file_done(out);
  }
  return out;
}

auto PreprocessPipeline::emit_phase(const PreprocessCallbacks& callbacks,
                                    const fs::path& file, std::string_view name)
    -> void {
  if (callbacks.on_phase) {
    std::lock_guard lock(callback_mu_);
    callbacks.on_phase(file, name);
  }
}

}  // namespace framelift
