#include "framelift/app/conversion_client.hpp"

#include "framelift/core/constants.hpp"
#include "framelift/util/log.hpp"

#include <algorithm>
#include <format>

namespace framelift {

namespace fs = std::filesystem;

namespace {

constexpr double kBytesPerGb = 1024.0 * 1024.0 * 1024.0;

auto unique_path(const fs::path& dir, const std::string& stem,
                 const std::string& ext) -> fs::path {
  std::error_code ec;
  auto candidate = dir / (stem + ext);
  for (int i = 1; fs::exists(candidate, ec) && i < media::kMaxNameCollisionSuffix;
       ++i) {
    candidate = dir / std::format("{}_{}{}", stem, i, ext);
  }
  return candidate;
}

}  // namespace

ConversionClient::ConversionClient(const ClientConfig& config, TaskStore& store,
                                   const ISettingsProvider& settings,
                                   PreprocessPipeline& pipeline,
                                   IConversionService& service,
                                   IPushChannel& channel)
    : config_(config),
      store_(store),
      settings_(settings),
      pipeline_(pipeline),
      service_(service),
      governor_(SpaceThresholds{config.space.warning_percent,
                                config.space.pause_percent},
                static_cast<std::uint64_t>(config.space.total_space_gb *
                                           kBytesPerGb)),
      retry_(store,
             RetryPolicy{
                 std::chrono::milliseconds(config.transfer.retry_base_delay_ms),
                 std::chrono::milliseconds(config.transfer.retry_max_delay_ms)}),
      relay_(store, channel, &governor_,
             RelayConfig{.auto_download = config.transfer.auto_download}) {
  relay_.set_completion_handler(
      [this](const TaskRecord& rec) { enqueue(JobKind::Download, rec.local_id); });
  relay_.set_failure_handler(
      [this](const TaskRecord& rec, const std::string& reason) {
        auto r = retry_.handle_failure(rec.local_id.value(), reason,
                                       FailureKind::Remote);
        if (!r) {
          log::warn("Failure of {} not handled: {}", rec.local_id,
                    r.error().message());
        }
      });
  retry_.set_requeue_callback(
      [this](const LocalId& id, std::chrono::milliseconds delay) {
        enqueue(JobKind::Upload, id, delay);
      });
}

ConversionClient::~ConversionClient() {
  stop();
}

auto ConversionClient::start() -> void {
  if (running_.exchange(true)) {
    return;
  }
  shutdown_ = CancellationSource{};

  recover();

  governor_listener_ = governor_.subscribe(
      [this](AdmissionState previous, AdmissionState current) {
        if (previous == AdmissionState::Paused &&
            current != AdmissionState::Paused) {
          release_blocked();
        }
      });
  relay_.start();

  int workers = std::max(1, config_.transfer.max_concurrent_uploads);
  workers_.reserve(static_cast<std::size_t>(workers));
  for (int i = 0; i < workers; ++i) {
    workers_.emplace_back([this](std::stop_token st) { worker_loop(st); });
  }
  log::info("Conversion client started ({} transfer workers)", workers);
}

auto ConversionClient::stop() -> void {
  if (!running_.exchange(false)) {
    return;
  }
  shutdown_.cancel();
  for (auto& worker : workers_) {
    worker.request_stop();
  }
  jobs_cv_.notify_all();
  workers_.clear();

  governor_.unsubscribe(governor_listener_);
  relay_.stop();
  log::info("Conversion client stopped");
}

auto ConversionClient::add_files(std::span<const fs::path> inputs,
                                 const PreprocessCallbacks& callbacks,
                                 const CancellationToken& cancel)
    -> AddFilesResult {
  PreprocessOptions options;
  options.recursive = config_.preprocess.recursive;
  options.reserved_names = store_.display_names();

  AddFilesResult out;
  out.preprocess = pipeline_.run(inputs, options, callbacks, cancel);

  auto settings = settings_.current();
  auto batch = generate_batch_id();
  out.tasks.reserve(out.preprocess.ready.size());
  for (const auto& file : out.preprocess.ready) {
    out.tasks.push_back(store_.create_task(file.to_file_info(), settings, batch));
  }
  log::info("Added {} tasks, skipped {} files", out.tasks.size(),
            out.preprocess.skipped.size());
  return out;
}

auto ConversionClient::submit(std::string_view id) -> Result<void> {
  auto rec = store_.find(id);
  if (!rec) {
    return fail(Error::NotFound);
  }
  if (rec->status != TaskStatus::Pending) {
    return fail(Error::InvalidTransition);
  }
  if (!governor_.can_admit()) {
    block(rec->local_id);
    return fail(Error::AdmissionPaused);
  }
  enqueue(JobKind::Upload, rec->local_id);
  return ok();
}

auto ConversionClient::submit_all() -> std::size_t {
  std::size_t queued = 0;
  for (const auto& rec : store_.list_by_status(TaskStatus::Pending)) {
    auto r = submit(rec.local_id.value());
    if (r || r.error() == Error::AdmissionPaused) {
      ++queued;
    }
  }
  return queued;
}

auto ConversionClient::cancel(std::string_view id) -> Result<void> {
  auto rec = store_.find(id);
  if (!rec) {
    return fail(Error::NotFound);
  }
  if (is_terminal(rec->status)) {
    return fail(Error::InvalidTransition);
  }

  {
    std::lock_guard lock(inflight_mu_);
    if (auto it = inflight_.find(rec->local_id); it != inflight_.end()) {
      it->second.cancel();
    }
  }
  drop_jobs(rec->local_id);

  auto r = store_.update_status(rec->local_id.value(), TaskStatus::Cancelled);
  if (!r) {
    return fail(r.error());
  }
  // Once the result is being fetched there is nothing left to cancel remotely.
  if (rec->server_id && rec->phase != TaskPhase::Downloading) {
    if (auto c = service_.cancel_task(*rec->server_id); !c) {
      log::warn("Remote cancel of {} failed: {}", *rec->server_id,
                c.error().message());
    }
  }
  log::info("Task {} cancelled", rec->local_id);
  return ok();
}

auto ConversionClient::retry(std::string_view id) -> Result<void> {
  return retry_.user_retry(id);
}

auto ConversionClient::remove(std::string_view id) -> Result<void> {
  auto rec = store_.find(id);
  if (!rec) {
    return fail(Error::NotFound);
  }
  if (!is_terminal(rec->status) && rec->status != TaskStatus::Pending) {
    if (auto r = cancel(id); !r) {
      return r;
    }
  }
  drop_jobs(rec->local_id);
  if (!relay_.untrack(rec->local_id.value())) {
    log::debug("Task {} was not tracked", rec->local_id);
  }
  return store_.remove(rec->local_id.value());
}

auto ConversionClient::download(std::string_view id) -> Result<void> {
  auto rec = store_.find(id);
  if (!rec) {
    return fail(Error::NotFound);
  }
  bool awaiting = rec->phase == TaskPhase::Downloading ||
                  (rec->status == TaskStatus::Completed && !rec->is_downloaded);
  if (!awaiting || !rec->is_linked()) {
    return fail(Error::InvalidTransition);
  }
  return perform_download(rec->local_id);
}

auto ConversionClient::sync_recent(int count) -> Result<std::size_t> {
  auto recent = service_.get_recent_tasks(count);
  if (!recent) {
    log::warn("Fetching recent tasks failed: {}", recent.error().message());
    return fail(recent.error());
  }

  std::size_t matched = 0;
  for (const auto& summary : *recent) {
    if (!store_.find_by_server_id(summary.task_id)) {
      continue;
    }
    TaskStatusEvent refresh{summary.task_id.str(), summary.status,
                            summary.progress, summary.error_message};
    if (relay_.submit(std::move(refresh))) {
      ++matched;
    }
  }
  log::info("Synced {} of {} recent tasks", matched, recent->size());
  return matched;
}

auto ConversionClient::purge_finished(std::chrono::days age) -> std::size_t {
  return store_.purge_finished(
      std::chrono::duration_cast<std::chrono::hours>(age));
}

auto ConversionClient::blocked_count() const -> std::size_t {
  std::lock_guard lock(jobs_mu_);
  return blocked_.size();
}

auto ConversionClient::recover() -> void {
  std::size_t reset = 0;
  std::size_t resumed = 0;
  std::size_t downloads = 0;

  for (const auto& rec : store_.list()) {
    const auto& id = rec.local_id;
    if (rec.status == TaskStatus::Uploading && !rec.is_linked()) {
      // Upload was interrupted before the server created the task.
      auto r = store_.update_status(id.value(), TaskStatus::Pending);
      if (r && *r) {
        enqueue(JobKind::Upload, id);
        ++reset;
      }
    } else if (rec.status == TaskStatus::Uploading) {
      if (auto r = store_.update_status(id.value(), TaskStatus::Converting);
          r) {
        ++resumed;
      }
    } else if (rec.phase == TaskPhase::Downloading &&
               config_.transfer.auto_download) {
      enqueue(JobKind::Download, id);
      ++downloads;
    }
  }

  if (reset + resumed + downloads > 0) {
    log::info("Recovered tasks: {} re-uploads, {} resumed, {} downloads",
              reset, resumed, downloads);
  }
}

auto ConversionClient::enqueue(JobKind kind, const LocalId& id,
                               std::chrono::milliseconds delay) -> void {
  {
    std::lock_guard lock(jobs_mu_);
    jobs_.push_back(Job{kind, id, std::chrono::steady_clock::now() + delay});
  }
  // Every worker re-evaluates its deadline when a delayed job arrives.
  if (delay.count() > 0) {
    jobs_cv_.notify_all();
  } else {
    jobs_cv_.notify_one();
  }
}

auto ConversionClient::next_job(std::stop_token& stop) -> std::optional<Job> {
  std::unique_lock lock(jobs_mu_);
  while (!stop.stop_requested()) {
    auto now = std::chrono::steady_clock::now();
    auto due = std::ranges::find_if(
        jobs_, [&](const Job& job) { return job.ready_at <= now; });
    if (due != jobs_.end()) {
      Job job = std::move(*due);
      jobs_.erase(due);
      return job;
    }

    auto seen = jobs_.size();
    if (jobs_.empty()) {
      jobs_cv_.wait(lock, stop, [this] { return !jobs_.empty(); });
    } else {
      auto earliest = std::ranges::min(jobs_, {}, &Job::ready_at).ready_at;
      jobs_cv_.wait_until(lock, stop, earliest,
                          [&] { return jobs_.size() != seen; });
    }
  }
  return std::nullopt;
}

auto ConversionClient::block(const LocalId& id) -> void {
  {
    std::lock_guard lock(jobs_mu_);
    if (std::ranges::find(blocked_, id) == blocked_.end()) {
      blocked_.push_back(id);
      log::info("Task {} waiting for server space", id);
    }
  }
  // The governor may have re-admitted between the check and the block.
  if (governor_.can_admit()) {
    release_blocked();
  }
}

auto ConversionClient::drop_jobs(const LocalId& id) -> void {
  std::lock_guard lock(jobs_mu_);
  std::erase(blocked_, id);
  std::erase_if(jobs_, [&](const Job& job) {
    return job.kind == JobKind::Upload && job.id == id;
  });
}

auto ConversionClient::release_blocked() -> void {
  std::size_t released = 0;
  {
    std::lock_guard lock(jobs_mu_);
    released = blocked_.size();
    for (auto& id : blocked_) {
      jobs_.push_back(Job{JobKind::Upload, std::move(id)});
    }
    blocked_.clear();
  }
  if (released > 0) {
    log::info("Admission resumed, releasing {} tasks", released);
    jobs_cv_.notify_all();
  }
}

auto ConversionClient::worker_loop(std::stop_token stop) -> void {
  while (auto next = next_job(stop)) {
    auto& job = *next;
    if (job.kind == JobKind::Upload) {
      upload(job.id);
    } else if (auto r = perform_download(job.id); !r) {
      log::warn("Download of {} failed: {}", job.id, r.error().message());
    }
  }
}

auto ConversionClient::upload(const LocalId& id) -> void {
  auto rec = store_.get(id);
  if (!rec || rec->status != TaskStatus::Pending) {
    log::debug("Task {} no longer pending, skipping upload", id);
    return;
  }
  if (!governor_.can_admit()) {
    block(id);
    return;
  }
  if (auto r = store_.update_status(id.value(), TaskStatus::Uploading); !r) {
    log::warn("Task {} cannot start uploading: {}", id, r.error().message());
    return;
  }

  auto source = CancellationSource::linked_to(shutdown_.token());
  {
    std::lock_guard lock(inflight_mu_);
    inflight_.insert_or_assign(id, source);
  }
  auto remote = service_.create_task(rec->file, rec->settings, source.token());
  {
    std::lock_guard lock(inflight_mu_);
    inflight_.erase(id);
  }

  if (!remote) {
    if (remote.error() == Error::Cancelled) {
      log::info("Upload of {} cancelled", id);
      return;
    }
    log::warn("Upload of {} failed: {}", id, remote.error().message());
    auto d = retry_.handle_failure(id.value(), remote.error().message(),
                                   classify_failure(remote.error()));
    if (!d) {
      log::warn("Failure of {} not handled: {}", id, d.error().message());
    }
    return;
  }

  auto current = store_.get(id);
  if (!current || current->status != TaskStatus::Uploading) {
    log::info("Task {} left Uploading during upload, cancelling remote {}", id,
              remote->task_id);
    if (auto c = service_.cancel_task(remote->task_id); !c) {
      log::warn("Remote cancel of {} failed: {}", remote->task_id,
                c.error().message());
    }
    return;
  }

  if (auto r = store_.link_remote_id(id, remote->task_id, remote->task_name);
      !r) {
    log::error("Linking {} to {} failed: {}", id, remote->task_id,
               r.error().message());
    if (auto f = store_.mark_failed(id.value(), r.error().message()); !f) {
      log::warn("Task {} could not be failed: {}", id, f.error().message());
    }
    return;
  }
  if (auto r = store_.update_status(id.value(), TaskStatus::Converting); !r) {
    log::debug("Task {} not moved to converting: {}", id, r.error().message());
  }
  log::info("Task {} uploaded as {}", id, remote->task_id);
}

auto ConversionClient::perform_download(const LocalId& id) -> Result<void> {
  auto rec = store_.get(id);
  if (!rec) {
    return fail(Error::NotFound);
  }
  if (!rec->server_id) {
    return fail(Error::InvalidTransition);
  }

  auto dest = output_path_for(*rec);
  std::error_code ec;
  fs::create_directories(dest.parent_path(), ec);
  if (ec) {
    log::warn("Cannot create output directory {}: {}",
              dest.parent_path().string(), ec.message());
    if (auto r = store_.fail_download(id.value(), ec.message()); !r) {
      return r;
    }
    return fail(Error::FileOpenFailed);
  }

  auto source = CancellationSource::linked_to(shutdown_.token());
  {
    std::lock_guard lock(inflight_mu_);
    inflight_.insert_or_assign(id, source);
  }
  auto bytes = service_.download_result(*rec->server_id, dest, source.token());
  {
    std::lock_guard lock(inflight_mu_);
    inflight_.erase(id);
  }

  if (!bytes) {
    if (bytes.error() == Error::Cancelled) {
      // Shutdown leaves the task in Downloading for recovery; a user cancel
      // leaves nothing to resume.
      if (auto now = store_.get(id);
          !now || now->phase != TaskPhase::Downloading) {
        discard_output(id, dest);
      }
      return fail(bytes.error());
    }
    if (auto r = store_.fail_download(id.value(), bytes.error().message());
        !r) {
      return r;
    }
    return fail(bytes.error());
  }

  if (auto r = store_.complete_download(id.value(), dest.string(), *bytes);
      !r) {
    discard_output(id, dest);
    return r;
  }
  log::info("Task {} downloaded to {} ({})", id, dest.string(),
            format_bytes(*bytes));
  process_source(*rec);
  return ok();
}

auto ConversionClient::discard_output(const LocalId& id,
                                      const fs::path& dest) -> void {
  std::error_code ec;
  if (fs::remove(dest, ec)) {
    log::info("Removed partial output {} of {}", dest.string(), id);
  } else if (ec) {
    log::warn("Cannot remove partial output {}: {}", dest.string(),
              ec.message());
  }
}

auto ConversionClient::process_source(const TaskRecord& rec) -> void {
  auto action = rec.settings.source_file_action;
  if (action == SourceFileAction::Keep || rec.source_file_processed) {
    return;
  }

  std::error_code ec;
  const auto& src = rec.file.path;
  if (!fs::exists(src, ec)) {
    log::debug("Source {} already gone", src.string());
    return;
  }

  std::string archived;
  if (action == SourceFileAction::Delete) {
    fs::remove(src, ec);
    if (ec) {
      log::warn("Failed to delete source {}: {}", src.string(), ec.message());
      return;
    }
  } else {
    fs::path dir = config_.transfer.archive_directory;
    fs::create_directories(dir, ec);
    if (ec) {
      log::warn("Cannot create archive directory {}: {}", dir.string(),
                ec.message());
      return;
    }
    auto dest = unique_path(dir, src.stem().string(), src.extension().string());
    fs::rename(src, dest, ec);
    if (ec == std::errc::cross_device_link) {
      ec.clear();
      if (fs::copy_file(src, dest, ec) && !ec) {
        fs::remove(src, ec);
      }
    }
    if (ec) {
      log::warn("Failed to archive source {}: {}", src.string(), ec.message());
      return;
    }
    archived = dest.string();
  }

  if (auto r = store_.mark_source_processed(rec.local_id.value(), archived);
      !r) {
    log::warn("Task {} source action not recorded: {}", rec.local_id,
              r.error().message());
    return;
  }
  log::info("Source {} {}", src.string(),
            action == SourceFileAction::Delete ? "deleted" : "archived");
}

auto ConversionClient::output_path_for(const TaskRecord& rec) const
    -> fs::path {
  auto stem = fs::path(rec.file.display_name).stem().string();
  if (stem.empty()) {
    stem = rec.local_id.str();
  }
  return unique_path(config_.transfer.output_directory, stem,
                     "." + rec.settings.output_format);
}

}  // namespace framelift
