#pragma once

#include "framelift/config/settings_provider.hpp"
#include "framelift/config/system_config.hpp"
#include "framelift/core/cancellation.hpp"
#include "framelift/core/error.hpp"
#include "framelift/preprocess/pipeline.hpp"
#include "framelift/relay/progress_relay.hpp"
#include "framelift/remote/conversion_service.hpp"
#include "framelift/remote/push_channel.hpp"
#include "framelift/retry/retry_controller.hpp"
#include "framelift/space/space_governor.hpp"
#include "framelift/task/task_store.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <span>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

namespace framelift {

struct AddFilesResult {
  std::vector<TaskRecord> tasks;
  PreprocessResult preprocess;
};

// Client facade - coordinates preprocessing, uploads, progress and
// downloads for one session.
class ConversionClient {
public:
  ConversionClient(const ClientConfig& config, TaskStore& store,
                   const ISettingsProvider& settings,
                   PreprocessPipeline& pipeline, IConversionService& service,
                   IPushChannel& channel);
  ~ConversionClient();

  ConversionClient(const ConversionClient&) = delete;
  auto operator=(const ConversionClient&) -> ConversionClient& = delete;

  // Recovers interrupted records, then starts the relay and upload workers.
  auto start() -> void;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
  }

  // Preprocesses inputs and creates one Pending task per ready file.
  [[nodiscard]] auto add_files(std::span<const std::filesystem::path> inputs,
                               const PreprocessCallbacks& callbacks = {},
                               const CancellationToken& cancel = {})
      -> AddFilesResult;

  // Queues a Pending task for upload. AdmissionPaused means the task waits
  // until the governor admits again.
  [[nodiscard]] auto submit(std::string_view id) -> Result<void>;
  // Submits every Pending task; returns how many were queued or blocked.
  auto submit_all() -> std::size_t;

  [[nodiscard]] auto cancel(std::string_view id) -> Result<void>;
  [[nodiscard]] auto retry(std::string_view id) -> Result<void>;
  [[nodiscard]] auto remove(std::string_view id) -> Result<void>;
  // Downloads the result now, on the calling thread.
  [[nodiscard]] auto download(std::string_view id) -> Result<void>;

  // Feeds the service's recent task list through the relay as status
  // refreshes; returns how many local records it matched.
  [[nodiscard]] auto sync_recent(int count) -> Result<std::size_t>;
  auto purge_finished(std::chrono::days age) -> std::size_t;

  [[nodiscard]] auto admission() const -> AdmissionState {
    return governor_.state();
  }
  [[nodiscard]] auto blocked_count() const -> std::size_t;

  [[nodiscard]] auto governor() noexcept -> SpaceGovernor& { return governor_; }
  [[nodiscard]] auto relay() noexcept -> ProgressRelay& { return relay_; }

private:
  enum class JobKind : std::uint8_t { Upload, Download };
  struct Job {
    JobKind kind{JobKind::Upload};
    LocalId id;
    std::chrono::steady_clock::time_point ready_at{};
  };

  auto recover() -> void;
  auto enqueue(JobKind kind, const LocalId& id,
               std::chrono::milliseconds delay = {}) -> void;
  // Blocks until a job is due; nullopt once stop is requested.
  [[nodiscard]] auto next_job(std::stop_token& stop) -> std::optional<Job>;
  auto block(const LocalId& id) -> void;
  auto drop_jobs(const LocalId& id) -> void;
  auto release_blocked() -> void;
  auto worker_loop(std::stop_token stop) -> void;

  auto upload(const LocalId& id) -> void;
  [[nodiscard]] auto perform_download(const LocalId& id) -> Result<void>;
  auto discard_output(const LocalId& id, const std::filesystem::path& dest)
      -> void;
  auto process_source(const TaskRecord& rec) -> void;
  [[nodiscard]] auto output_path_for(const TaskRecord& rec) const
      -> std::filesystem::path;

  ClientConfig config_;
  TaskStore& store_;
  const ISettingsProvider& settings_;
  PreprocessPipeline& pipeline_;
  IConversionService& service_;

  SpaceGovernor governor_;
  RetryController retry_;
  ProgressRelay relay_;
  SpaceGovernor::ListenerId governor_listener_{0};

  std::atomic<bool> running_{false};
  CancellationSource shutdown_;

  mutable std::mutex jobs_mu_;
  std::condition_variable_any jobs_cv_;
  std::deque<Job> jobs_;
  std::deque<LocalId> blocked_;
  std::vector<std::jthread> workers_;

  std::mutex inflight_mu_;
  std::unordered_map<LocalId, CancellationSource> inflight_;
};

}  // namespace framelift
