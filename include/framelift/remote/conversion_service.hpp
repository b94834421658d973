#pragma once

#include "framelift/config/conversion_settings.hpp"
#include "framelift/core/cancellation.hpp"
#include "framelift/core/error.hpp"
#include "framelift/task/task_record.hpp"
#include "framelift/util/id.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace framelift {

struct RemoteTask {
  ServerId task_id;
  std::string task_name;
};

struct RemoteTaskSummary {
  ServerId task_id;
  std::string task_name;
  std::string status;
  int progress{0};
  std::string error_message;
  std::string download_url;
};

// Request/response side of the conversion service. Transport failures are
// Error::NetworkError; a refusal of the request itself is
// Error::ServerRejected.
class IConversionService {
public:
  virtual ~IConversionService() = default;

  // Uploads the source file and creates the remote task.
  [[nodiscard]] virtual auto create_task(const FileInfo& file,
                                         const ConversionSettings& settings,
                                         const CancellationToken& cancel)
      -> Result<RemoteTask> = 0;

  [[nodiscard]] virtual auto cancel_task(const ServerId& task_id)
      -> Result<void> = 0;

  [[nodiscard]] virtual auto get_recent_tasks(int count)
      -> Result<std::vector<RemoteTaskSummary>> = 0;

  // Streams the converted file to destination; returns bytes written.
  [[nodiscard]] virtual auto download_result(
      const ServerId& task_id, const std::filesystem::path& destination,
      const CancellationToken& cancel) -> Result<std::uint64_t> = 0;
};

}  // namespace framelift
