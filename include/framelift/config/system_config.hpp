#pragma once

#include "framelift/config/conversion_settings.hpp"

#include <cstdint>
#include <string>

namespace framelift {

struct StorageConfig {
  std::string db_file{"framelift.db"};
  int write_retry_interval_ms{2000};
};

struct LoggingConfig {
  std::string level{"info"};
  std::string file;
};

struct PreprocessConfig {
  int max_workers{4};
  bool recursive{false};
  std::string ffprobe_path{"ffprobe"};
  std::string ffmpeg_path{"ffmpeg"};
  int probe_timeout_sec{10};
  int thumbnail_timeout_sec{15};
  int thumbnail_width{100};
  int thumbnail_height{70};
};

struct TransferConfig {
  int max_concurrent_uploads{2};
  int max_retries{3};
  // Automatic retries wait base, 2x base, ... up to max.
  int retry_base_delay_ms{1000};
  int retry_max_delay_ms{16000};
  bool auto_download{true};
  std::string output_directory{"./output"};
  std::string archive_directory{"./archive"};
};

struct SpaceConfig {
  double warning_percent{80.0};
  double pause_percent{90.0};
  double total_space_gb{100.0};
};

struct ClientConfig {
  StorageConfig storage;
  LoggingConfig logging;
  PreprocessConfig preprocess;
  TransferConfig transfer;
  SpaceConfig space;
  ConversionSettings conversion;
};

}  // namespace framelift
