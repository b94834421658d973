#include "framelift/config/config.hpp"

#include "framelift/config/yaml_utils.hpp"
#include "framelift/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<framelift::StorageConfig> {
  static bool decode(const Node& node, framelift::StorageConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.db_file = framelift::yaml_get_or<std::string>(node, "db_file", s.db_file);
    s.write_retry_interval_ms = framelift::yaml_get_or(
        node, "write_retry_interval_ms", s.write_retry_interval_ms);
    return true;
  }
};

template <>
struct convert<framelift::LoggingConfig> {
  static bool decode(const Node& node, framelift::LoggingConfig& l) {
    if (!node.IsMap()) {
      return false;
    }
    l.level = framelift::yaml_get_or<std::string>(node, "level", l.level);
    l.file = framelift::yaml_get_or<std::string>(node, "file", l.file);
    return true;
  }
};

template <>
struct convert<framelift::PreprocessConfig> {
  static bool decode(const Node& node, framelift::PreprocessConfig& p) {
    if (!node.IsMap()) {
      return false;
    }
    p.max_workers = framelift::yaml_get_or(node, "max_workers", p.max_workers);
    p.recursive = framelift::yaml_get_or(node, "recursive", p.recursive);
    p.ffprobe_path =
        framelift::yaml_get_or<std::string>(node, "ffprobe_path", p.ffprobe_path);
    p.ffmpeg_path =
        framelift::yaml_get_or<std::string>(node, "ffmpeg_path", p.ffmpeg_path);
    p.probe_timeout_sec =
        framelift::yaml_get_or(node, "probe_timeout_sec", p.probe_timeout_sec);
    p.thumbnail_timeout_sec = framelift::yaml_get_or(
        node, "thumbnail_timeout_sec", p.thumbnail_timeout_sec);
    p.thumbnail_width =
        framelift::yaml_get_or(node, "thumbnail_width", p.thumbnail_width);
    p.thumbnail_height =
        framelift::yaml_get_or(node, "thumbnail_height", p.thumbnail_height);
    return true;
  }
};

template <>
struct convert<framelift::TransferConfig> {
  static bool decode(const Node& node, framelift::TransferConfig& t) {
    if (!node.IsMap()) {
      return false;
    }
    t.max_concurrent_uploads = framelift::yaml_get_or(
        node, "max_concurrent_uploads", t.max_concurrent_uploads);
    t.max_retries = framelift::yaml_get_or(node, "max_retries", t.max_retries);
    t.retry_base_delay_ms = framelift::yaml_get_or(node, "retry_base_delay_ms",
                                                   t.retry_base_delay_ms);
    t.retry_max_delay_ms = framelift::yaml_get_or(node, "retry_max_delay_ms",
                                                  t.retry_max_delay_ms);
    t.auto_download =
        framelift::yaml_get_or(node, "auto_download", t.auto_download);
    t.output_directory = framelift::yaml_get_or<std::string>(
        node, "output_directory", t.output_directory);
    t.archive_directory = framelift::yaml_get_or<std::string>(
        node, "archive_directory", t.archive_directory);
    return true;
  }
};

template <>
struct convert<framelift::SpaceConfig> {
  static bool decode(const Node& node, framelift::SpaceConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.warning_percent =
        framelift::yaml_get_or(node, "warning_percent", s.warning_percent);
    s.pause_percent =
        framelift::yaml_get_or(node, "pause_percent", s.pause_percent);
    s.total_space_gb =
        framelift::yaml_get_or(node, "total_space_gb", s.total_space_gb);
    return true;
  }
};

template <>
struct convert<framelift::ConversionSettings> {
  static bool decode(const Node& node, framelift::ConversionSettings& c) {
    if (!node.IsMap()) {
      return false;
    }
    using framelift::yaml_get_or;
    c.output_format = yaml_get_or<std::string>(node, "output_format", c.output_format);
    c.resolution = yaml_get_or<std::string>(node, "resolution", c.resolution);
    c.video_codec = yaml_get_or<std::string>(node, "video_codec", c.video_codec);
    c.audio_codec = yaml_get_or<std::string>(node, "audio_codec", c.audio_codec);
    c.video_bitrate = yaml_get_or<std::string>(node, "video_bitrate", c.video_bitrate);
    c.audio_bitrate = yaml_get_or<std::string>(node, "audio_bitrate", c.audio_bitrate);
    c.quality_mode = yaml_get_or<std::string>(node, "quality_mode", c.quality_mode);
    c.quality_value = yaml_get_or<std::string>(node, "quality_value", c.quality_value);
    c.encoding_preset =
        yaml_get_or<std::string>(node, "encoding_preset", c.encoding_preset);
    c.frame_rate = yaml_get_or<std::string>(node, "frame_rate", c.frame_rate);
    c.hardware_acceleration = yaml_get_or<std::string>(
        node, "hardware_acceleration", c.hardware_acceleration);
    c.two_pass = yaml_get_or(node, "two_pass", c.two_pass);
    c.fast_start = yaml_get_or(node, "fast_start", c.fast_start);
    c.source_file_action = framelift::parse_source_file_action(
        yaml_get_or<std::string>(node, "source_file_action", "keep"));
    return true;
  }
};

template <>
struct convert<framelift::ClientConfig> {
  static bool decode(const Node& node, framelift::ClientConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto storage = node["storage"]) {
      c.storage = storage.as<framelift::StorageConfig>();
    }
    if (auto logging = node["logging"]) {
      c.logging = logging.as<framelift::LoggingConfig>();
    }
    if (auto preprocess = node["preprocess"]) {
      c.preprocess = preprocess.as<framelift::PreprocessConfig>();
    }
    if (auto transfer = node["transfer"]) {
      c.transfer = transfer.as<framelift::TransferConfig>();
    }
    if (auto space = node["space"]) {
      c.space = space.as<framelift::SpaceConfig>();
    }
    if (auto conversion = node["conversion"]) {
      c.conversion = conversion.as<framelift::ConversionSettings>();
    }
    return true;
  }
};

}  // namespace YAML

namespace framelift {

namespace {

auto check_ranges(const ClientConfig& c) -> Result<void> {
  if (c.preprocess.max_workers < 1 || c.transfer.max_concurrent_uploads < 1) {
    log::error("Worker counts must be at least 1");
    return fail(Error::InvalidArgument);
  }
  if (c.transfer.max_retries < 0) {
    log::error("max_retries must not be negative");
    return fail(Error::InvalidArgument);
  }
  if (c.transfer.retry_base_delay_ms < 0 ||
      c.transfer.retry_max_delay_ms < c.transfer.retry_base_delay_ms) {
    log::error("Invalid retry delays: base={}ms max={}ms",
               c.transfer.retry_base_delay_ms, c.transfer.retry_max_delay_ms);
    return fail(Error::InvalidArgument);
  }
  if (c.space.warning_percent > c.space.pause_percent ||
      c.space.pause_percent > 100.0 || c.space.total_space_gb <= 0.0) {
    log::error("Invalid space thresholds: warning={} pause={} total={}GB",
               c.space.warning_percent, c.space.pause_percent,
               c.space.total_space_gb);
    return fail(Error::InvalidArgument);
  }
  return validate(c.conversion);
}

}  // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<ClientConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<ClientConfig> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse YAML: empty or invalid content");
      return fail(Error::ParseError);
    }
    ClientConfig config = root.as<ClientConfig>();
    if (auto r = check_ranges(config); !r) {
      return fail(r.error());
    }
    return ok(std::move(config));
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

}  // namespace framelift
