#include "framelift/media/media_probe.hpp"

#include "framelift/media/process.hpp"
#include "framelift/util/log.hpp"
#include "framelift/util/util.hpp"

#include <nlohmann/json.hpp>

#include <charconv>
#include <format>
#include <optional>

namespace framelift {

namespace {

auto parse_number(std::string_view s) -> std::optional<double> {
  while (!s.empty() && (s.front() == ' ' || s.front() == '"')) {
    s.remove_prefix(1);
  }
  double value = 0.0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc{} || ptr == s.data()) {
    return std::nullopt;
  }
  return value;
}

auto json_number(const nlohmann::json& obj, const char* key)
    -> std::optional<double> {
  auto it = obj.find(key);
  if (it == obj.end()) {
    return std::nullopt;
  }
  if (it->is_number()) {
    return it->get<double>();
  }
  if (it->is_string()) {
    return parse_number(it->get_ref<const std::string&>());
  }
  return std::nullopt;
}

// Replaces the value of every "filename" key with an empty string. The
// value ends at the last quote on its line, which tolerates stray quotes
// and backslashes inside the path.
auto blank_filename(std::string_view text) -> std::string {
  constexpr std::string_view kKey = "\"filename\"";
  std::string out;
  out.reserve(text.size());

  std::size_t pos = 0;
  while (true) {
    auto key = text.find(kKey, pos);
    if (key == std::string_view::npos) {
      break;
    }
    auto colon = text.find(':', key + kKey.size());
    auto open = colon == std::string_view::npos ? colon : text.find('"', colon);
    auto eol = text.find('\n', key);
    if (eol == std::string_view::npos) {
      eol = text.size();
    }
    if (open == std::string_view::npos || open > eol) {
      out.append(text.substr(pos, key + kKey.size() - pos));
      pos = key + kKey.size();
      continue;
    }
    auto close = text.substr(0, eol).rfind('"');
    if (close == open) {
      out.append(text.substr(pos, key + kKey.size() - pos));
      pos = key + kKey.size();
      continue;
    }
    out.append(text.substr(pos, open + 1 - pos));
    pos = close;
  }
  out.append(text.substr(pos));
  return out;
}

// Value following the first occurrence of "key": in text.
auto scan_field(std::string_view text, std::string_view key)
    -> std::optional<std::string_view> {
  auto needle = std::format("\"{}\"", key);
  auto at = text.find(needle);
  if (at == std::string_view::npos) {
    return std::nullopt;
  }
  auto colon = text.find(':', at + needle.size());
  if (colon == std::string_view::npos) {
    return std::nullopt;
  }
  auto begin = text.find_first_not_of(" \t", colon + 1);
  if (begin == std::string_view::npos) {
    return std::nullopt;
  }
  if (text[begin] == '"') {
    auto end = text.find('"', begin + 1);
    if (end == std::string_view::npos) {
      return std::nullopt;
    }
    return text.substr(begin + 1, end - begin - 1);
  }
  auto end = text.find_first_of(",}\n", begin);
  return text.substr(begin, end == std::string_view::npos ? end : end - begin);
}

auto scan_fallback(std::string_view text) -> Result<MediaInfo> {
  MediaInfo info;
  bool found = false;
  if (auto v = scan_field(text, "duration")) {
    if (auto d = parse_number(*v)) {
      info.duration_seconds = *d;
      found = true;
    }
  }
  if (auto v = scan_field(text, "width")) {
    info.width = static_cast<int>(parse_number(*v).value_or(0));
    found = found || info.width > 0;
  }
  if (auto v = scan_field(text, "height")) {
    info.height = static_cast<int>(parse_number(*v).value_or(0));
  }
  if (auto v = scan_field(text, "codec_name")) {
    info.video_codec = std::string(*v);
    found = true;
  }
  if (!found) {
    return fail(Error::ParseError);
  }
  return info;
}

}  // namespace

auto MediaInfo::duration_text() const -> std::string {
  return has_duration() ? format_duration(duration_seconds) : "unknown";
}

auto MediaInfo::resolution_text() const -> std::string {
  if (width <= 0 || height <= 0) {
    return "unknown";
  }
  return std::format("{}x{}", width, height);
}

auto MediaInfo::codec_text() const -> std::string {
  return video_codec.empty() ? "unknown" : video_codec;
}

auto parse_probe_output(std::string_view text) -> Result<MediaInfo> {
  auto cleaned = blank_filename(text);
  auto doc = nlohmann::json::parse(cleaned, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    log::debug("ffprobe output is not valid JSON, scanning fields");
    return scan_fallback(cleaned);
  }

  MediaInfo info;
  if (auto format = doc.find("format");
      format != doc.end() && format->is_object()) {
    info.duration_seconds = json_number(*format, "duration").value_or(0.0);
    info.bit_rate =
        static_cast<std::uint64_t>(json_number(*format, "bit_rate").value_or(0));
  }

  if (auto streams = doc.find("streams");
      streams != doc.end() && streams->is_array()) {
    for (const auto& stream : *streams) {
      auto type = stream.value("codec_type", std::string{});
      if (type == "video" && info.video_codec.empty()) {
        info.video_codec = stream.value("codec_name", std::string{});
        info.width = stream.value("width", 0);
        info.height = stream.value("height", 0);
        if (!info.has_duration()) {
          info.duration_seconds = json_number(stream, "duration").value_or(0.0);
        }
      } else if (type == "audio" && info.audio_codec.empty()) {
        info.audio_codec = stream.value("codec_name", std::string{});
      }
    }
  }

  if (!info.has_duration() && info.video_codec.empty() &&
      info.audio_codec.empty()) {
    return fail(Error::ParseError);
  }
  return info;
}

FfprobeMediaProbe::FfprobeMediaProbe(std::string ffprobe_path,
                                     std::chrono::seconds timeout)
    : ffprobe_path_(std::move(ffprobe_path)), timeout_(timeout) {
}

auto FfprobeMediaProbe::available() const -> bool {
  return find_executable(ffprobe_path_).has_value();
}

auto FfprobeMediaProbe::probe(const std::filesystem::path& file,
                              const CancellationToken& cancel)
    -> Result<MediaInfo> {
  std::vector<std::string> argv = {
      ffprobe_path_, "-v", "quiet", "-print_format", "json",
      "-show_format", "-show_streams", file.string(),
  };

  auto run = run_process(argv, {.timeout = timeout_, .cancel = cancel});
  if (!run) {
    return fail(run.error());
  }
  if (run->cancelled) {
    return fail(Error::Cancelled);
  }
  if (run->timed_out) {
    log::warn("ffprobe timed out after {}s on {}", timeout_.count(),
              file.string());
    return fail(Error::Timeout);
  }
  if (run->exit_code != 0 || run->output.empty()) {
    log::debug("ffprobe exited with {} for {}", run->exit_code, file.string());
    return fail(Error::ToolFailed);
  }
  return parse_probe_output(run->output);
}

}  // namespace framelift
