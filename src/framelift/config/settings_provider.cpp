#include "framelift/config/settings_provider.hpp"

#include "framelift/util/log.hpp"
#include "framelift/util/util.hpp"

#include <algorithm>
#include <ranges>
#include <utility>
#include <vector>

namespace framelift {

namespace {

constexpr std::array<std::string_view, 5> kOutputFormats = {
    "mp4", "avi", "mov", "mkv", "webm"};

}  // namespace

auto source_file_action_name(SourceFileAction action) noexcept
    -> std::string_view {
  auto idx = std::to_underlying(action);
  return idx < detail::kSourceFileActionNames.size()
             ? detail::kSourceFileActionNames[idx]
             : "keep";
}

auto parse_source_file_action(std::string_view name) noexcept
    -> SourceFileAction {
  auto it = std::ranges::find(detail::kSourceFileActionNames, name);
  if (it != detail::kSourceFileActionNames.end()) {
    return static_cast<SourceFileAction>(
        std::ranges::distance(detail::kSourceFileActionNames.begin(), it));
  }
  return SourceFileAction::Keep;
}

auto validate(const ConversionSettings& settings) -> Result<void> {
  auto format = to_lower(settings.output_format);
  if (std::ranges::find(kOutputFormats, format) == kOutputFormats.end()) {
    log::warn("Unsupported output format: {}", settings.output_format);
    return fail(Error::InvalidArgument);
  }
  if (settings.video_codec.empty() || settings.audio_codec.empty()) {
    return fail(Error::InvalidArgument);
  }
  return ok();
}

SettingsStore::SettingsStore(ConversionSettings initial)
    : settings_(std::move(initial)) {
}

auto SettingsStore::current() const -> ConversionSettings {
  std::lock_guard lock(mu_);
  return settings_;
}

auto SettingsStore::subscribe(SettingsListener listener) -> SubscriptionId {
  std::lock_guard lock(mu_);
  auto id = next_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

auto SettingsStore::unsubscribe(SubscriptionId id) -> void {
  std::lock_guard lock(mu_);
  listeners_.erase(id);
}

auto SettingsStore::update(ConversionSettings settings) -> Result<void> {
  if (auto r = validate(settings); !r) {
    return r;
  }

  std::vector<SettingsListener> listeners;
  {
    std::lock_guard lock(mu_);
    if (settings_ == settings) {
      return ok();
    }
    settings_ = settings;
    listeners.reserve(listeners_.size());
    for (const auto& listener : listeners_ | std::views::values) {
      listeners.push_back(listener);
    }
  }

  log::debug("Conversion settings updated: {} {} {}", settings.output_format,
             settings.resolution, settings.video_codec);
  for (const auto& listener : listeners) {
    listener(settings);
  }
  return ok();
}

}  // namespace framelift
