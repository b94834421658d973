#pragma once

#include "framelift/config/conversion_settings.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace framelift {

using SettingsListener = std::function<void(const ConversionSettings&)>;
using SubscriptionId = std::uint64_t;

class ISettingsProvider {
public:
  virtual ~ISettingsProvider() = default;

  [[nodiscard]] virtual auto current() const -> ConversionSettings = 0;
  virtual auto subscribe(SettingsListener listener) -> SubscriptionId = 0;
  virtual auto unsubscribe(SubscriptionId id) -> void = 0;
};

// In-process provider. update() validates, swaps the value and publishes it
// to every subscriber outside the lock.
class SettingsStore : public ISettingsProvider {
public:
  SettingsStore() = default;
  explicit SettingsStore(ConversionSettings initial);

  [[nodiscard]] auto current() const -> ConversionSettings override;
  auto subscribe(SettingsListener listener) -> SubscriptionId override;
  auto unsubscribe(SubscriptionId id) -> void override;

  [[nodiscard]] auto update(ConversionSettings settings) -> Result<void>;

private:
  mutable std::mutex mu_;
  ConversionSettings settings_;
  std::map<SubscriptionId, SettingsListener> listeners_;
  SubscriptionId next_id_{1};
};

}  // namespace framelift
