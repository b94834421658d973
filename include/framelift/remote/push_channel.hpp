#pragma once

#include "framelift/core/error.hpp"
#include "framelift/remote/push_codec.hpp"
#include "framelift/remote/push_events.hpp"

#include <array>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace framelift {

enum class ConnectionState : std::uint8_t {
  Disconnected,
  Connecting,
  Connected,
  Reconnecting,
};

namespace detail {
constexpr std::array<std::string_view, 4> kConnectionStateNames = {
    "disconnected", "connecting", "connected", "reconnecting"};
}  // namespace detail

[[nodiscard]] constexpr auto connection_state_name(ConnectionState s) noexcept
    -> std::string_view {
  return detail::kConnectionStateNames[static_cast<std::size_t>(s)];
}

using PushEventHandler = std::function<void(PushEvent)>;
using ConnectionStateHandler = std::function<void(ConnectionState)>;

// Bidirectional update stream with the conversion service. Task ids passed
// here are remote ids.
class IPushChannel {
public:
  virtual ~IPushChannel() = default;

  [[nodiscard]] virtual auto join_task_group(std::string_view task_id)
      -> Result<void> = 0;
  [[nodiscard]] virtual auto leave_task_group(std::string_view task_id)
      -> Result<void> = 0;
  [[nodiscard]] virtual auto get_task_status(std::string_view task_id)
      -> Result<void> = 0;
  [[nodiscard]] virtual auto get_active_tasks() -> Result<void> = 0;

  virtual auto set_event_handler(PushEventHandler handler) -> void = 0;
  virtual auto set_connection_handler(ConnectionStateHandler handler)
      -> void = 0;

  [[nodiscard]] virtual auto state() const -> ConnectionState = 0;
};

// Hub-protocol channel over an arbitrary transport. Subclasses move bytes;
// this class frames outgoing invocations and decodes incoming frames.
class HubPushChannel : public IPushChannel {
public:
  [[nodiscard]] auto join_task_group(std::string_view task_id)
      -> Result<void> override;
  [[nodiscard]] auto leave_task_group(std::string_view task_id)
      -> Result<void> override;
  [[nodiscard]] auto get_task_status(std::string_view task_id)
      -> Result<void> override;
  [[nodiscard]] auto get_active_tasks() -> Result<void> override;

  auto set_event_handler(PushEventHandler handler) -> void override;
  auto set_connection_handler(ConnectionStateHandler handler) -> void override;

  [[nodiscard]] auto state() const -> ConnectionState override;

protected:
  // Writes one encoded frame to the transport.
  [[nodiscard]] virtual auto send(std::string frame) -> Result<void> = 0;

  // Feeds raw transport bytes; complete frames are decoded and dispatched.
  auto receive(std::string_view bytes) -> void;
  auto set_state(ConnectionState state) -> void;

private:
  [[nodiscard]] auto invoke(std::string_view target,
                            std::vector<std::string> arguments)
      -> Result<void>;

  mutable std::mutex mu_;
  std::string inbound_;
  ConnectionState state_{ConnectionState::Disconnected};
  PushEventHandler on_event_;
  ConnectionStateHandler on_state_;
};

}  // namespace framelift
