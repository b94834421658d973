#include "framelift/remote/push_channel.hpp"

#include "framelift/util/log.hpp"

#include <utility>

namespace framelift {

auto HubPushChannel::join_task_group(std::string_view task_id)
    -> Result<void> {
  return invoke(hub::kJoinTaskGroup, {std::string(task_id)});
}

auto HubPushChannel::leave_task_group(std::string_view task_id)
    -> Result<void> {
  return invoke(hub::kLeaveTaskGroup, {std::string(task_id)});
}

auto HubPushChannel::get_task_status(std::string_view task_id)
    -> Result<void> {
  return invoke(hub::kGetTaskStatus, {std::string(task_id)});
}

auto HubPushChannel::get_active_tasks() -> Result<void> {
  return invoke(hub::kGetActiveTasks, {});
}

auto HubPushChannel::set_event_handler(PushEventHandler handler) -> void {
  std::lock_guard lock(mu_);
  on_event_ = std::move(handler);
}

auto HubPushChannel::set_connection_handler(ConnectionStateHandler handler)
    -> void {
  std::lock_guard lock(mu_);
  on_state_ = std::move(handler);
}

auto HubPushChannel::state() const -> ConnectionState {
  std::lock_guard lock(mu_);
  return state_;
}

auto HubPushChannel::invoke(std::string_view target,
                            std::vector<std::string> arguments)
    -> Result<void> {
  if (state() != ConnectionState::Connected) {
    log::debug("Push channel not connected, dropping {}", target);
    return fail(Error::NetworkError);
  }
  return send(encode_invocation(
      HubInvocation{std::string(target), std::move(arguments)}));
}

auto HubPushChannel::receive(std::string_view bytes) -> void {
  std::vector<std::string> frames;
  PushEventHandler handler;
  {
    std::lock_guard lock(mu_);
    inbound_.append(bytes);
    frames = split_frames(inbound_);
    handler = on_event_;
  }

  for (const auto& frame : frames) {
    auto event = decode_frame(frame);
    if (!event) {
      log::warn("Dropping malformed push frame ({} bytes)", frame.size());
      continue;
    }
    if (*event && handler) {
      handler(std::move(**event));
    }
  }
}

auto HubPushChannel::set_state(ConnectionState state) -> void {
  ConnectionStateHandler handler;
  {
    std::lock_guard lock(mu_);
    if (state_ == state) {
      return;
    }
    state_ = state;
    if (state != ConnectionState::Connected) {
      inbound_.clear();
    }
    handler = on_state_;
  }
  log::info("Push channel {}", connection_state_name(state));
  if (handler) {
    handler(state);
  }
}

}  // namespace framelift
