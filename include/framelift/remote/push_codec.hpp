#pragma once

#include "framelift/core/error.hpp"
#include "framelift/remote/push_events.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace framelift {

// Frames on the push channel are JSON hub messages terminated by 0x1E.
inline constexpr char kRecordSeparator = '\x1e';

// Client to server invocation, e.g. JoinTaskGroup("abc").
struct HubInvocation {
  std::string target;
  std::vector<std::string> arguments;
};

namespace hub {
inline constexpr std::string_view kJoinTaskGroup = "JoinTaskGroup";
inline constexpr std::string_view kLeaveTaskGroup = "LeaveTaskGroup";
inline constexpr std::string_view kGetTaskStatus = "GetTaskStatus";
inline constexpr std::string_view kGetActiveTasks = "GetActiveTasks";
}  // namespace hub

[[nodiscard]] auto encode_invocation(const HubInvocation& invocation)
    -> std::string;

// Removes every complete frame from the front of buffer and returns them
// without separators. A trailing partial frame stays in buffer.
[[nodiscard]] auto split_frames(std::string& buffer) -> std::vector<std::string>;

// nullopt for frames that carry no event (pings, unknown targets).
// ParseError for malformed JSON or missing required arguments.
[[nodiscard]] auto decode_frame(std::string_view frame)
    -> Result<std::optional<PushEvent>>;

}  // namespace framelift
