#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace framelift {

namespace io {
inline constexpr std::size_t kReadBufferSize = 4096;
inline constexpr std::size_t kInitialOutputReserve = 8192;
inline constexpr std::size_t kMaxToolOutputSize = 10 * 1024 * 1024;
}  // namespace io

namespace media {
inline constexpr std::uint64_t kLargeFileThreshold = 100ULL * 1024 * 1024;
inline constexpr std::uint64_t kDefaultVideoBitrate = 5'000'000;
inline constexpr std::uint64_t kDefaultAudioBitrate = 128'000;
inline constexpr int kMaxNameCollisionSuffix = 10000;
}  // namespace media

namespace timing {
inline constexpr auto kShutdownPollInterval = std::chrono::milliseconds(50);
inline constexpr auto kRelayIdleTimeout = std::chrono::milliseconds(1000);
inline constexpr auto kProcessKillGrace = std::chrono::milliseconds(10);
}  // namespace timing

}  // namespace framelift
