#pragma once

#include <array>
#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace framelift {

inline constexpr std::array<std::string_view, 18> kSupportedExtensions = {
    ".mp4", ".avi", ".mov", ".mkv", ".wmv", ".flv", ".webm", ".m4v", ".3gp",
    ".mpg", ".mpeg", ".ts", ".mts", ".m2ts", ".vob", ".asf", ".rm", ".rmvb",
};

// Case-insensitive match against kSupportedExtensions.
[[nodiscard]] auto is_supported_video(const std::filesystem::path& file)
    -> bool;

// Replaces characters that are invalid on common filesystems with '_',
// collapses repeated underscores and trims '_' and spaces from the stem.
// An empty result becomes "unnamed_file" plus the extension.
[[nodiscard]] auto safe_file_name(std::string_view file_name) -> std::string;

// Hands out display names unique within one batch and against names that
// are already taken, appending _1, _2, ... to the stem on collision.
class NameAllocator {
public:
  NameAllocator() = default;
  explicit NameAllocator(const std::vector<std::string>& reserved);

  [[nodiscard]] auto allocate(std::string_view file_name) -> std::string;

private:
  [[nodiscard]] auto taken(const std::string& name) const -> bool;

  std::unordered_set<std::string> used_;  // lower-cased
};

}  // namespace framelift
