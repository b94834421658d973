#include "framelift/preprocess/file_names.hpp"

#include "framelift/core/constants.hpp"
#include "framelift/util/util.hpp"

#include <algorithm>
#include <format>

namespace framelift {

namespace {

constexpr std::string_view kInvalidChars = "<>:\"/\\|?*";

auto is_invalid(char c) -> bool {
  return static_cast<unsigned char>(c) < 0x20 ||
         kInvalidChars.find(c) != std::string_view::npos;
}

auto split_extension(std::string_view name)
    -> std::pair<std::string_view, std::string_view> {
  auto dot = name.rfind('.');
  if (dot == std::string_view::npos || dot == 0) {
    return {name, {}};
  }
  return {name.substr(0, dot), name.substr(dot)};
}

}  // namespace

auto is_supported_video(const std::filesystem::path& file) -> bool {
  auto ext = to_lower(file.extension().string());
  return std::ranges::find(kSupportedExtensions, ext) !=
         kSupportedExtensions.end();
}

auto safe_file_name(std::string_view file_name) -> std::string {
  auto [stem, ext] = split_extension(file_name);

  std::string cleaned;
  cleaned.reserve(stem.size());
  for (char c : stem) {
    char out = is_invalid(c) ? '_' : c;
    if (out == '_' && !cleaned.empty() && cleaned.back() == '_') {
      continue;
    }
    cleaned.push_back(out);
  }

  auto is_trim = [](char c) { return c == '_' || c == ' '; };
  auto first = std::ranges::find_if_not(cleaned, is_trim);
  auto last = std::ranges::find_if_not(cleaned.rbegin(), cleaned.rend(), is_trim);
  std::string trimmed =
      first == cleaned.end() ? std::string{} : std::string(first, last.base());

  std::string safe_ext;
  for (char c : ext) {
    if (!is_invalid(c)) {
      safe_ext.push_back(c);
    }
  }

  if (trimmed.empty()) {
    return std::format("unnamed_file{}", safe_ext);
  }
  return trimmed + safe_ext;
}

NameAllocator::NameAllocator(const std::vector<std::string>& reserved) {
  for (const auto& name : reserved) {
    used_.insert(to_lower(name));
  }
}

auto NameAllocator::taken(const std::string& name) const -> bool {
  return used_.contains(to_lower(name));
}

auto NameAllocator::allocate(std::string_view file_name) -> std::string {
  auto safe = safe_file_name(file_name);
  if (!taken(safe)) {
    used_.insert(to_lower(safe));
    return safe;
  }

  auto [stem, ext] = split_extension(safe);
  for (int i = 1; i <= media::kMaxNameCollisionSuffix; ++i) {
    auto candidate = std::format("{}_{}{}", stem, i, ext);
    if (!taken(candidate)) {
      used_.insert(to_lower(candidate));
      return candidate;
    }
  }

  auto fallback = std::format("{}_{}{}", stem, generate_uuid(), ext);
  used_.insert(to_lower(fallback));
  return fallback;
}

}  // namespace framelift
