#pragma once

#include <compare>
#include <concepts>
#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace framelift {

struct LocalTag {};
struct ServerTag {};
struct BatchTag {};

// Phantom-typed identifier. Local and remote ids share a representation but
// must never be mixed up, so each gets its own type.
template <typename Tag>
class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {}

  TypedId() = default;

  [[nodiscard]] auto value() const -> std::string_view { return value_; }
  [[nodiscard]] auto str() const -> const std::string& { return value_; }

  [[nodiscard]] explicit operator std::string() const { return value_; }

  [[nodiscard]] auto empty() const -> bool { return value_.empty(); }

  [[nodiscard]] friend auto operator<=>(const TypedId& lhs, const TypedId& rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId& lhs, const TypedId& rhs) -> bool = default;

private:
  std::string value_;
};

using LocalId = TypedId<LocalTag>;
using ServerId = TypedId<ServerTag>;
using BatchId = TypedId<BatchTag>;

[[nodiscard]] auto generate_local_id() -> LocalId;
[[nodiscard]] auto generate_batch_id() -> BatchId;

template <typename T>
concept IsTypedId = requires(T id) {
  { id.value() } -> std::convertible_to<std::string_view>;
  { id.empty() } -> std::convertible_to<bool>;
};

template <typename Tag>
inline auto operator<<(std::ostream& os, const TypedId<Tag>& id) -> std::ostream& {
  return os << id.value();
}

}  // namespace framelift

template <typename Tag>
struct std::hash<framelift::TypedId<Tag>> {
  auto operator()(const framelift::TypedId<Tag>& id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<framelift::TypedId<Tag>> : std::formatter<std::string_view> {
  auto format(const framelift::TypedId<Tag>& id, auto& ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};
