#pragma once

#include <compare>
#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace taskweave {

// Phantom type tags for type-safe ID disambiguation
struct WorkflowTag {};
struct TaskTag {};
struct JobTag {};

// Prevents accidental mixing of different ID types at compile time
template <typename Tag> class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {}
  explicit TypedId(std::string_view value) : value_(value) {}
  explicit TypedId(const char *value) : value_(value ? value : "") {}

  TypedId() = default;

  [[nodiscard]] auto value() const noexcept -> std::string_view {
    return value_;
  }
  [[nodiscard]] auto str() const noexcept -> const std::string & {
    return value_;
  }

  [[nodiscard]] friend auto operator<=>(const TypedId &lhs,
                                        const TypedId &rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId &lhs, const TypedId &rhs)
      -> bool = default;

  [[nodiscard]] friend auto operator==(const TypedId &lhs,
                                       std::string_view rhs) noexcept -> bool {
    return lhs.value_ == rhs;
  }

  [[nodiscard]] auto empty() const noexcept -> bool { return value_.empty(); }

private:
  std::string value_;
};

using WorkflowId = TypedId<WorkflowTag>;
using TaskId = TypedId<TaskTag>;
using JobId = TypedId<JobTag>;

template <typename Tag>
inline auto operator<<(std::ostream &os, const TypedId<Tag> &id)
    -> std::ostream & {
  return os << id.value();
}

namespace detail {
[[nodiscard]] auto generate_uuid_v7_like() -> std::string;
} // namespace detail

/// Time-ordered random id (millisecond timestamp + 64 random bits).
template <typename Id> [[nodiscard]] auto generate_id() -> Id {
  return Id{detail::generate_uuid_v7_like()};
}

} // namespace taskweave

// `is_avalanching` tells ankerl::unordered_dense::hash to use this result
// as is instead of mixing it again.
template <typename Tag> struct std::hash<taskweave::TypedId<Tag>> {
  using is_avalanching = void;
  auto operator()(const taskweave::TypedId<Tag> &id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<taskweave::TypedId<Tag>>
    : std::formatter<std::string_view> {
  auto format(const taskweave::TypedId<Tag> &id, auto &ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};
