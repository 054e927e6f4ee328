#pragma once

#include <algorithm>
#include <cctype>
#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace matrixforge {

[[nodiscard]] inline auto has_control_chars(std::string_view value) noexcept
    -> bool {
  return std::ranges::any_of(
      value, [](unsigned char ch) { return std::iscntrl(ch) != 0; });
}

[[nodiscard]] inline auto is_valid_id_text(std::string_view value) noexcept
    -> bool {
  return !value.empty() && !has_control_chars(value);
}

struct JobTag {};
struct InstanceTag {};

// Phantom-tagged string id; JobName and InstanceId never mix.
template <typename Tag> class TypedId {
public:
  TypedId() = default;
  explicit TypedId(std::string value) : value_(std::move(value)) {}
  explicit TypedId(std::string_view value) : value_(value) {}
  explicit TypedId(const char *value) : value_(value ? value : "") {}

  [[nodiscard]] auto value() const noexcept -> std::string_view {
    return value_;
  }
  [[nodiscard]] auto str() const noexcept -> const std::string & {
    return value_;
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return value_.empty(); }

  [[nodiscard]] friend auto operator<=>(const TypedId &lhs,
                                        const TypedId &rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId &lhs, const TypedId &rhs)
      -> bool = default;
  [[nodiscard]] friend auto operator==(const TypedId &lhs,
                                       std::string_view rhs) noexcept -> bool {
    return lhs.value_ == rhs;
  }

private:
  std::string value_;
};

/// Full name of a job, e.g. "demo/main" or "demo/main/linux".
using JobName = TypedId<JobTag>;
/// Identifies one command execution inside the executor.
using InstanceId = TypedId<InstanceTag>;

template <typename Tag>
inline auto operator<<(std::ostream &os, const TypedId<Tag> &id)
    -> std::ostream & {
  return os << id.value();
}

} // namespace matrixforge

// is_avalanching lets ankerl::unordered_dense delegate to this hash instead of
// hashing the raw object bytes.
template <typename Tag> struct std::hash<matrixforge::TypedId<Tag>> {
  using is_avalanching = void;
  auto operator()(const matrixforge::TypedId<Tag> &id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<matrixforge::TypedId<Tag>>
    : std::formatter<std::string_view> {
  auto format(const matrixforge::TypedId<Tag> &id, auto &ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};

namespace matrixforge {

inline auto generate_instance_id(const JobName &job, int number,
                                 std::size_t step) -> InstanceId {
  return InstanceId{std::format("{}#{}/{}", job, number, step)};
}

} // namespace matrixforge
