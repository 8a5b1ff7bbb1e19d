#pragma once

#include <concepts>
#include <cstdint>
#include <format>
#include <functional>
#include <ostream>
#include <random>
#include <string>
#include <string_view>

namespace taskchain {

// Phantom type tags for type-safe ID disambiguation
struct UserTag {};
struct SeqTag {};
struct BackendTag {};
struct MachineTag {};

// Type-safe ID wrapper using phantom type pattern
// Prevents accidental mixing of different ID types at compile time
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

// Identity of the end user a task runs for. Results are published to the
// listeners of this user.
using UserId = TypedId<UserTag>;
// Token shared by every rerun of one chain.
using SeqId = TypedId<SeqTag>;
using BackendId = TypedId<BackendTag>;
using MachineId = TypedId<MachineTag>;

// 128 random bits as 32 lowercase hex characters.
inline auto generate_seq_id() -> SeqId {
  thread_local std::random_device rd;
  thread_local std::mt19937_64 gen(rd());
  thread_local std::uniform_int_distribution<std::uint64_t> dis;
  return SeqId{std::format("{:016x}{:016x}", dis(gen), dis(gen))};
}

template <typename T>
concept IsTypedId = requires(T id) {
  { id.value() } -> std::convertible_to<std::string_view>;
  { id.empty() } -> std::convertible_to<bool>;
};

template <typename Tag>
inline auto operator<<(std::ostream& os, const TypedId<Tag>& id) -> std::ostream& {
  return os << id.value();
}

}  // namespace taskchain

// Enable std::unordered_map<TypedId<Tag>, V> usage
template <typename Tag>
struct std::hash<taskchain::TypedId<Tag>> {
  auto operator()(const taskchain::TypedId<Tag>& id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

// Enable std::print/std::format support (C++23)
template <typename Tag>
struct std::formatter<taskchain::TypedId<Tag>> : std::formatter<std::string> {
  auto format(const taskchain::TypedId<Tag>& id, auto& ctx) const {
    return std::formatter<std::string>::format(std::string(id.value()), ctx);
  }
};
