#pragma once

#include <concepts>
#include <expected>
#include <functional>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

namespace taskchain {

enum class Error : int {
  Success,
  FileNotFound,
  ParseError,
  InvalidArgument,
  DatabaseOpenFailed,
  DatabaseQueryFailed,
  CorruptRecord,
  QueueFull,
  QueueStopped,
  NotFound,
  Timeout,
  HostUnreachable,
  ProviderError,
  ServiceUnavailable,
  ConnectionFailed,
  CommandFailed,
  Unknown,
};

class ErrorCategory : public std::error_category {
  static constexpr std::string_view messages[] = {
      "success",
      "file not found",
      "parse error",
      "invalid argument",
      "failed to open database",
      "database query failed",
      "corrupt cache record",
      "task queue is full",
      "task queue is stopped",
      "not found",
      "timeout",
      "host unreachable",
      "provider error",
      "service unavailable",
      "connection failed",
      "command failed",
      "unknown error",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char* override {
    return "taskchain";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    auto idx = static_cast<std::size_t>(ev);
    if (idx >= std::size(messages)) {
      return "unknown error";
    }
    return std::string{messages[idx]};
  }
};

inline auto error_category() -> const ErrorCategory& {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

template <typename T>
concept ResultValue = std::destructible<T> || std::is_void_v<T>;

template <typename T>
using Result = std::expected<T, std::error_code>;

template <typename T>
  requires ResultValue<std::decay_t<T>>
[[nodiscard]] constexpr auto ok(T&& value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> {
  return {};
}

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

// Errors that the bounded-retry deployment workflow treats as worth another
// attempt.
[[nodiscard]] inline auto is_transient(const std::error_code& ec) -> bool {
  return ec == make_error_code(Error::ServiceUnavailable) ||
         ec == make_error_code(Error::ConnectionFailed);
}

}  // namespace taskchain

template <>
struct std::is_error_code_enum<taskchain::Error> : std::true_type {};

namespace taskchain {

struct StringHash {
  using is_transparent = void;

  [[nodiscard]] std::size_t operator()(std::string_view sv) const noexcept {
    return std::hash<std::string_view>{}(sv);
  }

  [[nodiscard]] std::size_t operator()(const std::string& s) const noexcept {
    return std::hash<std::string_view>{}(s);
  }

  [[nodiscard]] std::size_t operator()(const char* s) const noexcept {
    return std::hash<std::string_view>{}(s);
  }
};

using StringEqual = std::equal_to<>;

}  // namespace taskchain
