#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace codespaces::api {

enum class ErrorKind {
  MissingCredential,
  Unauthorized,
  ApiError,
  ConnectionError,
  InvalidResponse,
};

[[nodiscard]] std::string_view error_kind_name(ErrorKind kind);

/// A fatal condition for the current invocation. `message` is the
/// human-oriented remediation text printed by the entry point.
struct Error {
  ErrorKind kind = ErrorKind::ApiError;
  std::uint16_t status = 0;
  std::string body;
  std::string message;

  [[nodiscard]] std::string to_string() const;
};

} // namespace codespaces::api
