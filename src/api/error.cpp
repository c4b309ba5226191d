#include "codespaces/api/error.hpp"

namespace codespaces::api {

std::string_view error_kind_name(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::MissingCredential:
    return "missing_credential";
  case ErrorKind::Unauthorized:
    return "unauthorized";
  case ErrorKind::ApiError:
    return "api_error";
  case ErrorKind::ConnectionError:
    return "connection_error";
  case ErrorKind::InvalidResponse:
    return "invalid_response";
  }
  return "unknown";
}

std::string Error::to_string() const {
  std::string out(error_kind_name(kind));
  if (status != 0) {
    out += " (HTTP " + std::to_string(status) + ")";
  }
  if (!message.empty()) {
    out += ": " + message;
  }
  return out;
}

} // namespace codespaces::api
