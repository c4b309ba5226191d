#pragma once

#include "codespaces/api/codespace.hpp"
#include "codespaces/api/error.hpp"
#include "codespaces/api/http_client.hpp"
#include "codespaces/common/result.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace codespaces::api {

inline constexpr const char *ACCEPT_HEADER = "application/vnd.github.v3+json";

/// Reads the authenticated user's codespaces. One request per call, first
/// page only, no retries.
class CodespacesClient {
public:
  CodespacesClient(std::string api_url, std::uint64_t timeout_ms,
                   std::shared_ptr<HttpClient> http);

  [[nodiscard]] common::Result<std::vector<Codespace>, Error>
  fetch_all(const std::string &token) const;

private:
  std::string api_url_;
  std::uint64_t timeout_ms_;
  std::shared_ptr<HttpClient> http_;
};

} // namespace codespaces::api
