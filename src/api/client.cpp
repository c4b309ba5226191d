#include "codespaces/api/client.hpp"

#include "codespaces/common/json_util.hpp"
#include "codespaces/observability/global.hpp"

#include <chrono>

namespace codespaces::api {

namespace {

std::string api_error_message(const HttpResponse &response, const std::string &url) {
  std::string message =
      "GitHub API error: HTTP " + std::to_string(response.status) + " for url: " + url;
  const auto fields = common::json_parse_flat(response.body);
  if (auto it = fields.find("message"); it != fields.end()) {
    if (auto detail = common::json_as_string(it->second); detail.has_value() && !detail->empty()) {
      message += " (" + *detail + ")";
    }
  }
  return message;
}

} // namespace

CodespacesClient::CodespacesClient(std::string api_url, const std::uint64_t timeout_ms,
                                   std::shared_ptr<HttpClient> http)
    : api_url_(std::move(api_url)), timeout_ms_(timeout_ms), http_(std::move(http)) {}

common::Result<std::vector<Codespace>, Error>
CodespacesClient::fetch_all(const std::string &token) const {
  using ResultT = common::Result<std::vector<Codespace>, Error>;

  const std::unordered_map<std::string, std::string> headers = {
      {"Authorization", "token " + token},
      {"Accept", ACCEPT_HEADER},
  };

  observability::record_fetch_start(api_url_);
  const auto started = std::chrono::steady_clock::now();
  const HttpResponse response = http_->get(api_url_, headers, timeout_ms_);
  const auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);

  if (response.network_error) {
    const std::string detail = response.timeout ? "request timed out after " +
                                                      std::to_string(timeout_ms_) + " ms"
                                                : response.network_error_message;
    observability::record_error("api", "connection failed: " + detail);
    return ResultT::failure(Error{.kind = ErrorKind::ConnectionError,
                                 .status = 0,
                                 .body = "",
                                 .message = "Failed to connect to GitHub API: " + detail});
  }

  if (response.status == 401) {
    observability::record_error("api", "unauthorized");
    return ResultT::failure(
        Error{.kind = ErrorKind::Unauthorized,
              .status = response.status,
              .body = response.body,
              .message = "Invalid token or insufficient permissions.\n\n"
                         "Ensure your token has 'codespace' permission (scope) and is "
                         "authorized for the organization."});
  }

  if (response.status < 200 || response.status >= 300) {
    observability::record_error("api", "status " + std::to_string(response.status));
    return ResultT::failure(Error{.kind = ErrorKind::ApiError,
                                 .status = response.status,
                                 .body = response.body,
                                 .message = api_error_message(response, api_url_)});
  }

  auto parsed = parse_codespaces_response(response.body);
  if (!parsed.ok()) {
    observability::record_error("api", parsed.error().message);
    return parsed;
  }
  observability::record_fetch_end(response.status, parsed.value().size(), latency);
  return parsed;
}

} // namespace codespaces::api
