#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

namespace codespaces::api {

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;
  [[nodiscard]] virtual HttpResponse
  get(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
      std::uint64_t timeout_ms) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient &) = delete;
  CurlHttpClient &operator=(const CurlHttpClient &) = delete;

  [[nodiscard]] HttpResponse
  get(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
      std::uint64_t timeout_ms) override;
};

} // namespace codespaces::api
