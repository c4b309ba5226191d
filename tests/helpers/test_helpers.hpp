#pragma once

#include "codespaces/api/http_client.hpp"
#include "codespaces/common/time.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace codespaces::testing {

class MockHttpClient final : public api::HttpClient {
public:
  api::HttpResponse next_response;
  std::size_t calls = 0;
  std::string last_url;
  std::unordered_map<std::string, std::string> last_headers;
  std::uint64_t last_timeout_ms = 0;

  [[nodiscard]] api::HttpResponse
  get(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
      std::uint64_t timeout_ms) override;
};

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value);
  ~EnvGuard();

  EnvGuard(const EnvGuard &) = delete;
  EnvGuard &operator=(const EnvGuard &) = delete;
};

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

/// 2024-06-01T12:00:00Z
[[nodiscard]] common::Timestamp fixed_now();

[[nodiscard]] std::string iso_after(common::Timestamp base, std::chrono::seconds offset);

struct CodespaceFixture {
  std::string display_name = "fixture";
  std::string repository = "octo/repo";
  std::string state = "Available";
  std::optional<std::string> retention_expires_at;
  std::optional<std::string> last_used_at;
  std::optional<std::string> machine;
  bool uncommitted = false;
  bool unpushed = false;
  int ahead = 0;
  int behind = 0;

  [[nodiscard]] std::string to_json() const;
};

/// {"total_count": N, "codespaces": [...]}
[[nodiscard]] std::string codespaces_body(const std::vector<CodespaceFixture> &fixtures);

} // namespace codespaces::testing
