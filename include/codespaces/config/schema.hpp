#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace codespaces::config {

inline constexpr const char *DEFAULT_API_URL = "https://api.github.com/user/codespaces";
inline constexpr std::uint64_t DEFAULT_TIMEOUT_MS = 30'000;

struct ObservabilityConfig {
  std::string backend = "none";
};

struct Config {
  std::optional<std::string> github_token;
  std::string api_url = DEFAULT_API_URL;
  std::uint64_t timeout_ms = DEFAULT_TIMEOUT_MS;
  bool color = true;
  ObservabilityConfig observability;
  /// .env files that existed and were read, in load order.
  std::vector<std::filesystem::path> env_files;
};

} // namespace codespaces::config
