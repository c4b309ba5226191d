#pragma once

#include "codespaces/common/result.hpp"
#include "codespaces/config/schema.hpp"

#include <filesystem>

namespace codespaces::config {

inline constexpr const char *TOKEN_ENV = "GITHUB_TOKEN";
inline constexpr const char *ENV_FILE_ENV = "CODESPACES_ENV_FILE";
inline constexpr const char *API_URL_ENV = "CODESPACES_API_URL";
inline constexpr const char *TIMEOUT_ENV = "CODESPACES_TIMEOUT_MS";
inline constexpr const char *LOG_ENV = "CODESPACES_LOG";

/// Read KEY=VALUE lines into the process environment. Existing non-empty
/// variables win. Returns false when the file does not exist or cannot be read.
bool load_dotenv_file(const std::filesystem::path &path);

/// Load $CODESPACES_ENV_FILE, then <app_dir>/.env, into the environment and
/// snapshot the result. Called once at startup.
[[nodiscard]] common::Result<Config> load_config(const std::filesystem::path &app_dir);

/// Snapshot the current environment without touching any .env file.
[[nodiscard]] common::Result<Config> config_from_env();

} // namespace codespaces::config
