#include "codespaces/config/config.hpp"

#include "codespaces/common/fs.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <vector>

namespace codespaces::config {

namespace {

constexpr const char *ENV_FILENAME = ".env";

std::optional<std::string> env_value(const char *name) {
  if (const char *value = std::getenv(name); value != nullptr && *value != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    std::string out;
    out.reserve(value.size() - 2);
    bool escaped = false;
    for (std::size_t i = 1; i + 1 < value.size(); ++i) {
      const char ch = value[i];
      if (!escaped) {
        if (ch == '\\') {
          escaped = true;
          continue;
        }
        out.push_back(ch);
        continue;
      }
      switch (ch) {
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      default:
        out.push_back(ch);
        break;
      }
      escaped = false;
    }
    return out;
  }
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  // Unquoted values may carry a trailing " # comment".
  if (const auto hash = value.find(" #"); hash != std::string::npos) {
    return common::trim(value.substr(0, hash));
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    const auto uch = static_cast<unsigned char>(ch);
    if (!(std::isalnum(uch) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void set_env_if_missing(const std::string &name, const std::string &value) {
  if (!is_valid_env_name(name)) {
    return;
  }
  if (env_value(name.c_str()).has_value()) {
    return;
  }
#if defined(_WIN32)
  _putenv_s(name.c_str(), value.c_str());
#else
  setenv(name.c_str(), value.c_str(), 1);
#endif
}

} // namespace

bool load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return false;
  }

  std::ifstream file(path);
  if (!file) {
    return false;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }

    const std::string key = common::trim(trimmed.substr(0, eq));
    const std::string value = strip_env_quotes(trimmed.substr(eq + 1));
    if (key.empty()) {
      continue;
    }
    set_env_if_missing(key, value);
  }
  return true;
}

common::Result<Config> config_from_env() {
  Config config;
  config.github_token = env_value(TOKEN_ENV);

  if (auto url = env_value(API_URL_ENV); url.has_value()) {
    config.api_url = common::trim(*url);
  }

  if (auto raw = env_value(TIMEOUT_ENV); raw.has_value()) {
    const std::string value = common::trim(*raw);
    std::uint64_t parsed = 0;
    const auto *end = value.data() + value.size();
    const auto [ptr, ec] = std::from_chars(value.data(), end, parsed);
    if (ec != std::errc() || ptr != end || parsed == 0) {
      return common::Result<Config>::failure(std::string("Invalid ") + TIMEOUT_ENV + ": '" +
                                             value + "' (expected a positive integer)");
    }
    config.timeout_ms = parsed;
  }

  if (auto backend = env_value(LOG_ENV); backend.has_value()) {
    config.observability.backend = common::to_lower(common::trim(*backend));
  }

  if (std::getenv("NO_COLOR") != nullptr) {
    config.color = false;
  }

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config(const std::filesystem::path &app_dir) {
  std::vector<std::filesystem::path> candidates;
  if (auto explicit_file = env_value(ENV_FILE_ENV); explicit_file.has_value()) {
    candidates.emplace_back(common::expand_path(*explicit_file));
  }
  candidates.push_back(app_dir / ENV_FILENAME);

  std::vector<std::filesystem::path> loaded;
  for (const auto &candidate : candidates) {
    if (load_dotenv_file(candidate)) {
      loaded.push_back(candidate);
    }
  }

  auto config = config_from_env();
  if (!config.ok()) {
    return config;
  }
  config.value().env_files = std::move(loaded);
  return config;
}

} // namespace codespaces::config
