#include "codespaces/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <regex>

namespace codespaces::common {

std::string trim(const std::string &input) {
  auto first = std::find_if_not(input.begin(), input.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto last = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) {
    return std::isspace(c) != 0;
  }).base();

  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

bool contains_ignore_case(const std::string &haystack, const std::string &needle) {
  return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

bool equals_ignore_case(const std::string &lhs, const std::string &rhs) {
  return to_lower(lhs) == to_lower(rhs);
}

std::string expand_path(std::string value) {
  if (value.empty()) {
    return value;
  }

  if (value[0] == '~') {
    if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
      value.replace(0, 1, home);
    }
  }

  std::regex env_pattern(R"(\$\{?([A-Za-z_][A-Za-z0-9_]*)\}?)");
  std::smatch match;
  std::string expanded;
  std::string remaining = value;

  while (std::regex_search(remaining, match, env_pattern)) {
    expanded += match.prefix().str();
    const std::string var_name = match[1].str();
    if (const char *var = std::getenv(var_name.c_str()); var != nullptr) {
      expanded += var;
    }
    remaining = match.suffix().str();
  }

  expanded += remaining;
  return expanded;
}

Result<std::filesystem::path> executable_dir(const char *argv0) {
  std::error_code ec;
  const auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
  if (!ec && !self.empty()) {
    return Result<std::filesystem::path>::success(self.parent_path());
  }

  if (argv0 != nullptr && *argv0 != '\0') {
    const auto resolved = std::filesystem::weakly_canonical(std::filesystem::path(argv0), ec);
    if (!ec && resolved.has_parent_path()) {
      return Result<std::filesystem::path>::success(resolved.parent_path());
    }
  }

  const auto cwd = std::filesystem::current_path(ec);
  if (ec) {
    return Result<std::filesystem::path>::failure("Unable to locate executable directory: " +
                                                  ec.message());
  }
  return Result<std::filesystem::path>::success(cwd);
}

} // namespace codespaces::common
