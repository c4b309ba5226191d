#pragma once

#include "codespaces/common/result.hpp"
#include <filesystem>
#include <string>

namespace codespaces::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] bool contains_ignore_case(const std::string &haystack, const std::string &needle);
[[nodiscard]] bool equals_ignore_case(const std::string &lhs, const std::string &rhs);
[[nodiscard]] std::string expand_path(std::string value);

/// Directory holding the running executable. Falls back to argv[0]'s parent,
/// then to the current directory.
[[nodiscard]] Result<std::filesystem::path> executable_dir(const char *argv0);

} // namespace codespaces::common
