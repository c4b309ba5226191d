#pragma once

#include "codespaces/api/error.hpp"
#include "codespaces/common/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace codespaces::api {

struct GitStatus {
  bool has_uncommitted_changes = false;
  bool has_unpushed_changes = false;
  std::int64_t ahead = 0;
  std::int64_t behind = 0;
};

/// One codespace as returned by GET /user/codespaces. Only the fields the
/// tool reads are typed; `raw_json` keeps the full upstream object.
struct Codespace {
  std::string display_name;
  std::string repository_name;
  std::string state;
  std::optional<std::string> retention_expires_at;
  std::optional<std::string> last_used_at;
  std::optional<std::string> machine_display_name;
  GitStatus git_status;
  std::string raw_json;
};

/// Build a record from one JSON object. Missing or mistyped fields fall back
/// to their defaults.
[[nodiscard]] Codespace parse_codespace(const std::string &object_json);

/// Accepts {"codespaces": [...]} or a bare array.
[[nodiscard]] common::Result<std::vector<Codespace>, Error>
parse_codespaces_response(const std::string &body);

} // namespace codespaces::api
