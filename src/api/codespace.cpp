#include "codespaces/api/codespace.hpp"

#include "codespaces/common/fs.hpp"
#include "codespaces/common/json_util.hpp"

namespace codespaces::api {

namespace {

std::string field_or(const common::JsonFlatMap &fields, const std::string &key,
                     std::string fallback) {
  const auto it = fields.find(key);
  if (it == fields.end()) {
    return fallback;
  }
  return common::json_as_string(it->second).value_or(std::move(fallback));
}

std::optional<std::string> optional_field(const common::JsonFlatMap &fields,
                                          const std::string &key) {
  const auto it = fields.find(key);
  if (it == fields.end()) {
    return std::nullopt;
  }
  auto value = common::json_as_string(it->second);
  if (!value.has_value() || value->empty()) {
    return std::nullopt;
  }
  return value;
}

common::JsonFlatMap nested(const common::JsonFlatMap &fields, const std::string &key) {
  const auto it = fields.find(key);
  if (it == fields.end()) {
    return {};
  }
  return common::json_parse_flat(it->second);
}

GitStatus parse_git_status(const common::JsonFlatMap &fields) {
  GitStatus status;
  if (auto it = fields.find("has_uncommitted_changes"); it != fields.end()) {
    status.has_uncommitted_changes = common::json_as_bool(it->second).value_or(false);
  }
  if (auto it = fields.find("has_unpushed_changes"); it != fields.end()) {
    status.has_unpushed_changes = common::json_as_bool(it->second).value_or(false);
  }
  if (auto it = fields.find("ahead"); it != fields.end()) {
    status.ahead = common::json_as_integer(it->second).value_or(0);
  }
  if (auto it = fields.find("behind"); it != fields.end()) {
    status.behind = common::json_as_integer(it->second).value_or(0);
  }
  return status;
}

Error invalid_response(const std::string &body, const std::string &detail) {
  return Error{.kind = ErrorKind::InvalidResponse,
               .status = 0,
               .body = body,
               .message = "GitHub API returned an unexpected response: " + detail};
}

} // namespace

Codespace parse_codespace(const std::string &object_json) {
  const auto fields = common::json_parse_flat(object_json);

  Codespace codespace;
  codespace.display_name = field_or(fields, "display_name", "");
  codespace.repository_name = field_or(nested(fields, "repository"), "name", "");
  codespace.state = field_or(fields, "state", "");
  codespace.retention_expires_at = optional_field(fields, "retention_expires_at");
  codespace.last_used_at = optional_field(fields, "last_used_at");
  codespace.machine_display_name = optional_field(nested(fields, "machine"), "display_name");
  codespace.git_status = parse_git_status(nested(fields, "git_status"));
  codespace.raw_json = common::trim(object_json);
  return codespace;
}

common::Result<std::vector<Codespace>, Error> parse_codespaces_response(const std::string &body) {
  using ResultT = common::Result<std::vector<Codespace>, Error>;

  const std::string trimmed = common::trim(body);
  std::string array_json;
  if (!trimmed.empty() && trimmed.front() == '[') {
    array_json = trimmed;
  } else if (!trimmed.empty() && trimmed.front() == '{') {
    const auto fields = common::json_parse_flat(trimmed);
    const auto it = fields.find("codespaces");
    if (it == fields.end()) {
      // Same as an empty listing.
      return ResultT::success({});
    }
    array_json = common::trim(it->second);
    if (array_json == "null") {
      return ResultT::success({});
    }
    if (array_json.empty() || array_json.front() != '[') {
      return ResultT::failure(invalid_response(body, "\"codespaces\" is not an array"));
    }
  } else {
    return ResultT::failure(invalid_response(body, "body is not a JSON object or array"));
  }

  std::vector<Codespace> out;
  for (const auto &object : common::json_split_top_level_objects(array_json)) {
    out.push_back(parse_codespace(object));
  }
  return ResultT::success(std::move(out));
}

} // namespace codespaces::api
