#pragma once

#include "codespaces/api/error.hpp"
#include "codespaces/common/result.hpp"
#include "codespaces/config/schema.hpp"

#include <optional>
#include <string>

namespace codespaces::auth {

/// Explicit token first, then the GITHUB_TOKEN snapshot held by `config`.
/// Fails with ErrorKind::MissingCredential carrying setup guidance.
[[nodiscard]] common::Result<std::string, api::Error>
resolve_token(const std::optional<std::string> &explicit_token, const config::Config &config);

[[nodiscard]] std::string missing_token_guidance();

} // namespace codespaces::auth
