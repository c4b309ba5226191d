#pragma once

#include "codespaces/api/codespace.hpp"
#include "codespaces/common/time.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace codespaces::listing {

enum class Urgency { Gray, Green, Yellow, Red };

struct ExpirationInfo {
  std::optional<common::Timestamp> expires_at;
  std::optional<std::string> label;
  Urgency urgency = Urgency::Gray;
};

/// Parsed `retention_expires_at`; nullopt when absent or unparseable.
[[nodiscard]] std::optional<common::Timestamp> expiration_time(const api::Codespace &codespace);

/// Whole days from `now` to `expires_at`, rounded toward negative infinity.
[[nodiscard]] std::int64_t whole_days_until(common::Timestamp expires_at, common::Timestamp now);

[[nodiscard]] ExpirationInfo compute_expiration(std::optional<common::Timestamp> expires_at,
                                                common::Timestamp now);

[[nodiscard]] ExpirationInfo compute_expiration(const api::Codespace &codespace,
                                                common::Timestamp now);

} // namespace codespaces::listing
