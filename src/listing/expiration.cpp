#include "codespaces/listing/expiration.hpp"

#include "codespaces/observability/global.hpp"

namespace codespaces::listing {

std::optional<common::Timestamp> expiration_time(const api::Codespace &codespace) {
  if (!codespace.retention_expires_at.has_value()) {
    return std::nullopt;
  }
  auto parsed = common::parse_iso8601(*codespace.retention_expires_at);
  if (!parsed.has_value()) {
    observability::record_warning("expiration", "unparseable retention_expires_at '" +
                                                    *codespace.retention_expires_at + "' on " +
                                                    codespace.display_name);
  }
  return parsed;
}

std::int64_t whole_days_until(const common::Timestamp expires_at, const common::Timestamp now) {
  return std::chrono::floor<std::chrono::days>(expires_at - now).count();
}

ExpirationInfo compute_expiration(const std::optional<common::Timestamp> expires_at,
                                  const common::Timestamp now) {
  if (!expires_at.has_value()) {
    return ExpirationInfo{};
  }
  if (*expires_at <= now) {
    return ExpirationInfo{.expires_at = expires_at, .label = "Expired", .urgency = Urgency::Red};
  }

  const auto delta = *expires_at - now;
  const auto days = std::chrono::floor<std::chrono::days>(delta);
  const auto remainder = delta - days;
  const auto hours = std::chrono::floor<std::chrono::hours>(remainder).count();
  const auto minutes = std::chrono::floor<std::chrono::minutes>(remainder).count();
  const auto day_count = days.count();

  std::string label;
  if (day_count == 0 && hours == 0) {
    label = std::to_string(minutes) + "m";
  } else if (day_count == 0) {
    label = std::to_string(hours) + "h";
  } else if (day_count == 1) {
    label = "1 day";
  } else {
    label = std::to_string(day_count) + " days";
  }

  Urgency urgency = Urgency::Green;
  if (day_count < 7) {
    urgency = Urgency::Red;
  } else if (day_count < 14) {
    urgency = Urgency::Yellow;
  }

  return ExpirationInfo{.expires_at = expires_at, .label = std::move(label), .urgency = urgency};
}

ExpirationInfo compute_expiration(const api::Codespace &codespace, const common::Timestamp now) {
  return compute_expiration(expiration_time(codespace), now);
}

} // namespace codespaces::listing
