#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace codespaces::common {

/// Microsecond precision keeps years up to 9999 in range.
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::microseconds>;

[[nodiscard]] Timestamp now_utc();

/// Parse an ISO-8601 / RFC 3339 timestamp ("2024-05-01T12:00:00Z",
/// "2024-05-01T12:00:00.123+02:00") into an absolute UTC point in time.
[[nodiscard]] std::optional<Timestamp> parse_iso8601(const std::string &value);

/// "YYYY-MM-DDTHH:MM:SS[.ffffff]+00:00"; microseconds only when non-zero.
[[nodiscard]] std::string format_iso8601_utc(Timestamp timestamp);

/// "YYYY-MM-DD" in UTC.
[[nodiscard]] std::string format_date_utc(Timestamp timestamp);

} // namespace codespaces::common
