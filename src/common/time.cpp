#include "codespaces/common/time.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace codespaces::common {

namespace {

std::tm to_utc_tm(const std::time_t t) {
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  return tm;
}

bool read_digits(const std::string &value, std::size_t pos, std::size_t count, int &out) {
  if (pos + count > value.size()) {
    return false;
  }
  int parsed = 0;
  for (std::size_t i = pos; i < pos + count; ++i) {
    if (std::isdigit(static_cast<unsigned char>(value[i])) == 0) {
      return false;
    }
    parsed = parsed * 10 + (value[i] - '0');
  }
  out = parsed;
  return true;
}

} // namespace

std::optional<Timestamp> parse_iso8601(const std::string &value) {
  std::tm tm{};
  std::istringstream in(value);
  in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (in.fail()) {
    return std::nullopt;
  }

  std::string rest;
  std::getline(in, rest);
  std::size_t pos = 0;

  std::chrono::microseconds fraction{0};
  if (pos < rest.size() && (rest[pos] == '.' || rest[pos] == ',')) {
    ++pos;
    long long micros = 0;
    int digits = 0;
    while (pos < rest.size() && std::isdigit(static_cast<unsigned char>(rest[pos])) != 0) {
      if (digits < 6) {
        micros = micros * 10 + (rest[pos] - '0');
        ++digits;
      }
      ++pos;
    }
    if (digits == 0) {
      return std::nullopt;
    }
    for (; digits < 6; ++digits) {
      micros *= 10;
    }
    fraction = std::chrono::microseconds(micros);
  }

  std::chrono::minutes offset{0};
  if (pos < rest.size() && (rest[pos] == 'Z' || rest[pos] == 'z')) {
    ++pos;
  } else if (pos < rest.size() && (rest[pos] == '+' || rest[pos] == '-')) {
    const int sign = rest[pos] == '-' ? -1 : 1;
    ++pos;
    int hours = 0;
    int minutes = 0;
    if (!read_digits(rest, pos, 2, hours)) {
      return std::nullopt;
    }
    pos += 2;
    if (pos < rest.size() && rest[pos] == ':') {
      ++pos;
    }
    if (!read_digits(rest, pos, 2, minutes)) {
      return std::nullopt;
    }
    pos += 2;
    offset = std::chrono::minutes(sign * (hours * 60 + minutes));
  }
  // No designator: treated as UTC.

  if (pos != rest.size()) {
    return std::nullopt;
  }

#ifdef _WIN32
  const std::time_t seconds = _mkgmtime(&tm);
#else
  const std::time_t seconds = timegm(&tm);
#endif
  constexpr auto max_seconds =
      std::chrono::floor<std::chrono::seconds>(Timestamp::max()).time_since_epoch().count() - 1;
  if (seconds > max_seconds || seconds < -max_seconds) {
    return std::nullopt;
  }
  return Timestamp(std::chrono::seconds(seconds)) + fraction - offset;
}

Timestamp now_utc() {
  return std::chrono::time_point_cast<Timestamp::duration>(std::chrono::system_clock::now());
}

std::string format_iso8601_utc(const Timestamp timestamp) {
  const auto seconds = std::chrono::floor<std::chrono::seconds>(timestamp);
  const auto micros =
      std::chrono::duration_cast<std::chrono::microseconds>(timestamp - seconds).count();
  const std::tm tm = to_utc_tm(static_cast<std::time_t>(seconds.time_since_epoch().count()));

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (micros != 0) {
    out << '.' << std::setw(6) << std::setfill('0') << micros;
  }
  out << "+00:00";
  return out.str();
}

std::string format_date_utc(const Timestamp timestamp) {
  const auto seconds = std::chrono::floor<std::chrono::seconds>(timestamp);
  const std::tm tm = to_utc_tm(static_cast<std::time_t>(seconds.time_since_epoch().count()));
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%d");
  return out.str();
}

} // namespace codespaces::common
