#pragma once

#include "codespaces/api/http_client.hpp"
#include "codespaces/common/result.hpp"
#include "codespaces/common/time.hpp"
#include "codespaces/config/schema.hpp"
#include "codespaces/listing/filter.hpp"

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace codespaces::cli {

inline constexpr int EXIT_OK = 0;
inline constexpr int EXIT_FATAL = 1;
inline constexpr int EXIT_USAGE = 2;

struct CliOptions {
  std::optional<std::string> token;
  listing::FilterOptions filters;
  bool json = false;
  bool help = false;
  bool version = false;
};

/// Parse arguments (program name excluded). Errors are usage errors.
[[nodiscard]] common::Result<CliOptions> parse_args(const std::vector<std::string> &args);

struct RunEnvironment {
  std::ostream &out;
  std::ostream &err;
  common::Timestamp now;
  bool color_out = false;
  bool color_err = false;
  /// Show a transient "Fetching codespaces..." line on `err`.
  bool show_progress = false;
};

/// Credential -> fetch -> filter -> sort -> render. Returns the exit status.
[[nodiscard]] int run_listing(const CliOptions &options, const config::Config &config,
                              std::shared_ptr<api::HttpClient> http, const RunEnvironment &env);

[[nodiscard]] std::string version_string();
/// ANSI styling only when `color` is set.
void print_help(std::ostream &out, bool color);

int run_cli(int argc, char **argv);

} // namespace codespaces::cli
