#include "codespaces/cli/commands.hpp"

#include "codespaces/api/client.hpp"
#include "codespaces/auth/credentials.hpp"
#include "codespaces/common/fs.hpp"
#include "codespaces/config/config.hpp"
#include "codespaces/listing/sort.hpp"
#include "codespaces/observability/factory.hpp"
#include "codespaces/observability/global.hpp"
#include "codespaces/render/json.hpp"
#include "codespaces/render/table.hpp"

#include <array>
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <iostream>

#include <unistd.h>

namespace codespaces::cli {

namespace {

constexpr const char *RESET = "\033[0m";
constexpr const char *BOLD = "\033[1m";
constexpr const char *DIM = "\033[2m";
constexpr const char *RED = "\033[31m";
constexpr const char *GREEN = "\033[32m";
constexpr const char *YELLOW = "\033[33m";
constexpr const char *CYAN = "\033[36m";
constexpr const char *CLEAR_LINE = "\r\033[2K";

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

enum class OptionId { Token, Days, Repo, State, Json, Help, Version };

struct OptionSpec {
  OptionId id;
  const char *long_name;
  char short_name;
  bool takes_value;
};

constexpr std::array<OptionSpec, 7> OPTIONS = {{
    {OptionId::Token, "--token", 't', true},
    {OptionId::Days, "--days", 'd', true},
    {OptionId::Repo, "--repo", 'r', true},
    {OptionId::State, "--state", 's', true},
    {OptionId::Json, "--json", 'j', false},
    {OptionId::Help, "--help", 'h', false},
    {OptionId::Version, "--version", 'V', false},
}};

const OptionSpec *find_long(const std::string &name) {
  for (const auto &spec : OPTIONS) {
    if (name == spec.long_name) {
      return &spec;
    }
  }
  return nullptr;
}

const OptionSpec *find_short(const char name) {
  for (const auto &spec : OPTIONS) {
    if (name == spec.short_name) {
      return &spec;
    }
  }
  return nullptr;
}

/// Repeated options overwrite; the last occurrence wins.
void apply_option(CliOptions &options, std::optional<std::string> &days_raw,
                  const OptionSpec &spec, std::string value) {
  switch (spec.id) {
  case OptionId::Token:
    options.token = std::move(value);
    break;
  case OptionId::Days:
    days_raw = std::move(value);
    break;
  case OptionId::Repo:
    options.filters.repo = std::move(value);
    break;
  case OptionId::State:
    options.filters.state = std::move(value);
    break;
  case OptionId::Json:
    options.json = true;
    break;
  case OptionId::Help:
    options.help = true;
    break;
  case OptionId::Version:
    options.version = true;
    break;
  }
}

std::string missing_value(const std::string &name) {
  return "Option '" + name + "' requires an argument.";
}

std::optional<std::int64_t> parse_integer(const std::string &raw) {
  const std::string value = common::trim(raw);
  if (value.empty()) {
    return std::nullopt;
  }
  std::int64_t parsed = 0;
  const auto *end = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(value.data(), end, parsed);
  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return parsed;
}

void print_error(std::ostream &err, const bool color, const std::string &message) {
  if (color) {
    err << RED << "Error:" << RESET << " " << message << "\n";
  } else {
    err << "Error: " << message << "\n";
  }
}

} // namespace

common::Result<CliOptions> parse_args(const std::vector<std::string> &args) {
  using ResultT = common::Result<CliOptions>;
  CliOptions options;
  std::optional<std::string> days_raw;
  std::optional<std::string> extra;

  // Single left-to-right pass: an option that takes a value consumes the next
  // token verbatim, even when it starts with '-'.
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string &arg = args[i];
    if (arg == "--") {
      if (i + 1 < args.size() && !extra.has_value()) {
        extra = args[i + 1];
      }
      break;
    }

    if (common::starts_with(arg, "--")) {
      const auto eq = arg.find('=');
      const std::string name = arg.substr(0, eq);
      const auto *spec = find_long(name);
      if (spec == nullptr) {
        return ResultT::failure("No such option: " + name);
      }
      if (!spec->takes_value) {
        if (eq != std::string::npos) {
          return ResultT::failure("Option '" + name + "' does not take a value.");
        }
        apply_option(options, days_raw, *spec, {});
      } else if (eq != std::string::npos) {
        apply_option(options, days_raw, *spec, arg.substr(eq + 1));
      } else if (i + 1 < args.size()) {
        apply_option(options, days_raw, *spec, args[++i]);
      } else {
        return ResultT::failure(missing_value(name));
      }
      continue;
    }

    if (arg.size() > 1 && arg.front() == '-') {
      // Short options cluster ("-jh"); a value option takes the rest of the
      // token ("-d7") or the next argument.
      for (std::size_t pos = 1; pos < arg.size(); ++pos) {
        const std::string name = std::string("-") + arg[pos];
        const auto *spec = find_short(arg[pos]);
        if (spec == nullptr) {
          return ResultT::failure("No such option: " + name);
        }
        if (!spec->takes_value) {
          apply_option(options, days_raw, *spec, {});
          continue;
        }
        if (pos + 1 < arg.size()) {
          apply_option(options, days_raw, *spec, arg.substr(pos + 1));
        } else if (i + 1 < args.size()) {
          apply_option(options, days_raw, *spec, args[++i]);
        } else {
          return ResultT::failure(missing_value(name));
        }
        break;
      }
      continue;
    }

    if (!extra.has_value()) {
      extra = arg;
    }
  }

  if (days_raw.has_value()) {
    const auto days = parse_integer(*days_raw);
    if (!days.has_value()) {
      return ResultT::failure("Invalid value for '--days' / '-d': '" + *days_raw +
                              "' is not a valid integer.");
    }
    options.filters.max_days = days;
  }

  if (extra.has_value()) {
    return ResultT::failure("Got unexpected extra argument (" + *extra + ")");
  }

  return ResultT::success(std::move(options));
}

int run_listing(const CliOptions &options, const config::Config &config,
                std::shared_ptr<api::HttpClient> http, const RunEnvironment &env) {
  auto token = auth::resolve_token(options.token, config);
  if (!token.ok()) {
    observability::record_error("auth", token.error().to_string());
    print_error(env.err, env.color_err, token.error().message);
    return EXIT_FATAL;
  }

  const api::CodespacesClient client(config.api_url, config.timeout_ms, std::move(http));
  if (env.show_progress) {
    env.err << (env.color_err ? std::string(BOLD) + GREEN : std::string())
            << "Fetching codespaces..." << (env.color_err ? RESET : "") << std::flush;
  }
  auto fetched = client.fetch_all(token.value());
  if (env.show_progress) {
    env.err << CLEAR_LINE << std::flush;
  }
  if (!fetched.ok()) {
    print_error(env.err, env.color_err, fetched.error().message);
    return EXIT_FATAL;
  }

  const std::vector<api::Codespace> &codespaces = fetched.value();
  if (codespaces.empty()) {
    if (env.color_out) {
      env.out << YELLOW << "No codespaces found." << RESET << "\n";
    } else {
      env.out << "No codespaces found.\n";
    }
    return EXIT_OK;
  }

  auto selected = listing::filter_codespaces(listing::as_refs(codespaces), options.filters, env.now);
  listing::sort_by_expiration(selected);

  if (options.json) {
    render::render_json(selected, env.out, env.now);
  } else {
    render::render_table(selected, env.out, render::TableStyle{.color = env.color_out}, env.now);
  }
  return EXIT_OK;
}

std::string version_string() {
#ifdef CODESPACES_VERSION
  return std::string("codespaces ") + CODESPACES_VERSION;
#else
  return "codespaces 0.1.0";
#endif
}

void print_help(std::ostream &out, const bool color) {
  const auto paint = [color](const char *code, const std::string &text) {
    return color ? std::string(code) + text + RESET : text;
  };
  const auto option = [&](const std::string &flags, const std::string &description) {
    const std::size_t width = 20;
    const std::string padding(flags.size() < width ? width - flags.size() : 1, ' ');
    out << "  " << paint(CYAN, flags) << padding << description << "\n";
  };

  out << paint(BOLD, "Usage:") << " codespaces [OPTIONS]\n\n";
  out << "  List GitHub Codespaces sorted by expiration date.\n\n";
  out << "  Token Requirements:\n";
  out << "  - Must be a \"Personal access token (classic)\"\n";
  out << "  - Must have \"codespace\" permission enabled\n";
  out << "  - Must be authorized for any organization that owns your codespaces\n\n";
  out << "  Examples:\n";
  for (const char *example : {"codespaces", "codespaces --days 7",
                              "codespaces --repo web --state Shutdown", "codespaces --json"}) {
    out << "      " << paint(DIM, example) << "\n";
  }
  out << "\n" << paint(BOLD, "Options:") << "\n";
  option("-t, --token TEXT", "GitHub personal access token (overrides .env file)");
  option("-d, --days INTEGER", "Show only codespaces expiring within N days");
  option("-r, --repo TEXT", "Filter by repository name (partial match)");
  option("-s, --state TEXT", "Filter by codespace state (e.g., Available, Shutdown)");
  option("-j, --json", "Output as JSON for scripting");
  option("-V, --version", "Show the version and exit");
  option("-h, --help", "Show this message and exit");
}

int run_cli(int argc, char **argv) {
  auto parsed = parse_args(collect_args(argc - 1, argv + 1));
  if (!parsed.ok()) {
    std::cerr << "Usage: codespaces [OPTIONS]\n"
              << "Try 'codespaces --help' for help.\n\n"
              << "Error: " << parsed.error() << "\n";
    return EXIT_USAGE;
  }
  const CliOptions &options = parsed.value();
  if (options.help) {
    print_help(std::cout, std::getenv("NO_COLOR") == nullptr && isatty(STDOUT_FILENO) != 0);
    return EXIT_OK;
  }
  if (options.version) {
    std::cout << version_string() << "\n";
    return EXIT_OK;
  }

  auto app_dir = common::executable_dir(argc > 0 ? argv[0] : nullptr);
  if (!app_dir.ok()) {
    std::cerr << "Error: " << app_dir.error() << "\n";
    return EXIT_FATAL;
  }
  auto config = config::load_config(app_dir.value());
  if (!config.ok()) {
    std::cerr << "Error: " << config.error() << "\n";
    return EXIT_FATAL;
  }

  observability::set_global_observer(observability::create_observer(config.value()));
  for (const auto &env_file : config.value().env_files) {
    observability::record_config_loaded(env_file.string());
  }

  const bool color = config.value().color;
  const RunEnvironment env{.out = std::cout,
                           .err = std::cerr,
                           .now = common::now_utc(),
                           .color_out = color && isatty(STDOUT_FILENO) != 0,
                           .color_err = color && isatty(STDERR_FILENO) != 0,
                           .show_progress = isatty(STDERR_FILENO) != 0};

  const int status =
      run_listing(options, config.value(), std::make_shared<api::CurlHttpClient>(), env);
  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
  return status;
}

} // namespace codespaces::cli
