#include "test_framework.hpp"

#include "codespaces/cli/commands.hpp"
#include "codespaces/common/json_util.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace {

using namespace std::chrono_literals;
namespace cli = codespaces::cli;
using codespaces::testing::CodespaceFixture;
using codespaces::testing::MockHttpClient;

struct RunOutput {
  int status = -1;
  std::string out;
  std::string err;
};

std::string scenario_body() {
  CodespaceFixture expiring;
  expiring.display_name = "expiring-soon";
  expiring.repository = "web-app";
  expiring.state = "Available";
  expiring.retention_expires_at =
      codespaces::testing::iso_after(codespaces::testing::fixed_now(), 3 * 24h + 1h);

  CodespaceFixture kept;
  kept.display_name = "kept-forever";
  kept.repository = "docs";
  kept.state = "Shutdown";

  // Deliberately listed with the non-expiring record first.
  return codespaces::testing::codespaces_body({kept, expiring});
}

RunOutput run(const std::vector<std::string> &args, const std::shared_ptr<MockHttpClient> &http,
              std::optional<std::string> env_token = std::string("ghp_env")) {
  auto parsed = cli::parse_args(args);
  if (!parsed.ok()) {
    throw std::runtime_error("bad test args: " + parsed.error());
  }
  codespaces::config::Config config;
  config.github_token = std::move(env_token);

  std::ostringstream out;
  std::ostringstream err;
  const cli::RunEnvironment env{.out = out,
                                .err = err,
                                .now = codespaces::testing::fixed_now(),
                                .color_out = false,
                                .color_err = false,
                                .show_progress = false};
  RunOutput result;
  result.status = cli::run_listing(parsed.value(), config, http, env);
  result.out = out.str();
  result.err = err.str();
  return result;
}

std::shared_ptr<MockHttpClient> mock_with(std::uint16_t status, std::string body) {
  auto mock = std::make_shared<MockHttpClient>();
  mock->next_response.status = status;
  mock->next_response.body = std::move(body);
  return mock;
}

} // namespace

void register_listing_integration_tests(std::vector<codespaces::tests::TestCase> &tests) {
  using codespaces::tests::require;

  tests.push_back({"integration_days_filter_keeps_expiring_only", [] {
                     auto mock = mock_with(200, scenario_body());
                     const auto result = run({"--days", "7"}, mock);
                     require(result.status == cli::EXIT_OK, "exit status");
                     require(result.out.find("expiring-soon") != std::string::npos,
                             "expiring record shown");
                     require(result.out.find("kept-forever") == std::string::npos,
                             "non-expiring record filtered out");
                     require(result.out.find("Total: 1 codespace(s)") != std::string::npos,
                             "summary");
                   }});

  tests.push_back({"integration_state_filter_is_case_insensitive", [] {
                     auto mock = mock_with(200, scenario_body());
                     const auto result = run({"--state", "shutdown"}, mock);
                     require(result.status == cli::EXIT_OK, "exit status");
                     require(result.out.find("kept-forever") != std::string::npos,
                             "shutdown record shown");
                     require(result.out.find("expiring-soon") == std::string::npos,
                             "available record filtered out");
                   }});

  tests.push_back({"integration_json_sorted_with_injected_fields", [] {
                     auto mock = mock_with(200, scenario_body());
                     const auto result = run({"--json"}, mock);
                     require(result.status == cli::EXIT_OK, "exit status");
                     const auto objects =
                         codespaces::common::json_split_top_level_objects(result.out);
                     require(objects.size() == 2, "both records printed");

                     const auto first = codespaces::common::json_parse_flat(objects[0]);
                     const auto second = codespaces::common::json_parse_flat(objects[1]);
                     require(codespaces::common::json_as_string(first.at("display_name")).value() ==
                                 "expiring-soon",
                             "expiring record sorted first");
                     require(codespaces::common::json_as_string(first.at("_expires_in")).value() ==
                                 "3 days",
                             "relative label injected");
                     require(codespaces::common::json_as_string(first.at("_expires_timestamp"))
                                 .has_value(),
                             "timestamp injected");
                     require(second.at("_expires_in") == "null" &&
                                 second.at("_expires_timestamp") == "null",
                             "null fields for non-expiring record");
                   }});

  tests.push_back({"integration_explicit_token_overrides_env", [] {
                     auto mock = mock_with(200, scenario_body());
                     const auto result = run({"--token", "ghp_cli"}, mock);
                     require(result.status == cli::EXIT_OK, "exit status");
                     require(mock->last_headers.at("Authorization") == "token ghp_cli",
                             "explicit token used");
                   }});

  tests.push_back({"integration_missing_token_makes_no_request", [] {
                     auto mock = mock_with(200, scenario_body());
                     const auto result = run({}, mock, std::nullopt);
                     require(result.status == cli::EXIT_FATAL, "exit status 1");
                     require(mock->calls == 0, "no network call without a token");
                     require(result.err.find("No GitHub token provided") != std::string::npos,
                             "guidance printed");
                     require(result.out.empty(), "nothing on stdout");
                   }});

  tests.push_back({"integration_unauthorized_single_request", [] {
                     auto mock = mock_with(401, R"({"message":"Bad credentials"})");
                     const auto result = run({}, mock);
                     require(result.status == cli::EXIT_FATAL, "exit status 1");
                     require(mock->calls == 1, "exactly one request");
                     require(result.err.find("scope") != std::string::npos,
                             "guidance mentions token scope");
                   }});

  tests.push_back({"integration_api_and_connection_errors_exit_1", [] {
                     auto server_error = mock_with(500, "boom");
                     const auto api_result = run({}, server_error);
                     require(api_result.status == cli::EXIT_FATAL, "api error exit status");
                     require(api_result.err.find("500") != std::string::npos, "status printed");

                     auto offline = std::make_shared<MockHttpClient>();
                     offline->next_response.network_error = true;
                     offline->next_response.network_error_message = "Connection refused";
                     const auto net_result = run({}, offline);
                     require(net_result.status == cli::EXIT_FATAL, "connection exit status");
                     require(net_result.err.find("Failed to connect") != std::string::npos,
                             "connection guidance printed");
                     require(offline->calls == 1, "no retry");
                   }});

  tests.push_back({"integration_no_codespaces_exits_0", [] {
                     auto mock = mock_with(200, R"({"total_count": 0, "codespaces": []})");
                     const auto result = run({"--json"}, mock);
                     require(result.status == cli::EXIT_OK, "exit status 0");
                     require(result.out == "No codespaces found.\n", result.out);
                   }});

  tests.push_back({"integration_filters_can_empty_the_table", [] {
                     auto mock = mock_with(200, scenario_body());
                     const auto result = run({"--repo", "nothing-matches"}, mock);
                     require(result.status == cli::EXIT_OK, "exit status 0");
                     require(result.out == "No codespaces found matching your criteria.\n",
                             result.out);
                   }});
}
