#include "test_framework.hpp"

#include "codespaces/api/client.hpp"
#include "codespaces/api/codespace.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <memory>

void register_api_tests(std::vector<codespaces::tests::TestCase> &tests) {
  using codespaces::tests::require;
  using codespaces::testing::CodespaceFixture;
  using codespaces::testing::MockHttpClient;
  namespace api = codespaces::api;

  tests.push_back({"parse_codespace_reads_typed_fields", [] {
                     CodespaceFixture fixture;
                     fixture.display_name = "fluffy-space";
                     fixture.repository = "web-app";
                     fixture.state = "Shutdown";
                     fixture.retention_expires_at = "2024-06-10T00:00:00Z";
                     fixture.last_used_at = "2024-05-30T08:00:00Z";
                     fixture.machine = "2 cores, 8 GB RAM, 32 GB storage";
                     fixture.uncommitted = true;
                     fixture.ahead = 2;
                     const auto cs = api::parse_codespace(fixture.to_json());
                     require(cs.display_name == "fluffy-space", "display_name");
                     require(cs.repository_name == "web-app", "repository.name, not full_name");
                     require(cs.state == "Shutdown", "state");
                     require(cs.retention_expires_at.value_or("") == "2024-06-10T00:00:00Z",
                             "retention");
                     require(cs.last_used_at.value_or("") == "2024-05-30T08:00:00Z", "last used");
                     require(cs.machine_display_name.value_or("") ==
                                 "2 cores, 8 GB RAM, 32 GB storage",
                             "machine display name");
                     require(cs.git_status.has_uncommitted_changes, "uncommitted");
                     require(!cs.git_status.has_unpushed_changes, "unpushed");
                     require(cs.git_status.ahead == 2 && cs.git_status.behind == 0, "counts");
                   }});

  tests.push_back({"parse_codespace_defaults_missing_fields", [] {
                     const auto cs = api::parse_codespace(
                         R"({"display_name": "bare", "retention_expires_at": null})");
                     require(cs.repository_name.empty(), "repository defaults to empty");
                     require(cs.state.empty(), "state defaults to empty");
                     require(!cs.retention_expires_at.has_value(), "null retention is absent");
                     require(!cs.last_used_at.has_value(), "missing last_used_at");
                     require(!cs.machine_display_name.has_value(), "missing machine");
                     require(!cs.git_status.has_uncommitted_changes && cs.git_status.ahead == 0,
                             "git status defaults");
                   }});

  tests.push_back({"parse_response_accepts_wrapped_and_bare", [] {
                     CodespaceFixture a;
                     a.display_name = "a";
                     CodespaceFixture b;
                     b.display_name = "b";
                     auto wrapped =
                         api::parse_codespaces_response(codespaces::testing::codespaces_body({a, b}));
                     require(wrapped.ok() && wrapped.value().size() == 2, "wrapped list");
                     require(wrapped.value()[1].display_name == "b", "order kept");

                     auto bare = api::parse_codespaces_response("[" + a.to_json() + "]");
                     require(bare.ok() && bare.value().size() == 1, "bare array");

                     auto empty = api::parse_codespaces_response(R"({"total_count": 0})");
                     require(empty.ok() && empty.value().empty(), "missing key is empty");
                     auto null_list = api::parse_codespaces_response(R"({"codespaces": null})");
                     require(null_list.ok() && null_list.value().empty(), "null list is empty");
                   }});

  tests.push_back({"parse_response_rejects_non_json", [] {
                     auto parsed = api::parse_codespaces_response("<html>oops</html>");
                     require(!parsed.ok(), "html should fail");
                     require(parsed.error().kind == api::ErrorKind::InvalidResponse, "kind");
                   }});

  tests.push_back({"client_sends_single_authenticated_get", [] {
                     auto mock = std::make_shared<MockHttpClient>();
                     mock->next_response = {.status = 200,
                                            .body = codespaces::testing::codespaces_body({CodespaceFixture{}})};
                     api::CodespacesClient client("https://api.github.com/user/codespaces", 4321,
                                                  mock);
                     auto result = client.fetch_all("ghp_secret");
                     require(result.ok(), result.ok() ? "" : result.error().to_string());
                     require(mock->calls == 1, "exactly one request");
                     require(mock->last_url == "https://api.github.com/user/codespaces", "url");
                     require(mock->last_headers.at("Authorization") == "token ghp_secret",
                             "authorization header");
                     require(mock->last_headers.at("Accept") == "application/vnd.github.v3+json",
                             "accept header");
                     require(mock->last_timeout_ms == 4321, "timeout forwarded");
                   }});

  tests.push_back({"client_maps_401_to_unauthorized", [] {
                     auto mock = std::make_shared<MockHttpClient>();
                     mock->next_response = {.status = 401, .body = R"({"message":"Bad credentials"})"};
                     api::CodespacesClient client("https://api.github.com/user/codespaces", 1000,
                                                  mock);
                     auto result = client.fetch_all("bad");
                     require(!result.ok(), "401 should fail");
                     require(result.error().kind == api::ErrorKind::Unauthorized, "kind");
                     require(result.error().status == 401, "status");
                     require(result.error().message.find("scope") != std::string::npos,
                             "guidance mentions scope");
                     require(mock->calls == 1, "no retry");
                   }});

  tests.push_back({"client_maps_other_status_to_api_error", [] {
                     auto mock = std::make_shared<MockHttpClient>();
                     mock->next_response = {.status = 503, .body = R"({"message":"Unavailable"})"};
                     api::CodespacesClient client("https://api.github.com/user/codespaces", 1000,
                                                  mock);
                     auto result = client.fetch_all("tok");
                     require(!result.ok(), "503 should fail");
                     require(result.error().kind == api::ErrorKind::ApiError, "kind");
                     require(result.error().status == 503, "status kept");
                     require(result.error().body == R"({"message":"Unavailable"})", "body kept");
                     require(result.error().message.find("503") != std::string::npos,
                             "message has status");
                     require(result.error().message.find("Unavailable") != std::string::npos,
                             "message has upstream detail");
                     require(mock->calls == 1, "no retry");
                   }});

  tests.push_back({"client_maps_transport_failure", [] {
                     auto mock = std::make_shared<MockHttpClient>();
                     mock->next_response = {.network_error = true,
                                            .network_error_message = "Couldn't resolve host name"};
                     api::CodespacesClient client("https://api.github.com/user/codespaces", 1000,
                                                  mock);
                     auto result = client.fetch_all("tok");
                     require(!result.ok(), "network error should fail");
                     require(result.error().kind == api::ErrorKind::ConnectionError, "kind");
                     require(result.error().message.find("Couldn't resolve host name") !=
                                 std::string::npos,
                             "transport detail kept");

                     mock->next_response = {.timeout = true, .network_error = true};
                     auto timed_out = client.fetch_all("tok");
                     require(!timed_out.ok() &&
                                 timed_out.error().kind == api::ErrorKind::ConnectionError,
                             "timeout is a connection error");
                     require(timed_out.error().message.find("timed out") != std::string::npos,
                             "timeout mentioned");
                     require(mock->calls == 2, "one request per fetch");
                   }});
}
