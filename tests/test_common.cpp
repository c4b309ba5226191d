#include "test_framework.hpp"

#include "codespaces/common/fs.hpp"
#include "codespaces/common/json_util.hpp"
#include "codespaces/common/result.hpp"
#include "codespaces/common/time.hpp"

#include <chrono>
#include <string>

void register_common_tests(std::vector<codespaces::tests::TestCase> &tests) {
  using codespaces::tests::require;
  namespace c = codespaces::common;

  tests.push_back({"result_carries_typed_error", [] {
                     enum class Kind { A, B };
                     auto failed = c::Result<int, Kind>::failure(Kind::B);
                     require(!failed.ok(), "failure should not be ok");
                     require(failed.error() == Kind::B, "error kind mismatch");

                     auto succeeded = c::Result<int, Kind>::success(7);
                     require(succeeded.ok() && succeeded.value() == 7, "value mismatch");

                     bool threw = false;
                     try {
                       (void)failed.value();
                     } catch (const std::logic_error &) {
                       threw = true;
                     }
                     require(threw, "value() on failure should throw");
                   }});

  tests.push_back({"case_insensitive_helpers", [] {
                     require(c::contains_ignore_case("octo/Web-App", "web"), "substring");
                     require(!c::contains_ignore_case("octo/api", "web"), "no substring");
                     require(c::equals_ignore_case("Shutdown", "shutdown"), "equal");
                     require(!c::equals_ignore_case("Shutdown", "shut"), "not equal");
                   }});

  tests.push_back({"json_parse_flat_only_reads_top_level", [] {
                     const std::string json =
                         R"({"repository": {"name": "nested"}, "name": "top", "n": 3, "b": true, "z": null})";
                     const auto fields = c::json_parse_flat(json);
                     require(c::json_as_string(fields.at("name")).value() == "top",
                             "top-level name should win");
                     require(c::json_as_integer(fields.at("n")).value() == 3, "integer");
                     require(c::json_as_bool(fields.at("b")).value(), "bool");
                     require(!c::json_as_string(fields.at("z")).has_value(), "null is not a string");
                     const auto repo = c::json_parse_flat(fields.at("repository"));
                     require(c::json_as_string(repo.at("name")).value() == "nested", "nested name");
                   }});

  tests.push_back({"json_unescape_decodes_unicode", [] {
                     require(c::json_unescape(R"(a\u00e9b)") == "a\xC3\xA9" "b", "two-byte escape");
                     require(c::json_unescape(R"(\ud83d\ude80)") == "\xF0\x9F\x9A\x80",
                             "surrogate pair");
                     require(c::json_unescape(R"(line\nnext \"q\")") == "line\nnext \"q\"",
                             "simple escapes");
                   }});

  tests.push_back({"json_split_handles_braces_inside_strings", [] {
                     const auto objects =
                         c::json_split_top_level_objects(R"([{"a": "}{"}, {"b": {"c": 1}}])");
                     require(objects.size() == 2, "expected two objects");
                     require(objects[1] == R"({"b": {"c": 1}})", "second object mismatch");
                   }});

  tests.push_back({"json_append_fields_and_pretty", [] {
                     const auto appended =
                         c::json_append_fields(R"({"a":1})", {{"_x", "\"y\""}, {"_z", "null"}});
                     require(appended == R"({"a":1, "_x": "y", "_z": null})", appended);
                     require(c::json_append_fields("{}", {{"k", "1"}}) == R"({"k": 1})",
                             "empty object append");

                     const auto pretty = c::json_pretty(R"([{"a":1,"b":[],"c":{"d":"x, y"}}])");
                     const std::string expected = "[\n"
                                                  "  {\n"
                                                  "    \"a\": 1,\n"
                                                  "    \"b\": [],\n"
                                                  "    \"c\": {\n"
                                                  "      \"d\": \"x, y\"\n"
                                                  "    }\n"
                                                  "  }\n"
                                                  "]";
                     require(pretty == expected, pretty);
                     require(c::json_pretty("[]") == "[]", "empty array");
                   }});

  tests.push_back({"parse_iso8601_variants", [] {
                     const auto zulu = c::parse_iso8601("2024-06-01T12:00:00Z");
                     const auto offset = c::parse_iso8601("2024-06-01T14:00:00+02:00");
                     const auto fraction = c::parse_iso8601("2024-06-01T12:00:00.500Z");
                     require(zulu.has_value() && offset.has_value() && fraction.has_value(),
                             "all variants should parse");
                     require(*zulu == *offset, "offset should normalize to UTC");
                     require(*fraction - *zulu == std::chrono::milliseconds(500),
                             "fraction should be kept");
                     require(!c::parse_iso8601("not a date").has_value(), "garbage rejected");
                     require(!c::parse_iso8601("2024-06-01T12:00:00Zjunk").has_value(),
                             "trailing junk rejected");

                     const auto far = c::parse_iso8601("2300-01-01T00:00:00Z");
                     require(far.has_value() && *far > *zulu, "year 2300 stays in the future");
                     require(c::format_iso8601_utc(*far) == "2300-01-01T00:00:00+00:00",
                             c::format_iso8601_utc(*far));
                     const auto last = c::parse_iso8601("9999-12-31T23:59:59Z");
                     require(last.has_value() &&
                                 c::format_iso8601_utc(*last) == "9999-12-31T23:59:59+00:00",
                             "year 9999 round-trips");
                   }});

  tests.push_back({"format_timestamps", [] {
                     const auto ts = c::parse_iso8601("2024-06-01T23:30:05Z").value();
                     require(c::format_iso8601_utc(ts) == "2024-06-01T23:30:05+00:00",
                             c::format_iso8601_utc(ts));
                     require(c::format_date_utc(ts) == "2024-06-01", "date mismatch");
                     const auto late = c::parse_iso8601("2024-06-01T23:30:05+00:00").value() +
                                       std::chrono::hours(1);
                     require(c::format_date_utc(late) == "2024-06-02", "date should roll over");
                     const auto frac = c::parse_iso8601("2024-06-01T00:00:00.25Z").value();
                     require(c::format_iso8601_utc(frac) == "2024-06-01T00:00:00.250000+00:00",
                             c::format_iso8601_utc(frac));
                   }});
}
