#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "conductor/common/fs.hpp"
#include "conductor/common/json_util.hpp"
#include "conductor/common/time.hpp"
#include "conductor/common/toml.hpp"

#include <filesystem>

void register_common_tests(std::vector<conductor::tests::TestCase> &tests) {
  using conductor::tests::require;
  namespace c = conductor::common;
  namespace t = conductor::testing;

  tests.push_back({"common_json_object_members", [] {
                     const auto parsed = c::json_parse_object(
                         R"({"name":"a \"quoted\" value","count":3,"nested":{"x":[1,2]},)"
                         R"("list":["p","q"],"empty":null})");
                     require(parsed.ok(), parsed.error());
                     const auto &object = parsed.value();
                     require(object.at("name").is_string, "name should be a string");
                     require(object.at("name").raw == "a \"quoted\" value", "name unescape");
                     require(!object.at("count").is_string && object.at("count").raw == "3",
                             "count should stay raw");
                     require(object.at("nested").raw == R"({"x":[1,2]})", "nested raw mismatch");
                     require(object.at("empty").raw == "null", "null raw mismatch");

                     const auto list = c::json_parse_string_array(object.at("list").raw);
                     require(list.ok(), list.error());
                     require(list.value().size() == 2 && list.value()[1] == "q",
                             "string array mismatch");
                   }});

  tests.push_back({"common_json_rejects_truncated_input", [] {
                     require(!c::json_parse_object(R"({"a":"b")").ok(), "unterminated object");
                     require(!c::json_parse_object(R"({"a":)").ok(), "missing value");
                     require(!c::json_parse_object(R"({"a":1} trailing)").ok(), "trailing data");
                     require(!c::json_parse_object("[1,2]").ok(), "array is not an object");
                   }});

  tests.push_back({"common_json_decodes_surrogate_pairs", [] {
                     require(c::json_unescape("smile \\uD83D\\uDE00!") ==
                                 "smile \xF0\x9F\x98\x80!",
                             "pair becomes one 4-byte character");
                     require(c::json_unescape("\\u00e9") == "\xC3\xA9", "two-byte character");
                     require(c::json_unescape("x\\uD83Dy") == "x\xEF\xBF\xBDy",
                             "lone high surrogate replaced");
                     require(c::json_unescape("\\uDE00") == "\xEF\xBF\xBD",
                             "lone low surrogate replaced");
                   }});

  tests.push_back({"common_json_requires_separators", [] {
                     require(!c::json_parse_string_array(R"(["a" "b"])").ok(), "missing comma");
                     require(!c::json_parse_string_array(R"(["a",])").ok(), "trailing comma");
                     require(!c::json_parse_string_array(R"(["a"] x)").ok(), "trailing data");
                     require(!c::json_parse_object(R"({"a":1 "b":2})").ok(),
                             "missing comma in object");
                     require(!c::json_parse_object(R"({"a":1,})").ok(), "trailing comma in object");
                     const auto ok = c::json_parse_string_array(R"([ "a" , "b" ])");
                     require(ok.ok() && ok.value().size() == 2, "whitespace around commas");
                     require(c::json_parse_string_array("[]").value().empty(), "empty array");
                   }});

  tests.push_back({"common_json_escape_control_characters", [] {
                     const std::string raw = "line1\nline2\t\"q\"\\";
                     const auto quoted = c::json_quote(raw);
                     require(quoted.find('\n') == std::string::npos, "newline must be escaped");
                     require(c::json_unescape(quoted.substr(1, quoted.size() - 2)) == raw,
                             "unescape should restore input");
                     require(c::json_string_array({"a", "b"}) == R"(["a","b"])",
                             "string array encoding");
                   }});

  tests.push_back({"common_toml_sections_and_types", [] {
                     const auto doc = c::parse_toml("# comment\n"
                                                    "top = \"value\"\n"
                                                    "[scheduler]\n"
                                                    "max_sessions = 4 # inline\n"
                                                    "enabled = true\n"
                                                    "ratio = 0.5\n"
                                                    "names = [\"a\", \"b\"]\n");
                     require(doc.ok(), doc.error());
                     const auto &d = doc.value();
                     require(d.get_string("top") == "value", "top-level string");
                     require(d.get_i64("scheduler.max_sessions", 0) == 4, "integer");
                     require(d.get_bool("scheduler.enabled", false), "bool");
                     require(d.get_double("scheduler.ratio", 0.0) == 0.5, "double");
                     require(d.get_string_array("scheduler.names").size() == 2, "array");
                     require(d.get_u64("scheduler.missing", 9) == 9, "fallback");

                     const auto unknown = d.unknown_keys({"top", "scheduler.max_sessions"});
                     require(unknown.size() == 3 && unknown.front() == "scheduler.enabled",
                             "unknown keys should be sorted");
                   }});

  tests.push_back({"common_toml_rejects_malformed_lines", [] {
                     require(!c::parse_toml("[]\n").ok(), "empty section");
                     require(!c::parse_toml("just text\n").ok(), "missing '='");
                     require(!c::parse_toml(" = 3\n").ok(), "missing key");
                     require(c::quote_toml_string("a\"b") == "\"a\\\"b\"", "toml quoting");
                   }});

  tests.push_back({"common_timestamp_format_and_parse", [] {
                     const auto start = t::ManualClock::default_start() +
                                        std::chrono::milliseconds(42);
                     const auto text = c::format_timestamp(start);
                     require(text == "2026-01-15T09:30:00.042Z", "unexpected format: " + text);

                     const auto parsed = c::parse_timestamp(text);
                     require(parsed.ok(), parsed.error());
                     require(parsed.value() == start, "timestamp should round-trip");

                     const auto whole = c::parse_timestamp("2026-01-15T09:30:00Z");
                     require(whole.ok(), whole.error());
                     require(whole.value() == t::ManualClock::default_start(),
                             "fraction is optional");
                     require(!c::parse_timestamp("yesterday").ok(), "garbage rejected");
                     require(!c::parse_timestamp("2026-01-15T09:30:00.5+01:00").ok(),
                             "offsets rejected");
                   }});

  tests.push_back({"common_truncate_to_millis", [] {
                     const auto base = t::ManualClock::default_start();
                     const auto fine = base + std::chrono::microseconds(1500);
                     require(c::truncate_to_millis(fine) == base + std::chrono::milliseconds(1),
                             "sub-millisecond precision should be dropped");
                     require(c::epoch_millis(base) == 1768469400000LL, "epoch millis");
                   }});

  tests.push_back({"common_fs_helpers", [] {
                     require(c::trim("  a b \n") == "a b", "trim");
                     require(c::starts_with("session_1", "session_"), "starts_with");
                     require(c::to_lower("MiXeD") == "mixed", "to_lower");

                     t::TempWorkspace ws;
                     const auto path = ws.path() / "nested" / "file.json";
                     require(c::ensure_dir(path.parent_path()).ok(), "ensure_dir");
                     require(c::write_file_atomic(path, "payload").ok(), "write");
                     require(!std::filesystem::exists(path.string() + ".tmp"),
                             "temp file should be renamed away");

                     const auto read = c::read_file(path);
                     require(read.ok() && read.value() == "payload", "read back");
                     const auto missing = c::read_file(ws.path() / "absent");
                     require(missing.code() == c::ErrorCode::NotFound, "missing file code");
                   }});

  tests.push_back({"common_expand_path_uses_home", [] {
                     t::EnvGuard home("HOME", std::string("/tmp/conductor-home"));
                     require(c::expand_path("~/sessions.json") ==
                                 "/tmp/conductor-home/sessions.json",
                             "tilde should expand");
                     require(c::expand_path("/abs/path") == "/abs/path",
                             "absolute paths untouched");
                   }});
}
