#include "tui.h"

#include "doctest.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

TEST_CASE("tui init can only run once") {
  CHECK_THROWS_AS(kiln::tui::init(), std::logic_error);
}

TEST_CASE("tui enforces run/shutdown sequencing") {
  auto const handler{ [](std::string_view) {} };
  CHECK_NOTHROW(kiln::tui::set_output_handler(handler));
  CHECK_NOTHROW(kiln::tui::run(kiln::tui::level::TUI_INFO));
  CHECK_NOTHROW(kiln::tui::shutdown());

  CHECK_NOTHROW(kiln::tui::run(std::nullopt));
  CHECK_THROWS_AS(kiln::tui::set_output_handler(handler), std::logic_error);
  CHECK_THROWS_AS(kiln::tui::run(std::nullopt), std::logic_error);
  CHECK_THROWS_AS(kiln::tui::configure_trace_outputs({}), std::logic_error);

  CHECK_NOTHROW(kiln::tui::shutdown());
  CHECK_THROWS_AS(kiln::tui::shutdown(), std::logic_error);

  CHECK_NOTHROW(kiln::tui::set_output_handler(handler));
}

namespace {

struct captured_output {
  std::vector<std::string> messages;

  captured_output() {
    kiln::tui::set_output_handler(
        [this](std::string_view value) { messages.emplace_back(value); });
  }

  ~captured_output() {
    try {
      kiln::tui::set_output_handler([](std::string_view) {});
    } catch (std::logic_error const &error) {
      FAIL("set_output_handler should not throw during teardown: " << error.what());
    }
  }
};

std::vector<std::string> read_lines(std::filesystem::path const &path) {
  std::ifstream file{ path };
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(file, line)) {
    if (!line.empty()) { lines.push_back(line); }
  }
  return lines;
}

}  // namespace

TEST_CASE_FIXTURE(captured_output, "tui unstructured logs are raw messages") {
  REQUIRE(messages.empty());

  CHECK_NOTHROW(kiln::tui::run(std::nullopt));

  kiln::tui::debug("hello %s", "world");
  kiln::tui::info("staged %d assets", 3);
  kiln::tui::warn("post-processing exited %d", 9);
  kiln::tui::error("boom");

  CHECK_NOTHROW(kiln::tui::shutdown());

  REQUIRE(messages.size() == 4);
  CHECK(messages[0] == "hello world\n");
  CHECK(messages[1] == "staged 3 assets\n");
  CHECK(messages[2] == "post-processing exited 9\n");
  CHECK(messages[3] == "boom\n");
}

TEST_CASE_FIXTURE(captured_output, "tui structured logs include prefix") {
  CHECK_NOTHROW(kiln::tui::run(kiln::tui::level::TUI_DEBUG, true));
  kiln::tui::info("structured %d", 7);
  CHECK_NOTHROW(kiln::tui::shutdown());

  REQUIRE(messages.size() == 1);
  auto const &line{ messages[0] };
  CHECK(line.starts_with("["));
  CHECK(line.find("] [INF] ") != std::string::npos);
  CHECK(line.ends_with("structured 7\n"));
}

TEST_CASE_FIXTURE(captured_output, "tui severity filtering honors threshold") {
  CHECK_NOTHROW(kiln::tui::run(kiln::tui::level::TUI_WARN, true));
  kiln::tui::debug("debug");
  kiln::tui::info("info");
  kiln::tui::warn("warn");
  kiln::tui::error("error");
  CHECK_NOTHROW(kiln::tui::shutdown());

  REQUIRE(messages.size() == 2);
  CHECK(messages[0].find("WRN") != std::string::npos);
  CHECK(messages[0].find("warn") != std::string::npos);
  CHECK(messages[1].find("ERR") != std::string::npos);
  CHECK(messages[1].find("error") != std::string::npos);

  messages.clear();
  CHECK_NOTHROW(kiln::tui::run(kiln::tui::level::TUI_INFO, true));
  kiln::tui::debug("debug");
  kiln::tui::info("info");
  CHECK_NOTHROW(kiln::tui::shutdown());
  REQUIRE(messages.size() == 1);
  CHECK(messages[0].find("INF") != std::string::npos);
}

TEST_CASE_FIXTURE(captured_output, "tui trace events reach handler") {
  kiln::tui::configure_trace_outputs(
      { { kiln::tui::trace_output_type::std_err, std::nullopt } });
  CHECK(kiln::tui::g_trace_enabled);
  CHECK_NOTHROW(kiln::tui::run(kiln::tui::level::TUI_DEBUG, false));

  kiln::tui::trace(kiln::trace_events::recipe_versioned{
      .platform = "linux-ubuntu/x86_64",
      .components = 3,
      .version = "0123456789abcdef",
  });

  CHECK_NOTHROW(kiln::tui::shutdown());
  REQUIRE(messages.size() == 1);
  CHECK(messages[0] ==
        "recipe_versioned platform=linux-ubuntu/x86_64 components=3 "
        "version=0123456789abcdef\n");

  kiln::tui::configure_trace_outputs({});
  CHECK_FALSE(kiln::tui::g_trace_enabled);
}

TEST_CASE_FIXTURE(captured_output, "tui trace events bypass the level threshold") {
  kiln::tui::configure_trace_outputs(
      { { kiln::tui::trace_output_type::std_err, std::nullopt } });
  CHECK_NOTHROW(kiln::tui::run(kiln::tui::level::TUI_ERROR, true));

  kiln::tui::info("filtered");
  KILN_TRACE_SCHEDULE_ARMED("python", "rate(7 days)");

  CHECK_NOTHROW(kiln::tui::shutdown());
  REQUIRE(messages.size() == 1);
  CHECK(messages[0].find("] [TRC] schedule_armed job=python") != std::string::npos);

  kiln::tui::configure_trace_outputs({});
}

TEST_CASE_FIXTURE(captured_output, "trace macros are inert while tracing is off") {
  kiln::tui::configure_trace_outputs({});
  CHECK_NOTHROW(kiln::tui::run(kiln::tui::level::TUI_DEBUG, false));
  KILN_TRACE_SCHEDULE_ARMED("python", "rate(7 days)");
  CHECK_NOTHROW(kiln::tui::shutdown());
  CHECK(messages.empty());
}

TEST_CASE("trace_event_to_json fields") {
  kiln::trace_event_t const phase{ kiln::trace_events::build_phase_complete{
      .invocation = "python:ab12",
      .phase = "build",
      .exit_code = 4,
      .duration_ms = 1500,
  } };
  auto const json{ kiln::trace_event_to_json(phase) };
  CHECK(json.starts_with("{\"ts\":\""));
  CHECK(json.ends_with("}"));
  CHECK(json.find("\"event\":\"build_phase_complete\"") != std::string::npos);
  CHECK(json.find("\"invocation\":\"python:ab12\"") != std::string::npos);
  CHECK(json.find("\"exit_code\":4") != std::string::npos);
  CHECK(json.find("\"duration_ms\":1500") != std::string::npos);

  kiln::trace_event_t const delivered{ kiln::trace_events::signal_delivered{
      .physical_resource_id = "arn:aws:ecr:repo/\"demo\"",
      .status = "SUCCESS",
      .ok = false,
  } };
  auto const escaped{ kiln::trace_event_to_json(delivered) };
  CHECK(escaped.find("\"physical_resource_id\":\"arn:aws:ecr:repo/\\\"demo\\\"\"") !=
        std::string::npos);
  CHECK(escaped.find("\"ok\":false") != std::string::npos);
}

TEST_CASE("trace_event_name and trace_event_to_string") {
  kiln::trace_event_t const armed{ kiln::trace_events::schedule_armed{
      .job = "python", .expression = "rate(7 days)" } };
  CHECK(kiln::trace_event_name(armed) == "schedule_armed");
  CHECK(kiln::trace_event_to_string(armed) ==
        "schedule_armed job=python expression=rate(7 days)");

  kiln::trace_event_t const triggered{ kiln::trace_events::build_triggered{
      .job = "python", .invocation = "python:1", .correlated = true } };
  CHECK(kiln::trace_event_to_string(triggered) ==
        "build_triggered job=python invocation=python:1 correlated=true");
}

TEST_CASE("trace file output writes JSONL format") {
  auto const trace_path{ std::filesystem::temp_directory_path() /
                         "kiln_test_trace.jsonl" };
  std::error_code ec;
  std::filesystem::remove(trace_path, ec);

  kiln::tui::configure_trace_outputs(
      { { kiln::tui::trace_output_type::file, trace_path } });
  CHECK(kiln::tui::g_trace_enabled);
  CHECK_NOTHROW(kiln::tui::run(kiln::tui::level::TUI_DEBUG, false));

  KILN_TRACE_JOB_SYNTHESIZED("python", "0123456789abcdef", 5);
  KILN_TRACE_NOTIFIER_ATTACHED("python", "arn:aws:sns:us-east-1:1:alerts");

  CHECK_NOTHROW(kiln::tui::shutdown());

  auto const lines{ read_lines(trace_path) };
  REQUIRE(lines.size() == 2);
  for (auto const &line : lines) {
    CHECK(line.find("\"ts\":") != std::string::npos);
    CHECK(line.front() == '{');
    CHECK(line.back() == '}');
  }
  CHECK(lines[0].find("\"event\":\"job_synthesized\"") != std::string::npos);
  CHECK(lines[0].find("\"build_commands\":5") != std::string::npos);
  CHECK(lines[1].find("\"event\":\"notifier_attached\"") != std::string::npos);
  CHECK(lines[1].find("\"target\":\"arn:aws:sns:us-east-1:1:alerts\"") !=
        std::string::npos);

  std::filesystem::remove(trace_path, ec);
  kiln::tui::configure_trace_outputs({});
}

TEST_CASE("configure_trace_outputs rejects multiple file outputs") {
  auto const path1{ std::filesystem::temp_directory_path() / "kiln_trace1.jsonl" };
  auto const path2{ std::filesystem::temp_directory_path() / "kiln_trace2.jsonl" };

  CHECK_THROWS_AS(kiln::tui::configure_trace_outputs(
                      { { kiln::tui::trace_output_type::file, path1 },
                        { kiln::tui::trace_output_type::file, path2 } }),
                  std::logic_error);

  kiln::tui::configure_trace_outputs({});
  std::error_code ec;
  std::filesystem::remove(path1, ec);
}
