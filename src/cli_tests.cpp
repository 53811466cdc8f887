#include "cli.h"

#include "doctest.h"

#include <filesystem>
#include <string>
#include <variant>
#include <vector>

namespace {

// Helper to convert vector of strings to argc/argv
std::vector<char *> make_argv(std::vector<std::string> &args) {
  std::vector<char *> argv;
  for (auto &arg : args) { argv.push_back(arg.data()); }
  argv.push_back(nullptr);
  return argv;
}

kiln::cli_args parse(std::vector<std::string> args) {
  auto argv{ make_argv(args) };
  return kiln::cli_parse(static_cast<int>(args.size()), argv.data());
}

}  // anonymous namespace

TEST_CASE("cli_parse: no arguments") {
  auto const parsed{ parse({ "kiln" }) };

  // With no arguments, help text returned and no command configuration.
  CHECK_FALSE(parsed.cmd_cfg.has_value());
  CHECK(parsed.cli_output.find("recipe-version") != std::string::npos);
}

TEST_CASE("cli_parse: cmd_version") {
  SUBCASE("subcommand") {
    auto const parsed{ parse({ "kiln", "version" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    CHECK(std::holds_alternative<kiln::cmd_version::cfg>(*parsed.cmd_cfg));
  }

  SUBCASE("-v flag") {
    auto const parsed{ parse({ "kiln", "-v" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    CHECK(std::holds_alternative<kiln::cmd_version::cfg>(*parsed.cmd_cfg));
  }

  SUBCASE("--version flag") {
    auto const parsed{ parse({ "kiln", "--version" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    CHECK(std::holds_alternative<kiln::cmd_version::cfg>(*parsed.cmd_cfg));
  }
}

TEST_CASE("cli_parse: cmd_recipe_version") {
  SUBCASE("discovers the manifest by default") {
    auto const parsed{ parse({ "kiln", "recipe-version" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    auto const *cfg{ std::get_if<kiln::cmd_recipe_version::cfg>(&*parsed.cmd_cfg) };
    REQUIRE(cfg != nullptr);
    CHECK_FALSE(cfg->manifest_path.has_value());
  }

  SUBCASE("explicit manifest") {
    auto const parsed{ parse({ "kiln", "recipe-version", "--manifest", "/work/kiln.lua" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    auto const *cfg{ std::get_if<kiln::cmd_recipe_version::cfg>(&*parsed.cmd_cfg) };
    REQUIRE(cfg != nullptr);
    CHECK(cfg->manifest_path == std::filesystem::path("/work/kiln.lua"));
  }
}

TEST_CASE("cli_parse: cmd_synth") {
  SUBCASE("defaults") {
    auto const parsed{ parse({ "kiln", "synth" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    auto const *cfg{ std::get_if<kiln::cmd_synth::cfg>(&*parsed.cmd_cfg) };
    REQUIRE(cfg != nullptr);
    CHECK(cfg->out_dir == std::filesystem::path("kiln.out"));
  }

  SUBCASE("manifest and output directory") {
    auto const parsed{
      parse({ "kiln", "synth", "--manifest", "builders/kiln.lua", "--out", "/tmp/out" })
    };
    REQUIRE(parsed.cmd_cfg.has_value());
    auto const *cfg{ std::get_if<kiln::cmd_synth::cfg>(&*parsed.cmd_cfg) };
    REQUIRE(cfg != nullptr);
    CHECK(cfg->manifest_path == std::filesystem::path("builders/kiln.lua"));
    CHECK(cfg->out_dir == std::filesystem::path("/tmp/out"));
  }
}

TEST_CASE("cli_parse: cmd_build") {
  auto const parsed{ parse({ "kiln",
                             "build",
                             "--work-dir",
                             "/tmp/work",
                             "--skip-pre-build",
                             "--request-id",
                             "req-1",
                             "--response-url",
                             "https://signal.example.com/r" }) };
  REQUIRE(parsed.cmd_cfg.has_value());
  auto const *cfg{ std::get_if<kiln::cmd_build::cfg>(&*parsed.cmd_cfg) };
  REQUIRE(cfg != nullptr);
  CHECK(cfg->work_dir == std::filesystem::path("/tmp/work"));
  CHECK(cfg->skip_pre_build);
  CHECK_FALSE(cfg->skip_post_processing);
  CHECK(cfg->correlation.request_id == "req-1");
  CHECK(cfg->correlation.response_url == "https://signal.example.com/r");
  CHECK_FALSE(cfg->correlation.stack_id.has_value());
}

TEST_CASE("cli_parse: cmd_signal") {
  SUBCASE("all options") {
    auto const parsed{ parse({ "kiln",
                               "signal",
                               "--log",
                               "/tmp/codebuild.log",
                               "--exit-code",
                               "2",
                               "--physical-resource-id",
                               "arn:aws:ecr:repo/demo",
                               "--stack-id",
                               "stack-1" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    auto const *cfg{ std::get_if<kiln::cmd_signal::cfg>(&*parsed.cmd_cfg) };
    REQUIRE(cfg != nullptr);
    CHECK(cfg->log_path == std::filesystem::path("/tmp/codebuild.log"));
    CHECK(cfg->exit_code == 2);
    CHECK(cfg->physical_resource_id == "arn:aws:ecr:repo/demo");
    CHECK(cfg->correlation.stack_id == "stack-1");
  }

  SUBCASE("physical resource id is required") {
    auto const parsed{ parse({ "kiln", "signal", "--exit-code", "0" }) };
    CHECK_FALSE(parsed.cmd_cfg.has_value());
    CHECK_FALSE(parsed.cli_output.empty());
  }
}

TEST_CASE("cli_parse: verbose flag") {
  auto const parsed{ parse({ "kiln", "--verbose", "version" }) };

  REQUIRE(parsed.cmd_cfg.has_value());
  REQUIRE(parsed.verbosity.has_value());
  CHECK(parsed.verbosity == kiln::tui::level::TUI_DEBUG);
  CHECK(parsed.decorated_logging);
}

TEST_CASE("cli_parse: default verbosity is info, undecorated") {
  auto const parsed{ parse({ "kiln", "version" }) };
  CHECK(parsed.verbosity == kiln::tui::level::TUI_INFO);
  CHECK_FALSE(parsed.decorated_logging);
  CHECK(parsed.trace_outputs.empty());
}

TEST_CASE("cli_parse: trace outputs") {
  SUBCASE("bare --trace means stderr") {
    auto const parsed{ parse({ "kiln", "--trace", "version" }) };
    REQUIRE(parsed.trace_outputs.size() == 1);
    CHECK(parsed.trace_outputs[0].type == kiln::tui::trace_output_type::std_err);
    CHECK(parsed.verbosity == kiln::tui::level::TUI_DEBUG);
  }

  SUBCASE("stderr and file") {
    auto const parsed{ parse({ "kiln", "--trace=stderr,file:/tmp/t.jsonl", "version" }) };
    REQUIRE(parsed.trace_outputs.size() == 2);
    CHECK(parsed.trace_outputs[0].type == kiln::tui::trace_output_type::std_err);
    CHECK(parsed.trace_outputs[1].type == kiln::tui::trace_output_type::file);
    CHECK(parsed.trace_outputs[1].file_path == std::filesystem::path("/tmp/t.jsonl"));
  }

  SUBCASE("invalid spec is rejected") {
    auto const parsed{ parse({ "kiln", "--trace=syslog", "version" }) };
    CHECK_FALSE(parsed.cmd_cfg.has_value());
    CHECK(parsed.cli_output == "Invalid trace output spec: syslog");
  }
}
