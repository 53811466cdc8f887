#include "aws_util.h"
#include "cli.h"
#include "tui.h"

#include <cstdlib>
#include <exception>
#include <variant>

int main(int argc, char **argv) {
  kiln::tui::init();

  auto args{ kiln::cli_parse(argc, argv) };
  kiln::tui::configure_trace_outputs(args.trace_outputs);
  kiln::tui::scope tui_scope{ args.verbosity, args.decorated_logging };

  kiln::aws_shutdown_guard aws_guard;

  if (!args.cli_output.empty()) {
    if (!args.cmd_cfg.has_value()) {
      kiln::tui::error("%s", args.cli_output.c_str());
      return EXIT_FAILURE;
    }
    kiln::tui::info("%s", args.cli_output.c_str());
  }

  if (!args.cmd_cfg.has_value()) { return EXIT_FAILURE; }

  auto cmd{ std::visit([](auto const &cfg) { return kiln::cmd::create(cfg); },
                       *args.cmd_cfg) };

  bool ok{ false };
  try {
    ok = cmd->execute();
  } catch (std::exception const &ex) {
    kiln::tui::error("Execution failed: %s", ex.what());
    return EXIT_FAILURE;
  }

  return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
