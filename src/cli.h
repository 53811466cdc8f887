#pragma once

#include "cmds/cmd_build.h"
#include "cmds/cmd_recipe_version.h"
#include "cmds/cmd_signal.h"
#include "cmds/cmd_synth.h"
#include "cmds/cmd_version.h"
#include "tui.h"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace kiln {

struct cli_args {
  using cmd_cfg_t = std::variant<cmd_build::cfg,
                                 cmd_recipe_version::cfg,
                                 cmd_signal::cfg,
                                 cmd_synth::cfg,
                                 cmd_version::cfg>;

  std::optional<cmd_cfg_t> cmd_cfg;
  std::optional<tui::level> verbosity;
  bool decorated_logging{ false };
  std::vector<tui::trace_output_spec> trace_outputs;
  std::string cli_output;
};

cli_args cli_parse(int argc, char **argv);

}  // namespace kiln
