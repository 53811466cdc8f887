#pragma once

#include "cmd.h"
#include "cmd_common.h"

#include <filesystem>
#include <functional>
#include <optional>

namespace CLI { class App; }

namespace kiln {

class cmd_build : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_build> {
    std::optional<std::filesystem::path> manifest_path;
    std::filesystem::path work_dir{ "kiln.work" };
    bool skip_pre_build{ false };
    bool skip_post_processing{ false };
    correlation_options correlation;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_build(cfg cfg);

  // False when the build ran and failed.
  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace kiln
