#pragma once

#include "cmd.h"
#include "cmd_common.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace CLI { class App; }

namespace kiln {

// Completion Signal Protocol for a build that ran elsewhere.
class cmd_signal : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_signal> {
    std::optional<std::filesystem::path> log_path;
    std::optional<int> exit_code;  // absent: the build never reported, signal FAILED
    std::string physical_resource_id;
    correlation_options correlation;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_signal(cfg cfg);

  // False when delivery was attempted and failed.
  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace kiln
