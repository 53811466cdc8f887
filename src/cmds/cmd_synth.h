#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <optional>

namespace CLI { class App; }

namespace kiln {

// Binds the manifest's builder without running it and writes what a hosted executor needs:
// buildspec.json, Dockerfile, recipe-version, provisioning.json and, when a rebuild interval
// is set, schedule.json.
class cmd_synth : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_synth> {
    std::optional<std::filesystem::path> manifest_path;
    std::filesystem::path out_dir{ "kiln.out" };
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_synth(cfg cfg);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace kiln
