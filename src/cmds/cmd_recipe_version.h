#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>
#include <optional>

namespace CLI { class App; }

namespace kiln {

class cmd_recipe_version : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_recipe_version> {
    std::optional<std::filesystem::path> manifest_path;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_recipe_version(cfg cfg);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace kiln
