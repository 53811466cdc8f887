#include "cmd_recipe_version.h"

#include "build_trigger.h"
#include "cmd_common.h"
#include "manifest.h"
#include "tui.h"

#include "CLI11.hpp"

#include <memory>

namespace kiln {

void cmd_recipe_version::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("recipe-version", "Print the recipe version token") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("--manifest", cfg_ptr->manifest_path, "Path to kiln.lua manifest");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_recipe_version::cmd_recipe_version(cmd_recipe_version::cfg cfg)
    : cfg_{ std::move(cfg) } {}

bool cmd_recipe_version::execute() {
  auto const m{ load_manifest_or_throw(cfg_.manifest_path) };
  auto const r{ build_trigger_recipe(m->builder, m->components()) };
  tui::print_stdout("%s\n", r.version().c_str());
  return true;
}

}  // namespace kiln
