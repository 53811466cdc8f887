#include "cmd_build.h"

#include "asset_stager.h"
#include "build_trigger.h"
#include "failure_notifier.h"
#include "local_executor.h"
#include "manifest.h"
#include "registry.h"
#include "tui.h"

#include "CLI11.hpp"

#include <memory>
#include <string>

namespace kiln {

void cmd_build::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("build", "Run the image build on this machine") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("--manifest", cfg_ptr->manifest_path, "Path to kiln.lua manifest");
  sub->add_option("--work-dir", cfg_ptr->work_dir, "Invocation workspace root")
      ->capture_default_str();
  sub->add_flag("--skip-pre-build",
                cfg_ptr->skip_pre_build,
                "Skip the pre_build phase (registry login)");
  sub->add_flag("--skip-post-processing",
                cfg_ptr->skip_post_processing,
                "Skip post-processing after the completion signal");
  add_correlation_options(*sub, cfg_ptr->correlation);
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_build::cmd_build(cmd_build::cfg cfg) : cfg_{ std::move(cfg) } {}

bool cmd_build::execute() {
  auto const m{ load_manifest_or_throw(cfg_.manifest_path) };
  auto const work_dir{ std::filesystem::absolute(cfg_.work_dir) };

  auto stager{ make_asset_stager(m->builder, work_dir / "assets") };
  static_registry registry{ m->builder.repository };
  local_executor executor{ local_executor_options{
      .work_dir = work_dir,
      .run_pre_build = !cfg_.skip_pre_build,
      .run_post_processing = !cfg_.skip_post_processing,
      .transport = {},
  } };

  build_trigger trigger{ m->builder, m->components(), *stager, registry, executor };
  trigger.bind();

  if (m->builder.failure_target) {
    failure_notifier_attach({ &trigger }, *m->builder.failure_target);
  }

  auto const id{ trigger.trigger_now(resolve_correlation(cfg_.correlation)) };
  auto const status{ trigger.status(id) };
  auto const &outcome{ executor.signal(id) };

  if (outcome.delivery_attempted && !outcome.delivered) {
    tui::warn("Completion signal was not delivered: %s", outcome.delivery_error.c_str());
  }

  tui::print_stdout("%s %s\n", id.c_str(), std::string(build_status_name(status)).c_str());
  tui::info("Build log: %s", (executor.invocation_dir(id) / "build.log").string().c_str());
  return status == build_status::succeeded;
}

}  // namespace kiln
