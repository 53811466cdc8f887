#include "cmd_signal.h"

#include "completion_signal.h"
#include "tui.h"

#include "CLI11.hpp"

#include <memory>

namespace kiln {

void cmd_signal::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("signal", "Send the build completion signal") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("--log", cfg_ptr->log_path, "Build log whose tail becomes the reason");
  sub->add_option("--exit-code", cfg_ptr->exit_code, "Exit code of the build phase");
  sub->add_option("--physical-resource-id",
                  cfg_ptr->physical_resource_id,
                  "Physical resource id (the repository ARN)")
      ->required();
  add_correlation_options(*sub, cfg_ptr->correlation);
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_signal::cmd_signal(cmd_signal::cfg cfg) : cfg_{ std::move(cfg) } {}

bool cmd_signal::execute() {
  auto const outcome{ completion_signal_run(
      signal_inputs{
          .correlation = resolve_correlation(cfg_.correlation),
          .physical_resource_id = cfg_.physical_resource_id,
          .build_exit_code = cfg_.exit_code,
          .log_path = cfg_.log_path.value_or(std::filesystem::path{}),
          .post_process = {},
      },
      signal_http_transport()) };

  tui::print_stdout("%s\n", std::string(signal_status_name(outcome.signal.status)).c_str());
  return !outcome.delivery_attempted || outcome.delivered;
}

}  // namespace kiln
