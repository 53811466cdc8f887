#include "cmd_synth.h"

#include "asset_stager.h"
#include "build_trigger.h"
#include "cmd_common.h"
#include "failure_notifier.h"
#include "manifest.h"
#include "registry.h"
#include "scheduler.h"
#include "tui.h"
#include "util.h"

#include "CLI11.hpp"

#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace kiln {

namespace {

// Collects job definitions for a hosted executor; nothing runs here.
class synth_backend : public executor_backend {
 public:
  std::string_view name() const override { return "synth"; }

  bool supports(target_os os, target_arch) const override { return target_os_is_linux(os); }

  void register_job(build_job_definition const &def) override { jobs_[def.name] = def; }

  bool has_job(std::string const &job_name) const override {
    return jobs_.contains(job_name);
  }

  std::string start_build(std::string const &job_name, env_list_t const &) override {
    throw std::logic_error("synth does not start builds (job " + job_name + ")");
  }

  build_status query_status(std::string const &invocation_id) const override {
    throw std::runtime_error("Unknown invocation: " + invocation_id);
  }

  std::string read_log(std::string const &invocation_id) const override {
    throw std::runtime_error("Unknown invocation: " + invocation_id);
  }

  void attach_failure_notification(std::string const &job_name,
                                   std::string const &target) override {
    if (!has_job(job_name)) { throw std::runtime_error("Unknown job: " + job_name); }
    targets_.push_back(target);
  }

  std::vector<std::string> const &targets() const { return targets_; }

 private:
  std::map<std::string, build_job_definition> jobs_;
  std::vector<std::string> targets_;
};

}  // namespace

void cmd_synth::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("synth", "Stage assets and write the build job files") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("--manifest", cfg_ptr->manifest_path, "Path to kiln.lua manifest");
  sub->add_option("--out", cfg_ptr->out_dir, "Output directory")->capture_default_str();
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_synth::cmd_synth(cmd_synth::cfg cfg) : cfg_{ std::move(cfg) } {}

bool cmd_synth::execute() {
  if (cfg_.out_dir.empty()) { throw std::runtime_error("synth: output directory is required"); }

  auto const m{ load_manifest_or_throw(cfg_.manifest_path) };
  auto const out{ std::filesystem::absolute(cfg_.out_dir) };

  auto stager{ make_asset_stager(m->builder, out / "assets") };
  static_registry registry{ m->builder.repository };
  synth_backend backend;

  build_trigger trigger{ m->builder, m->components(), *stager, registry, backend };
  auto const &bound{ trigger.bind() };

  util_write_file(out / "buildspec.json", build_job_to_buildspec_json(trigger.job()));
  util_write_file(out / "Dockerfile", trigger.assembled().dockerfile);
  util_write_file(out / "recipe-version", bound.recipe_version + "\n");
  util_write_file(out / "provisioning.json", trigger.provisioning_properties() + "\n");

  std::filesystem::path const schedule_path{ out / "schedule.json" };
  std::error_code ec;
  std::filesystem::remove(schedule_path, ec);
  file_schedule_backend schedule{ schedule_path };
  if (auto const rule{ rebuild_schedule_arm(trigger, schedule) }) {
    tui::info("Rebuild rule %s: %s", rule->name.c_str(), rule->expression.c_str());
    if (!m->builder.failure_target) {
      tui::warn("Scheduled rebuilds of %s fail silently; set FAILURE_TARGET to be notified",
                bound.job_name.c_str());
    }
  }

  if (m->builder.failure_target) {
    failure_notifier_attach({ &trigger }, *m->builder.failure_target);
  }

  tui::info("Synthesized %s (%s) into %s",
            bound.job_name.c_str(),
            bound.image_uri.c_str(),
            out.string().c_str());
  for (auto const &target : backend.targets()) {
    tui::info("Failure notifications go to %s", target.c_str());
  }
  return true;
}

}  // namespace kiln
