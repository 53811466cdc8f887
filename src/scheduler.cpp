#include "scheduler.h"

#include "build_trigger.h"
#include "errors.h"
#include "json_util.h"
#include "trace.h"
#include "tui.h"
#include "util.h"

#include <utility>

namespace kiln {

std::string schedule_rate_expression(std::chrono::seconds interval) {
  auto const seconds{ interval.count() };
  if (seconds < 60) {
    throw configuration_error("Rebuild interval must be at least one minute (got " +
                              std::to_string(seconds) + "s)");
  }
  if (seconds % 60 != 0) {
    throw configuration_error("Rebuild interval must be a whole number of minutes (got " +
                              std::to_string(seconds) + "s)");
  }

  auto const minutes{ seconds / 60 };
  auto const render = [](long long count, char const *unit) {
    std::string out{ "rate(" + std::to_string(count) + " " + unit };
    if (count != 1) { out.push_back('s'); }
    out.push_back(')');
    return out;
  };

  if (minutes % (60 * 24) == 0) { return render(minutes / (60 * 24), "day"); }
  if (minutes % 60 == 0) { return render(minutes / 60, "hour"); }
  return render(minutes, "minute");
}

std::optional<schedule_rule> rebuild_schedule_arm(build_trigger &trigger,
                                                  schedule_backend &backend) {
  auto const &cfg{ trigger.config() };
  if (cfg.rebuild_interval.count() == 0) {
    tui::debug("Builder %s: rebuild interval is zero, manual rebuilds only",
               cfg.name.c_str());
    return std::nullopt;
  }

  auto expression{ schedule_rate_expression(cfg.rebuild_interval) };
  auto const &bound{ trigger.bind() };

  schedule_rule rule{
    .name = bound.job_name + "-rebuild",
    .description = "Rebuild image for " + trigger.registry().name(),
    .expression = std::move(expression),
    .target_job = bound.job_name,
  };
  backend.create_rule(rule);

  KILN_TRACE_SCHEDULE_ARMED(rule.target_job, rule.expression);
  tui::info("Builder %s: scheduled rebuild %s", cfg.name.c_str(), rule.expression.c_str());
  return rule;
}

file_schedule_backend::file_schedule_backend(std::filesystem::path path)
    : path_{ std::move(path) } {}

void file_schedule_backend::create_rule(schedule_rule const &rule) {
  rules_.push_back(rule);
  flush();
}

void file_schedule_backend::flush() const {
  std::string out{ "[" };
  for (std::size_t i{ 0 }; i < rules_.size(); ++i) {
    auto const &rule{ rules_[i] };
    out.append(i == 0 ? "\n" : ",\n");
    out.append("  {\"name\": " + json_quote(rule.name));
    out.append(", \"description\": " + json_quote(rule.description));
    out.append(", \"schedule\": " + json_quote(rule.expression));
    out.append(", \"target\": " + json_quote(rule.target_job) + "}");
  }
  out.append(rules_.empty() ? "]\n" : "\n]\n");
  util_write_file(path_, out);
}

}  // namespace kiln
