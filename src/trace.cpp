#include "trace.h"

#include "json_util.h"
#include "util.h"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <string>

namespace kiln {

namespace {

std::string_view bool_string(bool value) { return value ? "true" : "false"; }

std::tm make_utc_tm(std::time_t time) {
  std::tm result{};
  gmtime_r(&time, &result);
  return result;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  auto const seconds{ std::chrono::time_point_cast<std::chrono::seconds>(tp) };
  auto const millis{
    std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds).count()
  };

  std::time_t const timestamp{ std::chrono::system_clock::to_time_t(seconds) };
  std::tm const utc_tm{ make_utc_tm(timestamp) };

  char base[32]{};
  if (std::strftime(base, sizeof base, "%Y-%m-%dT%H:%M:%S", &utc_tm) == 0) { return {}; }

  char buffer[64]{};
  int const written{ std::snprintf(buffer,
                                   sizeof buffer,
                                   "%s.%03lldZ",
                                   base,
                                   static_cast<long long>(millis)) };
  if (written <= 0) { return {}; }

  return std::string{ buffer, static_cast<std::size_t>(written) };
}

void append_kv(std::string &out, char const *key, std::string_view value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":\"");
  json_escape_append(out, value);
  out.push_back('"');
}

void append_kv(std::string &out, char const *key, std::int64_t value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(std::to_string(value));
}

void append_kv(std::string &out, char const *key, bool value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(value ? "true" : "false");
}

}  // namespace

#define TRACE_NAME(type) \
  [](trace_events::type const &) -> std::string_view { return #type; }

std::string_view trace_event_name(trace_event_t const &event) {
  return std::visit(
      match{
          TRACE_NAME(recipe_versioned),
          TRACE_NAME(component_assembled),
          TRACE_NAME(asset_staged),
          TRACE_NAME(job_synthesized),
          TRACE_NAME(build_triggered),
          TRACE_NAME(build_phase_complete),
          TRACE_NAME(signal_delivered),
          TRACE_NAME(signal_skipped),
          TRACE_NAME(schedule_armed),
          TRACE_NAME(notifier_attached),
      },
      event);
}

#undef TRACE_NAME

std::string trace_event_to_string(trace_event_t const &event) {
  return std::visit(
      match{
          [](trace_events::recipe_versioned const &value) {
            std::ostringstream oss;
            oss << "recipe_versioned platform=" << value.platform
                << " components=" << value.components << " version=" << value.version;
            return oss.str();
          },
          [](trace_events::component_assembled const &value) {
            std::ostringstream oss;
            oss << "component_assembled index=" << value.index
                << " component=" << value.component << " assets=" << value.assets
                << " commands=" << value.commands << " directives=" << value.directives;
            return oss.str();
          },
          [](trace_events::asset_staged const &value) {
            std::ostringstream oss;
            oss << "asset_staged component=" << value.component << " name=" << value.name
                << " uri=" << value.uri;
            return oss.str();
          },
          [](trace_events::job_synthesized const &value) {
            std::ostringstream oss;
            oss << "job_synthesized job=" << value.job
                << " recipe_version=" << value.recipe_version
                << " build_commands=" << value.build_commands;
            return oss.str();
          },
          [](trace_events::build_triggered const &value) {
            std::ostringstream oss;
            oss << "build_triggered job=" << value.job
                << " invocation=" << value.invocation
                << " correlated=" << bool_string(value.correlated);
            return oss.str();
          },
          [](trace_events::build_phase_complete const &value) {
            std::ostringstream oss;
            oss << "build_phase_complete invocation=" << value.invocation
                << " phase=" << value.phase << " exit_code=" << value.exit_code
                << " duration_ms=" << value.duration_ms;
            return oss.str();
          },
          [](trace_events::signal_delivered const &value) {
            std::ostringstream oss;
            oss << "signal_delivered physical_resource_id=" << value.physical_resource_id
                << " status=" << value.status << " ok=" << bool_string(value.ok);
            return oss.str();
          },
          [](trace_events::signal_skipped const &value) {
            std::ostringstream oss;
            oss << "signal_skipped physical_resource_id=" << value.physical_resource_id
                << " status=" << value.status;
            return oss.str();
          },
          [](trace_events::schedule_armed const &value) {
            std::ostringstream oss;
            oss << "schedule_armed job=" << value.job
                << " expression=" << value.expression;
            return oss.str();
          },
          [](trace_events::notifier_attached const &value) {
            std::ostringstream oss;
            oss << "notifier_attached job=" << value.job << " target=" << value.target;
            return oss.str();
          },
      },
      event);
}

std::string trace_event_to_json(trace_event_t const &event) {
  std::string output;
  output.reserve(256);

  output.append("{\"ts\":\"");
  output.append(format_timestamp(std::chrono::system_clock::now()));
  output.append("\",\"event\":\"");
  output.append(trace_event_name(event));
  output.push_back('"');

  std::visit(
      match{
          [&](trace_events::recipe_versioned const &value) {
            append_kv(output, "platform", value.platform);
            append_kv(output, "components", value.components);
            append_kv(output, "version", value.version);
          },
          [&](trace_events::component_assembled const &value) {
            append_kv(output, "index", value.index);
            append_kv(output, "component", value.component);
            append_kv(output, "assets", value.assets);
            append_kv(output, "commands", value.commands);
            append_kv(output, "directives", value.directives);
          },
          [&](trace_events::asset_staged const &value) {
            append_kv(output, "component", value.component);
            append_kv(output, "name", value.name);
            append_kv(output, "uri", value.uri);
          },
          [&](trace_events::job_synthesized const &value) {
            append_kv(output, "job", value.job);
            append_kv(output, "recipe_version", value.recipe_version);
            append_kv(output, "build_commands", value.build_commands);
          },
          [&](trace_events::build_triggered const &value) {
            append_kv(output, "job", value.job);
            append_kv(output, "invocation", value.invocation);
            append_kv(output, "correlated", value.correlated);
          },
          [&](trace_events::build_phase_complete const &value) {
            append_kv(output, "invocation", value.invocation);
            append_kv(output, "phase", value.phase);
            append_kv(output, "exit_code", value.exit_code);
            append_kv(output, "duration_ms", value.duration_ms);
          },
          [&](trace_events::signal_delivered const &value) {
            append_kv(output, "physical_resource_id", value.physical_resource_id);
            append_kv(output, "status", value.status);
            append_kv(output, "ok", value.ok);
          },
          [&](trace_events::signal_skipped const &value) {
            append_kv(output, "physical_resource_id", value.physical_resource_id);
            append_kv(output, "status", value.status);
          },
          [&](trace_events::schedule_armed const &value) {
            append_kv(output, "job", value.job);
            append_kv(output, "expression", value.expression);
          },
          [&](trace_events::notifier_attached const &value) {
            append_kv(output, "job", value.job);
            append_kv(output, "target", value.target);
          },
      },
      event);

  output.push_back('}');
  return output;
}

}  // namespace kiln
