#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace kiln {

namespace trace_events {

struct recipe_versioned {
  std::string platform;
  std::int64_t components;
  std::string version;
};

struct component_assembled {
  std::int64_t index;
  std::string component;
  std::int64_t assets;
  std::int64_t commands;
  std::int64_t directives;
};

struct asset_staged {
  std::string component;
  std::string name;
  std::string uri;
};

struct job_synthesized {
  std::string job;
  std::string recipe_version;
  std::int64_t build_commands;
};

struct build_triggered {
  std::string job;
  std::string invocation;
  bool correlated;  // part of a provisioning transaction
};

struct build_phase_complete {
  std::string invocation;
  std::string phase;
  std::int64_t exit_code;
  std::int64_t duration_ms;
};

struct signal_delivered {
  std::string physical_resource_id;
  std::string status;
  bool ok;
};

struct signal_skipped {
  std::string physical_resource_id;
  std::string status;
};

struct schedule_armed {
  std::string job;
  std::string expression;
};

struct notifier_attached {
  std::string job;
  std::string target;
};

}  // namespace trace_events

using trace_event_t = std::variant<trace_events::recipe_versioned,
                                   trace_events::component_assembled,
                                   trace_events::asset_staged,
                                   trace_events::job_synthesized,
                                   trace_events::build_triggered,
                                   trace_events::build_phase_complete,
                                   trace_events::signal_delivered,
                                   trace_events::signal_skipped,
                                   trace_events::schedule_armed,
                                   trace_events::notifier_attached>;

std::string_view trace_event_name(trace_event_t const &event);
std::string trace_event_to_string(trace_event_t const &event);
std::string trace_event_to_json(trace_event_t const &event);

namespace tui {
extern bool g_trace_enabled;
void trace(trace_event_t event);

inline bool trace_enabled() { return g_trace_enabled; }
}  // namespace tui

}  // namespace kiln

#define KILN_TRACE_UNLIKELY [[unlikely]]

#define KILN_TRACE_EMIT(event_expr) \
  do { \
    if (::kiln::tui::g_trace_enabled) KILN_TRACE_UNLIKELY { \
        ::kiln::tui::trace event_expr; \
      } \
  } while (0)

#define KILN_TRACE_RECIPE_VERSIONED(platform_value, components_value, version_value) \
  KILN_TRACE_EMIT((::kiln::trace_events::recipe_versioned{ \
      .platform = (platform_value), \
      .components = (components_value), \
      .version = (version_value), \
  }))

#define KILN_TRACE_COMPONENT_ASSEMBLED(index_value, \
                                       component_value, \
                                       assets_value, \
                                       commands_value, \
                                       directives_value) \
  KILN_TRACE_EMIT((::kiln::trace_events::component_assembled{ \
      .index = (index_value), \
      .component = (component_value), \
      .assets = (assets_value), \
      .commands = (commands_value), \
      .directives = (directives_value), \
  }))

#define KILN_TRACE_ASSET_STAGED(component_value, name_value, uri_value) \
  KILN_TRACE_EMIT((::kiln::trace_events::asset_staged{ \
      .component = (component_value), \
      .name = (name_value), \
      .uri = (uri_value), \
  }))

#define KILN_TRACE_JOB_SYNTHESIZED(job_value, version_value, commands_value) \
  KILN_TRACE_EMIT((::kiln::trace_events::job_synthesized{ \
      .job = (job_value), \
      .recipe_version = (version_value), \
      .build_commands = (commands_value), \
  }))

#define KILN_TRACE_BUILD_TRIGGERED(job_value, invocation_value, correlated_value) \
  KILN_TRACE_EMIT((::kiln::trace_events::build_triggered{ \
      .job = (job_value), \
      .invocation = (invocation_value), \
      .correlated = (correlated_value), \
  }))

#define KILN_TRACE_BUILD_PHASE_COMPLETE(invocation_value, \
                                        phase_value, \
                                        exit_code_value, \
                                        duration_value) \
  KILN_TRACE_EMIT((::kiln::trace_events::build_phase_complete{ \
      .invocation = (invocation_value), \
      .phase = (phase_value), \
      .exit_code = (exit_code_value), \
      .duration_ms = (duration_value), \
  }))

#define KILN_TRACE_SIGNAL_DELIVERED(physical_value, status_value, ok_value) \
  KILN_TRACE_EMIT((::kiln::trace_events::signal_delivered{ \
      .physical_resource_id = (physical_value), \
      .status = (status_value), \
      .ok = (ok_value), \
  }))

#define KILN_TRACE_SIGNAL_SKIPPED(physical_value, status_value) \
  KILN_TRACE_EMIT((::kiln::trace_events::signal_skipped{ \
      .physical_resource_id = (physical_value), \
      .status = (status_value), \
  }))

#define KILN_TRACE_SCHEDULE_ARMED(job_value, expression_value) \
  KILN_TRACE_EMIT((::kiln::trace_events::schedule_armed{ \
      .job = (job_value), \
      .expression = (expression_value), \
  }))

#define KILN_TRACE_NOTIFIER_ATTACHED(job_value, target_value) \
  KILN_TRACE_EMIT((::kiln::trace_events::notifier_attached{ \
      .job = (job_value), \
      .target = (target_value), \
  }))
