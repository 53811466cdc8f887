#include "failure_notifier.h"

#include "build_trigger.h"
#include "trace.h"
#include "tui.h"

#include <stdexcept>

namespace kiln {

notifier_report failure_notifier_attach(std::vector<build_trigger *> const &triggers,
                                        std::string const &target) {
  if (target.empty()) {
    throw std::invalid_argument("failure_notifier_attach: target is empty");
  }

  notifier_report report;
  for (auto *trigger : triggers) {
    if (!trigger) { continue; }

    auto const job{ trigger->job_name() };
    if (!job || !trigger->backend().has_job(*job)) {
      tui::warn("Unused builder %s cannot get notifications of failed builds",
                trigger->config().name.c_str());
      ++report.skipped;
      continue;
    }

    trigger->backend().attach_failure_notification(*job, target);
    KILN_TRACE_NOTIFIER_ATTACHED(*job, target);
    report.attached.push_back(*job);
  }
  return report;
}

}  // namespace kiln
