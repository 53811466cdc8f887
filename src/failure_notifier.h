#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace kiln {

class build_trigger;

struct notifier_report {
  std::vector<std::string> attached;  // job names
  std::size_t skipped{ 0 };           // builders without a job
};

// Attaches `target` to the failure notifications of every trigger passed in. A trigger
// with no job yet (never bound) gets a warning, not an exception.
notifier_report failure_notifier_attach(std::vector<build_trigger *> const &triggers,
                                        std::string const &target);

}  // namespace kiln
