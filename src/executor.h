#pragma once

#include "build_job.h"
#include "target.h"
#include "util.h"

#include <string>
#include <string_view>

namespace kiln {

enum class build_status { pending, running, succeeded, failed };

inline std::string_view build_status_name(build_status status) {
  switch (status) {
    case build_status::pending: return "PENDING";
    case build_status::running: return "RUNNING";
    case build_status::succeeded: return "SUCCEEDED";
    case build_status::failed: return "FAILED";
  }
  return "UNKNOWN";
}

// Something that runs build jobs: a hosted build service, or the local machine.
class executor_backend {
 public:
  virtual ~executor_backend() = default;

  virtual std::string_view name() const = 0;
  virtual bool supports(target_os os, target_arch arch) const = 0;

  virtual void register_job(build_job_definition const &def) = 0;
  virtual bool has_job(std::string const &job_name) const = 0;

  // Starts one invocation; `overrides` replace same-named job environment variables.
  // Returns the invocation id.
  virtual std::string start_build(std::string const &job_name,
                                  env_list_t const &overrides) = 0;

  virtual build_status query_status(std::string const &invocation_id) const = 0;
  virtual std::string read_log(std::string const &invocation_id) const = 0;

  virtual void attach_failure_notification(std::string const &job_name,
                                           std::string const &target) = 0;
};

}  // namespace kiln
