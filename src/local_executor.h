#pragma once

#include "build_job.h"
#include "completion_signal.h"
#include "executor.h"
#include "util.h"

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kiln {

struct local_executor_options {
  std::filesystem::path work_dir;
  bool run_pre_build{ true };
  bool run_post_processing{ true };
  signal_transport_t transport;  // empty: signal_http_transport()
  std::optional<std::chrono::milliseconds> build_timeout;  // overrides the job's timeout
};

// Runs build jobs on this machine. start_build blocks until the invocation has signaled.
class local_executor : public executor_backend, unmovable {
 public:
  explicit local_executor(local_executor_options opts);

  std::string_view name() const override { return "local"; }
  bool supports(target_os os, target_arch arch) const override;

  void register_job(build_job_definition const &def) override;
  bool has_job(std::string const &job_name) const override;

  std::string start_build(std::string const &job_name, env_list_t const &overrides) override;

  build_status query_status(std::string const &invocation_id) const override;
  std::string read_log(std::string const &invocation_id) const override;

  void attach_failure_notification(std::string const &job_name,
                                   std::string const &target) override;

  std::vector<std::string> const &failure_targets(std::string const &job_name) const;
  signal_outcome const &signal(std::string const &invocation_id) const;
  std::filesystem::path invocation_dir(std::string const &invocation_id) const;

 private:
  struct invocation_record {
    std::string job;
    std::filesystem::path dir;
    build_status status{ build_status::pending };
    signal_outcome signal;
  };

  invocation_record const &find(std::string const &invocation_id) const;
  void notify_failure(std::string const &invocation_id, std::string const &job_name) const;

  local_executor_options opts_;
  std::map<std::string, build_job_definition> jobs_;
  std::map<std::string, std::vector<std::string>> failure_targets_;
  std::map<std::string, invocation_record> invocations_;
};

}  // namespace kiln
