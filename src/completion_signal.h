#pragma once

#include "util.h"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kiln {

// Correlation placeholder for builds outside a provisioning transaction.
inline constexpr std::string_view kUnspecified{ "unspecified" };

// Where the build job tees its output, and the BASH_ENV script that installs the tee.
inline constexpr std::string_view kBuildLogPath{ "/tmp/codebuild.log" };
inline constexpr std::string_view kBashEnvScript{ "codebuild-log.sh" };

// Cap on the log excerpt carried in Reason, in bytes.
inline constexpr std::size_t kReasonByteLimit{ 400 };

enum class signal_status { success, failed };

std::string_view signal_status_name(signal_status status);  // "SUCCESS" / "FAILED"

struct correlation_ids {
  std::string stack_id{ kUnspecified };
  std::string request_id{ kUnspecified };
  std::string logical_resource_id{ kUnspecified };
  std::string response_url{ kUnspecified };

  bool has_endpoint() const { return response_url != kUnspecified; }
};

struct completion_signal {
  correlation_ids correlation;
  std::string physical_resource_id;
  signal_status status{ signal_status::failed };
  std::string reason;
  std::string random;  // idempotency token, fresh per invocation
};

// SUCCESS iff the build phase exited 0. No exit code (killed, timed out, never ran) is FAILED.
signal_status signal_status_from_exit_code(std::optional<int> exit_code);

// Line breaks become spaces, all other bytes outside 0x20-0x7E are removed, then only the
// last kReasonByteLimit bytes are kept.
std::string signal_sanitize_reason(std::string_view log);

// 32 lowercase hex characters
std::string signal_random_token();

std::string signal_payload_json(completion_signal const &signal);

// Delivers `body` to `url`; throws on failure.
using signal_transport_t =
    std::function<void(std::string const &url, std::string const &body)>;

// HTTP PUT through libcurl with an empty Content-Type header.
signal_transport_t signal_http_transport();

struct signal_inputs {
  correlation_ids correlation;
  std::string physical_resource_id;
  std::optional<int> build_exit_code;
  std::filesystem::path log_path;       // empty: no log captured
  std::function<void()> post_process;  // best-effort, runs after delivery
};

struct signal_outcome {
  completion_signal signal;
  bool delivery_attempted{ false };
  bool delivered{ false };
  std::string delivery_error;
};

// Builds exactly one signal and delivers it unless the endpoint is the placeholder.
// Never throws for log, delivery or post-processing failures.
signal_outcome completion_signal_run(signal_inputs const &in,
                                     signal_transport_t const &transport);

// Shell rendition of completion_signal_run for executors that run post_build remotely.
// Expects STACK_ID, REQUEST_ID, LOGICAL_RESOURCE_ID, RESPONSE_URL and REPO_ARN.
std::vector<std::string> completion_signal_shell_commands();

enum class invocation_state { started, succeeded, failed, signaled };

std::string_view invocation_state_name(invocation_state state);

// STARTED -> (SUCCEEDED | FAILED) -> SIGNALED. Signaling twice is a logic_error.
class build_invocation : uncopyable {
 public:
  build_invocation(std::string id, correlation_ids correlation);

  std::string const &id() const { return id_; }
  correlation_ids const &correlation() const { return correlation_; }
  invocation_state state() const { return state_; }
  std::optional<int> build_exit_code() const { return exit_code_; }

  void finish_build(std::optional<int> exit_code);

  // Allowed from STARTED too (the build never reported back); the signal is then FAILED.
  signal_outcome emit_signal(std::string physical_resource_id,
                             std::filesystem::path log_path,
                             signal_transport_t const &transport,
                             std::function<void()> post_process = {});

 private:
  std::string id_;
  correlation_ids correlation_;
  invocation_state state_{ invocation_state::started };
  std::optional<int> exit_code_;
};

}  // namespace kiln
