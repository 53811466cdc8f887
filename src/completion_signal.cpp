#include "completion_signal.h"

#include "json_util.h"
#include "libcurl_util.h"
#include "trace.h"
#include "tui.h"

#include <cstdint>
#include <random>
#include <stdexcept>
#include <utility>

namespace kiln {

std::string_view signal_status_name(signal_status status) {
  switch (status) {
    case signal_status::success: return "SUCCESS";
    case signal_status::failed: return "FAILED";
  }
  return "FAILED";
}

signal_status signal_status_from_exit_code(std::optional<int> exit_code) {
  return (exit_code && *exit_code == 0) ? signal_status::success : signal_status::failed;
}

std::string signal_sanitize_reason(std::string_view log) {
  std::string cleaned;
  cleaned.reserve(log.size());
  for (char const ch : log) {
    auto const byte{ static_cast<unsigned char>(ch) };
    if (ch == '\n') {
      cleaned.push_back(' ');
    } else if (byte >= 0x20 && byte <= 0x7e) {
      cleaned.push_back(ch);
    }
  }

  if (cleaned.size() > kReasonByteLimit) {
    cleaned.erase(0, cleaned.size() - kReasonByteLimit);
  }
  return cleaned;
}

std::string signal_random_token() {
  static thread_local std::mt19937_64 rng{ std::random_device{}() };
  std::uint64_t const words[2]{ rng(), rng() };
  return util_bytes_to_hex(words, sizeof words);
}

std::string signal_payload_json(completion_signal const &signal) {
  std::string out{ "{\"StackId\":" };
  out.append(json_quote(signal.correlation.stack_id));
  out.append(",\"RequestId\":");
  out.append(json_quote(signal.correlation.request_id));
  out.append(",\"LogicalResourceId\":");
  out.append(json_quote(signal.correlation.logical_resource_id));
  out.append(",\"PhysicalResourceId\":");
  out.append(json_quote(signal.physical_resource_id));
  out.append(",\"Status\":");
  out.append(json_quote(signal_status_name(signal.status)));
  out.append(",\"Reason\":");
  out.append(json_quote(signal.reason));
  out.append(",\"Data\":{\"Random\":");
  out.append(json_quote(signal.random));
  out.append("}}");
  return out;
}

signal_transport_t signal_http_transport() {
  return [](std::string const &url, std::string const &body) {
    long const code{ libcurl_put(url, body, { "Content-Type;" }) };
    tui::debug("Completion signal accepted (HTTP %ld)", code);
  };
}

signal_outcome completion_signal_run(signal_inputs const &in,
                                     signal_transport_t const &transport) {
  signal_outcome outcome{ .signal = completion_signal{
                              .correlation = in.correlation,
                              .physical_resource_id = in.physical_resource_id,
                              .status = signal_status_from_exit_code(in.build_exit_code),
                              .reason = {},
                              .random = signal_random_token(),
                          } };
  auto &signal{ outcome.signal };

  if (!in.log_path.empty()) {
    try {
      auto const bytes{ util_load_file(in.log_path) };
      signal.reason = signal_sanitize_reason(
          std::string_view{ reinterpret_cast<char const *>(bytes.data()), bytes.size() });
    } catch (std::exception const &e) {
      tui::warn("Build log unavailable, reporting FAILED: %s", e.what());
      signal.status = signal_status::failed;
      signal.reason = signal_sanitize_reason(std::string("Build log unavailable: ") + e.what());
    }
  }

  auto const status_name{ std::string(signal_status_name(signal.status)) };

  if (!signal.correlation.has_endpoint()) {
    tui::debug("No response URL; skipping completion signal delivery (%s)",
               status_name.c_str());
    KILN_TRACE_SIGNAL_SKIPPED(signal.physical_resource_id, status_name);
  } else {
    outcome.delivery_attempted = true;
    try {
      if (!transport) { throw std::runtime_error("no signal transport configured"); }
      transport(signal.correlation.response_url, signal_payload_json(signal));
      outcome.delivered = true;
    } catch (std::exception const &e) {
      outcome.delivery_error = e.what();
      tui::error("Completion signal delivery failed: %s", e.what());
    }
    KILN_TRACE_SIGNAL_DELIVERED(signal.physical_resource_id, status_name, outcome.delivered);
  }

  if (in.post_process) {
    try {
      in.post_process();
    } catch (std::exception const &e) {
      tui::warn("Post-processing failed (status unaffected): %s", e.what());
    }
  }

  return outcome;
}

std::vector<std::string> completion_signal_shell_commands() {
  return {
    "rm -f " + std::string(kBashEnvScript) + " && STATUS=\"SUCCESS\"",
    "if [ \"${CODEBUILD_BUILD_SUCCEEDING:-0}\" -ne 1 ]; then STATUS=\"FAILED\"; fi",
    "RANDOM_TOKEN=`head -c 16 /dev/urandom | od -An -tx1 | tr -d ' \\n'`",
    "cat <<EOF > /tmp/payload.json\n"
    "{\n"
    "  \"StackId\": \"$STACK_ID\",\n"
    "  \"RequestId\": \"$REQUEST_ID\",\n"
    "  \"LogicalResourceId\": \"$LOGICAL_RESOURCE_ID\",\n"
    "  \"PhysicalResourceId\": \"$REPO_ARN\",\n"
    "  \"Status\": \"$STATUS\",\n"
    "  \"Reason\": `tr '\\n' ' ' < " +
        std::string(kBuildLogPath) +
        " | sed 's/[^[:print:]]//g' | tail -c " + std::to_string(kReasonByteLimit) +
        " | jq -Rsa .`,\n"
        "  \"Data\": {\"Random\": \"$RANDOM_TOKEN\"}\n"
        "}\n"
        "EOF",
    "if [ \"$RESPONSE_URL\" != \"" + std::string(kUnspecified) +
        "\" ]; then jq . /tmp/payload.json; curl -fsSL -X PUT -H \"Content-Type:\" -d "
        "\"@/tmp/payload.json\" \"$RESPONSE_URL\"; fi",
  };
}

std::string_view invocation_state_name(invocation_state state) {
  switch (state) {
    case invocation_state::started: return "STARTED";
    case invocation_state::succeeded: return "SUCCEEDED";
    case invocation_state::failed: return "FAILED";
    case invocation_state::signaled: return "SIGNALED";
  }
  return "UNKNOWN";
}

build_invocation::build_invocation(std::string id, correlation_ids correlation)
    : id_{ std::move(id) }, correlation_{ std::move(correlation) } {}

void build_invocation::finish_build(std::optional<int> exit_code) {
  if (state_ != invocation_state::started) {
    throw std::logic_error("build_invocation " + id_ + ": build already finished (" +
                           std::string(invocation_state_name(state_)) + ")");
  }
  exit_code_ = exit_code;
  state_ = signal_status_from_exit_code(exit_code) == signal_status::success
               ? invocation_state::succeeded
               : invocation_state::failed;
}

signal_outcome build_invocation::emit_signal(std::string physical_resource_id,
                                             std::filesystem::path log_path,
                                             signal_transport_t const &transport,
                                             std::function<void()> post_process) {
  if (state_ == invocation_state::signaled) {
    throw std::logic_error("build_invocation " + id_ + ": already signaled");
  }
  if (state_ == invocation_state::started) { finish_build(std::nullopt); }

  auto outcome{ completion_signal_run(
      signal_inputs{ .correlation = correlation_,
                     .physical_resource_id = std::move(physical_resource_id),
                     .build_exit_code = exit_code_,
                     .log_path = std::move(log_path),
                     .post_process = std::move(post_process) },
      transport) };
  state_ = invocation_state::signaled;
  return outcome;
}

}  // namespace kiln
