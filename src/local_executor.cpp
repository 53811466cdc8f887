#include "local_executor.h"

#include "shell.h"
#include "trace.h"
#include "tui.h"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <functional>
#include <stdexcept>
#include <system_error>

namespace kiln {
namespace {

constexpr char kStrictPrelude[]{ "set -eo pipefail\n" };
constexpr char kLogFileName[]{ "build.log" };

std::string phase_script(std::vector<std::string> const &commands) {
  return kStrictPrelude + util_join(commands, "\n") + "\n";
}

std::string lookup(shell_env_t const &env, char const *key) {
  auto const it{ env.find(key) };
  return it == env.end() ? std::string(kUnspecified) : it->second;
}

struct phase_result {
  std::optional<int> exit_code;  // nullopt: killed by the timeout
  std::int64_t duration_ms;
};

phase_result run_phase(std::string const &invocation,
                       char const *phase,
                       std::vector<std::string> const &commands,
                       shell_run_cfg const &cfg) {
  auto const start{ std::chrono::steady_clock::now() };
  auto const result{ shell_run(phase_script(commands), cfg) };
  auto const duration_ms{ static_cast<std::int64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - start)
          .count()) };

  phase_result out{ .exit_code = result.exit_code, .duration_ms = duration_ms };
  if (result.timed_out) {
    tui::warn("[%s] %s phase timed out after %lld ms",
              invocation.c_str(),
              phase,
              static_cast<long long>(duration_ms));
    out.exit_code = std::nullopt;
  }

  KILN_TRACE_BUILD_PHASE_COMPLETE(invocation,
                                  std::string(phase),
                                  static_cast<std::int64_t>(out.exit_code.value_or(-1)),
                                  duration_ms);
  tui::debug("[%s] %s phase finished with exit code %d",
             invocation.c_str(),
             phase,
             out.exit_code.value_or(-1));
  return out;
}

// Best effort: the log may be the thing that failed.
void append_log_line(std::filesystem::path const &log_path, std::string const &line) {
  file_ptr_t log{ util_open_file(log_path, "ab") };
  if (!log) { return; }
  std::fwrite(line.data(), 1, line.size(), log.get());
  std::fputc('\n', log.get());
}

}  // namespace

local_executor::local_executor(local_executor_options opts) : opts_{ std::move(opts) } {
  if (opts_.work_dir.empty()) {
    throw std::invalid_argument("local_executor: work_dir is empty");
  }
  if (!opts_.transport) { opts_.transport = signal_http_transport(); }
}

bool local_executor::supports(target_os os, target_arch) const {
  return target_os_is_linux(os);
}

void local_executor::register_job(build_job_definition const &def) {
  jobs_.insert_or_assign(def.name, def);
  tui::debug("local executor: registered job %s", def.name.c_str());
}

bool local_executor::has_job(std::string const &job_name) const {
  return jobs_.contains(job_name);
}

std::string local_executor::start_build(std::string const &job_name,
                                        env_list_t const &overrides) {
  auto const job_it{ jobs_.find(job_name) };
  if (job_it == jobs_.end()) { throw std::runtime_error("Unknown build job: " + job_name); }
  build_job_definition const &def{ job_it->second };

  std::string const token{ signal_random_token() };
  std::string const id{ job_name + ":" + token };
  std::filesystem::path const dir{ opts_.work_dir / job_name / token };
  std::filesystem::create_directories(dir);
  std::filesystem::path const log_path{ dir / kLogFileName };

  auto &record{ invocations_[id] };
  record.job = job_name;
  record.dir = dir;
  record.status = build_status::running;

  shell_env_t env{ shell_getenv() };
  for (auto const &[key, value] : def.env) { env[key] = value; }
  for (auto const &[key, value] : overrides) { env[key] = value; }
  env.erase("BASH_ENV");  // output is captured here instead of by a tee script

  correlation_ids const correlation{
    .stack_id = lookup(env, "STACK_ID"),
    .request_id = lookup(env, "REQUEST_ID"),
    .logical_resource_id = lookup(env, "LOGICAL_RESOURCE_ID"),
    .response_url = lookup(env, "RESPONSE_URL"),
  };

  tui::info("[%s] build started in %s", id.c_str(), dir.string().c_str());

  build_invocation invocation{ id, correlation };
  std::optional<int> build_exit;
  try {
    file_ptr_t log{ util_open_file(log_path, "wb") };
    if (!log) { throw std::runtime_error("Failed to open build log: " + log_path.string()); }

    shell_run_cfg cfg{
      .on_output_line =
          [&](std::string_view line) {
            std::fwrite(line.data(), 1, line.size(), log.get());
            std::fputc('\n', log.get());
            tui::debug("[%s] %.*s", id.c_str(), static_cast<int>(line.size()), line.data());
          },
      .cwd = dir,
      .env = env,
      .timeout = std::nullopt,
    };

    std::optional<int> pre_exit{ 0 };
    if (opts_.run_pre_build && !def.phases.pre_build.empty()) {
      pre_exit = run_phase(id, "pre_build", def.phases.pre_build, cfg).exit_code;
    }

    if (pre_exit == 0) {
      cfg.timeout = opts_.build_timeout
                        ? *opts_.build_timeout
                        : std::chrono::duration_cast<std::chrono::milliseconds>(def.timeout);
      build_exit = run_phase(id, "build", def.phases.build, cfg).exit_code;
    } else {
      tui::error("[%s] pre_build failed; skipping build phase", id.c_str());
      build_exit = pre_exit;
    }
  } catch (std::exception const &e) {
    tui::error("[%s] build could not run: %s", id.c_str(), e.what());
    build_exit = std::nullopt;
    append_log_line(log_path, std::string("kiln: build could not run: ") + e.what());
  }
  invocation.finish_build(build_exit);
  record.status = invocation.state() == invocation_state::succeeded ? build_status::succeeded
                                                                     : build_status::failed;

  std::function<void()> post_process;
  if (opts_.run_post_processing && !def.post_processing.empty()) {
    post_process = [&] {
      shell_run_cfg const cfg{
        .on_output_line =
            [&](std::string_view line) {
              tui::debug("[%s] %.*s", id.c_str(), static_cast<int>(line.size()), line.data());
            },
        .cwd = dir,
        .env = env,
        .timeout = std::nullopt,
      };
      auto const result{ run_phase(id, "post_processing", def.post_processing, cfg) };
      if (result.exit_code != 0) {
        throw std::runtime_error("post-processing exited with " +
                                 std::to_string(result.exit_code.value_or(-1)));
      }
    };
  }

  record.signal = invocation.emit_signal(lookup(env, "REPO_ARN"),
                                         log_path,
                                         opts_.transport,
                                         std::move(post_process));

  tui::info("[%s] build %s",
            id.c_str(),
            std::string(build_status_name(record.status)).c_str());

  if (record.status == build_status::failed) { notify_failure(id, job_name); }
  return id;
}

build_status local_executor::query_status(std::string const &invocation_id) const {
  return find(invocation_id).status;
}

std::string local_executor::read_log(std::string const &invocation_id) const {
  auto const bytes{ util_load_file(find(invocation_id).dir / kLogFileName) };
  return std::string(bytes.begin(), bytes.end());
}

void local_executor::attach_failure_notification(std::string const &job_name,
                                                 std::string const &target) {
  if (!has_job(job_name)) { throw std::runtime_error("Unknown build job: " + job_name); }
  failure_targets_[job_name].push_back(target);
}

std::vector<std::string> const &local_executor::failure_targets(
    std::string const &job_name) const {
  static std::vector<std::string> const kNone;
  auto const it{ failure_targets_.find(job_name) };
  return it == failure_targets_.end() ? kNone : it->second;
}

signal_outcome const &local_executor::signal(std::string const &invocation_id) const {
  return find(invocation_id).signal;
}

std::filesystem::path local_executor::invocation_dir(std::string const &invocation_id) const {
  return find(invocation_id).dir;
}

local_executor::invocation_record const &local_executor::find(
    std::string const &invocation_id) const {
  auto const it{ invocations_.find(invocation_id) };
  if (it == invocations_.end()) {
    throw std::runtime_error("Unknown build invocation: " + invocation_id);
  }
  return it->second;
}

void local_executor::notify_failure(std::string const &invocation_id,
                                    std::string const &job_name) const {
  for (auto const &target : failure_targets(job_name)) {
    shell_env_t env{ shell_getenv() };
    env["KILN_BUILD_ID"] = invocation_id;
    env["KILN_JOB"] = job_name;

    try {
      auto const result{ shell_run(target,
                                   shell_run_cfg{
                                       .on_output_line =
                                           [](std::string_view line) {
                                             tui::info("%.*s",
                                                       static_cast<int>(line.size()),
                                                       line.data());
                                           },
                                       .cwd = std::nullopt,
                                       .env = std::move(env),
                                       .timeout = std::nullopt,
                                   }) };
      if (result.exit_code != 0) {
        tui::warn("Failure notification for %s exited with %d",
                  job_name.c_str(),
                  result.exit_code);
      }
    } catch (std::system_error const &e) {
      tui::warn("Failure notification for %s could not run: %s", job_name.c_str(), e.what());
    }
  }
}

}  // namespace kiln
