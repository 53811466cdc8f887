#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace kiln {

using shell_env_t = std::unordered_map<std::string, std::string>;

struct shell_result {
  int exit_code;
  std::optional<int> signal;
  bool timed_out{ false };
};

struct shell_run_cfg {
  std::function<void(std::string_view)> on_output_line;  // stdout and stderr lines
  std::optional<std::filesystem::path> cwd;
  shell_env_t env;
  std::optional<std::chrono::milliseconds> timeout;  // kills the whole process group
};

shell_env_t shell_getenv();

// Runs `script` with bash from a temporary file. The child gets its own process group
// so a timeout takes down everything it started.
shell_result shell_run(std::string_view script, shell_run_cfg const &cfg);

}  // namespace kiln
