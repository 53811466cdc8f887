#pragma once

#include "assembler.h"
#include "completion_signal.h"
#include "target.h"
#include "util.h"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kiln {

inline constexpr std::string_view kDefaultComputeType{ "BUILD_GENERAL1_SMALL" };
inline constexpr std::chrono::minutes kDefaultBuildTimeout{ 60 };

struct compute_profile {
  std::string build_image;
  std::string compute_type{ kDefaultComputeType };
  bool privileged{ true };  // docker-in-docker
};

enum class subnet_kind { public_subnet, private_with_egress, private_isolated };

struct network_placement {
  std::string vpc_id;
  std::vector<std::string> subnet_ids;
  std::vector<std::string> security_group_ids;
  subnet_kind kind{ subnet_kind::private_with_egress };
};

subnet_kind subnet_kind_parse(std::string_view name);
std::string_view subnet_kind_name(subnet_kind kind);

struct build_phases {
  std::vector<std::string> pre_build;
  std::vector<std::string> build;
  std::vector<std::string> post_build;
};

struct build_job_definition {
  std::string name;
  std::string description;
  env_list_t env;
  build_phases phases;
  std::vector<std::string> post_processing;  // tail of post_build, best-effort
  compute_profile compute;
  std::optional<network_placement> network;
  std::chrono::minutes timeout{ kDefaultBuildTimeout };
  std::string log_sink;
  std::string principal;
  std::string recipe_version;
};

// Default executor image for a target. Windows throws configuration_error; the table is the
// complete list of supported combinations.
compute_profile build_job_default_compute(target_os os, target_arch arch);

// Architecture name used in secondary index release assets ("x86_64", "arm64")
std::string_view build_job_index_arch(target_arch arch);

// Best-effort secondary index (standalone-soci-indexer) commands run after signaling.
std::vector<std::string> build_job_index_commands(target_arch arch);

struct build_job_inputs {
  std::string name;
  std::string description;
  target_os os{ target_os::linux_ubuntu };
  target_arch arch{ target_arch::x86_64 };
  std::string recipe_version;
  std::string registry_uri;
  std::string registry_arn;
  assembled_build assembled;
  compute_profile compute;
  std::optional<network_placement> network;
  std::chrono::minutes timeout{ kDefaultBuildTimeout };
  std::string log_sink;
  std::string principal;
};

// Pure function of its inputs.
build_job_definition build_job_synthesize(build_job_inputs const &in);

// Buildspec document (version 0.2) rendered as deterministic JSON.
std::string build_job_to_buildspec_json(build_job_definition const &def);

// Value of `name` in the definition's environment, or nullopt.
std::optional<std::string> build_job_env_value(build_job_definition const &def,
                                               std::string_view name);

}  // namespace kiln
