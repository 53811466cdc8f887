#pragma once

#include "build_job.h"
#include "recipe.h"
#include "registry.h"
#include "target.h"
#include "util.h"

#include <chrono>
#include <optional>
#include <string>

namespace kiln {

inline constexpr std::chrono::seconds kDefaultRebuildInterval{ std::chrono::hours{ 24 * 7 } };

// Everything one image builder needs, defaulted the way a manifest leaves it.
struct builder_config {
  std::string name;
  target_os os{ target_os::linux_ubuntu };
  target_arch arch{ target_arch::x86_64 };
  std::optional<std::string> base_image;   // default: per-OS image
  std::string compute_type{ kDefaultComputeType };
  std::optional<std::string> build_image;  // default: per-architecture table
  std::chrono::minutes timeout{ kDefaultBuildTimeout };
  std::chrono::seconds rebuild_interval{ kDefaultRebuildInterval };  // zero: manual only
  std::optional<network_placement> network;
  std::string log_sink;
  registry_info repository;
  std::optional<std::string> asset_bucket;  // s3://bucket/prefix
  std::optional<std::string> failure_target;
  std::string dockerfile_template{ kDefaultDockerfileTemplate };
  env_list_t image_environment;
};

inline std::string builder_config_base_image(builder_config const &cfg) {
  return cfg.base_image ? *cfg.base_image : target_default_base_image(cfg.os);
}

}  // namespace kiln
