#include "cmd_common.h"

#include "asset_stager.h"
#include "builder_config.h"
#include "manifest.h"

#include "CLI11.hpp"

#include <cstdlib>
#include <stdexcept>

namespace kiln {

namespace {

std::string option_or_env(std::optional<std::string> const &value, char const *env_name) {
  if (value && !value->empty()) { return *value; }
  if (char const *env{ std::getenv(env_name) }; env && *env) { return env; }
  return std::string(kUnspecified);
}

}  // namespace

std::unique_ptr<manifest> load_manifest_or_throw(
    std::optional<std::filesystem::path> const &manifest_path) {
  auto const path{ manifest::find_manifest_path(manifest_path) };
  auto m{ manifest::load(path) };
  if (!m) { throw std::runtime_error("could not load manifest"); }
  return m;
}

std::unique_ptr<asset_stager> make_asset_stager(builder_config const &cfg,
                                                std::filesystem::path const &local_dir) {
  if (cfg.asset_bucket) { return std::make_unique<s3_asset_stager>(*cfg.asset_bucket); }
  return std::make_unique<local_asset_stager>(local_dir);
}

void add_correlation_options(CLI::App &sub, correlation_options &opts) {
  sub.add_option("--stack-id", opts.stack_id, "Provisioning stack id (env: STACK_ID)");
  sub.add_option("--request-id", opts.request_id, "Provisioning request id (env: REQUEST_ID)");
  sub.add_option("--logical-resource-id",
                 opts.logical_resource_id,
                 "Logical resource id (env: LOGICAL_RESOURCE_ID)");
  sub.add_option("--response-url",
                 opts.response_url,
                 "Pre-signed completion URL (env: RESPONSE_URL)");
}

correlation_ids resolve_correlation(correlation_options const &opts) {
  return correlation_ids{
    .stack_id = option_or_env(opts.stack_id, "STACK_ID"),
    .request_id = option_or_env(opts.request_id, "REQUEST_ID"),
    .logical_resource_id = option_or_env(opts.logical_resource_id, "LOGICAL_RESOURCE_ID"),
    .response_url = option_or_env(opts.response_url, "RESPONSE_URL"),
  };
}

}  // namespace kiln
