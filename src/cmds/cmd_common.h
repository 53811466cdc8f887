#pragma once

#include "completion_signal.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace CLI { class App; }

namespace kiln {

class asset_stager;
struct builder_config;
struct manifest;

std::unique_ptr<manifest> load_manifest_or_throw(
    std::optional<std::filesystem::path> const &manifest_path);

// S3 stager when the builder names an asset bucket, otherwise a local directory.
std::unique_ptr<asset_stager> make_asset_stager(builder_config const &cfg,
                                                std::filesystem::path const &local_dir);

struct correlation_options {
  std::optional<std::string> stack_id;
  std::optional<std::string> request_id;
  std::optional<std::string> logical_resource_id;
  std::optional<std::string> response_url;
};

void add_correlation_options(CLI::App &sub, correlation_options &opts);

// Options win; then STACK_ID, REQUEST_ID, LOGICAL_RESOURCE_ID and RESPONSE_URL from the
// environment; anything left is the placeholder.
correlation_ids resolve_correlation(correlation_options const &opts);

}  // namespace kiln
