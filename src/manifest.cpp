#include "manifest.h"

#include "assembler.h"
#include "errors.h"
#include "lua_component.h"
#include "tui.h"

#include <algorithm>
#include <stdexcept>

namespace kiln {

namespace {

constexpr char kManifestName[]{ "kiln.lua" };

std::optional<network_placement> parse_network(sol::table const &globals) {
  auto const table{ sol_util_get_optional<sol::table>(globals, "NETWORK", kManifestName) };
  if (!table) { return std::nullopt; }

  std::string const ctx{ "NETWORK" };
  network_placement net{
    .vpc_id = sol_util_get_required<std::string>(*table, "VPC_ID", ctx),
    .subnet_ids = sol_util_get_string_array(*table, "SUBNET_IDS", ctx),
    .security_group_ids = sol_util_get_string_array(*table, "SECURITY_GROUP_IDS", ctx),
  };
  if (auto const kind{ sol_util_get_optional<std::string>(*table, "SUBNET_TYPE", ctx) }) {
    net.kind = subnet_kind_parse(*kind);
  }
  return net;
}

registry_info parse_repository(sol::table const &globals) {
  auto const table{ sol_util_get_required<sol::table>(globals, "REPOSITORY", kManifestName) };
  std::string const ctx{ "REPOSITORY" };
  return registry_info{
    .name = sol_util_get_required<std::string>(table, "NAME", ctx),
    .uri = sol_util_get_required<std::string>(table, "URI", ctx),
    .arn = sol_util_get_or_default<std::string>(table, "ARN", "", ctx),
  };
}

// Sorted by name so table iteration order never reaches the recipe
env_list_t parse_environment(sol::table const &globals) {
  auto const table{
    sol_util_get_optional<sol::table>(globals, "IMAGE_ENVIRONMENT", kManifestName)
  };
  if (!table) { return {}; }

  env_list_t env;
  for (auto const &[key, value] : *table) {
    if (!key.is<std::string>() || !value.is<std::string>()) {
      throw configuration_error("IMAGE_ENVIRONMENT: keys and values must be strings");
    }
    env.emplace_back(key.as<std::string>(), value.as<std::string>());
  }
  std::sort(env.begin(), env.end());
  assembler_validate_environment(env);
  return env;
}

builder_config parse_builder(sol::table const &globals) {
  builder_config cfg;
  cfg.name = sol_util_get_required<std::string>(globals, "NAME", kManifestName);

  if (auto const os{ sol_util_get_optional<std::string>(globals, "OS", kManifestName) }) {
    cfg.os = target_os_parse(*os);
  }
  if (auto const arch{ sol_util_get_optional<std::string>(globals, "ARCH", kManifestName) }) {
    cfg.arch = target_arch_parse(*arch);
  }

  cfg.base_image = sol_util_get_optional<std::string>(globals, "BASE_IMAGE", kManifestName);
  cfg.compute_type = sol_util_get_or_default<std::string>(globals,
                                                          "COMPUTE_TYPE",
                                                          std::string(kDefaultComputeType),
                                                          kManifestName);
  cfg.build_image = sol_util_get_optional<std::string>(globals, "BUILD_IMAGE", kManifestName);

  if (auto const minutes{
          sol_util_get_optional<int>(globals, "TIMEOUT_MINUTES", kManifestName) }) {
    if (*minutes <= 0) {
      throw configuration_error("kiln.lua: TIMEOUT_MINUTES must be positive");
    }
    cfg.timeout = std::chrono::minutes{ *minutes };
  }

  if (auto const minutes{
          sol_util_get_optional<int>(globals, "REBUILD_INTERVAL_MINUTES", kManifestName) }) {
    if (*minutes < 0) {
      throw configuration_error("kiln.lua: REBUILD_INTERVAL_MINUTES must not be negative");
    }
    cfg.rebuild_interval = std::chrono::minutes{ *minutes };
  }

  cfg.network = parse_network(globals);
  cfg.log_sink = sol_util_get_or_default<std::string>(globals, "LOG_SINK", "", kManifestName);
  cfg.repository = parse_repository(globals);
  cfg.asset_bucket = sol_util_get_optional<std::string>(globals, "ASSET_BUCKET", kManifestName);
  cfg.failure_target =
      sol_util_get_optional<std::string>(globals, "FAILURE_TARGET", kManifestName);

  if (auto const tmpl{
          sol_util_get_optional<std::string>(globals, "DOCKERFILE_TEMPLATE", kManifestName) }) {
    cfg.dockerfile_template = *tmpl;
  }
  cfg.image_environment = parse_environment(globals);
  return cfg;
}

}  // namespace

std::optional<std::filesystem::path> manifest::discover() {
  namespace fs = std::filesystem;

  auto cur{ fs::current_path() };

  for (;;) {
    auto const manifest_path{ cur / kManifestName };
    if (fs::exists(manifest_path)) { return manifest_path; }

    auto const git_path{ cur / ".git" };
    if (fs::exists(git_path) && fs::is_directory(git_path)) { return std::nullopt; }

    auto const parent{ cur.parent_path() };
    if (parent == cur) { return std::nullopt; }

    cur = parent;
  }
}

std::filesystem::path manifest::find_manifest_path(
    std::optional<std::filesystem::path> const &explicit_path) {
  if (explicit_path) {
    auto const path{ std::filesystem::absolute(*explicit_path) };
    if (!std::filesystem::exists(path)) {
      throw configuration_error("manifest not found: " + path.string());
    }
    return path;
  }
  if (auto const discovered{ discover() }) { return *discovered; }
  throw configuration_error("manifest not found (no kiln.lua in this directory or above)");
}

std::unique_ptr<manifest> manifest::load(std::filesystem::path const &manifest_path) {
  tui::debug("Loading manifest from file: %s", manifest_path.string().c_str());
  auto const content{ util_load_file(manifest_path) };
  return load(std::string_view{ reinterpret_cast<char const *>(content.data()),
                                content.size() },
              manifest_path);
}

std::unique_ptr<manifest> manifest::load(std::string_view script,
                                         std::filesystem::path const &manifest_path) {
  tui::debug("Loading manifest (%zu bytes)", script.size());

  auto state{ sol_util_make_lua_state() };
  if (sol::protected_function_result const result{
          state->safe_script(script, sol::script_pass_on_error) };
      !result.valid()) {
    sol::error err = result;
    throw configuration_error(std::string("Failed to execute manifest script: ") +
                              err.what());
  }

  auto m{ std::make_unique<manifest>() };
  m->manifest_path = manifest_path;
  m->lua_ = std::move(state);

  sol::table const globals{ m->lua_->globals() };
  m->builder = parse_builder(globals);

  auto const base_dir{ std::filesystem::absolute(manifest_path).parent_path() };
  auto const entries{ sol_util_get_required<sol::table>(globals, "COMPONENTS", kManifestName) };
  for (std::size_t i{ 1 }, n{ entries.size() }; i <= n; ++i) {
    sol::object const entry{ entries[i] };
    switch (entry.get_type()) {
      case sol::type::string: {
        std::filesystem::path path{ entry.as<std::string>() };
        if (path.is_relative()) { path = base_dir / path; }
        m->components_.push_back(lua_component_load(*m->lua_, path));
        break;
      }
      case sol::type::table:
        m->components_.push_back(
            std::make_unique<lua_component>(entry.as<sol::table>(),
                                            base_dir,
                                            "COMPONENTS[" + std::to_string(i) + "]"));
        break;
      default:
        throw configuration_error("COMPONENTS[" + std::to_string(i) +
                                  "] must be a component file path or a table");
    }
  }

  tui::debug("Manifest %s declares builder %s with %zu components",
             manifest_path.string().c_str(),
             m->builder.name.c_str(),
             m->components_.size());
  return m;
}

std::vector<component const *> manifest::components() const {
  std::vector<component const *> out;
  out.reserve(components_.size());
  for (auto const &c : components_) { out.push_back(c.get()); }
  return out;
}

}  // namespace kiln
