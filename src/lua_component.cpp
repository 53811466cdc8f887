#include "lua_component.h"

#include "errors.h"
#include "sol_util.h"
#include "tui.h"

#include <array>

namespace kiln {
namespace {

constexpr std::array<char const *, 4> kComponentKeys{ "NAME",
                                                      "ASSETS",
                                                      "COMMANDS",
                                                      "DOCKER_COMMANDS" };

void check_contribution_type(sol::table const &decl,
                             char const *key,
                             std::string const &context) {
  sol::object const value{ decl[key] };
  switch (value.get_type()) {
    case sol::type::lua_nil:
    case sol::type::table:
    case sol::type::function: return;
    default:
      throw configuration_error(context + ": " + key + " must be a table or a function");
  }
}

}  // namespace

lua_component::lua_component(sol::table decl,
                             std::filesystem::path base_dir,
                             std::string context)
    : decl_{ std::move(decl) },
      base_dir_{ std::move(base_dir) },
      context_{ std::move(context) },
      name_{ sol_util_get_required<std::string>(decl_, "NAME", context_) } {
  component_validate_name(name_);
  for (char const *key : { "ASSETS", "COMMANDS", "DOCKER_COMMANDS" }) {
    check_contribution_type(decl_, key, context_);
  }
}

std::optional<sol::table> lua_component::resolve(char const *key,
                                                 target_os os,
                                                 target_arch arch) const {
  sol::object const value{ decl_[key] };
  if (value.get_type() == sol::type::table) { return value.as<sol::table>(); }
  if (value.get_type() != sol::type::function) { return std::nullopt; }

  sol::protected_function fn{ value.as<sol::protected_function>() };
  sol::protected_function_result result{
    fn(std::string(target_os_name(os)), std::string(target_arch_name(arch)))
  };
  if (!result.valid()) {
    sol::error err = result;
    throw configuration_error(context_ + ": " + key + " failed: " + err.what());
  }

  sol::object const returned{ result.get<sol::object>() };
  switch (returned.get_type()) {
    case sol::type::lua_nil: return std::nullopt;
    case sol::type::table: return returned.as<sol::table>();
    default:
      throw configuration_error(context_ + ": " + key + " must return a table");
  }
}

std::vector<std::string> lua_component::strings(char const *key,
                                                target_os os,
                                                target_arch arch) const {
  auto const table{ resolve(key, os, arch) };
  if (!table) { return {}; }

  std::vector<std::string> out;
  for (std::size_t i{ 1 }, n{ table->size() }; i <= n; ++i) {
    sol::object const entry{ (*table)[i] };
    if (!entry.is<std::string>()) {
      throw configuration_error(context_ + ": " + key + "[" + std::to_string(i) +
                                "] must be a string");
    }
    out.push_back(entry.as<std::string>());
  }
  return out;
}

std::vector<asset_descriptor> lua_component::get_assets(target_os os,
                                                        target_arch arch) const {
  auto const table{ resolve("ASSETS", os, arch) };
  if (!table) { return {}; }

  std::vector<asset_descriptor> out;
  for (std::size_t i{ 1 }, n{ table->size() }; i <= n; ++i) {
    std::string const ctx{ context_ + ": ASSETS[" + std::to_string(i) + "]" };
    sol::object const entry{ (*table)[i] };
    if (entry.get_type() != sol::type::table) {
      throw configuration_error(ctx + " must be a table");
    }
    sol::table const asset{ entry.as<sol::table>() };

    std::filesystem::path source{ sol_util_get_required<std::string>(asset, "source", ctx) };
    if (source.is_relative()) { source = base_dir_ / source; }

    out.push_back({ .source = source.lexically_normal(),
                    .target = sol_util_get_required<std::string>(asset, "target", ctx) });
  }
  return out;
}

std::vector<std::string> lua_component::get_commands(target_os os, target_arch arch) const {
  return strings("COMMANDS", os, arch);
}

std::vector<std::string> lua_component::get_docker_commands(target_os os,
                                                            target_arch arch) const {
  return strings("DOCKER_COMMANDS", os, arch);
}

std::unique_ptr<lua_component> lua_component_load(sol::state &lua,
                                                  std::filesystem::path const &path) {
  if (!std::filesystem::is_regular_file(path)) {
    throw configuration_error("Component file not found: " + path.string());
  }

  sol::environment env{ lua, sol::create, lua.globals() };
  auto result{ lua.safe_script_file(path.string(), env, sol::script_pass_on_error) };
  if (!result.valid()) {
    sol::error err = result;
    throw configuration_error("Failed to load component " + path.string() + ": " +
                              err.what());
  }

  // Copy only what the file assigned; the environment falls back to globals for lookups.
  sol::table decl{ lua.create_table() };
  for (char const *key : kComponentKeys) { decl[key] = env.raw_get<sol::object>(key); }

  tui::debug("loaded component file %s", path.string().c_str());
  return std::make_unique<lua_component>(decl,
                                         path.parent_path(),
                                         path.filename().string());
}

}  // namespace kiln
