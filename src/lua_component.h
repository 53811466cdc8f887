#pragma once

#include "component.h"

#include "sol/sol.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kiln {

// Component declared in Lua. NAME is a string; ASSETS, COMMANDS and DOCKER_COMMANDS are
// tables or functions of (os, arch) returning tables. Asset sources resolve against
// base_dir. The owning sol::state must outlive the component.
class lua_component : public component {
 public:
  lua_component(sol::table decl, std::filesystem::path base_dir, std::string context);

  std::string const &name() const override { return name_; }

  std::vector<asset_descriptor> get_assets(target_os os, target_arch arch) const override;
  std::vector<std::string> get_commands(target_os os, target_arch arch) const override;
  std::vector<std::string> get_docker_commands(target_os os,
                                               target_arch arch) const override;

 private:
  std::optional<sol::table> resolve(char const *key, target_os os, target_arch arch) const;
  std::vector<std::string> strings(char const *key, target_os os, target_arch arch) const;

  sol::table decl_;
  std::filesystem::path base_dir_;
  std::string context_;
  std::string name_;
};

// Runs a component file in its own environment; only the keys it assigns itself count.
std::unique_ptr<lua_component> lua_component_load(sol::state &lua,
                                                  std::filesystem::path const &path);

}  // namespace kiln
