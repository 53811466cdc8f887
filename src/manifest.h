#pragma once

#include "builder_config.h"
#include "component.h"
#include "sol_util.h"
#include "util.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace kiln {

// A kiln.lua manifest: one builder configuration plus its components.
struct manifest : unmovable {
  builder_config builder;
  std::filesystem::path manifest_path;

  manifest() = default;

  // Explicit path if given, otherwise search upward from the current directory for
  // kiln.lua, stopping at a repository root. Returns an absolute path or throws.
  static std::filesystem::path find_manifest_path(
      std::optional<std::filesystem::path> const &explicit_path);

  static std::optional<std::filesystem::path> discover();

  static std::unique_ptr<manifest> load(std::filesystem::path const &manifest_path);
  static std::unique_ptr<manifest> load(std::string_view script,
                                        std::filesystem::path const &manifest_path);

  // Non-owning, in COMPONENTS order
  std::vector<component const *> components() const;

 private:
  sol_state_ptr lua_;  // declared before components_; they reference tables in it
  std::vector<std::unique_ptr<component>> components_;
};

}  // namespace kiln
