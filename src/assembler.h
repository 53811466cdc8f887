#pragma once

#include "asset_stager.h"
#include "component.h"
#include "recipe.h"
#include "target.h"
#include "util.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace kiln {

inline constexpr std::string_view kHeredocMarker{ "EOFKILNDOCKERFILE" };

struct assembler_input {
  std::vector<component const *> components;  // not owned; order is significant
  target_os os{ target_os::linux_ubuntu };
  target_arch arch{ target_arch::x86_64 };
  std::string base_image;
  std::string dockerfile_template{ kDefaultDockerfileTemplate };
  env_list_t image_environment;  // rendered as ENV KEY="value" lines
  std::string principal;         // executor identity granted read on staged assets
};

struct assembled_build {
  std::vector<std::string> commands;  // build phase shell commands, in order
  std::string dockerfile;             // rendered image definition
};

// Keys must be valid shell identifiers and values single-line. Throws configuration_error.
void assembler_validate_environment(env_list_t const &environment);

// Every check that can fail, run before anything is staged. Throws configuration_error.
void assembler_validate(assembler_input const &in);

// Validates, then stages assets through `stager` and emits the build commands and image
// definition. Equal inputs produce byte-identical output.
assembled_build assemble(assembler_input const &in, asset_stager &stager);

std::string assembler_asset_name(std::size_t index, std::string_view component_name,
                                 std::size_t asset_index);
std::string assembler_script_name(std::size_t index, std::string_view component_name);

// Substitute placeholders. A line holding only a placeholder whose value is empty is
// dropped instead of leaving a blank line.
std::string assembler_render_template(std::string_view dockerfile_template,
                                      std::string_view base_image,
                                      env_list_t const &environment,
                                      std::vector<std::string> const &component_lines);

}  // namespace kiln
