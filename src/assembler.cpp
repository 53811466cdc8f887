#include "assembler.h"

#include "errors.h"
#include "trace.h"
#include "tui.h"

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace kiln {
namespace {

constexpr std::string_view kScriptPrelude{ "#!/bin/bash\nset -exuo pipefail\n" };

std::string heredoc(std::string_view file, std::string_view body) {
  std::string result{ "cat > " };
  result.append(file);
  result.append(" <<'");
  result.append(kHeredocMarker);
  result.append("'\n");
  result.append(body);
  result.push_back('\n');
  result.append(kHeredocMarker);
  return result;
}

bool contains_marker_line(std::string_view text) {
  while (!text.empty()) {
    auto const nl{ text.find('\n') };
    if (text.substr(0, nl) == kHeredocMarker) { return true; }
    if (nl == std::string_view::npos) { break; }
    text.remove_prefix(nl + 1);
  }
  return false;
}

bool has_line_break(std::string_view text) {
  return text.find_first_of("\r\n") != std::string_view::npos;
}

bool is_env_key(std::string_view key) {
  if (key.empty() || (key.front() >= '0' && key.front() <= '9')) { return false; }
  return std::all_of(key.begin(), key.end(), [](char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '_';
  });
}

// Double-quoted ENV value; `$` is left alone so values may reference earlier variables.
std::string quote_env_value(std::string_view value) {
  std::string out{ "\"" };
  for (char const c : value) {
    if (c == '"' || c == '\\') { out.push_back('\\'); }
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

std::string_view trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) { s.remove_prefix(1); }
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) {
    s.remove_suffix(1);
  }
  return s;
}

void replace_all(std::string &text, std::string_view from, std::string_view to) {
  for (std::size_t pos{ text.find(from) }; pos != std::string::npos;
       pos = text.find(from, pos + to.size())) {
    text.replace(pos, from.size(), to);
  }
}

}  // namespace

std::string assembler_asset_name(std::size_t index,
                                 std::string_view component_name,
                                 std::size_t asset_index) {
  return "asset" + std::to_string(index) + "-" + std::string(component_name) + "-" +
         std::to_string(asset_index);
}

std::string assembler_script_name(std::size_t index, std::string_view component_name) {
  return "component" + std::to_string(index) + "-" + std::string(component_name) + ".sh";
}

std::string assembler_render_template(std::string_view dockerfile_template,
                                      std::string_view base_image,
                                      env_list_t const &environment,
                                      std::vector<std::string> const &component_lines) {
  std::vector<std::string> env_lines;
  env_lines.reserve(environment.size());
  for (auto const &[key, value] : environment) {
    env_lines.push_back("ENV " + key + "=" + quote_env_value(value));
  }

  std::string const env_block{ util_join(env_lines, "\n") };
  std::string const components_block{ util_join(component_lines, "\n") };

  std::string result;
  std::string_view rest{ dockerfile_template };
  while (!rest.empty()) {
    auto const nl{ rest.find('\n') };
    std::string_view const raw{ rest.substr(0, nl) };
    rest = (nl == std::string_view::npos) ? std::string_view{} : rest.substr(nl + 1);

    auto const bare{ trim(raw) };
    if ((bare == kPlaceholderEnvironments && env_block.empty()) ||
        (bare == kPlaceholderComponents && components_block.empty())) {
      continue;
    }

    std::string line{ raw };
    replace_all(line, kPlaceholderParentImage, base_image);
    replace_all(line, kPlaceholderEnvironments, env_block);
    replace_all(line, kPlaceholderComponents, components_block);
    result.append(line);
    if (nl != std::string_view::npos) { result.push_back('\n'); }
  }

  return result;
}

void assembler_validate_environment(env_list_t const &environment) {
  for (auto const &[key, value] : environment) {
    if (!is_env_key(key)) {
      throw configuration_error("Image environment key '" + key +
                                "' must match [A-Za-z_][A-Za-z0-9_]*");
    }
    if (has_line_break(value)) {
      throw configuration_error("Image environment value of " + key +
                                " must not contain line breaks");
    }
  }
}

void assembler_validate(assembler_input const &in) {
  if (in.base_image.empty()) { throw configuration_error("Base image must not be empty"); }
  if (has_line_break(in.base_image)) {
    throw configuration_error("Base image must not contain line breaks");
  }
  recipe_validate_template(in.dockerfile_template);
  if (contains_marker_line(in.dockerfile_template)) {
    throw configuration_error("Dockerfile template contains the reserved line " +
                              std::string(kHeredocMarker));
  }
  assembler_validate_environment(in.image_environment);

  for (std::size_t i{ 0 }; i < in.components.size(); ++i) {
    auto const *c{ in.components[i] };
    if (!c) {
      throw std::invalid_argument("assembler: component " + std::to_string(i) + " is null");
    }
    component_validate_name(c->name());

    auto const assets{ c->get_assets(in.os, in.arch) };
    if (!assets.empty() && !target_os_is_linux(in.os)) {
      throw configuration_error("Can't add asset from component '" + c->name() +
                                "' as Windows container images cannot be built");
    }

    for (auto const &asset : assets) {
      asset_kind_of(asset.source);
      if (asset.target.empty()) {
        throw configuration_error("Asset " + asset.source.string() + " of component '" +
                                  c->name() + "' has no target path");
      }
      if (has_line_break(asset.target)) {
        throw configuration_error("Target path of asset " + asset.source.string() +
                                  " of component '" + c->name() +
                                  "' must not contain line breaks");
      }
    }

    for (auto const &command : c->get_commands(in.os, in.arch)) {
      if (contains_marker_line(command)) {
        throw configuration_error("Command of component '" + c->name() +
                                  "' contains the reserved line " +
                                  std::string(kHeredocMarker));
      }
    }

    for (auto const &directive : c->get_docker_commands(in.os, in.arch)) {
      if (contains_marker_line(directive)) {
        throw configuration_error("Directive of component '" + c->name() +
                                  "' contains the reserved line " +
                                  std::string(kHeredocMarker));
      }
    }
  }
}

assembled_build assemble(assembler_input const &in, asset_stager &stager) {
  assembler_validate(in);

  assembled_build out;
  std::vector<std::string> directives;

  for (std::size_t i{ 0 }; i < in.components.size(); ++i) {
    auto const &c{ *in.components[i] };
    auto const &name{ c.name() };

    auto const assets{ c.get_assets(in.os, in.arch) };
    for (std::size_t j{ 0 }; j < assets.size(); ++j) {
      auto const asset_name{ assembler_asset_name(i, name, j) };
      auto const staged{ stager.stage(assets[j].source, asset_name, in.principal) };
      KILN_TRACE_ASSET_STAGED(name, asset_name, staged.uri);

      if (staged.kind == asset_kind::file) {
        out.commands.push_back(stager.fetch_command(staged, asset_name));
      } else {
        out.commands.push_back(stager.fetch_command(staged, asset_name + ".zip"));
        out.commands.push_back("unzip " + asset_name + ".zip -d \"" + asset_name + "\"");
      }
      directives.push_back("COPY " + asset_name + " " + assets[j].target);
    }

    auto const commands{ c.get_commands(in.os, in.arch) };
    if (!commands.empty()) {
      auto const script_name{ assembler_script_name(i, name) };
      std::string script{ kScriptPrelude };
      script.append(util_join(commands, "\n"));
      out.commands.push_back(heredoc(script_name, script));
      out.commands.push_back("chmod +x " + script_name);
      directives.push_back("COPY " + script_name + " /tmp");
      directives.push_back("RUN /tmp/" + script_name);
    }

    auto const docker_commands{ c.get_docker_commands(in.os, in.arch) };
    for (auto const &directive : docker_commands) {
      if (!directive.empty()) { directives.push_back(directive); }
    }

    KILN_TRACE_COMPONENT_ASSEMBLED(static_cast<std::int64_t>(i),
                                   name,
                                   static_cast<std::int64_t>(assets.size()),
                                   static_cast<std::int64_t>(commands.size()),
                                   static_cast<std::int64_t>(docker_commands.size()));
    tui::debug("Assembled component %zu (%s): %zu assets, %zu commands, %zu directives",
               i,
               name.c_str(),
               assets.size(),
               commands.size(),
               docker_commands.size());
  }

  out.dockerfile = assembler_render_template(in.dockerfile_template,
                                             in.base_image,
                                             in.image_environment,
                                             directives);
  if (out.dockerfile.empty() || out.dockerfile.back() != '\n') {
    out.dockerfile.push_back('\n');
  }

  std::string_view body{ out.dockerfile };
  body.remove_suffix(1);
  out.commands.push_back(heredoc("Dockerfile", body));

  return out;
}

}  // namespace kiln
