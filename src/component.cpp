#include "component.h"

#include "errors.h"
#include "sha256.h"
#include "util.h"

#include <algorithm>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace kiln {

static_component::static_component(std::string name,
                                   std::vector<asset_descriptor> assets,
                                   std::vector<std::string> commands,
                                   std::vector<std::string> docker_commands)
    : name_{ std::move(name) },
      assets_{ std::move(assets) },
      commands_{ std::move(commands) },
      docker_commands_{ std::move(docker_commands) } {}

asset_kind asset_kind_of(std::filesystem::path const &source) {
  std::error_code ec;
  auto const status{ std::filesystem::status(source, ec) };
  if (ec || !std::filesystem::exists(status)) {
    throw configuration_error("Asset does not exist: " + source.string());
  }

  if (std::filesystem::is_regular_file(status)) { return asset_kind::file; }
  if (std::filesystem::is_directory(status)) { return asset_kind::archive; }

  throw configuration_error("Unknown asset type (neither file nor directory): " +
                            source.string());
}

std::string asset_content_digest(std::filesystem::path const &source) {
  if (asset_kind_of(source) == asset_kind::file) { return sha256_hex(sha256(source)); }

  std::vector<std::pair<std::string, std::string>> entries;
  std::error_code ec;
  for (std::filesystem::recursive_directory_iterator it{ source, ec }, end; it != end;
       it.increment(ec)) {
    if (ec) { break; }
    if (!it->is_regular_file()) { continue; }
    auto const rel{ std::filesystem::relative(it->path(), source).generic_string() };
    entries.emplace_back(rel, sha256_hex(sha256(it->path())));
  }
  if (ec) {
    throw std::runtime_error("asset_content_digest: failed to walk " + source.string() +
                             ": " + ec.message());
  }

  std::sort(entries.begin(), entries.end());

  std::string listing;
  for (auto const &[rel, digest] : entries) {
    listing.append(rel);
    listing.push_back('\0');
    listing.append(digest);
    listing.push_back('\n');
  }
  return sha256_hex(sha256_string(listing));
}

void component_validate_name(std::string const &name) {
  if (name.empty()) { throw configuration_error("Component name must not be empty"); }

  for (char const c : name) {
    bool const ok{ (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                   (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-' };
    if (!ok) {
      throw configuration_error("Component name '" + name +
                                "' may only contain letters, digits, '.', '_' and '-'");
    }
  }
}

std::string component_identity(component const &c, target_os os, target_arch arch) {
  auto const assets{ c.get_assets(os, arch) };
  auto const commands{ c.get_commands(os, arch) };
  auto const directives{ c.get_docker_commands(os, arch) };

  std::string canonical{ "kiln.component.v2\n" };
  canonical += "name=" + util_length_prefixed(c.name()) + "\n";

  canonical += "assets=" + std::to_string(assets.size()) + "\n";
  // Source paths are machine-local; the asset is identified by its shape and contents.
  for (auto const &asset : assets) {
    char const *const kind{ asset_kind_of(asset.source) == asset_kind::archive ? "archive"
                                                                               : "file" };
    canonical += "asset=" + std::string(kind) + "|" + util_length_prefixed(asset.target) +
                 "|" + asset_content_digest(asset.source) + "\n";
  }

  canonical += "commands=" + std::to_string(commands.size()) + "\n";
  for (auto const &command : commands) {
    canonical += "command=" + util_length_prefixed(command) + "\n";
  }

  canonical += "directives=" + std::to_string(directives.size()) + "\n";
  for (auto const &directive : directives) {
    canonical += "directive=" + util_length_prefixed(directive) + "\n";
  }

  return sha256_hex(sha256_string(canonical));
}

}  // namespace kiln
