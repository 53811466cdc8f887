#pragma once

#include "target.h"

#include <filesystem>
#include <string>
#include <vector>

namespace kiln {

struct asset_descriptor {
  std::filesystem::path source;  // local file or directory
  std::string target;            // absolute path inside the image
};

// Pluggable contributor to an image build. Queries must be free of side effects;
// staging and uploads happen through the asset stager, never inside a component.
class component {
 public:
  virtual ~component() = default;

  virtual std::string const &name() const = 0;

  virtual std::vector<asset_descriptor> get_assets(target_os os, target_arch arch) const = 0;
  virtual std::vector<std::string> get_commands(target_os os, target_arch arch) const = 0;
  virtual std::vector<std::string> get_docker_commands(target_os os,
                                                       target_arch arch) const = 0;
};

// Component whose contributions are fixed at construction, independent of target.
class static_component : public component {
 public:
  static_component(std::string name,
                   std::vector<asset_descriptor> assets,
                   std::vector<std::string> commands,
                   std::vector<std::string> docker_commands);

  std::string const &name() const override { return name_; }

  std::vector<asset_descriptor> get_assets(target_os, target_arch) const override {
    return assets_;
  }
  std::vector<std::string> get_commands(target_os, target_arch) const override {
    return commands_;
  }
  std::vector<std::string> get_docker_commands(target_os, target_arch) const override {
    return docker_commands_;
  }

 private:
  std::string name_;
  std::vector<asset_descriptor> assets_;
  std::vector<std::string> commands_;
  std::vector<std::string> docker_commands_;
};

enum class asset_kind { file, archive };

// Regular file -> file, directory -> archive. Anything else (missing, socket, device)
// is a configuration_error.
asset_kind asset_kind_of(std::filesystem::path const &source);

// Content digest (hex SHA-256) of an asset: file bytes, or for a directory the sorted
// listing of relative paths and per-file digests.
std::string asset_content_digest(std::filesystem::path const &source);

// Names end up in file names inside the build; restrict to [A-Za-z0-9._-].
void component_validate_name(std::string const &name);

// Hex SHA-256 over the component's full contribution for the given target.
std::string component_identity(component const &c, target_os os, target_arch arch);

}  // namespace kiln
