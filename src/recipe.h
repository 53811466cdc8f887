#pragma once

#include "component.h"
#include "target.h"

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace kiln {

inline constexpr std::string_view kPlaceholderParentImage{
  "{{{ imagebuilder:parentImage }}}"
};
inline constexpr std::string_view kPlaceholderEnvironments{
  "{{{ imagebuilder:environments }}}"
};
inline constexpr std::string_view kPlaceholderComponents{
  "{{{ imagebuilder:components }}}"
};

inline constexpr std::array<std::string_view, 3> kRequiredTemplatePlaceholders{
  kPlaceholderParentImage,
  kPlaceholderEnvironments,
  kPlaceholderComponents,
};

extern char const kDefaultDockerfileTemplate[];

// Version tokens are the first 16 lowercase hex characters of a SHA-256 digest.
inline constexpr std::size_t kRecipeVersionLength{ 16 };

// Versioned build recipe: platform tag, ordered component identities, image template.
// Immutable; a changed input is a new recipe with a new version.
class recipe {
 public:
  // Throws configuration_error if the template lacks a required placeholder.
  recipe(std::string platform,
         std::vector<std::string> component_identities,
         std::string dockerfile_template);

  std::string const &platform() const { return platform_; }
  std::vector<std::string> const &component_identities() const { return identities_; }
  std::string const &dockerfile_template() const { return template_; }
  std::string const &version() const { return version_; }

  // Canonical serialization the version is derived from
  std::string canonical() const;

 private:
  std::string platform_;
  std::vector<std::string> identities_;
  std::string template_;
  std::string version_;
};

std::string recipe_serialize(std::string_view platform,
                             std::vector<std::string> const &component_identities,
                             std::string_view dockerfile_template);

// Pure and deterministic: equal inputs give byte-identical tokens across runs.
std::string recipe_version(std::string_view platform,
                           std::vector<std::string> const &component_identities,
                           std::string_view dockerfile_template);

bool recipe_version_is_valid(std::string_view token);

void recipe_validate_template(std::string_view dockerfile_template);

// The only path from a builder to its recipe: `base_identity` (base image, architecture,
// image environment) leads, followed by each component's identity in order.
recipe recipe_for_components(std::string base_identity,
                             std::vector<component const *> const &components,
                             target_os os,
                             target_arch arch,
                             std::string dockerfile_template);

}  // namespace kiln
