#include "recipe.h"

#include "errors.h"
#include "sha256.h"
#include "trace.h"
#include "util.h"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace kiln {

char const kDefaultDockerfileTemplate[]{
  "FROM {{{ imagebuilder:parentImage }}}\n"
  "VOLUME /var/lib/docker\n"
  "{{{ imagebuilder:environments }}}\n"
  "{{{ imagebuilder:components }}}\n"
};

recipe::recipe(std::string platform,
               std::vector<std::string> component_identities,
               std::string dockerfile_template)
    : platform_{ std::move(platform) },
      identities_{ std::move(component_identities) },
      template_{ std::move(dockerfile_template) } {
  recipe_validate_template(template_);
  version_ = recipe_version(platform_, identities_, template_);
  KILN_TRACE_RECIPE_VERSIONED(platform_,
                              static_cast<std::int64_t>(identities_.size()),
                              version_);
}

std::string recipe::canonical() const {
  return recipe_serialize(platform_, identities_, template_);
}

std::string recipe_serialize(std::string_view platform,
                             std::vector<std::string> const &component_identities,
                             std::string_view dockerfile_template) {
  std::string out{ "kiln.recipe.v1\n" };
  out += "platform=" + util_length_prefixed(platform) + "\n";
  out += "components=" + std::to_string(component_identities.size()) + "\n";
  for (auto const &identity : component_identities) {
    out += "component=" + util_length_prefixed(identity) + "\n";
  }
  out += "template=" + util_length_prefixed(dockerfile_template) + "\n";
  return out;
}

std::string recipe_version(std::string_view platform,
                           std::vector<std::string> const &component_identities,
                           std::string_view dockerfile_template) {
  auto const canonical{ recipe_serialize(platform, component_identities, dockerfile_template) };
  return sha256_hex(sha256_string(canonical)).substr(0, kRecipeVersionLength);
}

bool recipe_version_is_valid(std::string_view token) {
  if (token.size() != kRecipeVersionLength) { return false; }
  for (char const c : token) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) { return false; }
  }
  return true;
}

void recipe_validate_template(std::string_view dockerfile_template) {
  for (auto const placeholder : kRequiredTemplatePlaceholders) {
    if (dockerfile_template.find(placeholder) == std::string_view::npos) {
      throw configuration_error("Dockerfile template is missing required placeholder " +
                                std::string{ placeholder });
    }
  }
}

recipe recipe_for_components(std::string base_identity,
                             std::vector<component const *> const &components,
                             target_os os,
                             target_arch arch,
                             std::string dockerfile_template) {
  std::vector<std::string> identities;
  identities.reserve(components.size() + 1);
  identities.push_back(std::move(base_identity));
  for (auto const *c : components) {
    if (!c) { throw std::invalid_argument("recipe_for_components: null component"); }
    identities.push_back(component_identity(*c, os, arch));
  }

  return recipe{ std::string{ target_platform_tag(os) },
                 std::move(identities),
                 std::move(dockerfile_template) };
}

}  // namespace kiln
