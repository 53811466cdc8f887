#include "registry.h"

#include "errors.h"

#include <algorithm>
#include <utility>

namespace kiln {

static_registry::static_registry(registry_info info) : info_{ std::move(info) } {
  if (info_.name.empty()) { throw configuration_error("Repository name is required"); }
  if (info_.uri.empty()) {
    throw configuration_error("Repository '" + info_.name + "' has no URI");
  }
  if (info_.arn.empty()) { info_.arn = info_.uri; }
}

void static_registry::grant_pull_push(std::string const &principal) {
  if (std::find(grants_.begin(), grants_.end(), principal) == grants_.end()) {
    grants_.push_back(principal);
  }
}

std::string registry_login_host(std::string_view uri) {
  auto const slash{ uri.find('/') };
  return std::string{ uri.substr(0, slash) };
}

}  // namespace kiln
