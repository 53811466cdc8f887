#pragma once

#include <stdexcept>

namespace kiln {

// Invalid builder configuration. Always raised during synthesis, before any remote call.
class configuration_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace kiln
