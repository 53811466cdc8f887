#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace kiln {

void libcurl_ensure_initialized();

// HTTP PUT of `body`. Headers use curl syntax ("Name: value", "Name;" for an empty value).
// Throws std::runtime_error on transport failure or an HTTP status >= 400.
long libcurl_put(std::string_view url,
                 std::string_view body,
                 std::vector<std::string> const &headers = {});

}  // namespace kiln
