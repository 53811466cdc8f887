#pragma once

#include <string>
#include <string_view>

namespace kiln {

// Append `value` JSON-escaped (no surrounding quotes). Control characters become \uXXXX.
void json_escape_append(std::string &out, std::string_view value);

// `value` as a quoted JSON string literal
std::string json_quote(std::string_view value);

}  // namespace kiln
