#include "sol_util.h"

namespace kiln {

sol_state_ptr sol_util_make_lua_state() {
  auto lua{ std::make_unique<sol::state>() };
  lua->open_libraries(sol::lib::base,
                      sol::lib::string,
                      sol::lib::table,
                      sol::lib::math,
                      sol::lib::os,
                      sol::lib::debug);

  // error() and assert() carry a stack trace so manifest mistakes point at a line
  lua->script(R"lua(
do
  local orig_error = error
  local orig_assert = assert

  _G.error = function(message, level)
    level = (level or 1) + 1
    return orig_error(debug.traceback(tostring(message), level), 0)
  end

  _G.assert = function(condition, message, ...)
    if not condition then
      message = message or "assertion failed"
      return orig_assert(false, debug.traceback(tostring(message), 2))
    end
    return condition, message, ...
  end
end
)lua");

  return lua;
}

std::vector<std::string> sol_util_get_string_array(sol::table const &table,
                                                   std::string_view key,
                                                   std::string_view context) {
  auto const array{ sol_util_get_optional<sol::table>(table, key, context) };
  if (!array) { return {}; }

  std::vector<std::string> out;
  std::size_t const count{ array->size() };
  out.reserve(count);
  for (std::size_t i{ 1 }; i <= count; ++i) {
    sol::object const entry{ (*array)[i] };
    if (!entry.is<std::string>()) {
      throw configuration_error(std::string(context) + ": " + std::string(key) + "[" +
                                std::to_string(i) + "] must be a string");
    }
    out.push_back(entry.as<std::string>());
  }
  return out;
}

}  // namespace kiln
