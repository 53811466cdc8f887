#include "lua_component.h"

#include "errors.h"
#include "sol_util.h"
#include "test_support.h"
#include "util.h"

#include "doctest.h"

#include <filesystem>
#include <string>
#include <vector>

namespace kiln {
namespace {

sol::table eval_table(sol::state &lua, char const *script) {
  lua.script(std::string("decl = ") + script);
  return lua["decl"];
}

}  // namespace

TEST_CASE("lua_component with static tables") {
  auto lua{ sol_util_make_lua_state() };
  auto decl{ eval_table(*lua, R"lua({
    NAME = 'python',
    ASSETS = { { source = 'files/requirements.txt', target = '/opt/req.txt' } },
    COMMANDS = { 'apt-get update', 'apt-get install -y python3' },
  })lua") };

  lua_component const c{ decl, "/work/builder", "python.lua" };
  CHECK(c.name() == "python");

  auto const assets{ c.get_assets(target_os::linux_ubuntu, target_arch::x86_64) };
  REQUIRE(assets.size() == 1);
  CHECK(assets[0].source == std::filesystem::path("/work/builder/files/requirements.txt"));
  CHECK(assets[0].target == "/opt/req.txt");

  std::vector<std::string> const expected{ "apt-get update", "apt-get install -y python3" };
  CHECK(c.get_commands(target_os::linux_ubuntu, target_arch::x86_64) == expected);
  CHECK(c.get_docker_commands(target_os::linux_ubuntu, target_arch::x86_64).empty());
}

TEST_CASE("lua_component functions receive os and arch") {
  auto lua{ sol_util_make_lua_state() };
  auto decl{ eval_table(*lua, R"lua({
    NAME = 'arch-aware',
    COMMANDS = function(os, arch) return { 'echo ' .. os .. ' ' .. arch } end,
    DOCKER_COMMANDS = function(os, arch)
      if arch == 'arm64' then return { 'ENV ARM=1' } end
    end,
  })lua") };

  lua_component const c{ decl, "/", "inline" };
  auto const x86{ c.get_commands(target_os::linux_amazon_2023, target_arch::x86_64) };
  REQUIRE(x86.size() == 1);
  CHECK(x86[0] == "echo linux-amazon-2023 x86_64");

  CHECK(c.get_docker_commands(target_os::linux_ubuntu, target_arch::x86_64).empty());
  auto const arm{ c.get_docker_commands(target_os::linux_ubuntu, target_arch::arm64) };
  REQUIRE(arm.size() == 1);
  CHECK(arm[0] == "ENV ARM=1");
}

TEST_CASE("lua_component validation") {
  auto lua{ sol_util_make_lua_state() };

  SUBCASE("missing NAME") {
    auto decl{ eval_table(*lua, "{ COMMANDS = {} }") };
    CHECK_THROWS_WITH_AS(lua_component(decl, "/", "ctx"),
                         "ctx: NAME is required",
                         configuration_error);
  }

  SUBCASE("bad NAME characters") {
    auto decl{ eval_table(*lua, "{ NAME = 'my component' }") };
    CHECK_THROWS_AS(lua_component(decl, "/", "ctx"), configuration_error);
  }

  SUBCASE("scalar contribution") {
    auto decl{ eval_table(*lua, "{ NAME = 'x', COMMANDS = 'echo hi' }") };
    CHECK_THROWS_WITH_AS(lua_component(decl, "/", "ctx"),
                         "ctx: COMMANDS must be a table or a function",
                         configuration_error);
  }

  SUBCASE("non-string command") {
    auto decl{ eval_table(*lua, "{ NAME = 'x', COMMANDS = { 'ok', 3 } }") };
    lua_component const c{ decl, "/", "ctx" };
    CHECK_THROWS_WITH_AS(c.get_commands(target_os::linux_ubuntu, target_arch::x86_64),
                         "ctx: COMMANDS[2] must be a string",
                         configuration_error);
  }

  SUBCASE("function errors surface with context") {
    auto decl{ eval_table(*lua, "{ NAME = 'x', COMMANDS = function() error('nope') end }") };
    lua_component const c{ decl, "/", "ctx" };
    CHECK_THROWS_AS(c.get_commands(target_os::linux_ubuntu, target_arch::x86_64),
                    configuration_error);
  }

  SUBCASE("asset without target") {
    auto decl{ eval_table(*lua, "{ NAME = 'x', ASSETS = { { source = 'a' } } }") };
    lua_component const c{ decl, "/", "ctx" };
    CHECK_THROWS_WITH_AS(c.get_assets(target_os::linux_ubuntu, target_arch::x86_64),
                         "ctx: ASSETS[1]: target is required",
                         configuration_error);
  }
}

TEST_CASE("lua_component_load isolates component files") {
  test::temp_dir_guard tmp{ "kiln-lua-component" };
  util_write_file(tmp.path / "git.lua",
                  "NAME = 'git'\n"
                  "local pkg = string.upper('git')\n"
                  "COMMANDS = { 'apt-get install -y ' .. string.lower(pkg) }\n"
                  "ASSETS = { { source = 'gitconfig', target = '/etc/gitconfig' } }\n");
  util_write_file(tmp.path / "curl.lua", "NAME = 'curl'\n");

  auto lua{ sol_util_make_lua_state() };
  auto const git{ lua_component_load(*lua, tmp.path / "git.lua") };
  auto const curl{ lua_component_load(*lua, tmp.path / "curl.lua") };

  CHECK(git->name() == "git");
  auto const commands{ git->get_commands(target_os::linux_ubuntu, target_arch::x86_64) };
  REQUIRE(commands.size() == 1);
  CHECK(commands[0] == "apt-get install -y git");
  auto const assets{ git->get_assets(target_os::linux_ubuntu, target_arch::x86_64) };
  REQUIRE(assets.size() == 1);
  CHECK(assets[0].source == (tmp.path / "gitconfig").lexically_normal());

  // curl.lua never assigned COMMANDS; git's must not leak into it
  CHECK(curl->get_commands(target_os::linux_ubuntu, target_arch::x86_64).empty());
  sol::object const leaked{ (*lua)["NAME"] };
  CHECK(leaked.get_type() == sol::type::lua_nil);

  CHECK_THROWS_AS(lua_component_load(*lua, tmp.path / "missing.lua"), configuration_error);
}

}  // namespace kiln
