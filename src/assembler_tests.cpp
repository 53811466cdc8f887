#include "assembler.h"

#include "errors.h"
#include "test_support.h"
#include "util.h"

#include "doctest.h"

#include <algorithm>
#include <string>
#include <vector>

namespace kiln {
namespace {

bool has_blank_line(std::string const &text) {
  return text.find("\n\n") != std::string::npos || text.starts_with("\n");
}

}  // namespace

TEST_CASE("assemble single component with one file asset and one command") {
  test::temp_dir_guard tmp{ "kiln-assembler" };
  util_write_file(tmp.path / "requirements.txt", "requests==2.31\n");

  static_component const python{ "python",
                                 { { tmp.path / "requirements.txt", "/opt/requirements.txt" } },
                                 { "pip install -r /opt/requirements.txt" },
                                 {} };
  test::recording_stager stager;

  auto const out{ assemble({ .components = { &python },
                             .os = target_os::linux_ubuntu,
                             .arch = target_arch::x86_64,
                             .base_image = "public.ecr.aws/lts/ubuntu:22.04",
                             .principal = "kiln-demo-executor" },
                           stager) };

  REQUIRE(out.commands.size() == 4);
  CHECK(out.commands[0].starts_with("fetch fake://asset0-python-0-"));
  CHECK(out.commands[0].ends_with(" asset0-python-0"));
  CHECK(out.commands[1] ==
        "cat > component0-python.sh <<'EOFKILNDOCKERFILE'\n"
        "#!/bin/bash\n"
        "set -exuo pipefail\n"
        "pip install -r /opt/requirements.txt\n"
        "EOFKILNDOCKERFILE");
  CHECK(out.commands[2] == "chmod +x component0-python.sh");
  CHECK(out.commands[3].starts_with("cat > Dockerfile <<'EOFKILNDOCKERFILE'\n"));

  CHECK(out.dockerfile ==
        "FROM public.ecr.aws/lts/ubuntu:22.04\n"
        "VOLUME /var/lib/docker\n"
        "COPY asset0-python-0 /opt/requirements.txt\n"
        "COPY component0-python.sh /tmp\n"
        "RUN /tmp/component0-python.sh\n");

  REQUIRE(stager.calls.size() == 1);
  CHECK(stager.calls[0].name == "asset0-python-0");
  CHECK(stager.calls[0].principal == "kiln-demo-executor");
}

TEST_CASE("assemble stages directories as archives") {
  test::temp_dir_guard tmp{ "kiln-assembler" };
  util_write_file(tmp.path / "conf" / "a.conf", "a");

  static_component const conf{ "conf", { { tmp.path / "conf", "/etc/conf" } }, {}, {} };
  test::recording_stager stager;

  auto const out{ assemble({ .components = { &conf }, .base_image = "ubuntu" }, stager) };

  REQUIRE(out.commands.size() == 3);
  CHECK(out.commands[0].ends_with(" asset0-conf-0.zip"));
  CHECK(out.commands[1] == "unzip asset0-conf-0.zip -d \"asset0-conf-0\"");
  CHECK(out.dockerfile.find("COPY asset0-conf-0 /etc/conf\n") != std::string::npos);
}

TEST_CASE("assemble is deterministic") {
  static_component const a{ "a", {}, { "echo a" }, { "ENV A=1" } };
  static_component const b{ "b", {}, { "echo b", "echo bb" }, {} };
  assembler_input const in{ .components = { &a, &b },
                            .base_image = "ubuntu",
                            .image_environment = { { "LANG", "C.UTF-8" } } };

  test::recording_stager stager;
  auto const first{ assemble(in, stager) };
  auto const second{ assemble(in, stager) };
  CHECK(first.commands == second.commands);
  CHECK(first.dockerfile == second.dockerfile);
  CHECK(first.dockerfile.find("ENV LANG=\"C.UTF-8\"\n") != std::string::npos);
}

TEST_CASE("assemble with components contributing nothing") {
  static_component const empty{ "empty", {}, {}, {} };
  static_component const blank_directive{ "blank", {}, {}, { "" } };
  test::recording_stager stager;

  SUBCASE("no components at all") {
    auto const out{ assemble({ .base_image = "ubuntu" }, stager) };
    REQUIRE(out.commands.size() == 1);
    CHECK(out.dockerfile == "FROM ubuntu\nVOLUME /var/lib/docker\n");
  }

  SUBCASE("empty contributions emit no scripts and no blank lines") {
    auto const out{
      assemble({ .components = { &empty, &blank_directive }, .base_image = "ubuntu" }, stager)
    };
    CHECK(out.commands.size() == 1);
    CHECK_FALSE(has_blank_line(out.dockerfile));
    CHECK(std::none_of(out.commands.begin(), out.commands.end(), [](auto const &c) {
      return c.find("chmod") != std::string::npos;
    }));
  }

  CHECK(stager.calls.empty());
}

TEST_CASE("assembler_validate rejects bad input before staging") {
  test::temp_dir_guard tmp{ "kiln-assembler" };
  util_write_file(tmp.path / "f", "x");
  test::recording_stager stager;

  SUBCASE("assets on Windows") {
    static_component const c{ "c", { { tmp.path / "f", "C:/f" } }, {}, {} };
    CHECK_THROWS_AS(
        assemble({ .components = { &c }, .os = target_os::windows, .base_image = "w" }, stager),
        configuration_error);
  }

  SUBCASE("missing asset") {
    static_component const c{ "c", { { tmp.path / "missing", "/x" } }, {}, {} };
    CHECK_THROWS_AS(assemble({ .components = { &c }, .base_image = "u" }, stager),
                    configuration_error);
  }

  SUBCASE("asset without target") {
    static_component const c{ "c", { { tmp.path / "f", "" } }, {}, {} };
    CHECK_THROWS_AS(assemble({ .components = { &c }, .base_image = "u" }, stager),
                    configuration_error);
  }

  SUBCASE("command containing the heredoc marker") {
    static_component const c{ "c", {}, { "echo\nEOFKILNDOCKERFILE\nrm -rf /" }, {} };
    CHECK_THROWS_AS(assemble({ .components = { &c }, .base_image = "u" }, stager),
                    configuration_error);
  }

  SUBCASE("template without a placeholder") {
    CHECK_THROWS_AS(assemble({ .base_image = "u", .dockerfile_template = "FROM scratch\n" },
                             stager),
                    configuration_error);
  }

  SUBCASE("directive containing the heredoc marker") {
    static_component const c{ "c", {}, {}, { "LABEL a=b\nEOFKILNDOCKERFILE" } };
    CHECK_THROWS_AS(assemble({ .components = { &c }, .base_image = "u" }, stager),
                    configuration_error);
  }

  SUBCASE("asset target with a line break") {
    static_component const c{ "c", { { tmp.path / "f", "/x\nRUN id" } }, {}, {} };
    CHECK_THROWS_AS(assemble({ .components = { &c }, .base_image = "u" }, stager),
                    configuration_error);
  }

  SUBCASE("base image with a line break") {
    CHECK_THROWS_AS(assemble({ .base_image = "ubuntu\nEOFKILNDOCKERFILE" }, stager),
                    configuration_error);
  }

  SUBCASE("template containing the heredoc marker") {
    std::string const tmpl{ std::string(kDefaultDockerfileTemplate) + "EOFKILNDOCKERFILE\n" };
    CHECK_THROWS_AS(assemble({ .base_image = "u", .dockerfile_template = tmpl }, stager),
                    configuration_error);
  }

  SUBCASE("environment key that is not an identifier") {
    env_list_t const env{ { "MY VAR", "x" } };
    CHECK_THROWS_AS(assemble({ .base_image = "u", .image_environment = env }, stager),
                    configuration_error);
  }

  SUBCASE("environment value with a line break") {
    env_list_t const env{ { "A", "one\nEOFKILNDOCKERFILE\nrm -rf /" } };
    CHECK_THROWS_AS(assemble({ .base_image = "u", .image_environment = env }, stager),
                    configuration_error);
  }

  SUBCASE("empty base image") {
    CHECK_THROWS_AS(assemble({}, stager), configuration_error);
  }

  CHECK(stager.calls.empty());
}

TEST_CASE("assembler_render_template keeps non-placeholder lines") {
  auto const rendered{ assembler_render_template(
      "FROM {{{ imagebuilder:parentImage }}} AS base\n"
      "  {{{ imagebuilder:environments }}}\n"
      "LABEL x=y\n"
      "{{{ imagebuilder:components }}}\n",
      "alpine",
      {},
      { "RUN true" }) };
  CHECK(rendered == "FROM alpine AS base\nLABEL x=y\nRUN true\n");
}

TEST_CASE("assembler_render_template quotes environment values") {
  env_list_t const env{ { "GREETING", "hello world" },
                        { "PATH", "/opt/bin:$PATH" },
                        { "QUOTED", "say \"hi\" \\o/" } };
  auto const rendered{ assembler_render_template(
      kDefaultDockerfileTemplate, "ubuntu", env, {}) };

  CHECK(rendered.find("ENV GREETING=\"hello world\"\n") != std::string::npos);
  CHECK(rendered.find("ENV PATH=\"/opt/bin:$PATH\"\n") != std::string::npos);
  CHECK(rendered.find("ENV QUOTED=\"say \\\"hi\\\" \\\\o/\"\n") != std::string::npos);
}

TEST_CASE("assembler_validate_environment") {
  env_list_t const good{ { "_PRIVATE", "x" }, { "LANG", "C.UTF-8" }, { "V2", "" } };
  CHECK_NOTHROW(assembler_validate_environment(good));

  env_list_t const leading_digit{ { "2FA", "x" } };
  CHECK_THROWS_AS(assembler_validate_environment(leading_digit), configuration_error);

  env_list_t const empty_key{ { "", "x" } };
  CHECK_THROWS_AS(assembler_validate_environment(empty_key), configuration_error);

  env_list_t const carriage_return{ { "A", "x\ry" } };
  CHECK_THROWS_AS(assembler_validate_environment(carriage_return), configuration_error);
}

}  // namespace kiln
