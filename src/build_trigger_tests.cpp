#include "build_trigger.h"

#include "errors.h"
#include "recipe.h"
#include "test_support.h"

#include "doctest.h"

#include <stdexcept>
#include <string>

namespace kiln {
namespace {

builder_config sample_config(std::string name = "python") {
  builder_config cfg;
  cfg.name = std::move(name);
  cfg.repository = { .name = "python",
                     .uri = "123456789012.dkr.ecr.us-east-1.amazonaws.com/python",
                     .arn = "arn:aws:ecr:us-east-1:123456789012:repository/python" };
  return cfg;
}

struct fixture {
  static_component python{ "python", {}, { "apt-get install -y python3" }, {} };
  static_component git{ "git", {}, { "apt-get install -y git" }, { "ENV GIT=1" } };
  test::recording_stager stager;
  test::recording_backend backend;
  static_registry registry{ sample_config().repository };
};

correlation_ids correlated(std::string request_id) {
  return { .stack_id = "stack",
           .request_id = std::move(request_id),
           .logical_resource_id = "Image",
           .response_url = "https://signal.example.com" };
}

}  // namespace

TEST_CASE("build_trigger rejects Windows with zero remote calls") {
  fixture f;
  auto cfg{ sample_config() };
  cfg.os = target_os::windows;

  CHECK_THROWS_AS(build_trigger(cfg, { &f.python }, f.stager, f.registry, f.backend),
                  configuration_error);
  CHECK(f.backend.remote_calls() == 0);
  CHECK(f.stager.calls.empty());
  CHECK(f.registry.grants().empty());
}

TEST_CASE("build_trigger rejects a backend that cannot build the target") {
  fixture f;
  build_trigger trigger{ sample_config(), { &f.python }, f.stager, f.registry, f.backend };
  CHECK_NOTHROW(trigger.bind());

  struct arm_less : test::recording_backend {
    bool supports(target_os, target_arch arch) const override {
      return arch == target_arch::x86_64;
    }
  } x86_only;
  auto cfg{ sample_config("python-arm") };
  cfg.arch = target_arch::arm64;
  build_trigger arm{ cfg, { &f.python }, f.stager, f.registry, x86_only };
  CHECK_THROWS_AS(arm.bind(), configuration_error);
  CHECK(x86_only.remote_calls() == 0);
}

TEST_CASE("build_trigger option validation") {
  fixture f;
  auto cfg{ sample_config() };

  SUBCASE("bad name") { cfg.name = "my builder"; }
  SUBCASE("empty name") { cfg.name.clear(); }
  SUBCASE("zero timeout") { cfg.timeout = std::chrono::minutes{ 0 }; }
  SUBCASE("sub-minute interval") { cfg.rebuild_interval = std::chrono::seconds{ 30 }; }

  CHECK_THROWS_AS(build_trigger(cfg, {}, f.stager, f.registry, f.backend),
                  configuration_error);
}

TEST_CASE("build_trigger compute options") {
  fixture f;
  auto cfg{ sample_config() };
  cfg.build_image = "my/custom:1";
  cfg.compute_type = "BUILD_GENERAL1_LARGE";
  build_trigger trigger{ cfg, {}, f.stager, f.registry, f.backend };

  CHECK(trigger.compute().build_image == "my/custom:1");
  CHECK(trigger.compute().compute_type == "BUILD_GENERAL1_LARGE");
  CHECK(trigger.principal() == "kiln-python-executor");
}

TEST_CASE("build_trigger bind registers one job and is memoized") {
  fixture f;
  build_trigger trigger{ sample_config(), { &f.python, &f.git }, f.stager, f.registry,
                         f.backend };
  CHECK_FALSE(trigger.is_bound());
  CHECK_FALSE(trigger.job_name());
  CHECK_THROWS_AS(trigger.job(), std::logic_error);
  CHECK_THROWS_AS(trigger.assembled(), std::logic_error);

  auto const &bound{ trigger.bind() };
  CHECK(bound.job_name == "python");
  CHECK(recipe_version_is_valid(bound.recipe_version));
  CHECK(bound.image_uri == bound.repository_uri + ":" + bound.recipe_version);
  CHECK(trigger.current_recipe().component_identities().size() == 3);  // base + 2

  CHECK(trigger.assembled().dockerfile.find("apt-get install -y git") == std::string::npos);
  CHECK(trigger.assembled().dockerfile.find("ENV GIT=1") != std::string::npos);

  trigger.bind();
  CHECK(f.backend.registrations.size() == 1);
  CHECK(f.registry.grants() == std::vector<std::string>{ "kiln-python-executor" });

  auto const &job{ f.backend.jobs.at("python") };
  CHECK(build_job_env_value(job, "RECIPE_VERSION") == bound.recipe_version);
  CHECK(build_job_env_value(job, "REPO_ARN") == f.registry.arn());
}

TEST_CASE("recipe version tracks component order and base image") {
  fixture f;
  build_trigger forward{ sample_config("a"), { &f.python, &f.git }, f.stager, f.registry,
                         f.backend };
  build_trigger reversed{ sample_config("b"), { &f.git, &f.python }, f.stager, f.registry,
                          f.backend };
  build_trigger same{ sample_config("c"), { &f.python, &f.git }, f.stager, f.registry,
                      f.backend };
  auto rebased_cfg{ sample_config("d") };
  rebased_cfg.base_image = "public.ecr.aws/lts/ubuntu:24.04";
  build_trigger rebased{ rebased_cfg, { &f.python, &f.git }, f.stager, f.registry,
                         f.backend };

  auto const version{ forward.bind().recipe_version };
  CHECK(same.bind().recipe_version == version);
  CHECK(reversed.bind().recipe_version != version);
  CHECK(rebased.bind().recipe_version != version);
}

TEST_CASE("build_trigger_recipe matches bind without side effects") {
  fixture f;
  auto const cfg{ sample_config() };
  auto const preview{ build_trigger_recipe(cfg, { &f.python, &f.git }) };
  CHECK(f.stager.calls.empty());
  CHECK(f.backend.remote_calls() == 0);

  build_trigger trigger{ cfg, { &f.python, &f.git }, f.stager, f.registry, f.backend };
  CHECK(trigger.bind().recipe_version == preview.version());

  auto const direct{ recipe_for_components(
      build_trigger_base_identity(
          builder_config_base_image(cfg), cfg.arch, cfg.image_environment),
      { &f.python, &f.git },
      cfg.os,
      cfg.arch,
      cfg.dockerfile_template) };
  CHECK(direct.version() == preview.version());
}

TEST_CASE("trigger_now passes correlation and deduplicates by request") {
  fixture f;
  build_trigger trigger{ sample_config(), { &f.python }, f.stager, f.registry, f.backend };

  auto const first{ trigger.trigger_now(correlated("req-1")) };
  auto const again{ trigger.trigger_now(correlated("req-1")) };
  auto const other{ trigger.trigger_now(correlated("req-2")) };
  CHECK(first == again);
  CHECK(first != other);
  REQUIRE(f.backend.starts.size() == 2);

  auto const &overrides{ f.backend.starts[0].overrides };
  env_list_t const expected{ { "STACK_ID", "stack" },
                             { "REQUEST_ID", "req-1" },
                             { "LOGICAL_RESOURCE_ID", "Image" },
                             { "RESPONSE_URL", "https://signal.example.com" } };
  CHECK(overrides == expected);

  // scheduled firings carry no request id and always start a build
  trigger.trigger_now();
  trigger.trigger_now();
  CHECK(f.backend.starts.size() == 4);
  CHECK(trigger.status(first) == build_status::succeeded);
}

TEST_CASE("build_trigger bind_ami is unsupported") {
  fixture f;
  build_trigger trigger{ sample_config(), {}, f.stager, f.registry, f.backend };
  CHECK_THROWS_AS(trigger.bind_ami(), configuration_error);
}

TEST_CASE("provisioning_properties embeds the buildspec") {
  fixture f;
  build_trigger trigger{ sample_config(), { &f.python }, f.stager, f.registry, f.backend };
  trigger.bind();

  auto const props{ trigger.provisioning_properties() };
  CHECK(props.starts_with("{\"RepoName\":\"python\",\"ProjectName\":\"python\","
                          "\"BuildSpec\":\"{\\n  \\\"version\\\": \\\"0.2\\\""));
  CHECK(props.find(trigger.current_recipe().version()) != std::string::npos);
}

}  // namespace kiln
