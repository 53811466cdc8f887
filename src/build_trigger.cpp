#include "build_trigger.h"

#include "assembler.h"
#include "errors.h"
#include "json_util.h"
#include "scheduler.h"
#include "sha256.h"
#include "trace.h"
#include "tui.h"

#include <stdexcept>
#include <utility>

namespace kiln {

std::string build_trigger_base_identity(std::string_view base_image,
                                        target_arch arch,
                                        env_list_t const &environment) {
  std::string canonical{ "kiln.base.v1\n" };
  canonical += "image=" + util_length_prefixed(base_image) + "\n";
  canonical += "arch=" + util_length_prefixed(target_arch_name(arch)) + "\n";
  canonical += "env=" + std::to_string(environment.size()) + "\n";
  for (auto const &[key, value] : environment) {
    canonical += "var=" + util_length_prefixed(key) + "|" + util_length_prefixed(value) + "\n";
  }
  return sha256_hex(sha256_string(canonical));
}

build_trigger::build_trigger(builder_config cfg,
                             std::vector<component const *> components,
                             asset_stager &stager,
                             artifact_registry &registry,
                             executor_backend &backend)
    : cfg_{ std::move(cfg) },
      components_{ std::move(components) },
      stager_{ stager },
      registry_{ registry },
      backend_{ backend } {
  if (cfg_.name.empty()) { throw configuration_error("Builder name is required"); }
  for (char const c : cfg_.name) {
    bool const ok{ (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                   (c >= '0' && c <= '9') || c == '-' || c == '_' };
    if (!ok) {
      throw configuration_error("Builder name '" + cfg_.name +
                                "' may only contain letters, digits, '-' and '_'");
    }
  }

  compute_ = build_job_default_compute(cfg_.os, cfg_.arch);
  if (cfg_.build_image) { compute_.build_image = *cfg_.build_image; }
  if (!cfg_.compute_type.empty()) { compute_.compute_type = cfg_.compute_type; }

  if (cfg_.timeout.count() <= 0) {
    throw configuration_error("Builder '" + cfg_.name + "' timeout must be positive");
  }

  if (cfg_.rebuild_interval.count() != 0) {
    schedule_rate_expression(cfg_.rebuild_interval);  // reject bad intervals up front
  }

  principal_ = "kiln-" + cfg_.name + "-executor";
}

bound_image const &build_trigger::bind() {
  if (bound_) { return *bound_; }

  if (!backend_.supports(cfg_.os, cfg_.arch)) {
    throw configuration_error("Executor backend '" + std::string(backend_.name()) +
                              "' cannot build " + std::string(target_os_name(cfg_.os)) +
                              "/" + std::string(target_arch_name(cfg_.arch)) + " images");
  }

  assembler_input const input{
    .components = components_,
    .os = cfg_.os,
    .arch = cfg_.arch,
    .base_image = builder_config_base_image(cfg_),
    .dockerfile_template = cfg_.dockerfile_template,
    .image_environment = cfg_.image_environment,
    .principal = principal_,
  };
  assembler_validate(input);

  auto versioned{ build_trigger_recipe(cfg_, components_) };

  tui::info("Builder %s: recipe version %s (%zu components)",
            cfg_.name.c_str(),
            versioned.version().c_str(),
            components_.size());

  auto assembled{ assemble(input, stager_) };

  auto def{ build_job_synthesize(build_job_inputs{
      .name = cfg_.name,
      .description = "Build container image " + registry_.name() + " (" +
                     std::string(target_os_name(cfg_.os)) + "/" +
                     std::string(target_arch_name(cfg_.arch)) + ")",
      .os = cfg_.os,
      .arch = cfg_.arch,
      .recipe_version = versioned.version(),
      .registry_uri = registry_.uri(),
      .registry_arn = registry_.arn(),
      .assembled = assembled,
      .compute = compute_,
      .network = cfg_.network,
      .timeout = cfg_.timeout,
      .log_sink = cfg_.log_sink,
      .principal = principal_,
  }) };

  backend_.register_job(def);
  registry_.grant_pull_push(principal_);

  bound_ = bound_image{
    .repository_uri = registry_.uri(),
    .image_uri = registry_.uri() + ":" + versioned.version(),
    .recipe_version = versioned.version(),
    .job_name = def.name,
    .os = cfg_.os,
    .arch = cfg_.arch,
  };
  recipe_.emplace(std::move(versioned));
  job_.emplace(std::move(def));
  assembled_.emplace(std::move(assembled));
  return *bound_;
}

void build_trigger::bind_ami() const {
  throw configuration_error("Builder '" + cfg_.name +
                            "' builds container images and cannot build machine images");
}

std::string build_trigger::trigger_now(correlation_ids const &correlation) {
  auto const &bound{ bind() };

  bool const correlated{ correlation.request_id != kUnspecified };
  if (correlated) {
    if (auto const it{ invocations_by_request_.find(correlation.request_id) };
        it != invocations_by_request_.end()) {
      tui::debug("Request %s already started invocation %s",
                 correlation.request_id.c_str(),
                 it->second.c_str());
      return it->second;
    }
  }

  env_list_t const overrides{
    { "STACK_ID", correlation.stack_id },
    { "REQUEST_ID", correlation.request_id },
    { "LOGICAL_RESOURCE_ID", correlation.logical_resource_id },
    { "RESPONSE_URL", correlation.response_url },
  };

  auto id{ backend_.start_build(bound.job_name, overrides) };
  KILN_TRACE_BUILD_TRIGGERED(bound.job_name, id, correlation.has_endpoint());
  tui::info("Started build %s for %s", id.c_str(), bound.job_name.c_str());

  if (correlated) { invocations_by_request_.emplace(correlation.request_id, id); }
  return id;
}

build_status build_trigger::status(std::string const &invocation_id) const {
  return backend_.query_status(invocation_id);
}

std::optional<std::string> build_trigger::job_name() const {
  if (!bound_) { return std::nullopt; }
  return bound_->job_name;
}

build_job_definition const &build_trigger::job() const {
  if (!job_) { throw std::logic_error("build_trigger::job: builder not bound"); }
  return *job_;
}

assembled_build const &build_trigger::assembled() const {
  if (!assembled_) { throw std::logic_error("build_trigger::assembled: builder not bound"); }
  return *assembled_;
}

recipe const &build_trigger::current_recipe() const {
  if (!recipe_) { throw std::logic_error("build_trigger::current_recipe: builder not bound"); }
  return *recipe_;
}

std::string build_trigger::provisioning_properties() const {
  auto const &def{ job() };
  std::string out{ "{\"RepoName\":" };
  out.append(json_quote(registry_.name()));
  out.append(",\"ProjectName\":");
  out.append(json_quote(def.name));
  out.append(",\"BuildSpec\":");
  out.append(json_quote(build_job_to_buildspec_json(def)));
  out.push_back('}');
  return out;
}

recipe build_trigger_recipe(builder_config const &cfg,
                            std::vector<component const *> const &components) {
  return recipe_for_components(
      build_trigger_base_identity(builder_config_base_image(cfg), cfg.arch, cfg.image_environment),
      components,
      cfg.os,
      cfg.arch,
      cfg.dockerfile_template);
}

}  // namespace kiln
