#pragma once

#include "assembler.h"
#include "asset_stager.h"
#include "build_job.h"
#include "builder_config.h"
#include "completion_signal.h"
#include "component.h"
#include "executor.h"
#include "recipe.h"
#include "registry.h"
#include "util.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kiln {

struct bound_image {
  std::string repository_uri;
  std::string image_uri;  // repository_uri:recipe_version
  std::string recipe_version;
  std::string job_name;
  target_os os;
  target_arch arch;
};

// One image builder: turns a component list into a registered build job and starts
// invocations of it. Independent triggers share nothing but the registry.
class build_trigger : unmovable {
 public:
  // Throws configuration_error for unsupported targets and invalid options. Makes no
  // remote calls.
  build_trigger(builder_config cfg,
                std::vector<component const *> components,
                asset_stager &stager,
                artifact_registry &registry,
                executor_backend &backend);

  // Validates, versions, stages, synthesizes and registers the job. Memoized: later calls
  // return the first result without touching collaborators again.
  bound_image const &bind();

  // Machine images are not supported by container builders.
  [[noreturn]] void bind_ami() const;

  // Starts an invocation. Repeating a request id that is not the placeholder returns the
  // earlier invocation instead of starting another.
  std::string trigger_now(correlation_ids const &correlation = {});

  build_status status(std::string const &invocation_id) const;

  bool is_bound() const { return bound_.has_value(); }
  std::optional<std::string> job_name() const;
  build_job_definition const &job() const;
  recipe const &current_recipe() const;
  assembled_build const &assembled() const;

  std::string const &principal() const { return principal_; }
  builder_config const &config() const { return cfg_; }
  compute_profile const &compute() const { return compute_; }
  executor_backend &backend() const { return backend_; }
  artifact_registry const &registry() const { return registry_; }

  // Provisioning request properties: RepoName, ProjectName and the full BuildSpec, so a
  // changed recipe is rebuilt immediately instead of waiting for the schedule.
  std::string provisioning_properties() const;

 private:
  builder_config cfg_;
  std::vector<component const *> components_;
  asset_stager &stager_;
  artifact_registry &registry_;
  executor_backend &backend_;
  compute_profile compute_;
  std::string principal_;

  std::optional<recipe> recipe_;
  std::optional<build_job_definition> job_;
  std::optional<assembled_build> assembled_;
  std::optional<bound_image> bound_;
  std::map<std::string, std::string> invocations_by_request_;
};

// Identity of the image base (parent image, environment, architecture); heads the
// recipe's identity list so changing any of them produces a new version.
std::string build_trigger_base_identity(std::string_view base_image,
                                        target_arch arch,
                                        env_list_t const &environment);

// Recipe a builder binds to, computed without staging or registering anything.
recipe build_trigger_recipe(builder_config const &cfg,
                            std::vector<component const *> const &components);

}  // namespace kiln
