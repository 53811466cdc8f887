#include "build_job.h"

#include "errors.h"
#include "json_util.h"
#include "recipe.h"
#include "registry.h"
#include "trace.h"
#include "tui.h"

#include <cstdint>
#include <string>

namespace kiln {
namespace {

constexpr char kIndexerReleases[]{
  "https://github.com/CloudSnorkel/standalone-soci-indexer/releases"
};

void append_string_array(std::string &out,
                         std::vector<std::string> const &values,
                         std::string_view indent) {
  if (values.empty()) {
    out.append("[]");
    return;
  }
  out.append("[\n");
  for (std::size_t i{ 0 }; i < values.size(); ++i) {
    out.append(indent);
    out.append("  ");
    out.append(json_quote(values[i]));
    if (i + 1 < values.size()) { out.push_back(','); }
    out.push_back('\n');
  }
  out.append(indent);
  out.push_back(']');
}

void append_phase(std::string &out,
                  char const *name,
                  std::vector<std::string> const &commands,
                  bool last) {
  out.append("    \"");
  out.append(name);
  out.append("\": {\n      \"commands\": ");
  append_string_array(out, commands, "      ");
  out.append("\n    }");
  if (!last) { out.push_back(','); }
  out.push_back('\n');
}

}  // namespace

subnet_kind subnet_kind_parse(std::string_view name) {
  if (name == "public") { return subnet_kind::public_subnet; }
  if (name == "private-with-egress") { return subnet_kind::private_with_egress; }
  if (name == "private-isolated") { return subnet_kind::private_isolated; }
  throw configuration_error(
      "Unknown subnet type: " + std::string(name) +
      " (expected public, private-with-egress or private-isolated)");
}

std::string_view subnet_kind_name(subnet_kind kind) {
  switch (kind) {
    case subnet_kind::public_subnet: return "public";
    case subnet_kind::private_with_egress: return "private-with-egress";
    case subnet_kind::private_isolated: return "private-isolated";
  }
  return "unknown";
}

compute_profile build_job_default_compute(target_os os, target_arch arch) {
  if (!target_os_is_linux(os)) {
    throw configuration_error(
        "The build executor cannot build Windows container images (docker-in-docker "
        "requires a Linux host)");
  }

  switch (arch) {
    case target_arch::x86_64:
      return compute_profile{ .build_image = "aws/codebuild/amazonlinux2-x86_64-standard:5.0" };
    case target_arch::arm64:
      return compute_profile{ .build_image =
                                  "aws/codebuild/amazonlinux2-aarch64-standard:3.0" };
  }

  throw configuration_error("Unsupported architecture for the build executor: " +
                            std::string(target_arch_name(arch)));
}

std::string_view build_job_index_arch(target_arch arch) {
  switch (arch) {
    case target_arch::x86_64: return "x86_64";
    case target_arch::arm64: return "arm64";
  }
  throw configuration_error("Unsupported architecture for the secondary index");
}

std::vector<std::string> build_job_index_commands(target_arch arch) {
  return {
    "docker rmi \"$REPO_URI\"",
    std::string("LATEST_SOCI_VERSION=`curl -w \"%{redirect_url}\" -fsS ") + kIndexerReleases +
        "/latest | grep -oE \"[^/]+$\"`",
    std::string("curl -fsSL ") + kIndexerReleases +
        "/download/${LATEST_SOCI_VERSION}/standalone-soci-indexer_Linux_" +
        std::string(build_job_index_arch(arch)) + ".tar.gz | tar xz",
    "./standalone-soci-indexer \"$REPO_URI\"",
  };
}

build_job_definition build_job_synthesize(build_job_inputs const &in) {
  if (in.name.empty()) { throw configuration_error("Build job name must not be empty"); }
  if (!recipe_version_is_valid(in.recipe_version)) {
    throw configuration_error("Invalid recipe version token: '" + in.recipe_version + "'");
  }
  if (in.registry_uri.empty()) {
    throw configuration_error("Build job '" + in.name + "' needs a repository URI");
  }
  if (in.timeout.count() <= 0) {
    throw configuration_error("Build job '" + in.name + "' timeout must be positive");
  }

  auto compute{ in.compute };
  if (compute.build_image.empty()) {
    compute.build_image = build_job_default_compute(in.os, in.arch).build_image;
  }
  if (compute.compute_type.empty()) { compute.compute_type = std::string(kDefaultComputeType); }

  if (in.network && in.network->kind == subnet_kind::private_isolated) {
    tui::warn("Build job '%s' is placed in private isolated subnets; the build will fail "
              "unless the registry and asset store are reachable through VPC endpoints",
              in.name.c_str());
  }

  build_job_definition def{
    .name = in.name,
    .description = in.description,
    .env = {
        { "REPO_ARN", in.registry_arn },
        { "REPO_URI", in.registry_uri },
        { "STACK_ID", std::string(kUnspecified) },
        { "REQUEST_ID", std::string(kUnspecified) },
        { "LOGICAL_RESOURCE_ID", std::string(kUnspecified) },
        { "RESPONSE_URL", std::string(kUnspecified) },
        { "BASH_ENV", std::string(kBashEnvScript) },
        { "RECIPE_VERSION", in.recipe_version },
    },
    .phases = {},
    .post_processing = {},
    .compute = std::move(compute),
    .network = in.network,
    .timeout = in.timeout,
    .log_sink = in.log_sink,
    .principal = in.principal,
    .recipe_version = in.recipe_version,
  };

  def.phases.pre_build = {
    "echo \"exec > >(tee -a " + std::string(kBuildLogPath) + ") 2>&1\" > " +
        std::string(kBashEnvScript),
    "aws ecr get-login-password --region \"$AWS_DEFAULT_REGION\" | docker login "
    "--username AWS --password-stdin " +
        registry_login_host(in.registry_uri),
  };

  def.phases.build = in.assembled.commands;
  def.phases.build.push_back("docker build --progress plain . -t \"$REPO_URI\"");
  def.phases.build.push_back("docker tag \"$REPO_URI\" \"$REPO_URI:$RECIPE_VERSION\"");
  def.phases.build.push_back("docker push \"$REPO_URI\"");
  def.phases.build.push_back("docker push \"$REPO_URI:$RECIPE_VERSION\"");

  def.post_processing = build_job_index_commands(in.arch);
  def.phases.post_build = completion_signal_shell_commands();
  def.phases.post_build.insert(def.phases.post_build.end(),
                               def.post_processing.begin(),
                               def.post_processing.end());

  KILN_TRACE_JOB_SYNTHESIZED(def.name,
                             def.recipe_version,
                             static_cast<std::int64_t>(def.phases.build.size()));
  return def;
}

std::string build_job_to_buildspec_json(build_job_definition const &def) {
  std::string out{ "{\n  \"version\": \"0.2\",\n  \"env\": {\n    \"variables\": {\n" };
  for (std::size_t i{ 0 }; i < def.env.size(); ++i) {
    out.append("      ");
    out.append(json_quote(def.env[i].first));
    out.append(": ");
    out.append(json_quote(def.env[i].second));
    if (i + 1 < def.env.size()) { out.push_back(','); }
    out.push_back('\n');
  }
  out.append("    },\n    \"shell\": \"bash\"\n  },\n  \"phases\": {\n");
  append_phase(out, "pre_build", def.phases.pre_build, false);
  append_phase(out, "build", def.phases.build, false);
  append_phase(out, "post_build", def.phases.post_build, true);
  out.append("  }\n}\n");
  return out;
}

std::optional<std::string> build_job_env_value(build_job_definition const &def,
                                               std::string_view name) {
  for (auto const &[key, value] : def.env) {
    if (key == name) { return value; }
  }
  return std::nullopt;
}

}  // namespace kiln
