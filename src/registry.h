#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace kiln {

// Container image repository the build pushes into.
class artifact_registry {
 public:
  virtual ~artifact_registry() = default;

  virtual std::string const &name() const = 0;
  virtual std::string const &uri() const = 0;  // host/path, no tag
  virtual std::string const &arn() const = 0;  // stable physical resource id

  virtual void grant_pull_push(std::string const &principal) = 0;
};

struct registry_info {
  std::string name;
  std::string uri;
  std::string arn;
};

// Registry described by configuration; grants are recorded, not enforced.
class static_registry : public artifact_registry {
 public:
  explicit static_registry(registry_info info);

  std::string const &name() const override { return info_.name; }
  std::string const &uri() const override { return info_.uri; }
  std::string const &arn() const override { return info_.arn; }

  void grant_pull_push(std::string const &principal) override;
  std::vector<std::string> const &grants() const { return grants_; }

 private:
  registry_info info_;
  std::vector<std::string> grants_;
};

// Host part of a repository URI: "1234.dkr.ecr.us-east-1.amazonaws.com/repo" -> "1234.dkr..."
std::string registry_login_host(std::string_view uri);

}  // namespace kiln
