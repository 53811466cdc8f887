#pragma once

#include "component.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace kiln {

struct staged_asset {
  std::string uri;  // fetchable reference
  asset_kind kind;
};

// Makes local assets reachable from the build executor. stage() guarantees that
// `principal` can read the result.
class asset_stager {
 public:
  virtual ~asset_stager() = default;

  virtual staged_asset stage(std::filesystem::path const &source,
                             std::string const &name,
                             std::string const &principal) = 0;

  // Shell command run inside the build workspace that retrieves `asset` into the file
  // `destination`.
  virtual std::string fetch_command(staged_asset const &asset,
                                    std::string const &destination) const = 0;
};

// Uploads into s3://bucket/prefix via the AWS SDK; the build fetches with `aws s3 cp`.
class s3_asset_stager : public asset_stager {
 public:
  explicit s3_asset_stager(std::string bucket_uri,
                           std::optional<std::string> region = std::nullopt);

  staged_asset stage(std::filesystem::path const &source,
                     std::string const &name,
                     std::string const &principal) override;
  std::string fetch_command(staged_asset const &asset,
                            std::string const &destination) const override;

 private:
  std::string bucket_uri_;
  std::optional<std::string> region_;
};

// Copies into a local directory; used by the local executor backend.
class local_asset_stager : public asset_stager {
 public:
  explicit local_asset_stager(std::filesystem::path directory);

  staged_asset stage(std::filesystem::path const &source,
                     std::string const &name,
                     std::string const &principal) override;
  std::string fetch_command(staged_asset const &asset,
                            std::string const &destination) const override;

  std::filesystem::path const &directory() const { return directory_; }
  std::vector<std::string> const &readers() const { return readers_; }

 private:
  std::filesystem::path directory_;
  std::vector<std::string> readers_;
};

// Object name for a staged asset: "<name>-<first 16 of digest>", plus ".zip" for archives.
std::string asset_stager_object_name(std::filesystem::path const &source,
                                     std::string const &name);

}  // namespace kiln
