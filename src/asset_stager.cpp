#include "asset_stager.h"

#include "archive_util.h"
#include "aws_util.h"
#include "tui.h"
#include "util.h"

#include <algorithm>
#include <random>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace kiln {
namespace {

constexpr std::size_t kObjectDigestLength{ 16 };

std::filesystem::path make_temp_zip_path() {
  static std::mt19937_64 rng{ std::random_device{}() };
  std::ostringstream oss;
  oss << "kiln-stage-" << std::hex << rng() << ".zip";
  return std::filesystem::temp_directory_path() / oss.str();
}

}  // namespace

std::string asset_stager_object_name(std::filesystem::path const &source,
                                     std::string const &name) {
  auto const kind{ asset_kind_of(source) };
  std::string result{ name };
  result.push_back('-');
  result.append(asset_content_digest(source).substr(0, kObjectDigestLength));
  if (kind == asset_kind::archive) { result.append(".zip"); }
  return result;
}

s3_asset_stager::s3_asset_stager(std::string bucket_uri, std::optional<std::string> region)
    : bucket_uri_{ std::move(bucket_uri) }, region_{ std::move(region) } {
  aws_parse_s3_uri(bucket_uri_);  // validate early
  while (bucket_uri_.size() > 5 && bucket_uri_.back() == '/') { bucket_uri_.pop_back(); }
}

staged_asset s3_asset_stager::stage(std::filesystem::path const &source,
                                    std::string const &name,
                                    std::string const &principal) {
  auto const kind{ asset_kind_of(source) };
  auto const parts{ aws_parse_s3_uri(bucket_uri_) };

  std::string key{ parts.key };
  if (!key.empty()) { key.push_back('/'); }
  key.append(asset_stager_object_name(source, name));

  std::filesystem::path upload_path{ source };
  scoped_path_cleanup zip_cleanup{ {} };
  if (kind == asset_kind::archive) {
    upload_path = make_temp_zip_path();
    zip_cleanup.reset(upload_path);
    archive_zip_directory(source, upload_path);
  }

  std::string const uri{ "s3://" + parts.bucket + "/" + key };
  tui::debug("Uploading %s to %s", source.string().c_str(), uri.c_str());

  aws_s3_upload(s3_upload_request{
      .source = upload_path,
      .uri = uri,
      .region = region_,
      .metadata = { { "kiln-reader", principal } },
  });

  return staged_asset{ .uri = uri, .kind = kind };
}

std::string s3_asset_stager::fetch_command(staged_asset const &asset,
                                           std::string const &destination) const {
  return "aws s3 cp " + asset.uri + " " + destination;
}

local_asset_stager::local_asset_stager(std::filesystem::path directory)
    : directory_{ std::filesystem::absolute(std::move(directory)).lexically_normal() } {}

staged_asset local_asset_stager::stage(std::filesystem::path const &source,
                                       std::string const &name,
                                       std::string const &principal) {
  auto const kind{ asset_kind_of(source) };
  auto const destination{ directory_ / asset_stager_object_name(source, name) };

  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    throw std::runtime_error("Failed to create staging directory " + directory_.string() +
                             ": " + ec.message());
  }

  if (kind == asset_kind::archive) {
    archive_zip_directory(source, destination);
  } else {
    std::filesystem::copy_file(source,
                               destination,
                               std::filesystem::copy_options::overwrite_existing,
                               ec);
    if (ec) {
      throw std::runtime_error("Failed to stage " + source.string() + ": " + ec.message());
    }
  }

  if (std::find(readers_.begin(), readers_.end(), principal) == readers_.end()) {
    readers_.push_back(principal);
  }

  return staged_asset{ .uri = destination.string(), .kind = kind };
}

std::string local_asset_stager::fetch_command(staged_asset const &asset,
                                              std::string const &destination) const {
  return "cp " + util_shell_quote(asset.uri) + " " + destination;
}

}  // namespace kiln
