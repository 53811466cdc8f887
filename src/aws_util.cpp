#include "aws_util.h"

#include "aws/core/Aws.h"
#include "aws/core/client/ClientConfiguration.h"
#include "aws/core/utils/logging/LogLevel.h"
#include "aws/core/utils/logging/NullLogSystem.h"
#include "aws/core/utils/memory/stl/AWSStreamFwd.h"
#include "aws/s3/S3Client.h"
#include "aws/s3/model/PutObjectRequest.h"

#include <cstdlib>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <string>

namespace kiln {
namespace {

constexpr char const *kAllocationTag{ "kiln-aws-util" };

Aws::SDKOptions g_options;
std::once_flag g_init_once;
std::mutex g_state_mutex;
bool g_initialized{ false };

void configure_options(Aws::SDKOptions &options) {
  options.loggingOptions.logLevel = Aws::Utils::Logging::LogLevel::Off;
  options.loggingOptions.logger_create_fn = [] {
    return Aws::MakeShared<Aws::Utils::Logging::NullLogSystem>(kAllocationTag);
  };
}

}  // namespace

s3_uri_parts aws_parse_s3_uri(std::string_view uri) {
  constexpr std::string_view kPrefix{ "s3://" };
  if (!uri.starts_with(kPrefix)) {
    throw std::invalid_argument("S3 URI must start with s3://: " + std::string(uri));
  }

  std::string_view remainder{ uri.substr(kPrefix.size()) };
  auto const slash{ remainder.find('/') };
  if (slash == 0 || remainder.empty()) {
    throw std::invalid_argument("S3 URI must include a bucket: " + std::string(uri));
  }

  if (slash == std::string_view::npos) {
    return s3_uri_parts{ .bucket = std::string(remainder), .key = {} };
  }

  return s3_uri_parts{
    .bucket = std::string(remainder.substr(0, slash)),
    .key = std::string(remainder.substr(slash + 1)),
  };
}

void aws_init() {
  std::call_once(g_init_once, [] {
    ::setenv("AWS_SDK_LOAD_CONFIG", "1", 1);
    configure_options(g_options);
    Aws::InitAPI(g_options);
    std::lock_guard<std::mutex> lock{ g_state_mutex };
    g_initialized = true;
  });
}

void aws_shutdown() {
  std::lock_guard<std::mutex> lock{ g_state_mutex };
  if (!g_initialized) { return; }
  g_initialized = false;
  Aws::ShutdownAPI(g_options);
}

aws_shutdown_guard::~aws_shutdown_guard() { aws_shutdown(); }

void aws_s3_upload(s3_upload_request const &request) {
  aws_init();

  auto const parts{ aws_parse_s3_uri(request.uri) };
  if (parts.key.empty()) {
    throw std::invalid_argument("aws_s3_upload: URI must include an object key: " +
                                request.uri);
  }

  Aws::Client::ClientConfiguration config;
  if (request.region && !request.region->empty()) {
    config.region = Aws::String(request.region->c_str());
  }
  Aws::S3::S3Client s3_client{ config };

  auto body{ Aws::MakeShared<Aws::FStream>(kAllocationTag,
                                           request.source.string().c_str(),
                                           std::ios_base::in | std::ios_base::binary) };
  if (!body->good()) {
    throw std::runtime_error("aws_s3_upload: failed to open source: " +
                             request.source.string());
  }

  Aws::S3::Model::PutObjectRequest put_request;
  put_request.SetBucket(Aws::String(parts.bucket.c_str()));
  put_request.SetKey(Aws::String(parts.key.c_str()));
  put_request.SetBody(body);
  for (auto const &[key, value] : request.metadata) {
    put_request.AddMetadata(Aws::String(key.c_str()), Aws::String(value.c_str()));
  }

  auto outcome{ s3_client.PutObject(put_request) };
  if (!outcome.IsSuccess()) {
    auto const &error{ outcome.GetError() };
    throw std::runtime_error(std::string("aws_s3_upload: PutObject failed: ") +
                             error.GetExceptionName().c_str() + " - " +
                             error.GetMessage().c_str());
  }
}

}  // namespace kiln
