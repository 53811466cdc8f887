#pragma once

#include "util.h"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace kiln {

void aws_init();
void aws_shutdown();

struct s3_uri_parts {
  std::string bucket;
  std::string key;  // may be empty for a bare "s3://bucket" prefix
};

// Throws std::invalid_argument unless uri is s3://bucket[/key]
s3_uri_parts aws_parse_s3_uri(std::string_view uri);

struct s3_upload_request {
  std::filesystem::path source;
  std::string uri;  // s3://bucket/key
  std::optional<std::string> region;
  std::map<std::string, std::string> metadata;
};

void aws_s3_upload(s3_upload_request const &request);

class aws_shutdown_guard : unmovable {
 public:
  aws_shutdown_guard() = default;
  ~aws_shutdown_guard();
};

}  // namespace kiln
