#include "asset_stager.h"

#include "aws_util.h"
#include "errors.h"
#include "test_support.h"
#include "util.h"

#include "doctest.h"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace kiln {

TEST_CASE("asset_stager_object_name") {
  test::temp_dir_guard tmp{ "kiln-stager" };
  util_write_file(tmp.path / "tool.sh", "echo tool\n");
  util_write_file(tmp.path / "bundle" / "x.txt", "x\n");

  auto const file_name{ asset_stager_object_name(tmp.path / "tool.sh", "tool") };
  CHECK(file_name.starts_with("tool-"));
  CHECK(file_name.size() == std::string("tool-").size() + 16);

  auto const dir_name{ asset_stager_object_name(tmp.path / "bundle", "bundle") };
  CHECK(dir_name.ends_with(".zip"));

  SUBCASE("content changes the name") {
    util_write_file(tmp.path / "tool.sh", "echo tool v2\n");
    CHECK(asset_stager_object_name(tmp.path / "tool.sh", "tool") != file_name);
  }

  SUBCASE("missing source is a configuration error") {
    CHECK_THROWS_AS(asset_stager_object_name(tmp.path / "nope", "nope"),
                    configuration_error);
  }
}

TEST_CASE("local_asset_stager copies files and zips directories") {
  test::temp_dir_guard tmp{ "kiln-stager" };
  util_write_file(tmp.path / "src" / "tool.sh", "echo tool\n");
  util_write_file(tmp.path / "src" / "bundle" / "x.txt", "x\n");

  local_asset_stager stager{ tmp.path / "staged" };

  auto const file{ stager.stage(tmp.path / "src" / "tool.sh", "tool", "builder-a") };
  CHECK(file.kind == asset_kind::file);
  REQUIRE(std::filesystem::exists(file.uri));
  CHECK(util_load_file(file.uri) == util_load_file(tmp.path / "src" / "tool.sh"));

  auto const dir{ stager.stage(tmp.path / "src" / "bundle", "bundle", "builder-a") };
  CHECK(dir.kind == asset_kind::archive);
  CHECK(dir.uri.ends_with(".zip"));
  CHECK(std::filesystem::is_regular_file(dir.uri));

  stager.stage(tmp.path / "src" / "tool.sh", "tool", "builder-b");
  std::vector<std::string> const expected{ "builder-a", "builder-b" };
  CHECK(stager.readers() == expected);

  CHECK(stager.fetch_command(file, "tool.sh") ==
        "cp " + util_shell_quote(file.uri) + " tool.sh");
}

TEST_CASE("s3_asset_stager fetch command and bucket validation") {
  s3_asset_stager stager{ "s3://assets-bucket/kiln/" };
  staged_asset const asset{ .uri = "s3://assets-bucket/kiln/tool-0011", .kind = asset_kind::file };
  CHECK(stager.fetch_command(asset, "tool.sh") ==
        "aws s3 cp s3://assets-bucket/kiln/tool-0011 tool.sh");

  CHECK_THROWS_AS(s3_asset_stager{ "https://assets-bucket" }, std::invalid_argument);
}

TEST_CASE("aws_parse_s3_uri") {
  auto const full{ aws_parse_s3_uri("s3://bucket/path/to/key") };
  CHECK(full.bucket == "bucket");
  CHECK(full.key == "path/to/key");

  auto const bare{ aws_parse_s3_uri("s3://bucket") };
  CHECK(bare.bucket == "bucket");
  CHECK(bare.key.empty());

  CHECK_THROWS_AS(aws_parse_s3_uri("s3://"), std::invalid_argument);
  CHECK_THROWS_AS(aws_parse_s3_uri("s3:///key"), std::invalid_argument);
  CHECK_THROWS_AS(aws_parse_s3_uri("gs://bucket/key"), std::invalid_argument);
}

}  // namespace kiln
