#include "target.h"

#include "errors.h"

#include "doctest.h"

namespace kiln {

TEST_CASE("target_os_parse round-trips every tag") {
  for (auto const os : { target_os::linux_ubuntu,
                         target_os::linux_amazon_2,
                         target_os::linux_amazon_2023,
                         target_os::windows }) {
    CHECK(target_os_parse(target_os_name(os)) == os);
  }
}

TEST_CASE("target_arch_parse accepts x86_64 and arm64") {
  CHECK(target_arch_parse("x86_64") == target_arch::x86_64);
  CHECK(target_arch_parse("arm64") == target_arch::arm64);
}

TEST_CASE("unknown tags are configuration errors") {
  CHECK_THROWS_AS(target_os_parse("macos"), configuration_error);
  CHECK_THROWS_WITH_AS(target_arch_parse("riscv64"),
                       "Unknown architecture: riscv64 (expected x86_64 or arm64)",
                       configuration_error);
}

TEST_CASE("platform tag groups every linux flavour") {
  CHECK(target_platform_tag(target_os::linux_ubuntu) == "Linux");
  CHECK(target_platform_tag(target_os::linux_amazon_2023) == "Linux");
  CHECK(target_platform_tag(target_os::windows) == "Windows");
}

TEST_CASE("default base images") {
  CHECK(target_default_base_image(target_os::linux_ubuntu) ==
        "public.ecr.aws/lts/ubuntu:22.04");
  CHECK(target_default_base_image(target_os::linux_amazon_2) ==
        "public.ecr.aws/amazonlinux/amazonlinux:2");
  CHECK(target_default_base_image(target_os::linux_amazon_2023) ==
        "public.ecr.aws/amazonlinux/amazonlinux:2023");
  CHECK(target_default_base_image(target_os::windows) ==
        "mcr.microsoft.com/windows/servercore:ltsc2019-amd64");
}

}  // namespace kiln
