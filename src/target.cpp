#include "target.h"

#include "errors.h"

#include <array>
#include <string>
#include <utility>

namespace kiln {

namespace {

constexpr std::array<std::pair<target_os, std::string_view>, 4> kOsNames{ {
    { target_os::linux_ubuntu, "linux-ubuntu" },
    { target_os::linux_amazon_2, "linux-amazon-2" },
    { target_os::linux_amazon_2023, "linux-amazon-2023" },
    { target_os::windows, "windows" },
} };

constexpr std::array<std::pair<target_arch, std::string_view>, 2> kArchNames{ {
    { target_arch::x86_64, "x86_64" },
    { target_arch::arm64, "arm64" },
} };

}  // namespace

std::string_view target_os_name(target_os os) {
  for (auto const &[value, name] : kOsNames) {
    if (value == os) { return name; }
  }
  return "unknown";
}

std::string_view target_arch_name(target_arch arch) {
  for (auto const &[value, name] : kArchNames) {
    if (value == arch) { return name; }
  }
  return "unknown";
}

target_os target_os_parse(std::string_view name) {
  for (auto const &[value, known] : kOsNames) {
    if (known == name) { return value; }
  }
  throw configuration_error("Unknown OS: " + std::string{ name } +
                            " (expected linux-ubuntu, linux-amazon-2, "
                            "linux-amazon-2023 or windows)");
}

target_arch target_arch_parse(std::string_view name) {
  for (auto const &[value, known] : kArchNames) {
    if (known == name) { return value; }
  }
  throw configuration_error("Unknown architecture: " + std::string{ name } +
                            " (expected x86_64 or arm64)");
}

bool target_os_is_linux(target_os os) { return os != target_os::windows; }

std::string_view target_platform_tag(target_os os) {
  return target_os_is_linux(os) ? "Linux" : "Windows";
}

std::string target_default_base_image(target_os os) {
  switch (os) {
    case target_os::windows: return "mcr.microsoft.com/windows/servercore:ltsc2019-amd64";
    case target_os::linux_ubuntu: return "public.ecr.aws/lts/ubuntu:22.04";
    case target_os::linux_amazon_2: return "public.ecr.aws/amazonlinux/amazonlinux:2";
    case target_os::linux_amazon_2023: return "public.ecr.aws/amazonlinux/amazonlinux:2023";
  }
  throw configuration_error("OS " + std::string{ target_os_name(os) } +
                            " not supported for container images");
}

}  // namespace kiln
