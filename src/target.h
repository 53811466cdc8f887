#pragma once

#include <string>
#include <string_view>

namespace kiln {

enum class target_os { linux_ubuntu, linux_amazon_2, linux_amazon_2023, windows };

enum class target_arch { x86_64, arm64 };

// Tags as written in manifests and on the command line ("linux-ubuntu", "arm64", ...)
std::string_view target_os_name(target_os os);
std::string_view target_arch_name(target_arch arch);

// Throw configuration_error for unknown tags
target_os target_os_parse(std::string_view name);
target_arch target_arch_parse(std::string_view name);

bool target_os_is_linux(target_os os);

// Recipe platform tag: "Linux" or "Windows"
std::string_view target_platform_tag(target_os os);

std::string target_default_base_image(target_os os);

}  // namespace kiln
