#pragma once

#include <array>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace kiln {

using sha256_t = std::array<unsigned char, 32>;

sha256_t sha256(std::filesystem::path const &file_path);
sha256_t sha256_buffer(void const *data, size_t length);

inline sha256_t sha256_string(std::string_view text) {
  return sha256_buffer(text.data(), text.size());
}

// Lowercase hex form of a digest (64 characters)
std::string sha256_hex(sha256_t const &digest);

}  // namespace kiln
