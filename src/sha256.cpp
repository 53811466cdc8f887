#include "sha256.h"

#include "mbedtls/sha256.h"
#include "util.h"

#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace kiln {

namespace {

class sha256_context : unmovable {
 public:
  sha256_context() {
    mbedtls_sha256_init(&ctx_);
    if (mbedtls_sha256_starts(&ctx_, 0)) {
      mbedtls_sha256_free(&ctx_);
      throw std::runtime_error("sha256: mbedtls_sha256_starts failed");
    }
  }

  ~sha256_context() { mbedtls_sha256_free(&ctx_); }

  void update(unsigned char const *data, size_t length) {
    if (length == 0) { return; }
    if (mbedtls_sha256_update(&ctx_, data, length)) {
      throw std::runtime_error("sha256: mbedtls_sha256_update failed");
    }
  }

  sha256_t finish() {
    sha256_t digest{};
    if (mbedtls_sha256_finish(&ctx_, digest.data())) {
      throw std::runtime_error("sha256: mbedtls_sha256_finish failed");
    }
    return digest;
  }

 private:
  mbedtls_sha256_context ctx_;
};

}  // namespace

sha256_t sha256(std::filesystem::path const &file_path) {
  if (!std::filesystem::exists(file_path)) {
    throw std::runtime_error("sha256: file does not exist: " + file_path.string());
  }

  sha256_context ctx;

  file_ptr_t file{ util_open_file(file_path, "rb") };
  if (!file) {
    throw std::runtime_error("sha256: failed to open file: " + file_path.string());
  }

  std::vector<unsigned char> buffer(1024 * 1024);
  while (true) {
    auto const read_bytes{
      std::fread(buffer.data(), sizeof(unsigned char), buffer.size(), file.get())
    };

    if (read_bytes > 0) { ctx.update(buffer.data(), read_bytes); }

    if (read_bytes < buffer.size()) {
      if (std::ferror(file.get())) { throw std::runtime_error("sha256: fread failed"); }
      break;
    }
  }

  return ctx.finish();
}

sha256_t sha256_buffer(void const *data, size_t length) {
  sha256_context ctx;
  ctx.update(static_cast<unsigned char const *>(data), length);
  return ctx.finish();
}

std::string sha256_hex(sha256_t const &digest) {
  return util_bytes_to_hex(digest.data(), digest.size());
}

}  // namespace kiln
