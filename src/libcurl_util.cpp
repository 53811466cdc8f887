#include "libcurl_util.h"

#include <curl/curl.h>

#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

#ifndef KILN_VERSION_STR
#error "KILN_VERSION_STR must be defined by the build system"
#endif

namespace kiln {

namespace {

constexpr char kDefaultUserAgent[]{ "kiln/" KILN_VERSION_STR };

size_t curl_discard(char *, size_t size, size_t nmemb, void *) { return size * nmemb; }

}  // namespace

void libcurl_ensure_initialized() {
  static std::once_flag once;
  std::call_once(once, [] {
    CURLcode const code{ curl_global_init(CURL_GLOBAL_DEFAULT) };
    if (code != CURLE_OK) {
      throw std::runtime_error(std::string("curl_global_init failed: ") +
                               curl_easy_strerror(code));
    }
  });
}

long libcurl_put(std::string_view url,
                 std::string_view body,
                 std::vector<std::string> const &headers) {
  libcurl_ensure_initialized();

  std::string const url_copy{ url };
  if (url_copy.empty()) { throw std::invalid_argument("libcurl_put: url is empty"); }

  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle{ curl_easy_init(),
                                                              &curl_easy_cleanup };
  if (!handle) { throw std::runtime_error("curl_easy_init failed"); }

  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> header_list{
    nullptr, &curl_slist_free_all
  };
  for (auto const &header : headers) {
    curl_slist *appended{ curl_slist_append(header_list.get(), header.c_str()) };
    if (!appended) { throw std::runtime_error("curl_slist_append failed"); }
    header_list.release();
    header_list.reset(appended);
  }

  auto const setopt = [handle = handle.get()](auto option, auto value) {
    CURLcode const rc{ curl_easy_setopt(handle, option, value) };
    if (rc != CURLE_OK) {
      throw std::runtime_error(std::string("curl_easy_setopt failed: ") +
                               curl_easy_strerror(rc));
    }
  };

  setopt(CURLOPT_URL, url_copy.c_str());
  setopt(CURLOPT_CUSTOMREQUEST, "PUT");
  setopt(CURLOPT_POSTFIELDS, body.data());
  setopt(CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
  setopt(CURLOPT_FOLLOWLOCATION, 1L);
  setopt(CURLOPT_FAILONERROR, 1L);
  setopt(CURLOPT_NOSIGNAL, 1L);
  setopt(CURLOPT_USERAGENT, kDefaultUserAgent);
  setopt(CURLOPT_WRITEFUNCTION, curl_discard);
  setopt(CURLOPT_NOPROGRESS, 1L);
  if (header_list) { setopt(CURLOPT_HTTPHEADER, header_list.get()); }

  CURLcode const perform_result{ curl_easy_perform(handle.get()) };

  long response_code{ 0 };
  curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &response_code);

  if (perform_result != CURLE_OK) {
    throw std::runtime_error(std::string("curl_easy_perform failed: ") +
                             curl_easy_strerror(perform_result) + " (HTTP " +
                             std::to_string(response_code) + ")");
  }

  return response_code;
}

}  // namespace kiln
