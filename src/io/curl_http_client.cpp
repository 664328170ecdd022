#include "io/curl_http_client.hpp"

#include <memory>
#include <utility>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

namespace routeopt::io {

namespace {

size_t WriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* out = static_cast<std::string*>(userdata);
  out->append(ptr, size * nmemb);
  return size * nmemb;
}

struct CurlHandleDeleter {
  void operator()(CURL* h) const { curl_easy_cleanup(h); }
};

} // namespace

CurlHttpClient::CurlHttpClient(std::string user_agent) : user_agent_(std::move(user_agent)) {
  curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlHttpClient::~CurlHttpClient() {
  curl_global_cleanup();
}

HttpResponse CurlHttpClient::Get(const std::string& url, double timeout_s) {
  std::unique_ptr<CURL, CurlHandleDeleter> curl(curl_easy_init());
  if (!curl) {
    throw HttpError("Failed to initialize curl", false);
  }

  HttpResponse resp;
  const long timeout_ms = static_cast<long>(timeout_s * 1000.0);

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &resp.body);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms);
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L); // required for multi-threaded use
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent_.c_str());

  spdlog::debug("[http] GET {}", url);
  const CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    throw HttpError(std::string("curl_easy_perform() failed: ") + curl_easy_strerror(res),
                    res == CURLE_OPERATION_TIMEDOUT);
  }

  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &resp.status);
  spdlog::debug("[http] {} -> {} ({} bytes)", url, resp.status, resp.body.size());
  return resp;
}

} // namespace routeopt::io
