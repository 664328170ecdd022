#pragma once
#include <string>
#include "io/http_client.hpp"

namespace routeopt::io {

// libcurl-backed client. One easy handle per request, so concurrent Get()
// calls are independent. curl_global_init/cleanup follow the object lifetime;
// create one instance at process start.
class CurlHttpClient final : public IHttpClient {
public:
  explicit CurlHttpClient(std::string user_agent);
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient&) = delete;
  CurlHttpClient& operator=(const CurlHttpClient&) = delete;

  HttpResponse Get(const std::string& url, double timeout_s) override;

private:
  std::string user_agent_;
};

} // namespace routeopt::io
