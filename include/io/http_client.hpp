#pragma once
#include <stdexcept>
#include <string>

namespace routeopt::io {

struct HttpResponse {
  long status{0};
  std::string body;
};

// 传输层失败（DNS、连接、超时等）。HTTP 错误状态码作为响应返回，不抛异常。
class HttpError : public std::runtime_error {
public:
  HttpError(const std::string& msg, bool timed_out)
      : std::runtime_error(msg), timed_out_(timed_out) {}

  bool timed_out() const noexcept { return timed_out_; }

private:
  bool timed_out_;
};

// 阻塞式 HTTP GET。实现必须支持多线程同时调用（optimizer 会并发地按 cluster 发请求）。
class IHttpClient {
public:
  virtual ~IHttpClient() = default;
  virtual HttpResponse Get(const std::string& url, double timeout_s) = 0;
};

// Percent-encodes everything except RFC 3986 unreserved characters.
std::string UrlEncode(const std::string& s);

} // namespace routeopt::io
