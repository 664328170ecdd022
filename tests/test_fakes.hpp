#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/types.hpp"
#include "geocode/geocode_provider.hpp"
#include "io/http_client.hpp"

// Stand-ins for the external services used across the test executables.

namespace routeopt::test {

// 脚本化的地理编码 provider。
//   answers[q]            查询 q 返回的候选
//   transient_failures[q] q 正常返回前先报几次 "timed out"
//   hard_errors           总是失败的查询（非临时错误）
class FakeGeocodeProvider final : public IGeocodeProvider {
public:
  std::map<std::string, std::vector<GeocodeCandidate>> answers;
  std::map<std::string, int> transient_failures;
  std::set<std::string> hard_errors;

  std::vector<GeocodeCandidate> Search(const std::string& query, int limit) override {
    std::lock_guard<std::mutex> lock(mu_);
    calls_.push_back(query);
    call_times_.push_back(std::chrono::steady_clock::now());

    if (hard_errors.count(query)) throw GeocodeProviderError("Geocoding service error: bad request", false);
    auto tf = transient_failures.find(query);
    if (tf != transient_failures.end() && tf->second > 0) {
      --tf->second;
      throw GeocodeProviderError("Geocoding timed out", true);
    }
    auto it = answers.find(query);
    if (it == answers.end()) return {};
    std::vector<GeocodeCandidate> out = it->second;
    if (static_cast<int>(out.size()) > limit) out.resize(static_cast<std::size_t>(limit));
    return out;
  }

  std::vector<std::string> calls() const {
    std::lock_guard<std::mutex> lock(mu_);
    return calls_;
  }

  std::vector<std::chrono::steady_clock::time_point> call_times() const {
    std::lock_guard<std::mutex> lock(mu_);
    return call_times_;
  }

  std::size_t CallCount(const std::string& query) const {
    std::lock_guard<std::mutex> lock(mu_);
    std::size_t n = 0;
    for (const auto& c : calls_) if (c == query) ++n;
    return n;
  }

private:
  mutable std::mutex mu_;
  std::vector<std::string> calls_;
  std::vector<std::chrono::steady_clock::time_point> call_times_;
};

// 响应由 handler 给出的 HTTP 客户端；没有 handler => 连接被拒。
class FakeHttpClient final : public io::IHttpClient {
public:
  std::function<io::HttpResponse(const std::string& url)> handler;

  io::HttpResponse Get(const std::string& url, double timeout_s) override {
    (void)timeout_s;
    {
      std::lock_guard<std::mutex> lock(mu_);
      urls_.push_back(url);
    }
    if (!handler) throw io::HttpError("curl_easy_perform() failed: Couldn't connect to server", false);
    return handler(url);
  }

  std::vector<std::string> urls() const {
    std::lock_guard<std::mutex> lock(mu_);
    return urls_;
  }

private:
  mutable std::mutex mu_;
  std::vector<std::string> urls_;
};

inline GeocodeCandidate Candidate(const std::string& name, double lat, double lon) {
  GeocodeCandidate c;
  c.display_name = name;
  c.coord = {lat, lon};
  return c;
}

inline GeocodeResult MatchedStop(const std::string& address, double lat, double lon) {
  GeocodeResult r;
  r.query.text = address;
  r.query.name = address;
  r.display_name = address;
  r.coord = {lat, lon};
  r.status = GeocodeStatus::kMatched;
  return r;
}

// OSRM /trip body. order[p] = input coordinate index placed at trip position p.
inline std::string TripResponse(const std::vector<int>& order, double distance_m, double duration_s) {
  nlohmann::json wps = nlohmann::json::array();
  std::vector<int> pos(order.size(), 0);
  for (std::size_t p = 0; p < order.size(); ++p) pos[static_cast<std::size_t>(order[p])] = static_cast<int>(p);
  for (int p : pos) wps.push_back({{"waypoint_index", p}, {"trips_index", 0}});
  nlohmann::json j;
  j["code"] = "Ok";
  j["waypoints"] = wps;
  j["trips"] = nlohmann::json::array({{{"distance", distance_m}, {"duration", duration_s}}});
  return j.dump();
}

} // namespace routeopt::test
