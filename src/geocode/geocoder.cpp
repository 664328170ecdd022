#include "geocode/geocoder.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <future>
#include <limits>
#include <regex>
#include <sstream>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

#include "geo/distance.hpp"
#include "geocode/address_variations.hpp"

namespace routeopt {

namespace {

// 超过这个长度的地址不做变体改写，直接记为失败（std::regex 在超长输入上会递归爆栈）。
constexpr std::size_t kMaxAddressLength = 512;

bool IsBlank(const std::string& s) {
  return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string FormatMiles(double v) {
  std::ostringstream oss;
  oss.setf(std::ios::fixed);
  oss.precision(1);
  oss << v;
  return oss.str();
}

} // namespace

Geocoder::Geocoder(std::shared_ptr<IGeocodeProvider> provider, std::shared_ptr<RateGate> gate, GeocoderConfig cfg)
    : provider_(std::move(provider)), gate_(std::move(gate)), cfg_(std::move(cfg)) {}

Geocoder::SearchOutcome Geocoder::SearchWithRetry(const std::string& query) {
  SearchOutcome out;
  for (int attempt = 0; attempt < cfg_.max_retries; ++attempt) {
    gate_->Acquire();
    try {
      out.candidates = provider_->Search(query, cfg_.candidate_limit);
      out.error.reset();
      return out;
    } catch (const GeocodeProviderError& e) {
      out.error = e.what();
      if (!e.transient() || attempt + 1 >= cfg_.max_retries) {
        spdlog::warn("[geocode] '{}': {}", query, e.what());
        return out;
      }
      const auto backoff = std::chrono::milliseconds(static_cast<long long>(cfg_.backoff_base_ms) << attempt);
      spdlog::debug("[geocode] '{}': {} (retry {} in {} ms)", query, e.what(), attempt + 1, backoff.count());
      std::this_thread::sleep_for(backoff);
    } catch (const std::exception& e) {
      out.error = std::string("Unexpected error: ") + e.what();
      spdlog::warn("[geocode] '{}': {}", query, *out.error);
      return out;
    }
  }
  return out;
}

GeocodeResult Geocoder::GeocodeOne(const DeliveryAddress& address,
                                   const std::optional<Coordinate>& origin,
                                   std::optional<double> radius_miles) {
  GeocodeResult r;
  r.query = address;

  if (IsBlank(address.text)) {
    r.status = GeocodeStatus::kError;
    r.error_detail = "Empty address";
    return r;
  }

  if (address.text.size() > kMaxAddressLength) {
    spdlog::warn("[geocode] address of {} chars exceeds {} chars, skipped", address.text.size(),
                 kMaxAddressLength);
    r.status = GeocodeStatus::kError;
    r.error_detail = "Address too long";
    return r;
  }

  std::vector<std::string> variations;
  try {
    variations = BuildAddressVariations(address.text, cfg_.max_variations);
  } catch (const std::regex_error& e) {
    spdlog::warn("[geocode] could not build variations for '{}': {}", address.Label(), e.what());
    r.status = GeocodeStatus::kError;
    r.error_detail = std::string("Address could not be normalised: ") + e.what();
    return r;
  }

  const bool filter = origin.has_value() && radius_miles.has_value();

  std::optional<GeocodeCandidate> nearest_rejected;
  double nearest_rejected_miles = std::numeric_limits<double>::infinity();
  std::optional<std::string> last_error;

  for (std::size_t vi = 0; vi < variations.size(); ++vi) {
    const auto& q = variations[vi];
    if (vi > 0) spdlog::debug("[geocode] trying variation {}: {}", vi, q);

    SearchOutcome found = SearchWithRetry(q);
    if (found.error) {
      last_error = found.error;
      continue;
    }

    for (const auto& c : found.candidates) {
      const std::optional<double> dist =
          origin ? std::optional<double>(geo::GeodesicMiles(*origin, c.coord)) : std::nullopt;

      if (filter && *dist > *radius_miles) {
        if (*dist < nearest_rejected_miles) {
          nearest_rejected_miles = *dist;
          nearest_rejected = c;
        }
        continue;
      }

      r.status = GeocodeStatus::kMatched;
      r.display_name = c.display_name;
      r.coord = c.coord;
      r.distance_from_depot_miles = dist;
      r.matched_query = q;
      r.error_detail.reset();
      spdlog::info("[geocode] matched '{}' -> {} ({:.6f}, {:.6f})", address.Label(), c.display_name,
                   c.coord.lat_deg, c.coord.lon_deg);
      return r;
    }
  }

  if (nearest_rejected) {
    r.status = GeocodeStatus::kOutOfRadius;
    r.display_name = nearest_rejected->display_name;
    r.coord = nearest_rejected->coord;
    r.distance_from_depot_miles = nearest_rejected_miles;
    r.error_detail = "Nearest candidate is " + FormatMiles(nearest_rejected_miles) +
                     " mi from depot, outside the " + FormatMiles(*radius_miles) + " mi radius";
  } else if (last_error) {
    r.status = GeocodeStatus::kError;
    r.error_detail = *last_error;
  } else {
    r.status = GeocodeStatus::kNoMatch;
    r.error_detail = "Address not found (tried " + std::to_string(variations.size()) + " variations)";
  }
  spdlog::warn("[geocode] '{}': {} - {}", address.Label(), ToString(r.status), *r.error_detail);
  return r;
}

std::vector<GeocodeResult> Geocoder::Geocode(const std::vector<DeliveryAddress>& addresses,
                                             std::optional<int> depot_index,
                                             std::optional<double> radius_miles) {
  std::vector<GeocodeResult> results(addresses.size());
  if (addresses.empty()) return results;

  if (depot_index && (*depot_index < 0 || *depot_index >= static_cast<int>(addresses.size()))) {
    spdlog::warn("[geocode] depot index {} out of range (0..{}), ignoring", *depot_index, addresses.size() - 1);
    depot_index.reset();
  }

  // 1) 先编码 depot：它是半径过滤的原点
  std::optional<Coordinate> origin;
  if (depot_index) {
    auto& depot = results[static_cast<std::size_t>(*depot_index)];
    depot = GeocodeOne(addresses[static_cast<std::size_t>(*depot_index)], std::nullopt, std::nullopt);
    if (depot.IsMatched()) {
      origin = depot.coord;
      depot.distance_from_depot_miles = 0.0;
      if (radius_miles) spdlog::info("[geocode] using {:.1f} mile radius filter", *radius_miles);
    } else {
      spdlog::warn("[geocode] depot address not found; radius filter disabled");
    }
  }

  // 2) 其余地址
  std::vector<std::size_t> pending;
  for (std::size_t i = 0; i < addresses.size(); ++i) {
    if (depot_index && static_cast<int>(i) == *depot_index) continue;
    pending.push_back(i);
  }

  const std::size_t workers = std::min<std::size_t>(static_cast<std::size_t>(cfg_.worker_threads), pending.size());
  if (workers <= 1) {
    for (std::size_t i : pending) results[i] = GeocodeOne(addresses[i], origin, radius_miles);
  } else {
    // 并发提交，发出仍由 gate 串行化。
    // 每个 worker 只写自己领到的位置，结果顺序与输入一致。
    std::atomic<std::size_t> next{0};
    std::vector<std::future<void>> futs;
    futs.reserve(workers);
    for (std::size_t w = 0; w < workers; ++w) {
      futs.emplace_back(std::async(std::launch::async, [&]() {
        for (std::size_t k = next.fetch_add(1); k < pending.size(); k = next.fetch_add(1)) {
          const std::size_t i = pending[k];
          results[i] = GeocodeOne(addresses[i], origin, radius_miles);
        }
      }));
    }
    for (auto& f : futs) f.get();
  }

  const auto ok = std::count_if(results.begin(), results.end(), [](const GeocodeResult& r) { return r.IsMatched(); });
  spdlog::info("[geocode] complete: {}/{} matched", ok, results.size());
  return results;
}

} // namespace routeopt
