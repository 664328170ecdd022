#include "geocode/rate_gate.hpp"

#include <thread>

namespace routeopt {

RateGate::RateGate(std::chrono::milliseconds min_interval) : min_interval_(min_interval) {}

void RateGate::Acquire() {
  std::lock_guard<std::mutex> lock(mu_);
  if (last_) {
    const auto ready_at = *last_ + min_interval_;
    const auto now = Clock::now();
    if (now < ready_at) {
      std::this_thread::sleep_until(ready_at);
    }
  }
  last_ = Clock::now();
}

} // namespace routeopt
