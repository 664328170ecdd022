#pragma once
#include <chrono>
#include <mutex>
#include <optional>

namespace routeopt {

// 限速 provider 前面的间隔闸门。
// Acquire() 会阻塞到距上一次 Acquire() 返回至少过去 min_interval，
// 因此不管多少线程调用，每个间隔内最多放行一次请求。
// Acquire() 返回前已经释放锁，调用方发请求时不持有它。
//
// 生命周期：进程启动时创建一次（见 app/main.cpp），所有 Geocoder 共享；
// 只保存一个单调时钟时间戳，不落盘。
class RateGate {
public:
  using Clock = std::chrono::steady_clock;

  explicit RateGate(std::chrono::milliseconds min_interval);

  void Acquire();

  std::chrono::milliseconds min_interval() const { return min_interval_; }

private:
  std::chrono::milliseconds min_interval_;
  std::mutex mu_;
  std::optional<Clock::time_point> last_;
};

} // namespace routeopt
