#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>

namespace fzd {

// Single-producer single-consumer latest-only handoff.
template <class T>
class LatestBuffer {
public:
  void publish(const T& v) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      data_ = v;
    }
    seq_.fetch_add(1, std::memory_order_release);
  }

  // Copies the latest value if the sequence moved past `cursor`.
  bool try_consume_latest(std::uint64_t& cursor, T& out) const {
    const auto s = seq_.load(std::memory_order_acquire);
    if (s == cursor) return false;
    std::lock_guard<std::mutex> lk(mu_);
    out = data_;
    cursor = s;
    return true;
  }

  std::uint64_t sequence() const { return seq_.load(std::memory_order_acquire); }

private:
  mutable std::mutex mu_;
  T data_{};
  std::atomic<std::uint64_t> seq_{0};
};

using SnapshotBuffer = LatestBuffer<struct CruiseSnapshot>;

} // namespace fzd
