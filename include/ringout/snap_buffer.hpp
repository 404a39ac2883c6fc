#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>
#include <ringout/events.hpp>
#include <ringout/snap.hpp>

namespace ringout {

// Single-writer latest-only value buffer. Readers keep a sequence cursor and
// only copy when the writer has published since their last read.
template <class T>
class LatestBuffer {
public:
  void publish(const T& v) {
    std::lock_guard<std::mutex> lk(m_);
    data_ = v;
    seq_.fetch_add(1, std::memory_order_release);
  }

  bool try_consume_latest(std::uint64_t& cursor, T& out) const {
    if (seq_.load(std::memory_order_acquire) == cursor) return false;
    std::lock_guard<std::mutex> lk(m_);
    out = data_;
    cursor = seq_.load(std::memory_order_relaxed);
    return true;
  }

  std::uint64_t sequence() const { return seq_.load(std::memory_order_acquire); }

private:
  mutable std::mutex m_;
  T data_{};
  std::atomic<std::uint64_t> seq_{0};
};

using SnapshotBuffer = LatestBuffer<ArenaSnapshot>;

// Bounded FIFO of simulation events for presentation. When full, the oldest
// events are dropped and counted.
class EventQueue {
public:
  explicit EventQueue(std::size_t capacity = 1024) : cap_(capacity ? capacity : 1) {}

  void push_all(const EventList& events) {
    std::lock_guard<std::mutex> lk(m_);
    for (const auto& e : events) {
      if (q_.size() >= cap_) { q_.pop_front(); ++dropped_; }
      q_.push_back(e);
    }
  }

  EventList drain() {
    std::lock_guard<std::mutex> lk(m_);
    EventList out(q_.begin(), q_.end());
    q_.clear();
    return out;
  }

  void clear() {
    std::lock_guard<std::mutex> lk(m_);
    q_.clear();
  }

  std::size_t dropped() const {
    std::lock_guard<std::mutex> lk(m_);
    return dropped_;
  }

private:
  mutable std::mutex m_;
  std::deque<SimEvent> q_;
  std::size_t cap_;
  std::size_t dropped_{0};
};

} // namespace ringout
