#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <utility>

namespace trayctx {

// Blocking FIFO shared between threads.
//
// capacity == 0 means unbounded. A bounded channel that is full evicts the
// oldest element accepted by `evictable`; if none qualifies the push still
// goes through.
template <typename T> class Channel {
public:
  using Evictable = std::function<bool(const T &)>;

  explicit Channel(std::size_t capacity = 0, Evictable evictable = {})
      : capacity_(capacity), evictable_(std::move(evictable)) {}

  // false when either side is closed; the value is dropped.
  bool push(T value) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (closed_ || receiver_closed_)
        return false;
      if (capacity_ != 0 && q_.size() >= capacity_)
        evict_one();
      q_.push_back(std::move(value));
    }
    cv_.notify_one();
    return true;
  }

  // Blocks until a value arrives; empty once closed and drained.
  std::optional<T> pop() {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait(lk, [&] { return !q_.empty() || closed_; });
    return take();
  }

  std::optional<T> try_pop() {
    std::lock_guard<std::mutex> lk(mu_);
    return take();
  }

  template <typename Rep, typename Period>
  std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait_for(lk, timeout, [&] { return !q_.empty() || closed_; });
    return take();
  }

  // Producer side is done. Queued values can still be drained.
  void close() {
    {
      std::lock_guard<std::mutex> lk(mu_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  // Nobody is listening any more; queued values are discarded.
  void close_receiver() {
    {
      std::lock_guard<std::mutex> lk(mu_);
      receiver_closed_ = true;
      q_.clear();
    }
    cv_.notify_all();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lk(mu_);
    return closed_;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return q_.size();
  }

  std::size_t dropped() const {
    std::lock_guard<std::mutex> lk(mu_);
    return dropped_;
  }

private:
  std::optional<T> take() {
    if (q_.empty())
      return std::nullopt;
    std::optional<T> out(std::move(q_.front()));
    q_.pop_front();
    return out;
  }

  void evict_one() {
    for (auto it = q_.begin(); it != q_.end(); ++it) {
      if (!evictable_ || evictable_(*it)) {
        q_.erase(it);
        dropped_++;
        return;
      }
    }
  }

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<T> q_;
  std::size_t capacity_;
  Evictable evictable_;
  std::size_t dropped_ = 0;
  bool closed_ = false;
  bool receiver_closed_ = false;
};

} // namespace trayctx
