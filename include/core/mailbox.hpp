#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace interview_agent::core {

enum class pop_status : std::uint8_t {
  ITEM = 0,
  TIMEOUT = 1,
  CLOSED = 2,
};

// Multi-producer queue drained by a single consumer thread. After close()
// producers are refused but the consumer still drains what was queued.
template <typename T>
class Mailbox {
 public:
  Mailbox() = default;

  Mailbox(const Mailbox&) = delete;
  Mailbox& operator=(const Mailbox&) = delete;

  bool push(T item) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_) {
        return false;
      }
      items_.push_back(std::move(item));
    }
    ready_.notify_one();
    return true;
  }

  std::optional<T> pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    ready_.wait(lock, [this] { return closed_ || !items_.empty(); });
    if (items_.empty()) {
      return std::nullopt;
    }
    T item = std::move(items_.front());
    items_.pop_front();
    return item;
  }

  pop_status pop_until(const std::chrono::steady_clock::time_point deadline, T& out) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!ready_.wait_until(lock, deadline, [this] { return closed_ || !items_.empty(); })) {
      return pop_status::TIMEOUT;
    }
    if (items_.empty()) {
      return pop_status::CLOSED;
    }
    out = std::move(items_.front());
    items_.pop_front();
    return pop_status::ITEM;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    ready_.notify_all();
  }

  // Drops everything still queued; returns how many items were discarded.
  std::size_t clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::size_t dropped = items_.size();
    items_.clear();
    return dropped;
  }

  [[nodiscard]] bool closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  [[nodiscard]] std::size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable ready_;
  std::deque<T> items_;
  bool closed_{false};
};

}  // namespace interview_agent::core
