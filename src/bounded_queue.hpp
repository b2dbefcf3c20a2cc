#pragma once
/*
 * BoundedQueue
 *
 * Purpose: fixed-capacity blocking FIFO between one producer and one consumer.
 * Semantics:
 *   push  blocks while full; false once the consumer dropped the queue.
 *   close producer side is done; pop drains what is left, then reports end.
 *   drop_receiver  consumer gave up; wakes a blocked producer.
 * Note: push never discards an item while the consumer is alive.
 */
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

enum class PopStatus { Item, Closed, Timeout };

template <typename T>
class BoundedQueue {
public:
  explicit BoundedQueue(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}
  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;

  bool push(T item) {
    std::unique_lock<std::mutex> lk(mu_);
    not_full_.wait(lk, [&]{ return items_.size() < capacity_ || closed_ || dropped_; });
    if (closed_ || dropped_) return false;
    items_.push_back(std::move(item));
    not_empty_.notify_one();
    return true;
  }

  PopStatus pop(T& out) {
    std::unique_lock<std::mutex> lk(mu_);
    not_empty_.wait(lk, [&]{ return !items_.empty() || closed_; });
    return take(out);
  }

  template <typename Rep, typename Period>
  PopStatus pop_for(T& out, std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock<std::mutex> lk(mu_);
    if (!not_empty_.wait_for(lk, timeout, [&]{ return !items_.empty() || closed_; })) return PopStatus::Timeout;
    return take(out);
  }

  void close() {
    std::lock_guard<std::mutex> lk(mu_);
    closed_ = true;
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  void drop_receiver() {
    std::lock_guard<std::mutex> lk(mu_);
    dropped_ = true;
    items_.clear();
    not_full_.notify_all();
  }

  size_t size() const { std::lock_guard<std::mutex> lk(mu_); return items_.size(); }
  size_t capacity() const { return capacity_; }

private:
  PopStatus take(T& out) {
    if (items_.empty()) return PopStatus::Closed;
    out = std::move(items_.front());
    items_.pop_front();
    not_full_.notify_one();
    return PopStatus::Item;
  }

  const size_t capacity_;
  mutable std::mutex mu_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<T> items_;
  bool closed_ = false;
  bool dropped_ = false;
};
