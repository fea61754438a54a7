#pragma once
/*
 * LimitedStack
 *
 * Purpose: LIFO stack with a fixed capacity; pushing onto a full stack
 * discards the oldest element at the bottom.
 */
#include <cstddef>
#include <deque>
#include <optional>
#include <utility>

template <typename T>
class LimitedStack {
public:
  explicit LimitedStack(std::size_t max_size) : max_size_(max_size == 0 ? 1 : max_size) {}

  void push(T item) {
    if (items_.size() >= max_size_) items_.pop_front();
    items_.push_back(std::move(item));
  }

  std::optional<T> pop() {
    if (items_.empty()) return std::nullopt;
    T item = std::move(items_.back());
    items_.pop_back();
    return item;
  }

  const T* top() const { return items_.empty() ? nullptr : &items_.back(); }
  // 0 is the oldest retained element.
  const T& at(std::size_t i) const { return items_.at(i); }

  std::size_t size() const { return items_.size(); }
  std::size_t capacity() const { return max_size_; }
  bool empty() const { return items_.empty(); }
  void clear() { items_.clear(); }

private:
  std::deque<T> items_;
  std::size_t max_size_;
};
