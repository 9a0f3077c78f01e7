/*
 * 설명: 늦게 접속한 클라이언트에게 재생할 이벤트를 고정 용량 FIFO로 보관한다.
 * 버전: v0.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/history_buffer_test.cpp
 */
#pragma once

#include <cstddef>
#include <deque>
#include <stdexcept>
#include <utility>

namespace doodle {

template <typename T>
class HistoryBuffer {
 public:
  explicit HistoryBuffer(std::size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
      throw std::invalid_argument("HistoryBuffer 용량은 0보다 커야 합니다");
    }
  }

  void Push(T item) {
    while (items_.size() >= capacity_) {
      items_.pop_front();
    }
    items_.push_back(std::move(item));
  }

  void Clear() { items_.clear(); }

  template <typename Fn>
  void ForEach(Fn&& fn) const {
    for (const auto& item : items_) {
      fn(item);
    }
  }

  std::size_t Size() const { return items_.size(); }
  std::size_t Capacity() const { return capacity_; }
  bool Empty() const { return items_.empty(); }
  const T& Front() const { return items_.front(); }
  const T& Back() const { return items_.back(); }

 private:
  std::size_t capacity_;
  std::deque<T> items_;
};

}  // namespace doodle
