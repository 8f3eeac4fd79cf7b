#pragma once

#include <assert.h>

#include <span>
#include <stdexcept>
#include <vector>

namespace rl {

/// Fixed-capacity circular store. Once full, each push overwrites the slot
/// at the write cursor, i.e. the oldest entry.
template <typename T>
class RingBuffer {
 public:
  explicit RingBuffer(std::size_t capacity) : capacity_(capacity) {
    if (capacity == 0) {
      throw std::invalid_argument("RingBuffer capacity must be positive");
    }
    data_.reserve(capacity);
  }

  /// Adopts `data` as a full buffer whose oldest slot is index 0.
  explicit RingBuffer(std::vector<T> data)
      : capacity_(data.size()), data_(std::move(data)) {
    if (capacity_ == 0) {
      throw std::invalid_argument("RingBuffer capacity must be positive");
    }
  }

  /// Inserts `item` and returns the slot it was written to.
  constexpr auto push(T item) -> std::size_t {
    auto index = cursor_;
    if (index >= data_.size()) {
      data_.emplace_back(std::move(item));
    } else {
      data_[index] = std::move(item);
    }
    cursor_ = (index + 1) % capacity_;
    return index;
  }

  constexpr auto size() const -> std::size_t { return data_.size(); }
  constexpr auto capacity() const -> std::size_t { return capacity_; }
  constexpr auto cursor() const -> std::size_t { return cursor_; }
  constexpr auto empty() const -> bool { return data_.empty(); }

  constexpr auto view() const -> std::span<const T> { return data_; }

  constexpr auto begin() const { return data_.begin(); }
  constexpr auto end() const { return data_.end(); }

  constexpr auto operator[](std::size_t index) const -> const T& {
    assert(index < data_.size());
    return data_[index];
  }

 private:
  std::size_t capacity_;
  std::size_t cursor_ = 0;
  std::vector<T> data_;
};

}  // namespace rl
