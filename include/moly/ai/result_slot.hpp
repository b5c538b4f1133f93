#pragma once

#include <mutex>
#include <optional>
#include <utility>

namespace moly::ai {

// Single-slot mailbox shared between one worker and the loop thread. A
// second put before take overwrites the first value.
template <typename T> class ResultSlot {
public:
  void put(T value) {
    std::lock_guard<std::mutex> lock(mutex_);
    value_ = std::move(value);
  }

  std::optional<T> take() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<T> out = std::move(value_);
    value_.reset();
    return out;
  }

  bool has_value() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return value_.has_value();
  }

private:
  mutable std::mutex mutex_;
  std::optional<T> value_;
};

} // namespace moly::ai
