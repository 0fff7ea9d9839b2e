#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <mutex>

#include "helm/telemetry/record.hpp"

namespace helm::telemetry {

// Bounded record queue shared between the loop thread, the health thread
// and whoever drains it.
template <int32_t Capacity = 256>
class ring {
 public:
  static_assert(Capacity > 0, "ring capacity must be positive");

  static bool try_enqueue(void * queue_ctx, const record & value) noexcept {
    auto * self = static_cast<ring *>(queue_ctx);
    if (self == nullptr) {
      return false;
    }
    std::lock_guard<std::mutex> lock(self->mutex_);
    if (self->count_ >= Capacity) {
      return false;
    }
    self->records_[static_cast<size_t>((self->head_ + self->count_) % Capacity)] = value;
    self->count_ += 1;
    return true;
  }

  static bool try_dequeue(void * queue_ctx, record * out_value) noexcept {
    auto * self = static_cast<ring *>(queue_ctx);
    if (self == nullptr || out_value == nullptr) {
      return false;
    }
    std::lock_guard<std::mutex> lock(self->mutex_);
    if (self->count_ == 0) {
      return false;
    }
    *out_value = self->records_[static_cast<size_t>(self->head_)];
    self->head_ = (self->head_ + 1) % Capacity;
    self->count_ -= 1;
    return true;
  }

  int32_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
  }

 private:
  mutable std::mutex mutex_;
  std::array<record, Capacity> records_ = {};
  int32_t head_ = 0;
  int32_t count_ = 0;
};

}  // namespace helm::telemetry
