#pragma once

#include <chrono>
#include <cstdint>

namespace helm {

inline uint64_t now_ns() noexcept {
  const auto since_epoch = std::chrono::steady_clock::now().time_since_epoch();
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch).count());
}

inline constexpr uint64_t ms_to_ns(const int32_t ms) noexcept {
  return ms <= 0 ? 0u : static_cast<uint64_t>(ms) * 1000000u;
}

}  // namespace helm
