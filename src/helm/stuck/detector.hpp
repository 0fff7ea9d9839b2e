#pragma once

#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>

#include "helm/bot/state.hpp"
#include "helm/clock.hpp"
#include "helm/config.hpp"
#include "helm/helm.h"
#include "helm/port/observation.hpp"
#include "helm/recovery/error.hpp"

namespace helm::stuck {

struct sample {
  float x = 0.0f;
  float y = 0.0f;
  int32_t activity = 0;
  bool has_position = false;
  uint64_t timestamp_ns = 0;
};

// Builds a sample from whatever the observation carries; false when it has
// neither a position nor an activity marker.
inline bool sample_from(const port::observation & obs, sample & out) noexcept {
  out = sample{};
  out.timestamp_ns = obs.timestamp_ns;
  if (obs.has(port::readout::position_x) && obs.has(port::readout::position_y)) {
    out.x = obs.get(port::readout::position_x);
    out.y = obs.get(port::readout::position_y);
    out.has_position = true;
    return true;
  }
  if (obs.has(port::readout::activity)) {
    out.activity = static_cast<int32_t>(obs.get(port::readout::activity));
    return true;
  }
  return false;
}

// Sliding window of progress samples. Loop-thread only.
class detector {
 public:
  explicit detector(
      const int32_t window = 5, const float epsilon = 10.0f, recovery::report_fn report = {}) noexcept
      : window_(clamp_window(window)), epsilon_(epsilon), report_(report) {}

  explicit detector(const config::engine & cfg, recovery::report_fn report = {}) noexcept
      : detector(cfg.stuck_window, cfg.stuck_epsilon, report) {}

  void observe(const sample & value) noexcept {
    if (count_ == window_) {
      head_ = (head_ + 1) % window_;
      count_ -= 1;
    }
    samples_[static_cast<size_t>((head_ + count_) % window_)] = value;
    count_ += 1;
  }

  // True once per full window of similar samples; the window is cleared on
  // a positive flag so the same samples never flag twice.
  bool is_stuck(const bot::bot_state origin = bot::bot_state::running) noexcept {
    if (!full() || !window_similar()) {
      return false;
    }
    flags_ += 1;
    if (report_) {
      const int32_t status = report_(recovery::error_event{
        .kind = recovery::error_kind::stuck,
        .origin = origin,
        .timestamp_ns = helm::now_ns(),
        .detail = count_,
      });
      if (status != HELM_OK) {
        unreported_ += 1;
      }
    }
    clear();
    return true;
  }

  // A full window that moved; the caller treats this as a confirmed
  // recovery from a previous stuck flag.
  bool progressing() const noexcept { return full() && !window_similar(); }

  void clear() noexcept {
    head_ = 0;
    count_ = 0;
  }

  bool full() const noexcept { return count_ == window_; }
  int32_t size() const noexcept { return count_; }
  int32_t window() const noexcept { return window_; }
  uint64_t flags() const noexcept { return flags_; }
  uint64_t unreported() const noexcept { return unreported_; }

 private:
  static int32_t clamp_window(const int32_t window) noexcept {
    if (window < 2) {
      return 2;
    }
    return window > config::k_max_stuck_window ? config::k_max_stuck_window : window;
  }

  const sample & at(const int32_t i) const noexcept {
    return samples_[static_cast<size_t>((head_ + i) % window_)];
  }

  bool similar(const sample & a, const sample & b) const noexcept {
    if (a.has_position != b.has_position) {
      return false;
    }
    if (a.has_position) {
      return std::fabs(a.x - b.x) <= epsilon_ && std::fabs(a.y - b.y) <= epsilon_;
    }
    return a.activity == b.activity;
  }

  bool window_similar() const noexcept {
    for (int32_t i = 0; i < count_; ++i) {
      for (int32_t j = i + 1; j < count_; ++j) {
        if (!similar(at(i), at(j))) {
          return false;
        }
      }
    }
    return true;
  }

  int32_t window_;
  float epsilon_;
  recovery::report_fn report_;
  std::array<sample, config::k_max_stuck_window> samples_ = {};
  int32_t head_ = 0;
  int32_t count_ = 0;
  uint64_t flags_ = 0;
  uint64_t unreported_ = 0;
};

}  // namespace helm::stuck
