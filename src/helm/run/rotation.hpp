#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include "helm/helm.h"
#include "helm/run/handler.hpp"

namespace helm::run {

enum class kind : uint8_t {
  boss_farm = 0,
  area_farm,
  leveling,
  count,
};

inline constexpr int32_t k_max_rotation = 8;

// Cycles run kinds behind one handler. The active kind advances each time
// begin() is called for a new run.
class rotation {
 public:
  int32_t add(const kind k, const handler_fn handler) noexcept {
    if (count_ >= k_max_rotation || !handler) {
      return HELM_ERR_INVALID_ARGUMENT;
    }
    entries_[static_cast<size_t>(count_)] = entry{.which = k, .handler = handler};
    count_ += 1;
    return HELM_OK;
  }

  void begin() noexcept {
    if (count_ == 0) {
      return;
    }
    if (started_) {
      cursor_ = (cursor_ + 1) % count_;
    }
    started_ = true;
  }

  kind active() const noexcept {
    return count_ == 0 ? kind::count : entries_[static_cast<size_t>(cursor_)].which;
  }

  void dispatch(const request & req, result & out) const {
    if (count_ == 0) {
      out.value = status::error;
      out.has_error = true;
      out.error = recovery::error_kind::unknown_state;
      return;
    }
    entries_[static_cast<size_t>(cursor_)].handler(req, out);
  }

  handler_fn as_handler() const noexcept {
    return handler_fn::from<rotation, &rotation::dispatch>(this);
  }

  int32_t size() const noexcept { return count_; }

 private:
  struct entry {
    kind which = kind::count;
    handler_fn handler = {};
  };

  std::array<entry, k_max_rotation> entries_ = {};
  int32_t count_ = 0;
  int32_t cursor_ = 0;
  bool started_ = false;
};

inline const char * to_string(const kind k) noexcept {
  switch (k) {
    case kind::boss_farm:
      return "boss_farm";
    case kind::area_farm:
      return "area_farm";
    case kind::leveling:
      return "leveling";
    case kind::count:
      break;
  }
  return "none";
}

}  // namespace helm::run
