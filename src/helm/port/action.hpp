#pragma once

#include <cstdint>

#include "helm/callback.hpp"
#include "helm/clock.hpp"
#include "helm/helm.h"

namespace helm::port {

enum class action_kind : uint8_t {
  click = 0,
  press_key,
  move,
  use_potion,
  exit_game_template,
  exit_game_fixed_click,
  cancel_key,
  wait,
};

struct action {
  action_kind kind = action_kind::wait;
  int32_t x = 0;
  int32_t y = 0;
  int32_t key = 0;
  int32_t slot = 0;
  int32_t duration_ms = 0;
};

// At-most-once delivery; a partial effect is still reported as failure.
using perform_fn = helm::callback<int32_t(const action & act, int32_t timeout_ms)>;

// Runs `act` and treats a call that overran its deadline as a timeout even
// when the collaborator reported success.
inline int32_t perform_bounded(const perform_fn & fn, const action & act, const int32_t timeout_ms) {
  const uint64_t started = helm::now_ns();
  const int32_t status = fn.call_or(HELM_ERR_UNAVAILABLE, act, timeout_ms);
  if (status != HELM_OK) {
    return status;
  }
  if (timeout_ms > 0 && helm::now_ns() - started > helm::ms_to_ns(timeout_ms)) {
    return HELM_ERR_TIMEOUT;
  }
  return HELM_OK;
}

inline const char * to_string(const action_kind k) noexcept {
  switch (k) {
    case action_kind::click:
      return "click";
    case action_kind::press_key:
      return "press_key";
    case action_kind::move:
      return "move";
    case action_kind::use_potion:
      return "use_potion";
    case action_kind::exit_game_template:
      return "exit_game_template";
    case action_kind::exit_game_fixed_click:
      return "exit_game_fixed_click";
    case action_kind::cancel_key:
      return "cancel_key";
    case action_kind::wait:
      return "wait";
  }
  return "unknown";
}

}  // namespace helm::port
