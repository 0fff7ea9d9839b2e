#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include "helm/callback.hpp"
#include "helm/clock.hpp"
#include "helm/helm.h"

namespace helm::port {

enum class label : uint8_t {
  unknown = 0,
  main_menu,
  loading,
  in_town,
  in_game,
  in_combat,
  loot_visible,
  inventory_full,
  dead,
  disconnected,
  level_up,
};

enum class readout : uint8_t {
  health = 0,
  mana,
  position_x,
  position_y,
  activity,
  count,
};

inline constexpr int32_t k_readout_count = static_cast<int32_t>(readout::count);

struct observation {
  label value = label::unknown;
  float confidence = 0.0f;
  uint64_t timestamp_ns = 0;
  std::array<float, k_readout_count> readouts = {};
  uint32_t readout_mask = 0;

  bool has(const readout r) const noexcept {
    return (readout_mask & (1u << static_cast<uint32_t>(r))) != 0u;
  }

  float get(const readout r) const noexcept { return readouts[static_cast<size_t>(r)]; }

  void set(const readout r, const float v) noexcept {
    readouts[static_cast<size_t>(r)] = v;
    readout_mask |= 1u << static_cast<uint32_t>(r);
  }
};

// Fills `out` within `timeout_ms`; returns HELM_OK, HELM_ERR_TIMEOUT or a
// backend status.
using observe_fn = helm::callback<int32_t(int32_t timeout_ms, observation & out)>;

// Labels reported below the confidence floor are not trusted.
inline void normalize(observation & obs, const float confidence_floor) noexcept {
  if (obs.confidence < confidence_floor) {
    obs.value = label::unknown;
  }
}

// An observation delivered after its deadline is stale even when the
// collaborator reported success.
inline int32_t observe_bounded(const observe_fn & fn, const int32_t timeout_ms, observation & out) {
  const uint64_t started = helm::now_ns();
  const int32_t status = fn.call_or(HELM_ERR_UNAVAILABLE, timeout_ms, out);
  if (status != HELM_OK) {
    return status;
  }
  if (timeout_ms > 0 && helm::now_ns() - started > helm::ms_to_ns(timeout_ms)) {
    return HELM_ERR_TIMEOUT;
  }
  return HELM_OK;
}

inline int32_t observe(
    const observe_fn & fn, const int32_t timeout_ms, const float confidence_floor,
    observation & out) {
  out = observation{};
  const int32_t status = observe_bounded(fn, timeout_ms, out);
  if (status != HELM_OK) {
    out.value = label::unknown;
    return status;
  }
  normalize(out, confidence_floor);
  return HELM_OK;
}

inline const char * to_string(const label l) noexcept {
  switch (l) {
    case label::unknown:
      return "unknown";
    case label::main_menu:
      return "main_menu";
    case label::loading:
      return "loading";
    case label::in_town:
      return "in_town";
    case label::in_game:
      return "in_game";
    case label::in_combat:
      return "in_combat";
    case label::loot_visible:
      return "loot_visible";
    case label::inventory_full:
      return "inventory_full";
    case label::dead:
      return "dead";
    case label::disconnected:
      return "disconnected";
    case label::level_up:
      return "level_up";
  }
  return "unknown";
}

}  // namespace helm::port
