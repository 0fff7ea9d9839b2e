#pragma once

#include <cstdint>

#include "helm/helm.h"

namespace helm::config {

struct screen_point {
  int32_t x = 0;
  int32_t y = 0;
};

struct screen_box {
  int32_t x_min = 0;
  int32_t x_max = 0;
  int32_t y_min = 0;
  int32_t y_max = 0;
};

// Options are read once when the engine is built; components copy what
// they need and never observe later changes.
struct engine {
  // orchestration loop
  int32_t tick_interval_ms = 100;
  int32_t observe_timeout_ms = 250;
  int32_t action_timeout_ms = 500;
  float confidence_floor = 0.6f;
  int32_t max_runs = 0;
  int32_t run_timeout_ms = 120000;

  // recovery
  int32_t retry_threshold = 3;
  int32_t max_consecutive_run_failures = 3;
  int32_t recovery_wait_ms = 1000;
  int32_t cancel_key = 27;
  screen_box escape_box = {.x_min = 400, .x_max = 1500, .y_min = 200, .y_max = 800};
  uint32_t random_seed = 0x5eedu;

  // health preemption
  float chicken_health_percent = 30.0f;
  float chicken_mana_percent = 0.0f;
  float warning_health_percent = 50.0f;
  float resume_health_percent = 50.0f;
  int32_t health_interval_ms = 50;
  int32_t health_sample_timeout_ms = 100;
  int32_t potion_cooldown_ms = 1000;
  int32_t health_potion_slot = 1;
  screen_point exit_button = {.x = 960, .y = 540};
  int32_t cancel_repeat = 3;

  // stuck detection
  int32_t stuck_window = 5;
  float stuck_epsilon = 10.0f;
};

inline constexpr int32_t k_max_stuck_window = 32;

inline float default_warning_percent(const float chicken_percent) noexcept {
  const float warning = chicken_percent + 20.0f;
  return warning < 60.0f ? warning : 60.0f;
}

inline bool valid_percent(const float value) noexcept {
  return value >= 0.0f && value <= 100.0f;
}

inline int32_t validate(const engine & cfg) noexcept {
  if (cfg.tick_interval_ms <= 0 || cfg.observe_timeout_ms <= 0 || cfg.action_timeout_ms <= 0 ||
      cfg.health_interval_ms <= 0 || cfg.health_sample_timeout_ms <= 0) {
    return HELM_ERR_INVALID_ARGUMENT;
  }
  if (cfg.confidence_floor < 0.0f || cfg.confidence_floor > 1.0f) {
    return HELM_ERR_INVALID_ARGUMENT;
  }
  if (cfg.max_runs < 0 || cfg.run_timeout_ms < 0 || cfg.recovery_wait_ms < 0 ||
      cfg.potion_cooldown_ms < 0) {
    return HELM_ERR_INVALID_ARGUMENT;
  }
  if (cfg.retry_threshold <= 0 || cfg.max_consecutive_run_failures <= 0) {
    return HELM_ERR_INVALID_ARGUMENT;
  }
  if (!valid_percent(cfg.chicken_health_percent) || !valid_percent(cfg.chicken_mana_percent) ||
      !valid_percent(cfg.warning_health_percent) || !valid_percent(cfg.resume_health_percent)) {
    return HELM_ERR_INVALID_ARGUMENT;
  }
  if (cfg.chicken_health_percent <= 0.0f) {
    return HELM_ERR_INVALID_ARGUMENT;
  }
  if (cfg.stuck_window < 2 || cfg.stuck_window > k_max_stuck_window || cfg.stuck_epsilon < 0.0f) {
    return HELM_ERR_INVALID_ARGUMENT;
  }
  if (cfg.escape_box.x_min > cfg.escape_box.x_max || cfg.escape_box.y_min > cfg.escape_box.y_max) {
    return HELM_ERR_INVALID_ARGUMENT;
  }
  if (cfg.cancel_repeat <= 0) {
    return HELM_ERR_INVALID_ARGUMENT;
  }
  return HELM_OK;
}

}  // namespace helm::config
