#pragma once

#include <array>
#include <cstdint>

#include "helm/bot/sm.hpp"
#include "helm/config.hpp"
#include "helm/helm.h"
#include "helm/port/action.hpp"
#include "helm/port/observation.hpp"
#include "helm/recovery/error.hpp"
#include "helm/telemetry/provider/sm.hpp"

namespace helm::health::action {

inline constexpr int32_t k_history_size = 16;

enum class escape_step : uint8_t {
  none = 0,
  exit_template,
  exit_fixed_click,
  cancel_sequence,
  exhausted,
};

enum class verdict : uint8_t {
  healthy = 0,
  warning,
  breach,
};

struct chicken_entry {
  uint64_t timestamp_ns = 0;
  float health = 0.0f;
  float mana = 0.0f;
  bot::bot_state from = bot::bot_state::idle;
  escape_step escaped_by = escape_step::none;
};

struct counters {
  uint64_t samples = 0;
  uint64_t sample_failures = 0;
  uint64_t chickens = 0;
  uint64_t chickens_rejected = 0;
  uint64_t escape_failures = 0;
  uint64_t escapes_exhausted = 0;
  uint64_t potions = 0;
};

struct context {
  float chicken_health_percent = 30.0f;
  float chicken_mana_percent = 0.0f;
  float warning_health_percent = 50.0f;
  int32_t sample_timeout_ms = 100;
  int32_t action_timeout_ms = 500;
  uint64_t potion_cooldown_ns = 0;
  int32_t health_potion_slot = 1;
  int32_t cancel_key = 27;
  int32_t cancel_repeat = 3;
  config::screen_point exit_button = {};

  port::observe_fn observe = {};
  port::perform_fn perform = {};
  bot::sm * bot = nullptr;
  recovery::report_fn report = {};
  helm::telemetry::provider::sm * telemetry = nullptr;

  bool has_health = false;
  bool has_mana = false;
  float health = 100.0f;
  float mana = 100.0f;
  bot::bot_state observed_state = bot::bot_state::idle;
  verdict assessment = verdict::healthy;

  // One breach chickens once; rearm() re-enables it for the next run.
  bool latched = false;
  int32_t chicken_status = HELM_OK;
  escape_step escaped_by = escape_step::none;
  uint64_t last_potion_ns = 0;
  bool potion_taken = false;

  std::array<chicken_entry, k_history_size> history = {};
  int32_t history_count = 0;
  counters stats = {};
};

}  // namespace helm::health::action
