#pragma once

#include <array>
#include <atomic>
#include <cstdint>

#include "helm/bot/sm.hpp"
#include "helm/callback.hpp"
#include "helm/config.hpp"
#include "helm/health/sm.hpp"
#include "helm/helm.h"
#include "helm/port/observation.hpp"
#include "helm/recovery/sm.hpp"
#include "helm/run/handler.hpp"
#include "helm/stuck/detector.hpp"
#include "helm/telemetry/provider/sm.hpp"

namespace helm::loop::action {

inline constexpr int32_t k_max_outcomes = recovery::k_inbox_capacity;

using run_start_fn = helm::callback<void()>;

struct session_stats {
  uint64_t ticks = 0;
  uint64_t paused_ticks = 0;
  uint64_t held_ticks = 0;
  uint64_t observation_failures = 0;
  uint64_t runs_started = 0;
  uint64_t runs_completed = 0;
  uint64_t runs_failed = 0;
  uint64_t deaths = 0;
  uint64_t chickens = 0;
  uint64_t disconnects = 0;
  uint64_t transitions_requested = 0;
  uint64_t transitions_rejected = 0;
  uint64_t total_run_ns = 0;
  uint64_t items_collected = 0;
};

struct context {
  config::engine cfg = {};

  bot::sm * bot = nullptr;
  recovery::sm * recovery = nullptr;
  health::sm * health = nullptr;
  stuck::detector * stuck = nullptr;
  port::observe_fn observe = {};
  helm::telemetry::provider::sm * telemetry = nullptr;
  std::array<run::handler_fn, bot::k_state_count> handlers = {};
  run_start_fn on_run_start = {};

  uint64_t tick = 0;
  port::observation latest = {};
  int32_t observe_status = HELM_OK;
  bot::bot_state seen_state = bot::bot_state::idle;

  std::array<recovery::outcome, k_max_outcomes> outcomes = {};
  int32_t outcome_count = 0;
  bool recovery_paused = false;
  uint64_t hold_until_ns = 0;
  bool holding = false;

  bot::bot_state decided = bot::bot_state::count;
  int32_t decide_status = HELM_OK;

  run::result last_result = {};
  bot::bot_state dispatched_state = bot::bot_state::count;

  bool run_active = false;
  uint64_t run_started_ns = 0;
  int32_t runs_finished = 0;
  bool inventory_pending = false;

  std::atomic<bool> stop_requested{false};
  bool finished = false;

  session_stats stats = {};
};

}  // namespace helm::loop::action
