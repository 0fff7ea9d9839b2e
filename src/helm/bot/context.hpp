#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <limits>

#include "helm/bot/events.hpp"
#include "helm/bot/graph.hpp"
#include "helm/bot/state.hpp"
#include "helm/helm.h"
#include "helm/port/observation.hpp"
#include "helm/telemetry/provider/sm.hpp"

namespace helm::bot::action {

inline constexpr uint64_t k_no_tick = std::numeric_limits<uint64_t>::max();

struct rejection {
  bot_state from = bot_state::idle;
  bot_state to = bot_state::idle;
  priority prio = priority::normal;
  int32_t status = HELM_OK;
  uint64_t tick = 0;
};

struct counters {
  uint64_t accepted = 0;
  uint64_t rejected_invalid = 0;
  uint64_t rejected_guard = 0;
  uint64_t superseded = 0;
  uint64_t busy = 0;
};

struct context {
  bot::graph edges = {};
  float resume_health_percent = 50.0f;
  std::array<event::hook_fn, k_state_count> on_enter = {};
  std::array<event::hook_fn, k_state_count> on_exit = {};
  helm::telemetry::provider::sm * telemetry = nullptr;

  std::atomic<bot_state> current{bot_state::idle};
  std::atomic<uint64_t> entered_at_ns{0};
  bot_state previous = bot_state::idle;
  port::observation latest = {};

  // Preemptive requests announce themselves here before they queue on the
  // machine lock so an in-flight normal request can yield to them.
  std::atomic<int32_t> preempt_pending{0};
  uint64_t tick = 0;
  uint64_t normal_tick = k_no_tick;
  uint64_t preempt_tick = k_no_tick;

  bot_state request_from = bot_state::idle;
  bot_state request_to = bot_state::idle;
  priority request_prio = priority::normal;

  counters stats = {};
  rejection last_rejection = {};
  bool has_rejection = false;
};

}  // namespace helm::bot::action
