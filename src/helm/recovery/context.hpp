#pragma once

#include <array>
#include <cstdint>
#include <random>

#include "helm/bot/sm.hpp"
#include "helm/callback.hpp"
#include "helm/config.hpp"
#include "helm/helm.h"
#include "helm/port/action.hpp"
#include "helm/recovery/error.hpp"
#include "helm/telemetry/provider/sm.hpp"

namespace helm::recovery::action {

using alert_fn = helm::callback<void(const char * message, const error_event & cause)>;

struct counters {
  uint64_t handled = 0;
  uint64_t resolved = 0;
  uint64_t escalated = 0;
  uint64_t run_ending = 0;
  uint64_t critical = 0;
  uint64_t superseded = 0;
  uint64_t dropped = 0;
  uint64_t alerts = 0;
  uint64_t recovery_attempts = 0;
  uint64_t recoveries_confirmed = 0;
};

struct context {
  int32_t action_timeout_ms = 500;
  int32_t max_consecutive_run_failures = 3;
  int32_t recovery_wait_ms = 1000;
  int32_t cancel_key = 27;
  config::screen_box escape_box = {};
  std::mt19937 rng{};

  bot::sm * bot = nullptr;
  port::perform_fn perform = {};
  alert_fn alert = {};
  helm::telemetry::provider::sm * telemetry = nullptr;

  std::array<retry_budget, k_error_kind_count> budgets = {};

  int32_t run_ending_this_run = 0;
  bool run_failure_counted = false;
  int32_t consecutive_run_failures = 0;
  bool run_ended_in_batch = false;

  bool paused = false;
  bool error_transition_pending = false;

  outcome current = {};
  counters stats = {};
};

}  // namespace helm::recovery::action
