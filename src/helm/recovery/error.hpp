#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include "helm/bot/state.hpp"
#include "helm/callback.hpp"

namespace helm::recovery {

enum class error_kind : uint8_t {
  stuck = 0,
  observation_timeout,
  action_timeout,
  inventory_full,
  template_fail,
  health_sample_timeout,
  character_death,
  disconnect,
  unknown_state,
  escape_attempt_failed,
  process_crash,
  escape_exhausted,
  count,
};

inline constexpr int32_t k_error_kind_count = static_cast<int32_t>(error_kind::count);

enum class severity : uint8_t {
  recoverable = 0,
  run_ending,
  critical,
};

enum class strategy : uint8_t {
  none = 0,
  escape_move,
  wait_retry,
  cancel_and_retry,
  town_handoff,
};

// `level` is filled in by classification; reporters leave it defaulted.
struct error_event {
  error_kind kind = error_kind::unknown_state;
  severity level = severity::recoverable;
  bot::bot_state origin = bot::bot_state::idle;
  uint64_t timestamp_ns = 0;
  int32_t detail = 0;
};

// One row per kind. The run-end target is where a run goes when an
// occurrence of this kind ends it; `count` means "abandon the run".
struct policy {
  error_kind kind = error_kind::unknown_state;
  severity level = severity::recoverable;
  strategy recovery = strategy::none;
  bot::bot_state run_end_target = bot::bot_state::count;
};

inline constexpr std::array<policy, k_error_kind_count> k_policy_table = {{
  {error_kind::stuck, severity::recoverable, strategy::escape_move, bot::bot_state::count},
  {error_kind::observation_timeout, severity::recoverable, strategy::wait_retry,
   bot::bot_state::count},
  {error_kind::action_timeout, severity::recoverable, strategy::cancel_and_retry,
   bot::bot_state::count},
  {error_kind::inventory_full, severity::recoverable, strategy::town_handoff,
   bot::bot_state::returning},
  {error_kind::template_fail, severity::recoverable, strategy::wait_retry, bot::bot_state::count},
  {error_kind::health_sample_timeout, severity::recoverable, strategy::wait_retry,
   bot::bot_state::count},
  {error_kind::character_death, severity::run_ending, strategy::none, bot::bot_state::dead},
  {error_kind::disconnect, severity::run_ending, strategy::none, bot::bot_state::disconnected},
  {error_kind::unknown_state, severity::run_ending, strategy::none, bot::bot_state::count},
  {error_kind::escape_attempt_failed, severity::run_ending, strategy::none, bot::bot_state::count},
  {error_kind::process_crash, severity::critical, strategy::none, bot::bot_state::count},
  {error_kind::escape_exhausted, severity::critical, strategy::none, bot::bot_state::count},
}};

inline constexpr bool policy_table_ordered() noexcept {
  for (size_t i = 0; i < k_policy_table.size(); ++i) {
    if (static_cast<size_t>(k_policy_table[i].kind) != i) {
      return false;
    }
  }
  return true;
}

static_assert(policy_table_ordered(), "policy rows must follow error_kind order");

inline constexpr bool valid_kind(const error_kind kind) noexcept {
  return static_cast<int32_t>(kind) >= 0 && static_cast<int32_t>(kind) < k_error_kind_count;
}

inline constexpr const policy & policy_for(const error_kind kind) noexcept {
  return k_policy_table[valid_kind(kind) ? static_cast<size_t>(kind)
                                         : static_cast<size_t>(error_kind::unknown_state)];
}

inline constexpr severity classify(const error_kind kind) noexcept {
  return policy_for(kind).level;
}

// Escalation only moves upward.
inline constexpr severity escalate(const severity level) noexcept {
  return level == severity::recoverable ? severity::run_ending : severity::critical;
}

struct retry_budget {
  int32_t consecutive_failures = 0;
  int32_t threshold = 3;
  uint64_t last_reset_ns = 0;
};

enum class resolution : uint8_t {
  none = 0,
  retry,
  recovered,
  town_handoff,
  end_run,
  pause,
  superseded,
};

// What one handled occurrence led to.
struct outcome {
  error_event event = {};
  severity effective = severity::recoverable;
  resolution result = resolution::none;
  bool escalated = false;
  bot::bot_state target = bot::bot_state::count;
  int32_t transition_status = 0;
  int32_t action_status = 0;
  // Earliest time the caller should try again; 0 retries on the next tick.
  uint64_t retry_at_ns = 0;
};

using report_fn = helm::callback<int32_t(const error_event & ev)>;

inline const char * to_string(const error_kind kind) noexcept {
  switch (kind) {
    case error_kind::stuck:
      return "stuck";
    case error_kind::observation_timeout:
      return "observation_timeout";
    case error_kind::action_timeout:
      return "action_timeout";
    case error_kind::inventory_full:
      return "inventory_full";
    case error_kind::template_fail:
      return "template_fail";
    case error_kind::health_sample_timeout:
      return "health_sample_timeout";
    case error_kind::character_death:
      return "character_death";
    case error_kind::disconnect:
      return "disconnect";
    case error_kind::unknown_state:
      return "unknown_state";
    case error_kind::escape_attempt_failed:
      return "escape_attempt_failed";
    case error_kind::process_crash:
      return "process_crash";
    case error_kind::escape_exhausted:
      return "escape_exhausted";
    case error_kind::count:
      break;
  }
  return "invalid";
}

inline const char * to_string(const resolution result) noexcept {
  switch (result) {
    case resolution::none:
      return "none";
    case resolution::retry:
      return "retry";
    case resolution::recovered:
      return "recovered";
    case resolution::town_handoff:
      return "town_handoff";
    case resolution::end_run:
      return "end_run";
    case resolution::pause:
      return "pause";
    case resolution::superseded:
      return "superseded";
  }
  return "invalid";
}

inline const char * to_string(const severity level) noexcept {
  switch (level) {
    case severity::recoverable:
      return "recoverable";
    case severity::run_ending:
      return "run_ending";
    case severity::critical:
      return "critical";
  }
  return "invalid";
}

}  // namespace helm::recovery
