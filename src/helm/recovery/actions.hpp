#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <random>

#include "helm/bot/state.hpp"
#include "helm/clock.hpp"
#include "helm/helm.h"
#include "helm/port/action.hpp"
#include "helm/recovery/context.hpp"
#include "helm/recovery/events.hpp"
#include "helm/recovery/guards.hpp"

namespace helm::recovery::action {

inline void publish_record(
    const context & ctx, const uint32_t event_id, const error_kind kind, const uint32_t target,
    const int32_t status) {
  if (ctx.telemetry == nullptr) {
    return;
  }
  const bot::bot_state state = ctx.bot != nullptr ? ctx.bot->current_state() : bot::bot_state::count;
  ctx.telemetry->emit(helm::telemetry::record{
    .timestamp_ns = helm::now_ns(),
    .component_id = HELM_COMPONENT_RECOVERY,
    .event_id = event_id,
    .state_id = static_cast<uint32_t>(state),
    .target_id = target,
    .kind_id = static_cast<uint32_t>(kind),
    .status = status,
  });
}

inline bot::bot_state current_state(const context & ctx) noexcept {
  return ctx.bot != nullptr ? ctx.bot->current_state() : bot::bot_state::count;
}

inline int32_t request(context & ctx, const bot::bot_state to, const bot::priority prio) {
  if (ctx.bot == nullptr) {
    return HELM_ERR_UNAVAILABLE;
  }
  return ctx.bot->request_transition(to, prio);
}

inline int32_t perform(context & ctx, const port::action & act) {
  if (!ctx.perform) {
    return HELM_ERR_UNAVAILABLE;
  }
  ctx.stats.recovery_attempts += 1;
  return port::perform_bounded(ctx.perform, act, ctx.action_timeout_ms);
}

inline int32_t random_between(std::mt19937 & rng, const int32_t lo, const int32_t hi) {
  std::uniform_int_distribution<int32_t> dist(lo, hi);
  return dist(rng);
}

// Where a run goes when this occurrence ends it; `count` leaves the state
// alone (no run underway, or the state already reflects the failure).
inline bot::bot_state run_end_target(const error_kind kind, const bot::bot_state current) noexcept {
  const bot::bot_state target = policy_for(kind).run_end_target;
  if (target == bot::bot_state::dead || target == bot::bot_state::disconnected) {
    return target == current ? bot::bot_state::count : target;
  }
  return bot::in_run(current) && current != bot::bot_state::returning ? bot::bot_state::returning
                                                                      : bot::bot_state::count;
}

inline void escalate_to(context & ctx, const severity level) {
  if (level <= ctx.current.effective) {
    return;
  }
  ctx.current.effective = level;
  ctx.current.escalated = true;
}

inline void run_strategy(context & ctx) {
  outcome & cur = ctx.current;
  switch (policy_for(cur.event.kind).recovery) {
    case strategy::escape_move: {
      const port::action move{
        .kind = port::action_kind::click,
        .x = random_between(ctx.rng, ctx.escape_box.x_min, ctx.escape_box.x_max),
        .y = random_between(ctx.rng, ctx.escape_box.y_min, ctx.escape_box.y_max),
      };
      cur.action_status = perform(ctx, move);
      cur.result = resolution::recovered;
      break;
    }
    case strategy::cancel_and_retry:
      cur.action_status = perform(ctx, port::action{
        .kind = port::action_kind::cancel_key,
        .key = ctx.cancel_key,
      });
      cur.result = resolution::retry;
      break;
    case strategy::town_handoff:
      cur.result = resolution::town_handoff;
      break;
    case strategy::wait_retry:
      cur.retry_at_ns = helm::now_ns() + helm::ms_to_ns(ctx.recovery_wait_ms);
      cur.result = resolution::retry;
      break;
    case strategy::none:
      cur.result = resolution::retry;
      break;
  }
  if (cur.action_status != HELM_OK) {
    escalate_to(ctx, severity::run_ending);
  }
}

inline constexpr auto begin_handle = [](const event::handle & ev, context & ctx) {
  if (ev.error_out != nullptr) {
    *ev.error_out = HELM_OK;
  }
  ctx.current = outcome{};
  ctx.current.event = ev.error;
  ctx.stats.handled += 1;
};

inline constexpr auto run_classify = [](const event::classify & ev, context & ctx) {
  if (ev.error_out == nullptr) return;
  *ev.error_out = HELM_OK;
  if (!valid_kind(ctx.current.event.kind)) {
    *ev.error_out = HELM_ERR_INVALID_ARGUMENT;
    return;
  }
  ctx.current.event.level = classify(ctx.current.event.kind);
  ctx.current.effective = ctx.current.event.level;
  if (ctx.current.event.timestamp_ns == 0) {
    ctx.current.event.timestamp_ns = helm::now_ns();
  }
  publish_record(
      ctx, HELM_RECORD_ERROR_EVENT, ctx.current.event.kind,
      static_cast<uint32_t>(ctx.current.event.level), HELM_OK);
};

inline constexpr auto run_attempt = [](const event::attempt & ev, context & ctx) {
  if (ev.error_out == nullptr) return;
  *ev.error_out = HELM_OK;

  outcome & cur = ctx.current;
  if (cur.event.level == severity::recoverable) {
    if (guard::run_already_ended{}(ctx)) {
      cur.result = resolution::superseded;
      ctx.stats.superseded += 1;
      return;
    }
    retry_budget & budget = ctx.budgets[static_cast<size_t>(cur.event.kind)];
    budget.consecutive_failures += 1;
    if (guard::budget_exhausted{}(budget)) {
      budget.consecutive_failures = 0;
      budget.last_reset_ns = helm::now_ns();
      escalate_to(ctx, severity::run_ending);
    } else {
      run_strategy(ctx);
      if (cur.escalated) {
        budget.consecutive_failures = 0;
        budget.last_reset_ns = helm::now_ns();
      }
    }
  }

  if (cur.effective == severity::run_ending && !ctx.run_failure_counted) {
    ctx.run_failure_counted = true;
    ctx.consecutive_run_failures += 1;
    if (guard::run_failures_exceeded{}(ctx)) {
      escalate_to(ctx, severity::critical);
    }
  }
};

inline constexpr auto run_apply = [](const event::apply & ev, context & ctx) {
  if (ev.error_out != nullptr) {
    *ev.error_out = HELM_OK;
  }
  outcome & cur = ctx.current;
  const bot::bot_state state = current_state(ctx);

  switch (cur.effective) {
    case severity::recoverable:
      if (cur.result == resolution::town_handoff) {
        cur.target = run_end_target(cur.event.kind, state);
        if (cur.target != bot::bot_state::count) {
          cur.transition_status = request(ctx, cur.target, bot::priority::normal);
        }
      }
      break;
    case severity::run_ending:
      cur.result = resolution::end_run;
      ctx.run_ended_in_batch = true;
      ctx.run_ending_this_run += 1;
      ctx.stats.run_ending += 1;
      cur.target = run_end_target(cur.event.kind, state);
      if (cur.target != bot::bot_state::count) {
        cur.transition_status = request(ctx, cur.target, bot::priority::normal);
      }
      break;
    case severity::critical: {
      cur.result = resolution::pause;
      cur.target = bot::bot_state::error;
      ctx.paused = true;
      ctx.run_ended_in_batch = true;
      ctx.stats.critical += 1;
      cur.transition_status = request(ctx, bot::bot_state::error, bot::priority::preemptive);
      ctx.error_transition_pending = cur.transition_status == HELM_ERR_BUSY;
      char message[128] = {};
      if (cur.escalated && cur.event.level != severity::critical) {
        std::snprintf(
            message, sizeof(message), "critical: %d consecutive failed runs, last cause %s",
            ctx.consecutive_run_failures, to_string(cur.event.kind));
      } else {
        std::snprintf(
            message, sizeof(message), "critical: %s in state %s", to_string(cur.event.kind),
            bot::to_string(cur.event.origin));
      }
      ctx.alert(message, cur.event);
      ctx.stats.alerts += 1;
      publish_record(ctx, HELM_RECORD_ALERT, cur.event.kind, static_cast<uint32_t>(cur.target),
                     cur.transition_status);
      break;
    }
  }

  if (cur.escalated) {
    ctx.stats.escalated += 1;
    publish_record(ctx, HELM_RECORD_ESCALATION, cur.event.kind,
                   static_cast<uint32_t>(cur.effective), HELM_OK);
  } else {
    ctx.stats.resolved += 1;
  }
  if (cur.result == resolution::superseded) {
    publish_record(ctx, HELM_RECORD_SUPERSEDED_EVENT, cur.event.kind,
                   static_cast<uint32_t>(cur.effective), HELM_OK);
  }
};

inline constexpr auto on_handle_done = [](const events::handle_done & ev, context &) {
  if (ev.error_out != nullptr) {
    *ev.error_out = HELM_OK;
  }
};

inline constexpr auto on_handle_error = [](const events::handle_error & ev, context &) {
  if (ev.error_out != nullptr) {
    *ev.error_out = ev.err;
  }
};

inline constexpr auto run_mark_recovered = [](const event::mark_recovered & ev, context & ctx) {
  if (!valid_kind(ev.kind)) {
    return;
  }
  retry_budget & budget = ctx.budgets[static_cast<size_t>(ev.kind)];
  if (budget.consecutive_failures > 0) {
    ctx.stats.recoveries_confirmed += 1;
  }
  budget.consecutive_failures = 0;
  budget.last_reset_ns = helm::now_ns();
};

inline constexpr auto run_begin_run = [](const event::begin_run &, context & ctx) {
  ctx.run_ending_this_run = 0;
  ctx.run_failure_counted = false;
  ctx.run_ended_in_batch = false;
};

inline constexpr auto run_run_succeeded = [](const event::run_succeeded &, context & ctx) {
  ctx.consecutive_run_failures = 0;
};

inline constexpr auto run_resume = [](const event::resume & ev, context & ctx) {
  if (ev.error_out != nullptr) {
    *ev.error_out = HELM_OK;
  }
  ctx.paused = false;
  ctx.error_transition_pending = false;
  ctx.consecutive_run_failures = 0;
  ctx.run_failure_counted = false;
  ctx.run_ended_in_batch = false;
};

}  // namespace helm::recovery::action
