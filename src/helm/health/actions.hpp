#pragma once

#include <cstddef>
#include <cstdint>

#include "helm/clock.hpp"
#include "helm/health/context.hpp"
#include "helm/health/events.hpp"
#include "helm/health/guards.hpp"
#include "helm/helm.h"

namespace helm::health::action {

inline void publish_record(
    const context & ctx, const uint32_t event_id, const uint32_t target, const uint32_t kind,
    const int32_t status) {
  if (ctx.telemetry == nullptr) {
    return;
  }
  ctx.telemetry->emit(helm::telemetry::record{
    .timestamp_ns = helm::now_ns(),
    .component_id = HELM_COMPONENT_HEALTH,
    .event_id = event_id,
    .state_id = static_cast<uint32_t>(ctx.observed_state),
    .target_id = target,
    .kind_id = kind,
    .status = status,
  });
}

inline void report(context & ctx, const recovery::error_kind kind, const int32_t detail) {
  if (!ctx.report) {
    return;
  }
  const int32_t status = ctx.report(recovery::error_event{
    .kind = kind,
    .origin = ctx.observed_state,
    .timestamp_ns = helm::now_ns(),
    .detail = detail,
  });
  if (status != HELM_OK) {
    publish_record(ctx, HELM_RECORD_DROPPED, 0u, static_cast<uint32_t>(kind), status);
  }
}

inline void remember_chicken(context & ctx, const bot::bot_state from) {
  const size_t slot = static_cast<size_t>(ctx.history_count % k_history_size);
  ctx.history[slot] = chicken_entry{
    .timestamp_ns = helm::now_ns(),
    .health = ctx.health,
    .mana = ctx.mana,
    .from = from,
    .escaped_by = escape_step::none,
  };
  ctx.history_count += 1;
}

inline int32_t try_escape_step(context & ctx, const escape_step step) {
  switch (step) {
    case escape_step::exit_template:
      return port::perform_bounded(ctx.perform, port::action{
        .kind = port::action_kind::exit_game_template,
      }, ctx.action_timeout_ms);
    case escape_step::exit_fixed_click:
      return port::perform_bounded(ctx.perform, port::action{
        .kind = port::action_kind::exit_game_fixed_click,
        .x = ctx.exit_button.x,
        .y = ctx.exit_button.y,
      }, ctx.action_timeout_ms);
    case escape_step::cancel_sequence:
      for (int32_t i = 0; i < ctx.cancel_repeat; ++i) {
        const int32_t status = port::perform_bounded(ctx.perform, port::action{
          .kind = port::action_kind::cancel_key,
          .key = ctx.cancel_key,
        }, ctx.action_timeout_ms);
        if (status != HELM_OK) {
          return status;
        }
      }
      return HELM_OK;
    case escape_step::none:
    case escape_step::exhausted:
      break;
  }
  return HELM_ERR_INVALID_ARGUMENT;
}

inline constexpr auto begin_start = [](const event::start & ev, context &) {
  if (ev.error_out != nullptr) {
    *ev.error_out = HELM_OK;
  }
};

inline constexpr auto reject_start = [](const event::start & ev, context &) {
  if (ev.error_out != nullptr) {
    *ev.error_out = HELM_ERR_UNAVAILABLE;
  }
};

inline constexpr auto begin_stop = [](const event::stop & ev, context &) {
  if (ev.error_out != nullptr) {
    *ev.error_out = HELM_OK;
  }
};

inline constexpr auto run_rearm = [](const event::rearm &, context & ctx) {
  ctx.latched = false;
  ctx.escaped_by = escape_step::none;
};

inline constexpr auto begin_sample = [](const event::sample & ev, context & ctx) {
  if (ev.error_out != nullptr) {
    *ev.error_out = HELM_OK;
  }
  ctx.assessment = verdict::healthy;
  ctx.chicken_status = HELM_OK;
};

inline constexpr auto run_read = [](const event::read & ev, context & ctx) {
  if (ev.error_out == nullptr) return;
  *ev.error_out = HELM_OK;
  ctx.stats.samples += 1;
  ctx.observed_state = ctx.bot != nullptr ? ctx.bot->current_state() : bot::bot_state::count;

  port::observation obs{};
  const int32_t status = port::observe_bounded(ctx.observe, ctx.sample_timeout_ms, obs);
  if (status != HELM_OK) {
    ctx.stats.sample_failures += 1;
    report(ctx, recovery::error_kind::health_sample_timeout, status);
    *ev.error_out = status;
    return;
  }

  ctx.has_health = obs.has(port::readout::health);
  ctx.has_mana = obs.has(port::readout::mana);
  if (ctx.has_health) {
    ctx.health = obs.get(port::readout::health);
  }
  if (ctx.has_mana) {
    ctx.mana = obs.get(port::readout::mana);
  }

  if (guard::breach_armed{}(ctx)) {
    ctx.assessment = verdict::breach;
  } else if (guard::warning_low{}(ctx) && guard::potion_ready{}(ctx, helm::now_ns())) {
    ctx.assessment = verdict::warning;
  } else {
    ctx.assessment = verdict::healthy;
  }
};

// The controller never writes bot state itself; it asks for a preemptive
// transition like any other client.
inline constexpr auto run_request_chicken = [](const event::request_chicken & ev, context & ctx) {
  if (ev.error_out != nullptr) {
    *ev.error_out = HELM_OK;
  }
  ctx.chicken_status = HELM_ERR_UNAVAILABLE;
  if (ctx.bot != nullptr) {
    ctx.chicken_status =
        ctx.bot->request_transition(bot::bot_state::chickened, bot::priority::preemptive);
  }
  if (ctx.chicken_status != HELM_OK) {
    ctx.stats.chickens_rejected += 1;
    publish_record(ctx, HELM_RECORD_CHICKEN, static_cast<uint32_t>(bot::bot_state::chickened), 0u,
                   ctx.chicken_status);
    return;
  }
  ctx.latched = true;
  ctx.stats.chickens += 1;
  remember_chicken(ctx, ctx.observed_state);
  publish_record(ctx, HELM_RECORD_CHICKEN, static_cast<uint32_t>(bot::bot_state::chickened), 0u,
                 HELM_OK);
};

inline constexpr auto run_escape = [](const event::run_escape & ev, context & ctx) {
  if (ev.error_out != nullptr) {
    *ev.error_out = HELM_OK;
  }
  constexpr escape_step k_fallbacks[] = {
    escape_step::exit_template,
    escape_step::exit_fixed_click,
    escape_step::cancel_sequence,
  };
  ctx.escaped_by = escape_step::exhausted;
  for (const escape_step step : k_fallbacks) {
    const int32_t status = try_escape_step(ctx, step);
    if (status == HELM_OK) {
      ctx.escaped_by = step;
      break;
    }
    ctx.stats.escape_failures += 1;
    report(ctx, recovery::error_kind::escape_attempt_failed, static_cast<int32_t>(step));
  }
  if (ctx.history_count > 0) {
    ctx.history[static_cast<size_t>((ctx.history_count - 1) % k_history_size)].escaped_by =
        ctx.escaped_by;
  }
  if (ctx.escaped_by == escape_step::exhausted) {
    ctx.stats.escapes_exhausted += 1;
    report(ctx, recovery::error_kind::escape_exhausted, 0);
  }
};

inline constexpr auto run_drink = [](const event::drink & ev, context & ctx) {
  if (ev.error_out != nullptr) {
    *ev.error_out = HELM_OK;
  }
  const int32_t status = port::perform_bounded(ctx.perform, port::action{
    .kind = port::action_kind::use_potion,
    .slot = ctx.health_potion_slot,
  }, ctx.action_timeout_ms);
  ctx.last_potion_ns = helm::now_ns();
  ctx.potion_taken = true;
  if (status == HELM_OK) {
    ctx.stats.potions += 1;
  }
  publish_record(ctx, HELM_RECORD_POTION, 0u, static_cast<uint32_t>(ctx.health_potion_slot), status);
};

inline constexpr auto on_read_error = [](const events::read_error &, context & ctx) {
  ctx.assessment = verdict::healthy;
};

inline constexpr auto on_sample_done = [](const events::sample_done &, context &) {};

}  // namespace helm::health::action
