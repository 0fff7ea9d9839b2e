#pragma once

#include <cstddef>
#include <cstdint>

#include "helm/clock.hpp"
#include "helm/config.hpp"
#include "helm/helm.h"
#include "helm/loop/context.hpp"
#include "helm/loop/events.hpp"
#include "helm/loop/guards.hpp"

namespace helm::loop::action {

inline void publish_record(
    const context & ctx, const uint32_t event_id, const bot::bot_state state, const uint32_t target,
    const uint32_t kind, const int32_t status) {
  if (ctx.telemetry == nullptr) {
    return;
  }
  ctx.telemetry->emit(helm::telemetry::record{
    .timestamp_ns = helm::now_ns(),
    .component_id = HELM_COMPONENT_LOOP,
    .event_id = event_id,
    .state_id = static_cast<uint32_t>(state),
    .target_id = target,
    .kind_id = kind,
    .status = status,
  });
}

inline void report(context & ctx, const recovery::error_kind kind, const bot::bot_state origin,
                   const int32_t detail) {
  (void)ctx.recovery->report(recovery::error_event{
    .kind = kind,
    .origin = origin,
    .timestamp_ns = helm::now_ns(),
    .detail = detail,
  });
}

inline void finish_run(context & ctx, const bool succeeded, const run::status why) {
  if (!ctx.run_active) {
    return;
  }
  ctx.run_active = false;
  const uint64_t now = helm::now_ns();
  uint64_t duration = now > ctx.run_started_ns ? now - ctx.run_started_ns : 0u;
  if (ctx.last_result.duration_ns > 0) {
    duration = ctx.last_result.duration_ns;
  }
  ctx.stats.total_run_ns += duration;
  ctx.runs_finished += 1;
  if (succeeded) {
    ctx.stats.runs_completed += 1;
    ctx.recovery->note_run_succeeded();
  } else {
    ctx.stats.runs_failed += 1;
  }
  publish_record(ctx, HELM_RECORD_RUN_FINISHED, ctx.bot->current_state(),
                 static_cast<uint32_t>(ctx.runs_finished), static_cast<uint32_t>(why),
                 succeeded ? HELM_OK : HELM_ERR_ACTION_FAILED);
}

inline void begin_run(context & ctx) {
  ctx.run_active = true;
  ctx.run_started_ns = helm::now_ns();
  ctx.stats.runs_started += 1;
  ctx.last_result = run::result{};
  ctx.recovery->begin_run();
  if (ctx.health != nullptr) {
    ctx.health->rearm();
  }
  if (ctx.stuck != nullptr) {
    ctx.stuck->clear();
  }
  ctx.on_run_start();
}

// Bookkeeping for state changes the loop did not request itself.
inline void track_state(context & ctx, const bot::bot_state state) {
  if (state == ctx.seen_state) {
    return;
  }
  switch (state) {
    case bot::bot_state::chickened:
      ctx.stats.chickens += 1;
      finish_run(ctx, false, run::status::chicken);
      break;
    case bot::bot_state::dead:
      ctx.stats.deaths += 1;
      finish_run(ctx, false, run::status::death);
      break;
    case bot::bot_state::disconnected:
      ctx.stats.disconnects += 1;
      finish_run(ctx, false, run::status::error);
      break;
    case bot::bot_state::error:
      finish_run(ctx, false, run::status::error);
      break;
    default:
      break;
  }
  ctx.seen_state = state;
}

inline bool in_game(const bot::bot_state state) noexcept {
  return bot::in_run(state) || state == bot::bot_state::in_town ||
         state == bot::bot_state::managing_inventory || state == bot::bot_state::leveling_up;
}

inline void feed_stuck_detector(context & ctx, const bot::bot_state state) {
  if (ctx.stuck == nullptr || !bot::in_run(state)) {
    return;
  }
  stuck::sample value{};
  if (!stuck::sample_from(ctx.latest, value)) {
    return;
  }
  ctx.stuck->observe(value);
  if (ctx.stuck->is_stuck(state)) {
    return;
  }
  if (ctx.stuck->progressing()) {
    ctx.recovery->mark_recovered(recovery::error_kind::stuck);
  }
}

inline void report_observed_faults(context & ctx, const bot::bot_state state) {
  switch (ctx.latest.value) {
    case port::label::dead:
      if (in_game(state)) {
        report(ctx, recovery::error_kind::character_death, state, 0);
      }
      break;
    case port::label::disconnected:
      if (in_game(state) || state == bot::bot_state::starting) {
        report(ctx, recovery::error_kind::disconnect, state, 0);
      }
      break;
    case port::label::inventory_full:
      if (bot::in_run(state) && !ctx.inventory_pending) {
        report(ctx, recovery::error_kind::inventory_full, state, 0);
      }
      break;
    default:
      break;
  }
}

inline constexpr auto begin_configure = [](const event::configure & ev, context &) {
  if (ev.error_out != nullptr) {
    *ev.error_out = HELM_OK;
  }
};

inline constexpr auto run_validate_config = [](const event::validate_config & ev, context & ctx) {
  if (ev.error_out == nullptr) return;
  *ev.error_out = config::validate(ctx.cfg);
  if (*ev.error_out == HELM_OK && !guard::wired{}(ctx)) {
    *ev.error_out = HELM_ERR_INVALID_ARGUMENT;
  }
};

inline constexpr auto on_configure_done = [](const events::configure_done & ev, context &) {
  if (ev.error_out != nullptr) {
    *ev.error_out = HELM_OK;
  }
};

inline constexpr auto on_configure_error = [](const events::configure_error & ev, context &) {
  if (ev.error_out != nullptr) {
    *ev.error_out = ev.err;
  }
};

inline constexpr auto begin_tick = [](const event::tick & ev, context & ctx) {
  if (ev.error_out != nullptr) {
    *ev.error_out = HELM_OK;
  }
  ctx.tick += 1;
  ctx.stats.ticks += 1;
  ctx.decided = bot::bot_state::count;
  ctx.decide_status = HELM_OK;
  ctx.outcome_count = 0;
  ctx.holding = guard::holding{}(ctx, helm::now_ns());
  if (ctx.holding) {
    ctx.stats.held_ticks += 1;
  }
  (void)ctx.bot->process_event(bot::event::begin_tick{.tick = ctx.tick});
};

// Observe with a bounded timeout; an untrusted observation becomes an
// error event instead of a decision input.
inline constexpr auto run_observe = [](const event::observe & ev, context & ctx) {
  if (ev.error_out != nullptr) {
    *ev.error_out = HELM_OK;
  }
  if (ctx.holding) {
    return;
  }
  ctx.observe_status = port::observe(ctx.observe, ctx.cfg.observe_timeout_ms,
                                     ctx.cfg.confidence_floor, ctx.latest);
  if (ctx.latest.timestamp_ns == 0) {
    ctx.latest.timestamp_ns = helm::now_ns();
  }
  (void)ctx.bot->process_event(bot::event::observe{.value = ctx.latest});

  const bot::bot_state state = ctx.bot->current_state();
  track_state(ctx, state);
  if (state == bot::bot_state::idle || state == bot::bot_state::stopping) {
    return;
  }

  if (ctx.observe_status == HELM_ERR_UNAVAILABLE) {
    ctx.stats.observation_failures += 1;
    report(ctx, recovery::error_kind::process_crash, state, ctx.observe_status);
    return;
  }
  if (ctx.observe_status != HELM_OK || ctx.latest.value == port::label::unknown) {
    ctx.stats.observation_failures += 1;
    report(ctx, recovery::error_kind::observation_timeout, state, ctx.observe_status);
    return;
  }

  ctx.recovery->mark_recovered(recovery::error_kind::observation_timeout);
  report_observed_faults(ctx, state);
  feed_stuck_detector(ctx, state);
};

inline constexpr auto run_recover = [](const event::recover & ev, context & ctx) {
  if (ev.error_out != nullptr) {
    *ev.error_out = HELM_OK;
  }
  const int32_t status = ctx.recovery->drain(ctx.outcomes.data(), k_max_outcomes, &ctx.outcome_count);
  ctx.recovery_paused = status == HELM_ERR_PAUSED || ctx.recovery->is_paused();

  for (int32_t i = 0; i < ctx.outcome_count; ++i) {
    const recovery::outcome & out = ctx.outcomes[static_cast<size_t>(i)];
    switch (out.result) {
      case recovery::resolution::town_handoff:
        if (out.event.kind == recovery::error_kind::inventory_full) {
          ctx.inventory_pending = true;
        }
        finish_run(ctx, true, run::status::aborted);
        break;
      case recovery::resolution::end_run:
      case recovery::resolution::pause:
        finish_run(ctx, false, run::status::error);
        break;
      case recovery::resolution::retry:
        if (out.retry_at_ns > ctx.hold_until_ns) {
          ctx.hold_until_ns = out.retry_at_ns;
        }
        break;
      default:
        break;
    }
  }
  track_state(ctx, ctx.bot->current_state());
};

inline bot::bot_state decide_target(context & ctx, const bot::bot_state state) {
  const port::label seen = ctx.latest.value;
  const bool result_here = ctx.dispatched_state == state;
  const run::status result = result_here ? ctx.last_result.value : run::status::in_progress;

  // A stop request leaves from anywhere; the run limit waits for town.
  const bool stop = ctx.stop_requested.load(std::memory_order_acquire);
  if (stop || guard::run_limit_reached{}(ctx)) {
    if (state == bot::bot_state::idle) {
      ctx.finished = true;
      return bot::bot_state::count;
    }
    if (state == bot::bot_state::stopping) {
      return bot::bot_state::idle;
    }
    if (stop || state == bot::bot_state::in_town) {
      return bot::bot_state::stopping;
    }
  }

  switch (state) {
    case bot::bot_state::idle:
      return bot::bot_state::starting;
    case bot::bot_state::starting:
      return seen == port::label::in_town ? bot::bot_state::in_town : bot::bot_state::count;
    case bot::bot_state::in_town:
      if (ctx.inventory_pending) {
        return bot::bot_state::managing_inventory;
      }
      if (seen == port::label::level_up) {
        return bot::bot_state::leveling_up;
      }
      return bot::bot_state::running;
    case bot::bot_state::running:
    case bot::bot_state::fighting:
    case bot::bot_state::looting:
      if (result == run::status::success) {
        return bot::bot_state::returning;
      }
      if (guard::run_timed_out{}(ctx, helm::now_ns())) {
        finish_run(ctx, false, run::status::timeout);
        return bot::bot_state::returning;
      }
      if (seen == port::label::in_combat && state != bot::bot_state::fighting) {
        return bot::bot_state::fighting;
      }
      if (seen == port::label::loot_visible && state != bot::bot_state::looting) {
        return bot::bot_state::looting;
      }
      if (seen == port::label::in_game && state != bot::bot_state::running) {
        return bot::bot_state::running;
      }
      return bot::bot_state::count;
    case bot::bot_state::returning:
      return seen == port::label::in_town ? bot::bot_state::in_town : bot::bot_state::count;
    case bot::bot_state::managing_inventory:
    case bot::bot_state::leveling_up:
      return result == run::status::success ? bot::bot_state::in_town : bot::bot_state::count;
    case bot::bot_state::dead:
    case bot::bot_state::chickened:
      if (seen == port::label::in_town) {
        return bot::bot_state::in_town;
      }
      return seen == port::label::main_menu ? bot::bot_state::starting : bot::bot_state::count;
    case bot::bot_state::disconnected:
      return seen == port::label::main_menu ? bot::bot_state::starting : bot::bot_state::count;
    case bot::bot_state::stopping:
      return bot::bot_state::idle;
    case bot::bot_state::error:
    case bot::bot_state::count:
      break;
  }
  return bot::bot_state::count;
}

inline constexpr auto run_decide = [](const event::decide & ev, context & ctx) {
  if (ev.error_out != nullptr) {
    *ev.error_out = HELM_OK;
  }
  if (ctx.holding && !ctx.stop_requested.load(std::memory_order_acquire)) {
    return;
  }
  const bot::bot_state state = ctx.bot->current_state();
  ctx.decided = decide_target(ctx, state);
  if (ctx.decided == bot::bot_state::count) {
    return;
  }
  ctx.stats.transitions_requested += 1;
  ctx.decide_status = ctx.bot->request_transition(ctx.decided, bot::priority::normal);
  if (ctx.decide_status != HELM_OK) {
    ctx.stats.transitions_rejected += 1;
    return;
  }
  if (ctx.decided == bot::bot_state::running && !bot::in_run(state)) {
    begin_run(ctx);
  }
  if (ctx.decided == bot::bot_state::managing_inventory) {
    ctx.inventory_pending = false;
  }
  if (ctx.decided == bot::bot_state::stopping) {
    finish_run(ctx, false, run::status::aborted);
  }
  if (ctx.decided == bot::bot_state::idle && state == bot::bot_state::stopping) {
    ctx.finished = true;
  }
  ctx.seen_state = ctx.decided;
};

inline constexpr auto run_dispatch = [](const event::dispatch & ev, context & ctx) {
  if (ev.error_out != nullptr) {
    *ev.error_out = HELM_OK;
  }
  if (ctx.holding) {
    return;
  }
  const bot::bot_state state = ctx.bot->current_state();
  if (state == bot::bot_state::idle || state == bot::bot_state::stopping ||
      state == bot::bot_state::error) {
    ctx.dispatched_state = bot::bot_state::count;
    return;
  }

  run::result out{};
  const run::handler_fn & handler = ctx.handlers[static_cast<size_t>(bot::index_of(state))];
  if (handler) {
    handler(run::request{
      .bot = ctx.bot,
      .state = state,
      .tick = ctx.tick,
      .run_started_ns = ctx.run_started_ns,
      .latest = &ctx.latest,
    }, out);
  } else if (bot::in_run(state) || state == bot::bot_state::managing_inventory ||
             state == bot::bot_state::leveling_up) {
    out.value = run::status::success;
  }
  ctx.last_result = out;
  ctx.dispatched_state = state;
  if (out.items > 0) {
    ctx.stats.items_collected += static_cast<uint64_t>(out.items);
  }

  switch (out.value) {
    case run::status::success:
      if (bot::in_run(state)) {
        finish_run(ctx, true, run::status::success);
      }
      break;
    case run::status::death:
      report(ctx, recovery::error_kind::character_death, state, 0);
      break;
    case run::status::error:
      report(ctx, out.has_error ? out.error : recovery::error_kind::unknown_state, state, 0);
      break;
    case run::status::timeout:
      report(ctx, recovery::error_kind::action_timeout, state, 0);
      break;
    case run::status::chicken:
    case run::status::aborted:
    case run::status::in_progress:
      break;
  }
};

// A stop requested while paused leaves ERROR through STOPPING, one
// transition per tick, without resuming recovery.
inline void wind_down_paused(context & ctx) {
  const bot::bot_state state = ctx.bot->current_state();
  if (state == bot::bot_state::idle) {
    ctx.finished = true;
    return;
  }
  const bot::bot_state target =
      state == bot::bot_state::stopping ? bot::bot_state::idle : bot::bot_state::stopping;
  const int32_t status = ctx.bot->request_transition(target, bot::priority::normal);
  if (status == HELM_OK) {
    ctx.finished = target == bot::bot_state::idle;
    return;
  }
  if (status == HELM_ERR_INVALID_TRANSITION || status == HELM_ERR_GUARD_REJECTED) {
    ctx.finished = true;
  }
}

inline constexpr auto run_paused_tick = [](const event::tick & ev, context & ctx) {
  if (ev.error_out != nullptr) {
    *ev.error_out = HELM_ERR_PAUSED;
  }
  ctx.tick += 1;
  ctx.stats.paused_ticks += 1;
  (void)ctx.bot->process_event(bot::event::begin_tick{.tick = ctx.tick});
  // Only retries a deferred error transition; events stay queued.
  (void)ctx.recovery->drain();
  if (ctx.stop_requested.load(std::memory_order_acquire)) {
    wind_down_paused(ctx);
  }
  track_state(ctx, ctx.bot->current_state());
};

inline constexpr auto run_resume = [](const event::resume & ev, context & ctx) {
  int32_t status = ctx.recovery->resume();
  // Resuming opens a fresh tick so the pausing preemption does not
  // supersede the way out of ERROR.
  ctx.tick += 1;
  (void)ctx.bot->process_event(bot::event::begin_tick{.tick = ctx.tick});
  if (status == HELM_OK && ctx.bot->current_state() == bot::bot_state::error) {
    status = ctx.bot->request_transition(bot::bot_state::starting, bot::priority::normal);
  }
  ctx.recovery_paused = false;
  ctx.hold_until_ns = 0;
  ctx.seen_state = ctx.bot->current_state();
  if (ev.error_out != nullptr) {
    *ev.error_out = status;
  }
};

inline constexpr auto run_stop = [](const event::stop & ev, context & ctx) {
  if (ev.error_out != nullptr) {
    *ev.error_out = HELM_OK;
  }
  ctx.stop_requested.store(true, std::memory_order_release);
  if (ctx.health != nullptr) {
    ctx.health->stop();
  }
};

}  // namespace helm::loop::action
