#pragma once

#include <cstddef>
#include <cstdint>

#include "helm/bot/context.hpp"
#include "helm/bot/events.hpp"
#include "helm/bot/guards.hpp"
#include "helm/clock.hpp"
#include "helm/helm.h"

namespace helm::bot::action {

inline void publish_record(
    const context & ctx, const uint32_t event_id, const bot_state from, const bot_state to,
    const int32_t status) {
  if (ctx.telemetry == nullptr) {
    return;
  }
  ctx.telemetry->emit(helm::telemetry::record{
    .timestamp_ns = helm::now_ns(),
    .component_id = HELM_COMPONENT_BOT,
    .event_id = event_id,
    .state_id = static_cast<uint32_t>(from),
    .target_id = static_cast<uint32_t>(to),
    .kind_id = static_cast<uint32_t>(ctx.request_prio),
    .status = status,
  });
}

inline constexpr auto begin_request = [](const event::request & ev, context & ctx) {
  if (ev.error_out != nullptr) {
    *ev.error_out = HELM_OK;
  }
  ctx.request_from = ctx.current.load(std::memory_order_relaxed);
  ctx.request_to = ev.to;
  ctx.request_prio = ev.prio;
};

inline constexpr auto run_validate = [](const event::validate & ev, context & ctx) {
  if (ev.error_out == nullptr) return;
  *ev.error_out = HELM_OK;

  if (!valid_state(ctx.request_to)) {
    *ev.error_out = HELM_ERR_INVALID_ARGUMENT;
    return;
  }
  if (!guard::has_edge{}(ctx)) {
    *ev.error_out = HELM_ERR_INVALID_TRANSITION;
    return;
  }
  if (!guard::edge_guard_passes{}(ctx)) {
    *ev.error_out = HELM_ERR_GUARD_REJECTED;
  }
};

inline constexpr auto run_arbitrate = [](const event::arbitrate & ev, context & ctx) {
  if (ev.error_out == nullptr) return;
  *ev.error_out = HELM_OK;

  if (ctx.request_prio == priority::preemptive) {
    if (guard::preempted_this_tick{}(ctx)) {
      *ev.error_out = HELM_ERR_BUSY;
    }
    return;
  }
  if (guard::preempt_waiting{}(ctx) || guard::preempted_this_tick{}(ctx)) {
    *ev.error_out = HELM_ERR_SUPERSEDED;
    return;
  }
  if (guard::normal_applied_this_tick{}(ctx)) {
    *ev.error_out = HELM_ERR_BUSY;
  }
};

inline constexpr auto run_exit = [](const event::run_exit & ev, context & ctx) {
  if (ev.error_out != nullptr) {
    *ev.error_out = HELM_OK;
  }
  ctx.on_exit[static_cast<size_t>(index_of(ctx.request_from))](ctx.request_from, ctx.request_to);
};

inline constexpr auto run_enter = [](const event::run_enter & ev, context & ctx) {
  if (ev.error_out != nullptr) {
    *ev.error_out = HELM_OK;
  }
  ctx.previous = ctx.request_from;
  ctx.entered_at_ns.store(helm::now_ns(), std::memory_order_relaxed);
  ctx.current.store(ctx.request_to, std::memory_order_release);
  if (ctx.request_prio == priority::preemptive) {
    ctx.preempt_tick = ctx.tick;
  } else {
    ctx.normal_tick = ctx.tick;
  }
  ctx.on_enter[static_cast<size_t>(index_of(ctx.request_to))](ctx.request_from, ctx.request_to);
};

inline constexpr auto run_publish = [](const event::publish & ev, context & ctx) {
  if (ev.error_out != nullptr) {
    *ev.error_out = HELM_OK;
  }
  ctx.stats.accepted += 1;
  publish_record(ctx, HELM_RECORD_TRANSITION, ctx.request_from, ctx.request_to, HELM_OK);
};

inline constexpr auto on_transition_done = [](const events::transition_done & ev, context &) {
  if (ev.error_out != nullptr) {
    *ev.error_out = HELM_OK;
  }
};

inline constexpr auto on_transition_error = [](const events::transition_error & ev, context & ctx) {
  if (ev.error_out != nullptr) {
    *ev.error_out = ev.err;
  }
  switch (ev.err) {
    case HELM_ERR_INVALID_TRANSITION:
    case HELM_ERR_INVALID_ARGUMENT:
      ctx.stats.rejected_invalid += 1;
      break;
    case HELM_ERR_GUARD_REJECTED:
      ctx.stats.rejected_guard += 1;
      break;
    case HELM_ERR_SUPERSEDED:
      ctx.stats.superseded += 1;
      break;
    case HELM_ERR_BUSY:
      ctx.stats.busy += 1;
      break;
    default:
      break;
  }
  ctx.last_rejection = rejection{
    .from = ctx.request_from,
    .to = ctx.request_to,
    .prio = ctx.request_prio,
    .status = ev.err,
    .tick = ctx.tick,
  };
  ctx.has_rejection = true;
  publish_record(ctx, HELM_RECORD_REJECTION, ctx.request_from, ctx.request_to, ev.err);
};

inline constexpr auto run_begin_tick = [](const event::begin_tick & ev, context & ctx) {
  ctx.tick = ev.tick;
};

inline constexpr auto run_observe = [](const event::observe & ev, context & ctx) {
  ctx.latest = ev.value;
};

inline constexpr auto run_bind_hooks = [](const event::bind_hooks & ev, context & ctx) {
  if (!valid_state(ev.state)) {
    if (ev.error_out != nullptr) {
      *ev.error_out = HELM_ERR_INVALID_ARGUMENT;
    }
    return;
  }
  if (ev.error_out != nullptr) {
    *ev.error_out = HELM_OK;
  }
  ctx.on_enter[static_cast<size_t>(index_of(ev.state))] = ev.on_enter;
  ctx.on_exit[static_cast<size_t>(index_of(ev.state))] = ev.on_exit;
};

}  // namespace helm::bot::action
