#pragma once

#include "helm/bot/context.hpp"

namespace helm::bot::guard {

struct has_edge {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.edges.contains(ctx.request_from, ctx.request_to);
  }
};

struct edge_guard_passes {
  bool operator()(const action::context & ctx) const {
    const guard_fn predicate = ctx.edges.guard_for(ctx.request_from, ctx.request_to);
    if (!predicate) {
      return true;
    }
    return predicate(guard_input{
      .latest = &ctx.latest,
      .resume_health_percent = ctx.resume_health_percent,
    });
  }
};

struct preempt_waiting {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.preempt_pending.load(std::memory_order_acquire) > 0;
  }
};

struct preempted_this_tick {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.preempt_tick == ctx.tick;
  }
};

struct normal_applied_this_tick {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.normal_tick == ctx.tick;
  }
};

}  // namespace helm::bot::guard
