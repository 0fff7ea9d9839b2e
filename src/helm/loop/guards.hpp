#pragma once

#include "helm/clock.hpp"
#include "helm/loop/context.hpp"

namespace helm::loop::guard {

struct recovery_paused {
  bool operator()(const action::context & ctx) const noexcept { return ctx.recovery_paused; }
};

struct recovery_active {
  bool operator()(const action::context & ctx) const noexcept { return !ctx.recovery_paused; }
};

// A wait-and-retry outcome holds observation until its deadline.
struct holding {
  bool operator()(const action::context & ctx, const uint64_t now) const noexcept {
    return now < ctx.hold_until_ns;
  }
};

struct finished {
  bool operator()(const action::context & ctx) const noexcept { return ctx.finished; }
};

struct not_finished {
  bool operator()(const action::context & ctx) const noexcept { return !ctx.finished; }
};

struct run_limit_reached {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.cfg.max_runs > 0 && ctx.runs_finished >= ctx.cfg.max_runs;
  }
};

struct run_timed_out {
  bool operator()(const action::context & ctx, const uint64_t now) const noexcept {
    return ctx.run_active && ctx.cfg.run_timeout_ms > 0 &&
           now - ctx.run_started_ns > helm::ms_to_ns(ctx.cfg.run_timeout_ms);
  }
};

struct wired {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.bot != nullptr && ctx.recovery != nullptr;
  }
};

}  // namespace helm::loop::guard
