#pragma once

#include "helm/recovery/context.hpp"

namespace helm::recovery::guard {

struct escalated {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.current.escalated;
  }
};

struct not_escalated {
  bool operator()(const action::context & ctx) const noexcept {
    return !ctx.current.escalated;
  }
};

struct paused {
  bool operator()(const action::context & ctx) const noexcept { return ctx.paused; }
};

struct not_paused {
  bool operator()(const action::context & ctx) const noexcept { return !ctx.paused; }
};

struct budget_exhausted {
  bool operator()(const retry_budget & budget) const noexcept {
    return budget.consecutive_failures >= budget.threshold;
  }
};

// A run already ended in this batch makes later recoverable work moot.
struct run_already_ended {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.run_ended_in_batch;
  }
};

struct run_failures_exceeded {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.consecutive_run_failures > ctx.max_consecutive_run_failures;
  }
};

}  // namespace helm::recovery::guard
