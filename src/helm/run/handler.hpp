#pragma once

#include <cstdint>

#include "helm/bot/state.hpp"
#include "helm/callback.hpp"
#include "helm/port/observation.hpp"
#include "helm/recovery/error.hpp"

namespace helm::bot {
struct sm;
}  // namespace helm::bot

namespace helm::run {

enum class status : uint8_t {
  in_progress = 0,
  success,
  death,
  chicken,
  error,
  timeout,
  aborted,
};

struct result {
  status value = status::in_progress;
  bool has_error = false;
  recovery::error_kind error = recovery::error_kind::unknown_state;
  // Items picked up during this step.
  int32_t items = 0;
  // Handler-measured run length; replaces the loop's wall time when set.
  uint64_t duration_ns = 0;
};

// Handlers poll bot->current_state() between steps and return `aborted`
// once the state they were dispatched for is gone.
struct request {
  const bot::sm * bot = nullptr;
  bot::bot_state state = bot::bot_state::idle;
  uint64_t tick = 0;
  uint64_t run_started_ns = 0;
  const port::observation * latest = nullptr;
};

using handler_fn = helm::callback<void(const request & req, result & out)>;

inline const char * to_string(const status s) noexcept {
  switch (s) {
    case status::in_progress:
      return "in_progress";
    case status::success:
      return "success";
    case status::death:
      return "death";
    case status::chicken:
      return "chicken";
    case status::error:
      return "error";
    case status::timeout:
      return "timeout";
    case status::aborted:
      return "aborted";
  }
  return "invalid";
}

}  // namespace helm::run
