#pragma once

#include <cstdint>

#include "helm/bot/state.hpp"
#include "helm/callback.hpp"
#include "helm/port/observation.hpp"

namespace helm::bot::event {

using hook_fn = helm::callback<void(bot_state from, bot_state to)>;

struct request {
  bot_state to = bot_state::idle;
  priority prio = priority::normal;
  int32_t * error_out = nullptr;
};

struct begin_tick {
  uint64_t tick = 0;
};

struct observe {
  port::observation value = {};
};

// Entry/exit hooks run with the machine locked; they must not call back
// into the machine.
struct bind_hooks {
  bot_state state = bot_state::idle;
  hook_fn on_enter = {};
  hook_fn on_exit = {};
  int32_t * error_out = nullptr;
};

struct validate {
  int32_t * error_out = nullptr;
};

struct arbitrate {
  int32_t * error_out = nullptr;
};

struct run_exit {
  int32_t * error_out = nullptr;
};

struct run_enter {
  int32_t * error_out = nullptr;
};

struct publish {
  int32_t * error_out = nullptr;
};

}  // namespace helm::bot::event

namespace helm::bot::events {

struct validate_done {};
struct validate_error {
  int32_t err = 0;
};

struct arbitrate_done {};
struct arbitrate_error {
  int32_t err = 0;
};

struct exit_done {};
struct enter_done {};
struct publish_done {};

struct transition_done {
  int32_t * error_out = nullptr;
};

struct transition_error {
  int32_t err = 0;
  int32_t * error_out = nullptr;
};

}  // namespace helm::bot::events
