#pragma once

#include <cstdint>

namespace helm::loop::event {

struct configure {
  int32_t * error_out = nullptr;
};

struct tick {
  int32_t * error_out = nullptr;
};

struct resume {
  int32_t * error_out = nullptr;
};

struct stop {
  int32_t * error_out = nullptr;
};

struct validate_config {
  int32_t * error_out = nullptr;
};

struct observe {
  int32_t * error_out = nullptr;
};

struct recover {
  int32_t * error_out = nullptr;
};

struct decide {
  int32_t * error_out = nullptr;
};

struct dispatch {
  int32_t * error_out = nullptr;
};

}  // namespace helm::loop::event

namespace helm::loop::events {

struct validate_config_done {};
struct validate_config_error {
  int32_t err = 0;
};

struct configure_done {
  int32_t * error_out = nullptr;
};

struct configure_error {
  int32_t err = 0;
  int32_t * error_out = nullptr;
};

struct observe_done {};
struct recover_done {};
struct decide_done {};
struct dispatch_done {};
struct paused_tick_done {};

}  // namespace helm::loop::events
