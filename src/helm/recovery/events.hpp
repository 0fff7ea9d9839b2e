#pragma once

#include <cstdint>

#include "helm/recovery/error.hpp"

namespace helm::recovery::event {

struct handle {
  error_event error = {};
  recovery::outcome * outcome_out = nullptr;
  int32_t * error_out = nullptr;
};

struct mark_recovered {
  error_kind kind = error_kind::unknown_state;
};

struct begin_run {};

struct run_succeeded {};

struct resume {
  int32_t * error_out = nullptr;
};

struct classify {
  int32_t * error_out = nullptr;
};

struct attempt {
  int32_t * error_out = nullptr;
};

struct apply {
  int32_t * error_out = nullptr;
};

}  // namespace helm::recovery::event

namespace helm::recovery::events {

struct classify_done {};
struct classify_error {
  int32_t err = 0;
};

struct attempt_done {};
struct attempt_error {
  int32_t err = 0;
};

struct apply_done {};

struct handle_done {
  int32_t * error_out = nullptr;
};

struct handle_error {
  int32_t err = 0;
  int32_t * error_out = nullptr;
};

}  // namespace helm::recovery::events
