#pragma once

#include <cstdint>

namespace helm::health::event {

struct start {
  bool spawn_worker = true;
  int32_t * error_out = nullptr;
};

struct stop {
  int32_t * error_out = nullptr;
};

struct rearm {};

struct sample {
  int32_t * error_out = nullptr;
};

struct read {
  int32_t * error_out = nullptr;
};

struct request_chicken {
  int32_t * error_out = nullptr;
};

struct run_escape {
  int32_t * error_out = nullptr;
};

struct drink {
  int32_t * error_out = nullptr;
};

}  // namespace helm::health::event

namespace helm::health::events {

struct read_done {};
struct read_error {
  int32_t err = 0;
};

struct chicken_done {};
struct escape_done {};
struct drink_done {};

struct sample_done {};

}  // namespace helm::health::events
