#pragma once

#include <cstdint>

#include "helm/telemetry/record.hpp"

namespace helm::telemetry::provider::event {

struct configure {
  void * queue_ctx = nullptr;
  helm::telemetry::enqueue_record_fn try_enqueue = nullptr;
  int32_t * error_out = nullptr;
};

struct start {
  int32_t * error_out = nullptr;
};

struct publish {
  helm::telemetry::record value = {};
  bool * dropped_out = nullptr;
  int32_t * error_out = nullptr;
};

struct stop {
  int32_t * error_out = nullptr;
};

struct reset {
  int32_t * error_out = nullptr;
};

struct validate_config {
  int32_t * error_out = nullptr;
};

struct run_start {
  int32_t * error_out = nullptr;
};

struct publish_record {
  int32_t * error_out = nullptr;
};

struct run_stop {
  int32_t * error_out = nullptr;
};

}  // namespace helm::telemetry::provider::event

namespace helm::telemetry::provider::events {

struct validate_config_done {};
struct validate_config_error {
  int32_t err = 0;
};

struct run_start_done {};
struct run_start_error {
  int32_t err = 0;
};

struct publish_record_done {};
struct publish_record_error {
  int32_t err = 0;
};

struct run_stop_done {};
struct run_stop_error {
  int32_t err = 0;
};

struct configure_done {};
struct configure_error {
  int32_t err = 0;
};

struct start_done {};
struct start_error {
  int32_t err = 0;
};

struct publish_done {};
struct publish_error {
  int32_t err = 0;
};

struct stop_done {};
struct stop_error {
  int32_t err = 0;
};

}  // namespace helm::telemetry::provider::events
