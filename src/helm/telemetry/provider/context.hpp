#pragma once

#include <cstdint>

#include "helm/helm.h"
#include "helm/telemetry/record.hpp"

namespace helm::telemetry::provider::action {

struct context {
  void * queue_ctx = nullptr;
  helm::telemetry::enqueue_record_fn try_enqueue = nullptr;

  helm::telemetry::record pending_record = {};
  bool pending_dropped = false;

  uint64_t sessions_started = 0;
  uint64_t records_emitted = 0;
  uint64_t records_dropped = 0;
};

}  // namespace helm::telemetry::provider::action
