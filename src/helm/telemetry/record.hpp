#pragma once

#include <cstdint>

namespace helm::telemetry {

struct record {
  uint64_t timestamp_ns = 0;
  uint32_t component_id = 0;
  uint32_t event_id = 0;
  uint32_t state_id = 0;
  uint32_t target_id = 0;
  uint32_t kind_id = 0;
  int32_t status = 0;
};

using enqueue_record_fn = bool (*)(void * queue_ctx, const record & value) noexcept;
using dequeue_record_fn = bool (*)(void * queue_ctx, record * out_value) noexcept;

}  // namespace helm::telemetry
