#pragma once

#include "helm/telemetry/provider/context.hpp"

namespace helm::telemetry::provider::guard {

struct is_configured {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.queue_ctx != nullptr && ctx.try_enqueue != nullptr;
  }
};

}  // namespace helm::telemetry::provider::guard
