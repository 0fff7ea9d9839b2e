#pragma once

#include <cstdint>

#include "helm/helm.h"
#include "helm/telemetry/provider/context.hpp"
#include "helm/telemetry/provider/events.hpp"

namespace helm::telemetry::provider::action {

inline constexpr auto begin_configure = [](const event::configure & ev, context & ctx) {
  ctx.queue_ctx = ev.queue_ctx;
  ctx.try_enqueue = ev.try_enqueue;
};

inline constexpr auto run_validate_config = [](const event::validate_config & ev, context & ctx) {
  if (ev.error_out == nullptr) return;
  *ev.error_out = HELM_OK;
  if (ctx.queue_ctx == nullptr || ctx.try_enqueue == nullptr) {
    *ev.error_out = HELM_ERR_INVALID_ARGUMENT;
  }
};

inline constexpr auto begin_start = [](const event::start &, context & ctx) {
  ctx.pending_dropped = false;
};

inline constexpr auto run_start = [](const event::run_start & ev, context & ctx) {
  if (ev.error_out == nullptr) return;
  *ev.error_out = HELM_OK;
  ctx.sessions_started += 1;
};

inline constexpr auto begin_publish = [](const event::publish & ev, context & ctx) {
  ctx.pending_record = ev.value;
  ctx.pending_dropped = false;
};

inline constexpr auto run_publish_record = [](const event::publish_record & ev, context & ctx) {
  if (ev.error_out == nullptr) return;
  *ev.error_out = HELM_OK;

  if (!ctx.try_enqueue(ctx.queue_ctx, ctx.pending_record)) {
    ctx.pending_dropped = true;
    ctx.records_dropped += 1;
    return;
  }
  ctx.records_emitted += 1;
};

inline constexpr auto begin_stop = [](const event::stop &, context & ctx) {
  ctx.pending_dropped = false;
};

inline constexpr auto run_stop = [](const event::run_stop & ev, context &) {
  if (ev.error_out == nullptr) return;
  *ev.error_out = HELM_OK;
};

inline constexpr auto run_reset = [](const event::reset & ev, context & ctx) {
  if (ev.error_out != nullptr) {
    *ev.error_out = HELM_OK;
  }
  ctx.queue_ctx = nullptr;
  ctx.try_enqueue = nullptr;
  ctx.pending_dropped = false;
};

}  // namespace helm::telemetry::provider::action
