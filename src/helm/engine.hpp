#pragma once

#include <cstdint>

#include "helm/config.hpp"
#include "helm/helm.h"
#include "helm/machines.hpp"
#include "helm/port/action.hpp"
#include "helm/port/observation.hpp"
#include "helm/recovery/error.hpp"
#include "helm/telemetry/ring.hpp"

namespace helm {

// External collaborators. Every port is optional; see the per-component
// notes for what a missing one degrades to.
struct ports {
  port::observe_fn observe = {};
  port::perform_fn perform = {};
  recovery::action::alert_fn alert = {};
};

// Owns one instance of every component and wires them the only way they
// may talk: transitions through the bot, faults through recovery.
// Members are declared in dependency order.
class engine {
 public:
  using record_ring = helm::telemetry::ring<1024>;

  engine(const config::engine & cfg, const ports & io)
      : cfg_(cfg),
        bot_(bot::graph::standard(), cfg.resume_health_percent, &telemetry_),
        recovery_(cfg, &bot_, io.perform, io.alert, &telemetry_),
        stuck_(cfg, reporter()),
        health_(cfg, &bot_, io.observe, io.perform, reporter(), &telemetry_),
        loop_(cfg, &bot_, &recovery_, io.observe, &health_, &stuck_, &telemetry_) {}

  ~engine() { (void)shutdown(); }

  engine(const engine &) = delete;
  engine & operator=(const engine &) = delete;

  // Validates the options, opens the record stream and starts the health
  // worker. A missing observation port leaves health monitoring off.
  int32_t start(const bool spawn_health_worker = true) {
    int32_t err = HELM_OK;
    (void)telemetry_.process_event(helm::telemetry::provider::event::configure{
      .queue_ctx = &records_,
      .try_enqueue = &record_ring::try_enqueue,
      .error_out = &err,
    });
    if (err != HELM_OK) {
      return err;
    }
    (void)telemetry_.process_event(helm::telemetry::provider::event::start{.error_out = &err});
    if (err != HELM_OK) {
      return err;
    }
    err = loop_.configure();
    if (err != HELM_OK) {
      return err;
    }
    err = HELM_OK;
    (void)health_.process_event(health::event::start{
      .spawn_worker = spawn_health_worker,
      .error_out = &err,
    });
    if (err != HELM_OK && err != HELM_ERR_UNAVAILABLE) {
      return err;
    }
    return HELM_OK;
  }

  int32_t shutdown() {
    health_.stop();
    if (!telemetry_.running()) {
      return HELM_OK;
    }
    int32_t err = HELM_OK;
    (void)telemetry_.process_event(helm::telemetry::provider::event::stop{.error_out = &err});
    return err;
  }

  // Pops one telemetry record; false when none are queued.
  bool next_record(helm::telemetry::record & out) {
    return record_ring::try_dequeue(&records_, &out);
  }

  const config::engine & options() const noexcept { return cfg_; }

  BotMachine & bot() noexcept { return bot_; }
  RecoveryCoordinator & recovery() noexcept { return recovery_; }
  StuckDetector & stuck() noexcept { return stuck_; }
  HealthController & health() noexcept { return health_; }
  OrchestrationLoop & loop() noexcept { return loop_; }
  TelemetryProvider & telemetry() noexcept { return telemetry_; }

 private:
  recovery::report_fn reporter() noexcept {
    return recovery::report_fn::from<RecoveryCoordinator, &RecoveryCoordinator::report>(&recovery_);
  }

  config::engine cfg_;
  record_ring records_;
  TelemetryProvider telemetry_;
  BotMachine bot_;
  RecoveryCoordinator recovery_;
  StuckDetector stuck_;
  HealthController health_;
  OrchestrationLoop loop_;
};

}  // namespace helm
