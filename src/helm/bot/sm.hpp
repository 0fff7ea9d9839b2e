#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

#include "helm/bot/actions.hpp"
#include "helm/bot/events.hpp"
#include "helm/bot/guards.hpp"
#include "helm/clock.hpp"
#include "helm/helm.h"
#include "helm/sm.hpp"

namespace helm::bot {

struct ready {};
struct validating {};
struct arbitrating {};
struct exiting {};
struct entering {};
struct publishing {};
struct done {};
struct errored {};

struct model {
  auto operator()() const {
    namespace sml = boost::sml;

    return sml::make_transition_table(
      *sml::state<ready> + sml::event<event::request> / action::begin_request =
          sml::state<validating>,

      sml::state<validating> + sml::event<event::validate> / action::run_validate =
          sml::state<validating>,
      sml::state<validating> + sml::event<events::validate_done> = sml::state<arbitrating>,
      sml::state<validating> + sml::event<events::validate_error> = sml::state<errored>,

      sml::state<arbitrating> + sml::event<event::arbitrate> / action::run_arbitrate =
          sml::state<arbitrating>,
      sml::state<arbitrating> + sml::event<events::arbitrate_done> = sml::state<exiting>,
      sml::state<arbitrating> + sml::event<events::arbitrate_error> = sml::state<errored>,

      sml::state<exiting> + sml::event<event::run_exit> / action::run_exit = sml::state<exiting>,
      sml::state<exiting> + sml::event<events::exit_done> = sml::state<entering>,

      sml::state<entering> + sml::event<event::run_enter> / action::run_enter =
          sml::state<entering>,
      sml::state<entering> + sml::event<events::enter_done> = sml::state<publishing>,

      sml::state<publishing> + sml::event<event::publish> / action::run_publish =
          sml::state<publishing>,
      sml::state<publishing> + sml::event<events::publish_done> = sml::state<done>,

      sml::state<done> + sml::event<events::transition_done> / action::on_transition_done =
          sml::state<ready>,
      sml::state<errored> + sml::event<events::transition_error> / action::on_transition_error =
          sml::state<ready>,

      sml::state<ready> + sml::event<event::begin_tick> / action::run_begin_tick =
          sml::state<ready>,
      sml::state<ready> + sml::event<event::observe> / action::run_observe = sml::state<ready>,
      sml::state<ready> + sml::event<event::bind_hooks> / action::run_bind_hooks =
          sml::state<ready>
    );
  }
};

// Sole owner of the current bot state. Every write goes through
// process_event(event::request) under one lock; current_state() is a
// lock-free read usable from any thread.
struct sm : helm::sm<model> {
  using base_type = helm::sm<model>;

  explicit sm(
      const bot::graph & edges = bot::graph::standard(), const float resume_health_percent = 50.0f,
      helm::telemetry::provider::sm * telemetry = nullptr)
      : base_type(context_) {
    context_.edges = edges;
    context_.resume_health_percent = resume_health_percent;
    context_.telemetry = telemetry;
    context_.entered_at_ns.store(helm::now_ns(), std::memory_order_relaxed);
  }

  bool process_event(const event::request & ev) {
    const bool preemptive = ev.prio == priority::preemptive;
    if (preemptive) {
      context_.preempt_pending.fetch_add(1, std::memory_order_acq_rel);
    }
    std::unique_lock<std::mutex> lock(mutex_);
    if (preemptive) {
      context_.preempt_pending.fetch_sub(1, std::memory_order_acq_rel);
    }

    if (!base_type::process_event(ev)) {
      if (ev.error_out != nullptr) {
        *ev.error_out = HELM_ERR_BACKEND;
      }
      return false;
    }
    int32_t phase_error = HELM_OK;
    if (!run_phase<event::validate, events::validate_done, events::validate_error>(phase_error)) {
      return finalize_error(phase_error, ev.error_out);
    }
    if (!run_phase<event::arbitrate, events::arbitrate_done, events::arbitrate_error>(phase_error)) {
      return finalize_error(phase_error, ev.error_out);
    }
    run_step<event::run_exit, events::exit_done>();
    run_step<event::run_enter, events::enter_done>();
    run_step<event::publish, events::publish_done>();
    const bool accepted = base_type::process_event(events::transition_done{
      .error_out = ev.error_out,
    });
    lock.unlock();
    changed_.notify_all();
    return accepted;
  }

  bool process_event(const event::begin_tick & ev) {
    std::lock_guard<std::mutex> lock(mutex_);
    return base_type::process_event(ev);
  }

  bool process_event(const event::observe & ev) {
    std::lock_guard<std::mutex> lock(mutex_);
    return base_type::process_event(ev);
  }

  bool process_event(const event::bind_hooks & ev) {
    std::lock_guard<std::mutex> lock(mutex_);
    return base_type::process_event(ev);
  }

  int32_t request_transition(const bot_state to, const priority prio = priority::normal) {
    int32_t err = HELM_OK;
    (void)process_event(event::request{
      .to = to,
      .prio = prio,
      .error_out = &err,
    });
    return err;
  }

  bot_state current_state() const noexcept {
    return context_.current.load(std::memory_order_acquire);
  }

  bot_state previous_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return context_.previous;
  }

  uint64_t state_duration_ns() const noexcept {
    const uint64_t entered = context_.entered_at_ns.load(std::memory_order_relaxed);
    const uint64_t now = helm::now_ns();
    return now > entered ? now - entered : 0u;
  }

  // Blocks until the machine is in `target` or the timeout elapses.
  bool wait_for(const bot_state target, const int32_t timeout_ms) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return changed_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [&] {
      return context_.current.load(std::memory_order_acquire) == target;
    });
  }

  int32_t preempt_pending() const noexcept {
    return context_.preempt_pending.load(std::memory_order_acquire);
  }

  uint64_t tick() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return context_.tick;
  }

  const bot::graph & edges() const noexcept { return context_.edges; }

  action::counters stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return context_.stats;
  }

  bool last_rejection(action::rejection & out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!context_.has_rejection) {
      return false;
    }
    out = context_.last_rejection;
    return true;
  }

 private:
  template <class TriggerEvent, class DoneEvent, class ErrorEvent>
  bool run_phase(int32_t & error_out) {
    error_out = HELM_OK;
    TriggerEvent trigger{};
    trigger.error_out = &error_out;
    if (!base_type::process_event(trigger)) {
      error_out = HELM_ERR_BACKEND;
      return false;
    }
    if (error_out == HELM_OK) {
      return base_type::process_event(DoneEvent{});
    }
    (void)base_type::process_event(ErrorEvent{
      .err = error_out,
    });
    return false;
  }

  template <class TriggerEvent, class DoneEvent>
  void run_step() {
    (void)base_type::process_event(TriggerEvent{});
    (void)base_type::process_event(DoneEvent{});
  }

  bool finalize_error(const int32_t error_code, int32_t * error_out) {
    const int32_t err = error_code == HELM_OK ? HELM_ERR_BACKEND : error_code;
    (void)base_type::process_event(events::transition_error{
      .err = err,
      .error_out = error_out,
    });
    return false;
  }

  mutable std::mutex mutex_;
  mutable std::condition_variable changed_;
  action::context context_{};
};

}  // namespace helm::bot
