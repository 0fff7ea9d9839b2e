#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

#include "helm/helm.h"
#include "helm/loop/actions.hpp"
#include "helm/loop/events.hpp"
#include "helm/loop/guards.hpp"
#include "helm/sm.hpp"

namespace helm::loop {

struct initialized {};
struct configuring {};
struct ready {};
struct observing {};
struct recovering {};
struct deciding {};
struct dispatching {};
struct paused {};
struct stopped {};
struct errored {};

struct model {
  auto operator()() const {
    namespace sml = boost::sml;

    return sml::make_transition_table(
      *sml::state<initialized> + sml::event<event::configure> / action::begin_configure =
          sml::state<configuring>,
      sml::state<configuring> + sml::event<event::validate_config> / action::run_validate_config =
          sml::state<configuring>,
      sml::state<configuring> + sml::event<events::validate_config_done> = sml::state<configuring>,
      sml::state<configuring> + sml::event<events::validate_config_error> =
          sml::state<configuring>,
      sml::state<configuring> + sml::event<events::configure_done> / action::on_configure_done =
          sml::state<ready>,
      sml::state<configuring> + sml::event<events::configure_error> / action::on_configure_error =
          sml::state<errored>,

      sml::state<ready> + sml::event<event::tick> / action::begin_tick = sml::state<observing>,
      sml::state<observing> + sml::event<event::observe> / action::run_observe =
          sml::state<observing>,
      sml::state<observing> + sml::event<events::observe_done> = sml::state<recovering>,
      sml::state<recovering> + sml::event<event::recover> / action::run_recover =
          sml::state<recovering>,
      sml::state<recovering> + sml::event<events::recover_done>[guard::recovery_active{}] =
          sml::state<deciding>,
      sml::state<recovering> + sml::event<events::recover_done>[guard::recovery_paused{}] =
          sml::state<paused>,
      sml::state<deciding> + sml::event<event::decide> / action::run_decide =
          sml::state<deciding>,
      sml::state<deciding> + sml::event<events::decide_done> = sml::state<dispatching>,
      sml::state<dispatching> + sml::event<event::dispatch> / action::run_dispatch =
          sml::state<dispatching>,
      sml::state<dispatching> + sml::event<events::dispatch_done>[guard::not_finished{}] =
          sml::state<ready>,
      sml::state<dispatching> + sml::event<events::dispatch_done>[guard::finished{}] =
          sml::state<stopped>,

      sml::state<paused> + sml::event<event::tick> / action::run_paused_tick = sml::state<paused>,
      sml::state<paused> + sml::event<events::paused_tick_done>[guard::not_finished{}] =
          sml::state<paused>,
      sml::state<paused> + sml::event<events::paused_tick_done>[guard::finished{}] =
          sml::state<stopped>,
      sml::state<paused> + sml::event<event::resume> / action::run_resume = sml::state<ready>,

      sml::state<ready> + sml::event<event::stop> / action::run_stop = sml::state<stopped>,
      sml::state<paused> + sml::event<event::stop> / action::run_stop = sml::state<stopped>
    );
  }
};

// The orchestration loop: one tick observes, drains recovery, applies at
// most one normal transition and dispatches the state's handler.
struct sm : helm::sm<model> {
  using base_type = helm::sm<model>;

  sm(const config::engine & cfg, bot::sm * bot, recovery::sm * recovery, port::observe_fn observe,
     health::sm * health = nullptr, stuck::detector * stuck = nullptr,
     helm::telemetry::provider::sm * telemetry = nullptr)
      : base_type(context_) {
    context_.cfg = cfg;
    context_.bot = bot;
    context_.recovery = recovery;
    context_.observe = observe;
    context_.health = health;
    context_.stuck = stuck;
    context_.telemetry = telemetry;
  }

  bool process_event(const event::configure & ev) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!base_type::process_event(ev)) return false;
    int32_t phase_error = HELM_OK;
    event::validate_config validate{.error_out = &phase_error};
    (void)base_type::process_event(validate);
    if (phase_error != HELM_OK) {
      (void)base_type::process_event(events::validate_config_error{.err = phase_error});
      (void)base_type::process_event(events::configure_error{
        .err = phase_error,
        .error_out = ev.error_out,
      });
      return false;
    }
    (void)base_type::process_event(events::validate_config_done{});
    return base_type::process_event(events::configure_done{.error_out = ev.error_out});
  }

  bool process_event(const event::tick & ev) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (base_type::is(boost::sml::state<loop::paused>)) {
      if (!base_type::process_event(ev)) return false;
      (void)base_type::process_event(events::paused_tick_done{});
      return true;
    }
    if (!base_type::process_event(ev)) {
      if (ev.error_out != nullptr) {
        *ev.error_out = HELM_ERR_UNAVAILABLE;
      }
      return false;
    }
    run_step<event::observe, events::observe_done>();
    run_step<event::recover, events::recover_done>();
    if (base_type::is(boost::sml::state<loop::paused>)) {
      if (ev.error_out != nullptr) {
        *ev.error_out = HELM_ERR_PAUSED;
      }
      return true;
    }
    run_step<event::decide, events::decide_done>();
    run_step<event::dispatch, events::dispatch_done>();
    return true;
  }

  bool process_event(const event::resume & ev) {
    std::lock_guard<std::mutex> lock(mutex_);
    return base_type::process_event(ev);
  }

  bool process_event(const event::stop & ev) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!base_type::process_event(ev)) return false;
    }
    wake_.notify_all();
    return true;
  }

  int32_t configure() {
    int32_t err = HELM_OK;
    (void)process_event(event::configure{.error_out = &err});
    return err;
  }

  int32_t tick() {
    int32_t err = HELM_OK;
    (void)process_event(event::tick{.error_out = &err});
    return err;
  }

  int32_t resume() {
    int32_t err = HELM_ERR_INVALID_ARGUMENT;
    if (!process_event(event::resume{.error_out = &err})) {
      return HELM_ERR_INVALID_ARGUMENT;
    }
    return err;
  }

  // Asks the loop to wind down through STOPPING; safe from any thread.
  void request_stop() {
    context_.stop_requested.store(true, std::memory_order_release);
    wake_.notify_all();
  }

  // Hard stop: the loop machine stops without driving the bot further.
  void stop() { (void)process_event(event::stop{}); }

  // Ticks on the configured cadence until the loop stops or `max_ticks`
  // ticks have run (0 = no limit).
  int32_t run(const uint64_t max_ticks = 0) {
    uint64_t ran = 0;
    while (!stopped()) {
      if (max_ticks > 0 && ran >= max_ticks) {
        return HELM_ERR_TIMEOUT;
      }
      const int32_t status = tick();
      if (status != HELM_OK && status != HELM_ERR_PAUSED) {
        return status;
      }
      ran += 1;
      std::unique_lock<std::mutex> wait_lock(wake_mutex_);
      wake_.wait_for(wait_lock, std::chrono::milliseconds(context_.cfg.tick_interval_ms), [this] {
        return context_.stop_requested.load(std::memory_order_acquire);
      });
    }
    return HELM_OK;
  }

  void set_handler(const bot::bot_state state, const run::handler_fn handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!bot::valid_state(state)) {
      return;
    }
    context_.handlers[static_cast<size_t>(bot::index_of(state))] = handler;
  }

  void set_run_start_hook(const action::run_start_fn hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    context_.on_run_start = hook;
  }

  bool stopped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return base_type::is(boost::sml::state<loop::stopped>);
  }

  bool is_paused() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return base_type::is(boost::sml::state<loop::paused>);
  }

  bool configured() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !base_type::is(boost::sml::state<initialized>) &&
           !base_type::is(boost::sml::state<errored>);
  }

  action::session_stats stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return context_.stats;
  }

  int32_t last_decision(bot::bot_state & target) const {
    std::lock_guard<std::mutex> lock(mutex_);
    target = context_.decided;
    return context_.decide_status;
  }

  run::result last_result() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return context_.last_result;
  }

  bool run_active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return context_.run_active;
  }

  double items_per_run() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (context_.stats.runs_started == 0) {
      return 0.0;
    }
    return static_cast<double>(context_.stats.items_collected) /
           static_cast<double>(context_.stats.runs_started);
  }

  double average_run_seconds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const uint64_t finished = context_.stats.runs_completed + context_.stats.runs_failed;
    if (finished == 0) {
      return 0.0;
    }
    return static_cast<double>(context_.stats.total_run_ns) / 1e9 / static_cast<double>(finished);
  }

 private:
  template <class TriggerEvent, class DoneEvent>
  void run_step() {
    (void)base_type::process_event(TriggerEvent{});
    (void)base_type::process_event(DoneEvent{});
  }

  mutable std::mutex mutex_;
  std::mutex wake_mutex_;
  std::condition_variable wake_;
  action::context context_{};
};

}  // namespace helm::loop
