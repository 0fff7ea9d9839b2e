#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

#include "helm/bot/sm.hpp"
#include "helm/clock.hpp"
#include "helm/config.hpp"
#include "helm/health/actions.hpp"
#include "helm/health/events.hpp"
#include "helm/health/guards.hpp"
#include "helm/helm.h"
#include "helm/sm.hpp"

namespace helm::health {

struct stopped {};
struct monitoring {};
struct sampling {};
struct preempting {};
struct escaping {};
struct medicating {};
struct settling {};

struct model {
  auto operator()() const {
    namespace sml = boost::sml;

    return sml::make_transition_table(
      *sml::state<stopped> + sml::event<event::start>[guard::has_observe_port{}] /
          action::begin_start = sml::state<monitoring>,
      sml::state<stopped> + sml::event<event::start>[!guard::has_observe_port{}] /
          action::reject_start = sml::state<stopped>,
      sml::state<monitoring> + sml::event<event::stop> / action::begin_stop = sml::state<stopped>,
      sml::state<stopped> + sml::event<event::rearm> / action::run_rearm = sml::state<stopped>,
      sml::state<monitoring> + sml::event<event::rearm> / action::run_rearm =
          sml::state<monitoring>,

      sml::state<monitoring> + sml::event<event::sample> / action::begin_sample =
          sml::state<sampling>,
      sml::state<sampling> + sml::event<event::read> / action::run_read = sml::state<sampling>,
      sml::state<sampling> + sml::event<events::read_done>[guard::verdict_breach{}] =
          sml::state<preempting>,
      sml::state<sampling> + sml::event<events::read_done>[guard::verdict_warning{}] =
          sml::state<medicating>,
      sml::state<sampling> + sml::event<events::read_done>[guard::verdict_healthy{}] =
          sml::state<settling>,
      sml::state<sampling> + sml::event<events::read_error> / action::on_read_error =
          sml::state<settling>,

      sml::state<preempting> + sml::event<event::request_chicken> / action::run_request_chicken =
          sml::state<preempting>,
      sml::state<preempting> + sml::event<events::chicken_done>[guard::chicken_accepted{}] =
          sml::state<escaping>,
      sml::state<preempting> + sml::event<events::chicken_done>[guard::chicken_rejected{}] =
          sml::state<settling>,

      sml::state<escaping> + sml::event<event::run_escape> / action::run_escape =
          sml::state<escaping>,
      sml::state<escaping> + sml::event<events::escape_done> = sml::state<settling>,

      sml::state<medicating> + sml::event<event::drink> / action::run_drink =
          sml::state<medicating>,
      sml::state<medicating> + sml::event<events::drink_done> = sml::state<settling>,

      sml::state<settling> + sml::event<events::sample_done> / action::on_sample_done =
          sml::state<monitoring>
    );
  }
};

// Health preemption controller. Runs its own worker on its own cadence and
// reaches the bot only through preemptive transition requests.
struct sm : helm::sm<model> {
  using base_type = helm::sm<model>;

  sm(const config::engine & cfg, bot::sm * bot, port::observe_fn observe,
     port::perform_fn perform = {}, recovery::report_fn report = {},
     helm::telemetry::provider::sm * telemetry = nullptr)
      : base_type(context_), interval_ms_(cfg.health_interval_ms) {
    context_.chicken_health_percent = cfg.chicken_health_percent;
    context_.chicken_mana_percent = cfg.chicken_mana_percent;
    context_.warning_health_percent = cfg.warning_health_percent > cfg.chicken_health_percent
                                          ? cfg.warning_health_percent
                                          : config::default_warning_percent(cfg.chicken_health_percent);
    context_.sample_timeout_ms = cfg.health_sample_timeout_ms;
    context_.action_timeout_ms = cfg.action_timeout_ms;
    context_.potion_cooldown_ns = helm::ms_to_ns(cfg.potion_cooldown_ms);
    context_.health_potion_slot = cfg.health_potion_slot;
    context_.cancel_key = cfg.cancel_key;
    context_.cancel_repeat = cfg.cancel_repeat;
    context_.exit_button = cfg.exit_button;
    context_.observe = observe;
    context_.perform = perform;
    context_.bot = bot;
    context_.report = report;
    context_.telemetry = telemetry;
  }

  ~sm() { (void)process_event(event::stop{}); }

  bool process_event(const event::start & ev) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!base_type::process_event(ev) || !base_type::is(boost::sml::state<monitoring>)) {
        if (ev.error_out != nullptr && *ev.error_out == HELM_OK) {
          *ev.error_out = HELM_ERR_BACKEND;
        }
        return false;
      }
    }
    if (ev.spawn_worker) {
      {
        std::lock_guard<std::mutex> wake_lock(wake_mutex_);
        stop_requested_ = false;
      }
      worker_ = std::thread([this] { run_worker(); });
    }
    return true;
  }

  bool process_event(const event::stop & ev) {
    {
      std::lock_guard<std::mutex> wake_lock(wake_mutex_);
      stop_requested_ = true;
    }
    wake_.notify_all();
    if (worker_.joinable()) {
      worker_.join();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return base_type::process_event(ev);
  }

  bool process_event(const event::rearm & ev) {
    std::lock_guard<std::mutex> lock(mutex_);
    return base_type::process_event(ev);
  }

  int32_t start() {
    int32_t err = HELM_OK;
    (void)process_event(event::start{.spawn_worker = true, .error_out = &err});
    return err;
  }

  void stop() { (void)process_event(event::stop{}); }
  void rearm() { (void)process_event(event::rearm{}); }

  // One synchronous sample/evaluate/respond cycle.
  int32_t sample_once() {
    std::lock_guard<std::mutex> lock(mutex_);
    int32_t err = HELM_OK;
    if (!base_type::process_event(event::sample{.error_out = &err})) {
      return HELM_ERR_UNAVAILABLE;
    }
    int32_t phase_error = HELM_OK;
    event::read read{.error_out = &phase_error};
    (void)base_type::process_event(read);
    if (phase_error == HELM_OK) {
      (void)base_type::process_event(events::read_done{});
    } else {
      (void)base_type::process_event(events::read_error{.err = phase_error});
    }
    if (base_type::is(boost::sml::state<preempting>)) {
      run_step<event::request_chicken, events::chicken_done>();
    }
    if (base_type::is(boost::sml::state<escaping>)) {
      run_step<event::run_escape, events::escape_done>();
    }
    if (base_type::is(boost::sml::state<medicating>)) {
      run_step<event::drink, events::drink_done>();
    }
    (void)base_type::process_event(events::sample_done{});
    return phase_error;
  }

  bool running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !base_type::is(boost::sml::state<stopped>);
  }

  bool latched() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return context_.latched;
  }

  action::escape_step last_escape() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return context_.escaped_by;
  }

  action::counters stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return context_.stats;
  }

  int32_t chicken_history(action::chicken_entry * out, const int32_t capacity) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const int32_t kept =
        context_.history_count < action::k_history_size ? context_.history_count : action::k_history_size;
    const int32_t n = kept < capacity ? kept : capacity;
    for (int32_t i = 0; i < n; ++i) {
      const int32_t index = context_.history_count - kept + i;
      out[i] = context_.history[static_cast<size_t>(index % action::k_history_size)];
    }
    return n;
  }

 private:
  template <class TriggerEvent, class DoneEvent>
  void run_step() {
    (void)base_type::process_event(TriggerEvent{});
    (void)base_type::process_event(DoneEvent{});
  }

  void run_worker() {
    std::unique_lock<std::mutex> wake_lock(wake_mutex_);
    while (!stop_requested_) {
      wake_lock.unlock();
      (void)sample_once();
      wake_lock.lock();
      wake_.wait_for(wake_lock, std::chrono::milliseconds(interval_ms_),
                     [this] { return stop_requested_; });
    }
  }

  int32_t interval_ms_;
  mutable std::mutex mutex_;
  std::mutex wake_mutex_;
  std::condition_variable wake_;
  bool stop_requested_ = false;
  std::thread worker_;
  action::context context_{};
};

}  // namespace helm::health
