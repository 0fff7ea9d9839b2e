#pragma once

#include <cstdint>
#include <mutex>

#include "helm/helm.h"
#include "helm/sm.hpp"
#include "helm/telemetry/provider/actions.hpp"
#include "helm/telemetry/provider/events.hpp"
#include "helm/telemetry/provider/guards.hpp"

namespace helm::telemetry::provider {

struct initialized {};
struct configuring {};
struct configured {};
struct starting {};
struct running {};
struct publishing {};
struct stopping {};
struct errored {};

struct model {
  auto operator()() const {
    namespace sml = boost::sml;

    return sml::make_transition_table(
      *sml::state<initialized> + sml::event<event::configure> / action::begin_configure =
          sml::state<configuring>,
      sml::state<configured> + sml::event<event::configure> / action::begin_configure =
          sml::state<configuring>,
      sml::state<errored> + sml::event<event::configure> / action::begin_configure =
          sml::state<configuring>,
      sml::state<configuring> + sml::event<event::validate_config> / action::run_validate_config =
          sml::state<configuring>,
      sml::state<configuring> + sml::event<events::validate_config_done> = sml::state<configuring>,
      sml::state<configuring> + sml::event<events::validate_config_error> = sml::state<configuring>,
      sml::state<configuring> + sml::event<events::configure_done> = sml::state<configured>,
      sml::state<configuring> + sml::event<events::configure_error> = sml::state<errored>,

      sml::state<configured> + sml::event<event::start>[guard::is_configured{}] / action::begin_start =
          sml::state<starting>,
      sml::state<starting> + sml::event<event::run_start> / action::run_start =
          sml::state<starting>,
      sml::state<starting> + sml::event<events::run_start_done> = sml::state<starting>,
      sml::state<starting> + sml::event<events::run_start_error> = sml::state<starting>,
      sml::state<starting> + sml::event<events::start_done> = sml::state<running>,
      sml::state<starting> + sml::event<events::start_error> = sml::state<errored>,

      sml::state<running> + sml::event<event::publish> / action::begin_publish =
          sml::state<publishing>,
      sml::state<publishing> + sml::event<event::publish_record> / action::run_publish_record =
          sml::state<publishing>,
      sml::state<publishing> + sml::event<events::publish_record_done> = sml::state<publishing>,
      sml::state<publishing> + sml::event<events::publish_record_error> = sml::state<publishing>,
      sml::state<publishing> + sml::event<events::publish_done> = sml::state<running>,
      sml::state<publishing> + sml::event<events::publish_error> = sml::state<errored>,

      sml::state<running> + sml::event<event::stop> / action::begin_stop = sml::state<stopping>,
      sml::state<configured> + sml::event<event::stop> / action::begin_stop = sml::state<stopping>,
      sml::state<stopping> + sml::event<event::run_stop> / action::run_stop =
          sml::state<stopping>,
      sml::state<stopping> + sml::event<events::run_stop_done> = sml::state<stopping>,
      sml::state<stopping> + sml::event<events::run_stop_error> = sml::state<stopping>,
      sml::state<stopping> + sml::event<events::stop_done> = sml::state<configured>,
      sml::state<stopping> + sml::event<events::stop_error> = sml::state<errored>,

      sml::state<configured> + sml::event<event::reset> / action::run_reset =
          sml::state<initialized>,
      sml::state<errored> + sml::event<event::reset> / action::run_reset =
          sml::state<initialized>
    );
  }
};

// Publishing is shared by the loop thread and the health thread, so every
// request is serialized behind one mutex.
struct sm : helm::sm<model> {
  using base_type = helm::sm<model>;

  sm() : base_type(context_) {}

  bool process_event(const event::configure & ev) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!base_type::process_event(ev)) return false;
    int32_t phase_error = HELM_OK;
    if (!run_phase<event::validate_config, events::validate_config_done, events::validate_config_error>(
            phase_error)) {
      return finish<events::configure_done, events::configure_error>(ev.error_out, phase_error);
    }
    return finish<events::configure_done, events::configure_error>(ev.error_out, HELM_OK);
  }

  bool process_event(const event::start & ev) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!base_type::process_event(ev)) return false;
    int32_t phase_error = HELM_OK;
    (void)run_phase<event::run_start, events::run_start_done, events::run_start_error>(phase_error);
    return finish<events::start_done, events::start_error>(ev.error_out, phase_error);
  }

  bool process_event(const event::publish & ev) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!base_type::process_event(ev)) return false;
    int32_t phase_error = HELM_OK;
    (void)run_phase<event::publish_record, events::publish_record_done, events::publish_record_error>(
        phase_error);
    if (ev.dropped_out != nullptr) {
      *ev.dropped_out = phase_error != HELM_OK ? true : context_.pending_dropped;
    }
    return finish<events::publish_done, events::publish_error>(ev.error_out, phase_error);
  }

  bool process_event(const event::stop & ev) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!base_type::process_event(ev)) return false;
    int32_t phase_error = HELM_OK;
    (void)run_phase<event::run_stop, events::run_stop_done, events::run_stop_error>(phase_error);
    return finish<events::stop_done, events::stop_error>(ev.error_out, phase_error);
  }

  bool process_event(const event::reset & ev) {
    std::lock_guard<std::mutex> lock(mutex_);
    return base_type::process_event(ev);
  }

  // Fire and forget; a provider that is not running drops the record.
  void emit(const helm::telemetry::record & value) { (void)process_event(event::publish{.value = value}); }

  bool running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return base_type::is(boost::sml::state<provider::running>);
  }

  uint64_t sessions_started() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return context_.sessions_started;
  }

  uint64_t records_emitted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return context_.records_emitted;
  }

  uint64_t records_dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return context_.records_dropped;
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

  template <class DoneEvent, class ErrorEvent>
  bool finish(int32_t * error_out, const int32_t phase_error) {
    if (error_out != nullptr) {
      *error_out = phase_error;
    }
    if (phase_error == HELM_OK) {
      return base_type::process_event(DoneEvent{});
    }
    (void)base_type::process_event(ErrorEvent{
      .err = phase_error,
    });
    return false;
  }

  mutable std::mutex mutex_;
  action::context context_{};
};

}  // namespace helm::telemetry::provider
