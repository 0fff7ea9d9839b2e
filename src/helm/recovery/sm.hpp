#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <mutex>

#include "helm/bot/sm.hpp"
#include "helm/config.hpp"
#include "helm/helm.h"
#include "helm/recovery/actions.hpp"
#include "helm/recovery/events.hpp"
#include "helm/recovery/guards.hpp"
#include "helm/sm.hpp"

namespace helm::recovery {

struct ready {};
struct detected {};
struct classified {};
struct attempting {};
struct resolved {};
struct escalated {};
struct paused {};
struct errored {};

struct model {
  auto operator()() const {
    namespace sml = boost::sml;

    return sml::make_transition_table(
      *sml::state<ready> + sml::event<event::handle> / action::begin_handle =
          sml::state<detected>,

      sml::state<detected> + sml::event<event::classify> / action::run_classify =
          sml::state<detected>,
      sml::state<detected> + sml::event<events::classify_done> = sml::state<classified>,
      sml::state<detected> + sml::event<events::classify_error> = sml::state<errored>,

      sml::state<classified> + sml::event<event::attempt> / action::run_attempt =
          sml::state<attempting>,
      sml::state<attempting> + sml::event<events::attempt_done>[guard::escalated{}] =
          sml::state<escalated>,
      sml::state<attempting> + sml::event<events::attempt_done>[guard::not_escalated{}] =
          sml::state<resolved>,
      sml::state<attempting> + sml::event<events::attempt_error> = sml::state<errored>,

      sml::state<resolved> + sml::event<event::apply> / action::run_apply = sml::state<resolved>,
      sml::state<resolved> + sml::event<events::apply_done> = sml::state<resolved>,
      sml::state<escalated> + sml::event<event::apply> / action::run_apply =
          sml::state<escalated>,
      sml::state<escalated> + sml::event<events::apply_done> = sml::state<escalated>,

      sml::state<resolved> + sml::event<events::handle_done>[guard::not_paused{}] /
          action::on_handle_done = sml::state<ready>,
      sml::state<escalated> + sml::event<events::handle_done>[guard::not_paused{}] /
          action::on_handle_done = sml::state<ready>,
      sml::state<resolved> + sml::event<events::handle_done>[guard::paused{}] /
          action::on_handle_done = sml::state<paused>,
      sml::state<escalated> + sml::event<events::handle_done>[guard::paused{}] /
          action::on_handle_done = sml::state<paused>,
      sml::state<errored> + sml::event<events::handle_error> / action::on_handle_error =
          sml::state<ready>,

      sml::state<ready> + sml::event<event::mark_recovered> / action::run_mark_recovered =
          sml::state<ready>,
      sml::state<paused> + sml::event<event::mark_recovered> / action::run_mark_recovered =
          sml::state<paused>,
      sml::state<ready> + sml::event<event::begin_run> / action::run_begin_run =
          sml::state<ready>,
      sml::state<ready> + sml::event<event::run_succeeded> / action::run_run_succeeded =
          sml::state<ready>,
      sml::state<paused> + sml::event<event::resume> / action::run_resume = sml::state<ready>
    );
  }
};

inline constexpr int32_t k_inbox_capacity = 64;

// Single consumer of every error event. report() may be called from any
// thread; drain() and the remaining operations belong to the loop thread.
struct sm : helm::sm<model> {
  using base_type = helm::sm<model>;

  sm(const config::engine & cfg, bot::sm * bot, port::perform_fn perform = {},
     action::alert_fn alert = {}, helm::telemetry::provider::sm * telemetry = nullptr)
      : base_type(context_) {
    context_.action_timeout_ms = cfg.action_timeout_ms;
    context_.max_consecutive_run_failures = cfg.max_consecutive_run_failures;
    context_.recovery_wait_ms = cfg.recovery_wait_ms;
    context_.cancel_key = cfg.cancel_key;
    context_.escape_box = cfg.escape_box;
    context_.rng.seed(cfg.random_seed);
    context_.bot = bot;
    context_.perform = perform;
    context_.alert = alert;
    context_.telemetry = telemetry;
    for (retry_budget & budget : context_.budgets) {
      budget.threshold = cfg.retry_threshold;
    }
  }

  int32_t report(const error_event & ev) {
    std::lock_guard<std::mutex> lock(inbox_mutex_);
    if (inbox_count_ >= k_inbox_capacity) {
      dropped_ += 1;
      action::publish_record(context_, HELM_RECORD_DROPPED, ev.kind, 0u, HELM_ERR_QUEUE_FULL);
      return HELM_ERR_QUEUE_FULL;
    }
    inbox_[static_cast<size_t>(inbox_count_)] = ev;
    inbox_count_ += 1;
    return HELM_OK;
  }

  // Handles everything queued so far, most severe first and in arrival
  // order within a tier. A pause stops consumption; the rest stays queued.
  int32_t drain(outcome * outcomes = nullptr, const int32_t capacity = 0, int32_t * count_out = nullptr) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (count_out != nullptr) {
      *count_out = 0;
    }
    retry_error_transition();
    if (base_type::is(boost::sml::state<recovery::paused>)) {
      return HELM_ERR_PAUSED;
    }

    std::array<error_event, k_inbox_capacity> batch = {};
    int32_t batch_count = 0;
    {
      std::lock_guard<std::mutex> inbox_lock(inbox_mutex_);
      std::copy_n(inbox_.begin(), inbox_count_, batch.begin());
      batch_count = inbox_count_;
      inbox_count_ = 0;
    }
    std::stable_sort(batch.begin(), batch.begin() + batch_count,
                     [](const error_event & lhs, const error_event & rhs) {
                       return classify(lhs.kind) > classify(rhs.kind);
                     });

    context_.run_ended_in_batch = false;
    int32_t handled = 0;
    for (int32_t i = 0; i < batch_count; ++i) {
      if (base_type::is(boost::sml::state<recovery::paused>)) {
        requeue(batch.data() + i, batch_count - i);
        break;
      }
      outcome * out = outcomes != nullptr && handled < capacity ? outcomes + handled : nullptr;
      int32_t err = HELM_OK;
      (void)handle_locked(batch[static_cast<size_t>(i)], out, &err);
      handled += 1;
    }
    if (count_out != nullptr) {
      *count_out = handled;
    }
    return HELM_OK;
  }

  bool process_event(const event::handle & ev) {
    std::lock_guard<std::mutex> lock(mutex_);
    return handle_locked(ev.error, ev.outcome_out, ev.error_out);
  }

  bool process_event(const event::mark_recovered & ev) {
    std::lock_guard<std::mutex> lock(mutex_);
    return base_type::process_event(ev);
  }

  bool process_event(const event::begin_run & ev) {
    std::lock_guard<std::mutex> lock(mutex_);
    return base_type::process_event(ev);
  }

  bool process_event(const event::run_succeeded & ev) {
    std::lock_guard<std::mutex> lock(mutex_);
    return base_type::process_event(ev);
  }

  bool process_event(const event::resume & ev) {
    std::lock_guard<std::mutex> lock(mutex_);
    return base_type::process_event(ev);
  }

  void mark_recovered(const error_kind kind) { (void)process_event(event::mark_recovered{.kind = kind}); }
  void begin_run() { (void)process_event(event::begin_run{}); }
  void note_run_succeeded() { (void)process_event(event::run_succeeded{}); }

  int32_t resume() {
    int32_t err = HELM_ERR_INVALID_ARGUMENT;
    if (!process_event(event::resume{.error_out = &err})) {
      return HELM_ERR_INVALID_ARGUMENT;
    }
    return err;
  }

  bool is_paused() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return base_type::is(boost::sml::state<recovery::paused>);
  }

  int32_t pending() const {
    std::lock_guard<std::mutex> lock(inbox_mutex_);
    return inbox_count_;
  }

  retry_budget budget(const error_kind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!valid_kind(kind)) {
      return {};
    }
    return context_.budgets[static_cast<size_t>(kind)];
  }

  int32_t consecutive_run_failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return context_.consecutive_run_failures;
  }

  action::counters stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    action::counters out = context_.stats;
    std::lock_guard<std::mutex> inbox_lock(inbox_mutex_);
    out.dropped = dropped_;
    return out;
  }

  // Share of recovery actions later confirmed by a healthy observation.
  double recovery_rate() const {
    const action::counters s = stats();
    if (s.recovery_attempts == 0) {
      return 0.0;
    }
    return static_cast<double>(s.recoveries_confirmed) / static_cast<double>(s.recovery_attempts);
  }

 private:
  bool handle_locked(const error_event & error, outcome * outcome_out, int32_t * error_out) {
    if (!base_type::process_event(event::handle{
            .error = error,
            .outcome_out = outcome_out,
            .error_out = error_out,
        })) {
      if (error_out != nullptr) {
        *error_out = base_type::is(boost::sml::state<recovery::paused>) ? HELM_ERR_PAUSED
                                                                         : HELM_ERR_BACKEND;
      }
      return false;
    }
    int32_t phase_error = HELM_OK;
    if (!run_phase<event::classify, events::classify_done, events::classify_error>(phase_error)) {
      return finalize_error(phase_error, error_out);
    }
    if (!run_phase<event::attempt, events::attempt_done, events::attempt_error>(phase_error)) {
      return finalize_error(phase_error, error_out);
    }
    (void)base_type::process_event(event::apply{});
    (void)base_type::process_event(events::apply_done{});
    if (outcome_out != nullptr) {
      *outcome_out = context_.current;
    }
    return base_type::process_event(events::handle_done{
      .error_out = error_out,
    });
  }

  void retry_error_transition() {
    if (!context_.error_transition_pending) {
      return;
    }
    const int32_t status = action::request(context_, bot::bot_state::error, bot::priority::preemptive);
    context_.error_transition_pending = status == HELM_ERR_BUSY;
  }

  void requeue(const error_event * events_in, const int32_t count) {
    std::lock_guard<std::mutex> inbox_lock(inbox_mutex_);
    std::array<error_event, k_inbox_capacity> merged = {};
    int32_t merged_count = 0;
    for (int32_t i = 0; i < count && merged_count < k_inbox_capacity; ++i) {
      merged[static_cast<size_t>(merged_count++)] = events_in[i];
    }
    for (int32_t i = 0; i < inbox_count_; ++i) {
      if (merged_count >= k_inbox_capacity) {
        dropped_ += static_cast<uint64_t>(inbox_count_ - i);
        break;
      }
      merged[static_cast<size_t>(merged_count++)] = inbox_[static_cast<size_t>(i)];
    }
    inbox_ = merged;
    inbox_count_ = merged_count;
  }

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

  bool finalize_error(const int32_t error_code, int32_t * error_out) {
    const int32_t err = error_code == HELM_OK ? HELM_ERR_BACKEND : error_code;
    (void)base_type::process_event(events::handle_error{
      .err = err,
      .error_out = error_out,
    });
    return false;
  }

  mutable std::mutex mutex_;
  mutable std::mutex inbox_mutex_;
  std::array<error_event, k_inbox_capacity> inbox_ = {};
  int32_t inbox_count_ = 0;
  uint64_t dropped_ = 0;
  action::context context_{};
};

}  // namespace helm::recovery
