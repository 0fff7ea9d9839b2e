#include <array>
#include <cstdint>
#include <doctest/doctest.h>

#include "helm/bot/sm.hpp"
#include "helm/config.hpp"
#include "helm/health/sm.hpp"
#include "helm/helm.h"
#include "support/ports.hpp"

namespace {

using helm::bot::bot_state;
using helm::health::action::escape_step;
using helm::port::action_kind;

struct fixture {
  helm::config::engine cfg{};
  helm::bot::sm bot{};
  helm::test::scripted_observer observer{};
  helm::test::recording_actuator actuator{};
  helm::test::report_sink reports{};
  uint64_t tick = 0;

  void next_tick() {
    tick += 1;
    bot.process_event(helm::bot::event::begin_tick{.tick = tick});
  }

  void enter_run() {
    for (const bot_state to : {bot_state::starting, bot_state::in_town, bot_state::running}) {
      next_tick();
      REQUIRE(bot.request_transition(to) == HELM_OK);
    }
  }

  void hold_health(const float health) {
    observer.hold(helm::test::with_health(
        helm::test::make_observation(helm::port::label::in_game), health));
  }
};

void start_manual(helm::health::sm & controller) {
  int32_t err = HELM_ERR_BACKEND;
  REQUIRE(controller.process_event(helm::health::event::start{
    .spawn_worker = false,
    .error_out = &err,
  }));
  REQUIRE(err == HELM_OK);
}

TEST_CASE("health_start_needs_observation_port") {
  helm::config::engine cfg{};
  helm::bot::sm bot{};
  helm::health::sm controller{cfg, &bot, helm::port::observe_fn{}};
  CHECK(controller.start() == HELM_ERR_UNAVAILABLE);
  CHECK_FALSE(controller.running());
  CHECK(controller.sample_once() == HELM_ERR_UNAVAILABLE);
}

TEST_CASE("health_drop_below_floor_preempts_before_next_normal_transition") {
  fixture f{};
  f.enter_run();
  helm::health::sm controller{f.cfg, &f.bot, f.observer.fn(), f.actuator.fn(), f.reports.fn()};
  start_manual(controller);

  f.next_tick();
  f.hold_health(60.0f);
  CHECK(controller.sample_once() == HELM_OK);
  CHECK(f.bot.current_state() == bot_state::running);
  CHECK(f.actuator.total() == 0);

  // Health collapses between two loop ticks.
  f.hold_health(20.0f);
  CHECK(controller.sample_once() == HELM_OK);
  CHECK(f.bot.current_state() == bot_state::chickened);

  // The loop's own normal request for this tick arrives too late.
  CHECK(f.bot.request_transition(bot_state::starting) == HELM_ERR_SUPERSEDED);
  CHECK(f.bot.current_state() == bot_state::chickened);

  CHECK(controller.latched());
  CHECK(controller.stats().chickens == 1);
  CHECK(controller.last_escape() == escape_step::exit_template);
  CHECK(f.actuator.count_of(action_kind::exit_game_template) == 1);
  CHECK(f.reports.count == 0);

  std::array<helm::health::action::chicken_entry, 4> history = {};
  REQUIRE(controller.chicken_history(history.data(), 4) == 1);
  CHECK(history[0].from == bot_state::running);
  CHECK(history[0].health == doctest::Approx(20.0f));
  CHECK(history[0].escaped_by == escape_step::exit_template);
}

TEST_CASE("health_chicken_latches_until_rearmed") {
  fixture f{};
  f.enter_run();
  helm::health::sm controller{f.cfg, &f.bot, f.observer.fn(), f.actuator.fn(), f.reports.fn()};
  start_manual(controller);

  f.next_tick();
  f.hold_health(10.0f);
  CHECK(controller.sample_once() == HELM_OK);
  CHECK(controller.stats().chickens == 1);

  f.next_tick();
  CHECK(controller.sample_once() == HELM_OK);
  CHECK(controller.stats().chickens == 1);
  CHECK(f.actuator.count_of(action_kind::exit_game_template) == 1);

  // Back in a run, the next breach chickens again.
  f.next_tick();
  REQUIRE(f.bot.request_transition(bot_state::starting) == HELM_OK);
  controller.rearm();
  CHECK_FALSE(controller.latched());
  for (const bot_state to : {bot_state::in_town, bot_state::running}) {
    f.next_tick();
    f.hold_health(90.0f);
    REQUIRE(f.bot.request_transition(to) == HELM_OK);
  }
  f.next_tick();
  f.hold_health(10.0f);
  CHECK(controller.sample_once() == HELM_OK);
  CHECK(controller.stats().chickens == 2);
  CHECK(f.bot.current_state() == bot_state::chickened);
}

TEST_CASE("health_escape_falls_back_to_fixed_click") {
  fixture f{};
  f.enter_run();
  f.actuator.fail(action_kind::exit_game_template);
  helm::health::sm controller{f.cfg, &f.bot, f.observer.fn(), f.actuator.fn(), f.reports.fn()};
  start_manual(controller);

  f.next_tick();
  f.hold_health(5.0f);
  CHECK(controller.sample_once() == HELM_OK);
  CHECK(controller.last_escape() == escape_step::exit_fixed_click);
  REQUIRE(f.actuator.count_of(action_kind::exit_game_fixed_click) == 1);
  CHECK(f.actuator.performed[1].x == f.cfg.exit_button.x);
  CHECK(f.actuator.performed[1].y == f.cfg.exit_button.y);
  CHECK(f.reports.count_of(helm::recovery::error_kind::escape_attempt_failed) == 1);
  CHECK(f.reports.count_of(helm::recovery::error_kind::escape_exhausted) == 0);
}

TEST_CASE("health_escape_falls_back_to_cancel_sequence") {
  fixture f{};
  f.enter_run();
  f.actuator.fail(action_kind::exit_game_template);
  f.actuator.fail(action_kind::exit_game_fixed_click);
  helm::health::sm controller{f.cfg, &f.bot, f.observer.fn(), f.actuator.fn(), f.reports.fn()};
  start_manual(controller);

  f.next_tick();
  f.hold_health(5.0f);
  CHECK(controller.sample_once() == HELM_OK);
  CHECK(controller.last_escape() == escape_step::cancel_sequence);
  CHECK(f.actuator.count_of(action_kind::cancel_key) == f.cfg.cancel_repeat);
  CHECK(f.reports.count_of(helm::recovery::error_kind::escape_attempt_failed) == 2);
}

TEST_CASE("health_escape_exhaustion_is_reported_critical") {
  fixture f{};
  f.enter_run();
  f.actuator.fail(action_kind::exit_game_template);
  f.actuator.fail(action_kind::exit_game_fixed_click);
  f.actuator.fail(action_kind::cancel_key, HELM_ERR_TIMEOUT);
  helm::health::sm controller{f.cfg, &f.bot, f.observer.fn(), f.actuator.fn(), f.reports.fn()};
  start_manual(controller);

  f.next_tick();
  f.hold_health(5.0f);
  CHECK(controller.sample_once() == HELM_OK);
  CHECK(controller.last_escape() == escape_step::exhausted);
  CHECK(f.actuator.count_of(action_kind::cancel_key) == 1);
  CHECK(f.reports.count_of(helm::recovery::error_kind::escape_attempt_failed) == 3);
  CHECK(f.reports.count_of(helm::recovery::error_kind::escape_exhausted) == 1);
  CHECK(helm::recovery::classify(helm::recovery::error_kind::escape_exhausted) ==
        helm::recovery::severity::critical);
  CHECK(controller.stats().escapes_exhausted == 1);
  CHECK(f.bot.current_state() == bot_state::chickened);
}

TEST_CASE("health_warning_drinks_potion_with_cooldown") {
  fixture f{};
  f.enter_run();
  helm::health::sm controller{f.cfg, &f.bot, f.observer.fn(), f.actuator.fn(), f.reports.fn()};
  start_manual(controller);

  f.hold_health(45.0f);
  CHECK(controller.sample_once() == HELM_OK);
  REQUIRE(f.actuator.count_of(action_kind::use_potion) == 1);
  CHECK(f.actuator.performed[0].slot == f.cfg.health_potion_slot);

  CHECK(controller.sample_once() == HELM_OK);
  CHECK(f.actuator.count_of(action_kind::use_potion) == 1);
  CHECK(controller.stats().potions == 1);
  CHECK(f.bot.current_state() == bot_state::running);
}

TEST_CASE("health_breach_outside_game_is_ignored") {
  fixture f{};
  helm::health::sm controller{f.cfg, &f.bot, f.observer.fn(), f.actuator.fn(), f.reports.fn()};
  start_manual(controller);
  f.hold_health(5.0f);
  CHECK(controller.sample_once() == HELM_OK);
  CHECK(f.bot.current_state() == bot_state::idle);
  CHECK(controller.stats().chickens == 0);
  CHECK(f.actuator.total() == 0);
}

TEST_CASE("health_mana_floor_also_chickens") {
  fixture f{};
  f.cfg.chicken_mana_percent = 20.0f;
  f.enter_run();
  helm::health::sm controller{f.cfg, &f.bot, f.observer.fn(), f.actuator.fn(), f.reports.fn()};
  start_manual(controller);

  f.next_tick();
  helm::port::observation obs = helm::test::make_observation(helm::port::label::in_game);
  obs.set(helm::port::readout::health, 90.0f);
  obs.set(helm::port::readout::mana, 10.0f);
  f.observer.hold(obs);
  CHECK(controller.sample_once() == HELM_OK);
  CHECK(f.bot.current_state() == bot_state::chickened);
}

TEST_CASE("health_sample_timeout_is_reported") {
  fixture f{};
  f.enter_run();
  helm::health::sm controller{f.cfg, &f.bot, f.observer.fn(), f.actuator.fn(), f.reports.fn()};
  start_manual(controller);

  f.observer.fail_with(HELM_ERR_TIMEOUT);
  CHECK(controller.sample_once() == HELM_ERR_TIMEOUT);
  CHECK(controller.stats().sample_failures == 1);
  CHECK(f.reports.count_of(helm::recovery::error_kind::health_sample_timeout) == 1);
  CHECK(f.bot.current_state() == bot_state::running);
  CHECK(controller.running());
}

TEST_CASE("health_late_sample_is_a_timeout_and_not_acted_on") {
  fixture f{};
  f.cfg.health_sample_timeout_ms = 5;
  f.enter_run();
  helm::health::sm controller{f.cfg, &f.bot, f.observer.fn(), f.actuator.fn(), f.reports.fn()};
  start_manual(controller);

  f.hold_health(10.0f);
  f.observer.slow_down(20);
  CHECK(controller.sample_once() == HELM_ERR_TIMEOUT);
  CHECK(controller.stats().sample_failures == 1);
  CHECK(f.reports.count_of(helm::recovery::error_kind::health_sample_timeout) == 1);
  CHECK(f.bot.current_state() == bot_state::running);
  CHECK(f.actuator.total() == 0);
}

TEST_CASE("health_rejected_chicken_is_not_latched") {
  fixture f{};
  f.enter_run();
  helm::health::sm controller{f.cfg, &f.bot, f.observer.fn(), f.actuator.fn(), f.reports.fn()};
  start_manual(controller);

  f.next_tick();
  REQUIRE(f.bot.request_transition(bot_state::fighting, helm::bot::priority::preemptive) ==
          HELM_OK);
  f.hold_health(5.0f);
  CHECK(controller.sample_once() == HELM_OK);
  CHECK(controller.stats().chickens_rejected == 1);
  CHECK_FALSE(controller.latched());
  CHECK(f.actuator.total() == 0);
}

TEST_CASE("health_worker_chickens_on_its_own_cadence") {
  fixture f{};
  f.cfg.health_interval_ms = 5;
  f.enter_run();
  f.hold_health(90.0f);
  helm::health::sm controller{f.cfg, &f.bot, f.observer.fn(), f.actuator.fn(), f.reports.fn()};
  REQUIRE(controller.start() == HELM_OK);
  CHECK(controller.running());

  f.hold_health(15.0f);
  CHECK(f.bot.wait_for(bot_state::chickened, 5000));

  controller.stop();
  CHECK_FALSE(controller.running());
  CHECK(controller.stats().chickens == 1);
}

}  // namespace
