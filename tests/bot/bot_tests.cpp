#include <array>
#include <chrono>
#include <cstdint>
#include <doctest/doctest.h>
#include <initializer_list>
#include <thread>

#include "helm/bot/sm.hpp"
#include "helm/helm.h"
#include "helm/telemetry/ring.hpp"

namespace {

using helm::bot::bot_state;
using helm::bot::priority;

// Walks the machine through `path`, one tick per hop.
void drive(helm::bot::sm & machine, std::initializer_list<bot_state> path) {
  uint64_t tick = machine.tick();
  for (const bot_state to : path) {
    tick += 1;
    machine.process_event(helm::bot::event::begin_tick{.tick = tick});
    REQUIRE(machine.request_transition(to) == HELM_OK);
  }
}

struct hook_log {
  std::array<bot_state, 8> order = {};
  std::array<bool, 8> entering = {};
  int32_t count = 0;

  void on_enter(const bot_state, const bot_state to) {
    order[static_cast<size_t>(count)] = to;
    entering[static_cast<size_t>(count)] = true;
    count += 1;
  }

  void on_exit(const bot_state from, const bot_state) {
    order[static_cast<size_t>(count)] = from;
    entering[static_cast<size_t>(count)] = false;
    count += 1;
  }
};

TEST_CASE("bot_sm_starts_idle_and_reads_are_idempotent") {
  helm::bot::sm machine{};
  CHECK(machine.current_state() == bot_state::idle);
  CHECK(machine.current_state() == bot_state::idle);
  CHECK(machine.current_state() == bot_state::idle);
  CHECK(machine.stats().accepted == 0);
}

TEST_CASE("bot_sm_accepts_edge_in_graph") {
  helm::bot::sm machine{};
  int32_t err = HELM_ERR_BACKEND;
  CHECK(machine.process_event(helm::bot::event::request{
    .to = bot_state::starting,
    .prio = priority::normal,
    .error_out = &err,
  }));
  CHECK(err == HELM_OK);
  CHECK(machine.current_state() == bot_state::starting);
  CHECK(machine.previous_state() == bot_state::idle);
  CHECK(machine.stats().accepted == 1);
}

TEST_CASE("bot_sm_rejects_edge_missing_from_graph") {
  helm::bot::sm machine{};
  CHECK(machine.request_transition(bot_state::fighting) == HELM_ERR_INVALID_TRANSITION);
  CHECK(machine.current_state() == bot_state::idle);

  helm::bot::action::rejection last{};
  REQUIRE(machine.last_rejection(last));
  CHECK(last.from == bot_state::idle);
  CHECK(last.to == bot_state::fighting);
  CHECK(last.status == HELM_ERR_INVALID_TRANSITION);
  CHECK(machine.stats().rejected_invalid == 1);
}

TEST_CASE("bot_sm_rejects_self_transition_and_out_of_range_target") {
  helm::bot::sm machine{};
  CHECK(machine.request_transition(bot_state::idle) == HELM_ERR_INVALID_TRANSITION);
  CHECK(machine.request_transition(bot_state::count) == HELM_ERR_INVALID_ARGUMENT);
  CHECK(machine.current_state() == bot_state::idle);
  CHECK(machine.stats().rejected_invalid == 2);
}

TEST_CASE("bot_sm_fighting_to_leveling_up_is_rejected") {
  helm::bot::sm machine{};
  drive(machine, {bot_state::starting, bot_state::in_town, bot_state::running, bot_state::fighting});
  machine.process_event(helm::bot::event::begin_tick{.tick = machine.tick() + 1});

  CHECK(machine.request_transition(bot_state::leveling_up) == HELM_ERR_INVALID_TRANSITION);
  CHECK(machine.current_state() == bot_state::fighting);

  helm::bot::action::rejection last{};
  REQUIRE(machine.last_rejection(last));
  CHECK(last.from == bot_state::fighting);
  CHECK(last.to == bot_state::leveling_up);
}

TEST_CASE("bot_sm_rejected_preemptive_still_needs_an_edge") {
  helm::bot::sm machine{};
  CHECK(machine.request_transition(bot_state::chickened, priority::preemptive) ==
        HELM_ERR_INVALID_TRANSITION);
  CHECK(machine.current_state() == bot_state::idle);
}

TEST_CASE("bot_sm_guard_uses_latest_observation") {
  helm::bot::sm machine{helm::bot::graph::standard(), 50.0f};
  drive(machine, {bot_state::starting, bot_state::in_town});

  helm::port::observation low{};
  low.value = helm::port::label::in_town;
  low.set(helm::port::readout::health, 20.0f);
  machine.process_event(helm::bot::event::observe{.value = low});
  machine.process_event(helm::bot::event::begin_tick{.tick = machine.tick() + 1});
  CHECK(machine.request_transition(bot_state::running) == HELM_ERR_GUARD_REJECTED);
  CHECK(machine.current_state() == bot_state::in_town);
  CHECK(machine.stats().rejected_guard == 1);

  helm::port::observation healed = low;
  healed.set(helm::port::readout::health, 90.0f);
  machine.process_event(helm::bot::event::observe{.value = healed});
  CHECK(machine.request_transition(bot_state::running) == HELM_OK);
  CHECK(machine.current_state() == bot_state::running);
}

TEST_CASE("bot_sm_first_normal_request_in_a_tick_wins") {
  helm::bot::sm machine{};
  drive(machine, {bot_state::starting, bot_state::in_town, bot_state::running});
  machine.process_event(helm::bot::event::begin_tick{.tick = machine.tick() + 1});

  CHECK(machine.request_transition(bot_state::fighting) == HELM_OK);
  CHECK(machine.request_transition(bot_state::looting) == HELM_ERR_BUSY);
  CHECK(machine.current_state() == bot_state::fighting);
  CHECK(machine.stats().busy == 1);

  machine.process_event(helm::bot::event::begin_tick{.tick = machine.tick() + 1});
  CHECK(machine.request_transition(bot_state::looting) == HELM_OK);
}

TEST_CASE("bot_sm_preemptive_supersedes_later_normal_in_same_tick") {
  helm::bot::sm machine{};
  drive(machine, {bot_state::starting, bot_state::in_town, bot_state::running});
  machine.process_event(helm::bot::event::begin_tick{.tick = machine.tick() + 1});

  CHECK(machine.request_transition(bot_state::chickened, priority::preemptive) == HELM_OK);
  CHECK(machine.request_transition(bot_state::starting) == HELM_ERR_SUPERSEDED);
  CHECK(machine.current_state() == bot_state::chickened);
  CHECK(machine.stats().superseded == 1);
}

TEST_CASE("bot_sm_preemptive_after_normal_in_same_tick_still_wins") {
  helm::bot::sm machine{};
  drive(machine, {bot_state::starting, bot_state::in_town, bot_state::running});
  machine.process_event(helm::bot::event::begin_tick{.tick = machine.tick() + 1});

  CHECK(machine.request_transition(bot_state::fighting) == HELM_OK);
  CHECK(machine.request_transition(bot_state::chickened, priority::preemptive) == HELM_OK);
  CHECK(machine.current_state() == bot_state::chickened);
}

TEST_CASE("bot_sm_second_preemptive_in_same_tick_is_busy") {
  helm::bot::sm machine{};
  drive(machine, {bot_state::starting, bot_state::in_town, bot_state::running});
  machine.process_event(helm::bot::event::begin_tick{.tick = machine.tick() + 1});

  CHECK(machine.request_transition(bot_state::chickened, priority::preemptive) == HELM_OK);
  CHECK(machine.request_transition(bot_state::error, priority::preemptive) == HELM_ERR_BUSY);
  CHECK(machine.current_state() == bot_state::chickened);

  machine.process_event(helm::bot::event::begin_tick{.tick = machine.tick() + 1});
  CHECK(machine.request_transition(bot_state::error, priority::preemptive) == HELM_OK);
  CHECK(machine.current_state() == bot_state::error);
}

TEST_CASE("bot_sm_runs_exit_hook_before_enter_hook") {
  helm::bot::sm machine{};
  hook_log log{};
  int32_t err = HELM_ERR_BACKEND;
  CHECK(machine.process_event(helm::bot::event::bind_hooks{
    .state = bot_state::idle,
    .on_enter = {},
    .on_exit = helm::bot::event::hook_fn::from<hook_log, &hook_log::on_exit>(&log),
    .error_out = &err,
  }));
  CHECK(err == HELM_OK);
  CHECK(machine.process_event(helm::bot::event::bind_hooks{
    .state = bot_state::starting,
    .on_enter = helm::bot::event::hook_fn::from<hook_log, &hook_log::on_enter>(&log),
    .on_exit = {},
    .error_out = &err,
  }));

  REQUIRE(machine.request_transition(bot_state::starting) == HELM_OK);
  REQUIRE(log.count == 2);
  CHECK(log.order[0] == bot_state::idle);
  CHECK_FALSE(log.entering[0]);
  CHECK(log.order[1] == bot_state::starting);
  CHECK(log.entering[1]);
}

TEST_CASE("bot_sm_rejected_request_runs_no_hooks") {
  helm::bot::sm machine{};
  hook_log log{};
  machine.process_event(helm::bot::event::bind_hooks{
    .state = bot_state::idle,
    .on_enter = {},
    .on_exit = helm::bot::event::hook_fn::from<hook_log, &hook_log::on_exit>(&log),
  });
  CHECK(machine.request_transition(bot_state::running) == HELM_ERR_INVALID_TRANSITION);
  CHECK(log.count == 0);
}

TEST_CASE("bot_sm_bind_hooks_rejects_invalid_state") {
  helm::bot::sm machine{};
  int32_t err = HELM_OK;
  machine.process_event(helm::bot::event::bind_hooks{
    .state = bot_state::count,
    .error_out = &err,
  });
  CHECK(err == HELM_ERR_INVALID_ARGUMENT);
}

TEST_CASE("bot_sm_publishes_transition_and_rejection_records") {
  helm::telemetry::ring<16> ring{};
  helm::telemetry::provider::sm telemetry{};
  int32_t err = HELM_OK;
  telemetry.process_event(helm::telemetry::provider::event::configure{
    .queue_ctx = &ring,
    .try_enqueue = &helm::telemetry::ring<16>::try_enqueue,
    .error_out = &err,
  });
  telemetry.process_event(helm::telemetry::provider::event::start{.error_out = &err});
  REQUIRE(telemetry.running());

  helm::bot::sm machine{helm::bot::graph::standard(), 50.0f, &telemetry};
  REQUIRE(machine.request_transition(bot_state::starting) == HELM_OK);
  machine.process_event(helm::bot::event::begin_tick{.tick = 1});
  CHECK(machine.request_transition(bot_state::looting) == HELM_ERR_INVALID_TRANSITION);

  helm::telemetry::record rec{};
  REQUIRE(helm::telemetry::ring<16>::try_dequeue(&ring, &rec));
  CHECK(rec.component_id == HELM_COMPONENT_BOT);
  CHECK(rec.event_id == HELM_RECORD_TRANSITION);
  CHECK(rec.state_id == static_cast<uint32_t>(bot_state::idle));
  CHECK(rec.target_id == static_cast<uint32_t>(bot_state::starting));
  CHECK(rec.status == HELM_OK);

  REQUIRE(helm::telemetry::ring<16>::try_dequeue(&ring, &rec));
  CHECK(rec.event_id == HELM_RECORD_REJECTION);
  CHECK(rec.state_id == static_cast<uint32_t>(bot_state::starting));
  CHECK(rec.target_id == static_cast<uint32_t>(bot_state::looting));
  CHECK(rec.status == HELM_ERR_INVALID_TRANSITION);
  CHECK_FALSE(helm::telemetry::ring<16>::try_dequeue(&ring, &rec));
}

TEST_CASE("bot_sm_state_duration_resets_on_transition") {
  helm::bot::sm machine{};
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  const uint64_t before = machine.state_duration_ns();
  CHECK(before >= 10'000'000u);
  REQUIRE(machine.request_transition(bot_state::starting) == HELM_OK);
  CHECK(machine.state_duration_ns() < before);
}

TEST_CASE("bot_sm_wait_for_observes_transition_from_other_thread") {
  helm::bot::sm machine{};
  CHECK_FALSE(machine.wait_for(bot_state::starting, 1));

  std::thread requester([&machine] {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    (void)machine.request_transition(bot_state::starting);
  });
  CHECK(machine.wait_for(bot_state::starting, 2000));
  requester.join();
  CHECK(machine.current_state() == bot_state::starting);
}

}  // namespace
