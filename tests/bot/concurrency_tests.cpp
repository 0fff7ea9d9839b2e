#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <doctest/doctest.h>
#include <thread>

#include "helm/bot/sm.hpp"
#include "helm/helm.h"

namespace {

using helm::bot::bot_state;
using helm::bot::priority;

// Edge guard that parks the in-flight request until a preemptive request
// has announced itself, so the supersede window is hit deterministically.
struct preempt_gate {
  const helm::bot::sm * machine = nullptr;
  std::atomic<bool> entered{false};
  std::atomic<bool> saw_preempt{false};

  bool pass(const helm::bot::guard_input &) {
    entered.store(true, std::memory_order_release);
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline) {
      if (machine != nullptr && machine->preempt_pending() > 0) {
        saw_preempt.store(true, std::memory_order_release);
        return true;
      }
      std::this_thread::yield();
    }
    return true;
  }
};

TEST_CASE("bot_concurrency_preemptive_supersedes_normal_mid_flight") {
  preempt_gate gate{};
  const std::array<helm::bot::edge, 3> edges = {{
    {bot_state::idle, bot_state::running, {}},
    {bot_state::running, bot_state::fighting,
     helm::bot::guard_fn::from<preempt_gate, &preempt_gate::pass>(&gate)},
    {bot_state::running, bot_state::chickened, {}},
  }};
  helm::bot::graph g{};
  REQUIRE(helm::bot::graph::build(edges.data(), static_cast<int32_t>(edges.size()), g) == HELM_OK);

  helm::bot::sm machine{g};
  gate.machine = &machine;
  REQUIRE(machine.request_transition(bot_state::running) == HELM_OK);
  machine.process_event(helm::bot::event::begin_tick{.tick = 1});

  std::atomic<int32_t> normal_status{HELM_OK};
  std::thread loop_thread([&] {
    normal_status.store(machine.request_transition(bot_state::fighting, priority::normal));
  });
  while (!gate.entered.load(std::memory_order_acquire)) {
    std::this_thread::yield();
  }

  const int32_t preempt_status = machine.request_transition(bot_state::chickened, priority::preemptive);
  loop_thread.join();

  CHECK(gate.saw_preempt.load());
  CHECK(normal_status.load() == HELM_ERR_SUPERSEDED);
  CHECK(preempt_status == HELM_OK);
  CHECK(machine.current_state() == bot_state::chickened);
  CHECK(machine.preempt_pending() == 0);
  CHECK(machine.stats().superseded == 1);
  CHECK(machine.stats().accepted == 2);
}

TEST_CASE("bot_concurrency_preemptive_from_other_thread_wins_the_tick") {
  helm::bot::sm machine{};
  for (const bot_state to : {bot_state::starting, bot_state::in_town, bot_state::running}) {
    machine.process_event(helm::bot::event::begin_tick{.tick = machine.tick() + 1});
    REQUIRE(machine.request_transition(to) == HELM_OK);
  }
  machine.process_event(helm::bot::event::begin_tick{.tick = machine.tick() + 1});

  std::atomic<bool> go{false};
  std::atomic<int32_t> preempt_status{HELM_ERR_BACKEND};
  std::thread monitor([&] {
    while (!go.load(std::memory_order_acquire)) {
      std::this_thread::yield();
    }
    preempt_status.store(machine.request_transition(bot_state::chickened, priority::preemptive));
  });

  go.store(true, std::memory_order_release);
  const int32_t normal_status = machine.request_transition(bot_state::fighting, priority::normal);
  monitor.join();

  // Either order is legal; the preemptive target is where the tick ends.
  // A normal request that loses the race finds no CHICKENED -> FIGHTING edge.
  CHECK(preempt_status.load() == HELM_OK);
  CHECK(machine.current_state() == bot_state::chickened);
  CHECK((normal_status == HELM_OK || normal_status == HELM_ERR_SUPERSEDED ||
         normal_status == HELM_ERR_INVALID_TRANSITION));
}

TEST_CASE("bot_concurrency_every_request_is_accounted_for") {
  helm::bot::sm machine{};
  for (const bot_state to : {bot_state::starting, bot_state::in_town, bot_state::running}) {
    machine.process_event(helm::bot::event::begin_tick{.tick = machine.tick() + 1});
    REQUIRE(machine.request_transition(to) == HELM_OK);
  }

  constexpr int32_t k_rounds = 200;
  std::atomic<bool> go{false};
  auto hammer = [&](const bot_state a, const bot_state b, const priority prio) {
    while (!go.load(std::memory_order_acquire)) {
      std::this_thread::yield();
    }
    for (int32_t i = 0; i < k_rounds; ++i) {
      (void)machine.request_transition((i % 2) == 0 ? a : b, prio);
    }
  };
  std::thread first(hammer, bot_state::fighting, bot_state::looting, priority::normal);
  std::thread second(hammer, bot_state::running, bot_state::looting, priority::normal);
  std::thread third(hammer, bot_state::chickened, bot_state::in_town, priority::preemptive);
  std::thread ticker([&] {
    while (!go.load(std::memory_order_acquire)) {
      std::this_thread::yield();
    }
    for (int32_t i = 0; i < k_rounds; ++i) {
      machine.process_event(helm::bot::event::begin_tick{.tick = machine.tick() + 1});
      std::this_thread::yield();
    }
  });
  go.store(true, std::memory_order_release);
  first.join();
  second.join();
  third.join();
  ticker.join();

  const helm::bot::action::counters stats = machine.stats();
  const uint64_t total = stats.accepted + stats.rejected_invalid + stats.rejected_guard +
                         stats.superseded + stats.busy;
  CHECK(total == 3u + 3u * static_cast<uint64_t>(k_rounds));
  CHECK(helm::bot::valid_state(machine.current_state()));
  CHECK(machine.preempt_pending() == 0);
}

}  // namespace
