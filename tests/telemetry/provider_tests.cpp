#include "doctest/doctest.h"

#include "helm/helm.h"
#include "helm/telemetry/provider/sm.hpp"
#include "helm/telemetry/ring.hpp"

namespace {

struct queue_state {
  helm::telemetry::record records[4] = {};
  int32_t count = 0;
  int32_t capacity = 4;
};

bool try_enqueue(void * queue_ctx, const helm::telemetry::record & value) noexcept {
  auto * state = static_cast<queue_state *>(queue_ctx);
  if (state == nullptr) {
    return false;
  }
  if (state->count >= state->capacity) {
    return false;
  }
  state->records[state->count] = value;
  state->count += 1;
  return true;
}

void configure_and_start(helm::telemetry::provider::sm & machine, queue_state & queue) {
  int32_t err = HELM_ERR_BACKEND;
  helm::telemetry::provider::event::configure configure{};
  configure.queue_ctx = &queue;
  configure.try_enqueue = try_enqueue;
  configure.error_out = &err;
  REQUIRE(machine.process_event(configure));
  REQUIRE(err == HELM_OK);

  helm::telemetry::provider::event::start start{};
  start.error_out = &err;
  REQUIRE(machine.process_event(start));
  REQUIRE(err == HELM_OK);
}

}  // namespace

TEST_CASE("provider configures, starts, and publishes") {
  helm::telemetry::provider::sm machine{};
  queue_state queue{};
  configure_and_start(machine, queue);
  CHECK(machine.sessions_started() == 1);
  CHECK(machine.running());

  int32_t err = HELM_ERR_BACKEND;
  bool dropped = true;
  helm::telemetry::provider::event::publish publish{};
  publish.value.component_id = HELM_COMPONENT_BOT;
  publish.value.event_id = HELM_RECORD_TRANSITION;
  publish.value.status = 7;
  publish.dropped_out = &dropped;
  publish.error_out = &err;
  CHECK(machine.process_event(publish));
  CHECK(err == HELM_OK);
  CHECK(dropped == false);
  CHECK(queue.count == 1);
  CHECK(queue.records[0].status == 7);
  CHECK(queue.records[0].event_id == HELM_RECORD_TRANSITION);
  CHECK(machine.records_emitted() == 1);
  CHECK(machine.records_dropped() == 0);
  CHECK(machine.running());
}

TEST_CASE("provider publish drop does not error") {
  helm::telemetry::provider::sm machine{};
  queue_state queue{};
  queue.capacity = 0;
  configure_and_start(machine, queue);

  int32_t err = HELM_ERR_BACKEND;
  bool dropped = false;
  helm::telemetry::provider::event::publish publish{};
  publish.value.status = 3;
  publish.dropped_out = &dropped;
  publish.error_out = &err;
  CHECK(machine.process_event(publish));
  CHECK(err == HELM_OK);
  CHECK(dropped == true);
  CHECK(queue.count == 0);
  CHECK(machine.records_emitted() == 0);
  CHECK(machine.records_dropped() == 1);
}

TEST_CASE("provider configure without queue fails and reset recovers") {
  helm::telemetry::provider::sm machine{};

  int32_t err = HELM_OK;
  helm::telemetry::provider::event::configure configure{};
  configure.error_out = &err;
  CHECK_FALSE(machine.process_event(configure));
  CHECK(err == HELM_ERR_INVALID_ARGUMENT);

  helm::telemetry::provider::event::start start{};
  CHECK_FALSE(machine.process_event(start));

  helm::telemetry::provider::event::reset reset{};
  reset.error_out = &err;
  CHECK(machine.process_event(reset));
  CHECK(err == HELM_OK);

  queue_state queue{};
  configure_and_start(machine, queue);
  CHECK(machine.running());
}

TEST_CASE("provider emit before start is ignored") {
  helm::telemetry::provider::sm machine{};
  queue_state queue{};

  bool dropped = false;
  helm::telemetry::provider::event::publish publish{};
  publish.dropped_out = &dropped;
  CHECK_FALSE(machine.process_event(publish));
  CHECK(dropped == false);

  machine.emit(helm::telemetry::record{.status = 1});
  CHECK(queue.count == 0);
  CHECK(machine.records_emitted() == 0);
}

TEST_CASE("provider stop returns to configured and restarts") {
  helm::telemetry::provider::sm machine{};
  queue_state queue{};
  configure_and_start(machine, queue);

  int32_t err = HELM_ERR_BACKEND;
  helm::telemetry::provider::event::stop stop{};
  stop.error_out = &err;
  CHECK(machine.process_event(stop));
  CHECK(err == HELM_OK);
  CHECK_FALSE(machine.running());

  machine.emit(helm::telemetry::record{.status = 2});
  CHECK(queue.count == 0);

  helm::telemetry::provider::event::start start{};
  start.error_out = &err;
  CHECK(machine.process_event(start));
  CHECK(err == HELM_OK);
  CHECK(machine.sessions_started() == 2);
  machine.emit(helm::telemetry::record{.status = 2});
  CHECK(queue.count == 1);
}

TEST_CASE("ring drains in publish order and rejects when full") {
  helm::telemetry::ring<2> ring{};
  using ring_type = helm::telemetry::ring<2>;
  CHECK(ring_type::try_enqueue(&ring, helm::telemetry::record{.status = 1}));
  CHECK(ring_type::try_enqueue(&ring, helm::telemetry::record{.status = 2}));
  CHECK_FALSE(ring_type::try_enqueue(&ring, helm::telemetry::record{.status = 3}));
  CHECK(ring.size() == 2);

  helm::telemetry::record out{};
  REQUIRE(ring_type::try_dequeue(&ring, &out));
  CHECK(out.status == 1);
  CHECK(ring_type::try_enqueue(&ring, helm::telemetry::record{.status = 4}));
  REQUIRE(ring_type::try_dequeue(&ring, &out));
  CHECK(out.status == 2);
  REQUIRE(ring_type::try_dequeue(&ring, &out));
  CHECK(out.status == 4);
  CHECK_FALSE(ring_type::try_dequeue(&ring, &out));
  CHECK_FALSE(ring_type::try_dequeue(nullptr, &out));
  CHECK_FALSE(ring_type::try_enqueue(nullptr, out));
}
