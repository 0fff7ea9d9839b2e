#include <cstdio>
#include <mutex>

#include "helm/clock.hpp"
#include "helm/engine.hpp"
#include "helm/helm.h"
#include "helm/run/rotation.hpp"

namespace {

using helm::bot::bot_state;
using helm::port::label;

// A scripted game client. Run handlers move it through a farming run; the
// engine sees it only through the observe and perform ports.
struct world {
  std::mutex mutex;
  label scene = label::main_menu;
  float health = 100.0f;
  float x = 0.0f;
  float y = 0.0f;
  int32_t runs = 0;
  int32_t steps = 0;
  helm::run::rotation * rotation = nullptr;

  int32_t observe(const int32_t, helm::port::observation & out) {
    std::lock_guard<std::mutex> lock(mutex);
    out.value = scene;
    out.confidence = 0.95f;
    out.set(helm::port::readout::health, health);
    if (scene == label::in_game || scene == label::in_combat || scene == label::loot_visible) {
      out.set(helm::port::readout::position_x, x);
      out.set(helm::port::readout::position_y, y);
    }
    return HELM_OK;
  }

  int32_t perform(const helm::port::action & act, const int32_t) {
    std::lock_guard<std::mutex> lock(mutex);
    switch (act.kind) {
      case helm::port::action_kind::exit_game_template:
      case helm::port::action_kind::exit_game_fixed_click:
        scene = label::main_menu;
        health = 100.0f;
        break;
      case helm::port::action_kind::use_potion:
        health += 30.0f;
        break;
      case helm::port::action_kind::click:
        x += 60.0f;
        y += 20.0f;
        break;
      default:
        break;
    }
    return HELM_OK;
  }

  void begin_run() {
    std::lock_guard<std::mutex> lock(mutex);
    runs += 1;
    steps = 0;
    if (rotation != nullptr) {
      rotation->begin();
    }
  }

  void enter_town(const helm::run::request &, helm::run::result & out) {
    std::lock_guard<std::mutex> lock(mutex);
    scene = label::in_town;
    out.value = helm::run::status::in_progress;
  }

  // Kill, loot, leave. The third run takes a heavy hit mid-fight.
  void boss_run(const helm::run::request &, helm::run::result & out) {
    std::lock_guard<std::mutex> lock(mutex);
    steps += 1;
    x += 40.0f;
    switch (steps) {
      case 1:
        scene = label::in_game;
        break;
      case 2:
        scene = label::in_combat;
        if (runs == 3) {
          health = 20.0f;
        }
        break;
      case 3:
        scene = label::loot_visible;
        out.items = 2;
        break;
      default:
        scene = label::in_game;
        out.value = helm::run::status::success;
        return;
    }
    out.value = helm::run::status::in_progress;
  }

  // Clears an area; stands against a wall for a while before moving on.
  void area_run(const helm::run::request &, helm::run::result & out) {
    std::lock_guard<std::mutex> lock(mutex);
    steps += 1;
    scene = label::in_game;
    if (steps > 8) {
      out.value = helm::run::status::success;
      return;
    }
    out.value = helm::run::status::in_progress;
  }
};

const char * component_name(const uint32_t id) {
  switch (id) {
    case HELM_COMPONENT_BOT:
      return "bot";
    case HELM_COMPONENT_RECOVERY:
      return "recovery";
    case HELM_COMPONENT_HEALTH:
      return "health";
    case HELM_COMPONENT_LOOP:
      return "loop";
    default:
      return "none";
  }
}

const char * record_name(const uint32_t id) {
  switch (id) {
    case HELM_RECORD_TRANSITION:
      return "transition";
    case HELM_RECORD_REJECTION:
      return "rejection";
    case HELM_RECORD_ERROR_EVENT:
      return "error_event";
    case HELM_RECORD_ESCALATION:
      return "escalation";
    case HELM_RECORD_ALERT:
      return "alert";
    case HELM_RECORD_DROPPED:
      return "dropped";
    case HELM_RECORD_CHICKEN:
      return "chicken";
    case HELM_RECORD_POTION:
      return "potion";
    case HELM_RECORD_RUN_FINISHED:
      return "run_finished";
    case HELM_RECORD_SUPERSEDED_EVENT:
      return "superseded_event";
    default:
      return "unknown";
  }
}

void print_record(const helm::telemetry::record & rec, const uint64_t origin_ns) {
  const double ms = static_cast<double>(rec.timestamp_ns - origin_ns) / 1e6;
  if (rec.component_id == HELM_COMPONENT_BOT) {
    std::fprintf(stdout, "%9.1f ms  %-8s %-16s %s -> %s (%s)\n", ms, component_name(rec.component_id),
                 record_name(rec.event_id), helm::bot::to_string(static_cast<bot_state>(rec.state_id)),
                 helm::bot::to_string(static_cast<bot_state>(rec.target_id)),
                 helm_status_name(rec.status));
    return;
  }
  std::fprintf(stdout, "%9.1f ms  %-8s %-16s state=%s target=%u kind=%u (%s)\n", ms,
               component_name(rec.component_id), record_name(rec.event_id),
               helm::bot::to_string(static_cast<bot_state>(rec.state_id)), rec.target_id, rec.kind_id,
               helm_status_name(rec.status));
}

void on_alert(const char * message, const helm::recovery::error_event &) {
  std::fprintf(stderr, "ALERT: %s\n", message);
}

}  // namespace

int main() {
  world game{};

  helm::config::engine cfg{};
  cfg.tick_interval_ms = 20;
  cfg.health_interval_ms = 5;
  cfg.max_runs = 4;

  helm::engine engine{cfg, helm::ports{
    .observe = helm::port::observe_fn::from<world, &world::observe>(&game),
    .perform = helm::port::perform_fn::from<world, &world::perform>(&game),
    .alert = helm::recovery::action::alert_fn::from<&on_alert>(),
  }};

  helm::run::rotation rotation{};
  (void)rotation.add(helm::run::kind::boss_farm,
                     helm::run::handler_fn::from<world, &world::boss_run>(&game));
  (void)rotation.add(helm::run::kind::area_farm,
                     helm::run::handler_fn::from<world, &world::area_run>(&game));

  helm::OrchestrationLoop & loop = engine.loop();
  const helm::run::handler_fn town = helm::run::handler_fn::from<world, &world::enter_town>(&game);
  loop.set_handler(bot_state::starting, town);
  loop.set_handler(bot_state::returning, town);
  loop.set_handler(bot_state::running, rotation.as_handler());
  loop.set_handler(bot_state::fighting, rotation.as_handler());
  loop.set_handler(bot_state::looting, rotation.as_handler());
  game.rotation = &rotation;
  loop.set_run_start_hook(helm::loop::action::run_start_fn::from<world, &world::begin_run>(&game));

  const uint64_t origin_ns = helm::now_ns();
  const int32_t started = engine.start();
  if (started != HELM_OK) {
    std::fprintf(stderr, "engine start failed: %s\n", helm_status_name(started));
    return 1;
  }

  const int32_t status = loop.run(2000);
  (void)engine.shutdown();

  helm::telemetry::record rec{};
  while (engine.next_record(rec)) {
    print_record(rec, origin_ns);
  }

  const helm::loop::action::session_stats stats = loop.stats();
  std::fprintf(stdout,
               "\nrun status=%s ticks=%llu runs=%llu completed=%llu failed=%llu chickens=%llu "
               "deaths=%llu items=%llu avg_run=%.2fs recovery_rate=%.2f\n",
               helm_status_name(status), static_cast<unsigned long long>(stats.ticks),
               static_cast<unsigned long long>(stats.runs_started),
               static_cast<unsigned long long>(stats.runs_completed),
               static_cast<unsigned long long>(stats.runs_failed),
               static_cast<unsigned long long>(stats.chickens),
               static_cast<unsigned long long>(stats.deaths),
               static_cast<unsigned long long>(stats.items_collected), loop.average_run_seconds(),
               engine.recovery().recovery_rate());
  return status == HELM_OK ? 0 : 1;
}
