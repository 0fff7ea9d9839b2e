#pragma once

#include "helm/clock.hpp"
#include "helm/health/context.hpp"

namespace helm::health::guard {

// Only states with a live character can be chickened out of.
struct character_in_game {
  bool operator()(const action::context & ctx) const noexcept {
    const bot::bot_state s = ctx.observed_state;
    return bot::in_run(s) || s == bot::bot_state::in_town ||
           s == bot::bot_state::managing_inventory || s == bot::bot_state::leveling_up;
  }
};

struct below_floor {
  bool operator()(const action::context & ctx) const noexcept {
    if (ctx.has_health && ctx.health <= ctx.chicken_health_percent) {
      return true;
    }
    return ctx.chicken_mana_percent > 0.0f && ctx.has_mana && ctx.mana <= ctx.chicken_mana_percent;
  }
};

struct breach_armed {
  bool operator()(const action::context & ctx) const noexcept {
    return !ctx.latched && character_in_game{}(ctx) && below_floor{}(ctx);
  }
};

struct potion_ready {
  bool operator()(const action::context & ctx, const uint64_t now) const noexcept {
    return !ctx.potion_taken || now - ctx.last_potion_ns >= ctx.potion_cooldown_ns;
  }
};

struct warning_low {
  bool operator()(const action::context & ctx) const noexcept {
    return !ctx.latched && character_in_game{}(ctx) && ctx.has_health &&
           ctx.health <= ctx.warning_health_percent && static_cast<bool>(ctx.perform);
  }
};

struct verdict_breach {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.assessment == action::verdict::breach;
  }
};

struct verdict_warning {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.assessment == action::verdict::warning;
  }
};

struct verdict_healthy {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.assessment == action::verdict::healthy;
  }
};

struct chicken_accepted {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.chicken_status == HELM_OK;
  }
};

struct chicken_rejected {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.chicken_status != HELM_OK;
  }
};

struct has_observe_port {
  bool operator()(const action::context & ctx) const noexcept {
    return static_cast<bool>(ctx.observe);
  }
};

}  // namespace helm::health::guard
