#pragma once

#include <cstdint>

namespace helm::bot {

enum class bot_state : uint8_t {
  idle = 0,
  starting,
  in_town,
  running,
  fighting,
  looting,
  returning,
  managing_inventory,
  leveling_up,
  dead,
  chickened,
  disconnected,
  error,
  stopping,
  count,
};

inline constexpr int32_t k_state_count = static_cast<int32_t>(bot_state::count);

enum class priority : uint8_t {
  normal = 0,
  preemptive,
};

inline constexpr int32_t index_of(const bot_state state) noexcept {
  return static_cast<int32_t>(state);
}

inline constexpr bool valid_state(const bot_state state) noexcept {
  return index_of(state) >= 0 && index_of(state) < k_state_count;
}

// States in which a farming run is underway.
inline constexpr bool in_run(const bot_state state) noexcept {
  return state == bot_state::running || state == bot_state::fighting ||
         state == bot_state::looting || state == bot_state::returning;
}

inline const char * to_string(const bot_state state) noexcept {
  switch (state) {
    case bot_state::idle:
      return "idle";
    case bot_state::starting:
      return "starting";
    case bot_state::in_town:
      return "in_town";
    case bot_state::running:
      return "running";
    case bot_state::fighting:
      return "fighting";
    case bot_state::looting:
      return "looting";
    case bot_state::returning:
      return "returning";
    case bot_state::managing_inventory:
      return "managing_inventory";
    case bot_state::leveling_up:
      return "leveling_up";
    case bot_state::dead:
      return "dead";
    case bot_state::chickened:
      return "chickened";
    case bot_state::disconnected:
      return "disconnected";
    case bot_state::error:
      return "error";
    case bot_state::stopping:
      return "stopping";
    case bot_state::count:
      break;
  }
  return "invalid";
}

}  // namespace helm::bot
