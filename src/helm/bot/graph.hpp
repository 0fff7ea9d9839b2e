#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include "helm/bot/state.hpp"
#include "helm/callback.hpp"
#include "helm/helm.h"
#include "helm/port/observation.hpp"

namespace helm::bot {

struct guard_input {
  const port::observation * latest = nullptr;
  float resume_health_percent = 0.0f;
};

using guard_fn = helm::callback<bool(const guard_input & input)>;

namespace guards {

// Leaving town for a new run needs enough health; without a health readout
// the edge is allowed.
inline bool health_ready(const guard_input & input) {
  if (input.latest == nullptr || !input.latest->has(port::readout::health)) {
    return true;
  }
  return input.latest->get(port::readout::health) >= input.resume_health_percent;
}

inline bool observed_in_town(const guard_input & input) {
  return input.latest != nullptr && input.latest->value == port::label::in_town;
}

}  // namespace guards

struct edge {
  bot_state from = bot_state::idle;
  bot_state to = bot_state::idle;
  guard_fn guard = {};
};

namespace detail {

inline constexpr guard_fn k_health_ready = guard_fn::from<&guards::health_ready>();
inline constexpr guard_fn k_in_town = guard_fn::from<&guards::observed_in_town>();

using S = bot_state;

}  // namespace detail

inline constexpr std::array<edge, 79> k_default_edges = {{
  {detail::S::idle, detail::S::starting, {}},
  {detail::S::idle, detail::S::stopping, {}},

  {detail::S::starting, detail::S::in_town, {}},
  {detail::S::starting, detail::S::disconnected, {}},
  {detail::S::starting, detail::S::error, {}},
  {detail::S::starting, detail::S::stopping, {}},

  {detail::S::in_town, detail::S::running, detail::k_health_ready},
  {detail::S::in_town, detail::S::managing_inventory, {}},
  {detail::S::in_town, detail::S::leveling_up, {}},
  {detail::S::in_town, detail::S::dead, {}},
  {detail::S::in_town, detail::S::chickened, {}},
  {detail::S::in_town, detail::S::disconnected, {}},
  {detail::S::in_town, detail::S::error, {}},
  {detail::S::in_town, detail::S::stopping, {}},

  {detail::S::running, detail::S::fighting, {}},
  {detail::S::running, detail::S::looting, {}},
  {detail::S::running, detail::S::returning, {}},
  {detail::S::running, detail::S::in_town, detail::k_in_town},
  {detail::S::running, detail::S::dead, {}},
  {detail::S::running, detail::S::chickened, {}},
  {detail::S::running, detail::S::disconnected, {}},
  {detail::S::running, detail::S::error, {}},
  {detail::S::running, detail::S::stopping, {}},

  {detail::S::fighting, detail::S::running, {}},
  {detail::S::fighting, detail::S::looting, {}},
  {detail::S::fighting, detail::S::returning, {}},
  {detail::S::fighting, detail::S::in_town, detail::k_in_town},
  {detail::S::fighting, detail::S::dead, {}},
  {detail::S::fighting, detail::S::chickened, {}},
  {detail::S::fighting, detail::S::disconnected, {}},
  {detail::S::fighting, detail::S::error, {}},
  {detail::S::fighting, detail::S::stopping, {}},

  {detail::S::looting, detail::S::running, {}},
  {detail::S::looting, detail::S::fighting, {}},
  {detail::S::looting, detail::S::returning, {}},
  {detail::S::looting, detail::S::in_town, detail::k_in_town},
  {detail::S::looting, detail::S::dead, {}},
  {detail::S::looting, detail::S::chickened, {}},
  {detail::S::looting, detail::S::disconnected, {}},
  {detail::S::looting, detail::S::error, {}},
  {detail::S::looting, detail::S::stopping, {}},

  {detail::S::returning, detail::S::in_town, detail::k_in_town},
  {detail::S::returning, detail::S::fighting, {}},
  {detail::S::returning, detail::S::looting, {}},
  {detail::S::returning, detail::S::dead, {}},
  {detail::S::returning, detail::S::chickened, {}},
  {detail::S::returning, detail::S::disconnected, {}},
  {detail::S::returning, detail::S::error, {}},
  {detail::S::returning, detail::S::stopping, {}},

  {detail::S::managing_inventory, detail::S::in_town, {}},
  {detail::S::managing_inventory, detail::S::dead, {}},
  {detail::S::managing_inventory, detail::S::chickened, {}},
  {detail::S::managing_inventory, detail::S::disconnected, {}},
  {detail::S::managing_inventory, detail::S::error, {}},
  {detail::S::managing_inventory, detail::S::stopping, {}},

  {detail::S::leveling_up, detail::S::in_town, {}},
  {detail::S::leveling_up, detail::S::running, {}},
  {detail::S::leveling_up, detail::S::dead, {}},
  {detail::S::leveling_up, detail::S::chickened, {}},
  {detail::S::leveling_up, detail::S::disconnected, {}},
  {detail::S::leveling_up, detail::S::error, {}},
  {detail::S::leveling_up, detail::S::stopping, {}},

  {detail::S::dead, detail::S::in_town, detail::k_in_town},
  {detail::S::dead, detail::S::starting, {}},
  {detail::S::dead, detail::S::disconnected, {}},
  {detail::S::dead, detail::S::error, {}},
  {detail::S::dead, detail::S::stopping, {}},

  {detail::S::chickened, detail::S::starting, {}},
  {detail::S::chickened, detail::S::in_town, detail::k_in_town},
  {detail::S::chickened, detail::S::disconnected, {}},
  {detail::S::chickened, detail::S::error, {}},
  {detail::S::chickened, detail::S::stopping, {}},

  {detail::S::disconnected, detail::S::starting, {}},
  {detail::S::disconnected, detail::S::error, {}},
  {detail::S::disconnected, detail::S::stopping, {}},

  {detail::S::error, detail::S::idle, {}},
  {detail::S::error, detail::S::starting, {}},
  {detail::S::error, detail::S::stopping, {}},

  {detail::S::stopping, detail::S::idle, {}},
}};

// Immutable adjacency matrix. Built once; the bot machine copies it at
// construction and only reads it afterwards.
class graph {
 public:
  graph() = default;

  static int32_t build(const edge * edges, const int32_t count, graph & out) noexcept {
    graph next{};
    if (edges == nullptr && count != 0) {
      return HELM_ERR_INVALID_ARGUMENT;
    }
    for (int32_t i = 0; i < count; ++i) {
      const edge & e = edges[i];
      if (!valid_state(e.from) || !valid_state(e.to) || e.from == e.to) {
        return HELM_ERR_INVALID_ARGUMENT;
      }
      slot & s = next.slots_[slot_index(e.from, e.to)];
      if (s.present) {
        return HELM_ERR_INVALID_ARGUMENT;
      }
      s.present = true;
      s.guard = e.guard;
      next.edge_count_ += 1;
    }
    out = next;
    return HELM_OK;
  }

  static graph standard() noexcept {
    graph out{};
    (void)build(k_default_edges.data(), static_cast<int32_t>(k_default_edges.size()), out);
    return out;
  }

  bool contains(const bot_state from, const bot_state to) const noexcept {
    if (!valid_state(from) || !valid_state(to)) {
      return false;
    }
    return slots_[slot_index(from, to)].present;
  }

  guard_fn guard_for(const bot_state from, const bot_state to) const noexcept {
    if (!contains(from, to)) {
      return {};
    }
    return slots_[slot_index(from, to)].guard;
  }

  int32_t edge_count() const noexcept { return edge_count_; }

 private:
  struct slot {
    bool present = false;
    guard_fn guard = {};
  };

  static size_t slot_index(const bot_state from, const bot_state to) noexcept {
    return static_cast<size_t>(index_of(from) * k_state_count + index_of(to));
  }

  std::array<slot, static_cast<size_t>(k_state_count * k_state_count)> slots_ = {};
  int32_t edge_count_ = 0;
};

}  // namespace helm::bot
