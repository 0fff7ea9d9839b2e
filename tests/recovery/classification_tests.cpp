#include <cstdint>
#include <cstring>
#include <doctest/doctest.h>

#include "helm/recovery/error.hpp"

namespace {

using helm::recovery::error_kind;
using helm::recovery::severity;
using helm::recovery::strategy;

TEST_CASE("recovery_classify_maps_each_kind_to_its_tier") {
  CHECK(helm::recovery::classify(error_kind::stuck) == severity::recoverable);
  CHECK(helm::recovery::classify(error_kind::observation_timeout) == severity::recoverable);
  CHECK(helm::recovery::classify(error_kind::action_timeout) == severity::recoverable);
  CHECK(helm::recovery::classify(error_kind::inventory_full) == severity::recoverable);
  CHECK(helm::recovery::classify(error_kind::template_fail) == severity::recoverable);
  CHECK(helm::recovery::classify(error_kind::health_sample_timeout) == severity::recoverable);
  CHECK(helm::recovery::classify(error_kind::character_death) == severity::run_ending);
  CHECK(helm::recovery::classify(error_kind::disconnect) == severity::run_ending);
  CHECK(helm::recovery::classify(error_kind::unknown_state) == severity::run_ending);
  CHECK(helm::recovery::classify(error_kind::escape_attempt_failed) == severity::run_ending);
  CHECK(helm::recovery::classify(error_kind::process_crash) == severity::critical);
  CHECK(helm::recovery::classify(error_kind::escape_exhausted) == severity::critical);
}

TEST_CASE("recovery_policy_table_picks_recovery_strategies") {
  CHECK(helm::recovery::policy_for(error_kind::stuck).recovery == strategy::escape_move);
  CHECK(helm::recovery::policy_for(error_kind::observation_timeout).recovery ==
        strategy::wait_retry);
  CHECK(helm::recovery::policy_for(error_kind::action_timeout).recovery ==
        strategy::cancel_and_retry);
  CHECK(helm::recovery::policy_for(error_kind::inventory_full).recovery ==
        strategy::town_handoff);
  CHECK(helm::recovery::policy_for(error_kind::character_death).recovery == strategy::none);
}

TEST_CASE("recovery_policy_table_run_end_targets") {
  using helm::bot::bot_state;
  CHECK(helm::recovery::policy_for(error_kind::character_death).run_end_target == bot_state::dead);
  CHECK(helm::recovery::policy_for(error_kind::disconnect).run_end_target ==
        bot_state::disconnected);
  CHECK(helm::recovery::policy_for(error_kind::inventory_full).run_end_target ==
        bot_state::returning);
  CHECK(helm::recovery::policy_for(error_kind::stuck).run_end_target == bot_state::count);
}

TEST_CASE("recovery_invalid_kind_falls_back_to_unknown_state") {
  CHECK_FALSE(helm::recovery::valid_kind(error_kind::count));
  CHECK(helm::recovery::policy_for(error_kind::count).kind == error_kind::unknown_state);
  CHECK(helm::recovery::classify(error_kind::count) == severity::run_ending);
}

TEST_CASE("recovery_escalation_only_moves_upward") {
  CHECK(helm::recovery::escalate(severity::recoverable) == severity::run_ending);
  CHECK(helm::recovery::escalate(severity::run_ending) == severity::critical);
  CHECK(helm::recovery::escalate(severity::critical) == severity::critical);
}

TEST_CASE("recovery_names_are_stable") {
  CHECK(std::strcmp(helm::recovery::to_string(error_kind::observation_timeout),
                    "observation_timeout") == 0);
  CHECK(std::strcmp(helm::recovery::to_string(error_kind::count), "invalid") == 0);
  CHECK(std::strcmp(helm::recovery::to_string(severity::run_ending), "run_ending") == 0);
  CHECK(std::strcmp(helm::recovery::to_string(helm::recovery::resolution::town_handoff),
                    "town_handoff") == 0);
}

}  // namespace
