#pragma once

#include "helm/bot/sm.hpp"
#include "helm/health/sm.hpp"
#include "helm/loop/sm.hpp"
#include "helm/recovery/sm.hpp"
#include "helm/stuck/detector.hpp"
#include "helm/telemetry/provider/sm.hpp"

namespace helm {

using BotMachine = helm::bot::sm;
using HealthController = helm::health::sm;
using OrchestrationLoop = helm::loop::sm;
using RecoveryCoordinator = helm::recovery::sm;
using StuckDetector = helm::stuck::detector;
using TelemetryProvider = helm::telemetry::provider::sm;

}  // namespace helm
