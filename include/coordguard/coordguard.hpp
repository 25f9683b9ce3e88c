#pragma once

// CoordGuard: Coordination Strategy & Pattern-Learning Engine
//
// Decides how many work items may run together, how to batch them and which
// execution strategy to use, then learns from reported outcomes.

// Core
#include "coordguard/types.hpp"
#include "coordguard/exceptions.hpp"
#include "coordguard/config.hpp"
#include "coordguard/clock.hpp"
#include "coordguard/logging.hpp"
#include "coordguard/monitor.hpp"

// Decision path
#include "coordguard/admission_controller.hpp"
#include "coordguard/strategy_selector.hpp"
#include "coordguard/batch_planner.hpp"

// Learning
#include "coordguard/event_log.hpp"
#include "coordguard/pattern_learner.hpp"
#include "coordguard/analytics.hpp"
#include "coordguard/insight_generator.hpp"
#include "coordguard/recommender.hpp"

// Persistence
#include "coordguard/serialization.hpp"
#include "coordguard/storage.hpp"

#include "coordguard/coordination_engine.hpp"
