#pragma once
// Intersect: the multi-persona turn core
//
// - Types: Personas, modes, messages
// - Affinity: Persistent weights and their single mutator
// - Session boost: Per-conversation routing momentum
// - Router / Grounding: Who speaks, with how much user context
// - Debate: Bounded continuation after disagreement
// - Traits: Background weight updates
// - TurnService: handle_turn

#include "types.hpp"
#include "config.hpp"
#include "variability.hpp"
#include "affinity.hpp"
#include "session_boost.hpp"
#include "store.hpp"
#include "router.hpp"
#include "grounding.hpp"
#include "judgment.hpp"
#include "generator.hpp"
#include "voice.hpp"
#include "debate.hpp"
#include "trait_analysis.hpp"
#include "weight_updater.hpp"
#include "turn_service.hpp"
#include "version.hpp"
