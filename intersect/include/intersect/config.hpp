#pragma once
// Config: every tuning constant of the turn core
//
// Defaults are the product-tuned values. None of them is an invariant;
// a JSON config file may override any field (see load_config).

#include "types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace intersect {

struct VariabilityConfig {
    float ceiling_messages = 10000.0f;  // fully rigid at this lifetime count
};

struct SessionConfig {
    float decay_factor = 0.9f;          // applied once per exchange
    float primary_boost = 0.02f;
    float secondary_boost = 0.015f;     // secondary, fan-out and debate turns
};

struct RouterConfig {
    float keyword_boost = 0.15f;
    float close_call_threshold = 0.15f; // top-two gap below this adds a secondary
    uint32_t silence_threshold = 3;     // user turns without speaking
    float silence_boost = 0.2f;
    uint32_t silence_lookback = 5;      // user turns inspected for silence
    InteractionMode challenge_secondary_mode = InteractionMode::Rebuttal;

    std::vector<std::string> all_personas_phrases = {
        "all of you", "all three", "each of you", "everyone",
        "hear from all", "want to hear from each", "all your perspectives"
    };

    // Analytical / planning language
    std::vector<std::string> logic_keywords = {
        "analyze", "think", "logic", "reason", "plan", "step", "how do i",
        "what should", "explain", "break down", "structure", "system", "process",
        "debug", "error", "fix", "code", "data", "numbers", "calculate", "compare",
        "evaluate", "pros and cons", "trade-off", "decision matrix", "framework"
    };

    // Quick-action / gut language
    std::vector<std::string> instinct_keywords = {
        "feel", "gut", "quick", "fast", "now", "immediately", "just do", "trust",
        "sense", "vibe", "intuition", "something tells me", "my read", "honestly",
        "straight up", "bottom line", "cut to", "tldr", "short version", "help me"
    };

    // Meaning / emotion language
    std::vector<std::string> psyche_keywords = {
        "why", "meaning", "feel about", "emotion", "deeper", "really", "underneath",
        "motivation", "afraid", "worried", "anxious", "happy", "sad", "love",
        "relationship", "self", "identity", "purpose", "value", "matter",
        "care about", "struggle", "conflict", "internal", "therapy", "reflect"
    };

    const std::vector<std::string>& keywords_for(Persona p) const {
        switch (p) {
            case Persona::Instinct: return instinct_keywords;
            case Persona::Logic: return logic_keywords;
            case Persona::Psyche: return psyche_keywords;
        }
        return logic_keywords;
    }
};

struct GroundingConfig {
    size_t deep_word_count = 50;        // strictly more than this is "long"
    size_t moderate_word_count = 30;
    size_t deep_question_marks = 2;
    size_t rich_fact_count = 3;
    size_t rich_pattern_count = 2;
    size_t moderate_fact_limit = 5;
    size_t moderate_pattern_limit = 2;

    std::vector<std::string> introspective_markers = {
        "why do i", "what does this mean", "help me understand",
        "been thinking about", "struggling with", "pattern", "always", "never",
        "relationship", "therapy", "deeper", "really", "honestly", "truth"
    };
};

struct DebateConfig {
    size_t max_responses = 4;           // primary + secondary + continuations
    size_t max_iterations = 2;          // continuations beyond the first pair
    InteractionMode default_mode = InteractionMode::Rebuttal;
    float judgment_temperature = 0.4f;
    int judgment_max_tokens = 150;
};

struct TraitConfig {
    float neutral_signal = 0.33f;
    float intrinsic_boost = 0.015f;
    float engagement_boost = 0.03f;
    float challenge_dampening = 0.5f;   // engagement multiplier in challenge mode
    size_t min_message_chars = 10;      // shorter messages read as neutral
    float judgment_temperature = 0.3f;
};

struct VoiceConfig {
    size_t history_messages = 15;
    int max_tokens = 300;
    float instinct_temperature = 0.8f;
    float logic_temperature = 0.4f;
    float psyche_temperature = 0.6f;

    float temperature_for(Persona p) const {
        switch (p) {
            case Persona::Instinct: return instinct_temperature;
            case Persona::Logic: return logic_temperature;
            case Persona::Psyche: return psyche_temperature;
        }
        return logic_temperature;
    }
};

struct Config {
    VariabilityConfig variability;
    SessionConfig session;
    RouterConfig router;
    GroundingConfig grounding;
    DebateConfig debate;
    TraitConfig traits;
    VoiceConfig voice;

    size_t history_window = 20;         // recent messages loaded per turn
    bool verbose = false;
};

// Load overrides from a JSON file. Missing keys keep their defaults.
// A missing or malformed file logs an error and yields defaults.
Config load_config(const std::string& path);

// Environment-derived paths
std::string default_config_path();   // $INTERSECT_CONFIG or ~/.intersect/config.json
std::string default_db_path();       // $INTERSECT_DB_PATH or ~/.intersect/intersect.db
std::string default_socket_path();   // $INTERSECT_SOCKET or /tmp/intersect-generate.sock

} // namespace intersect
