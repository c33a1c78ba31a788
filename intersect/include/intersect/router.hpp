#pragma once
// Heuristic Router: who speaks first, and who follows
//
// Instant and pure: combined weights, keyword signals and silence
// correction decide the primary and an optional secondary. No external
// calls, no randomness; identical inputs give identical decisions.
//
// Order of evaluation:
//   1. fewer than two personas enabled -> that persona alone
//   2. explicit "all of you" request with three enabled -> fan out
//   3. base score = combined weight (inverted in challenge mode)
//   4. keyword boost per matching persona
//   5. silence boost for personas quiet for N user turns
//   6. primary = best score
//   7. secondary on challenge mode or a close call
//   8. a silent persona left out is forced in as secondary

#include "config.hpp"
#include "text.hpp"
#include "types.hpp"
#include <algorithm>
#include <array>
#include <optional>
#include <string>
#include <vector>

namespace intersect {

struct SecondaryChoice {
    Persona persona;
    InteractionMode mode;

    bool operator==(const SecondaryChoice& o) const {
        return persona == o.persona && mode == o.mode;
    }
};

struct RoutingDecision {
    Persona primary = Persona::Logic;
    std::optional<SecondaryChoice> secondary;
    bool fan_out = false;               // every enabled persona answers

    // Diagnostics
    PersonaVector scores;
    std::array<uint32_t, PERSONA_COUNT> silence{};
    bool forced_by_silence = false;

    bool includes(Persona p) const {
        return primary == p || (secondary && secondary->persona == p);
    }

    bool operator==(const RoutingDecision& o) const {
        return primary == o.primary && secondary == o.secondary &&
               fan_out == o.fan_out && scores == o.scores &&
               silence == o.silence && forced_by_silence == o.forced_by_silence;
    }
    bool operator!=(const RoutingDecision& o) const { return !(*this == o); }
};

class HeuristicRouter {
public:
    explicit HeuristicRouter(RouterConfig config = {}) : config_(std::move(config)) {}

    // nullopt only when no persona is enabled
    std::optional<RoutingDecision> route(const std::string& message,
                                         const PersonaVector& combined_weights,
                                         const std::vector<Persona>& enabled_personas,
                                         const std::vector<Message>& history,
                                         bool challenge_mode) const {
        std::vector<Persona> enabled = unique(enabled_personas);
        if (enabled.empty()) return std::nullopt;

        RoutingDecision decision;
        decision.silence = silence_counts(history);

        // 1. Nothing to choose between
        if (enabled.size() < 2) {
            decision.primary = enabled.front();
            return decision;
        }

        std::string lower = to_lower(message);

        // 2. Explicit request to hear from everyone
        if (enabled.size() >= PERSONA_COUNT && contains_any(lower, config_.all_personas_phrases)) {
            decision.primary = enabled.front();
            decision.fan_out = true;
            return decision;
        }

        // 3. Base scores. Challenge mode surfaces habitually quiet perspectives.
        PersonaVector& scores = decision.scores;
        for (Persona p : enabled) {
            scores[p] = challenge_mode ? 1.0f - combined_weights[p] : combined_weights[p];
        }

        // 4. Keyword signals, one boost per persona
        for (Persona p : enabled) {
            if (contains_any(lower, config_.keywords_for(p))) {
                scores[p] += config_.keyword_boost;
            }
        }

        // 5. Silence correction
        std::vector<Persona> silent;
        for (Persona p : enabled) {
            if (decision.silence[index_of(p)] >= config_.silence_threshold) {
                scores[p] += config_.silence_boost;
                silent.push_back(p);
            }
        }

        // 6. Ranking; ties keep the caller's persona order
        std::vector<Persona> ranked = enabled;
        std::stable_sort(ranked.begin(), ranked.end(), [&](Persona a, Persona b) {
            return scores[a] > scores[b];
        });
        decision.primary = ranked[0];

        InteractionMode follow_mode = challenge_mode ? config_.challenge_secondary_mode
                                                     : InteractionMode::Addition;

        // 7. Secondary on challenge mode or a close call
        bool close_call = scores[ranked[0]] - scores[ranked[1]] < config_.close_call_threshold;
        if (challenge_mode || close_call) {
            decision.secondary = SecondaryChoice{ranked[1], follow_mode};
        }

        // 8. Hard override, applied last: the longest-silent persona still
        //    left out takes the secondary slot
        std::optional<Persona> forced;
        for (Persona p : silent) {
            if (decision.includes(p)) continue;
            if (!forced ||
                decision.silence[index_of(p)] > decision.silence[index_of(*forced)] ||
                (decision.silence[index_of(p)] == decision.silence[index_of(*forced)] &&
                 scores[p] > scores[*forced])) {
                forced = p;
            }
        }
        if (forced) {
            decision.secondary = SecondaryChoice{*forced, follow_mode};
            decision.forced_by_silence = true;
        }

        return decision;
    }

    // User turns since each persona last spoke, looking back at most
    // silence_lookback user turns. A persona that spoke after the latest
    // user message has silence 0.
    std::array<uint32_t, PERSONA_COUNT> silence_counts(const std::vector<Message>& history) const {
        std::array<uint32_t, PERSONA_COUNT> silence{};
        std::array<bool, PERSONA_COUNT> spoke{};
        uint32_t user_turns = 0;

        for (auto it = history.rbegin(); it != history.rend(); ++it) {
            if (it->is_user()) {
                if (user_turns >= config_.silence_lookback) break;
                ++user_turns;
                for (Persona p : ALL_PERSONAS) {
                    if (!spoke[index_of(p)]) silence[index_of(p)] = user_turns;
                }
            } else if (it->is_persona()) {
                spoke[index_of(*it->persona)] = true;
            }
        }
        return silence;
    }

    const RouterConfig& config() const { return config_; }

private:
    static std::vector<Persona> unique(const std::vector<Persona>& in) {
        std::vector<Persona> out;
        for (Persona p : in) {
            if (std::find(out.begin(), out.end(), p) == out.end()) out.push_back(p);
        }
        return out;
    }

    RouterConfig config_;
};

} // namespace intersect
