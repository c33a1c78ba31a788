#pragma once
// Trait Analysis: how a user message moves the persistent weights
//
// Two independent signals per exchange:
//   intrinsic   what the message itself exhibits (analytical, gut, reflective)
//   engagement  how the user took up each persona's previous response
// Both are judged by the generator, combined into one raw delta and
// applied once through AffinityWeights::apply_delta. Runs off the
// response path (see WeightUpdateQueue).

#include "affinity.hpp"
#include "config.hpp"
#include "generator.hpp"
#include "judgment.hpp"
#include "types.hpp"
#include "variability.hpp"
#include <optional>
#include <string>
#include <vector>

namespace intersect {

class TraitAnalysisCombiner {
public:
    explicit TraitAnalysisCombiner(TraitConfig config = {}) : config_(config) {}

    // Raw delta before variability scaling. Absent signals contribute nothing.
    PersonaVector delta(const std::optional<IntrinsicSignal>& intrinsic,
                        const std::optional<EngagementSignal>& engagement,
                        bool challenge_mode) const {
        PersonaVector d;
        float engagement_scale = config_.engagement_boost;
        if (challenge_mode) engagement_scale *= config_.challenge_dampening;

        for (Persona p : ALL_PERSONAS) {
            if (intrinsic) {
                d[p] += (intrinsic->scores[p] - config_.neutral_signal) * config_.intrinsic_boost;
            }
            if (engagement) {
                d[p] += engagement->scores[p] * engagement_scale;
            }
        }
        return d;
    }

    AffinityWeights apply(const AffinityWeights& current, const PersonaVector& raw_delta,
                          uint64_t total_messages,
                          const VariabilityConfig& variability_config = {}) const {
        return current.apply_delta(raw_delta, variability(total_messages, variability_config));
    }

    const TraitConfig& config() const { return config_; }

private:
    TraitConfig config_;
};

// Asks the generator for the two judgments. nullopt means "no signal"
// (judgment failed, malformed, or nothing to engage with). Messages too
// short to judge read as neutral.
class TraitAnalyzer {
public:
    TraitAnalyzer(TextGenerator& generator, TraitConfig config = {})
        : generator_(generator), config_(config) {}

    std::optional<IntrinsicSignal> intrinsic(const std::string& user_message,
                                             const std::string& conversation_id = "");

    std::optional<EngagementSignal> engagement(const std::string& user_message,
                                               const std::vector<Utterance>& previous_responses,
                                               const std::string& conversation_id = "");

private:
    TextGenerator& generator_;
    TraitConfig config_;
};

} // namespace intersect
