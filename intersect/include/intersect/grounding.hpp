#pragma once
// Grounding Classifier: how much of the user's accumulated context to surface
//
// Throwaway exchanges stay light; long, searching or introspective
// messages from a well-known user get everything. First match wins:
//   first user turn                              -> Light
//   complex message AND rich profile             -> Deep
//   rich profile OR moderately long message      -> Moderate
//   otherwise                                    -> Light

#include "config.hpp"
#include "store.hpp"
#include "text.hpp"
#include "types.hpp"
#include <algorithm>
#include <string>
#include <vector>

namespace intersect {

enum class GroundingLevel : uint8_t {
    Light = 0,
    Moderate = 1,
    Deep = 2,
};

inline const char* grounding_name(GroundingLevel level) {
    switch (level) {
        case GroundingLevel::Light: return "light";
        case GroundingLevel::Moderate: return "moderate";
        case GroundingLevel::Deep: return "deep";
    }
    return "light";
}

struct GroundingDecision {
    GroundingLevel level = GroundingLevel::Light;
    std::vector<std::string> relevant_fact_keys;
    std::vector<std::string> relevant_pattern_types;
    bool include_past_context = false;
};

class GroundingClassifier {
public:
    explicit GroundingClassifier(GroundingConfig config = {}) : config_(std::move(config)) {}

    // history: messages before the current one
    GroundingDecision classify(const std::string& message,
                               const std::vector<Message>& history,
                               const ProfileSummary* profile) const {
        GroundingDecision decision;

        bool first_turn = std::none_of(history.begin(), history.end(),
                                       [](const Message& m) { return m.is_user(); });
        if (first_turn) return decision;

        std::string lower = to_lower(message);
        size_t words = word_count(message);
        size_t questions = static_cast<size_t>(std::count(message.begin(), message.end(), '?'));

        bool complex = words > config_.deep_word_count ||
                       questions >= config_.deep_question_marks ||
                       contains_any(lower, config_.introspective_markers);
        bool rich = profile && is_rich(*profile);

        if (complex && rich) {
            decision.level = GroundingLevel::Deep;
            decision.relevant_fact_keys = fact_keys(*profile, profile->facts.size());
            decision.relevant_pattern_types = pattern_types(*profile, profile->patterns.size());
            decision.include_past_context = true;
            return decision;
        }

        if (rich || words > config_.moderate_word_count) {
            decision.level = GroundingLevel::Moderate;
            if (profile) {
                decision.relevant_fact_keys = fact_keys(*profile, config_.moderate_fact_limit);
                decision.relevant_pattern_types =
                    pattern_types(*profile, config_.moderate_pattern_limit);
            }
            return decision;
        }

        return decision;
    }

    bool is_rich(const ProfileSummary& profile) const {
        return profile.facts.size() >= config_.rich_fact_count ||
               profile.patterns.size() >= config_.rich_pattern_count;
    }

private:
    static std::vector<std::string> fact_keys(const ProfileSummary& profile, size_t limit) {
        std::vector<std::string> keys;
        for (const auto& f : profile.facts) {
            if (keys.size() >= limit) break;
            keys.push_back(f.key);
        }
        return keys;
    }

    static std::vector<std::string> pattern_types(const ProfileSummary& profile, size_t limit) {
        std::vector<std::string> types;
        for (const auto& p : profile.patterns) {
            if (types.size() >= limit) break;
            types.push_back(p.pattern_type);
        }
        return types;
    }

    GroundingConfig config_;
};

} // namespace intersect
