#pragma once
// Persona Voice: the generation request behind one persona utterance
//
// System instruction = persona character + how this response relates to
// the previous one + whatever user context grounding exposed. Messages =
// recent history, the current user message, and for follow-on responders
// the response they are answering.

#include "config.hpp"
#include "generator.hpp"
#include "grounding.hpp"
#include "store.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace intersect {

struct VoiceContext {
    const std::string& user_message;
    const std::vector<Message>& history;        // before the current message
    const GroundingDecision& grounding;
    const ProfileSummary* profile = nullptr;
};

class PersonaVoice {
public:
    explicit PersonaVoice(VoiceConfig config = {}) : config_(config) {}

    // mode unset: first responder. previous: the response being answered.
    GenerationRequest request(Persona speaker,
                              const VoiceContext& context,
                              std::optional<InteractionMode> mode = std::nullopt,
                              const Utterance* previous = nullptr) const;

    std::string system_instruction(Persona speaker,
                                   const VoiceContext& context,
                                   std::optional<InteractionMode> mode,
                                   const Utterance* previous) const;

    const VoiceConfig& config() const { return config_; }

private:
    VoiceConfig config_;
};

} // namespace intersect
