#include <intersect/voice.hpp>
#include <algorithm>
#include <sstream>

namespace intersect {

namespace {

const char* character(Persona p) {
    switch (p) {
        case Persona::Instinct:
            return "You are Snap, the instinct voice. You give fast gut reads and push "
                   "toward action. Direct, confident, brief.";
        case Persona::Logic:
            return "You are Dot, the logic voice. You break problems down, weigh options "
                   "and lay out clear next steps.";
        case Persona::Psyche:
            return "You are Puff, the psyche voice. You look at meaning, motivation and "
                   "feeling underneath the question.";
    }
    return "";
}

std::string short_name(Persona p) {
    switch (p) {
        case Persona::Instinct: return "Snap";
        case Persona::Logic: return "Dot";
        case Persona::Psyche: return "Puff";
    }
    return "another persona";
}

template <typename T, typename Pred>
std::vector<const T*> select(const std::vector<T>& items, Pred pred) {
    std::vector<const T*> out;
    for (const auto& item : items) {
        if (pred(item)) out.push_back(&item);
    }
    return out;
}

}  // anonymous namespace

std::string PersonaVoice::system_instruction(Persona speaker,
                                             const VoiceContext& context,
                                             std::optional<InteractionMode> mode,
                                             const Utterance* previous) const {
    std::ostringstream out;
    out << character(speaker) << "\n\n";

    std::string other = previous ? short_name(previous->persona) : "another persona";
    std::string quoted = previous ? previous->content : "";

    if (!mode) {
        out << "You are responding first to the user. Address what they actually need.";
    } else {
        switch (*mode) {
            case InteractionMode::Addition:
                out << other << " just responded: \"" << quoted << "\"\n\n"
                    << "Add something useful that " << other << " might have missed.";
                break;
            case InteractionMode::Rebuttal:
                out << other << " responded: \"" << quoted << "\"\n\n"
                    << "You see it differently than " << other
                    << ". Offer your alternative take, and stay helpful.";
                break;
            case InteractionMode::Debate:
                out << other << " responded: \"" << quoted << "\"\n\n"
                    << "You strongly disagree with " << other
                    << ". Make your case clearly so the user can weigh both views.";
                break;
        }
    }

    if (context.profile && context.grounding.level != GroundingLevel::Light) {
        const auto& keys = context.grounding.relevant_fact_keys;
        const auto& types = context.grounding.relevant_pattern_types;
        auto facts = select(context.profile->facts, [&](const Fact& f) {
            return std::find(keys.begin(), keys.end(), f.key) != keys.end();
        });
        auto patterns = select(context.profile->patterns, [&](const Pattern& p) {
            return std::find(types.begin(), types.end(), p.pattern_type) != types.end();
        });

        if (!facts.empty() || !patterns.empty()) {
            out << "\n\nWHAT YOU KNOW ABOUT THE USER ("
                << grounding_name(context.grounding.level) << "):\n";
            for (const Fact* f : facts) {
                out << "- " << f->key << ": " << f->value << "\n";
            }
            for (const Pattern* p : patterns) {
                out << "- " << p->pattern_type << ": " << p->description << "\n";
            }
            out << "Use this only where it genuinely helps.";
        }
        if (context.grounding.include_past_context) {
            out << "\nEarlier exchanges in this conversation may be relevant; draw on them.";
        }
    }

    out << "\n\nNever prefix your response with your name or a label. "
           "Keep it short: one to three sentences, a short paragraph at most.";
    return out.str();
}

GenerationRequest PersonaVoice::request(Persona speaker,
                                        const VoiceContext& context,
                                        std::optional<InteractionMode> mode,
                                        const Utterance* previous) const {
    GenerationRequest req;
    req.system = system_instruction(speaker, context, mode, previous);
    req.temperature = config_.temperature_for(speaker);
    req.max_tokens = config_.max_tokens;
    req.purpose = "persona";

    const auto& history = context.history;
    size_t start = history.size() > config_.history_messages
                       ? history.size() - config_.history_messages : 0;
    for (size_t i = start; i < history.size(); ++i) {
        const Message& m = history[i];
        if (m.role == Role::System) continue;
        req.messages.push_back({m.is_user() ? "user" : "assistant", m.content});
    }

    req.messages.push_back({"user", context.user_message});

    if (previous) {
        req.messages.push_back({"assistant", previous->content});
        req.messages.push_back({"user", std::string(persona_display_name(previous->persona)) +
                                        " just responded. Now it's your turn: acknowledge "
                                        "what they said if relevant, then add your perspective."});
    }
    return req;
}

} // namespace intersect
