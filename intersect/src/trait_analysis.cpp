#include <intersect/trait_analysis.hpp>
#include <intersect/log.hpp>
#include <sstream>

namespace intersect {

namespace {

const char* INTRINSIC_PROMPT = R"(You analyze a single user message for the thinking styles it exhibits.

Score each style from 0.0 to 1.0:
- logic_signal: analysis, structure, planning, weighing options, asking how things work
- instinct_signal: gut reads, quick decisions, action orientation, directness
- psyche_signal: meaning, emotion, motivation, self-reflection, relationships

A message with no clear style scores 0.33 on all three. Judge the message
itself, not the topic it mentions.

Respond with ONLY valid JSON:
{"logic_signal": 0.33, "instinct_signal": 0.33, "psyche_signal": 0.33, "reasoning": "brief reason"})";

const char* ENGAGEMENT_PROMPT = R"(You analyze how a user's reply engages with the previous persona responses.

For each persona assign a score from -1.0 to 1.0:
- 1.0: strong agreement, follow-up questions, adopting their framing
- 0.5: building on their point
- 0.0: neutral, no clear engagement
- -0.5: mild disagreement or dismissal
- -1.0: strong rejection

Personas that did not respond score 0.0. Most replies are subtle; keep
scores near 0 unless the signal is explicit.

Respond with ONLY valid JSON:
{"logic_score": 0.0, "instinct_score": 0.0, "psyche_score": 0.0, "reasoning": "brief reason"})";

}  // anonymous namespace

std::optional<IntrinsicSignal> TraitAnalyzer::intrinsic(const std::string& user_message,
                                                        const std::string& conversation_id) {
    if (trim(user_message).size() < config_.min_message_chars) {
        return IntrinsicSignal::neutral(config_.neutral_signal);
    }

    GenerationRequest request;
    request.system = INTRINSIC_PROMPT;
    request.messages.push_back({"user", "USER MESSAGE:\n" + user_message + "\n\nAnalyze:"});
    request.temperature = config_.judgment_temperature;
    request.purpose = "intrinsic";

    Generation gen = generator_.generate(request);
    if (!gen.ok) {
        log(LogCategory::Error, conversation_id, "Intrinsic analysis failed: %s", gen.error.c_str());
        return std::nullopt;
    }

    auto signal = parse_intrinsic(gen.text, config_.neutral_signal);
    if (!signal) {
        log(LogCategory::Error, conversation_id, "Unparseable intrinsic judgment: %.80s",
            gen.text.c_str());
        return std::nullopt;
    }

    log(LogCategory::Memory, conversation_id, "Intrinsic I=%.2f L=%.2f P=%.2f (%s)",
        signal->scores.instinct, signal->scores.logic, signal->scores.psyche,
        signal->reasoning.c_str());
    return signal;
}

std::optional<EngagementSignal> TraitAnalyzer::engagement(
    const std::string& user_message,
    const std::vector<Utterance>& previous_responses,
    const std::string& conversation_id) {
    if (previous_responses.empty()) return std::nullopt;

    std::ostringstream prompt;
    prompt << "PREVIOUS PERSONA RESPONSES:\n";
    for (const auto& r : previous_responses) {
        prompt << "[" << persona_display_name(r.persona) << "]: " << r.content << "\n\n";
    }
    prompt << "USER'S RESPONSE:\n" << user_message << "\n\nAnalyze engagement:";

    GenerationRequest request;
    request.system = ENGAGEMENT_PROMPT;
    request.messages.push_back({"user", prompt.str()});
    request.temperature = config_.judgment_temperature;
    request.purpose = "engagement";

    Generation gen = generator_.generate(request);
    if (!gen.ok) {
        log(LogCategory::Error, conversation_id, "Engagement analysis failed: %s", gen.error.c_str());
        return std::nullopt;
    }

    auto signal = parse_engagement(gen.text);
    if (!signal) {
        log(LogCategory::Error, conversation_id, "Unparseable engagement judgment: %.80s",
            gen.text.c_str());
        return std::nullopt;
    }

    log(LogCategory::Memory, conversation_id, "Engagement I=%.2f L=%.2f P=%.2f (%s)",
        signal->scores.instinct, signal->scores.logic, signal->scores.psyche,
        signal->reasoning.c_str());
    return signal;
}

} // namespace intersect
