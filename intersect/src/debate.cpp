#include <intersect/debate.hpp>
#include <intersect/log.hpp>
#include <sstream>

namespace intersect {

namespace {

std::string join_names(const std::vector<Persona>& personas) {
    if (personas.empty()) return "none";
    std::string out;
    for (Persona p : personas) {
        if (!out.empty()) out += ", ";
        out += persona_name(p);
    }
    return out;
}

}  // anonymous namespace

std::string GeneratorDebateJudge::prompt(const DebateContext& context) const {
    std::vector<Persona> silent;
    std::vector<Persona> spoke_once;
    for (Persona p : context.enabled) {
        uint32_t n = context.speak_counts[index_of(p)];
        if (n == 0) silent.push_back(p);
        else if (n == 1) spoke_once.push_back(p);
    }

    std::ostringstream out;
    out << "You are evaluating an ongoing exchange between personas.\n\n"
        << "CONTEXT:\n"
        << "- User asked: \"" << context.user_message << "\"\n"
        << "- " << context.transcript.size() << " responses have been given (max "
        << context.max_responses << ")\n"
        << "- Conversation mode: " << (context.challenge_mode ? "challenge" : "normal") << "\n"
        << "- Personas who haven't spoken: " << join_names(silent) << "\n"
        << "- Personas who could respond again: " << join_names(spoke_once) << "\n\n"
        << "RESPONSES SO FAR:\n";
    for (const auto& u : context.transcript) {
        out << persona_name(u.persona) << ": " << u.content << "\n\n";
    }
    out << "DECISION: should another persona jump in?\n"
        << "Continue only for genuine disagreement or a meaningful new point. A persona "
           "may speak a second time if it has something new to say about a later point. "
           "Prefer stopping if the exchange feels complete.\n\n"
        << "Respond with ONLY valid JSON:\n"
        << "{\"continue\": true/false, \"next_agent\": \"instinct|logic|psyche or null\", "
           "\"type\": \"addition/rebuttal/debate or null\", \"reason\": \"brief reason\"}";
    return out.str();
}

std::optional<ContinueDecision> GeneratorDebateJudge::judge(const DebateContext& context) {
    GenerationRequest request;
    request.system = prompt(context);
    request.messages.push_back(
        {"user", "Evaluate whether to continue the exchange based on the context above."});
    request.temperature = config_.judgment_temperature;
    request.max_tokens = config_.judgment_max_tokens;
    request.purpose = "debate_judgment";

    Generation gen = generator_.generate(request);
    if (!gen.ok) {
        log(LogCategory::Error, "", "Debate judgment failed: %s", gen.error.c_str());
        return std::nullopt;
    }

    auto decision = parse_continue_decision(gen.text);
    if (!decision) {
        log(LogCategory::Error, "", "Unparseable debate judgment: %.80s", gen.text.c_str());
        return std::nullopt;
    }

    log(LogCategory::Agent, "", "Debate continue=%s next=%s reason=%s",
        decision->should_continue ? "true" : "false",
        decision->next_persona ? persona_name(*decision->next_persona) : "none",
        decision->reason.c_str());
    return decision;
}

} // namespace intersect
