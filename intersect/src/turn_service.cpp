#include <intersect/turn_service.hpp>
#include <intersect/log.hpp>
#include <algorithm>

namespace intersect {

struct TurnService::TurnState {
    std::string conversation_id;
    std::string user_message;
    std::vector<Persona> enabled;
    bool challenge_mode = false;

    UserProfile profile;
    std::vector<Message> history;
    GroundingDecision grounding;
    std::string last_message_id;    // what the next response answers
    std::string last_error;
};

namespace {

// Persona responses since the last user message: what the new message replies to
std::vector<Utterance> previous_responses(const std::vector<Message>& history) {
    std::vector<Utterance> out;
    for (auto it = history.rbegin(); it != history.rend(); ++it) {
        if (it->is_user()) break;
        if (it->is_persona()) out.push_back({*it->persona, it->content});
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::vector<Persona> dedupe(const std::vector<Persona>& in) {
    std::vector<Persona> out;
    for (Persona p : in) {
        if (std::find(out.begin(), out.end(), p) == out.end()) out.push_back(p);
    }
    return out;
}

}  // anonymous namespace

TurnService::TurnService(std::string user_id,
                         Config config,
                         ProfileStore& profiles,
                         MessageStore& messages,
                         TextGenerator& generator,
                         SessionBoostStore& sessions,
                         WeightUpdateQueue& updates,
                         DebateJudge* judge)
    : user_id_(std::move(user_id))
    , config_(std::move(config))
    , profiles_(profiles)
    , messages_(messages)
    , generator_(generator)
    , sessions_(sessions)
    , updates_(updates)
    , router_(config_.router)
    , grounding_(config_.grounding)
    , voice_(config_.voice)
    , judge_(judge) {
    if (!judge_) {
        own_judge_ = std::make_unique<GeneratorDebateJudge>(generator_, config_.debate);
        judge_ = own_judge_.get();
    }
}

TurnResult TurnService::handle_turn(const std::string& conversation_id,
                                    const std::string& user_message,
                                    const std::vector<Persona>& enabled_personas,
                                    bool challenge_mode) {
    TurnResult result;

    TurnState turn;
    turn.conversation_id = conversation_id;
    turn.user_message = user_message;
    turn.enabled = dedupe(enabled_personas);
    turn.challenge_mode = challenge_mode;

    if (turn.enabled.empty()) {
        result.error = "no personas enabled";
        log(LogCategory::Error, conversation_id, "Turn rejected: no personas enabled");
        return result;
    }

    try {
        run_turn(turn, result);
    } catch (const StoreError& e) {
        result.error = std::string("store error: ") + e.what();
        log(LogCategory::Error, conversation_id, "Turn aborted: %s", e.what());
    }
    return result;
}

void TurnService::finalize_conversation(const std::string& conversation_id) {
    sessions_.clear(conversation_id);
    log(LogCategory::Conversation, conversation_id, "Finalized, session boost cleared");
}

void TurnService::run_turn(TurnState& turn, TurnResult& result) {
    const std::string& conv = turn.conversation_id;

    sessions_.decay(conv);

    turn.profile = profiles_.load_profile(user_id_);
    PersonaVector combined = sessions_.combined_weights(conv, turn.profile.weights);
    turn.history = messages_.recent(conv, config_.history_window);

    turn.grounding = grounding_.classify(turn.user_message, turn.history, &turn.profile.summary);
    result.grounding = turn.grounding.level;
    log(LogCategory::Routing, conv, "Grounding %s (%zu facts, %zu patterns)",
        grounding_name(turn.grounding.level), turn.grounding.relevant_fact_keys.size(),
        turn.grounding.relevant_pattern_types.size());

    auto decision = router_.route(turn.user_message, combined, turn.enabled, turn.history,
                                  turn.challenge_mode);
    if (!decision) {
        result.error = "routing produced no decision";
        return;
    }
    result.routing = decision;
    log(LogCategory::Routing, conv, "Primary %s, secondary %s (%s)%s%s",
        persona_name(decision->primary),
        decision->secondary ? persona_name(decision->secondary->persona) : "none",
        decision->secondary ? mode_name(decision->secondary->mode) : "-",
        decision->fan_out ? ", fan-out" : "",
        decision->forced_by_silence ? ", forced by silence" : "");

    Message user = Message::from_user(conv, turn.user_message);
    messages_.append(user);
    turn.last_message_id = user.id;

    if (!respond(turn, result, decision->primary, std::nullopt, nullptr)) {
        result.error = "primary response failed: " + turn.last_error;
        return;
    }
    Utterance primary{decision->primary, result.responses.front().content};

    if (decision->fan_out) {
        // Everyone answers the primary, not each other
        for (Persona p : turn.enabled) {
            if (p == decision->primary) continue;
            respond(turn, result, p, InteractionMode::Addition, &primary);
        }
    } else if (decision->secondary) {
        const SecondaryChoice& secondary = *decision->secondary;
        if (respond(turn, result, secondary.persona, secondary.mode, &primary) &&
            is_adversarial(secondary.mode)) {
            run_debate(turn, result, secondary.mode);
        }
    }

    uint64_t total = profiles_.increment_message_count(user_id_);
    log(LogCategory::Conversation, conv, "Turn complete: %zu responses, %llu lifetime messages",
        result.responses.size(), static_cast<unsigned long long>(total));

    TraitJob job;
    job.user_id = user_id_;
    job.conversation_id = conv;
    job.user_message = turn.user_message;
    job.previous_responses = previous_responses(turn.history);
    job.challenge_mode = turn.challenge_mode;
    updates_.submit(std::move(job));
}

bool TurnService::respond(TurnState& turn, TurnResult& result, Persona speaker,
                          std::optional<InteractionMode> mode, const Utterance* previous) {
    VoiceContext context{turn.user_message, turn.history, turn.grounding, &turn.profile.summary};
    Generation gen = generator_.generate(voice_.request(speaker, context, mode, previous));
    if (!gen.ok) {
        turn.last_error = gen.error;
        log(LogCategory::Error, turn.conversation_id, "%s response (%s) failed: %s",
            persona_name(speaker), mode ? mode_name(*mode) : "primary", gen.error.c_str());
        return false;
    }

    Message reply = Message::from_persona(turn.conversation_id, speaker, gen.text, mode);
    reply.references_message_id = turn.last_message_id;
    messages_.append(reply);
    turn.last_message_id = reply.id;

    sessions_.boost(turn.conversation_id, speaker,
                    mode ? config_.session.secondary_boost : config_.session.primary_boost);

    result.responses.push_back({speaker, gen.text, mode});
    log(LogCategory::Agent, turn.conversation_id, "%s (%s): %zu chars",
        persona_name(speaker), mode ? mode_name(*mode) : "primary", gen.text.size());
    return true;
}

void TurnService::run_debate(TurnState& turn, TurnResult& result, InteractionMode secondary_mode) {
    DebateContinuation debate(config_.debate, turn.enabled, turn.user_message, turn.challenge_mode);
    const auto& first = result.responses[0];
    const auto& second = result.responses[1];
    debate.begin({first.persona, first.content}, {second.persona, second.content}, secondary_mode);

    while (debate.state() == DebateState::AwaitingJudgment) {
        auto next = debate.next(*judge_);
        if (!next) break;

        Utterance previous = debate.context().transcript.back();
        if (!respond(turn, result, next->persona, next->mode, &previous)) {
            debate.abort();
            break;
        }
        debate.record({next->persona, result.responses.back().content});
    }

    bool intense = secondary_mode == InteractionMode::Debate || debate.at_cap();
    result.continuation_mode = intense ? "intense" : "mild";
    log(LogCategory::Agent, turn.conversation_id, "Debate ended after %zu responses (%s)",
        debate.response_count(), result.continuation_mode->c_str());
}

} // namespace intersect
