#pragma once
// Turn Service: the one entry point of the turn core
//
// handle_turn(conversation, message, enabled, challenge):
//   1. decay session boost
//   2. load profile, combine persistent + session weights
//   3. load recent history, classify grounding, route
//   4. primary response, then fan-out or secondary (+ debate)
//   5. bump lifetime message count, enqueue trait analysis
//
// Responses are returned as soon as they exist. Trait analysis never
// delays them (see WeightUpdateQueue). The queue's analyzer should hold
// its own TextGenerator: a generator that serializes requests (such as
// SocketGenerator) would otherwise make a persona response wait behind
// the previous turn's judgments.

#include "config.hpp"
#include "debate.hpp"
#include "generator.hpp"
#include "grounding.hpp"
#include "router.hpp"
#include "session_boost.hpp"
#include "store.hpp"
#include "voice.hpp"
#include "weight_updater.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace intersect {

struct PersonaResponse {
    Persona persona;
    std::string content;
    std::optional<InteractionMode> mode;    // unset for the primary

    std::string kind() const { return mode ? mode_name(*mode) : "primary"; }
};

struct TurnResult {
    std::vector<PersonaResponse> responses;
    std::optional<std::string> continuation_mode;   // "mild" or "intense" when a debate ran
    std::optional<std::string> error;               // set when the turn stopped early

    // Diagnostics
    std::optional<RoutingDecision> routing;
    GroundingLevel grounding = GroundingLevel::Light;

    bool ok() const { return !responses.empty(); }
};

class TurnService {
public:
    // judge: defaults to one backed by the generator
    TurnService(std::string user_id,
                Config config,
                ProfileStore& profiles,
                MessageStore& messages,
                TextGenerator& generator,
                SessionBoostStore& sessions,
                WeightUpdateQueue& updates,
                DebateJudge* judge = nullptr);

    TurnResult handle_turn(const std::string& conversation_id,
                           const std::string& user_message,
                           const std::vector<Persona>& enabled_personas,
                           bool challenge_mode);

    // Conversation over or abandoned: drop its session boost.
    // Already-queued weight updates still run.
    void finalize_conversation(const std::string& conversation_id);

    const std::string& user_id() const { return user_id_; }
    const Config& config() const { return config_; }

private:
    struct TurnState;

    void run_turn(TurnState& turn, TurnResult& result);
    bool respond(TurnState& turn, TurnResult& result, Persona speaker,
                 std::optional<InteractionMode> mode, const Utterance* previous);
    void run_debate(TurnState& turn, TurnResult& result, InteractionMode secondary_mode);

    std::string user_id_;
    Config config_;
    ProfileStore& profiles_;
    MessageStore& messages_;
    TextGenerator& generator_;
    SessionBoostStore& sessions_;
    WeightUpdateQueue& updates_;

    HeuristicRouter router_;
    GroundingClassifier grounding_;
    PersonaVoice voice_;
    std::unique_ptr<GeneratorDebateJudge> own_judge_;
    DebateJudge* judge_;
};

} // namespace intersect
