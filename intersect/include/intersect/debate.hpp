#pragma once
// Debate Continuation: bounded extra responses after a disagreement
//
//   Idle --begin(adversarial)--> AwaitingJudgment --judge says go--> Continuing
//     ^                              |                                   |
//     |                              +--stop / invalid / failed--+       |
//     |                                                          v       |
//     +------------------------------------------------------ Terminated |
//                                    ^                                   |
//                                    +--------- record() at cap ---------+
//
// Entered only when the secondary pushed back (Rebuttal or Debate).
// Never more than max_responses responses in a turn, however the judge
// answers. A failed or malformed judgment ends the debate.

#include "config.hpp"
#include "generator.hpp"
#include "judgment.hpp"
#include "router.hpp"
#include "types.hpp"
#include <algorithm>
#include <array>
#include <optional>
#include <string>
#include <vector>

namespace intersect {

enum class DebateState : uint8_t {
    Idle = 0,
    AwaitingJudgment = 1,
    Continuing = 2,
    Terminated = 3,
};

inline const char* debate_state_name(DebateState s) {
    switch (s) {
        case DebateState::Idle: return "idle";
        case DebateState::AwaitingJudgment: return "awaiting_judgment";
        case DebateState::Continuing: return "continuing";
        case DebateState::Terminated: return "terminated";
    }
    return "idle";
}

// Everything the judge sees
struct DebateContext {
    std::string user_message;
    std::vector<Persona> enabled;
    std::vector<Utterance> transcript;
    std::array<uint32_t, PERSONA_COUNT> speak_counts{};
    bool challenge_mode = false;
    size_t max_responses = 4;
};

class DebateJudge {
public:
    virtual ~DebateJudge() = default;

    // nullopt: the judgment could not be obtained or parsed
    virtual std::optional<ContinueDecision> judge(const DebateContext& context) = 0;
};

// Judge backed by the text generator
class GeneratorDebateJudge : public DebateJudge {
public:
    GeneratorDebateJudge(TextGenerator& generator, DebateConfig config = {})
        : generator_(generator), config_(config) {}

    std::optional<ContinueDecision> judge(const DebateContext& context) override;

    // Exposed for inspection in tests
    std::string prompt(const DebateContext& context) const;

private:
    TextGenerator& generator_;
    DebateConfig config_;
};

class DebateContinuation {
public:
    DebateContinuation(DebateConfig config, std::vector<Persona> enabled,
                       std::string user_message, bool challenge_mode)
        : config_(config) {
        context_.enabled = std::move(enabled);
        context_.user_message = std::move(user_message);
        context_.challenge_mode = challenge_mode;
        context_.max_responses = config_.max_responses;
    }

    // Seed with the primary and secondary responses. Returns whether a
    // debate is underway (adversarial secondary, room under the cap).
    bool begin(const Utterance& primary, const Utterance& secondary,
               InteractionMode secondary_mode) {
        if (state_ != DebateState::Idle) return state_ == DebateState::AwaitingJudgment;
        push(primary);
        push(secondary);
        if (!is_adversarial(secondary_mode) || at_cap()) {
            state_ = DebateState::Terminated;
            return false;
        }
        state_ = DebateState::AwaitingJudgment;
        return true;
    }

    // Ask the judge who speaks next. nullopt: the debate is over.
    std::optional<SecondaryChoice> next(DebateJudge& judge) {
        if (state_ != DebateState::AwaitingJudgment) return std::nullopt;
        if (at_cap() || iterations_ >= config_.max_iterations) {
            state_ = DebateState::Terminated;
            return std::nullopt;
        }

        auto decision = judge.judge(context_);
        if (!decision || !decision->should_continue || !decision->next_persona ||
            !enabled(*decision->next_persona)) {
            state_ = DebateState::Terminated;
            return std::nullopt;
        }

        state_ = DebateState::Continuing;
        return SecondaryChoice{*decision->next_persona,
                               decision->mode.value_or(config_.default_mode)};
    }

    // The chosen persona answered
    void record(const Utterance& response) {
        if (state_ != DebateState::Continuing) return;
        push(response);
        ++iterations_;
        state_ = (at_cap() || iterations_ >= config_.max_iterations)
                     ? DebateState::Terminated
                     : DebateState::AwaitingJudgment;
    }

    // The chosen persona failed to answer
    void abort() { state_ = DebateState::Terminated; }

    DebateState state() const { return state_; }
    const DebateContext& context() const { return context_; }
    size_t response_count() const { return context_.transcript.size(); }
    size_t iterations() const { return iterations_; }
    bool at_cap() const { return context_.transcript.size() >= config_.max_responses; }

private:
    void push(const Utterance& u) {
        context_.transcript.push_back(u);
        context_.speak_counts[index_of(u.persona)]++;
    }

    bool enabled(Persona p) const {
        return std::find(context_.enabled.begin(), context_.enabled.end(), p) !=
               context_.enabled.end();
    }

    DebateConfig config_;
    DebateContext context_;
    DebateState state_ = DebateState::Idle;
    size_t iterations_ = 0;
};

} // namespace intersect
