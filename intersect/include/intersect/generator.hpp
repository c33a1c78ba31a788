#pragma once
// Generator: the text-generation capability the turn core consumes
//
// Produces persona utterances and the small JSON judgments used by the
// debate loop and trait analysis. Implementations may block; callers on
// the turn path await each call in sequence.

#include <optional>
#include <string>
#include <vector>

namespace intersect {

struct ChatTurn {
    std::string role;       // "user" or "assistant"
    std::string content;
};

struct GenerationRequest {
    std::string system;
    std::vector<ChatTurn> messages;
    float temperature = 0.7f;
    std::optional<int> max_tokens;
    std::string purpose;    // "persona", "debate_judgment", "intrinsic", "engagement"
};

// Generated text or the reason there is none
struct Generation {
    bool ok = false;
    std::string text;
    std::string error;      // transport, rate limit, malformed response

    static Generation success(std::string text) {
        return {true, std::move(text), {}};
    }

    static Generation failure(std::string error) {
        return {false, {}, std::move(error)};
    }
};

class TextGenerator {
public:
    virtual ~TextGenerator() = default;
    virtual Generation generate(const GenerationRequest& request) = 0;
};

} // namespace intersect
