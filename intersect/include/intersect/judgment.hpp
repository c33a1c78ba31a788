#pragma once
// Judgment: defensive parsing of the small JSON verdicts the generator returns
//
// Generated JSON arrives wrapped in prose or ``` fences, with missing keys,
// strings where numbers belong. Everything here returns nullopt instead
// of throwing; callers substitute their safe default.

#include "config.hpp"
#include "text.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <optional>
#include <string>

namespace intersect {

using json = nlohmann::json;

// Debate continuation verdict
struct ContinueDecision {
    bool should_continue = false;
    std::optional<Persona> next_persona;
    std::optional<InteractionMode> mode;
    std::string reason;
};

// How strongly the user's own message exhibits each style, 0..1 (0.33 neutral)
struct IntrinsicSignal {
    PersonaVector scores{0.33f, 0.33f, 0.33f};
    std::string reasoning;

    static IntrinsicSignal neutral(float value = 0.33f) {
        IntrinsicSignal s;
        s.scores = {value, value, value};
        return s;
    }
};

// How the user engaged with the previous turn's personas, -1..1
struct EngagementSignal {
    PersonaVector scores;
    std::string reasoning;
};

// Pull the outermost {...} out of generated text
inline std::optional<json> extract_json_object(const std::string& text) {
    std::string cleaned = trim(text);
    size_t open = cleaned.find('{');
    size_t close = cleaned.rfind('}');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        return std::nullopt;
    }
    try {
        json j = json::parse(cleaned.substr(open, close - open + 1));
        if (!j.is_object()) return std::nullopt;
        return j;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

namespace detail {

inline std::optional<float> number_field(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_number()) return std::nullopt;
    double v = j[key].get<double>();
    if (!std::isfinite(v)) return std::nullopt;
    return static_cast<float>(v);
}

inline std::string string_field(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_string()) return {};
    return j[key].get<std::string>();
}

} // namespace detail

// Expects {"continue": bool, "next_agent": "name"|null, "type": "mode"|null}.
// An unknown or null persona leaves next_persona empty.
inline std::optional<ContinueDecision> parse_continue_decision(const std::string& text) {
    auto j = extract_json_object(text);
    if (!j || !j->contains("continue") || !(*j)["continue"].is_boolean()) {
        return std::nullopt;
    }

    ContinueDecision d;
    d.should_continue = (*j)["continue"].get<bool>();
    d.next_persona = parse_persona(detail::string_field(*j, "next_agent"));
    if (!d.next_persona) d.next_persona = parse_persona(detail::string_field(*j, "next_persona"));
    d.mode = parse_mode(detail::string_field(*j, "type"));
    if (!d.mode) d.mode = parse_mode(detail::string_field(*j, "mode"));
    d.reason = detail::string_field(*j, "reason");
    return d;
}

// Expects {"instinct_signal": x, "logic_signal": y, "psyche_signal": z}.
// Missing components read as neutral; nothing numeric at all is malformed.
inline std::optional<IntrinsicSignal> parse_intrinsic(const std::string& text,
                                                      float neutral = 0.33f) {
    auto j = extract_json_object(text);
    if (!j) return std::nullopt;

    auto i = detail::number_field(*j, "instinct_signal");
    auto l = detail::number_field(*j, "logic_signal");
    auto p = detail::number_field(*j, "psyche_signal");
    if (!i && !l && !p) return std::nullopt;

    IntrinsicSignal s;
    s.scores.instinct = std::clamp(i.value_or(neutral), 0.0f, 1.0f);
    s.scores.logic = std::clamp(l.value_or(neutral), 0.0f, 1.0f);
    s.scores.psyche = std::clamp(p.value_or(neutral), 0.0f, 1.0f);
    s.reasoning = detail::string_field(*j, "reasoning");
    return s;
}

// Expects {"instinct_score": x, "logic_score": y, "psyche_score": z}
inline std::optional<EngagementSignal> parse_engagement(const std::string& text) {
    auto j = extract_json_object(text);
    if (!j) return std::nullopt;

    auto i = detail::number_field(*j, "instinct_score");
    auto l = detail::number_field(*j, "logic_score");
    auto p = detail::number_field(*j, "psyche_score");
    if (!i && !l && !p) return std::nullopt;

    EngagementSignal s;
    s.scores.instinct = std::clamp(i.value_or(0.0f), -1.0f, 1.0f);
    s.scores.logic = std::clamp(l.value_or(0.0f), -1.0f, 1.0f);
    s.scores.psyche = std::clamp(p.value_or(0.0f), -1.0f, 1.0f);
    s.reasoning = detail::string_field(*j, "reasoning");
    return s;
}

} // namespace intersect
