#include <intersect/config.hpp>
#include <intersect/log.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdlib>
#include <fstream>

namespace intersect {

using json = nlohmann::json;

namespace {

std::string home_dir() {
    const char* home = std::getenv("HOME");
    if (!home) home = ".";
    return home;
}

InteractionMode mode_value(const json& j, const char* key, InteractionMode fallback) {
    if (!j.contains(key) || !j[key].is_string()) return fallback;
    auto parsed = parse_mode(j[key].get<std::string>());
    return parsed ? *parsed : fallback;
}

void keyword_list(const json& j, const char* key, std::vector<std::string>& out) {
    if (!j.contains(key) || !j[key].is_array()) return;
    std::vector<std::string> words;
    for (const auto& item : j[key]) {
        if (item.is_string()) words.push_back(item.get<std::string>());
    }
    out = std::move(words);
}

void apply_router(const json& j, RouterConfig& c) {
    c.keyword_boost = j.value("keyword_boost", c.keyword_boost);
    c.close_call_threshold = j.value("close_call_threshold", c.close_call_threshold);
    c.silence_threshold = j.value("silence_threshold", c.silence_threshold);
    c.silence_boost = j.value("silence_boost", c.silence_boost);
    c.silence_lookback = j.value("silence_lookback", c.silence_lookback);
    c.challenge_secondary_mode = mode_value(j, "challenge_secondary_mode",
                                            c.challenge_secondary_mode);
    keyword_list(j, "all_personas_phrases", c.all_personas_phrases);
    keyword_list(j, "logic_keywords", c.logic_keywords);
    keyword_list(j, "instinct_keywords", c.instinct_keywords);
    keyword_list(j, "psyche_keywords", c.psyche_keywords);
}

void apply_grounding(const json& j, GroundingConfig& c) {
    c.deep_word_count = j.value("deep_word_count", c.deep_word_count);
    c.moderate_word_count = j.value("moderate_word_count", c.moderate_word_count);
    c.deep_question_marks = j.value("deep_question_marks", c.deep_question_marks);
    c.rich_fact_count = j.value("rich_fact_count", c.rich_fact_count);
    c.rich_pattern_count = j.value("rich_pattern_count", c.rich_pattern_count);
    c.moderate_fact_limit = j.value("moderate_fact_limit", c.moderate_fact_limit);
    c.moderate_pattern_limit = j.value("moderate_pattern_limit", c.moderate_pattern_limit);
    keyword_list(j, "introspective_markers", c.introspective_markers);
}

// Hard limits: a turn never exceeds four responses, whatever the file says
constexpr size_t MIN_DEBATE_RESPONSES = 2;
constexpr size_t MAX_DEBATE_RESPONSES = 4;
constexpr size_t MAX_DEBATE_ITERATIONS = 2;

void apply_debate(const json& j, DebateConfig& c) {
    c.max_responses = j.value("max_responses", c.max_responses);
    c.max_iterations = j.value("max_iterations", c.max_iterations);
    if (c.max_responses > MAX_DEBATE_RESPONSES || c.max_responses < MIN_DEBATE_RESPONSES) {
        size_t clamped = std::min(std::max(c.max_responses, MIN_DEBATE_RESPONSES),
                                  MAX_DEBATE_RESPONSES);
        log(LogCategory::Error, "", "debate.max_responses %zu out of range, using %zu",
            c.max_responses, clamped);
        c.max_responses = clamped;
    }
    if (c.max_iterations > MAX_DEBATE_ITERATIONS) {
        log(LogCategory::Error, "", "debate.max_iterations %zu out of range, using %zu",
            c.max_iterations, MAX_DEBATE_ITERATIONS);
        c.max_iterations = MAX_DEBATE_ITERATIONS;
    }
    c.default_mode = mode_value(j, "default_mode", c.default_mode);
    c.judgment_temperature = j.value("judgment_temperature", c.judgment_temperature);
    c.judgment_max_tokens = j.value("judgment_max_tokens", c.judgment_max_tokens);
}

void apply_traits(const json& j, TraitConfig& c) {
    c.neutral_signal = j.value("neutral_signal", c.neutral_signal);
    c.intrinsic_boost = j.value("intrinsic_boost", c.intrinsic_boost);
    c.engagement_boost = j.value("engagement_boost", c.engagement_boost);
    c.challenge_dampening = j.value("challenge_dampening", c.challenge_dampening);
    c.min_message_chars = j.value("min_message_chars", c.min_message_chars);
    c.judgment_temperature = j.value("judgment_temperature", c.judgment_temperature);
}

void apply_voice(const json& j, VoiceConfig& c) {
    c.history_messages = j.value("history_messages", c.history_messages);
    c.max_tokens = j.value("max_tokens", c.max_tokens);
    c.instinct_temperature = j.value("instinct_temperature", c.instinct_temperature);
    c.logic_temperature = j.value("logic_temperature", c.logic_temperature);
    c.psyche_temperature = j.value("psyche_temperature", c.psyche_temperature);
}

}  // anonymous namespace

Config load_config(const std::string& path) {
    Config config;

    std::ifstream in(path);
    if (!in) {
        log(LogCategory::Error, "", "Cannot open config file %s, using defaults", path.c_str());
        return config;
    }

    try {
        json j = json::parse(in);
        if (!j.is_object()) {
            log(LogCategory::Error, "", "Config %s is not a JSON object, using defaults",
                path.c_str());
            return config;
        }

        config.history_window = j.value("history_window", config.history_window);
        config.verbose = j.value("verbose", config.verbose);
        if (j.contains("variability") && j["variability"].is_object()) {
            config.variability.ceiling_messages =
                j["variability"].value("ceiling_messages", config.variability.ceiling_messages);
        }
        if (j.contains("session") && j["session"].is_object()) {
            const auto& s = j["session"];
            float decay = s.value("decay_factor", config.session.decay_factor);
            if (decay > 0.0f && decay < 1.0f) {
                config.session.decay_factor = decay;
            } else {
                // Decay must shrink the boost without flipping its sign
                log(LogCategory::Error, "", "session.decay_factor %.3f outside (0,1), using %.3f",
                    static_cast<double>(decay), static_cast<double>(config.session.decay_factor));
            }
            config.session.primary_boost = s.value("primary_boost", config.session.primary_boost);
            config.session.secondary_boost =
                s.value("secondary_boost", config.session.secondary_boost);
        }
        if (j.contains("router") && j["router"].is_object()) apply_router(j["router"], config.router);
        if (j.contains("grounding") && j["grounding"].is_object()) apply_grounding(j["grounding"], config.grounding);
        if (j.contains("debate") && j["debate"].is_object()) apply_debate(j["debate"], config.debate);
        if (j.contains("traits") && j["traits"].is_object()) apply_traits(j["traits"], config.traits);
        if (j.contains("voice") && j["voice"].is_object()) apply_voice(j["voice"], config.voice);
    } catch (const json::exception& e) {
        log(LogCategory::Error, "", "Malformed config %s: %s", path.c_str(), e.what());
        return Config{};
    }

    return config;
}

std::string default_config_path() {
    if (const char* env = std::getenv("INTERSECT_CONFIG")) return env;
    return home_dir() + "/.intersect/config.json";
}

std::string default_db_path() {
    if (const char* env = std::getenv("INTERSECT_DB_PATH")) return env;
    return home_dir() + "/.intersect/intersect.db";
}

std::string default_socket_path() {
    if (const char* env = std::getenv("INTERSECT_SOCKET")) return env;
    return "/tmp/intersect-generate.sock";
}

} // namespace intersect
