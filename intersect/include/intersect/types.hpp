#pragma once
// Core types: the vocabulary of a turn
//
// Three personas share every conversation. A PersonaVector holds one
// float per persona. Messages are the append-only log of who said what.

#include <array>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace intersect {

// Timestamp as Unix millis
using Timestamp = int64_t;

// Current time as Timestamp
inline Timestamp now() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

// ═══════════════════════════════════════════════════════════════════════════
// Personas
// ═══════════════════════════════════════════════════════════════════════════

enum class Persona : uint8_t {
    Instinct = 0,   // Snap: gut reads, quick action
    Logic = 1,      // Dot: analysis, planning
    Psyche = 2,     // Puff: meaning, emotion, introspection
};

constexpr size_t PERSONA_COUNT = 3;

constexpr std::array<Persona, PERSONA_COUNT> ALL_PERSONAS = {
    Persona::Instinct, Persona::Logic, Persona::Psyche
};

constexpr size_t index_of(Persona p) { return static_cast<size_t>(p); }

inline const char* persona_name(Persona p) {
    switch (p) {
        case Persona::Instinct: return "instinct";
        case Persona::Logic: return "logic";
        case Persona::Psyche: return "psyche";
    }
    return "unknown";
}

inline const char* persona_display_name(Persona p) {
    switch (p) {
        case Persona::Instinct: return "Snap (Instinct)";
        case Persona::Logic: return "Dot (Logic)";
        case Persona::Psyche: return "Puff (Psyche)";
    }
    return "another persona";
}

// The one place free text becomes a Persona. Case-insensitive, trims
// surrounding whitespace and quotes.
inline std::optional<Persona> parse_persona(const std::string& text) {
    size_t start = 0;
    size_t end = text.size();
    auto junk = [](char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '"' || c == '\'';
    };
    while (start < end && junk(text[start])) ++start;
    while (end > start && junk(text[end - 1])) --end;

    std::string lower;
    lower.reserve(end - start);
    for (size_t i = start; i < end; ++i) {
        char c = text[i];
        lower += (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    }

    if (lower == "instinct" || lower == "snap") return Persona::Instinct;
    if (lower == "logic" || lower == "dot") return Persona::Logic;
    if (lower == "psyche" || lower == "puff") return Persona::Psyche;
    return std::nullopt;
}

// ═══════════════════════════════════════════════════════════════════════════
// Interaction modes
// ═══════════════════════════════════════════════════════════════════════════

// How a follow-on responder relates to what came before it
enum class InteractionMode : uint8_t {
    Addition = 0,   // builds on the previous response
    Rebuttal = 1,   // pushes back
    Debate = 2,     // full disagreement
};

inline const char* mode_name(InteractionMode m) {
    switch (m) {
        case InteractionMode::Addition: return "addition";
        case InteractionMode::Rebuttal: return "rebuttal";
        case InteractionMode::Debate: return "debate";
    }
    return "addition";
}

inline std::optional<InteractionMode> parse_mode(const std::string& text) {
    std::string lower;
    for (char c : text) {
        lower += (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    }
    if (lower == "addition") return InteractionMode::Addition;
    if (lower == "rebuttal") return InteractionMode::Rebuttal;
    if (lower == "debate") return InteractionMode::Debate;
    return std::nullopt;
}

inline bool is_adversarial(InteractionMode m) {
    return m == InteractionMode::Rebuttal || m == InteractionMode::Debate;
}

// ═══════════════════════════════════════════════════════════════════════════
// PersonaVector: one float per persona
// ═══════════════════════════════════════════════════════════════════════════

struct PersonaVector {
    float instinct = 0.0f;
    float logic = 0.0f;
    float psyche = 0.0f;

    float& operator[](Persona p) {
        switch (p) {
            case Persona::Instinct: return instinct;
            case Persona::Logic: return logic;
            case Persona::Psyche: return psyche;
        }
        return logic;
    }

    float operator[](Persona p) const {
        switch (p) {
            case Persona::Instinct: return instinct;
            case Persona::Logic: return logic;
            case Persona::Psyche: return psyche;
        }
        return logic;
    }

    PersonaVector operator+(const PersonaVector& o) const {
        return {instinct + o.instinct, logic + o.logic, psyche + o.psyche};
    }

    PersonaVector operator*(float s) const {
        return {instinct * s, logic * s, psyche * s};
    }

    PersonaVector& operator+=(const PersonaVector& o) {
        instinct += o.instinct;
        logic += o.logic;
        psyche += o.psyche;
        return *this;
    }

    float sum() const { return instinct + logic + psyche; }

    bool operator==(const PersonaVector& o) const {
        return instinct == o.instinct && logic == o.logic && psyche == o.psyche;
    }
    bool operator!=(const PersonaVector& o) const { return !(*this == o); }
};

// ═══════════════════════════════════════════════════════════════════════════
// Messages
// ═══════════════════════════════════════════════════════════════════════════

enum class Role : uint8_t {
    User = 0,
    Persona = 1,
    System = 2,
};

// Random 128-bit id rendered as a UUID string
inline std::string generate_id() {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dis;
    uint64_t high = dis(gen);
    uint64_t low = dis(gen);
    char buf[37];
    snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
             (uint32_t)(high >> 32),
             (uint16_t)(high >> 16),
             (uint16_t)high,
             (uint16_t)(low >> 48),
             (unsigned long long)(low & 0xFFFFFFFFFFFFULL));
    return buf;
}

struct Message {
    std::string id;
    std::string conversation_id;
    Role role = Role::User;
    std::optional<Persona> persona;         // set when role == Persona
    std::string content;
    std::optional<InteractionMode> mode;    // unset for user and primary responses
    std::string references_message_id;      // follow-ons point at what they answer
    Timestamp timestamp = 0;

    static Message from_user(const std::string& conversation_id, std::string text) {
        Message m;
        m.id = generate_id();
        m.conversation_id = conversation_id;
        m.role = Role::User;
        m.content = std::move(text);
        m.timestamp = now();
        return m;
    }

    static Message from_persona(const std::string& conversation_id, Persona p,
                                std::string text,
                                std::optional<InteractionMode> mode = std::nullopt) {
        Message m;
        m.id = generate_id();
        m.conversation_id = conversation_id;
        m.role = Role::Persona;
        m.persona = p;
        m.content = std::move(text);
        m.mode = mode;
        m.timestamp = now();
        return m;
    }

    bool is_user() const { return role == Role::User; }
    bool is_persona() const { return role == Role::Persona && persona.has_value(); }
};

// One persona response within a turn
struct Utterance {
    Persona persona;
    std::string content;
};

// Role string as stored: "user", "system", or the persona name
inline std::string role_string(const Message& m) {
    if (m.is_persona()) return persona_name(*m.persona);
    return m.role == Role::System ? "system" : "user";
}

} // namespace intersect
