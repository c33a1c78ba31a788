#pragma once
// Affinity Weights: the persistent preference vector over personas
//
// Invariants: every component in [MIN_WEIGHT, MAX_WEIGHT], components sum to 1.
// apply_delta is the only way to produce new weights from old ones.

#include "types.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace intersect {

constexpr float MIN_WEIGHT = 0.10f;
constexpr float MAX_WEIGHT = 0.60f;

class AffinityWeights {
public:
    // Fresh profiles lean analytical
    AffinityWeights() : v_{0.20f, 0.50f, 0.30f} {}

    static AffinityWeights defaults() { return AffinityWeights(); }

    // Bring stored values back inside the invariants (rows written by
    // other tools, rounding on disk).
    static AffinityWeights from_stored(float instinct, float logic, float psyche) {
        AffinityWeights w;
        w.v_ = project(PersonaVector{instinct, logic, psyche});
        return w;
    }

    float instinct() const { return v_.instinct; }
    float logic() const { return v_.logic; }
    float psyche() const { return v_.psyche; }
    float operator[](Persona p) const { return v_[p]; }
    const PersonaVector& vector() const { return v_; }

    // Scale by variability, add, clamp, normalize.
    AffinityWeights apply_delta(const PersonaVector& raw_delta, float variability) const {
        float scale = std::isfinite(variability) ? std::clamp(variability, 0.0f, 1.0f) : 0.0f;
        PersonaVector next = v_;
        for (Persona p : ALL_PERSONAS) {
            float d = raw_delta[p];
            if (!std::isfinite(d)) d = 0.0f;
            next[p] += d * scale;
        }
        AffinityWeights w;
        w.v_ = project(next);
        return w;
    }

    // Highest weight wins; ties resolve logic, then psyche, then instinct
    Persona dominant() const {
        if (v_.logic >= v_.instinct && v_.logic >= v_.psyche) return Persona::Logic;
        if (v_.psyche >= v_.instinct && v_.psyche >= v_.logic) return Persona::Psyche;
        return Persona::Instinct;
    }

    bool valid() const {
        float s = v_.sum();
        if (std::fabs(s - 1.0f) > 1e-4f) return false;
        for (Persona p : ALL_PERSONAS) {
            if (v_[p] < MIN_WEIGHT - 1e-5f || v_[p] > MAX_WEIGHT + 1e-5f) return false;
        }
        return true;
    }

private:
    PersonaVector v_;

    // Clamp then normalize, repeated on the components that are still free.
    // A single clamp/divide can push a component back over MAX_WEIGHT
    // (0.1, 0.1, 0.6 -> 0.125, 0.125, 0.75), so pinned components are held
    // at their bound and the remaining mass is spread over the rest.
    static PersonaVector project(PersonaVector in) {
        for (Persona p : ALL_PERSONAS) {
            if (!std::isfinite(in[p])) in[p] = 1.0f / PERSONA_COUNT;
            in[p] = std::clamp(in[p], MIN_WEIGHT, MAX_WEIGHT);
        }

        bool pinned[PERSONA_COUNT] = {false, false, false};
        for (size_t round = 0; round < PERSONA_COUNT + 1; ++round) {
            float fixed_mass = 0.0f;
            float free_mass = 0.0f;
            for (Persona p : ALL_PERSONAS) {
                if (pinned[index_of(p)]) fixed_mass += in[p];
                else free_mass += in[p];
            }

            float target = 1.0f - fixed_mass;
            if (free_mass <= 0.0f) break;
            float scale = target / free_mass;

            bool changed = false;
            for (Persona p : ALL_PERSONAS) {
                if (pinned[index_of(p)]) continue;
                float scaled = in[p] * scale;
                if (scaled > MAX_WEIGHT) {
                    in[p] = MAX_WEIGHT;
                    pinned[index_of(p)] = true;
                    changed = true;
                } else if (scaled < MIN_WEIGHT) {
                    in[p] = MIN_WEIGHT;
                    pinned[index_of(p)] = true;
                    changed = true;
                }
            }
            if (!changed) {
                for (Persona p : ALL_PERSONAS) {
                    if (!pinned[index_of(p)]) in[p] *= scale;
                }
                break;
            }
        }

        // Absorb float residue into the largest free-most component
        float residue = 1.0f - in.sum();
        Persona widest = Persona::Logic;
        float room = -1.0f;
        for (Persona p : ALL_PERSONAS) {
            float r = residue >= 0.0f ? MAX_WEIGHT - in[p] : in[p] - MIN_WEIGHT;
            if (r > room) {
                room = r;
                widest = p;
            }
        }
        in[widest] += residue;
        return in;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Weight shift: what changed after a background update
// ═══════════════════════════════════════════════════════════════════════════

enum class ShiftKind {
    Minor,          // small drift, same dominant persona
    Shift,          // notable drift, same dominant persona
    MajorShift,     // dominant persona changed
};

inline const char* shift_kind_name(ShiftKind k) {
    switch (k) {
        case ShiftKind::Minor: return "minor";
        case ShiftKind::Shift: return "shift";
        case ShiftKind::MajorShift: return "major_shift";
    }
    return "minor";
}

struct WeightShift {
    ShiftKind kind = ShiftKind::Minor;
    Persona old_dominant = Persona::Logic;
    Persona new_dominant = Persona::Logic;
    float total_shift = 0.0f;       // L1 distance between old and new
    AffinityWeights before;
    AffinityWeights after;
};

// Returns false when the change is below notice (total shift < min_shift)
inline bool describe_shift(const AffinityWeights& before, const AffinityWeights& after,
                           WeightShift& out, float min_shift = 0.01f,
                           float notable_shift = 0.03f) {
    float total = 0.0f;
    for (Persona p : ALL_PERSONAS) total += std::fabs(after[p] - before[p]);
    if (total < min_shift) return false;

    out.before = before;
    out.after = after;
    out.total_shift = total;
    out.old_dominant = before.dominant();
    out.new_dominant = after.dominant();
    if (out.old_dominant != out.new_dominant) {
        out.kind = ShiftKind::MajorShift;
    } else if (total > notable_shift) {
        out.kind = ShiftKind::Shift;
    } else {
        out.kind = ShiftKind::Minor;
    }
    return true;
}

} // namespace intersect
