#pragma once
// Variability: how far one exchange may move a user's identity
//
// Formula: variability = 1 - sqrt(min(total_messages / ceiling, 1))
// Steep early learning, gradual refinement, fully settled at the ceiling.
//   0 messages     -> 1.00
//   100 messages   -> 0.90
//   2500 messages  -> 0.50
//   10000+         -> 0.00

#include "config.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>

namespace intersect {

inline float variability(uint64_t total_messages, const VariabilityConfig& config = {}) {
    if (config.ceiling_messages <= 0.0f) return 0.0f;
    float progress = std::min(static_cast<float>(total_messages) / config.ceiling_messages, 1.0f);
    return 1.0f - std::sqrt(progress);
}

} // namespace intersect
