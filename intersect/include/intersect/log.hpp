#pragma once
// Log: timestamped, category-tagged lines on stderr
//
// ERROR is always written. Everything else only in verbose mode.
// Format: [HH:MM:SS.mmm][ROUTING] conversation=1a2b3c4d | message

#include <string>

namespace intersect {

enum class LogCategory {
    Routing,        // routing and grounding decisions
    Agent,          // persona responses and debate turns
    Memory,         // weight updates and profile changes
    Conversation,   // conversation lifecycle
    Error,
};

const char* log_category_name(LogCategory category);

void set_verbose(bool verbose);
bool verbose();

// printf-style. conversation_id may be empty.
void log(LogCategory category, const std::string& conversation_id, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

} // namespace intersect
