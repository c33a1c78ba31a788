#include <intersect/log.hpp>
#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace intersect {

namespace {

std::atomic<bool> verbose_mode{false};
std::mutex write_mutex;

}  // anonymous namespace

const char* log_category_name(LogCategory category) {
    switch (category) {
        case LogCategory::Routing: return "ROUTING";
        case LogCategory::Agent: return "AGENT";
        case LogCategory::Memory: return "MEMORY";
        case LogCategory::Conversation: return "CONVERSATION";
        case LogCategory::Error: return "ERROR";
    }
    return "LOG";
}

void set_verbose(bool v) { verbose_mode = v; }

bool verbose() { return verbose_mode; }

void log(LogCategory category, const std::string& conversation_id, const char* fmt, ...) {
    if (category != LogCategory::Error && !verbose_mode) return;

    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&now_time_t, &local);
    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &local);

    // Lines from the worker thread must not interleave with the turn path
    std::lock_guard<std::mutex> lock(write_mutex);
    std::fprintf(stderr, "[%s.%03d][%s] ", time_buf,
                 static_cast<int>(now_ms.count()), log_category_name(category));
    if (!conversation_id.empty()) {
        std::fprintf(stderr, "conversation=%s | ", conversation_id.substr(0, 8).c_str());
    }

    va_list args;
    va_start(args, fmt);
    std::vfprintf(stderr, fmt, args);
    va_end(args);
    std::fputc('\n', stderr);
}

} // namespace intersect
