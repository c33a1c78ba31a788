#pragma once
// Session Boost: short-term routing momentum, one entry per conversation
//
// Starts at zero, decays by a constant factor at the start of every
// exchange, grows additively when a persona speaks. Added to the
// persistent weights for routing only, never clamped or normalized.
//
// Concurrency: the map is guarded by a shared mutex that is held only to
// find, insert or erase an entry. Each entry carries its own mutex, so
// decay/boost on one conversation never serializes another.

#include "affinity.hpp"
#include "config.hpp"
#include "types.hpp"
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace intersect {

class SessionBoostStore {
public:
    explicit SessionBoostStore(SessionConfig config = {}) : config_(config) {}

    SessionBoostStore(const SessionBoostStore&) = delete;
    SessionBoostStore& operator=(const SessionBoostStore&) = delete;

    // Multiply all components by the decay factor. Unknown id: no-op.
    void decay(const std::string& conversation_id) {
        auto entry = find(conversation_id);
        if (!entry) return;
        std::lock_guard<std::mutex> lock(entry->mutex);
        entry->boost = entry->boost * config_.decay_factor;
    }

    // Add amount to one persona, creating the entry if needed
    void boost(const std::string& conversation_id, Persona persona, float amount) {
        auto entry = find_or_create(conversation_id);
        std::lock_guard<std::mutex> lock(entry->mutex);
        entry->boost[persona] += amount;
    }

    // Current boost; zeros for an unknown conversation
    PersonaVector get(const std::string& conversation_id) const {
        auto entry = find(conversation_id);
        if (!entry) return {};
        std::lock_guard<std::mutex> lock(entry->mutex);
        return entry->boost;
    }

    // persistent + session, for routing only
    PersonaVector combined_weights(const std::string& conversation_id,
                                   const AffinityWeights& persistent) const {
        return persistent.vector() + get(conversation_id);
    }

    // Drop the entry when a conversation is finalized or abandoned
    void clear(const std::string& conversation_id) {
        std::unique_lock lock(map_mutex_);
        entries_.erase(conversation_id);
    }

    bool contains(const std::string& conversation_id) const {
        std::shared_lock lock(map_mutex_);
        return entries_.count(conversation_id) > 0;
    }

    size_t size() const {
        std::shared_lock lock(map_mutex_);
        return entries_.size();
    }

    const SessionConfig& config() const { return config_; }

private:
    struct Entry {
        std::mutex mutex;
        PersonaVector boost;
    };

    // shared_ptr keeps an entry alive for a caller that found it just
    // before a concurrent clear() erased it from the map
    std::shared_ptr<Entry> find(const std::string& conversation_id) const {
        std::shared_lock lock(map_mutex_);
        auto it = entries_.find(conversation_id);
        return it == entries_.end() ? nullptr : it->second;
    }

    std::shared_ptr<Entry> find_or_create(const std::string& conversation_id) {
        if (auto entry = find(conversation_id)) return entry;
        std::unique_lock lock(map_mutex_);
        auto& slot = entries_[conversation_id];
        if (!slot) slot = std::make_shared<Entry>();
        return slot;
    }

    SessionConfig config_;
    mutable std::shared_mutex map_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
};

} // namespace intersect
