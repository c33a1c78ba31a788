#pragma once
// Store: the persistence seams of the turn core
//
// ProfileStore keeps one record per user (weights, lifetime message
// count, facts, behavioural patterns). MessageStore is the append-only
// per-conversation log used to rebuild recent history.
//
// update_weights is an atomic read-modify-write: concurrent background
// updates for the same user serialize inside the store.

#include "affinity.hpp"
#include "types.hpp"
#include <algorithm>
#include <cstdint>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace intersect {

struct Fact {
    std::string category;   // personal, work, preferences, relationships, ...
    std::string key;
    std::string value;
    float confidence = 0.5f;
};

struct Pattern {
    std::string pattern_type;   // communication_style, thinking_mode, ...
    std::string description;
    float confidence = 0.5f;
};

// Accumulated user context consulted by grounding
struct ProfileSummary {
    std::vector<Fact> facts;
    std::vector<Pattern> patterns;

    bool empty() const { return facts.empty() && patterns.empty(); }
};

struct UserProfile {
    std::string user_id;
    AffinityWeights weights;
    uint64_t total_messages = 0;
    ProfileSummary summary;
};

// Failure of a durable store (I/O, SQL)
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// (current weights, lifetime message count) -> new weights
using WeightUpdate = std::function<AffinityWeights(const AffinityWeights&, uint64_t)>;

class ProfileStore {
public:
    virtual ~ProfileStore() = default;

    // Creates a default profile on first use
    virtual UserProfile load_profile(const std::string& user_id) = 0;

    // Atomic read-modify-write of the persistent weights. Returns the new weights.
    virtual AffinityWeights update_weights(const std::string& user_id,
                                           const WeightUpdate& update) = 0;

    virtual uint64_t increment_message_count(const std::string& user_id) = 0;

    virtual void add_fact(const std::string& user_id, const Fact& fact) = 0;
    virtual void add_pattern(const std::string& user_id, const Pattern& pattern) = 0;

    // Full reset: default weights, zero messages, no facts or patterns
    virtual void reset(const std::string& user_id) = 0;
};

class MessageStore {
public:
    virtual ~MessageStore() = default;

    virtual void append(const Message& message) = 0;

    // Last `limit` messages of a conversation, oldest first
    virtual std::vector<Message> recent(const std::string& conversation_id,
                                        size_t limit) = 0;
};

// ═══════════════════════════════════════════════════════════════════════════
// In-memory implementations
// ═══════════════════════════════════════════════════════════════════════════

class MemoryProfileStore : public ProfileStore {
public:
    UserProfile load_profile(const std::string& user_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return slot(user_id);
    }

    AffinityWeights update_weights(const std::string& user_id,
                                   const WeightUpdate& update) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& profile = slot(user_id);
        profile.weights = update(profile.weights, profile.total_messages);
        return profile.weights;
    }

    uint64_t increment_message_count(const std::string& user_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return ++slot(user_id).total_messages;
    }

    void add_fact(const std::string& user_id, const Fact& fact) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& facts = slot(user_id).summary.facts;
        auto it = std::find_if(facts.begin(), facts.end(), [&](const Fact& f) {
            return f.category == fact.category && f.key == fact.key;
        });
        if (it != facts.end()) *it = fact;
        else facts.push_back(fact);
    }

    void add_pattern(const std::string& user_id, const Pattern& pattern) override {
        std::lock_guard<std::mutex> lock(mutex_);
        slot(user_id).summary.patterns.push_back(pattern);
    }

    void reset(const std::string& user_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        profiles_.erase(user_id);
    }

    // Test hook: overwrite the lifetime count
    void set_message_count(const std::string& user_id, uint64_t count) {
        std::lock_guard<std::mutex> lock(mutex_);
        slot(user_id).total_messages = count;
    }

private:
    UserProfile& slot(const std::string& user_id) {
        auto it = profiles_.find(user_id);
        if (it == profiles_.end()) {
            UserProfile fresh;
            fresh.user_id = user_id;
            it = profiles_.emplace(user_id, std::move(fresh)).first;
        }
        return it->second;
    }

    std::mutex mutex_;
    std::unordered_map<std::string, UserProfile> profiles_;
};

class MemoryMessageStore : public MessageStore {
public:
    void append(const Message& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        log_[message.conversation_id].push_back(message);
    }

    std::vector<Message> recent(const std::string& conversation_id, size_t limit) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = log_.find(conversation_id);
        if (it == log_.end()) return {};
        const auto& all = it->second;
        size_t start = all.size() > limit ? all.size() - limit : 0;
        return std::vector<Message>(all.begin() + static_cast<std::ptrdiff_t>(start), all.end());
    }

private:
    std::mutex mutex_;
    std::unordered_map<std::string, std::vector<Message>> log_;
};

} // namespace intersect
