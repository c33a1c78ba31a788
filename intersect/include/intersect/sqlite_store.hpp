#pragma once
// SQLite Store: durable profiles and message log in one database file
//
// Tables: user_profile, user_facts, user_patterns, messages.
// Every statement runs under one connection mutex; weight updates run in
// a BEGIN IMMEDIATE transaction so other processes on the same file
// cannot interleave a read-modify-write either.

#include "store.hpp"
#include <mutex>
#include <string>

struct sqlite3;

namespace intersect {

class SqliteStore : public ProfileStore, public MessageStore {
public:
    // Opens (creating if needed) the database and its schema. Throws StoreError.
    explicit SqliteStore(const std::string& path);
    ~SqliteStore() override;

    // Non-copyable, non-movable (owns the connection)
    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;
    SqliteStore(SqliteStore&&) = delete;
    SqliteStore& operator=(SqliteStore&&) = delete;

    // ProfileStore
    UserProfile load_profile(const std::string& user_id) override;
    AffinityWeights update_weights(const std::string& user_id,
                                   const WeightUpdate& update) override;
    uint64_t increment_message_count(const std::string& user_id) override;
    void add_fact(const std::string& user_id, const Fact& fact) override;
    void add_pattern(const std::string& user_id, const Pattern& pattern) override;
    void reset(const std::string& user_id) override;

    // MessageStore
    void append(const Message& message) override;
    std::vector<Message> recent(const std::string& conversation_id, size_t limit) override;

    const std::string& path() const { return path_; }

private:
    void exec(const char* sql);
    void ensure_profile(const std::string& user_id);
    AffinityWeights read_weights(const std::string& user_id, uint64_t& total_messages);
    void write_weights(const std::string& user_id, const AffinityWeights& weights);

    std::string path_;
    sqlite3* db_ = nullptr;
    std::mutex mutex_;
};

} // namespace intersect
