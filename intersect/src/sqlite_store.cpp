#include <intersect/sqlite_store.hpp>
#include <intersect/log.hpp>
#include <sqlite3.h>
#include <string>

namespace intersect {

namespace {

const char* SCHEMA = R"SQL(
CREATE TABLE IF NOT EXISTS user_profile (
    user_id TEXT PRIMARY KEY,
    instinct_weight REAL NOT NULL DEFAULT 0.20,
    logic_weight REAL NOT NULL DEFAULT 0.50,
    psyche_weight REAL NOT NULL DEFAULT 0.30,
    total_messages INTEGER NOT NULL DEFAULT 0,
    created_at INTEGER NOT NULL,
    updated_at INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS user_facts (
    user_id TEXT NOT NULL,
    category TEXT NOT NULL,
    fact_key TEXT NOT NULL,
    value TEXT NOT NULL,
    confidence REAL NOT NULL DEFAULT 0.5,
    updated_at INTEGER NOT NULL,
    PRIMARY KEY (user_id, category, fact_key)
);
CREATE TABLE IF NOT EXISTS user_patterns (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    user_id TEXT NOT NULL,
    pattern_type TEXT NOT NULL,
    description TEXT NOT NULL,
    confidence REAL NOT NULL DEFAULT 0.5,
    created_at INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS messages (
    id TEXT PRIMARY KEY,
    conversation_id TEXT NOT NULL,
    role TEXT NOT NULL,
    content TEXT NOT NULL,
    response_type TEXT,
    references_message_id TEXT,
    timestamp INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_messages_conversation
    ON messages (conversation_id, timestamp);
)SQL";

// Prepared statement owned for one scope
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            throw StoreError(std::string("prepare failed: ") + sqlite3_errmsg(db));
        }
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int idx, const std::string& value) {
        check(sqlite3_bind_text(stmt_, idx, value.c_str(), -1, SQLITE_TRANSIENT));
        return *this;
    }
    Statement& bind(int idx, double value) {
        check(sqlite3_bind_double(stmt_, idx, value));
        return *this;
    }
    Statement& bind(int idx, int64_t value) {
        check(sqlite3_bind_int64(stmt_, idx, value));
        return *this;
    }
    Statement& bind_null(int idx) {
        check(sqlite3_bind_null(stmt_, idx));
        return *this;
    }

    // true while rows remain
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw StoreError(std::string("step failed: ") + sqlite3_errmsg(db_));
    }

    void run() {
        while (step()) {}
    }

    std::string text(int col) const {
        const unsigned char* t = sqlite3_column_text(stmt_, col);
        return t ? reinterpret_cast<const char*>(t) : "";
    }
    bool is_null(int col) const { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }
    double real(int col) const { return sqlite3_column_double(stmt_, col); }
    int64_t integer(int col) const { return sqlite3_column_int64(stmt_, col); }

private:
    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw StoreError(std::string("bind failed: ") + sqlite3_errmsg(db_));
        }
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

Message row_to_message(const Statement& s) {
    Message m;
    m.id = s.text(0);
    m.conversation_id = s.text(1);
    std::string role = s.text(2);
    if (role == "user") {
        m.role = Role::User;
    } else if (auto persona = parse_persona(role)) {
        m.role = Role::Persona;
        m.persona = persona;
    } else {
        m.role = Role::System;
    }
    m.content = s.text(3);
    if (!s.is_null(4)) m.mode = parse_mode(s.text(4));
    if (!s.is_null(5)) m.references_message_id = s.text(5);
    m.timestamp = s.integer(6);
    return m;
}

}  // anonymous namespace

SqliteStore::SqliteStore(const std::string& path) : path_(path) {
    if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw StoreError("Cannot open database " + path + ": " + err);
    }
    sqlite3_busy_timeout(db_, 5000);
    exec("PRAGMA journal_mode=WAL;");
    exec(SCHEMA);
}

SqliteStore::~SqliteStore() {
    if (db_) sqlite3_close(db_);
}

void SqliteStore::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw StoreError("exec failed: " + msg);
    }
}

void SqliteStore::ensure_profile(const std::string& user_id) {
    Timestamp t = now();
    Statement s(db_,
        "INSERT OR IGNORE INTO user_profile (user_id, created_at, updated_at) "
        "VALUES (?1, ?2, ?3)");
    s.bind(1, user_id).bind(2, t).bind(3, t).run();
}

AffinityWeights SqliteStore::read_weights(const std::string& user_id, uint64_t& total_messages) {
    Statement s(db_,
        "SELECT instinct_weight, logic_weight, psyche_weight, total_messages "
        "FROM user_profile WHERE user_id = ?1");
    s.bind(1, user_id);
    if (!s.step()) {
        total_messages = 0;
        return AffinityWeights::defaults();
    }
    total_messages = static_cast<uint64_t>(s.integer(3));
    return AffinityWeights::from_stored(static_cast<float>(s.real(0)),
                                        static_cast<float>(s.real(1)),
                                        static_cast<float>(s.real(2)));
}

void SqliteStore::write_weights(const std::string& user_id, const AffinityWeights& weights) {
    Statement s(db_,
        "UPDATE user_profile SET instinct_weight = ?1, logic_weight = ?2, "
        "psyche_weight = ?3, updated_at = ?4 WHERE user_id = ?5");
    s.bind(1, static_cast<double>(weights.instinct()))
     .bind(2, static_cast<double>(weights.logic()))
     .bind(3, static_cast<double>(weights.psyche()))
     .bind(4, now())
     .bind(5, user_id)
     .run();
}

UserProfile SqliteStore::load_profile(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_profile(user_id);

    UserProfile profile;
    profile.user_id = user_id;
    profile.weights = read_weights(user_id, profile.total_messages);

    Statement facts(db_,
        "SELECT category, fact_key, value, confidence FROM user_facts "
        "WHERE user_id = ?1 ORDER BY confidence DESC, updated_at DESC");
    facts.bind(1, user_id);
    while (facts.step()) {
        profile.summary.facts.push_back({facts.text(0), facts.text(1), facts.text(2),
                                         static_cast<float>(facts.real(3))});
    }

    Statement patterns(db_,
        "SELECT pattern_type, description, confidence FROM user_patterns "
        "WHERE user_id = ?1 ORDER BY confidence DESC, id ASC");
    patterns.bind(1, user_id);
    while (patterns.step()) {
        profile.summary.patterns.push_back({patterns.text(0), patterns.text(1),
                                            static_cast<float>(patterns.real(2))});
    }

    return profile;
}

AffinityWeights SqliteStore::update_weights(const std::string& user_id,
                                            const WeightUpdate& update) {
    std::lock_guard<std::mutex> lock(mutex_);
    exec("BEGIN IMMEDIATE;");
    try {
        ensure_profile(user_id);
        uint64_t total_messages = 0;
        AffinityWeights current = read_weights(user_id, total_messages);
        AffinityWeights next = update(current, total_messages);
        write_weights(user_id, next);
        exec("COMMIT;");
        return next;
    } catch (const std::exception&) {
        char* err = nullptr;
        if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
            log(LogCategory::Error, "", "Rollback failed: %s", err ? err : "unknown");
            sqlite3_free(err);
        }
        throw;
    }
}

uint64_t SqliteStore::increment_message_count(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_profile(user_id);
    Statement(db_,
        "UPDATE user_profile SET total_messages = total_messages + 1, updated_at = ?1 "
        "WHERE user_id = ?2").bind(1, now()).bind(2, user_id).run();

    Statement s(db_, "SELECT total_messages FROM user_profile WHERE user_id = ?1");
    s.bind(1, user_id);
    return s.step() ? static_cast<uint64_t>(s.integer(0)) : 0;
}

void SqliteStore::add_fact(const std::string& user_id, const Fact& fact) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement s(db_,
        "INSERT INTO user_facts (user_id, category, fact_key, value, confidence, updated_at) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6) "
        "ON CONFLICT (user_id, category, fact_key) DO UPDATE SET "
        "value = excluded.value, confidence = excluded.confidence, "
        "updated_at = excluded.updated_at");
    s.bind(1, user_id).bind(2, fact.category).bind(3, fact.key).bind(4, fact.value)
     .bind(5, static_cast<double>(fact.confidence)).bind(6, now()).run();
}

void SqliteStore::add_pattern(const std::string& user_id, const Pattern& pattern) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement s(db_,
        "INSERT INTO user_patterns (user_id, pattern_type, description, confidence, created_at) "
        "VALUES (?1, ?2, ?3, ?4, ?5)");
    s.bind(1, user_id).bind(2, pattern.pattern_type).bind(3, pattern.description)
     .bind(4, static_cast<double>(pattern.confidence)).bind(5, now()).run();
}

void SqliteStore::reset(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    exec("BEGIN IMMEDIATE;");
    try {
        Statement(db_, "DELETE FROM user_facts WHERE user_id = ?1").bind(1, user_id).run();
        Statement(db_, "DELETE FROM user_patterns WHERE user_id = ?1").bind(1, user_id).run();
        Statement(db_, "DELETE FROM user_profile WHERE user_id = ?1").bind(1, user_id).run();
        ensure_profile(user_id);
        exec("COMMIT;");
    } catch (const std::exception&) {
        char* err = nullptr;
        if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
            log(LogCategory::Error, "", "Rollback failed: %s", err ? err : "unknown");
            sqlite3_free(err);
        }
        throw;
    }
    log(LogCategory::Memory, "", "Profile %s reset to defaults", user_id.c_str());
}

void SqliteStore::append(const Message& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement s(db_,
        "INSERT INTO messages (id, conversation_id, role, content, response_type, "
        "references_message_id, timestamp) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7)");
    s.bind(1, message.id).bind(2, message.conversation_id).bind(3, role_string(message))
     .bind(4, message.content);
    if (message.mode) s.bind(5, std::string(mode_name(*message.mode)));
    else s.bind_null(5);
    if (!message.references_message_id.empty()) s.bind(6, message.references_message_id);
    else s.bind_null(6);
    s.bind(7, message.timestamp).run();
}

std::vector<Message> SqliteStore::recent(const std::string& conversation_id, size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement s(db_,
        "SELECT id, conversation_id, role, content, response_type, references_message_id, "
        "timestamp FROM (SELECT *, rowid AS seq FROM messages WHERE conversation_id = ?1 "
        "ORDER BY timestamp DESC, seq DESC LIMIT ?2) ORDER BY timestamp ASC, seq ASC");
    s.bind(1, conversation_id).bind(2, static_cast<int64_t>(limit));

    std::vector<Message> out;
    while (s.step()) {
        out.push_back(row_to_message(s));
    }
    return out;
}

} // namespace intersect
