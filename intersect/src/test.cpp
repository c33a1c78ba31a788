#include <intersect/intersect.hpp>
#include <intersect/sqlite_store.hpp>
#include <intersect/socket_generator.hpp>
#include <intersect/log.hpp>
#include <nlohmann/json.hpp>
#include <atomic>
#include <iostream>
#include <fstream>
#include <cassert>
#include <cmath>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <limits>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

using namespace intersect;

static bool near(float a, float b, float eps = 1e-4f) {
    return std::fabs(a - b) <= eps;
}

static const std::vector<Persona> ALL = {Persona::Instinct, Persona::Logic, Persona::Psyche};

// Scripted generator: persona replies are numbered, judgments come from
// the configured strings. Thread-safe (the weight worker calls it too).
class StubGenerator : public TextGenerator {
public:
    Generation generate(const GenerationRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(request);
        if (request.purpose == "persona") {
            ++persona_calls_;
            if (persona_calls_ == fail_persona_call) return Generation::failure("stub outage");
            return Generation::success("reply " + std::to_string(persona_calls_));
        }
        if (request.purpose == "intrinsic") return reply(intrinsic_reply);
        if (request.purpose == "engagement") return reply(engagement_reply);
        if (request.purpose == "debate_judgment") return reply(judgment_reply);
        return Generation::failure("unexpected purpose " + request.purpose);
    }

    size_t count(const std::string& purpose) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& r : requests_) {
            if (r.purpose == purpose) ++n;
        }
        return n;
    }

    std::vector<GenerationRequest> requests(const std::string& purpose) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<GenerationRequest> out;
        for (const auto& r : requests_) {
            if (r.purpose == purpose) out.push_back(r);
        }
        return out;
    }

    int fail_persona_call = 0;      // 1-based; 0 = never fail
    std::string intrinsic_reply =
        R"({"instinct_signal": 0.33, "logic_signal": 0.33, "psyche_signal": 0.33})";
    std::string engagement_reply =
        R"({"instinct_score": 0.0, "logic_score": 0.0, "psyche_score": 0.0})";
    std::string judgment_reply = R"({"continue": false, "next_agent": null, "type": null})";

private:
    static Generation reply(const std::string& text) {
        if (text.empty()) return Generation::failure("stub: no reply configured");
        return Generation::success(text);
    }

    std::mutex mutex_;
    std::vector<GenerationRequest> requests_;
    int persona_calls_ = 0;
};

// Always wants more: hands the floor back to whoever spoke before the last speaker
class AlwaysContinueJudge : public DebateJudge {
public:
    std::optional<ContinueDecision> judge(const DebateContext& context) override {
        ++calls;
        ContinueDecision d;
        d.should_continue = true;
        d.next_persona = context.transcript[context.transcript.size() - 2].persona;
        d.mode = InteractionMode::Rebuttal;
        return d;
    }
    int calls = 0;
};

class ScriptedJudge : public DebateJudge {
public:
    explicit ScriptedJudge(std::optional<ContinueDecision> answer) : answer_(answer) {}
    std::optional<ContinueDecision> judge(const DebateContext&) override {
        ++calls;
        return answer_;
    }
    int calls = 0;

private:
    std::optional<ContinueDecision> answer_;
};

class FailingProfileStore : public MemoryProfileStore {
public:
    AffinityWeights update_weights(const std::string&, const WeightUpdate&) override {
        throw StoreError("disk full");
    }
};

// Local generation daemon with a fixed script: each request line, on
// whatever connection it arrives, consumes the next action.
class CannedDaemon {
public:
    enum class Action { Reply, ReplyThenClose, Close, Silent };
    struct Step {
        Action action;
        std::string line;
    };

    CannedDaemon(const std::string& path, std::vector<Step> script)
        : path_(path), script_(std::move(script)) {
        unlink(path_.c_str());
        listen_fd_ = socket(AF_UNIX, SOCK_STREAM, 0);
        assert(listen_fd_ >= 0);
        struct sockaddr_un addr;
        memset(&addr, 0, sizeof(addr));
        addr.sun_family = AF_UNIX;
        strncpy(addr.sun_path, path_.c_str(), sizeof(addr.sun_path) - 1);
        int rc = bind(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
        assert(rc == 0);
        rc = listen(listen_fd_, 4);
        assert(rc == 0);
        (void)rc;
        thread_ = std::thread([this] { serve(); });
    }

    ~CannedDaemon() {
        shutdown(listen_fd_, SHUT_RDWR);
        close(listen_fd_);
        if (thread_.joinable()) thread_.join();
        unlink(path_.c_str());
    }

    void join() {
        if (thread_.joinable()) thread_.join();
    }

    std::vector<std::string> received() {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_;
    }

    // Connections the daemon has closed so far
    int closed() const { return closed_.load(); }

private:
    static std::optional<std::string> read_request(int fd, std::string& buffer) {
        while (true) {
            size_t pos = buffer.find('\n');
            if (pos != std::string::npos) {
                std::string line = buffer.substr(0, pos);
                buffer.erase(0, pos + 1);
                return line;
            }
            char buf[4096];
            ssize_t n = read(fd, buf, sizeof(buf));
            if (n <= 0) return std::nullopt;
            buffer.append(buf, static_cast<size_t>(n));
        }
    }

    static void send_line(int fd, const std::string& line) {
        std::string msg = line + "\n";
        size_t sent = 0;
        while (sent < msg.size()) {
            ssize_t n = send(fd, msg.data() + sent, msg.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) return;
            sent += static_cast<size_t>(n);
        }
    }

    void serve() {
        size_t next = 0;
        while (next < script_.size()) {
            int conn = accept(listen_fd_, nullptr, nullptr);
            if (conn < 0) return;

            std::string buffer;
            bool open = true;
            while (open && next < script_.size()) {
                auto line = read_request(conn, buffer);
                if (!line) break;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    received_.push_back(*line);
                }
                const Step& step = script_[next++];
                switch (step.action) {
                    case Action::Reply:
                        send_line(conn, step.line);
                        break;
                    case Action::ReplyThenClose:
                        send_line(conn, step.line);
                        open = false;
                        break;
                    case Action::Close:
                        open = false;
                        break;
                    case Action::Silent:
                        // Hold the request until the client gives up
                        while (read_request(conn, buffer)) {}
                        open = false;
                        break;
                }
            }
            close(conn);
            ++closed_;
        }
    }

    std::string path_;
    std::vector<Step> script_;
    int listen_fd_ = -1;
    std::thread thread_;
    std::mutex mutex_;
    std::vector<std::string> received_;
    std::atomic<int> closed_{0};
};

static Message persona_msg(const std::string& conv, Persona p, const std::string& text = "ok") {
    return Message::from_persona(conv, p, text);
}

static ProfileSummary rich_profile(size_t facts = 3, size_t patterns = 2) {
    ProfileSummary s;
    for (size_t i = 0; i < facts; ++i) {
        s.facts.push_back({"work", "fact_" + std::to_string(i), "value " + std::to_string(i), 0.8f});
    }
    for (size_t i = 0; i < patterns; ++i) {
        s.patterns.push_back({"pattern_" + std::to_string(i), "description", 0.7f});
    }
    return s;
}

// ═══════════════════════════════════════════════════════════════════════════
// Types, variability, weights
// ═══════════════════════════════════════════════════════════════════════════

void test_persona_parsing() {
    std::cout << "Testing persona parsing..." << std::endl;

    assert(parse_persona("logic") == Persona::Logic);
    assert(parse_persona("  \"Logic\"\n") == Persona::Logic);
    assert(parse_persona("PUFF") == Persona::Psyche);
    assert(parse_persona("snap") == Persona::Instinct);
    assert(!parse_persona("gremlin"));
    assert(!parse_persona(""));

    assert(parse_mode("Rebuttal") == InteractionMode::Rebuttal);
    assert(!parse_mode("shouting"));
    assert(is_adversarial(InteractionMode::Debate));
    assert(!is_adversarial(InteractionMode::Addition));

    std::cout << "  PASS" << std::endl;
}

void test_variability_bounds() {
    std::cout << "Testing variability bounds..." << std::endl;

    assert(variability(0) == 1.0f);
    assert(variability(10000) == 0.0f);
    assert(variability(50000) == 0.0f);

    float previous = variability(0);
    for (uint64_t n = 1; n <= 12000; n += 7) {
        float v = variability(n);
        assert(v <= previous);
        assert(v >= 0.0f && v <= 1.0f);
        previous = v;
    }

    VariabilityConfig fast;
    fast.ceiling_messages = 100.0f;
    assert(variability(100, fast) == 0.0f);
    assert(near(variability(25, fast), 0.5f));

    std::cout << "  PASS" << std::endl;
}

void test_affinity_defaults() {
    std::cout << "Testing affinity defaults..." << std::endl;

    AffinityWeights w;
    assert(near(w.instinct(), 0.20f));
    assert(near(w.logic(), 0.50f));
    assert(near(w.psyche(), 0.30f));
    assert(w.valid());
    assert(w.dominant() == Persona::Logic);

    // Clamp then re-normalize must not push a component back over the cap
    auto pinned = AffinityWeights::from_stored(0.1f, 0.1f, 0.6f);
    assert(pinned.valid());
    assert(near(pinned.instinct(), 0.2f));
    assert(near(pinned.logic(), 0.2f));
    assert(near(pinned.psyche(), 0.6f));

    auto heavy = AffinityWeights::from_stored(0.6f, 0.6f, 0.1f);
    assert(heavy.valid());
    assert(near(heavy.instinct(), 0.45f));
    assert(near(heavy.psyche(), 0.1f));

    std::cout << "  PASS" << std::endl;
}

void test_apply_delta_invariants() {
    std::cout << "Testing apply_delta invariants..." << std::endl;

    std::mt19937 rng(42);
    std::uniform_real_distribution<float> start(0.0f, 1.0f);
    std::uniform_real_distribution<float> delta(-2.0f, 2.0f);
    std::uniform_real_distribution<float> var(0.0f, 1.0f);

    for (int trial = 0; trial < 200; ++trial) {
        AffinityWeights w = AffinityWeights::from_stored(start(rng), start(rng), start(rng));
        assert(w.valid());
        for (int step = 0; step < 50; ++step) {
            PersonaVector d{delta(rng), delta(rng), delta(rng)};
            w = w.apply_delta(d, var(rng));
            assert(w.valid());
        }
    }

    // Small deltas at full variability
    AffinityWeights w;
    for (int i = 0; i < 1000; ++i) {
        w = w.apply_delta({0.0f, 0.0f, 0.01f}, 1.0f);
        assert(w.valid());
    }
    assert(near(w.psyche(), MAX_WEIGHT));

    // Garbage in, invariants out
    float nan = std::numeric_limits<float>::quiet_NaN();
    float inf = std::numeric_limits<float>::infinity();
    AffinityWeights g = AffinityWeights().apply_delta({nan, inf, -inf}, 1.0f);
    assert(g.valid());
    assert(AffinityWeights().apply_delta({0.5f, 0.0f, 0.0f}, nan).valid());

    // Rigid profile does not move
    AffinityWeights rigid = AffinityWeights().apply_delta({1.0f, -1.0f, 0.0f}, 0.0f);
    assert(near(rigid.instinct(), 0.20f));
    assert(near(rigid.logic(), 0.50f));

    std::cout << "  PASS" << std::endl;
}

void test_weight_shift() {
    std::cout << "Testing weight shift classification..." << std::endl;

    AffinityWeights before;
    WeightShift shift;

    assert(!describe_shift(before, before, shift));

    auto swapped = AffinityWeights::from_stored(0.5f, 0.2f, 0.3f);
    assert(describe_shift(before, swapped, shift));
    assert(shift.kind == ShiftKind::MajorShift);
    assert(shift.old_dominant == Persona::Logic);
    assert(shift.new_dominant == Persona::Instinct);

    auto drift = AffinityWeights::from_stored(0.18f, 0.50f, 0.32f);
    assert(describe_shift(before, drift, shift));
    assert(shift.kind == ShiftKind::Shift);

    auto nudge = AffinityWeights::from_stored(0.19f, 0.50f, 0.31f);
    assert(describe_shift(before, nudge, shift));
    assert(shift.kind == ShiftKind::Minor);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Session boost
// ═══════════════════════════════════════════════════════════════════════════

void test_session_decay() {
    std::cout << "Testing session boost decay..." << std::endl;

    SessionBoostStore sessions;
    sessions.decay("missing");
    assert(!sessions.contains("missing"));

    sessions.boost("c", Persona::Logic, 0.5f);
    sessions.boost("c", Persona::Psyche, 0.02f);
    PersonaVector prev = sessions.get("c");
    for (int i = 0; i < 40; ++i) {
        sessions.decay("c");
        PersonaVector cur = sessions.get("c");
        assert(cur.logic < prev.logic && cur.logic > 0.0f);
        assert(cur.psyche < prev.psyche && cur.psyche > 0.0f);
        assert(cur.instinct == 0.0f);
        prev = cur;
    }

    AffinityWeights w;
    PersonaVector combined = sessions.combined_weights("c", w);
    assert(near(combined.logic, w.logic() + prev.logic));

    sessions.clear("c");
    assert(!sessions.contains("c"));
    assert(sessions.get("c") == PersonaVector{});

    std::cout << "  PASS" << std::endl;
}

void test_session_concurrency() {
    std::cout << "Testing session boost concurrency..." << std::endl;

    SessionBoostStore sessions;
    std::vector<std::thread> threads;

    // Separate conversations
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&sessions, t]() {
            std::string conv = "conv-" + std::to_string(t);
            for (int i = 0; i < 1000; ++i) sessions.boost(conv, Persona::Instinct, 1.0f);
        });
    }
    // One shared conversation
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&sessions]() {
            for (int i = 0; i < 1000; ++i) sessions.boost("shared", Persona::Psyche, 1.0f);
        });
    }
    // Churn on an unrelated id
    threads.emplace_back([&sessions]() {
        for (int i = 0; i < 1000; ++i) {
            sessions.boost("churn", Persona::Logic, 1.0f);
            sessions.decay("churn");
            sessions.clear("churn");
        }
    });
    for (auto& th : threads) th.join();

    for (int t = 0; t < 8; ++t) {
        PersonaVector v = sessions.get("conv-" + std::to_string(t));
        assert(v.instinct == 1000.0f);
        assert(v.logic == 0.0f && v.psyche == 0.0f);
    }
    assert(sessions.get("shared").psyche == 4000.0f);
    assert(!sessions.contains("churn"));
    assert(sessions.size() == 9);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Routing
// ═══════════════════════════════════════════════════════════════════════════

void test_router_step_by_step() {
    std::cout << "Testing router on an analytical request..." << std::endl;

    HeuristicRouter router;
    AffinityWeights w;
    auto d = router.route("walk me through the pros and cons step by step",
                          w.vector(), ALL, {}, false);
    assert(d);
    assert(d->primary == Persona::Logic);
    assert(!d->secondary);
    assert(!d->fan_out);
    assert(!d->forced_by_silence);

    std::cout << "  PASS" << std::endl;
}

void test_router_challenge_mode() {
    std::cout << "Testing router challenge mode..." << std::endl;

    HeuristicRouter router;
    AffinityWeights w;
    const char* messages[] = {
        "walk me through the pros and cons step by step",
        "ok",
        "why do I keep doing this",
        "just tell me what to do right now",
    };
    for (const char* m : messages) {
        auto d = router.route(m, w.vector(), ALL, {}, true);
        assert(d);
        assert(d->secondary);
        assert(d->secondary->persona != d->primary);
        assert(d->secondary->mode == InteractionMode::Rebuttal);
    }

    // Inversion: the habitually quiet persona leads on a neutral message
    auto d = router.route("ok", w.vector(), ALL, {}, true);
    assert(d->primary == Persona::Instinct);

    std::cout << "  PASS" << std::endl;
}

void test_router_determinism() {
    std::cout << "Testing router determinism..." << std::endl;

    HeuristicRouter router;
    PersonaVector weights{0.31f, 0.33f, 0.36f};
    std::vector<Message> history = {
        Message::from_user("c", "hello"),
        persona_msg("c", Persona::Logic),
        Message::from_user("c", "and then?"),
        persona_msg("c", Persona::Psyche),
    };

    auto a = router.route("I feel stuck, why?", weights, ALL, history, false);
    auto b = router.route("I feel stuck, why?", weights, ALL, history, false);
    assert(a && b);
    assert(*a == *b);

    auto c = router.route("I feel stuck, why?", weights, ALL, history, true);
    auto e = router.route("I feel stuck, why?", weights, ALL, history, true);
    assert(*c == *e);

    std::cout << "  PASS" << std::endl;
}

void test_router_edges() {
    std::cout << "Testing router edge cases..." << std::endl;

    HeuristicRouter router;
    AffinityWeights w;

    assert(!router.route("hi", w.vector(), {}, {}, false));

    auto solo = router.route("hear from all of you", w.vector(), {Persona::Psyche}, {}, true);
    assert(solo && solo->primary == Persona::Psyche && !solo->secondary && !solo->fan_out);

    auto fan = router.route("I want to hear from all of you on this", w.vector(),
                            {Persona::Psyche, Persona::Logic, Persona::Instinct}, {}, false);
    assert(fan && fan->fan_out);
    assert(fan->primary == Persona::Psyche);

    // Fan-out needs every persona enabled
    auto pair = router.route("I want to hear from all of you", w.vector(),
                             {Persona::Logic, Persona::Psyche}, {}, false);
    assert(pair && !pair->fan_out);

    // Duplicates do not count as extra personas
    auto dup = router.route("hi", w.vector(), {Persona::Logic, Persona::Logic}, {}, true);
    assert(dup && dup->primary == Persona::Logic && !dup->secondary);

    // Close call adds an Addition secondary
    auto close = router.route("hmm", PersonaVector{0.2f, 0.41f, 0.39f}, ALL, {}, false);
    assert(close && close->secondary);
    assert(close->secondary->persona == Persona::Psyche);
    assert(close->secondary->mode == InteractionMode::Addition);

    std::cout << "  PASS" << std::endl;
}

void test_silence_fairness() {
    std::cout << "Testing silence fairness..." << std::endl;

    HeuristicRouter router;
    // Four user turns; logic and instinct alternate, psyche never speaks
    std::vector<Message> history = {
        Message::from_user("c", "first"),
        persona_msg("c", Persona::Logic),
        Message::from_user("c", "second"),
        persona_msg("c", Persona::Instinct),
        Message::from_user("c", "third"),
        persona_msg("c", Persona::Logic),
        Message::from_user("c", "fourth"),
        persona_msg("c", Persona::Instinct),
    };

    auto silence = router.silence_counts(history);
    assert(silence[index_of(Persona::Instinct)] == 0);
    assert(silence[index_of(Persona::Logic)] == 1);
    assert(silence[index_of(Persona::Psyche)] == 4);

    // Turn five: psyche carries the lowest weight and no keyword
    PersonaVector weights{0.30f, 0.60f, 0.10f};
    auto d = router.route("ok sounds good", weights, ALL, history, false);
    assert(d);
    assert(d->includes(Persona::Psyche));
    assert(d->primary == Persona::Logic);
    assert(d->secondary && d->secondary->persona == Persona::Psyche);
    assert(d->forced_by_silence);

    // Lookback is bounded
    std::vector<Message> long_history;
    for (int i = 0; i < 12; ++i) {
        long_history.push_back(Message::from_user("c", "turn"));
        long_history.push_back(persona_msg("c", Persona::Logic));
    }
    auto s2 = router.silence_counts(long_history);
    assert(s2[index_of(Persona::Psyche)] == router.config().silence_lookback);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Grounding
// ═══════════════════════════════════════════════════════════════════════════

void test_grounding_first_turn() {
    std::cout << "Testing grounding on the first turn..." << std::endl;

    GroundingClassifier classifier;
    ProfileSummary profile = rich_profile(6, 4);
    std::string deep_message =
        "why do I always end up here? what does this mean? I have been thinking about it "
        "for weeks and honestly I am struggling with the pattern";

    auto g = classifier.classify(deep_message, {}, &profile);
    assert(g.level == GroundingLevel::Light);
    assert(g.relevant_fact_keys.empty());
    assert(g.relevant_pattern_types.empty());
    assert(!g.include_past_context);

    // Persona chatter alone does not make a returning user
    std::vector<Message> greeting = {persona_msg("c", Persona::Psyche, "welcome")};
    assert(classifier.classify(deep_message, greeting, &profile).level == GroundingLevel::Light);

    std::cout << "  PASS" << std::endl;
}

void test_grounding_levels() {
    std::cout << "Testing grounding levels..." << std::endl;

    GroundingClassifier classifier;
    std::vector<Message> history = {
        Message::from_user("c", "hi"),
        persona_msg("c", Persona::Logic, "hello"),
    };
    ProfileSummary rich = rich_profile(7, 3);
    ProfileSummary empty;

    auto deep = classifier.classify("why do i keep avoiding this?", history, &rich);
    assert(deep.level == GroundingLevel::Deep);
    assert(deep.relevant_fact_keys.size() == 7);
    assert(deep.relevant_pattern_types.size() == 3);
    assert(deep.include_past_context);

    // Complex message, thin profile
    auto thin = classifier.classify("why do i keep avoiding this?", history, &empty);
    assert(thin.level == GroundingLevel::Light);

    auto moderate = classifier.classify("thanks", history, &rich);
    assert(moderate.level == GroundingLevel::Moderate);
    assert(moderate.relevant_fact_keys.size() == 5);
    assert(moderate.relevant_pattern_types.size() == 2);
    assert(!moderate.include_past_context);

    std::string long_message;
    for (int i = 0; i < 35; ++i) long_message += "word ";
    auto wordy = classifier.classify(long_message, history, &empty);
    assert(wordy.level == GroundingLevel::Moderate);
    assert(wordy.relevant_fact_keys.empty());

    assert(classifier.classify("thanks", history, &empty).level == GroundingLevel::Light);
    assert(classifier.classify("thanks", history, nullptr).level == GroundingLevel::Light);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Judgments and traits
// ═══════════════════════════════════════════════════════════════════════════

void test_judgment_parsing() {
    std::cout << "Testing judgment parsing..." << std::endl;

    auto fenced = parse_continue_decision(
        "```json\n{\"continue\": true, \"next_agent\": \"Puff\", \"type\": \"debate\", "
        "\"reason\": \"disagrees\"}\n```");
    assert(fenced);
    assert(fenced->should_continue);
    assert(fenced->next_persona == Persona::Psyche);
    assert(fenced->mode == InteractionMode::Debate);
    assert(fenced->reason == "disagrees");

    auto prose = parse_continue_decision("Sure! {\"continue\": false} Hope that helps.");
    assert(prose && !prose->should_continue && !prose->next_persona);

    auto unknown = parse_continue_decision("{\"continue\": true, \"next_agent\": \"gremlin\"}");
    assert(unknown && unknown->should_continue && !unknown->next_persona);

    assert(!parse_continue_decision("no json here"));
    assert(!parse_continue_decision("{\"continue\": \"maybe\"}"));
    assert(!parse_continue_decision("{\"continue\": tru"));

    auto intrinsic = parse_intrinsic(
        "{\"logic_signal\": 1.7, \"instinct_signal\": -0.2, \"reasoning\": \"lists\"}");
    assert(intrinsic);
    assert(intrinsic->scores.logic == 1.0f);
    assert(intrinsic->scores.instinct == 0.0f);
    assert(near(intrinsic->scores.psyche, 0.33f));
    assert(!parse_intrinsic("{\"logic_signal\": \"high\"}"));

    auto engagement = parse_engagement("{\"psyche_score\": 0.5, \"logic_score\": -3}");
    assert(engagement);
    assert(engagement->scores.psyche == 0.5f);
    assert(engagement->scores.logic == -1.0f);
    assert(engagement->scores.instinct == 0.0f);
    assert(!parse_engagement(""));

    std::cout << "  PASS" << std::endl;
}

void test_trait_combiner() {
    std::cout << "Testing trait combination..." << std::endl;

    TraitAnalysisCombiner combiner;

    PersonaVector none = combiner.delta(std::nullopt, std::nullopt, false);
    assert(none == PersonaVector{});

    PersonaVector neutral = combiner.delta(IntrinsicSignal::neutral(), std::nullopt, false);
    assert(near(neutral.sum(), 0.0f, 1e-6f));

    IntrinsicSignal analytical;
    analytical.scores = {0.33f, 1.0f, 0.33f};
    PersonaVector d = combiner.delta(analytical, std::nullopt, false);
    assert(near(d.logic, 0.67f * 0.015f, 1e-6f));
    assert(near(d.instinct, 0.0f, 1e-6f));

    EngagementSignal engaged;
    engaged.scores = {0.0f, 0.0f, 1.0f};
    assert(near(combiner.delta(std::nullopt, engaged, false).psyche, 0.03f, 1e-6f));
    assert(near(combiner.delta(std::nullopt, engaged, true).psyche, 0.015f, 1e-6f));

    // Lifetime count scales the effect
    AffinityWeights w;
    PersonaVector push{0.0f, 0.0f, 0.05f};
    AffinityWeights young = combiner.apply(w, push, 0);
    AffinityWeights old = combiner.apply(w, push, 10000);
    assert(young.psyche() > w.psyche());
    assert(near(old.psyche(), w.psyche()));

    std::cout << "  PASS" << std::endl;
}

void test_trait_analyzer() {
    std::cout << "Testing trait analyzer fallbacks..." << std::endl;

    StubGenerator gen;
    TraitAnalyzer analyzer(gen);

    // Too short to judge: neutral without a request
    auto short_signal = analyzer.intrinsic("ok");
    assert(short_signal && near(short_signal->scores.logic, 0.33f));
    assert(gen.count("intrinsic") == 0);

    gen.intrinsic_reply = "```json\n{\"logic_signal\": 0.9, \"instinct_signal\": 0.1, "
                          "\"psyche_signal\": 0.2}\n```";
    auto parsed = analyzer.intrinsic("let me compare the two offers carefully");
    assert(parsed && near(parsed->scores.logic, 0.9f));

    gen.intrinsic_reply = "I would say mostly logical";
    assert(!analyzer.intrinsic("let me compare the two offers carefully"));
    gen.intrinsic_reply = "";
    assert(!analyzer.intrinsic("let me compare the two offers carefully"));

    // Nothing to engage with: no request at all
    assert(!analyzer.engagement("sure", {}));
    assert(gen.count("engagement") == 0);

    gen.engagement_reply = "{\"logic_score\": 0.8}";
    auto e = analyzer.engagement("good point about the budget",
                                 {{Persona::Logic, "Check the budget first."}});
    assert(e && near(e->scores.logic, 0.8f));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Debate
// ═══════════════════════════════════════════════════════════════════════════

void test_debate_cap() {
    std::cout << "Testing debate response cap..." << std::endl;

    AlwaysContinueJudge judge;
    DebateContinuation debate(DebateConfig{}, ALL, "should I quit?", true);
    assert(debate.state() == DebateState::Idle);
    assert(debate.begin({Persona::Logic, "stay"}, {Persona::Instinct, "go"},
                        InteractionMode::Rebuttal));
    assert(debate.state() == DebateState::AwaitingJudgment);

    int guard = 0;
    while (debate.state() == DebateState::AwaitingJudgment && guard++ < 100) {
        auto next = debate.next(judge);
        if (!next) break;
        assert(debate.state() == DebateState::Continuing);
        debate.record({next->persona, "again"});
    }

    assert(debate.response_count() == 4);
    assert(debate.state() == DebateState::Terminated);
    assert(debate.at_cap());
    assert(judge.calls == 2);
    assert(!debate.next(judge));
    assert(judge.calls == 2);

    // A persona may speak twice in one turn
    assert(debate.context().speak_counts[index_of(Persona::Logic)] == 2);
    assert(debate.context().speak_counts[index_of(Persona::Instinct)] == 2);

    std::cout << "  PASS" << std::endl;
}

void test_debate_termination() {
    std::cout << "Testing debate termination..." << std::endl;

    Utterance a{Persona::Logic, "a"};
    Utterance b{Persona::Psyche, "b"};

    // Additions never start a debate
    DebateContinuation addition(DebateConfig{}, ALL, "m", false);
    assert(!addition.begin(a, b, InteractionMode::Addition));
    assert(addition.state() == DebateState::Terminated);

    ContinueDecision stop;
    stop.should_continue = false;
    ScriptedJudge stop_judge(stop);
    DebateContinuation stopped(DebateConfig{}, ALL, "m", false);
    assert(stopped.begin(a, b, InteractionMode::Rebuttal));
    assert(!stopped.next(stop_judge));
    assert(stopped.state() == DebateState::Terminated);
    assert(stopped.response_count() == 2);

    // Continue, but the chosen persona is not enabled
    ContinueDecision outsider;
    outsider.should_continue = true;
    outsider.next_persona = Persona::Instinct;
    ScriptedJudge outsider_judge(outsider);
    DebateContinuation limited(DebateConfig{}, {Persona::Logic, Persona::Psyche}, "m", false);
    assert(limited.begin(a, b, InteractionMode::Debate));
    assert(!limited.next(outsider_judge));
    assert(limited.state() == DebateState::Terminated);

    // Continue with no persona
    ContinueDecision nobody;
    nobody.should_continue = true;
    ScriptedJudge nobody_judge(nobody);
    DebateContinuation vague(DebateConfig{}, ALL, "m", false);
    vague.begin(a, b, InteractionMode::Rebuttal);
    assert(!vague.next(nobody_judge));

    // Judgment unavailable: fail closed
    ScriptedJudge broken(std::nullopt);
    DebateContinuation failing(DebateConfig{}, ALL, "m", false);
    failing.begin(a, b, InteractionMode::Rebuttal);
    assert(!failing.next(broken));
    assert(failing.state() == DebateState::Terminated);
    assert(broken.calls == 1);

    // Mode defaults when the judge names none
    ContinueDecision modeless;
    modeless.should_continue = true;
    modeless.next_persona = Persona::Logic;
    ScriptedJudge modeless_judge(modeless);
    DebateContinuation defaulted(DebateConfig{}, ALL, "m", false);
    defaulted.begin(a, b, InteractionMode::Rebuttal);
    auto next = defaulted.next(modeless_judge);
    assert(next && next->mode == InteractionMode::Rebuttal);
    defaulted.abort();
    assert(defaulted.state() == DebateState::Terminated);

    std::cout << "  PASS" << std::endl;
}

void test_generator_debate_judge() {
    std::cout << "Testing generator-backed debate judge..." << std::endl;

    StubGenerator gen;
    GeneratorDebateJudge judge(gen);

    DebateContext context;
    context.user_message = "should I move?";
    context.enabled = ALL;
    context.transcript = {{Persona::Logic, "list costs"}, {Persona::Instinct, "just go"}};
    context.speak_counts = {1, 1, 0};

    std::string prompt = judge.prompt(context);
    assert(prompt.find("should I move?") != std::string::npos);
    assert(prompt.find("haven't spoken: psyche") != std::string::npos);
    assert(prompt.find("just go") != std::string::npos);

    gen.judgment_reply = "```json\n{\"continue\": true, \"next_agent\": \"psyche\", "
                         "\"type\": \"addition\"}\n```";
    auto d = judge.judge(context);
    assert(d && d->should_continue && d->next_persona == Persona::Psyche);
    assert(d->mode == InteractionMode::Addition);

    gen.judgment_reply = "I think they should keep going";
    assert(!judge.judge(context));
    gen.judgment_reply = "";
    assert(!judge.judge(context));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Voice
// ═══════════════════════════════════════════════════════════════════════════

void test_voice_request() {
    std::cout << "Testing persona voice requests..." << std::endl;

    PersonaVoice voice;
    std::vector<Message> history;
    for (int i = 0; i < 10; ++i) {
        history.push_back(Message::from_user("c", "u" + std::to_string(i)));
        history.push_back(persona_msg("c", Persona::Logic, "a" + std::to_string(i)));
    }
    ProfileSummary profile = rich_profile(3, 2);
    GroundingDecision light;
    std::string question = "what now?";
    VoiceContext light_ctx{question, history, light, &profile};

    auto primary = voice.request(Persona::Instinct, light_ctx);
    assert(near(primary.temperature, 0.8f));
    assert(primary.max_tokens && *primary.max_tokens == 300);
    assert(primary.purpose == "persona");
    assert(primary.messages.size() == 16);
    assert(primary.messages.front().content == "a2");
    assert(primary.messages.back().role == "user");
    assert(primary.messages.back().content == "what now?");
    assert(primary.system.find("value 0") == std::string::npos);

    Utterance previous{Persona::Logic, "make a list"};
    auto follow = voice.request(Persona::Psyche, light_ctx, InteractionMode::Rebuttal, &previous);
    assert(near(follow.temperature, 0.6f));
    assert(follow.messages.size() == 18);
    assert(follow.messages[16].role == "assistant");
    assert(follow.messages[16].content == "make a list");
    assert(follow.messages[17].content.find("Dot (Logic) just responded") == 0);
    assert(follow.system.find("You see it differently than Dot") != std::string::npos);

    GroundingDecision deep;
    deep.level = GroundingLevel::Deep;
    deep.relevant_fact_keys = {"fact_1"};
    deep.relevant_pattern_types = {"pattern_0"};
    deep.include_past_context = true;
    std::string why = "why?";
    VoiceContext deep_ctx{why, history, deep, &profile};
    auto grounded = voice.request(Persona::Logic, deep_ctx);
    assert(near(grounded.temperature, 0.4f));
    assert(grounded.system.find("fact_1: value 1") != std::string::npos);
    assert(grounded.system.find("fact_0") == std::string::npos);
    assert(grounded.system.find("pattern_0: description") != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Turn service
// ═══════════════════════════════════════════════════════════════════════════

// Everything a TurnService needs, in construction order
struct Harness {
    MemoryProfileStore profiles;
    MemoryMessageStore messages;
    StubGenerator generator;
    SessionBoostStore sessions;
    TraitAnalyzer analyzer{generator};
    WeightUpdateQueue updates{profiles, analyzer};
};

void test_turn_basic() {
    std::cout << "Testing handle_turn..." << std::endl;

    Harness h;
    h.updates.start();
    TurnService service("alice", Config{}, h.profiles, h.messages, h.generator,
                        h.sessions, h.updates);

    TurnResult r = service.handle_turn("c1", "walk me through the pros and cons step by step",
                                       ALL, false);
    assert(r.ok());
    assert(!r.error);
    assert(r.responses.size() == 1);
    assert(r.responses[0].persona == Persona::Logic);
    assert(!r.responses[0].mode);
    assert(r.responses[0].kind() == "primary");
    assert(r.responses[0].content == "reply 1");
    assert(!r.continuation_mode);
    assert(r.grounding == GroundingLevel::Light);

    assert(near(h.sessions.get("c1").logic, 0.02f, 1e-6f));

    auto stored = h.messages.recent("c1", 10);
    assert(stored.size() == 2);
    assert(stored[0].is_user());
    assert(stored[1].is_persona() && *stored[1].persona == Persona::Logic);
    assert(stored[1].references_message_id == stored[0].id);

    assert(h.profiles.load_profile("alice").total_messages == 1);

    // Second turn decays first, then boosts
    r = service.handle_turn("c1", "and what about the costs involved here", ALL, false);
    assert(r.ok());
    h.updates.wait_idle();
    assert(h.updates.processed() == 2);
    assert(h.generator.count("engagement") == 1);
    assert(h.profiles.load_profile("alice").total_messages == 2);

    service.finalize_conversation("c1");
    assert(!h.sessions.contains("c1"));

    h.updates.stop();
    std::cout << "  PASS" << std::endl;
}

void test_turn_fan_out() {
    std::cout << "Testing handle_turn fan-out..." << std::endl;

    Harness h;
    TurnService service("bob", Config{}, h.profiles, h.messages, h.generator,
                        h.sessions, h.updates);

    TurnResult r = service.handle_turn("c", "I want to hear from all of you",
                                       {Persona::Psyche, Persona::Instinct, Persona::Logic},
                                       false);
    assert(r.responses.size() == 3);
    assert(r.responses[0].persona == Persona::Psyche && !r.responses[0].mode);
    assert(r.responses[1].persona == Persona::Instinct);
    assert(r.responses[1].mode == InteractionMode::Addition);
    assert(r.responses[2].persona == Persona::Logic);
    assert(r.responses[2].mode == InteractionMode::Addition);
    assert(!r.continuation_mode);

    // Both followers answer the primary, not the response before them
    auto calls = h.generator.requests("persona");
    assert(calls.size() == 3);
    for (size_t i = 1; i < 3; ++i) {
        const auto& msgs = calls[i].messages;
        assert(msgs.size() >= 2);
        assert(msgs[msgs.size() - 2].content == "reply 1");
        assert(msgs.back().content.rfind("Puff (Psyche) just responded", 0) == 0);
        assert(calls[i].system.find("reply 1") != std::string::npos);
    }
    assert(calls[2].system.find("reply 2") == std::string::npos);

    PersonaVector boost = h.sessions.get("c");
    assert(near(boost.psyche, 0.02f, 1e-6f));
    assert(near(boost.instinct, 0.015f, 1e-6f));
    assert(near(boost.logic, 0.015f, 1e-6f));

    std::cout << "  PASS" << std::endl;
}

void test_turn_debate_cap() {
    std::cout << "Testing handle_turn debate cap..." << std::endl;

    Harness h;
    AlwaysContinueJudge judge;
    TurnService service("carol", Config{}, h.profiles, h.messages, h.generator,
                        h.sessions, h.updates, &judge);

    TurnResult r = service.handle_turn("c", "should I take the job?", ALL, true);
    assert(r.ok());
    assert(r.responses.size() == 4);
    assert(!r.responses[0].mode);
    assert(r.responses[1].mode == InteractionMode::Rebuttal);
    assert(r.continuation_mode && *r.continuation_mode == "intense");
    assert(judge.calls == 2);
    assert(h.messages.recent("c", 20).size() == 5);

    std::cout << "  PASS" << std::endl;
}

void test_turn_mild_rebuttal() {
    std::cout << "Testing handle_turn rebuttal without continuation..." << std::endl;

    Harness h;
    TurnService service("dan", Config{}, h.profiles, h.messages, h.generator,
                        h.sessions, h.updates);

    // Generator-backed judge; the stub says stop
    TurnResult r = service.handle_turn("c", "should I take the job?", ALL, true);
    assert(r.responses.size() == 2);
    assert(r.continuation_mode && *r.continuation_mode == "mild");
    assert(h.generator.count("debate_judgment") == 1);

    std::cout << "  PASS" << std::endl;
}

void test_turn_failures() {
    std::cout << "Testing handle_turn failures..." << std::endl;

    {
        // Secondary fails: primary is kept, no debate
        Harness h;
        h.generator.fail_persona_call = 2;
        AlwaysContinueJudge judge;
        TurnService service("erin", Config{}, h.profiles, h.messages, h.generator,
                            h.sessions, h.updates, &judge);
        TurnResult r = service.handle_turn("c", "should I take the job?", ALL, true);
        assert(r.ok());
        assert(r.responses.size() == 1);
        assert(!r.continuation_mode);
        assert(judge.calls == 0);
        assert(h.profiles.load_profile("erin").total_messages == 1);
    }
    {
        // Continuation fails: everything before it is kept
        Harness h;
        h.generator.fail_persona_call = 3;
        AlwaysContinueJudge judge;
        TurnService service("fay", Config{}, h.profiles, h.messages, h.generator,
                            h.sessions, h.updates, &judge);
        TurnResult r = service.handle_turn("c", "should I take the job?", ALL, true);
        assert(r.responses.size() == 2);
        assert(r.continuation_mode && *r.continuation_mode == "mild");
    }
    {
        // Primary fails: nothing to return
        Harness h;
        h.generator.fail_persona_call = 1;
        TurnService service("gus", Config{}, h.profiles, h.messages, h.generator,
                            h.sessions, h.updates);
        TurnResult r = service.handle_turn("c", "hello there", ALL, false);
        assert(!r.ok());
        assert(r.responses.empty());
        assert(r.error && r.error->find("stub outage") != std::string::npos);
        assert(h.profiles.load_profile("gus").total_messages == 0);
        assert(h.updates.pending() == 0);
    }
    {
        Harness h;
        TurnService service("hal", Config{}, h.profiles, h.messages, h.generator,
                            h.sessions, h.updates);
        TurnResult r = service.handle_turn("c", "hello", {}, false);
        assert(!r.ok() && r.error);
    }

    std::cout << "  PASS" << std::endl;
}

void test_stale_weight_race() {
    std::cout << "Testing background weight update ordering..." << std::endl;

    Harness h;
    h.generator.intrinsic_reply =
        R"({"instinct_signal": 0.0, "logic_signal": 0.0, "psyche_signal": 1.0})";

    std::vector<WeightShift> shifts;
    std::mutex shifts_mutex;
    h.updates.on_shift([&](const std::string&, const WeightShift& s) {
        std::lock_guard<std::mutex> lock(shifts_mutex);
        shifts.push_back(s);
    });

    TurnService service("ivy", Config{}, h.profiles, h.messages, h.generator,
                        h.sessions, h.updates);
    AffinityWeights initial = h.profiles.load_profile("ivy").weights;

    // Worker not yet running: the turn returns with its update still queued
    TurnResult first = service.handle_turn("c", "what does all of this mean for me", ALL, false);
    assert(first.ok());
    assert(h.updates.pending() == 1);
    assert(h.profiles.load_profile("ivy").weights.vector() == initial.vector());

    // The follow-up routes on the same, not yet updated, persistent weights
    TurnResult second = service.handle_turn("c", "tell me more about that feeling", ALL, false);
    assert(second.ok());
    assert(h.updates.pending() == 2);
    assert(h.profiles.load_profile("ivy").weights.vector() == initial.vector());

    h.updates.start();
    h.updates.wait_idle();
    assert(h.updates.pending() == 0);
    assert(h.updates.processed() == 2);

    AffinityWeights updated = h.profiles.load_profile("ivy").weights;
    assert(updated.valid());
    assert(updated.psyche() > initial.psyche());
    assert(updated.logic() < initial.logic());
    {
        std::lock_guard<std::mutex> lock(shifts_mutex);
        assert(!shifts.empty());
    }

    h.updates.stop();
    assert(!h.updates.is_running());
    std::cout << "  PASS" << std::endl;
}

void test_stop_drains_queue() {
    std::cout << "Testing weight queue drain on stop..." << std::endl;

    Harness h;
    h.generator.intrinsic_reply =
        R"({"instinct_signal": 1.0, "logic_signal": 0.0, "psyche_signal": 0.0})";
    h.updates.start();
    for (int i = 0; i < 20; ++i) {
        TraitJob job;
        job.user_id = "jo";
        job.conversation_id = "c";
        job.user_message = "go go go, no time to think";
        h.updates.submit(job);
    }
    h.updates.stop();
    assert(h.updates.pending() == 0);
    assert(h.updates.processed() == 20);
    assert(h.profiles.load_profile("jo").weights.valid());
    assert(h.profiles.load_profile("jo").weights.instinct() > 0.20f);

    // A store that throws is logged and counted, never propagated
    FailingProfileStore failing;
    WeightUpdateQueue doomed(failing, h.analyzer);
    doomed.process(TraitJob{"jo", "c", "go go go, no time to think", {}, false});
    assert(doomed.failed() == 1);
    assert(doomed.processed() == 0);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Stores and config
// ═══════════════════════════════════════════════════════════════════════════

void test_memory_stores() {
    std::cout << "Testing memory stores..." << std::endl;

    MemoryMessageStore messages;
    for (int i = 0; i < 30; ++i) {
        messages.append(Message::from_user("c", std::to_string(i)));
    }
    messages.append(Message::from_user("other", "x"));
    auto recent = messages.recent("c", 20);
    assert(recent.size() == 20);
    assert(recent.front().content == "10");
    assert(recent.back().content == "29");
    assert(messages.recent("none", 20).empty());

    MemoryProfileStore profiles;
    profiles.add_fact("u", {"work", "role", "engineer", 0.9f});
    profiles.add_fact("u", {"work", "role", "manager", 0.9f});
    assert(profiles.load_profile("u").summary.facts.size() == 1);
    assert(profiles.load_profile("u").summary.facts[0].value == "manager");
    profiles.set_message_count("u", 500);
    profiles.reset("u");
    UserProfile fresh = profiles.load_profile("u");
    assert(fresh.total_messages == 0);
    assert(fresh.summary.empty());
    assert(near(fresh.weights.logic(), 0.5f));

    std::cout << "  PASS" << std::endl;
}

void test_sqlite_store() {
    std::cout << "Testing SQLite store..." << std::endl;

    std::string path = "/tmp/intersect_test_" + std::to_string(getpid()) + ".db";
    std::remove(path.c_str());
    {
        SqliteStore store(path);

        UserProfile p = store.load_profile("u");
        assert(p.total_messages == 0);
        assert(near(p.weights.logic(), 0.5f));

        AffinityWeights next = store.update_weights("u", [](const AffinityWeights& w, uint64_t n) {
            assert(n == 0);
            return w.apply_delta({0.0f, -0.1f, 0.1f}, 1.0f);
        });
        assert(next.valid());
        p = store.load_profile("u");
        assert(near(p.weights.psyche(), next.psyche()));
        assert(near(p.weights.logic(), next.logic()));

        assert(store.increment_message_count("u") == 1);
        assert(store.increment_message_count("u") == 2);

        store.add_fact("u", {"personal", "city", "Lisbon", 0.9f});
        store.add_fact("u", {"personal", "city", "Porto", 0.95f});
        store.add_fact("u", {"work", "role", "designer", 0.6f});
        store.add_pattern("u", {"thinking_mode", "weighs options aloud", 0.7f});
        p = store.load_profile("u");
        assert(p.total_messages == 2);
        assert(p.summary.facts.size() == 2);
        assert(p.summary.facts[0].value == "Porto");
        assert(p.summary.patterns.size() == 1);

        // Failing update leaves the row untouched
        bool threw = false;
        try {
            store.update_weights("u", [](const AffinityWeights&, uint64_t) -> AffinityWeights {
                throw StoreError("abandoned");
            });
        } catch (const StoreError&) {
            threw = true;
        }
        assert(threw);
        assert(near(store.load_profile("u").weights.psyche(), next.psyche()));

        Message user = Message::from_user("c", "hello");
        store.append(user);
        Message reply = Message::from_persona("c", Persona::Psyche, "hi", InteractionMode::Rebuttal);
        reply.references_message_id = user.id;
        store.append(reply);
        store.append(Message::from_user("c", "again"));
        auto recent = store.recent("c", 2);
        assert(recent.size() == 2);
        assert(recent[0].id == reply.id);
        assert(recent[0].persona == Persona::Psyche);
        assert(recent[0].mode == InteractionMode::Rebuttal);
        assert(recent[0].references_message_id == user.id);
        assert(recent[1].is_user() && recent[1].content == "again");

        store.reset("u");
        p = store.load_profile("u");
        assert(p.total_messages == 0);
        assert(p.summary.empty());
        assert(near(p.weights.logic(), 0.5f));
    }
    {
        // Reopen: data survives
        SqliteStore store(path);
        assert(store.recent("c", 10).size() == 3);
    }
    std::remove(path.c_str());
    std::remove((path + "-wal").c_str());
    std::remove((path + "-shm").c_str());

    bool threw = false;
    try {
        SqliteStore bad("/nonexistent-dir/intersect/x.db");
    } catch (const StoreError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_config_loading() {
    std::cout << "Testing config loading..." << std::endl;

    std::string path = "/tmp/intersect_config_" + std::to_string(getpid()) + ".json";
    {
        std::ofstream out(path);
        out << R"({
            "history_window": 12,
            "router": {"silence_threshold": 4, "challenge_secondary_mode": "debate",
                       "logic_keywords": ["spreadsheet"]},
            "debate": {"max_responses": 3},
            "session": {"decay_factor": 0.5},
            "voice": {"logic_temperature": 0.2}
        })";
    }
    Config c = load_config(path);
    assert(c.history_window == 12);
    assert(c.router.silence_threshold == 4);
    assert(c.router.challenge_secondary_mode == InteractionMode::Debate);
    assert(c.router.logic_keywords.size() == 1);
    assert(!c.router.psyche_keywords.empty());
    assert(c.debate.max_responses == 3);
    assert(near(c.session.decay_factor, 0.5f));
    assert(near(c.voice.logic_temperature, 0.2f));
    assert(near(c.router.keyword_boost, 0.15f));

    // Out-of-range limits are clamped on load
    {
        std::ofstream out(path);
        out << R"({
            "debate": {"max_responses": 8, "max_iterations": 6},
            "session": {"decay_factor": 1.5}
        })";
    }
    Config loose = load_config(path);
    assert(loose.debate.max_responses == 4);
    assert(loose.debate.max_iterations == 2);
    assert(near(loose.session.decay_factor, 0.9f));

    {
        Harness h;
        AlwaysContinueJudge judge;
        TurnService service("erin", loose, h.profiles, h.messages, h.generator,
                            h.sessions, h.updates, &judge);
        TurnResult r = service.handle_turn("c", "should I take the job?", ALL, true);
        assert(r.responses.size() == 4);
    }

    {
        std::ofstream out(path);
        out << R"({"debate": {"max_responses": 1}, "session": {"decay_factor": -0.2}})";
    }
    Config tight = load_config(path);
    assert(tight.debate.max_responses == 2);
    assert(near(tight.session.decay_factor, 0.9f));

    {
        SessionBoostStore sessions(tight.session);
        sessions.boost("c", Persona::Logic, 0.02f);
        sessions.decay("c");
        float boost = sessions.get("c").logic;
        assert(boost > 0.0f && boost < 0.02f);
    }

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    Config broken = load_config(path);
    assert(broken.router.silence_threshold == 3);
    std::remove(path.c_str());

    Config missing = load_config(path);
    assert(missing.history_window == 20);

    std::cout << "  PASS" << std::endl;
}

void test_socket_generator() {
    std::cout << "Testing socket generator..." << std::endl;

    using Action = CannedDaemon::Action;
    std::string path = "/tmp/intersect_gen_" + std::to_string(getpid()) + ".sock";

    GenerationRequest req;
    req.system = "be brief";
    req.messages.push_back({"user", "hello"});
    req.temperature = 0.4f;
    req.max_tokens = 150;
    req.purpose = "debate_judgment";

    CannedDaemon daemon(path, {
        {Action::Reply, R"({"jsonrpc":"2.0","id":1,"result":"plain text"})"},
        {Action::Reply, R"({"jsonrpc":"2.0","id":2,"result":{"text":"object text"}})"},
        {Action::Reply, R"({"jsonrpc":"2.0","id":3,"error":{"code":-32000,"message":"rate limited"}})"},
        {Action::Reply, "this is not json"},
        {Action::Reply, R"({"jsonrpc":"2.0","id":5,"result":{"tokens":12}})"},
        {Action::Close, ""},
        {Action::ReplyThenClose, R"({"jsonrpc":"2.0","id":7,"result":"before idle close"})"},
        {Action::Reply, R"({"jsonrpc":"2.0","id":8,"result":"after reconnect"})"},
        {Action::Silent, ""},
    });

    SocketGenerator gen(path, 500);
    assert(gen.connect());

    Generation g = gen.generate(req);
    assert(g.ok && g.text == "plain text");

    auto sent = nlohmann::json::parse(daemon.received().at(0));
    assert(sent["jsonrpc"] == "2.0");
    assert(sent["method"] == "generate");
    assert(sent["params"]["purpose"] == "debate_judgment");
    assert(sent["params"]["max_tokens"] == 150);
    assert(sent["params"]["messages"].size() == 1);

    g = gen.generate(req);
    assert(g.ok && g.text == "object text");

    g = gen.generate(req);
    assert(!g.ok && g.error == "rate limited");
    assert(gen.connected());

    g = gen.generate(req);
    assert(!g.ok && g.error.rfind("Malformed response", 0) == 0);

    g = gen.generate(req);
    assert(!g.ok && g.error == "Malformed response: result has no text");

    // Written but unanswered: reported, not resent
    g = gen.generate(req);
    assert(!g.ok && g.error == "Connection closed");
    assert(!gen.connected());
    assert(daemon.received().size() == 6);

    // Reconnects on the next call
    g = gen.generate(req);
    assert(g.ok && g.text == "before idle close");
    while (daemon.closed() < 2) std::this_thread::sleep_for(std::chrono::milliseconds(5));

    // Stale connection: the write fails, so the request goes out once on a fresh one
    g = gen.generate(req);
    assert(g.ok && g.text == "after reconnect");
    assert(daemon.received().size() == 8);

    g = gen.generate(req);
    assert(!g.ok && g.error == "Response timeout");

    daemon.join();
    assert(daemon.received().size() == 9);
    assert(daemon.closed() == 3);

    SocketGenerator nobody("/tmp/intersect_gen_missing_" + std::to_string(getpid()) + ".sock");
    g = nobody.generate(req);
    assert(!g.ok && g.error.rfind("connect() failed", 0) == 0);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Intersect Tests ===" << std::endl;
    std::cout << std::endl;

    test_persona_parsing();
    test_variability_bounds();
    test_affinity_defaults();
    test_apply_delta_invariants();
    test_weight_shift();
    test_session_decay();
    test_session_concurrency();

    std::cout << std::endl;
    std::cout << "=== Routing and Grounding ===" << std::endl;
    test_router_step_by_step();
    test_router_challenge_mode();
    test_router_determinism();
    test_router_edges();
    test_silence_fairness();
    test_grounding_first_turn();
    test_grounding_levels();

    std::cout << std::endl;
    std::cout << "=== Judgments and Debate ===" << std::endl;
    test_judgment_parsing();
    test_trait_combiner();
    test_trait_analyzer();
    test_debate_cap();
    test_debate_termination();
    test_generator_debate_judge();
    test_voice_request();

    std::cout << std::endl;
    std::cout << "=== Turn Service ===" << std::endl;
    test_turn_basic();
    test_turn_fan_out();
    test_turn_debate_cap();
    test_turn_mild_rebuttal();
    test_turn_failures();
    test_stale_weight_race();
    test_stop_drains_queue();

    std::cout << std::endl;
    std::cout << "=== Storage ===" << std::endl;
    test_memory_stores();
    test_sqlite_store();
    test_config_loading();
    test_socket_generator();

    std::cout << std::endl;
    std::cout << "All tests passed!" << std::endl;
    return 0;
}
