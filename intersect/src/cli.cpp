// intersect: Command-line interface for the turn core
//
// Usage: intersect <command> [options]
//
// Commands:
//   turn "<msg>"         Run a full turn against the generation daemon
//   route "<msg>"        Show the routing decision for a message
//   ground "<msg>"       Show the grounding level for a message
//   variability <n>      Weight variability after n lifetime messages
//   weights              Show the user's persistent weights
//   reset                Reset the user's profile
//   version / help

#include <intersect/intersect.hpp>
#include <intersect/socket_generator.hpp>
#include <intersect/sqlite_store.hpp>
#include <intersect/log.hpp>
#include <nlohmann/json.hpp>
#include <iostream>
#include <iomanip>
#include <string>
#include <cstring>
#include <cstdlib>
#include <sys/stat.h>

using namespace intersect;
using json = nlohmann::json;

// Get program name from path
static const char* prog_name(const char* path) {
    const char* last = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') last = p + 1;
    }
    return last;
}

void print_usage(const char* prog) {
    const char* name = prog_name(prog);
    std::cerr << "intersect " << INTERSECT_VERSION << " - Multi-persona turn core\n\n"
              << "Usage: " << name << " <command> [options]\n\n"
              << "Commands:\n"
              << "  turn <message>       Run a full turn (needs the generation daemon)\n"
              << "  route <message>      Show the routing decision for a message\n"
              << "  ground <message>     Show the grounding level for a message\n"
              << "  variability <n>      Weight variability after n lifetime messages\n"
              << "  weights              Show persistent weights for the user\n"
              << "  reset                Reset the user's profile to defaults\n"
              << "  version              Show version\n"
              << "  help                 Show this help\n\n"
              << "Options:\n"
              << "  --db PATH            Database path (default: $INTERSECT_DB_PATH or ~/.intersect/intersect.db)\n"
              << "  --socket PATH        Generation daemon socket (default: $INTERSECT_SOCKET)\n"
              << "  --config PATH        Config file (default: $INTERSECT_CONFIG or ~/.intersect/config.json)\n"
              << "  --user ID            User id (default: $USER)\n"
              << "  --conversation ID    Conversation id (default: cli)\n"
              << "  --enabled LIST       Enabled personas, e.g. logic,psyche (default: all)\n"
              << "  --challenge          Challenge mode\n"
              << "  --json               Output as JSON\n"
              << "  --verbose            Enable verbose logging\n";
}

static std::string default_user() {
    const char* user = std::getenv("USER");
    return user ? user : "default";
}

// Comma-separated persona names
static bool parse_enabled(const std::string& list, std::vector<Persona>& out) {
    out.clear();
    size_t start = 0;
    while (start <= list.size()) {
        size_t comma = list.find(',', start);
        std::string item = list.substr(start, comma == std::string::npos ? std::string::npos
                                                                          : comma - start);
        if (!trim(item).empty()) {
            auto p = parse_persona(item);
            if (!p) {
                std::cerr << "Unknown persona: " << item << "\n";
                return false;
            }
            out.push_back(*p);
        }
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return !out.empty();
}

static void ensure_parent_dir(const std::string& path) {
    size_t slash = path.rfind('/');
    if (slash == std::string::npos || slash == 0) return;
    mkdir(path.substr(0, slash).c_str(), 0755);
}

static json weights_json(const AffinityWeights& w) {
    return {{"instinct", w.instinct()}, {"logic", w.logic()}, {"psyche", w.psyche()}};
}

int cmd_variability(const std::string& arg, const Config& config, bool json_output) {
    uint64_t n = 0;
    try {
        n = std::stoull(arg);
    } catch (const std::exception&) {
        std::cerr << "Not a message count: " << arg << "\n";
        return 1;
    }
    float v = variability(n, config.variability);
    if (json_output) {
        std::cout << json{{"messages", n}, {"variability", v}}.dump() << "\n";
    } else {
        std::cout << "Variability after " << n << " messages: "
                  << std::fixed << std::setprecision(4) << v << "\n";
    }
    return 0;
}

int cmd_weights(SqliteStore& store, const Config& config, const std::string& user,
                bool json_output) {
    UserProfile profile = store.load_profile(user);
    if (json_output) {
        json out = weights_json(profile.weights);
        out["user"] = user;
        out["total_messages"] = profile.total_messages;
        out["dominant"] = persona_name(profile.weights.dominant());
        out["facts"] = profile.summary.facts.size();
        out["patterns"] = profile.summary.patterns.size();
        std::cout << out.dump() << "\n";
        return 0;
    }

    std::cout << "Weights for " << user << "\n";
    std::cout << "═══════════════════════════════\n";
    std::cout << std::fixed << std::setprecision(3);
    for (Persona p : ALL_PERSONAS) {
        std::cout << "  " << std::left << std::setw(18) << persona_display_name(p)
                  << profile.weights[p] << "\n";
    }
    std::cout << "\nDominant:     " << persona_name(profile.weights.dominant()) << "\n";
    std::cout << "Messages:     " << profile.total_messages << "\n";
    std::cout << "Variability:  " << variability(profile.total_messages, config.variability) << "\n";
    std::cout << "Facts:        " << profile.summary.facts.size() << "\n";
    std::cout << "Patterns:     " << profile.summary.patterns.size() << "\n";
    return 0;
}

int cmd_reset(SqliteStore& store, const std::string& user) {
    store.reset(user);
    std::cout << "Profile reset for " << user << "\n";
    return 0;
}

int cmd_route(SqliteStore& store, const Config& config, const std::string& user,
              const std::string& conversation, const std::string& message,
              const std::vector<Persona>& enabled, bool challenge, bool json_output) {
    UserProfile profile = store.load_profile(user);
    auto history = store.recent(conversation, config.history_window);

    HeuristicRouter router(config.router);
    auto decision = router.route(message, profile.weights.vector(), enabled, history, challenge);
    if (!decision) {
        std::cerr << "No personas enabled\n";
        return 1;
    }

    if (json_output) {
        json out = {
            {"primary", persona_name(decision->primary)},
            {"fan_out", decision->fan_out},
            {"forced_by_silence", decision->forced_by_silence},
            {"scores", {{"instinct", decision->scores.instinct},
                        {"logic", decision->scores.logic},
                        {"psyche", decision->scores.psyche}}}
        };
        if (decision->secondary) {
            out["secondary"] = {{"persona", persona_name(decision->secondary->persona)},
                                {"mode", mode_name(decision->secondary->mode)}};
        } else {
            out["secondary"] = nullptr;
        }
        std::cout << out.dump() << "\n";
        return 0;
    }

    std::cout << "Primary:   " << persona_display_name(decision->primary) << "\n";
    if (decision->fan_out) {
        std::cout << "Fan-out:   every enabled persona\n";
    } else if (decision->secondary) {
        std::cout << "Secondary: " << persona_display_name(decision->secondary->persona)
                  << " (" << mode_name(decision->secondary->mode) << ")"
                  << (decision->forced_by_silence ? " [silence]" : "") << "\n";
    } else {
        std::cout << "Secondary: none\n";
    }
    std::cout << std::fixed << std::setprecision(3);
    std::cout << "Scores:    I=" << decision->scores.instinct
              << " L=" << decision->scores.logic
              << " P=" << decision->scores.psyche << "\n";
    std::cout << "Silence:   I=" << decision->silence[0] << " L=" << decision->silence[1]
              << " P=" << decision->silence[2] << "\n";
    return 0;
}

int cmd_ground(SqliteStore& store, const Config& config, const std::string& user,
               const std::string& conversation, const std::string& message, bool json_output) {
    UserProfile profile = store.load_profile(user);
    auto history = store.recent(conversation, config.history_window);

    GroundingClassifier classifier(config.grounding);
    GroundingDecision g = classifier.classify(message, history, &profile.summary);

    if (json_output) {
        std::cout << json{{"level", grounding_name(g.level)},
                          {"facts", g.relevant_fact_keys},
                          {"patterns", g.relevant_pattern_types},
                          {"past_context", g.include_past_context}}.dump() << "\n";
        return 0;
    }

    std::cout << "Grounding: " << grounding_name(g.level) << "\n";
    for (const auto& k : g.relevant_fact_keys) std::cout << "  fact:    " << k << "\n";
    for (const auto& t : g.relevant_pattern_types) std::cout << "  pattern: " << t << "\n";
    if (g.include_past_context) std::cout << "  + past context\n";
    return 0;
}

int cmd_turn(SqliteStore& store, const Config& config, const std::string& socket_path,
             const std::string& user, const std::string& conversation,
             const std::string& message, const std::vector<Persona>& enabled,
             bool challenge, bool json_output) {
    SocketGenerator generator(socket_path);
    if (!generator.connect()) {
        std::cerr << "Cannot reach generation daemon at " << socket_path << ": "
                  << generator.last_error() << "\n";
        return 1;
    }

    // Trait judgments get their own connection so they never queue ahead
    // of a persona response
    SocketGenerator analysis_generator(socket_path);

    SessionBoostStore sessions(config.session);
    TraitAnalyzer analyzer(analysis_generator, config.traits);
    WeightUpdateQueue updates(store, analyzer, config.traits, config.variability);
    updates.on_shift([](const std::string& uid, const WeightShift& shift) {
        if (shift.kind == ShiftKind::Minor) return;
        std::cerr << "[weights] " << uid << ": " << shift_kind_name(shift.kind) << " "
                  << persona_name(shift.old_dominant) << " -> "
                  << persona_name(shift.new_dominant) << "\n";
    });
    updates.start();

    TurnService service(user, config, store, store, generator, sessions, updates);
    TurnResult result = service.handle_turn(conversation, message, enabled, challenge);

    // Drains the trait job before exit
    updates.stop();

    if (json_output) {
        json responses = json::array();
        for (const auto& r : result.responses) {
            responses.push_back({{"persona", persona_name(r.persona)},
                                 {"content", r.content},
                                 {"mode", r.kind()}});
        }
        json out = {{"responses", responses}, {"grounding", grounding_name(result.grounding)}};
        out["continuation_mode"] = result.continuation_mode ? json(*result.continuation_mode)
                                                            : json(nullptr);
        if (result.error) out["error"] = *result.error;
        std::cout << out.dump() << "\n";
        return result.ok() ? 0 : 1;
    }

    for (const auto& r : result.responses) {
        std::cout << persona_display_name(r.persona) << " [" << r.kind() << "]\n"
                  << r.content << "\n\n";
    }
    if (result.continuation_mode) {
        std::cout << "(debate: " << *result.continuation_mode << ")\n";
    }
    if (result.error) {
        std::cerr << "Error: " << *result.error << "\n";
    }
    return result.ok() ? 0 : 1;
}

int main(int argc, char* argv[]) {
    std::string db_path = default_db_path();
    std::string socket_path = default_socket_path();
    std::string config_path = default_config_path();
    bool config_explicit = false;
    std::string user = default_user();
    std::string conversation = "cli";
    std::string enabled_list;
    std::string command;
    std::string argument;
    bool challenge = false;
    bool json_output = false;
    bool verbose_flag = false;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--db") == 0 && i + 1 < argc) {
            db_path = argv[++i];
        } else if (strcmp(argv[i], "--socket") == 0 && i + 1 < argc) {
            socket_path = argv[++i];
        } else if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
            config_explicit = true;
        } else if (strcmp(argv[i], "--user") == 0 && i + 1 < argc) {
            user = argv[++i];
        } else if (strcmp(argv[i], "--conversation") == 0 && i + 1 < argc) {
            conversation = argv[++i];
        } else if (strcmp(argv[i], "--enabled") == 0 && i + 1 < argc) {
            enabled_list = argv[++i];
        } else if (strcmp(argv[i], "--challenge") == 0) {
            challenge = true;
        } else if (strcmp(argv[i], "--json") == 0) {
            json_output = true;
        } else if (strcmp(argv[i], "--verbose") == 0) {
            verbose_flag = true;
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "intersect " << INTERSECT_VERSION << "\n";
            return 0;
        } else if (argv[i][0] != '-') {
            if (command.empty()) {
                command = argv[i];
            } else if (argument.empty()) {
                argument = argv[i];
            }
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (command.empty() || command == "help") {
        print_usage(argv[0]);
        return 0;
    }
    if (command == "version") {
        std::cout << "intersect " << INTERSECT_VERSION << "\n";
        return 0;
    }

    // A missing default config is normal; a missing explicit one is logged
    Config config;
    struct stat st;
    if (config_explicit || stat(config_path.c_str(), &st) == 0) {
        config = load_config(config_path);
    }
    set_verbose(verbose_flag || config.verbose);

    if (command == "variability") {
        if (argument.empty()) {
            std::cerr << "Usage: intersect variability <messages>\n";
            return 1;
        }
        return cmd_variability(argument, config, json_output);
    }

    std::vector<Persona> enabled(ALL_PERSONAS.begin(), ALL_PERSONAS.end());
    if (!enabled_list.empty() && !parse_enabled(enabled_list, enabled)) {
        return 1;
    }

    bool needs_message = command == "turn" || command == "route" || command == "ground";
    if (needs_message && argument.empty()) {
        std::cerr << "Usage: intersect " << command << " \"<message>\"\n";
        return 1;
    }

    try {
        ensure_parent_dir(db_path);
        SqliteStore store(db_path);

        if (command == "weights") return cmd_weights(store, config, user, json_output);
        if (command == "reset") return cmd_reset(store, user);
        if (command == "route") {
            return cmd_route(store, config, user, conversation, argument, enabled, challenge,
                             json_output);
        }
        if (command == "ground") {
            return cmd_ground(store, config, user, conversation, argument, json_output);
        }
        if (command == "turn") {
            return cmd_turn(store, config, socket_path, user, conversation, argument, enabled,
                            challenge, json_output);
        }
    } catch (const StoreError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "Unknown command: " << command << "\n\n";
    print_usage(argv[0]);
    return 1;
}
