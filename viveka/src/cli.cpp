// viveka: Command-line driver for knowledge-base curation
//
// Usage: viveka <command> [options]
//
// Commands:
//   import <file>            Load items from JSONL into the store
//   dedup                    Run the auto-dedup pass once
//   triads                   List drift triads
//   communities              List candidate communities
//   review --bucket B        Interactive review over stdin
//   overnight                Automated multi-round curation
//   report                   Morning report from the last overnight run
//   export-canonical <file>  Write active items as JSONL
//   export-decisions <file>  Write the decision log as CSV
//   lineage <id>             Decisions that touched an item
//   help                     Show this help

#include <viveka/viveka.hpp>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <unistd.h>

using namespace viveka;

namespace {

struct CliOptions {
    std::string command;
    std::string arg;                 // import/export file
    std::string db_path = "viveka.db";
    std::string config_path;
    std::string vectors_path;
    std::string neighbors_path;
    std::string llm_command;
    std::string bucket = "high";
    std::string report_path;
    std::string user;
    long max_iterations = -1;
    double min_improvement = -1.0;
    long batch_size = -1;
    long max_retries = -1;
    bool dry_run = false;
    bool reset_state = false;
    bool json_output = false;
};

// Providers chosen on the command line
struct Providers {
    std::unique_ptr<EmbeddingIndex> index;
    std::unique_ptr<NeighborFile> neighbor_file;
    VectorProvider* vectors = nullptr;
    RerankProvider* rerank = nullptr;
};

const char* prog_name(const char* path) {
    const char* slash = strrchr(path, '/');
    return slash ? slash + 1 : path;
}

void print_usage(const char* prog) {
    const char* name = prog_name(prog);
    std::cerr << "viveka " << VIVEKA_VERSION << " - Knowledge-base curation\n\n"
              << "Usage: " << name << " <command> [options]\n\n"
              << "Commands:\n"
              << "  import <file>            Load items (JSONL) into the store\n"
              << "  dedup                    Merge pairs at or above auto_dedup\n"
              << "  triads                   List drift triads\n"
              << "  communities              List candidate communities\n"
              << "  review                   Interactive review (commands on stdin)\n"
              << "  overnight                Automated curation until convergence\n"
              << "  report                   Morning report from the last overnight run\n"
              << "  export-canonical <file>  Write active items as JSONL\n"
              << "  export-decisions <file>  Write the decision log as CSV\n"
              << "  lineage <id>             Decisions that touched an item\n"
              << "  help                     Show this help\n\n"
              << "Options:\n"
              << "  --db PATH              SQLite store (default: viveka.db)\n"
              << "  --config PATH          Curation config (JSON)\n"
              << "  --vectors PATH         Embeddings JSONL {id, category, vector}\n"
              << "  --neighbors PATH       Neighbor cache JSONL {src, dst, embed_score}\n"
              << "  --llm-command CMD      Adjudicator command (prompt on stdin)\n"
              << "  --bucket B             Review bucket: high|medium|low (default: high)\n"
              << "  --user NAME            Recorded on every decision\n"
              << "  --max-iterations N     Override max_iterations\n"
              << "  --min-improvement R    Override min_improvement_rate\n"
              << "  --batch-size N         Communities per overnight round (0 = all)\n"
              << "  --max-retries N        Adjudicator retries before manual review\n"
              << "  --report PATH          Also write the morning report here\n"
              << "  --dry-run              Compute everything, persist nothing\n"
              << "  --reset-state          Ignore the saved checkpoint\n"
              << "  --json                 Output as JSON\n"
              << "  --verbose              Enable verbose debug logging\n"
              << "  -v, --version          Show version\n";
}

std::string default_user() {
    const char* user = std::getenv("USER");
    return user ? user : "unknown";
}

bool open_store(SqliteStore& store, const std::string& path) {
    if (!store.open(path)) {
        std::cerr << "Cannot open store " << path << ": " << store.last_error() << "\n";
        return false;
    }
    return true;
}

// Throws ProviderUnavailable
bool load_providers(const CliOptions& opts, Providers& p) {
    if (!opts.vectors_path.empty()) {
        p.index = std::make_unique<EmbeddingIndex>();
        p.index->load_jsonl(opts.vectors_path);
        p.vectors = p.index.get();
    } else if (!opts.neighbors_path.empty()) {
        p.neighbor_file = std::make_unique<NeighborFile>();
        p.neighbor_file->load(opts.neighbors_path);
        p.vectors = p.neighbor_file.get();
        if (p.neighbor_file->has_rerank_scores()) p.rerank = p.neighbor_file.get();
    } else {
        std::cerr << "A vector provider is required: --vectors PATH or --neighbors PATH\n";
        return false;
    }
    return true;
}

int cmd_import(SqliteStore& store, const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        std::cerr << "Cannot open " << path << "\n";
        return 1;
    }
    auto result = import_items(store, in, path);
    if (result.failed) {
        std::cerr << "Import failed: " << result.error << "\n";
        return 1;
    }
    std::cout << "Imported " << result.imported << " items";
    if (result.skipped) std::cout << " (" << result.skipped << " skipped)";
    if (result.dangling) std::cout << " (" << result.dangling << " with a dangling canonical)";
    std::cout << "\n";
    return 0;
}

int cmd_lineage(const CliOptions& opts, SqliteStore& store) {
    auto records = AuditLog::lineage(store.decisions(), opts.arg);
    if (opts.json_output) {
        json out = json::array();
        for (const auto& r : records) out.push_back(decision_to_json(r));
        std::cout << out.dump(2) << "\n";
        return 0;
    }
    if (records.empty()) {
        std::cout << "No decisions mention " << opts.arg << "\n";
        return 0;
    }
    for (const auto& r : records) {
        std::cout << iso8601(r.timestamp) << "  " << action_name(r.action)
                  << " by " << actor_name(r.actor);
        if (!r.user.empty()) std::cout << " (" << r.user << ")";
        std::cout << ": ";
        for (size_t i = 0; i < r.subject.size(); ++i) std::cout << (i ? ", " : "") << r.subject[i];
        if (r.target) std::cout << " -> " << *r.target;
        if (!r.rationale.empty()) std::cout << "  [" << r.rationale << "]";
        std::cout << "\n";
    }
    return 0;
}

int cmd_dedup(const CliOptions& opts, const CurationConfig& config, SqliteStore& store,
              Providers& providers) {
    ItemPool pool(store.load_items());
    size_t before = pool.active_count();
    AuditLog audit(&store, pool, opts.dry_run);
    GraphBuilder builder(*providers.vectors, providers.rerank, config);
    AutoDedup dedup(config, audit);

    auto graphs = builder.build_all(pool);
    auto result = dedup.run(graphs, "dedup-" + iso8601(now()));

    if (opts.json_output) {
        std::cout << json{
            {"dry_run", opts.dry_run},
            {"groups", result.groups},
            {"merged", result.merged_items},
            {"withheld_chains", result.withheld_groups},
            {"active_before", before},
            {"active_after", pool.active_count()}
        }.dump(2) << "\n";
    } else {
        std::cout << (opts.dry_run ? "[dry run] " : "")
                  << "Merged " << result.merged_items << " items in " << result.groups << " groups; "
                  << before << " -> " << pool.active_count() << " active\n";
        if (result.withheld_groups) {
            std::cout << result.withheld_groups << " chains withheld for review (see 'triads')\n";
        }
    }
    return result.failed ? 2 : 0;
}

int cmd_triads(const CliOptions& opts, const CurationConfig& config, SqliteStore& store,
               Providers& providers) {
    ItemPool pool(store.load_items());
    GraphBuilder builder(*providers.vectors, providers.rerank, config);
    TriadDetector detector(config.thresholds.high_bucket);
    auto triads = detector.detect_all(builder.build_all(pool));

    if (opts.json_output) {
        json out = json::array();
        for (const auto& t : triads) {
            out.push_back({{"category", t.category}, {"a", t.a}, {"b", t.b}, {"c", t.c},
                           {"ab", t.ab}, {"bc", t.bc},
                           {"ac", t.ac ? json(*t.ac) : json()},
                           {"recommendation", t.recommendation()}});
        }
        std::cout << out.dump(2) << "\n";
        return 0;
    }
    std::cout << triads.size() << " drift triads\n";
    for (const auto& t : triads) {
        std::cout << "  [" << t.category << "] " << t.a << " ~ " << t.b << " ~ " << t.c
                  << "  " << t.recommendation() << "\n";
    }
    return 0;
}

int cmd_communities(const CliOptions& opts, const CurationConfig& config, SqliteStore& store,
                    Providers& providers) {
    ItemPool pool(store.load_items());
    GraphBuilder builder(*providers.vectors, providers.rerank, config);
    CommunityDetector detector(config);
    DecisionPolicy policy(config);
    auto communities = detector.detect_all(builder.build_all(pool));

    if (opts.json_output) {
        json out = json::array();
        for (const auto& c : communities) {
            out.push_back({{"id", c.id}, {"category", c.category}, {"members", c.members},
                           {"avg_similarity", c.avg_similarity}, {"density", c.density},
                           {"priority", c.priority}, {"oversized", c.oversized},
                           {"route", route_name(policy.route(c.avg_similarity))}});
        }
        std::cout << out.dump(2) << "\n";
        return 0;
    }
    std::cout << communities.size() << " communities\n";
    for (const auto& c : communities) {
        printf("  %s [%s] size=%zu avg=%.3f density=%.2f priority=%.3f %s%s\n",
               c.id.c_str(), c.category.c_str(), c.size(), c.avg_similarity, c.density,
               c.priority, route_name(policy.route(c.avg_similarity)),
               c.oversized ? " (oversized)" : "");
    }
    return 0;
}

int cmd_review(const CliOptions& opts, const CurationConfig& config, SqliteStore& store,
               Providers& providers) {
    auto bucket = parse_bucket(opts.bucket);
    if (!bucket || *bucket == Bucket::Auto) {
        std::cerr << "Unknown review bucket '" << opts.bucket << "' (high|medium|low)\n";
        return 1;
    }

    ItemPool pool(store.load_items());
    AuditLog audit(opts.dry_run ? nullptr : &store, pool, opts.dry_run);
    StateManager states(opts.dry_run ? nullptr : &store);
    const std::string key = StateManager::review_key(bucket_name(*bucket));
    GraphBuilder builder(*providers.vectors, providers.rerank, config);

    std::optional<SessionState> state;
    if (!opts.reset_state) state = states.load(key);
    if (state && !state->exhausted()) {
        std::cout << "Resuming " << state->session_id << " at " << (state->cursor + 1)
                  << "/" << state->queue.size() << "\n";
    } else {
        auto graphs = builder.build_all(pool);
        auto triads = TriadDetector(config.thresholds.high_bucket).detect_all(graphs);
        auto communities = CommunityDetector(config).detect_all(graphs);
        state = SessionState{};
        state->session_id = "review-" + std::string(bucket_name(*bucket)) + "-" + iso8601(now());
        state->bucket = bucket_name(*bucket);
        state->initial_active = pool.active_count();
        state->queue = build_review_queue(graphs, communities, triads, DecisionPolicy(config), *bucket);
        std::cout << state->queue.size() << " candidates in the " << state->bucket << " bucket\n";
    }

    ReviewSession session(audit, states, key, std::move(*state), config.user);
    session.on_content_changed([&builder](const ItemId& id) { builder.invalidate(id); });

    bool interactive = isatty(STDIN_FILENO);
    std::string line;
    while (session.phase() == ReviewPhase::AwaitingInput) {
        std::cout << "\n" << session.render();
        if (interactive) std::cout << "> " << std::flush;
        if (!std::getline(std::cin, line)) {
            std::cout << session.handle("quit").message << "\n";
            break;
        }
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        auto result = session.handle(line);
        std::cout << (result.ok ? "" : "! ") << result.message << "\n";
    }
    if (session.phase() == ReviewPhase::Done) {
        std::cout << "Queue exhausted; " << audit.committed() << " decisions recorded\n";
    }
    return 0;
}

int cmd_overnight(const CliOptions& opts, const CurationConfig& config, SqliteStore& store,
                  Providers& providers) {
    std::unique_ptr<Adjudicator> adjudicator;
    if (!opts.llm_command.empty()) {
        adjudicator = std::make_unique<CommandAdjudicator>(opts.llm_command, config.llm_timeout_seconds);
    } else {
        log::warn("overnight", "no --llm-command; review-bucket communities go to the manual queue");
    }

    ItemPool pool(store.load_items());
    ConvergenceLoop loop(config, pool, &store, *providers.vectors, providers.rerank,
                         adjudicator.get(), opts.dry_run);
    auto result = loop.run(opts.reset_state);

    std::string text = opts.json_output ? summary_json(result).dump(2) : morning_report(result);
    std::cout << text << "\n";
    if (!opts.report_path.empty()) {
        std::string path = opts.report_path + (opts.dry_run ? ".dryrun" : "");
        std::ofstream out(path);
        out << text << "\n";
        if (!out) std::cerr << "Cannot write report to " << path << "\n";
    }
    return result.ok() ? 0 : 2;
}

int cmd_report(const CliOptions& opts, SqliteStore& store) {
    StateManager states(&store);
    auto state = states.load(StateManager::overnight_key());
    if (!state) {
        std::cerr << "No overnight run recorded in " << opts.db_path << "\n";
        return 1;
    }
    ItemPool pool(store.load_items());
    auto summary = summary_from_state(*state, store.manual_queue(), pool);
    std::cout << (opts.json_output ? summary_json(summary).dump(2) : morning_report(summary)) << "\n";
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions opts;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--db") == 0 && i + 1 < argc) {
            opts.db_path = argv[++i];
        } else if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            opts.config_path = argv[++i];
        } else if (strcmp(argv[i], "--vectors") == 0 && i + 1 < argc) {
            opts.vectors_path = argv[++i];
        } else if (strcmp(argv[i], "--neighbors") == 0 && i + 1 < argc) {
            opts.neighbors_path = argv[++i];
        } else if (strcmp(argv[i], "--llm-command") == 0 && i + 1 < argc) {
            opts.llm_command = argv[++i];
        } else if (strcmp(argv[i], "--bucket") == 0 && i + 1 < argc) {
            opts.bucket = argv[++i];
        } else if (strcmp(argv[i], "--user") == 0 && i + 1 < argc) {
            opts.user = argv[++i];
        } else if (strcmp(argv[i], "--report") == 0 && i + 1 < argc) {
            opts.report_path = argv[++i];
        } else if (strcmp(argv[i], "--max-iterations") == 0 && i + 1 < argc) {
            opts.max_iterations = std::strtol(argv[++i], nullptr, 10);
        } else if (strcmp(argv[i], "--min-improvement") == 0 && i + 1 < argc) {
            opts.min_improvement = std::strtod(argv[++i], nullptr);
        } else if (strcmp(argv[i], "--batch-size") == 0 && i + 1 < argc) {
            opts.batch_size = std::strtol(argv[++i], nullptr, 10);
        } else if (strcmp(argv[i], "--max-retries") == 0 && i + 1 < argc) {
            opts.max_retries = std::strtol(argv[++i], nullptr, 10);
        } else if (strcmp(argv[i], "--dry-run") == 0) {
            opts.dry_run = true;
        } else if (strcmp(argv[i], "--reset-state") == 0) {
            opts.reset_state = true;
        } else if (strcmp(argv[i], "--json") == 0) {
            opts.json_output = true;
        } else if (strcmp(argv[i], "--verbose") == 0) {
            log::set_verbose(true);
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "viveka " << VIVEKA_VERSION << "\n";
            return 0;
        } else if (argv[i][0] != '-') {
            if (opts.command.empty()) {
                opts.command = argv[i];
            } else if (opts.arg.empty()) {
                opts.arg = argv[i];
            }
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (opts.command.empty() || opts.command == "help") {
        print_usage(argv[0]);
        return 0;
    }

    // Configuration is validated before any store or provider is touched
    CurationConfig config;
    try {
        if (!opts.config_path.empty()) config = CurationConfig::load(opts.config_path);
        if (opts.max_iterations >= 0) config.max_iterations = static_cast<uint32_t>(opts.max_iterations);
        if (opts.min_improvement >= 0.0) config.min_improvement_rate = static_cast<float>(opts.min_improvement);
        if (opts.batch_size >= 0) config.batch_size = static_cast<size_t>(opts.batch_size);
        if (opts.max_retries >= 0) config.llm_max_retries = static_cast<uint32_t>(opts.max_retries);
        config.user = !opts.user.empty() ? opts.user
                    : (config.user == "auto" && opts.command == "review") ? default_user() : config.user;
        config.validate();
    } catch (const ConfigurationError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    SqliteStore store;
    if (!open_store(store, opts.db_path)) return 1;

    const std::string& cmd = opts.command;
    if (cmd == "import") {
        if (opts.arg.empty()) {
            std::cerr << "Usage: viveka import <items.jsonl>\n";
            return 1;
        }
        return cmd_import(store, opts.arg);
    }
    if (cmd == "report") return cmd_report(opts, store);
    if (cmd == "lineage") {
        if (opts.arg.empty()) {
            std::cerr << "Usage: viveka lineage <item-id>\n";
            return 1;
        }
        return cmd_lineage(opts, store);
    }
    if (cmd == "export-canonical") {
        if (opts.arg.empty()) {
            std::cerr << "Usage: viveka export-canonical <out.jsonl>\n";
            return 1;
        }
        ItemPool pool(store.load_items());
        if (!export_canonical(pool, opts.arg)) {
            std::cerr << "Cannot write " << opts.arg << "\n";
            return 1;
        }
        std::cout << "Exported " << pool.active_count() << " canonical items to " << opts.arg << "\n";
        return 0;
    }
    if (cmd == "export-decisions") {
        if (opts.arg.empty()) {
            std::cerr << "Usage: viveka export-decisions <out.csv>\n";
            return 1;
        }
        auto records = store.decisions();
        if (!AuditLog::export_csv(records, opts.arg)) {
            std::cerr << "Cannot write " << opts.arg << "\n";
            return 1;
        }
        std::cout << "Exported " << records.size() << " decisions to " << opts.arg << "\n";
        return 0;
    }

    if (cmd != "dedup" && cmd != "triads" && cmd != "communities" &&
        cmd != "review" && cmd != "overnight") {
        std::cerr << "Unknown command: " << cmd << "\n";
        print_usage(argv[0]);
        return 1;
    }

    try {
        Providers providers;
        if (!load_providers(opts, providers)) return 1;

        if (cmd == "dedup") return cmd_dedup(opts, config, store, providers);
        if (cmd == "triads") return cmd_triads(opts, config, store, providers);
        if (cmd == "communities") return cmd_communities(opts, config, store, providers);
        if (cmd == "review") return cmd_review(opts, config, store, providers);
        return cmd_overnight(opts, config, store, providers);
    } catch (const ProviderUnavailable& e) {
        std::cerr << e.what() << "\n";
        return 2;
    } catch (const Error& e) {
        std::cerr << e.what() << "\n";
        return 2;
    }
}
