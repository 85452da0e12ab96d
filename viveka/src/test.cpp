#include <viveka/viveka.hpp>
#include <iostream>
#include <cassert>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>

using namespace viveka;

// ═══════════════════════════════════════════════════════════════════════════
// Fixtures
// ═══════════════════════════════════════════════════════════════════════════

Item make_item(const std::string& id, const std::string& category = "DEV",
               ItemStatus status = ItemStatus::Pending) {
    Item item;
    item.id = id;
    item.category = category;
    item.title = "title of " + id;
    item.body = "body of " + id;
    item.embedding_ref = id;
    item.status = status;
    item.created_at = 1000;
    item.updated_at = 1000;
    return item;
}

Edge make_edge(const ItemId& a, const ItemId& b, float score) {
    Edge e;
    e.a_id = a;
    e.b_id = b;
    e.embed_score = score;
    e.blended_score = score;
    return e;
}

bool near(float x, float y, float eps = 1e-4f) { return std::fabs(x - y) < eps; }

// Vector provider answering from a fixed score table
class StaticVectors : public VectorProvider {
public:
    void set(const ItemId& a, const ItemId& b, float score) { scores_[PairKey::of(a, b)] = score; }
    void set_category(const ItemId& id, const std::string& category) { categories_[id] = category; }
    void bump() { ++generation_; }

    std::vector<Neighbor> neighbors(const ItemId& id, size_t k) override {
        ++calls;
        if (fail) throw ProviderUnavailable(name(), "offline");
        std::vector<Neighbor> out;
        for (const auto& [key, score] : scores_) {
            if (key.a != id && key.b != id) continue;
            const ItemId& other = (key.a == id) ? key.b : key.a;
            auto cat = categories_.find(other);
            out.push_back({other, score, cat != categories_.end() ? cat->second : ""});
        }
        std::sort(out.begin(), out.end(), [](const Neighbor& x, const Neighbor& y) {
            if (x.embed_score != y.embed_score) return x.embed_score > y.embed_score;
            return x.id < y.id;
        });
        if (out.size() > k) out.resize(k);
        return out;
    }

    uint64_t generation() const override { return generation_; }
    std::string name() const override { return "static-vectors"; }

    bool fail = false;
    size_t calls = 0;

private:
    std::map<PairKey, float> scores_;
    std::map<ItemId, std::string> categories_;
    uint64_t generation_ = 0;
};

// Replies chosen by member set
class ScriptedAdjudicator : public Adjudicator {
public:
    void script(std::vector<ItemId> members, const std::string& reply) {
        std::sort(members.begin(), members.end());
        replies_[member_signature("", members)] = reply;
    }

    Verdict decide(const AdjudicationRequest& request) override {
        ++calls;
        if (fail || calls <= fail_first) throw ProviderUnavailable(name(), "offline");
        auto it = replies_.find(member_signature("", request.ids()));
        return parse_verdict(it != replies_.end() ? it->second : fallback, request.ids());
    }

    std::string name() const override { return "scripted"; }

    bool fail = false;
    size_t fail_first = 0;          // Calls that throw before replies start
    size_t calls = 0;
    std::string fallback = R"({"decision": "manual_review"})";

private:
    std::map<std::string, std::string> replies_;
};

// SQLite store whose commit can be made to fail
class FailingStore : public Store {
public:
    explicit FailingStore(SqliteStore& inner) : inner_(inner) {}

    bool put_item(const Item& item) override { return inner_.put_item(item); }
    std::vector<Item> load_items() override { return inner_.load_items(); }

    bool commit(DecisionRecord& record, const std::vector<Item>& mutations) override {
        if (fail_commit) {
            error_ = "injected commit failure";
            return false;
        }
        return inner_.commit(record, mutations);
    }

    std::vector<DecisionRecord> decisions() override { return inner_.decisions(); }
    size_t decision_count() override { return inner_.decision_count(); }
    bool put_state(const std::string& key, const std::string& value) override {
        return inner_.put_state(key, value);
    }
    std::optional<std::string> get_state(const std::string& key) override { return inner_.get_state(key); }
    bool erase_state(const std::string& key) override { return inner_.erase_state(key); }
    bool enqueue_manual(ManualReviewEntry& entry) override { return inner_.enqueue_manual(entry); }
    std::vector<ManualReviewEntry> manual_queue() override { return inner_.manual_queue(); }
    std::string last_error() const override { return fail_commit ? error_ : inner_.last_error(); }

    bool fail_commit = false;

private:
    SqliteStore& inner_;
    std::string error_;
};

// Ten DEV items: E1-E3 a high-bucket cluster, F1/F2 an exact duplicate, S1-S5 unrelated
struct Scenario {
    SqliteStore store;
    StaticVectors vectors;
    ScriptedAdjudicator adjudicator;
    CurationConfig config;

    Scenario() {
        bool opened = store.open(":memory:");
        assert(opened);
        (void)opened;
        for (const char* id : {"E1", "E2", "E3", "F1", "F2", "S1", "S2", "S3", "S4", "S5"}) {
            store.put_item(make_item(id));
            vectors.set_category(id, "DEV");
        }
        vectors.set("E1", "E2", 0.95f);
        vectors.set("E1", "E3", 0.95f);
        vectors.set("E2", "E3", 0.95f);
        vectors.set("F1", "F2", 0.99f);
        adjudicator.script({"E1", "E2", "E3"},
            R"({"decision": "merge_all", "canonical": "E1", "confidence": 0.9,
                "rationale": "same procedure written three times"})");
    }

    ItemPool pool() { return ItemPool(store.load_items()); }
};

// ═══════════════════════════════════════════════════════════════════════════
// Configuration and scoring
// ═══════════════════════════════════════════════════════════════════════════

void test_config_validation() {
    std::cout << "Testing CurationConfig validation..." << std::endl;

    CurationConfig defaults;
    defaults.validate();

    CurationConfig inverted;
    inverted.thresholds.auto_dedup = 0.90f;
    inverted.thresholds.high_bucket = 0.92f;
    bool threw = false;
    try {
        inverted.validate();
    } catch (const ConfigurationError& e) {
        threw = std::string(e.what()).find("auto_dedup") != std::string::npos;
    }
    assert(threw);

    auto nested = CurationConfig::from_json(nlohmann::json::parse(R"({
        "curation": {
            "algorithm": "leiden",
            "max_rounds": 4,
            "thresholds": {"edge_keep": 0.70, "auto_dedup": 0.97, "high": 0.90}
        }
    })"));
    assert(near(nested.thresholds.edge_keep, 0.70f));
    assert(near(nested.thresholds.auto_dedup, 0.97f));
    assert(near(nested.thresholds.high_bucket, 0.90f));
    assert(nested.max_iterations == 4);
    nested.validate();

    threw = false;
    try {
        CurationConfig::from_json(nlohmann::json::parse(R"({"top_k": "many"})"));
    } catch (const ConfigurationError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        CurationConfig::from_json(nlohmann::json::parse(R"({"algorithm": "kmeans"})"));
    } catch (const ConfigurationError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        CurationConfig::load("/tmp/viveka_test_no_such_config.json");
    } catch (const ConfigurationError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_blend() {
    std::cout << "Testing score blending..." << std::endl;

    assert(near(blend(0.9f, std::nullopt), 0.9f));
    assert(near(blend(0.9f, 0.6f), 0.81f));
    assert(near(blend(0.5f, 1.0f, BlendWeights{0.5f, 0.5f}), 0.75f));

    std::cout << "  PASS" << std::endl;
}

void test_policy_buckets() {
    std::cout << "Testing DecisionPolicy buckets..." << std::endl;

    CurationConfig config;
    DecisionPolicy policy(config);
    assert(policy.bucket(0.99f) == Bucket::Auto);
    assert(policy.bucket(0.98f) == Bucket::Auto);
    assert(policy.bucket(0.95f) == Bucket::High);
    assert(policy.bucket(0.80f) == Bucket::Medium);
    assert(policy.bucket(0.60f) == Bucket::Low);
    assert(policy.bucket(0.30f) == Bucket::None);

    assert(policy.route(0.99f) == Route::AutoMerge);
    assert(policy.route(0.80f) == Route::Review);
    assert(policy.route(0.60f) == Route::Borderline);
    assert(policy.route(0.30f) == Route::Ignore);

    config.include_borderline = true;
    DecisionPolicy borderline(config);
    assert(borderline.route(0.60f) == Route::Review);

    assert(parse_bucket("borderline") == Bucket::Low);
    assert(!parse_bucket("urgent"));

    CurationConfig bad;
    bad.thresholds.medium_bucket = 0.50f;
    bool threw = false;
    try {
        DecisionPolicy invalid(bad);
    } catch (const ConfigurationError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_size_score() {
    std::cout << "Testing community scoring..." << std::endl;

    assert(near(size_score(2), 2.0f / 3.0f));
    assert(near(size_score(3), 1.0f));
    assert(near(size_score(10), 1.0f));
    assert(near(size_score(20), 0.5f));

    SimilarityGraph graph("DEV");
    graph.add_edge(make_edge("A", "B", 0.9f));
    graph.add_edge(make_edge("B", "C", 0.8f));
    Community comm;
    comm.members = {"A", "B", "C"};
    score_community(comm, graph);
    assert(near(comm.avg_similarity, 0.85f));
    assert(near(comm.density, 2.0f / 3.0f));
    assert(near(comm.priority, 0.6f * 0.85f + 0.3f * (2.0f / 3.0f) + 0.1f));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Graph, triads, communities
// ═══════════════════════════════════════════════════════════════════════════

void test_graph_builder() {
    std::cout << "Testing GraphBuilder..." << std::endl;

    ItemPool pool({make_item("A"), make_item("B"), make_item("C"),
                   make_item("D", "DEV", ItemStatus::Rejected), make_item("X", "OPS")});
    StaticVectors vectors;
    for (const char* id : {"A", "B", "C", "D"}) vectors.set_category(id, "DEV");
    vectors.set_category("X", "OPS");
    vectors.set("A", "B", 0.95f);
    vectors.set("A", "C", 0.60f);
    vectors.set("A", "D", 0.97f);
    vectors.set("A", "X", 0.99f);

    CurationConfig config;
    GraphBuilder builder(vectors, nullptr, config);
    auto graphs = builder.build_all(pool);
    assert(graphs.size() == 2);

    const SimilarityGraph& dev = graphs.at("DEV");
    assert(dev.node_count() == 3);
    assert(dev.edge_count() == 1);
    assert(near(*dev.score("B", "A"), 0.95f));
    assert(!dev.score("A", "C"));
    assert(!dev.score("A", "D"));
    assert(dev.stats.cross_category == 1);
    assert(dev.stats.stale_neighbors == 1);
    assert(dev.stats.below_threshold == 2);

    const SimilarityGraph& ops = graphs.at("OPS");
    assert(ops.node_count() == 1);
    assert(ops.edge_count() == 0);
    assert(ops.stats.cross_category == 1);

    // Rebuild from cache
    assert(vectors.calls == 4);
    graphs = builder.build_all(pool);
    assert(vectors.calls == 4);
    assert(graphs.at("DEV").stats.cache_hits == 3);

    builder.invalidate("B");
    assert(!builder.cache().contains("B"));
    assert(!builder.cache().contains("A"));
    assert(builder.cache().contains("C"));

    vectors.bump();
    builder.build_all(pool);
    assert(vectors.calls == 8);

    vectors.fail = true;
    vectors.bump();
    bool threw = false;
    try {
        builder.build(pool, "DEV");
    } catch (const ProviderUnavailable& e) {
        threw = e.provider() == "static-vectors";
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_graph_rerank() {
    std::cout << "Testing rerank blending..." << std::endl;

    std::string path = "/tmp/viveka_test_neighbors.jsonl";
    {
        std::ofstream out(path);
        out << R"({"type": "meta", "model": "test"})" << "\n";
        out << R"({"src": "A", "dst": "B", "embed_score": 0.90, "rerank_score": 0.60, "category": "DEV"})" << "\n";
        out << R"({"src": "B", "dst": "A", "weight": 0.90, "category": "DEV"})" << "\n";
        out << "not json\n";
    }
    NeighborFile file;
    assert(file.load(path) == 2);
    assert(file.has_rerank_scores());

    ItemPool pool({make_item("A"), make_item("B")});
    CurationConfig config;
    GraphBuilder builder(file, &file, config);
    auto graph = builder.build(pool, "DEV");
    const Edge* e = graph.edge("A", "B");
    assert(e != nullptr);
    assert(e->rerank_score.has_value());
    assert(near(e->blended_score, 0.81f));
    std::remove(path.c_str());

    bool threw = false;
    try {
        NeighborFile missing;
        missing.load("/tmp/viveka_test_missing_neighbors.jsonl");
    } catch (const ProviderUnavailable&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_embedding_index() {
    std::cout << "Testing EmbeddingIndex..." << std::endl;

    EmbeddingIndex index;
    assert(index.add("A", "DEV", {1.0f, 0.0f, 0.0f}));
    assert(index.add("B", "DEV", {0.9f, 0.1f, 0.0f}));
    assert(index.add("C", "DEV", {0.0f, 1.0f, 0.0f}));
    assert(index.add("X", "OPS", {1.0f, 0.0f, 0.0f}));
    assert(!index.add("Z", "DEV", {0.0f, 0.0f, 0.0f}));
    assert(!index.add("W", "DEV", {1.0f, 0.0f}));
    assert(index.size() == 4);
    assert(index.dimension() == 3);

    auto n = index.neighbors("A", 10);
    assert(n.size() == 2);
    assert(n[0].id == "B");
    assert(n[0].embed_score > 0.99f);
    assert(n[1].id == "C");
    for (const auto& neighbor : n) assert(neighbor.category == "DEV");

    uint64_t gen = index.generation();
    assert(index.remove("B"));
    assert(index.generation() > gen);
    assert(index.neighbors("A", 10).size() == 1);

    // No vector is an error, not an empty neighborhood
    bool threw = false;
    try {
        index.neighbors("B", 10);
    } catch (const ProviderUnavailable& e) {
        threw = true;
        assert(std::string(e.what()).find("no vector for B") != std::string::npos);
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_triads() {
    std::cout << "Testing TriadDetector..." << std::endl;

    SimilarityGraph graph("DEV");
    graph.add_edge(make_edge("A", "B", 0.88f));
    graph.add_edge(make_edge("B", "C", 0.87f));
    graph.add_edge(make_edge("A", "C", 0.65f));

    TriadDetector detector(0.85f);
    auto triads = detector.detect(graph);
    assert(triads.size() == 1);
    const Triad& t = triads[0];
    assert(t.b == "B");
    assert(t.a == "A" && t.c == "C");
    assert(t.ac && near(*t.ac, 0.65f));
    assert(t.close_pair() == PairKey::of("A", "B"));
    assert(t.distant() == "C");
    assert(t.recommendation().find("keep C separate") != std::string::npos);
    assert(in_triad(triads, "A", "C"));
    assert(!in_triad(triads, "A", "Q"));

    // Fully connected: no drift
    graph.add_edge(make_edge("A", "C", 0.90f));
    assert(detector.detect(graph).empty());

    // Missing A~C counts as low
    SimilarityGraph sparse("DEV");
    sparse.add_edge(make_edge("A", "B", 0.95f));
    sparse.add_edge(make_edge("B", "C", 0.93f));
    auto open = detector.detect(sparse);
    assert(open.size() == 1);
    assert(!open[0].ac);

    std::cout << "  PASS" << std::endl;
}

void test_louvain_determinism() {
    std::cout << "Testing Louvain communities..." << std::endl;

    SimilarityGraph graph("DEV");
    std::vector<ItemId> left = {"a1", "a2", "a3", "a4"};
    std::vector<ItemId> right = {"b1", "b2", "b3", "b4"};
    for (size_t i = 0; i < 4; ++i) {
        for (size_t j = i + 1; j < 4; ++j) {
            graph.add_edge(make_edge(left[i], left[j], 0.9f));
            graph.add_edge(make_edge(right[i], right[j], 0.9f));
        }
    }
    graph.add_edge(make_edge("a1", "b1", 0.73f));
    graph.add_node("lonely");

    auto first = louvain(graph, 42, 1.0);
    auto second = louvain(graph, 42, 1.0);
    assert(first == second);
    assert(first.size() == 3);
    assert(first[0] == left);
    assert(first[1] == right);

    CurationConfig config;
    CommunityDetector detector(config);
    std::map<std::string, SimilarityGraph> graphs;
    graphs.emplace("DEV", graph);
    auto communities = detector.detect_all(graphs);
    assert(communities.size() == 2);
    assert(communities[0].id == "COMM-001");
    assert(communities[1].id == "COMM-002");
    assert(communities[0].members == left);
    assert(near(communities[0].avg_similarity, 0.9f));
    assert(near(communities[0].density, 1.0f));
    assert(near(communities[0].priority, 0.94f));
    assert(!communities[0].oversized);

    config.max_community_size = 3;
    CommunityDetector small(config);
    assert(small.detect(graph)[0].oversized);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Pool, audit log, store
// ═══════════════════════════════════════════════════════════════════════════

void test_merge_flattening() {
    std::cout << "Testing merge flattening..." << std::endl;

    ItemPool pool({make_item("A"), make_item("B"), make_item("C", "DEV", ItemStatus::Synced)});
    assert(*pool.default_canonical({"A", "B", "C"}) == "C");
    assert(*pool.default_canonical({"B", "A"}) == "A");

    pool.apply(pool.plan_merge({"A", "B"}, "A", 2000));
    assert(pool.get("B")->merged());
    assert(*pool.get("B")->canonical_of == "A");

    // Absorbing A re-points B at the new survivor
    auto images = pool.plan_merge({"A", "C"}, "C", 3000);
    assert(images.size() == 2);
    pool.apply(images);
    assert(*pool.get("A")->canonical_of == "C");
    assert(*pool.get("B")->canonical_of == "C");
    assert(*pool.resolve("B") == "C");
    assert(pool.chain_violations().empty());
    assert(pool.active_count() == 1);

    // Merging into an absorbed item resolves to its survivor
    ItemPool second({make_item("P"), make_item("Q"), make_item("R")});
    second.apply(second.plan_merge({"P", "Q"}, "P", 2000));
    auto into_merged = second.plan_merge({"R", "Q"}, "Q", 3000);
    assert(into_merged.size() == 1);
    assert(*into_merged[0].canonical_of == "P");

    // Explicit reject releases dependents
    auto rejected = pool.plan_reject("C", 4000);
    pool.apply(rejected);
    assert(pool.get("C")->status == ItemStatus::Rejected);
    assert(!pool.get("C")->canonical_of);
    assert(pool.get("A")->status == ItemStatus::Pending);
    assert(pool.get("B")->status == ItemStatus::Pending);
    assert(pool.chain_violations().empty());

    auto copy = pool.plan_split_copy("A", 5000);
    assert(copy && copy->id == "A_split_1");
    pool.put(*copy);
    assert(pool.plan_split_copy("A", 5001)->id == "A_split_2");

    std::cout << "  PASS" << std::endl;
}

void test_sqlite_store() {
    std::cout << "Testing SqliteStore..." << std::endl;

    std::string path = "/tmp/viveka_test_store.db";
    std::remove(path.c_str());
    std::remove((path + "-wal").c_str());
    std::remove((path + "-shm").c_str());

    {
        SqliteStore store;
        assert(store.open(path));
        Item item = make_item("EXP-1", "DEV", ItemStatus::Synced);
        assert(store.put_item(item));
        assert(store.put_item(make_item("EXP-2")));

        Item absorbed = make_item("EXP-2");
        absorbed.status = ItemStatus::Rejected;
        absorbed.canonical_of = "EXP-1";

        DecisionRecord record;
        record.session_id = "review-high-1";
        record.subject = {"EXP-1", "EXP-2"};
        record.target = "EXP-1";
        record.action = Action::Merge;
        record.actor = Actor::Human;
        record.rationale = "same fix, \"quoted\"";
        record.user = "ana";
        record.timestamp = 1700000000123;
        assert(store.commit(record, {absorbed}));
        assert(record.seq == 1);

        assert(store.put_state("review:high", R"({"cursor": 3})"));
        assert(store.put_state("review:high", R"({"cursor": 4})"));

        ManualReviewEntry entry;
        entry.session_id = "overnight-1";
        entry.round = 2;
        entry.community_id = "COMM-004";
        entry.category = "DEV";
        entry.members = {"EXP-1", "EXP-9"};
        entry.reason = "low confidence";
        entry.queued_at = 1700000000000;
        assert(store.enqueue_manual(entry));
        assert(entry.id == 1);
    }

    SqliteStore store;
    assert(store.open(path));
    auto items = store.load_items();
    assert(items.size() == 2);
    assert(items[0].id == "EXP-1" && items[0].status == ItemStatus::Synced);
    assert(items[1].merged() && *items[1].canonical_of == "EXP-1");

    auto decisions = store.decisions();
    assert(decisions.size() == 1);
    assert(store.decision_count() == 1);
    const auto& r = decisions[0];
    assert(r.seq == 1);
    assert(r.subject == std::vector<ItemId>({"EXP-1", "EXP-2"}));
    assert(r.target && *r.target == "EXP-1");
    assert(r.action == Action::Merge && r.actor == Actor::Human);
    assert(r.rationale == "same fix, \"quoted\"");
    assert(r.timestamp == 1700000000123);

    assert(*store.get_state("review:high") == R"({"cursor": 4})");
    assert(store.erase_state("review:high"));
    assert(!store.get_state("review:high"));

    auto manual = store.manual_queue();
    assert(manual.size() == 1);
    assert(manual[0].community_id == "COMM-004");
    assert(manual[0].members.size() == 2);

    store.close();
    std::remove(path.c_str());
    std::remove((path + "-wal").c_str());
    std::remove((path + "-shm").c_str());

    std::cout << "  PASS" << std::endl;
}

void test_write_ahead_failure() {
    std::cout << "Testing write-ahead commit failure..." << std::endl;

    SqliteStore inner;
    assert(inner.open(":memory:"));
    FailingStore store(inner);
    ItemPool pool({make_item("A"), make_item("B")});
    for (const auto& [_, item] : pool.items()) store.put_item(item);
    AuditLog audit(&store, pool);

    DecisionRecord record;
    record.session_id = "s";
    record.subject = {"A", "B"};
    record.target = "A";
    record.action = Action::Merge;
    record.actor = Actor::Human;
    record.rationale = "duplicate";

    store.fail_commit = true;
    assert(!audit.commit(record, pool.plan_merge({"A", "B"}, "A", now())));
    assert(pool.is_active("B"));
    assert(audit.committed() == 0);
    assert(inner.decision_count() == 0);
    assert(audit.last_error().find("injected") != std::string::npos);

    // Human decisions need a reason
    store.fail_commit = false;
    DecisionRecord silent = record;
    silent.rationale.clear();
    assert(!audit.commit(silent, pool.plan_merge({"A", "B"}, "A", now())));
    assert(pool.is_active("B"));

    assert(audit.commit(record, pool.plan_merge({"A", "B"}, "A", now())));
    assert(!pool.is_active("B"));
    assert(inner.decision_count() == 1);
    assert(audit.records()[0].seq == 1);
    assert(audit.records()[0].timestamp > 0);

    // Review command refused by the store leaves the session where it was
    ItemPool triad_pool({make_item("T1"), make_item("T2"), make_item("T3")});
    AuditLog triad_audit(&store, triad_pool);
    StateManager states(&store);
    SessionState state;
    state.session_id = "review-high-test";
    state.bucket = "high";
    ReviewCandidate c;
    c.kind = CandidateKind::Triad;
    c.category = "DEV";
    c.members = {"T1", "T2", "T3"};
    c.scores = {{"T1", "T2", 0.95f}, {"T2", "T3", 0.93f}};
    state.queue.push_back(c);

    ReviewSession session(triad_audit, states, "review:high", state, "ana");
    store.fail_commit = true;
    auto result = session.handle("merge_ab -- same fix");
    assert(!result.ok && !result.mutated);
    assert(result.message.find("not applied") == 0);
    assert(session.phase() == ReviewPhase::AwaitingInput);
    assert(session.state().cursor == 0);
    assert(triad_pool.active_count() == 3);

    std::cout << "  PASS" << std::endl;
}

void test_audit_export() {
    std::cout << "Testing decision export..." << std::endl;

    DecisionRecord r;
    r.session_id = "review-high-1";
    r.subject = {"A", "B"};
    r.target = "A";
    r.action = Action::Merge;
    r.actor = Actor::Human;
    r.rationale = "same, but worded differently";
    r.user = "ana";
    r.timestamp = 0;

    DecisionRecord other = r;
    other.subject = {"C"};
    other.target.reset();
    other.action = Action::Reject;

    auto lineage = AuditLog::lineage({r, other}, "B");
    assert(lineage.size() == 1);
    auto j = decision_to_json(lineage[0]);
    assert(j["action"] == "MERGE");
    assert(j["actor"] == "HUMAN");
    assert(j["target"] == "A");
    assert(j["subject"].size() == 2);
    assert(!decision_to_json(other).contains("target"));

    std::string path = "/tmp/viveka_test_decisions.csv";
    assert(AuditLog::export_csv({r, other}, path));
    std::ifstream in(path);
    std::string header, first;
    std::getline(in, header);
    std::getline(in, first);
    assert(header == "timestamp,user,session,round,action,actor,subject,target,rationale");
    assert(first == "1970-01-01T00:00:00.000Z,ana,review-high-1,0,MERGE,HUMAN,A;B,A,"
                    "\"same, but worded differently\"");
    std::remove(path.c_str());

    std::cout << "  PASS" << std::endl;
}

void test_item_json() {
    std::cout << "Testing item import format..." << std::endl;

    std::string error;
    auto item = item_from_json(nlohmann::json::parse(
        R"({"id": "EXP-7", "type": "DEV", "content": "run the linter", "sync_status": 1})"), error);
    assert(item);
    assert(item->category == "DEV");
    assert(item->body == "run the linter");
    assert(item->status == ItemStatus::Synced);
    assert(item->embedding_ref == "EXP-7");

    assert(!item_from_json(nlohmann::json::parse(R"({"title": "no id"})"), error));
    assert(error.find("id") != std::string::npos);
    assert(!item_from_json(nlohmann::json::parse(R"({"id": "X", "category": "DEV", "status": "lost"})"), error));

    auto j = item_to_json(*item);
    assert(j["status"] == "SYNCED");
    assert(!j.contains("canonical_of"));

    std::cout << "  PASS" << std::endl;
}

void test_import_items() {
    std::cout << "Testing item import..." << std::endl;

    SqliteStore store;
    assert(store.open(":memory:"));
    assert(store.put_item(make_item("K1")));

    std::istringstream in(
        "{\"id\": \"A1\", \"category\": \"DEV\", \"status\": \"pending\"}\n"
        "{\"id\": \"A2\", \"category\": \"DEV\", \"status\": \"rejected\", \"canonical_of\": \"A1\"}\n"
        "{\"id\": \"A3\", \"category\": \"DEV\", \"status\": \"rejected\", \"canonical_of\": \"GONE\"}\n"
        "{\"id\": \"A4\", \"category\": \"DEV\", \"status\": \"rejected\", \"canonical_of\": \"K1\"}\n"
        "{\"id\": \"A5\", \"category\": \"DEV\", \"status\": \"rejected\", \"canonical_of\": \"A6\"}\n"
        "\n"
        "not json\n"
        "{\"id\": \"A6\", \"category\": \"DEV\", \"status\": \"synced\"}\n"
        "{\"id\": \"A7\", \"category\": \"DEV\", \"status\": \"rejected\", \"canonical_of\": \"A2\"}\n");

    auto result = import_items(store, in, "inline");
    assert(!result.failed);
    assert(result.imported == 5);
    assert(result.skipped == 1);
    assert(result.dangling == 2);

    ItemPool pool(store.load_items());
    assert(pool.get("A2") && *pool.get("A2")->canonical_of == "A1");
    assert(pool.get("A5") && *pool.get("A5")->canonical_of == "A6");
    assert(!pool.get("A3"));
    assert(!pool.get("A7"));
    assert(pool.chain_violations().empty());

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Auto-dedup and review
// ═══════════════════════════════════════════════════════════════════════════

void test_auto_dedup_scenario() {
    std::cout << "Testing auto-dedup over 100 items..." << std::endl;

    SqliteStore store;
    assert(store.open(":memory:"));
    StaticVectors vectors;
    for (int i = 0; i < 100; ++i) {
        char id[16];
        snprintf(id, sizeof(id), "DEV-%03d", i);
        store.put_item(make_item(id));
        vectors.set_category(id, "DEV");
    }
    vectors.set("DEV-010", "DEV-011", 0.99f);
    vectors.set("DEV-020", "DEV-021", 0.985f);
    vectors.set("DEV-030", "DEV-031", 0.80f);
    vectors.set("DEV-040", "DEV-041", 0.95f);

    CurationConfig config;
    ItemPool pool(store.load_items());
    AuditLog audit(&store, pool);
    GraphBuilder builder(vectors, nullptr, config);
    AutoDedup dedup(config, audit);

    auto result = dedup.run(builder.build_all(pool), "dedup-test");
    assert(!result.failed);
    assert(result.groups == 2);
    assert(result.merged_items == 2);
    assert(pool.active_count() == 98);
    assert(pool.count(ItemStatus::Rejected) == 2);
    assert(*pool.get("DEV-011")->canonical_of == "DEV-010");
    assert(*pool.get("DEV-021")->canonical_of == "DEV-020");

    auto records = store.decisions();
    assert(records.size() == 2);
    for (const auto& r : records) {
        assert(r.actor == Actor::AutoThreshold);
        assert(r.action == Action::Merge);
        assert(r.subject.size() == 2 && r.subject[0] < r.subject[1]);
        assert(r.target && *r.target == r.subject[0]);
        assert(r.rationale.find("auto_dedup") != std::string::npos);
    }
    assert(ItemPool(store.load_items()).active_count() == 98);

    // Idempotent
    auto again = dedup.run(builder.build_all(pool), "dedup-test-2");
    assert(again.merged_items == 0);
    assert(store.decision_count() == 2);

    // A~B and B~C at auto level but A~C missing: a chain, withheld
    SimilarityGraph chain("DEV");
    ItemPool chain_pool({make_item("A"), make_item("B"), make_item("C")});
    AuditLog chain_audit(nullptr, chain_pool, true);
    AutoDedup chain_dedup(config, chain_audit);
    chain.add_edge(make_edge("A", "B", 0.99f));
    chain.add_edge(make_edge("B", "C", 0.99f));
    size_t withheld = 0;
    assert(chain_dedup.plan(chain, &withheld).empty());
    assert(withheld == 1);

    chain.add_edge(make_edge("A", "C", 0.93f));
    assert(chain_dedup.plan(chain).size() == 1);

    // A~B at auto level, B~C high, A~C missing: {A,B} is part of a drift triad
    SimilarityGraph drift("DEV");
    drift.add_edge(make_edge("A", "B", 0.99f));
    drift.add_edge(make_edge("B", "C", 0.93f));
    assert(TriadDetector(config.thresholds.high_bucket).detect(drift).size() == 1);
    withheld = 0;
    assert(chain_dedup.plan(drift, &withheld).empty());
    assert(withheld == 1);

    std::map<std::string, SimilarityGraph> drift_graphs;
    drift_graphs.emplace("DEV", drift);
    auto drift_result = chain_dedup.run(drift_graphs, "dedup-drift");
    assert(drift_result.merged_items == 0);
    assert(chain_pool.is_active("A") && chain_pool.is_active("B"));
    assert(chain_pool.get("B")->status == ItemStatus::Pending);

    std::cout << "  PASS" << std::endl;
}

void test_review_queue() {
    std::cout << "Testing review queue construction..." << std::endl;

    SimilarityGraph graph("DEV");
    graph.add_edge(make_edge("A", "B", 0.95f));
    graph.add_edge(make_edge("B", "C", 0.93f));
    graph.add_edge(make_edge("M1", "M2", 0.80f));
    graph.add_edge(make_edge("M1", "M3", 0.80f));
    graph.add_edge(make_edge("M2", "M3", 0.80f));
    graph.add_edge(make_edge("Q1", "Q2", 0.85f));
    graph.add_edge(make_edge("R1", "R2", 0.78f));
    std::map<std::string, SimilarityGraph> graphs;
    graphs.emplace("DEV", graph);

    CurationConfig config;
    DecisionPolicy policy(config);
    auto triads = TriadDetector(config.thresholds.high_bucket).detect_all(graphs);
    auto communities = CommunityDetector(config).detect_all(graphs);
    assert(triads.size() == 1);

    auto high = build_review_queue(graphs, communities, triads, policy, Bucket::High);
    assert(high.size() == 1);
    assert(high[0].kind == CandidateKind::Triad);
    assert(high[0].members == std::vector<ItemId>({"A", "B", "C"}));

    auto medium = build_review_queue(graphs, communities, triads, policy, Bucket::Medium);
    assert(medium.size() == 3);
    assert(medium[0].kind == CandidateKind::Community);
    assert(medium[0].members == std::vector<ItemId>({"M1", "M2", "M3"}));
    assert(medium[0].ref.find("COMM-") == 0);
    assert(medium[1].kind == CandidateKind::Pair && medium[1].members[0] == "Q1");
    assert(medium[2].kind == CandidateKind::Pair && medium[2].members[0] == "R1");

    std::cout << "  PASS" << std::endl;
}

void test_review_triad_merge() {
    std::cout << "Testing triad review (merge_ab)..." << std::endl;

    SqliteStore store;
    assert(store.open(":memory:"));
    ItemPool pool({make_item("A"), make_item("B"), make_item("C")});
    for (const auto& [_, item] : pool.items()) store.put_item(item);

    SimilarityGraph graph("DEV");
    graph.add_edge(make_edge("A", "B", 0.95f));
    graph.add_edge(make_edge("B", "C", 0.93f));
    std::map<std::string, SimilarityGraph> graphs;
    graphs.emplace("DEV", graph);

    CurationConfig config;
    auto triads = TriadDetector(config.thresholds.high_bucket).detect_all(graphs);
    auto communities = CommunityDetector(config).detect_all(graphs);

    SessionState state;
    state.session_id = "review-high-test";
    state.bucket = "high";
    state.queue = build_review_queue(graphs, communities, triads, DecisionPolicy(config), Bucket::High);
    assert(state.queue.size() == 1);

    AuditLog audit(&store, pool);
    StateManager states(&store);
    ReviewSession session(audit, states, StateManager::review_key("high"), state, "ana");
    assert(session.render().find("A~C below keep") != std::string::npos);

    auto diff = session.handle("diff");
    assert(diff.ok && !diff.mutated);
    assert(store.decision_count() == 0);

    auto result = session.handle("merge_ab -- same fix, different wording");
    assert(result.ok && result.mutated);
    assert(session.phase() == ReviewPhase::Done);

    auto records = store.decisions();
    assert(records.size() == 1);
    assert(records[0].action == Action::Merge);
    assert(records[0].actor == Actor::Human);
    assert(records[0].subject == std::vector<ItemId>({"A", "B"}));
    assert(*records[0].target == "A");
    assert(records[0].user == "ana");
    assert(records[0].round == 0);

    assert(pool.is_active("A"));
    assert(!pool.is_active("B"));
    assert(pool.is_active("C"));
    assert(!pool.get("C")->canonical_of);

    std::cout << "  PASS" << std::endl;
}

void test_review_commands() {
    std::cout << "Testing review commands and resume..." << std::endl;

    SqliteStore store;
    assert(store.open(":memory:"));
    ItemPool pool({make_item("D1"), make_item("D2"), make_item("D3"), make_item("D4"),
                   make_item("P1"), make_item("P2")});
    for (const auto& [_, item] : pool.items()) store.put_item(item);

    SessionState state;
    state.session_id = "review-medium-test";
    state.bucket = "medium";
    ReviewCandidate comm;
    comm.kind = CandidateKind::Community;
    comm.category = "DEV";
    comm.members = {"D1", "D2", "D3", "D4"};
    comm.scores = {{"D1", "D2", 0.82f}, {"D3", "D4", 0.84f}, {"D2", "D3", 0.76f}};
    comm.score = 0.806f;
    comm.ref = "COMM-001";
    ReviewCandidate pair;
    pair.kind = CandidateKind::Pair;
    pair.category = "DEV";
    pair.members = {"P1", "P2"};
    pair.scores = {{"P1", "P2", 0.79f}};
    pair.score = 0.79f;
    state.queue = {comm, pair};

    AuditLog audit(&store, pool);
    StateManager states(&store);
    const std::string key = StateManager::review_key("medium");

    {
        ReviewSession session(audit, states, key, state, "ana");
        assert(!session.handle("bogus").ok);
        assert(!session.handle("\xc3\x89QUIT").ok);
        assert(!session.handle("merge_ab").ok);
        assert(session.handle("list").message.find("2 remaining") == 0);

        auto split = session.handle("split D1,D2 D3,D4 -- two distinct procedures");
        assert(split.ok && split.mutated);
        assert(session.state().queue.size() == 4);
        assert(session.state().cursor == 1);
        assert(session.current()->members == std::vector<ItemId>({"D1", "D2"}));
        assert(session.current()->ref == "COMM-001.1");
        assert(near(session.current()->score, 0.82f));

        auto keep = session.handle("keep -- different scope");
        assert(keep.ok && keep.mutated);
        assert(session.state().settled.count("DEV:D1,D2"));
        assert(session.state().cursor == 2);

        auto quit = session.handle("quit");
        assert(quit.ok);
        assert(session.phase() == ReviewPhase::Suspended);
        assert(!session.handle("keep").ok);
    }

    auto saved = states.load(key);
    assert(saved);
    assert(saved->cursor == 2);
    assert(saved->queue.size() == 4);
    assert(saved->queue[2].ref == "COMM-001.2");
    assert(saved->queue[3].kind == CandidateKind::Pair);

    std::vector<ItemId> changed;
    ReviewSession resumed(audit, states, key, *saved, "ana");
    resumed.on_content_changed([&changed](const ItemId& id) { changed.push_back(id); });
    assert(resumed.current()->members == std::vector<ItemId>({"D3", "D4"}));

    auto merge = resumed.handle("merge D4 -- newer entry is complete");
    assert(merge.ok && merge.mutated);
    assert(*pool.get("D3")->canonical_of == "D4");

    auto update = resumed.handle("update title Combined deploy checklist");
    assert(update.ok && update.mutated);
    assert(pool.get("D4")->title == "Combined deploy checklist");
    assert(changed == std::vector<ItemId>({"D4"}));

    assert(resumed.current()->members == std::vector<ItemId>({"P1", "P2"}));
    auto split_pair = resumed.handle("split P1 -- covers two topics");
    assert(split_pair.ok && split_pair.mutated);
    assert(pool.is_active("P1_split_1"));
    assert(pool.get("P1_split_1")->status == ItemStatus::Pending);
    assert(resumed.current()->members == std::vector<ItemId>({"P1", "P2"}));

    auto reject = resumed.handle("reject P2 spam entry");
    assert(reject.ok && reject.mutated);
    assert(pool.get("P2")->status == ItemStatus::Rejected);
    assert(!pool.get("P2")->canonical_of);
    assert(resumed.phase() == ReviewPhase::Done);

    auto records = store.decisions();
    assert(records.size() == 6);
    assert(records[0].action == Action::Split);
    assert(records[1].action == Action::KeepSeparate);
    assert(records[2].action == Action::Merge);
    assert(records[3].action == Action::Update);
    assert(records[4].action == Action::Split && *records[4].target == "P1_split_1");
    assert(records[5].action == Action::Reject && records[5].rationale == "spam entry");
    assert(AuditLog::lineage(records, "D4").size() == 3);

    // Store reflects the pool
    ItemPool reloaded(store.load_items());
    assert(reloaded.active_count() == pool.active_count());
    assert(reloaded.get("D4")->title == "Combined deploy checklist");

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Adjudication and the overnight loop
// ═══════════════════════════════════════════════════════════════════════════

void test_parse_verdict() {
    std::cout << "Testing adjudicator reply parsing..." << std::endl;

    std::vector<ItemId> ids = {"A", "B", "C"};

    auto all = parse_verdict(R"({"decision": "merge_all", "canonical": "A", "rationale": "dupes"})", ids);
    assert(all.kind == VerdictKind::Merge);
    assert(*all.canonical == "A");
    assert(all.subset == ids);
    assert(near(all.confidence, 1.0f));

    auto fenced = parse_verdict("Here you go:\n```json\n{\"decision\": \"KEEP_SEPARATE\", "
                                "\"notes\": \"different tools\", \"confidence\": 0.7}\n```", ids);
    assert(fenced.kind == VerdictKind::KeepSeparate);
    assert(fenced.rationale == "different tools");
    assert(near(fenced.confidence, 0.7f));

    auto subset = parse_verdict(R"({"decision": "merge_subset", "merges": [["B", "A"]],
                                    "rationale": "B restates A"})", ids);
    assert(subset.kind == VerdictKind::MergeSubset);
    assert(*subset.canonical == "A");
    assert(subset.subset == std::vector<ItemId>({"A", "B"}));

    auto covering = parse_verdict(R"({"decision": "merge_subset", "subset": ["A", "B", "C"],
                                      "rationale": "all the same"})", ids);
    assert(covering.kind == VerdictKind::Merge);

    auto split = parse_verdict(R"({"decision": "split", "groups": [["A", "B"], ["C"]],
                                   "rationale": "two topics"})", ids);
    assert(split.kind == VerdictKind::Split);
    assert(split.groups.size() == 2);

    auto manual = parse_verdict(R"({"decision": "manual_review"})", ids);
    assert(manual.kind == VerdictKind::ManualReview);
    assert(!manual.rationale.empty());
    assert(!manual.failed);

    // Non-ASCII bytes in the decision are an unknown decision, nothing more
    auto accented = parse_verdict("{\"decision\": \"MERGE_ALL\xc3\xa9\", \"rationale\": \"r\"}", ids);
    assert(accented.kind == VerdictKind::ManualReview);
    assert(accented.failed);

    // Everything below must fall back to manual review
    const char* ambiguous[] = {
        "no json here",
        R"({"decision": "merge_all", "canonical": "A"})",
        R"({"decision": "merge_all", "canonical": "Z", "rationale": "r"})",
        R"({"decision": "merge_all", "confidence": 1.5, "rationale": "r"})",
        R"({"decision": "merge_subset", "merges": [["B", "A"], ["C", "B"]], "rationale": "r"})",
        R"({"decision": "merge_subset", "subset": ["A"], "rationale": "r"})",
        R"({"decision": "split", "groups": [["A", "B"], ["B", "C"]], "rationale": "r"})",
        R"({"decision": "split", "rationale": "r"})",
        R"({"decision": "probably_merge", "rationale": "r"})",
        R"({"rationale": "r"})",
    };
    for (const char* reply : ambiguous) {
        auto v = parse_verdict(reply, ids);
        assert(v.kind == VerdictKind::ManualReview);
        assert(v.failed);
    }
    auto conflict = parse_verdict(ambiguous[4], ids);
    assert(conflict.rationale.find("conflicting merge targets") != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

void test_command_adjudicator() {
    std::cout << "Testing CommandAdjudicator..." << std::endl;

    AdjudicationRequest request;
    request.community_id = "COMM-001";
    request.category = "DEV";
    request.items = {make_item("A"), make_item("B")};
    request.edges = {make_edge("A", "B", 0.93f)};

    auto prompt = build_prompt(request);
    assert(prompt["members"].size() == 2);
    assert(prompt["pairwise"][0]["score"].get<float>() > 0.92f);

    std::string script = "/tmp/viveka_test_adjudicator.sh";
    {
        std::ofstream out(script);
        out << "#!/bin/sh\n"
            << "cat > /dev/null\n"
            << "echo '{\"decision\": \"keep_separate\", \"rationale\": \"distinct\", \"confidence\": 0.8}'\n";
    }
    CommandAdjudicator good("sh " + script, 10);
    auto verdict = good.decide(request);
    assert(verdict.kind == VerdictKind::KeepSeparate);
    assert(verdict.rationale == "distinct");

    // Echoing the prompt back is not a verdict
    CommandAdjudicator echo("cat", 10);
    assert(echo.decide(request).kind == VerdictKind::ManualReview);

    CommandAdjudicator failing("false", 10);
    assert(failing.decide(request).kind == VerdictKind::ManualReview);

    CommandAdjudicator missing("/tmp/viveka_test_no_such_command", 10);
    bool threw = false;
    try {
        missing.decide(request);
    } catch (const ProviderUnavailable&) {
        threw = true;
    }
    assert(threw);
    std::remove(script.c_str());

    std::cout << "  PASS" << std::endl;
}

void test_overnight_converges() {
    std::cout << "Testing overnight convergence..." << std::endl;

    Scenario s;
    ConvergenceLoop loop(s.config, s.pool(), &s.store, s.vectors, nullptr, &s.adjudicator);
    auto result = loop.run();

    assert(result.ok());
    assert(result.reason == StopReason::Converged);
    assert(result.state.round_counter == 2);
    assert(result.state.initial_active == 10);
    assert(result.final_active == 7);
    assert(result.decisions == 2);

    const auto& round1 = result.state.rounds[0];
    assert(round1.auto_merges == 1);
    assert(round1.merges == 2);
    assert(round1.communities == 1);
    assert(round1.items_before == 10 && round1.items_after == 7);
    assert(near(round1.improvement_rate, 0.3f));
    assert(near(result.state.rounds[1].improvement_rate, 0.0f));

    auto records = s.store.decisions();
    assert(records.size() == 2);
    assert(records[0].actor == Actor::AutoThreshold);
    assert(records[1].actor == Actor::Llm);
    assert(records[1].round == 1);
    assert(records[1].subject == std::vector<ItemId>({"E1", "E2", "E3"}));
    assert(*records[1].target == "E1");
    assert(records[1].rationale == "same procedure written three times");
    assert(s.adjudicator.calls == 1);

    auto checkpoint = StateManager(&s.store).load(StateManager::overnight_key());
    assert(checkpoint && checkpoint->stop_reason == "converged");

    // A finished run is not resumed
    ConvergenceLoop next(s.config, s.pool(), &s.store, s.vectors, nullptr, &s.adjudicator);
    auto fresh = next.run();
    assert(fresh.state.session_id != "" && fresh.state.rounds.size() == 1);
    assert(fresh.state.initial_active == 7);

    std::cout << "  PASS" << std::endl;
}

// Each build shows one auto-level pair: the first whose members are both
// still active. Every merge uncovers the next, so no round stalls.
class UnfoldingDuplicates : public VectorProvider {
public:
    explicit UnfoldingDuplicates(size_t pairs) : pairs_(pairs) {}

    void watch(const ItemPool& pool) { pool_ = &pool; }

    static ItemId member(size_t pair, char side) {
        char id[16];
        snprintf(id, sizeof(id), "D%zu%c", pair, side);
        return id;
    }

    std::vector<Neighbor> neighbors(const ItemId& id, size_t) override {
        for (size_t i = 0; i < pairs_; ++i) {
            ItemId a = member(i, 'a'), b = member(i, 'b');
            if (!pool_->is_active(a) || !pool_->is_active(b)) continue;
            if (id == a) return {{b, 0.99f, "DEV"}};
            if (id == b) return {{a, 0.99f, "DEV"}};
            return {};
        }
        return {};
    }

    uint64_t generation() const override { return pool_ ? pool_->count(ItemStatus::Rejected) : 0; }
    std::string name() const override { return "unfolding"; }

private:
    size_t pairs_;
    const ItemPool* pool_ = nullptr;
};

void test_overnight_iteration_cap() {
    std::cout << "Testing overnight iteration cap..." << std::endl;

    SqliteStore store;
    assert(store.open(":memory:"));
    const size_t pairs = 8;
    for (size_t i = 0; i < pairs; ++i) {
        store.put_item(make_item(UnfoldingDuplicates::member(i, 'a')));
        store.put_item(make_item(UnfoldingDuplicates::member(i, 'b')));
    }

    CurationConfig config;
    config.max_iterations = 3;
    assert(near(config.min_improvement_rate, 0.05f));

    UnfoldingDuplicates vectors(pairs);
    ConvergenceLoop loop(config, ItemPool(store.load_items()), &store, vectors, nullptr, nullptr);
    vectors.watch(loop.pool());
    auto result = loop.run();

    assert(result.reason == StopReason::MaxIterations);
    assert(result.state.round_counter == 3);
    assert(result.state.rounds.size() == 3);
    assert(result.state.stop_reason == "max_iterations");
    for (const auto& round : result.state.rounds) {
        assert(!round.failed);
        assert(round.items_after < round.items_before);
        assert(round.improvement_rate >= config.min_improvement_rate);
    }
    assert(result.final_active < 2 * pairs);
    assert(result.final_active > pairs);

    std::cout << "  PASS" << std::endl;
}

void test_overnight_resume() {
    std::cout << "Testing overnight resume..." << std::endl;

    Scenario straight;
    ConvergenceLoop uninterrupted(straight.config, straight.pool(), &straight.store,
                                  straight.vectors, nullptr, &straight.adjudicator);
    auto expected = uninterrupted.run();

    Scenario s;
    std::string session_id;
    {
        ConvergenceLoop first(s.config, s.pool(), &s.store, s.vectors, nullptr, &s.adjudicator);
        first.on_round([](const RoundReport& r) { return r.round < 1; });
        auto partial = first.run();
        assert(partial.reason == StopReason::Interrupted);
        assert(partial.state.round_counter == 1);
        assert(partial.state.stop_reason.empty());
        session_id = partial.state.session_id;
    }

    ConvergenceLoop second(s.config, s.pool(), &s.store, s.vectors, nullptr, &s.adjudicator);
    auto resumed = second.run();
    assert(resumed.reason == StopReason::Converged);
    assert(resumed.state.session_id == session_id);
    assert(resumed.state.round_counter == expected.state.round_counter);
    assert(resumed.state.initial_active == 10);
    assert(resumed.final_active == expected.final_active);
    assert(s.store.decision_count() == straight.store.decision_count());
    assert(s.pool().count(ItemStatus::Rejected) == straight.pool().count(ItemStatus::Rejected));

    std::cout << "  PASS" << std::endl;
}

void test_overnight_dry_run() {
    std::cout << "Testing overnight dry run..." << std::endl;

    Scenario s;
    ConvergenceLoop loop(s.config, s.pool(), &s.store, s.vectors, nullptr, &s.adjudicator, true);
    auto result = loop.run();

    assert(result.dry_run);
    assert(result.ok());
    assert(result.final_active == 7);
    assert(loop.pool().active_count() == 7);
    assert(loop.records().size() == 2);

    assert(s.store.decision_count() == 0);
    assert(!s.store.get_state(StateManager::overnight_key()));
    assert(s.store.manual_queue().empty());
    assert(s.pool().active_count() == 10);
    assert(morning_report(result).find("(dry run)") != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

void test_overnight_provider_failure() {
    std::cout << "Testing overnight provider failure..." << std::endl;

    Scenario s;
    s.vectors.fail = true;
    {
        ConvergenceLoop loop(s.config, s.pool(), &s.store, s.vectors, nullptr, &s.adjudicator);
        auto result = loop.run();
        assert(!result.ok());
        assert(result.reason == StopReason::ProviderFailure);
        assert(result.state.round_counter == 0);
        assert(result.state.rounds.size() == 1);
        assert(result.state.rounds[0].failed);
        assert(!result.warnings.empty());
        assert(s.store.decision_count() == 0);
    }

    auto checkpoint = StateManager(&s.store).load(StateManager::overnight_key());
    assert(checkpoint && checkpoint->round_counter == 0 && checkpoint->stop_reason.empty());

    s.vectors.fail = false;
    ConvergenceLoop retry(s.config, s.pool(), &s.store, s.vectors, nullptr, &s.adjudicator);
    auto result = retry.run();
    assert(result.reason == StopReason::Converged);
    assert(result.state.round_counter == 2);
    assert(result.state.rounds.size() == 3);
    assert(result.final_active == 7);

    std::cout << "  PASS" << std::endl;
}

void test_overnight_manual_routing() {
    std::cout << "Testing overnight manual routing..." << std::endl;

    // Low confidence
    {
        Scenario s;
        s.adjudicator.script({"E1", "E2", "E3"},
            R"({"decision": "merge_all", "canonical": "E1", "confidence": 0.3, "rationale": "maybe"})");
        ConvergenceLoop loop(s.config, s.pool(), &s.store, s.vectors, nullptr, &s.adjudicator);
        auto result = loop.run();

        assert(result.reason == StopReason::Converged);
        assert(result.final_active == 9);
        assert(result.state.rounds[0].manual == 1);
        assert(result.state.rounds[0].excluded_items == 3);
        assert(near(result.state.rounds[0].improvement_rate, 1.0f / 7.0f));
        assert(s.adjudicator.calls == 1);

        auto manual = s.store.manual_queue();
        assert(manual.size() == 1);
        assert(manual[0].community_id == "COMM-001");
        assert(manual[0].reason.find("low confidence") == 0);
        assert(manual[0].members == std::vector<ItemId>({"E1", "E2", "E3"}));

        std::string report = morning_report(result);
        assert(report.find("# Morning Report") == 0);
        assert(report.find("## Summary") != std::string::npos);
        assert(report.find("## Round Details") != std::string::npos);
        assert(report.find("## Manual Review Queue") != std::string::npos);
        assert(report.find("COMM-001 (DEV, round 1): E1, E2, E3 - low confidence") != std::string::npos);
        assert(report.find("Stop reason: converged") != std::string::npos);
        assert(report.find("Reduction: 10.00%") != std::string::npos);

        auto state = StateManager(&s.store).load(StateManager::overnight_key());
        auto summary = summary_from_state(*state, s.store.manual_queue(), s.pool());
        assert(summary.reason == StopReason::Converged);
        assert(summary.final_active == 9);
        auto j = summary_json(summary);
        assert(j["rounds_run"] == 2);
        assert(j["manual_queue"].size() == 1);
    }

    // Adjudicator unreachable: the community waits for a human, the run goes on
    {
        Scenario s;
        s.adjudicator.fail = true;
        ConvergenceLoop loop(s.config, s.pool(), &s.store, s.vectors, nullptr, &s.adjudicator);
        auto result = loop.run();
        assert(result.ok());
        assert(result.manual.size() == 1);
        assert(s.store.manual_queue().size() == 1);
    }

    // No adjudicator at all
    {
        Scenario s;
        ConvergenceLoop loop(s.config, s.pool(), &s.store, s.vectors, nullptr, nullptr);
        auto result = loop.run();
        assert(result.ok());
        assert(result.manual.size() == 1);
        assert(result.manual[0].reason == "no adjudicator configured");
        assert(result.final_active == 9);
    }

    // Keep separate settles the set
    {
        Scenario s;
        s.adjudicator.script({"E1", "E2", "E3"},
            R"({"decision": "keep_separate", "rationale": "three environments"})");
        s.config.min_improvement_rate = 0.0f;
        s.config.max_iterations = 3;
        ConvergenceLoop loop(s.config, s.pool(), &s.store, s.vectors, nullptr, &s.adjudicator);
        auto result = loop.run();
        assert(result.state.rounds[0].kept == 1);
        assert(s.adjudicator.calls == 1);
        assert(s.store.manual_queue().empty());
    }

    std::cout << "  PASS" << std::endl;
}

void test_overnight_split() {
    std::cout << "Testing adjudicated split..." << std::endl;

    Scenario s;
    s.adjudicator.script({"E1", "E2", "E3"},
        R"({"decision": "split", "groups": [["E1", "E2"], ["E3"]], "rationale": "E3 is about staging"})");
    s.adjudicator.script({"E1", "E2"},
        R"({"decision": "merge_all", "canonical": "E2", "rationale": "E1 is a draft of E2"})");
    s.adjudicator.script({"E2", "E3"},
        R"({"decision": "keep_separate", "rationale": "staging differs from production"})");
    ConvergenceLoop loop(s.config, s.pool(), &s.store, s.vectors, nullptr, &s.adjudicator);
    auto result = loop.run();

    assert(result.ok());
    assert(s.adjudicator.calls == 3);
    assert(*loop.pool().get("E1")->canonical_of == "E2");
    assert(loop.pool().is_active("E3"));

    auto records = s.store.decisions();
    assert(records.size() == 4);
    assert(records[1].action == Action::Split && records[1].actor == Actor::Llm);
    assert(records[2].action == Action::Merge && *records[2].target == "E2");
    assert(records[3].action == Action::KeepSeparate && records[3].round == 2);

    std::cout << "  PASS" << std::endl;
}

void test_overnight_stale_vectors() {
    std::cout << "Testing overnight with vectors for other items..." << std::endl;

    SqliteStore store;
    assert(store.open(":memory:"));
    for (const char* id : {"DEV-1", "DEV-2", "DEV-3"}) store.put_item(make_item(id));

    EmbeddingIndex index;
    assert(index.add("OTHER-1", "DEV", {1.0f, 0.0f}));
    assert(index.add("OTHER-2", "DEV", {0.9f, 0.1f}));

    CurationConfig config;
    ConvergenceLoop loop(config, ItemPool(store.load_items()), &store, index, nullptr, nullptr);
    auto result = loop.run();

    assert(!result.ok());
    assert(result.reason == StopReason::ProviderFailure);
    assert(result.state.round_counter == 0);
    assert(result.state.rounds.size() == 1 && result.state.rounds[0].failed);
    assert(result.state.rounds[0].error.find("no vector for DEV-1") != std::string::npos);
    assert(store.decision_count() == 0);

    std::cout << "  PASS" << std::endl;
}

void test_overnight_retries() {
    std::cout << "Testing adjudicator retries..." << std::endl;

    CurationConfig defaults;
    defaults.llm_retry_delays = {1, 2};
    assert(defaults.retry_delay(1) == 1);
    assert(defaults.retry_delay(2) == 2);
    assert(defaults.retry_delay(3) == 20);
    defaults.llm_retry_backoff = "linear";
    assert(defaults.retry_delay(3) == 15);
    defaults.llm_retry_backoff = "cubic";
    bool threw = false;
    try {
        defaults.validate();
    } catch (const ConfigurationError&) {
        threw = true;
    }
    assert(threw);

    auto loaded = CurationConfig::from_json(nlohmann::json::parse(
        R"({"max_retries": 3, "retry_delays": [0, 1], "retry_backoff": "linear", "batch_size": 4})"));
    assert(loaded.llm_max_retries == 3);
    assert(loaded.llm_retry_delays == std::vector<int>({0, 1}));
    assert(loaded.llm_retry_backoff == "linear");
    assert(loaded.batch_size == 4);

    // Two failures, two retries: the third call answers
    {
        Scenario s;
        s.config.llm_max_retries = 2;
        s.config.llm_retry_delays = {0, 0};
        s.adjudicator.fail_first = 2;
        ConvergenceLoop loop(s.config, s.pool(), &s.store, s.vectors, nullptr, &s.adjudicator);
        auto result = loop.run();
        assert(result.ok());
        assert(s.adjudicator.calls == 3);
        assert(result.manual.empty());
        assert(result.final_active == 7);
    }

    // Retries run out
    {
        Scenario s;
        s.config.llm_max_retries = 1;
        s.config.llm_retry_delays = {0};
        s.adjudicator.fail_first = 2;
        ConvergenceLoop loop(s.config, s.pool(), &s.store, s.vectors, nullptr, &s.adjudicator);
        auto result = loop.run();
        assert(result.ok());
        assert(s.adjudicator.calls == 2);
        assert(result.manual.size() == 1);
        assert(result.final_active == 9);
    }

    // An unparseable reply is retried like an outage
    {
        Scenario s;
        s.config.llm_max_retries = 2;
        s.config.llm_retry_delays = {0, 0};
        s.adjudicator.script({"E1", "E2", "E3"}, "I think these are the same?");
        ConvergenceLoop loop(s.config, s.pool(), &s.store, s.vectors, nullptr, &s.adjudicator);
        auto result = loop.run();
        assert(s.adjudicator.calls == 3);
        assert(result.manual.size() == 1);
        assert(result.manual[0].reason.find("ambiguous decision") == 0);
    }

    // A deliberate manual_review is an answer
    {
        Scenario s;
        s.config.llm_max_retries = 2;
        s.config.llm_retry_delays = {0, 0};
        s.adjudicator.script({"E1", "E2", "E3"},
            R"({"decision": "manual_review", "rationale": "needs the owning team"})");
        ConvergenceLoop loop(s.config, s.pool(), &s.store, s.vectors, nullptr, &s.adjudicator);
        auto result = loop.run();
        assert(s.adjudicator.calls == 1);
        assert(result.manual.size() == 1);
        assert(result.manual[0].reason == "needs the owning team");
    }

    std::cout << "  PASS" << std::endl;
}

void test_overnight_batch_size() {
    std::cout << "Testing overnight batch size..." << std::endl;

    Scenario s;
    for (const char* id : {"G1", "G2"}) {
        s.store.put_item(make_item(id));
        s.vectors.set_category(id, "DEV");
    }
    s.vectors.set("G1", "G2", 0.93f);
    s.adjudicator.script({"G1", "G2"},
        R"({"decision": "merge_all", "canonical": "G1", "confidence": 0.9, "rationale": "G2 repeats G1"})");
    s.config.batch_size = 1;

    ConvergenceLoop loop(s.config, s.pool(), &s.store, s.vectors, nullptr, &s.adjudicator);
    std::vector<size_t> calls_per_round;
    loop.on_round([&](const RoundReport&) {
        calls_per_round.push_back(s.adjudicator.calls);
        return true;
    });
    auto result = loop.run();

    assert(result.reason == StopReason::Converged);
    assert(calls_per_round.size() >= 2);
    assert(calls_per_round[0] == 1);
    assert(calls_per_round[1] == 2);
    assert(result.state.rounds[0].communities == 2);
    assert(result.final_active == 8);
    assert(!loop.pool().is_active("G2"));
    assert(!loop.pool().is_active("E2") && !loop.pool().is_active("E3"));

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Viveka Tests ===" << std::endl;
    std::cout << "version " << VIVEKA_VERSION << std::endl;
    std::cout << std::endl;

    log::set_min_level(log::Level::Error);

    test_config_validation();
    test_blend();
    test_policy_buckets();
    test_size_score();

    test_graph_builder();
    test_graph_rerank();
    test_embedding_index();
    test_triads();
    test_louvain_determinism();

    test_merge_flattening();
    test_sqlite_store();
    test_write_ahead_failure();
    test_audit_export();
    test_item_json();
    test_import_items();

    test_auto_dedup_scenario();
    test_review_queue();
    test_review_triad_merge();
    test_review_commands();

    std::cout << std::endl;
    std::cout << "=== Overnight ===" << std::endl;
    test_parse_verdict();
    test_command_adjudicator();
    test_overnight_converges();
    test_overnight_iteration_cap();
    test_overnight_resume();
    test_overnight_dry_run();
    test_overnight_provider_failure();
    test_overnight_manual_routing();
    test_overnight_split();
    test_overnight_stale_vectors();
    test_overnight_retries();
    test_overnight_batch_size();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
