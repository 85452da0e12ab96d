#pragma once
// Session state: resumable progress for review sessions and overnight runs
//
// Checkpointed as one JSON document per session key:
//   review:<bucket>    interactive queue + cursor
//   overnight          round counter, improvement history, round reports
// A checkpoint in an older layout is discarded, never half-read.

#include "log.hpp"
#include "store.hpp"
#include "version.hpp"
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <vector>

namespace viveka {

using json = nlohmann::json;

enum class CandidateKind : uint8_t {
    Pair = 0,
    Triad = 1,         // members = {a, pivot, c}
    Community = 2,
};

inline const char* candidate_kind_name(CandidateKind kind) {
    switch (kind) {
        case CandidateKind::Pair: return "pair";
        case CandidateKind::Triad: return "triad";
        case CandidateKind::Community: return "community";
    }
    return "pair";
}

inline std::optional<CandidateKind> parse_candidate_kind(const std::string& s) {
    if (s == "pair") return CandidateKind::Pair;
    if (s == "triad") return CandidateKind::Triad;
    if (s == "community") return CandidateKind::Community;
    return std::nullopt;
}

struct ScoredPair {
    ItemId a;
    ItemId b;
    float score = 0.0f;
};

// One unit of review work
struct ReviewCandidate {
    CandidateKind kind = CandidateKind::Pair;
    std::string category;
    std::vector<ItemId> members;
    std::vector<ScoredPair> scores;   // Pairwise scores at queue time
    float score = 0.0f;               // Pair score, triad close score or community average
    std::string ref;                  // COMM-### or empty

    std::optional<float> score_of(const ItemId& x, const ItemId& y) const {
        PairKey key = PairKey::of(x, y);
        for (const auto& s : scores) {
            if (PairKey::of(s.a, s.b) == key) return s.score;
        }
        return std::nullopt;
    }

    json to_json() const {
        json pairs = json::array();
        for (const auto& s : scores) pairs.push_back({s.a, s.b, s.score});
        return {
            {"kind", candidate_kind_name(kind)},
            {"category", category},
            {"members", members},
            {"scores", pairs},
            {"score", score},
            {"ref", ref}
        };
    }

    static ReviewCandidate from_json(const json& j) {
        ReviewCandidate c;
        c.kind = parse_candidate_kind(j.at("kind").get<std::string>()).value_or(CandidateKind::Pair);
        c.category = j.value("category", "");
        c.members = j.at("members").get<std::vector<ItemId>>();
        for (const auto& p : j.value("scores", json::array())) {
            c.scores.push_back({p.at(0).get<std::string>(), p.at(1).get<std::string>(),
                                p.at(2).get<float>()});
        }
        c.score = j.value("score", 0.0f);
        c.ref = j.value("ref", "");
        return c;
    }
};

// What one overnight round did
struct RoundReport {
    uint32_t round = 0;
    size_t communities = 0;
    size_t triads = 0;
    size_t items_before = 0;
    size_t items_after = 0;
    size_t auto_merges = 0;        // Items absorbed by the auto-dedup pass
    size_t merges = 0;             // Items absorbed by adjudicated merges
    size_t kept = 0;
    size_t manual = 0;             // Communities sent to the manual queue
    size_t deferred = 0;           // Conflicts pushed to the next round
    size_t excluded_items = 0;     // Members of manual communities
    size_t decisions = 0;
    float improvement_rate = 0.0f;
    bool failed = false;
    std::string error;

    json to_json() const {
        return {
            {"round", round}, {"communities", communities}, {"triads", triads},
            {"items_before", items_before}, {"items_after", items_after},
            {"auto_merges", auto_merges}, {"merges", merges}, {"kept", kept},
            {"manual", manual}, {"deferred", deferred}, {"excluded_items", excluded_items},
            {"decisions", decisions}, {"improvement_rate", improvement_rate},
            {"failed", failed}, {"error", error}
        };
    }

    static RoundReport from_json(const json& j) {
        RoundReport r;
        r.round = j.value("round", 0u);
        r.communities = j.value("communities", size_t{0});
        r.triads = j.value("triads", size_t{0});
        r.items_before = j.value("items_before", size_t{0});
        r.items_after = j.value("items_after", size_t{0});
        r.auto_merges = j.value("auto_merges", size_t{0});
        r.merges = j.value("merges", size_t{0});
        r.kept = j.value("kept", size_t{0});
        r.manual = j.value("manual", size_t{0});
        r.deferred = j.value("deferred", size_t{0});
        r.excluded_items = j.value("excluded_items", size_t{0});
        r.decisions = j.value("decisions", size_t{0});
        r.improvement_rate = j.value("improvement_rate", 0.0f);
        r.failed = j.value("failed", false);
        r.error = j.value("error", "");
        return r;
    }
};

struct SessionState {
    int format = VIVEKA_STATE_FORMAT_VERSION;
    std::string session_id;
    std::string bucket;
    std::vector<ReviewCandidate> queue;
    size_t cursor = 0;                       // Next candidate to present
    uint32_t round_counter = 0;              // Last completed round
    std::vector<float> improvement_history;
    std::vector<RoundReport> rounds;
    std::set<std::string> settled;           // Member signatures not to re-ask
    size_t initial_active = 0;
    std::string stop_reason;                 // Empty while still running
    Timestamp updated_at = 0;

    bool exhausted() const { return cursor >= queue.size(); }

    json to_json() const {
        json q = json::array();
        for (const auto& c : queue) q.push_back(c.to_json());
        json r = json::array();
        for (const auto& round : rounds) r.push_back(round.to_json());
        return {
            {"format", format},
            {"session_id", session_id},
            {"bucket", bucket},
            {"queue", q},
            {"cursor", cursor},
            {"round_counter", round_counter},
            {"improvement_history", improvement_history},
            {"rounds", r},
            {"settled", settled},
            {"initial_active", initial_active},
            {"stop_reason", stop_reason},
            {"updated_at", updated_at}
        };
    }

    static SessionState from_json(const json& j) {
        SessionState s;
        s.format = j.value("format", 0);
        s.session_id = j.value("session_id", "");
        s.bucket = j.value("bucket", "");
        for (const auto& c : j.value("queue", json::array())) {
            s.queue.push_back(ReviewCandidate::from_json(c));
        }
        s.cursor = j.value("cursor", size_t{0});
        s.round_counter = j.value("round_counter", 0u);
        s.improvement_history = j.value("improvement_history", std::vector<float>{});
        for (const auto& r : j.value("rounds", json::array())) {
            s.rounds.push_back(RoundReport::from_json(r));
        }
        s.settled = j.value("settled", std::set<std::string>{});
        s.initial_active = j.value("initial_active", size_t{0});
        s.stop_reason = j.value("stop_reason", "");
        s.updated_at = j.value("updated_at", Timestamp{0});
        return s;
    }
};

// Checkpoint persistence over the store's kv table
class StateManager {
public:
    explicit StateManager(Store* store) : store_(store) {}

    bool save(const std::string& key, SessionState& state) {
        if (!store_) return true;
        state.updated_at = now();
        if (!store_->put_state(key, state.to_json().dump())) {
            log::error("state", "checkpoint %s failed: %s", key.c_str(), store_->last_error().c_str());
            return false;
        }
        log::debug("state", "checkpoint %s (cursor %zu, round %u)",
                   key.c_str(), state.cursor, state.round_counter);
        return true;
    }

    std::optional<SessionState> load(const std::string& key) {
        if (!store_) return std::nullopt;
        auto raw = store_->get_state(key);
        if (!raw) return std::nullopt;
        try {
            auto state = SessionState::from_json(json::parse(*raw));
            if (!version::state_compatible(state.format)) {
                log::warn("state", "discarding %s: format %d, expected %d",
                          key.c_str(), state.format, VIVEKA_STATE_FORMAT_VERSION);
                return std::nullopt;
            }
            return state;
        } catch (const json::exception& e) {
            log::warn("state", "discarding unreadable checkpoint %s: %s", key.c_str(), e.what());
            return std::nullopt;
        }
    }

    bool reset(const std::string& key) {
        if (!store_) return true;
        return store_->erase_state(key);
    }

    static std::string review_key(const std::string& bucket) { return "review:" + bucket; }
    static std::string overnight_key() { return "overnight"; }

private:
    Store* store_;
};

} // namespace viveka
