#pragma once
// Core types: items, edges, communities, decisions
//
// Items are partitioned by category. Nothing is ever deleted:
// a merged item becomes Rejected and points at its canonical.

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace viveka {

// Timestamp as Unix millis
using Timestamp = int64_t;

inline Timestamp now() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

// UTC ISO-8601 with milliseconds
inline std::string iso8601(Timestamp ts) {
    std::time_t secs = static_cast<std::time_t>(ts / 1000);
    std::tm tm_utc{};
    gmtime_r(&secs, &tm_utc);
    char buf[40];
    size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_utc);
    snprintf(buf + n, sizeof(buf) - n, ".%03dZ", static_cast<int>(ts % 1000));
    return buf;
}

// Category-scoped stable identifier (e.g. "EXP-00042")
using ItemId = std::string;

// Values match the sync_status column of the upstream store
enum class ItemStatus : uint8_t {
    Pending = 0,
    Synced = 1,
    Rejected = 2,
};

inline const char* status_name(ItemStatus status) {
    switch (status) {
        case ItemStatus::Pending: return "PENDING";
        case ItemStatus::Synced: return "SYNCED";
        case ItemStatus::Rejected: return "REJECTED";
    }
    return "PENDING";
}

inline std::optional<ItemStatus> parse_status(const std::string& s) {
    if (s == "PENDING" || s == "pending" || s == "0") return ItemStatus::Pending;
    if (s == "SYNCED" || s == "synced" || s == "1") return ItemStatus::Synced;
    if (s == "REJECTED" || s == "rejected" || s == "2") return ItemStatus::Rejected;
    return std::nullopt;
}

// A knowledge unit contributed by a user
struct Item {
    ItemId id;
    std::string category;          // Partition key, never compared across
    std::string title;
    std::string body;              // Text the embedding was computed from
    std::string embedding_ref;     // Handle into the vector provider
    ItemStatus status = ItemStatus::Pending;
    std::optional<ItemId> canonical_of;  // Surviving item when merged away
    Timestamp created_at = 0;
    Timestamp updated_at = 0;

    bool active() const { return status != ItemStatus::Rejected; }

    // Rejected through a merge (as opposed to an explicit reject)
    bool merged() const { return status == ItemStatus::Rejected && canonical_of.has_value(); }
};

// Unordered pair key: lexicographically smaller id first
struct PairKey {
    ItemId a;
    ItemId b;

    static PairKey of(const ItemId& x, const ItemId& y) {
        return (x < y) ? PairKey{x, y} : PairKey{y, x};
    }

    bool operator==(const PairKey& other) const { return a == other.a && b == other.b; }
    bool operator!=(const PairKey& other) const { return !(*this == other); }
    bool operator<(const PairKey& other) const {
        return a < other.a || (a == other.a && b < other.b);
    }

    std::string to_string() const { return a + "|" + b; }
};

// Embed/rerank blend weights
struct BlendWeights {
    float embed = 0.7f;
    float rerank = 0.3f;
};

inline float blend(float embed_score, std::optional<float> rerank_score,
                   const BlendWeights& weights = {}) {
    if (!rerank_score) return embed_score;
    return weights.embed * embed_score + weights.rerank * *rerank_score;
}

// Scored relationship between two items of the same category
struct Edge {
    ItemId a_id;
    ItemId b_id;
    float embed_score = 0.0f;
    std::optional<float> rerank_score;  // Absent: blended falls back to embed
    float blended_score = 0.0f;

    PairKey key() const { return PairKey::of(a_id, b_id); }

    bool touches(const ItemId& id) const { return a_id == id || b_id == id; }

    const ItemId& other(const ItemId& id) const { return a_id == id ? b_id : a_id; }
};

// Cluster of mutually similar items (recomputed every round, never stored)
struct Community {
    std::string id;                 // COMM-### in priority order
    std::string category;
    std::vector<ItemId> members;    // Sorted, size >= 2
    float avg_similarity = 0.0f;
    float density = 0.0f;
    float priority = 0.0f;
    bool oversized = false;

    size_t size() const { return members.size(); }

    bool contains(const ItemId& id) const {
        return std::binary_search(members.begin(), members.end(), id);
    }
};

// Decision actions
enum class Action : uint8_t {
    Merge = 0,
    MergeSubset = 1,
    KeepSeparate = 2,
    Reject = 3,
    Split = 4,
    Update = 5,
};

enum class Actor : uint8_t {
    Human = 0,
    Llm = 1,
    AutoThreshold = 2,
};

inline const char* action_name(Action action) {
    switch (action) {
        case Action::Merge: return "MERGE";
        case Action::MergeSubset: return "MERGE_SUBSET";
        case Action::KeepSeparate: return "KEEP_SEPARATE";
        case Action::Reject: return "REJECT";
        case Action::Split: return "SPLIT";
        case Action::Update: return "UPDATE";
    }
    return "MERGE";
}

inline std::optional<Action> parse_action(const std::string& s) {
    if (s == "MERGE") return Action::Merge;
    if (s == "MERGE_SUBSET") return Action::MergeSubset;
    if (s == "KEEP_SEPARATE") return Action::KeepSeparate;
    if (s == "REJECT") return Action::Reject;
    if (s == "SPLIT") return Action::Split;
    if (s == "UPDATE") return Action::Update;
    return std::nullopt;
}

inline const char* actor_name(Actor actor) {
    switch (actor) {
        case Actor::Human: return "HUMAN";
        case Actor::Llm: return "LLM";
        case Actor::AutoThreshold: return "AUTO_THRESHOLD";
    }
    return "HUMAN";
}

inline std::optional<Actor> parse_actor(const std::string& s) {
    if (s == "HUMAN") return Actor::Human;
    if (s == "LLM") return Actor::Llm;
    if (s == "AUTO_THRESHOLD") return Actor::AutoThreshold;
    return std::nullopt;
}

// Append-only audit entry. Immutable once the store has accepted it.
struct DecisionRecord {
    int64_t seq = 0;                 // Assigned by the store on commit
    std::string session_id;
    uint32_t round = 0;              // 0 for interactive sessions
    std::vector<ItemId> subject;     // Pair or community members
    std::optional<ItemId> target;    // Canonical survivor or split copy
    Action action = Action::KeepSeparate;
    Actor actor = Actor::Human;
    std::string rationale;
    std::string user;
    Timestamp timestamp = 0;

    bool mentions(const ItemId& id) const {
        if (target && *target == id) return true;
        return std::find(subject.begin(), subject.end(), id) != subject.end();
    }
};

inline bool rationale_required(Actor actor) {
    return actor == Actor::Human || actor == Actor::Llm;
}

// Stable signature for a member set (category-qualified)
inline std::string member_signature(const std::string& category, std::vector<ItemId> members) {
    std::sort(members.begin(), members.end());
    std::string sig = category + ":";
    for (size_t i = 0; i < members.size(); ++i) {
        if (i > 0) sig += ",";
        sig += members[i];
    }
    return sig;
}

} // namespace viveka
