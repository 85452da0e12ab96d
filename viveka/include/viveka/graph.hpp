#pragma once
// Similarity graph: sparse, per category
//
// Built fresh each round from the vector provider. One edge per unordered
// pair, scored with the blended score, and only edges at or above
// edge_keep survive. A graph never holds two categories.

#include "config.hpp"
#include "errors.hpp"
#include "item_pool.hpp"
#include "log.hpp"
#include "providers.hpp"
#include <map>
#include <set>
#include <unordered_map>

namespace viveka {

struct BuildStats {
    size_t items_queried = 0;
    size_t raw_neighbors = 0;
    size_t edges_kept = 0;
    size_t below_threshold = 0;
    size_t cross_category = 0;    // Provider answered outside the partition
    size_t stale_neighbors = 0;   // Unknown or inactive neighbor ids
    size_t cache_hits = 0;

    void add(const BuildStats& other) {
        items_queried += other.items_queried;
        raw_neighbors += other.raw_neighbors;
        edges_kept += other.edges_kept;
        below_threshold += other.below_threshold;
        cross_category += other.cross_category;
        stale_neighbors += other.stale_neighbors;
        cache_hits += other.cache_hits;
    }
};

class SimilarityGraph {
public:
    explicit SimilarityGraph(std::string category = "") : category_(std::move(category)) {}

    const std::string& category() const { return category_; }

    void add_node(const ItemId& id) { adj_[id]; }

    // Keeps the higher blended score when the pair is already present
    bool add_edge(const Edge& edge) {
        if (edge.a_id == edge.b_id) return false;
        Edge e = edge;
        PairKey key = e.key();
        e.a_id = key.a;
        e.b_id = key.b;

        auto it = edges_.find(key);
        if (it != edges_.end()) {
            if (e.blended_score <= it->second.blended_score) return false;
            it->second = e;
        } else {
            edges_.emplace(key, e);
        }
        adj_[key.a][key.b] = e.blended_score;
        adj_[key.b][key.a] = e.blended_score;
        return true;
    }

    const Edge* edge(const ItemId& a, const ItemId& b) const {
        auto it = edges_.find(PairKey::of(a, b));
        return (it != edges_.end()) ? &it->second : nullptr;
    }

    std::optional<float> score(const ItemId& a, const ItemId& b) const {
        auto* e = edge(a, b);
        if (!e) return std::nullopt;
        return e->blended_score;
    }

    // Neighbor -> score, ordered by neighbor id
    const std::map<ItemId, float>& neighbors(const ItemId& id) const {
        static const std::map<ItemId, float> empty;
        auto it = adj_.find(id);
        return (it != adj_.end()) ? it->second : empty;
    }

    std::vector<ItemId> nodes() const {
        std::vector<ItemId> out;
        out.reserve(adj_.size());
        for (const auto& [id, _] : adj_) out.push_back(id);
        return out;
    }

    // Edges with both ends in `members`
    std::vector<Edge> edges_among(const std::vector<ItemId>& members) const {
        std::set<ItemId> in(members.begin(), members.end());
        std::vector<Edge> out;
        for (const auto& id : in) {
            for (const auto& [other, _] : neighbors(id)) {
                if (id < other && in.count(other)) out.push_back(edges_.at(PairKey{id, other}));
            }
        }
        return out;
    }

    const std::map<PairKey, Edge>& edges() const { return edges_; }
    size_t node_count() const { return adj_.size(); }
    size_t edge_count() const { return edges_.size(); }

    BuildStats stats;

private:
    std::string category_;
    std::map<PairKey, Edge> edges_;
    std::map<ItemId, std::map<ItemId, float>> adj_;
};

// Raw neighbor lists reused across rounds.
// Dropped wholesale when the provider generation moves, per item on update.
class NeighborCache {
public:
    std::optional<std::vector<Neighbor>> get(const ItemId& id, size_t k, uint64_t generation) {
        sync(generation);
        auto it = entries_.find(id);
        if (it == entries_.end() || it->second.k < k) return std::nullopt;
        auto list = it->second.neighbors;
        if (list.size() > k) list.resize(k);
        return list;
    }

    void put(const ItemId& id, size_t k, std::vector<Neighbor> neighbors, uint64_t generation) {
        sync(generation);
        entries_[id] = Entry{k, std::move(neighbors)};
    }

    // Drop `id`'s list and every list that mentions it
    void invalidate(const ItemId& id) {
        entries_.erase(id);
        for (auto it = entries_.begin(); it != entries_.end();) {
            bool mentions = false;
            for (const auto& n : it->second.neighbors) {
                if (n.id == id) {
                    mentions = true;
                    break;
                }
            }
            it = mentions ? entries_.erase(it) : std::next(it);
        }
    }

    void clear() { entries_.clear(); }
    size_t size() const { return entries_.size(); }
    bool contains(const ItemId& id) const { return entries_.count(id) > 0; }

private:
    struct Entry {
        size_t k = 0;
        std::vector<Neighbor> neighbors;
    };

    void sync(uint64_t generation) {
        if (generation != generation_) {
            entries_.clear();
            generation_ = generation;
        }
    }

    std::unordered_map<ItemId, Entry> entries_;
    uint64_t generation_ = 0;
};

class GraphBuilder {
public:
    GraphBuilder(VectorProvider& vectors, RerankProvider* rerank, const CurationConfig& config)
        : vectors_(vectors), rerank_(rerank), config_(config) {}

    // Throws ProviderUnavailable; an unreachable provider never yields an empty graph
    SimilarityGraph build(const ItemPool& pool, const std::string& category) {
        SimilarityGraph graph(category);
        BuildStats& stats = graph.stats;
        const float keep = config_.thresholds.edge_keep;

        for (const Item* item : pool.active_in(category)) {
            graph.add_node(item->id);
            ++stats.items_queried;

            std::vector<Neighbor> raw;
            if (auto cached = cache_.get(item->id, config_.top_k, vectors_.generation())) {
                raw = std::move(*cached);
                ++stats.cache_hits;
            } else {
                raw = vectors_.neighbors(item->id, config_.top_k);
                cache_.put(item->id, config_.top_k, raw, vectors_.generation());
            }
            stats.raw_neighbors += raw.size();

            std::vector<Neighbor> candidates;
            for (const auto& n : raw) {
                if (n.id == item->id) continue;
                const Item* other = pool.get(n.id);
                if ((!n.category.empty() && n.category != category) ||
                    (other && other->category != category)) {
                    ++stats.cross_category;
                    log::warn("graph", "cross-category neighbor %s -> %s discarded",
                              item->id.c_str(), n.id.c_str());
                    continue;
                }
                if (!other || !other->active()) {
                    ++stats.stale_neighbors;
                    continue;
                }
                candidates.push_back(n);
            }

            std::map<ItemId, float> rerank_scores;
            if (rerank_ && !candidates.empty()) {
                std::vector<ItemId> ids;
                for (const auto& n : candidates) ids.push_back(n.id);
                for (const auto& [id, score] : rerank_->rerank(item->id, ids)) {
                    rerank_scores[id] = score;
                }
            }

            for (const auto& n : candidates) {
                Edge e;
                e.a_id = item->id;
                e.b_id = n.id;
                e.embed_score = n.embed_score;
                auto r = rerank_scores.find(n.id);
                if (r != rerank_scores.end()) e.rerank_score = r->second;
                e.blended_score = blend(e.embed_score, e.rerank_score, config_.blend);
                if (e.blended_score < keep) {
                    ++stats.below_threshold;
                    continue;
                }
                graph.add_edge(e);
            }
        }

        stats.edges_kept = graph.edge_count();
        log::debug("graph", "%s: %zu nodes, %zu edges (%zu below %.2f, %zu cached)",
                   category.c_str(), graph.node_count(), graph.edge_count(),
                   stats.below_threshold, keep, stats.cache_hits);
        return graph;
    }

    // One graph per category with at least one active item
    std::map<std::string, SimilarityGraph> build_all(const ItemPool& pool) {
        std::map<std::string, SimilarityGraph> graphs;
        for (const auto& category : pool.categories()) {
            if (pool.active_in(category).empty()) continue;
            graphs.emplace(category, build(pool, category));
        }
        return graphs;
    }

    // Content of `id` changed; its neighbor lists are stale
    void invalidate(const ItemId& id) { cache_.invalidate(id); }
    void clear_cache() { cache_.clear(); }

    const NeighborCache& cache() const { return cache_; }

private:
    VectorProvider& vectors_;
    RerankProvider* rerank_;
    const CurationConfig& config_;
    NeighborCache cache_;
};

} // namespace viveka
