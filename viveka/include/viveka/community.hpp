#pragma once
// Community detection: Louvain modularity clustering per category
//
// Deterministic for a fixed graph and seed: node order comes from a
// seeded Fisher-Yates shuffle over id-sorted nodes, neighbor communities
// are visited in index order, and ties keep the current community.
//
// Scoring:
//   priority = 0.6 * avg_similarity + 0.3 * density + 0.1 * size_score
//   size_score(n) = n/3 (n < 3), 1 (3..10), 10/n (n > 10)

#include "config.hpp"
#include "graph.hpp"
#include <cstdio>
#include <map>
#include <random>

namespace viveka {

inline float size_score(size_t n) {
    if (n < 3) return static_cast<float>(n) / 3.0f;
    if (n <= 10) return 1.0f;
    return 10.0f / static_cast<float>(n);
}

inline void score_community(Community& comm, const SimilarityGraph& graph) {
    auto edges = graph.edges_among(comm.members);
    size_t n = comm.members.size();
    float sum = 0.0f;
    for (const auto& e : edges) sum += e.blended_score;
    comm.avg_similarity = edges.empty() ? 0.0f : sum / static_cast<float>(edges.size());
    size_t possible = n * (n - 1) / 2;
    comm.density = possible ? static_cast<float>(edges.size()) / static_cast<float>(possible) : 0.0f;
    comm.priority = 0.6f * comm.avg_similarity + 0.3f * comm.density + 0.1f * size_score(n);
}

// Priority descending; ties go to the larger community, then the smaller first id
inline bool priority_before(const Community& x, const Community& y) {
    if (x.priority != y.priority) return x.priority > y.priority;
    if (x.size() != y.size()) return x.size() > y.size();
    if (x.members.front() != y.members.front()) return x.members.front() < y.members.front();
    return x.category < y.category;
}

// Raw Louvain partition: every node of the graph appears in exactly one group
inline std::vector<std::vector<ItemId>> louvain(const SimilarityGraph& graph,
                                                uint64_t seed, double resolution) {
    std::vector<ItemId> ids = graph.nodes();
    const size_t n0 = ids.size();
    std::map<ItemId, size_t> index;
    for (size_t i = 0; i < n0; ++i) index[ids[i]] = i;

    // Level graph: symmetric adjacency plus self-loop weight per node
    std::vector<std::vector<std::pair<size_t, double>>> adj(n0);
    std::vector<double> self(n0, 0.0);
    for (const auto& [key, edge] : graph.edges()) {
        size_t a = index.at(key.a), b = index.at(key.b);
        adj[a].emplace_back(b, edge.blended_score);
        adj[b].emplace_back(a, edge.blended_score);
    }
    for (auto& list : adj) std::sort(list.begin(), list.end());

    std::vector<size_t> assignment(n0);
    for (size_t i = 0; i < n0; ++i) assignment[i] = i;

    std::mt19937_64 rng(seed);
    for (int level = 0; level < 32; ++level) {
        const size_t n = adj.size();
        std::vector<double> k(n, 0.0);
        double m2 = 0.0;
        for (size_t i = 0; i < n; ++i) {
            for (const auto& [_, w] : adj[i]) k[i] += w;
            k[i] += 2.0 * self[i];
            m2 += k[i];
        }
        if (m2 <= 0.0) break;

        std::vector<size_t> comm(n);
        std::vector<double> tot(k);
        for (size_t i = 0; i < n; ++i) comm[i] = i;

        std::vector<size_t> order(n);
        for (size_t i = 0; i < n; ++i) order[i] = i;
        for (size_t i = n; i > 1; --i) {
            size_t j = static_cast<size_t>(rng() % i);
            std::swap(order[i - 1], order[j]);
        }

        bool improved = false;
        for (int pass = 0; pass < 100; ++pass) {
            bool moved = false;
            for (size_t i : order) {
                size_t current = comm[i];
                std::map<size_t, double> links;
                for (const auto& [j, w] : adj[i]) links[comm[j]] += w;

                tot[current] -= k[i];
                size_t best = current;
                double best_gain = links[current] - resolution * tot[current] * k[i] / m2;
                for (const auto& [c, w] : links) {
                    double gain = w - resolution * tot[c] * k[i] / m2;
                    if (gain > best_gain + 1e-12) {
                        best_gain = gain;
                        best = c;
                    }
                }
                tot[best] += k[i];
                comm[i] = best;
                if (best != current) moved = true;
            }
            if (!moved) break;
            improved = true;
        }
        if (!improved) break;

        // Renumber by first appearance so the aggregate is order-stable
        std::map<size_t, size_t> renumber;
        for (size_t i = 0; i < n; ++i) {
            if (!renumber.count(comm[i])) renumber.emplace(comm[i], renumber.size());
        }
        const size_t next_n = renumber.size();
        std::vector<std::map<size_t, double>> next_links(next_n);
        std::vector<double> next_self(next_n, 0.0);
        for (size_t i = 0; i < n; ++i) {
            size_t ci = renumber[comm[i]];
            next_self[ci] += self[i];
            for (const auto& [j, w] : adj[i]) {
                size_t cj = renumber[comm[j]];
                if (ci == cj) {
                    if (i < j) next_self[ci] += w;
                } else {
                    next_links[ci][cj] += w;
                }
            }
        }
        for (auto& a : assignment) a = renumber[comm[a]];

        adj.assign(next_n, {});
        for (size_t c = 0; c < next_n; ++c) {
            for (const auto& [d, w] : next_links[c]) adj[c].emplace_back(d, w);
        }
        self = std::move(next_self);
        if (next_n == n) break;
    }

    std::map<size_t, std::vector<ItemId>> groups;
    for (size_t i = 0; i < n0; ++i) groups[assignment[i]].push_back(ids[i]);

    std::vector<std::vector<ItemId>> out;
    for (auto& [_, members] : groups) {
        std::sort(members.begin(), members.end());
        out.push_back(std::move(members));
    }
    std::sort(out.begin(), out.end());
    return out;
}

class CommunityDetector {
public:
    explicit CommunityDetector(const CurationConfig& config) : config_(config) {}

    // Scored communities of one graph, priority order, ids not yet assigned
    std::vector<Community> detect(const SimilarityGraph& graph) const {
        std::vector<Community> out;
        for (auto& members : louvain(graph, config_.louvain_seed, config_.louvain_resolution)) {
            if (members.size() < config_.min_community_size) continue;
            Community comm;
            comm.category = graph.category();
            comm.members = std::move(members);
            score_community(comm, graph);
            comm.oversized = comm.size() > config_.max_community_size;
            out.push_back(std::move(comm));
        }
        std::sort(out.begin(), out.end(), priority_before);
        return out;
    }

    // All categories, ids COMM-001.. assigned in global priority order
    std::vector<Community> detect_all(const std::map<std::string, SimilarityGraph>& graphs) const {
        std::vector<Community> out;
        for (const auto& [_, graph] : graphs) {
            auto found = detect(graph);
            out.insert(out.end(), found.begin(), found.end());
        }
        std::sort(out.begin(), out.end(), priority_before);
        for (size_t i = 0; i < out.size(); ++i) {
            char buf[24];
            snprintf(buf, sizeof(buf), "COMM-%03zu", i + 1);
            out[i].id = buf;
        }
        return out;
    }

private:
    const CurationConfig& config_;
};

} // namespace viveka
