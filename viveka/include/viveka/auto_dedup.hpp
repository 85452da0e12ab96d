#pragma once
// Auto-dedup pass: merge everything at or above auto_dedup
//
// Pairs are grouped with union-find. A group merges only if every pair
// inside it is at least high_bucket; otherwise it is a transitive chain
// (drift) and is left for review. A group holding any pair of a drift
// triad is left for review too, even when the third item sits outside
// it. One AUTO_THRESHOLD record per absorbed item. Merged items are
// inactive, so a second pass finds nothing.

#include "audit.hpp"
#include "config.hpp"
#include "graph.hpp"
#include "triads.hpp"
#include "union_find.hpp"
#include <cstdio>

namespace viveka {

struct AutoDedupResult {
    size_t groups = 0;
    size_t merged_items = 0;
    size_t withheld_groups = 0;
    bool failed = false;        // A commit was refused; the pass stopped there
};

class AutoDedup {
public:
    AutoDedup(const CurationConfig& config, AuditLog& audit) : config_(config), audit_(audit) {}

    AutoDedupResult run(const std::map<std::string, SimilarityGraph>& graphs,
                        const std::string& session_id, uint32_t round = 0) {
        AutoDedupResult result;
        for (const auto& [_, graph] : graphs) {
            run_graph(graph, session_id, round, result);
            if (result.failed) break;
        }
        if (result.merged_items > 0 || result.withheld_groups > 0) {
            log::info("dedup", "%zu groups, %zu items merged, %zu chains withheld",
                      result.groups, result.merged_items, result.withheld_groups);
        }
        return result;
    }

    // Groups the pass would merge, without merging them
    std::vector<std::vector<ItemId>> plan(const SimilarityGraph& graph,
                                          size_t* withheld = nullptr) const {
        const ItemPool& pool = audit_.pool();
        UnionFind uf;
        for (const auto& [key, edge] : graph.edges()) {
            if (edge.blended_score < config_.thresholds.auto_dedup) continue;
            if (!pool.is_active(key.a) || !pool.is_active(key.b)) continue;
            uf.unite(key.a, key.b);
        }

        auto triads = TriadDetector(config_.thresholds.high_bucket).detect(graph);

        std::vector<std::vector<ItemId>> out;
        for (auto& group : uf.groups(2)) {
            if (is_chain(graph, group)) {
                if (withheld) {
                    ++*withheld;
                    log::warn("dedup", "withholding %zu-item chain starting at %s (pair below %.2f)",
                              group.size(), group.front().c_str(), config_.thresholds.high_bucket);
                }
                continue;
            }
            if (touches_triad(triads, group)) {
                if (withheld) {
                    ++*withheld;
                    log::warn("dedup", "withholding %zu-item group starting at %s (drift triad)",
                              group.size(), group.front().c_str());
                }
                continue;
            }
            out.push_back(std::move(group));
        }
        return out;
    }

private:
    void run_graph(const SimilarityGraph& graph, const std::string& session_id, uint32_t round,
                   AutoDedupResult& result) {
        for (const auto& group : plan(graph, &result.withheld_groups)) {
            auto canonical = audit_.pool().default_canonical(group);
            if (!canonical) continue;
            ++result.groups;

            for (const auto& member : group) {
                if (member == *canonical || !audit_.pool().is_active(member)) continue;
                Timestamp ts = now();
                auto images = audit_.pool().plan_merge({member}, *canonical, ts);
                if (images.empty()) continue;

                float score = graph.score(member, *canonical).value_or(0.0f);
                char why[96];
                snprintf(why, sizeof(why), "blended score %.3f >= auto_dedup %.3f",
                         score, config_.thresholds.auto_dedup);

                DecisionRecord record;
                record.session_id = session_id;
                record.round = round;
                record.subject = {member, *canonical};
                std::sort(record.subject.begin(), record.subject.end());
                record.target = *canonical;
                record.action = Action::Merge;
                record.actor = Actor::AutoThreshold;
                record.rationale = why;
                record.user = config_.user;
                record.timestamp = ts;

                if (!audit_.commit(std::move(record), images)) {
                    result.failed = true;
                    return;
                }
                ++result.merged_items;
            }
        }
    }

    // Some pair inside the group is missing or below high_bucket
    bool is_chain(const SimilarityGraph& graph, const std::vector<ItemId>& group) const {
        for (size_t i = 0; i < group.size(); ++i) {
            for (size_t j = i + 1; j < group.size(); ++j) {
                auto s = graph.score(group[i], group[j]);
                if (!s || *s < config_.thresholds.high_bucket) return true;
            }
        }
        return false;
    }

    static bool touches_triad(const std::vector<Triad>& triads, const std::vector<ItemId>& group) {
        for (size_t i = 0; i < group.size(); ++i) {
            for (size_t j = i + 1; j < group.size(); ++j) {
                if (in_triad(triads, group[i], group[j])) return true;
            }
        }
        return false;
    }

    const CurationConfig& config_;
    AuditLog& audit_;
};

} // namespace viveka
