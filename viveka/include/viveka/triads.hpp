#pragma once
// Drift triads: A~B and B~C are high but A~C is not
//
// Clustering would put all three in one community and merge them. A
// triad means B sits between two distinct things, so only the closer
// pair is a merge candidate. Triads are reported, never auto-resolved.

#include "graph.hpp"
#include <set>
#include <sstream>
#include <tuple>

namespace viveka {

struct Triad {
    ItemId a;
    ItemId b;                      // Pivot, high with both ends
    ItemId c;
    float ab = 0.0f;
    float bc = 0.0f;
    std::optional<float> ac;       // Absent: below edge_keep
    std::string category;

    // The closer of the two high pairs
    PairKey close_pair() const { return (ab >= bc) ? PairKey::of(a, b) : PairKey::of(b, c); }

    // The end left out of the close pair
    const ItemId& distant() const { return (ab >= bc) ? c : a; }

    std::vector<ItemId> members() const {
        std::vector<ItemId> m{a, b, c};
        std::sort(m.begin(), m.end());
        return m;
    }

    std::string recommendation() const {
        PairKey p = close_pair();
        std::ostringstream oss;
        oss.precision(2);
        oss << std::fixed << "merge " << p.a << " + " << p.b << " ("
            << std::max(ab, bc) << "), keep " << distant() << " separate";
        return oss.str();
    }
};

class TriadDetector {
public:
    explicit TriadDetector(float high_threshold) : high_(high_threshold) {}

    // Each {A,B,C} appears once, with a < c and b the pivot
    std::vector<Triad> detect(const SimilarityGraph& graph) const {
        std::vector<Triad> out;
        std::set<std::tuple<ItemId, ItemId, ItemId>> seen;

        for (const auto& pivot : graph.nodes()) {
            std::vector<std::pair<ItemId, float>> high;
            for (const auto& [other, score] : graph.neighbors(pivot)) {
                if (score >= high_) high.emplace_back(other, score);
            }
            // neighbors() is ordered by id, so i < j means a < c
            for (size_t i = 0; i < high.size(); ++i) {
                for (size_t j = i + 1; j < high.size(); ++j) {
                    const auto& [a, ab] = high[i];
                    const auto& [c, bc] = high[j];
                    auto ac = graph.score(a, c);
                    if (ac && *ac >= high_) continue;

                    auto m = Triad{a, pivot, c, ab, bc, ac, graph.category()}.members();
                    if (!seen.insert({m[0], m[1], m[2]}).second) continue;
                    out.push_back(Triad{a, pivot, c, ab, bc, ac, graph.category()});
                }
            }
        }

        std::sort(out.begin(), out.end(), [](const Triad& x, const Triad& y) {
            float sx = std::max(x.ab, x.bc), sy = std::max(y.ab, y.bc);
            if (sx != sy) return sx > sy;
            return x.members() < y.members();
        });
        return out;
    }

    std::vector<Triad> detect_all(const std::map<std::string, SimilarityGraph>& graphs) const {
        std::vector<Triad> out;
        for (const auto& [_, graph] : graphs) {
            auto found = detect(graph);
            out.insert(out.end(), found.begin(), found.end());
        }
        return out;
    }

    float threshold() const { return high_; }

private:
    float high_;
};

// True when `x` and `y` belong to the same triad
inline bool in_triad(const std::vector<Triad>& triads, const ItemId& x, const ItemId& y) {
    for (const auto& t : triads) {
        auto m = t.members();
        bool has_x = std::find(m.begin(), m.end(), x) != m.end();
        bool has_y = std::find(m.begin(), m.end(), y) != m.end();
        if (has_x && has_y) return true;
    }
    return false;
}

} // namespace viveka
