#pragma once
// Neighbor file: precomputed nearest-neighbor cache as a provider
//
// One JSONL record per directed neighbor:
//   {"src": "EXP-1", "dst": "EXP-7", "embed_score": 0.93,
//    "rerank_score": 0.88, "category": "DEV"}
// "weight" is accepted for embed_score. Records of {"type": "meta"} are skipped.
// Also serves the stored rerank scores through the RerankProvider contract.

#include "errors.hpp"
#include "log.hpp"
#include "providers.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <map>
#include <unordered_map>

namespace viveka {

class NeighborFile : public VectorProvider, public RerankProvider {
public:
    NeighborFile() = default;

    // Throws ProviderUnavailable if the file cannot be read at all
    size_t load(const std::string& path) {
        std::ifstream in(path);
        if (!in) throw ProviderUnavailable(name_str(), "neighbor cache not found: " + path);

        rows_.clear();
        rerank_.clear();
        size_t loaded = 0;
        size_t line_no = 0;
        std::string line;
        while (std::getline(in, line)) {
            ++line_no;
            if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
            try {
                auto rec = nlohmann::json::parse(line);
                if (rec.value("type", "") == "meta") continue;
                Row row;
                std::string src = rec.at("src").get<std::string>();
                row.neighbor.id = rec.at("dst").get<std::string>();
                if (rec.contains("embed_score")) {
                    row.neighbor.embed_score = rec["embed_score"].get<float>();
                } else {
                    row.neighbor.embed_score = rec.at("weight").get<float>();
                }
                row.neighbor.category = rec.value("category", "");
                if (src.empty() || row.neighbor.id.empty() || src == row.neighbor.id) continue;

                if (rec.contains("rerank_score") && rec["rerank_score"].is_number()) {
                    rerank_[PairKey::of(src, row.neighbor.id)] = rec["rerank_score"].get<float>();
                }
                rows_[src].push_back(std::move(row));
                ++loaded;
            } catch (const nlohmann::json::exception& e) {
                log::warn("neighbors", "%s:%zu skipped: %s", path.c_str(), line_no, e.what());
            }
        }

        for (auto& [_, list] : rows_) {
            std::sort(list.begin(), list.end(), [](const Row& a, const Row& b) {
                if (a.neighbor.embed_score != b.neighbor.embed_score) {
                    return a.neighbor.embed_score > b.neighbor.embed_score;
                }
                return a.neighbor.id < b.neighbor.id;
            });
        }
        ++generation_;
        log::debug("neighbors", "loaded %zu neighbor records from %s", loaded, path.c_str());
        return loaded;
    }

    std::vector<Neighbor> neighbors(const ItemId& id, size_t k) override {
        std::vector<Neighbor> out;
        auto it = rows_.find(id);
        if (it == rows_.end()) return out;
        for (const auto& row : it->second) {
            if (out.size() >= k) break;
            out.push_back(row.neighbor);
        }
        return out;
    }

    std::vector<std::pair<ItemId, float>> rerank(
        const ItemId& id, const std::vector<ItemId>& candidates) override
    {
        std::vector<std::pair<ItemId, float>> out;
        for (const auto& c : candidates) {
            auto it = rerank_.find(PairKey::of(id, c));
            if (it != rerank_.end()) out.emplace_back(c, it->second);
        }
        return out;
    }

    bool has_rerank_scores() const { return !rerank_.empty(); }
    uint64_t generation() const override { return generation_; }
    std::string name() const override { return name_str(); }

private:
    static std::string name_str() { return "neighbor-file"; }

    struct Row {
        Neighbor neighbor;
    };

    std::unordered_map<ItemId, std::vector<Row>> rows_;
    std::map<PairKey, float> rerank_;
    uint64_t generation_ = 0;
};

} // namespace viveka
