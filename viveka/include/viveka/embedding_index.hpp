#pragma once
// Embedding index: in-memory vector provider
//
// Brute-force cosine over unit vectors, bucketed by category so a
// query can never see another partition. Good for tens of thousands
// of items, which is the size of a curation pool.
//
// File format (JSONL): {"id": "...", "category": "...", "vector": [..]}

#include "errors.hpp"
#include "log.hpp"
#include "providers.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <map>
#include <unordered_map>

namespace viveka {

class EmbeddingIndex : public VectorProvider {
public:
    EmbeddingIndex() = default;

    // Insert or replace. Zero vectors are refused.
    bool add(const ItemId& id, const std::string& category, std::vector<float> vec) {
        float norm = 0.0f;
        for (float v : vec) norm += v * v;
        norm = std::sqrt(norm);
        if (norm <= 0.0f || !std::isfinite(norm)) return false;
        for (float& v : vec) v /= norm;

        if (dim_ == 0) dim_ = vec.size();
        if (vec.size() != dim_) {
            log::warn("embeddings", "dimension mismatch for %s (%zu != %zu)",
                      id.c_str(), vec.size(), dim_);
            return false;
        }

        remove(id);
        entries_[id] = Entry{category, std::move(vec)};
        by_category_[category].push_back(id);
        ++generation_;
        return true;
    }

    bool remove(const ItemId& id) {
        auto it = entries_.find(id);
        if (it == entries_.end()) return false;
        auto& ids = by_category_[it->second.category];
        ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
        entries_.erase(it);
        ++generation_;
        return true;
    }

    // Returns number of vectors loaded; throws ProviderUnavailable if unreadable
    size_t load_jsonl(const std::string& path) {
        std::ifstream in(path);
        if (!in) throw ProviderUnavailable(name(), "cannot open " + path);

        size_t loaded = 0;
        size_t line_no = 0;
        std::string line;
        while (std::getline(in, line)) {
            ++line_no;
            if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
            try {
                auto rec = nlohmann::json::parse(line);
                if (rec.value("type", "") == "meta") continue;
                std::string id = rec.at("id").get<std::string>();
                std::string category = rec.value("category", "");
                auto vec = rec.at("vector").get<std::vector<float>>();
                if (add(id, category, std::move(vec))) ++loaded;
            } catch (const nlohmann::json::exception& e) {
                log::warn("embeddings", "%s:%zu skipped: %s", path.c_str(), line_no, e.what());
            }
        }
        log::debug("embeddings", "loaded %zu vectors from %s", loaded, path.c_str());
        return loaded;
    }

    // Throws ProviderUnavailable for an id with no vector (stale or mismatched vectors file)
    std::vector<Neighbor> neighbors(const ItemId& id, size_t k) override {
        std::vector<Neighbor> results;
        auto it = entries_.find(id);
        if (it == entries_.end()) throw ProviderUnavailable(name(), "no vector for " + id);

        const Entry& query = it->second;
        auto cat = by_category_.find(query.category);
        if (cat == by_category_.end()) return results;

        for (const auto& other_id : cat->second) {
            if (other_id == id) continue;
            const Entry& other = entries_.at(other_id);
            results.push_back({other_id, dot(query.vec, other.vec), query.category});
        }

        std::sort(results.begin(), results.end(), [](const Neighbor& a, const Neighbor& b) {
            if (a.embed_score != b.embed_score) return a.embed_score > b.embed_score;
            return a.id < b.id;
        });
        if (results.size() > k) results.resize(k);
        return results;
    }

    uint64_t generation() const override { return generation_; }
    std::string name() const override { return "embedding-index"; }

    size_t size() const { return entries_.size(); }
    size_t dimension() const { return dim_; }
    bool contains(const ItemId& id) const { return entries_.count(id) > 0; }

private:
    struct Entry {
        std::string category;
        std::vector<float> vec;   // Unit length
    };

    static float dot(const std::vector<float>& a, const std::vector<float>& b) {
        float sum = 0.0f;
        for (size_t i = 0; i < a.size(); ++i) sum += a[i] * b[i];
        return std::clamp(sum, -1.0f, 1.0f);
    }

    std::unordered_map<ItemId, Entry> entries_;
    std::map<std::string, std::vector<ItemId>> by_category_;
    size_t dim_ = 0;
    uint64_t generation_ = 0;
};

} // namespace viveka
