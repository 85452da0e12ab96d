#pragma once
// Curation configuration
//
// Defaults mirror the production thresholds. A config is validated once
// at startup; an inconsistent one is rejected, never clamped.
//
// Accepted JSON layouts:
//   {"auto_dedup": 0.98, "high_bucket": 0.92, ...}
//   {"curation": {"thresholds": {"edge_keep": 0.72, "auto_dedup": 0.98}, ...}}

#include "errors.hpp"
#include "log.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>

namespace viveka {

struct Thresholds {
    float edge_keep = 0.72f;       // Edges below are never stored
    float auto_dedup = 0.98f;      // Merge without review
    float high_bucket = 0.92f;
    float medium_bucket = 0.75f;
    float low_bucket = 0.55f;      // Borderline floor
};

struct CurationConfig {
    Thresholds thresholds;
    BlendWeights blend;

    size_t top_k = 50;                   // Neighbors requested per item
    uint32_t max_iterations = 10;        // Hard cap on overnight rounds
    float min_improvement_rate = 0.05f;  // Halt when a round reduces less
    size_t batch_size = 0;               // Communities adjudicated per round, 0 = all

    size_t min_community_size = 2;
    size_t max_community_size = 50;      // Larger ones go to manual review
    bool process_oversized = false;
    bool include_borderline = false;     // Adjudicate low-bucket communities

    float min_llm_confidence = 0.5f;     // Below: manual review
    int llm_timeout_seconds = 120;
    uint32_t llm_max_retries = 0;        // Extra attempts after a failed call
    std::vector<int> llm_retry_delays;   // Seconds before retry n; past the list, backoff applies
    std::string llm_retry_backoff = "exponential";   // or "linear", from a 5s base

    uint64_t louvain_seed = 42;
    double louvain_resolution = 1.0;

    std::string user = "auto";

    // Throws ConfigurationError
    void validate() const {
        auto in_unit = [](float v) { return std::isfinite(v) && v >= 0.0f && v <= 1.0f; };
        const auto& t = thresholds;

        if (!in_unit(t.edge_keep)) throw ConfigurationError("edge_keep must be within [0,1]");
        if (!in_unit(t.auto_dedup)) throw ConfigurationError("auto_dedup must be within [0,1]");
        if (!in_unit(t.high_bucket)) throw ConfigurationError("high_bucket must be within [0,1]");
        if (!in_unit(t.medium_bucket)) throw ConfigurationError("medium_bucket must be within [0,1]");
        if (!in_unit(t.low_bucket)) throw ConfigurationError("low_bucket must be within [0,1]");

        if (t.auto_dedup < t.high_bucket) {
            throw ConfigurationError("auto_dedup (" + fmt(t.auto_dedup) +
                                     ") must be >= high_bucket (" + fmt(t.high_bucket) + ")");
        }
        if (t.high_bucket < t.medium_bucket) {
            throw ConfigurationError("high_bucket (" + fmt(t.high_bucket) +
                                     ") must be >= medium_bucket (" + fmt(t.medium_bucket) + ")");
        }
        if (t.medium_bucket < t.low_bucket) {
            throw ConfigurationError("medium_bucket (" + fmt(t.medium_bucket) +
                                     ") must be >= low_bucket (" + fmt(t.low_bucket) + ")");
        }

        if (blend.embed < 0.0f || blend.rerank < 0.0f ||
            std::fabs(blend.embed + blend.rerank - 1.0f) > 1e-4f) {
            throw ConfigurationError("blend weights must be non-negative and sum to 1");
        }
        if (top_k == 0) throw ConfigurationError("top_k must be positive");
        if (max_iterations == 0) throw ConfigurationError("max_iterations must be positive");
        if (!in_unit(min_improvement_rate)) {
            throw ConfigurationError("min_improvement_rate must be within [0,1]");
        }
        if (min_community_size < 2) throw ConfigurationError("min_community_size must be >= 2");
        if (max_community_size < min_community_size) {
            throw ConfigurationError("max_community_size must be >= min_community_size");
        }
        if (!in_unit(min_llm_confidence)) {
            throw ConfigurationError("min_llm_confidence must be within [0,1]");
        }
        if (llm_timeout_seconds <= 0) throw ConfigurationError("llm_timeout_seconds must be positive");
        for (int d : llm_retry_delays) {
            if (d < 0) throw ConfigurationError("llm_retry_delays must be non-negative");
        }
        if (llm_retry_backoff != "linear" && llm_retry_backoff != "exponential") {
            throw ConfigurationError("llm_retry_backoff must be 'linear' or 'exponential'");
        }
        if (!(louvain_resolution > 0.0)) throw ConfigurationError("louvain_resolution must be positive");
    }

    // Overlay keys present in `doc` on top of the current values
    void merge_json(const nlohmann::json& doc) {
        if (!doc.is_object()) throw ConfigurationError("top-level document must be an object");

        const nlohmann::json* root = &doc;
        if (doc.contains("curation")) {
            root = &doc["curation"];
            if (!root->is_object()) throw ConfigurationError("'curation' must be an object");
        }

        read_flat(*root);

        auto th = root->find("thresholds");
        if (th != root->end()) {
            if (!th->is_object()) throw ConfigurationError("'thresholds' must be an object");
            read_key(*th, "edge_keep", thresholds.edge_keep);
            read_key(*th, "auto_dedup", thresholds.auto_dedup);
            read_key(*th, "high", thresholds.high_bucket);
            read_key(*th, "high_bucket", thresholds.high_bucket);
            read_key(*th, "medium", thresholds.medium_bucket);
            read_key(*th, "medium_bucket", thresholds.medium_bucket);
            read_key(*th, "low", thresholds.low_bucket);
            read_key(*th, "low_bucket", thresholds.low_bucket);
        }

        auto algo = root->find("algorithm");
        if (algo != root->end()) {
            if (!algo->is_string()) throw ConfigurationError("'algorithm' must be a string");
            std::string name = algo->get<std::string>();
            if (name == "leiden") {
                log::warn("config", "leiden requested; using louvain");
            } else if (name != "louvain") {
                throw ConfigurationError("unknown community algorithm '" + name + "'");
            }
        }
    }

    static CurationConfig from_json(const nlohmann::json& doc) {
        CurationConfig config;
        config.merge_json(doc);
        return config;
    }

    // Load a JSON file over the defaults. Does not validate.
    static CurationConfig load(const std::string& path) {
        std::ifstream in(path);
        if (!in) throw ConfigurationError("cannot open config file " + path);
        nlohmann::json doc;
        try {
            in >> doc;
        } catch (const nlohmann::json::parse_error& e) {
            throw ConfigurationError("cannot parse " + path + ": " + e.what());
        }
        return from_json(doc);
    }

    // Seconds to wait before retry `attempt` (1-based)
    int retry_delay(uint32_t attempt) const {
        if (attempt == 0) return 0;
        if (attempt <= llm_retry_delays.size()) return llm_retry_delays[attempt - 1];
        const int base = 5;
        if (llm_retry_backoff == "linear") return base * static_cast<int>(attempt);
        return base * (1 << std::min<uint32_t>(attempt - 1, 10));
    }

    nlohmann::json to_json() const {
        return {
            {"edge_keep", thresholds.edge_keep},
            {"auto_dedup", thresholds.auto_dedup},
            {"high_bucket", thresholds.high_bucket},
            {"medium_bucket", thresholds.medium_bucket},
            {"low_bucket", thresholds.low_bucket},
            {"embed_weight", blend.embed},
            {"rerank_weight", blend.rerank},
            {"top_k", top_k},
            {"max_iterations", max_iterations},
            {"min_improvement_rate", min_improvement_rate},
            {"batch_size", batch_size},
            {"min_community_size", min_community_size},
            {"max_community_size", max_community_size},
            {"process_oversized", process_oversized},
            {"include_borderline", include_borderline},
            {"min_llm_confidence", min_llm_confidence},
            {"llm_timeout_seconds", llm_timeout_seconds},
            {"llm_max_retries", llm_max_retries},
            {"llm_retry_delays", llm_retry_delays},
            {"llm_retry_backoff", llm_retry_backoff},
            {"louvain_seed", louvain_seed},
            {"louvain_resolution", louvain_resolution},
            {"user", user}
        };
    }

private:
    void read_flat(const nlohmann::json& obj) {
        read_key(obj, "edge_keep", thresholds.edge_keep);
        read_key(obj, "edge_keep_threshold", thresholds.edge_keep);
        read_key(obj, "auto_dedup", thresholds.auto_dedup);
        read_key(obj, "auto_dedup_threshold", thresholds.auto_dedup);
        read_key(obj, "high_bucket", thresholds.high_bucket);
        read_key(obj, "high_bucket_threshold", thresholds.high_bucket);
        read_key(obj, "medium_bucket", thresholds.medium_bucket);
        read_key(obj, "medium_bucket_threshold", thresholds.medium_bucket);
        read_key(obj, "low_bucket", thresholds.low_bucket);
        read_key(obj, "low_bucket_threshold", thresholds.low_bucket);
        read_key(obj, "min_similarity_threshold", thresholds.edge_keep);
        read_key(obj, "embed_weight", blend.embed);
        read_key(obj, "rerank_weight", blend.rerank);
        read_key(obj, "top_k", top_k);
        read_key(obj, "top_k_neighbors", top_k);
        read_key(obj, "max_iterations", max_iterations);
        read_key(obj, "max_rounds", max_iterations);
        read_key(obj, "min_improvement_rate", min_improvement_rate);
        read_key(obj, "improvement_threshold", min_improvement_rate);
        read_key(obj, "batch_size", batch_size);
        read_key(obj, "min_community_size", min_community_size);
        read_key(obj, "max_community_size", max_community_size);
        read_key(obj, "process_oversized", process_oversized);
        read_key(obj, "include_borderline", include_borderline);
        read_key(obj, "min_llm_confidence", min_llm_confidence);
        read_key(obj, "llm_timeout_seconds", llm_timeout_seconds);
        read_key(obj, "llm_max_retries", llm_max_retries);
        read_key(obj, "max_retries", llm_max_retries);
        read_key(obj, "llm_retry_backoff", llm_retry_backoff);
        read_key(obj, "retry_backoff", llm_retry_backoff);
        read_delays(obj, "llm_retry_delays");
        read_delays(obj, "retry_delays");
        read_key(obj, "louvain_seed", louvain_seed);
        read_key(obj, "louvain_resolution", louvain_resolution);
        read_key(obj, "user", user);
    }

    template <typename T>
    static void read_key(const nlohmann::json& obj, const char* key, T& out) {
        auto it = obj.find(key);
        if (it == obj.end() || it->is_null()) return;

        if constexpr (std::is_same_v<T, bool>) {
            if (!it->is_boolean()) throw ConfigurationError(std::string("'") + key + "' must be a boolean");
        } else if constexpr (std::is_arithmetic_v<T>) {
            if (!it->is_number()) throw ConfigurationError(std::string("'") + key + "' must be a number");
            if constexpr (std::is_unsigned_v<T>) {
                if (!it->is_number_integer() || it->get<double>() < 0) {
                    throw ConfigurationError(std::string("'") + key + "' must be a non-negative integer");
                }
            }
        } else {
            if (!it->is_string()) throw ConfigurationError(std::string("'") + key + "' must be a string");
        }
        out = it->get<T>();
    }

    void read_delays(const nlohmann::json& obj, const char* key) {
        auto it = obj.find(key);
        if (it == obj.end() || it->is_null()) return;
        if (!it->is_array()) throw ConfigurationError(std::string("'") + key + "' must be an array");
        std::vector<int> delays;
        for (const auto& d : *it) {
            if (!d.is_number_integer()) {
                throw ConfigurationError(std::string("'") + key + "' must hold whole seconds");
            }
            delays.push_back(d.get<int>());
        }
        llm_retry_delays = std::move(delays);
    }

    static std::string fmt(float v) {
        std::ostringstream oss;
        oss << v;
        return oss.str();
    }
};

} // namespace viveka
