#pragma once
// Decision policy: similarity bucket -> resolution path
//
//   score >= auto_dedup          Auto     merge, actor AUTO_THRESHOLD
//   high   <= score < auto       High     human review / adjudicator
//   medium <= score < high       Medium   same, lower priority
//   low    <= score < medium     Low      borderline, preview only
//   score < low                  None     ignored

#include "config.hpp"
#include <string>

namespace viveka {

enum class Bucket : uint8_t {
    Auto = 0,
    High = 1,
    Medium = 2,
    Low = 3,
    None = 4,
};

enum class Route : uint8_t {
    AutoMerge = 0,
    Review = 1,        // Human in interactive mode, adjudicator overnight
    Borderline = 2,    // Only when explicitly requested
    Ignore = 3,
};

inline const char* bucket_name(Bucket bucket) {
    switch (bucket) {
        case Bucket::Auto: return "auto";
        case Bucket::High: return "high";
        case Bucket::Medium: return "medium";
        case Bucket::Low: return "low";
        case Bucket::None: return "none";
    }
    return "none";
}

inline std::optional<Bucket> parse_bucket(const std::string& s) {
    if (s == "auto") return Bucket::Auto;
    if (s == "high") return Bucket::High;
    if (s == "medium") return Bucket::Medium;
    if (s == "low" || s == "borderline") return Bucket::Low;
    return std::nullopt;
}

inline const char* route_name(Route route) {
    switch (route) {
        case Route::AutoMerge: return "auto-merge";
        case Route::Review: return "review";
        case Route::Borderline: return "borderline";
        case Route::Ignore: return "ignore";
    }
    return "ignore";
}

class DecisionPolicy {
public:
    // Throws ConfigurationError for inconsistent thresholds
    explicit DecisionPolicy(const CurationConfig& config) : config_(config) {
        config_.validate();
    }

    Bucket bucket(float score) const {
        const auto& t = config_.thresholds;
        if (score >= t.auto_dedup) return Bucket::Auto;
        if (score >= t.high_bucket) return Bucket::High;
        if (score >= t.medium_bucket) return Bucket::Medium;
        if (score >= t.low_bucket) return Bucket::Low;
        return Bucket::None;
    }

    Route route(float score) const {
        switch (bucket(score)) {
            case Bucket::Auto: return Route::AutoMerge;
            case Bucket::High:
            case Bucket::Medium: return Route::Review;
            case Bucket::Low: return config_.include_borderline ? Route::Review : Route::Borderline;
            case Bucket::None: return Route::Ignore;
        }
        return Route::Ignore;
    }

    // Score range [lo, hi) of a bucket
    std::pair<float, float> range(Bucket b) const {
        const auto& t = config_.thresholds;
        switch (b) {
            case Bucket::Auto: return {t.auto_dedup, 1.0f + 1e-6f};
            case Bucket::High: return {t.high_bucket, t.auto_dedup};
            case Bucket::Medium: return {t.medium_bucket, t.high_bucket};
            case Bucket::Low: return {t.low_bucket, t.medium_bucket};
            case Bucket::None: return {0.0f, t.low_bucket};
        }
        return {0.0f, 0.0f};
    }

    const CurationConfig& config() const { return config_; }

private:
    CurationConfig config_;
};

} // namespace viveka
