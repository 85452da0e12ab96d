#pragma once
// Convergence loop: unattended multi-round curation
//
// Each round: build graphs, auto-dedup, rebuild, detect triads and
// communities, then resolve communities in priority order through the
// policy (auto-merge, adjudicator, or the manual queue). Stops when a
// round improves less than min_improvement_rate or max_iterations rounds
// have completed. The checkpoint is written after every round, so a
// restart continues with the next round.
//
// improvement_rate = (active_before - active_after) / (active_before - excluded)
// where excluded counts members of communities sent to manual review.
// batch_size caps the communities decided per round, best priority first.
// A failed adjudicator call is retried llm_max_retries times before the
// community goes to manual review.

#include "adjudicator.hpp"
#include "auto_dedup.hpp"
#include "community.hpp"
#include "policy.hpp"
#include "session_state.hpp"
#include "triads.hpp"
#include <chrono>
#include <functional>
#include <thread>

namespace viveka {

enum class StopReason : uint8_t {
    Converged = 0,
    MaxIterations = 1,
    ProviderFailure = 2,
    StoreFailure = 3,
    Interrupted = 4,
};

inline const char* stop_reason_name(StopReason reason) {
    switch (reason) {
        case StopReason::Converged: return "converged";
        case StopReason::MaxIterations: return "max_iterations";
        case StopReason::ProviderFailure: return "provider_unavailable";
        case StopReason::StoreFailure: return "store_failure";
        case StopReason::Interrupted: return "interrupted";
    }
    return "interrupted";
}

struct OvernightResult {
    StopReason reason = StopReason::Converged;
    SessionState state;                         // Includes every round so far
    size_t final_active = 0;
    std::vector<ManualReviewEntry> manual;      // Queued by this run
    std::vector<std::string> warnings;
    size_t decisions = 0;                       // Committed by this run
    bool dry_run = false;

    bool ok() const {
        return reason == StopReason::Converged || reason == StopReason::MaxIterations;
    }
};

class ConvergenceLoop {
public:
    // Return false to stop after the reported round (the checkpoint is already written)
    using RoundObserver = std::function<bool(const RoundReport&)>;

    ConvergenceLoop(const CurationConfig& config, const ItemPool& pool, Store* store,
                    VectorProvider& vectors, RerankProvider* rerank, Adjudicator* adjudicator,
                    bool dry_run = false)
        : config_(config), policy_(config), pool_(pool), store_(dry_run ? nullptr : store),
          audit_(store_, pool_, dry_run), states_(store_), builder_(vectors, rerank, config_),
          adjudicator_(adjudicator), dry_run_(dry_run) {}

    void on_round(RoundObserver fn) { observer_ = std::move(fn); }

    // Working copy; in dry-run mode the only place merges show up
    const ItemPool& pool() const { return pool_; }
    GraphBuilder& builder() { return builder_; }

    OvernightResult run(bool reset_state = false) {
        OvernightResult result;
        result.dry_run = dry_run_;
        const std::string key = StateManager::overnight_key();

        if (reset_state && !states_.reset(key)) {
            log::warn("overnight", "could not clear previous checkpoint");
        }
        auto loaded = states_.load(key);
        if (loaded && loaded->stop_reason.empty()) {
            state_ = *loaded;
            log::info("overnight", "resuming %s at round %u",
                      state_.session_id.c_str(), state_.round_counter + 1);
        } else {
            state_ = SessionState{};
            state_.session_id = "overnight-" + iso8601(now());
            state_.initial_active = pool_.active_count();
        }

        TriadDetector triad_detector(config_.thresholds.high_bucket);
        CommunityDetector community_detector(config_);
        AutoDedup dedup(config_, audit_);
        const size_t decisions_at_start = audit_.committed();

        while (true) {
            if (state_.round_counter >= config_.max_iterations) {
                result.reason = StopReason::MaxIterations;
                break;
            }

            RoundReport report;
            report.round = state_.round_counter + 1;
            report.items_before = pool_.active_count();
            const size_t decisions_before = audit_.committed();
            touched_.clear();

            try {
                auto graphs = builder_.build_all(pool_);
                note_graph_warnings(graphs, report.round, result);

                auto dd = dedup.run(graphs, state_.session_id, report.round);
                if (dd.failed) throw StoreError(audit_.last_error());
                report.auto_merges = dd.merged_items;
                if (dd.withheld_groups > 0) {
                    result.warnings.push_back("round " + std::to_string(report.round) + ": " +
                                              std::to_string(dd.withheld_groups) +
                                              " auto-dedup chains withheld for review");
                }
                if (dd.merged_items > 0) graphs = builder_.build_all(pool_);

                auto triads = triad_detector.detect_all(graphs);
                auto communities = community_detector.detect_all(graphs);
                report.triads = triads.size();
                report.communities = communities.size();

                size_t handled = 0;
                for (const auto& comm : communities) {
                    if (config_.batch_size > 0 && handled >= config_.batch_size) break;
                    if (process(comm, graphs.at(comm.category), triads, report, result)) ++handled;
                }
            } catch (const ProviderUnavailable& e) {
                report.failed = true;
                report.error = e.what();
                log::error("overnight", "round %u failed: %s", report.round, e.what());
                result.warnings.push_back("round " + std::to_string(report.round) + " failed: " + e.what());
                state_.rounds.push_back(report);
                checkpoint();
                result.reason = StopReason::ProviderFailure;
                break;
            } catch (const StoreError& e) {
                report.failed = true;
                report.error = e.what();
                log::error("overnight", "round %u aborted: %s", report.round, e.what());
                result.warnings.push_back("round " + std::to_string(report.round) + " aborted: " + e.what());
                result.reason = StopReason::StoreFailure;
                break;
            }

            report.items_after = pool_.active_count();
            report.decisions = audit_.committed() - decisions_before;
            size_t reduced = report.items_before - report.items_after;
            size_t denominator = report.items_before > report.excluded_items
                ? report.items_before - report.excluded_items : 0;
            report.improvement_rate = denominator
                ? static_cast<float>(reduced) / static_cast<float>(denominator) : 0.0f;

            state_.improvement_history.push_back(report.improvement_rate);
            state_.rounds.push_back(report);
            state_.round_counter = report.round;
            if (!checkpoint()) {
                result.reason = StopReason::StoreFailure;
                break;
            }

            log::info("overnight", "round %u: %zu -> %zu active (%.1f%%), %zu communities, "
                      "%zu manual, %zu deferred",
                      report.round, report.items_before, report.items_after,
                      report.improvement_rate * 100.0f, report.communities,
                      report.manual, report.deferred);

            if (observer_ && !observer_(report)) {
                result.reason = StopReason::Interrupted;
                break;
            }
            if (report.improvement_rate < config_.min_improvement_rate) {
                result.reason = StopReason::Converged;
                break;
            }
        }

        if (result.reason == StopReason::Converged || result.reason == StopReason::MaxIterations) {
            state_.stop_reason = stop_reason_name(result.reason);
            checkpoint();
        }

        result.state = state_;
        result.final_active = pool_.active_count();
        result.decisions = audit_.committed() - decisions_at_start;
        log::info("overnight", "stopped (%s) after %u rounds: %zu -> %zu active",
                  stop_reason_name(result.reason), state_.round_counter,
                  state_.initial_active, result.final_active);
        return result;
    }

    const std::vector<DecisionRecord>& records() const { return audit_.records(); }

private:
    // False when the community was skipped without a decision (counts against no batch)
    bool process(const Community& comm, const SimilarityGraph& graph,
                 const std::vector<Triad>& triads, RoundReport& report, OvernightResult& result) {
        auto active = active_members(comm.members);
        if (active.size() < 2) return false;
        if (state_.settled.count(member_signature(comm.category, active))) return false;

        for (const auto& id : active) {
            if (touched_.count(id)) {
                ++report.deferred;
                log::debug("overnight", "%s deferred: %s already changed this round",
                           comm.id.c_str(), id.c_str());
                return false;
            }
        }

        if (comm.oversized && !config_.process_oversized) {
            to_manual(comm.category, comm.id, active, "oversized community (" +
                      std::to_string(active.size()) + " members)", report, result);
            return true;
        }

        bool holds_triad = false;
        for (const auto& t : triads) {
            if (comm.contains(t.a) && comm.contains(t.b) && comm.contains(t.c)) {
                holds_triad = true;
                break;
            }
        }

        switch (policy_.route(comm.avg_similarity)) {
            case Route::Ignore:
            case Route::Borderline:
                return false;
            case Route::AutoMerge:
                if (!holds_triad) {
                    auto canonical = pool_.default_canonical(active);
                    char why[96];
                    snprintf(why, sizeof(why), "community average %.3f >= auto_dedup %.3f",
                             comm.avg_similarity, config_.thresholds.auto_dedup);
                    merge(active, *canonical, Action::Merge, Actor::AutoThreshold, why, report);
                    return true;
                }
                break;
            case Route::Review:
                break;
        }
        adjudicate(comm.category, comm.id, active, graph, 0, report, result);
        return true;
    }

    void adjudicate(const std::string& category, const std::string& ref,
                    const std::vector<ItemId>& members, const SimilarityGraph& graph, int depth,
                    RoundReport& report, OvernightResult& result) {
        if (!adjudicator_) {
            to_manual(category, ref, members, "no adjudicator configured", report, result);
            return;
        }

        AdjudicationRequest request;
        request.community_id = ref;
        request.category = category;
        request.round = report.round;
        for (const auto& id : members) request.items.push_back(*pool_.get(id));
        request.edges = graph.edges_among(members);

        Verdict verdict;
        for (uint32_t attempt = 1;; ++attempt) {
            try {
                verdict = adjudicator_->decide(request);
            } catch (const ProviderUnavailable& e) {
                verdict = Verdict::failure(e.what());
            }
            if (!verdict.failed || attempt > config_.llm_max_retries) break;

            int delay = config_.retry_delay(attempt);
            log::warn("overnight", "%s attempt %u failed (%s); retrying in %ds",
                      ref.c_str(), attempt, verdict.rationale.c_str(), delay);
            if (delay > 0) std::this_thread::sleep_for(std::chrono::seconds(delay));
        }
        if (verdict.kind != VerdictKind::ManualReview && verdict.confidence < config_.min_llm_confidence) {
            char why[96];
            snprintf(why, sizeof(why), "low confidence %.2f < %.2f",
                     verdict.confidence, config_.min_llm_confidence);
            verdict = Verdict::manual(why);
        }

        std::string rationale = verdict.rationale;
        switch (verdict.kind) {
            case VerdictKind::Merge: {
                auto canonical = verdict.canonical ? verdict.canonical : pool_.default_canonical(members);
                merge(members, *canonical, Action::Merge, Actor::Llm, rationale, report);
                break;
            }
            case VerdictKind::MergeSubset: {
                auto canonical = verdict.canonical ? verdict.canonical
                                                   : pool_.default_canonical(verdict.subset);
                merge(verdict.subset, *canonical, Action::MergeSubset, Actor::Llm, rationale, report);
                break;
            }
            case VerdictKind::KeepSeparate:
                record(members, std::nullopt, Action::KeepSeparate, Actor::Llm, rationale, {}, report);
                state_.settled.insert(member_signature(category, members));
                ++report.kept;
                break;
            case VerdictKind::Split:
                if (depth > 0) {
                    to_manual(category, ref, members, "adjudicator split a split group", report, result);
                    break;
                }
                record(members, std::nullopt, Action::Split, Actor::Llm, rationale, {}, report);
                for (size_t i = 0; i < verdict.groups.size(); ++i) {
                    if (verdict.groups[i].size() < 2) continue;
                    adjudicate(category, ref + "." + std::to_string(i + 1), verdict.groups[i],
                               graph, depth + 1, report, result);
                }
                break;
            case VerdictKind::ManualReview:
                to_manual(category, ref, members, rationale, report, result);
                break;
        }
    }

    void merge(const std::vector<ItemId>& members, const ItemId& canonical, Action action,
               Actor actor, const std::string& rationale, RoundReport& report) {
        Timestamp ts = now();
        auto images = pool_.plan_merge(members, canonical, ts);
        size_t absorbed = 0;
        for (const auto& image : images) {
            if (std::find(members.begin(), members.end(), image.id) != members.end()) ++absorbed;
        }
        if (absorbed == 0) return;
        record(members, canonical, action, actor, rationale, images, report);
        report.merges += absorbed;
    }

    void record(const std::vector<ItemId>& members, const std::optional<ItemId>& target,
                Action action, Actor actor, const std::string& rationale,
                const std::vector<Item>& images, RoundReport& report) {
        DecisionRecord r;
        r.session_id = state_.session_id;
        r.round = report.round;
        r.subject = members;
        r.target = target;
        r.action = action;
        r.actor = actor;
        r.rationale = rationale;
        r.user = config_.user;
        if (!audit_.commit(std::move(r), images)) throw StoreError(audit_.last_error());
        if (action != Action::KeepSeparate) {
            touched_.insert(members.begin(), members.end());
        }
    }

    void to_manual(const std::string& category, const std::string& ref,
                   const std::vector<ItemId>& members, const std::string& reason,
                   RoundReport& report, OvernightResult& result) {
        ManualReviewEntry entry;
        entry.session_id = state_.session_id;
        entry.round = report.round;
        entry.community_id = ref;
        entry.category = category;
        entry.members = members;
        entry.reason = reason;
        entry.queued_at = now();
        if (store_ && !store_->enqueue_manual(entry)) throw StoreError(store_->last_error());

        log::info("overnight", "%s -> manual review: %s", ref.c_str(), reason.c_str());
        state_.settled.insert(member_signature(category, members));
        ++report.manual;
        report.excluded_items += members.size();
        result.manual.push_back(std::move(entry));
    }

    void note_graph_warnings(const std::map<std::string, SimilarityGraph>& graphs, uint32_t round,
                             OvernightResult& result) {
        size_t violations = 0;
        for (const auto& [_, g] : graphs) violations += g.stats.cross_category;
        if (violations > 0) {
            result.warnings.push_back("round " + std::to_string(round) + ": " +
                                      std::to_string(violations) +
                                      " cross-category neighbors discarded");
        }
    }

    bool checkpoint() {
        if (dry_run_) return true;
        return states_.save(StateManager::overnight_key(), state_);
    }

    std::vector<ItemId> active_members(const std::vector<ItemId>& members) const {
        std::vector<ItemId> out;
        for (const auto& id : members) {
            if (pool_.is_active(id)) out.push_back(id);
        }
        return out;
    }

    CurationConfig config_;
    DecisionPolicy policy_;
    ItemPool pool_;
    Store* store_;
    AuditLog audit_;
    StateManager states_;
    GraphBuilder builder_;
    Adjudicator* adjudicator_;
    bool dry_run_;
    RoundObserver observer_;
    SessionState state_;
    std::set<ItemId> touched_;
};

} // namespace viveka
