#pragma once
// Interactive review: a resumable state machine over one bucket's queue
//
//   AwaitingInput --merge/keep/reject/update/split--> Applying --> Recorded
//   Recorded --> AwaitingInput (more work) | Done (queue exhausted)
//   AwaitingInput --quit--> Suspended (checkpoint written, resumable)
//
// Commands arrive as text lines; where they come from (stdin, a script,
// a test) does not matter. diff, list and help never mutate. A mutation
// is applied only after its DecisionRecord has been committed.

#include "audit.hpp"
#include "community.hpp"
#include "policy.hpp"
#include "session_state.hpp"
#include "triads.hpp"
#include <cctype>
#include <functional>
#include <sstream>

namespace viveka {

// Triads first, then multi-item communities, then uncovered pairs
inline std::vector<ReviewCandidate> build_review_queue(
    const std::map<std::string, SimilarityGraph>& graphs,
    const std::vector<Community>& communities,
    const std::vector<Triad>& triads,
    const DecisionPolicy& policy,
    Bucket bucket)
{
    auto [lo, hi] = policy.range(bucket);
    std::vector<ReviewCandidate> queue;
    std::set<PairKey> covered;

    auto cover = [&covered](const std::vector<ItemId>& members) {
        for (size_t i = 0; i < members.size(); ++i) {
            for (size_t j = i + 1; j < members.size(); ++j) {
                covered.insert(PairKey::of(members[i], members[j]));
            }
        }
    };
    auto scores_for = [&graphs](const std::string& category, const std::vector<ItemId>& members) {
        std::vector<ScoredPair> out;
        auto g = graphs.find(category);
        if (g == graphs.end()) return out;
        for (const auto& e : g->second.edges_among(members)) {
            out.push_back({e.a_id, e.b_id, e.blended_score});
        }
        return out;
    };

    // Triads sit at or above high_bucket by construction
    if (bucket == Bucket::High) {
        for (const auto& t : triads) {
            ReviewCandidate c;
            c.kind = CandidateKind::Triad;
            c.category = t.category;
            c.members = {t.a, t.b, t.c};
            c.scores = scores_for(t.category, t.members());
            c.score = std::max(t.ab, t.bc);
            queue.push_back(std::move(c));
            cover(t.members());
        }
    }

    for (const auto& comm : communities) {
        if (comm.size() <= 2) continue;
        if (comm.avg_similarity < lo || comm.avg_similarity >= hi) continue;
        bool holds_triad = false;
        for (const auto& t : triads) {
            if (comm.contains(t.a) && comm.contains(t.b) && comm.contains(t.c)) {
                holds_triad = true;
                break;
            }
        }
        if (holds_triad) continue;

        ReviewCandidate c;
        c.kind = CandidateKind::Community;
        c.category = comm.category;
        c.members = comm.members;
        c.scores = scores_for(comm.category, comm.members);
        c.score = comm.avg_similarity;
        c.ref = comm.id;
        queue.push_back(std::move(c));
        cover(comm.members);
    }

    std::vector<ReviewCandidate> pairs;
    for (const auto& [category, graph] : graphs) {
        for (const auto& [key, edge] : graph.edges()) {
            if (edge.blended_score < lo || edge.blended_score >= hi) continue;
            if (covered.count(key)) continue;
            ReviewCandidate c;
            c.kind = CandidateKind::Pair;
            c.category = category;
            c.members = {key.a, key.b};
            c.scores = {{key.a, key.b, edge.blended_score}};
            c.score = edge.blended_score;
            pairs.push_back(std::move(c));
        }
    }
    std::stable_sort(pairs.begin(), pairs.end(), [](const ReviewCandidate& x, const ReviewCandidate& y) {
        return x.score > y.score;
    });
    queue.insert(queue.end(), pairs.begin(), pairs.end());
    return queue;
}

enum class ReviewPhase : uint8_t {
    AwaitingInput = 0,
    Applying = 1,
    Recorded = 2,
    Done = 3,
    Suspended = 4,
};

inline const char* phase_name(ReviewPhase phase) {
    switch (phase) {
        case ReviewPhase::AwaitingInput: return "AWAITING_INPUT";
        case ReviewPhase::Applying: return "APPLYING";
        case ReviewPhase::Recorded: return "RECORDED";
        case ReviewPhase::Done: return "DONE";
        case ReviewPhase::Suspended: return "SUSPENDED";
    }
    return "DONE";
}

struct CommandResult {
    bool ok = true;           // Command understood and carried out
    bool mutated = false;     // A DecisionRecord was committed
    std::string message;
};

class ReviewSession {
public:
    using ContentChanged = std::function<void(const ItemId&)>;

    ReviewSession(AuditLog& audit, StateManager& states, std::string key,
                  SessionState state, const std::string& user)
        : audit_(audit), states_(states), key_(std::move(key)),
          state_(std::move(state)), user_(user)
    {
        settle_cursor();
    }

    // Called after `update` so the embedding side can drop stale neighbor lists
    void on_content_changed(ContentChanged fn) { content_changed_ = std::move(fn); }

    ReviewPhase phase() const { return phase_; }
    const SessionState& state() const { return state_; }

    const ReviewCandidate* current() const {
        if (state_.exhausted()) return nullptr;
        return &state_.queue[state_.cursor];
    }

    std::string render() const {
        const ReviewCandidate* c = current();
        if (!c) return "Queue exhausted.";
        const ItemPool& pool = audit_.pool();

        std::ostringstream out;
        out.precision(3);
        out << std::fixed;
        out << "[" << (state_.cursor + 1) << "/" << state_.queue.size() << "] "
            << candidate_kind_name(c->kind);
        if (!c->ref.empty()) out << " " << c->ref;
        out << " (" << c->category << ")\n";

        if (c->kind == CandidateKind::Triad) {
            const auto& m = c->members;
            out << "  A=" << m[0] << "  B=" << m[1] << "  C=" << m[2] << "\n";
            out << "  A~B " << fmt_score(c->score_of(m[0], m[1]))
                << "  B~C " << fmt_score(c->score_of(m[1], m[2]))
                << "  A~C " << fmt_score(c->score_of(m[0], m[2])) << "\n";
        } else {
            for (const auto& s : c->scores) {
                out << "  " << s.a << " ~ " << s.b << "  " << s.score << "\n";
            }
        }
        for (const auto& id : c->members) {
            const Item* item = pool.get(id);
            if (!item) continue;
            out << "  " << id << " [" << status_name(item->status) << "] " << item->title << "\n";
        }
        return out.str();
    }

    CommandResult handle(const std::string& line) {
        if (phase_ == ReviewPhase::Done || phase_ == ReviewPhase::Suspended) {
            return {false, false, std::string("session is ") + phase_name(phase_)};
        }

        std::string text = line;
        std::string rationale;
        auto sep = text.find(" -- ");
        if (sep != std::string::npos) {
            rationale = trim(text.substr(sep + 4));
            text = text.substr(0, sep);
        }
        std::istringstream iss(text);
        std::vector<std::string> args;
        for (std::string tok; iss >> tok;) args.push_back(tok);
        if (args.empty()) return {false, false, "empty command"};

        std::string cmd = args.front();
        args.erase(args.begin());
        std::transform(cmd.begin(), cmd.end(), cmd.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (cmd == "help") return {true, false, help()};
        if (cmd == "quit" || cmd == "q") return quit();
        if (cmd == "list") return {true, false, list()};

        if (!current()) {
            phase_ = ReviewPhase::Done;
            return {false, false, "queue exhausted"};
        }

        if (cmd == "diff") return diff(args);
        if (cmd == "skip") return skip();
        if (cmd == "merge") return merge(args, rationale);
        if (cmd == "merge_ab" || cmd == "merge_bc") return merge_triad(cmd == "merge_ab", rationale);
        if (cmd == "keep") return keep(rationale);
        if (cmd == "reject") return reject(args, rationale);
        if (cmd == "update") return update(args, text);
        if (cmd == "split") return split(args, rationale);

        return {false, false, "unknown command '" + cmd + "' (try 'help')"};
    }

    static std::string help() {
        return "Commands:\n"
               "  merge [X] [Y ..]      merge into X (default canonical when omitted)\n"
               "  merge_ab | merge_bc   triads: merge the named pair, leave the third\n"
               "  keep                  keep separate\n"
               "  reject <id> [reason]  reject an invalid entry without a merge target\n"
               "  update [id] title|body <text>   edit the canonical after a merge\n"
               "  split A,B C,D         communities: requeue each group\n"
               "  split <id>            pairs: clone <id> into a new pending entry\n"
               "  diff [X Y]            compare without changing anything\n"
               "  list | skip | quit | help\n"
               "Append ' -- <rationale>' to any decision to record why.";
    }

private:
    CommandResult merge(const std::vector<std::string>& args, const std::string& rationale) {
        const ReviewCandidate& c = *current();
        auto active = active_members(c);

        std::vector<ItemId> subject;
        if (c.kind == CandidateKind::Community && args.size() > 1) {
            subject = args;
        } else if (c.kind == CandidateKind::Triad) {
            if (args.size() != 2) return {false, false, "triads: merge X Y, merge_ab or merge_bc"};
            subject = args;
        } else {
            subject = active;
        }
        for (const auto& id : subject) {
            if (std::find(active.begin(), active.end(), id) == active.end()) {
                return {false, false, "'" + id + "' is not an active member"};
            }
        }

        std::optional<ItemId> canonical;
        if (!args.empty()) {
            if (std::find(active.begin(), active.end(), args.front()) == active.end()) {
                return {false, false, "'" + args.front() + "' is not an active member"};
            }
            canonical = args.front();
        } else {
            canonical = audit_.pool().default_canonical(subject);
        }
        if (!canonical || subject.size() < 2) return {false, false, "nothing to merge"};

        Action action = Action::Merge;
        if (c.kind == CandidateKind::Community && subject.size() < active.size()) {
            action = Action::MergeSubset;
        }
        return apply_merge(subject, *canonical, action, rationale, true);
    }

    CommandResult merge_triad(bool ab, const std::string& rationale) {
        const ReviewCandidate& c = *current();
        if (c.kind != CandidateKind::Triad) return {false, false, "merge_ab/merge_bc apply to triads"};
        std::vector<ItemId> subject = ab ? std::vector<ItemId>{c.members[0], c.members[1]}
                                         : std::vector<ItemId>{c.members[1], c.members[2]};
        for (const auto& id : subject) {
            if (!audit_.pool().is_active(id)) return {false, false, "'" + id + "' is no longer active"};
        }
        auto canonical = audit_.pool().default_canonical(subject);
        if (!canonical) return {false, false, "nothing to merge"};
        return apply_merge(subject, *canonical, Action::Merge, rationale, true);
    }

    CommandResult apply_merge(std::vector<ItemId> subject, const ItemId& canonical, Action action,
                              const std::string& rationale, bool advance) {
        phase_ = ReviewPhase::Applying;
        Timestamp ts = now();
        auto images = audit_.pool().plan_merge(subject, canonical, ts);

        DecisionRecord record = make_record(subject, action, rationale.empty()
            ? "reviewer merged " + join(subject) + " into " + canonical : rationale);
        record.target = canonical;
        record.timestamp = ts;
        if (!commit(std::move(record), images)) return failed();

        last_canonical_ = canonical;
        return recorded(advance, "merged " + join(subject) + " into " + canonical);
    }

    CommandResult keep(const std::string& rationale) {
        const ReviewCandidate& c = *current();
        auto members = active_members(c);
        phase_ = ReviewPhase::Applying;
        DecisionRecord record = make_record(members, Action::KeepSeparate,
                                            rationale.empty() ? "reviewer kept separate" : rationale);
        if (!commit(std::move(record), {})) return failed();
        state_.settled.insert(member_signature(c.category, members));
        return recorded(true, "kept " + join(members) + " separate");
    }

    CommandResult reject(const std::vector<std::string>& args, const std::string& rationale) {
        if (args.empty()) return {false, false, "usage: reject <id> [reason]"};
        const ReviewCandidate& c = *current();
        const ItemId& id = args.front();
        if (std::find(c.members.begin(), c.members.end(), id) == c.members.end()) {
            return {false, false, "'" + id + "' is not in this candidate"};
        }
        if (!audit_.pool().is_active(id)) return {false, false, "'" + id + "' is already rejected"};

        std::string reason = rationale;
        for (size_t i = 1; i < args.size(); ++i) {
            if (!reason.empty()) reason += " ";
            reason += args[i];
        }
        if (reason.empty()) reason = "rejected as invalid by reviewer";

        phase_ = ReviewPhase::Applying;
        Timestamp ts = now();
        auto images = audit_.pool().plan_reject(id, ts);
        DecisionRecord record = make_record({id}, Action::Reject, reason);
        record.timestamp = ts;
        if (!commit(std::move(record), images)) return failed();
        return recorded(false, "rejected " + id);
    }

    CommandResult update(const std::vector<std::string>& args, const std::string& text) {
        size_t field_at = 0;
        ItemId id;
        if (!args.empty() && args[0] != "title" && args[0] != "body") {
            id = args[0];
            field_at = 1;
        } else if (last_canonical_) {
            id = *last_canonical_;
        }
        if (id.empty() || args.size() <= field_at + 1 ||
            (args[field_at] != "title" && args[field_at] != "body")) {
            return {false, false, "usage: update [id] title|body <text>"};
        }

        // Everything after the field keyword, spacing preserved
        const std::string& field = args[field_at];
        auto pos = text.find(" " + field + " ");
        std::string value = (pos == std::string::npos) ? args[field_at + 1]
                                                       : trim(text.substr(pos + field.size() + 2));

        auto image = audit_.pool().plan_update(
            id, field == "title" ? std::optional<std::string>(value) : std::nullopt,
            field == "body" ? std::optional<std::string>(value) : std::nullopt, now());
        if (!image) return {false, false, "'" + id + "' is not an active item"};

        phase_ = ReviewPhase::Applying;
        DecisionRecord record = make_record({id}, Action::Update, field + " updated by reviewer");
        record.target = id;
        record.timestamp = image->updated_at;
        if (!commit(std::move(record), {*image})) return failed();
        if (content_changed_) content_changed_(id);
        return recorded(false, "updated " + field + " of " + id);
    }

    CommandResult split(const std::vector<std::string>& args, const std::string& rationale) {
        const ReviewCandidate& c = *current();

        if (c.kind == CandidateKind::Pair) {
            if (args.size() != 1) return {false, false, "usage: split <id>"};
            const ItemId& id = args.front();
            if (std::find(c.members.begin(), c.members.end(), id) == c.members.end()) {
                return {false, false, "'" + id + "' is not in this pair"};
            }
            auto copy = audit_.pool().plan_split_copy(id, now());
            if (!copy) return {false, false, "'" + id + "' not found"};

            phase_ = ReviewPhase::Applying;
            DecisionRecord record = make_record({id}, Action::Split,
                                                rationale.empty() ? "split into " + copy->id : rationale);
            record.target = copy->id;
            record.timestamp = copy->created_at;
            if (!commit(std::move(record), {*copy})) return failed();
            if (content_changed_) content_changed_(copy->id);
            return recorded(false, "split " + id + " into " + copy->id);
        }

        if (c.kind != CandidateKind::Community) return {false, false, "split applies to communities and pairs"};
        if (args.empty()) return {false, false, "usage: split A,B C,D"};

        auto active = active_members(c);
        std::vector<ReviewCandidate> requeue;
        std::set<ItemId> seen;
        for (const auto& arg : args) {
            std::vector<ItemId> group;
            std::istringstream parts(arg);
            for (std::string id; std::getline(parts, id, ',');) {
                if (id.empty()) continue;
                if (std::find(active.begin(), active.end(), id) == active.end()) {
                    return {false, false, "'" + id + "' is not an active member"};
                }
                if (!seen.insert(id).second) return {false, false, "'" + id + "' is in two groups"};
                group.push_back(id);
            }
            if (group.size() < 2) continue;
            std::sort(group.begin(), group.end());

            ReviewCandidate sub;
            sub.kind = group.size() == 2 ? CandidateKind::Pair : CandidateKind::Community;
            sub.category = c.category;
            sub.members = group;
            sub.ref = c.ref.empty() ? "" : c.ref + "." + std::to_string(requeue.size() + 1);
            float sum = 0.0f;
            for (const auto& s : c.scores) {
                if (std::binary_search(group.begin(), group.end(), s.a) &&
                    std::binary_search(group.begin(), group.end(), s.b)) {
                    sub.scores.push_back(s);
                    sum += s.score;
                }
            }
            sub.score = sub.scores.empty() ? 0.0f : sum / static_cast<float>(sub.scores.size());
            requeue.push_back(std::move(sub));
        }

        phase_ = ReviewPhase::Applying;
        DecisionRecord record = make_record(active, Action::Split,
                                            rationale.empty() ? "split into " + std::to_string(requeue.size()) + " groups"
                                                              : rationale);
        if (!commit(std::move(record), {})) return failed();

        auto at = state_.queue.begin() + static_cast<std::ptrdiff_t>(state_.cursor + 1);
        state_.queue.insert(at, requeue.begin(), requeue.end());
        return recorded(true, "split into " + std::to_string(requeue.size()) + " requeued groups");
    }

    CommandResult diff(const std::vector<std::string>& args) const {
        const ReviewCandidate& c = *current();
        std::vector<ItemId> ids = args.size() >= 2 ? std::vector<ItemId>{args[0], args[1]} : c.members;

        std::ostringstream out;
        out.precision(3);
        out << std::fixed;
        for (size_t i = 0; i < ids.size(); ++i) {
            const Item* item = audit_.pool().get(ids[i]);
            if (!item) return {false, false, "unknown item '" + ids[i] + "'"};
            out << "--- " << item->id << " [" << status_name(item->status) << "]";
            if (item->canonical_of) out << " -> " << *item->canonical_of;
            out << "\n  title: " << item->title << "\n  body:  " << item->body << "\n";
        }
        for (size_t i = 0; i < ids.size(); ++i) {
            for (size_t j = i + 1; j < ids.size(); ++j) {
                out << "  " << ids[i] << " ~ " << ids[j] << "  "
                    << fmt_score(c.score_of(ids[i], ids[j])) << "\n";
            }
        }
        return {true, false, out.str()};
    }

    std::string list() const {
        std::ostringstream out;
        out.precision(3);
        out << std::fixed;
        out << (state_.queue.size() - std::min(state_.cursor, state_.queue.size()))
            << " remaining in " << state_.bucket << " bucket\n";
        for (size_t i = state_.cursor; i < state_.queue.size() && i < state_.cursor + 10; ++i) {
            const auto& c = state_.queue[i];
            out << "  " << (i + 1) << ". " << candidate_kind_name(c.kind) << " "
                << c.score << "  " << join(c.members) << "\n";
        }
        return out.str();
    }

    CommandResult skip() {
        ++state_.cursor;
        settle_cursor();
        persist();
        return {true, false, "skipped"};
    }

    CommandResult quit() {
        persist();
        phase_ = ReviewPhase::Suspended;
        return {true, false, "progress saved at " + std::to_string(state_.cursor + 1) + "/" +
                             std::to_string(state_.queue.size())};
    }

    DecisionRecord make_record(std::vector<ItemId> subject, Action action, const std::string& rationale) const {
        DecisionRecord record;
        record.session_id = state_.session_id;
        record.round = 0;
        record.subject = std::move(subject);
        record.action = action;
        record.actor = Actor::Human;
        record.rationale = rationale;
        record.user = user_;
        return record;
    }

    bool commit(DecisionRecord record, const std::vector<Item>& images) {
        return audit_.commit(std::move(record), images);
    }

    CommandResult failed() {
        phase_ = ReviewPhase::AwaitingInput;
        return {false, false, "not applied: " + audit_.last_error()};
    }

    CommandResult recorded(bool advance, const std::string& message) {
        phase_ = ReviewPhase::Recorded;
        if (advance) ++state_.cursor;
        settle_cursor();
        persist();
        return {true, true, message};
    }

    // Skip candidates that earlier decisions made moot
    void settle_cursor() {
        while (!state_.exhausted() && active_members(state_.queue[state_.cursor]).size() < 2) {
            ++state_.cursor;
        }
        phase_ = state_.exhausted() ? ReviewPhase::Done : ReviewPhase::AwaitingInput;
    }

    void persist() {
        if (!states_.save(key_, state_)) {
            log::warn("review", "progress not saved; a restart resumes from the last checkpoint");
        }
    }

    std::vector<ItemId> active_members(const ReviewCandidate& c) const {
        std::vector<ItemId> out;
        for (const auto& id : c.members) {
            if (audit_.pool().is_active(id)) out.push_back(id);
        }
        return out;
    }

    static std::string fmt_score(std::optional<float> s) {
        if (!s) return "below keep";
        char buf[16];
        snprintf(buf, sizeof(buf), "%.3f", *s);
        return buf;
    }

    static std::string join(const std::vector<ItemId>& ids) {
        std::string out;
        for (size_t i = 0; i < ids.size(); ++i) {
            if (i > 0) out += ",";
            out += ids[i];
        }
        return out;
    }

    static std::string trim(const std::string& s) {
        auto b = s.find_first_not_of(" \t\r\n");
        if (b == std::string::npos) return "";
        auto e = s.find_last_not_of(" \t\r\n");
        return s.substr(b, e - b + 1);
    }

    AuditLog& audit_;
    StateManager& states_;
    std::string key_;
    SessionState state_;
    std::string user_;
    ReviewPhase phase_ = ReviewPhase::AwaitingInput;
    std::optional<ItemId> last_canonical_;
    ContentChanged content_changed_;
};

} // namespace viveka
