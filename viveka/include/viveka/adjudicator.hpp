#pragma once
// Adjudicator: closed verdict over a candidate group
//
// The adjudicator (usually an LLM behind a command) sees the members of a
// community and answers with one of five verdicts. Anything the parser
// cannot map exactly onto a verdict becomes ManualReview, never a
// default merge or keep.
//
// Reply format:
//   {"decision": "merge_all" | "merge_subset" | "keep_separate" | "split" | "manual_review",
//    "canonical": "EXP-1", "subset": [..], "merges": [["EXP-2", "EXP-1"], ..],
//    "groups": [[..], [..]], "confidence": 0.9, "rationale": "..."}

#include "errors.hpp"
#include "log.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <set>
#include <string>
#include <vector>

namespace viveka {

enum class VerdictKind : uint8_t {
    Merge = 0,          // Collapse every member into the canonical
    MergeSubset = 1,    // Collapse `subset`; the rest stay in the pool
    KeepSeparate = 2,
    Split = 3,          // Re-adjudicate each of `groups`
    ManualReview = 4,
};

inline const char* verdict_name(VerdictKind kind) {
    switch (kind) {
        case VerdictKind::Merge: return "merge_all";
        case VerdictKind::MergeSubset: return "merge_subset";
        case VerdictKind::KeepSeparate: return "keep_separate";
        case VerdictKind::Split: return "split";
        case VerdictKind::ManualReview: return "manual_review";
    }
    return "manual_review";
}

struct Verdict {
    VerdictKind kind = VerdictKind::ManualReview;
    std::optional<ItemId> canonical;            // Merge / MergeSubset
    std::vector<ItemId> subset;                 // MergeSubset, sorted
    std::vector<std::vector<ItemId>> groups;    // Split
    float confidence = 1.0f;
    std::string rationale;
    bool failed = false;                        // No usable answer; asking again may help

    static Verdict manual(const std::string& why) {
        Verdict v;
        v.kind = VerdictKind::ManualReview;
        v.confidence = 0.0f;
        v.rationale = why;
        return v;
    }

    // Unparseable, invalid, timed out or crashed: manual review unless a retry succeeds
    static Verdict failure(const std::string& why) {
        Verdict v = manual(why);
        v.failed = true;
        return v;
    }
};

// What the adjudicator is asked about
struct AdjudicationRequest {
    std::string community_id;
    std::string category;
    uint32_t round = 0;
    std::vector<Item> items;
    std::vector<Edge> edges;        // Pairwise scores among `items`

    std::vector<ItemId> ids() const {
        std::vector<ItemId> out;
        for (const auto& item : items) out.push_back(item.id);
        return out;
    }
};

inline nlohmann::json build_prompt(const AdjudicationRequest& req) {
    nlohmann::json members = nlohmann::json::array();
    for (const auto& item : req.items) {
        members.push_back({
            {"id", item.id},
            {"title", item.title},
            {"body", item.body},
            {"status", status_name(item.status)}
        });
    }
    nlohmann::json pairs = nlohmann::json::array();
    for (const auto& e : req.edges) {
        pairs.push_back({{"a", e.a_id}, {"b", e.b_id}, {"score", e.blended_score}});
    }
    return {
        {"community_id", req.community_id},
        {"category", req.category},
        {"round", req.round},
        {"members", members},
        {"pairwise", pairs},
        {"decisions", {"merge_all", "merge_subset", "keep_separate", "split", "manual_review"}}
    };
}

namespace detail {

// Reply text may be wrapped in a markdown fence or prose
inline std::string extract_object(const std::string& text) {
    auto first = text.find('{');
    auto last = text.rfind('}');
    if (first == std::string::npos || last == std::string::npos || last < first) return "";
    return text.substr(first, last - first + 1);
}

inline bool read_ids(const nlohmann::json& arr, const std::set<ItemId>& allowed,
                     std::vector<ItemId>& out, std::string& err) {
    if (!arr.is_array()) {
        err = "expected an array of ids";
        return false;
    }
    for (const auto& v : arr) {
        if (!v.is_string()) {
            err = "ids must be strings";
            return false;
        }
        auto id = v.get<std::string>();
        if (!allowed.count(id)) {
            err = "unknown id '" + id + "'";
            return false;
        }
        if (std::find(out.begin(), out.end(), id) == out.end()) out.push_back(id);
    }
    return true;
}

} // namespace detail

// Strict reply parser. `allowed` is the set of member ids the request named.
inline Verdict parse_verdict(const std::string& reply, const std::vector<ItemId>& allowed_ids) {
    std::set<ItemId> allowed(allowed_ids.begin(), allowed_ids.end());

    std::string body = detail::extract_object(reply);
    if (body.empty()) return Verdict::failure("ambiguous decision: no JSON object in reply");

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        return Verdict::failure(std::string("ambiguous decision: ") + e.what());
    }
    if (!doc.is_object()) return Verdict::failure("ambiguous decision: reply is not an object");

    Verdict v;
    for (const char* key : {"rationale", "notes", "reasoning"}) {
        auto it = doc.find(key);
        if (it != doc.end() && it->is_string() && !it->get<std::string>().empty()) {
            v.rationale = it->get<std::string>();
            break;
        }
    }

    auto decision_it = doc.find("decision");
    if (decision_it == doc.end() || !decision_it->is_string()) {
        return Verdict::failure("ambiguous decision: missing 'decision'");
    }
    std::string decision = decision_it->get<std::string>();
    std::transform(decision.begin(), decision.end(), decision.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (decision == "manual_review") {
        if (v.rationale.empty()) v.rationale = "adjudicator requested manual review";
        v.kind = VerdictKind::ManualReview;
        return v;
    }
    if (v.rationale.empty()) return Verdict::failure("ambiguous decision: missing rationale");

    auto conf = doc.find("confidence");
    if (conf != doc.end() && !conf->is_null()) {
        if (!conf->is_number()) return Verdict::failure("ambiguous decision: confidence is not a number");
        double c = conf->get<double>();
        if (!(c >= 0.0 && c <= 1.0)) return Verdict::failure("ambiguous decision: confidence out of range");
        v.confidence = static_cast<float>(c);
    }

    std::string err;
    if (auto c = doc.find("canonical"); c != doc.end() && !c->is_null()) {
        if (!c->is_string() || !allowed.count(c->get<std::string>())) {
            return Verdict::failure("ambiguous decision: unknown canonical");
        }
        v.canonical = c->get<std::string>();
    }

    // [[src, dst], ..] pairs all pointing at one destination
    std::vector<ItemId> merge_members;
    if (auto m = doc.find("merges"); m != doc.end() && !m->is_null()) {
        if (!m->is_array()) return Verdict::failure("ambiguous decision: 'merges' must be an array");
        std::optional<ItemId> dst;
        for (const auto& pair : *m) {
            std::vector<ItemId> ids;
            if (!pair.is_array() || pair.size() != 2 || !detail::read_ids(pair, allowed, ids, err) ||
                ids.size() != 2) {
                return Verdict::failure("ambiguous decision: malformed merge pair");
            }
            if (dst && *dst != ids[1]) {
                return Verdict::failure("ambiguous decision: conflicting merge targets");
            }
            dst = ids[1];
            for (const auto& id : ids) {
                if (std::find(merge_members.begin(), merge_members.end(), id) == merge_members.end()) {
                    merge_members.push_back(id);
                }
            }
        }
        if (dst) {
            if (v.canonical && *v.canonical != *dst) {
                return Verdict::failure("ambiguous decision: canonical disagrees with merges");
            }
            v.canonical = dst;
        }
    }

    if (decision == "keep_separate" || decision == "keep") {
        v.kind = VerdictKind::KeepSeparate;
        v.canonical.reset();
        return v;
    }

    if (decision == "merge_all" || decision == "merge") {
        v.kind = VerdictKind::Merge;
        v.subset.assign(allowed.begin(), allowed.end());
        return v;
    }

    if (decision == "merge_subset") {
        std::vector<ItemId> subset;
        if (auto s = doc.find("subset"); s != doc.end() && !s->is_null()) {
            if (!detail::read_ids(*s, allowed, subset, err)) {
                return Verdict::failure("ambiguous decision: " + err);
            }
        } else {
            subset = merge_members;
        }
        if (v.canonical && std::find(subset.begin(), subset.end(), *v.canonical) == subset.end()) {
            subset.push_back(*v.canonical);
        }
        if (subset.size() < 2) return Verdict::failure("ambiguous decision: subset needs two members");
        std::sort(subset.begin(), subset.end());
        v.subset = subset;
        v.kind = (subset.size() == allowed.size()) ? VerdictKind::Merge : VerdictKind::MergeSubset;
        return v;
    }

    if (decision == "split") {
        auto g = doc.find("groups");
        if (g == doc.end() || !g->is_array() || g->empty()) {
            return Verdict::failure("ambiguous decision: split without groups");
        }
        std::set<ItemId> seen;
        for (const auto& group : *g) {
            std::vector<ItemId> ids;
            if (!detail::read_ids(group, allowed, ids, err)) {
                return Verdict::failure("ambiguous decision: " + err);
            }
            for (const auto& id : ids) {
                if (!seen.insert(id).second) {
                    return Verdict::failure("ambiguous decision: '" + id + "' in two groups");
                }
            }
            std::sort(ids.begin(), ids.end());
            if (!ids.empty()) v.groups.push_back(ids);
        }
        v.kind = VerdictKind::Split;
        v.canonical.reset();
        return v;
    }

    return Verdict::failure("ambiguous decision: unknown decision '" + decision + "'");
}

class Adjudicator {
public:
    virtual ~Adjudicator() = default;

    // Throws ProviderUnavailable when the adjudicator cannot be reached
    virtual Verdict decide(const AdjudicationRequest& request) = 0;

    virtual std::string name() const = 0;
};

// Runs an external command per request: prompt JSON on stdin, reply on stdout
class CommandAdjudicator : public Adjudicator {
public:
    CommandAdjudicator(std::string command, int timeout_seconds)
        : command_(std::move(command)), timeout_seconds_(timeout_seconds) {}

    Verdict decide(const AdjudicationRequest& request) override {
        char path[] = "/tmp/viveka_prompt_XXXXXX";
        int fd = mkstemp(path);
        if (fd < 0) throw ProviderUnavailable(name(), "cannot create prompt file");
        close(fd);

        {
            std::ofstream out(path);
            out << build_prompt(request).dump() << "\n";
            if (!out) {
                unlink(path);
                throw ProviderUnavailable(name(), "cannot write prompt file");
            }
        }

        std::string cmd = "timeout " + std::to_string(timeout_seconds_) + " " +
                          command_ + " < \"" + path + "\"";
        FILE* pipe = popen(cmd.c_str(), "r");
        if (!pipe) {
            unlink(path);
            throw ProviderUnavailable(name(), "cannot start '" + command_ + "'");
        }

        std::string reply;
        char buffer[4096];
        size_t n;
        while ((n = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
            reply.append(buffer, n);
        }
        int status = pclose(pipe);
        unlink(path);

        int code = (status >= 0 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
        if (code == 127) throw ProviderUnavailable(name(), "command not found: " + command_);
        if (code == 124) {
            log::warn("adjudicator", "%s timed out after %ds",
                      request.community_id.c_str(), timeout_seconds_);
            return Verdict::failure("adjudicator timed out after " + std::to_string(timeout_seconds_) + "s");
        }
        if (code != 0) {
            log::warn("adjudicator", "%s: command exited with %d", request.community_id.c_str(), code);
            return Verdict::failure("adjudicator exited with status " + std::to_string(code));
        }
        if (reply.find_first_not_of(" \t\r\n") == std::string::npos) {
            return Verdict::failure("adjudicator returned no output");
        }
        return parse_verdict(reply, request.ids());
    }

    std::string name() const override { return "llm-command"; }

private:
    std::string command_;
    int timeout_seconds_;
};

} // namespace viveka
