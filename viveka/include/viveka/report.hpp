#pragma once
// Reports and exports
//
// Morning report (Markdown) and its JSON twin, canonical set export,
// the JSONL item format shared by import and export, and decision
// lineage output.

#include "convergence.hpp"
#include <nlohmann/json.hpp>
#include <cstdio>
#include <fstream>
#include <set>
#include <sstream>

namespace viveka {

inline json item_to_json(const Item& item) {
    json j = {
        {"id", item.id},
        {"category", item.category},
        {"title", item.title},
        {"body", item.body},
        {"embedding_ref", item.embedding_ref},
        {"status", status_name(item.status)},
        {"created_at", item.created_at},
        {"updated_at", item.updated_at}
    };
    if (item.canonical_of) j["canonical_of"] = *item.canonical_of;
    return j;
}

// Accepts the export format plus "content"/"playbook" for body and "type" for category
inline std::optional<Item> item_from_json(const json& j, std::string& error) {
    if (!j.is_object()) {
        error = "record is not an object";
        return std::nullopt;
    }
    Item item;
    item.id = j.value("id", "");
    item.category = j.value("category", j.value("type", ""));
    if (item.id.empty() || item.category.empty()) {
        error = "record needs 'id' and 'category'";
        return std::nullopt;
    }
    item.title = j.value("title", "");
    item.body = j.value("body", j.value("content", j.value("playbook", "")));
    item.embedding_ref = j.value("embedding_ref", item.id);

    auto status = j.find("status");
    if (status == j.end()) status = j.find("sync_status");
    if (status != j.end()) {
        std::string s = status->is_number_integer() ? std::to_string(status->get<int>())
                                                    : status->is_string() ? status->get<std::string>() : "";
        auto parsed = parse_status(s);
        if (!parsed) {
            error = "unknown status for " + item.id;
            return std::nullopt;
        }
        item.status = *parsed;
    }
    if (j.contains("canonical_of") && j["canonical_of"].is_string()) {
        item.canonical_of = j["canonical_of"].get<std::string>();
    }
    item.created_at = j.value("created_at", now());
    item.updated_at = j.value("updated_at", item.created_at);
    return item;
}

struct ImportResult {
    size_t imported = 0;
    size_t skipped = 0;             // Unparseable or invalid lines
    size_t dangling = 0;            // Merged rows whose canonical is missing or inactive
    bool failed = false;            // The store refused a write
    std::string error;
};

// Read JSONL items and write them to the store. Merged rows are checked
// against the store contents plus the whole file, so a canonical may
// appear later in the file than the rows pointing at it.
inline ImportResult import_items(Store& store, std::istream& in, const std::string& source) {
    ImportResult result;
    std::vector<Item> incoming;
    size_t line_no = 0;
    std::string line;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        std::string error;
        std::optional<Item> item;
        try {
            item = item_from_json(json::parse(line), error);
        } catch (const json::exception& e) {
            error = e.what();
        }
        if (!item) {
            log::warn("import", "%s:%zu skipped: %s", source.c_str(), line_no, error.c_str());
            ++result.skipped;
            continue;
        }
        incoming.push_back(std::move(*item));
    }

    ItemPool combined(store.load_items());
    for (const auto& item : incoming) combined.put(item);
    auto violations = combined.chain_violations();
    std::set<ItemId> dangling(violations.begin(), violations.end());

    for (const auto& item : incoming) {
        if (dangling.count(item.id)) {
            log::warn("import", "%s skipped: canonical %s is missing or not active",
                      item.id.c_str(), item.canonical_of->c_str());
            ++result.dangling;
            continue;
        }
        if (!store.put_item(item)) {
            result.failed = true;
            result.error = store.last_error();
            return result;
        }
        ++result.imported;
    }
    return result;
}

inline json decision_to_json(const DecisionRecord& r) {
    json j = {
        {"seq", r.seq},
        {"timestamp", iso8601(r.timestamp)},
        {"session", r.session_id},
        {"round", r.round},
        {"action", action_name(r.action)},
        {"actor", actor_name(r.actor)},
        {"subject", r.subject},
        {"rationale", r.rationale},
        {"user", r.user}
    };
    if (r.target) j["target"] = *r.target;
    return j;
}

// Active items only
inline bool export_canonical(const ItemPool& pool, const std::string& path) {
    std::ofstream out(path);
    if (!out) return false;
    for (const auto& [_, item] : pool.items()) {
        if (item.active()) out << item_to_json(item).dump() << "\n";
    }
    return static_cast<bool>(out);
}

// Rebuild a run summary from the last checkpoint (for `report` without a run)
inline OvernightResult summary_from_state(const SessionState& state,
                                          std::vector<ManualReviewEntry> manual,
                                          const ItemPool& pool) {
    OvernightResult r;
    r.state = state;
    r.final_active = pool.active_count();
    r.manual = std::move(manual);
    if (state.stop_reason == "converged") r.reason = StopReason::Converged;
    else if (state.stop_reason == "max_iterations") r.reason = StopReason::MaxIterations;
    else r.reason = StopReason::Interrupted;
    for (const auto& round : state.rounds) {
        r.decisions += round.decisions;
        if (round.failed) r.warnings.push_back("round " + std::to_string(round.round) + " failed: " + round.error);
    }
    return r;
}

inline float reduction(const OvernightResult& r) {
    if (r.state.initial_active == 0) return 0.0f;
    size_t initial = r.state.initial_active;
    size_t final_active = std::min(r.final_active, initial);
    return static_cast<float>(initial - final_active) / static_cast<float>(initial);
}

inline std::string morning_report(const OvernightResult& r) {
    char buf[64];
    std::ostringstream out;
    out << "# Morning Report" << (r.dry_run ? " (dry run)" : "") << "\n\n";

    out << "## Summary\n";
    out << "- Session: " << r.state.session_id << "\n";
    out << "- Initial active: " << r.state.initial_active << "\n";
    out << "- Final active: " << r.final_active << "\n";
    snprintf(buf, sizeof(buf), "%.2f%%", reduction(r) * 100.0f);
    out << "- Reduction: " << buf << "\n";
    out << "- Rounds run: " << r.state.round_counter << "\n";
    out << "- Stop reason: " << stop_reason_name(r.reason) << "\n";
    out << "- Decisions recorded: " << r.decisions << "\n\n";

    out << "## Round Details\n";
    out << "| Round | Communities | Triads | Items | Auto Merges | Merges | Kept | Manual Reviews | Deferred | Improvement |\n";
    out << "| --- | --- | --- | --- | --- | --- | --- | --- | --- | --- |\n";
    for (const auto& row : r.state.rounds) {
        if (row.failed) {
            out << "| " << row.round << " | failed | | " << row.items_before
                << " | | | | | | " << row.error << " |\n";
            continue;
        }
        snprintf(buf, sizeof(buf), "%.2f%%", row.improvement_rate * 100.0f);
        out << "| " << row.round << " | " << row.communities << " | " << row.triads
            << " | " << row.items_before << " -> " << row.items_after
            << " | " << row.auto_merges << " | " << row.merges << " | " << row.kept
            << " | " << row.manual << " | " << row.deferred << " | " << buf << " |\n";
    }
    out << "\n";

    out << "## Manual Review Queue\n";
    if (r.manual.empty()) {
        out << "- (none)\n";
    } else {
        for (const auto& e : r.manual) {
            out << "- " << (e.community_id.empty() ? "?" : e.community_id)
                << " (" << e.category << ", round " << e.round << "): ";
            for (size_t i = 0; i < e.members.size(); ++i) {
                if (i > 0) out << ", ";
                out << e.members[i];
            }
            out << " - " << e.reason << "\n";
        }
    }

    if (!r.warnings.empty()) {
        out << "\n## Warnings\n";
        for (const auto& w : r.warnings) out << "- " << w << "\n";
    }
    return out.str();
}

inline json summary_json(const OvernightResult& r) {
    json rounds = json::array();
    for (const auto& row : r.state.rounds) rounds.push_back(row.to_json());
    json manual = json::array();
    for (const auto& e : r.manual) {
        manual.push_back({
            {"community_id", e.community_id},
            {"category", e.category},
            {"round", e.round},
            {"members", e.members},
            {"reason", e.reason}
        });
    }
    return {
        {"session_id", r.state.session_id},
        {"dry_run", r.dry_run},
        {"initial_active", r.state.initial_active},
        {"final_active", r.final_active},
        {"reduction", reduction(r)},
        {"rounds_run", r.state.round_counter},
        {"stop_reason", stop_reason_name(r.reason)},
        {"decisions", r.decisions},
        {"improvement_history", r.state.improvement_history},
        {"rounds", rounds},
        {"manual_queue", manual},
        {"warnings", r.warnings}
    };
}

} // namespace viveka
