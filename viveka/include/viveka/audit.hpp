#pragma once
// Audit log: write-ahead decision recording
//
// Every mutation goes through commit(): the store accepts the record and
// the item images in one transaction, and only then does the in-memory
// pool change. A refused commit leaves both untouched.
//
// In dry-run mode nothing reaches the store; records are kept in memory
// so a preview can still report what would have happened.

#include "item_pool.hpp"
#include "log.hpp"
#include "store.hpp"
#include <fstream>
#include <string>
#include <vector>

namespace viveka {

class AuditLog {
public:
    AuditLog(Store* store, ItemPool& pool, bool dry_run = false)
        : store_(store), pool_(pool), dry_run_(dry_run) {}

    bool commit(DecisionRecord record, const std::vector<Item>& images) {
        if (rationale_required(record.actor) && record.rationale.empty()) {
            last_error_ = std::string(actor_name(record.actor)) + " decision without rationale";
            log::error("audit", "%s", last_error_.c_str());
            return false;
        }
        if (record.timestamp == 0) record.timestamp = now();

        if (dry_run_ || !store_) {
            record.seq = static_cast<int64_t>(records_.size()) + 1;
        } else if (!store_->commit(record, images)) {
            last_error_ = store_->last_error();
            log::error("audit", "%s on %s not applied: %s", action_name(record.action),
                       record.subject.empty() ? "?" : record.subject.front().c_str(),
                       last_error_.c_str());
            return false;
        }

        pool_.apply(images);
        log::debug("audit", "#%lld %s by %s (%zu items written)",
                   static_cast<long long>(record.seq), action_name(record.action),
                   actor_name(record.actor), images.size());
        records_.push_back(std::move(record));
        return true;
    }

    // Records committed through this log, in order
    const std::vector<DecisionRecord>& records() const { return records_; }
    size_t committed() const { return records_.size(); }

    bool dry_run() const { return dry_run_; }
    ItemPool& pool() { return pool_; }
    const std::string& last_error() const { return last_error_; }

    // Decisions that touched `id`, oldest first
    static std::vector<DecisionRecord> lineage(const std::vector<DecisionRecord>& all,
                                               const ItemId& id) {
        std::vector<DecisionRecord> out;
        for (const auto& r : all) {
            if (r.mentions(id)) out.push_back(r);
        }
        return out;
    }

    // timestamp,user,session,round,action,actor,subject,target,rationale
    static bool export_csv(const std::vector<DecisionRecord>& records, const std::string& path) {
        std::ofstream out(path);
        if (!out) return false;
        write_csv(records, out);
        return static_cast<bool>(out);
    }

    static void write_csv(const std::vector<DecisionRecord>& records, std::ostream& out) {
        out << "timestamp,user,session,round,action,actor,subject,target,rationale\n";
        for (const auto& r : records) {
            std::string subject;
            for (size_t i = 0; i < r.subject.size(); ++i) {
                if (i > 0) subject += ";";
                subject += r.subject[i];
            }
            out << iso8601(r.timestamp) << ','
                << csv_field(r.user) << ','
                << csv_field(r.session_id) << ','
                << r.round << ','
                << action_name(r.action) << ','
                << actor_name(r.actor) << ','
                << csv_field(subject) << ','
                << csv_field(r.target.value_or("")) << ','
                << csv_field(r.rationale) << '\n';
        }
    }

    static std::string csv_field(const std::string& s) {
        if (s.find_first_of(",\"\n\r") == std::string::npos) return s;
        std::string quoted = "\"";
        for (char c : s) {
            if (c == '"') quoted += '"';
            quoted += c;
        }
        quoted += '"';
        return quoted;
    }

private:
    Store* store_;
    ItemPool& pool_;
    bool dry_run_;
    std::vector<DecisionRecord> records_;
    std::string last_error_;
};

} // namespace viveka
