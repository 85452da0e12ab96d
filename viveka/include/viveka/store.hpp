#pragma once
// Persistence collaborator
//
// The engine only needs four things from storage: the item set, the
// append-only decision log, named checkpoints and the manual-review queue.
// commit() is the single write path for mutations: the record and the
// item images it produced land together or not at all.

#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace viveka {

// Candidate the automated loop could not resolve
struct ManualReviewEntry {
    int64_t id = 0;                  // Assigned by the store
    std::string session_id;
    uint32_t round = 0;
    std::string community_id;
    std::string category;
    std::vector<ItemId> members;
    std::string reason;
    Timestamp queued_at = 0;
};

class Store {
public:
    virtual ~Store() = default;

    // Import path: insert or replace without a decision record
    virtual bool put_item(const Item& item) = 0;
    virtual std::vector<Item> load_items() = 0;

    // Atomically append `record` (seq assigned on success) and write `mutations`
    virtual bool commit(DecisionRecord& record, const std::vector<Item>& mutations) = 0;
    virtual std::vector<DecisionRecord> decisions() = 0;
    virtual size_t decision_count() = 0;

    // Named JSON checkpoints
    virtual bool put_state(const std::string& key, const std::string& value) = 0;
    virtual std::optional<std::string> get_state(const std::string& key) = 0;
    virtual bool erase_state(const std::string& key) = 0;

    virtual bool enqueue_manual(ManualReviewEntry& entry) = 0;
    virtual std::vector<ManualReviewEntry> manual_queue() = 0;

    virtual std::string last_error() const = 0;
};

} // namespace viveka
