#pragma once
// Item pool: the in-memory canonical set
//
// Mutations are planned first (plan_* returns the item images a decision
// would write) and applied only after the audit log has committed them.
// Merges keep canonical pointers at depth 1.

#include "types.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace viveka {

class ItemPool {
public:
    ItemPool() = default;

    explicit ItemPool(std::vector<Item> items) { load(std::move(items)); }

    void load(std::vector<Item> items) {
        items_.clear();
        for (auto& item : items) items_[item.id] = std::move(item);
    }

    // Insert or replace
    void put(Item item) { items_[item.id] = std::move(item); }

    // Replace with committed images
    void apply(const std::vector<Item>& images) {
        for (const auto& image : images) items_[image.id] = image;
    }

    const Item* get(const ItemId& id) const {
        auto it = items_.find(id);
        return (it != items_.end()) ? &it->second : nullptr;
    }

    bool contains(const ItemId& id) const { return items_.count(id) > 0; }

    bool is_active(const ItemId& id) const {
        auto* item = get(id);
        return item && item->active();
    }

    const std::map<ItemId, Item>& items() const { return items_; }
    size_t size() const { return items_.size(); }

    std::set<std::string> categories() const {
        std::set<std::string> out;
        for (const auto& [_, item] : items_) out.insert(item.category);
        return out;
    }

    // Active items of one category, ordered by id
    std::vector<const Item*> active_in(const std::string& category) const {
        std::vector<const Item*> out;
        for (const auto& [_, item] : items_) {
            if (item.category == category && item.active()) out.push_back(&item);
        }
        return out;
    }

    size_t active_count() const {
        size_t n = 0;
        for (const auto& [_, item] : items_) if (item.active()) ++n;
        return n;
    }

    size_t count(ItemStatus status) const {
        size_t n = 0;
        for (const auto& [_, item] : items_) if (item.status == status) ++n;
        return n;
    }

    // Follow canonical pointers to a surviving item
    std::optional<ItemId> resolve(const ItemId& id) const {
        ItemId cur = id;
        for (size_t hops = 0; hops <= items_.size(); ++hops) {
            auto* item = get(cur);
            if (!item) return std::nullopt;
            if (item->active()) return cur;
            if (!item->canonical_of) return std::nullopt;
            cur = *item->canonical_of;
        }
        return std::nullopt;
    }

    // Synced beats pending; ties go to the lowest id
    std::optional<ItemId> default_canonical(const std::vector<ItemId>& members) const {
        std::optional<ItemId> best;
        bool best_synced = false;
        for (const auto& id : members) {
            auto* item = get(id);
            if (!item || !item->active()) continue;
            bool synced = item->status == ItemStatus::Synced;
            if (!best || (synced && !best_synced) ||
                (synced == best_synced && id < *best)) {
                best = id;
                best_synced = synced;
            }
        }
        return best;
    }

    // Images for merging `members` into `canonical`. Empty when nothing changes.
    std::vector<Item> plan_merge(const std::vector<ItemId>& members, const ItemId& canonical,
                                 Timestamp ts) const {
        std::vector<Item> images;
        auto survivor = resolve(canonical);
        if (!survivor) return images;

        std::set<ItemId> absorbed;
        for (const auto& id : members) {
            if (id == *survivor) continue;
            auto* item = get(id);
            if (!item || !item->active()) continue;
            Item image = *item;
            image.status = ItemStatus::Rejected;
            image.canonical_of = *survivor;
            image.updated_at = ts;
            images.push_back(std::move(image));
            absorbed.insert(id);
        }

        // Re-point anything that pointed at an absorbed item
        for (const auto& [id, item] : items_) {
            if (item.merged() && absorbed.count(*item.canonical_of)) {
                Item image = item;
                image.canonical_of = *survivor;
                image.updated_at = ts;
                images.push_back(std::move(image));
            }
        }
        return images;
    }

    // Explicit rejection: no canonical, dependents are released to pending
    std::vector<Item> plan_reject(const ItemId& id, Timestamp ts) const {
        std::vector<Item> images;
        auto* item = get(id);
        if (!item || !item->active()) return images;

        Item image = *item;
        image.status = ItemStatus::Rejected;
        image.canonical_of.reset();
        image.updated_at = ts;
        images.push_back(std::move(image));

        for (const auto& [other_id, other] : items_) {
            if (other.merged() && *other.canonical_of == id) {
                Item freed = other;
                freed.status = ItemStatus::Pending;
                freed.canonical_of.reset();
                freed.updated_at = ts;
                images.push_back(std::move(freed));
            }
        }
        return images;
    }

    std::optional<Item> plan_update(const ItemId& id, const std::optional<std::string>& title,
                                    const std::optional<std::string>& body, Timestamp ts) const {
        auto* item = get(id);
        if (!item || !item->active()) return std::nullopt;
        Item image = *item;
        if (title) image.title = *title;
        if (body) image.body = *body;
        image.updated_at = ts;
        return image;
    }

    // Clone into a new pending item <id>_split_<n>
    std::optional<Item> plan_split_copy(const ItemId& id, Timestamp ts) const {
        auto* item = get(id);
        if (!item) return std::nullopt;
        Item copy = *item;
        for (size_t n = 1;; ++n) {
            copy.id = id + "_split_" + std::to_string(n);
            if (!contains(copy.id)) break;
        }
        copy.status = ItemStatus::Pending;
        copy.canonical_of.reset();
        copy.embedding_ref = copy.id;
        copy.created_at = ts;
        copy.updated_at = ts;
        return copy;
    }

    // Merged items whose canonical is missing or not active
    std::vector<ItemId> chain_violations() const {
        std::vector<ItemId> out;
        for (const auto& [id, item] : items_) {
            if (!item.merged()) continue;
            auto* target = get(*item.canonical_of);
            if (!target || !target->active()) out.push_back(id);
        }
        return out;
    }

private:
    std::map<ItemId, Item> items_;
};

} // namespace viveka
