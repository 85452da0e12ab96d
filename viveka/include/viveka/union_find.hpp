#pragma once
// Disjoint sets over item ids (path halving, union by size)

#include "types.hpp"
#include <map>
#include <vector>

namespace viveka {

class UnionFind {
public:
    const ItemId& find(const ItemId& id) {
        auto it = parent_.find(id);
        if (it == parent_.end()) {
            parent_[id] = id;
            size_[id] = 1;
            return parent_.find(id)->first;
        }
        ItemId cur = id;
        while (parent_[cur] != cur) {
            parent_[cur] = parent_[parent_[cur]];
            cur = parent_[cur];
        }
        return parent_.find(cur)->first;
    }

    bool unite(const ItemId& x, const ItemId& y) {
        ItemId rx = find(x);
        ItemId ry = find(y);
        if (rx == ry) return false;
        if (size_[rx] < size_[ry]) std::swap(rx, ry);
        parent_[ry] = rx;
        size_[rx] += size_[ry];
        return true;
    }

    // Sets with at least `min_size` members, each sorted, ordered by first member
    std::vector<std::vector<ItemId>> groups(size_t min_size = 2) {
        std::map<ItemId, std::vector<ItemId>> by_root;
        std::vector<ItemId> ids;
        for (const auto& [id, _] : parent_) ids.push_back(id);
        for (const auto& id : ids) by_root[find(id)].push_back(id);

        std::vector<std::vector<ItemId>> out;
        for (auto& [_, members] : by_root) {
            if (members.size() < min_size) continue;
            std::sort(members.begin(), members.end());
            out.push_back(std::move(members));
        }
        std::sort(out.begin(), out.end());
        return out;
    }

private:
    std::map<ItemId, ItemId> parent_;
    std::map<ItemId, size_t> size_;
};

} // namespace viveka
