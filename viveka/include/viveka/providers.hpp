#pragma once
// Collaborator contracts: vector similarity and rerank
//
// Implementations throw ProviderUnavailable when they cannot answer.
// An empty answer means "no neighbors", never "could not ask".

#include "types.hpp"
#include <string>
#include <utility>
#include <vector>

namespace viveka {

struct Neighbor {
    ItemId id;
    float embed_score = 0.0f;
    std::string category;   // Empty when the provider does not know it
};

class VectorProvider {
public:
    virtual ~VectorProvider() = default;

    // Top-k nearest neighbors of `id`, best first, never `id` itself
    virtual std::vector<Neighbor> neighbors(const ItemId& id, size_t k) = 0;

    // Bumped whenever embeddings change; cached neighbor lists are stale after a bump
    virtual uint64_t generation() const { return 0; }

    virtual std::string name() const = 0;
};

class RerankProvider {
public:
    virtual ~RerankProvider() = default;

    // Scores for the subset of `candidates` the reranker could judge
    virtual std::vector<std::pair<ItemId, float>> rerank(
        const ItemId& id, const std::vector<ItemId>& candidates) = 0;

    virtual std::string name() const = 0;
};

} // namespace viveka
