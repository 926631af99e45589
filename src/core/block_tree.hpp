#pragma once

#include "core/block_types.hpp"
#include "core/result.hpp"

#include <functional>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace blockstore::blocks {

/**
 * BlockLoader - Fetches one block by id for lazy navigation.
 *
 * Returns nullopt when the block does not exist or is hidden by the
 * trash visibility of the call that produced the tree.
 */
using BlockLoader = std::function<Result<std::optional<Block>, Error>(const Uuid&)>;

/**
 * BlockTree - Arena of hydrated blocks keyed by id.
 *
 * Blocks never point at each other. Navigation always goes through the
 * tree: `tree.parent(b)` and `tree.children(b)` return references to the
 * cached instances, so two lookups of the same id yield the same object.
 * Misses are loaded through the injected loader, once per id.
 *
 * Move-only; references stay valid for the lifetime of the tree.
 */
class BlockTree {
public:
    BlockTree(Block block, BlockLoader loader);

    BlockTree(const BlockTree&) = delete;
    BlockTree& operator=(const BlockTree&) = delete;
    BlockTree(BlockTree&&) noexcept = default;
    BlockTree& operator=(BlockTree&&) noexcept = default;

    /**
     * The block the tree was requested for.
     */
    [[nodiscard]] const Block& block() const;

    /**
     * Cached instance for `id`, or nullptr. Never loads.
     */
    [[nodiscard]] const Block* find(const Uuid& id) const;

    [[nodiscard]] bool contains(const Uuid& id) const { return nodes_.contains(id); }
    [[nodiscard]] size_t size() const noexcept { return nodes_.size(); }

    /**
     * Number of loader round trips made since construction.
     */
    [[nodiscard]] size_t load_count() const noexcept { return load_count_; }

    /**
     * Cached instance for `id`, loading it on a miss. nullptr when the
     * block does not exist or is not visible.
     */
    [[nodiscard]] Result<const Block*, Error> resolve(const Uuid& id);

    /**
     * Parent of `block`, or nullptr for a root or an invisible parent.
     */
    [[nodiscard]] Result<const Block*, Error> parent(const Block& block);

    /**
     * Children of `block` in children_ids order. Missing or invisible
     * children are skipped.
     */
    [[nodiscard]] Result<std::vector<const Block*>, Error> children(const Block& block);

    /**
     * Every cached block, in no particular order.
     */
    [[nodiscard]] std::vector<const Block*> cached() const;

    /**
     * Add a block fetched by the repository during hydration. An already
     * cached instance is kept so that handed-out references stay valid.
     */
    const Block& adopt(Block block);

    /**
     * Record that `id` is known to be absent so navigation never asks
     * the loader for it.
     */
    void mark_missing(const Uuid& id) { missing_.insert(id); }

private:
    Uuid block_id_;
    std::unordered_map<Uuid, Block> nodes_;
    std::unordered_set<Uuid> missing_;
    BlockLoader loader_;
    size_t load_count_{0};
};

} // namespace blockstore::blocks
