#pragma once

#include "storage/database.hpp"
#include "storage/filters.hpp"
#include "core/block_tree.hpp"
#include "core/block_types.hpp"
#include "core/result.hpp"
#include <cstdint>
#include <vector>
#include <optional>

namespace blockstore::storage {

/**
 * BlockRepository - Data access layer for blocks.
 *
 * Persists blocks in the `blocks` table and enforces the tree
 * invariants on structural edits: no duplicate or self children, no
 * cycles, one root per subtree, and optimistic concurrency through the
 * per-row `version` counter. Every public call runs in its own
 * transaction and either applies completely or not at all.
 *
 * Trees returned by get() load misses through this repository, so they
 * must not outlive it.
 */
class BlockRepository {
public:
    explicit BlockRepository(Database& db) : db_(db) {}

    /**
     * Get a block and hydrate its descendants into a BlockTree.
     *
     * depth 0 returns only the block; N eagerly loads N levels below it;
     * nullopt loads every row sharing the block's root_id in one query.
     * Returns nullopt when the block does not exist or is trashed (unless
     * include_trashed). A negative depth is ErrorKind::InvalidArgument.
     */
    [[nodiscard]] Result<std::optional<blocks::BlockTree>, Error> get(
        const Uuid& id,
        std::optional<int> depth = 0,
        bool include_trashed = false);

    /**
     * Get a single block without building a tree.
     */
    [[nodiscard]] Result<std::optional<blocks::Block>, Error> get_block(
        const Uuid& id,
        bool include_trashed = false);

    /**
     * Get several blocks in one query. Missing or hidden ids are skipped;
     * the result follows the order of `ids`.
     */
    [[nodiscard]] Result<std::vector<blocks::Block>, Error> get_blocks(
        const std::vector<Uuid>& ids,
        bool include_trashed = false);

    /**
     * True if a row with this id exists, trashed or not.
     */
    [[nodiscard]] Result<bool, Error> exists(const Uuid& id);

    /**
     * Blocks matching structural and semantic filters.
     */
    [[nodiscard]] Result<std::vector<blocks::Block>, Error> query(const BlockQuery& query);

    /**
     * Insert or replace blocks by id in one transaction. No version check
     * and no structural side effects on other rows.
     */
    [[nodiscard]] Result<void, Error> upsert(const std::vector<blocks::Block>& blocks);

    /**
     * Replace a parent's children. Listed children are reparented under
     * it; children dropped from the list are orphaned (parent cleared).
     * Bumps the parent's version, and the version of any previous parent
     * a child was taken from.
     */
    [[nodiscard]] Result<void, Error> set_children(
        const Uuid& parent_id,
        const std::vector<Uuid>& children_ids,
        int64_t expected_version);

    /**
     * set_children restricted to a permutation of the current children.
     */
    [[nodiscard]] Result<void, Error> reorder_children(
        const Uuid& parent_id,
        const std::vector<Uuid>& new_order,
        int64_t expected_version);

    /**
     * Move a block under `new_parent_id` at `index` (clamped into
     * [0, children]). Both parents and the block are version-bumped; a
     * move within the same parent bumps the parent and the block once.
     */
    [[nodiscard]] Result<void, Error> move_block(
        const Uuid& block_id,
        const Uuid& new_parent_id,
        int64_t index,
        int64_t expected_block_version,
        int64_t expected_new_parent_version,
        std::optional<int64_t> expected_old_parent_version = std::nullopt);

    /**
     * Set or clear the trash flag on `ids` (and, with cascade, on every
     * descendant), bumping each row's version.
     */
    [[nodiscard]] Result<void, Error> set_in_trash(
        const std::vector<Uuid>& ids,
        bool in_trash,
        bool cascade = true);

    /**
     * Hard-delete `ids` and all their descendants. Relationships touching
     * deleted rows go with them.
     */
    [[nodiscard]] Result<void, Error> remove(const std::vector<Uuid>& ids);

private:
    Database& db_;

    /**
     * Convert a database row to a Block.
     */
    [[nodiscard]] Result<blocks::Block, Error> row_to_block(Statement& stmt, int first = 0);

    [[nodiscard]] Result<std::vector<blocks::Block>, Error> select_blocks(
        const std::string& sql,
        const std::vector<SqlValue>& params);

    [[nodiscard]] Result<void, Error> hydrate(
        blocks::BlockTree& tree,
        const blocks::Block& block,
        int depth,
        bool include_trashed);

    [[nodiscard]] Result<void, Error> hydrate_root(
        blocks::BlockTree& tree,
        const blocks::Block& block,
        bool include_trashed);

    [[nodiscard]] Result<std::vector<Uuid>, Error> descendant_closure(const std::vector<Uuid>& ids);

    [[nodiscard]] Result<std::vector<Uuid>, Error> missing_ids(const std::vector<Uuid>& ids);
};

} // namespace blockstore::storage
