#pragma once

#include "storage/block_repository.hpp"
#include "storage/relationship_repository.hpp"
#include "core/block_tree.hpp"
#include "core/block_types.hpp"
#include "core/relationship.hpp"
#include "core/result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace blockstore::store {

struct DocumentStoreOptions {
    // Types get_root_tree accepts as the anchor of a document tree.
    std::vector<blocks::BlockType> root_types{
        blocks::BlockType::Document,
        blocks::BlockType::Dataset,
    };
};

/**
 * Expected versions for move_block. Omitted entries are filled in by
 * re-reading the current rows.
 */
struct MoveVersions {
    std::optional<int64_t> block;
    std::optional<int64_t> new_parent;
    std::optional<int64_t> old_parent;
};

/**
 * A child of a page group paired with the canonical block its
 * content.synced_from points at.
 */
struct ResolvedSyncedChild {
    blocks::Block synced;
    blocks::BlockTree target;
};

struct PageGroupView {
    blocks::BlockTree page_group;
    std::vector<blocks::Block> children;
    std::vector<ResolvedSyncedChild> resolved_children;
};

/**
 * DocumentStore - Domain rules on top of the repositories.
 *
 * Version auto-fill and upsert_blocks read the current row and then
 * write with the version they saw. Between the two another writer may
 * win, in which case the write fails with ErrorKind::VersionConflict.
 * Callers that need strict compare-and-swap pass explicit versions.
 */
class DocumentStore {
public:
    DocumentStore(storage::BlockRepository& blocks,
                  storage::RelationshipRepository& relationships,
                  DocumentStoreOptions options = {});

    // ========================================================================
    // Reads
    // ========================================================================

    /**
     * Tree anchored at `id`. ErrorKind::DocumentStore when the block is
     * missing or its type is not one of the configured root types.
     *
     * Levels below `depth` are loaded on demand through the block
     * repository, so a tree must not be navigated past its hydrated depth
     * once the owning BlockStore is gone. Pass nullopt to load every level.
     */
    [[nodiscard]] Result<blocks::BlockTree, Error> get_root_tree(
        const Uuid& id,
        std::optional<int> depth = 1);

    // Same lazy-loading lifetime rule as get_root_tree().
    [[nodiscard]] Result<std::optional<blocks::BlockTree>, Error> get_block(
        const Uuid& id,
        std::optional<int> depth = 0);

    [[nodiscard]] Result<std::vector<blocks::Block>, Error> query(const storage::BlockQuery& query);

    /**
     * Non-trashed document blocks.
     */
    [[nodiscard]] Result<std::vector<blocks::Block>, Error> list_documents(
        std::optional<size_t> limit = std::nullopt);

    /**
     * Page group `id` with its children. When resolve_synced is set,
     * every child carrying content.synced_from is paired with its target
     * hydrated to `target_depth`.
     */
    [[nodiscard]] Result<PageGroupView, Error> get_page_group(
        const Uuid& id,
        std::optional<int> depth = 1,
        bool resolve_synced = true,
        std::optional<int> target_depth = 1);

    /**
     * Canonical block referenced by `block.content.synced_from`.
     */
    [[nodiscard]] Result<blocks::BlockTree, Error> resolve_synced(
        const blocks::Block& block,
        std::optional<int> depth = 0);

    // ========================================================================
    // Writes
    // ========================================================================

    [[nodiscard]] Result<void, Error> set_children(
        const Uuid& parent_id,
        const std::vector<Uuid>& children_ids,
        std::optional<int64_t> expected_version = std::nullopt);

    [[nodiscard]] Result<void, Error> move_block(
        const Uuid& block_id,
        const Uuid& new_parent_id,
        int64_t index,
        MoveVersions versions = {});

    [[nodiscard]] Result<void, Error> save_blocks(const std::vector<blocks::Block>& blocks);

    /**
     * Persist `blocks` and, given a parent, attach them to it.
     *
     * With top_level_only, only blocks whose parent is not part of the
     * batch are attached, so hierarchy inside the batch is kept. New
     * children go to the end, or right after `insert_after`, which must
     * be a current child. Blocks already attached are not added twice.
     */
    [[nodiscard]] Result<void, Error> upsert_blocks(
        const std::vector<blocks::Block>& blocks,
        std::optional<Uuid> parent_id = std::nullopt,
        std::optional<Uuid> insert_after = std::nullopt,
        bool top_level_only = true);

    /**
     * Trash or restore `ids` together with all of their descendants.
     */
    [[nodiscard]] Result<void, Error> set_in_trash(const std::vector<Uuid>& ids, bool in_trash);

    // ========================================================================
    // Relationships
    // ========================================================================

    [[nodiscard]] Result<void, Error> upsert_relationships(
        const std::vector<Relationship>& relationships);

    [[nodiscard]] Result<bool, Error> delete_relationships(const std::vector<RelationshipKey>& keys);

    [[nodiscard]] Result<std::vector<Relationship>, Error> get_relationships(
        const Uuid& block_id,
        Direction direction = Direction::All,
        bool include_trashed = false);

    [[nodiscard]] const DocumentStoreOptions& options() const noexcept { return options_; }

private:
    storage::BlockRepository& blocks_;
    storage::RelationshipRepository& relationships_;
    DocumentStoreOptions options_;

    [[nodiscard]] Result<blocks::BlockTree, Error> require_tree(
        const Uuid& id,
        std::optional<int> depth);

    [[nodiscard]] Result<blocks::Block, Error> require_block(const Uuid& id);
};

/**
 * Return an existing workspace block, preferring `workspace_id`, or
 * create one with the given title.
 */
[[nodiscard]] Result<blocks::Block, Error> ensure_workspace(
    DocumentStore& store,
    std::optional<Uuid> workspace_id = std::nullopt,
    const std::string& title = "Default Workspace");

} // namespace blockstore::store
