#include "store/document_store.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <unordered_set>

namespace blockstore::store {

namespace {

Error store_error(std::string message) {
    return Error{ErrorKind::DocumentStore, std::move(message)};
}

} // anonymous namespace

DocumentStore::DocumentStore(
    storage::BlockRepository& blocks,
    storage::RelationshipRepository& relationships,
    DocumentStoreOptions options
)
    : blocks_(blocks)
    , relationships_(relationships)
    , options_(std::move(options)) {}

Result<blocks::BlockTree, Error> DocumentStore::require_tree(
    const Uuid& id,
    std::optional<int> depth
) {
    auto result = blocks_.get(id, depth);
    if (result.is_err()) {
        return Result<blocks::BlockTree, Error>::err(result.unwrap_err());
    }
    auto tree = std::move(result).unwrap();
    if (!tree) {
        return Result<blocks::BlockTree, Error>::err(
            store_error("Block " + id.to_string() + " does not exist"));
    }
    return Result<blocks::BlockTree, Error>::ok(std::move(*tree));
}

Result<blocks::Block, Error> DocumentStore::require_block(const Uuid& id) {
    auto result = blocks_.get_block(id);
    if (result.is_err()) {
        return Result<blocks::Block, Error>::err(result.unwrap_err());
    }
    auto block = std::move(result).unwrap();
    if (!block) {
        return Result<blocks::Block, Error>::err(
            store_error("Block " + id.to_string() + " does not exist"));
    }
    return Result<blocks::Block, Error>::ok(std::move(*block));
}

// ============================================================================
// Reads
// ============================================================================

Result<blocks::BlockTree, Error> DocumentStore::get_root_tree(
    const Uuid& id,
    std::optional<int> depth
) {
    auto tree = require_tree(id, depth);
    if (tree.is_err()) {
        return tree;
    }
    const auto type = tree.unwrap().block().type;
    if (std::find(options_.root_types.begin(), options_.root_types.end(), type) ==
        options_.root_types.end()) {
        return Result<blocks::BlockTree, Error>::err(store_error(
            "Block " + id.to_string() + " is a " + std::string(blocks::type_name(type)) +
            ", not a document root"));
    }
    return tree;
}

Result<std::optional<blocks::BlockTree>, Error> DocumentStore::get_block(
    const Uuid& id,
    std::optional<int> depth
) {
    return blocks_.get(id, depth);
}

Result<std::vector<blocks::Block>, Error> DocumentStore::query(const storage::BlockQuery& query) {
    return blocks_.query(query);
}

Result<std::vector<blocks::Block>, Error> DocumentStore::list_documents(std::optional<size_t> limit) {
    storage::BlockQuery query;
    query.where.types = {blocks::BlockType::Document};
    query.limit = limit;
    return blocks_.query(query);
}

Result<blocks::BlockTree, Error> DocumentStore::resolve_synced(
    const blocks::Block& block,
    std::optional<int> depth
) {
    if (!block.content || !block.content->synced_from) {
        return Result<blocks::BlockTree, Error>::err(store_error(
            "Block " + block.id.to_string() + " does not reference canonical content"));
    }
    const Uuid target_id = *block.content->synced_from;

    auto result = blocks_.get(target_id, depth);
    if (result.is_err()) {
        return Result<blocks::BlockTree, Error>::err(result.unwrap_err());
    }
    auto target = std::move(result).unwrap();
    if (!target) {
        return Result<blocks::BlockTree, Error>::err(store_error(
            "Block " + block.id.to_string() + " references missing block " +
            target_id.to_string()));
    }
    return Result<blocks::BlockTree, Error>::ok(std::move(*target));
}

Result<PageGroupView, Error> DocumentStore::get_page_group(
    const Uuid& id,
    std::optional<int> depth,
    bool resolve_synced,
    std::optional<int> target_depth
) {
    auto tree_result = require_tree(id, depth);
    if (tree_result.is_err()) {
        return Result<PageGroupView, Error>::err(tree_result.unwrap_err());
    }
    auto tree = std::move(tree_result).unwrap();
    if (tree.block().type != blocks::BlockType::PageGroup) {
        return Result<PageGroupView, Error>::err(
            store_error("Block " + id.to_string() + " is not a page group"));
    }

    std::vector<blocks::Block> children;
    for (const auto& child_id : tree.block().children_ids) {
        auto child = tree.resolve(child_id);
        if (child.is_err()) {
            return Result<PageGroupView, Error>::err(child.unwrap_err());
        }
        if (child.unwrap() == nullptr) {
            return Result<PageGroupView, Error>::err(store_error(
                "Page group " + id.to_string() + " lists missing child " + child_id.to_string()));
        }
        children.push_back(*child.unwrap());
    }

    std::vector<ResolvedSyncedChild> resolved;
    if (resolve_synced) {
        for (const auto& child : children) {
            if (!child.content || !child.content->synced_from) continue;
            auto target = this->resolve_synced(child, target_depth);
            if (target.is_err()) {
                return Result<PageGroupView, Error>::err(target.unwrap_err());
            }
            resolved.push_back(ResolvedSyncedChild{
                .synced = child,
                .target = std::move(target).unwrap(),
            });
        }
    }

    return Result<PageGroupView, Error>::ok(PageGroupView{
        .page_group = std::move(tree),
        .children = std::move(children),
        .resolved_children = std::move(resolved),
    });
}

// ============================================================================
// Writes
// ============================================================================

Result<void, Error> DocumentStore::set_children(
    const Uuid& parent_id,
    const std::vector<Uuid>& children_ids,
    std::optional<int64_t> expected_version
) {
    if (!expected_version) {
        auto parent = require_block(parent_id);
        if (parent.is_err()) {
            return Result<void, Error>::err(parent.unwrap_err());
        }
        expected_version = parent.unwrap().version;
    }
    return blocks_.set_children(parent_id, children_ids, *expected_version);
}

Result<void, Error> DocumentStore::move_block(
    const Uuid& block_id,
    const Uuid& new_parent_id,
    int64_t index,
    MoveVersions versions
) {
    auto block = require_block(block_id);
    if (block.is_err()) {
        return Result<void, Error>::err(block.unwrap_err());
    }
    if (!versions.block) {
        versions.block = block.unwrap().version;
    }

    if (!versions.new_parent) {
        auto new_parent = require_block(new_parent_id);
        if (new_parent.is_err()) {
            return Result<void, Error>::err(new_parent.unwrap_err());
        }
        versions.new_parent = new_parent.unwrap().version;
    }

    const auto& old_parent_id = block.unwrap().parent_id;
    if (!versions.old_parent && old_parent_id) {
        auto old_parent = require_block(*old_parent_id);
        if (old_parent.is_err()) {
            return Result<void, Error>::err(old_parent.unwrap_err());
        }
        versions.old_parent = old_parent.unwrap().version;
    }

    return blocks_.move_block(block_id, new_parent_id, index,
                              *versions.block, *versions.new_parent, versions.old_parent);
}

Result<void, Error> DocumentStore::save_blocks(const std::vector<blocks::Block>& blocks) {
    if (blocks.empty()) {
        return Result<void, Error>::ok();
    }
    return blocks_.upsert(blocks);
}

Result<void, Error> DocumentStore::upsert_blocks(
    const std::vector<blocks::Block>& blocks,
    std::optional<Uuid> parent_id,
    std::optional<Uuid> insert_after,
    bool top_level_only
) {
    auto saved = save_blocks(blocks);
    if (saved.is_err() || !parent_id || blocks.empty()) {
        return saved;
    }

    std::unordered_set<Uuid> batch_ids;
    for (const auto& block : blocks) {
        batch_ids.insert(block.id);
    }

    std::vector<Uuid> attach;
    for (const auto& block : blocks) {
        if (block.id == *parent_id) continue;
        if (top_level_only && block.parent_id && batch_ids.contains(*block.parent_id)) continue;
        attach.push_back(block.id);
    }

    auto parent_result = require_block(*parent_id);
    if (parent_result.is_err()) {
        return Result<void, Error>::err(parent_result.unwrap_err());
    }
    const auto& parent = parent_result.unwrap();

    std::vector<Uuid> children = parent.children_ids;
    auto position = children.end();
    if (insert_after) {
        position = std::find(children.begin(), children.end(), *insert_after);
        if (position == children.end()) {
            return Result<void, Error>::err(store_error(
                "Block " + insert_after->to_string() + " not found in parent " +
                parent_id->to_string()));
        }
        ++position;
    }

    // Listed children whose saved row no longer points at the parent are
    // re-linked by set_children below.
    bool relink = false;
    std::vector<Uuid> added;
    for (const auto& block : blocks) {
        if (std::find(attach.begin(), attach.end(), block.id) == attach.end()) continue;
        if (parent.has_child(block.id)) {
            relink = relink || block.parent_id != *parent_id;
            continue;
        }
        if (std::find(added.begin(), added.end(), block.id) != added.end()) continue;
        added.push_back(block.id);
    }
    if (added.empty() && !relink) {
        return Result<void, Error>::ok();
    }
    children.insert(position, added.begin(), added.end());

    qCDebug(blockstoreStoreLog) << "Attaching" << added.size() << "blocks under"
                                << QString::fromStdString(parent_id->to_string());
    return blocks_.set_children(*parent_id, children, parent.version);
}

Result<void, Error> DocumentStore::set_in_trash(const std::vector<Uuid>& ids, bool in_trash) {
    return blocks_.set_in_trash(ids, in_trash, true);
}

// ============================================================================
// Relationships
// ============================================================================

Result<void, Error> DocumentStore::upsert_relationships(
    const std::vector<Relationship>& relationships
) {
    return relationships_.upsert(relationships);
}

Result<bool, Error> DocumentStore::delete_relationships(const std::vector<RelationshipKey>& keys) {
    return relationships_.remove(keys);
}

Result<std::vector<Relationship>, Error> DocumentStore::get_relationships(
    const Uuid& block_id,
    Direction direction,
    bool include_trashed
) {
    return relationships_.get(block_id, direction, include_trashed);
}

// ============================================================================
// Workspace bootstrap
// ============================================================================

Result<blocks::Block, Error> ensure_workspace(
    DocumentStore& store,
    std::optional<Uuid> workspace_id,
    const std::string& title
) {
    storage::BlockQuery query;
    query.where.types = {blocks::BlockType::Workspace};
    auto existing = store.query(query);
    if (existing.is_err()) {
        return Result<blocks::Block, Error>::err(existing.unwrap_err());
    }

    auto& workspaces = existing.unwrap();
    if (workspace_id) {
        for (auto& workspace : workspaces) {
            if (workspace.id == *workspace_id) {
                return Result<blocks::Block, Error>::ok(std::move(workspace));
            }
        }
    }
    if (!workspaces.empty()) {
        return Result<blocks::Block, Error>::ok(std::move(workspaces.front()));
    }

    auto workspace = blocks::create_root(
        workspace_id.value_or(Uuid::generate()),
        blocks::BlockType::Workspace,
        blocks::WorkspaceProps{.title = title});
    auto saved = store.save_blocks({workspace});
    if (saved.is_err()) {
        return Result<blocks::Block, Error>::err(saved.unwrap_err());
    }

    qCInfo(blockstoreStoreLog) << "Created workspace"
                               << QString::fromStdString(workspace.id.to_string());
    return Result<blocks::Block, Error>::ok(std::move(workspace));
}

} // namespace blockstore::store
