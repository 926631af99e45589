#include "core/block_tree.hpp"

namespace blockstore::blocks {

BlockTree::BlockTree(Block block, BlockLoader loader)
    : block_id_(block.id), loader_(std::move(loader)) {
    nodes_.emplace(block.id, std::move(block));
}

const Block& BlockTree::block() const {
    return nodes_.at(block_id_);
}

const Block* BlockTree::find(const Uuid& id) const {
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : &it->second;
}

const Block& BlockTree::adopt(Block block) {
    auto id = block.id;
    missing_.erase(id);
    return nodes_.try_emplace(id, std::move(block)).first->second;
}

Result<const Block*, Error> BlockTree::resolve(const Uuid& id) {
    if (const auto* cached = find(id)) {
        return Result<const Block*, Error>::ok(cached);
    }
    if (missing_.contains(id) || !loader_) {
        return Result<const Block*, Error>::ok(nullptr);
    }

    ++load_count_;
    auto loaded = loader_(id);
    if (loaded.is_err()) {
        return Result<const Block*, Error>::err(loaded.unwrap_err());
    }
    auto block = std::move(loaded).unwrap();
    if (!block) {
        missing_.insert(id);
        return Result<const Block*, Error>::ok(nullptr);
    }
    return Result<const Block*, Error>::ok(&adopt(std::move(*block)));
}

Result<const Block*, Error> BlockTree::parent(const Block& block) {
    if (!block.parent_id) {
        return Result<const Block*, Error>::ok(nullptr);
    }
    return resolve(*block.parent_id);
}

Result<std::vector<const Block*>, Error> BlockTree::children(const Block& block) {
    std::vector<const Block*> result;
    result.reserve(block.children_ids.size());
    // Copy: resolving may insert into the arena but never moves `block`,
    // and `block` may not belong to this tree at all.
    const auto ids = block.children_ids;
    for (const auto& id : ids) {
        auto child = resolve(id);
        if (child.is_err()) {
            return Result<std::vector<const Block*>, Error>::err(child.unwrap_err());
        }
        if (child.unwrap()) {
            result.push_back(child.unwrap());
        }
    }
    return Result<std::vector<const Block*>, Error>::ok(std::move(result));
}

std::vector<const Block*> BlockTree::cached() const {
    std::vector<const Block*> result;
    result.reserve(nodes_.size());
    for (const auto& [id, block] : nodes_) {
        result.push_back(&block);
    }
    return result;
}

} // namespace blockstore::blocks
