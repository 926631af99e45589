#include "storage/block_repository.hpp"
#include "storage/filter_compiler.hpp"
#include "storage/json_columns.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <deque>
#include <unordered_map>
#include <unordered_set>

namespace blockstore::storage {

using blocks::Block;
using blocks::BlockTree;

namespace {

constexpr const char* BLOCK_COLUMNS[] = {
    "id", "type", "parent_id", "root_id", "children_ids", "workspace_id",
    "in_trash", "version", "created_time", "last_edited_time", "created_by",
    "last_edited_by", "properties", "metadata", "content", "properties_version",
};

std::string select_list(std::string_view alias) {
    std::string out;
    for (const char* column : BLOCK_COLUMNS) {
        if (!out.empty()) out += ", ";
        out += alias;
        out += '.';
        out += column;
    }
    return out;
}

std::string placeholders(size_t count) {
    std::string out;
    for (size_t i = 0; i < count; ++i) {
        out += i == 0 ? "?" : ", ?";
    }
    return out;
}

std::vector<SqlValue> uuid_params(const std::vector<Uuid>& ids) {
    std::vector<SqlValue> params;
    params.reserve(ids.size());
    for (const auto& id : ids) {
        params.emplace_back(id.to_string());
    }
    return params;
}

std::string describe(const std::vector<Uuid>& ids) {
    std::string out = "[";
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) out += ", ";
        out += ids[i].to_string();
    }
    return out + "]";
}

std::vector<SqlValue> block_params(const Block& block) {
    return {
        block.id.to_string(),
        std::string(blocks::type_name(block.type)),
        optional_uuid(block.parent_id),
        block.root_id.to_string(),
        json_text(blocks::uuids_to_json(block.children_ids)),
        optional_uuid(block.workspace_id),
        int64_t{block.in_trash ? 1 : 0},
        block.version,
        block.created_time.millis(),
        block.last_edited_time.millis(),
        optional_uuid(block.created_by),
        optional_uuid(block.last_edited_by),
        json_text(blocks::properties_to_json(block.properties)),
        json_text(block.metadata),
        block.content ? SqlValue{json_text(blocks::content_to_json(*block.content))}
                      : SqlValue{nullptr},
        block.properties_version ? SqlValue{int64_t{*block.properties_version}}
                                 : SqlValue{nullptr},
    };
}

bool erase_id(std::vector<Uuid>& ids, const Uuid& id) {
    auto it = std::find(ids.begin(), ids.end(), id);
    if (it == ids.end()) return false;
    ids.erase(it);
    return true;
}

/**
 * Structure - The hierarchy columns of one row.
 */
struct Structure {
    Uuid id;
    std::optional<Uuid> parent_id;
    Uuid root_id;
    std::vector<Uuid> children_ids;
    int64_t version{0};
};

/**
 * StructureEdit - The rows touched by one structural operation.
 *
 * Rows are read once, edited in memory and written back with a
 * `version = ?` guard, so a writer on another connection that got in
 * between surfaces as a VersionConflict.
 */
class StructureEdit {
public:
    explicit StructureEdit(Database& db) : db_(db) {}

    // nullptr when no row has this id
    Result<Structure*, Error> load(const Uuid& id) {
        if (auto it = rows_.find(id); it != rows_.end()) {
            return Result<Structure*, Error>::ok(&it->second);
        }

        auto stmt_result = db_.prepare(
            "SELECT parent_id, root_id, children_ids, version FROM blocks WHERE id = ?;");
        if (stmt_result.is_err()) {
            return Result<Structure*, Error>::err(stmt_result.unwrap_err());
        }
        auto stmt = std::move(stmt_result).unwrap();
        auto bind_result = stmt.bind_uuid(1, id);
        if (bind_result.is_err()) {
            return Result<Structure*, Error>::err(bind_result.unwrap_err());
        }
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<Structure*, Error>::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) {
            return Result<Structure*, Error>::ok(nullptr);
        }

        auto children = parse_uuid_array(stmt.column_text(2));
        if (children.is_err()) {
            return Result<Structure*, Error>::err(children.unwrap_err());
        }
        Structure row{
            .id = id,
            .parent_id = stmt.column_uuid(0),
            .root_id = stmt.column_uuid(1).value_or(Uuid{}),
            .children_ids = std::move(children).unwrap(),
            .version = stmt.column_int64(3),
        };
        loaded_versions_[id] = row.version;
        auto [it, inserted] = rows_.emplace(id, std::move(row));
        return Result<Structure*, Error>::ok(&it->second);
    }

    Result<Structure*, Error> require(const Uuid& id, std::string_view what) {
        auto row = load(id);
        if (row.is_ok() && row.unwrap() == nullptr) {
            return fail<Structure*>(ErrorKind::NotFound,
                                    std::string(what) + " " + id.to_string() + " does not exist");
        }
        return row;
    }

    // Ancestors of `start`: its parent, grandparent and so on. Stops at a
    // missing row, or at a repeated id if the stored chain is corrupt.
    Result<std::unordered_set<Uuid>, Error> ancestors(const Structure& start) {
        std::unordered_set<Uuid> seen;
        auto current = start.parent_id;
        while (current) {
            if (!seen.insert(*current).second) {
                qCWarning(blockstoreStorageLog) << "Ancestor chain of" << start.id.to_string().c_str()
                                                << "loops at" << current->to_string().c_str();
                break;
            }
            auto row = load(*current);
            if (row.is_err()) {
                return Result<std::unordered_set<Uuid>, Error>::err(row.unwrap_err());
            }
            if (!row.unwrap()) break;
            current = row.unwrap()->parent_id;
        }
        return Result<std::unordered_set<Uuid>, Error>::ok(std::move(seen));
    }

    void mark_changed(const Uuid& id) { changed_.insert(id); }

    void mark_bumped(const Uuid& id) {
        changed_.insert(id);
        bumped_.insert(id);
    }

    Result<void, Error> write(Timestamp now) {
        auto stmt_result = db_.prepare(R"SQL(
            UPDATE blocks
            SET parent_id = ?, children_ids = ?, version = ?,
                last_edited_time = COALESCE(?, last_edited_time)
            WHERE id = ? AND version = ?;
        )SQL");
        if (stmt_result.is_err()) {
            return Result<void, Error>::err(stmt_result.unwrap_err());
        }
        auto stmt = std::move(stmt_result).unwrap();

        for (const auto& id : changed_) {
            const auto& row = rows_.at(id);
            const bool bump = bumped_.contains(id);
            const int64_t loaded = loaded_versions_.at(id);
            auto bind_result = stmt.bind_all({
                optional_uuid(row.parent_id),
                json_text(blocks::uuids_to_json(row.children_ids)),
                bump ? loaded + 1 : loaded,
                bump ? SqlValue{now.millis()} : SqlValue{nullptr},
                id.to_string(),
                loaded,
            });
            if (bind_result.is_err()) {
                return bind_result;
            }
            auto step_result = stmt.step();
            if (step_result.is_err()) {
                return Result<void, Error>::err(step_result.unwrap_err());
            }
            if (db_.changes() != 1) {
                return fail(ErrorKind::VersionConflict,
                            "Block " + id.to_string() + " was modified concurrently");
            }
            auto reset_result = stmt.reset();
            if (reset_result.is_err()) {
                return reset_result;
            }
        }
        return Result<void, Error>::ok();
    }

private:
    Database& db_;
    std::unordered_map<Uuid, Structure> rows_;
    std::unordered_map<Uuid, int64_t> loaded_versions_;
    std::unordered_set<Uuid> changed_;
    std::unordered_set<Uuid> bumped_;
};

Status version_mismatch(std::string_view what, const Uuid& id, int64_t expected, int64_t found) {
    return fail(ErrorKind::VersionConflict,
                std::string(what) + " " + id.to_string() + " version mismatch: expected " +
                std::to_string(expected) + ", found " + std::to_string(found));
}

} // anonymous namespace

// ============================================================================
// Row mapping
// ============================================================================

Result<Block, Error> BlockRepository::row_to_block(Statement& stmt, int first) {
    auto column = [first](int offset) { return first + offset; };

    auto id = stmt.column_uuid(column(0));
    if (!id) {
        return fail<Block>(ErrorKind::Storage, "Malformed block id '" + stmt.column_text(column(0)) + "'");
    }
    const std::string prefix = "Block " + id->to_string() + ": ";

    auto type_text = stmt.column_text(column(1));
    auto type = blocks::parse_type(type_text);
    if (!type) {
        return fail<Block>(ErrorKind::Validation, prefix + "unknown block type '" + type_text + "'");
    }

    auto children = parse_uuid_array(stmt.column_text(column(4)));
    if (children.is_err()) {
        return fail<Block>(children.unwrap_err().kind, prefix + children.unwrap_err().message);
    }

    auto properties_json = parse_object(stmt.column_text(column(12)), "properties");
    if (properties_json.is_err()) {
        return fail<Block>(ErrorKind::Storage, prefix + properties_json.unwrap_err().message);
    }
    auto properties = blocks::properties_from_json(*type, properties_json.unwrap());
    if (properties.is_err()) {
        return fail<Block>(ErrorKind::Validation, prefix + properties.unwrap_err().message);
    }

    auto metadata = parse_object(stmt.column_text(column(13)), "metadata");
    if (metadata.is_err()) {
        return fail<Block>(ErrorKind::Storage, prefix + metadata.unwrap_err().message);
    }

    std::optional<blocks::Content> content;
    if (!stmt.column_is_null(column(14))) {
        auto content_json = parse_object(stmt.column_text(column(14)), "content");
        if (content_json.is_err()) {
            return fail<Block>(ErrorKind::Storage, prefix + content_json.unwrap_err().message);
        }
        auto decoded = blocks::content_from_json(content_json.unwrap());
        if (decoded.is_err()) {
            return fail<Block>(ErrorKind::Validation, prefix + decoded.unwrap_err().message);
        }
        content = std::move(decoded).unwrap();
    }

    std::optional<int> properties_version;
    if (!stmt.column_is_null(column(15))) {
        properties_version = stmt.column_int(column(15));
    }

    return Result<Block, Error>::ok(Block{
        .id = *id,
        .type = *type,
        .parent_id = stmt.column_uuid(column(2)),
        .root_id = stmt.column_uuid(column(3)).value_or(Uuid{}),
        .children_ids = std::move(children).unwrap(),
        .workspace_id = stmt.column_uuid(column(5)),
        .in_trash = stmt.column_int(column(6)) != 0,
        .version = stmt.column_int64(column(7)),
        .created_time = Timestamp(stmt.column_int64(column(8))),
        .last_edited_time = Timestamp(stmt.column_int64(column(9))),
        .created_by = stmt.column_uuid(column(10)),
        .last_edited_by = stmt.column_uuid(column(11)),
        .properties = std::move(properties).unwrap(),
        .metadata = std::move(metadata).unwrap(),
        .content = std::move(content),
        .properties_version = properties_version,
    });
}

Result<std::vector<Block>, Error> BlockRepository::select_blocks(
    const std::string& sql,
    const std::vector<SqlValue>& params
) {
    std::vector<Block> blocks;
    auto result = db_.query(sql, params, [&](Statement& stmt) -> Result<void, Error> {
        auto block = row_to_block(stmt);
        if (block.is_err()) {
            return Result<void, Error>::err(block.unwrap_err());
        }
        blocks.push_back(std::move(block).unwrap());
        return Result<void, Error>::ok();
    });
    if (result.is_err()) {
        return Result<std::vector<Block>, Error>::err(result.unwrap_err());
    }
    return Result<std::vector<Block>, Error>::ok(std::move(blocks));
}

// ============================================================================
// Reads
// ============================================================================

Result<std::optional<Block>, Error> BlockRepository::get_block(const Uuid& id, bool include_trashed) {
    std::string sql = "SELECT " + select_list("b") + " FROM blocks AS b WHERE b.id = ?";
    if (!include_trashed) {
        sql += " AND b.in_trash = 0";
    }
    auto rows = select_blocks(sql + ";", {id.to_string()});
    if (rows.is_err()) {
        return Result<std::optional<Block>, Error>::err(rows.unwrap_err());
    }
    auto& found = rows.unwrap();
    if (found.empty()) {
        return Result<std::optional<Block>, Error>::ok(std::nullopt);
    }
    return Result<std::optional<Block>, Error>::ok(std::move(found.front()));
}

Result<std::vector<Block>, Error> BlockRepository::get_blocks(
    const std::vector<Uuid>& ids,
    bool include_trashed
) {
    if (ids.empty()) {
        return Result<std::vector<Block>, Error>::ok({});
    }

    std::string sql = "SELECT " + select_list("b") + " FROM blocks AS b WHERE b.id IN (" +
                      placeholders(ids.size()) + ")";
    if (!include_trashed) {
        sql += " AND b.in_trash = 0";
    }
    auto rows = select_blocks(sql + ";", uuid_params(ids));
    if (rows.is_err()) {
        return rows;
    }

    std::unordered_map<Uuid, Block> by_id;
    for (auto& block : rows.unwrap()) {
        auto id = block.id;
        by_id.emplace(id, std::move(block));
    }
    std::vector<Block> ordered;
    ordered.reserve(by_id.size());
    for (const auto& id : ids) {
        auto it = by_id.find(id);
        if (it != by_id.end()) {
            ordered.push_back(std::move(it->second));
            by_id.erase(it);
        }
    }
    return Result<std::vector<Block>, Error>::ok(std::move(ordered));
}

Result<bool, Error> BlockRepository::exists(const Uuid& id) {
    bool found = false;
    auto result = db_.query("SELECT 1 FROM blocks WHERE id = ?;", {id.to_string()},
                            [&](Statement&) -> Result<void, Error> {
                                found = true;
                                return Result<void, Error>::ok();
                            });
    if (result.is_err()) {
        return Result<bool, Error>::err(result.unwrap_err());
    }
    return Result<bool, Error>::ok(found);
}

Result<std::optional<BlockTree>, Error> BlockRepository::get(
    const Uuid& id,
    std::optional<int> depth,
    bool include_trashed
) {
    using TreeResult = Result<std::optional<BlockTree>, Error>;

    if (depth && *depth < 0) {
        return TreeResult::err(Error{ErrorKind::InvalidArgument,
                                     "Depth must be a non-negative integer or unbounded"});
    }

    auto block_result = get_block(id, include_trashed);
    if (block_result.is_err()) {
        return TreeResult::err(block_result.unwrap_err());
    }
    auto block = std::move(block_result).unwrap();
    if (!block) {
        return TreeResult::ok(std::nullopt);
    }

    BlockTree tree(std::move(*block), [this, include_trashed](const Uuid& target) {
        return get_block(target, include_trashed);
    });

    auto hydrated = Result<void, Error>::ok();
    if (!depth) {
        hydrated = hydrate_root(tree, tree.block(), include_trashed);
    } else if (*depth > 0) {
        hydrated = hydrate(tree, tree.block(), *depth, include_trashed);
    }
    if (hydrated.is_err()) {
        return TreeResult::err(hydrated.unwrap_err());
    }

    qCDebug(blockstoreStorageLog) << "Hydrated" << tree.size() << "blocks under"
                                  << id.to_string().c_str();
    return TreeResult::ok(std::move(tree));
}

Result<void, Error> BlockRepository::hydrate(
    BlockTree& tree,
    const Block& block,
    int depth,
    bool include_trashed
) {
    if (depth == 0 || block.children_ids.empty()) {
        return Result<void, Error>::ok();
    }

    std::vector<Uuid> pending;
    for (const auto& child_id : block.children_ids) {
        if (!tree.contains(child_id)) {
            pending.push_back(child_id);
        }
    }
    if (pending.empty()) {
        return Result<void, Error>::ok();
    }

    auto rows = get_blocks(pending, include_trashed);
    if (rows.is_err()) {
        return Result<void, Error>::err(rows.unwrap_err());
    }

    // Missing and hidden children stop the walk and are never re-fetched.
    std::unordered_set<Uuid> found;
    for (const auto& child : rows.unwrap()) {
        found.insert(child.id);
    }
    for (const auto& child_id : pending) {
        if (!found.contains(child_id)) {
            tree.mark_missing(child_id);
        }
    }

    for (auto& child : rows.unwrap()) {
        const Block& cached = tree.adopt(std::move(child));
        auto result = hydrate(tree, cached, depth - 1, include_trashed);
        if (result.is_err()) {
            return result;
        }
    }
    return Result<void, Error>::ok();
}

Result<void, Error> BlockRepository::hydrate_root(
    BlockTree& tree,
    const Block& block,
    bool include_trashed
) {
    std::string sql = "SELECT " + select_list("b") + " FROM blocks AS b WHERE b.root_id = ?";
    if (!include_trashed) {
        sql += " AND b.in_trash = 0";
    }
    auto rows = select_blocks(sql + ";", {block.root_id.to_string()});
    if (rows.is_err()) {
        return Result<void, Error>::err(rows.unwrap_err());
    }
    for (auto& row : rows.unwrap()) {
        tree.adopt(std::move(row));
    }
    return Result<void, Error>::ok();
}

Result<std::vector<Block>, Error> BlockRepository::query(const BlockQuery& query) {
    std::string sql = "SELECT " + select_list("b") + " FROM blocks AS b";
    std::vector<SqlFragment> parts;

    auto related = [&parts](const std::string& alias,
                            const std::optional<WhereClause>& where,
                            const std::optional<FilterExpression>& filter) {
        FilterCompiler compiler(alias);
        if (where) parts.push_back(compiler.compile(*where));
        if (filter) parts.push_back(compiler.compile(*filter));
    };

    if (query.root) {
        sql += " JOIN blocks AS r ON r.id = b.root_id";
        related("r", query.root->where, query.root->filter);
    }
    if (query.parent) {
        sql += " JOIN blocks AS p ON p.id = b.parent_id";
        related("p", query.parent->where, query.parent->filter);
    }

    FilterCompiler compiler("b");
    parts.push_back(compiler.compile(query.where));
    if (query.property_filter) {
        parts.push_back(compiler.compile(*query.property_filter));
    }
    if (!query.include_trashed) {
        parts.push_back(SqlFragment{"b.in_trash = 0", {}});
    }

    auto where = conjunction(parts);
    if (!where.empty()) {
        sql += " WHERE " + where.sql;
    }
    if (query.limit) {
        sql += " LIMIT ?";
        where.params.emplace_back(static_cast<int64_t>(*query.limit));
    }
    return select_blocks(sql + ";", where.params);
}

// ============================================================================
// Writes
// ============================================================================

Result<void, Error> BlockRepository::upsert(const std::vector<Block>& blocks) {
    if (blocks.empty()) {
        return Result<void, Error>::ok();
    }
    for (const auto& block : blocks) {
        auto valid = blocks::validate(block);
        if (valid.is_err()) {
            return valid;
        }
    }

    return db_.transaction([&]() -> Result<void, Error> {
        auto stmt_result = db_.prepare(R"SQL(
            INSERT INTO blocks (
                id, type, parent_id, root_id, children_ids, workspace_id,
                in_trash, version, created_time, last_edited_time, created_by,
                last_edited_by, properties, metadata, content, properties_version
            ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
            ON CONFLICT(id) DO UPDATE SET
                type = excluded.type,
                parent_id = excluded.parent_id,
                root_id = excluded.root_id,
                children_ids = excluded.children_ids,
                workspace_id = excluded.workspace_id,
                in_trash = excluded.in_trash,
                version = excluded.version,
                created_time = excluded.created_time,
                last_edited_time = excluded.last_edited_time,
                created_by = excluded.created_by,
                last_edited_by = excluded.last_edited_by,
                properties = excluded.properties,
                metadata = excluded.metadata,
                content = excluded.content,
                properties_version = excluded.properties_version;
        )SQL");
        if (stmt_result.is_err()) {
            return Result<void, Error>::err(stmt_result.unwrap_err());
        }
        auto stmt = std::move(stmt_result).unwrap();

        for (const auto& block : blocks) {
            auto bind_result = stmt.bind_all(block_params(block));
            if (bind_result.is_err()) {
                return bind_result;
            }
            auto step_result = stmt.step();
            if (step_result.is_err()) {
                return Result<void, Error>::err(step_result.unwrap_err());
            }
            auto reset_result = stmt.reset();
            if (reset_result.is_err()) {
                return reset_result;
            }
        }

        qCDebug(blockstoreStorageLog) << "Upserted" << blocks.size() << "blocks";
        return Result<void, Error>::ok();
    });
}

Result<void, Error> BlockRepository::set_children(
    const Uuid& parent_id,
    const std::vector<Uuid>& children_ids,
    int64_t expected_version
) {
    const std::unordered_set<Uuid> listed(children_ids.begin(), children_ids.end());
    if (listed.size() != children_ids.size()) {
        return fail(ErrorKind::InvalidChildren, "Duplicate child identifiers are not allowed");
    }

    return db_.transaction([&]() -> Result<void, Error> {
        StructureEdit edit(db_);

        auto parent_result = edit.require(parent_id, "Parent block");
        if (parent_result.is_err()) {
            return Result<void, Error>::err(parent_result.unwrap_err());
        }
        Structure* parent = parent_result.unwrap();
        if (parent->version != expected_version) {
            return version_mismatch("Parent", parent_id, expected_version, parent->version);
        }

        auto ancestors_result = edit.ancestors(*parent);
        if (ancestors_result.is_err()) {
            return Result<void, Error>::err(ancestors_result.unwrap_err());
        }
        const auto& ancestors = ancestors_result.unwrap();

        std::vector<Structure*> children;
        children.reserve(children_ids.size());
        for (const auto& child_id : children_ids) {
            if (child_id == parent_id) {
                return fail(ErrorKind::InvalidChildren, "A block cannot be a child of itself");
            }
            auto child_result = edit.require(child_id, "Child block");
            if (child_result.is_err()) {
                return Result<void, Error>::err(child_result.unwrap_err());
            }
            Structure* child = child_result.unwrap();
            if (ancestors.contains(child_id)) {
                return fail(ErrorKind::InvalidChildren,
                            "Child " + child_id.to_string() + " would introduce a cycle under parent " +
                            parent_id.to_string());
            }
            // A self-anchored root (a document) may be filed under a
            // container of another root; interior nodes may not.
            if (child->root_id != parent->root_id && child->root_id != child->id) {
                return fail(ErrorKind::InvalidChildren,
                            "Child " + child_id.to_string() + " belongs to root " +
                            child->root_id.to_string() + ", parent to root " +
                            parent->root_id.to_string());
            }
            children.push_back(child);
        }

        for (const auto& old_id : parent->children_ids) {
            if (listed.contains(old_id)) continue;
            auto old_result = edit.load(old_id);
            if (old_result.is_err()) {
                return Result<void, Error>::err(old_result.unwrap_err());
            }
            Structure* old = old_result.unwrap();
            if (old && old->parent_id == parent_id) {
                old->parent_id.reset();
                edit.mark_changed(old_id);
            }
        }

        for (Structure* child : children) {
            if (child->parent_id == parent_id) continue;
            if (child->parent_id) {
                auto previous_result = edit.load(*child->parent_id);
                if (previous_result.is_err()) {
                    return Result<void, Error>::err(previous_result.unwrap_err());
                }
                Structure* previous = previous_result.unwrap();
                if (previous && erase_id(previous->children_ids, child->id)) {
                    edit.mark_bumped(previous->id);
                }
            }
            child->parent_id = parent_id;
            edit.mark_changed(child->id);
        }

        parent->children_ids = children_ids;
        edit.mark_bumped(parent_id);

        auto written = edit.write(Timestamp::now());
        if (written.is_ok()) {
            qCDebug(blockstoreStorageLog) << "Set" << children_ids.size() << "children on"
                                          << parent_id.to_string().c_str();
        }
        return written;
    });
}

Result<void, Error> BlockRepository::reorder_children(
    const Uuid& parent_id,
    const std::vector<Uuid>& new_order,
    int64_t expected_version
) {
    return db_.transaction([&]() -> Result<void, Error> {
        StructureEdit edit(db_);
        auto parent_result = edit.require(parent_id, "Parent block");
        if (parent_result.is_err()) {
            return Result<void, Error>::err(parent_result.unwrap_err());
        }
        const auto& current = parent_result.unwrap()->children_ids;

        const std::unordered_set<Uuid> current_set(current.begin(), current.end());
        const std::unordered_set<Uuid> requested_set(new_order.begin(), new_order.end());
        if (current_set != requested_set || new_order.size() != current.size()) {
            return fail(ErrorKind::InvalidChildren,
                        "Reorder must reference the same child ids as currently stored");
        }

        return set_children(parent_id, new_order, expected_version);
    });
}

Result<void, Error> BlockRepository::move_block(
    const Uuid& block_id,
    const Uuid& new_parent_id,
    int64_t index,
    int64_t expected_block_version,
    int64_t expected_new_parent_version,
    std::optional<int64_t> expected_old_parent_version
) {
    return db_.transaction([&]() -> Result<void, Error> {
        StructureEdit edit(db_);

        auto block_result = edit.require(block_id, "Block");
        if (block_result.is_err()) {
            return Result<void, Error>::err(block_result.unwrap_err());
        }
        Structure* block = block_result.unwrap();
        if (block->version != expected_block_version) {
            return version_mismatch("Block", block_id, expected_block_version, block->version);
        }

        auto parent_result = edit.require(new_parent_id, "Target parent");
        if (parent_result.is_err()) {
            return Result<void, Error>::err(parent_result.unwrap_err());
        }
        Structure* new_parent = parent_result.unwrap();
        if (new_parent->version != expected_new_parent_version) {
            return version_mismatch("Parent", new_parent_id, expected_new_parent_version,
                                    new_parent->version);
        }

        if (new_parent->root_id != block->root_id) {
            return fail(ErrorKind::InvalidChildren,
                        "Cannot move block " + block_id.to_string() + " from root " +
                        block->root_id.to_string() + " to parent in root " +
                        new_parent->root_id.to_string());
        }
        if (block_id == new_parent_id) {
            return fail(ErrorKind::InvalidChildren, "A block cannot be moved under itself");
        }
        auto ancestors = edit.ancestors(*new_parent);
        if (ancestors.is_err()) {
            return Result<void, Error>::err(ancestors.unwrap_err());
        }
        if (ancestors.unwrap().contains(block_id)) {
            return fail(ErrorKind::InvalidChildren,
                        "Moving block " + block_id.to_string() + " under parent " +
                        new_parent_id.to_string() + " creates a cycle");
        }

        auto insert_at = [&](std::vector<Uuid>& ids) {
            erase_id(ids, block_id);
            auto position = std::clamp<int64_t>(index, 0, static_cast<int64_t>(ids.size()));
            ids.insert(ids.begin() + position, block_id);
        };

        if (block->parent_id != new_parent_id && block->parent_id) {
            auto old_result = edit.require(*block->parent_id, "Existing parent");
            if (old_result.is_err()) {
                return Result<void, Error>::err(old_result.unwrap_err());
            }
            Structure* old_parent = old_result.unwrap();
            if (expected_old_parent_version && old_parent->version != *expected_old_parent_version) {
                return version_mismatch("Parent", old_parent->id, *expected_old_parent_version,
                                        old_parent->version);
            }
            if (erase_id(old_parent->children_ids, block_id)) {
                edit.mark_bumped(old_parent->id);
            }
        }

        insert_at(new_parent->children_ids);
        edit.mark_bumped(new_parent_id);
        block->parent_id = new_parent_id;
        edit.mark_bumped(block_id);

        auto written = edit.write(Timestamp::now());
        if (written.is_ok()) {
            qCDebug(blockstoreStorageLog) << "Moved" << block_id.to_string().c_str() << "under"
                                          << new_parent_id.to_string().c_str() << "at" << index;
        }
        return written;
    });
}

Result<std::vector<Uuid>, Error> BlockRepository::missing_ids(const std::vector<Uuid>& ids) {
    std::unordered_set<Uuid> present;
    auto result = db_.query(
        "SELECT id FROM blocks WHERE id IN (" + placeholders(ids.size()) + ");",
        uuid_params(ids),
        [&](Statement& stmt) -> Result<void, Error> {
            if (auto id = stmt.column_uuid(0)) present.insert(*id);
            return Result<void, Error>::ok();
        });
    if (result.is_err()) {
        return Result<std::vector<Uuid>, Error>::err(result.unwrap_err());
    }

    std::vector<Uuid> missing;
    for (const auto& id : ids) {
        if (!present.contains(id)) missing.push_back(id);
    }
    return Result<std::vector<Uuid>, Error>::ok(std::move(missing));
}

Result<std::vector<Uuid>, Error> BlockRepository::descendant_closure(const std::vector<Uuid>& ids) {
    auto stmt_result = db_.prepare("SELECT children_ids FROM blocks WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Result<std::vector<Uuid>, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();

    std::vector<Uuid> closure;
    std::unordered_set<Uuid> seen;
    std::deque<Uuid> pending(ids.begin(), ids.end());
    while (!pending.empty()) {
        auto current = pending.front();
        pending.pop_front();
        if (!seen.insert(current).second) continue;

        auto bind_result = stmt.bind_uuid(1, current);
        if (bind_result.is_err()) {
            return Result<std::vector<Uuid>, Error>::err(bind_result.unwrap_err());
        }
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<std::vector<Uuid>, Error>::err(step_result.unwrap_err());
        }
        if (step_result.unwrap()) {
            closure.push_back(current);
            auto children = parse_uuid_array(stmt.column_text(0));
            if (children.is_err()) {
                return Result<std::vector<Uuid>, Error>::err(children.unwrap_err());
            }
            for (const auto& child : children.unwrap()) {
                pending.push_back(child);
            }
        }
        auto reset_result = stmt.reset();
        if (reset_result.is_err()) {
            return Result<std::vector<Uuid>, Error>::err(reset_result.unwrap_err());
        }
    }
    return Result<std::vector<Uuid>, Error>::ok(std::move(closure));
}

Result<void, Error> BlockRepository::set_in_trash(
    const std::vector<Uuid>& ids,
    bool in_trash,
    bool cascade
) {
    if (ids.empty()) {
        return Result<void, Error>::ok();
    }

    return db_.transaction([&]() -> Result<void, Error> {
        auto missing = missing_ids(ids);
        if (missing.is_err()) {
            return Result<void, Error>::err(missing.unwrap_err());
        }
        if (!missing.unwrap().empty()) {
            return fail(ErrorKind::NotFound,
                        "Block(s) " + describe(missing.unwrap()) + " do not exist");
        }

        std::vector<Uuid> targets;
        if (cascade) {
            auto closure = descendant_closure(ids);
            if (closure.is_err()) {
                return Result<void, Error>::err(closure.unwrap_err());
            }
            targets = std::move(closure).unwrap();
        } else {
            std::unordered_set<Uuid> seen;
            for (const auto& id : ids) {
                if (seen.insert(id).second) targets.push_back(id);
            }
        }

        auto stmt_result = db_.prepare(
            "UPDATE blocks SET in_trash = ?, version = version + 1 WHERE id = ?;");
        if (stmt_result.is_err()) {
            return Result<void, Error>::err(stmt_result.unwrap_err());
        }
        auto stmt = std::move(stmt_result).unwrap();
        for (const auto& id : targets) {
            auto bind_result = stmt.bind_all({int64_t{in_trash ? 1 : 0}, id.to_string()});
            if (bind_result.is_err()) {
                return bind_result;
            }
            auto step_result = stmt.step();
            if (step_result.is_err()) {
                return Result<void, Error>::err(step_result.unwrap_err());
            }
            auto reset_result = stmt.reset();
            if (reset_result.is_err()) {
                return reset_result;
            }
        }

        qCDebug(blockstoreStorageLog) << (in_trash ? "Trashed" : "Restored") << targets.size()
                                      << "blocks";
        return Result<void, Error>::ok();
    });
}

Result<void, Error> BlockRepository::remove(const std::vector<Uuid>& ids) {
    if (ids.empty()) {
        return Result<void, Error>::ok();
    }

    return db_.transaction([&]() -> Result<void, Error> {
        auto missing = missing_ids(ids);
        if (missing.is_err()) {
            return Result<void, Error>::err(missing.unwrap_err());
        }
        if (!missing.unwrap().empty()) {
            return fail(ErrorKind::NotFound,
                        "Block(s) " + describe(missing.unwrap()) + " do not exist");
        }

        auto closure_result = descendant_closure(ids);
        if (closure_result.is_err()) {
            return Result<void, Error>::err(closure_result.unwrap_err());
        }
        const auto closure = std::move(closure_result).unwrap();
        const std::unordered_set<Uuid> doomed(closure.begin(), closure.end());

        // Detach each removed subtree from a parent that survives.
        StructureEdit edit(db_);
        for (const auto& id : ids) {
            auto row = edit.load(id);
            if (row.is_err()) {
                return Result<void, Error>::err(row.unwrap_err());
            }
            const auto parent_id = row.unwrap()->parent_id;
            if (!parent_id || doomed.contains(*parent_id)) continue;
            auto parent = edit.load(*parent_id);
            if (parent.is_err()) {
                return Result<void, Error>::err(parent.unwrap_err());
            }
            if (parent.unwrap() && erase_id(parent.unwrap()->children_ids, id)) {
                edit.mark_bumped(*parent_id);
            }
        }
        auto written = edit.write(Timestamp::now());
        if (written.is_err()) {
            return written;
        }

        for (const auto& id : closure) {
            auto orphaned = db_.run("UPDATE blocks SET parent_id = NULL WHERE parent_id = ?;",
                                    {id.to_string()});
            if (orphaned.is_err()) {
                return Result<void, Error>::err(orphaned.unwrap_err());
            }
            auto deleted = db_.run("DELETE FROM blocks WHERE id = ?;", {id.to_string()});
            if (deleted.is_err()) {
                return Result<void, Error>::err(deleted.unwrap_err());
            }
        }

        qCInfo(blockstoreStorageLog) << "Removed" << closure.size() << "blocks";
        return Result<void, Error>::ok();
    });
}

} // namespace blockstore::storage
