#pragma once

#include "storage/database.hpp"
#include "core/relationship.hpp"
#include "core/result.hpp"
#include <vector>

namespace blockstore::storage {

/**
 * RelationshipRepository - Typed, directed edges between blocks.
 *
 * A (source, target, rel_type) triple is unique: upserting an existing
 * triple updates its metadata and bumps its version instead of adding a
 * row. Hard-deleting either endpoint deletes the edge; trashing one
 * hides it from default reads.
 */
class RelationshipRepository {
public:
    explicit RelationshipRepository(Database& db) : db_(db) {}

    /**
     * Insert or update relationships in one transaction. Every endpoint
     * must exist (ErrorKind::NotFound otherwise).
     */
    [[nodiscard]] Result<void, Error> upsert(const std::vector<Relationship>& relationships);

    /**
     * Delete by composite key. Returns true if any row was removed.
     */
    [[nodiscard]] Result<bool, Error> remove(const std::vector<RelationshipKey>& keys);

    /**
     * Relationships touching `block_id` in the given direction. Unless
     * include_trashed, edges with a trashed endpoint are left out.
     */
    [[nodiscard]] Result<std::vector<Relationship>, Error> get(
        const Uuid& block_id,
        Direction direction = Direction::All,
        bool include_trashed = false);

private:
    Database& db_;

    [[nodiscard]] Result<Relationship, Error> row_to_relationship(Statement& stmt);
};

} // namespace blockstore::storage
