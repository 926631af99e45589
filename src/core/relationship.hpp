#pragma once

#include "core/types.hpp"

#include <QJsonObject>

#include <optional>
#include <string>

namespace blockstore {

/**
 * Relationship - A directed, typed edge between two blocks, independent
 * of the tree. At most one exists per (source, target, rel_type).
 */
struct Relationship {
    Uuid id;
    std::optional<Uuid> workspace_id;
    Uuid source_block_id;
    Uuid target_block_id;
    std::string rel_type;
    QJsonObject metadata;
    int64_t version{0};
    Timestamp created_time;
    Timestamp last_edited_time;
    std::optional<Uuid> created_by;
    std::optional<Uuid> last_edited_by;

    bool operator==(const Relationship&) const = default;
};

/**
 * The composite key that identifies a relationship row.
 */
struct RelationshipKey {
    Uuid source_block_id;
    Uuid target_block_id;
    std::string rel_type;

    bool operator==(const RelationshipKey&) const = default;
};

[[nodiscard]] inline RelationshipKey key_of(const Relationship& rel) {
    return RelationshipKey{
        .source_block_id = rel.source_block_id,
        .target_block_id = rel.target_block_id,
        .rel_type = rel.rel_type,
    };
}

enum class Direction { All, Outgoing, Incoming };

/**
 * Build a new relationship with a fresh id and current timestamps.
 */
[[nodiscard]] inline Relationship make_relationship(
    Uuid source,
    Uuid target,
    std::string rel_type,
    QJsonObject metadata = {}
) {
    auto now = Timestamp::now();
    return Relationship{
        .id = Uuid::generate(),
        .source_block_id = source,
        .target_block_id = target,
        .rel_type = std::move(rel_type),
        .metadata = std::move(metadata),
        .created_time = now,
        .last_edited_time = now,
    };
}

} // namespace blockstore
