#include "storage/relationship_repository.hpp"
#include "storage/json_columns.hpp"
#include "core/logging.hpp"

#include <unordered_set>

namespace blockstore::storage {

Result<Relationship, Error> RelationshipRepository::row_to_relationship(Statement& stmt) {
    auto id = stmt.column_uuid(0);
    auto source = stmt.column_uuid(2);
    auto target = stmt.column_uuid(3);
    if (!id || !source || !target) {
        return fail<Relationship>(ErrorKind::Storage,
                                  "Malformed relationship row '" + stmt.column_text(0) + "'");
    }

    auto metadata = parse_object(stmt.column_text(5), "metadata");
    if (metadata.is_err()) {
        return Result<Relationship, Error>::err(metadata.unwrap_err());
    }

    return Result<Relationship, Error>::ok(Relationship{
        .id = *id,
        .workspace_id = stmt.column_uuid(1),
        .source_block_id = *source,
        .target_block_id = *target,
        .rel_type = stmt.column_text(4),
        .metadata = std::move(metadata).unwrap(),
        .version = stmt.column_int64(6),
        .created_time = Timestamp(stmt.column_int64(7)),
        .last_edited_time = Timestamp(stmt.column_int64(8)),
        .created_by = stmt.column_uuid(9),
        .last_edited_by = stmt.column_uuid(10),
    });
}

Result<void, Error> RelationshipRepository::upsert(const std::vector<Relationship>& relationships) {
    if (relationships.empty()) {
        return Result<void, Error>::ok();
    }

    return db_.transaction([&]() -> Result<void, Error> {
        auto lookup_result = db_.prepare("SELECT 1 FROM blocks WHERE id = ?;");
        if (lookup_result.is_err()) {
            return Result<void, Error>::err(lookup_result.unwrap_err());
        }
        auto lookup = std::move(lookup_result).unwrap();

        std::unordered_set<Uuid> checked;
        std::string missing;
        for (const auto& rel : relationships) {
            for (const auto& endpoint : {rel.source_block_id, rel.target_block_id}) {
                if (!checked.insert(endpoint).second) continue;
                auto bind_result = lookup.bind_uuid(1, endpoint);
                if (bind_result.is_err()) {
                    return bind_result;
                }
                auto step_result = lookup.step();
                if (step_result.is_err()) {
                    return Result<void, Error>::err(step_result.unwrap_err());
                }
                if (!step_result.unwrap()) {
                    missing += (missing.empty() ? "" : ", ") + endpoint.to_string();
                }
                auto reset_result = lookup.reset();
                if (reset_result.is_err()) {
                    return reset_result;
                }
            }
        }
        if (!missing.empty()) {
            return fail(ErrorKind::NotFound, "Relationship endpoint(s) [" + missing + "] do not exist");
        }

        auto stmt_result = db_.prepare(R"SQL(
            INSERT INTO relationships (
                id, workspace_id, source_block_id, target_block_id, rel_type, metadata,
                version, created_time, last_edited_time, created_by, last_edited_by
            ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
            ON CONFLICT(source_block_id, target_block_id, rel_type) DO UPDATE SET
                metadata = excluded.metadata,
                last_edited_time = excluded.last_edited_time,
                last_edited_by = excluded.last_edited_by,
                version = relationships.version + 1;
        )SQL");
        if (stmt_result.is_err()) {
            return Result<void, Error>::err(stmt_result.unwrap_err());
        }
        auto stmt = std::move(stmt_result).unwrap();

        for (const auto& rel : relationships) {
            auto bind_result = stmt.bind_all({
                rel.id.to_string(),
                optional_uuid(rel.workspace_id),
                rel.source_block_id.to_string(),
                rel.target_block_id.to_string(),
                rel.rel_type,
                json_text(rel.metadata),
                rel.version,
                rel.created_time.millis(),
                rel.last_edited_time.millis(),
                optional_uuid(rel.created_by),
                optional_uuid(rel.last_edited_by),
            });
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

        qCDebug(blockstoreStorageLog) << "Upserted" << relationships.size() << "relationships";
        return Result<void, Error>::ok();
    });
}

Result<bool, Error> RelationshipRepository::remove(const std::vector<RelationshipKey>& keys) {
    if (keys.empty()) {
        return Result<bool, Error>::ok(false);
    }

    return db_.transaction([&]() -> Result<bool, Error> {
        int removed = 0;
        for (const auto& key : keys) {
            auto result = db_.run(
                "DELETE FROM relationships "
                "WHERE source_block_id = ? AND target_block_id = ? AND rel_type = ?;",
                {key.source_block_id.to_string(), key.target_block_id.to_string(), key.rel_type});
            if (result.is_err()) {
                return Result<bool, Error>::err(result.unwrap_err());
            }
            removed += result.unwrap();
        }
        return Result<bool, Error>::ok(removed > 0);
    });
}

Result<std::vector<Relationship>, Error> RelationshipRepository::get(
    const Uuid& block_id,
    Direction direction,
    bool include_trashed
) {
    std::string sql = R"SQL(
        SELECT r.id, r.workspace_id, r.source_block_id, r.target_block_id, r.rel_type,
               r.metadata, r.version, r.created_time, r.last_edited_time,
               r.created_by, r.last_edited_by
        FROM relationships AS r
    )SQL";
    if (!include_trashed) {
        sql += " JOIN blocks AS s ON s.id = r.source_block_id"
               " JOIN blocks AS t ON t.id = r.target_block_id";
    }

    std::vector<SqlValue> params{block_id.to_string()};
    switch (direction) {
        case Direction::Outgoing:
            sql += " WHERE r.source_block_id = ?";
            break;
        case Direction::Incoming:
            sql += " WHERE r.target_block_id = ?";
            break;
        case Direction::All:
            sql += " WHERE (r.source_block_id = ? OR r.target_block_id = ?)";
            params.emplace_back(block_id.to_string());
            break;
    }
    if (!include_trashed) {
        sql += " AND s.in_trash = 0 AND t.in_trash = 0";
    }
    sql += " ORDER BY r.created_time, r.id;";

    std::vector<Relationship> relationships;
    auto result = db_.query(sql, params, [&](Statement& stmt) -> Result<void, Error> {
        auto rel = row_to_relationship(stmt);
        if (rel.is_err()) {
            return Result<void, Error>::err(rel.unwrap_err());
        }
        relationships.push_back(std::move(rel).unwrap());
        return Result<void, Error>::ok();
    });
    if (result.is_err()) {
        return Result<std::vector<Relationship>, Error>::err(result.unwrap_err());
    }
    return Result<std::vector<Relationship>, Error>::ok(std::move(relationships));
}

} // namespace blockstore::storage
