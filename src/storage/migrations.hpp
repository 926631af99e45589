#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <string>
#include <vector>

namespace blockstore::storage {

/**
 * Migration - A database schema migration.
 */
struct Migration {
    int version;
    std::string name;
    std::string up_sql;
    std::string down_sql;  // Optional - for rollback
};

/**
 * All migrations in order.
 */
inline const std::vector<Migration> ALL_MIGRATIONS = {
    {
        .version = 1,
        .name = "blocks",
        .up_sql = R"SQL(
            -- One row per block. JSON columns hold Qt-serialized compact JSON.
            CREATE TABLE IF NOT EXISTS blocks (
                id TEXT PRIMARY KEY,
                type TEXT NOT NULL,
                parent_id TEXT,
                root_id TEXT NOT NULL,
                children_ids TEXT NOT NULL DEFAULT '[]'
                    CHECK (json_valid(children_ids) AND json_type(children_ids) = 'array'),
                workspace_id TEXT,
                in_trash INTEGER NOT NULL DEFAULT 0,
                version INTEGER NOT NULL DEFAULT 0,
                created_time INTEGER NOT NULL,
                last_edited_time INTEGER NOT NULL,
                created_by TEXT,
                last_edited_by TEXT,
                properties TEXT NOT NULL DEFAULT '{}'
                    CHECK (json_valid(properties)),
                metadata TEXT NOT NULL DEFAULT '{}'
                    CHECK (json_valid(metadata)),
                content TEXT
                    CHECK (content IS NULL OR json_valid(content)),
                properties_version INTEGER
            );
            CREATE INDEX IF NOT EXISTS ix_blocks_root_type ON blocks(root_id, type);
            CREATE INDEX IF NOT EXISTS ix_blocks_parent ON blocks(parent_id);
            CREATE INDEX IF NOT EXISTS ix_blocks_workspace_root ON blocks(workspace_id, root_id);
            CREATE INDEX IF NOT EXISTS ix_blocks_in_trash ON blocks(in_trash);
        )SQL",
        .down_sql = R"SQL(
            DROP INDEX IF EXISTS ix_blocks_in_trash;
            DROP INDEX IF EXISTS ix_blocks_workspace_root;
            DROP INDEX IF EXISTS ix_blocks_parent;
            DROP INDEX IF EXISTS ix_blocks_root_type;
            DROP TABLE IF EXISTS blocks;
        )SQL"
    },
    {
        .version = 2,
        .name = "relationships",
        .up_sql = R"SQL(
            CREATE TABLE IF NOT EXISTS relationships (
                id TEXT PRIMARY KEY,
                workspace_id TEXT,
                source_block_id TEXT NOT NULL REFERENCES blocks(id) ON DELETE CASCADE,
                target_block_id TEXT NOT NULL REFERENCES blocks(id) ON DELETE CASCADE,
                rel_type TEXT NOT NULL,
                metadata TEXT NOT NULL DEFAULT '{}'
                    CHECK (json_valid(metadata)),
                version INTEGER NOT NULL DEFAULT 0,
                created_time INTEGER NOT NULL,
                last_edited_time INTEGER NOT NULL,
                created_by TEXT,
                last_edited_by TEXT
            );
            CREATE INDEX IF NOT EXISTS ix_relationships_source ON relationships(source_block_id);
            CREATE INDEX IF NOT EXISTS ix_relationships_target ON relationships(target_block_id);
            CREATE INDEX IF NOT EXISTS ix_relationships_type ON relationships(rel_type);
            CREATE UNIQUE INDEX IF NOT EXISTS ix_relationships_unique
                ON relationships(source_block_id, target_block_id, rel_type);
        )SQL",
        .down_sql = R"SQL(
            DROP INDEX IF EXISTS ix_relationships_unique;
            DROP INDEX IF EXISTS ix_relationships_type;
            DROP INDEX IF EXISTS ix_relationships_target;
            DROP INDEX IF EXISTS ix_relationships_source;
            DROP TABLE IF EXISTS relationships;
        )SQL"
    },
};

/**
 * MigrationRunner - Applies and rolls back schema migrations, tracking
 * the applied versions in schema_migrations.
 */
class MigrationRunner {
public:
    explicit MigrationRunner(Database& db) : db_(db) {}

    /**
     * Run all pending migrations.
     */
    [[nodiscard]] Result<void, Error> migrate();

    /**
     * Apply pending migrations up to `target_version`. Already being at or
     * past it is a no-op; a version no migration has is InvalidArgument.
     */
    [[nodiscard]] Result<void, Error> migrate_to(int target_version);

    /**
     * Rollback the last migration.
     */
    [[nodiscard]] Result<void, Error> rollback();

    /**
     * Undo applied migrations above `target_version`, newest first, in one
     * transaction.
     */
    [[nodiscard]] Result<void, Error> rollback_to(int target_version);

    /**
     * Get the current schema version.
     */
    [[nodiscard]] Result<int, Error> current_version();

    /**
     * Get the latest available migration version.
     */
    [[nodiscard]] static int latest_version() {
        return ALL_MIGRATIONS.empty() ? 0 : ALL_MIGRATIONS.back().version;
    }

private:
    Database& db_;

    [[nodiscard]] Result<void, Error> ensure_migrations_table();
    // Run one step and record it in (or erase it from) schema_migrations.
    [[nodiscard]] Result<void, Error> apply(const Migration& m);
    [[nodiscard]] Result<void, Error> revert(const Migration& m);
};

/**
 * Initialize a database with all migrations.
 */
[[nodiscard]] inline Result<void, Error> initialize_database(Database& db) {
    MigrationRunner runner(db);
    return runner.migrate();
}

} // namespace blockstore::storage
