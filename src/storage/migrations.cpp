#include "storage/migrations.hpp"
#include "core/logging.hpp"

namespace blockstore::storage {

namespace {

Error migration_error(const std::string& what, const Migration& m, const Error& cause) {
    Error error(what + " " + std::to_string(m.version) + " (" + m.name + ") failed: " +
                cause.message, cause.code);
    error.kind = cause.kind;
    return error;
}

} // anonymous namespace

Result<void, Error> MigrationRunner::ensure_migrations_table() {
    return db_.execute(R"SQL(
        CREATE TABLE IF NOT EXISTS schema_migrations (
            version INTEGER PRIMARY KEY,
            name TEXT NOT NULL,
            applied_at INTEGER NOT NULL
        );
    )SQL");
}

Result<int, Error> MigrationRunner::current_version() {
    auto ensured = ensure_migrations_table();
    if (ensured.is_err()) {
        return Result<int, Error>::err(ensured.unwrap_err());
    }

    int version = 0;
    auto read = db_.query(
        "SELECT COALESCE(MAX(version), 0) FROM schema_migrations;", {},
        [&](Statement& stmt) -> Result<void, Error> {
            version = stmt.column_int(0);
            return Result<void, Error>::ok();
        });
    if (read.is_err()) {
        return Result<int, Error>::err(read.unwrap_err());
    }
    return Result<int, Error>::ok(version);
}

Result<void, Error> MigrationRunner::apply(const Migration& m) {
    auto executed = db_.execute(m.up_sql);
    if (executed.is_err()) {
        return Result<void, Error>::err(migration_error("Migration", m, executed.unwrap_err()));
    }

    auto recorded = db_.run(
        "INSERT INTO schema_migrations (version, name, applied_at) VALUES (?, ?, ?);",
        {int64_t{m.version}, m.name, Timestamp::now().millis()});
    if (recorded.is_err()) {
        return Result<void, Error>::err(recorded.unwrap_err());
    }

    qCInfo(blockstoreStorageLog) << "Applied migration" << m.version << m.name.c_str();
    return Result<void, Error>::ok();
}

Result<void, Error> MigrationRunner::revert(const Migration& m) {
    if (m.down_sql.empty()) {
        return Result<void, Error>::err(Error{
            "Migration " + std::to_string(m.version) + " (" + m.name + ") cannot be rolled back"});
    }

    auto executed = db_.execute(m.down_sql);
    if (executed.is_err()) {
        return Result<void, Error>::err(migration_error("Rollback of migration", m, executed.unwrap_err()));
    }

    auto erased = db_.run("DELETE FROM schema_migrations WHERE version = ?;", {int64_t{m.version}});
    if (erased.is_err()) {
        return Result<void, Error>::err(erased.unwrap_err());
    }

    qCInfo(blockstoreStorageLog) << "Rolled back migration" << m.version << m.name.c_str();
    return Result<void, Error>::ok();
}

Result<void, Error> MigrationRunner::migrate() {
    return migrate_to(latest_version());
}

Result<void, Error> MigrationRunner::migrate_to(int target_version) {
    if (target_version < 0 || target_version > latest_version()) {
        return fail(ErrorKind::InvalidArgument,
                    "Unknown schema version " + std::to_string(target_version));
    }
    auto current = current_version();
    if (current.is_err()) {
        return Result<void, Error>::err(current.unwrap_err());
    }
    const int from = current.unwrap();

    return db_.transaction([&]() -> Result<void, Error> {
        for (const auto& m : ALL_MIGRATIONS) {
            if (m.version <= from || m.version > target_version) continue;
            auto applied = apply(m);
            if (applied.is_err()) {
                return applied;
            }
        }
        return Result<void, Error>::ok();
    });
}

Result<void, Error> MigrationRunner::rollback() {
    auto current = current_version();
    if (current.is_err()) {
        return Result<void, Error>::err(current.unwrap_err());
    }
    if (current.unwrap() == 0) {
        return Result<void, Error>::ok();
    }
    return rollback_to(current.unwrap() - 1);
}

Result<void, Error> MigrationRunner::rollback_to(int target_version) {
    if (target_version < 0) {
        return fail(ErrorKind::InvalidArgument,
                    "Unknown schema version " + std::to_string(target_version));
    }
    auto current = current_version();
    if (current.is_err()) {
        return Result<void, Error>::err(current.unwrap_err());
    }
    const int from = current.unwrap();

    return db_.transaction([&]() -> Result<void, Error> {
        for (auto it = ALL_MIGRATIONS.rbegin(); it != ALL_MIGRATIONS.rend(); ++it) {
            if (it->version > from || it->version <= target_version) continue;
            auto reverted = revert(*it);
            if (reverted.is_err()) {
                return reverted;
            }
        }
        return Result<void, Error>::ok();
    });
}

} // namespace blockstore::storage
