#include <catch2/catch_test_macros.hpp>
#include "storage/database.hpp"
#include "storage/migrations.hpp"

#include <set>

using namespace blockstore;
using namespace blockstore::storage;

namespace {

std::set<std::string> table_names(Database& db) {
    std::set<std::string> names;
    auto result = db.query(
        "SELECT name FROM sqlite_master WHERE type = 'table';", {},
        [&](Statement& stmt) -> Result<void, Error> {
            names.insert(stmt.column_text(0));
            return Result<void, Error>::ok();
        });
    result.unwrap();
    return names;
}

int64_t count_rows(Database& db, const std::string& table) {
    int64_t count = 0;
    db.query("SELECT COUNT(*) FROM " + table + ";", {},
             [&](Statement& stmt) -> Result<void, Error> {
                 count = stmt.column_int64(0);
                 return Result<void, Error>::ok();
             }).unwrap();
    return count;
}

} // anonymous namespace

TEST_CASE("Migrations create and drop the schema", "[integration][migrations]") {
    auto db = Database::open_memory().unwrap();
    MigrationRunner runner(db);

    REQUIRE(runner.current_version().unwrap() == 0);
    REQUIRE(runner.migrate().is_ok());
    REQUIRE(runner.current_version().unwrap() == MigrationRunner::latest_version());
    REQUIRE(MigrationRunner::latest_version() == 2);

    auto tables = table_names(db);
    REQUIRE(tables.contains("blocks"));
    REQUIRE(tables.contains("relationships"));
    REQUIRE(tables.contains("schema_migrations"));

    SECTION("migrate is idempotent") {
        REQUIRE(runner.migrate().is_ok());
        REQUIRE(count_rows(db, "schema_migrations") == 2);
    }

    SECTION("rollback one step") {
        REQUIRE(runner.rollback().is_ok());
        REQUIRE(runner.current_version().unwrap() == 1);
        REQUIRE_FALSE(table_names(db).contains("relationships"));
        REQUIRE(table_names(db).contains("blocks"));
    }

    SECTION("rollback to zero and back") {
        REQUIRE(runner.rollback_to(0).is_ok());
        REQUIRE_FALSE(table_names(db).contains("blocks"));

        REQUIRE(runner.migrate_to(1).is_ok());
        REQUIRE(runner.current_version().unwrap() == 1);
        REQUIRE(initialize_database(db).is_ok());
        REQUIRE(runner.current_version().unwrap() == 2);
    }

    SECTION("unknown target versions are rejected") {
        auto ahead = runner.migrate_to(MigrationRunner::latest_version() + 1);
        REQUIRE(ahead.is_err());
        REQUIRE(ahead.unwrap_err().kind == ErrorKind::InvalidArgument);
        REQUIRE(runner.rollback_to(-1).unwrap_err().kind == ErrorKind::InvalidArgument);
        REQUIRE(runner.current_version().unwrap() == 2);
    }

    SECTION("each applied step is recorded under its name") {
        std::vector<std::string> names;
        db.query("SELECT name FROM schema_migrations ORDER BY version;", {},
                 [&](Statement& stmt) -> Result<void, Error> {
                     names.push_back(stmt.column_text(0));
                     return Result<void, Error>::ok();
                 }).unwrap();
        REQUIRE(names == std::vector<std::string>{"blocks", "relationships"});
    }
}

TEST_CASE("Schema constraints", "[integration][migrations]") {
    auto db = Database::open_memory().unwrap();
    REQUIRE(initialize_database(db).is_ok());

    const std::string insert =
        "INSERT INTO blocks (id, type, root_id, children_ids, created_time, last_edited_time, "
        "properties) VALUES (?, 'paragraph', ?, ?, 0, 0, ?);";

    SECTION("children_ids must be a JSON array") {
        auto result = db.run(insert, {std::string{"a"}, std::string{"a"},
                                      std::string{"{}"}, std::string{"{}"}});
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::Storage);
    }

    SECTION("properties must be valid JSON") {
        auto result = db.run(insert, {std::string{"a"}, std::string{"a"},
                                      std::string{"[]"}, std::string{"{oops"}});
        REQUIRE(result.is_err());
    }

    SECTION("relationships need existing endpoints") {
        auto result = db.run(
            "INSERT INTO relationships (id, source_block_id, target_block_id, rel_type, "
            "created_time, last_edited_time) VALUES ('r', 'x', 'y', 'cites', 0, 0);",
            {});
        REQUIRE(result.is_err());
    }
}

TEST_CASE("Database transactions", "[integration][database]") {
    auto db = Database::open_memory().unwrap();
    REQUIRE(db.execute("CREATE TABLE t (v INTEGER);").is_ok());

    SECTION("commit on success") {
        auto result = db.transaction([&]() -> Result<void, Error> {
            return db.run("INSERT INTO t VALUES (1);", {}).and_then(
                [](int) { return Result<void, Error>::ok(); });
        });
        REQUIRE(result.is_ok());
        REQUIRE(count_rows(db, "t") == 1);
        REQUIRE_FALSE(db.in_transaction());
    }

    SECTION("rollback on failure") {
        auto result = db.transaction([&]() -> Result<void, Error> {
            auto inserted = db.run("INSERT INTO t VALUES (1);", {});
            if (inserted.is_err()) {
                return Result<void, Error>::err(inserted.unwrap_err());
            }
            return fail(ErrorKind::VersionConflict, "stale");
        });
        REQUIRE(result.unwrap_err().kind == ErrorKind::VersionConflict);
        REQUIRE(count_rows(db, "t") == 0);
        REQUIRE_FALSE(db.in_transaction());
    }

    SECTION("nested calls join the outer transaction") {
        auto result = db.transaction([&]() -> Result<void, Error> {
            auto inner = db.transaction([&]() -> Result<int, Error> {
                return db.run("INSERT INTO t VALUES (1);", {});
            });
            if (inner.is_err()) {
                return Result<void, Error>::err(inner.unwrap_err());
            }
            REQUIRE(db.in_transaction());
            return fail(ErrorKind::InvalidChildren, "abort");
        });
        REQUIRE(result.is_err());
        REQUIRE(count_rows(db, "t") == 0);
    }

    SECTION("run reports changed rows") {
        REQUIRE(db.execute("INSERT INTO t VALUES (1), (2), (3);").is_ok());
        REQUIRE(db.run("UPDATE t SET v = v + 1 WHERE v > ?;", {int64_t{1}}).unwrap() == 2);
    }

    SECTION("query callbacks can stop iteration with an error") {
        REQUIRE(db.execute("INSERT INTO t VALUES (1), (2);").is_ok());
        int seen = 0;
        auto result = db.query("SELECT v FROM t;", {}, [&](Statement&) -> Result<void, Error> {
            ++seen;
            return fail(ErrorKind::Validation, "bad row");
        });
        REQUIRE(result.unwrap_err().kind == ErrorKind::Validation);
        REQUIRE(seen == 1);
    }
}

TEST_CASE("Foreign keys are enforced", "[integration][database]") {
    auto db = Database::open_memory().unwrap();
    int enabled = 0;
    db.query("PRAGMA foreign_keys;", {}, [&](Statement& stmt) -> Result<void, Error> {
        enabled = stmt.column_int(0);
        return Result<void, Error>::ok();
    }).unwrap();
    REQUIRE(enabled == 1);
}
