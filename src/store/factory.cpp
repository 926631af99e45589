#include "store/factory.hpp"
#include "storage/migrations.hpp"
#include "core/logging.hpp"

#include <QString>
#include <QtGlobal>

namespace blockstore::store {

StoreConfig StoreConfig::from_environment() {
    StoreConfig config;
    const auto path = qEnvironmentVariable("BLOCKSTORE_DB_PATH");
    if (!path.isEmpty()) {
        config.db_path = path.toStdString();
    }
    config.debug_sql = qEnvironmentVariableIsSet("BLOCKSTORE_DEBUG_SQL");
    return config;
}

BlockStore::BlockStore(storage::Database db, DocumentStoreOptions options)
    : db_(std::move(db))
    , blocks_(db_)
    , relationships_(db_)
    , documents_(blocks_, relationships_, std::move(options)) {}

Result<std::unique_ptr<BlockStore>, Error> BlockStore::open(const StoreConfig& config) {
    auto db_result = config.db_path.empty()
        ? storage::Database::open_memory()
        : storage::Database::open(config.db_path);
    if (db_result.is_err()) {
        qCWarning(blockstoreStoreLog) << "Failed to open database"
                                      << QString::fromStdString(config.db_path) << ":"
                                      << QString::fromStdString(db_result.unwrap_err().message);
        return Result<std::unique_ptr<BlockStore>, Error>::err(db_result.unwrap_err());
    }
    auto db = std::move(db_result).unwrap();

    if (config.debug_sql) {
        enable_debug_logging();
        db.set_tracing(true);
    }

    auto migrated = storage::initialize_database(db);
    if (migrated.is_err()) {
        return Result<std::unique_ptr<BlockStore>, Error>::err(migrated.unwrap_err());
    }

    qCInfo(blockstoreStoreLog) << "Opened block store at"
                               << (config.db_path.empty()
                                       ? QStringLiteral(":memory:")
                                       : QString::fromStdString(config.db_path));

    std::unique_ptr<BlockStore> store(new BlockStore(
        std::move(db), DocumentStoreOptions{.root_types = config.root_types}));
    return Result<std::unique_ptr<BlockStore>, Error>::ok(std::move(store));
}

} // namespace blockstore::store
