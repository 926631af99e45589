#include "core/logging.hpp"

Q_LOGGING_CATEGORY(blockstoreStorageLog, "blockstore.storage", QtInfoMsg)
Q_LOGGING_CATEGORY(blockstoreSqlLog, "blockstore.sql", QtInfoMsg)
Q_LOGGING_CATEGORY(blockstoreStoreLog, "blockstore.store", QtInfoMsg)

namespace blockstore {

void enable_debug_logging() {
    QLoggingCategory::setFilterRules(QStringLiteral("blockstore.*.debug=true"));
}

} // namespace blockstore
