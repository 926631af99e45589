#pragma once

#include <QLoggingCategory>

// Logging categories for the library. Enable with QT_LOGGING_RULES, e.g.
//   QT_LOGGING_RULES="blockstore.storage.debug=true"
Q_DECLARE_LOGGING_CATEGORY(blockstoreStorageLog)
Q_DECLARE_LOGGING_CATEGORY(blockstoreSqlLog)
Q_DECLARE_LOGGING_CATEGORY(blockstoreStoreLog)

namespace blockstore {

// Turns on debug output for every blockstore category. Used when
// BLOCKSTORE_DEBUG_SQL is set so that traced statements are visible.
void enable_debug_logging();

} // namespace blockstore
