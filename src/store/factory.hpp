#pragma once

#include "store/document_store.hpp"
#include "storage/block_repository.hpp"
#include "storage/database.hpp"
#include "storage/relationship_repository.hpp"
#include "core/result.hpp"

#include <memory>
#include <string>
#include <vector>

namespace blockstore::store {

struct StoreConfig {
    // Empty means an in-memory database.
    std::string db_path;
    bool debug_sql{false};
    std::vector<blocks::BlockType> root_types{
        blocks::BlockType::Document,
        blocks::BlockType::Dataset,
    };

    /**
     * Read BLOCKSTORE_DB_PATH and BLOCKSTORE_DEBUG_SQL.
     */
    [[nodiscard]] static StoreConfig from_environment();
};

/**
 * BlockStore - Owns one connection and everything layered on it.
 *
 * Repositories and the façade hold references into the store, so it is
 * handed out behind a unique_ptr and never moved. Trees read through it
 * load unhydrated levels through its repository and must not be
 * navigated into those levels after the store is destroyed.
 */
class BlockStore {
public:
    /**
     * Open the database, apply pending migrations and wire the
     * repositories and the document store.
     */
    [[nodiscard]] static Result<std::unique_ptr<BlockStore>, Error> open(const StoreConfig& config);

    BlockStore(const BlockStore&) = delete;
    BlockStore& operator=(const BlockStore&) = delete;

    [[nodiscard]] storage::Database& database() { return db_; }
    [[nodiscard]] storage::BlockRepository& blocks() { return blocks_; }
    [[nodiscard]] storage::RelationshipRepository& relationships() { return relationships_; }
    [[nodiscard]] DocumentStore& documents() { return documents_; }

private:
    BlockStore(storage::Database db, DocumentStoreOptions options);

    storage::Database db_;
    storage::BlockRepository blocks_;
    storage::RelationshipRepository relationships_;
    DocumentStore documents_;
};

} // namespace blockstore::store
