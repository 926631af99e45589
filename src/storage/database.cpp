#include "storage/database.hpp"
#include "core/logging.hpp"

namespace blockstore::storage {

namespace {

Result<void, Error> check_bind(int rc, const char* what) {
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(Error{std::string("Failed to bind ") + what, rc});
    }
    return Result<void, Error>::ok();
}

int trace_statement(unsigned type, void*, void* stmt, void*) {
    if (type != SQLITE_TRACE_STMT) return 0;
    char* sql = sqlite3_expanded_sql(static_cast<sqlite3_stmt*>(stmt));
    if (sql) {
        qCDebug(blockstoreSqlLog).noquote() << sql;
        sqlite3_free(sql);
    }
    return 0;
}

} // anonymous namespace

// ============================================================================
// Statement implementation
// ============================================================================

Result<void, Error> Statement::bind_text(int index, std::string_view text) {
    return check_bind(sqlite3_bind_text(stmt_.get(), index, text.data(),
                                        static_cast<int>(text.size()), SQLITE_TRANSIENT),
                      "text");
}

Result<void, Error> Statement::bind_int(int index, int value) {
    return check_bind(sqlite3_bind_int(stmt_.get(), index, value), "int");
}

Result<void, Error> Statement::bind_int64(int index, int64_t value) {
    return check_bind(sqlite3_bind_int64(stmt_.get(), index, value), "int64");
}

Result<void, Error> Statement::bind_double(int index, double value) {
    return check_bind(sqlite3_bind_double(stmt_.get(), index, value), "double");
}

Result<void, Error> Statement::bind_null(int index) {
    return check_bind(sqlite3_bind_null(stmt_.get(), index), "null");
}

Result<void, Error> Statement::bind_uuid(int index, const Uuid& id) {
    return bind_text(index, id.to_string());
}

Result<void, Error> Statement::bind_optional_uuid(int index, const std::optional<Uuid>& id) {
    return id ? bind_uuid(index, *id) : bind_null(index);
}

Result<void, Error> Statement::bind_value(int index, const SqlValue& value) {
    return std::visit([&](const auto& v) -> Result<void, Error> {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return bind_null(index);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return bind_int64(index, v);
        } else if constexpr (std::is_same_v<T, double>) {
            return bind_double(index, v);
        } else {
            return bind_text(index, v);
        }
    }, value);
}

Result<void, Error> Statement::bind_all(const std::vector<SqlValue>& values, int first) {
    for (size_t i = 0; i < values.size(); ++i) {
        auto result = bind_value(first + static_cast<int>(i), values[i]);
        if (result.is_err()) {
            return result;
        }
    }
    return Result<void, Error>::ok();
}

std::string Statement::column_text(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_.get(), index);
    if (!text) return "";
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_.get(), index)));
}

int Statement::column_int(int index) const {
    return sqlite3_column_int(stmt_.get(), index);
}

int64_t Statement::column_int64(int index) const {
    return sqlite3_column_int64(stmt_.get(), index);
}

double Statement::column_double(int index) const {
    return sqlite3_column_double(stmt_.get(), index);
}

bool Statement::column_is_null(int index) const {
    return sqlite3_column_type(stmt_.get(), index) == SQLITE_NULL;
}

std::optional<Uuid> Statement::column_uuid(int index) const {
    if (column_is_null(index)) return std::nullopt;
    return Uuid::parse(column_text(index));
}

Result<bool, Error> Statement::step() {
    int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) {
        return Result<bool, Error>::ok(true);
    }
    if (rc == SQLITE_DONE) {
        return Result<bool, Error>::ok(false);
    }
    sqlite3* db = sqlite3_db_handle(stmt_.get());
    return Result<bool, Error>::err(
        Error{std::string("Step failed: ") + (db ? sqlite3_errmsg(db) : "unknown"), rc});
}

Result<void, Error> Statement::reset() {
    int rc = sqlite3_reset(stmt_.get());
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(Error{"Reset failed", rc});
    }
    return Result<void, Error>::ok();
}

// ============================================================================
// Database implementation
// ============================================================================

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept : db_(other.db_) {
    other.db_ = nullptr;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        other.db_ = nullptr;
    }
    return *this;
}

Result<Database, Error> Database::open(const std::string& path) {
    sqlite3* raw = nullptr;
    int rc = sqlite3_open(path.c_str(), &raw);
    if (rc != SQLITE_OK) {
        std::string error = raw ? sqlite3_errmsg(raw) : "Unknown error";
        if (raw) sqlite3_close(raw);
        return Result<Database, Error>::err(Error{error, rc});
    }

    Database db(raw);

    auto fk_result = db.execute("PRAGMA foreign_keys = ON;");
    if (fk_result.is_err()) {
        return Result<Database, Error>::err(fk_result.unwrap_err());
    }

    if (path != ":memory:" && !path.empty()) {
        auto wal_result = db.execute("PRAGMA journal_mode = WAL;");
        if (wal_result.is_err()) {
            return Result<Database, Error>::err(wal_result.unwrap_err());
        }
        // Writers on other connections wait instead of failing at once.
        sqlite3_busy_timeout(raw, 5000);
    }

    qCDebug(blockstoreStorageLog) << "Opened database" << path.c_str();
    return Result<Database, Error>::ok(std::move(db));
}

Result<Database, Error> Database::open_memory() {
    return open(":memory:");
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void Database::set_tracing(bool enabled) {
    if (!db_) return;
    if (enabled) {
        sqlite3_trace_v2(db_, SQLITE_TRACE_STMT, trace_statement, nullptr);
    } else {
        sqlite3_trace_v2(db_, 0, nullptr, nullptr);
    }
}

Result<Statement, Error> Database::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(),
                                static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<Statement, Error>::err(Error{last_error(), rc});
    }
    return Result<Statement, Error>::ok(Statement(stmt));
}

Result<void, Error> Database::execute(const std::string& sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : "Unknown error";
        sqlite3_free(error_msg);
        return Result<void, Error>::err(Error{error, rc});
    }
    return Result<void, Error>::ok();
}

Result<int, Error> Database::run(const std::string& sql, const std::vector<SqlValue>& params) {
    auto stmt_result = prepare(sql);
    if (stmt_result.is_err()) {
        return Result<int, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bind_result = stmt.bind_all(params);
    if (bind_result.is_err()) {
        return Result<int, Error>::err(bind_result.unwrap_err());
    }
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int, Error>::err(step_result.unwrap_err());
    }
    return Result<int, Error>::ok(changes());
}

Result<void, Error> Database::begin_transaction() {
    return execute("BEGIN IMMEDIATE;");
}

Result<void, Error> Database::commit() {
    return execute("COMMIT;");
}

Result<void, Error> Database::rollback() {
    return execute("ROLLBACK;");
}

bool Database::in_transaction() const {
    return db_ && sqlite3_get_autocommit(db_) == 0;
}

void Database::abandon_transaction() {
    if (!in_transaction()) return;
    auto result = rollback();
    if (result.is_err()) {
        qCWarning(blockstoreStorageLog) << "Rollback failed:"
                                        << result.unwrap_err().message.c_str();
    }
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

std::string Database::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "Database not open";
}

} // namespace blockstore::storage
