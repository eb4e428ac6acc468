#include <kitties/storage/sqlite_store.hpp>
#include <sqlite3.h>

namespace kitties::storage {

    // ===========================================
    // SqliteKittyStore implementation
    // ===========================================

    SqliteKittyStore::SqliteKittyStore() : db_(nullptr), is_open_(false) {}

    SqliteKittyStore::~SqliteKittyStore() { close(); }

    dp::Result<void, dp::Error> SqliteKittyStore::open(const std::string &path, const OpenOptions &opts) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        int rc = sqlite3_open(path.c_str(), &db_);
        if (rc != SQLITE_OK) {
            auto error = lastError("Failed to open " + path);
            if (db_) {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            is_open_ = false;
            return dp::Result<void, dp::Error>::err(error);
        }

        db_path_ = path;
        is_open_ = true;
        applyPragmas(opts);
        return dp::Result<void, dp::Error>::ok();
    }

    void SqliteKittyStore::close() {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
            is_open_ = false;
        }
    }

    bool SqliteKittyStore::isOpen() const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return is_open_;
    }

    void SqliteKittyStore::applyPragmas(const OpenOptions &opts) {
        if (!db_)
            return;

        if (opts.enable_wal) {
            sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
        }

        std::string busy_timeout = "PRAGMA busy_timeout=" + std::to_string(opts.busy_timeout_ms) + ";";
        sqlite3_exec(db_, busy_timeout.c_str(), nullptr, nullptr, nullptr);

        std::string cache_size = "PRAGMA cache_size=-" + std::to_string(opts.cache_size_kb) + ";";
        sqlite3_exec(db_, cache_size.c_str(), nullptr, nullptr, nullptr);

        std::string sync_mode;
        switch (opts.sync_mode) {
        case OpenOptions::Synchronous::OFF:
            sync_mode = "PRAGMA synchronous=OFF;";
            break;
        case OpenOptions::Synchronous::NORMAL:
            sync_mode = "PRAGMA synchronous=NORMAL;";
            break;
        case OpenOptions::Synchronous::FULL:
            sync_mode = "PRAGMA synchronous=FULL;";
            break;
        }
        sqlite3_exec(db_, sync_mode.c_str(), nullptr, nullptr, nullptr);
    }

    dp::Result<void, dp::Error> SqliteKittyStore::initializeSchema() {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return dp::Result<void, dp::Error>::err(store_not_open());

        auto tx = beginTransaction();
        auto begun = tx->status();
        if (!begun.is_ok())
            return begun;

        auto created = executeSql(SCHEMA_MIGRATIONS_TABLE);
        if (!created.is_ok())
            return created;

        if (getSchemaVersion() < 1) {
            for (const char *sql : {KITTIES_TABLE, META_TABLE, IDX_KITTIES_ID}) {
                auto applied = executeSql(sql);
                if (!applied.is_ok())
                    return applied;
            }
            auto versioned = setSchemaVersion(1);
            if (!versioned.is_ok())
                return versioned;
        }

        return tx->commit();
    }

    dp::Result<void, dp::Error> SqliteKittyStore::executeSql(const std::string &sql) {
        char *err_msg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
        if (rc != SQLITE_OK) {
            std::string message = err_msg ? err_msg : "unknown error";
            sqlite3_free(err_msg);
            return dp::Result<void, dp::Error>::err(store_failed(dp::String(message.c_str())));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    bool SqliteKittyStore::tableExists(const std::string &table_name) const {
        if (!db_)
            return false;

        sqlite3_stmt *stmt;
        const char *sql = "SELECT name FROM sqlite_master WHERE type='table' AND name=?";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }

        sqlite3_bind_text(stmt, 1, table_name.c_str(), -1, SQLITE_TRANSIENT);

        bool exists = (sqlite3_step(stmt) == SQLITE_ROW);
        sqlite3_finalize(stmt);

        return exists;
    }

    int32_t SqliteKittyStore::getSchemaVersion() const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!tableExists("schema_migrations"))
            return 0;

        sqlite3_stmt *stmt;
        const char *sql = "SELECT MAX(version) FROM schema_migrations";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return 0;
        }

        int32_t version = 0;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            version = sqlite3_column_int(stmt, 0);
        }

        sqlite3_finalize(stmt);
        return version;
    }

    dp::Result<void, dp::Error> SqliteKittyStore::setSchemaVersion(int32_t version) {
        sqlite3_stmt *stmt;
        const char *sql = "INSERT OR REPLACE INTO schema_migrations (version, applied_at) VALUES (?, ?)";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Result<void, dp::Error>::err(lastError("Failed to prepare schema version update"));
        }

        sqlite3_bind_int(stmt, 1, version);
        sqlite3_bind_int64(stmt, 2, currentTimestamp());

        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        sqlite3_finalize(stmt);

        if (!success)
            return dp::Result<void, dp::Error>::err(lastError("Failed to record schema version"));
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Error SqliteKittyStore::lastError(const std::string &context) const {
        std::string message = context;
        if (db_) {
            message += ": ";
            message += sqlite3_errmsg(db_);
        }
        return store_failed(dp::String(message.c_str()));
    }

    // ===========================================
    // Transaction Guard
    // ===========================================

    SqliteKittyStore::SqliteTxGuard::SqliteTxGuard(SqliteKittyStore &store)
        : store_(store), active_(false), committed_(false) {
        std::lock_guard<std::recursive_mutex> lock(store_.mutex_);
        if (!store_.db_ || !store_.is_open_) {
            begin_error_ = dp::Optional<dp::Error>(store_not_open());
            return;
        }
        if (sqlite3_exec(store_.db_, "BEGIN TRANSACTION", nullptr, nullptr, nullptr) != SQLITE_OK) {
            begin_error_ = dp::Optional<dp::Error>(store_.lastError("Failed to begin transaction"));
            return;
        }
        active_ = true;
    }

    dp::Result<void, dp::Error> SqliteKittyStore::SqliteTxGuard::status() const {
        if (begin_error_.has_value())
            return dp::Result<void, dp::Error>::err(*begin_error_);
        return dp::Result<void, dp::Error>::ok();
    }

    SqliteKittyStore::SqliteTxGuard::~SqliteTxGuard() { rollback(); }

    dp::Result<void, dp::Error> SqliteKittyStore::SqliteTxGuard::commit() {
        std::lock_guard<std::recursive_mutex> lock(store_.mutex_);
        if (begin_error_.has_value())
            return dp::Result<void, dp::Error>::err(*begin_error_);
        if (!active_ || committed_) {
            return dp::Result<void, dp::Error>::err(store_failed("No active transaction to commit"));
        }
        if (sqlite3_exec(store_.db_, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) {
            auto error = store_.lastError("Commit failed");
            sqlite3_exec(store_.db_, "ROLLBACK", nullptr, nullptr, nullptr);
            committed_ = true;
            active_ = false;
            return dp::Result<void, dp::Error>::err(error);
        }
        committed_ = true;
        active_ = false;
        return dp::Result<void, dp::Error>::ok();
    }

    void SqliteKittyStore::SqliteTxGuard::rollback() {
        std::lock_guard<std::recursive_mutex> lock(store_.mutex_);
        if (active_ && !committed_) {
            sqlite3_exec(store_.db_, "ROLLBACK", nullptr, nullptr, nullptr);
            committed_ = true;
            active_ = false;
        }
    }

    std::unique_ptr<KittyStore::TxGuard> SqliteKittyStore::beginTransaction() {
        return std::make_unique<SqliteTxGuard>(*this);
    }

    // ===========================================
    // KittyStore operations
    // ===========================================

    dp::Optional<Kitty> SqliteKittyStore::get(const AccountId &owner, KittyId id) const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return dp::Optional<Kitty>();

        sqlite3_stmt *stmt;
        const char *sql = "SELECT genome FROM kitties WHERE owner = ? AND kitty_id = ?";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Optional<Kitty>();
        }

        sqlite3_bind_text(stmt, 1, owner.data(), static_cast<int>(owner.size()), SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(id));

        dp::Optional<Kitty> result;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            const auto *blob = static_cast<const uint8_t *>(sqlite3_column_blob(stmt, 0));
            int size = sqlite3_column_bytes(stmt, 0);
            if (blob && size > 0) {
                auto kitty = Kitty::fromBytes(std::vector<uint8_t>(blob, blob + size));
                if (kitty.is_ok())
                    result = dp::Optional<Kitty>(kitty.value());
            }
        }

        sqlite3_finalize(stmt);
        return result;
    }

    dp::Result<void, dp::Error> SqliteKittyStore::insert(const AccountId &owner, KittyId id, const Kitty &kitty) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return dp::Result<void, dp::Error>::err(store_not_open());

        sqlite3_stmt *stmt;
        const char *sql = "INSERT OR REPLACE INTO kitties (owner, kitty_id, genome, created_at) VALUES (?, ?, ?, ?)";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Result<void, dp::Error>::err(lastError("Failed to prepare kitty insert"));
        }

        auto genome = kitty.toBytes();
        sqlite3_bind_text(stmt, 1, owner.data(), static_cast<int>(owner.size()), SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(id));
        sqlite3_bind_blob(stmt, 3, genome.data(), static_cast<int>(genome.size()), SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 4, currentTimestamp());

        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        sqlite3_finalize(stmt);

        if (!success)
            return dp::Result<void, dp::Error>::err(lastError("Failed to insert kitty"));
        return dp::Result<void, dp::Error>::ok();
    }

    std::vector<KittyEntry> SqliteKittyStore::kittiesOf(const AccountId &owner) const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        std::vector<KittyEntry> entries;
        if (!db_ || !is_open_)
            return entries;

        sqlite3_stmt *stmt;
        const char *sql = "SELECT kitty_id, genome FROM kitties WHERE owner = ? ORDER BY kitty_id";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return entries;
        }

        sqlite3_bind_text(stmt, 1, owner.data(), static_cast<int>(owner.size()), SQLITE_TRANSIENT);

        while (sqlite3_step(stmt) == SQLITE_ROW) {
            auto id = static_cast<KittyId>(sqlite3_column_int64(stmt, 0));
            const auto *blob = static_cast<const uint8_t *>(sqlite3_column_blob(stmt, 1));
            int size = sqlite3_column_bytes(stmt, 1);
            if (!blob || size <= 0)
                continue;
            auto kitty = Kitty::fromBytes(std::vector<uint8_t>(blob, blob + size));
            if (kitty.is_ok())
                entries.push_back(KittyEntry{id, kitty.value()});
        }

        sqlite3_finalize(stmt);
        return entries;
    }

    dp::i64 SqliteKittyStore::count() const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return 0;

        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM kitties", -1, &stmt, nullptr) != SQLITE_OK) {
            return 0;
        }

        dp::i64 total = 0;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            total = sqlite3_column_int64(stmt, 0);
        }

        sqlite3_finalize(stmt);
        return total;
    }

    dp::Result<KittyId, dp::Error> SqliteKittyStore::nextId() const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return dp::Result<KittyId, dp::Error>::err(store_not_open());

        sqlite3_stmt *stmt;
        const char *sql = "SELECT value FROM meta WHERE key = 'next_kitty_id'";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Result<KittyId, dp::Error>::err(lastError("Failed to read kitty id counter"));
        }

        KittyId next_id = 0;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            next_id = static_cast<KittyId>(sqlite3_column_int64(stmt, 0));
        }

        sqlite3_finalize(stmt);
        return dp::Result<KittyId, dp::Error>::ok(next_id);
    }

    dp::Result<void, dp::Error> SqliteKittyStore::setNextId(KittyId next_id) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return dp::Result<void, dp::Error>::err(store_not_open());

        sqlite3_stmt *stmt;
        const char *sql = "INSERT OR REPLACE INTO meta (key, value) VALUES ('next_kitty_id', ?)";

        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Result<void, dp::Error>::err(lastError("Failed to prepare kitty id counter update"));
        }

        sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(next_id));

        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        sqlite3_finalize(stmt);

        if (!success)
            return dp::Result<void, dp::Error>::err(lastError("Failed to update kitty id counter"));
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<bool, dp::Error> SqliteKittyStore::quickCheck() const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!db_ || !is_open_)
            return dp::Result<bool, dp::Error>::err(store_not_open());

        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, "PRAGMA quick_check", -1, &stmt, nullptr) != SQLITE_OK) {
            return dp::Result<bool, dp::Error>::err(lastError("Failed to run quick_check"));
        }

        bool healthy = false;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            const unsigned char *text = sqlite3_column_text(stmt, 0);
            healthy = text && std::string(reinterpret_cast<const char *>(text)) == "ok";
        }

        sqlite3_finalize(stmt);
        return dp::Result<bool, dp::Error>::ok(healthy);
    }

} // namespace kitties::storage
