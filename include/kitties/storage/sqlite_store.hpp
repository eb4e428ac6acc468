#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "kitty_store.hpp"

// Forward declaration for sqlite3 C API
struct sqlite3;
struct sqlite3_stmt;

namespace kitties::storage {

    // ===========================================
    // SqliteKittyStore - SQLite-backed kitty storage
    // ===========================================

    class SqliteKittyStore : public KittyStore {
      public:
        SqliteKittyStore();
        ~SqliteKittyStore() override;

        // Non-copyable
        SqliteKittyStore(const SqliteKittyStore &) = delete;
        SqliteKittyStore &operator=(const SqliteKittyStore &) = delete;

        /// Open or create database at given path (e.g. "data/kitties.db", or ":memory:")
        dp::Result<void, dp::Error> open(const std::string &path, const OpenOptions &opts = OpenOptions{});

        /// Close database connection
        void close();

        /// Check if database is open
        bool isOpen() const;

        /// Create tables and run migrations; idempotent
        dp::Result<void, dp::Error> initializeSchema();

        // ===========================================
        // Transaction management (RAII)
        // ===========================================

        class SqliteTxGuard : public TxGuard {
          public:
            explicit SqliteTxGuard(SqliteKittyStore &store);
            ~SqliteTxGuard() override;

            SqliteTxGuard(const SqliteTxGuard &) = delete;
            SqliteTxGuard &operator=(const SqliteTxGuard &) = delete;

            dp::Result<void, dp::Error> status() const override;
            dp::Result<void, dp::Error> commit() override;
            void rollback() override;

          private:
            SqliteKittyStore &store_;
            bool active_;
            bool committed_;
            dp::Optional<dp::Error> begin_error_;
        };

        std::unique_ptr<TxGuard> beginTransaction() override;

        // ===========================================
        // KittyStore operations
        // ===========================================

        dp::Optional<Kitty> get(const AccountId &owner, KittyId id) const override;

        dp::Result<void, dp::Error> insert(const AccountId &owner, KittyId id, const Kitty &kitty) override;

        std::vector<KittyEntry> kittiesOf(const AccountId &owner) const override;

        dp::i64 count() const override;

        dp::Result<KittyId, dp::Error> nextId() const override;

        dp::Result<void, dp::Error> setNextId(KittyId next_id) override;

        // ===========================================
        // Diagnostics
        // ===========================================

        /// Current schema version (0 when uninitialized)
        int32_t getSchemaVersion() const;

        /// Run SQLite integrity check
        dp::Result<bool, dp::Error> quickCheck() const;

      private:
        sqlite3 *db_;
        std::string db_path_;
        bool is_open_;
        mutable std::recursive_mutex mutex_;

        void applyPragmas(const OpenOptions &opts);
        dp::Result<void, dp::Error> executeSql(const std::string &sql);
        bool tableExists(const std::string &table_name) const;
        dp::Result<void, dp::Error> setSchemaVersion(int32_t version);
        dp::Error lastError(const std::string &context) const;

        static constexpr const char *SCHEMA_MIGRATIONS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS schema_migrations (
                version INTEGER PRIMARY KEY,
                applied_at INTEGER NOT NULL
            )
        )";

        static constexpr const char *KITTIES_TABLE = R"(
            CREATE TABLE IF NOT EXISTS kitties (
                owner TEXT NOT NULL,
                kitty_id INTEGER NOT NULL,
                genome BLOB NOT NULL,
                created_at INTEGER NOT NULL,
                PRIMARY KEY (owner, kitty_id)
            )
        )";

        static constexpr const char *META_TABLE = R"(
            CREATE TABLE IF NOT EXISTS meta (
                key TEXT PRIMARY KEY,
                value INTEGER NOT NULL
            )
        )";

        static constexpr const char *IDX_KITTIES_ID =
            "CREATE UNIQUE INDEX IF NOT EXISTS idx_kitties_id ON kitties(kitty_id)";
    };

} // namespace kitties::storage
