#pragma once

#include <chrono>
#include <datapod/datapod.hpp>
#include <memory>
#include <vector>

#include "kitties/common/error.hpp"
#include "kitties/ledger/kitty.hpp"

namespace kitties::storage {

    // ===========================================
    // Configuration
    // ===========================================

    /// Storage configuration options
    struct OpenOptions {
        bool enable_wal = true;         // SQLite only
        dp::i32 busy_timeout_ms = 5000; // SQLite only
        dp::i32 cache_size_kb = 20000;  // SQLite only
        enum class Synchronous { OFF = 0, NORMAL = 1, FULL = 2 };
        Synchronous sync_mode = Synchronous::NORMAL;
    };

    inline dp::i64 currentTimestamp() {
        return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    // ===========================================
    // KittyStore - keyed (owner, id) -> Kitty storage
    // ===========================================

    /// Backend for kitties and the persisted id counter.
    /// Writes issued while a TxGuard is active become visible on commit();
    /// outside a transaction they apply immediately.
    class KittyStore {
      public:
        virtual ~KittyStore() = default;

        class TxGuard {
          public:
            virtual ~TxGuard() = default;

            /// Error if the transaction could not be started; writes must not follow
            virtual dp::Result<void, dp::Error> status() const { return dp::Result<void, dp::Error>::ok(); }

            virtual dp::Result<void, dp::Error> commit() = 0;
            virtual void rollback() = 0;
        };

        virtual std::unique_ptr<TxGuard> beginTransaction() = 0;

        /// Pure lookup
        virtual dp::Optional<Kitty> get(const AccountId &owner, KittyId id) const = 0;

        /// Insert or overwrite
        virtual dp::Result<void, dp::Error> insert(const AccountId &owner, KittyId id, const Kitty &kitty) = 0;

        /// All kitties of an owner, ordered by id
        virtual std::vector<KittyEntry> kittiesOf(const AccountId &owner) const = 0;

        /// Total number of kitties
        virtual dp::i64 count() const = 0;

        /// Persisted allocator counter (0 for a fresh store)
        virtual dp::Result<KittyId, dp::Error> nextId() const = 0;

        virtual dp::Result<void, dp::Error> setNextId(KittyId next_id) = 0;
    };

} // namespace kitties::storage
