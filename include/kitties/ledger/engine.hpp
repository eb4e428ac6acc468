#pragma once

#include <datapod/datapod.hpp>
#include <iostream>
#include <memory>
#include <mutex>
#include <vector>

#include "allocator.hpp"
#include "dna.hpp"
#include "entropy.hpp"
#include "event.hpp"
#include "kitties/common/error.hpp"
#include "kitties/storage/kitty_store.hpp"
#include "kitty.hpp"

namespace kitties {

    /// Kitty registry state machine.
    /// Each call is applied wholly or not at all: on any error neither the id
    /// counter nor the store changes, and no event is deposited.
    /// The entropy source is called under the engine lock and must not call
    /// back into the engine; the event sink is called after the lock is
    /// released and may.
    class KittyEngine {
      public:
        KittyEngine(std::shared_ptr<storage::KittyStore> store, std::shared_ptr<EntropySource> entropy,
                    std::shared_ptr<EventSink> sink = nullptr);

        KittyEngine(const KittyEngine &) = delete;
        KittyEngine &operator=(const KittyEngine &) = delete;

        /// Load the id counter from the store. Must succeed before create/breed.
        dp::Result<void, dp::Error> initialize();

        inline bool isInitialized() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return initialized_;
        }

        // ===========================================
        // Mutating operations
        // ===========================================

        /// Create a kitty with a fresh genome for `caller`
        dp::Result<KittyEvent, dp::Error> create(const AccountId &caller);

        /// Breed two kitties owned by `caller` into a new one.
        /// Fails with kitty_not_found if either is not owned by the caller,
        /// same_gender if the parents share a gender.
        dp::Result<KittyEvent, dp::Error> breed(const AccountId &caller, KittyId parent1_id, KittyId parent2_id);

        // ===========================================
        // Queries
        // ===========================================

        dp::Optional<Kitty> lookup(const AccountId &owner, KittyId id) const;

        std::vector<KittyEntry> kittiesOf(const AccountId &owner) const;

        /// Id the next successful create/breed will receive
        KittyId nextKittyId() const;

        dp::i64 kittyCount() const;

        void printSummary(const std::vector<AccountId> &owners = {}) const;

      private:
        dp::Result<KittyEvent, dp::Error> createLocked(const AccountId &caller);

        dp::Result<KittyEvent, dp::Error> breedLocked(const AccountId &caller, KittyId parent1_id,
                                                      KittyId parent2_id);

        void deposit(const KittyEvent &event);

        /// Persist `kitty` under (owner, id) together with the advanced counter
        dp::Result<void, dp::Error> commitKitty(const AccountId &owner, KittyId id, const Kitty &kitty,
                                                IdAllocator::Reservation &reservation);

        EntropyContext nextContext(const AccountId &caller) const;

        std::shared_ptr<storage::KittyStore> store_;
        std::shared_ptr<EntropySource> entropy_;
        std::shared_ptr<EventSink> sink_;

        IdAllocator allocator_;
        dp::u64 call_index_ = 0;
        bool initialized_ = false;

        mutable std::mutex mutex_;
    };

} // namespace kitties
