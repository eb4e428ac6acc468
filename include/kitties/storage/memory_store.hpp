#pragma once

#include <map>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include "kitty_store.hpp"

namespace kitties::storage {

    /// In-process store: a map keyed by (owner, id)
    class MemoryKittyStore : public KittyStore {
      public:
        MemoryKittyStore() = default;

        class MemoryTxGuard : public TxGuard {
          public:
            inline explicit MemoryTxGuard(MemoryKittyStore &store) : store_(store), committed_(false) {
                std::unique_lock lock(store_.mutex_);
                store_.clearPending();
                store_.in_transaction_ = true;
            }

            inline ~MemoryTxGuard() override { rollback(); }

            MemoryTxGuard(const MemoryTxGuard &) = delete;
            MemoryTxGuard &operator=(const MemoryTxGuard &) = delete;

            inline dp::Result<void, dp::Error> commit() override {
                if (committed_)
                    return dp::Result<void, dp::Error>::ok();
                std::unique_lock lock(store_.mutex_);
                for (const auto &[key, kitty] : store_.pending_kitties_)
                    store_.kitties_[key] = kitty;
                if (store_.pending_next_id_.has_value())
                    store_.next_id_ = *store_.pending_next_id_;
                store_.clearPending();
                store_.in_transaction_ = false;
                committed_ = true;
                return dp::Result<void, dp::Error>::ok();
            }

            inline void rollback() override {
                if (committed_)
                    return;
                std::unique_lock lock(store_.mutex_);
                store_.clearPending();
                store_.in_transaction_ = false;
                committed_ = true;
            }

          private:
            MemoryKittyStore &store_;
            bool committed_;
        };

        inline std::unique_ptr<TxGuard> beginTransaction() override {
            return std::make_unique<MemoryTxGuard>(*this);
        }

        inline dp::Optional<Kitty> get(const AccountId &owner, KittyId id) const override {
            std::shared_lock lock(mutex_);
            auto it = kitties_.find(Key(owner, id));
            if (it == kitties_.end())
                return dp::Optional<Kitty>();
            return dp::Optional<Kitty>(it->second);
        }

        inline dp::Result<void, dp::Error> insert(const AccountId &owner, KittyId id, const Kitty &kitty) override {
            std::unique_lock lock(mutex_);
            if (in_transaction_)
                pending_kitties_[Key(owner, id)] = kitty;
            else
                kitties_[Key(owner, id)] = kitty;
            return dp::Result<void, dp::Error>::ok();
        }

        inline std::vector<KittyEntry> kittiesOf(const AccountId &owner) const override {
            std::shared_lock lock(mutex_);
            std::vector<KittyEntry> result;
            for (auto it = kitties_.lower_bound(Key(owner, 0)); it != kitties_.end() && it->first.first == owner;
                 ++it) {
                result.push_back(KittyEntry{it->first.second, it->second});
            }
            return result;
        }

        inline dp::i64 count() const override {
            std::shared_lock lock(mutex_);
            return static_cast<dp::i64>(kitties_.size());
        }

        inline dp::Result<KittyId, dp::Error> nextId() const override {
            std::shared_lock lock(mutex_);
            return dp::Result<KittyId, dp::Error>::ok(next_id_);
        }

        inline dp::Result<void, dp::Error> setNextId(KittyId next_id) override {
            std::unique_lock lock(mutex_);
            if (in_transaction_)
                pending_next_id_ = dp::Optional<KittyId>(next_id);
            else
                next_id_ = next_id;
            return dp::Result<void, dp::Error>::ok();
        }

      private:
        using Key = std::pair<AccountId, KittyId>;

        inline void clearPending() {
            pending_kitties_.clear();
            pending_next_id_ = dp::Optional<KittyId>();
        }

        std::map<Key, Kitty> kitties_;
        KittyId next_id_ = 0;

        bool in_transaction_ = false;
        std::map<Key, Kitty> pending_kitties_;
        dp::Optional<KittyId> pending_next_id_;

        mutable std::shared_mutex mutex_;
    };

} // namespace kitties::storage
