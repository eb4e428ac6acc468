#include <kitties/ledger/engine.hpp>

namespace kitties {

    KittyEngine::KittyEngine(std::shared_ptr<storage::KittyStore> store, std::shared_ptr<EntropySource> entropy,
                             std::shared_ptr<EventSink> sink)
        : store_(std::move(store)), entropy_(std::move(entropy)), sink_(std::move(sink)) {}

    dp::Result<void, dp::Error> KittyEngine::initialize() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!store_ || !entropy_) {
            return dp::Result<void, dp::Error>::err(
                dp::Error::invalid_argument("Engine requires a store and an entropy source"));
        }

        auto next_id = store_->nextId();
        if (!next_id.is_ok()) {
            return dp::Result<void, dp::Error>::err(next_id.error());
        }

        allocator_ = IdAllocator(next_id.value());
        initialized_ = true;
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<KittyEvent, dp::Error> KittyEngine::create(const AccountId &caller) {
        std::unique_lock<std::mutex> lock(mutex_);
        auto result = createLocked(caller);
        lock.unlock();

        if (result.is_ok())
            deposit(result.value());
        return result;
    }

    dp::Result<KittyEvent, dp::Error> KittyEngine::breed(const AccountId &caller, KittyId parent1_id,
                                                         KittyId parent2_id) {
        std::unique_lock<std::mutex> lock(mutex_);
        auto result = breedLocked(caller, parent1_id, parent2_id);
        lock.unlock();

        if (result.is_ok())
            deposit(result.value());
        return result;
    }

    void KittyEngine::deposit(const KittyEvent &event) {
        if (sink_)
            sink_->deposit(event);
    }

    dp::Result<KittyEvent, dp::Error> KittyEngine::createLocked(const AccountId &caller) {
        if (!initialized_) {
            return dp::Result<KittyEvent, dp::Error>::err(not_initialized());
        }
        if (!isValidAccount(caller)) {
            return dp::Result<KittyEvent, dp::Error>::err(
                dp::Error::invalid_argument("Caller must not contain NUL bytes"));
        }

        IdAllocator::Reservation reservation(allocator_);
        auto kitty_id = reservation.take();
        if (!kitty_id.is_ok()) {
            return dp::Result<KittyEvent, dp::Error>::err(kitty_id.error());
        }

        auto dna = entropy_->derive(nextContext(caller));
        if (!dna.is_ok()) {
            return dp::Result<KittyEvent, dp::Error>::err(dna.error());
        }

        Kitty kitty(dna.value());
        auto committed = commitKitty(caller, kitty_id.value(), kitty, reservation);
        if (!committed.is_ok()) {
            return dp::Result<KittyEvent, dp::Error>::err(committed.error());
        }

        KittyEvent event(KittyEventType::Created, caller, kitty_id.value(), kitty);
        return dp::Result<KittyEvent, dp::Error>::ok(event);
    }

    dp::Result<KittyEvent, dp::Error> KittyEngine::breedLocked(const AccountId &caller, KittyId parent1_id,
                                                               KittyId parent2_id) {
        if (!initialized_) {
            return dp::Result<KittyEvent, dp::Error>::err(not_initialized());
        }
        if (!isValidAccount(caller)) {
            return dp::Result<KittyEvent, dp::Error>::err(
                dp::Error::invalid_argument("Caller must not contain NUL bytes"));
        }

        auto parent1 = store_->get(caller, parent1_id);
        if (!parent1.has_value()) {
            return dp::Result<KittyEvent, dp::Error>::err(
                kitty_not_found(dp::String(("Kitty " + std::to_string(parent1_id) + " not owned by caller").c_str())));
        }
        auto parent2 = store_->get(caller, parent2_id);
        if (!parent2.has_value()) {
            return dp::Result<KittyEvent, dp::Error>::err(
                kitty_not_found(dp::String(("Kitty " + std::to_string(parent2_id) + " not owned by caller").c_str())));
        }

        // Also rules out breeding a kitty with itself
        if (parent1->gender() == parent2->gender()) {
            return dp::Result<KittyEvent, dp::Error>::err(same_gender());
        }

        IdAllocator::Reservation reservation(allocator_);
        auto kitty_id = reservation.take();
        if (!kitty_id.is_ok()) {
            return dp::Result<KittyEvent, dp::Error>::err(kitty_id.error());
        }

        auto selector = entropy_->derive(nextContext(caller));
        if (!selector.is_ok()) {
            return dp::Result<KittyEvent, dp::Error>::err(selector.error());
        }

        Kitty kitten = breedKitties(*parent1, *parent2, selector.value());
        auto committed = commitKitty(caller, kitty_id.value(), kitten, reservation);
        if (!committed.is_ok()) {
            return dp::Result<KittyEvent, dp::Error>::err(committed.error());
        }

        KittyEvent event(KittyEventType::Bred, caller, kitty_id.value(), kitten);
        return dp::Result<KittyEvent, dp::Error>::ok(event);
    }

    dp::Result<void, dp::Error> KittyEngine::commitKitty(const AccountId &owner, KittyId id, const Kitty &kitty,
                                                         IdAllocator::Reservation &reservation) {
        auto tx = store_->beginTransaction();
        auto begun = tx->status();
        if (!begun.is_ok())
            return begun;

        auto inserted = store_->insert(owner, id, kitty);
        if (!inserted.is_ok())
            return inserted;

        auto counted = store_->setNextId(allocator_.current());
        if (!counted.is_ok())
            return counted;

        auto committed = tx->commit();
        if (!committed.is_ok())
            return committed;

        reservation.commit();
        call_index_++;
        return dp::Result<void, dp::Error>::ok();
    }

    EntropyContext KittyEngine::nextContext(const AccountId &caller) const {
        EntropyContext context;
        context.caller = caller;
        context.call_index = call_index_;
        return context;
    }

    dp::Optional<Kitty> KittyEngine::lookup(const AccountId &owner, KittyId id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!store_)
            return dp::Optional<Kitty>();
        return store_->get(owner, id);
    }

    std::vector<KittyEntry> KittyEngine::kittiesOf(const AccountId &owner) const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!store_)
            return {};
        return store_->kittiesOf(owner);
    }

    KittyId KittyEngine::nextKittyId() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return allocator_.current();
    }

    dp::i64 KittyEngine::kittyCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!store_)
            return 0;
        return store_->count();
    }

    void KittyEngine::printSummary(const std::vector<AccountId> &owners) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << "=== Kitties Summary ===\n";
        std::cout << "Initialized: " << (initialized_ ? "YES" : "NO") << "\n";
        std::cout << "Next Kitty Id: " << allocator_.current() << "\n";
        std::cout << "Total Kitties: " << (store_ ? store_->count() : 0) << "\n";
        if (!store_)
            return;
        for (const auto &owner : owners) {
            auto entries = store_->kittiesOf(owner);
            std::cout << "Owner " << owner << " (" << entries.size() << "):" << std::endl;
            for (const auto &entry : entries) {
                std::cout << "  #" << entry.id << " " << entry.kitty.toHex() << " ("
                          << kittyGenderToString(entry.kitty.gender()) << ")" << std::endl;
            }
        }
    }

} // namespace kitties
