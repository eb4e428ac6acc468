#pragma once

#include <datapod/datapod.hpp>
#include <iostream>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <tuple>
#include <vector>

#include "kitty.hpp"

namespace kitties {

    /// Kitty event types
    enum class KittyEventType : dp::u8 {
        Created = 0,
        Bred = 1,
    };

    /// Get string name for event type
    inline std::string kittyEventTypeToString(KittyEventType type) {
        switch (type) {
        case KittyEventType::Created:
            return "created";
        case KittyEventType::Bred:
            return "bred";
        default:
            return "unknown";
        }
    }

    /// Notification emitted by a committed create or breed: (owner, kitty_id, kitty)
    struct KittyEvent {
        dp::u8 event_type{0}; // KittyEventType
        dp::String owner;
        dp::u32 kitty_id{0};
        Kitty kitty;

        KittyEvent() = default;

        KittyEvent(KittyEventType type, const AccountId &owner_id, KittyId id, const Kitty &k)
            : event_type(static_cast<dp::u8>(type)), owner(dp::String(owner_id.c_str())), kitty_id(id), kitty(k) {}

        inline KittyEventType getType() const { return static_cast<KittyEventType>(event_type); }

        inline AccountId getOwner() const { return AccountId(owner.c_str()); }

        inline KittyId getKittyId() const { return kitty_id; }

        inline const Kitty &getKitty() const { return kitty; }

        inline std::string toString() const {
            return kittyEventTypeToString(getType()) + "(" + getOwner() + ", " + std::to_string(kitty_id) + ", " +
                   kitty.toHex() + ")";
        }

        inline std::vector<uint8_t> toBytes() const {
            auto &self = const_cast<KittyEvent &>(*this);
            auto buf = dp::serialize<dp::Mode::WITH_VERSION>(self);
            return std::vector<uint8_t>(buf.begin(), buf.end());
        }

        inline static dp::Result<KittyEvent, dp::Error> fromBytes(const std::vector<uint8_t> &data) {
            try {
                dp::ByteBuf buf(data.begin(), data.end());
                auto result = dp::deserialize<dp::Mode::WITH_VERSION, KittyEvent>(buf);
                return dp::Result<KittyEvent, dp::Error>::ok(std::move(result));
            } catch (const std::exception &e) {
                return dp::Result<KittyEvent, dp::Error>::err(deserialization_failed(dp::String(e.what())));
            }
        }

        auto members() { return std::tie(event_type, owner, kitty_id, kitty); }
        auto members() const { return std::tie(event_type, owner, kitty_id, kitty); }
    };

    /// Receives events after the operation that produced them has committed
    class EventSink {
      public:
        virtual ~EventSink() = default;

        virtual void deposit(const KittyEvent &event) = 0;
    };

    /// In-memory ordered event history
    class EventLog : public EventSink {
      public:
        EventLog() = default;

        inline void deposit(const KittyEvent &event) override {
            std::unique_lock lock(mutex_);
            events_.push_back(event);
        }

        inline std::vector<KittyEvent> events() const {
            std::shared_lock lock(mutex_);
            return events_;
        }

        inline std::vector<KittyEvent> eventsFor(const AccountId &owner) const {
            std::shared_lock lock(mutex_);
            std::vector<KittyEvent> result;
            for (const auto &event : events_) {
                if (event.getOwner() == owner)
                    result.push_back(event);
            }
            return result;
        }

        inline size_t size() const {
            std::shared_lock lock(mutex_);
            return events_.size();
        }

        /// Clear the log (for testing)
        inline void clear() {
            std::unique_lock lock(mutex_);
            events_.clear();
        }

      private:
        std::vector<KittyEvent> events_;
        mutable std::shared_mutex mutex_;
    };

    /// Prints one line per event
    class ConsoleEventSink : public EventSink {
      public:
        inline explicit ConsoleEventSink(std::ostream &out = std::cout) : out_(out) {}

        inline void deposit(const KittyEvent &event) override {
            std::lock_guard<std::mutex> lock(mutex_);
            out_ << "Kitty " << kittyEventTypeToString(event.getType()) << ": owner=" << event.getOwner()
                 << " id=" << event.getKittyId() << " genome=" << event.getKitty().toHex()
                 << " gender=" << kittyGenderToString(event.getKitty().gender()) << std::endl;
        }

      private:
        std::ostream &out_;
        std::mutex mutex_;
    };

} // namespace kitties
