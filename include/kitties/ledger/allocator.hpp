#pragma once

#include <limits>

#include "kitties/common/error.hpp"
#include "kitty.hpp"

namespace kitties {

    /// Issues kitty ids from a single monotonically increasing counter.
    /// Not thread-safe on its own; the engine serializes access.
    class IdAllocator {
      public:
        IdAllocator() = default;
        inline explicit IdAllocator(KittyId start) : next_id_(start) {}

        /// Read-then-increment. On overflow the counter is left untouched.
        inline dp::Result<KittyId, dp::Error> next() {
            if (next_id_ == std::numeric_limits<KittyId>::max()) {
                return dp::Result<KittyId, dp::Error>::err(id_overflow());
            }
            KittyId current_id = next_id_;
            next_id_ = current_id + 1;
            return dp::Result<KittyId, dp::Error>::ok(current_id);
        }

        /// Id the next successful call to next() would return
        inline KittyId current() const { return next_id_; }

        inline bool isExhausted() const { return next_id_ == std::numeric_limits<KittyId>::max(); }

        // ===========================================
        // Reservation (RAII)
        // ===========================================

        /// Takes an id for the duration of an operation. Unless commit() is
        /// called the counter goes back to where it was on destruction.
        class Reservation {
          public:
            inline explicit Reservation(IdAllocator &allocator)
                : allocator_(allocator), saved_(allocator.next_id_), committed_(false) {}

            inline ~Reservation() {
                if (!committed_) {
                    allocator_.next_id_ = saved_;
                }
            }

            Reservation(const Reservation &) = delete;
            Reservation &operator=(const Reservation &) = delete;

            inline dp::Result<KittyId, dp::Error> take() { return allocator_.next(); }

            inline void commit() { committed_ = true; }

          private:
            IdAllocator &allocator_;
            KittyId saved_;
            bool committed_;
        };

      private:
        KittyId next_id_ = 0;
    };

} // namespace kitties
