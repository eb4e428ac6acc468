#pragma once

#include <datapod/datapod.hpp>
#include <mutex>
#include <string>
#include <vector>

#include "kitty.hpp"

namespace kitties {

    /// Call context a genome is derived for
    struct EntropyContext {
        AccountId caller;
        dp::u64 call_index = 0;
    };

    /// Source of 16 unpredictable bytes, used verbatim as a genome or selector
    class EntropySource {
      public:
        virtual ~EntropySource() = default;

        /// Called while the engine holds its lock; must not call back into the engine
        virtual dp::Result<Genome, dp::Error> derive(const EntropyContext &context) = 0;
    };

    /// SHA-256(seed || caller || call_index) truncated to 16 bytes.
    /// The seed stands in for a chain-wide randomness beacon; reseed() it per block.
    class SeededEntropySource : public EntropySource {
      public:
        explicit SeededEntropySource(std::vector<uint8_t> seed);

        /// Seed drawn from std::random_device
        static std::vector<uint8_t> randomSeed(dp::usize length = 32);

        dp::Result<Genome, dp::Error> derive(const EntropyContext &context) override;

        void reseed(std::vector<uint8_t> seed);

        std::vector<uint8_t> getSeed() const;

      private:
        mutable std::mutex mutex_;
        std::vector<uint8_t> seed_;
    };

    /// Returns pinned genomes in order, repeating the last one once exhausted.
    /// Records every context it was asked for.
    class FixedEntropySource : public EntropySource {
      public:
        FixedEntropySource() = default;
        explicit FixedEntropySource(std::vector<Genome> genomes);

        dp::Result<Genome, dp::Error> derive(const EntropyContext &context) override;

        void push(const Genome &genome);

        std::vector<EntropyContext> getContexts() const;

        size_t getCallCount() const;

      private:
        mutable std::mutex mutex_;
        std::vector<Genome> genomes_;
        size_t position_ = 0;
        std::vector<EntropyContext> contexts_;
    };

} // namespace kitties
